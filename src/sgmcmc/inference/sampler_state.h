/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <map>
#include <string>
#include "sgmcmc/inference/parameters.h"

namespace sgmcmc {
namespace inference {

/*
The state of a chain: the current parameter values plus whatever auxiliary
tensors the step engine keeps (momentum, thermostat). Only `params` is read
outside the engine.
*/
struct SamplerState {
  ParameterSet params;
  std::map<std::string, ParameterSet> auxiliary;
  // number of steps taken since the state was initialized
  int iteration = 0;

  bool has_auxiliary(const std::string& name) const {
    return auxiliary.find(name) != auxiliary.end();
  }
  // Throws std::logic_error if the engine never created the entry.
  const ParameterSet& get_auxiliary(const std::string& name) const;
  ParameterSet& get_auxiliary(const std::string& name);
};

} // namespace inference
} // namespace sgmcmc
