/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <fmt/format.h>
#include <stdexcept>

#include "sgmcmc/inference/sampler_state.h"

namespace sgmcmc {
namespace inference {

const ParameterSet& SamplerState::get_auxiliary(
    const std::string& name) const {
  auto found = auxiliary.find(name);
  if (found == auxiliary.end()) {
    throw std::logic_error(
        fmt::format("sampler state has no auxiliary entry '{}'", name));
  }
  return found->second;
}

ParameterSet& SamplerState::get_auxiliary(const std::string& name) {
  auto found = auxiliary.find(name);
  if (found == auxiliary.end()) {
    throw std::logic_error(
        fmt::format("sampler state has no auxiliary entry '{}'", name));
  }
  return found->second;
}

} // namespace inference
} // namespace sgmcmc
