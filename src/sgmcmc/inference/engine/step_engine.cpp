/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <fmt/format.h>

#include "sgmcmc/inference/engine/step_engine.h"
#include "sgmcmc/inference/errors.h"
#include "sgmcmc/util.h"

namespace sgmcmc {
namespace inference {

void StepEngine::check_divergence(const ParameterSet& params, int iteration) {
  for (const auto& [name, value] : params) {
    if (not util::all_finite(value)) {
      throw DivergenceError(fmt::format(
          "parameter '{}' became non-finite at iteration {}; "
          "try a smaller step size",
          name,
          iteration));
    }
  }
}

} // namespace inference
} // namespace sgmcmc
