/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <random>
#include "sgmcmc/inference/dataset.h"
#include "sgmcmc/inference/sampler_state.h"

namespace sgmcmc {
namespace inference {

/*
One transition of a stochastic gradient MCMC chain. Engines take the current
state by value and return the next one; the caller owns the state.
*/
class StepEngine {
 public:
  explicit StepEngine() {}
  // The state a chain starting at `params` begins in. Engines with auxiliary
  // variables draw or set them here.
  virtual SamplerState initialize(
      const ParameterSet& params,
      std::mt19937& /*gen*/) {
    SamplerState state;
    state.params = params;
    return state;
  }
  virtual SamplerState advance(
      const SamplerState& state,
      const Dataset& minibatch,
      std::mt19937& gen) = 0;
  virtual ~StepEngine() {}

 protected:
  // Throws DivergenceError naming the first non-finite parameter.
  static void check_divergence(const ParameterSet& params, int iteration);
};

} // namespace inference
} // namespace sgmcmc
