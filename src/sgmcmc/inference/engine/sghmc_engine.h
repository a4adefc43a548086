/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <memory>
#include "sgmcmc/inference/engine/step_engine.h"
#include "sgmcmc/inference/gradient/gradient_estimator.h"

namespace sgmcmc {
namespace inference {

/*
Stochastic gradient Hamiltonian Monte Carlo as specified in [1].

Each step resamples the momentum v ~ N(0, eps) and then runs
`num_leapfrog_steps` updates on the same minibatch:
  theta <- theta + v
  v     <- v + eps * grad - alpha * v + N(0, 2 * alpha * eps)
where alpha is the friction term.

Reference:
[1] Tianqi Chen, Emily B. Fox and Carlos Guestrin. "Stochastic Gradient
    Hamiltonian Monte Carlo" (2014). https://arxiv.org/abs/1402.4102
*/
class SghmcEngine : public StepEngine {
 public:
  SghmcEngine(
      std::unique_ptr<GradientEstimator> estimator,
      TuningMap step_sizes,
      TuningMap alpha,
      int num_leapfrog_steps);
  SamplerState initialize(const ParameterSet& params, std::mt19937& gen)
      override;
  SamplerState advance(
      const SamplerState& state,
      const Dataset& minibatch,
      std::mt19937& gen) override;

 private:
  std::unique_ptr<GradientEstimator> estimator;
  TuningMap step_sizes;
  TuningMap alpha;
  int num_leapfrog_steps;
  ParameterSet sample_momentum(const ParameterSet& params, std::mt19937& gen);
};

// Throws ConfigError unless at least one leapfrog step is requested.
void validate_num_leapfrog_steps(int num_leapfrog_steps);

} // namespace inference
} // namespace sgmcmc
