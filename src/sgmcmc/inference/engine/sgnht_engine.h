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
Stochastic gradient Nose-Hoover thermostat [1]. Every parameter carries a
momentum v and a scalar thermostat xi that adapts the friction so that the
kinetic energy matches the target temperature:
  v     <- v + eps * grad - xi * v + N(0, 2 * a * eps)
  theta <- theta + v
  xi    <- xi + mean(v^2) - eps
The momentum starts at N(0, eps) and the thermostat at `a`.

Reference:
[1] Nan Ding, Youhan Fang, Ryan Babbush, Changyou Chen, Robert D. Skeel and
    Hartmut Neven. "Bayesian Sampling Using Stochastic Gradient Thermostats"
    (2014).
*/
class SgnhtEngine : public StepEngine {
 public:
  SgnhtEngine(
      std::unique_ptr<GradientEstimator> estimator,
      TuningMap step_sizes,
      TuningMap a);
  SamplerState initialize(const ParameterSet& params, std::mt19937& gen)
      override;
  SamplerState advance(
      const SamplerState& state,
      const Dataset& minibatch,
      std::mt19937& gen) override;

 private:
  std::unique_ptr<GradientEstimator> estimator;
  TuningMap step_sizes;
  TuningMap a;
};

} // namespace inference
} // namespace sgmcmc
