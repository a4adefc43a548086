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
Stochastic gradient Langevin dynamics [1]:
  theta <- theta + eps / 2 * grad + N(0, eps)

Reference:
[1] Max Welling and Yee Whye Teh. "Bayesian Learning via Stochastic Gradient
    Langevin Dynamics" (2011).
*/
class SgldEngine : public StepEngine {
 public:
  SgldEngine(
      std::unique_ptr<GradientEstimator> estimator,
      TuningMap step_sizes);
  SamplerState advance(
      const SamplerState& state,
      const Dataset& minibatch,
      std::mt19937& gen) override;

 private:
  std::unique_ptr<GradientEstimator> estimator;
  TuningMap step_sizes;
};

} // namespace inference
} // namespace sgmcmc
