/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <cmath>
#include <utility>

#include "sgmcmc/inference/engine/sgld_engine.h"
#include "sgmcmc/util.h"

namespace sgmcmc {
namespace inference {

SgldEngine::SgldEngine(
    std::unique_ptr<GradientEstimator> estimator,
    TuningMap step_sizes)
    : StepEngine(),
      estimator(std::move(estimator)),
      step_sizes(std::move(step_sizes)) {}

SamplerState SgldEngine::advance(
    const SamplerState& state,
    const Dataset& minibatch,
    std::mt19937& gen) {
  SamplerState next = state;
  GradientEstimate estimate = estimator->estimate(state.params, minibatch);
  for (auto& [name, value] : next.params) {
    double eps = step_sizes.at(name);
    Eigen::MatrixXd noise =
        util::sample_standard_normal(gen, value.rows(), value.cols());
    value += eps / 2 * estimate.gradients.at(name) + std::sqrt(eps) * noise;
  }
  next.iteration++;
  check_divergence(next.params, next.iteration);
  return next;
}

} // namespace inference
} // namespace sgmcmc
