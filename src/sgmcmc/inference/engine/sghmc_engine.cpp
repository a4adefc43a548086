/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <fmt/format.h>
#include <cmath>
#include <utility>

#include "sgmcmc/inference/engine/sghmc_engine.h"
#include "sgmcmc/inference/errors.h"
#include "sgmcmc/util.h"

namespace sgmcmc {
namespace inference {

void validate_num_leapfrog_steps(int num_leapfrog_steps) {
  if (num_leapfrog_steps < 1) {
    throw ConfigError(fmt::format(
        "number of leapfrog steps must be positive, got {}",
        num_leapfrog_steps));
  }
}

SghmcEngine::SghmcEngine(
    std::unique_ptr<GradientEstimator> estimator,
    TuningMap step_sizes,
    TuningMap alpha,
    int num_leapfrog_steps)
    : StepEngine(),
      estimator(std::move(estimator)),
      step_sizes(std::move(step_sizes)),
      alpha(std::move(alpha)),
      num_leapfrog_steps(num_leapfrog_steps) {
  validate_num_leapfrog_steps(num_leapfrog_steps);
}

ParameterSet SghmcEngine::sample_momentum(
    const ParameterSet& params,
    std::mt19937& gen) {
  ParameterSet momentum;
  for (const auto& [name, value] : params) {
    momentum[name] = std::sqrt(step_sizes.at(name)) *
        util::sample_standard_normal(gen, value.rows(), value.cols());
  }
  return momentum;
}

SamplerState SghmcEngine::initialize(
    const ParameterSet& params,
    std::mt19937& gen) {
  SamplerState state;
  state.params = params;
  state.auxiliary["momentum"] = sample_momentum(params, gen);
  return state;
}

SamplerState SghmcEngine::advance(
    const SamplerState& state,
    const Dataset& minibatch,
    std::mt19937& gen) {
  SamplerState next = state;
  ParameterSet& momentum = next.auxiliary["momentum"];
  momentum = sample_momentum(next.params, gen);

  for (int l = 0; l < num_leapfrog_steps; l++) {
    for (auto& [name, value] : next.params) {
      value += momentum.at(name);
    }
    GradientEstimate estimate = estimator->estimate(next.params, minibatch);
    for (auto& [name, v] : momentum) {
      double eps = step_sizes.at(name);
      double friction = alpha.at(name);
      Eigen::MatrixXd noise =
          util::sample_standard_normal(gen, v.rows(), v.cols());
      v += eps * estimate.gradients.at(name) - friction * v +
          std::sqrt(2 * friction * eps) * noise;
    }
  }
  next.iteration++;
  check_divergence(next.params, next.iteration);
  return next;
}

} // namespace inference
} // namespace sgmcmc
