/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <cmath>
#include <utility>

#include "sgmcmc/inference/engine/sgnht_engine.h"
#include "sgmcmc/util.h"

namespace sgmcmc {
namespace inference {

SgnhtEngine::SgnhtEngine(
    std::unique_ptr<GradientEstimator> estimator,
    TuningMap step_sizes,
    TuningMap a)
    : StepEngine(),
      estimator(std::move(estimator)),
      step_sizes(std::move(step_sizes)),
      a(std::move(a)) {}

SamplerState SgnhtEngine::initialize(
    const ParameterSet& params,
    std::mt19937& gen) {
  SamplerState state;
  state.params = params;
  ParameterSet& momentum = state.auxiliary["momentum"];
  ParameterSet& thermostat = state.auxiliary["thermostat"];
  for (const auto& [name, value] : params) {
    momentum[name] = std::sqrt(step_sizes.at(name)) *
        util::sample_standard_normal(gen, value.rows(), value.cols());
    thermostat[name] = Eigen::MatrixXd::Constant(1, 1, a.at(name));
  }
  return state;
}

SamplerState SgnhtEngine::advance(
    const SamplerState& state,
    const Dataset& minibatch,
    std::mt19937& gen) {
  SamplerState next = state;
  ParameterSet& momentum = next.get_auxiliary("momentum");
  ParameterSet& thermostat = next.get_auxiliary("thermostat");
  GradientEstimate estimate = estimator->estimate(state.params, minibatch);

  for (auto& [name, value] : next.params) {
    double eps = step_sizes.at(name);
    Eigen::MatrixXd& v = momentum.at(name);
    double& xi = thermostat.at(name)(0, 0);
    Eigen::MatrixXd noise =
        util::sample_standard_normal(gen, v.rows(), v.cols());
    v += eps * estimate.gradients.at(name) - xi * v +
        std::sqrt(2 * a.at(name) * eps) * noise;
    value += v;
    xi += v.squaredNorm() / static_cast<double>(v.size()) - eps;
  }
  next.iteration++;
  check_divergence(next.params, next.iteration);
  return next;
}

} // namespace inference
} // namespace sgmcmc
