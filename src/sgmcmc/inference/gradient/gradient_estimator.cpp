/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <utility>

#include "sgmcmc/inference/errors.h"
#include "sgmcmc/inference/gradient/gradient_estimator.h"

namespace sgmcmc {
namespace inference {

MinibatchGradientEstimator::MinibatchGradientEstimator(
    const Model& model,
    std::size_t num_observations)
    : model(model), num_observations(static_cast<double>(num_observations)) {}

GradientEstimate MinibatchGradientEstimator::estimate(
    const ParameterSet& params,
    const Dataset& minibatch) const {
  if (minibatch.num_observations() == 0) {
    throw ConfigError("cannot estimate a gradient from an empty minibatch");
  }
  double scale =
      num_observations / static_cast<double>(minibatch.num_observations());
  ModelEvalResult likelihood = model.log_likelihood(params, minibatch);
  ModelEvalResult prior = model.log_prior(params);
  check_same_structure(params, likelihood.gradients, "log likelihood gradient");
  check_same_structure(params, prior.gradients, "log prior gradient");

  GradientEstimate result{
      prior.log_prob + scale * likelihood.log_prob, std::move(prior.gradients)};
  for (auto& [name, grad] : result.gradients) {
    grad += scale * likelihood.gradients.at(name);
  }
  return result;
}

ControlVariateGradientEstimator::ControlVariateGradientEstimator(
    const Model& model,
    std::size_t num_observations,
    ParameterSet centre0,
    GradientEstimate full_estimate_at_centre)
    : minibatch_estimator(model, num_observations),
      centre(std::move(centre0)),
      full_estimate(std::move(full_estimate_at_centre)) {
  check_same_structure(
      centre, full_estimate.gradients, "full gradient at the centre");
}

GradientEstimate ControlVariateGradientEstimator::estimate(
    const ParameterSet& params,
    const Dataset& minibatch) const {
  GradientEstimate at_params = minibatch_estimator.estimate(params, minibatch);
  GradientEstimate at_centre = minibatch_estimator.estimate(centre, minibatch);
  at_params.log_posterior +=
      full_estimate.log_posterior - at_centre.log_posterior;
  for (auto& [name, grad] : at_params.gradients) {
    grad += full_estimate.gradients.at(name) - at_centre.gradients.at(name);
  }
  return at_params;
}

} // namespace inference
} // namespace sgmcmc
