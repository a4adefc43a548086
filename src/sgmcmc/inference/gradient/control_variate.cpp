/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <fmt/format.h>
#include <algorithm>
#include <iostream>
#include <utility>

#include "sgmcmc/inference/errors.h"
#include "sgmcmc/inference/gradient/control_variate.h"
#include "sgmcmc/inference/minibatch.h"
#include "sgmcmc/util.h"

namespace sgmcmc {
namespace inference {

GradientEstimate compute_full_gradient(
    const Model& model,
    const Dataset& dataset,
    const ParameterSet& params,
    std::size_t chunk_size) {
  if (chunk_size == 0) {
    throw ConfigError("chunk size for the full gradient must be positive");
  }
  ModelEvalResult prior = model.log_prior(params);
  check_same_structure(params, prior.gradients, "log prior gradient");
  GradientEstimate result{prior.log_prob, std::move(prior.gradients)};

  std::size_t n = dataset.num_observations();
  for (std::size_t begin = 0; begin < n; begin += chunk_size) {
    std::size_t end = std::min(n, begin + chunk_size);
    ModelEvalResult chunk =
        model.log_likelihood(params, dataset.slice(begin, end));
    check_same_structure(params, chunk.gradients, "log likelihood gradient");
    result.log_posterior += chunk.log_prob;
    for (auto& [name, grad] : result.gradients) {
      grad += chunk.gradients.at(name);
    }
  }
  return result;
}

ParameterSet find_mode(
    const Model& model,
    const Dataset& dataset,
    ParameterSet params,
    double step_size,
    int num_iters,
    std::size_t batch_size,
    std::mt19937& gen,
    bool verbose) {
  if (not(step_size > 0)) {
    throw ConfigError(fmt::format(
        "optimization step size must be positive, got {}", step_size));
  }
  if (num_iters < 0) {
    throw ConfigError(fmt::format(
        "number of optimization iterations must be non-negative, got {}",
        num_iters));
  }
  MinibatchGradientEstimator estimator(model, dataset.num_observations());
  MinibatchSampler minibatches(dataset.num_observations(), batch_size);
  int report_every = std::max(1, num_iters / 10);

  if (verbose and num_iters > 0) {
    std::cout << "Finding a posterior mode for the control variate\n";
  }
  for (int i = 1; i <= num_iters; i++) {
    GradientEstimate estimate =
        estimator.estimate(params, minibatches.draw(dataset, gen));
    for (auto& [name, value] : params) {
      value += step_size * estimate.gradients.at(name);
      if (not util::all_finite(value)) {
        throw DivergenceError(fmt::format(
            "parameter '{}' became non-finite at optimization iteration {}; "
            "try a smaller optimization step size",
            name,
            i));
      }
    }
    if (verbose and i % report_every == 0) {
      std::cout << fmt::format(
          "Iteration: {}\t\tLog posterior estimate: {}\n",
          i,
          estimate.log_posterior);
    }
  }
  return params;
}

std::unique_ptr<ControlVariateGradientEstimator> make_control_variate(
    const Model& model,
    const Dataset& dataset,
    const ParameterSet& params,
    const ControlVariateConfig& cv_config,
    std::size_t batch_size,
    std::mt19937& gen,
    bool verbose) {
  ParameterSet mode = find_mode(
      model,
      dataset,
      params,
      cv_config.opt_step_size,
      cv_config.num_opt_iters,
      batch_size,
      gen,
      verbose);
  GradientEstimate full_estimate =
      compute_full_gradient(model, dataset, mode, batch_size);
  if (verbose) {
    std::cout << fmt::format(
        "Log posterior at the control variate centre: {}\n",
        full_estimate.log_posterior);
  }
  return std::make_unique<ControlVariateGradientEstimator>(
      model, dataset.num_observations(), mode, std::move(full_estimate));
}

} // namespace inference
} // namespace sgmcmc
