/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <cstddef>
#include <memory>
#include <random>
#include "sgmcmc/inference/gradient/gradient_estimator.h"

namespace sgmcmc {
namespace inference {

struct ControlVariateConfig {
  // learning rate of the mode search
  double opt_step_size;
  int num_opt_iters;

  ~ControlVariateConfig() {}
  ControlVariateConfig(double opt_step_size = 1e-6, int num_opt_iters = 10000)
      : opt_step_size(opt_step_size), num_opt_iters(num_opt_iters) {}
};

/*
The exact log posterior and its gradient over the whole dataset. The data is
visited in contiguous chunks of `chunk_size` observations so that the model
never sees more than one chunk at a time.
*/
GradientEstimate compute_full_gradient(
    const Model& model,
    const Dataset& dataset,
    const ParameterSet& params,
    std::size_t chunk_size);

/*
Locate a posterior mode by stochastic gradient ascent on the minibatch
estimate of the log posterior:
  theta <- theta + step_size * grad
:param params: the starting point
:param step_size: learning rate of the ascent
:param num_iters: number of ascent steps
:param batch_size: observations per minibatch
:param gen: random number generator used to draw minibatches
:param verbose: print the log posterior estimate ten times over the search
:returns: the parameters after the last step
Throws DivergenceError if the parameters become non-finite.
*/
ParameterSet find_mode(
    const Model& model,
    const Dataset& dataset,
    ParameterSet params,
    double step_size,
    int num_iters,
    std::size_t batch_size,
    std::mt19937& gen,
    bool verbose = false);

/*
Set up a control variate estimator: search for a mode starting at `params`,
then compute the full-data gradient there. The chain of a control variate
sampler starts at the returned estimator's centre.
*/
std::unique_ptr<ControlVariateGradientEstimator> make_control_variate(
    const Model& model,
    const Dataset& dataset,
    const ParameterSet& params,
    const ControlVariateConfig& cv_config,
    std::size_t batch_size,
    std::mt19937& gen,
    bool verbose);

} // namespace inference
} // namespace sgmcmc
