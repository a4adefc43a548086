/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <cstddef>
#include "sgmcmc/inference/dataset.h"
#include "sgmcmc/inference/model.h"
#include "sgmcmc/inference/parameters.h"

namespace sgmcmc {
namespace inference {

// An unbiased estimate of the log posterior and its gradient.
struct GradientEstimate {
  double log_posterior;
  ParameterSet gradients;
};

class GradientEstimator {
 public:
  virtual GradientEstimate estimate(
      const ParameterSet& params,
      const Dataset& minibatch) const = 0;
  virtual ~GradientEstimator() {}
};

/*
The plain stochastic gradient estimate
  log p(theta) + (N / n) * sum_{i in minibatch} log p(x_i | theta)
where N is the size of the full dataset and n the size of the minibatch.
*/
class MinibatchGradientEstimator : public GradientEstimator {
 public:
  MinibatchGradientEstimator(const Model& model, std::size_t num_observations);
  GradientEstimate estimate(
      const ParameterSet& params,
      const Dataset& minibatch) const override;

 private:
  const Model& model;
  double num_observations;
};

/*
Control variate estimate of the log posterior gradient [1]. Given a centre
point theta_hat (usually a posterior mode) and the exact gradient of the log
posterior at theta_hat over the full dataset, the estimate is
  grad log p(theta_hat | x) + g(theta) - g(theta_hat)
where g is the minibatch estimate on the same minibatch. Its variance
shrinks as theta approaches theta_hat.

Reference:
[1] Jack Baker, Paul Fearnhead, Emily B. Fox and Christopher Nemeth.
    "Control variates for stochastic gradient MCMC" (2019).
    https://arxiv.org/abs/1706.05439
*/
class ControlVariateGradientEstimator : public GradientEstimator {
 public:
  ControlVariateGradientEstimator(
      const Model& model,
      std::size_t num_observations,
      ParameterSet centre,
      GradientEstimate full_estimate_at_centre);
  GradientEstimate estimate(
      const ParameterSet& params,
      const Dataset& minibatch) const override;

  const ParameterSet& get_centre() const {
    return centre;
  }

 private:
  MinibatchGradientEstimator minibatch_estimator;
  ParameterSet centre;
  GradientEstimate full_estimate;
};

} // namespace inference
} // namespace sgmcmc
