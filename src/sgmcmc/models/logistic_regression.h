/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include "sgmcmc/inference/model.h"

namespace sgmcmc {
namespace models {

/*
Bayesian logistic regression with a Laplace prior:
  beta_j, bias ~ Laplace(0, prior_scale)
  y_i ~ Bernoulli(logistic(bias + x_i' beta))
Data: table "X" (N x d covariates) and table "y" (N x 1 labels, 0 or 1).
Parameters: "beta" (d x 1) and "bias" (1 x 1).
*/
class LogisticRegression : public inference::Model {
 public:
  explicit LogisticRegression(double prior_scale = 1.0);

  inference::ModelEvalResult log_likelihood(
      const inference::ParameterSet& params,
      const inference::Dataset& data) const override;
  inference::ModelEvalResult log_prior(
      const inference::ParameterSet& params) const override;
  std::vector<std::string> parameter_names() const override {
    return {"beta", "bias"};
  }
  std::vector<std::string> required_data() const override {
    return {"X", "y"};
  }

  /*
  Average negative log probability of the labels in `held_out`:
    -mean(y log p + (1 - y) log(1 - p))
  Suitable as a run diagnostic; it does not modify anything.
  */
  double log_loss(
      const inference::ParameterSet& params,
      const inference::Dataset& held_out) const;

 private:
  double prior_scale;
  // the single column of the "y" table
  Eigen::VectorXd labels(const inference::Dataset& data) const;
  // bias + X beta, one entry per row of X
  Eigen::VectorXd linear_predictor(
      const inference::ParameterSet& params,
      const Eigen::MatrixXd& X) const;
};

} // namespace models
} // namespace sgmcmc
