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
Mean of a multivariate Gaussian with identity covariance:
  theta ~ N(0, prior_variance * I)
  x_i ~ N(theta, I)
Data: table "X" with one d-dimensional observation per row.
Parameters: "theta", a 1 x d row vector.
*/
class GaussianMean : public inference::Model {
 public:
  explicit GaussianMean(double prior_variance = 10.0);

  inference::ModelEvalResult log_likelihood(
      const inference::ParameterSet& params,
      const inference::Dataset& data) const override;
  inference::ModelEvalResult log_prior(
      const inference::ParameterSet& params) const override;
  std::vector<std::string> parameter_names() const override {
    return {"theta"};
  }
  std::vector<std::string> required_data() const override {
    return {"X"};
  }

  // The exact posterior mean of theta given the observations in X.
  Eigen::MatrixXd posterior_mean(const Eigen::MatrixXd& X) const;

 private:
  double prior_variance;
};

} // namespace models
} // namespace sgmcmc
