/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#define _USE_MATH_DEFINES
#include <cmath>

#include <fmt/format.h>

#include "sgmcmc/inference/errors.h"
#include "sgmcmc/models/gaussian_mean.h"

namespace sgmcmc {
namespace models {

using inference::ConfigError;
using inference::Dataset;
using inference::ModelEvalResult;
using inference::ParameterSet;

static const double LOG_2_PI = std::log(2 * M_PI);

GaussianMean::GaussianMean(double prior_variance)
    : prior_variance(prior_variance) {
  if (not(prior_variance > 0)) {
    throw ConfigError(fmt::format(
        "prior variance must be positive, got {}", prior_variance));
  }
}

ModelEvalResult GaussianMean::log_likelihood(
    const ParameterSet& params,
    const Dataset& data) const {
  const Eigen::MatrixXd& theta = params.at("theta");
  const Eigen::MatrixXd& X = data.table("X");
  if (theta.rows() != 1 or theta.cols() != X.cols()) {
    throw ConfigError(fmt::format(
        "theta must be 1x{} to match the data, got {}x{}",
        X.cols(),
        theta.rows(),
        theta.cols()));
  }
  auto n = static_cast<double>(X.rows());
  auto d = static_cast<double>(X.cols());
  Eigen::MatrixXd centred = X.rowwise() - theta.row(0);
  double log_prob = -0.5 * centred.squaredNorm() - 0.5 * n * d * LOG_2_PI;
  ParameterSet gradients;
  gradients["theta"] = centred.colwise().sum();
  return {log_prob, gradients};
}

ModelEvalResult GaussianMean::log_prior(const ParameterSet& params) const {
  const Eigen::MatrixXd& theta = params.at("theta");
  auto d = static_cast<double>(theta.size());
  double log_prob = -0.5 * theta.squaredNorm() / prior_variance -
      0.5 * d * (LOG_2_PI + std::log(prior_variance));
  ParameterSet gradients;
  gradients["theta"] = -theta / prior_variance;
  return {log_prob, gradients};
}

Eigen::MatrixXd GaussianMean::posterior_mean(const Eigen::MatrixXd& X) const {
  double precision = static_cast<double>(X.rows()) + 1.0 / prior_variance;
  return X.colwise().sum() / precision;
}

} // namespace models
} // namespace sgmcmc
