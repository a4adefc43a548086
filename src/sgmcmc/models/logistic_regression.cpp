/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <fmt/format.h>
#include <cmath>

#include "sgmcmc/inference/errors.h"
#include "sgmcmc/models/logistic_regression.h"
#include "sgmcmc/util.h"

namespace sgmcmc {
namespace models {

using inference::ConfigError;
using inference::Dataset;
using inference::ModelEvalResult;
using inference::ParameterSet;

LogisticRegression::LogisticRegression(double prior_scale)
    : prior_scale(prior_scale) {
  if (not(prior_scale > 0)) {
    throw ConfigError(
        fmt::format("prior scale must be positive, got {}", prior_scale));
  }
}

Eigen::VectorXd LogisticRegression::linear_predictor(
    const ParameterSet& params,
    const Eigen::MatrixXd& X) const {
  const Eigen::MatrixXd& beta = params.at("beta");
  const Eigen::MatrixXd& bias = params.at("bias");
  if (beta.rows() != X.cols() or beta.cols() != 1) {
    throw ConfigError(fmt::format(
        "beta must be {}x1 to match the covariates, got {}x{}",
        X.cols(),
        beta.rows(),
        beta.cols()));
  }
  if (bias.size() != 1) {
    throw ConfigError(fmt::format(
        "bias must be 1x1, got {}x{}", bias.rows(), bias.cols()));
  }
  Eigen::VectorXd z = X * beta;
  return (z.array() + bias(0, 0)).matrix();
}

Eigen::VectorXd LogisticRegression::labels(const Dataset& data) const {
  const Eigen::MatrixXd& y = data.table("y");
  if (y.cols() != 1) {
    throw ConfigError(
        fmt::format("labels must be a single column, got {}", y.cols()));
  }
  return y.col(0);
}

ModelEvalResult LogisticRegression::log_likelihood(
    const ParameterSet& params,
    const Dataset& data) const {
  const Eigen::MatrixXd& X = data.table("X");
  Eigen::VectorXd y = labels(data);
  Eigen::VectorXd z = linear_predictor(params, X);

  // log p(y | z) = y z - log(1 + exp(z))
  double log_prob = y.dot(z) - util::log1pexp(Eigen::MatrixXd(z)).sum();
  Eigen::VectorXd residual = y - util::logistic(Eigen::MatrixXd(z));

  ParameterSet gradients;
  gradients["beta"] = X.transpose() * residual;
  gradients["bias"] = Eigen::MatrixXd::Constant(1, 1, residual.sum());
  return {log_prob, gradients};
}

ModelEvalResult LogisticRegression::log_prior(
    const ParameterSet& params) const {
  double log_prob = 0;
  ParameterSet gradients;
  for (const auto& name : parameter_names()) {
    const Eigen::MatrixXd& value = params.at(name);
    log_prob += -value.cwiseAbs().sum() / prior_scale -
        static_cast<double>(value.size()) * std::log(2 * prior_scale);
    // the subgradient at zero is taken to be zero
    gradients[name] = -value.unaryExpr([](double x) {
      return static_cast<double>((x > 0) - (x < 0));
    }) / prior_scale;
  }
  return {log_prob, gradients};
}

double LogisticRegression::log_loss(
    const ParameterSet& params,
    const Dataset& held_out) const {
  const Eigen::MatrixXd& X = held_out.table("X");
  Eigen::VectorXd y = labels(held_out);
  if (y.size() == 0) {
    throw ConfigError("log loss needs at least one held-out observation");
  }
  Eigen::VectorXd z = linear_predictor(params, X);
  // -log p(y | z) = log(1 + exp(z)) - y z
  return (util::log1pexp(Eigen::MatrixXd(z)).sum() - y.dot(z)) /
      static_cast<double>(y.size());
}

} // namespace models
} // namespace sgmcmc
