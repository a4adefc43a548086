/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "sgmcmc/util.h"

namespace sgmcmc {
namespace util {

double logistic(double logodds) {
  return 1.0 / (1.0 + std::exp(-logodds));
}

Eigen::MatrixXd logistic(const Eigen::MatrixXd& logodds) {
  return logodds.unaryExpr([](double x) { return logistic(x); });
}

double log1pexp(double x) {
  if (x <= -37) {
    return std::exp(x);
  } else if (x <= 18) {
    return std::log1p(std::exp(x));
  } else if (x <= 33.3) {
    return x + std::exp(-x);
  } else {
    return x;
  }
}

Eigen::MatrixXd log1pexp(const Eigen::MatrixXd& x) {
  return x.unaryExpr([](double x) { return log1pexp(x); });
}

Eigen::MatrixXd sample_standard_normal(
    std::mt19937& gen,
    Eigen::Index rows,
    Eigen::Index cols) {
  std::normal_distribution<double> normal_dist(0.0, 1.0);
  Eigen::MatrixXd result(rows, cols);
  // fill column by column so that draws follow Eigen's storage order
  for (auto j : range(cols)) {
    for (auto i : range(rows)) {
      result(i, j) = normal_dist(gen);
    }
  }
  return result;
}

bool all_finite(const Eigen::MatrixXd& matrix) {
  return matrix.allFinite();
}

} // namespace util
} // namespace sgmcmc
