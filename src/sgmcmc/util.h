/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#define _USE_MATH_DEFINES
#include <cmath>

#include <boost/range/irange.hpp>

#include <Eigen/Dense>
#include <random>

namespace sgmcmc {
namespace util {

// compute  1 / (1 + exp(-logodds))
double logistic(double logodds);

Eigen::MatrixXd logistic(const Eigen::MatrixXd& logodds);

/*
Compute `log(1 + exp(x))` with numerical stability.
See: https://cran.r-project.org/web/packages/Rmpfr/vignettes/log1mexp-note.pdf
:param x:
:returns: log(1 + exp(x))
*/
double log1pexp(double x);

Eigen::MatrixXd log1pexp(const Eigen::MatrixXd& x);

/*
Fill a matrix with independent draws from N(0, 1).
:param gen: random number generator
:param rows: number of rows of the result
:param cols: number of columns of the result
*/
Eigen::MatrixXd sample_standard_normal(
    std::mt19937& gen,
    Eigen::Index rows,
    Eigen::Index cols);

// true if no entry of the matrix is NaN or infinite
bool all_finite(const Eigen::MatrixXd& matrix);

/*
 * Iterables over integer ranges.
 * Source: https://codereview.stackexchange.com/a/52217
 */
template <class Integer>
decltype(auto) range(Integer first, Integer last) {
  return boost::irange(first, last);
}

template <class Integer>
decltype(auto) range(Integer last) {
  return boost::irange(static_cast<Integer>(0), last);
}

} // namespace util
} // namespace sgmcmc
