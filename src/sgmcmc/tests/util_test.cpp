/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <vector>

#include "sgmcmc/util.h"

using namespace sgmcmc;

TEST(testutil, logistic) {
  EXPECT_DOUBLE_EQ(util::logistic(0.0), 0.5);
  EXPECT_NEAR(util::logistic(2.0), 1.0 / (1.0 + std::exp(-2.0)), 1e-15);
  EXPECT_NEAR(util::logistic(2.0) + util::logistic(-2.0), 1.0, 1e-15);

  Eigen::MatrixXd logodds(2, 1);
  logodds << 0.0, 3.0;
  Eigen::MatrixXd p = util::logistic(logodds);
  EXPECT_DOUBLE_EQ(p(0, 0), 0.5);
  EXPECT_NEAR(p(1, 0), util::logistic(3.0), 1e-15);
}

TEST(testutil, log1pexp) {
  std::vector<double> xs = {-50.0, -3.0, 0.0, 5.0, 25.0, 40.0};
  for (double x : xs) {
    double expected = x > 0 ? x + std::log1p(std::exp(-x))
                            : std::log1p(std::exp(x));
    EXPECT_NEAR(util::log1pexp(x), expected, 1e-12) << "x = " << x;
  }
  // large arguments must not overflow
  EXPECT_DOUBLE_EQ(util::log1pexp(1000.0), 1000.0);

  Eigen::MatrixXd x(1, 2);
  x << 0.0, 1000.0;
  Eigen::MatrixXd y = util::log1pexp(x);
  EXPECT_NEAR(y(0, 0), std::log(2.0), 1e-15);
  EXPECT_DOUBLE_EQ(y(0, 1), 1000.0);
}

TEST(testutil, sample_standard_normal) {
  std::mt19937 gen(1234);
  Eigen::MatrixXd draws = util::sample_standard_normal(gen, 20000, 2);
  EXPECT_EQ(draws.rows(), 20000);
  EXPECT_EQ(draws.cols(), 2);
  for (int j = 0; j < 2; j++) {
    double mean = draws.col(j).mean();
    double var = (draws.col(j).array() - mean).square().mean();
    EXPECT_NEAR(mean, 0.0, 0.05);
    EXPECT_NEAR(var, 1.0, 0.05);
  }

  std::mt19937 gen1(99);
  std::mt19937 gen2(99);
  EXPECT_EQ(
      util::sample_standard_normal(gen1, 3, 4),
      util::sample_standard_normal(gen2, 3, 4));
}

TEST(testutil, all_finite) {
  Eigen::MatrixXd m = Eigen::MatrixXd::Ones(2, 2);
  EXPECT_TRUE(util::all_finite(m));
  m(1, 0) = std::numeric_limits<double>::quiet_NaN();
  EXPECT_FALSE(util::all_finite(m));
  m(1, 0) = std::numeric_limits<double>::infinity();
  EXPECT_FALSE(util::all_finite(m));
}

TEST(testutil, range) {
  int sum = 0;
  for (int i : util::range(5)) {
    sum += i;
  }
  EXPECT_EQ(sum, 10);
  int count = 0;
  for (int i : util::range(3, 7)) {
    EXPECT_GE(i, 3);
    count++;
  }
  EXPECT_EQ(count, 4);
}
