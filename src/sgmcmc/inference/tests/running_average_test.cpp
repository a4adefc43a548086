/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <gtest/gtest.h>
#include <random>

#include "sgmcmc/inference/errors.h"
#include "sgmcmc/inference/running_average.h"
#include "sgmcmc/util.h"

using namespace sgmcmc;
using namespace inference;

namespace {

ParameterSet snapshot(double theta, double bias) {
  ParameterSet params;
  params["theta"] = Eigen::MatrixXd::Constant(1, 2, theta);
  params["bias"] = Eigen::MatrixXd::Constant(1, 1, bias);
  return params;
}

} // namespace

TEST(testrunningaverage, first_update_copies_snapshot) {
  RunningAverage average(snapshot(100.0, 100.0));
  EXPECT_EQ(average.count(), 0);
  average.update(snapshot(0.3, -2.0));
  EXPECT_EQ(average.count(), 1);
  // exact copy, the template snapshot is not counted
  EXPECT_EQ(average.mean().at("theta")(0, 1), 0.3);
  EXPECT_EQ(average.mean().at("bias")(0, 0), -2.0);
}

TEST(testrunningaverage, arithmetic_mean) {
  RunningAverage average(snapshot(0.0, 0.0));
  average.update(snapshot(1.0, 10.0));
  average.update(snapshot(2.0, 20.0));
  EXPECT_DOUBLE_EQ(average.mean().at("theta")(0, 0), 1.5);
  average.update(snapshot(3.0, 30.0));
  EXPECT_DOUBLE_EQ(average.mean().at("theta")(0, 0), 2.0);
  EXPECT_DOUBLE_EQ(average.mean().at("bias")(0, 0), 20.0);
  EXPECT_EQ(average.count(), 3);
}

TEST(testrunningaverage, matches_batch_mean) {
  std::mt19937 gen(11);
  ParameterSet shape;
  shape["w"] = Eigen::MatrixXd::Zero(3, 2);
  RunningAverage average(shape);
  RunningMoments moments(shape);
  int n = 500;
  Eigen::MatrixXd draws = util::sample_standard_normal(gen, n, 6);
  for (int i = 0; i < n; i++) {
    Eigen::RowVectorXd row = draws.row(i);
    ParameterSet sample;
    sample["w"] = Eigen::Map<Eigen::MatrixXd>(row.data(), 3, 2);
    average.update(sample);
    moments.update(sample);
  }
  Eigen::RowVectorXd batch_mean = draws.colwise().mean();
  Eigen::MatrixXd centred = draws.rowwise() - batch_mean;
  Eigen::RowVectorXd batch_var =
      centred.array().square().matrix().colwise().sum() / (n - 1.0);
  for (int k = 0; k < 6; k++) {
    EXPECT_NEAR(average.mean().at("w")(k), batch_mean(k), 1e-12);
    EXPECT_NEAR(moments.mean().at("w")(k), batch_mean(k), 1e-12);
    EXPECT_NEAR(moments.variance().at("w")(k), batch_var(k), 1e-10);
  }
  EXPECT_EQ(moments.count(), n);
}

TEST(testrunningaverage, moments_need_two_samples) {
  RunningMoments moments(snapshot(0.0, 0.0));
  EXPECT_EQ(moments.variance().at("theta")(0, 0), 0.0);
  moments.update(snapshot(4.0, 1.0));
  EXPECT_EQ(moments.variance().at("theta")(0, 0), 0.0);
  EXPECT_EQ(moments.mean().at("theta")(0, 0), 4.0);
  moments.update(snapshot(6.0, 1.0));
  EXPECT_DOUBLE_EQ(moments.variance().at("theta")(0, 0), 2.0);
  EXPECT_DOUBLE_EQ(moments.variance().at("bias")(0, 0), 0.0);
}

TEST(testrunningaverage, rejects_mismatched_snapshot) {
  RunningAverage average(snapshot(0.0, 0.0));
  ParameterSet wrong_shape = snapshot(1.0, 1.0);
  wrong_shape["theta"] = Eigen::MatrixXd::Zero(2, 1);
  EXPECT_THROW(average.update(wrong_shape), ConfigError);

  ParameterSet missing_key;
  missing_key["theta"] = Eigen::MatrixXd::Zero(1, 2);
  EXPECT_THROW(average.update(missing_key), ConfigError);
  EXPECT_EQ(average.count(), 0);

  RunningMoments moments(snapshot(0.0, 0.0));
  EXPECT_THROW(moments.update(missing_key), ConfigError);
}
