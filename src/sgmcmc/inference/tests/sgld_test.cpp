/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <gtest/gtest.h>
#include <cmath>
#include <limits>

#include "sgmcmc/inference/errors.h"
#include "sgmcmc/inference/sgld.h"
#include "sgmcmc/inference/tests/test_util.h"
#include "sgmcmc/models/gaussian_mean.h"

using namespace sgmcmc;
using namespace inference;

namespace {

ParameterSet theta_zero() {
  ParameterSet params;
  params["theta"] = Eigen::MatrixXd::Zero(1, 2);
  return params;
}

} // namespace

TEST(testsgld, sgld_gaussian_mean) {
  models::GaussianMean model;
  Dataset data =
      make_gaussian_dataset(1000, Eigen::RowVector2d(1.0, -1.0), 5123401);
  Eigen::MatrixXd expected = model.posterior_mean(data.table("X"));

  SGLD sampler(model, data, theta_zero(), 5e-4, SamplerConfig(0.1, 17));
  EXPECT_EQ(sampler.get_minibatch_size(), 100);
  RunResult result = sampler.run(RunConfig(1000, 5000, 1000));
  const Eigen::MatrixXd& mean = result.average.mean().at("theta");
  EXPECT_NEAR(mean(0, 0), expected(0, 0), 0.05);
  EXPECT_NEAR(mean(0, 1), expected(0, 1), 0.05);
  EXPECT_EQ(result.average.count(), 5000);
  EXPECT_EQ(sampler.get_state().iteration, 6000);
}

TEST(testsgld, sgld_infer_gaussian_mean) {
  models::GaussianMean model;
  Dataset data =
      make_gaussian_dataset(1000, Eigen::RowVector2d(1.0, -1.0), 5123401);
  Eigen::MatrixXd expected = model.posterior_mean(data.table("X"));

  SGLD sampler(model, data, theta_zero(), 5e-4, SamplerConfig(100, 3));
  std::vector<ParameterSet> samples = sampler.infer(3000, 500);
  EXPECT_EQ(samples.size(), 3000);
  EXPECT_NEAR(compute_mean_at(samples, "theta", 0), expected(0, 0), 0.05);
  EXPECT_NEAR(compute_mean_at(samples, "theta", 1), expected(0, 1), 0.05);
}

TEST(testsgld, sgldcv_gaussian_mean) {
  models::GaussianMean model;
  Dataset data =
      make_gaussian_dataset(1000, Eigen::RowVector2d(1.0, -1.0), 5123401);
  Eigen::MatrixXd expected = model.posterior_mean(data.table("X"));

  SGLDCV sampler(
      model,
      data,
      theta_zero(),
      5e-4,
      SamplerConfig(0.1, 17),
      ControlVariateConfig(1e-4, 2000));
  // the chain starts at the mode found during construction
  EXPECT_NEAR(sampler.params().at("theta")(0, 0), expected(0, 0), 0.1);
  EXPECT_NEAR(sampler.params().at("theta")(0, 1), expected(0, 1), 0.1);
  EXPECT_EQ(sampler.get_state().iteration, 0);

  RunResult result = sampler.run(RunConfig(500, 3000, 1000));
  const Eigen::MatrixXd& mean = result.average.mean().at("theta");
  EXPECT_NEAR(mean(0, 0), expected(0, 0), 0.05);
  EXPECT_NEAR(mean(0, 1), expected(0, 1), 0.05);
}

TEST(testsgld, sgld_per_parameter_step_size) {
  models::GaussianMean model;
  Dataset data = make_gaussian_dataset(200, Eigen::RowVector2d(0.0, 0.0), 1);
  EXPECT_NO_THROW(SGLD(
      model, data, theta_zero(), TuningConstant(TuningMap{{"theta", 1e-3}})));
  EXPECT_THROW(
      SGLD(
          model,
          data,
          theta_zero(),
          TuningConstant(TuningMap{{"beta", 1e-3}})),
      ConfigError);
  EXPECT_THROW(SGLD(model, data, theta_zero(), 0.0), ConfigError);
  EXPECT_THROW(
      SGLDCV(
          model,
          data,
          theta_zero(),
          TuningConstant(TuningMap{{"beta", 1e-3}})),
      ConfigError);
}

TEST(testsgld, sgld_rejects_bad_setup) {
  models::GaussianMean model;
  Dataset data = make_gaussian_dataset(200, Eigen::RowVector2d(0.0, 0.0), 1);

  ParameterSet wrong_name;
  wrong_name["mu"] = Eigen::MatrixXd::Zero(1, 2);
  EXPECT_THROW(SGLD(model, data, wrong_name, 1e-3), ConfigError);

  ParameterSet not_finite = theta_zero();
  not_finite["theta"](0, 1) = std::numeric_limits<double>::infinity();
  EXPECT_THROW(SGLD(model, data, not_finite, 1e-3), ConfigError);

  EXPECT_THROW(
      SGLD(model, data, theta_zero(), 1e-3, SamplerConfig(500)), ConfigError);
  EXPECT_THROW(
      SGLD(model, data, theta_zero(), 1e-3, SamplerConfig(-0.1)), ConfigError);
  EXPECT_THROW(SGLD(model, Dataset(), theta_zero(), 1e-3), ConfigError);

  Dataset wrong_table(Tables{{"Y", Eigen::MatrixXd::Zero(10, 2)}});
  EXPECT_THROW(SGLD(model, wrong_table, theta_zero(), 1e-3), ConfigError);
}

TEST(testsgld, sgld_diverges_with_large_step_size) {
  models::GaussianMean model;
  Dataset data =
      make_gaussian_dataset(1000, Eigen::RowVector2d(1.0, -1.0), 5123401);
  SGLD sampler(model, data, theta_zero(), 10.0, SamplerConfig(0.1));
  EXPECT_THROW(sampler.run(RunConfig(0, 1000, 100)), DivergenceError);
}

TEST(testsgld, sgld_same_seed_same_chain) {
  models::GaussianMean model;
  Dataset data = make_gaussian_dataset(300, Eigen::RowVector2d(1.0, 2.0), 8);
  SGLD first(model, data, theta_zero(), 1e-3, SamplerConfig(0.1, 77));
  SGLD second(model, data, theta_zero(), 1e-3, SamplerConfig(0.1, 77));
  SGLD other(model, data, theta_zero(), 1e-3, SamplerConfig(0.1, 78));
  for (int i = 0; i < 20; i++) {
    first.step();
    second.step();
    other.step();
  }
  EXPECT_EQ(first.params().at("theta"), second.params().at("theta"));
  EXPECT_NE(first.params().at("theta"), other.params().at("theta"));
}
