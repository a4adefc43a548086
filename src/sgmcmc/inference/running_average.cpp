/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "sgmcmc/inference/running_average.h"

namespace sgmcmc {
namespace inference {

RunningAverage::RunningAverage(const ParameterSet& shape)
    : n(0), average(shape) {}

void RunningAverage::update(const ParameterSet& snapshot) {
  check_same_structure(average, snapshot, "snapshot for the running average");
  n++;
  if (n == 1) {
    // the mean of one sample is the sample itself
    average = snapshot;
    return;
  }
  for (auto& [name, avg] : average) {
    avg += (snapshot.at(name) - avg) / static_cast<double>(n);
  }
}

RunningMoments::RunningMoments(const ParameterSet& shape)
    : n(0), sample_mean(zeros_like(shape)), M2(zeros_like(shape)) {}

void RunningMoments::update(const ParameterSet& snapshot) {
  check_same_structure(sample_mean, snapshot, "snapshot for running moments");
  // uses Welford's online algorithm
  n++;
  for (auto& [name, mean] : sample_mean) {
    const Eigen::MatrixXd& sample = snapshot.at(name);
    Eigen::MatrixXd delta = sample - mean;
    mean += delta / static_cast<double>(n);
    Eigen::MatrixXd delta2 = sample - mean;
    M2.at(name) += delta.cwiseProduct(delta2);
  }
}

ParameterSet RunningMoments::variance() const {
  ParameterSet result = zeros_like(M2);
  if (n < 2) {
    return result;
  }
  for (auto& [name, var] : result) {
    var = M2.at(name) / static_cast<double>(n - 1);
  }
  return result;
}

} // namespace inference
} // namespace sgmcmc
