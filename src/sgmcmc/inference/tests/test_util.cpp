/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "sgmcmc/inference/tests/test_util.h"
#include <utility>
#include "sgmcmc/inference/errors.h"
#include "sgmcmc/util.h"

namespace sgmcmc {
namespace inference {

Dataset
make_gaussian_dataset(int n, const Eigen::RowVectorXd& mean, uint seed) {
  std::mt19937 gen(seed);
  Eigen::MatrixXd X = util::sample_standard_normal(gen, n, mean.size());
  X.rowwise() += mean;
  return Dataset(Tables{{"X", X}});
}

Dataset make_index_dataset(int n) {
  Eigen::MatrixXd index(n, 1);
  for (int i = 0; i < n; i++) {
    index(i, 0) = i;
  }
  return Dataset(Tables{{"index", index}});
}

SequenceEngine::SequenceEngine(std::vector<double> values)
    : StepEngine(), values(std::move(values)) {}

SamplerState SequenceEngine::advance(
    const SamplerState& state,
    const Dataset& /*minibatch*/,
    std::mt19937& /*gen*/) {
  SamplerState next = state;
  next.params.at("x").setConstant(values[num_calls % values.size()]);
  next.iteration++;
  num_calls++;
  return next;
}

SamplerState FailingEngine::advance(
    const SamplerState& state,
    const Dataset& /*minibatch*/,
    std::mt19937& /*gen*/) {
  SamplerState next = state;
  next.iteration++;
  if (next.iteration == fail_at) {
    throw DivergenceError("diverged");
  }
  return next;
}

double compute_mean_at(
    const std::vector<ParameterSet>& samples,
    const std::string& name,
    Eigen::Index index) {
  double mean = 0;
  for (const auto& sample : samples) {
    mean += sample.at(name)(index);
  }
  return mean / samples.size();
}

} // namespace inference
} // namespace sgmcmc
