/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <vector>
#include "sgmcmc/inference/dataset.h"
#include "sgmcmc/inference/engine/step_engine.h"
#include "sgmcmc/inference/model.h"

namespace sgmcmc {
namespace inference {

// n draws from N(mean, I), one per row of table "X"
Dataset make_gaussian_dataset(int n, const Eigen::RowVectorXd& mean, uint seed);

// A model whose log density is identically zero.
class FlatModel : public Model {
 public:
  ModelEvalResult log_likelihood(const ParameterSet& params, const Dataset&)
      const override {
    return {0.0, zeros_like(params)};
  }
};

// A dataset of n observations of a single column, for use with FlatModel.
Dataset make_index_dataset(int n);

// Step engine that ignores the data and sets every entry of parameter "x" to
// the next value of a fixed sequence, cycling when it runs out.
class SequenceEngine : public StepEngine {
 public:
  explicit SequenceEngine(std::vector<double> values);
  SamplerState advance(
      const SamplerState& state,
      const Dataset& minibatch,
      std::mt19937& gen) override;
  int get_num_calls() const {
    return num_calls;
  }

 private:
  std::vector<double> values;
  int num_calls = 0;
};

// Step engine that throws DivergenceError on the given call.
class FailingEngine : public StepEngine {
 public:
  explicit FailingEngine(int fail_at) : fail_at(fail_at) {}
  SamplerState advance(
      const SamplerState& state,
      const Dataset& minibatch,
      std::mt19937& gen) override;

 private:
  int fail_at;
};

double compute_mean_at(
    const std::vector<ParameterSet>& samples,
    const std::string& name,
    Eigen::Index index);

} // namespace inference
} // namespace sgmcmc
