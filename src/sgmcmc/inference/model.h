/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <string>
#include <vector>
#include "sgmcmc/inference/dataset.h"
#include "sgmcmc/inference/parameters.h"

namespace sgmcmc {
namespace inference {

// The result of evaluating a log density term of a Model.
struct ModelEvalResult {
  // The log density at the given parameters.
  double log_prob;

  // The derivative of the log density with respect to every parameter. It
  // has the same keys and shapes as the parameters it was evaluated at.
  ParameterSet gradients;
};

// This interface defines what the samplers need to know about a model: the
// log likelihood of a set of observations and the log prior density, each
// with its gradient with respect to the parameters.  Parameters are assumed
// to be supported over the full range of real numbers; a model with
// constrained parameters is expected to sample them in a transformed space.
class Model {
 public:
  // Given parameter values and a set of observations (the whole dataset, a
  // minibatch or a chunk of it), compute the log likelihood summed over the
  // observations and its gradient.
  virtual ModelEvalResult log_likelihood(
      const ParameterSet& params,
      const Dataset& data) const = 0;

  // The log prior density and its gradient. Defaults to an improper flat
  // prior.
  virtual ModelEvalResult log_prior(const ParameterSet& params) const {
    return {0.0, zeros_like(params)};
  }

  // The parameter names the model expects. An empty list disables the check.
  virtual std::vector<std::string> parameter_names() const {
    return {};
  }

  // The dataset tables the model reads.
  virtual std::vector<std::string> required_data() const {
    return {};
  }

  virtual ~Model() {}
};

// Checks `params` and `data` against what `model` declares; throws
// ConfigError on any disagreement.
void validate_model_inputs(
    const Model& model,
    const ParameterSet& params,
    const Dataset& data);

} // namespace inference
} // namespace sgmcmc
