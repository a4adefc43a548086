/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <fmt/format.h>
#include <algorithm>

#include "sgmcmc/inference/errors.h"
#include "sgmcmc/inference/model.h"

namespace sgmcmc {
namespace inference {

void validate_model_inputs(
    const Model& model,
    const ParameterSet& params,
    const Dataset& data) {
  if (data.empty() or data.num_observations() == 0) {
    throw ConfigError("dataset has no observations");
  }
  check_required_tables(data, model.required_data());
  validate_parameters(params);

  std::vector<std::string> expected = model.parameter_names();
  if (expected.empty()) {
    return;
  }
  std::sort(expected.begin(), expected.end());
  std::vector<std::string> given = keys_of(params);
  if (given != expected) {
    throw ConfigError(fmt::format(
        "parameters [{}] do not match the model's parameters [{}]",
        describe_keys(given),
        describe_keys(expected)));
  }
}

} // namespace inference
} // namespace sgmcmc
