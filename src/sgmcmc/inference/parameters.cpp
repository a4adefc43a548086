/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <fmt/format.h>
#include <cmath>
#include <utility>

#include "sgmcmc/inference/errors.h"
#include "sgmcmc/inference/parameters.h"
#include "sgmcmc/util.h"

namespace sgmcmc {
namespace inference {

ParameterSet zeros_like(const ParameterSet& params) {
  ParameterSet result;
  for (const auto& [name, value] : params) {
    result[name] = Eigen::MatrixXd::Zero(value.rows(), value.cols());
  }
  return result;
}

bool same_structure(const ParameterSet& a, const ParameterSet& b) {
  if (a.size() != b.size()) {
    return false;
  }
  auto it_b = b.begin();
  for (auto it_a = a.begin(); it_a != a.end(); ++it_a, ++it_b) {
    if (it_a->first != it_b->first or
        it_a->second.rows() != it_b->second.rows() or
        it_a->second.cols() != it_b->second.cols()) {
      return false;
    }
  }
  return true;
}

void check_same_structure(
    const ParameterSet& reference,
    const ParameterSet& params,
    const std::string& what) {
  if (same_structure(reference, params)) {
    return;
  }
  for (const auto& [name, value] : reference) {
    auto found = params.find(name);
    if (found == params.end()) {
      throw ConfigError(
          fmt::format("{} is missing parameter '{}'", what, name));
    }
    if (found->second.rows() != value.rows() or
        found->second.cols() != value.cols()) {
      throw ConfigError(fmt::format(
          "{} has shape {}x{} for parameter '{}', expected {}x{}",
          what,
          found->second.rows(),
          found->second.cols(),
          name,
          value.rows(),
          value.cols()));
    }
  }
  throw ConfigError(fmt::format(
      "{} has keys [{}], expected [{}]",
      what,
      describe_keys(keys_of(params)),
      describe_keys(keys_of(reference))));
}

std::vector<std::string> keys_of(const ParameterSet& params) {
  std::vector<std::string> keys;
  keys.reserve(params.size());
  for (const auto& entry : params) {
    keys.push_back(entry.first);
  }
  return keys;
}

std::string describe_keys(const std::vector<std::string>& keys) {
  std::string result;
  for (const auto& key : keys) {
    if (not result.empty()) {
      result += ", ";
    }
    result += key;
  }
  return result;
}

void validate_parameters(const ParameterSet& params) {
  if (params.empty()) {
    throw ConfigError("at least one parameter is required");
  }
  for (const auto& [name, value] : params) {
    if (value.size() == 0) {
      throw ConfigError(fmt::format("parameter '{}' is empty", name));
    }
    if (not util::all_finite(value)) {
      throw ConfigError(fmt::format(
          "initial value of parameter '{}' is not finite", name));
    }
  }
}

TuningConstant::TuningConstant(double value)
    : scalar(true), value(value) {}

TuningConstant::TuningConstant(TuningMap values)
    : scalar(false), value(0.0), values(std::move(values)) {}

TuningMap TuningConstant::resolve(
    const ParameterSet& params,
    const std::string& name) const {
  TuningMap result;
  if (scalar) {
    for (const auto& entry : params) {
      result[entry.first] = value;
    }
  } else {
    for (const auto& entry : params) {
      auto found = values.find(entry.first);
      if (found == values.end()) {
        throw ConfigError(fmt::format(
            "{} has no value for parameter '{}'", name, entry.first));
      }
      result[entry.first] = found->second;
    }
    for (const auto& entry : values) {
      if (params.find(entry.first) == params.end()) {
        throw ConfigError(fmt::format(
            "{} is given for '{}', which is not a parameter; parameters are [{}]",
            name,
            entry.first,
            describe_keys(keys_of(params))));
      }
    }
  }
  for (const auto& [key, resolved] : result) {
    if (not std::isfinite(resolved) or resolved <= 0) {
      throw ConfigError(fmt::format(
          "{} for parameter '{}' must be positive, got {}",
          name,
          key,
          resolved));
    }
  }
  return result;
}

} // namespace inference
} // namespace sgmcmc
