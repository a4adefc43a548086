/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <Eigen/Dense>
#include <map>
#include <string>
#include <vector>

namespace sgmcmc {
namespace inference {

/*
Named parameter tensors. Scalars are stored as 1x1 matrices. The key set and
the shape of every entry are fixed for the lifetime of a run.
*/
using ParameterSet = std::map<std::string, Eigen::MatrixXd>;

// Per-parameter tuning values after broadcasting, keyed like a ParameterSet.
using TuningMap = std::map<std::string, double>;

// A ParameterSet with the same keys and shapes as `params`, filled with zeros.
ParameterSet zeros_like(const ParameterSet& params);

// true if both sets have the same keys and every entry has the same shape
bool same_structure(const ParameterSet& a, const ParameterSet& b);

// Throws ConfigError naming `what` unless `params` matches `reference`.
void check_same_structure(
    const ParameterSet& reference,
    const ParameterSet& params,
    const std::string& what);

std::vector<std::string> keys_of(const ParameterSet& params);

// Comma separated key list, used in error messages.
std::string describe_keys(const std::vector<std::string>& keys);

// Throws ConfigError if `params` is empty or holds a non-finite value.
void validate_parameters(const ParameterSet& params);

/*
A tuning constant such as a step size. It is given either as a single value
that applies to every parameter, or as one value per parameter name.
*/
class TuningConstant {
 public:
  // NOLINTNEXTLINE(google-explicit-constructor)
  TuningConstant(double value);
  // NOLINTNEXTLINE(google-explicit-constructor)
  TuningConstant(TuningMap values);

  bool is_scalar() const {
    return scalar;
  }

  /*
  Broadcast the constant over the keys of `params`.
  :param params: the parameters the constant applies to
  :param name: the constant's name, for error messages
  :returns: one value per parameter key
  Throws ConfigError if a per-parameter map does not have exactly the keys of
  `params`, or if any value is not strictly positive.
  */
  TuningMap resolve(const ParameterSet& params, const std::string& name) const;

 private:
  bool scalar;
  double value;
  TuningMap values;
};

} // namespace inference
} // namespace sgmcmc
