/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace sgmcmc {
namespace inference {

// Thrown during setup, before any step is taken, when parameters, data and
// tuning constants do not agree with each other.
struct ConfigError : public std::invalid_argument {
  explicit ConfigError(const std::string& message)
      : std::invalid_argument(message) {}
};

// Thrown mid-run when an update produces a non-finite value.
struct DivergenceError : public std::runtime_error {
  explicit DivergenceError(const std::string& message)
      : std::runtime_error(message) {}
};

} // namespace inference
} // namespace sgmcmc
