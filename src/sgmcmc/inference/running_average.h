/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include "sgmcmc/inference/parameters.h"

namespace sgmcmc {
namespace inference {

/*
Streaming elementwise mean of a sequence of parameter snapshots, in constant
memory. The constructor fixes keys and shapes from a template snapshot, which
is not counted; after n calls to update, mean() is the arithmetic mean of the
n snapshots passed to update.
*/
class RunningAverage {
 public:
  explicit RunningAverage(const ParameterSet& shape);
  // Throws ConfigError if `snapshot` has different keys or shapes.
  void update(const ParameterSet& snapshot);
  const ParameterSet& mean() const {
    return average;
  }
  int count() const {
    return n;
  }

 private:
  int n;
  ParameterSet average;
};

// Streaming elementwise mean and variance, using Welford's online algorithm.
class RunningMoments {
 public:
  explicit RunningMoments(const ParameterSet& shape);
  void update(const ParameterSet& snapshot);
  const ParameterSet& mean() const {
    return sample_mean;
  }
  // Unbiased sample variance; zero until two snapshots have been seen.
  ParameterSet variance() const;
  int count() const {
    return n;
  }

 private:
  int n;
  ParameterSet sample_mean;
  ParameterSet M2;
};

} // namespace inference
} // namespace sgmcmc
