/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <random>
#include <vector>
#include "sgmcmc/inference/dataset.h"

namespace sgmcmc {
namespace inference {

/*
Turn a configured minibatch size into a number of observations.
:param minibatch_size: a fraction of the dataset if in (0, 1), otherwise an
                       absolute count
:param num_observations: size of the dataset
:returns: the number of observations per minibatch, at least one
Throws ConfigError for non-positive or non-integral counts and for counts
larger than the dataset.
*/
std::size_t resolve_minibatch_size(
    double minibatch_size,
    std::size_t num_observations);

// Draws minibatches uniformly at random without replacement.
class MinibatchSampler {
 public:
  MinibatchSampler(std::size_t num_observations, std::size_t batch_size);

  std::size_t batch_size() const {
    return n_batch;
  }

  // Distinct row indices in [0, num_observations).
  std::vector<std::size_t> draw_indices(std::mt19937& gen);
  Dataset draw(const Dataset& dataset, std::mt19937& gen);

 private:
  std::size_t n_batch;
  // a permutation of all row indices; the first n_batch entries are the
  // current minibatch
  std::vector<std::size_t> permutation;
};

} // namespace inference
} // namespace sgmcmc
