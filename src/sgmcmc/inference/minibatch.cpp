/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <fmt/format.h>
#include <algorithm>
#include <cmath>
#include <numeric>
#include <utility>

#include "sgmcmc/inference/errors.h"
#include "sgmcmc/inference/minibatch.h"

namespace sgmcmc {
namespace inference {

std::size_t resolve_minibatch_size(
    double minibatch_size,
    std::size_t num_observations) {
  if (not std::isfinite(minibatch_size) or minibatch_size <= 0) {
    throw ConfigError(fmt::format(
        "minibatch size must be positive, got {}", minibatch_size));
  }
  if (minibatch_size < 1) {
    double count = std::round(minibatch_size * num_observations);
    return std::max<std::size_t>(1, static_cast<std::size_t>(count));
  }
  if (minibatch_size != std::floor(minibatch_size)) {
    throw ConfigError(fmt::format(
        "minibatch size {} is neither a fraction nor a whole count",
        minibatch_size));
  }
  if (minibatch_size > num_observations) {
    throw ConfigError(fmt::format(
        "minibatch size {} exceeds the {} observations in the dataset",
        minibatch_size,
        num_observations));
  }
  return static_cast<std::size_t>(minibatch_size);
}

MinibatchSampler::MinibatchSampler(
    std::size_t num_observations,
    std::size_t batch_size)
    : n_batch(batch_size), permutation(num_observations) {
  if (batch_size == 0 or batch_size > num_observations) {
    throw ConfigError(fmt::format(
        "cannot draw minibatches of {} from {} observations",
        batch_size,
        num_observations));
  }
  std::iota(permutation.begin(), permutation.end(), 0);
}

std::vector<std::size_t> MinibatchSampler::draw_indices(std::mt19937& gen) {
  // partial Fisher-Yates shuffle of the first n_batch positions
  std::size_t n = permutation.size();
  for (std::size_t i = 0; i < n_batch; i++) {
    std::uniform_int_distribution<std::size_t> pick(i, n - 1);
    std::swap(permutation[i], permutation[pick(gen)]);
  }
  return std::vector<std::size_t>(
      permutation.begin(), permutation.begin() + n_batch);
}

Dataset MinibatchSampler::draw(const Dataset& dataset, std::mt19937& gen) {
  if (dataset.num_observations() != permutation.size()) {
    throw ConfigError(fmt::format(
        "minibatch sampler was set up for {} observations, dataset has {}",
        permutation.size(),
        dataset.num_observations()));
  }
  return dataset.select_rows(draw_indices(gen));
}

} // namespace inference
} // namespace sgmcmc
