/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <fmt/format.h>
#include <utility>

#include "sgmcmc/inference/dataset.h"
#include "sgmcmc/inference/errors.h"

namespace sgmcmc {
namespace inference {

Dataset::Dataset(Tables tables0)
    : tables(std::move(tables0)) {
  bool first = true;
  for (const auto& [name, table] : tables) {
    auto rows = static_cast<std::size_t>(table.rows());
    if (first) {
      n_obs = rows;
      first = false;
    } else if (rows != n_obs) {
      throw ConfigError(fmt::format(
          "table '{}' has {} rows but the other tables have {}",
          name,
          rows,
          n_obs));
    }
  }
}

bool Dataset::contains(const std::string& name) const {
  return tables.find(name) != tables.end();
}

const Eigen::MatrixXd& Dataset::table(const std::string& name) const {
  auto found = tables.find(name);
  if (found == tables.end()) {
    throw ConfigError(fmt::format("dataset has no table '{}'", name));
  }
  return found->second;
}

Dataset Dataset::select_rows(const std::vector<std::size_t>& indices) const {
  Tables selected;
  for (const auto& [name, table] : tables) {
    Eigen::MatrixXd rows(static_cast<Eigen::Index>(indices.size()), table.cols());
    for (std::size_t i = 0; i < indices.size(); i++) {
      if (indices[i] >= n_obs) {
        throw std::out_of_range(fmt::format(
            "row {} requested from a dataset of {} observations",
            indices[i],
            n_obs));
      }
      rows.row(static_cast<Eigen::Index>(i)) =
          table.row(static_cast<Eigen::Index>(indices[i]));
    }
    selected[name] = std::move(rows);
  }
  return Dataset(std::move(selected));
}

Dataset Dataset::slice(std::size_t begin, std::size_t end) const {
  if (begin > end or end > n_obs) {
    throw std::out_of_range(fmt::format(
        "slice [{}, {}) of a dataset of {} observations", begin, end, n_obs));
  }
  Tables sliced;
  for (const auto& [name, table] : tables) {
    sliced[name] = table.middleRows(
        static_cast<Eigen::Index>(begin), static_cast<Eigen::Index>(end - begin));
  }
  return Dataset(std::move(sliced));
}

void check_required_tables(
    const Dataset& dataset,
    const std::vector<std::string>& required) {
  for (const auto& name : required) {
    if (not dataset.contains(name)) {
      throw ConfigError(fmt::format("dataset is missing table '{}'", name));
    }
  }
}

} // namespace inference
} // namespace sgmcmc
