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

using Tables = std::map<std::string, Eigen::MatrixXd>;

/*
A set of named tables that share their first axis: row i of every table
belongs to observation i. A minibatch is again a Dataset.
*/
class Dataset {
 public:
  Dataset() {}
  // Throws ConfigError if the tables disagree on the number of rows.
  explicit Dataset(Tables tables);

  std::size_t num_observations() const {
    return n_obs;
  }
  bool empty() const {
    return tables.empty();
  }
  bool contains(const std::string& name) const;
  // Throws ConfigError if there is no table of that name.
  const Eigen::MatrixXd& table(const std::string& name) const;

  // The observations at `indices`, in that order.
  Dataset select_rows(const std::vector<std::size_t>& indices) const;
  // The contiguous observations [begin, end).
  Dataset slice(std::size_t begin, std::size_t end) const;

 private:
  Tables tables;
  std::size_t n_obs = 0;
};

// Throws ConfigError unless every name in `required` is a table of `dataset`.
void check_required_tables(
    const Dataset& dataset,
    const std::vector<std::string>& required);

} // namespace inference
} // namespace sgmcmc
