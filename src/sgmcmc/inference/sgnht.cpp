/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "sgmcmc/inference/sgnht.h"
#include <memory>
#include "sgmcmc/inference/engine/sgnht_engine.h"

namespace sgmcmc {
namespace inference {

SGNHT::SGNHT(
    const Model& model,
    const Dataset& dataset,
    const ParameterSet& params,
    const TuningConstant& step_size,
    const TuningConstant& a,
    SamplerConfig config)
    : Sampler(model, dataset, params, config) {
  set_engine(
      std::make_unique<SgnhtEngine>(
          std::make_unique<MinibatchGradientEstimator>(
              model, dataset.num_observations()),
          step_size.resolve(params, "step size"),
          a.resolve(params, "a")),
      params);
}

SGNHTCV::SGNHTCV(
    const Model& model,
    const Dataset& dataset,
    const ParameterSet& params,
    const TuningConstant& step_size,
    const TuningConstant& a,
    SamplerConfig config,
    ControlVariateConfig cv_config)
    : Sampler(model, dataset, params, config) {
  TuningMap step_sizes = step_size.resolve(params, "step size");
  TuningMap as = a.resolve(params, "a");
  auto estimator = make_control_variate(
      model,
      dataset,
      params,
      cv_config,
      minibatches.batch_size(),
      gen,
      config.verbose);
  ParameterSet centre = estimator->get_centre();
  set_engine(
      std::make_unique<SgnhtEngine>(std::move(estimator), step_sizes, as),
      centre);
}

} // namespace inference
} // namespace sgmcmc
