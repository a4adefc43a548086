/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "sgmcmc/inference/sgld.h"
#include <memory>
#include "sgmcmc/inference/engine/sgld_engine.h"

namespace sgmcmc {
namespace inference {

SGLD::SGLD(
    const Model& model,
    const Dataset& dataset,
    const ParameterSet& params,
    const TuningConstant& step_size,
    SamplerConfig config)
    : Sampler(model, dataset, params, config) {
  set_engine(
      std::make_unique<SgldEngine>(
          std::make_unique<MinibatchGradientEstimator>(
              model, dataset.num_observations()),
          step_size.resolve(params, "step size")),
      params);
}

SGLDCV::SGLDCV(
    const Model& model,
    const Dataset& dataset,
    const ParameterSet& params,
    const TuningConstant& step_size,
    SamplerConfig config,
    ControlVariateConfig cv_config)
    : Sampler(model, dataset, params, config) {
  TuningMap step_sizes = step_size.resolve(params, "step size");
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
      std::make_unique<SgldEngine>(std::move(estimator), step_sizes), centre);
}

} // namespace inference
} // namespace sgmcmc
