/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "sgmcmc/inference/sghmc.h"
#include <memory>
#include "sgmcmc/inference/engine/sghmc_engine.h"

namespace sgmcmc {
namespace inference {

SGHMC::SGHMC(
    const Model& model,
    const Dataset& dataset,
    const ParameterSet& params,
    const TuningConstant& step_size,
    const TuningConstant& alpha,
    int num_leapfrog_steps,
    SamplerConfig config)
    : Sampler(model, dataset, params, config) {
  set_engine(
      std::make_unique<SghmcEngine>(
          std::make_unique<MinibatchGradientEstimator>(
              model, dataset.num_observations()),
          step_size.resolve(params, "step size"),
          alpha.resolve(params, "alpha"),
          num_leapfrog_steps),
      params);
}

SGHMCCV::SGHMCCV(
    const Model& model,
    const Dataset& dataset,
    const ParameterSet& params,
    const TuningConstant& step_size,
    const TuningConstant& alpha,
    int num_leapfrog_steps,
    SamplerConfig config,
    ControlVariateConfig cv_config)
    : Sampler(model, dataset, params, config) {
  TuningMap step_sizes = step_size.resolve(params, "step size");
  TuningMap alphas = alpha.resolve(params, "alpha");
  validate_num_leapfrog_steps(num_leapfrog_steps);
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
      std::make_unique<SghmcEngine>(
          std::move(estimator), step_sizes, alphas, num_leapfrog_steps),
      centre);
}

} // namespace inference
} // namespace sgmcmc
