/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include "sgmcmc/inference/gradient/control_variate.h"
#include "sgmcmc/inference/parameters.h"
#include "sgmcmc/inference/sampler.h"

namespace sgmcmc {
namespace inference {

class SGNHT : public Sampler {
 public:
  /*
  :param step_size: learning rate, per parameter or shared
  :param a: injected noise level and initial thermostat value
  */
  SGNHT(
      const Model& model,
      const Dataset& dataset,
      const ParameterSet& params,
      const TuningConstant& step_size,
      const TuningConstant& a = 0.01,
      SamplerConfig config = SamplerConfig());
};

class SGNHTCV : public Sampler {
 public:
  SGNHTCV(
      const Model& model,
      const Dataset& dataset,
      const ParameterSet& params,
      const TuningConstant& step_size,
      const TuningConstant& a = 0.01,
      SamplerConfig config = SamplerConfig(),
      ControlVariateConfig cv_config = ControlVariateConfig());
};

} // namespace inference
} // namespace sgmcmc
