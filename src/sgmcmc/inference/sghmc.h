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

class SGHMC : public Sampler {
 public:
  /*
  :param step_size: learning rate, per parameter or shared
  :param alpha: friction term, per parameter or shared
  :param num_leapfrog_steps: number of leapfrog steps per iteration
  */
  SGHMC(
      const Model& model,
      const Dataset& dataset,
      const ParameterSet& params,
      const TuningConstant& step_size,
      const TuningConstant& alpha = 0.01,
      int num_leapfrog_steps = 5,
      SamplerConfig config = SamplerConfig());
};

// SGHMC with control variate gradients; the chain starts at the mode found
// during construction.
class SGHMCCV : public Sampler {
 public:
  SGHMCCV(
      const Model& model,
      const Dataset& dataset,
      const ParameterSet& params,
      const TuningConstant& step_size,
      const TuningConstant& alpha = 0.01,
      int num_leapfrog_steps = 5,
      SamplerConfig config = SamplerConfig(),
      ControlVariateConfig cv_config = ControlVariateConfig());
};

} // namespace inference
} // namespace sgmcmc
