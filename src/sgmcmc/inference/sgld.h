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

// Stochastic gradient Langevin dynamics with plain minibatch gradients.
class SGLD : public Sampler {
 public:
  SGLD(
      const Model& model,
      const Dataset& dataset,
      const ParameterSet& params,
      const TuningConstant& step_size,
      SamplerConfig config = SamplerConfig());
};

/*
SGLD with control variate gradients. Construction first searches for a
posterior mode with stochastic gradient ascent, then computes the full-data
gradient at the mode; the chain starts at the mode.
*/
class SGLDCV : public Sampler {
 public:
  SGLDCV(
      const Model& model,
      const Dataset& dataset,
      const ParameterSet& params,
      const TuningConstant& step_size,
      SamplerConfig config = SamplerConfig(),
      ControlVariateConfig cv_config = ControlVariateConfig());
};

} // namespace inference
} // namespace sgmcmc
