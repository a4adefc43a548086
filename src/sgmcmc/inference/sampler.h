/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>
#include "sgmcmc/inference/dataset.h"
#include "sgmcmc/inference/engine/step_engine.h"
#include "sgmcmc/inference/minibatch.h"
#include "sgmcmc/inference/model.h"
#include "sgmcmc/inference/running_average.h"
#include "sgmcmc/inference/sampler_state.h"

namespace sgmcmc {
namespace inference {

struct SamplerConfig {
  // fraction of the dataset if in (0, 1), otherwise a number of observations
  double minibatch_size;
  uint seed;
  bool verbose;

  ~SamplerConfig() {}
  SamplerConfig(
      double minibatch_size = 0.01,
      uint seed = 5123401,
      bool verbose = false)
      : minibatch_size(minibatch_size), seed(seed), verbose(verbose) {}
};

enum class RunPhase { BURN_IN, PRODUCTION, DONE };

std::string to_string(RunPhase phase);

struct RunConfig {
  int burn_in_steps;
  int production_steps;
  // number of steps between two evaluations of the diagnostic
  int report_every;
  // also accumulate the elementwise variance of the production samples
  bool track_variance;

  ~RunConfig() {}
  RunConfig(
      int burn_in_steps = 0,
      int production_steps = 1000,
      int report_every = 100,
      bool track_variance = false)
      : burn_in_steps(burn_in_steps),
        production_steps(production_steps),
        report_every(report_every),
        track_variance(track_variance) {}
};

// A pure function of the parameters and a held-out dataset, such as a test
// set log loss.
using Diagnostic =
    std::function<double(const ParameterSet& params, const Dataset& held_out)>;

struct DiagnosticRecord {
  RunPhase phase;
  // 1-based step index within the phase
  int step;
  double value;
};

struct RunResult {
  RunningAverage average;
  // set when RunConfig::track_variance is
  std::optional<ParameterSet> variance;
  std::vector<DiagnosticRecord> diagnostics;
};

/*
A stochastic gradient MCMC chain over a fixed dataset. Each step draws a
minibatch and hands the current state to the step engine, which returns the
next state. Subclasses pick the engine (SGLD, SGHMC, SGNHT and their control
variate versions).

The model and the dataset are held by reference and must outlive the sampler.
*/
class Sampler {
 public:
  // Build a chain around an arbitrary engine, starting at `params`.
  Sampler(
      std::unique_ptr<StepEngine> engine,
      const Model& model,
      const Dataset& dataset,
      const ParameterSet& params,
      SamplerConfig config = SamplerConfig());

  // Advance the chain by one step.
  void step();

  // The current parameter values.
  const ParameterSet& params() const {
    return state.params;
  }
  const SamplerState& get_state() const {
    return state;
  }
  std::size_t get_minibatch_size() const {
    return minibatches.batch_size();
  }

  /*
  Run the chain and keep every sample.
  :param num_samples: number of samples to return after burn-in
  :param num_burn_in: number of steps taken before samples are kept
  :param keep_burn_in: also return the burn-in samples
  :returns: one ParameterSet per kept step
  */
  std::vector<ParameterSet>
  infer(int num_samples, int num_burn_in = 0, bool keep_burn_in = false);

  /*
  Run burn-in and production phases without keeping the chain. Production
  samples are folded into a running average; `diagnostic`, when given, is
  evaluated on the current parameters and `held_out` every
  `config.report_every` steps of either phase.
  Throws ConfigError for an invalid configuration, or for a diagnostic given
  without held-out data, before any step is taken.
  */
  RunResult run(
      const RunConfig& config,
      const Diagnostic& diagnostic = Diagnostic(),
      const Dataset& held_out = Dataset());

  virtual ~Sampler() {}

 protected:
  // For subclasses that build their engine after validation; they must call
  // set_engine before the sampler is used.
  Sampler(
      const Model& model,
      const Dataset& dataset,
      const ParameterSet& params,
      SamplerConfig config);
  // Install `engine` and start the chain at `initial`.
  void set_engine(
      std::unique_ptr<StepEngine> engine,
      const ParameterSet& initial);

  const Model& model;
  const Dataset& dataset;
  SamplerConfig config;
  std::mt19937 gen;
  MinibatchSampler minibatches;

 private:
  std::unique_ptr<StepEngine> engine;
  SamplerState state;
};

} // namespace inference
} // namespace sgmcmc
