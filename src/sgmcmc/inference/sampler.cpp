/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <boost/iostreams/device/null.hpp>
#include <boost/iostreams/stream.hpp>
#include <boost/progress.hpp>
#include <fmt/format.h>
#include <iostream>
#include <stdexcept>
#include <utility>

#include "sgmcmc/inference/errors.h"
#include "sgmcmc/inference/sampler.h"

namespace sgmcmc {
namespace inference {

namespace {

// Validates the inputs shared by every sampler and sets up minibatching.
MinibatchSampler make_minibatch_sampler(
    const Model& model,
    const Dataset& dataset,
    const ParameterSet& params,
    const SamplerConfig& config) {
  validate_model_inputs(model, params, dataset);
  std::size_t n = dataset.num_observations();
  return MinibatchSampler(n, resolve_minibatch_size(config.minibatch_size, n));
}

} // namespace

std::string to_string(RunPhase phase) {
  switch (phase) {
    case RunPhase::BURN_IN:
      return "Burn-in";
    case RunPhase::PRODUCTION:
      return "Production";
    case RunPhase::DONE:
      return "Done";
  }
  throw std::invalid_argument("unknown run phase");
}

Sampler::Sampler(
    const Model& model,
    const Dataset& dataset,
    const ParameterSet& params,
    SamplerConfig config)
    : model(model),
      dataset(dataset),
      config(config),
      gen(config.seed),
      minibatches(make_minibatch_sampler(model, dataset, params, config)) {}

Sampler::Sampler(
    std::unique_ptr<StepEngine> engine,
    const Model& model,
    const Dataset& dataset,
    const ParameterSet& params,
    SamplerConfig config)
    : Sampler(model, dataset, params, config) {
  set_engine(std::move(engine), params);
}

void Sampler::set_engine(
    std::unique_ptr<StepEngine> engine0,
    const ParameterSet& initial) {
  if (engine0 == nullptr) {
    throw std::invalid_argument("sampler requires a step engine");
  }
  engine = std::move(engine0);
  state = engine->initialize(initial, gen);
}

void Sampler::step() {
  if (engine == nullptr) {
    throw std::logic_error("sampler was used before its engine was set");
  }
  Dataset minibatch = minibatches.draw(dataset, gen);
  state = engine->advance(state, minibatch, gen);
}

std::vector<ParameterSet>
Sampler::infer(int num_samples, int num_burn_in, bool keep_burn_in) {
  if (num_samples < 1 or num_burn_in < 0) {
    throw ConfigError(fmt::format(
        "invalid sample counts: {} samples after {} burn-in steps",
        num_samples,
        num_burn_in));
  }
  std::vector<ParameterSet> samples;
  samples.reserve(num_samples + (keep_burn_in ? num_burn_in : 0));

  boost::iostreams::stream<boost::iostreams::null_sink> nullOstream(
      (boost::iostreams::null_sink()));
  boost::progress_display show_progress(
      num_samples + num_burn_in, config.verbose ? std::cout : nullOstream);

  for (int i = 0; i < num_samples + num_burn_in; i++) {
    step();
    if (i >= num_burn_in or keep_burn_in) {
      samples.push_back(state.params);
    }
    ++show_progress;
  }
  return samples;
}

RunResult Sampler::run(
    const RunConfig& run_config,
    const Diagnostic& diagnostic,
    const Dataset& held_out) {
  if (run_config.burn_in_steps < 0) {
    throw ConfigError(fmt::format(
        "burn-in steps must be non-negative, got {}",
        run_config.burn_in_steps));
  }
  if (run_config.production_steps < 1) {
    throw ConfigError(fmt::format(
        "production steps must be positive, got {}",
        run_config.production_steps));
  }
  if (run_config.report_every < 1) {
    throw ConfigError(fmt::format(
        "report interval must be positive, got {}", run_config.report_every));
  }
  if (diagnostic and held_out.num_observations() == 0) {
    throw ConfigError("a diagnostic needs a non-empty held-out dataset");
  }

  std::vector<DiagnosticRecord> diagnostics;
  auto report = [&](RunPhase phase, int i) {
    if (not diagnostic or i % run_config.report_every != 0) {
      return;
    }
    double value = diagnostic(state.params, held_out);
    diagnostics.push_back({phase, i, value});
    if (config.verbose) {
      std::cout << fmt::format(
          "{} iteration: {}\t\tDiagnostic: {}\n", to_string(phase), i, value);
    }
  };

  std::optional<RunningAverage> average;
  std::optional<RunningMoments> moments;
  RunPhase phase =
      run_config.burn_in_steps > 0 ? RunPhase::BURN_IN : RunPhase::PRODUCTION;
  int i = 0;
  while (phase != RunPhase::DONE) {
    switch (phase) {
      case RunPhase::BURN_IN:
        step();
        i++;
        report(phase, i);
        if (i == run_config.burn_in_steps) {
          phase = RunPhase::PRODUCTION;
          i = 0;
        }
        break;
      case RunPhase::PRODUCTION:
        if (not average) {
          // the post burn-in snapshot fixes the shapes of the accumulators
          average.emplace(state.params);
          if (run_config.track_variance) {
            moments.emplace(state.params);
          }
        }
        step();
        i++;
        average->update(state.params);
        if (moments) {
          moments->update(state.params);
        }
        report(phase, i);
        if (i == run_config.production_steps) {
          phase = RunPhase::DONE;
        }
        break;
      case RunPhase::DONE:
        break;
    }
  }

  std::optional<ParameterSet> variance;
  if (moments) {
    variance = moments->variance();
  }
  return RunResult{std::move(*average), std::move(variance), diagnostics};
}

} // namespace inference
} // namespace sgmcmc
