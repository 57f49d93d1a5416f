// SPDX-License-Identifier: MIT
/**
 * @file backward_induction.hpp
 * @brief Regression Monte Carlo backward induction over the exercise dates
 *
 * Steps are processed in strictly decreasing order k = M-1, ..., 1. At each
 * step the configured generator builds an in-the-money design, the
 * pathwise response sampler simulates lookaheads that read the surrogates
 * already fitted for later steps, and the regressor fits T̂(k, ·) on the
 * final design. Maturity never carries a surrogate.
 *
 * Usage:
 *   auto engine = BackwardInductionEngine::create(config);
 *   RunContext ctx(seed);
 *   auto result = engine->run(ctx);
 *   if (!result) { handle result.error(); }
 *
 * The first failing step aborts the induction; its error carries the step.
 */

#pragma once

#include "osp/design/design_generator.hpp"
#include "osp/engine/fitted_surrogates.hpp"
#include "osp/engine/run_context.hpp"
#include "osp/model/model_config.hpp"
#include "osp/model/payoff.hpp"
#include "osp/model/state_simulator.hpp"
#include "osp/regression/regressor.hpp"
#include <memory>
#include <vector>

namespace osp {

struct InductionResult {
    FittedSurrogates surrogates;          ///< T̂(1..M-1, ·)
    std::vector<StepDiagnostics> steps;   ///< In processing order (M-1 first)
    double total_seconds = 0.0;
};

class BackwardInductionEngine {
public:
    /// Validate the configuration and resolve every variant once
    ///
    /// @return InvalidConfig on an inconsistent configuration
    static Expected<BackwardInductionEngine> create(const ModelConfig& config);

    /// Fit the surrogates of steps M-1 down to 1
    ///
    /// Diagnostics are also appended to `ctx`.
    Expected<InductionResult> run(RunContext& ctx) const;

    const ModelConfig& config() const { return config_; }
    const StateSimulator& simulator() const { return simulator_; }
    const PayoffFunction& payoff() const { return *payoff_; }
    const Regressor& regressor() const { return *regressor_; }
    const DesignGenerator& generator() const { return *generator_; }

private:
    BackwardInductionEngine(ModelConfig config, StateSimulator simulator,
                            std::shared_ptr<const PayoffFunction> payoff,
                            std::unique_ptr<Regressor> regressor,
                            std::unique_ptr<DesignGenerator> generator);

    /// Pilot trajectories when the design region is estimated
    bool needs_pilot_paths() const;

    ModelConfig config_;
    StateSimulator simulator_;
    std::shared_ptr<const PayoffFunction> payoff_;
    std::unique_ptr<Regressor> regressor_;
    std::unique_ptr<DesignGenerator> generator_;
};

}  // namespace osp
