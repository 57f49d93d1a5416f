// SPDX-License-Identifier: MIT
#include "osp/engine/backward_induction.hpp"
#include "osp/engine/pathwise_response.hpp"
#include "osp/regression/regressor_factory.hpp"
#include "osp/support/osp_trace.h"
#include <chrono>
#include <string>
#include <utility>

namespace osp {

namespace {

double seconds_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

}  // namespace

BackwardInductionEngine::BackwardInductionEngine(ModelConfig config, StateSimulator simulator,
                                                 std::shared_ptr<const PayoffFunction> payoff,
                                                 std::unique_ptr<Regressor> regressor,
                                                 std::unique_ptr<DesignGenerator> generator)
    : config_(std::move(config))
    , simulator_(std::move(simulator))
    , payoff_(std::move(payoff))
    , regressor_(std::move(regressor))
    , generator_(std::move(generator)) {}

Expected<BackwardInductionEngine> BackwardInductionEngine::create(const ModelConfig& config) {
    auto valid = validate_model_config(config);
    if (!valid) {
        return std::unexpected(valid.error());
    }
    auto simulator = StateSimulator::create(config.process);
    if (!simulator) {
        return std::unexpected(simulator.error());
    }
    auto payoff = std::make_shared<const PayoffFunction>(config.payoff);
    auto regressor = make_regressor(config.regression, payoff);
    if (!regressor) {
        return std::unexpected(regressor.error());
    }
    auto generator = make_design_generator(config.design);
    if (!generator) {
        return std::unexpected(generator.error());
    }
    return BackwardInductionEngine(config, std::move(*simulator), std::move(payoff),
                                   std::move(*regressor), std::move(*generator));
}

bool BackwardInductionEngine::needs_pilot_paths() const {
    const DesignMethod m = config_.design.method;
    const bool region_based = m == DesignMethod::Qmc || m == DesignMethod::Sequential ||
                              m == DesignMethod::AdaptiveBatch;
    return region_based && config_.design.lower.empty();
}

Expected<InductionResult> BackwardInductionEngine::run(RunContext& ctx) const {
    const auto run_start = std::chrono::steady_clock::now();
    const size_t M = config_.time.n_steps;

    InductionResult result;
    result.surrogates = FittedSurrogates(M);
    const PathwiseResponseSampler sampler(config_, simulator_, *payoff_, result.surrogates);

    PathBatch pilot;
    if (needs_pilot_paths()) {
        auto paths = simulate_paths(simulator_, config_.time, config_.design.pilot_paths,
                                    ctx, StreamPurpose::Pilot);
        if (!paths) {
            return std::unexpected(paths.error());
        }
        pilot = std::move(*paths);
    }
    PathBatch training;
    if (generator_->needs_training_paths()) {
        auto paths = simulate_paths(simulator_, config_.time, config_.design.n_paths,
                                    ctx, StreamPurpose::TrainingPaths);
        if (!paths) {
            return std::unexpected(paths.error());
        }
        training = std::move(*paths);
    }

    DesignContext design_ctx{
        .config = config_,
        .payoff = *payoff_,
        .regressor = *regressor_,
        .sampler = sampler,
        .run = ctx,
        .training_paths = training.empty() ? nullptr : &training,
        .pilot_paths = pilot.empty() ? nullptr : &pilot,
    };

    OSP_TRACE_ALGO_START(OSP_MODULE_INDUCTION, M, config_.design.lookahead,
                         static_cast<int>(config_.regression.method));

    for (size_t k = M - 1; k >= 1; --k) {
        const auto step_start = std::chrono::steady_clock::now();
        OSP_TRACE_INDUCTION_STEP_BEGIN(k, sampler.horizon(k) - k);

        auto design = generator_->generate(k, design_ctx);
        if (!design) {
            OSP_TRACE_RUNTIME_ERROR(OSP_MODULE_INDUCTION, static_cast<int>(design.error().code), k);
            return std::unexpected(at_step(design.error(), k));
        }
        for (Eigen::Index i = 0; i < design->inputs.rows(); ++i) {
            if (!payoff_->in_the_money(state_row(design->inputs, i))) {
                return std::unexpected(at_step(
                    OspError{.code = OspErrorCode::InvalidConfig, .step = std::nullopt,
                             .message = "Design input " + std::to_string(i) +
                                        " lies outside the in-the-money region"},
                    k));
            }
        }

        auto surrogate = regressor_->fit(design->to_fit_data());
        if (!surrogate) {
            OSP_TRACE_RUNTIME_ERROR(OSP_MODULE_INDUCTION, static_cast<int>(surrogate.error().code), k);
            return std::unexpected(at_step(surrogate.error(), k));
        }
        result.surrogates.set(k, std::move(*surrogate));

        StepDiagnostics diag;
        diag.step = k;
        diag.elapsed_seconds = seconds_since(step_start);
        diag.n_unique = design->size();
        diag.total_simulations = design->total_simulations();
        diag.replications = design->replications;
        diag.inputs = design->inputs;
        diag.budget_exhausted = design->budget_exhausted;
        OSP_TRACE_INDUCTION_STEP_COMPLETE(k, diag.n_unique, diag.total_simulations, diag.elapsed_seconds);
        ctx.record(diag);
        result.steps.push_back(std::move(diag));
    }

    result.total_seconds = seconds_since(run_start);
    OSP_TRACE_ALGO_COMPLETE(OSP_MODULE_INDUCTION, result.surrogates.count(), result.total_seconds);
    return result;
}

}  // namespace osp
