// SPDX-License-Identifier: MIT
/**
 * @file backward_induction_test.cc
 * @brief End-to-end induction and out-of-sample pricing
 *
 * Reference values: the Bermudan put with S0 = 36, K = 40, σ = 0.2,
 * r = 0.06, T = 1 and 25 exercise dates is worth about 4.47. Policies
 * fitted by regression are evaluated on independent test paths and are
 * therefore low-biased.
 */

#include <gtest/gtest.h>
#include "osp/engine/backward_induction.hpp"
#include "osp/engine/forward_policy.hpp"
#include <cmath>
#include <memory>
#include <vector>

namespace osp {
namespace {

ModelConfig put_config(size_t n_steps = 25, double dt = 0.04, double strike = 40.0) {
    ModelConfig config;
    config.process.initial_state = {36.0};
    config.process.drift = {0.06};
    config.process.volatility = {0.2};
    config.payoff = PayoffSpec{PayoffType::Put, strike};
    config.time = TimeGrid{dt, n_steps};
    config.rate = 0.06;
    return config;
}

StateMatrix uniform_grid(double lo, double hi, Eigen::Index n) {
    StateMatrix grid(n, 1);
    for (Eigen::Index i = 0; i < n; ++i) {
        grid(i, 0) = lo + (hi - lo) * static_cast<double>(i) / static_cast<double>(n - 1);
    }
    return grid;
}

/// Positive timing value everywhere: never exercise before maturity
class HoldSurrogate final : public Surrogate {
public:
    size_t dimension() const override { return 2; }
    Prediction predict(const StateMatrix& x) const override {
        return Prediction{Eigen::VectorXd::Ones(x.rows()), std::nullopt};
    }
};

struct Priced {
    InductionResult induction;
    PolicyEvaluation evaluation;
};

/// Fit the policy and price it on `n_test` fresh test paths
Priced induce_and_price(const ModelConfig& config, size_t n_test, uint64_t seed = 20240917ULL) {
    auto engine = BackwardInductionEngine::create(config);
    EXPECT_TRUE(engine.has_value()) << engine.error();
    RunContext ctx(seed);
    auto induction = engine->run(ctx);
    EXPECT_TRUE(induction.has_value()) << induction.error();

    RunContext test_ctx(seed + 1);
    auto paths = simulate_paths(config, n_test, test_ctx, StreamPurpose::TestPaths);
    EXPECT_TRUE(paths.has_value());
    auto eval = evaluate_policy(*paths, induction->surrogates, config);
    EXPECT_TRUE(eval.has_value()) << eval.error();
    return Priced{std::move(*induction), std::move(*eval)};
}

// ============================================================================
// Engine bookkeeping
// ============================================================================

ModelConfig small_linear_config() {
    ModelConfig config = put_config(4, 0.25);
    config.regression.method = RegressionMethod::LinearBasis;
    config.regression.polynomial_degree = 2;
    config.design.method = DesignMethod::FixedGrid;
    config.design.grid = uniform_grid(24.0, 44.0, 11);
    config.design.replications = 30;
    return config;
}

TEST(BackwardInductionTest, RejectsInvalidConfig) {
    ModelConfig config = small_linear_config();
    config.time.n_steps = 1;
    auto engine = BackwardInductionEngine::create(config);
    ASSERT_FALSE(engine.has_value());
    EXPECT_EQ(engine.error().code, OspErrorCode::InvalidConfig);
}

TEST(BackwardInductionTest, FitsEveryStepBeforeMaturity) {
    const ModelConfig config = small_linear_config();
    auto engine = BackwardInductionEngine::create(config);
    ASSERT_TRUE(engine.has_value()) << engine.error();
    EXPECT_EQ(engine->generator().method(), DesignMethod::FixedGrid);
    EXPECT_EQ(engine->regressor().method(), RegressionMethod::LinearBasis);

    RunContext ctx(3);
    auto result = engine->run(ctx);
    ASSERT_TRUE(result.has_value()) << result.error();

    EXPECT_EQ(result->surrogates.count(), 3u);
    EXPECT_EQ(result->surrogates.at(0), nullptr);
    EXPECT_EQ(result->surrogates.at(4), nullptr);
    for (size_t k = 1; k < 4; ++k) {
        EXPECT_NE(result->surrogates.at(k), nullptr) << "step " << k;
    }

    // Diagnostics in processing order, mirrored into the run context
    ASSERT_EQ(result->steps.size(), 3u);
    ASSERT_EQ(ctx.diagnostics().size(), 3u);
    for (size_t i = 0; i < 3; ++i) {
        const StepDiagnostics& diag = result->steps[i];
        EXPECT_EQ(diag.step, 3 - i);
        EXPECT_EQ(ctx.diagnostics()[i].step, diag.step);
        // 8 of the 11 grid points lie strictly below the strike
        EXPECT_EQ(diag.n_unique, 8u);
        EXPECT_EQ(diag.total_simulations, 8u * 30u);
        EXPECT_EQ(diag.replications, std::vector<size_t>(8, 30));
        EXPECT_EQ(diag.inputs.rows(), 8);
        EXPECT_FALSE(diag.budget_exhausted);
        EXPECT_GE(diag.elapsed_seconds, 0.0);
    }
    EXPECT_GE(result->total_seconds, 0.0);
}

TEST(BackwardInductionTest, SameSeedSamePolicy) {
    const ModelConfig config = small_linear_config();
    auto engine = BackwardInductionEngine::create(config);
    ASSERT_TRUE(engine.has_value());
    RunContext a(11);
    RunContext b(11);
    auto ra = engine->run(a);
    auto rb = engine->run(b);
    ASSERT_TRUE(ra.has_value());
    ASSERT_TRUE(rb.has_value());

    const StateMatrix probe = uniform_grid(25.0, 39.0, 15);
    for (size_t k = 1; k < 4; ++k) {
        EXPECT_EQ(ra->surrogates.at(k)->predict_mean(probe), rb->surrogates.at(k)->predict_mean(probe));
    }
}

TEST(BackwardInductionTest, FailureCarriesStep) {
    ModelConfig config = small_linear_config();
    config.regression.method = RegressionMethod::Spline;
    config.regression.spline_knots = 20;  // more basis functions than grid points
    auto engine = BackwardInductionEngine::create(config);
    ASSERT_TRUE(engine.has_value()) << engine.error();
    RunContext ctx;
    auto result = engine->run(ctx);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, OspErrorCode::UnderdeterminedFit);
    EXPECT_EQ(result.error().step, std::optional<size_t>(3));
}

TEST(BackwardInductionTest, DesignFailureCarriesStep) {
    ModelConfig config = small_linear_config();
    config.design.method = DesignMethod::Qmc;
    config.design.lower = {41.0};
    config.design.upper = {50.0};
    config.design.qmc_size = 10;
    auto engine = BackwardInductionEngine::create(config);
    ASSERT_TRUE(engine.has_value()) << engine.error();
    RunContext ctx;
    auto result = engine->run(ctx);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, OspErrorCode::UnderdeterminedFit);
    EXPECT_EQ(result.error().step, std::optional<size_t>(3));
}

// ============================================================================
// Pricing scenarios
// ============================================================================

TEST(BackwardInductionScenarioTest, GaussianProcessOnFixedGrid) {
    ModelConfig config = put_config();
    config.design.method = DesignMethod::FixedGrid;
    config.design.grid = uniform_grid(16.0, 40.0, 25);
    config.design.replications = 200;
    config.regression.method = RegressionMethod::GpMle;
    config.regression.kernel = KernelFamily::Matern52;
    config.regression.noise = NoiseModel::FromReplicates;

    const Priced priced = induce_and_price(config, 20000);
    EXPECT_EQ(priced.induction.surrogates.count(), 24u);
    for (const StepDiagnostics& diag : priced.induction.steps) {
        EXPECT_EQ(diag.n_unique, 24u);
    }
    EXPECT_GT(priced.evaluation.mean(), 4.15);
    EXPECT_LT(priced.evaluation.mean(), 4.65);
    EXPECT_LT(priced.evaluation.standard_error(), 0.05);
}

/// Price gap between a GP and a 20-knot spline fitted on the same grid.
/// Both policies are priced on the same test paths.
double spline_gp_gap(size_t replications) {
    ModelConfig gp = put_config();
    gp.design.method = DesignMethod::FixedGrid;
    gp.design.grid = uniform_grid(16.0, 40.0, 25);
    gp.design.replications = replications;
    gp.regression.method = RegressionMethod::GpMle;
    gp.regression.kernel = KernelFamily::Matern52;
    gp.regression.noise = NoiseModel::FromReplicates;

    ModelConfig spline = gp;
    spline.regression.method = RegressionMethod::Spline;
    spline.regression.spline_knots = 20;

    const Priced a = induce_and_price(gp, 20000);
    const Priced b = induce_and_price(spline, 20000);
    EXPECT_EQ(a.induction.surrogates.count(), 24u);
    EXPECT_EQ(b.induction.surrogates.count(), 24u);
    EXPECT_GT(b.evaluation.mean(), 4.0);
    EXPECT_LT(b.evaluation.mean(), 4.7);
    return std::abs(a.evaluation.mean() - b.evaluation.mean());
}

TEST(BackwardInductionScenarioTest, SmoothingSplineConvergesToGaussianProcess) {
    const double coarse = spline_gp_gap(200);
    const double fine = spline_gp_gap(800);
    EXPECT_LT(coarse, 0.3);
    EXPECT_LT(fine, 0.15);
    EXPECT_LT(fine, coarse + 0.05);
}

TEST(BackwardInductionScenarioTest, PathDesignWithPayoffBasis) {
    ModelConfig config = put_config();
    config.design.method = DesignMethod::PathBased;
    config.design.n_paths = 10000;
    config.regression.method = RegressionMethod::LinearBasis;
    config.regression.polynomial_degree = 2;
    config.regression.payoff_basis = true;

    const Priced priced = induce_and_price(config, 20000);
    EXPECT_EQ(priced.induction.surrogates.count(), 24u);
    for (const StepDiagnostics& diag : priced.induction.steps) {
        for (size_t r : diag.replications) ASSERT_EQ(r, 1u);
    }
    EXPECT_GT(priced.evaluation.mean(), 4.1);
    EXPECT_LT(priced.evaluation.mean(), 4.65);
}

TEST(BackwardInductionScenarioTest, ShortLookaheadWindow) {
    ModelConfig config = put_config();
    config.design.method = DesignMethod::FixedGrid;
    config.design.grid = uniform_grid(16.0, 40.0, 25);
    config.design.replications = 200;
    config.design.lookahead = 2;
    config.regression.method = RegressionMethod::GpMle;

    const Priced priced = induce_and_price(config, 20000);
    EXPECT_EQ(priced.induction.surrogates.count(), 24u);
    EXPECT_GT(priced.evaluation.mean(), 4.0);
    EXPECT_LT(priced.evaluation.mean(), 4.65);
}

TEST(BackwardInductionScenarioTest, AdaptiveBatchingMatchesSequentialOnBasket) {
    ModelConfig base;
    base.process.initial_state = {40.0, 40.0};
    base.process.drift = {0.06, 0.06};
    base.process.volatility = {0.2, 0.2};
    base.payoff = PayoffSpec{PayoffType::BasketPut, 40.0};
    base.time = TimeGrid{0.1, 9};
    base.rate = 0.06;
    base.regression.method = RegressionMethod::GpMle;
    base.regression.noise = NoiseModel::FromReplicates;
    base.design.lower = {25.0, 25.0};
    base.design.upper = {45.0, 45.0};
    base.design.initial_size = 10;
    base.design.target_size = 30;
    base.design.replications = 20;
    base.design.candidate_pool = 150;

    ModelConfig sequential = base;
    sequential.design.method = DesignMethod::Sequential;

    ModelConfig adaptive = base;
    adaptive.design.method = DesignMethod::AdaptiveBatch;
    adaptive.design.budget = 600;
    adaptive.design.replication_increment = 20;

    const Priced s = induce_and_price(sequential, 10000);
    const Priced a = induce_and_price(adaptive, 10000);

    ASSERT_EQ(s.induction.steps.size(), a.induction.steps.size());
    for (size_t i = 0; i < a.induction.steps.size(); ++i) {
        const StepDiagnostics& ds = s.induction.steps[i];
        const StepDiagnostics& da = a.induction.steps[i];
        EXPECT_EQ(ds.n_unique, 30u);
        EXPECT_LE(da.n_unique, ds.n_unique);
        EXPECT_LE(da.total_simulations, 600u);
        for (Eigen::Index r = 0; r < da.inputs.rows(); ++r) {
            EXPECT_LT(0.5 * (da.inputs(r, 0) + da.inputs(r, 1)), 40.0);
        }
    }

    // A fitted policy should not lose much against never exercising early
    RunContext test_ctx(20240918ULL);
    auto paths = simulate_paths(base, 10000, test_ctx, StreamPurpose::TestPaths);
    ASSERT_TRUE(paths.has_value());
    FittedSurrogates never(9);
    for (size_t k = 1; k < 9; ++k) never.set(k, std::make_shared<HoldSurrogate>());
    auto european = evaluate_policy(*paths, never, base);
    ASSERT_TRUE(european.has_value());

    EXPECT_GT(s.evaluation.mean(), european->mean() - 0.1);
    EXPECT_GT(a.evaluation.mean(), european->mean() - 0.1);
    EXPECT_NEAR(s.evaluation.mean(), a.evaluation.mean(), 0.25);
}

TEST(BackwardInductionScenarioTest, BoundaryRisesWithStrike) {
    auto boundaries = [](double strike) {
        ModelConfig config = put_config(10, 0.1, strike);
        config.design.method = DesignMethod::FixedGrid;
        config.design.grid = uniform_grid(0.5 * strike, strike, 21);
        config.design.replications = 400;
        config.regression.method = RegressionMethod::GpMle;

        auto engine = BackwardInductionEngine::create(config);
        EXPECT_TRUE(engine.has_value());
        RunContext ctx(77);
        auto result = engine->run(ctx);
        EXPECT_TRUE(result.has_value()) << result.error();

        std::vector<double> out;
        for (size_t k : {1, 3, 5}) {
            auto b = exercise_boundary(*result->surrogates.at(k), 22.0, strike - 0.25);
            EXPECT_TRUE(b.has_value()) << "K = " << strike << " step " << k << ": " << b.error();
            out.push_back(b.value_or(0.0));
        }
        return out;
    };

    const std::vector<double> b40 = boundaries(40.0);
    const std::vector<double> b44 = boundaries(44.0);
    for (size_t i = 0; i < b40.size(); ++i) {
        EXPECT_GE(b44[i], b40[i] - 0.5) << "step index " << i;
        EXPECT_LT(b40[i], 40.0);
        EXPECT_LT(b44[i], 44.0);
    }
}

}  // namespace
}  // namespace osp
