// SPDX-License-Identifier: MIT
/**
 * @file state_simulator_test.cc
 * @brief Transition laws, correlation and stream separation of the simulator
 */

#include <gtest/gtest.h>
#include "osp/model/state_simulator.hpp"
#include <cmath>

namespace osp {
namespace {

ProcessSpec gbm_1d(double s0 = 36.0, double mu = 0.06, double sigma = 0.2) {
    ProcessSpec spec;
    spec.initial_state = {s0};
    spec.drift = {mu};
    spec.volatility = {sigma};
    return spec;
}

TEST(StateSimulatorTest, CreateValidatesSpec) {
    ProcessSpec spec = gbm_1d();
    spec.volatility = {};
    auto sim = StateSimulator::create(spec);
    ASSERT_FALSE(sim.has_value());
    EXPECT_EQ(sim.error().code, OspErrorCode::InvalidConfig);
}

TEST(StateSimulatorTest, RejectsIndefiniteCorrelation) {
    ProcessSpec spec;
    spec.initial_state = {40.0, 40.0, 40.0};
    spec.drift = {0.0, 0.0, 0.0};
    spec.volatility = {0.2, 0.2, 0.2};
    spec.correlation = Eigen::MatrixXd(3, 3);
    spec.correlation << 1.0, 0.9, -0.9,
                        0.9, 1.0, 0.9,
                        -0.9, 0.9, 1.0;
    auto sim = StateSimulator::create(spec);
    ASSERT_FALSE(sim.has_value());
    EXPECT_EQ(sim.error().code, OspErrorCode::InvalidConfig);
}

TEST(StateSimulatorTest, GbmExactStepWithGivenShocks) {
    auto sim = StateSimulator::create(gbm_1d(36.0, 0.06, 0.2));
    ASSERT_TRUE(sim.has_value());

    StateMatrix x(2, 1);
    x << 36.0, 40.0;
    StateMatrix eps(2, 1);
    eps << 0.5, -1.0;
    auto next = sim->advance_with_shocks(x, 0.04, eps);
    ASSERT_TRUE(next.has_value());

    const double drift = (0.06 - 0.5 * 0.04) * 0.04;
    const double vol = 0.2 * std::sqrt(0.04);
    EXPECT_NEAR((*next)(0, 0), 36.0 * std::exp(drift + vol * 0.5), 1e-12);
    EXPECT_NEAR((*next)(1, 0), 40.0 * std::exp(drift - vol), 1e-12);
}

TEST(StateSimulatorTest, ZeroVolatilityIsDeterministicGrowth) {
    auto sim = StateSimulator::create(gbm_1d(40.0, 0.05, 0.0));
    ASSERT_TRUE(sim.has_value());
    std::mt19937_64 rng(7);
    StateMatrix x = sim->initial_state();
    auto next = sim->advance(x, 0.5, rng);
    ASSERT_TRUE(next.has_value());
    EXPECT_NEAR((*next)(0, 0), 40.0 * std::exp(0.025), 1e-12);
}

TEST(StateSimulatorTest, AdvanceRejectsWidthMismatch) {
    auto sim = StateSimulator::create(gbm_1d());
    ASSERT_TRUE(sim.has_value());
    std::mt19937_64 rng(1);
    StateMatrix wrong(4, 2);
    wrong.setConstant(36.0);
    auto next = sim->advance(wrong, 0.04, rng);
    ASSERT_FALSE(next.has_value());
    EXPECT_EQ(next.error().code, OspErrorCode::InvalidConfig);

    auto shocked = sim->advance_with_shocks(wrong, 0.04, StateMatrix::Zero(4, 2));
    ASSERT_FALSE(shocked.has_value());
    EXPECT_EQ(shocked.error().code, OspErrorCode::InvalidConfig);
}

TEST(StateSimulatorTest, GbmMeanMatchesDrift) {
    auto sim = StateSimulator::create(gbm_1d(100.0, 0.05, 0.3));
    ASSERT_TRUE(sim.has_value());
    std::mt19937_64 rng(42);
    StateMatrix x = StateMatrix::Constant(200000, 1, 100.0);
    auto next = sim->advance(x, 1.0, rng);
    ASSERT_TRUE(next.has_value());
    // sd of the sample mean is about 100 * 0.31 / sqrt(2e5) ~ 0.07
    EXPECT_NEAR(next->mean(), 100.0 * std::exp(0.05), 0.4);
}

TEST(StateSimulatorTest, CorrelatedLogReturns) {
    ProcessSpec spec;
    spec.initial_state = {1.0, 1.0};
    spec.drift = {0.0, 0.0};
    spec.volatility = {0.2, 0.2};
    spec.correlation = Eigen::MatrixXd(2, 2);
    spec.correlation << 1.0, 0.7,
                        0.7, 1.0;
    auto sim = StateSimulator::create(spec);
    ASSERT_TRUE(sim.has_value());

    std::mt19937_64 rng(11);
    StateMatrix x = StateMatrix::Ones(100000, 2);
    auto next = sim->advance(x, 1.0, rng);
    ASSERT_TRUE(next.has_value());

    Eigen::ArrayXd a = next->col(0).array().log();
    Eigen::ArrayXd b = next->col(1).array().log();
    a -= a.mean();
    b -= b.mean();
    const double corr = (a * b).sum() / std::sqrt((a * a).sum() * (b * b).sum());
    EXPECT_NEAR(corr, 0.7, 0.02);
}

TEST(StateSimulatorTest, ExpOuRevertsToLongRunLevel) {
    ProcessSpec spec;
    spec.type = ProcessType::ExpOU;
    spec.initial_state = {std::exp(1.0)};
    spec.volatility = {0.0};
    spec.mean_reversion = 2.0;
    spec.long_run_log_level = 0.0;
    auto sim = StateSimulator::create(spec);
    ASSERT_TRUE(sim.has_value());

    StateMatrix x = sim->initial_state();
    auto next = sim->advance_with_shocks(x, 0.5, StateMatrix::Zero(1, 1));
    ASSERT_TRUE(next.has_value());
    EXPECT_NEAR(std::log((*next)(0, 0)), std::exp(-1.0), 1e-12);
}

TEST(StateSimulatorTest, PathBatchShapeAndInitialState) {
    ModelConfig config;
    config.process = gbm_1d();
    config.time = {0.04, 25};
    RunContext ctx(5);
    auto paths = simulate_paths(config, 100, ctx, StreamPurpose::TestPaths);
    ASSERT_TRUE(paths.has_value());
    ASSERT_EQ(paths->size(), 26u);
    for (const auto& snapshot : *paths) {
        EXPECT_EQ(snapshot.rows(), 100);
        EXPECT_EQ(snapshot.cols(), 1);
    }
    EXPECT_TRUE(((*paths)[0].array() == 36.0).all());
}

TEST(StateSimulatorTest, PathsAreReproducible) {
    ModelConfig config;
    config.process = gbm_1d();
    config.time = {0.1, 10};
    RunContext a(99);
    RunContext b(99);
    auto p = simulate_paths(config, 50, a, StreamPurpose::TestPaths);
    auto q = simulate_paths(config, 50, b, StreamPurpose::TestPaths);
    ASSERT_TRUE(p.has_value());
    ASSERT_TRUE(q.has_value());
    for (size_t k = 0; k < p->size(); ++k) {
        EXPECT_EQ((*p)[k], (*q)[k]);
    }
}

TEST(StateSimulatorTest, TrainingAndTestStreamsAreDisjoint) {
    ModelConfig config;
    config.process = gbm_1d();
    config.time = {0.04, 25};
    RunContext ctx(2024);
    auto training = simulate_paths(config, 1000, ctx, StreamPurpose::TrainingPaths);
    auto test = simulate_paths(config, 1000, ctx, StreamPurpose::TestPaths);
    ASSERT_TRUE(training.has_value());
    ASSERT_TRUE(test.has_value());
    for (size_t k = 1; k < training->size(); ++k) {
        EXPECT_NE((*training)[k], (*test)[k]) << "step " << k;
        size_t shared = 0;
        for (Eigen::Index i = 0; i < (*test)[k].rows(); ++i) {
            if ((*training)[k](i, 0) == (*test)[k](i, 0)) ++shared;
        }
        EXPECT_EQ(shared, 0u) << "step " << k;
    }
}

TEST(StateSimulatorTest, StreamsDifferByCoordinate) {
    auto a = make_stream(1, StreamPurpose::Lookahead, 3, 0, 0);
    auto b = make_stream(1, StreamPurpose::Lookahead, 3, 0, 1);
    auto c = make_stream(1, StreamPurpose::Lookahead, 4, 0, 0);
    auto d = make_stream(1, StreamPurpose::Lookahead, 3, 0, 0);
    const auto va = a();
    EXPECT_NE(va, b());
    EXPECT_NE(va, c());
    EXPECT_EQ(va, d());
}

}  // namespace
}  // namespace osp
