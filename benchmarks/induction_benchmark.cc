// SPDX-License-Identifier: MIT
/**
 * @file induction_benchmark.cc
 * @brief End-to-end backward induction per regression method
 */

#include "osp/engine/backward_induction.hpp"
#include <benchmark/benchmark.h>
#include <stdexcept>

using namespace osp;

namespace {

ModelConfig bermudan_put(RegressionMethod method) {
    ModelConfig config;
    config.process.initial_state = {36.0};
    config.process.drift = {0.06};
    config.process.volatility = {0.2};
    config.payoff = PayoffSpec{PayoffType::Put, 40.0};
    config.time = TimeGrid{0.04, 25};
    config.rate = 0.06;
    config.regression.method = method;
    config.regression.spline_knots = 8;
    config.design.method = DesignMethod::FixedGrid;
    config.design.grid = StateMatrix(25, 1);
    for (Eigen::Index i = 0; i < 25; ++i) config.design.grid(i, 0) = 16.0 + static_cast<double>(i);
    config.design.replications = 100;
    return config;
}

void run_induction(benchmark::State& state, RegressionMethod method) {
    auto engine = BackwardInductionEngine::create(bermudan_put(method));
    if (!engine) {
        throw std::runtime_error("Engine creation failed: " + engine.error().message);
    }
    uint64_t seed = 1;
    for (auto _ : state) {
        RunContext ctx(seed++);
        auto result = engine->run(ctx);
        if (!result) {
            throw std::runtime_error("Induction failed: " + result.error().message);
        }
        benchmark::DoNotOptimize(result->total_seconds);
    }
}

}  // namespace

static void BM_Induction_LinearBasis(benchmark::State& state) {
    run_induction(state, RegressionMethod::LinearBasis);
}
BENCHMARK(BM_Induction_LinearBasis)->Unit(benchmark::kMillisecond);

static void BM_Induction_Spline(benchmark::State& state) {
    run_induction(state, RegressionMethod::Spline);
}
BENCHMARK(BM_Induction_Spline)->Unit(benchmark::kMillisecond);

static void BM_Induction_GpMle(benchmark::State& state) {
    run_induction(state, RegressionMethod::GpMle);
}
BENCHMARK(BM_Induction_GpMle)->Unit(benchmark::kMillisecond);

BENCHMARK_MAIN();
