// SPDX-License-Identifier: MIT
/**
 * @file lookahead_benchmark.cc
 * @brief Cost of pathwise response simulation versus window length
 *
 * Surrogates come from a quick polynomial induction so that every window
 * reads real timing values.
 */

#include "osp/engine/backward_induction.hpp"
#include "osp/engine/pathwise_response.hpp"
#include <benchmark/benchmark.h>
#include <memory>
#include <stdexcept>
#include <vector>

using namespace osp;

namespace {

ModelConfig bermudan_put() {
    ModelConfig config;
    config.process.initial_state = {36.0};
    config.process.drift = {0.06};
    config.process.volatility = {0.2};
    config.payoff = PayoffSpec{PayoffType::Put, 40.0};
    config.time = TimeGrid{0.04, 25};
    config.rate = 0.06;
    config.regression.method = RegressionMethod::LinearBasis;
    config.regression.polynomial_degree = 3;
    config.design.method = DesignMethod::FixedGrid;
    config.design.grid = StateMatrix(25, 1);
    for (Eigen::Index i = 0; i < 25; ++i) config.design.grid(i, 0) = 16.0 + static_cast<double>(i);
    config.design.replications = 50;
    return config;
}

struct LookaheadFixture {
    ModelConfig config;
    std::unique_ptr<BackwardInductionEngine> engine;
    InductionResult induction;
};

const LookaheadFixture& GetLookaheadFixture() {
    static LookaheadFixture* fixture = [] {
        auto f = std::make_unique<LookaheadFixture>();
        f->config = bermudan_put();
        auto engine = BackwardInductionEngine::create(f->config);
        if (!engine) {
            throw std::runtime_error("Engine creation failed: " + engine.error().message);
        }
        f->engine = std::make_unique<BackwardInductionEngine>(std::move(*engine));
        RunContext ctx(1);
        auto result = f->engine->run(ctx);
        if (!result) {
            throw std::runtime_error("Induction failed: " + result.error().message);
        }
        f->induction = std::move(*result);
        return f.release();
    }();
    return *fixture;
}

}  // namespace

static void BM_LookaheadWindow(benchmark::State& state) {
    const LookaheadFixture& fx = GetLookaheadFixture();
    ModelConfig config = fx.config;
    config.design.lookahead = static_cast<size_t>(state.range(0));
    const PathwiseResponseSampler sampler(config, fx.engine->simulator(), fx.engine->payoff(),
                                          fx.induction.surrogates);

    StateMatrix inputs(20, 1);
    for (Eigen::Index i = 0; i < 20; ++i) inputs(i, 0) = 20.0 + static_cast<double>(i);
    const std::vector<size_t> reps(20, 100);
    RunContext ctx(2);

    uint64_t batch = 0;
    for (auto _ : state) {
        auto y = sampler.sample(1, inputs, reps, batch++, ctx);
        if (!y) {
            throw std::runtime_error("Lookahead failed: " + y.error().message);
        }
        benchmark::DoNotOptimize(y->data());
    }
    state.SetItemsProcessed(state.iterations() * 2000);
}
BENCHMARK(BM_LookaheadWindow)->Arg(1)->Arg(5)->Arg(0)->Unit(benchmark::kMillisecond);

BENCHMARK_MAIN();
