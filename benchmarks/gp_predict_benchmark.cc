// SPDX-License-Identifier: MIT
/**
 * @file gp_predict_benchmark.cc
 * @brief Gaussian process fitting and prediction cost versus design size
 *
 * Prediction is the inner loop of every lookahead (one batch per step of
 * the window), so mean-only and mean+variance queries are timed separately.
 */

#include "osp/regression/gaussian_process.hpp"
#include <benchmark/benchmark.h>
#include <cmath>
#include <random>
#include <stdexcept>

using namespace osp;

namespace {

FitData noisy_design(Eigen::Index n, Eigen::Index d) {
    std::mt19937_64 rng(42);
    std::uniform_real_distribution<double> unif(25.0, 40.0);
    std::normal_distribution<double> normal(0.0, 0.1);
    FitData data;
    data.inputs = StateMatrix(n, d);
    data.outputs = Eigen::VectorXd(n);
    data.replications = Eigen::VectorXd::Constant(n, 50.0);
    data.sample_variance = Eigen::VectorXd::Constant(n, 1.0);
    for (Eigen::Index i = 0; i < n; ++i) {
        double s = 0.0;
        for (Eigen::Index j = 0; j < d; ++j) {
            data.inputs(i, j) = unif(rng);
            s += data.inputs(i, j);
        }
        data.outputs[i] = std::sin(s / (5.0 * static_cast<double>(d))) + normal(rng);
    }
    return data;
}

RegressionConfig mle_config() {
    RegressionConfig config;
    config.method = RegressionMethod::GpMle;
    config.kernel = KernelFamily::Matern52;
    config.noise = NoiseModel::FromReplicates;
    return config;
}

StateMatrix query_batch(Eigen::Index n, Eigen::Index d) {
    std::mt19937_64 rng(7);
    std::uniform_real_distribution<double> unif(25.0, 40.0);
    StateMatrix q(n, d);
    for (Eigen::Index i = 0; i < n; ++i) {
        for (Eigen::Index j = 0; j < d; ++j) q(i, j) = unif(rng);
    }
    return q;
}

}  // namespace

static void BM_GpMleFit(benchmark::State& state) {
    const FitData data = noisy_design(state.range(0), state.range(1));
    GaussianProcessRegressor regressor(mle_config());
    for (auto _ : state) {
        auto fit = regressor.fit(data);
        if (!fit) {
            throw std::runtime_error("GP fit failed: " + fit.error().message);
        }
        benchmark::DoNotOptimize(fit);
    }
    state.SetComplexityN(state.range(0));
}
BENCHMARK(BM_GpMleFit)->Args({25, 1})->Args({50, 1})->Args({100, 1})->Args({50, 2})
    ->Unit(benchmark::kMillisecond);

static void BM_GpPredictMean(benchmark::State& state) {
    const FitData data = noisy_design(state.range(0), 1);
    GaussianProcessRegressor regressor(mle_config());
    auto fit = regressor.fit(data);
    if (!fit) {
        throw std::runtime_error("GP fit failed: " + fit.error().message);
    }
    const StateMatrix q = query_batch(state.range(1), 1);
    for (auto _ : state) {
        Eigen::VectorXd m = (*fit)->predict_mean(q);
        benchmark::DoNotOptimize(m.data());
    }
    state.SetItemsProcessed(state.iterations() * state.range(1));
}
BENCHMARK(BM_GpPredictMean)->Args({25, 1000})->Args({25, 10000})->Args({100, 10000});

static void BM_GpPredictWithVariance(benchmark::State& state) {
    const FitData data = noisy_design(state.range(0), 1);
    GaussianProcessRegressor regressor(mle_config());
    auto fit = regressor.fit(data);
    if (!fit) {
        throw std::runtime_error("GP fit failed: " + fit.error().message);
    }
    const StateMatrix q = query_batch(state.range(1), 1);
    for (auto _ : state) {
        Prediction p = (*fit)->predict(q);
        benchmark::DoNotOptimize(p.mean.data());
    }
    state.SetItemsProcessed(state.iterations() * state.range(1));
}
BENCHMARK(BM_GpPredictWithVariance)->Args({25, 200})->Args({100, 200});

BENCHMARK_MAIN();
