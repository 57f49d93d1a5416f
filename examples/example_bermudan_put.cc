// SPDX-License-Identifier: MIT
/**
 * @file example_bermudan_put.cc
 * @brief Price a Bermudan put with a GP surrogate on a fixed grid
 *
 * S0 = 36, K = 40, σ = 0.2, r = 0.06, 25 exercise dates over one year.
 */

#include "osp/engine/backward_induction.hpp"
#include "osp/engine/forward_policy.hpp"
#include <iomanip>
#include <iostream>

int main() {
    using namespace osp;

    ModelConfig config;
    config.process.initial_state = {36.0};
    config.process.drift = {0.06};
    config.process.volatility = {0.2};
    config.payoff = PayoffSpec{PayoffType::Put, 40.0};
    config.time = TimeGrid{0.04, 25};
    config.rate = 0.06;
    config.regression.method = RegressionMethod::GpMle;
    config.regression.kernel = KernelFamily::Matern52;
    config.regression.noise = NoiseModel::FromReplicates;
    config.design.method = DesignMethod::FixedGrid;
    config.design.grid = StateMatrix(25, 1);
    for (Eigen::Index i = 0; i < 25; ++i) {
        config.design.grid(i, 0) = 16.0 + static_cast<double>(i);
    }
    config.design.replications = 200;

    auto engine = BackwardInductionEngine::create(config);
    if (!engine) {
        std::cerr << "Configuration rejected: " << engine.error() << "\n";
        return 1;
    }

    RunContext ctx(20240917ULL);
    auto induction = engine->run(ctx);
    if (!induction) {
        std::cerr << "Backward induction failed: " << induction.error() << "\n";
        return 1;
    }

    RunContext test_ctx(7);
    auto paths = simulate_paths(config, 50000, test_ctx, StreamPurpose::TestPaths);
    if (!paths) {
        std::cerr << "Test path simulation failed: " << paths.error() << "\n";
        return 1;
    }
    auto eval = evaluate_policy(*paths, induction->surrogates, config);
    if (!eval) {
        std::cerr << "Policy evaluation failed: " << eval.error() << "\n";
        return 1;
    }

    std::cout << "=== Bermudan put (S0=36, K=40, sigma=0.2, r=0.06, T=1) ===\n";
    std::cout << std::fixed << std::setprecision(4);
    std::cout << "Price:          " << eval->mean() << " +/- " << eval->standard_error() << "\n";
    std::cout << "Induction time: " << induction->total_seconds << " s\n";

    std::cout << "\nStep  unique  simulations  boundary\n";
    for (const StepDiagnostics& diag : induction->steps) {
        auto boundary = exercise_boundary(*induction->surrogates.at(diag.step), 16.0, 39.9);
        std::cout << std::setw(4) << diag.step << std::setw(8) << diag.n_unique
                  << std::setw(13) << diag.total_simulations << "  ";
        if (boundary) {
            std::cout << *boundary << "\n";
        } else {
            std::cout << "n/a\n";
        }
    }
    return 0;
}
