// SPDX-License-Identifier: MIT
/**
 * @file example_exercise_boundary.cc
 * @brief Exercise boundary of a Bermudan put from a smoothing spline fit
 *
 * Prints the fitted boundary at every exercise date together with the
 * surrogate's timing value on a few states below it.
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
    config.regression.method = RegressionMethod::Spline;
    config.regression.spline_knots = 10;
    config.regression.spline_penalty = 1e-3;
    config.design.method = DesignMethod::PathBased;
    config.design.n_paths = 20000;

    auto engine = BackwardInductionEngine::create(config);
    if (!engine) {
        std::cerr << "Configuration rejected: " << engine.error() << "\n";
        return 1;
    }
    RunContext ctx(3);
    auto induction = engine->run(ctx);
    if (!induction) {
        std::cerr << "Backward induction failed: " << induction.error() << "\n";
        return 1;
    }

    StateMatrix probes(3, 1);
    probes << 26.0, 30.0, 34.0;

    std::cout << "=== Exercise boundary, Bermudan put K=40 ===\n";
    std::cout << std::fixed << std::setprecision(3);
    std::cout << "   t   boundary   T(26)    T(30)    T(34)\n";
    for (size_t k = 1; k < config.time.n_steps; ++k) {
        const Surrogate& timing = *induction->surrogates.at(k);
        auto boundary = exercise_boundary(timing, 20.0, 39.9);
        const Eigen::VectorXd t = timing.predict_mean(probes);
        std::cout << std::setw(5) << config.time.dt * static_cast<double>(k) << "  ";
        if (boundary) {
            std::cout << std::setw(9) << *boundary;
        } else {
            std::cout << std::setw(9) << "n/a";
        }
        std::cout << std::setw(9) << t[0] << std::setw(9) << t[1] << std::setw(9) << t[2] << "\n";
    }
    return 0;
}
