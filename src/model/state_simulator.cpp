// SPDX-License-Identifier: MIT
#include "osp/model/state_simulator.hpp"
#include "osp/support/osp_trace.h"
#include "osp/support/parallel.hpp"
#include <cmath>
#include <string>
#include <vector>

namespace osp {

namespace {

std::unexpected<OspError> width_mismatch(Eigen::Index cols, size_t d) {
    OSP_TRACE_VALIDATION_ERROR(OSP_MODULE_SIMULATOR,
                               static_cast<int>(OspErrorCode::InvalidConfig),
                               static_cast<double>(cols), static_cast<double>(d));
    return make_error(OspErrorCode::InvalidConfig,
                      "State matrix has " + std::to_string(cols) +
                      " columns, process dimension is " + std::to_string(d));
}

}  // namespace

Expected<StateSimulator> StateSimulator::create(const ProcessSpec& spec) {
    if (auto ok = validate_process_spec(spec); !ok) {
        return std::unexpected(ok.error());
    }

    Eigen::MatrixXd chol;
    const auto d = static_cast<Eigen::Index>(spec.initial_state.size());
    if (spec.correlation.size() != 0 && !spec.correlation.isIdentity(1e-14)) {
        Eigen::LLT<Eigen::MatrixXd> llt(spec.correlation);
        if (llt.info() != Eigen::Success) {
            OSP_TRACE_VALIDATION_ERROR(OSP_MODULE_SIMULATOR,
                                       static_cast<int>(OspErrorCode::InvalidConfig),
                                       static_cast<double>(d), 0.0);
            return make_error(OspErrorCode::InvalidConfig,
                              "Correlation matrix is not positive definite");
        }
        chol = llt.matrixL();
    }
    return StateSimulator(spec, std::move(chol));
}

void StateSimulator::advance_state(double* x, double dt, const double* eps) const {
    const size_t d = dimension();
    const double sqrt_dt = std::sqrt(dt);

    // Correlate shocks: z = L·ε (lower triangular, so z_i needs ε_0..ε_i)
    double z_stack[8];
    std::vector<double> z_heap;
    double* z = z_stack;
    if (d > 8) {
        z_heap.resize(d);
        z = z_heap.data();
    }
    if (chol_.size() == 0) {
        for (size_t i = 0; i < d; ++i) z[i] = eps[i];
    } else {
        for (size_t i = 0; i < d; ++i) {
            double acc = 0.0;
            for (size_t j = 0; j <= i; ++j) {
                acc += chol_(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) * eps[j];
            }
            z[i] = acc;
        }
    }

    if (spec_.type == ProcessType::GBM) {
        for (size_t i = 0; i < d; ++i) {
            const double sigma = spec_.volatility[i];
            x[i] *= std::exp((spec_.drift[i] - 0.5 * sigma * sigma) * dt + sigma * sqrt_dt * z[i]);
        }
        return;
    }

    const double kappa = spec_.mean_reversion;
    const double theta = spec_.long_run_log_level;
    const double decay = std::exp(-kappa * dt);
    const double sd_factor = std::sqrt((1.0 - decay * decay) / (2.0 * kappa));
    for (size_t i = 0; i < d; ++i) {
        const double y = std::log(x[i]);
        x[i] = std::exp(theta + (y - theta) * decay + spec_.volatility[i] * sd_factor * z[i]);
    }
}

Expected<StateMatrix> StateSimulator::advance_with_shocks(const StateMatrix& states, double dt,
                                                          const StateMatrix& shocks) const {
    const size_t d = dimension();
    if (static_cast<size_t>(states.cols()) != d) {
        return width_mismatch(states.cols(), d);
    }
    if (shocks.rows() != states.rows() || shocks.cols() != states.cols()) {
        return make_error(OspErrorCode::InvalidConfig, "Shock matrix shape does not match the states");
    }
    if (!(dt > 0.0)) {
        return make_error(OspErrorCode::InvalidConfig, "Time step must be positive");
    }

    StateMatrix next = states;
    OSP_PRAGMA_PARALLEL_FOR
    for (Eigen::Index i = 0; i < next.rows(); ++i) {
        advance_state(next.row(i).data(), dt, shocks.row(i).data());
    }
    return next;
}

Expected<StateMatrix> StateSimulator::advance(const StateMatrix& states, double dt,
                                              std::mt19937_64& rng) const {
    if (static_cast<size_t>(states.cols()) != dimension()) {
        return width_mismatch(states.cols(), dimension());
    }
    std::normal_distribution<double> normal(0.0, 1.0);
    StateMatrix shocks(states.rows(), states.cols());
    for (Eigen::Index i = 0; i < shocks.rows(); ++i) {
        for (Eigen::Index j = 0; j < shocks.cols(); ++j) {
            shocks(i, j) = normal(rng);
        }
    }
    return advance_with_shocks(states, dt, shocks);
}

StateMatrix StateSimulator::initial_state() const {
    const auto d = static_cast<Eigen::Index>(dimension());
    StateMatrix x0(1, d);
    for (Eigen::Index j = 0; j < d; ++j) {
        x0(0, j) = spec_.initial_state[static_cast<size_t>(j)];
    }
    return x0;
}

Expected<PathBatch> simulate_paths(const StateSimulator& simulator, const TimeGrid& time,
                                   size_t n_paths, const RunContext& ctx,
                                   StreamPurpose purpose, uint64_t batch) {
    if (n_paths == 0) {
        return make_error(OspErrorCode::InvalidConfig, "Path batch must contain at least one path");
    }
    if (!(time.dt > 0.0) || time.n_steps == 0) {
        return make_error(OspErrorCode::InvalidConfig, "Time grid must have dt > 0 and n_steps >= 1");
    }

    const auto n = static_cast<Eigen::Index>(n_paths);
    const auto d = static_cast<Eigen::Index>(simulator.dimension());
    const StateMatrix x0 = simulator.initial_state();

    PathBatch paths(time.n_steps + 1, StateMatrix(n, d));
    paths[0] = x0.replicate(n, 1);

    OSP_PRAGMA_PARALLEL_FOR
    for (Eigen::Index i = 0; i < n; ++i) {
        std::mt19937_64 rng = ctx.stream(purpose, 0, batch, static_cast<uint64_t>(i));
        std::normal_distribution<double> normal(0.0, 1.0);
        std::vector<double> x(x0.data(), x0.data() + d);
        std::vector<double> eps(static_cast<size_t>(d));
        for (size_t k = 1; k <= time.n_steps; ++k) {
            for (auto& e : eps) e = normal(rng);
            simulator.advance_state(x.data(), time.dt, eps.data());
            for (Eigen::Index j = 0; j < d; ++j) {
                paths[k](i, j) = x[static_cast<size_t>(j)];
            }
        }
    }
    return paths;
}

Expected<PathBatch> simulate_paths(const ModelConfig& config, size_t n_paths,
                                   const RunContext& ctx, StreamPurpose purpose) {
    auto simulator = StateSimulator::create(config.process);
    if (!simulator) {
        return std::unexpected(simulator.error());
    }
    return simulate_paths(*simulator, config.time, n_paths, ctx, purpose);
}

}  // namespace osp
