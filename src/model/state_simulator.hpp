// SPDX-License-Identifier: MIT
/**
 * @file state_simulator.hpp
 * @brief One-step transition of the state process
 *
 * Both supported processes have exact transitions, so a step of any size
 * is simulated without discretisation error:
 *
 *   GBM:    xᵢ' = xᵢ · exp((μᵢ - σᵢ²/2)Δt + σᵢ√Δt · zᵢ)
 *   ExpOU:  yᵢ' = θ + (yᵢ - θ)e^{-κΔt} + σᵢ √((1 - e^{-2κΔt}) / 2κ) · zᵢ,  x = eʸ
 *
 * where z = L·ε with L the Cholesky factor of the correlation matrix and
 * ε independent standard normals.
 */

#pragma once

#include "osp/engine/run_context.hpp"
#include "osp/model/model_config.hpp"
#include "osp/model/types.hpp"
#include "osp/support/error_types.hpp"
#include <Eigen/Dense>
#include <cstddef>
#include <random>
#include <utility>

namespace osp {

class StateSimulator {
public:
    /// Validate the process and cache the correlation factor
    ///
    /// @return InvalidConfig on dimension mismatch or a correlation matrix
    ///         that is not symmetric positive definite with unit diagonal
    static Expected<StateSimulator> create(const ProcessSpec& spec);

    size_t dimension() const { return spec_.initial_state.size(); }
    const ProcessSpec& spec() const { return spec_; }

    /// Advance every row by dt, drawing N·d standard normals from rng
    Expected<StateMatrix> advance(const StateMatrix& states, double dt,
                                  std::mt19937_64& rng) const;

    /// Advance every row by dt with caller-supplied independent N(0,1) shocks
    Expected<StateMatrix> advance_with_shocks(const StateMatrix& states, double dt,
                                              const StateMatrix& shocks) const;

    /// Advance a single state in place (no validation)
    ///
    /// @param x State of length d, overwritten with the next state
    /// @param eps d independent standard normals
    void advance_state(double* x, double dt, const double* eps) const;

    /// Initial state as a 1 x d matrix
    StateMatrix initial_state() const;

private:
    StateSimulator(ProcessSpec spec, Eigen::MatrixXd chol)
        : spec_(std::move(spec)), chol_(std::move(chol)) {}

    ProcessSpec spec_;
    Eigen::MatrixXd chol_;  ///< Lower Cholesky factor, empty when uncorrelated
};

/// Simulate n_paths trajectories from the initial state over the time grid
///
/// Path i draws from its own stream (purpose, step 0, batch, row i), so a
/// training batch and a test batch never share random numbers.
Expected<PathBatch> simulate_paths(const StateSimulator& simulator, const TimeGrid& time,
                                   size_t n_paths, const RunContext& ctx,
                                   StreamPurpose purpose, uint64_t batch = 0);

/// Convenience overload building the simulator from the configuration
Expected<PathBatch> simulate_paths(const ModelConfig& config, size_t n_paths,
                                   const RunContext& ctx, StreamPurpose purpose);

}  // namespace osp
