// SPDX-License-Identifier: MIT
/**
 * @file pathwise_response.hpp
 * @brief Telescoped pathwise samples of the timing value
 *
 * From a state x at step k, a lookahead path runs to the window end
 * H = min(k + w, M) (w = 0 means H = M) and stops at the first step j < H
 * where it is in the money and T̂(j, xⱼ) < 0. With discount factor
 * D(n) = exp(-r·Δt·n) the response is
 *
 *   stopped at j < H:      D(j - k)·h(xⱼ) - h(x)
 *   reached H = M:         D(M - k)·h(x_M) - h(x)
 *   reached H < M:         D(H - k)·(T̂(H, x_H) + h(x_H)) - h(x)
 *
 * Every response row simulates along its own random stream, so the result
 * is independent of the order and threading of the rows.
 */

#pragma once

#include "osp/engine/fitted_surrogates.hpp"
#include "osp/engine/run_context.hpp"
#include "osp/model/model_config.hpp"
#include "osp/model/payoff.hpp"
#include "osp/model/state_simulator.hpp"
#include <Eigen/Dense>
#include <cstdint>
#include <vector>

namespace osp {

class PathwiseResponseSampler {
public:
    PathwiseResponseSampler(const ModelConfig& config, const StateSimulator& simulator,
                            const PayoffFunction& payoff, const FittedSurrogates& surrogates)
        : config_(config), simulator_(simulator), payoff_(payoff), surrogates_(surrogates) {}

    /// Last step H of the lookahead window that starts at `step`
    size_t horizon(size_t step) const;

    /// Simulate replications[i] lookaheads from inputs row i
    ///
    /// Row ρ of the result (input-major order) draws from the stream
    /// (Lookahead, step, batch, ρ).
    ///
    /// @return Σ replications responses, or InvalidConfig if a surrogate
    ///         needed inside the window is missing
    Expected<Eigen::VectorXd> sample(size_t step, const StateMatrix& inputs,
                                     const std::vector<size_t>& replications,
                                     uint64_t batch, const RunContext& ctx) const;

    /// Responses along caller-supplied shocks
    ///
    /// @param starts States at `step`, one lookahead per row
    /// @param shocks shocks[s] holds the N x d independent normals of the
    ///        transition into step `step + s + 1`
    Expected<Eigen::VectorXd> respond(size_t step, const StateMatrix& starts,
                                      const std::vector<StateMatrix>& shocks) const;

private:
    const ModelConfig& config_;
    const StateSimulator& simulator_;
    const PayoffFunction& payoff_;
    const FittedSurrogates& surrogates_;
};

}  // namespace osp
