// SPDX-License-Identifier: MIT
/**
 * @file sequential_design.hpp
 * @brief Active-learning design grown one input at a time
 *
 * Starts from `initial_size` Sobol inputs, then repeatedly scores a fresh
 * Latin-hypercube candidate pool with the acquisition function and
 * simulates at the best candidate. The surrogate is updated after every
 * addition; hyperparameters are re-estimated every `update_frequency`
 * additions and reused in between.
 */

#pragma once

#include "osp/design/design_generator.hpp"
#include "osp/design/design_region.hpp"
#include <cstdint>

namespace osp {

/// In-the-money candidates from a Latin hypercube over the box
///
/// Drawn from the stream (CandidatePool, step, round).
StateMatrix candidate_pool(const DesignBox& box, size_t pool_size, size_t step, uint64_t round,
                           const PayoffFunction& payoff, const RunContext& run);

/// Seed design shared by the sequential and adaptive generators
Expected<SimulationDesign> initial_sequential_design(size_t step, const DesignBox& box,
                                                     DesignContext& ctx);

class SequentialDesign final : public DesignGenerator {
public:
    Expected<SimulationDesign> generate(size_t step, DesignContext& ctx) const override;
    DesignMethod method() const override { return DesignMethod::Sequential; }
};

}  // namespace osp
