// SPDX-License-Identifier: MIT
/**
 * @file adaptive_batch.hpp
 * @brief Budgeted allocation between new inputs and extra replications
 *
 * Each round compares two ways of spending simulations (ABSUR):
 *
 *   new input x:        benefit cSUR(m, s², τ²(x) / r₀),  cost r₀ + overhead
 *   replicate input i:  benefit cSUR(mᵢ, sᵢ², τᵢ² / r_add), cost r_add
 *
 * and takes the option with the largest benefit per unit cost that still
 * fits in the remaining budget. τ² is the per-simulation noise variance:
 * the replicate sample variance at existing inputs, the surrogate's noise
 * estimate at candidates. Rounds stop when the unique design reaches
 * `target_size` or no option fits in the budget; the latter sets
 * `budget_exhausted`.
 */

#pragma once

#include "osp/design/design_generator.hpp"

namespace osp {

class AdaptiveBatchDesign final : public DesignGenerator {
public:
    Expected<SimulationDesign> generate(size_t step, DesignContext& ctx) const override;
    DesignMethod method() const override { return DesignMethod::AdaptiveBatch; }
};

}  // namespace osp
