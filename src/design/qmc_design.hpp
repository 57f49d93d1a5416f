// SPDX-License-Identifier: MIT
#pragma once

#include "osp/design/design_generator.hpp"
#include "osp/design/design_region.hpp"

namespace osp {

/// First n Sobol points of the box that lie in the money
///
/// Points are mapped affinely from the unit cube and rejected outside the
/// in-the-money region, which confines basket payoffs to the simplex-like
/// part of the box. At most `max_draws` points are examined.
///
/// @return UnderdeterminedFit when fewer than n points were accepted
Expected<StateMatrix> sobol_in_the_money(const DesignBox& box, size_t n,
                                         const PayoffFunction& payoff, size_t max_draws);

/// Space-filling design: Sobol inputs with fixed replication
class QmcDesign final : public DesignGenerator {
public:
    Expected<SimulationDesign> generate(size_t step, DesignContext& ctx) const override;
    DesignMethod method() const override { return DesignMethod::Qmc; }
};

}  // namespace osp
