// SPDX-License-Identifier: MIT
#pragma once

#include "osp/design/design_generator.hpp"
#include <Eigen/Dense>

namespace osp {

/// Axis-aligned box from which design inputs are drawn
struct DesignBox {
    Eigen::VectorXd lower;
    Eigen::VectorXd upper;
};

/// Design region of backward step `step`
///
/// Uses the configured bounds when given. Otherwise the box spans the
/// [q, 1 - q] quantiles (q = pilot_quantile) of the in-the-money pilot
/// states at that step.
///
/// @return UnderdeterminedFit when fewer than two pilot states are in the money
Expected<DesignBox> design_region(size_t step, const DesignContext& ctx);

}  // namespace osp
