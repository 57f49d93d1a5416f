// SPDX-License-Identifier: MIT
#pragma once

#include "osp/model/model_config.hpp"
#include "osp/model/payoff.hpp"
#include "osp/regression/regressor.hpp"
#include <memory>

namespace osp {

/// Resolve the configured regression method into a Regressor
///
/// @param payoff Used by the linear basis when `payoff_basis` is set
/// @return InvalidConfig when the method's settings are inconsistent
Expected<std::unique_ptr<Regressor>> make_regressor(const RegressionConfig& config,
                                                    std::shared_ptr<const PayoffFunction> payoff);

}  // namespace osp
