// SPDX-License-Identifier: MIT
#include "osp/design/fixed_grid_design.hpp"
#include "osp/support/osp_trace.h"
#include <string>
#include <vector>

namespace osp {

Expected<SimulationDesign> FixedGridDesign::generate(size_t step, DesignContext& ctx) const {
    const DesignConfig& cfg = ctx.config.design;
    const StateMatrix inputs = in_the_money_rows(cfg.grid, ctx.payoff);
    if (inputs.rows() == 0) {
        OSP_TRACE_VALIDATION_ERROR(OSP_MODULE_DESIGN, static_cast<int>(OspErrorCode::UnderdeterminedFit),
                                   static_cast<double>(cfg.grid.rows()), 0.0);
        return make_error(OspErrorCode::UnderdeterminedFit, "No grid point is in the money");
    }
    std::vector<size_t> reps(static_cast<size_t>(inputs.rows()), cfg.replications);
    return simulate_design(step, inputs, reps, ctx);
}

Expected<SimulationDesign> PathDesign::generate(size_t step, DesignContext& ctx) const {
    if (ctx.training_paths == nullptr || step >= ctx.training_paths->size()) {
        return make_error(OspErrorCode::InvalidConfig, "Path-based design needs forward training paths");
    }
    const StateMatrix inputs = in_the_money_rows((*ctx.training_paths)[step], ctx.payoff);
    if (inputs.rows() == 0) {
        OSP_TRACE_VALIDATION_ERROR(OSP_MODULE_DESIGN, static_cast<int>(OspErrorCode::UnderdeterminedFit),
                                   static_cast<double>(step), 0.0);
        return make_error(OspErrorCode::UnderdeterminedFit,
                          "No training path is in the money at step " + std::to_string(step));
    }
    std::vector<size_t> reps(static_cast<size_t>(inputs.rows()), 1);
    return simulate_design(step, inputs, reps, ctx);
}

}  // namespace osp
