// SPDX-License-Identifier: MIT
#include "osp/design/qmc_design.hpp"
#include "osp/support/osp_trace.h"
#include <boost/random/sobol.hpp>
#include <string>
#include <vector>

namespace osp {

Expected<StateMatrix> sobol_in_the_money(const DesignBox& box, size_t n,
                                         const PayoffFunction& payoff, size_t max_draws) {
    const Eigen::Index d = box.lower.size();
    boost::random::sobol engine(static_cast<std::size_t>(d));
    const double scale = static_cast<double>(boost::random::sobol::max()) + 1.0;

    StateMatrix accepted(static_cast<Eigen::Index>(n), d);
    std::vector<double> x(static_cast<size_t>(d));
    size_t count = 0;
    for (size_t draw = 0; draw < max_draws && count < n; ++draw) {
        for (Eigen::Index j = 0; j < d; ++j) {
            const double u = static_cast<double>(engine()) / scale;
            x[static_cast<size_t>(j)] = box.lower[j] + u * (box.upper[j] - box.lower[j]);
        }
        if (payoff.in_the_money(x)) {
            for (Eigen::Index j = 0; j < d; ++j) {
                accepted(static_cast<Eigen::Index>(count), j) = x[static_cast<size_t>(j)];
            }
            ++count;
        }
    }
    if (count < n) {
        OSP_TRACE_VALIDATION_ERROR(OSP_MODULE_DESIGN, static_cast<int>(OspErrorCode::UnderdeterminedFit),
                                   static_cast<double>(count), static_cast<double>(n));
        return make_error(OspErrorCode::UnderdeterminedFit,
                          "Only " + std::to_string(count) + " of " + std::to_string(n) +
                          " Sobol points fell in the money");
    }
    return accepted;
}

Expected<SimulationDesign> QmcDesign::generate(size_t step, DesignContext& ctx) const {
    const DesignConfig& cfg = ctx.config.design;
    auto box = design_region(step, ctx);
    if (!box) {
        return std::unexpected(box.error());
    }
    auto inputs = sobol_in_the_money(*box, cfg.qmc_size, ctx.payoff, 1000 * cfg.qmc_size);
    if (!inputs) {
        return std::unexpected(inputs.error());
    }
    std::vector<size_t> reps(cfg.qmc_size, cfg.replications);
    return simulate_design(step, *inputs, reps, ctx);
}

}  // namespace osp
