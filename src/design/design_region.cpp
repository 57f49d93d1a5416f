// SPDX-License-Identifier: MIT
#include "osp/design/design_region.hpp"
#include "osp/support/osp_trace.h"
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <string>
#include <vector>

namespace osp {

namespace {

double quantile(std::vector<double>& v, double q) {
    const double pos = q * static_cast<double>(v.size() - 1);
    const auto lo = static_cast<size_t>(std::floor(pos));
    const auto hi = std::min(lo + 1, v.size() - 1);
    std::nth_element(v.begin(), v.begin() + static_cast<std::ptrdiff_t>(lo), v.end());
    const double a = v[lo];
    std::nth_element(v.begin(), v.begin() + static_cast<std::ptrdiff_t>(hi), v.end());
    const double b = v[hi];
    return a + (pos - static_cast<double>(lo)) * (b - a);
}

}  // namespace

Expected<DesignBox> design_region(size_t step, const DesignContext& ctx) {
    const DesignConfig& design = ctx.config.design;
    const auto d = static_cast<Eigen::Index>(ctx.config.dimension());

    if (!design.lower.empty()) {
        DesignBox box{Eigen::VectorXd(d), Eigen::VectorXd(d)};
        for (Eigen::Index j = 0; j < d; ++j) {
            box.lower[j] = design.lower[static_cast<size_t>(j)];
            box.upper[j] = design.upper[static_cast<size_t>(j)];
        }
        return box;
    }

    if (ctx.pilot_paths == nullptr || step >= ctx.pilot_paths->size()) {
        return make_error(OspErrorCode::InvalidConfig,
                          "Design region needs explicit bounds or pilot paths");
    }
    const StateMatrix itm = in_the_money_rows((*ctx.pilot_paths)[step], ctx.payoff);
    if (itm.rows() < 2) {
        OSP_TRACE_VALIDATION_ERROR(OSP_MODULE_DESIGN, static_cast<int>(OspErrorCode::UnderdeterminedFit),
                                   static_cast<double>(itm.rows()), 2.0);
        return make_error(OspErrorCode::UnderdeterminedFit,
                          "Fewer than two pilot states are in the money at step " + std::to_string(step));
    }

    DesignBox box{Eigen::VectorXd(d), Eigen::VectorXd(d)};
    std::vector<double> column(static_cast<size_t>(itm.rows()));
    for (Eigen::Index j = 0; j < d; ++j) {
        for (Eigen::Index i = 0; i < itm.rows(); ++i) {
            column[static_cast<size_t>(i)] = itm(i, j);
        }
        double lo = quantile(column, design.pilot_quantile);
        double hi = quantile(column, 1.0 - design.pilot_quantile);
        if (!(hi > lo)) {
            const double pad = 1e-6 * std::max(std::abs(lo), 1.0);
            lo -= pad;
            hi += pad;
        }
        box.lower[j] = lo;
        box.upper[j] = hi;
    }
    return box;
}

}  // namespace osp
