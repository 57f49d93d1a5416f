// SPDX-License-Identifier: MIT
#include "osp/design/design_generator.hpp"
#include "osp/design/adaptive_batch.hpp"
#include "osp/design/fixed_grid_design.hpp"
#include "osp/design/qmc_design.hpp"
#include "osp/design/sequential_design.hpp"

namespace osp {

StateMatrix in_the_money_rows(const StateMatrix& states, const PayoffFunction& payoff) {
    std::vector<Eigen::Index> keep;
    keep.reserve(static_cast<size_t>(states.rows()));
    for (Eigen::Index i = 0; i < states.rows(); ++i) {
        if (payoff.in_the_money(state_row(states, i))) {
            keep.push_back(i);
        }
    }
    StateMatrix out(static_cast<Eigen::Index>(keep.size()), states.cols());
    for (size_t i = 0; i < keep.size(); ++i) {
        out.row(static_cast<Eigen::Index>(i)) = states.row(keep[i]);
    }
    return out;
}

Expected<SimulationDesign> simulate_design(size_t step, const StateMatrix& inputs,
                                           const std::vector<size_t>& replications,
                                           DesignContext& ctx) {
    auto responses = ctx.sampler.sample(step, inputs, replications, ctx.run.next_batch_id(), ctx.run);
    if (!responses) {
        return std::unexpected(responses.error());
    }
    return make_design(inputs, replications, *responses);
}

Expected<std::unique_ptr<DesignGenerator>> make_design_generator(const DesignConfig& config) {
    switch (config.method) {
        case DesignMethod::FixedGrid:
            return std::make_unique<FixedGridDesign>();
        case DesignMethod::Qmc:
            return std::make_unique<QmcDesign>();
        case DesignMethod::PathBased:
            return std::make_unique<PathDesign>();
        case DesignMethod::Sequential:
            return std::make_unique<SequentialDesign>();
        case DesignMethod::AdaptiveBatch:
            return std::make_unique<AdaptiveBatchDesign>();
    }
    return make_error(OspErrorCode::InvalidConfig, "Unknown design method");
}

}  // namespace osp
