// SPDX-License-Identifier: MIT
#include "osp/design/sequential_design.hpp"
#include "osp/design/acquisition.hpp"
#include "osp/design/qmc_design.hpp"
#include "osp/math/latin_hypercube.hpp"
#include "osp/support/osp_trace.h"
#include <string>
#include <vector>

namespace osp {

namespace {

/// Candidate pools drawn before giving up on an empty in-the-money region
constexpr size_t MAX_EMPTY_POOLS = 20;

}  // namespace

StateMatrix candidate_pool(const DesignBox& box, size_t pool_size, size_t step, uint64_t round,
                           const PayoffFunction& payoff, const RunContext& run) {
    std::mt19937_64 rng = run.stream(StreamPurpose::CandidatePool, step, round);
    const Eigen::MatrixXd unit = latin_hypercube(pool_size, static_cast<size_t>(box.lower.size()), rng);
    const StateMatrix scaled = scale_to_box(unit, box.lower, box.upper);
    return in_the_money_rows(scaled, payoff);
}

Expected<SimulationDesign> initial_sequential_design(size_t step, const DesignBox& box,
                                                     DesignContext& ctx) {
    const DesignConfig& cfg = ctx.config.design;
    auto inputs = sobol_in_the_money(box, cfg.initial_size, ctx.payoff, 1000 * cfg.initial_size);
    if (!inputs) {
        return std::unexpected(inputs.error());
    }
    std::vector<size_t> reps(cfg.initial_size, cfg.replications);
    return simulate_design(step, *inputs, reps, ctx);
}

Expected<SimulationDesign> SequentialDesign::generate(size_t step, DesignContext& ctx) const {
    const DesignConfig& cfg = ctx.config.design;
    auto box = design_region(step, ctx);
    if (!box) {
        return std::unexpected(box.error());
    }
    auto seeded = initial_sequential_design(step, *box, ctx);
    if (!seeded) {
        return std::unexpected(seeded.error());
    }
    SimulationDesign design = std::move(*seeded);

    auto surrogate = ctx.regressor.fit(design.to_fit_data());
    if (!surrogate) {
        return std::unexpected(surrogate.error());
    }

    OSP_TRACE_ALGO_START(OSP_MODULE_DESIGN, step, cfg.initial_size, cfg.target_size);
    size_t added = 0;
    size_t empty_pools = 0;
    uint64_t round = 0;
    while (design.size() < cfg.target_size) {
        const StateMatrix pool = candidate_pool(*box, cfg.candidate_pool, step, round++, ctx.payoff, ctx.run);
        if (pool.rows() == 0) {
            if (++empty_pools > MAX_EMPTY_POOLS) {
                return make_error(OspErrorCode::UnderdeterminedFit,
                                  "Candidate pools contain no in-the-money states at step " +
                                  std::to_string(step));
            }
            continue;
        }

        const Prediction pred = (*surrogate)->predict(pool);
        if (!pred.variance) {
            return make_error(OspErrorCode::InvalidConfig,
                              "Sequential design needs a surrogate with predictive variance");
        }
        std::optional<Eigen::VectorXd> nugget;
        if (cfg.acquisition == AcquisitionFunction::Csur) {
            nugget = (*surrogate)->noise_variance(pool);
            if (nugget) {
                *nugget /= static_cast<double>(cfg.replications);
            }
        }
        const Eigen::VectorXd scores = acquisition_scores(cfg.acquisition, pred.mean, *pred.variance, nugget);
        const std::optional<size_t> best = best_candidate(scores);
        if (!best) {
            return make_error(OspErrorCode::FitFailure, "Acquisition scores are not finite");
        }

        const auto b = static_cast<Eigen::Index>(*best);
        const StateMatrix x = pool.row(b);
        auto responses = ctx.sampler.sample(step, x, {cfg.replications}, ctx.run.next_batch_id(), ctx.run);
        if (!responses) {
            return std::unexpected(responses.error());
        }
        design.add_input(state_row(x, 0), *responses);
        ++added;
        OSP_TRACE_DESIGN_POINT_ADDED(step, design.size(), scores[b]);

        const FitData data = design.to_fit_data();
        surrogate = (added % cfg.update_frequency == 0)
            ? ctx.regressor.fit(data)
            : ctx.regressor.refit(data, **surrogate);
        if (!surrogate) {
            return std::unexpected(surrogate.error());
        }
        OSP_TRACE_ALGO_PROGRESS(OSP_MODULE_DESIGN, design.size(), cfg.target_size, scores[b]);
    }
    OSP_TRACE_ALGO_COMPLETE(OSP_MODULE_DESIGN, added, design.size());
    return design;
}

}  // namespace osp
