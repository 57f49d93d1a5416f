// SPDX-License-Identifier: MIT
#include "osp/design/adaptive_batch.hpp"
#include "osp/design/acquisition.hpp"
#include "osp/design/design_region.hpp"
#include "osp/design/sequential_design.hpp"
#include "osp/support/osp_trace.h"
#include <algorithm>
#include <limits>
#include <optional>
#include <string>

namespace osp {

namespace {

constexpr double NO_OPTION = -std::numeric_limits<double>::infinity();

/// Rounds without any scorable option before giving up
constexpr size_t MAX_IDLE_ROUNDS = 20;

/// Pooled per-simulation variance of the design, fallback noise level
double pooled_sample_variance(const SimulationDesign& design) {
    double m2 = 0.0;
    double dof = 0.0;
    for (size_t i = 0; i < design.size(); ++i) {
        const double r = static_cast<double>(design.replications[i]);
        if (r >= 2.0) {
            m2 += design.sample_variance[static_cast<Eigen::Index>(i)] * (r - 1.0);
            dof += r - 1.0;
        }
    }
    return dof > 0.0 ? m2 / dof : 0.0;
}

}  // namespace

Expected<SimulationDesign> AdaptiveBatchDesign::generate(size_t step, DesignContext& ctx) const {
    const DesignConfig& cfg = ctx.config.design;
    const size_t r0 = cfg.replications;
    const size_t r_add = cfg.replication_increment;

    auto box = design_region(step, ctx);
    if (!box) {
        return std::unexpected(box.error());
    }
    auto seeded = initial_sequential_design(step, *box, ctx);
    if (!seeded) {
        return std::unexpected(seeded.error());
    }
    SimulationDesign design = std::move(*seeded);
    size_t used = design.total_simulations();

    auto surrogate = ctx.regressor.fit(design.to_fit_data());
    if (!surrogate) {
        return std::unexpected(surrogate.error());
    }

    OSP_TRACE_ALGO_START(OSP_MODULE_ALLOCATOR, step, cfg.budget, cfg.target_size);
    size_t rounds = 0;
    uint64_t pool_round = 0;
    size_t idle_rounds = 0;
    bool exhausted = false;
    while (design.size() < cfg.target_size) {
        const size_t remaining = cfg.budget > used ? cfg.budget - used : 0;
        const bool can_add = r0 <= remaining;
        const bool can_replicate = r_add <= remaining;
        if (!can_add && !can_replicate) {
            exhausted = true;
            break;
        }

        const double pooled = pooled_sample_variance(design);

        // Best new location
        double best_new_ratio = NO_OPTION;
        StateMatrix best_new;
        if (can_add) {
            const StateMatrix pool = candidate_pool(*box, cfg.candidate_pool, step, pool_round++,
                                                    ctx.payoff, ctx.run);
            if (pool.rows() > 0) {
                const Prediction pred = (*surrogate)->predict(pool);
                if (!pred.variance) {
                    return make_error(OspErrorCode::InvalidConfig,
                                      "Adaptive batching needs a surrogate with predictive variance");
                }
                const std::optional<Eigen::VectorXd> tau2 = (*surrogate)->noise_variance(pool);
                Eigen::VectorXd ratio(pool.rows());
                for (Eigen::Index c = 0; c < pool.rows(); ++c) {
                    const double noise = tau2 ? (*tau2)[c] : pooled;
                    ratio[c] = csur_reduction(pred.mean[c], (*pred.variance)[c],
                                              noise / static_cast<double>(r0)) /
                               (static_cast<double>(r0) + cfg.new_point_overhead);
                }
                if (auto best = best_candidate(ratio)) {
                    best_new_ratio = ratio[static_cast<Eigen::Index>(*best)];
                    best_new = pool.row(static_cast<Eigen::Index>(*best));
                }
            }
        }

        // Best existing location to replicate
        double best_rep_ratio = NO_OPTION;
        std::optional<size_t> best_rep;
        if (can_replicate) {
            const Prediction pred = (*surrogate)->predict(design.inputs);
            if (!pred.variance) {
                return make_error(OspErrorCode::InvalidConfig,
                                  "Adaptive batching needs a surrogate with predictive variance");
            }
            Eigen::VectorXd ratio(design.inputs.rows());
            for (Eigen::Index i = 0; i < design.inputs.rows(); ++i) {
                const double s2 = design.sample_variance[i];
                const double noise = s2 > 0.0 ? s2 : pooled;
                ratio[i] = csur_reduction(pred.mean[i], (*pred.variance)[i],
                                          noise / static_cast<double>(r_add)) /
                           static_cast<double>(r_add);
            }
            best_rep = best_candidate(ratio);
            if (best_rep) {
                best_rep_ratio = ratio[static_cast<Eigen::Index>(*best_rep)];
            }
        }

        if (best_new_ratio == NO_OPTION && best_rep_ratio == NO_OPTION) {
            if (++idle_rounds > MAX_IDLE_ROUNDS) {
                return make_error(OspErrorCode::UnderdeterminedFit,
                                  "No affordable in-the-money option found at step " +
                                  std::to_string(step));
            }
            continue;
        }

        const uint64_t batch = ctx.run.next_batch_id();
        if (best_new_ratio >= best_rep_ratio) {
            auto responses = ctx.sampler.sample(step, best_new, {r0}, batch, ctx.run);
            if (!responses) {
                return std::unexpected(responses.error());
            }
            design.add_input(state_row(best_new, 0), *responses);
            used += r0;
            OSP_TRACE_DESIGN_POINT_ADDED(step, design.size(), best_new_ratio);
        } else {
            const auto i = static_cast<Eigen::Index>(*best_rep);
            const StateMatrix x = design.inputs.row(i);
            auto responses = ctx.sampler.sample(step, x, {r_add}, batch, ctx.run);
            if (!responses) {
                return std::unexpected(responses.error());
            }
            merge_replicates(design, *best_rep, *responses);
            used += r_add;
            OSP_TRACE_DESIGN_REPLICATION_ADDED(step, *best_rep, design.replications[*best_rep]);
        }

        ++rounds;
        const FitData data = design.to_fit_data();
        surrogate = (rounds % cfg.update_frequency == 0)
            ? ctx.regressor.fit(data)
            : ctx.regressor.refit(data, **surrogate);
        if (!surrogate) {
            return std::unexpected(surrogate.error());
        }
        OSP_TRACE_ALGO_PROGRESS(OSP_MODULE_ALLOCATOR, used, cfg.budget, design.size());
    }

    design.budget_exhausted = exhausted;
    if (exhausted) {
        OSP_TRACE_BUDGET_EXHAUSTED(step, design.size(), cfg.budget);
    }
    OSP_TRACE_ALGO_COMPLETE(OSP_MODULE_ALLOCATOR, rounds, used);
    return design;
}

}  // namespace osp
