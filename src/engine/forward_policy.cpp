// SPDX-License-Identifier: MIT
#include "osp/engine/forward_policy.hpp"
#include "osp/math/root_finding.hpp"
#include "osp/model/payoff.hpp"
#include "osp/support/osp_trace.h"
#include <cmath>
#include <numeric>
#include <string>

namespace osp {

double PolicyEvaluation::mean() const {
    return payoffs.size() > 0 ? payoffs.mean() : 0.0;
}

double PolicyEvaluation::standard_error() const {
    const Eigen::Index n = payoffs.size();
    if (n < 2) return 0.0;
    const double m = payoffs.mean();
    const double var = (payoffs.array() - m).square().sum() / static_cast<double>(n - 1);
    return std::sqrt(var / static_cast<double>(n));
}

Expected<PolicyEvaluation> evaluate_policy(const PathBatch& test_paths,
                                           const FittedSurrogates& surrogates,
                                           const ModelConfig& config) {
    const size_t M = config.time.n_steps;
    if (test_paths.size() != M + 1) {
        return make_error(OspErrorCode::InvalidConfig,
                          "Test paths need " + std::to_string(M + 1) + " snapshots, got " +
                          std::to_string(test_paths.size()));
    }
    const Eigen::Index n = test_paths.front().rows();
    const auto d = static_cast<Eigen::Index>(config.dimension());
    for (const StateMatrix& snapshot : test_paths) {
        if (snapshot.rows() != n || snapshot.cols() != d) {
            return make_error(OspErrorCode::InvalidConfig, "Test path snapshots have inconsistent shapes");
        }
    }
    for (size_t k = 1; k < M; ++k) {
        if (surrogates.at(k) == nullptr) {
            OSP_TRACE_VALIDATION_ERROR(OSP_MODULE_EVALUATOR, static_cast<int>(OspErrorCode::InvalidConfig),
                                       static_cast<double>(k), 0.0);
            return make_error(OspErrorCode::InvalidConfig,
                              "No fitted surrogate at step " + std::to_string(k));
        }
    }

    OSP_TRACE_ALGO_START(OSP_MODULE_EVALUATOR, n, M, d);
    const PayoffFunction payoff(config.payoff);
    PolicyEvaluation eval;
    eval.payoffs = Eigen::VectorXd::Zero(n);
    eval.stopping_times.assign(static_cast<size_t>(n), M);

    std::vector<Eigen::Index> active(static_cast<size_t>(n));
    std::iota(active.begin(), active.end(), Eigen::Index{0});

    for (size_t k = 1; k < M && !active.empty(); ++k) {
        const StateMatrix& x = test_paths[k];
        std::vector<Eigen::Index> itm;
        for (Eigen::Index i : active) {
            if (payoff.in_the_money(state_row(x, i))) {
                itm.push_back(i);
            }
        }
        if (itm.empty()) {
            continue;
        }
        StateMatrix query(static_cast<Eigen::Index>(itm.size()), d);
        for (size_t a = 0; a < itm.size(); ++a) {
            query.row(static_cast<Eigen::Index>(a)) = x.row(itm[a]);
        }
        const Eigen::VectorXd timing = surrogates.at(k)->predict_mean(query);
        const double disc = config.discount(k);
        std::vector<char> stopped(static_cast<size_t>(n), 0);
        for (size_t a = 0; a < itm.size(); ++a) {
            if (timing[static_cast<Eigen::Index>(a)] < 0.0) {
                const Eigen::Index i = itm[a];
                eval.payoffs[i] = disc * payoff.value(state_row(x, i));
                eval.stopping_times[static_cast<size_t>(i)] = k;
                stopped[static_cast<size_t>(i)] = 1;
            }
        }
        std::erase_if(active, [&](Eigen::Index i) { return stopped[static_cast<size_t>(i)] != 0; });
    }

    const double disc_maturity = config.discount(M);
    for (Eigen::Index i : active) {
        eval.payoffs[i] = disc_maturity * payoff.value(state_row(test_paths[M], i));
    }

    OSP_TRACE_ALGO_COMPLETE(OSP_MODULE_EVALUATOR, M, eval.mean());
    return eval;
}

Expected<double> exercise_boundary(const Surrogate& surrogate, double lo, double hi) {
    if (surrogate.dimension() != 1) {
        return make_error(OspErrorCode::InvalidConfig, "Exercise boundary needs a one-dimensional surrogate");
    }
    if (!(lo < hi)) {
        return make_error(OspErrorCode::InvalidConfig, "Boundary search interval is empty");
    }
    auto timing = [&surrogate](double x) {
        StateMatrix s(1, 1);
        s(0, 0) = x;
        return surrogate.predict_mean(s)[0];
    };
    const double f_lo = timing(lo);
    const double f_hi = timing(hi);
    if (!std::isfinite(f_lo) || !std::isfinite(f_hi) || f_lo * f_hi > 0.0) {
        return make_error(OspErrorCode::InvalidConfig,
                          "Timing value does not change sign on [" + std::to_string(lo) + ", " +
                          std::to_string(hi) + "]");
    }
    const RootFindingResult res = brent_find_root(timing, lo, hi, RootFindingConfig{});
    if (!res.root.has_value()) {
        return make_error(OspErrorCode::FitFailure,
                          res.failure_reason.value_or("Brent search did not locate the boundary"));
    }
    return *res.root;
}

}  // namespace osp
