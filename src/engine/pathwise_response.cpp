// SPDX-License-Identifier: MIT
#include "osp/engine/pathwise_response.hpp"
#include "osp/support/osp_trace.h"
#include "osp/support/parallel.hpp"
#include <algorithm>
#include <numeric>
#include <random>
#include <string>

namespace osp {

namespace {

/// Rows of `x` listed in `rows`
StateMatrix gather_rows(const StateMatrix& x, const std::vector<Eigen::Index>& rows) {
    StateMatrix out(static_cast<Eigen::Index>(rows.size()), x.cols());
    for (size_t r = 0; r < rows.size(); ++r) {
        out.row(static_cast<Eigen::Index>(r)) = x.row(rows[r]);
    }
    return out;
}

}  // namespace

size_t PathwiseResponseSampler::horizon(size_t step) const {
    const size_t M = config_.time.n_steps;
    const size_t w = config_.design.lookahead;
    return (w == 0) ? M : std::min(step + w, M);
}

Expected<Eigen::VectorXd> PathwiseResponseSampler::sample(size_t step, const StateMatrix& inputs,
                                                          const std::vector<size_t>& replications,
                                                          uint64_t batch, const RunContext& ctx) const {
    if (step >= config_.time.n_steps) {
        return make_error(OspErrorCode::InvalidConfig, "Lookahead must start before maturity");
    }
    if (replications.size() != static_cast<size_t>(inputs.rows())) {
        return make_error(OspErrorCode::InvalidConfig, "One replication count per input is required");
    }
    const size_t total = std::accumulate(replications.begin(), replications.end(), size_t{0});
    const auto n = static_cast<Eigen::Index>(total);
    const Eigen::Index d = inputs.cols();

    StateMatrix starts(n, d);
    {
        Eigen::Index row = 0;
        for (Eigen::Index i = 0; i < inputs.rows(); ++i) {
            for (size_t r = 0; r < replications[static_cast<size_t>(i)]; ++r) {
                starts.row(row++) = inputs.row(i);
            }
        }
    }

    const size_t H = horizon(step);
    std::vector<StateMatrix> shocks(H - step, StateMatrix(n, d));
    OSP_PRAGMA_PARALLEL_FOR
    for (Eigen::Index row = 0; row < n; ++row) {
        std::mt19937_64 rng = ctx.stream(StreamPurpose::Lookahead, step, batch,
                                         static_cast<uint64_t>(row));
        std::normal_distribution<double> normal(0.0, 1.0);
        for (auto& s : shocks) {
            for (Eigen::Index j = 0; j < d; ++j) {
                s(row, j) = normal(rng);
            }
        }
    }
    return respond(step, starts, shocks);
}

Expected<Eigen::VectorXd> PathwiseResponseSampler::respond(size_t step, const StateMatrix& starts,
                                                           const std::vector<StateMatrix>& shocks) const {
    const size_t M = config_.time.n_steps;
    const size_t H = horizon(step);
    const Eigen::Index n = starts.rows();
    const Eigen::Index d = starts.cols();

    if (step >= M) {
        return make_error(OspErrorCode::InvalidConfig, "Lookahead must start before maturity");
    }
    if (static_cast<size_t>(d) != simulator_.dimension()) {
        return make_error(OspErrorCode::InvalidConfig, "Start states have the wrong dimension");
    }
    if (shocks.size() < H - step) {
        return make_error(OspErrorCode::InvalidConfig,
                          "Lookahead window needs " + std::to_string(H - step) + " shock matrices");
    }
    for (size_t s = 0; s < H - step; ++s) {
        if (shocks[s].rows() != n || shocks[s].cols() != d) {
            return make_error(OspErrorCode::InvalidConfig, "Shock matrix shape does not match the states");
        }
    }

    const Eigen::VectorXd h0 = payoff_.evaluate(starts);
    Eigen::VectorXd response = Eigen::VectorXd::Zero(n);
    StateMatrix x = starts;
    std::vector<Eigen::Index> active(static_cast<size_t>(n));
    std::iota(active.begin(), active.end(), Eigen::Index{0});

    for (size_t j = step + 1; j <= H && !active.empty(); ++j) {
        const StateMatrix& eps = shocks[j - step - 1];
        OSP_PRAGMA_PARALLEL_FOR
        for (size_t a = 0; a < active.size(); ++a) {
            const Eigen::Index i = active[a];
            simulator_.advance_state(x.row(i).data(), config_.time.dt, eps.row(i).data());
        }

        const double disc = config_.discount(j - step);

        if (j == M) {
            for (Eigen::Index i : active) {
                response[i] = disc * payoff_.value(state_row(x, i)) - h0[i];
            }
            break;
        }

        const Surrogate* surrogate = surrogates_.at(j);
        if (surrogate == nullptr) {
            OSP_TRACE_RUNTIME_ERROR(OSP_MODULE_INDUCTION, static_cast<int>(OspErrorCode::InvalidConfig), j);
            return make_error(OspErrorCode::InvalidConfig,
                              "No fitted surrogate at step " + std::to_string(j));
        }

        if (j == H) {
            const Eigen::VectorXd timing = surrogate->predict_mean(gather_rows(x, active));
            for (size_t a = 0; a < active.size(); ++a) {
                const Eigen::Index i = active[a];
                const double h = payoff_.value(state_row(x, i));
                response[i] = disc * (timing[static_cast<Eigen::Index>(a)] + h) - h0[i];
            }
            break;
        }

        // Stop where in the money with negative timing value
        std::vector<Eigen::Index> itm;
        std::vector<double> itm_payoff;
        for (Eigen::Index i : active) {
            const double h = payoff_.value(state_row(x, i));
            if (h > 0.0) {
                itm.push_back(i);
                itm_payoff.push_back(h);
            }
        }
        if (itm.empty()) {
            continue;
        }
        const Eigen::VectorXd timing = surrogate->predict_mean(gather_rows(x, itm));
        std::vector<char> stopped(static_cast<size_t>(n), 0);
        for (size_t a = 0; a < itm.size(); ++a) {
            if (timing[static_cast<Eigen::Index>(a)] < 0.0) {
                response[itm[a]] = disc * itm_payoff[a] - h0[itm[a]];
                stopped[static_cast<size_t>(itm[a])] = 1;
            }
        }
        std::erase_if(active, [&](Eigen::Index i) { return stopped[static_cast<size_t>(i)] != 0; });
    }
    return response;
}

}  // namespace osp
