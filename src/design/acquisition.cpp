// SPDX-License-Identifier: MIT
#include "osp/design/acquisition.hpp"
#include <algorithm>
#include <cmath>
#include <numbers>

namespace osp {

namespace {

constexpr double MIN_VARIANCE = 1e-300;

double normal_pdf(double x) {
    return std::exp(-0.5 * x * x) / std::sqrt(2.0 * std::numbers::pi);
}

}  // namespace

double normal_cdf(double x) {
    return 0.5 * std::erfc(-x / std::numbers::sqrt2);
}

double csur_reduction(double mean, double variance, double nugget) {
    const double s2 = std::max(variance, MIN_VARIANCE);
    const double tau2 = std::max(nugget, 0.0);
    const double s_new2 = std::max(s2 * tau2 / (tau2 + s2), MIN_VARIANCE);
    const double m = std::abs(mean);
    return normal_cdf(-m / std::sqrt(s2)) - normal_cdf(-m / std::sqrt(s_new2));
}

Eigen::VectorXd acquisition_scores(AcquisitionFunction fn, const Eigen::VectorXd& mean,
                                   const Eigen::VectorXd& variance,
                                   const std::optional<Eigen::VectorXd>& nugget) {
    const Eigen::Index n = mean.size();
    Eigen::VectorXd score(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        const double m = mean[i];
        const double s = std::sqrt(std::max(variance[i], MIN_VARIANCE));
        switch (fn) {
            case AcquisitionFunction::Mcu:
                score[i] = normal_cdf(-std::abs(m) / s);
                break;
            case AcquisitionFunction::Smcu:
                score[i] = STRADDLE_GAMMA * s - std::abs(m);
                break;
            case AcquisitionFunction::Tmse:
                score[i] = s * normal_pdf(m / s);
                break;
            case AcquisitionFunction::Csur: {
                const double tau2 = nugget ? (*nugget)[i] : 0.0;
                score[i] = csur_reduction(m, variance[i], tau2);
                break;
            }
        }
    }
    return score;
}

std::optional<size_t> best_candidate(const Eigen::VectorXd& scores) {
    std::optional<size_t> best;
    for (Eigen::Index i = 0; i < scores.size(); ++i) {
        if (!std::isfinite(scores[i])) continue;
        if (!best || scores[i] > scores[static_cast<Eigen::Index>(*best)]) {
            best = static_cast<size_t>(i);
        }
    }
    return best;
}

}  // namespace osp
