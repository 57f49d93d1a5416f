// SPDX-License-Identifier: MIT
#include "osp/model/payoff.hpp"
#include "osp/support/parallel.hpp"
#include <algorithm>
#include <numeric>

namespace osp {

double PayoffFunction::value(std::span<const double> x) const {
    const double K = spec_.strike;
    switch (spec_.type) {
        case PayoffType::Put:
            return std::max(K - x[0], 0.0);
        case PayoffType::Call:
            return std::max(x[0] - K, 0.0);
        case PayoffType::BasketPut: {
            double avg = std::accumulate(x.begin(), x.end(), 0.0) / static_cast<double>(x.size());
            return std::max(K - avg, 0.0);
        }
        case PayoffType::BasketCall: {
            double avg = std::accumulate(x.begin(), x.end(), 0.0) / static_cast<double>(x.size());
            return std::max(avg - K, 0.0);
        }
        case PayoffType::MaxCall:
            return std::max(*std::max_element(x.begin(), x.end()) - K, 0.0);
        case PayoffType::MinPut:
            return std::max(K - *std::min_element(x.begin(), x.end()), 0.0);
        case PayoffType::DigitalPut:
            return x[0] < K ? 1.0 : 0.0;
    }
    return 0.0;
}

Eigen::VectorXd PayoffFunction::evaluate(const StateMatrix& states) const {
    Eigen::VectorXd h(states.rows());
    OSP_PRAGMA_PARALLEL_FOR
    for (Eigen::Index i = 0; i < states.rows(); ++i) {
        h[i] = value(state_row(states, i));
    }
    return h;
}

}  // namespace osp
