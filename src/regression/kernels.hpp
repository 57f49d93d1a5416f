// SPDX-License-Identifier: MIT
/**
 * @file kernels.hpp
 * @brief Stationary correlation functions and their derivatives
 *
 * Each kernel family is a row of a strategy table holding the 1-D
 * correlation c(h; θ), its derivative ∂c/∂h and the prior variance factor
 * of the process derivative. The product kernel over coordinates is
 *
 *   k(x, x') = σ² · Πⱼ c(xⱼ - x'ⱼ; θⱼ)
 *
 * and the prior variance of ∂f/∂xⱼ is σ² · factor / θⱼ² (−c''(0) = factor/θ²).
 */

#pragma once

#include "osp/model/model_config.hpp"
#include <cmath>

namespace osp {

struct KernelStrategy {
    double (*correlation)(double h, double theta);
    double (*d_correlation)(double h, double theta);  ///< ∂c/∂h
    double derivative_variance_factor;
};

namespace kernels {

inline double gaussian(double h, double theta) {
    const double u = h / theta;
    return std::exp(-0.5 * u * u);
}

inline double gaussian_dh(double h, double theta) {
    return -h / (theta * theta) * gaussian(h, theta);
}

inline double matern52(double h, double theta) {
    constexpr double SQRT5 = 2.23606797749979;
    const double r = std::abs(h) / theta;
    return (1.0 + SQRT5 * r + 5.0 / 3.0 * r * r) * std::exp(-SQRT5 * r);
}

inline double matern52_dh(double h, double theta) {
    constexpr double SQRT5 = 2.23606797749979;
    const double r = std::abs(h) / theta;
    return -5.0 * h / (3.0 * theta * theta) * (1.0 + SQRT5 * r) * std::exp(-SQRT5 * r);
}

}  // namespace kernels

inline const KernelStrategy& kernel_strategy(KernelFamily family) {
    static const KernelStrategy GAUSSIAN{kernels::gaussian, kernels::gaussian_dh, 1.0};
    static const KernelStrategy MATERN52{kernels::matern52, kernels::matern52_dh, 5.0 / 3.0};
    return family == KernelFamily::Gaussian ? GAUSSIAN : MATERN52;
}

}  // namespace osp
