// SPDX-License-Identifier: MIT
#pragma once

#include "osp/support/osp_trace.h"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <concepts>
#include <cstddef>
#include <limits>
#include <numeric>
#include <optional>
#include <string>
#include <vector>

namespace osp {

/// Configuration for box-constrained Nelder-Mead minimisation
struct NelderMeadConfig {
    /// Maximum iterations (simplex updates)
    size_t max_iter = 400;

    /// Convergence when max |f_i - f_best| falls below this
    double f_tolerance = 1e-7;

    /// Convergence when the simplex diameter falls below this
    double x_tolerance = 1e-6;

    /// Initial simplex edge as a fraction of each box width
    double initial_step = 0.15;
};

/// Result of a minimisation
struct MinimizationResult {
    bool converged;
    size_t iterations;
    double value;
    std::optional<std::string> failure_reason;
    Eigen::VectorXd argmin;
};

/// Multivariate objective f: R^n -> R
template<typename F>
concept VectorObjective = requires(F f, const Eigen::VectorXd& x) {
    { f(x) } -> std::convertible_to<double>;
};

/// Minimise f over the box [lower, upper] with the Nelder-Mead simplex method
///
/// Every trial vertex is projected back into the box before evaluation.
/// Non-finite objective values are treated as +infinity so the simplex moves
/// away from them; the search fails only if no finite value was ever seen.
///
/// Used for maximum-likelihood estimation of GP hyperparameters in
/// log-coordinates (lengthscales, signal variance, nugget).
template<VectorObjective F>
MinimizationResult nelder_mead_minimize(F&& f,
                                        const Eigen::VectorXd& start,
                                        const Eigen::VectorXd& lower,
                                        const Eigen::VectorXd& upper,
                                        const NelderMeadConfig& config = {}) {
    const Eigen::Index n = start.size();
    constexpr double kInf = std::numeric_limits<double>::infinity();

    auto project = [&](Eigen::VectorXd x) {
        return x.cwiseMax(lower).cwiseMin(upper).eval();
    };
    auto eval = [&](const Eigen::VectorXd& x) {
        double v = f(x);
        return std::isfinite(v) ? v : kInf;
    };

    // Initial simplex: start plus one step along each axis (reversed at the upper edge)
    std::vector<Eigen::VectorXd> simplex(static_cast<size_t>(n + 1), project(start));
    for (Eigen::Index j = 0; j < n; ++j) {
        Eigen::VectorXd& v = simplex[static_cast<size_t>(j + 1)];
        double width = upper[j] - lower[j];
        double step = config.initial_step * (width > 0.0 ? width : 1.0);
        v[j] = (v[j] + step <= upper[j]) ? v[j] + step : v[j] - step;
        v = project(v);
    }
    std::vector<double> values(simplex.size());
    for (size_t i = 0; i < simplex.size(); ++i) {
        values[i] = eval(simplex[i]);
    }

    std::vector<size_t> order(simplex.size());
    size_t iter = 0;
    for (; iter < config.max_iter; ++iter) {
        std::iota(order.begin(), order.end(), size_t{0});
        std::sort(order.begin(), order.end(),
                  [&](size_t a, size_t b) { return values[a] < values[b]; });
        const size_t best = order.front();
        const size_t worst = order.back();
        const size_t second_worst = order[order.size() - 2];

        double spread = values[worst] - values[best];
        double diameter = 0.0;
        for (size_t i = 0; i < simplex.size(); ++i) {
            diameter = std::max(diameter, (simplex[i] - simplex[best]).lpNorm<Eigen::Infinity>());
        }
        OSP_TRACE_CONVERGENCE_ITER(OSP_MODULE_NELDER_MEAD, iter, values[best], spread);

        if (std::isfinite(values[worst]) &&
            (spread < config.f_tolerance || diameter < config.x_tolerance)) {
            break;
        }

        Eigen::VectorXd centroid = Eigen::VectorXd::Zero(n);
        for (size_t i = 0; i < simplex.size(); ++i) {
            if (i != worst) centroid += simplex[i];
        }
        centroid /= static_cast<double>(n);

        // Reflection
        Eigen::VectorXd reflected = project(centroid + (centroid - simplex[worst]));
        double f_reflected = eval(reflected);

        if (f_reflected < values[best]) {
            // Expansion
            Eigen::VectorXd expanded = project(centroid + 2.0 * (centroid - simplex[worst]));
            double f_expanded = eval(expanded);
            if (f_expanded < f_reflected) {
                simplex[worst] = expanded;
                values[worst] = f_expanded;
            } else {
                simplex[worst] = reflected;
                values[worst] = f_reflected;
            }
            continue;
        }
        if (f_reflected < values[second_worst]) {
            simplex[worst] = reflected;
            values[worst] = f_reflected;
            continue;
        }

        // Contraction (outside if the reflection improved on the worst vertex)
        Eigen::VectorXd contracted = (f_reflected < values[worst])
            ? project(centroid + 0.5 * (reflected - centroid))
            : project(centroid + 0.5 * (simplex[worst] - centroid));
        double f_contracted = eval(contracted);
        if (f_contracted < std::min(f_reflected, values[worst])) {
            simplex[worst] = contracted;
            values[worst] = f_contracted;
            continue;
        }

        // Shrink towards the best vertex
        for (size_t i = 0; i < simplex.size(); ++i) {
            if (i == best) continue;
            simplex[i] = project(simplex[best] + 0.5 * (simplex[i] - simplex[best]));
            values[i] = eval(simplex[i]);
        }
    }

    size_t best = static_cast<size_t>(
        std::distance(values.begin(), std::min_element(values.begin(), values.end())));

    if (!std::isfinite(values[best])) {
        OSP_TRACE_CONVERGENCE_FAILED(OSP_MODULE_NELDER_MEAD, iter, values[best]);
        return MinimizationResult{
            .converged = false,
            .iterations = iter,
            .value = values[best],
            .failure_reason = "Objective was non-finite at every evaluated point",
            .argmin = simplex[best]
        };
    }
    if (iter >= config.max_iter) {
        OSP_TRACE_CONVERGENCE_FAILED(OSP_MODULE_NELDER_MEAD, iter, values[best]);
        return MinimizationResult{
            .converged = false,
            .iterations = iter,
            .value = values[best],
            .failure_reason = "Max iterations reached",
            .argmin = simplex[best]
        };
    }
    OSP_TRACE_CONVERGENCE_SUCCESS(OSP_MODULE_NELDER_MEAD, iter, values[best]);
    return MinimizationResult{
        .converged = true,
        .iterations = iter,
        .value = values[best],
        .failure_reason = std::nullopt,
        .argmin = simplex[best]
    };
}

}  // namespace osp
