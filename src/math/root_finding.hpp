// SPDX-License-Identifier: MIT
#pragma once

#include "osp/support/osp_trace.h"
#include <algorithm>
#include <cmath>
#include <concepts>
#include <cstddef>
#include <limits>
#include <optional>
#include <string>
#include <utility>

namespace osp {

/// Configuration for scalar root finding
struct RootFindingConfig {
    /// Maximum iterations
    size_t max_iter = 100;

    /// Absolute tolerance on |f(x)| and on the bracket width
    double tol_abs = 1e-8;
};

/// Result of a scalar root search
struct RootFindingResult {
    bool converged;
    size_t iterations;
    double final_error;
    std::optional<std::string> failure_reason;
    std::optional<double> root;
};

/// Scalar objective f: R -> R
template<typename F>
concept ObjectiveFunction = requires(F f, double x) {
    { f(x) } -> std::convertible_to<double>;
};

/// Find root using Brent's method
///
/// Combines bisection, secant and inverse quadratic interpolation.
/// Guaranteed convergence if f(a) and f(b) have opposite signs.
///
/// Used to locate the exercise boundary {x : T(k, x) = 0} of a fitted
/// timing-value surrogate in one dimension.
///
/// Reference: Brent, R. (1973). "Algorithms for Minimization without Derivatives"
template<ObjectiveFunction F>
RootFindingResult brent_find_root(F&& f, double a, double b,
                                  const RootFindingConfig& config) {
    double fa = f(a);
    double fb = f(b);

    OSP_TRACE_BRENT_START(a, b, config.tol_abs, config.max_iter);

    if (!std::isfinite(fa) || !std::isfinite(fb)) {
        return RootFindingResult{
            .converged = false,
            .iterations = 0,
            .final_error = std::numeric_limits<double>::quiet_NaN(),
            .failure_reason = "Function returned non-finite value (NaN or Inf)",
            .root = std::nullopt
        };
    }

    if (fa * fb > 0.0) {
        return RootFindingResult{
            .converged = false,
            .iterations = 0,
            .final_error = std::min(std::abs(fa), std::abs(fb)),
            .failure_reason = "Root not bracketed",
            .root = std::nullopt
        };
    }

    if (std::abs(fa) < config.tol_abs) {
        OSP_TRACE_BRENT_COMPLETE(a, 0, 1);
        return RootFindingResult{
            .converged = true, .iterations = 0, .final_error = std::abs(fa),
            .failure_reason = std::nullopt, .root = a
        };
    }
    if (std::abs(fb) < config.tol_abs) {
        OSP_TRACE_BRENT_COMPLETE(b, 0, 1);
        return RootFindingResult{
            .converged = true, .iterations = 0, .final_error = std::abs(fb),
            .failure_reason = std::nullopt, .root = b
        };
    }

    // Keep |f(b)| <= |f(a)|
    if (std::abs(fa) < std::abs(fb)) {
        std::swap(a, b);
        std::swap(fa, fb);
    }

    double c = a;
    double fc = fa;
    bool mflag = true;
    double d = 0.0;

    for (size_t iter = 0; iter < config.max_iter; ++iter) {
        [[maybe_unused]] double interval_width = std::abs(b - a);
        OSP_TRACE_BRENT_ITER(iter, b, fb, interval_width);

        if (std::abs(fb) < config.tol_abs || std::abs(b - a) < config.tol_abs) {
            OSP_TRACE_BRENT_COMPLETE(b, iter + 1, 1);
            return RootFindingResult{
                .converged = true, .iterations = iter + 1, .final_error = std::abs(fb),
                .failure_reason = std::nullopt, .root = b
            };
        }

        double s;
        if (fa != fc && fb != fc) {
            // Inverse quadratic interpolation
            s = a * fb * fc / ((fa - fb) * (fa - fc))
              + b * fa * fc / ((fb - fa) * (fb - fc))
              + c * fa * fb / ((fc - fa) * (fc - fb));
        } else {
            // Secant
            s = b - fb * (b - a) / (fb - fa);
        }

        double bisect = (3.0 * a + b) / 4.0;
        bool condition1 = !((s > bisect && s < b) || (s < bisect && s > b));
        bool condition2 = mflag && std::abs(s - b) >= std::abs(b - c) / 2.0;
        bool condition3 = !mflag && std::abs(s - b) >= std::abs(c - d) / 2.0;
        bool condition4 = mflag && std::abs(b - c) < config.tol_abs;
        bool condition5 = !mflag && std::abs(c - d) < config.tol_abs;

        if (condition1 || condition2 || condition3 || condition4 || condition5) {
            s = (a + b) / 2.0;
            mflag = true;
        } else {
            mflag = false;
        }

        double fs = f(s);
        if (!std::isfinite(fs)) {
            OSP_TRACE_BRENT_COMPLETE(s, iter + 1, 0);
            return RootFindingResult{
                .converged = false,
                .iterations = iter + 1,
                .final_error = std::numeric_limits<double>::quiet_NaN(),
                .failure_reason = "Function returned non-finite value (NaN or Inf)",
                .root = std::nullopt
            };
        }

        d = c;
        c = b;
        fc = fb;

        if (fa * fs < 0.0) {
            b = s;
            fb = fs;
        } else {
            a = s;
            fa = fs;
        }

        if (std::abs(fa) < std::abs(fb)) {
            std::swap(a, b);
            std::swap(fa, fb);
        }
    }

    OSP_TRACE_BRENT_COMPLETE(b, config.max_iter, 0);
    return RootFindingResult{
        .converged = false,
        .iterations = config.max_iter,
        .final_error = std::abs(fb),
        .failure_reason = "Max iterations reached",
        .root = b
    };
}

}  // namespace osp
