// SPDX-License-Identifier: MIT
/**
 * @file bspline_basis.hpp
 * @brief Cubic B-spline basis evaluation for regression splines
 *
 * Provides:
 * - Clamped knot vectors with uniformly spaced interior knots
 * - Knot span search (binary search)
 * - Cox-de Boor basis recursion (degree p=3) and first derivatives
 *
 * References:
 * - de Boor, "A Practical Guide to Splines" (2001)
 * - Eilers & Marx, "Flexible smoothing with B-splines and penalties" (1996)
 */

#pragma once

#include <algorithm>
#include <cmath>
#include <concepts>
#include <cstddef>
#include <vector>

namespace osp {

/// Create a clamped cubic knot vector with `n_knots` uniform breakpoints on [lo, hi]
///
/// Breakpoints include both ends, so there are n_knots - 2 interior knots and
/// the spline space has n_knots + 2 basis functions:
///   [lo, lo, lo, lo, t₁, ..., t_{n_knots-2}, hi, hi, hi, hi]
///
/// @param lo Left end of the data range
/// @param hi Right end of the data range (must exceed lo)
/// @param n_knots Number of breakpoints (>= 2)
/// @return Knot vector of size n_knots + 6
template<std::floating_point T>
[[nodiscard]] std::vector<T> clamped_uniform_knots_cubic(T lo, T hi, size_t n_knots) {
    const size_t interior = n_knots >= 2 ? n_knots - 2 : 0;
    std::vector<T> t;
    t.reserve(interior + 8);

    t.insert(t.end(), 4, lo);
    for (size_t k = 1; k <= interior; ++k) {
        const T ratio = static_cast<T>(k) / static_cast<T>(interior + 1);
        t.push_back(lo + ratio * (hi - lo));
    }
    t.insert(t.end(), 4, hi);
    return t;
}

/// Number of cubic basis functions spanned by a clamped knot vector
template<std::floating_point T>
[[nodiscard]] size_t cubic_basis_count(const std::vector<T>& t) noexcept {
    return t.size() >= 4 ? t.size() - 4 : 0;
}

/// Find knot span containing x using binary search
///
/// Returns index i such that t[i] ≤ x < t[i+1], clamped to the valid range
/// [3, n_ctrl - 1] so boundary points use the first/last span.
template<std::floating_point T>
[[nodiscard]] int find_span_cubic(const std::vector<T>& t, T x) noexcept {
    constexpr int DEGREE = 3;
    const int n_ctrl = static_cast<int>(t.size()) - DEGREE - 1;
    const int min_span = DEGREE;
    const int max_span = std::max(min_span, n_ctrl - 1);

    if (x <= t[min_span]) {
        return min_span;
    }
    if (x >= t[n_ctrl]) {
        return max_span;
    }

    auto it = std::upper_bound(t.begin() + min_span, t.begin() + n_ctrl + 1, x);
    int i = static_cast<int>(std::distance(t.begin(), it)) - 1;
    return std::clamp(i, min_span, max_span);
}

namespace detail {

/// Degree 0..2 Cox-de Boor tables for the 4 functions touching span i
///
/// Output ordering is N[k] = B_{i-k}.
template<std::floating_point T>
void cubic_lower_degree_tables(const std::vector<T>& t, int i, T x,
                               T N1[4], T N2[4]) noexcept {
    const int n = static_cast<int>(t.size());

    T N0[4] = {T{0}, T{0}, T{0}, T{0}};
    for (int k = 0; k < 4; ++k) {
        const int idx = i - k;
        if (idx >= 0 && idx + 1 < n) {
            N0[k] = (t[idx] <= x && x < t[idx + 1]) ? T{1} : T{0};
        }
    }
    // Right boundary belongs to the last non-degenerate span
    if (x >= t[static_cast<size_t>(n - 4)]) {
        N0[0] = T{1};
    }

    for (int k = 0; k < 4; ++k) {
        N1[k] = T{0};
        const int idx = i - k;
        if (idx >= 0 && idx + 2 < n) {
            const T leftDen  = t[idx + 1] - t[idx];
            const T rightDen = t[idx + 2] - t[idx + 1];
            const T left  = (leftDen > T{0}) ? (x - t[idx]) / leftDen * N0[k] : T{0};
            const T right = (rightDen > T{0} && k > 0) ?
                            (t[idx + 2] - x) / rightDen * N0[k - 1] : T{0};
            N1[k] = left + right;
        }
    }

    for (int k = 0; k < 4; ++k) {
        N2[k] = T{0};
        const int idx = i - k;
        if (idx >= 0 && idx + 3 < n) {
            const T leftDen  = t[idx + 2] - t[idx];
            const T rightDen = t[idx + 3] - t[idx + 1];
            const T left  = (leftDen > T{0}) ? (x - t[idx]) / leftDen * N1[k] : T{0};
            const T right = (rightDen > T{0} && k > 0) ?
                            (t[idx + 3] - x) / rightDen * N1[k - 1] : T{0};
            N2[k] = left + right;
        }
    }
}

}  // namespace detail

/// Evaluate the 4 nonzero cubic B-spline basis functions at x for span i
///
/// **Output ordering:** N[0] = Bᵢ(x), N[1] = Bᵢ₋₁(x), N[2] = Bᵢ₋₂(x), N[3] = Bᵢ₋₃(x)
template<std::floating_point T>
void cubic_basis_nonuniform(const std::vector<T>& t, int i, T x, T N[4]) noexcept {
    const int n = static_cast<int>(t.size());
    T N1[4];
    T N2[4];
    detail::cubic_lower_degree_tables(t, i, x, N1, N2);

    for (int k = 0; k < 4; ++k) {
        const int idx = i - k;
        if (idx >= 0 && idx + 4 < n) {
            const T leftDen  = t[idx + 3] - t[idx];
            const T rightDen = t[idx + 4] - t[idx + 1];
            const T left  = (leftDen > T{0}) ? (x - t[idx]) / leftDen * N2[k] : T{0};
            const T right = (rightDen > T{0} && k > 0) ?
                            (t[idx + 4] - x) / rightDen * N2[k - 1] : T{0};
            N[k] = left + right;
        } else {
            N[k] = T{0};
        }
    }
}

/// Evaluate first derivatives of the 4 nonzero cubic basis functions
///
///   B'ᵢ,₃(x) = 3/(tᵢ₊₃ - tᵢ) · Bᵢ,₂(x) - 3/(tᵢ₊₄ - tᵢ₊₁) · Bᵢ₊₁,₂(x)
template<std::floating_point T>
void cubic_basis_derivative_nonuniform(const std::vector<T>& t, int i, T x, T dN[4]) noexcept {
    const int n = static_cast<int>(t.size());
    T N1[4];
    T N2[4];
    detail::cubic_lower_degree_tables(t, i, x, N1, N2);

    constexpr T p = T{3};
    for (int k = 0; k < 4; ++k) {
        const int idx = i - k;
        if (idx >= 0 && idx + 4 < n) {
            const T leftDen  = t[idx + 3] - t[idx];
            const T rightDen = t[idx + 4] - t[idx + 1];
            const T left  = (leftDen > T{0}) ? (p / leftDen) * N2[k] : T{0};
            const T right = (rightDen > T{0} && k > 0) ? (p / rightDen) * N2[k - 1] : T{0};
            dN[k] = left - right;
        } else {
            dN[k] = T{0};
        }
    }
}

}  // namespace osp
