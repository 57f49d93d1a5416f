// SPDX-License-Identifier: MIT
/**
 * @file acquisition.hpp
 * @brief Contour-finding acquisition functions for sequential designs
 *
 * The exercise boundary is the zero contour of T̂. With posterior mean m
 * and standard deviation s at a candidate:
 *
 *   MCU   Φ(-|m| / s)
 *   SMCU  γ·s - |m|                       (straddle, γ = 1.96)
 *   tMSE  s · φ(m / s)                    (targeted MSE at the zero level)
 *   cSUR  Φ(-|m| / s) - Φ(-|m| / s_new),  s_new² = s²·τ² / (τ² + s²)
 *
 * where τ² is the noise variance of the prospective observation.
 */

#pragma once

#include "osp/model/model_config.hpp"
#include <Eigen/Dense>
#include <cstddef>
#include <optional>

namespace osp {

inline constexpr double STRADDLE_GAMMA = 1.96;

/// Standard normal CDF
double normal_cdf(double x);

/// Reduction of contour misclassification probability from one observation
///
/// @param mean Posterior mean m
/// @param variance Posterior variance s²
/// @param nugget Noise variance τ² of the new observation
double csur_reduction(double mean, double variance, double nugget);

/// Score every candidate; higher is better
///
/// @param nugget Per-candidate noise variance, required by Csur
Eigen::VectorXd acquisition_scores(AcquisitionFunction fn, const Eigen::VectorXd& mean,
                                   const Eigen::VectorXd& variance,
                                   const std::optional<Eigen::VectorXd>& nugget = std::nullopt);

/// Index of the best finite score, ties resolved to the lowest index
///
/// @return Empty when no score is finite
std::optional<size_t> best_candidate(const Eigen::VectorXd& scores);

}  // namespace osp
