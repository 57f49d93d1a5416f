// SPDX-License-Identifier: MIT
/**
 * @file forward_policy.hpp
 * @brief Out-of-sample evaluation of the fitted stopping policy
 *
 * Each test path walks forward from step 1 and stops at the first step k
 * where it is in the money and T̂(k, x_k) < 0, or at maturity. The payoff
 * at the stopping step is discounted to time 0. With test paths
 * independent of every training stream the mean payoff is a low-biased
 * estimate of the option value.
 */

#pragma once

#include "osp/engine/fitted_surrogates.hpp"
#include "osp/model/model_config.hpp"
#include "osp/model/types.hpp"
#include "osp/regression/surrogate.hpp"
#include <Eigen/Dense>
#include <cstddef>
#include <vector>

namespace osp {

struct PolicyEvaluation {
    Eigen::VectorXd payoffs;            ///< Discounted to time 0, one per path
    std::vector<size_t> stopping_times; ///< Step index in 1..M

    /// Average discounted payoff
    double mean() const;

    /// Monte Carlo standard error of mean()
    double standard_error() const;
};

/// Apply the stopping rule to every test path
///
/// Deterministic: the same paths and surrogates always give identical
/// results. Only the surrogates' predictions are read.
///
/// @return InvalidConfig when the path batch does not match the time grid
///         or a surrogate for steps 1..M-1 is missing
Expected<PolicyEvaluation> evaluate_policy(const PathBatch& test_paths,
                                           const FittedSurrogates& surrogates,
                                           const ModelConfig& config);

/// Exercise boundary of a one-dimensional surrogate
///
/// Locates the zero of x -> T̂(x) in [lo, hi] with Brent's method.
///
/// @return InvalidConfig when the surrogate is not one-dimensional or the
///         timing value does not change sign on [lo, hi]
Expected<double> exercise_boundary(const Surrogate& surrogate, double lo, double hi);

}  // namespace osp
