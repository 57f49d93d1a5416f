// SPDX-License-Identifier: MIT
/**
 * @file surrogate.hpp
 * @brief Fitted timing-value surrogate T̂(k, ·)
 *
 * A surrogate is immutable once fitted and is shared by reference between
 * the pathwise response sampler of earlier steps and the forward policy
 * evaluator. All query methods are const and thread-safe.
 */

#pragma once

#include "osp/model/types.hpp"
#include "osp/support/error_types.hpp"
#include <Eigen/Dense>
#include <cstddef>
#include <optional>

namespace osp {

/// Point predictions with optional predictive variance
struct Prediction {
    Eigen::VectorXd mean;
    std::optional<Eigen::VectorXd> variance;  ///< Present for GP surrogates
};

/// Posterior of ∂T̂/∂xⱼ
struct GradientPrediction {
    Eigen::VectorXd mean;
    Eigen::VectorXd std_error;
};

class Surrogate {
public:
    virtual ~Surrogate() = default;

    /// Input dimension d
    virtual size_t dimension() const = 0;

    /// Mean (and variance when available) at every row of x
    virtual Prediction predict(const StateMatrix& x) const = 0;

    /// Mean only; GP surrogates skip the variance solve
    virtual Eigen::VectorXd predict_mean(const StateMatrix& x) const { return predict(x).mean; }

    virtual bool provides_variance() const { return false; }

    /// Closed-form derivative along one coordinate
    ///
    /// @return InvalidConfig for surrogates without a differentiable posterior
    virtual Expected<GradientPrediction> gradient(const StateMatrix& x, size_t coordinate) const {
        (void)x;
        (void)coordinate;
        return make_error(OspErrorCode::InvalidConfig,
                          "Surrogate does not provide closed-form gradients");
    }

    /// Estimated variance of a single simulation at each row of x
    ///
    /// Used by acquisition functions that need the noise level of a future
    /// observation. Empty when the surrogate carries no noise model.
    virtual std::optional<Eigen::VectorXd> noise_variance(const StateMatrix& x) const {
        (void)x;
        return std::nullopt;
    }
};

}  // namespace osp
