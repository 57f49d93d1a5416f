// SPDX-License-Identifier: MIT
/**
 * @file gaussian_process.hpp
 * @brief Gaussian process (kriging) surrogates of the timing value
 *
 * Model:
 *   y(x) = f(x)ᵀβ + Z(x) + ε(x),  Z ~ GP(0, σ² Πⱼ c(xⱼ - x'ⱼ; θⱼ))
 *
 * with f(x) = 1 (ordinary kriging) or f(x) = (1, x) (universal kriging).
 * The trend coefficients β are estimated by generalised least squares and
 * their uncertainty enters the predictive variance.
 *
 * Noise on observation i is  known_i + nugget / rᵢ :
 * - Estimated:      known = 0, nugget is a hyperparameter (per-simulation variance)
 * - FromReplicates: known = s²ᵢ / rᵢ from the replicate sample variance
 * - HetGp:          known = λ(xᵢ) / rᵢ with λ smoothed by a log-variance GP
 *
 * Hyperparameters are estimated by maximising the likelihood with a
 * box-constrained Nelder-Mead search in log coordinates.
 */

#pragma once

#include "osp/model/model_config.hpp"
#include "osp/regression/regressor.hpp"
#include <Eigen/Dense>
#include <memory>
#include <optional>
#include <utility>

namespace osp {

/// Observation noise split into a known part and a nugget multiplier
struct GpNoise {
    Eigen::VectorXd known;         ///< Added to the diagonal as is
    Eigen::VectorXd nugget_scale;  ///< Multiplies the nugget, usually 1 / rᵢ
};

/// Per-simulation noise level reported by noise_variance()
class GaussianProcessSurrogate;
struct GpNoiseLevel {
    double constant = 0.0;
    std::shared_ptr<const GaussianProcessSurrogate> log_variance;  ///< Overrides constant when set
};

class GaussianProcessSurrogate final : public Surrogate {
public:
    /// Condition the GP on data at fixed hyperparameters
    ///
    /// @return FitFailure if the covariance stays indefinite after jitter or
    ///         the trend is not identifiable
    static Expected<std::shared_ptr<const GaussianProcessSurrogate>> condition(
        const StateMatrix& inputs, const Eigen::VectorXd& outputs, const GpNoise& noise,
        const GpHyperparameters& hyper, KernelFamily kernel, TrendType trend,
        GpNoiseLevel noise_level = {});

    size_t dimension() const override { return static_cast<size_t>(inputs_.cols()); }
    Prediction predict(const StateMatrix& x) const override;
    Eigen::VectorXd predict_mean(const StateMatrix& x) const override;
    bool provides_variance() const override { return true; }
    Expected<GradientPrediction> gradient(const StateMatrix& x, size_t coordinate) const override;
    std::optional<Eigen::VectorXd> noise_variance(const StateMatrix& x) const override;

    const GpHyperparameters& hyperparameters() const { return hyper_; }
    KernelFamily kernel() const { return kernel_; }
    TrendType trend() const { return trend_; }
    const Eigen::VectorXd& trend_coefficients() const { return beta_; }
    const GpNoiseLevel& noise_level() const { return noise_level_; }

    /// Negative log-likelihood of the conditioning data
    double negative_log_likelihood() const { return nll_; }

private:
    GaussianProcessSurrogate() = default;

    Eigen::MatrixXd cross_covariance(const StateMatrix& x) const;
    Eigen::MatrixXd trend_basis(const StateMatrix& x) const;

    StateMatrix inputs_;
    GpHyperparameters hyper_;
    KernelFamily kernel_ = KernelFamily::Matern52;
    TrendType trend_ = TrendType::Constant;
    GpNoiseLevel noise_level_;

    Eigen::LLT<Eigen::MatrixXd> chol_;       ///< K = LLᵀ
    Eigen::MatrixXd linv_f_;                 ///< L⁻¹F
    Eigen::LLT<Eigen::MatrixXd> gls_chol_;   ///< FᵀK⁻¹F
    Eigen::VectorXd beta_;
    Eigen::VectorXd alpha_;                  ///< K⁻¹(y - Fβ)
    double nll_ = 0.0;
};

/// Maximum-likelihood hyperparameters
///
/// Box (unless overridden by lengthscale bounds in the config):
///   θⱼ ∈ [0.05, 10] · rangeⱼ,  σ² ∈ [10⁻⁴, 10²] · var(y),  nugget ∈ [10⁻⁶, 10] · var(y)
///
/// @param estimate_nugget Optimise the nugget too (otherwise it stays at fixed_nugget)
/// @return FitFailure when the likelihood is non-finite everywhere in the box
Expected<GpHyperparameters> estimate_gp_hyperparameters(
    const StateMatrix& inputs, const Eigen::VectorXd& outputs, const GpNoise& noise,
    const RegressionConfig& config, bool estimate_nugget, double fixed_nugget);

/// Kriging regressor (GpFixed or GpMle)
class GaussianProcessRegressor final : public Regressor {
public:
    explicit GaussianProcessRegressor(RegressionConfig config) : config_(std::move(config)) {}

    Expected<std::shared_ptr<const Surrogate>> fit(const FitData& data) const override;

    /// Condition on the new data with the hyperparameters of `previous`
    Expected<std::shared_ptr<const Surrogate>> refit(const FitData& data,
                                                     const Surrogate& previous) const override;

    bool provides_variance() const override { return true; }
    RegressionMethod method() const override { return config_.method; }

private:
    Expected<std::shared_ptr<const Surrogate>> fit_impl(const FitData& data,
                                                        const GpHyperparameters* reuse) const;

    RegressionConfig config_;
};

}  // namespace osp
