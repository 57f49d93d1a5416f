// SPDX-License-Identifier: MIT
/**
 * @file smoothing_spline_regressor.hpp
 * @brief One-dimensional penalised cubic regression spline (P-spline)
 *
 * Minimises  Σᵢ rᵢ (yᵢ - f(xᵢ))² + λ ‖D₂ c‖²  over cubic B-spline
 * coefficients c on uniformly spaced clamped knots spanning the data range.
 * λ is the configured penalty scaled by trace(BᵀWB) / trace(D₂ᵀD₂) so the
 * same setting behaves alike for any replication level.
 * Outside the data range the fit is continued linearly.
 */

#pragma once

#include "osp/regression/regressor.hpp"
#include <Eigen/Dense>
#include <utility>
#include <vector>

namespace osp {

class SmoothingSplineSurrogate final : public Surrogate {
public:
    SmoothingSplineSurrogate(std::vector<double> knots, Eigen::VectorXd coefficients);

    size_t dimension() const override { return 1; }
    Prediction predict(const StateMatrix& x) const override;
    Eigen::VectorXd predict_mean(const StateMatrix& x) const override;

    /// f(x) and f'(x) inside the knot range
    std::pair<double, double> value_and_slope(double x) const;

    double lower() const { return knots_.front(); }
    double upper() const { return knots_.back(); }

private:
    double evaluate(double x) const;

    std::vector<double> knots_;
    Eigen::VectorXd coefficients_;
    double value_lo_, slope_lo_;
    double value_hi_, slope_hi_;
};

class SmoothingSplineRegressor final : public Regressor {
public:
    explicit SmoothingSplineRegressor(const RegressionConfig& config)
        : n_knots_(config.spline_knots), penalty_(config.spline_penalty) {}

    Expected<std::shared_ptr<const Surrogate>> fit(const FitData& data) const override;
    bool provides_variance() const override { return false; }
    RegressionMethod method() const override { return RegressionMethod::Spline; }

private:
    size_t n_knots_;
    double penalty_;
};

}  // namespace osp
