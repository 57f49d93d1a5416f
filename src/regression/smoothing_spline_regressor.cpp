// SPDX-License-Identifier: MIT
#include "osp/regression/smoothing_spline_regressor.hpp"
#include "osp/math/bspline_basis.hpp"
#include "osp/support/osp_trace.h"
#include <algorithm>
#include <string>
#include <tuple>

namespace osp {

SmoothingSplineSurrogate::SmoothingSplineSurrogate(std::vector<double> knots,
                                                   Eigen::VectorXd coefficients)
    : knots_(std::move(knots)), coefficients_(std::move(coefficients)) {
    std::tie(value_lo_, slope_lo_) = value_and_slope(knots_.front());
    std::tie(value_hi_, slope_hi_) = value_and_slope(knots_.back());
}

std::pair<double, double> SmoothingSplineSurrogate::value_and_slope(double x) const {
    x = std::clamp(x, knots_.front(), knots_.back());
    const int span = find_span_cubic(knots_, x);
    double N[4];
    double dN[4];
    cubic_basis_nonuniform(knots_, span, x, N);
    cubic_basis_derivative_nonuniform(knots_, span, x, dN);

    double value = 0.0;
    double slope = 0.0;
    for (int k = 0; k < 4; ++k) {
        const int idx = span - k;
        if (idx >= 0 && idx < coefficients_.size()) {
            value += coefficients_[idx] * N[k];
            slope += coefficients_[idx] * dN[k];
        }
    }
    return {value, slope};
}

double SmoothingSplineSurrogate::evaluate(double x) const {
    if (x < knots_.front()) {
        return value_lo_ + slope_lo_ * (x - knots_.front());
    }
    if (x > knots_.back()) {
        return value_hi_ + slope_hi_ * (x - knots_.back());
    }
    return value_and_slope(x).first;
}

Eigen::VectorXd SmoothingSplineSurrogate::predict_mean(const StateMatrix& x) const {
    Eigen::VectorXd out(x.rows());
    for (Eigen::Index i = 0; i < x.rows(); ++i) {
        out[i] = evaluate(x(i, 0));
    }
    return out;
}

Prediction SmoothingSplineSurrogate::predict(const StateMatrix& x) const {
    return Prediction{.mean = predict_mean(x), .variance = std::nullopt};
}

Expected<std::shared_ptr<const Surrogate>> SmoothingSplineRegressor::fit(const FitData& data) const {
    if (auto ok = check_fit_data(data, OSP_MODULE_SPLINE); !ok) {
        return std::unexpected(ok.error());
    }
    if (data.inputs.cols() != 1) {
        OSP_TRACE_VALIDATION_ERROR(OSP_MODULE_SPLINE, static_cast<int>(OspErrorCode::InvalidConfig),
                                   static_cast<double>(data.inputs.cols()), 1.0);
        return make_error(OspErrorCode::InvalidConfig,
                          "Smoothing spline regression supports one-dimensional inputs only");
    }

    const Eigen::Index n = data.inputs.rows();
    const double lo = data.inputs.col(0).minCoeff();
    const double hi = data.inputs.col(0).maxCoeff();
    std::vector<double> knots = clamped_uniform_knots_cubic(lo, hi, n_knots_);
    const auto m = static_cast<Eigen::Index>(cubic_basis_count(knots));
    OSP_TRACE_ALGO_START(OSP_MODULE_SPLINE, n, m, penalty_);

    if (!(hi > lo) || n < m) {
        OSP_TRACE_VALIDATION_ERROR(OSP_MODULE_SPLINE,
                                   static_cast<int>(OspErrorCode::UnderdeterminedFit),
                                   static_cast<double>(n), static_cast<double>(m));
        return make_error(OspErrorCode::UnderdeterminedFit,
                          "Smoothing spline with " + std::to_string(m) +
                          " basis functions needs that many distinct inputs, got " +
                          std::to_string(n));
    }

    // Normal equations of the weighted, penalised least-squares problem
    Eigen::MatrixXd BtWB = Eigen::MatrixXd::Zero(m, m);
    Eigen::VectorXd BtWy = Eigen::VectorXd::Zero(m);
    for (Eigen::Index i = 0; i < n; ++i) {
        const double x = data.inputs(i, 0);
        const double w = data.replications[i];
        const int span = find_span_cubic(knots, x);
        double N[4];
        cubic_basis_nonuniform(knots, span, x, N);
        for (int a = 0; a < 4; ++a) {
            const int ia = span - a;
            if (ia < 0 || ia >= m) continue;
            BtWy[ia] += w * N[a] * data.outputs[i];
            for (int b = 0; b < 4; ++b) {
                const int ib = span - b;
                if (ib < 0 || ib >= m) continue;
                BtWB(ia, ib) += w * N[a] * N[b];
            }
        }
    }

    Eigen::MatrixXd D = Eigen::MatrixXd::Zero(m - 2, m);
    for (Eigen::Index r = 0; r < m - 2; ++r) {
        D(r, r) = 1.0;
        D(r, r + 1) = -2.0;
        D(r, r + 2) = 1.0;
    }
    const Eigen::MatrixXd DtD = D.transpose() * D;
    const double lambda = penalty_ * BtWB.trace() / DtD.trace();

    Eigen::LDLT<Eigen::MatrixXd> ldlt(BtWB + lambda * DtD);
    if (ldlt.info() != Eigen::Success) {
        OSP_TRACE_RUNTIME_ERROR(OSP_MODULE_SPLINE, static_cast<int>(OspErrorCode::FitFailure), m);
        return make_error(OspErrorCode::FitFailure, "Spline normal equations are singular");
    }
    Eigen::VectorXd coef = ldlt.solve(BtWy);
    if (!coef.allFinite()) {
        OSP_TRACE_RUNTIME_ERROR(OSP_MODULE_SPLINE, static_cast<int>(OspErrorCode::FitFailure), m);
        return make_error(OspErrorCode::FitFailure, "Spline fit produced non-finite coefficients");
    }

    OSP_TRACE_ALGO_COMPLETE(OSP_MODULE_SPLINE, 1, lambda);
    return std::make_shared<const SmoothingSplineSurrogate>(std::move(knots), std::move(coef));
}

}  // namespace osp
