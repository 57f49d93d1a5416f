// SPDX-License-Identifier: MIT
#include "osp/regression/linear_basis_regressor.hpp"
#include "osp/support/osp_trace.h"
#include <cmath>
#include <string>

namespace osp {

PolynomialBasis::PolynomialBasis(size_t dim, size_t degree, bool payoff_term,
                                 Eigen::VectorXd center, Eigen::VectorXd scale,
                                 std::shared_ptr<const PayoffFunction> payoff)
    : dim_(dim), degree_(degree), payoff_term_(payoff_term && payoff != nullptr),
      center_(std::move(center)), scale_(std::move(scale)), payoff_(std::move(payoff)) {
    size_ = 1 + dim_ * degree_;
    if (degree_ >= 2) {
        size_ += dim_ * (dim_ - 1) / 2;
    }
    if (payoff_term_) {
        size_ += 1;
    }
}

Eigen::MatrixXd PolynomialBasis::evaluate(const StateMatrix& x) const {
    const Eigen::Index n = x.rows();
    Eigen::MatrixXd phi(n, static_cast<Eigen::Index>(size_));

    for (Eigen::Index i = 0; i < n; ++i) {
        Eigen::Index c = 0;
        phi(i, c++) = 1.0;
        for (size_t j = 0; j < dim_; ++j) {
            const auto jj = static_cast<Eigen::Index>(j);
            const double z = (x(i, jj) - center_[jj]) / scale_[jj];
            double power = 1.0;
            for (size_t p = 1; p <= degree_; ++p) {
                power *= z;
                phi(i, c++) = power;
            }
        }
        if (degree_ >= 2) {
            for (size_t a = 0; a < dim_; ++a) {
                for (size_t b = a + 1; b < dim_; ++b) {
                    const auto aa = static_cast<Eigen::Index>(a);
                    const auto bb = static_cast<Eigen::Index>(b);
                    phi(i, c++) = (x(i, aa) - center_[aa]) / scale_[aa] *
                                  ((x(i, bb) - center_[bb]) / scale_[bb]);
                }
            }
        }
        if (payoff_term_) {
            phi(i, c++) = payoff_->value(state_row(x, i));
        }
    }
    return phi;
}

Eigen::VectorXd LinearBasisSurrogate::predict_mean(const StateMatrix& x) const {
    return basis_.evaluate(x) * coefficients_;
}

Prediction LinearBasisSurrogate::predict(const StateMatrix& x) const {
    return Prediction{.mean = predict_mean(x), .variance = std::nullopt};
}

Expected<std::shared_ptr<const Surrogate>> LinearBasisRegressor::fit(const FitData& data) const {
    if (auto ok = check_fit_data(data, OSP_MODULE_LINEAR_BASIS); !ok) {
        return std::unexpected(ok.error());
    }
    const Eigen::Index n = data.inputs.rows();
    const auto d = static_cast<size_t>(data.inputs.cols());
    OSP_TRACE_ALGO_START(OSP_MODULE_LINEAR_BASIS, n, d, degree_);

    Eigen::VectorXd center = data.inputs.colwise().mean().transpose();
    Eigen::VectorXd scale(static_cast<Eigen::Index>(d));
    for (Eigen::Index j = 0; j < static_cast<Eigen::Index>(d); ++j) {
        double sd = std::sqrt((data.inputs.col(j).array() - center[j]).square().mean());
        scale[j] = sd > 0.0 ? sd : 1.0;
    }

    PolynomialBasis basis(d, degree_, payoff_basis_, std::move(center), std::move(scale), payoff_);
    if (static_cast<size_t>(n) < basis.size()) {
        OSP_TRACE_VALIDATION_ERROR(OSP_MODULE_LINEAR_BASIS,
                                   static_cast<int>(OspErrorCode::UnderdeterminedFit),
                                   static_cast<double>(n), static_cast<double>(basis.size()));
        return make_error(OspErrorCode::UnderdeterminedFit,
                          "Linear basis needs " + std::to_string(basis.size()) +
                          " unique inputs, got " + std::to_string(n));
    }

    const Eigen::VectorXd sqrt_w = data.replications.array().sqrt();
    Eigen::MatrixXd A = sqrt_w.asDiagonal() * basis.evaluate(data.inputs);
    Eigen::VectorXd b = sqrt_w.asDiagonal() * data.outputs;

    Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(A);
    if (qr.rank() < A.cols()) {
        OSP_TRACE_VALIDATION_ERROR(OSP_MODULE_LINEAR_BASIS,
                                   static_cast<int>(OspErrorCode::UnderdeterminedFit),
                                   static_cast<double>(qr.rank()), static_cast<double>(A.cols()));
        return make_error(OspErrorCode::UnderdeterminedFit,
                          "Linear basis design matrix is rank deficient (rank " +
                          std::to_string(qr.rank()) + " of " + std::to_string(A.cols()) + ")");
    }
    Eigen::VectorXd coef = qr.solve(b);
    if (!coef.allFinite()) {
        return make_error(OspErrorCode::FitFailure, "Least squares produced non-finite coefficients");
    }

    OSP_TRACE_ALGO_COMPLETE(OSP_MODULE_LINEAR_BASIS, 1, (A * coef - b).norm());
    return std::make_shared<const LinearBasisSurrogate>(std::move(basis), std::move(coef));
}

}  // namespace osp
