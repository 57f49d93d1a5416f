// SPDX-License-Identifier: MIT
#pragma once

#include "osp/model/payoff.hpp"
#include "osp/regression/regressor.hpp"
#include <Eigen/Dense>
#include <memory>
#include <utility>

namespace osp {

/// Polynomial basis used by LinearBasisRegressor
///
/// Inputs are standardised per coordinate before expansion:
///   1, zⱼᵖ (p = 1..degree), zᵢzⱼ (i < j, degree ≥ 2), optionally h(x)
class PolynomialBasis {
public:
    PolynomialBasis(size_t dim, size_t degree, bool payoff_term,
                    Eigen::VectorXd center, Eigen::VectorXd scale,
                    std::shared_ptr<const PayoffFunction> payoff);

    size_t size() const { return size_; }
    size_t dimension() const { return dim_; }

    /// Design matrix, one row per state
    Eigen::MatrixXd evaluate(const StateMatrix& x) const;

private:
    size_t dim_;
    size_t degree_;
    bool payoff_term_;
    size_t size_;
    Eigen::VectorXd center_;
    Eigen::VectorXd scale_;
    std::shared_ptr<const PayoffFunction> payoff_;
};

class LinearBasisSurrogate final : public Surrogate {
public:
    LinearBasisSurrogate(PolynomialBasis basis, Eigen::VectorXd coefficients)
        : basis_(std::move(basis)), coefficients_(std::move(coefficients)) {}

    size_t dimension() const override { return basis_.dimension(); }
    Prediction predict(const StateMatrix& x) const override;
    Eigen::VectorXd predict_mean(const StateMatrix& x) const override;

    const Eigen::VectorXd& coefficients() const { return coefficients_; }

private:
    PolynomialBasis basis_;
    Eigen::VectorXd coefficients_;
};

/// Weighted least squares on a polynomial basis (column-pivoting QR)
class LinearBasisRegressor final : public Regressor {
public:
    LinearBasisRegressor(const RegressionConfig& config, std::shared_ptr<const PayoffFunction> payoff)
        : degree_(config.polynomial_degree),
          payoff_basis_(config.payoff_basis),
          payoff_(std::move(payoff)) {}

    Expected<std::shared_ptr<const Surrogate>> fit(const FitData& data) const override;
    bool provides_variance() const override { return false; }
    RegressionMethod method() const override { return RegressionMethod::LinearBasis; }

private:
    size_t degree_;
    bool payoff_basis_;
    std::shared_ptr<const PayoffFunction> payoff_;
};

}  // namespace osp
