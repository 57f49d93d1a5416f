// SPDX-License-Identifier: MIT
#include "osp/regression/regressor_factory.hpp"
#include "osp/regression/gaussian_process.hpp"
#include "osp/regression/het_gp_regressor.hpp"
#include "osp/regression/linear_basis_regressor.hpp"
#include "osp/regression/smoothing_spline_regressor.hpp"

namespace osp {

Expected<std::unique_ptr<Regressor>> make_regressor(const RegressionConfig& config,
                                                    std::shared_ptr<const PayoffFunction> payoff) {
    switch (config.method) {
        case RegressionMethod::Spline:
            if (config.spline_knots < 2) {
                return make_error(OspErrorCode::InvalidConfig, "Smoothing spline needs at least 2 knots");
            }
            return std::make_unique<SmoothingSplineRegressor>(config);
        case RegressionMethod::LinearBasis:
            if (config.polynomial_degree < 1) {
                return make_error(OspErrorCode::InvalidConfig, "Polynomial degree must be at least 1");
            }
            if (config.payoff_basis && payoff == nullptr) {
                return make_error(OspErrorCode::InvalidConfig, "Payoff basis requested without a payoff");
            }
            return std::make_unique<LinearBasisRegressor>(config, std::move(payoff));
        case RegressionMethod::GpFixed:
        case RegressionMethod::GpMle:
            return std::make_unique<GaussianProcessRegressor>(config);
        case RegressionMethod::HetGp:
            return std::make_unique<HetGpRegressor>(config);
    }
    return make_error(OspErrorCode::InvalidConfig, "Unknown regression method");
}

}  // namespace osp
