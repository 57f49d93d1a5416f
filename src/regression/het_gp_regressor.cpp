// SPDX-License-Identifier: MIT
#include "osp/regression/het_gp_regressor.hpp"
#include "osp/support/osp_trace.h"
#include <cmath>
#include <string>
#include <vector>

namespace osp {

Expected<std::shared_ptr<const Surrogate>> HetGpRegressor::fit(const FitData& data) const {
    return fit_impl(data, nullptr);
}

Expected<std::shared_ptr<const Surrogate>> HetGpRegressor::refit(const FitData& data,
                                                                 const Surrogate& previous) const {
    const auto* gp = dynamic_cast<const GaussianProcessSurrogate*>(&previous);
    if (gp == nullptr || !gp->noise_level().log_variance ||
        gp->dimension() != static_cast<size_t>(data.inputs.cols())) {
        return fit_impl(data, nullptr);
    }
    return fit_impl(data, gp);
}

Expected<std::shared_ptr<const Surrogate>> HetGpRegressor::fit_impl(
    const FitData& data, const GaussianProcessSurrogate* reuse) const
{
    if (auto ok = check_fit_data(data, OSP_MODULE_GAUSSIAN_PROCESS); !ok) {
        return std::unexpected(ok.error());
    }
    if (!data.sample_variance) {
        return make_error(OspErrorCode::InvalidConfig,
                          "Heteroskedastic GP needs per-input sample variances");
    }
    const Eigen::Index n = data.inputs.rows();
    const Eigen::Index d = data.inputs.cols();

    // Stage 1: log-variance GP on the inputs with usable replicate variance
    std::vector<Eigen::Index> usable;
    for (Eigen::Index i = 0; i < n; ++i) {
        if (data.replications[i] >= 2.0 && (*data.sample_variance)[i] > 0.0) {
            usable.push_back(i);
        }
    }
    const auto m = static_cast<Eigen::Index>(usable.size());
    if (m < 3) {
        OSP_TRACE_VALIDATION_ERROR(OSP_MODULE_GAUSSIAN_PROCESS,
                                   static_cast<int>(OspErrorCode::UnderdeterminedFit),
                                   static_cast<double>(m), 3.0);
        return make_error(OspErrorCode::UnderdeterminedFit,
                          "Heteroskedastic GP needs at least 3 inputs with 2 or more replications, got " +
                          std::to_string(m));
    }

    StateMatrix var_inputs(m, d);
    Eigen::VectorXd log_var(m);
    GpNoise var_noise{Eigen::VectorXd(m), Eigen::VectorXd::Ones(m)};
    for (Eigen::Index k = 0; k < m; ++k) {
        const Eigen::Index i = usable[static_cast<size_t>(k)];
        var_inputs.row(k) = data.inputs.row(i);
        log_var[k] = std::log((*data.sample_variance)[i]);
        var_noise.known[k] = 2.0 / (data.replications[i] - 1.0);
    }

    RegressionConfig var_config = config_;
    var_config.trend = TrendType::Constant;

    GpHyperparameters var_hyper;
    if (reuse != nullptr) {
        var_hyper = reuse->noise_level().log_variance->hyperparameters();
    } else {
        auto mle = estimate_gp_hyperparameters(var_inputs, log_var, var_noise, var_config, false, 0.0);
        if (!mle) {
            return std::unexpected(mle.error());
        }
        var_hyper = std::move(*mle);
    }
    auto variance_gp = GaussianProcessSurrogate::condition(var_inputs, log_var, var_noise, var_hyper,
                                                           var_config.kernel, TrendType::Constant);
    if (!variance_gp) {
        return std::unexpected(variance_gp.error());
    }

    // Stage 2: mean GP with smoothed noise λ(xᵢ) / rᵢ
    const Eigen::VectorXd lambda = (*variance_gp)->predict_mean(data.inputs).array().exp();
    GpNoise noise{lambda.cwiseQuotient(data.replications), data.replications.cwiseInverse()};

    GpHyperparameters hyper;
    if (reuse != nullptr) {
        hyper = reuse->hyperparameters();
    } else {
        auto mle = estimate_gp_hyperparameters(data.inputs, data.outputs, noise, config_, false, 0.0);
        if (!mle) {
            return std::unexpected(mle.error());
        }
        hyper = std::move(*mle);
    }

    GpNoiseLevel level;
    level.log_variance = *variance_gp;
    auto gp = GaussianProcessSurrogate::condition(data.inputs, data.outputs, noise, hyper,
                                                  config_.kernel, config_.trend, std::move(level));
    if (!gp) {
        return std::unexpected(gp.error());
    }
    return std::shared_ptr<const Surrogate>(std::move(*gp));
}

}  // namespace osp
