// SPDX-License-Identifier: MIT
#include "osp/regression/gaussian_process.hpp"
#include "osp/math/nelder_mead.hpp"
#include "osp/regression/kernels.hpp"
#include "osp/support/osp_trace.h"
#include "osp/support/parallel.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <numbers>
#include <string>

namespace osp {

namespace {

/// Πₗ c(aₗ - bₗ; θₗ) for every pair of rows
Eigen::MatrixXd correlation_matrix(const StateMatrix& a, const StateMatrix& b,
                                   const std::vector<double>& theta, const KernelStrategy& k) {
    Eigen::MatrixXd C(a.rows(), b.rows());
    const Eigen::Index d = a.cols();
    OSP_PRAGMA_PARALLEL_FOR
    for (Eigen::Index i = 0; i < a.rows(); ++i) {
        for (Eigen::Index j = 0; j < b.rows(); ++j) {
            double c = 1.0;
            for (Eigen::Index l = 0; l < d; ++l) {
                c *= k.correlation(a(i, l) - b(j, l), theta[static_cast<size_t>(l)]);
            }
            C(i, j) = c;
        }
    }
    return C;
}

Eigen::MatrixXd trend_matrix(const StateMatrix& x, TrendType trend) {
    if (trend == TrendType::Constant) {
        return Eigen::MatrixXd::Ones(x.rows(), 1);
    }
    Eigen::MatrixXd F(x.rows(), x.cols() + 1);
    F.col(0).setOnes();
    F.rightCols(x.cols()) = x;
    return F;
}

size_t trend_size(TrendType trend, size_t d) {
    return trend == TrendType::Constant ? 1 : d + 1;
}

double population_variance(const Eigen::VectorXd& y) {
    if (y.size() < 2) return 0.0;
    return (y.array() - y.mean()).square().mean();
}

struct Factorization {
    Eigen::LLT<Eigen::MatrixXd> chol;
    Eigen::MatrixXd linv_f;
    Eigen::LLT<Eigen::MatrixXd> gls_chol;
    Eigen::VectorXd beta;
    Eigen::VectorXd alpha;
    double nll = 0.0;
};

Expected<Factorization> factorize(const StateMatrix& x, const Eigen::VectorXd& y,
                                  const GpNoise& noise, const GpHyperparameters& hyper,
                                  KernelFamily kernel, TrendType trend) {
    const Eigen::Index n = x.rows();
    const double sigma2 = hyper.signal_variance;

    Eigen::MatrixXd K = sigma2 * correlation_matrix(x, x, hyper.lengthscales, kernel_strategy(kernel));
    K.diagonal() += noise.known + hyper.nugget * noise.nugget_scale;

    // Jitter ladder for near-duplicate inputs with little noise
    Factorization f;
    double jitter = 0.0;
    bool ok = false;
    for (int attempt = 0; attempt < 7 && !ok; ++attempt) {
        if (jitter > 0.0) {
            Eigen::MatrixXd Kj = K;
            Kj.diagonal().array() += jitter;
            f.chol.compute(Kj);
        } else {
            f.chol.compute(K);
        }
        ok = f.chol.info() == Eigen::Success &&
             f.chol.matrixLLT().diagonal().allFinite() &&
             (f.chol.matrixLLT().diagonal().array() > 0.0).all();
        jitter = (jitter == 0.0) ? 1e-10 * sigma2 : jitter * 10.0;
    }
    if (!ok) {
        OSP_TRACE_RUNTIME_ERROR(OSP_MODULE_GAUSSIAN_PROCESS,
                                static_cast<int>(OspErrorCode::FitFailure), n);
        return make_error(OspErrorCode::FitFailure,
                          "GP covariance matrix is not positive definite after jitter");
    }

    const auto L = f.chol.matrixL();
    const Eigen::MatrixXd F = trend_matrix(x, trend);
    f.linv_f = L.solve(F);
    const Eigen::VectorXd linv_y = L.solve(y);

    f.gls_chol.compute(f.linv_f.transpose() * f.linv_f);
    if (f.gls_chol.info() != Eigen::Success) {
        OSP_TRACE_RUNTIME_ERROR(OSP_MODULE_GAUSSIAN_PROCESS,
                                static_cast<int>(OspErrorCode::FitFailure), n);
        return make_error(OspErrorCode::FitFailure, "GP trend coefficients are not identifiable");
    }
    f.beta = f.gls_chol.solve(f.linv_f.transpose() * linv_y);

    const Eigen::VectorXd resid = y - F * f.beta;
    f.alpha = f.chol.solve(resid);

    const double logdet = 2.0 * f.chol.matrixLLT().diagonal().array().log().sum();
    f.nll = 0.5 * (resid.dot(f.alpha) + logdet +
                   static_cast<double>(n) * std::log(2.0 * std::numbers::pi));
    if (!std::isfinite(f.nll) || !f.beta.allFinite()) {
        return make_error(OspErrorCode::FitFailure, "GP likelihood is not finite");
    }
    return f;
}

}  // namespace

// ============================================================================
// GaussianProcessSurrogate
// ============================================================================

Expected<std::shared_ptr<const GaussianProcessSurrogate>> GaussianProcessSurrogate::condition(
    const StateMatrix& inputs, const Eigen::VectorXd& outputs, const GpNoise& noise,
    const GpHyperparameters& hyper, KernelFamily kernel, TrendType trend,
    GpNoiseLevel noise_level)
{
    const auto d = static_cast<size_t>(inputs.cols());
    if (hyper.lengthscales.size() != d) {
        return make_error(OspErrorCode::InvalidConfig,
                          "GP needs one lengthscale per input coordinate");
    }
    if (static_cast<size_t>(inputs.rows()) < trend_size(trend, d) + 1) {
        OSP_TRACE_VALIDATION_ERROR(OSP_MODULE_GAUSSIAN_PROCESS,
                                   static_cast<int>(OspErrorCode::UnderdeterminedFit),
                                   static_cast<double>(inputs.rows()),
                                   static_cast<double>(trend_size(trend, d) + 1));
        return make_error(OspErrorCode::UnderdeterminedFit,
                          "GP needs more unique inputs than trend coefficients, got " +
                          std::to_string(inputs.rows()));
    }

    auto f = factorize(inputs, outputs, noise, hyper, kernel, trend);
    if (!f) {
        return std::unexpected(f.error());
    }

    std::shared_ptr<GaussianProcessSurrogate> gp(new GaussianProcessSurrogate());
    gp->inputs_ = inputs;
    gp->hyper_ = hyper;
    gp->kernel_ = kernel;
    gp->trend_ = trend;
    gp->noise_level_ = std::move(noise_level);
    gp->chol_ = std::move(f->chol);
    gp->linv_f_ = std::move(f->linv_f);
    gp->gls_chol_ = std::move(f->gls_chol);
    gp->beta_ = std::move(f->beta);
    gp->alpha_ = std::move(f->alpha);
    gp->nll_ = f->nll;
    return std::shared_ptr<const GaussianProcessSurrogate>(std::move(gp));
}

Eigen::MatrixXd GaussianProcessSurrogate::cross_covariance(const StateMatrix& x) const {
    return hyper_.signal_variance *
           correlation_matrix(x, inputs_, hyper_.lengthscales, kernel_strategy(kernel_));
}

Eigen::MatrixXd GaussianProcessSurrogate::trend_basis(const StateMatrix& x) const {
    return trend_matrix(x, trend_);
}

Eigen::VectorXd GaussianProcessSurrogate::predict_mean(const StateMatrix& x) const {
    return trend_basis(x) * beta_ + cross_covariance(x) * alpha_;
}

Prediction GaussianProcessSurrogate::predict(const StateMatrix& x) const {
    const Eigen::MatrixXd k_star = cross_covariance(x);
    const Eigen::MatrixXd F_star = trend_basis(x);

    Prediction out;
    out.mean = F_star * beta_ + k_star * alpha_;

    // V = L⁻¹k*ᵀ, U = f* - (L⁻¹F)ᵀV
    const Eigen::MatrixXd V = chol_.matrixL().solve(k_star.transpose());
    const Eigen::MatrixXd U = F_star.transpose() - linv_f_.transpose() * V;
    const Eigen::MatrixXd AinvU = gls_chol_.solve(U);

    Eigen::VectorXd var(x.rows());
    for (Eigen::Index i = 0; i < x.rows(); ++i) {
        double v = hyper_.signal_variance - V.col(i).squaredNorm() + U.col(i).dot(AinvU.col(i));
        var[i] = std::max(v, 0.0);
    }
    out.variance = std::move(var);
    return out;
}

Expected<GradientPrediction> GaussianProcessSurrogate::gradient(const StateMatrix& x,
                                                                size_t coordinate) const {
    const Eigen::Index d = inputs_.cols();
    if (x.cols() != d) {
        return make_error(OspErrorCode::InvalidConfig, "Gradient query has the wrong dimension");
    }
    if (coordinate >= static_cast<size_t>(d)) {
        return make_error(OspErrorCode::InvalidConfig,
                          "Gradient coordinate " + std::to_string(coordinate) + " out of range");
    }
    const KernelStrategy& k = kernel_strategy(kernel_);
    const auto j = static_cast<Eigen::Index>(coordinate);
    const double theta_j = hyper_.lengthscales[coordinate];
    const double sigma2 = hyper_.signal_variance;

    // ∂k(x, xᵢ)/∂xⱼ = σ² c'(hⱼ) Π_{l≠j} c(hₗ)
    Eigen::MatrixXd dk(x.rows(), inputs_.rows());
    OSP_PRAGMA_PARALLEL_FOR
    for (Eigen::Index a = 0; a < x.rows(); ++a) {
        for (Eigen::Index b = 0; b < inputs_.rows(); ++b) {
            double prod = k.d_correlation(x(a, j) - inputs_(b, j), theta_j);
            for (Eigen::Index l = 0; l < d; ++l) {
                if (l == j) continue;
                prod *= k.correlation(x(a, l) - inputs_(b, l), hyper_.lengthscales[static_cast<size_t>(l)]);
            }
            dk(a, b) = sigma2 * prod;
        }
    }

    // Trend derivative: βⱼ₊₁ for a linear trend, zero otherwise
    Eigen::MatrixXd dF = Eigen::MatrixXd::Zero(x.rows(), beta_.size());
    if (trend_ == TrendType::Linear) {
        dF.col(j + 1).setOnes();
    }

    GradientPrediction out;
    out.mean = dF * beta_ + dk * alpha_;

    const Eigen::MatrixXd V = chol_.matrixL().solve(dk.transpose());
    const Eigen::MatrixXd U = dF.transpose() - linv_f_.transpose() * V;
    const Eigen::MatrixXd AinvU = gls_chol_.solve(U);
    const double prior = sigma2 * k.derivative_variance_factor / (theta_j * theta_j);

    out.std_error.resize(x.rows());
    for (Eigen::Index i = 0; i < x.rows(); ++i) {
        double v = prior - V.col(i).squaredNorm() + U.col(i).dot(AinvU.col(i));
        out.std_error[i] = std::sqrt(std::max(v, 0.0));
    }
    return out;
}

std::optional<Eigen::VectorXd> GaussianProcessSurrogate::noise_variance(const StateMatrix& x) const {
    if (noise_level_.log_variance) {
        return noise_level_.log_variance->predict_mean(x).array().exp().matrix();
    }
    return Eigen::VectorXd::Constant(x.rows(), noise_level_.constant);
}

// ============================================================================
// Maximum likelihood
// ============================================================================

Expected<GpHyperparameters> estimate_gp_hyperparameters(
    const StateMatrix& inputs, const Eigen::VectorXd& outputs, const GpNoise& noise,
    const RegressionConfig& config, bool estimate_nugget, double fixed_nugget)
{
    const auto d = static_cast<Eigen::Index>(inputs.cols());
    const Eigen::Index n_params = d + 1 + (estimate_nugget ? 1 : 0);
    OSP_TRACE_ALGO_START(OSP_MODULE_GAUSSIAN_PROCESS, inputs.rows(), d, config.mle_max_iter);

    const double var_y = std::max(population_variance(outputs), 1e-12);

    Eigen::VectorXd lower(n_params);
    Eigen::VectorXd upper(n_params);
    Eigen::VectorXd start(n_params);
    for (Eigen::Index j = 0; j < d; ++j) {
        double range = inputs.col(j).maxCoeff() - inputs.col(j).minCoeff();
        if (!(range > 0.0)) range = 1.0;
        const auto jj = static_cast<size_t>(j);
        double lo = config.lengthscale_lower.empty() ? 0.05 * range : config.lengthscale_lower[jj];
        double hi = config.lengthscale_upper.empty() ? 10.0 * range : config.lengthscale_upper[jj];
        lower[j] = std::log(lo);
        upper[j] = std::log(hi);
        start[j] = std::clamp(std::log(0.5 * range), lower[j], upper[j]);
    }
    lower[d] = std::log(1e-4 * var_y);
    upper[d] = std::log(1e2 * var_y);
    start[d] = std::log(var_y);
    if (estimate_nugget) {
        lower[d + 1] = std::log(1e-6 * var_y);
        upper[d + 1] = std::log(10.0 * var_y);
        start[d + 1] = std::log(0.1 * var_y);
    }

    auto unpack = [&](const Eigen::VectorXd& v) {
        GpHyperparameters h;
        h.lengthscales.resize(static_cast<size_t>(d));
        for (Eigen::Index j = 0; j < d; ++j) {
            h.lengthscales[static_cast<size_t>(j)] = std::exp(v[j]);
        }
        h.signal_variance = std::exp(v[d]);
        h.nugget = estimate_nugget ? std::exp(v[d + 1]) : fixed_nugget;
        return h;
    };

    auto objective = [&](const Eigen::VectorXd& v) {
        auto f = factorize(inputs, outputs, noise, unpack(v), config.kernel, config.trend);
        return f ? f->nll : std::numeric_limits<double>::infinity();
    };

    NelderMeadConfig nm;
    nm.max_iter = config.mle_max_iter;
    MinimizationResult result = nelder_mead_minimize(objective, start, lower, upper, nm);

    if (!std::isfinite(result.value)) {
        OSP_TRACE_RUNTIME_ERROR(OSP_MODULE_GAUSSIAN_PROCESS,
                                static_cast<int>(OspErrorCode::FitFailure), inputs.rows());
        return make_error(OspErrorCode::FitFailure,
                          "GP likelihood maximisation failed: " +
                          result.failure_reason.value_or("no finite likelihood"));
    }
    OSP_TRACE_ALGO_COMPLETE(OSP_MODULE_GAUSSIAN_PROCESS, result.iterations, result.value);
    return unpack(result.argmin);
}

// ============================================================================
// GaussianProcessRegressor
// ============================================================================

Expected<std::shared_ptr<const Surrogate>> GaussianProcessRegressor::fit(const FitData& data) const {
    return fit_impl(data, nullptr);
}

Expected<std::shared_ptr<const Surrogate>> GaussianProcessRegressor::refit(
    const FitData& data, const Surrogate& previous) const
{
    const auto* gp = dynamic_cast<const GaussianProcessSurrogate*>(&previous);
    if (gp == nullptr || gp->dimension() != static_cast<size_t>(data.inputs.cols())) {
        return fit_impl(data, nullptr);
    }
    return fit_impl(data, &gp->hyperparameters());
}

Expected<std::shared_ptr<const Surrogate>> GaussianProcessRegressor::fit_impl(
    const FitData& data, const GpHyperparameters* reuse) const
{
    if (auto ok = check_fit_data(data, OSP_MODULE_GAUSSIAN_PROCESS); !ok) {
        return std::unexpected(ok.error());
    }
    const Eigen::Index n = data.inputs.rows();
    const auto d = static_cast<size_t>(data.inputs.cols());
    if (config_.method == RegressionMethod::GpFixed && config_.fixed.lengthscales.size() != d) {
        return make_error(OspErrorCode::InvalidConfig,
                          "Fixed GP hyperparameters need one lengthscale per coordinate");
    }
    if (static_cast<size_t>(n) < trend_size(config_.trend, d) + 1) {
        OSP_TRACE_VALIDATION_ERROR(OSP_MODULE_GAUSSIAN_PROCESS,
                                   static_cast<int>(OspErrorCode::UnderdeterminedFit),
                                   static_cast<double>(n), static_cast<double>(trend_size(config_.trend, d) + 1));
        return make_error(OspErrorCode::UnderdeterminedFit,
                          "GP needs more unique inputs than trend coefficients, got " + std::to_string(n));
    }

    GpNoise noise;
    noise.nugget_scale = data.replications.cwiseInverse();
    GpNoiseLevel level;
    bool estimate_nugget = false;

    if (config_.noise == NoiseModel::FromReplicates) {
        Eigen::VectorXd averaged;
        if (data.noise_variance) {
            averaged = *data.noise_variance;
        } else if (data.sample_variance) {
            averaged = data.sample_variance->cwiseQuotient(data.replications);
        } else {
            return make_error(OspErrorCode::InvalidConfig,
                              "Replicate noise model needs per-input noise variances");
        }
        const double floor = 1e-10 * std::max(population_variance(data.outputs), 1e-12);
        noise.known = averaged.cwiseMax(floor);
        level.constant = averaged.cwiseProduct(data.replications).mean();
    } else {
        noise.known = Eigen::VectorXd::Zero(n);
        estimate_nugget = (config_.method == RegressionMethod::GpMle);
    }

    GpHyperparameters hyper;
    if (reuse != nullptr) {
        hyper = *reuse;
    } else if (config_.method == RegressionMethod::GpFixed) {
        hyper = config_.fixed;
    } else {
        auto mle = estimate_gp_hyperparameters(data.inputs, data.outputs, noise, config_,
                                               estimate_nugget, config_.fixed.nugget);
        if (!mle) {
            return std::unexpected(mle.error());
        }
        hyper = std::move(*mle);
    }
    if (config_.noise == NoiseModel::Estimated) {
        level.constant = hyper.nugget;
    }

    auto gp = GaussianProcessSurrogate::condition(data.inputs, data.outputs, noise, hyper,
                                                  config_.kernel, config_.trend, std::move(level));
    if (!gp) {
        return std::unexpected(gp.error());
    }
    return std::shared_ptr<const Surrogate>(std::move(*gp));
}

}  // namespace osp
