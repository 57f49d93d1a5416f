// SPDX-License-Identifier: MIT
/**
 * @file het_gp_regressor.hpp
 * @brief Heteroskedastic GP for replicated designs
 *
 * Two-stage fit:
 *   1. A GP on log sample variances log s²ᵢ (known noise 2 / (rᵢ - 1), the
 *      asymptotic variance of a log sample variance) gives the smoothed
 *      per-simulation noise λ(x) = exp(mean).
 *   2. The mean GP is fitted with known noise λ(xᵢ) / rᵢ.
 *
 * The resulting surrogate reports λ(x) through noise_variance(), which the
 * adaptive batch allocator uses to price new replications.
 */

#pragma once

#include "osp/regression/gaussian_process.hpp"
#include <memory>

namespace osp {

class HetGpRegressor final : public Regressor {
public:
    explicit HetGpRegressor(RegressionConfig config) : config_(std::move(config)) {}

    Expected<std::shared_ptr<const Surrogate>> fit(const FitData& data) const override;
    Expected<std::shared_ptr<const Surrogate>> refit(const FitData& data,
                                                     const Surrogate& previous) const override;

    bool provides_variance() const override { return true; }
    RegressionMethod method() const override { return RegressionMethod::HetGp; }

private:
    Expected<std::shared_ptr<const Surrogate>> fit_impl(const FitData& data,
                                                        const GaussianProcessSurrogate* reuse) const;

    RegressionConfig config_;
};

}  // namespace osp
