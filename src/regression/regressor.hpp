// SPDX-License-Identifier: MIT
#pragma once

#include "osp/model/model_config.hpp"
#include "osp/model/types.hpp"
#include "osp/regression/surrogate.hpp"
#include "osp/support/error_types.hpp"
#include <Eigen/Dense>
#include <memory>
#include <optional>

namespace osp {

/// Training data at one step, one row per unique input
struct FitData {
    StateMatrix inputs;
    Eigen::VectorXd outputs;       ///< Replicate-averaged responses
    Eigen::VectorXd replications;  ///< r(x) ≥ 1, used as least-squares weights

    /// Variance of each averaged output, s²(x)/r(x)
    std::optional<Eigen::VectorXd> noise_variance;

    /// Sample variance of a single simulation, s²(x) (needs r(x) ≥ 2)
    std::optional<Eigen::VectorXd> sample_variance;

    size_t size() const { return static_cast<size_t>(inputs.rows()); }
};

/// Strategy that turns FitData into a Surrogate
class Regressor {
public:
    virtual ~Regressor() = default;

    /// Fit from scratch, including any hyperparameter estimation
    ///
    /// @return UnderdeterminedFit when the data cannot identify the model,
    ///         FitFailure on numerical breakdown
    virtual Expected<std::shared_ptr<const Surrogate>> fit(const FitData& data) const = 0;

    /// Cheap update after the design grew, reusing `previous`'s hyperparameters
    virtual Expected<std::shared_ptr<const Surrogate>> refit(const FitData& data,
                                                             const Surrogate& previous) const {
        (void)previous;
        return fit(data);
    }

    virtual bool provides_variance() const = 0;
    virtual RegressionMethod method() const = 0;
};

/// Shared validation of FitData shape
Expected<void> check_fit_data(const FitData& data, int module_id);

}  // namespace osp
