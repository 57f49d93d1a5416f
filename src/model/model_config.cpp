// SPDX-License-Identifier: MIT
#include "osp/model/model_config.hpp"
#include "osp/support/osp_trace.h"
#include <cmath>
#include <string>

namespace osp {

namespace {

std::unexpected<OspError> invalid(std::string message, double value = 0.0, double expected = 0.0) {
    OSP_TRACE_VALIDATION_ERROR(OSP_MODULE_SIMULATOR,
                               static_cast<int>(OspErrorCode::InvalidConfig), value, expected);
    return make_error(OspErrorCode::InvalidConfig, std::move(message));
}

bool all_finite(const std::vector<double>& v) {
    for (double x : v) {
        if (!std::isfinite(x)) return false;
    }
    return true;
}

std::expected<void, OspError> validate_box(const std::vector<double>& lower,
                                           const std::vector<double>& upper,
                                           size_t d, const char* what) {
    if (lower.empty() && upper.empty()) {
        return {};
    }
    if (lower.size() != d || upper.size() != d) {
        return invalid(std::string(what) + " bounds must both have one entry per coordinate",
                       static_cast<double>(lower.size()), static_cast<double>(d));
    }
    for (size_t j = 0; j < d; ++j) {
        if (!std::isfinite(lower[j]) || !std::isfinite(upper[j]) || !(lower[j] < upper[j])) {
            return invalid(std::string(what) + " bounds must satisfy lower < upper in coordinate "
                           + std::to_string(j), lower[j], upper[j]);
        }
    }
    return {};
}

std::expected<void, OspError> validate_regression(const RegressionConfig& reg, size_t d) {
    switch (reg.method) {
        case RegressionMethod::Spline:
            if (d != 1) {
                return invalid("Smoothing spline regression requires a one-dimensional state",
                               static_cast<double>(d), 1.0);
            }
            if (reg.spline_knots < 2) {
                return invalid("Smoothing spline needs at least 2 knots",
                               static_cast<double>(reg.spline_knots), 2.0);
            }
            if (!(reg.spline_penalty >= 0.0) || !std::isfinite(reg.spline_penalty)) {
                return invalid("Spline penalty must be finite and non-negative", reg.spline_penalty);
            }
            break;
        case RegressionMethod::LinearBasis:
            if (reg.polynomial_degree < 1) {
                return invalid("Linear basis regression needs polynomial degree >= 1");
            }
            break;
        case RegressionMethod::GpFixed:
            if (reg.fixed.lengthscales.size() != d) {
                return invalid("Fixed GP hyperparameters need one lengthscale per coordinate",
                               static_cast<double>(reg.fixed.lengthscales.size()),
                               static_cast<double>(d));
            }
            for (double theta : reg.fixed.lengthscales) {
                if (!(theta > 0.0) || !std::isfinite(theta)) {
                    return invalid("GP lengthscales must be positive and finite", theta);
                }
            }
            if (!(reg.fixed.signal_variance > 0.0) || !std::isfinite(reg.fixed.signal_variance)) {
                return invalid("GP signal variance must be positive", reg.fixed.signal_variance);
            }
            if (!(reg.fixed.nugget >= 0.0) || !std::isfinite(reg.fixed.nugget)) {
                return invalid("GP nugget must be non-negative", reg.fixed.nugget);
            }
            break;
        case RegressionMethod::GpMle:
        case RegressionMethod::HetGp:
            if (reg.mle_max_iter == 0) {
                return invalid("GP maximum likelihood needs mle_max_iter >= 1");
            }
            if (auto box = validate_box(reg.lengthscale_lower, reg.lengthscale_upper, d, "Lengthscale");
                !box) {
                return box;
            }
            for (double lo : reg.lengthscale_lower) {
                if (!(lo > 0.0)) {
                    return invalid("Lengthscale lower bounds must be positive", lo);
                }
            }
            break;
    }
    return {};
}

std::expected<void, OspError> validate_design(const DesignConfig& design,
                                              const RegressionConfig& reg,
                                              const TimeGrid& time, size_t d) {
    if (design.lookahead > time.n_steps) {
        return invalid("Lookahead window exceeds the number of time steps",
                       static_cast<double>(design.lookahead), static_cast<double>(time.n_steps));
    }
    if (design.replications == 0) {
        return invalid("Replication count must be at least 1");
    }
    if (auto box = validate_box(design.lower, design.upper, d, "Design region"); !box) {
        return box;
    }
    if (design.lower.empty() && design.pilot_paths == 0 &&
        design.method != DesignMethod::FixedGrid && design.method != DesignMethod::PathBased) {
        return invalid("Design region needs explicit bounds or pilot paths");
    }
    if (!(design.pilot_quantile >= 0.0 && design.pilot_quantile < 0.5)) {
        return invalid("Pilot quantile must lie in [0, 0.5)", design.pilot_quantile);
    }

    const bool gp_from_replicates =
        (reg.method == RegressionMethod::GpFixed || reg.method == RegressionMethod::GpMle) &&
        reg.noise == NoiseModel::FromReplicates;

    switch (design.method) {
        case DesignMethod::FixedGrid:
            if (design.grid.rows() == 0 || static_cast<size_t>(design.grid.cols()) != d) {
                return invalid("Fixed grid design must be a non-empty matrix with d columns",
                               static_cast<double>(design.grid.cols()), static_cast<double>(d));
            }
            if (!design.grid.allFinite()) {
                return invalid("Fixed grid design contains non-finite inputs");
            }
            break;
        case DesignMethod::Qmc:
            if (design.qmc_size == 0) {
                return invalid("QMC design size must be at least 1");
            }
            break;
        case DesignMethod::PathBased:
            if (design.n_paths == 0) {
                return invalid("Path-based design needs at least one training path");
            }
            if (gp_from_replicates || reg.method == RegressionMethod::HetGp) {
                return invalid("Path-based designs have one simulation per input; "
                               "use an estimated nugget instead of replicate noise");
            }
            break;
        case DesignMethod::Sequential:
        case DesignMethod::AdaptiveBatch:
            if (!regression_provides_variance(reg.method)) {
                return invalid("Sequential designs need a regression with predictive variance");
            }
            if (design.initial_size == 0 || design.target_size < design.initial_size) {
                return invalid("Sequential design needs 1 <= initial_size <= target_size",
                               static_cast<double>(design.initial_size),
                               static_cast<double>(design.target_size));
            }
            if (design.candidate_pool == 0 || design.update_frequency == 0) {
                return invalid("Candidate pool and update frequency must be at least 1");
            }
            if (design.method == DesignMethod::AdaptiveBatch) {
                if (design.replication_increment == 0) {
                    return invalid("Replication increment must be at least 1");
                }
                if (design.budget < design.initial_size * design.replications) {
                    return invalid("Simulation budget is smaller than the initial design",
                                   static_cast<double>(design.budget),
                                   static_cast<double>(design.initial_size * design.replications));
                }
                if (!(design.new_point_overhead >= 0.0)) {
                    return invalid("New point overhead must be non-negative", design.new_point_overhead);
                }
            }
            break;
    }

    if ((gp_from_replicates || reg.method == RegressionMethod::HetGp) && design.replications < 2) {
        return invalid("Replicate-based noise estimates need at least 2 replications per input",
                       static_cast<double>(design.replications), 2.0);
    }
    return {};
}

}  // namespace

double ModelConfig::discount(size_t n) const {
    return std::exp(-rate * time.dt * static_cast<double>(n));
}

bool regression_provides_variance(RegressionMethod method) {
    return method == RegressionMethod::GpFixed ||
           method == RegressionMethod::GpMle ||
           method == RegressionMethod::HetGp;
}

std::expected<void, OspError> validate_process_spec(const ProcessSpec& spec) {
    const size_t d = spec.initial_state.size();
    if (d == 0) {
        return invalid("State dimension must be at least 1");
    }
    if (spec.volatility.size() != d) {
        return invalid("Volatility vector length does not match the state dimension",
                       static_cast<double>(spec.volatility.size()), static_cast<double>(d));
    }
    if (spec.type == ProcessType::GBM && spec.drift.size() != d) {
        return invalid("Drift vector length does not match the state dimension",
                       static_cast<double>(spec.drift.size()), static_cast<double>(d));
    }
    if (!all_finite(spec.initial_state) || !all_finite(spec.drift) || !all_finite(spec.volatility)) {
        return invalid("Process parameters must be finite");
    }
    for (size_t j = 0; j < d; ++j) {
        if (!(spec.initial_state[j] > 0.0)) {
            return invalid("Initial state must be positive", spec.initial_state[j]);
        }
        if (spec.volatility[j] < 0.0) {
            return invalid("Volatility must be non-negative", spec.volatility[j]);
        }
    }
    if (spec.correlation.size() != 0) {
        if (static_cast<size_t>(spec.correlation.rows()) != d ||
            static_cast<size_t>(spec.correlation.cols()) != d) {
            return invalid("Correlation matrix must be d x d",
                           static_cast<double>(spec.correlation.rows()), static_cast<double>(d));
        }
        for (size_t i = 0; i < d; ++i) {
            const auto ii = static_cast<Eigen::Index>(i);
            if (std::abs(spec.correlation(ii, ii) - 1.0) > 1e-12) {
                return invalid("Correlation matrix must have a unit diagonal", spec.correlation(ii, ii));
            }
            for (size_t j = 0; j < i; ++j) {
                const auto jj = static_cast<Eigen::Index>(j);
                double rho = spec.correlation(ii, jj);
                if (std::abs(rho - spec.correlation(jj, ii)) > 1e-12 || !(std::abs(rho) <= 1.0)) {
                    return invalid("Correlation matrix must be symmetric with entries in [-1, 1]", rho);
                }
            }
        }
    }
    if (spec.type == ProcessType::ExpOU &&
        (!(spec.mean_reversion > 0.0) || !std::isfinite(spec.long_run_log_level))) {
        return invalid("Exponential OU needs a positive mean-reversion speed", spec.mean_reversion);
    }
    return {};
}

std::expected<void, OspError> validate_model_config(const ModelConfig& config) {
    if (auto process = validate_process_spec(config.process); !process) {
        return process;
    }
    const size_t d = config.dimension();

    if (!(config.payoff.strike > 0.0) || !std::isfinite(config.payoff.strike)) {
        return invalid("Strike must be positive and finite", config.payoff.strike);
    }
    if ((config.payoff.type == PayoffType::Put || config.payoff.type == PayoffType::Call ||
         config.payoff.type == PayoffType::DigitalPut) && d != 1) {
        return invalid("Single-asset payoffs require a one-dimensional state", static_cast<double>(d), 1.0);
    }
    if (!(config.time.dt > 0.0) || !std::isfinite(config.time.dt)) {
        return invalid("Time step must be positive", config.time.dt);
    }
    if (config.time.n_steps < 2) {
        return invalid("At least two exercise dates are required",
                       static_cast<double>(config.time.n_steps), 2.0);
    }
    if (!std::isfinite(config.rate)) {
        return invalid("Discount rate must be finite", config.rate);
    }
    if (auto reg = validate_regression(config.regression, d); !reg) {
        return reg;
    }
    return validate_design(config.design, config.regression, config.time, d);
}

}  // namespace osp
