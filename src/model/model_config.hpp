// SPDX-License-Identifier: MIT
/**
 * @file model_config.hpp
 * @brief Strongly-typed configuration of an optimal stopping experiment
 *
 * A ModelConfig is created once per experiment and read-only afterwards.
 * Variant choices (process, payoff, regression, design) are enums that the
 * factories resolve into interface objects exactly once.
 */

#pragma once

#include "osp/model/types.hpp"
#include "osp/support/error_types.hpp"
#include <Eigen/Dense>
#include <cstddef>
#include <expected>
#include <vector>

namespace osp {

// ============================================================================
// State process
// ============================================================================

enum class ProcessType {
    GBM,    ///< Correlated geometric Brownian motion
    ExpOU   ///< Exponential Ornstein-Uhlenbeck (mean-reverting log state)
};

/// State process parameters
///
/// GBM: dXᵢ/Xᵢ = μᵢ dt + σᵢ dWᵢ with corr(dWᵢ, dWⱼ) = ρᵢⱼ
/// ExpOU: Xᵢ = exp(Yᵢ), dYᵢ = κ(θ - Yᵢ) dt + σᵢ dWᵢ
struct ProcessSpec {
    ProcessType type = ProcessType::GBM;
    std::vector<double> initial_state;  ///< x₀, defines the dimension d
    std::vector<double> drift;          ///< μᵢ (GBM only), usually r - qᵢ
    std::vector<double> volatility;     ///< σᵢ >= 0
    Eigen::MatrixXd correlation;        ///< d x d, empty for independent coordinates
    double mean_reversion = 0.0;        ///< κ (ExpOU only)
    double long_run_log_level = 0.0;    ///< θ (ExpOU only)
};

// ============================================================================
// Payoff
// ============================================================================

enum class PayoffType {
    Put,         ///< (K - x₁)⁺
    Call,        ///< (x₁ - K)⁺
    BasketPut,   ///< (K - mean(x))⁺
    BasketCall,  ///< (mean(x) - K)⁺
    MaxCall,     ///< (max(x) - K)⁺
    MinPut,      ///< (K - min(x))⁺
    DigitalPut   ///< 1{x₁ < K}
};

struct PayoffSpec {
    PayoffType type = PayoffType::Put;
    double strike = 40.0;
};

// ============================================================================
// Time discretisation
// ============================================================================

/// Exercise dates t_k = k·dt for k = 1..n_steps; step n_steps is maturity
struct TimeGrid {
    double dt = 0.04;
    size_t n_steps = 25;

    double maturity() const { return dt * static_cast<double>(n_steps); }
};

// ============================================================================
// Regression
// ============================================================================

enum class RegressionMethod {
    Spline,       ///< 1-D penalised cubic regression spline
    LinearBasis,  ///< Least squares on a polynomial basis
    GpFixed,      ///< Gaussian process with user-given hyperparameters
    GpMle,        ///< Gaussian process with maximum-likelihood hyperparameters
    HetGp         ///< Heteroskedastic GP fitted on replicated designs
};

enum class KernelFamily {
    Gaussian,  ///< Squared exponential
    Matern52   ///< Matérn ν = 5/2
};

enum class TrendType {
    Constant,  ///< Ordinary kriging
    Linear     ///< Universal kriging with trend β₀ + Σ βⱼ xⱼ
};

enum class NoiseModel {
    Estimated,      ///< Homoskedastic nugget estimated with the other hyperparameters
    FromReplicates  ///< Known noise s²(x)/r(x) from replicated simulations
};

struct GpHyperparameters {
    std::vector<double> lengthscales;  ///< One per coordinate
    double signal_variance = 1.0;
    double nugget = 0.0;               ///< Added to the diagonal on top of known noise
};

struct RegressionConfig {
    RegressionMethod method = RegressionMethod::GpMle;

    // Gaussian process
    KernelFamily kernel = KernelFamily::Matern52;
    TrendType trend = TrendType::Constant;
    NoiseModel noise = NoiseModel::FromReplicates;
    GpHyperparameters fixed;                 ///< Used by GpFixed
    std::vector<double> lengthscale_lower;   ///< MLE box, empty = derived from the inputs
    std::vector<double> lengthscale_upper;
    size_t mle_max_iter = 400;

    // Smoothing spline
    size_t spline_knots = 20;
    double spline_penalty = 1e-4;  ///< Relative weight of the roughness penalty

    // Linear basis
    size_t polynomial_degree = 2;
    bool payoff_basis = false;     ///< Append the payoff h(x) as a basis function
};

// ============================================================================
// Simulation design
// ============================================================================

enum class DesignMethod {
    FixedGrid,      ///< User-specified inputs, fixed replication
    Qmc,            ///< Sobol points restricted to the in-the-money region
    PathBased,      ///< States of forward training paths
    Sequential,     ///< Active learning by acquisition maximisation
    AdaptiveBatch   ///< Sequential design with budgeted replication allocation
};

enum class AcquisitionFunction {
    Mcu,   ///< Maximum contour uncertainty Φ(-|m|/s)
    Smcu,  ///< Straddle γ·s - |m|
    Tmse,  ///< Targeted mean squared error
    Csur   ///< Contour stepwise uncertainty reduction
};

struct DesignConfig {
    DesignMethod method = DesignMethod::FixedGrid;

    /// Lookahead window w in steps, 0 = until maturity
    size_t lookahead = 0;

    /// Replications per input (fixed/QMC/sequential), initial batch r₀ (adaptive)
    size_t replications = 100;

    // Fixed grid
    StateMatrix grid;

    // Design region: explicit box, or estimated from pilot paths when empty
    std::vector<double> lower;
    std::vector<double> upper;
    size_t pilot_paths = 2000;
    double pilot_quantile = 0.01;

    // QMC
    size_t qmc_size = 50;

    // Path-based
    size_t n_paths = 10000;

    // Sequential / adaptive batch
    size_t initial_size = 20;
    size_t target_size = 60;
    size_t candidate_pool = 200;
    size_t update_frequency = 5;
    AcquisitionFunction acquisition = AcquisitionFunction::Smcu;

    // Adaptive batch
    size_t budget = 3000;               ///< Simulations per step, hard ceiling
    size_t replication_increment = 10;  ///< r_add when replicating an existing input
    double new_point_overhead = 0.0;    ///< Extra cost charged for a new location
};

// ============================================================================
// Experiment
// ============================================================================

struct ModelConfig {
    ProcessSpec process;
    PayoffSpec payoff;
    TimeGrid time;
    double rate = 0.06;  ///< Discount rate r
    RegressionConfig regression;
    DesignConfig design;

    size_t dimension() const { return process.initial_state.size(); }

    /// Discount factor over n steps: exp(-r·dt·n)
    double discount(size_t n_steps) const;
};

/// Validate the full configuration
///
/// @return void on success, InvalidConfig describing the first inconsistency
std::expected<void, OspError> validate_model_config(const ModelConfig& config);

/// Validate process parameters alone (used by StateSimulator::create)
std::expected<void, OspError> validate_process_spec(const ProcessSpec& spec);

/// True for the regression methods that expose predictive variance
bool regression_provides_variance(RegressionMethod method);

}  // namespace osp
