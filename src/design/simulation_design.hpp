// SPDX-License-Identifier: MIT
#pragma once

#include "osp/model/types.hpp"
#include "osp/regression/regressor.hpp"
#include <Eigen/Dense>
#include <cstddef>
#include <span>
#include <vector>

namespace osp {

/// Simulation design 𝒟ₖ with replicate-averaged responses
///
/// Every input lies in the in-the-money region of its step.
struct SimulationDesign {
    StateMatrix inputs;                ///< Unique locations, one per row
    std::vector<size_t> replications;  ///< r(x) >= 1
    Eigen::VectorXd mean_response;     ///< Replicate average ȳ(x)
    Eigen::VectorXd sample_variance;   ///< s²(x) (denominator r - 1), 0 when r = 1
    bool budget_exhausted = false;     ///< Set by the adaptive allocator

    size_t size() const { return static_cast<size_t>(inputs.rows()); }

    /// Σ r(x)
    size_t total_simulations() const;

    /// Regression inputs; noise variances are attached when every r(x) >= 2
    FitData to_fit_data() const;

    /// Append a location with its raw responses
    void add_input(std::span<const double> x, const Eigen::Ref<const Eigen::VectorXd>& responses);
};

/// Summarise raw responses (input-major, replications[i] per row) into a design
SimulationDesign make_design(const StateMatrix& inputs, const std::vector<size_t>& replications,
                             const Eigen::VectorXd& responses);

/// Fold extra replicates into input `index`
///
/// Mean and variance are combined with the pairwise update of Chan et al.,
/// so the result equals summarising all responses at once.
void merge_replicates(SimulationDesign& design, size_t index,
                      const Eigen::Ref<const Eigen::VectorXd>& responses);

}  // namespace osp
