// SPDX-License-Identifier: MIT
/**
 * @file design_generator.hpp
 * @brief Common contract of the simulation design generators
 *
 * A generator produces the design 𝒟ₖ for one backward step: the unique
 * in-the-money inputs, their replication counts and the summarised
 * pathwise responses simulated through the PathwiseResponseSampler.
 */

#pragma once

#include "osp/design/simulation_design.hpp"
#include "osp/engine/pathwise_response.hpp"
#include "osp/engine/run_context.hpp"
#include "osp/model/model_config.hpp"
#include "osp/model/payoff.hpp"
#include "osp/model/state_simulator.hpp"
#include "osp/regression/regressor.hpp"
#include <cstddef>
#include <memory>
#include <vector>

namespace osp {

/// Everything a generator may consult while building a design
struct DesignContext {
    const ModelConfig& config;
    const PayoffFunction& payoff;
    const Regressor& regressor;
    const PathwiseResponseSampler& sampler;
    RunContext& run;
    const PathBatch* training_paths = nullptr;  ///< Path-based designs
    const PathBatch* pilot_paths = nullptr;     ///< Design region estimation
};

class DesignGenerator {
public:
    virtual ~DesignGenerator() = default;

    /// Build the design of backward step `step`
    ///
    /// @return UnderdeterminedFit when no in-the-money inputs can be placed
    virtual Expected<SimulationDesign> generate(size_t step, DesignContext& ctx) const = 0;

    virtual DesignMethod method() const = 0;

    /// Path-based designs read a forward training batch
    virtual bool needs_training_paths() const { return false; }
};

/// Resolve the configured design method into a generator
Expected<std::unique_ptr<DesignGenerator>> make_design_generator(const DesignConfig& config);

/// Rows of `states` that are strictly in the money
StateMatrix in_the_money_rows(const StateMatrix& states, const PayoffFunction& payoff);

/// Simulate replications[i] lookahead responses per input and summarise them
Expected<SimulationDesign> simulate_design(size_t step, const StateMatrix& inputs,
                                           const std::vector<size_t>& replications,
                                           DesignContext& ctx);

}  // namespace osp
