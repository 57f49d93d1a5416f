// SPDX-License-Identifier: MIT
#pragma once

#include "osp/design/design_generator.hpp"

namespace osp {

/// User-specified inputs, each replicated `replications` times
///
/// Grid points out of the money at a step are dropped for that step.
class FixedGridDesign final : public DesignGenerator {
public:
    Expected<SimulationDesign> generate(size_t step, DesignContext& ctx) const override;
    DesignMethod method() const override { return DesignMethod::FixedGrid; }
};

/// Inputs are the in-the-money states of a forward training batch at the step
///
/// The paths double as the design: one lookahead per state, no replication.
class PathDesign final : public DesignGenerator {
public:
    Expected<SimulationDesign> generate(size_t step, DesignContext& ctx) const override;
    DesignMethod method() const override { return DesignMethod::PathBased; }
    bool needs_training_paths() const override { return true; }
};

}  // namespace osp
