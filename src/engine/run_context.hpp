// SPDX-License-Identifier: MIT
/**
 * @file run_context.hpp
 * @brief Per-run mutable state threaded through the engine and designs
 *
 * A RunContext owns the master seed and the diagnostics accumulated while
 * an induction runs. Random streams are never shared: every consumer
 * derives its own engine from (seed, purpose, step, batch, row), so
 * training and test paths can never coincide and parallel loops give the
 * same result for any thread count.
 */

#pragma once

#include "osp/model/types.hpp"
#include <cstddef>
#include <cstdint>
#include <random>
#include <utility>
#include <vector>

namespace osp {

/// Independent random stream families
enum class StreamPurpose : uint32_t {
    TrainingPaths = 1,  ///< Forward paths of path-based designs
    TestPaths = 2,      ///< Out-of-sample policy evaluation
    Pilot = 3,          ///< Pilot paths for the design region
    Design = 4,         ///< Random design placement
    Lookahead = 5,      ///< Pathwise response simulation
    CandidatePool = 6   ///< Acquisition candidate pools
};

/// Diagnostics recorded for one backward step
struct StepDiagnostics {
    size_t step = 0;
    double elapsed_seconds = 0.0;
    size_t n_unique = 0;
    size_t total_simulations = 0;
    std::vector<size_t> replications;  ///< Per unique input
    StateMatrix inputs;                ///< Unique design inputs
    bool budget_exhausted = false;     ///< Adaptive allocator hit its budget first
};

/// Engine seeded from a hashed tuple of stream coordinates
std::mt19937_64 make_stream(uint64_t seed, StreamPurpose purpose,
                            uint64_t step = 0, uint64_t batch = 0, uint64_t row = 0);

class RunContext {
public:
    explicit RunContext(uint64_t seed = 20240917ULL) : seed_(seed) {}

    uint64_t seed() const { return seed_; }

    /// Engine for (purpose, step, batch, row) under this run's seed
    std::mt19937_64 stream(StreamPurpose purpose, uint64_t step = 0,
                           uint64_t batch = 0, uint64_t row = 0) const {
        return make_stream(seed_, purpose, step, batch, row);
    }

    /// Fresh batch identifier for lookahead simulations within a step
    uint64_t next_batch_id() { return next_batch_++; }

    void record(StepDiagnostics diag) { diagnostics_.push_back(std::move(diag)); }
    const std::vector<StepDiagnostics>& diagnostics() const { return diagnostics_; }

    /// Forget diagnostics and batch ids (the seed is kept)
    void reset() {
        diagnostics_.clear();
        next_batch_ = 0;
    }

private:
    uint64_t seed_;
    uint64_t next_batch_ = 0;
    std::vector<StepDiagnostics> diagnostics_;
};

}  // namespace osp
