// SPDX-License-Identifier: MIT
#pragma once

#include "osp/regression/surrogate.hpp"
#include <cstddef>
#include <memory>
#include <utility>
#include <vector>

namespace osp {

/// Per-step timing-value surrogates T̂(1..M-1, ·)
///
/// Write-once per step during the backward pass, read-only afterwards.
/// Maturity never carries a surrogate: the action there is fixed.
class FittedSurrogates {
public:
    FittedSurrogates() = default;
    explicit FittedSurrogates(size_t n_steps) : slots_(n_steps + 1) {}

    size_t n_steps() const { return slots_.empty() ? 0 : slots_.size() - 1; }

    /// Store the surrogate of step k (1 <= k < n_steps)
    void set(size_t step, std::shared_ptr<const Surrogate> surrogate) {
        slots_.at(step) = std::move(surrogate);
    }

    /// Surrogate of step k, nullptr when absent
    const Surrogate* at(size_t step) const {
        return step < slots_.size() ? slots_[step].get() : nullptr;
    }

    std::shared_ptr<const Surrogate> shared(size_t step) const {
        return step < slots_.size() ? slots_[step] : nullptr;
    }

    /// Number of fitted steps
    size_t count() const {
        size_t n = 0;
        for (const auto& s : slots_) {
            if (s) ++n;
        }
        return n;
    }

private:
    std::vector<std::shared_ptr<const Surrogate>> slots_;
};

}  // namespace osp
