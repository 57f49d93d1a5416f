// SPDX-License-Identifier: MIT
#include "osp/engine/run_context.hpp"

namespace osp {

std::mt19937_64 make_stream(uint64_t seed, StreamPurpose purpose,
                            uint64_t step, uint64_t batch, uint64_t row) {
    auto lo = [](uint64_t v) { return static_cast<uint32_t>(v & 0xffffffffULL); };
    auto hi = [](uint64_t v) { return static_cast<uint32_t>(v >> 32); };
    std::seed_seq seq{lo(seed), hi(seed),
                      static_cast<uint32_t>(purpose),
                      lo(step), hi(step),
                      lo(batch), hi(batch),
                      lo(row), hi(row)};
    return std::mt19937_64(seq);
}

}  // namespace osp
