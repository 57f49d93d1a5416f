// SPDX-License-Identifier: MIT
#pragma once

#include <cstddef>
#include <expected>
#include <optional>
#include <ostream>
#include <string>
#include <utility>

namespace osp {

/// Error categories surfaced through expected results
enum class OspErrorCode {
    InvalidConfig,       ///< Malformed or dimensionally inconsistent configuration
    UnderdeterminedFit,  ///< Design too small or degenerate for the regression
    FitFailure           ///< Numerical failure inside a regression fit
};

/// Detailed error passed through the expected failure path
///
/// `step` is filled in by the backward induction engine when the failure
/// happened while processing a particular time step.
struct OspError {
    OspErrorCode code{OspErrorCode::InvalidConfig};
    std::optional<size_t> step;
    std::string message;
};

template <typename T>
using Expected = std::expected<T, OspError>;

inline std::unexpected<OspError> make_error(OspErrorCode code, std::string message) {
    return std::unexpected(OspError{.code = code, .step = std::nullopt, .message = std::move(message)});
}

/// Stamp a step index on an error that does not carry one yet
inline OspError at_step(OspError err, size_t step) {
    if (!err.step.has_value()) {
        err.step = step;
    }
    return err;
}

inline const char* to_string(OspErrorCode code) {
    switch (code) {
        case OspErrorCode::InvalidConfig:      return "InvalidConfig";
        case OspErrorCode::UnderdeterminedFit: return "UnderdeterminedFit";
        case OspErrorCode::FitFailure:         return "FitFailure";
    }
    return "Unknown";
}

inline std::ostream& operator<<(std::ostream& os, OspErrorCode code) {
    return os << to_string(code);
}

inline std::ostream& operator<<(std::ostream& os, const OspError& err) {
    os << "OspError{code=" << to_string(err.code);
    if (err.step.has_value()) {
        os << ", step=" << *err.step;
    }
    os << ", message=\"" << err.message << "\"}";
    return os;
}

}  // namespace osp
