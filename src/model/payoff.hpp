// SPDX-License-Identifier: MIT
#pragma once

#include "osp/model/model_config.hpp"
#include "osp/model/types.hpp"
#include <Eigen/Dense>
#include <cstddef>
#include <span>

namespace osp {

/// Immediate exercise reward h(x)
///
/// Pure and time-homogeneous; discounting is applied by the callers.
/// Single-asset payoffs read the first coordinate, basket payoffs the
/// arithmetic average.
class PayoffFunction {
public:
    explicit PayoffFunction(PayoffSpec spec) : spec_(spec) {}

    double value(std::span<const double> x) const;

    /// h(x) for every row
    Eigen::VectorXd evaluate(const StateMatrix& states) const;

    bool in_the_money(std::span<const double> x) const { return value(x) > 0.0; }

    const PayoffSpec& spec() const { return spec_; }

private:
    PayoffSpec spec_;
};

}  // namespace osp
