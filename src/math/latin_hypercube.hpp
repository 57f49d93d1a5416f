// SPDX-License-Identifier: MIT
#pragma once

#include <Eigen/Dense>
#include <algorithm>
#include <cstddef>
#include <numeric>
#include <random>
#include <vector>

namespace osp {

/// Generate Latin Hypercube samples in the unit hypercube [0,1]^d
///
/// Each dimension has exactly one sample per stratum, giving better
/// coverage than plain random sampling for candidate pools.
///
/// @param n Number of samples
/// @param dim Dimension d
/// @param rng Random engine (consumed)
/// @return n x d matrix of samples
template <typename Engine>
Eigen::MatrixXd latin_hypercube(size_t n, size_t dim, Engine& rng) {
    std::uniform_real_distribution<double> uniform(0.0, 1.0);
    Eigen::MatrixXd samples(static_cast<Eigen::Index>(n), static_cast<Eigen::Index>(dim));

    std::vector<size_t> indices(n);
    for (size_t d = 0; d < dim; ++d) {
        std::iota(indices.begin(), indices.end(), size_t{0});
        std::shuffle(indices.begin(), indices.end(), rng);

        for (size_t i = 0; i < n; ++i) {
            double stratum_start = static_cast<double>(indices[i]) / static_cast<double>(n);
            double stratum_width = 1.0 / static_cast<double>(n);
            samples(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(d)) =
                stratum_start + uniform(rng) * stratum_width;
        }
    }
    return samples;
}

/// Scale unit-cube samples affinely to the box [lower, upper]
inline Eigen::MatrixXd scale_to_box(const Eigen::MatrixXd& unit,
                                    const Eigen::VectorXd& lower,
                                    const Eigen::VectorXd& upper) {
    Eigen::MatrixXd scaled(unit.rows(), unit.cols());
    for (Eigen::Index j = 0; j < unit.cols(); ++j) {
        double range = upper[j] - lower[j];
        scaled.col(j) = (unit.col(j).array() * range + lower[j]).matrix();
    }
    return scaled;
}

}  // namespace osp
