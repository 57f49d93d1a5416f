// SPDX-License-Identifier: MIT
#pragma once

#include <Eigen/Dense>
#include <cstddef>
#include <span>
#include <vector>

namespace osp {

/// Batch of d-dimensional states, one state per row
using StateMatrix = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

/// Simulated trajectories: one StateMatrix per time step, step 0 first
///
/// Row i of every snapshot belongs to trajectory i.
using PathBatch = std::vector<StateMatrix>;

/// Contiguous view of one state (row) of a StateMatrix
inline std::span<const double> state_row(const StateMatrix& states, Eigen::Index i) {
    return {states.row(i).data(), static_cast<size_t>(states.cols())};
}

}  // namespace osp
