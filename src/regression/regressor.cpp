// SPDX-License-Identifier: MIT
#include "osp/regression/regressor.hpp"
#include "osp/support/osp_trace.h"

namespace osp {

Expected<void> check_fit_data(const FitData& data, int module_id) {
    const Eigen::Index n = data.inputs.rows();
    auto fail = [&](OspErrorCode code, const char* message) -> Expected<void> {
        OSP_TRACE_VALIDATION_ERROR(module_id, static_cast<int>(code), static_cast<double>(n), 0.0);
        return make_error(code, message);
    };

    if (n == 0 || data.inputs.cols() == 0) {
        return fail(OspErrorCode::UnderdeterminedFit, "No training inputs");
    }
    if (data.outputs.size() != n || data.replications.size() != n) {
        return fail(OspErrorCode::InvalidConfig, "Outputs and replications must match the input rows");
    }
    if (data.noise_variance && data.noise_variance->size() != n) {
        return fail(OspErrorCode::InvalidConfig, "Noise variance must match the input rows");
    }
    if (data.sample_variance && data.sample_variance->size() != n) {
        return fail(OspErrorCode::InvalidConfig, "Sample variance must match the input rows");
    }
    if (!data.inputs.allFinite() || !data.outputs.allFinite()) {
        return fail(OspErrorCode::FitFailure, "Training data contains non-finite values");
    }
    if ((data.replications.array() < 1.0).any()) {
        return fail(OspErrorCode::InvalidConfig, "Replication counts must be at least 1");
    }
    return {};
}

}  // namespace osp
