// SPDX-License-Identifier: MIT
#include "osp/design/simulation_design.hpp"
#include <numeric>

namespace osp {

namespace {

double sample_variance_of(const Eigen::Ref<const Eigen::VectorXd>& v) {
    if (v.size() < 2) return 0.0;
    const double mean = v.mean();
    return (v.array() - mean).square().sum() / static_cast<double>(v.size() - 1);
}

}  // namespace

size_t SimulationDesign::total_simulations() const {
    return std::accumulate(replications.begin(), replications.end(), size_t{0});
}

FitData SimulationDesign::to_fit_data() const {
    FitData data;
    data.inputs = inputs;
    data.outputs = mean_response;
    data.replications.resize(static_cast<Eigen::Index>(replications.size()));
    bool replicated = !replications.empty();
    for (size_t i = 0; i < replications.size(); ++i) {
        data.replications[static_cast<Eigen::Index>(i)] = static_cast<double>(replications[i]);
        replicated = replicated && replications[i] >= 2;
    }
    if (replicated) {
        data.sample_variance = sample_variance;
        data.noise_variance = sample_variance.cwiseQuotient(data.replications);
    }
    return data;
}

void SimulationDesign::add_input(std::span<const double> x,
                                 const Eigen::Ref<const Eigen::VectorXd>& responses) {
    const Eigen::Index n = inputs.rows();
    const auto d = static_cast<Eigen::Index>(x.size());
    inputs.conservativeResize(n + 1, d);
    for (Eigen::Index j = 0; j < d; ++j) {
        inputs(n, j) = x[static_cast<size_t>(j)];
    }
    replications.push_back(static_cast<size_t>(responses.size()));
    mean_response.conservativeResize(n + 1);
    mean_response[n] = responses.mean();
    sample_variance.conservativeResize(n + 1);
    sample_variance[n] = sample_variance_of(responses);
}

SimulationDesign make_design(const StateMatrix& inputs, const std::vector<size_t>& replications,
                             const Eigen::VectorXd& responses) {
    SimulationDesign design;
    design.inputs = inputs;
    design.replications = replications;
    design.mean_response.resize(inputs.rows());
    design.sample_variance.resize(inputs.rows());

    Eigen::Index offset = 0;
    for (Eigen::Index i = 0; i < inputs.rows(); ++i) {
        const auto r = static_cast<Eigen::Index>(replications[static_cast<size_t>(i)]);
        const auto seg = responses.segment(offset, r);
        design.mean_response[i] = seg.mean();
        design.sample_variance[i] = sample_variance_of(seg);
        offset += r;
    }
    return design;
}

void merge_replicates(SimulationDesign& design, size_t index,
                      const Eigen::Ref<const Eigen::VectorXd>& responses) {
    const auto i = static_cast<Eigen::Index>(index);
    const auto n_b = static_cast<double>(responses.size());
    if (n_b == 0.0) return;

    const auto n_a = static_cast<double>(design.replications[index]);
    const double mean_a = design.mean_response[i];
    const double m2_a = design.sample_variance[i] * (n_a - 1.0);

    const double mean_b = responses.mean();
    const double m2_b = (responses.array() - mean_b).square().sum();

    const double n = n_a + n_b;
    const double delta = mean_b - mean_a;
    design.mean_response[i] = mean_a + delta * n_b / n;
    design.sample_variance[i] = (m2_a + m2_b + delta * delta * n_a * n_b / n) / (n - 1.0);
    design.replications[index] += static_cast<size_t>(responses.size());
}

}  // namespace osp
