// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "osp/design/simulation_design.hpp"
#include <vector>

namespace osp {
namespace {

SimulationDesign two_input_design() {
    StateMatrix inputs(2, 1);
    inputs << 30.0, 35.0;
    Eigen::VectorXd responses(5);
    responses << 1.0, 2.0, 3.0,   // input 0
                 -1.0, 1.0;       // input 1
    return make_design(inputs, {3, 2}, responses);
}

TEST(SimulationDesignTest, MakeDesignSummarisesReplicates) {
    SimulationDesign design = two_input_design();
    ASSERT_EQ(design.size(), 2u);
    EXPECT_DOUBLE_EQ(design.mean_response[0], 2.0);
    EXPECT_DOUBLE_EQ(design.sample_variance[0], 1.0);
    EXPECT_DOUBLE_EQ(design.mean_response[1], 0.0);
    EXPECT_DOUBLE_EQ(design.sample_variance[1], 2.0);
    EXPECT_EQ(design.total_simulations(), 5u);
    EXPECT_FALSE(design.budget_exhausted);
}

TEST(SimulationDesignTest, MergeEqualsPooledSummary) {
    SimulationDesign design = two_input_design();
    Eigen::VectorXd extra(4);
    extra << 0.5, 4.0, -2.0, 2.5;
    merge_replicates(design, 0, extra);

    Eigen::VectorXd all(7);
    all << 1.0, 2.0, 3.0, 0.5, 4.0, -2.0, 2.5;
    const double mean = all.mean();
    const double var = (all.array() - mean).square().sum() / 6.0;

    EXPECT_EQ(design.replications[0], 7u);
    EXPECT_NEAR(design.mean_response[0], mean, 1e-12);
    EXPECT_NEAR(design.sample_variance[0], var, 1e-12);
    EXPECT_EQ(design.total_simulations(), 9u);
    // The other input is untouched
    EXPECT_DOUBLE_EQ(design.mean_response[1], 0.0);
}

TEST(SimulationDesignTest, MergeIntoSingleReplicate) {
    StateMatrix inputs(1, 1);
    inputs << 32.0;
    Eigen::VectorXd one(1);
    one << 2.0;
    SimulationDesign design = make_design(inputs, {1}, one);
    EXPECT_DOUBLE_EQ(design.sample_variance[0], 0.0);

    Eigen::VectorXd extra(1);
    extra << 4.0;
    merge_replicates(design, 0, extra);
    EXPECT_DOUBLE_EQ(design.mean_response[0], 3.0);
    EXPECT_DOUBLE_EQ(design.sample_variance[0], 2.0);
}

TEST(SimulationDesignTest, AddInputAppendsRow) {
    SimulationDesign design = two_input_design();
    const std::vector<double> x{28.0};
    Eigen::VectorXd responses(2);
    responses << 3.0, 5.0;
    design.add_input(x, responses);
    ASSERT_EQ(design.size(), 3u);
    EXPECT_DOUBLE_EQ(design.inputs(2, 0), 28.0);
    EXPECT_DOUBLE_EQ(design.inputs(0, 0), 30.0);
    EXPECT_EQ(design.replications.back(), 2u);
    EXPECT_DOUBLE_EQ(design.mean_response[2], 4.0);
    EXPECT_DOUBLE_EQ(design.sample_variance[2], 2.0);
}

TEST(SimulationDesignTest, FitDataCarriesNoiseOnlyWhenReplicated) {
    SimulationDesign design = two_input_design();
    FitData data = design.to_fit_data();
    ASSERT_TRUE(data.noise_variance.has_value());
    ASSERT_TRUE(data.sample_variance.has_value());
    EXPECT_DOUBLE_EQ((*data.noise_variance)[0], 1.0 / 3.0);
    EXPECT_DOUBLE_EQ((*data.noise_variance)[1], 1.0);
    EXPECT_DOUBLE_EQ(data.replications[0], 3.0);

    const std::vector<double> x{28.0};
    Eigen::VectorXd single(1);
    single << 1.5;
    design.add_input(x, single);
    FitData unreplicated = design.to_fit_data();
    EXPECT_FALSE(unreplicated.noise_variance.has_value());
    EXPECT_FALSE(unreplicated.sample_variance.has_value());
    EXPECT_EQ(unreplicated.size(), 3u);
}

}  // namespace
}  // namespace osp
