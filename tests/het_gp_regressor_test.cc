// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "osp/regression/het_gp_regressor.hpp"
#include "osp/regression/regressor_factory.hpp"
#include <cmath>
#include <random>

namespace osp {
namespace {

double noise_sd_at(double x) { return std::sqrt(0.01 + 0.2 * x * x); }

/// Replicated observations of sin(3x) with noise growing in x
FitData replicated_data(Eigen::Index n, size_t reps, uint64_t seed = 11) {
    std::mt19937_64 rng(seed);
    std::normal_distribution<double> normal(0.0, 1.0);
    FitData data;
    data.inputs = StateMatrix(n, 1);
    data.outputs = Eigen::VectorXd(n);
    data.replications = Eigen::VectorXd::Constant(n, static_cast<double>(reps));
    data.sample_variance = Eigen::VectorXd(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        const double x = static_cast<double>(i) / static_cast<double>(n - 1);
        data.inputs(i, 0) = x;
        Eigen::VectorXd y(static_cast<Eigen::Index>(reps));
        for (Eigen::Index j = 0; j < y.size(); ++j) {
            y[j] = std::sin(3.0 * x) + noise_sd_at(x) * normal(rng);
        }
        data.outputs[i] = y.mean();
        (*data.sample_variance)[i] =
            (y.array() - y.mean()).square().sum() / static_cast<double>(y.size() - 1);
    }
    data.noise_variance = data.sample_variance->cwiseQuotient(data.replications);
    return data;
}

RegressionConfig het_config() {
    RegressionConfig config;
    config.method = RegressionMethod::HetGp;
    config.kernel = KernelFamily::Matern52;
    return config;
}

TEST(HetGpRegressorTest, NoiseLevelTracksHeteroskedasticity) {
    HetGpRegressor regressor(het_config());
    auto fit = regressor.fit(replicated_data(30, 40));
    ASSERT_TRUE(fit.has_value()) << fit.error();
    EXPECT_TRUE((*fit)->provides_variance());

    StateMatrix q(2, 1);
    q << 0.1, 0.9;
    auto lambda = (*fit)->noise_variance(q);
    ASSERT_TRUE(lambda.has_value());
    EXPECT_GT((*lambda)[0], 0.0);
    EXPECT_GT((*lambda)[1], 3.0 * (*lambda)[0]);
    EXPECT_NEAR((*lambda)[1], 0.01 + 0.2 * 0.81, 0.1);
}

TEST(HetGpRegressorTest, MeanFollowsSignal) {
    HetGpRegressor regressor(het_config());
    auto fit = regressor.fit(replicated_data(30, 40));
    ASSERT_TRUE(fit.has_value()) << fit.error();

    StateMatrix q(3, 1);
    q << 0.2, 0.5, 0.8;
    Prediction pred = (*fit)->predict(q);
    ASSERT_TRUE(pred.variance.has_value());
    for (Eigen::Index i = 0; i < q.rows(); ++i) {
        EXPECT_NEAR(pred.mean[i], std::sin(3.0 * q(i, 0)), 0.15) << "x = " << q(i, 0);
        EXPECT_GE((*pred.variance)[i], 0.0);
    }
}

TEST(HetGpRegressorTest, RefitReusesHyperparameters) {
    HetGpRegressor regressor(het_config());
    auto first = regressor.fit(replicated_data(20, 30, 3));
    ASSERT_TRUE(first.has_value()) << first.error();
    auto second = regressor.refit(replicated_data(25, 30, 4), **first);
    ASSERT_TRUE(second.has_value()) << second.error();

    const auto* a = dynamic_cast<const GaussianProcessSurrogate*>(first->get());
    const auto* b = dynamic_cast<const GaussianProcessSurrogate*>(second->get());
    ASSERT_NE(a, nullptr);
    ASSERT_NE(b, nullptr);
    EXPECT_EQ(a->hyperparameters().lengthscales, b->hyperparameters().lengthscales);
    EXPECT_DOUBLE_EQ(a->hyperparameters().signal_variance, b->hyperparameters().signal_variance);
}

TEST(HetGpRegressorTest, RequiresSampleVariance) {
    HetGpRegressor regressor(het_config());
    FitData data = replicated_data(10, 5);
    data.sample_variance.reset();
    auto fit = regressor.fit(data);
    ASSERT_FALSE(fit.has_value());
    EXPECT_EQ(fit.error().code, OspErrorCode::InvalidConfig);
}

TEST(HetGpRegressorTest, UnderdeterminedWithoutReplicatedInputs) {
    HetGpRegressor regressor(het_config());
    FitData data = replicated_data(10, 5);
    data.replications.setOnes();
    data.replications[0] = 5.0;
    data.replications[1] = 5.0;
    auto fit = regressor.fit(data);
    ASSERT_FALSE(fit.has_value());
    EXPECT_EQ(fit.error().code, OspErrorCode::UnderdeterminedFit);
}

TEST(HetGpRegressorTest, FactoryBuildsHetGp) {
    auto regressor = make_regressor(het_config(), nullptr);
    ASSERT_TRUE(regressor.has_value()) << regressor.error();
    EXPECT_EQ((*regressor)->method(), RegressionMethod::HetGp);
    EXPECT_TRUE((*regressor)->provides_variance());
}

}  // namespace
}  // namespace osp
