// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "osp/model/model_config.hpp"
#include <cmath>

namespace osp {
namespace {

ModelConfig put_config() {
    ModelConfig config;
    config.process.initial_state = {36.0};
    config.process.drift = {0.06};
    config.process.volatility = {0.2};
    config.payoff = {PayoffType::Put, 40.0};
    config.time = {0.04, 25};
    config.rate = 0.06;
    config.regression.method = RegressionMethod::GpMle;
    config.design.method = DesignMethod::FixedGrid;
    config.design.grid = StateMatrix(3, 1);
    config.design.grid << 30.0, 34.0, 38.0;
    config.design.replications = 50;
    return config;
}

TEST(ModelConfigTest, ValidPutConfiguration) {
    auto result = validate_model_config(put_config());
    EXPECT_TRUE(result.has_value()) << result.error();
}

TEST(ModelConfigTest, DiscountFactor) {
    ModelConfig config = put_config();
    EXPECT_DOUBLE_EQ(config.discount(0), 1.0);
    EXPECT_NEAR(config.discount(25), std::exp(-0.06), 1e-15);
    EXPECT_NEAR(config.time.maturity(), 1.0, 1e-15);
}

TEST(ModelConfigTest, RejectsDimensionMismatch) {
    ModelConfig config = put_config();
    config.process.volatility = {0.2, 0.3};
    auto result = validate_model_config(config);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, OspErrorCode::InvalidConfig);
}

TEST(ModelConfigTest, RejectsSingleAssetPayoffOnBasket) {
    ModelConfig config = put_config();
    config.process.initial_state = {36.0, 36.0};
    config.process.drift = {0.06, 0.06};
    config.process.volatility = {0.2, 0.2};
    config.design.grid = StateMatrix::Constant(3, 2, 30.0);
    auto result = validate_model_config(config);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, OspErrorCode::InvalidConfig);

    config.payoff.type = PayoffType::BasketPut;
    EXPECT_TRUE(validate_model_config(config).has_value());
}

TEST(ModelConfigTest, RejectsNonPositiveTimeStep) {
    ModelConfig config = put_config();
    config.time.dt = 0.0;
    EXPECT_FALSE(validate_model_config(config).has_value());
    config.time.dt = 0.04;
    config.time.n_steps = 1;
    EXPECT_FALSE(validate_model_config(config).has_value());
}

TEST(ModelConfigTest, RejectsAsymmetricCorrelation) {
    ProcessSpec spec;
    spec.initial_state = {40.0, 40.0};
    spec.drift = {0.0, 0.0};
    spec.volatility = {0.2, 0.2};
    spec.correlation = Eigen::MatrixXd(2, 2);
    spec.correlation << 1.0, 0.3,
                        0.2, 1.0;
    auto result = validate_process_spec(spec);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, OspErrorCode::InvalidConfig);

    spec.correlation(1, 0) = 0.3;
    EXPECT_TRUE(validate_process_spec(spec).has_value());
}

TEST(ModelConfigTest, ExpOuNeedsMeanReversion) {
    ProcessSpec spec;
    spec.type = ProcessType::ExpOU;
    spec.initial_state = {1.0};
    spec.volatility = {0.3};
    spec.mean_reversion = 0.0;
    EXPECT_FALSE(validate_process_spec(spec).has_value());
    spec.mean_reversion = 2.0;
    EXPECT_TRUE(validate_process_spec(spec).has_value());
}

TEST(ModelConfigTest, SplineRequiresOneDimension) {
    ModelConfig config = put_config();
    config.process.initial_state = {36.0, 36.0};
    config.process.drift = {0.06, 0.06};
    config.process.volatility = {0.2, 0.2};
    config.payoff.type = PayoffType::BasketPut;
    config.design.grid = StateMatrix::Constant(3, 2, 30.0);
    config.regression.method = RegressionMethod::Spline;
    auto result = validate_model_config(config);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, OspErrorCode::InvalidConfig);
}

TEST(ModelConfigTest, FixedGpNeedsLengthscalePerCoordinate) {
    ModelConfig config = put_config();
    config.regression.method = RegressionMethod::GpFixed;
    config.regression.fixed.lengthscales = {};
    EXPECT_FALSE(validate_model_config(config).has_value());
    config.regression.fixed.lengthscales = {5.0};
    EXPECT_TRUE(validate_model_config(config).has_value());
}

TEST(ModelConfigTest, SequentialDesignNeedsPredictiveVariance) {
    ModelConfig config = put_config();
    config.design.method = DesignMethod::Sequential;
    config.design.lower = {20.0};
    config.design.upper = {40.0};
    config.regression.method = RegressionMethod::LinearBasis;
    EXPECT_FALSE(validate_model_config(config).has_value());
    config.regression.method = RegressionMethod::GpMle;
    EXPECT_TRUE(validate_model_config(config).has_value());
}

TEST(ModelConfigTest, PathDesignRejectsReplicateNoise) {
    ModelConfig config = put_config();
    config.design.method = DesignMethod::PathBased;
    config.regression.noise = NoiseModel::FromReplicates;
    EXPECT_FALSE(validate_model_config(config).has_value());
    config.regression.noise = NoiseModel::Estimated;
    EXPECT_TRUE(validate_model_config(config).has_value());
}

TEST(ModelConfigTest, ReplicateNoiseNeedsTwoReplications) {
    ModelConfig config = put_config();
    config.regression.noise = NoiseModel::FromReplicates;
    config.design.replications = 1;
    EXPECT_FALSE(validate_model_config(config).has_value());
}

TEST(ModelConfigTest, AdaptiveBudgetMustCoverInitialDesign) {
    ModelConfig config = put_config();
    config.design.method = DesignMethod::AdaptiveBatch;
    config.design.lower = {20.0};
    config.design.upper = {40.0};
    config.design.initial_size = 10;
    config.design.target_size = 20;
    config.design.replications = 20;
    config.design.budget = 100;
    EXPECT_FALSE(validate_model_config(config).has_value());
    config.design.budget = 400;
    EXPECT_TRUE(validate_model_config(config).has_value());
}

TEST(ModelConfigTest, LookaheadWithinHorizon) {
    ModelConfig config = put_config();
    config.design.lookahead = 26;
    EXPECT_FALSE(validate_model_config(config).has_value());
    config.design.lookahead = 3;
    EXPECT_TRUE(validate_model_config(config).has_value());
}

TEST(ModelConfigTest, RegressionVarianceCapability) {
    EXPECT_TRUE(regression_provides_variance(RegressionMethod::GpFixed));
    EXPECT_TRUE(regression_provides_variance(RegressionMethod::GpMle));
    EXPECT_TRUE(regression_provides_variance(RegressionMethod::HetGp));
    EXPECT_FALSE(regression_provides_variance(RegressionMethod::Spline));
    EXPECT_FALSE(regression_provides_variance(RegressionMethod::LinearBasis));
}

}  // namespace
}  // namespace osp
