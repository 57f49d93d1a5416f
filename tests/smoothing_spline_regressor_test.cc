// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "osp/regression/smoothing_spline_regressor.hpp"
#include <cmath>
#include <random>

namespace osp {
namespace {

FitData sampled(double (*f)(double), size_t n, double lo, double hi, double noise_sd = 0.0,
                uint64_t seed = 1) {
    std::mt19937_64 rng(seed);
    std::normal_distribution<double> normal(0.0, 1.0);
    FitData data;
    data.inputs = StateMatrix(static_cast<Eigen::Index>(n), 1);
    data.outputs = Eigen::VectorXd(static_cast<Eigen::Index>(n));
    data.replications = Eigen::VectorXd::Ones(static_cast<Eigen::Index>(n));
    for (size_t i = 0; i < n; ++i) {
        const double x = lo + (hi - lo) * static_cast<double>(i) / static_cast<double>(n - 1);
        data.inputs(static_cast<Eigen::Index>(i), 0) = x;
        data.outputs[static_cast<Eigen::Index>(i)] = f(x) + noise_sd * normal(rng);
    }
    return data;
}

double smooth_curve(double x) { return std::sin(x / 3.0) + 0.05 * x; }

RegressionConfig spline_config(size_t knots, double penalty) {
    RegressionConfig config;
    config.method = RegressionMethod::Spline;
    config.spline_knots = knots;
    config.spline_penalty = penalty;
    return config;
}

TEST(SmoothingSplineRegressorTest, ApproximatesSmoothFunction) {
    SmoothingSplineRegressor regressor(spline_config(20, 1e-8));
    auto fit = regressor.fit(sampled(smooth_curve, 200, 16.0, 40.0));
    ASSERT_TRUE(fit.has_value()) << fit.error();
    StateMatrix q(3, 1);
    q << 18.2, 27.0, 38.9;
    Eigen::VectorXd m = (*fit)->predict_mean(q);
    for (Eigen::Index i = 0; i < q.rows(); ++i) {
        EXPECT_NEAR(m[i], smooth_curve(q(i, 0)), 2e-3) << "x = " << q(i, 0);
    }
}

TEST(SmoothingSplineRegressorTest, LinearExtrapolationOutsideData) {
    SmoothingSplineRegressor regressor(spline_config(10, 1e-4));
    auto fit = regressor.fit(sampled(smooth_curve, 60, 20.0, 30.0));
    ASSERT_TRUE(fit.has_value()) << fit.error();
    StateMatrix q(3, 1);
    q << 31.0, 32.0, 33.0;
    Eigen::VectorXd m = (*fit)->predict_mean(q);
    EXPECT_NEAR(m[2] - m[1], m[1] - m[0], 1e-10);

    const auto* spline = dynamic_cast<const SmoothingSplineSurrogate*>(fit->get());
    ASSERT_NE(spline, nullptr);
    EXPECT_DOUBLE_EQ(spline->lower(), 20.0);
    EXPECT_DOUBLE_EQ(spline->upper(), 30.0);
    const auto [v_hi, s_hi] = spline->value_and_slope(30.0);
    EXPECT_NEAR(m[0], v_hi + s_hi, 1e-10);
}

TEST(SmoothingSplineRegressorTest, PenaltySmoothsNoise) {
    const FitData noisy = sampled(smooth_curve, 120, 16.0, 40.0, 0.3, 7);
    SmoothingSplineRegressor rough(spline_config(30, 1e-9));
    SmoothingSplineRegressor smooth(spline_config(30, 1.0));
    auto a = rough.fit(noisy);
    auto b = smooth.fit(noisy);
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());

    auto roughness = [](const Surrogate& s) {
        StateMatrix q(241, 1);
        for (Eigen::Index i = 0; i < q.rows(); ++i) q(i, 0) = 16.0 + 0.1 * static_cast<double>(i);
        Eigen::VectorXd v = s.predict_mean(q);
        double r = 0.0;
        for (Eigen::Index i = 1; i + 1 < v.size(); ++i) {
            const double d2 = v[i + 1] - 2.0 * v[i] + v[i - 1];
            r += d2 * d2;
        }
        return r;
    };
    EXPECT_LT(roughness(**b), roughness(**a));
}

TEST(SmoothingSplineRegressorTest, RejectsMultiDimensionalInputs) {
    SmoothingSplineRegressor regressor(spline_config(10, 1e-4));
    FitData data;
    data.inputs = StateMatrix::Random(30, 2);
    data.outputs = Eigen::VectorXd::Zero(30);
    data.replications = Eigen::VectorXd::Ones(30);
    auto fit = regressor.fit(data);
    ASSERT_FALSE(fit.has_value());
    EXPECT_EQ(fit.error().code, OspErrorCode::InvalidConfig);
}

TEST(SmoothingSplineRegressorTest, UnderdeterminedWithFewerInputsThanBasis) {
    SmoothingSplineRegressor regressor(spline_config(20, 1e-4));
    auto fit = regressor.fit(sampled(smooth_curve, 15, 16.0, 40.0));
    ASSERT_FALSE(fit.has_value());
    EXPECT_EQ(fit.error().code, OspErrorCode::UnderdeterminedFit);
}

TEST(SmoothingSplineRegressorTest, UnderdeterminedOnDegenerateRange) {
    SmoothingSplineRegressor regressor(spline_config(4, 1e-4));
    FitData data = sampled(smooth_curve, 30, 16.0, 40.0);
    data.inputs.setConstant(25.0);
    auto fit = regressor.fit(data);
    ASSERT_FALSE(fit.has_value());
    EXPECT_EQ(fit.error().code, OspErrorCode::UnderdeterminedFit);
}

}  // namespace
}  // namespace osp
