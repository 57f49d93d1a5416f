// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "osp/design/acquisition.hpp"
#include <cmath>
#include <limits>
#include <numbers>

namespace osp {
namespace {

TEST(AcquisitionTest, NormalCdf) {
    EXPECT_DOUBLE_EQ(normal_cdf(0.0), 0.5);
    EXPECT_NEAR(normal_cdf(1.96), 0.9750021, 1e-6);
    EXPECT_NEAR(normal_cdf(-1.0) + normal_cdf(1.0), 1.0, 1e-14);
}

TEST(AcquisitionTest, ScoresFavourTheZeroContour) {
    Eigen::VectorXd mean(3), variance(3);
    mean << 2.0, 0.1, -2.0;
    variance << 0.25, 0.25, 0.25;
    for (auto fn : {AcquisitionFunction::Mcu, AcquisitionFunction::Smcu,
                    AcquisitionFunction::Tmse}) {
        Eigen::VectorXd s = acquisition_scores(fn, mean, variance);
        ASSERT_EQ(s.size(), 3);
        EXPECT_GT(s[1], s[0]);
        EXPECT_NEAR(s[0], s[2], 1e-14);
        EXPECT_EQ(best_candidate(s), std::optional<size_t>(1));
    }
}

TEST(AcquisitionTest, ClosedForms) {
    Eigen::VectorXd mean(1), variance(1);
    mean << 0.5;
    variance << 4.0;
    EXPECT_NEAR(acquisition_scores(AcquisitionFunction::Mcu, mean, variance)[0],
                normal_cdf(-0.25), 1e-14);
    EXPECT_NEAR(acquisition_scores(AcquisitionFunction::Smcu, mean, variance)[0],
                STRADDLE_GAMMA * 2.0 - 0.5, 1e-14);
    const double phi = std::exp(-0.5 * 0.0625) / std::sqrt(2.0 * std::numbers::pi);
    EXPECT_NEAR(acquisition_scores(AcquisitionFunction::Tmse, mean, variance)[0],
                2.0 * phi, 1e-12);
}

TEST(AcquisitionTest, SmcuPrefersUncertaintyAtEqualMean) {
    Eigen::VectorXd mean(2), variance(2);
    mean << 0.3, 0.3;
    variance << 0.1, 1.0;
    Eigen::VectorXd s = acquisition_scores(AcquisitionFunction::Smcu, mean, variance);
    EXPECT_EQ(best_candidate(s), std::optional<size_t>(1));
}

TEST(AcquisitionTest, CsurReductionIsNonNegative) {
    for (double m : {-3.0, -0.2, 0.0, 0.4, 5.0}) {
        for (double s2 : {1e-6, 0.1, 2.0}) {
            for (double tau2 : {0.0, 0.01, 1.0, 100.0}) {
                EXPECT_GE(csur_reduction(m, s2, tau2), 0.0)
                    << "m=" << m << " s2=" << s2 << " tau2=" << tau2;
            }
        }
    }
}

TEST(AcquisitionTest, CsurShrinksWithNoise) {
    const double precise = csur_reduction(0.5, 1.0, 0.01);
    const double noisy = csur_reduction(0.5, 1.0, 10.0);
    EXPECT_GT(precise, noisy);
    EXPECT_NEAR(csur_reduction(0.0, 1.0, 0.5), 0.0, 1e-14);
}

TEST(AcquisitionTest, CsurScoresUseNugget) {
    Eigen::VectorXd mean(2), variance(2), nugget(2);
    mean << 0.5, 0.5;
    variance << 1.0, 1.0;
    nugget << 5.0, 0.05;
    Eigen::VectorXd s = acquisition_scores(AcquisitionFunction::Csur, mean, variance, nugget);
    EXPECT_NEAR(s[0], csur_reduction(0.5, 1.0, 5.0), 1e-14);
    EXPECT_EQ(best_candidate(s), std::optional<size_t>(1));
}

TEST(AcquisitionTest, TiesResolveToLowestIndex) {
    Eigen::VectorXd s(4);
    s << 0.2, 0.7, 0.7, 0.1;
    EXPECT_EQ(best_candidate(s), std::optional<size_t>(1));
}

TEST(AcquisitionTest, NonFiniteScoresAreSkipped) {
    Eigen::VectorXd s(3);
    s << std::numeric_limits<double>::quiet_NaN(), -1.0, std::numeric_limits<double>::infinity();
    EXPECT_EQ(best_candidate(s), std::optional<size_t>(1));

    Eigen::VectorXd none(2);
    none << std::numeric_limits<double>::quiet_NaN(), std::numeric_limits<double>::quiet_NaN();
    EXPECT_FALSE(best_candidate(none).has_value());
    EXPECT_FALSE(best_candidate(Eigen::VectorXd()).has_value());
}

}  // namespace
}  // namespace osp
