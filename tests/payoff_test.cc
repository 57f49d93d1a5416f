// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "osp/model/payoff.hpp"
#include <vector>

namespace osp {
namespace {

double payoff_at(PayoffType type, double strike, std::vector<double> x) {
    PayoffFunction h(PayoffSpec{type, strike});
    return h.value(x);
}

TEST(PayoffTest, SingleAssetPayoffs) {
    EXPECT_DOUBLE_EQ(payoff_at(PayoffType::Put, 40.0, {36.0}), 4.0);
    EXPECT_DOUBLE_EQ(payoff_at(PayoffType::Put, 40.0, {44.0}), 0.0);
    EXPECT_DOUBLE_EQ(payoff_at(PayoffType::Call, 40.0, {44.0}), 4.0);
    EXPECT_DOUBLE_EQ(payoff_at(PayoffType::Call, 40.0, {36.0}), 0.0);
    EXPECT_DOUBLE_EQ(payoff_at(PayoffType::DigitalPut, 40.0, {39.9}), 1.0);
    EXPECT_DOUBLE_EQ(payoff_at(PayoffType::DigitalPut, 40.0, {40.0}), 0.0);
}

TEST(PayoffTest, MultiAssetPayoffs) {
    EXPECT_DOUBLE_EQ(payoff_at(PayoffType::BasketPut, 40.0, {30.0, 44.0}), 3.0);
    EXPECT_DOUBLE_EQ(payoff_at(PayoffType::BasketCall, 40.0, {30.0, 54.0}), 2.0);
    EXPECT_DOUBLE_EQ(payoff_at(PayoffType::MaxCall, 40.0, {30.0, 54.0}), 14.0);
    EXPECT_DOUBLE_EQ(payoff_at(PayoffType::MinPut, 40.0, {30.0, 54.0}), 10.0);
    EXPECT_DOUBLE_EQ(payoff_at(PayoffType::MinPut, 40.0, {41.0, 54.0}), 0.0);
}

TEST(PayoffTest, AtTheMoneyIsNotInTheMoney) {
    PayoffFunction put(PayoffSpec{PayoffType::Put, 40.0});
    std::vector<double> atm{40.0};
    std::vector<double> itm{39.99};
    EXPECT_FALSE(put.in_the_money(atm));
    EXPECT_TRUE(put.in_the_money(itm));
}

TEST(PayoffTest, EvaluateMatchesRowwiseValue) {
    PayoffFunction basket(PayoffSpec{PayoffType::BasketPut, 40.0});
    StateMatrix x(3, 2);
    x << 30.0, 34.0,
         40.0, 42.0,
         38.0, 38.0;
    Eigen::VectorXd h = basket.evaluate(x);
    ASSERT_EQ(h.size(), 3);
    EXPECT_DOUBLE_EQ(h[0], 8.0);
    EXPECT_DOUBLE_EQ(h[1], 0.0);
    EXPECT_DOUBLE_EQ(h[2], 2.0);
}

}  // namespace
}  // namespace osp
