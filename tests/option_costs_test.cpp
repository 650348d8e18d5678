// option_costs_test.cpp — Tests for the asymmetric option cost model
//
// Sellers receive mid less half the spread, buyers pay mid plus half the
// spread; commission is charged per contract on both sides.

#include <gtest/gtest.h>

#include "pricing/option_costs.hpp"

#include <vector>

// ===========================================================================
// Fixture
// ===========================================================================
class OptionCostsTest : public ::testing::Test {
protected:
    OptionCosts costs;  // default-constructed
};

// ===========================================================================
// 1. Default values
// ===========================================================================

TEST_F(OptionCostsTest, DefaultSpread) {
    EXPECT_DOUBLE_EQ(costs.spread_pct, 0.15);
}

TEST_F(OptionCostsTest, DefaultCommission) {
    EXPECT_DOUBLE_EQ(costs.commission_per_contract, 0.65);
}

TEST_F(OptionCostsTest, DefaultMultiplier) {
    EXPECT_DOUBLE_EQ(costs.contract_multiplier, 100.0);
}

// ===========================================================================
// 2. Per-side formulas
// ===========================================================================

TEST_F(OptionCostsTest, SellProceedsFormula) {
    // 0.20 * (1 - 0.075) * 100 * 10 - 0.65 * 10 = 185.0 - 6.5
    EXPECT_NEAR(costs.sell_proceeds(0.20, 10), 178.5, 1e-9);
}

TEST_F(OptionCostsTest, BuybackCostFormula) {
    // 0.20 * (1 + 0.075) * 100 * 10 + 0.65 * 10 = 215.0 + 6.5
    EXPECT_NEAR(costs.buyback_cost(0.20, 10), 221.5, 1e-9);
}

TEST_F(OptionCostsTest, FrictionlessIsMidTimesNotional) {
    OptionCosts c;
    c.spread_pct = 0.0;
    c.commission_per_contract = 0.0;
    EXPECT_DOUBLE_EQ(c.sell_proceeds(0.05, 10), 50.0);
    EXPECT_DOUBLE_EQ(c.buyback_cost(0.05, 10), 50.0);
    EXPECT_DOUBLE_EQ(c.round_trip_cost(0.05, 10), 0.0);
}

TEST_F(OptionCostsTest, SellOfNearWorthlessOptionCanBeNegative) {
    EXPECT_LT(costs.sell_proceeds(0.001, 10), 0.0);
}

TEST_F(OptionCostsTest, CommissionScalesWithContracts) {
    EXPECT_DOUBLE_EQ(costs.commission(1), 0.65);
    EXPECT_DOUBLE_EQ(costs.commission(10), 6.5);
}

TEST_F(OptionCostsTest, ApplyCostsMatchesStructHelpers) {
    EXPECT_DOUBLE_EQ(apply_costs(TradeSide::SELL, 0.3, 0.15, 0.65, 5, 100.0),
                     costs.sell_proceeds(0.3, 5));
    EXPECT_DOUBLE_EQ(apply_costs(TradeSide::BUY, 0.3, 0.15, 0.65, 5, 100.0),
                     costs.buyback_cost(0.3, 5));
}

// ===========================================================================
// 3. Round trip always loses value when any friction is present
// ===========================================================================

TEST(OptionCostsRoundTripTest, SellMinusBuyIsNegative) {
    const std::vector<double> spreads = {0.0, 0.01, 0.15, 0.5, 1.0};
    const std::vector<double> commissions = {0.0, 0.01, 0.65, 2.0};
    const std::vector<double> mids = {0.0, 0.01, 0.25, 1.5};

    for (double s : spreads) {
        for (double c : commissions) {
            if (s == 0.0 && c == 0.0) continue;
            for (double mid : mids) {
                if (s > 0.0 && c == 0.0 && mid == 0.0) continue;  // nothing trades
                double sell = apply_costs(TradeSide::SELL, mid, s, c, 10, 100.0);
                double buy = apply_costs(TradeSide::BUY, mid, s, c, 10, 100.0);
                EXPECT_LT(sell - buy, 0.0)
                    << "spread=" << s << " commission=" << c << " mid=" << mid;
            }
        }
    }
}

TEST(OptionCostsRoundTripTest, RoundTripEqualsSpreadPlusTwoCommissions) {
    OptionCosts c;
    // spread: 0.40 * 0.15 * 100 * 10 = 60; commissions 2 * 6.5 = 13
    EXPECT_NEAR(c.round_trip_cost(0.40, 10), 73.0, 1e-9);
}

// ===========================================================================
// 4. Input validation
// ===========================================================================

TEST(OptionCostsValidationTest, NegativeMidRejected) {
    EXPECT_THROW(apply_costs(TradeSide::SELL, -0.01, 0.15, 0.65, 10, 100.0),
                 InvalidInputError);
}

TEST(OptionCostsValidationTest, SpreadOutsideUnitIntervalRejected) {
    EXPECT_THROW(apply_costs(TradeSide::SELL, 0.1, 1.5, 0.65, 10, 100.0), InvalidInputError);
    EXPECT_THROW(apply_costs(TradeSide::BUY, 0.1, -0.1, 0.65, 10, 100.0), InvalidInputError);
}

TEST(OptionCostsValidationTest, NonPositiveContractsRejected) {
    EXPECT_THROW(apply_costs(TradeSide::SELL, 0.1, 0.15, 0.65, 0, 100.0), InvalidInputError);
}

TEST(OptionCostsValidationTest, NegativeCommissionRejected) {
    EXPECT_THROW(apply_costs(TradeSide::BUY, 0.1, 0.15, -0.65, 10, 100.0), InvalidInputError);
}
