// premium_optimizer_test.cpp — Tests for the strike x expiration grid search
//
// Covers per-combination analysis, the min_strike filter, composite score
// ordering with its deterministic tie-breaks, and the report table.

#include <gtest/gtest.h>

#include "strategy/premium_optimizer.hpp"
#include "strategy/strategy_config.hpp"

#include <string>
#include <vector>

// ===========================================================================
// Fixture
// ===========================================================================
class PremiumOptimizerTest : public ::testing::Test {
protected:
    StrategyConfig config;
    static constexpr double SPOT = 2.00;
    static constexpr double VOL = 0.80;

    void SetUp() override {
        config.min_strike = 2.50;
        config.strike_candidates = {2.00, 2.50, 3.00, 3.50, 4.00, 5.00};
        config.candidate_dtes = {14, 30, 45};
    }
};

// ===========================================================================
// 1. Single combination analysis
// ===========================================================================

TEST_F(PremiumOptimizerTest, AnalyzeMatchesPricingAndCosts) {
    PremiumOptimizer opt(config);
    auto a = opt.analyze(SPOT, 2.50, 30, VOL);

    double t = bs::years_from_days(30);
    double mid = bs::call_price(SPOT, 2.50, t, VOL, config.risk_free_rate);
    EXPECT_DOUBLE_EQ(a.theoretical_premium, mid);
    EXPECT_DOUBLE_EQ(a.net_premium, mid * (1.0 - 0.15 / 2.0));
    EXPECT_DOUBLE_EQ(a.net_total_premium, config.costs().sell_proceeds(mid, 10));
    EXPECT_DOUBLE_EQ(a.delta, bs::call_delta(SPOT, 2.50, t, VOL, config.risk_free_rate));
    EXPECT_LT(a.theta_daily, 0.0);
    EXPECT_DOUBLE_EQ(a.upside_to_strike, 0.25);
}

TEST_F(PremiumOptimizerTest, AnnualizedReturnOnCapitalAtStrike) {
    PremiumOptimizer opt(config);
    auto a = opt.analyze(SPOT, 2.50, 30, VOL);
    double expected = a.net_total_premium / (2.50 * 1000.0) * (365.0 / 30.0);
    EXPECT_NEAR(a.annualized_return, expected, 1e-12);
}

TEST_F(PremiumOptimizerTest, AnalyzeRejectsBadInputs) {
    PremiumOptimizer opt(config);
    EXPECT_THROW(opt.analyze(0.0, 2.50, 30, VOL), InvalidInputError);
    EXPECT_THROW(opt.analyze(SPOT, 2.50, 0, VOL), InvalidInputError);
    EXPECT_THROW(opt.analyze(SPOT, 2.50, 30, -0.1), InvalidInputError);
}

// ===========================================================================
// 2. Grid search
// ===========================================================================

TEST_F(PremiumOptimizerTest, SkipsStrikesBelowMinimum) {
    PremiumOptimizer opt(config);
    auto ranked = opt.optimize(SPOT, VOL);
    // 5 strikes >= 2.50 times 3 DTEs
    ASSERT_EQ(ranked.size(), 15u);
    for (const auto& a : ranked) {
        EXPECT_GE(a.strike, 2.50);
    }
}

TEST_F(PremiumOptimizerTest, EmptyWhenNoStrikeClearsMinimum) {
    config.min_strike = 10.0;
    PremiumOptimizer opt(config);
    EXPECT_TRUE(opt.optimize(SPOT, VOL).empty());
}

TEST_F(PremiumOptimizerTest, SortedByScoreDescending) {
    PremiumOptimizer opt(config);
    auto ranked = opt.optimize(SPOT, VOL);
    for (size_t i = 1; i < ranked.size(); ++i) {
        EXPECT_GE(ranked[i - 1].score, ranked[i].score);
    }
}

TEST_F(PremiumOptimizerTest, ScoreWithinUnitInterval) {
    PremiumOptimizer opt(config);
    for (const auto& a : opt.optimize(SPOT, VOL)) {
        EXPECT_GE(a.score, 0.0);
        EXPECT_LE(a.score, 1.0);
    }
}

TEST_F(PremiumOptimizerTest, ScoreIsWeightedComposite) {
    config.bid_ask_spread_pct = 0.0;
    config.commission_per_contract = 0.0;
    config.candidate_dtes = {30};
    PremiumOptimizer opt(config);
    auto ranked = opt.optimize(SPOT, VOL);
    ASSERT_FALSE(ranked.empty());

    double best_income = 0.0;
    for (const auto& a : ranked) best_income = std::max(best_income, a.annualized_return);

    for (const auto& a : ranked) {
        double expected = 0.5 * (a.annualized_return / best_income) +
                          0.3 * optimizer_scoring::delta_sweet_spot(a.delta, 0.20) +
                          0.2 * optimizer_scoring::upside_room(a.upside_to_strike);
        EXPECT_NEAR(a.score, expected, 1e-12) << "strike=" << a.strike;
    }
}

TEST_F(PremiumOptimizerTest, NonPositiveNetPremiumScoresZero) {
    // At $0.50 spot every OTM call is worth less than commission.
    PremiumOptimizer opt(config);
    auto ranked = opt.optimize(0.50, config.strike_candidates, {30}, 0.30);
    ASSERT_FALSE(ranked.empty());
    for (const auto& a : ranked) {
        EXPECT_LE(a.net_total_premium, 0.0);
        EXPECT_EQ(a.score, 0.0);
    }
}

TEST_F(PremiumOptimizerTest, TiesBreakByLowerDteThenCandidateOrder) {
    // Identical strikes score identically; all-zero scores tie across DTEs.
    PremiumOptimizer opt(config);
    auto ranked = opt.optimize(0.50, {3.00, 3.00, 2.50}, {45, 14}, 0.30);
    ASSERT_EQ(ranked.size(), 6u);
    EXPECT_EQ(ranked[0].dte, 14);
    EXPECT_EQ(ranked[0].candidate_index, 0);
    EXPECT_EQ(ranked[1].dte, 14);
    EXPECT_EQ(ranked[1].candidate_index, 1);
    EXPECT_EQ(ranked[2].dte, 14);
    EXPECT_EQ(ranked[2].candidate_index, 2);
    EXPECT_EQ(ranked[3].dte, 45);
    EXPECT_EQ(ranked[3].candidate_index, 0);
}

TEST_F(PremiumOptimizerTest, RepeatedOptimizationIsIdentical) {
    PremiumOptimizer opt(config);
    auto a = opt.optimize(SPOT, VOL);
    auto b = opt.optimize(SPOT, VOL);
    ASSERT_EQ(a.size(), b.size());
    for (size_t i = 0; i < a.size(); ++i) {
        EXPECT_EQ(a[i].strike, b[i].strike);
        EXPECT_EQ(a[i].dte, b[i].dte);
        EXPECT_EQ(a[i].score, b[i].score);
    }
}

TEST_F(PremiumOptimizerTest, UsesTargetDteWhenNoCandidates) {
    config.candidate_dtes.clear();
    config.target_dte = 21;
    PremiumOptimizer opt(config);
    for (const auto& a : opt.optimize(SPOT, VOL)) {
        EXPECT_EQ(a.dte, 21);
    }
}

TEST_F(PremiumOptimizerTest, OutOfRangeDeltaTargetRejected) {
    config.target_delta = 5.0;
    EXPECT_THROW(PremiumOptimizer{config}, InvalidInputError);
}

TEST_F(PremiumOptimizerTest, NegativeRateRejected) {
    config.risk_free_rate = -0.5;
    EXPECT_THROW(PremiumOptimizer{config}, InvalidInputError);
}

TEST_F(PremiumOptimizerTest, ZeroContractMultiplierRejected) {
    config.contract_multiplier = 0.0;
    EXPECT_THROW(PremiumOptimizer{config}, InvalidInputError);
}

// ===========================================================================
// 3. Scoring helpers
// ===========================================================================

TEST(OptimizerScoringTest, DeltaSweetSpotPeaksAtTarget) {
    EXPECT_DOUBLE_EQ(optimizer_scoring::delta_sweet_spot(0.20, 0.20), 1.0);
    EXPECT_NEAR(optimizer_scoring::delta_sweet_spot(0.30, 0.20), 0.7, 1e-12);
    EXPECT_DOUBLE_EQ(optimizer_scoring::delta_sweet_spot(0.90, 0.20), 0.1);
}

TEST(OptimizerScoringTest, UpsideRoomClamped) {
    EXPECT_DOUBLE_EQ(optimizer_scoring::upside_room(-0.1), 0.0);
    EXPECT_NEAR(optimizer_scoring::upside_room(0.15), 0.5, 1e-12);
    EXPECT_DOUBLE_EQ(optimizer_scoring::upside_room(0.60), 1.0);
}

// ===========================================================================
// 4. Report table
// ===========================================================================

TEST_F(PremiumOptimizerTest, FormatTableHonorsTopN) {
    PremiumOptimizer opt(config);
    auto ranked = opt.optimize(SPOT, VOL);
    std::string table = format_table(SPOT, VOL, ranked, 3);

    EXPECT_NE(table.find("Premium optimization for $2.00 (IV: 80.0%)"), std::string::npos);
    EXPECT_NE(table.find("Strike"), std::string::npos);
    size_t lines = 0;
    for (char c : table) lines += (c == '\n');
    EXPECT_EQ(lines, 3u + 3u);  // title, header, rule, 3 rows
}
