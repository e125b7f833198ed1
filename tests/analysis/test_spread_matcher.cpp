/*
SpreadBridge — SpreadMatcher Tests
Role: Verify bull call / bear put pairing, the delta band, derived metrics and ranking
Testing Strategy: Hand-built Greeks snapshots → assert recommendation fields exactly
Coverage: ATM selection, band edges, lot sizes, ordering, truncation, empty and one-sided input
*/
#include <gtest/gtest.h>
#include "analysis/SpreadMatcher.hpp"
#include <vector>

namespace {

OptionContract leg(double strike, OptionType type, double delta, std::int64_t volume = 1000,
                   const std::string& symbol = "NIFTY") {
    OptionContract c;
    c.strike = strike;
    c.option_type = type;
    c.delta = delta;
    c.volume = volume;
    c.expiry = "25JAN2024";
    c.underlying_symbol = symbol;
    return c;
}

OptionContract call(double strike, double delta, std::int64_t volume = 1000) {
    return leg(strike, OptionType::Call, delta, volume);
}

OptionContract put(double strike, double delta, std::int64_t volume = 1000) {
    return leg(strike, OptionType::Put, delta, volume);
}

} // namespace

// =============================================================================
// ATM Strike
// =============================================================================

TEST(SpreadMatcherAtm, EmptySetHasNoAtm) {
    std::vector<OptionContract> none;
    EXPECT_FALSE(SpreadMatcher::atmStrike(none, 22000.0).has_value());
}

TEST(SpreadMatcherAtm, ClosestStrikeWins) {
    std::vector<OptionContract> legs{call(21900, 0.6), call(22000, 0.5), call(22100, 0.4)};
    EXPECT_DOUBLE_EQ(*SpreadMatcher::atmStrike(legs, 22030.0), 22000.0);
}

TEST(SpreadMatcherAtm, FirstMinimumWinsOnTie) {
    std::vector<OptionContract> legs{call(22050, 0.45), call(21950, 0.55)};
    EXPECT_DOUBLE_EQ(*SpreadMatcher::atmStrike(legs, 22000.0), 22050.0);
}

// =============================================================================
// Bull Call Spreads
// =============================================================================

TEST(SpreadMatcherBull, DeltaBandIsInclusiveAtBothEdges) {
    SpreadMatcher matcher;
    std::vector<OptionContract> calls{
        call(22000, 0.50),
        call(22050, 0.40),   // 0.10, below band
        call(22100, 0.35),   // 0.15, lower edge
        call(22200, 0.24),   // 0.26, upper edge
        call(22250, 0.20),   // 0.30, above band
    };

    auto spreads = matcher.bullCallSpreads(calls, 22000.0);
    ASSERT_EQ(spreads.size(), 2u);
    EXPECT_DOUBLE_EQ(spreads[0].sell_strike, 22100.0);
    EXPECT_DOUBLE_EQ(spreads[1].sell_strike, 22200.0);
}

TEST(SpreadMatcherBull, BandEdgeToleratesRepresentationErrorOnly) {
    SpreadMatcher matcher;
    // 0.41 - 0.26 evaluates to 0.14999999999999997 in binary floating point
    std::vector<OptionContract> atEdge{call(22000, 0.41), call(22100, 0.26)};
    ASSERT_LT(0.41 - 0.26, 0.15);
    ASSERT_EQ(matcher.bullCallSpreads(atEdge, 22000.0).size(), 1u);

    // A real shortfall is still outside the band
    std::vector<OptionContract> below{call(22000, 0.41), call(22100, 0.2601)};
    EXPECT_TRUE(matcher.bullCallSpreads(below, 22000.0).empty());

    std::vector<OptionContract> above{call(22000, 0.50), call(22100, 0.2399)};
    EXPECT_TRUE(matcher.bullCallSpreads(above, 22000.0).empty());
}

TEST(SpreadMatcherBull, SellLegMustBeAboveBuyLeg) {
    SpreadMatcher matcher;
    std::vector<OptionContract> calls{call(21900, 0.70), call(22000, 0.50)};
    EXPECT_TRUE(matcher.bullCallSpreads(calls, 22000.0).empty());
}

TEST(SpreadMatcherBull, MetricsForNifty) {
    SpreadMatcher matcher;
    std::vector<OptionContract> calls{call(22000, 0.50, 1200), call(22100, 0.35, 800)};

    auto spreads = matcher.bullCallSpreads(calls, 22010.0);
    ASSERT_EQ(spreads.size(), 1u);
    const auto& s = spreads[0];

    EXPECT_EQ(s.kind, SpreadKind::BullCallDebit);
    EXPECT_EQ(s.symbol, "NIFTY");
    EXPECT_EQ(s.expiry, "25JAN2024");
    EXPECT_DOUBLE_EQ(s.buy_strike, 22000.0);
    EXPECT_DOUBLE_EQ(s.buy_delta, 0.50);
    EXPECT_DOUBLE_EQ(s.sell_delta, 0.35);
    EXPECT_NEAR(s.delta_difference, 0.15, 1e-12);
    EXPECT_DOUBLE_EQ(s.net_premium, 50.0);
    EXPECT_DOUBLE_EQ(s.buy_premium, 50.0);
    EXPECT_DOUBLE_EQ(s.sell_premium, 30.0);
    EXPECT_DOUBLE_EQ(s.max_profit, 3750.0);    // (100 - 50) * 75
    EXPECT_DOUBLE_EQ(s.max_loss, 3750.0);
    EXPECT_DOUBLE_EQ(s.breakeven, 22050.0);
    EXPECT_NEAR(s.profit_per_100_up, 1125.0, 1e-6);
    EXPECT_NEAR(s.profit_per_100_down, -1125.0, 1e-6);
    EXPECT_DOUBLE_EQ(s.risk_reward_ratio, 1.0);
    EXPECT_DOUBLE_EQ(s.probability_profit, 50.0);
    EXPECT_EQ(s.total_volume, 2000);
    EXPECT_TRUE(s.premium_estimated);
}

// =============================================================================
// Bear Put Spreads
// =============================================================================

TEST(SpreadMatcherBear, MetricsForBankNifty) {
    SpreadMatcher matcher;
    std::vector<OptionContract> puts{
        leg(48000, OptionType::Put, 0.50, 500, "BANKNIFTY"),
        leg(47800, OptionType::Put, 0.30, 700, "BANKNIFTY"),
    };

    auto spreads = matcher.bearPutSpreads(puts, 48020.0);
    ASSERT_EQ(spreads.size(), 1u);
    const auto& s = spreads[0];

    EXPECT_EQ(s.kind, SpreadKind::BearPutDebit);
    EXPECT_DOUBLE_EQ(s.buy_strike, 48000.0);
    EXPECT_DOUBLE_EQ(s.sell_strike, 47800.0);
    EXPECT_NEAR(s.delta_difference, 0.20, 1e-12);
    EXPECT_DOUBLE_EQ(s.max_profit, 5250.0);    // (200 - 50) * 35
    EXPECT_DOUBLE_EQ(s.max_loss, 1750.0);
    EXPECT_DOUBLE_EQ(s.breakeven, 47950.0);
    EXPECT_NEAR(s.profit_per_100_up, -700.0, 1e-6);
    EXPECT_NEAR(s.profit_per_100_down, 700.0, 1e-6);
    EXPECT_DOUBLE_EQ(s.risk_reward_ratio, 3.0);
    EXPECT_EQ(s.total_volume, 1200);
}

TEST(SpreadMatcherBear, SellLegMustBeBelowBuyLeg) {
    SpreadMatcher matcher;
    std::vector<OptionContract> puts{put(22000, 0.50), put(22100, 0.70)};
    EXPECT_TRUE(matcher.bearPutSpreads(puts, 22000.0).empty());
}

TEST(SpreadMatcherBear, UnknownSymbolUsesDefaultLotSize) {
    SpreadMatcher matcher;
    std::vector<OptionContract> puts{
        leg(1000, OptionType::Put, 0.50, 10, "FINNIFTY"),
        leg(900, OptionType::Put, 0.30, 10, "FINNIFTY"),
    };

    auto spreads = matcher.bearPutSpreads(puts, 1000.0);
    ASSERT_EQ(spreads.size(), 1u);
    EXPECT_DOUBLE_EQ(spreads[0].max_loss, 2500.0);   // 50 * 50
}

// =============================================================================
// Match: Combination, Ranking, Truncation
// =============================================================================

TEST(SpreadMatcherMatch, EmptySnapshotGivesNothing) {
    SpreadMatcher matcher;
    std::vector<OptionContract> none;
    EXPECT_TRUE(matcher.match(none, 22000.0).empty());
}

TEST(SpreadMatcherMatch, CallsOnlyStillMatches) {
    SpreadMatcher matcher;
    std::vector<OptionContract> calls{call(22000, 0.50), call(22100, 0.30)};

    auto spreads = matcher.match(calls, 22000.0);
    ASSERT_EQ(spreads.size(), 1u);
    EXPECT_EQ(spreads[0].kind, SpreadKind::BullCallDebit);
}

TEST(SpreadMatcherMatch, SortedByRiskRewardWithStableTies) {
    SpreadMatcher matcher;
    std::vector<OptionContract> snapshot{
        call(22000, 0.50), call(22100, 0.30), call(22200, 0.26),
        put(22000, 0.50), put(21900, 0.30),
    };

    auto spreads = matcher.match(snapshot, 22000.0);
    ASSERT_EQ(spreads.size(), 3u);

    EXPECT_EQ(spreads[0].kind, SpreadKind::BullCallDebit);
    EXPECT_DOUBLE_EQ(spreads[0].sell_strike, 22200.0);
    EXPECT_DOUBLE_EQ(spreads[0].risk_reward_ratio, 3.0);

    // Equal ratios keep bull-before-bear insertion order
    EXPECT_EQ(spreads[1].kind, SpreadKind::BullCallDebit);
    EXPECT_DOUBLE_EQ(spreads[1].sell_strike, 22100.0);
    EXPECT_EQ(spreads[2].kind, SpreadKind::BearPutDebit);
    EXPECT_DOUBLE_EQ(spreads[2].sell_strike, 21900.0);
}

TEST(SpreadMatcherMatch, TruncatesToTenBest) {
    SpreadMatcher matcher;
    std::vector<OptionContract> calls{call(22000, 0.50)};
    for (int i = 1; i <= 12; ++i) {
        calls.push_back(call(22000 + 50 * i, 0.30));
    }

    auto spreads = matcher.match(calls, 22000.0);
    ASSERT_EQ(spreads.size(), 10u);
    EXPECT_DOUBLE_EQ(spreads.front().sell_strike, 22600.0);
    EXPECT_DOUBLE_EQ(spreads.back().sell_strike, 22150.0);
}

TEST(SpreadMatcherMatch, CustomConfigChangesBandAndLimit) {
    MatcherConfig cfg;
    cfg.minDeltaDiff = 0.05;
    cfg.maxDeltaDiff = 0.10;
    cfg.maxResults = 1;
    SpreadMatcher matcher(cfg);

    std::vector<OptionContract> calls{call(22000, 0.50), call(22050, 0.45), call(22100, 0.40), call(22150, 0.30)};

    auto spreads = matcher.match(calls, 22000.0);
    ASSERT_EQ(spreads.size(), 1u);
    EXPECT_DOUBLE_EQ(spreads[0].sell_strike, 22100.0);
}
