/*
SpreadBridge — Strike Window Tests
Role: Verify ATM rounding and the ±range grid filter applied before matching
Testing Strategy: Small synthetic chains → assert selected strikes and ordering
Coverage: Half-even ATM, range bounds, off-grid strikes, (strike, type) ordering, invalid interval
*/
#include <gtest/gtest.h>
#include "analysis/StrikeWindow.hpp"
#include <stdexcept>
#include <vector>

namespace {

OptionContract contract(double strike, OptionType type) {
    OptionContract c;
    c.strike = strike;
    c.option_type = type;
    c.underlying_symbol = "NIFTY";
    return c;
}

std::vector<double> strikesOf(const std::vector<OptionContract>& v) {
    std::vector<double> out;
    for (const auto& c : v) out.push_back(c.strike);
    return out;
}

std::vector<OptionContract> callGrid(double from, double to, double step) {
    std::vector<OptionContract> out;
    for (double s = from; s <= to; s += step) out.push_back(contract(s, OptionType::Call));
    return out;
}

} // namespace

TEST(StrikeWindow, CentresOnNearestGridStrike) {
    auto chain = callGrid(21800, 22200, 50);
    auto window = selectStrikeWindow(chain, 22061.0, 50, 1);
    EXPECT_EQ(strikesOf(window), (std::vector<double>{22000, 22050, 22100}));
}

TEST(StrikeWindow, HalfwayRoundsToEvenMultiple) {
    auto chain = callGrid(21800, 22200, 50);

    // 22025 / 50 = 440.5 -> 440
    EXPECT_EQ(strikesOf(selectStrikeWindow(chain, 22025.0, 50, 0)), (std::vector<double>{22000}));
    // 22075 / 50 = 441.5 -> 442
    EXPECT_EQ(strikesOf(selectStrikeWindow(chain, 22075.0, 50, 0)), (std::vector<double>{22100}));
}

TEST(StrikeWindow, DropsOffGridStrikes) {
    std::vector<OptionContract> chain{
        contract(22000, OptionType::Call),
        contract(22025, OptionType::Call),
        contract(22050, OptionType::Call),
    };
    auto window = selectStrikeWindow(chain, 22000.0, 50, 2);
    EXPECT_EQ(strikesOf(window), (std::vector<double>{22000, 22050}));
}

TEST(StrikeWindow, SortsByStrikeThenCallBeforePut) {
    std::vector<OptionContract> chain{
        contract(22100, OptionType::Put),
        contract(22000, OptionType::Put),
        contract(22100, OptionType::Call),
        contract(22000, OptionType::Call),
    };

    auto window = selectStrikeWindow(chain, 22000.0, 100, 1);
    ASSERT_EQ(window.size(), 4u);
    EXPECT_DOUBLE_EQ(window[0].strike, 22000.0);
    EXPECT_EQ(window[0].option_type, OptionType::Call);
    EXPECT_EQ(window[1].option_type, OptionType::Put);
    EXPECT_DOUBLE_EQ(window[2].strike, 22100.0);
    EXPECT_EQ(window[2].option_type, OptionType::Call);
    EXPECT_EQ(window[3].option_type, OptionType::Put);
}

TEST(StrikeWindow, NoMatchingStrikesGivesEmpty) {
    auto chain = callGrid(21000, 21200, 50);
    EXPECT_TRUE(selectStrikeWindow(chain, 22000.0, 50, 2).empty());
}

TEST(StrikeWindow, NegativeRangeGivesEmpty) {
    auto chain = callGrid(21800, 22200, 50);
    EXPECT_TRUE(selectStrikeWindow(chain, 22000.0, 50, -1).empty());
}

TEST(StrikeWindow, NonPositiveIntervalThrows) {
    auto chain = callGrid(21800, 22200, 50);
    EXPECT_THROW(selectStrikeWindow(chain, 22000.0, 0, 2), std::invalid_argument);
    EXPECT_THROW(selectStrikeWindow(chain, 22000.0, -50, 2), std::invalid_argument);
}
