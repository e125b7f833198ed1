#pragma once
#include <span>
#include <vector>
#include "marketdata/model/MarketTypes.h"

// Contracts whose strike is ATM + i*interval for i in [-range, range], where
// ATM = round-half-even(currentPrice / interval) * interval. Sorted by (strike, option type).
std::vector<OptionContract> selectStrikeWindow(std::span<const OptionContract> contracts,
                                               double currentPrice,
                                               int strikeInterval,
                                               int range);
