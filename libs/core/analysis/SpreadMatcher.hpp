/*
SpreadBridge — SpreadMatcher
Role: Turns one option Greeks snapshot plus the underlying price into ranked two-leg debit spreads.
Inputs/Outputs: Takes OptionContracts and a current price; returns at most maxResults SpreadRecommendations.
Threading: Stateless after construction; match() is const and safe to call concurrently.
Performance: O(n) per leg type; snapshots are a few dozen rows after strike windowing.
Integration: Owned by BridgeContext; called by MarketDataService::recommendations().
Observability: Logs leg counts and accepted pairs through the analysis category.
Assumptions: Deltas are magnitudes; premiums are estimates (premium_estimated is always set).
*/
#pragma once
#include <optional>
#include <span>
#include <vector>
#include "marketdata/model/MarketTypes.h"

struct MatcherConfig {
    double minDeltaDiff    = 0.15;
    double maxDeltaDiff    = 0.26;
    double netPremium      = 50.0;   // estimated debit; the Greeks feed carries no premium quote
    double sellPremiumRatio = 0.6;   // sell leg premium as a share of netPremium
    std::size_t maxResults = 10;
    double bandEpsilon     = 1e-9;
};

class SpreadMatcher {
public:
    explicit SpreadMatcher(MatcherConfig config = {});

    /// Bull call + bear put candidates, stable-sorted by risk/reward (best first), truncated.
    [[nodiscard]] std::vector<SpreadRecommendation> match(std::span<const OptionContract> contracts,
                                                          double currentPrice) const;

    /// Every bull call pair for the ATM call; `calls` must hold calls only.
    [[nodiscard]] std::vector<SpreadRecommendation> bullCallSpreads(std::span<const OptionContract> calls,
                                                                    double currentPrice) const;

    /// Every bear put pair for the ATM put; `puts` must hold puts only.
    [[nodiscard]] std::vector<SpreadRecommendation> bearPutSpreads(std::span<const OptionContract> puts,
                                                                   double currentPrice) const;

    /// Strike closest to currentPrice; the first minimum wins. std::nullopt for an empty set.
    [[nodiscard]] static std::optional<double> atmStrike(std::span<const OptionContract> legs, double currentPrice);

    [[nodiscard]] const MatcherConfig& config() const { return m_config; }

private:
    [[nodiscard]] bool inBand(double deltaDiff) const;
    [[nodiscard]] SpreadRecommendation makeSpread(SpreadKind kind,
                                                  const OptionContract& buy,
                                                  const OptionContract& sell,
                                                  double deltaDiff) const;

    MatcherConfig m_config;
};
