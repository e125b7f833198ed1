#include "SpreadMatcher.hpp"
#include "marketdata/model/Instruments.hpp"
#include "SpreadBridgeLogging.hpp"
#include <algorithm>
#include <cmath>

SpreadMatcher::SpreadMatcher(MatcherConfig config)
    : m_config(config)
{}

std::optional<double> SpreadMatcher::atmStrike(std::span<const OptionContract> legs, double currentPrice) {
    if (legs.empty()) return std::nullopt;

    const OptionContract* best = &legs.front();
    double bestDistance = std::fabs(best->strike - currentPrice);
    for (const auto& leg : legs.subspan(1)) {
        const double distance = std::fabs(leg.strike - currentPrice);
        if (distance < bestDistance) {
            best = &leg;
            bestDistance = distance;
        }
    }
    return best->strike;
}

bool SpreadMatcher::inBand(double deltaDiff) const {
    return deltaDiff >= m_config.minDeltaDiff - m_config.bandEpsilon
        && deltaDiff <= m_config.maxDeltaDiff + m_config.bandEpsilon;
}

SpreadRecommendation SpreadMatcher::makeSpread(SpreadKind kind,
                                               const OptionContract& buy,
                                               const OptionContract& sell,
                                               double deltaDiff) const {
    const double lot = instruments::lotSizeFor(buy.underlying_symbol);
    const double net = m_config.netPremium;
    const bool bullish = (kind == SpreadKind::BullCallDebit);
    const double strikeDiff = std::fabs(sell.strike - buy.strike);

    SpreadRecommendation s;
    s.kind = kind;
    s.symbol = buy.underlying_symbol;
    s.expiry = buy.expiry;

    s.buy_strike = buy.strike;
    s.buy_premium = net;
    s.buy_delta = buy.delta;

    s.sell_strike = sell.strike;
    s.sell_premium = net * m_config.sellPremiumRatio;
    s.sell_delta = sell.delta;

    s.delta_difference = deltaDiff;
    s.net_premium = net;
    s.max_profit = (strikeDiff - net) * lot;
    s.max_loss = net * lot;
    s.breakeven = bullish ? buy.strike + net : buy.strike - net;

    const double perHundred = deltaDiff * 100.0 * lot;
    s.profit_per_100_up = bullish ? perHundred : -perHundred;
    s.profit_per_100_down = bullish ? -perHundred : perHundred;

    s.risk_reward_ratio = s.max_loss > 0.0 ? s.max_profit / s.max_loss : 0.0;
    s.probability_profit = std::fabs(buy.delta) * 100.0;
    s.total_volume = buy.volume + sell.volume;
    s.premium_estimated = true;
    return s;
}

std::vector<SpreadRecommendation> SpreadMatcher::bullCallSpreads(std::span<const OptionContract> calls,
                                                                 double currentPrice) const {
    std::vector<SpreadRecommendation> out;
    const auto atm = atmStrike(calls, currentPrice);
    if (!atm) return out;

    auto buyIt = std::find_if(calls.begin(), calls.end(), [&](const OptionContract& c) { return c.strike == *atm; });
    if (buyIt == calls.end()) return out;
    const OptionContract& buy = *buyIt;

    for (const auto& sell : calls) {
        if (sell.option_type != OptionType::Call || sell.strike <= buy.strike) continue;
        const double deltaDiff = buy.delta - sell.delta;
        if (inBand(deltaDiff)) {
            out.push_back(makeSpread(SpreadKind::BullCallDebit, buy, sell, deltaDiff));
        }
    }
    return out;
}

std::vector<SpreadRecommendation> SpreadMatcher::bearPutSpreads(std::span<const OptionContract> puts,
                                                                double currentPrice) const {
    std::vector<SpreadRecommendation> out;
    const auto atm = atmStrike(puts, currentPrice);
    if (!atm) return out;

    auto buyIt = std::find_if(puts.begin(), puts.end(), [&](const OptionContract& p) { return p.strike == *atm; });
    if (buyIt == puts.end()) return out;
    const OptionContract& buy = *buyIt;

    for (const auto& sell : puts) {
        if (sell.option_type != OptionType::Put || sell.strike >= buy.strike) continue;
        const double deltaDiff = std::fabs(buy.delta) - std::fabs(sell.delta);
        if (inBand(deltaDiff)) {
            out.push_back(makeSpread(SpreadKind::BearPutDebit, buy, sell, deltaDiff));
        }
    }
    return out;
}

std::vector<SpreadRecommendation> SpreadMatcher::match(std::span<const OptionContract> contracts,
                                                       double currentPrice) const {
    std::vector<OptionContract> calls;
    std::vector<OptionContract> puts;
    for (const auto& c : contracts) {
        (c.option_type == OptionType::Call ? calls : puts).push_back(c);
    }

    sbLog_Analysis(QString("Analyzing %1 calls and %2 puts").arg(calls.size()).arg(puts.size()));

    auto spreads = bullCallSpreads(calls, currentPrice);
    auto bearPuts = bearPutSpreads(puts, currentPrice);
    spreads.insert(spreads.end(), std::make_move_iterator(bearPuts.begin()), std::make_move_iterator(bearPuts.end()));

    std::stable_sort(spreads.begin(), spreads.end(), [](const SpreadRecommendation& a, const SpreadRecommendation& b) {
        return a.risk_reward_ratio > b.risk_reward_ratio;
    });

    sbLog_Analysis(QString("Found %1 spread opportunities").arg(spreads.size()));
    if (spreads.size() > m_config.maxResults) {
        spreads.resize(m_config.maxResults);
    }
    return spreads;
}
