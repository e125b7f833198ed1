#ifndef MARKETTYPES_H
#define MARKETTYPES_H

#include <chrono>
#include <cstdint>
#include <string>

// Option leg side, as the venue reports it ("CE" / "PE")
enum class OptionType {
    Call,
    Put
};

enum class SpreadKind {
    BullCallDebit,
    BearPutDebit
};

// Venue session credentials. Either fully populated or fully empty.
struct Session
{
    std::string access_token;   // venue "jwtToken"
    std::string refresh_token;
    std::string feed_token;
    std::chrono::system_clock::time_point expires_at{};

    [[nodiscard]] bool populated() const {
        return !access_token.empty() && expires_at != std::chrono::system_clock::time_point{};
    }
};

// One decoded upstream price packet
struct Tick
{
    std::string instrument_id;  // venue token, e.g. "99926000"
    std::string symbol;         // e.g. "NIFTY"
    double last_traded_price = 0.0;
    std::chrono::system_clock::time_point received_at;
};

// One row of an option Greeks snapshot. Delta is stored as a magnitude.
struct OptionContract
{
    double strike = 0.0;
    double delta = 0.0;
    double gamma = 0.0;
    double theta = 0.0;
    double vega = 0.0;
    double implied_volatility = 0.0;
    std::int64_t volume = 0;
    OptionType option_type = OptionType::Call;
    std::string expiry;
    std::string underlying_symbol;
};

// Two-leg debit spread drawn from a single snapshot.
// Premium figures are estimates: the Greeks source carries no live premium quote.
struct SpreadRecommendation
{
    SpreadKind kind = SpreadKind::BullCallDebit;
    std::string symbol;
    std::string expiry;

    // Buy leg
    double buy_strike = 0.0;
    double buy_premium = 0.0;
    double buy_delta = 0.0;

    // Sell leg
    double sell_strike = 0.0;
    double sell_premium = 0.0;
    double sell_delta = 0.0;

    double delta_difference = 0.0;
    double net_premium = 0.0;
    double max_profit = 0.0;
    double max_loss = 0.0;
    double breakeven = 0.0;

    double profit_per_100_up = 0.0;
    double profit_per_100_down = 0.0;

    double risk_reward_ratio = 0.0;
    double probability_profit = 0.0;

    std::int64_t total_volume = 0;
    bool premium_estimated = true;
};

// Top gainers/losers row (derivatives segment)
struct MoverRow
{
    std::string trading_symbol;
    std::string symbol_token;
    double percent_change = 0.0;
    double ltp = 0.0;
    double net_change = 0.0;
    double open_interest = 0.0;
    double net_change_open_interest = 0.0;
};

inline const char* toString(OptionType t) {
    return t == OptionType::Call ? "CE" : "PE";
}

inline const char* toString(SpreadKind k) {
    return k == SpreadKind::BullCallDebit ? "Bull Call Spread" : "Bear Put Spread";
}

#endif // MARKETTYPES_H
