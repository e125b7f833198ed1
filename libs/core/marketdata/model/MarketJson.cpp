#include "MarketJson.hpp"
#include "Cpp20Utils.hpp"

void to_json(nlohmann::json& j, const Tick& t) {
    j = nlohmann::json{
        {"instrument_id", t.instrument_id},
        {"symbol", t.symbol},
        {"ltp", t.last_traded_price},
        {"received_at", Cpp20Utils::formatIsoTimestamp(t.received_at)},
    };
}

void to_json(nlohmann::json& j, const OptionContract& c) {
    j = nlohmann::json{
        {"strike", c.strike},
        {"delta", c.delta},
        {"gamma", c.gamma},
        {"theta", c.theta},
        {"vega", c.vega},
        {"implied_volatility", c.implied_volatility},
        {"volume", c.volume},
        {"option_type", toString(c.option_type)},
        {"expiry", c.expiry},
        {"symbol", c.underlying_symbol},
    };
}

void to_json(nlohmann::json& j, const SpreadRecommendation& s) {
    j = nlohmann::json{
        {"type", toString(s.kind)},
        {"symbol", s.symbol},
        {"expiry", s.expiry},
        {"buy_strike", s.buy_strike},
        {"buy_premium", s.buy_premium},
        {"buy_delta", s.buy_delta},
        {"sell_strike", s.sell_strike},
        {"sell_premium", s.sell_premium},
        {"sell_delta", s.sell_delta},
        {"delta_difference", s.delta_difference},
        {"net_premium", s.net_premium},
        {"max_profit", s.max_profit},
        {"max_loss", s.max_loss},
        {"breakeven", s.breakeven},
        {"profit_per_100_up", s.profit_per_100_up},
        {"profit_per_100_down", s.profit_per_100_down},
        {"risk_reward_ratio", s.risk_reward_ratio},
        {"probability_profit", s.probability_profit},
        {"total_volume", s.total_volume},
        {"premium_estimated", s.premium_estimated},
    };
}

void to_json(nlohmann::json& j, const MoverRow& m) {
    j = nlohmann::json{
        {"trading_symbol", m.trading_symbol},
        {"symbol_token", m.symbol_token},
        {"percent_change", m.percent_change},
        {"ltp", m.ltp},
        {"net_change", m.net_change},
        {"open_interest", m.open_interest},
        {"net_change_open_interest", m.net_change_open_interest},
    };
}
