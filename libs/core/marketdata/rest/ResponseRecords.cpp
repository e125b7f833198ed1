#include "ResponseRecords.hpp"
#include "Cpp20Utils.hpp"
#include <cmath>

namespace records {

namespace {

bool truthy(const nlohmann::json& reply, const char* key) {
    auto it = reply.find(key);
    return it != reply.end() && it->is_boolean() && it->get<bool>();
}

std::string errorCodeOf(const nlohmann::json& reply) {
    for (const char* key : {"errorcode", "errorCode"}) {
        if (auto code = Cpp20Utils::textField(reply, key)) return *code;
    }
    return auth_codes::kNotSpecified;
}

std::string messageOf(const nlohmann::json& reply) {
    auto it = reply.find("message");
    if (it != reply.end() && it->is_string()) return it->get<std::string>();
    return {};
}

// [-2^63, 2^63): the doubles whose truncation is representable as std::int64_t.
bool fitsInt64(double v) {
    constexpr double kLimit = 9223372036854775808.0;
    return v >= -kLimit && v < kLimit;
}

} // namespace

std::optional<AuthError> venueFailure(const nlohmann::json& reply) {
    if (!reply.is_object()) {
        return AuthError(auth_codes::kInternal, "Malformed venue reply");
    }
    auto it = reply.find("status");
    if (it != reply.end() && it->is_boolean() && !it->get<bool>()) {
        return AuthError(errorCodeOf(reply), messageOf(reply));
    }
    return std::nullopt;
}

namespace {

LoginReply malformedLogin() {
    LoginReply out;
    out.errorCode = auth_codes::kInternal;
    out.message = "Malformed login response";
    return out;
}

LoginReply parseTokenReply(const nlohmann::json& reply, bool requireAllTokens) {
    if (!reply.is_object()) return malformedLogin();

    if (!truthy(reply, "status") && !truthy(reply, "success")) {
        LoginReply out;
        out.errorCode = errorCodeOf(reply);
        out.message = messageOf(reply);
        return out;
    }

    const auto data = reply.find("data");
    if (data == reply.end() || !data->is_object()) return malformedLogin();

    auto jwt = Cpp20Utils::textField(*data, "jwtToken");
    auto refresh = Cpp20Utils::textField(*data, "refreshToken");
    auto feed = Cpp20Utils::textField(*data, "feedToken");
    if (!jwt || jwt->empty()) return malformedLogin();
    // A login must yield a complete session; a refresh may omit tokens that did not rotate.
    if (requireAllTokens && (!refresh || refresh->empty() || !feed || feed->empty())) {
        return malformedLogin();
    }

    LoginReply out;
    out.ok = true;
    out.jwtToken = std::move(*jwt);
    out.refreshToken = refresh.value_or("");
    out.feedToken = feed.value_or("");
    return out;
}

} // namespace

LoginReply parseLoginReply(const nlohmann::json& reply) {
    return parseTokenReply(reply, true);
}

LoginReply parseRefreshReply(const nlohmann::json& reply) {
    return parseTokenReply(reply, false);
}

std::optional<double> parseLtp(const nlohmann::json& reply) {
    if (!reply.is_object()) return std::nullopt;
    auto data = reply.find("data");
    if (data == reply.end()) return std::nullopt;
    return Cpp20Utils::numberField(*data, "ltp");
}

std::optional<OptionContract> parseGreeksRow(const nlohmann::json& row, const std::string& underlying) {
    if (!row.is_object()) return std::nullopt;

    const auto strike = Cpp20Utils::numberField(row, "strikePrice");
    const auto delta  = Cpp20Utils::numberField(row, "delta");
    const auto gamma  = Cpp20Utils::numberField(row, "gamma");
    const auto theta  = Cpp20Utils::numberField(row, "theta");
    const auto vega   = Cpp20Utils::numberField(row, "vega");
    const auto iv     = Cpp20Utils::numberField(row, "impliedVolatility");
    const auto volume = Cpp20Utils::numberField(row, "tradeVolume");
    const auto type   = Cpp20Utils::textField(row, "optionType");
    if (!strike || !delta || !gamma || !theta || !vega || !iv || !volume || !type) {
        return std::nullopt;
    }
    if (!fitsInt64(*volume)) return std::nullopt;

    OptionContract c;
    c.strike = *strike;
    c.delta = std::fabs(*delta);
    c.gamma = *gamma;
    c.theta = *theta;
    c.vega = *vega;
    c.implied_volatility = *iv;
    c.volume = static_cast<std::int64_t>(*volume);
    c.option_type = (*type == "CE") ? OptionType::Call : OptionType::Put;
    c.expiry = Cpp20Utils::textField(row, "expiry").value_or("");
    c.underlying_symbol = underlying;
    return c;
}

ParsedRows<OptionContract> parseGreeksRows(const nlohmann::json& reply, const std::string& underlying) {
    ParsedRows<OptionContract> out;
    if (!reply.is_object()) return out;
    auto data = reply.find("data");
    if (data == reply.end() || !data->is_array()) return out;

    out.rows.reserve(data->size());
    for (const auto& row : *data) {
        if (auto c = parseGreeksRow(row, underlying)) {
            out.rows.push_back(std::move(*c));
        } else {
            ++out.dropped;
        }
    }
    return out;
}

std::optional<MoverRow> parseMoverRow(const nlohmann::json& row) {
    if (!row.is_object()) return std::nullopt;

    auto symbol = Cpp20Utils::textField(row, "tradingSymbol");
    auto token = Cpp20Utils::textField(row, "symbolToken");
    const auto pct = Cpp20Utils::numberField(row, "percentChange");
    if (!symbol || !token || !pct) return std::nullopt;

    MoverRow m;
    m.trading_symbol = std::move(*symbol);
    m.symbol_token = std::move(*token);
    m.percent_change = *pct;
    m.ltp = Cpp20Utils::numberField(row, "ltp").value_or(0.0);
    m.net_change = Cpp20Utils::numberField(row, "netChange").value_or(0.0);
    m.open_interest = Cpp20Utils::numberField(row, "opnInterest").value_or(0.0);
    m.net_change_open_interest = Cpp20Utils::numberField(row, "netChangeOpnInterest").value_or(0.0);
    return m;
}

ParsedRows<MoverRow> parseMoverRows(const nlohmann::json& reply) {
    ParsedRows<MoverRow> out;
    if (!reply.is_object()) return out;
    auto data = reply.find("data");
    if (data == reply.end() || !data->is_array()) return out;

    for (const auto& row : *data) {
        if (auto m = parseMoverRow(row)) {
            out.rows.push_back(std::move(*m));
        } else {
            ++out.dropped;
        }
    }
    return out;
}

} // namespace records
