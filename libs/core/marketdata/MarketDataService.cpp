#include "MarketDataService.hpp"
#include "auth/SessionManager.hpp"
#include "rest/IVenueApi.hpp"
#include "rest/ResponseRecords.hpp"
#include "model/Instruments.hpp"
#include "analysis/SpreadMatcher.hpp"
#include "analysis/StrikeWindow.hpp"
#include "analysis/ExpiryCalendar.hpp"
#include "SpreadBridgeLogging.hpp"
#include "Cpp20Utils.hpp"
#include <algorithm>
#include <iterator>

namespace {

AuthError authRequired() {
    return AuthError(auth_codes::kClientNotLogin, "Authentication required");
}

template <std::size_t N>
bool oneOf(const std::string& value, const char* const (&allowed)[N]) {
    return std::any_of(std::begin(allowed), std::end(allowed), [&](const char* a) { return value == a; });
}

template <std::size_t N>
std::string joined(const char* const (&allowed)[N]) {
    std::string out;
    for (const char* a : allowed) {
        if (!out.empty()) out += ", ";
        out += a;
    }
    return out;
}

} // namespace

MarketDataService::MarketDataService(SessionManager& session, IVenueApi& api, const SpreadMatcher& matcher, Clock clock)
    : m_session(session)
    , m_api(api)
    , m_matcher(matcher)
    , m_clock(std::move(clock))
{}

bool MarketDataService::sessionReady() {
    return m_session.ensureValid();
}

Result<nlohmann::json> MarketDataService::callVenue(
    const char* what, const std::function<nlohmann::json(const std::string& accessToken)>& call) {
    if (!sessionReady()) {
        return Result<nlohmann::json>{std::in_place_type<AuthError>, authRequired()};
    }
    const Session session = m_session.snapshot();

    nlohmann::json reply;
    try {
        reply = call(session.access_token);
    }
    catch (const std::exception& ex) {
        sbLog_Warning(QString::fromStdString(Cpp20Utils::formatErrorLog(what, ex.what())));
        return Result<nlohmann::json>{std::in_place_type<AuthError>,
                                      AuthError(auth_codes::kInternal, std::string("Failed to ") + what + ": " + ex.what())};
    }

    if (auto err = records::venueFailure(reply)) {
        sbLog_Warning(QString::fromStdString(Cpp20Utils::formatErrorLog(what, err->what())));
        return Result<nlohmann::json>{std::in_place_type<AuthError>, std::move(*err)};
    }
    return Result<nlohmann::json>{std::in_place_type<nlohmann::json>, std::move(reply)};
}

Result<double> MarketDataService::currentPrice(const std::string& symbol) {
    if (!sessionReady()) return authRequired();

    const auto* info = instruments::findBySymbol(symbol);
    if (!info) {
        return ValidationError{"symbol", "Unsupported symbol: " + symbol};
    }

    auto reply = callVenue("fetch current price", [&](const std::string& token) {
        return m_api.ltpData(token, std::string(info->exchange), symbol, std::string(info->token));
    });
    if (auto* err = std::get_if<AuthError>(&reply)) return *err;

    const auto ltp = records::parseLtp(std::get<nlohmann::json>(reply));
    if (!ltp) {
        return AuthError(auth_codes::kInternal, "Failed to fetch current price: malformed LTP reply");
    }
    sbLog_Data(QString("Current %1 price: %2").arg(QString::fromStdString(symbol)).arg(*ltp));
    return *ltp;
}

Result<std::vector<OptionContract>> MarketDataService::optionChain(const std::string& symbol,
                                                                   std::optional<std::string> expiry) {
    if (!sessionReady()) return authRequired();
    if (symbol.empty()) {
        return ValidationError{"symbol", "Symbol must not be empty"};
    }

    if (!expiry || expiry->empty()) {
        const auto now = m_clock ? m_clock() : std::chrono::system_clock::now();
        expiry = ExpiryCalendar::nearestExpiry(symbol, ExpiryCalendar::exchangeDate(now));
    }

    auto reply = callVenue("fetch option Greeks", [&](const std::string& token) {
        return m_api.optionGreek(token, symbol, *expiry);
    });
    if (auto* err = std::get_if<AuthError>(&reply)) return *err;

    auto parsed = records::parseGreeksRows(std::get<nlohmann::json>(reply), symbol);
    if (parsed.dropped > 0) {
        sbLog_Analysis(QString("Skipped %1 invalid option rows for %2 %3")
            .arg(parsed.dropped)
            .arg(QString::fromStdString(symbol))
            .arg(QString::fromStdString(*expiry)));
    }
    return std::move(parsed.rows);
}

Result<std::vector<SpreadRecommendation>> MarketDataService::recommendations(const std::string& symbol,
                                                                              int strikesRange) {
    if (!sessionReady()) return authRequired();

    const auto* info = instruments::findBySymbol(symbol);
    if (!info) {
        return ValidationError{"symbol", "Symbol must be NIFTY or BANKNIFTY"};
    }
    if (strikesRange < 0) {
        return ValidationError{"strikes_range", "Must not be negative"};
    }

    auto price = currentPrice(symbol);
    if (auto* err = std::get_if<AuthError>(&price)) return *err;
    if (auto* err = std::get_if<ValidationError>(&price)) return *err;

    auto chain = optionChain(symbol);
    if (auto* err = std::get_if<AuthError>(&chain)) return *err;
    if (auto* err = std::get_if<ValidationError>(&chain)) return *err;

    const double spot = std::get<double>(price);
    const auto window = selectStrikeWindow(std::get<std::vector<OptionContract>>(chain), spot,
                                           info->strikeInterval, strikesRange);
    sbLog_Analysis(QString("Found %1 relevant options for %2").arg(window.size()).arg(QString::fromStdString(symbol)));
    if (window.empty()) {
        return std::vector<SpreadRecommendation>{};
    }
    return m_matcher.match(window, spot);
}

Result<std::vector<MoverRow>> MarketDataService::gainersLosers(const std::string& dataType, const std::string& expiryType) {
    if (!sessionReady()) return authRequired();

    if (!oneOf(dataType, mover_query::kDataTypes)) {
        return ValidationError{"data_type", "Must be one of: " + joined(mover_query::kDataTypes)};
    }
    if (!oneOf(expiryType, mover_query::kExpiryTypes)) {
        return ValidationError{"expiry_type", "Must be one of: " + joined(mover_query::kExpiryTypes)};
    }

    auto reply = callVenue("fetch top gainers/losers", [&](const std::string& token) {
        return m_api.gainersLosers(token, dataType, expiryType);
    });
    if (auto* err = std::get_if<AuthError>(&reply)) return *err;

    auto parsed = records::parseMoverRows(std::get<nlohmann::json>(reply));
    if (parsed.dropped > 0) {
        sbLog_Analysis(QString("Skipped %1 invalid gainer/loser rows").arg(parsed.dropped));
    }
    return std::move(parsed.rows);
}

Result<std::map<std::string, double>> MarketDataService::prices() {
    if (!sessionReady()) return authRequired();

    std::map<std::string, double> out;
    for (const auto& index : instruments::kIndices) {
        const std::string symbol(index.symbol);
        auto price = currentPrice(symbol);
        if (auto* err = std::get_if<AuthError>(&price)) return *err;
        if (auto* err = std::get_if<ValidationError>(&price)) return *err;
        out.emplace(symbol, std::get<double>(price));
    }
    return out;
}
