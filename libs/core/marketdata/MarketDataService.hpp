#pragma once
/*
SpreadBridge — MarketDataService
Role: REST-facing collaborator: ensures a valid session, fetches venue data, parses it, and runs the matcher.
Inputs/Outputs: Symbols and query parameters in; Result<T> values out (AuthError / ValidationError on failure).
Threading: Stateless apart from its collaborators; safe to call from several threads (SessionManager serializes logins).
Performance: One blocking HTTPS round trip per venue call; recommendations() makes two.
Integration: Owned by BridgeContext; used by spread_scan and available to any embedding surface.
Observability: Logs fetch failures and dropped snapshot rows via SpreadBridgeLogging.
Related: SessionManager.hpp, IVenueApi.hpp, ResponseRecords.hpp, SpreadMatcher.hpp, StrikeWindow.hpp.
Assumptions: SessionManager, IVenueApi and SpreadMatcher outlive this object.
*/
#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "model/MarketTypes.h"
#include "model/Result.hpp"

class SessionManager;
class IVenueApi;
class SpreadMatcher;

namespace mover_query {
    inline constexpr const char* kDataTypes[]   = {"PercPriceGainers", "PercPriceLosers", "PercOIGainers", "PercOILosers"};
    inline constexpr const char* kExpiryTypes[] = {"NEAR", "NEXT", "FAR"};
}

class MarketDataService {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    static constexpr int kDefaultStrikesRange = 8;

    MarketDataService(SessionManager& session, IVenueApi& api, const SpreadMatcher& matcher, Clock clock = {});

    Result<double> currentPrice(const std::string& symbol);

    /// Expiry defaults to the nearest listed expiry for the symbol.
    Result<std::vector<OptionContract>> optionChain(const std::string& symbol,
                                                    std::optional<std::string> expiry = std::nullopt);

    /// NIFTY or BANKNIFTY only. An empty strike window yields an empty result.
    Result<std::vector<SpreadRecommendation>> recommendations(const std::string& symbol,
                                                              int strikesRange = kDefaultStrikesRange);

    Result<std::vector<MoverRow>> gainersLosers(const std::string& dataType, const std::string& expiryType = "NEAR");

    /// Current price of every known index, keyed by symbol.
    Result<std::map<std::string, double>> prices();

    MarketDataService(const MarketDataService&)            = delete;
    MarketDataService& operator=(const MarketDataService&) = delete;

private:
    Result<nlohmann::json> callVenue(const char* what,
                                     const std::function<nlohmann::json(const std::string& accessToken)>& call);
    [[nodiscard]] bool sessionReady();

    SessionManager&      m_session;
    IVenueApi&           m_api;
    const SpreadMatcher& m_matcher;
    Clock                m_clock;
};
