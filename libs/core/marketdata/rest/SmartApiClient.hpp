/*
SpreadBridge — SmartApiClient
Role: HTTPS implementation of IVenueApi for the Angel One SmartAPI REST routes.
Inputs/Outputs: Takes typed call arguments; returns the venue's JSON reply.
Threading: Calls are serialized internally; safe to use from several threads.
Integration: Owned by BridgeContext; used by SessionManager and MarketDataService.
Observability: Logs each route and HTTP status via SpreadBridgeLogging (data category).
Assumptions: The venue answers JSON on every route, including failures.
*/
#pragma once
#include <mutex>
#include <string>
#include "IVenueApi.hpp"
#include "HttpsClient.hpp"
#include "../config/BridgeConfig.hpp"

namespace smartapi_routes {
    inline constexpr const char* kLogin         = "/rest/auth/angelbroking/user/v1/loginByPassword";
    inline constexpr const char* kGenerateToken = "/rest/auth/angelbroking/jwt/v1/generateTokens";
    inline constexpr const char* kLogout        = "/rest/secure/angelbroking/user/v1/logout";
    inline constexpr const char* kLtpData       = "/rest/secure/angelbroking/order/v1/getLtpData";
    inline constexpr const char* kOptionGreek   = "/rest/secure/angelbroking/marketData/v1/optionGreek";
    inline constexpr const char* kGainersLosers = "/rest/secure/angelbroking/marketData/v1/gainersLosers";
}

class SmartApiClient : public IVenueApi {
public:
    SmartApiClient(std::string apiKey, const RestSettings& settings);

    nlohmann::json loginByPassword(const std::string& clientCode,
                                   const std::string& password,
                                   const std::string& totp) override;
    nlohmann::json generateTokens(const std::string& refreshToken,
                                  const std::string& accessToken) override;
    nlohmann::json logout(const std::string& clientCode,
                          const std::string& accessToken) override;
    nlohmann::json ltpData(const std::string& accessToken,
                           const std::string& exchange,
                           const std::string& tradingSymbol,
                           const std::string& symbolToken) override;
    nlohmann::json optionGreek(const std::string& accessToken,
                               const std::string& name,
                               const std::string& expiry) override;
    nlohmann::json gainersLosers(const std::string& accessToken,
                                 const std::string& dataType,
                                 const std::string& expiryType) override;

private:
    nlohmann::json call(const char* route, const nlohmann::json& body, const std::string& accessToken);
    HttpsClient::Headers baseHeaders(const std::string& accessToken) const;

    std::string  m_apiKey;
    RestSettings m_settings;
    std::mutex   m_callMx;   // HttpsClient owns a single io_context
    HttpsClient  m_http;
};
