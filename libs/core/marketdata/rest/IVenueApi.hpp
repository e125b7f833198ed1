#pragma once
#include <string>
#include <nlohmann/json.hpp>

// Raw venue REST surface. Each call returns the venue's JSON reply untouched;
// typed parsing happens in ResponseRecords. Implementations may throw on transport faults.
class IVenueApi {
public:
    virtual ~IVenueApi() = default;

    virtual nlohmann::json loginByPassword(const std::string& clientCode,
                                           const std::string& password,
                                           const std::string& totp) = 0;

    virtual nlohmann::json generateTokens(const std::string& refreshToken,
                                          const std::string& accessToken) = 0;

    virtual nlohmann::json logout(const std::string& clientCode,
                                  const std::string& accessToken) = 0;

    virtual nlohmann::json ltpData(const std::string& accessToken,
                                   const std::string& exchange,
                                   const std::string& tradingSymbol,
                                   const std::string& symbolToken) = 0;

    virtual nlohmann::json optionGreek(const std::string& accessToken,
                                       const std::string& name,
                                       const std::string& expiry) = 0;

    virtual nlohmann::json gainersLosers(const std::string& accessToken,
                                         const std::string& dataType,
                                         const std::string& expiryType) = 0;
};
