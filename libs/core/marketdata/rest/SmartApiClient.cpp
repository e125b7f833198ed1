#include "SmartApiClient.hpp"
#include "SpreadBridgeLogging.hpp"
#include <stdexcept>

SmartApiClient::SmartApiClient(std::string apiKey, const RestSettings& settings)
    : m_apiKey(std::move(apiKey))
    , m_settings(settings)
    , m_http(settings.host, settings.port, settings.timeout)
{
    sbLog_App(QString("SmartApiClient targeting %1:%2")
        .arg(QString::fromStdString(m_settings.host))
        .arg(QString::fromStdString(m_settings.port)));
}

HttpsClient::Headers SmartApiClient::baseHeaders(const std::string& accessToken) const {
    HttpsClient::Headers headers{
        {"X-PrivateKey",     m_apiKey},
        {"X-UserType",       "USER"},
        {"X-SourceID",       "WEB"},
        {"X-ClientLocalIP",  m_settings.clientLocalIp},
        {"X-ClientPublicIP", m_settings.clientPublicIp},
        {"X-MACAddress",     m_settings.macAddress},
    };
    if (!accessToken.empty()) {
        headers.emplace_back("Authorization", "Bearer " + accessToken);
    }
    return headers;
}

nlohmann::json SmartApiClient::call(const char* route, const nlohmann::json& body, const std::string& accessToken) {
    HttpResponse res;
    {
        std::lock_guard<std::mutex> lock(m_callMx);
        res = m_http.post(route, body.dump(), baseHeaders(accessToken));
    }
    sbLog_Data(QString("POST %1 -> HTTP %2").arg(QString::fromLatin1(route)).arg(res.status));

    auto reply = nlohmann::json::parse(res.body, nullptr, false);
    if (reply.is_discarded() || !reply.is_object()) {
        throw std::runtime_error("HTTP " + std::to_string(res.status) + " with non-JSON body from " + route);
    }
    return reply;
}

nlohmann::json SmartApiClient::loginByPassword(const std::string& clientCode,
                                               const std::string& password,
                                               const std::string& totp) {
    return call(smartapi_routes::kLogin,
                {{"clientcode", clientCode}, {"password", password}, {"totp", totp}},
                {});
}

nlohmann::json SmartApiClient::generateTokens(const std::string& refreshToken,
                                              const std::string& accessToken) {
    return call(smartapi_routes::kGenerateToken, {{"refreshToken", refreshToken}}, accessToken);
}

nlohmann::json SmartApiClient::logout(const std::string& clientCode, const std::string& accessToken) {
    return call(smartapi_routes::kLogout, {{"clientcode", clientCode}}, accessToken);
}

nlohmann::json SmartApiClient::ltpData(const std::string& accessToken,
                                       const std::string& exchange,
                                       const std::string& tradingSymbol,
                                       const std::string& symbolToken) {
    return call(smartapi_routes::kLtpData,
                {{"exchange", exchange}, {"tradingsymbol", tradingSymbol}, {"symboltoken", symbolToken}},
                accessToken);
}

nlohmann::json SmartApiClient::optionGreek(const std::string& accessToken,
                                           const std::string& name,
                                           const std::string& expiry) {
    return call(smartapi_routes::kOptionGreek, {{"name", name}, {"expirydate", expiry}}, accessToken);
}

nlohmann::json SmartApiClient::gainersLosers(const std::string& accessToken,
                                             const std::string& dataType,
                                             const std::string& expiryType) {
    return call(smartapi_routes::kGainersLosers, {{"datatype", dataType}, {"expirytype", expiryType}}, accessToken);
}
