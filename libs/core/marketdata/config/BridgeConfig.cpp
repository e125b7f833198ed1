#include "BridgeConfig.hpp"
#include "SpreadBridgeLogging.hpp"
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace {

void overrideFromEnv(std::string& field, const char* name) {
    if (const char* v = std::getenv(name); v && *v) {
        field = v;
    }
}

std::chrono::milliseconds millisOr(const nlohmann::json& j, const char* key, std::chrono::milliseconds def) {
    const auto v = j.value(key, static_cast<std::int64_t>(def.count()));
    if (v <= 0) {
        throw std::runtime_error(std::string("BridgeConfig: '") + key + "' must be positive");
    }
    return std::chrono::milliseconds{v};
}

} // namespace

BridgeConfig BridgeConfig::fromJson(const nlohmann::json& j, bool applyEnvironment) {
    BridgeConfig cfg;

    try {
        if (auto it = j.find("credentials"); it != j.end() && it->is_object()) {
            const auto& c = *it;
            cfg.credentials.apiKey     = c.value("api_key", "");
            cfg.credentials.clientCode = c.value("client_code", "");
            cfg.credentials.password   = c.value("password", "");
            cfg.credentials.totpSecret = c.value("totp_secret", "");
        }

        if (auto it = j.find("rest"); it != j.end() && it->is_object()) {
            const auto& r = *it;
            cfg.rest.host           = r.value("host", cfg.rest.host);
            cfg.rest.port           = r.value("port", cfg.rest.port);
            cfg.rest.clientLocalIp  = r.value("client_local_ip", cfg.rest.clientLocalIp);
            cfg.rest.clientPublicIp = r.value("client_public_ip", cfg.rest.clientPublicIp);
            cfg.rest.macAddress     = r.value("mac_address", cfg.rest.macAddress);
            cfg.rest.timeout        = std::chrono::seconds{r.value("timeout_s", static_cast<std::int64_t>(cfg.rest.timeout.count()))};
        }

        if (auto it = j.find("feed"); it != j.end() && it->is_object()) {
            const auto& f = *it;
            cfg.feed.host              = f.value("host", cfg.feed.host);
            cfg.feed.port              = f.value("port", cfg.feed.port);
            cfg.feed.path              = f.value("path", cfg.feed.path);
            cfg.feed.correlationId     = f.value("correlation_id", cfg.feed.correlationId);
            cfg.feed.mode              = f.value("mode", cfg.feed.mode);
            cfg.feed.reconnectBackoff  = millisOr(f, "reconnect_backoff_ms", cfg.feed.reconnectBackoff);
            cfg.feed.heartbeatInterval = millisOr(f, "heartbeat_interval_ms", cfg.feed.heartbeatInterval);
        }

        if (auto it = j.find("server"); it != j.end() && it->is_object()) {
            const auto& s = *it;
            cfg.server.bindAddress = s.value("bind", cfg.server.bindAddress);
            cfg.server.port        = s.value("port", cfg.server.port);
            cfg.server.path        = s.value("path", cfg.server.path);
            cfg.server.maxPendingPerSubscriber = s.value("max_pending", cfg.server.maxPendingPerSubscriber);
        }

        if (auto it = j.find("analysis"); it != j.end() && it->is_object()) {
            cfg.analysis.strikesRange = it->value("strikes_range", cfg.analysis.strikesRange);
        }
    }
    catch (const nlohmann::json::exception& ex) {
        throw std::runtime_error(std::string("BridgeConfig: malformed field: ") + ex.what());
    }

    if (applyEnvironment) {
        overrideFromEnv(cfg.credentials.apiKey,     "ANGEL_API_KEY");
        overrideFromEnv(cfg.credentials.clientCode, "ANGEL_CLIENT_CODE");
        overrideFromEnv(cfg.credentials.password,   "ANGEL_PASSWORD");
        overrideFromEnv(cfg.credentials.totpSecret, "ANGEL_TOTP_TOKEN");
    }

    if (cfg.credentials.apiKey.empty())     throw std::runtime_error("BridgeConfig: missing credentials.api_key (ANGEL_API_KEY)");
    if (cfg.credentials.clientCode.empty()) throw std::runtime_error("BridgeConfig: missing credentials.client_code (ANGEL_CLIENT_CODE)");
    if (cfg.credentials.password.empty())   throw std::runtime_error("BridgeConfig: missing credentials.password (ANGEL_PASSWORD)");
    if (cfg.credentials.totpSecret.empty()) throw std::runtime_error("BridgeConfig: missing credentials.totp_secret (ANGEL_TOTP_TOKEN)");
    if (cfg.analysis.strikesRange < 1)      throw std::runtime_error("BridgeConfig: analysis.strikes_range must be >= 1");

    return cfg;
}

BridgeConfig BridgeConfig::load(const std::string& path) {
    nlohmann::json j = nlohmann::json::object();

    std::ifstream file(path);
    if (file.is_open()) {
        try {
            file >> j;
        }
        catch (const std::exception& ex) {
            throw std::runtime_error("BridgeConfig: failed to parse JSON from " + path + ": " + ex.what());
        }
        sbLog_App(QString("Loaded configuration from %1").arg(QString::fromStdString(path)));
    } else {
        sbLog_Warning(QString("Config file %1 not found, relying on environment").arg(QString::fromStdString(path)));
    }

    return fromJson(j);
}
