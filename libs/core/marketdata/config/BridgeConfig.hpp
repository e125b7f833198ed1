/*
SpreadBridge — BridgeConfig
Role: Loads venue credentials and runtime settings from a JSON file with environment overrides.
Inputs/Outputs: Reads 'bridge.json' (or a given path) and ANGEL_* env vars; outputs a BridgeConfig value.
Threading: Load once at startup on the calling thread; the result is immutable afterwards.
Integration: Consumed by BridgeContext, which hands each section to the component that needs it.
Observability: Logs the loaded path (never the secrets) via SpreadBridgeLogging.
Assumptions: Credentials are complete after overrides, otherwise loading throws.
*/
#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>
#include "../auth/CredentialStore.hpp"

struct RestSettings {
    std::string host = "apiconnect.angelone.in";
    std::string port = "443";
    std::string clientLocalIp = "127.0.0.1";
    std::string clientPublicIp = "127.0.0.1";
    std::string macAddress = "00:00:00:00:00:00";
    std::chrono::seconds timeout{15};
};

struct FeedSettings {
    std::string host = "smartapisocket.angelone.in";
    std::string port = "443";
    std::string path = "/smart-stream";
    std::string correlationId = "price_feed";
    int mode = 1;                                           // LTP
    std::chrono::milliseconds reconnectBackoff{10000};
    std::chrono::milliseconds heartbeatInterval{30000};
};

struct ServerSettings {
    std::string bindAddress = "0.0.0.0";
    std::uint16_t port = 8000;
    std::string path = "/ws";
    std::size_t maxPendingPerSubscriber = 256;
};

struct AnalysisSettings {
    int strikesRange = 8;
};

struct BridgeConfig {
    CredentialStore  credentials;
    RestSettings     rest;
    FeedSettings     feed;
    ServerSettings   server;
    AnalysisSettings analysis;

    /// Parse from JSON and apply ANGEL_* environment overrides. Throws std::runtime_error
    /// if credentials are incomplete afterwards.
    static BridgeConfig fromJson(const nlohmann::json& j, bool applyEnvironment = true);

    /// Load a JSON file. A missing file is allowed when the environment supplies every credential.
    static BridgeConfig load(const std::string& path = "bridge.json");
};
