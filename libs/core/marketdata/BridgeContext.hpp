#pragma once
/*
SpreadBridge — BridgeContext
Role: Owns and wires the whole bridge: venue client, session, matcher, REST service, upstream feed and fan-out hub.
Inputs/Outputs: Takes a BridgeConfig; exposes the service, hub and session to the executables plus a status report.
Threading: Construction and destruction on the caller's thread; the feed and hub run their own threads/locks.
Performance: Simple ownership and delegation; cost lives in the owned components.
Integration: Instantiated once by spreadbridge_server and spread_scan.
Observability: Logs lifecycle via SpreadBridgeLogging; status() reports session, feed and subscriber state.
Related: BridgeContext.cpp, MarketDataService.hpp, FeedConnection.hpp, FanoutHub.hpp.
Assumptions: Exclusive ownership of every component; the feed is stopped before anything it references dies.
*/
#include <memory>
#include <nlohmann/json.hpp>
#include "config/BridgeConfig.hpp"
#include "feed/FeedConnection.hpp"
#include "rest/IVenueApi.hpp"

class SessionManager;
class SpreadMatcher;
class MarketDataService;
class FanoutHub;

class BridgeContext {
public:
    /// A null api builds the HTTPS SmartApiClient; an empty factory builds the Beast feed transport.
    explicit BridgeContext(BridgeConfig config,
                           std::unique_ptr<IVenueApi> api = {},
                           FeedConnection::TransportFactory feedTransport = {});
    ~BridgeContext();

    [[nodiscard]] const BridgeConfig& config() const { return m_config; }
    [[nodiscard]] SessionManager&    session()  { return *m_session; }
    [[nodiscard]] MarketDataService& service()  { return *m_service; }
    [[nodiscard]] FanoutHub&         hub()      { return *m_hub; }
    [[nodiscard]] FeedConnection&    feed()     { return *m_feed; }

    /// {"session_valid":..,"subscribers":..,"feed":{"state":..,"ticks_forwarded":..,...}}
    [[nodiscard]] nlohmann::json status() const;

    // Non-copyable, non-movable (components hold references into each other)
    BridgeContext(const BridgeContext&) = delete;
    BridgeContext& operator=(const BridgeContext&) = delete;
    BridgeContext(BridgeContext&&) = delete;
    BridgeContext& operator=(BridgeContext&&) = delete;

private:
    BridgeConfig                       m_config;
    std::unique_ptr<IVenueApi>         m_api;
    std::unique_ptr<SessionManager>    m_session;
    std::unique_ptr<SpreadMatcher>     m_matcher;
    std::unique_ptr<MarketDataService> m_service;
    std::unique_ptr<FeedConnection>    m_feed;
    std::unique_ptr<FanoutHub>         m_hub;
};
