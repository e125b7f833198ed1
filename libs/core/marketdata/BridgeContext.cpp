/*
SpreadBridge — BridgeContext
Role: Builds the component graph in dependency order and tears it down feed-first.
Assumptions: m_config is never mutated after construction; SessionManager keeps a reference to its credentials.
*/
#include "BridgeContext.hpp"
#include "MarketDataService.hpp"
#include "auth/SessionManager.hpp"
#include "rest/SmartApiClient.hpp"
#include "fanout/FanoutHub.hpp"
#include "analysis/SpreadMatcher.hpp"
#include "SpreadBridgeLogging.hpp"

BridgeContext::BridgeContext(BridgeConfig config,
                             std::unique_ptr<IVenueApi> api,
                             FeedConnection::TransportFactory feedTransport)
    : m_config(std::move(config))
    , m_api(std::move(api))
{
    if (!m_api) {
        m_api = std::make_unique<SmartApiClient>(m_config.credentials.apiKey, m_config.rest);
    }
    m_session = std::make_unique<SessionManager>(m_config.credentials, *m_api);
    m_matcher = std::make_unique<SpreadMatcher>();
    m_service = std::make_unique<MarketDataService>(*m_session, *m_api, *m_matcher);
    m_feed    = std::make_unique<FeedConnection>(*m_session, m_config.feed, std::move(feedTransport));
    m_hub     = std::make_unique<FanoutHub>(*m_feed);

    m_feed->setTickHandler([hub = m_hub.get()](const Tick& tick) { hub->broadcast(tick); });
    sbLog_App(QString("BridgeContext ready for client %1").arg(QString::fromStdString(m_config.credentials.clientCode)));
}

BridgeContext::~BridgeContext() {
    // The feed thread calls into the hub; it must be gone before the hub is.
    if (m_feed) {
        m_feed->stop();
        m_feed.reset();
    }
    m_hub.reset();
    sbLog_App("BridgeContext destroyed");
}

nlohmann::json BridgeContext::status() const {
    return {
        {"session_valid", m_session->isValid()},
        {"subscribers", m_hub->subscriberCount()},
        {"feed", {
            {"state", toString(m_feed->state())},
            {"ticks_forwarded", m_feed->ticksForwarded()},
            {"packets_dropped", m_feed->packetsDropped()},
            {"connection_attempts", m_feed->connectionAttempts()},
        }},
    };
}
