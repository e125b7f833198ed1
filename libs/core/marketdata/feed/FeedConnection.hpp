#pragma once
/*
SpreadBridge — FeedConnection
Role: Owns the single upstream price-feed WebSocket: connect, subscribe, heartbeat, decode, reconnect.
Inputs/Outputs: Takes a SessionManager for credentials; emits decoded Ticks through the tick handler.
Threading: Runs a Boost.Asio io_context on a dedicated worker thread; every state change happens on one strand.
           start()/stop() only post to that strand and never block.
Performance: Hot path is BinaryFeedDecoder plus one tick handler call per packet; data logging is throttled.
Integration: Created and owned by BridgeContext; FanoutHub drives start()/stop() by subscriber count.
Observability: Logs lifecycle via SpreadBridgeLogging; exposes state and counters for status reports.
Related: FeedConnection.cpp, BeastWsTransport.hpp, SubscriptionManager.hpp, BinaryFeedDecoder.hpp.
Assumptions: The SessionManager outlives this object; the tick handler is set before the first start().
*/
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/ssl/context.hpp>
#include "IFeedControl.hpp"
#include "../config/BridgeConfig.hpp"
#include "../model/MarketTypes.h"
#include "../ws/WsTransport.hpp"
#include "../ws/SubscriptionManager.hpp"

class SessionManager;

enum class FeedState {
    Disconnected,
    Connecting,
    Subscribed,
    Streaming
};

const char* toString(FeedState s);

class FeedConnection : public IFeedControl {
public:
    using TickHandler = std::function<void(const Tick&)>;
    using TransportFactory = std::function<std::shared_ptr<WsTransport>(boost::asio::io_context&,
                                                                        boost::asio::ssl::context&)>;

    FeedConnection(SessionManager& session, FeedSettings settings, TransportFactory factory = {});
    ~FeedConnection() override;

    void setTickHandler(TickHandler handler);

    void start() override;
    void stop() override;

    [[nodiscard]] FeedState state() const { return m_state.load(); }
    [[nodiscard]] std::uint64_t ticksForwarded() const { return m_ticksForwarded.load(); }
    [[nodiscard]] std::uint64_t packetsDropped() const { return m_packetsDropped.load(); }
    [[nodiscard]] std::uint64_t connectionAttempts() const { return m_connectionAttempts.load(); }

    // Non-copyable, non-movable (manages thread)
    FeedConnection(const FeedConnection&) = delete;
    FeedConnection& operator=(const FeedConnection&) = delete;

private:
    // One upstream connection: the transport and the heartbeat that must die with it.
    struct Link {
        std::shared_ptr<WsTransport> transport;
        boost::asio::steady_timer heartbeat;
    };

    void ensureIoThread();
    void run();

    // Strand-only
    void doStart();
    void doStop();
    void beginConnect();
    void onTransportStatus(std::uint64_t generation, bool up);
    void onTransportError(std::uint64_t generation, const std::string& error);
    void onTransportMessage(std::uint64_t generation, const std::string& payload, bool binary);
    void teardown();
    void scheduleReconnect(const std::string& reason);
    void scheduleHeartbeat();
    std::string buildTarget(const Session& session) const;

    SessionManager&     m_session;
    FeedSettings        m_settings;
    TransportFactory    m_factory;
    TickHandler         m_onTick;
    SubscriptionManager m_subscriptions;

    boost::asio::io_context m_ioc;
    boost::asio::ssl::context m_sslCtx{boost::asio::ssl::context::tlsv12_client};
    boost::asio::strand<boost::asio::io_context::executor_type> m_strand{m_ioc.get_executor()};
    boost::asio::steady_timer m_reconnectTimer{m_strand};
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> m_workGuard;
    std::thread m_ioThread;
    std::mutex  m_threadMx;

    std::unique_ptr<Link> m_link;
    std::uint64_t m_generation = 0;   // bumped per attempt and teardown; stale callbacks compare against it
    bool m_wanted = false;

    std::atomic<FeedState>     m_state{FeedState::Disconnected};
    std::atomic<std::uint64_t> m_ticksForwarded{0};
    std::atomic<std::uint64_t> m_packetsDropped{0};
    std::atomic<std::uint64_t> m_connectionAttempts{0};
};
