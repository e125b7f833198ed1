#pragma once
/*
SpreadBridge — SubscriberServer
Role: Downstream WebSocket listener; every accepted client becomes one FanoutHub channel.
Inputs/Outputs: Accepts plain WebSocket clients on bind:port/path; writes price_update frames to them,
                answers "ping" with "pong" and acknowledges any other text.
Threading: Runs its own io_context on a worker thread; each client session has its own strand and write queue.
Integration: Owned by the bridge executable; registers/unregisters sessions with FanoutHub.
Observability: Logs accepts, closes and dropped clients via SpreadBridgeLogging.
Assumptions: The FanoutHub outlives this object.
*/
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include "../config/BridgeConfig.hpp"

class FanoutHub;
class SubscriberSession;

class SubscriberServer {
public:
    SubscriberServer(FanoutHub& hub, ServerSettings settings);
    ~SubscriberServer();

    /// Bind, listen and start accepting. Throws boost::system::system_error if the port is unavailable.
    void start();

    /// Stop accepting, close every client and unregister it from the hub.
    void stop();

    /// Bound port (useful when configured with port 0).
    [[nodiscard]] std::uint16_t port() const { return m_boundPort.load(); }

    SubscriberServer(const SubscriberServer&)            = delete;
    SubscriberServer& operator=(const SubscriberServer&) = delete;

private:
    void doAccept();

    FanoutHub&     m_hub;
    ServerSettings m_settings;

    boost::asio::io_context        m_ioc;
    boost::asio::ip::tcp::acceptor m_acceptor{m_ioc};
    std::thread                    m_ioThread;
    std::atomic<bool>              m_running{false};
    std::atomic<std::uint16_t>     m_boundPort{0};

    std::mutex m_sessionsMx;
    std::vector<std::weak_ptr<SubscriberSession>> m_sessions;
};
