/*
SpreadBridge — FeedConnection
Role: Drives the upstream state machine Disconnected -> Connecting -> Subscribed -> Streaming.
Threading: All members below the thread plumbing are touched only from m_strand.
Observability: Lifecycle via sbLog_App/sbLog_Data; per-packet logging is throttled.
*/
#include "FeedConnection.hpp"
#include "../auth/SessionManager.hpp"
#include "../decode/BinaryFeedDecoder.hpp"
#include "../ws/BeastWsTransport.hpp"
#include "SpreadBridgeLogging.hpp"
#include "Cpp20Utils.hpp"
#include <boost/asio/post.hpp>
#include <future>

const char* toString(FeedState s) {
    switch (s) {
        case FeedState::Disconnected: return "disconnected";
        case FeedState::Connecting:   return "connecting";
        case FeedState::Subscribed:   return "subscribed";
        case FeedState::Streaming:    return "streaming";
    }
    return "unknown";
}

FeedConnection::FeedConnection(SessionManager& session, FeedSettings settings, TransportFactory factory)
    : m_session(session)
    , m_settings(std::move(settings))
    , m_factory(std::move(factory))
    , m_subscriptions(m_settings.correlationId, m_settings.mode)
{
    m_sslCtx.set_default_verify_paths();
    m_sslCtx.set_verify_mode(boost::asio::ssl::verify_peer);

    if (!m_factory) {
        m_factory = [](boost::asio::io_context& ioc, boost::asio::ssl::context& ctx) -> std::shared_ptr<WsTransport> {
            return std::make_shared<BeastWsTransport>(ioc, ctx);
        };
    }
    sbLog_App("FeedConnection initialized");
}

FeedConnection::~FeedConnection() {
    std::lock_guard<std::mutex> lock(m_threadMx);
    if (m_ioThread.joinable()) {
        // Tear the link down on the strand before the loop goes away.
        std::promise<void> done;
        auto stopped = done.get_future();
        boost::asio::post(m_strand, [this, &done]() {
            doStop();
            done.set_value();
        });
        stopped.wait();

        m_workGuard.reset();
        m_ioc.stop();
        m_ioThread.join();
    }
    sbLog_App("FeedConnection destroyed");
}

void FeedConnection::setTickHandler(TickHandler handler) {
    m_onTick = std::move(handler);
}

void FeedConnection::ensureIoThread() {
    std::lock_guard<std::mutex> lock(m_threadMx);
    if (m_ioThread.joinable()) return;
    m_workGuard.emplace(m_ioc.get_executor());
    m_ioThread = std::thread(&FeedConnection::run, this);
}

void FeedConnection::run() {
    sbLog_Data(QString("IO context running for feed (%1:%2)")
        .arg(QString::fromStdString(m_settings.host))
        .arg(QString::fromStdString(m_settings.port)));
    m_ioc.run();
    sbLog_Data("Feed IO context stopped");
}

void FeedConnection::start() {
    ensureIoThread();
    boost::asio::post(m_strand, [this]() { doStart(); });
}

void FeedConnection::stop() {
    boost::asio::post(m_strand, [this]() { doStop(); });
}

void FeedConnection::doStart() {
    if (m_wanted) return;
    m_wanted = true;
    sbLog_App("Starting upstream price feed...");
    beginConnect();
}

void FeedConnection::doStop() {
    if (!m_wanted && !m_link) return;
    m_wanted = false;
    m_reconnectTimer.cancel();
    teardown();
    sbLog_App("Upstream price feed stopped");
}

void FeedConnection::beginConnect() {
    if (!m_wanted) return;

    m_state.store(FeedState::Connecting);
    ++m_connectionAttempts;

    if (!m_session.ensureValid()) {
        scheduleReconnect("no valid venue session");
        return;
    }
    const Session session = m_session.snapshot();
    if (session.access_token.empty() || session.feed_token.empty()) {
        scheduleReconnect("missing feed authentication details");
        return;
    }

    const std::uint64_t generation = ++m_generation;
    auto transport = m_factory(m_ioc, m_sslCtx);
    transport->setHandshakeHeaders({
        {"Authorization", "Bearer " + session.access_token},
        {"x-api-key",     m_session.apiKey()},
        {"x-client-code", m_session.clientCode()},
        {"x-feed-token",  session.feed_token},
    });
    transport->onStatus([this, generation](bool up) {
        boost::asio::post(m_strand, [this, generation, up]() { onTransportStatus(generation, up); });
    });
    transport->onError([this, generation](std::string err) {
        boost::asio::post(m_strand, [this, generation, e = std::move(err)]() { onTransportError(generation, e); });
    });
    transport->onMessage([this, generation](std::string payload, bool binary) {
        boost::asio::post(m_strand, [this, generation, p = std::move(payload), binary]() {
            onTransportMessage(generation, p, binary);
        });
    });

    m_link = std::make_unique<Link>(Link{transport, boost::asio::steady_timer{m_strand}});

    sbLog_App(QString("Connecting to upstream feed %1 (attempt %2)")
        .arg(QString::fromStdString(m_settings.host))
        .arg(m_connectionAttempts.load()));
    transport->connect(m_settings.host, m_settings.port, buildTarget(session));
}

std::string FeedConnection::buildTarget(const Session& session) const {
    return m_settings.path
         + "?clientCode=" + m_session.clientCode()
         + "&feedToken=" + session.feed_token
         + "&apiKey=" + m_session.apiKey();
}

void FeedConnection::onTransportStatus(std::uint64_t generation, bool up) {
    if (generation != m_generation || !m_link) return;

    if (!up) {
        teardown();
        scheduleReconnect("transport down");
        return;
    }

    m_state.store(FeedState::Subscribed);
    m_link->transport->send(m_subscriptions.buildSubscribeMsg());
    sbLog_App("Subscribed to index LTP feed");

    m_state.store(FeedState::Streaming);
    scheduleHeartbeat();
}

void FeedConnection::onTransportError(std::uint64_t generation, const std::string& error) {
    if (generation != m_generation || !m_link) return;
    sbLog_Warning(QString::fromStdString(Cpp20Utils::formatErrorLog("Upstream feed", error)));
    teardown();
    scheduleReconnect(error);
}

void FeedConnection::onTransportMessage(std::uint64_t generation, const std::string& payload, bool binary) {
    if (generation != m_generation || !m_link) return;

    if (!binary) {
        if (payload == "pong") {
            sbLog_Data("Heartbeat acknowledged");
        } else {
            sbLog_Debug(QString("Upstream text frame: %1").arg(QString::fromStdString(payload)));
        }
        return;
    }

    try {
        auto tick = BinaryFeedDecoder::decode(std::string_view(payload), std::chrono::system_clock::now());
        if (!tick) {
            ++m_packetsDropped;
            return;
        }
        const auto count = ++m_ticksForwarded;
        sbLog_Data(QString::fromStdString(Cpp20Utils::formatTickLog(tick->symbol, tick->last_traded_price, count)));
        if (m_onTick) m_onTick(*tick);
    }
    catch (const std::exception& ex) {
        sbLog_Error(QString::fromStdString(Cpp20Utils::formatErrorLog("Feed message path", ex.what())));
        teardown();
        scheduleReconnect(ex.what());
    }
}

void FeedConnection::teardown() {
    ++m_generation;
    if (m_link) {
        // Heartbeat first: nothing may write to a transport that is closing.
        m_link->heartbeat.cancel();
        m_link->transport->close();
        m_link.reset();
    }
    m_state.store(FeedState::Disconnected);
}

void FeedConnection::scheduleReconnect(const std::string& reason) {
    m_state.store(FeedState::Disconnected);
    if (!m_wanted) return;

    sbLog_App(QString("Feed reconnect in %1ms (%2)")
        .arg(m_settings.reconnectBackoff.count())
        .arg(QString::fromStdString(reason)));

    const std::uint64_t generation = m_generation;
    m_reconnectTimer.expires_after(m_settings.reconnectBackoff);
    m_reconnectTimer.async_wait([this, generation](boost::system::error_code ec) {
        if (ec || !m_wanted || generation != m_generation) return;
        beginConnect();
    });
}

void FeedConnection::scheduleHeartbeat() {
    if (!m_link) return;
    const std::uint64_t generation = m_generation;
    m_link->heartbeat.expires_after(m_settings.heartbeatInterval);
    m_link->heartbeat.async_wait([this, generation](boost::system::error_code ec) {
        if (ec || generation != m_generation || !m_link) return;
        m_link->transport->send("ping");
        sbLog_Data("Sent heartbeat");
        scheduleHeartbeat();
    });
}
