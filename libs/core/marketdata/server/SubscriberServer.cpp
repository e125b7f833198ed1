#include "SubscriberServer.hpp"
#include "../fanout/FanoutHub.hpp"
#include "../fanout/ISubscriberChannel.hpp"
#include "SpreadBridgeLogging.hpp"
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/version.hpp>
#include <deque>
#include <optional>

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

// One downstream client. deliver() may be called from any thread; everything
// touching the stream runs on the session strand.
class SubscriberSession : public ISubscriberChannel,
                          public std::enable_shared_from_this<SubscriberSession> {
public:
    SubscriberSession(tcp::socket socket, FanoutHub& hub, const ServerSettings& settings)
        : ws_(std::move(socket))
        , hub_(hub)
        , path_(settings.path)
        , maxPending_(settings.maxPendingPerSubscriber)
    {}

    void run() {
        net::dispatch(ws_.get_executor(), [self = shared_from_this()]() { self->doHandshake(); });
    }

    bool deliver(const std::string& message) override {
        if (!open_.load()) return false;
        if (pending_.load() > maxPending_) {
            sbLog_Warning(QString("Subscriber has %1 undelivered messages, closing").arg(pending_.load()));
            shutdown();
            return false;
        }
        ++pending_;
        net::post(ws_.get_executor(), [self = shared_from_this(), m = message]() mutable {
            self->writeQueue_.emplace_back(std::move(m));
            if (self->writeQueue_.size() == 1) self->doWrite();
        });
        return true;
    }

    // Mark closed, leave the hub, then drop the socket on the session strand.
    void shutdown() {
        if (!open_.exchange(false)) return;
        detach();
        net::post(ws_.get_executor(), [self = shared_from_this()]() {
            // A write may be in flight, so cancel at the socket rather than start a close handshake.
            beast::error_code ignored;
            beast::get_lowest_layer(self->ws_).socket().close(ignored);
        });
    }

    // Leave the hub without touching the stream (used once the io thread is gone).
    void detach() {
        std::optional<SubscriptionToken> token;
        {
            std::lock_guard<std::mutex> lock(tokenMx_);
            token.swap(token_);
        }
        if (token) hub_.unsubscribe(*token);
    }

private:
    void doHandshake() {
        ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
        ws_.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
            res.set(beast::http::field::server, std::string(BOOST_BEAST_VERSION_STRING) + " spreadbridge");
        }));

        // Read the upgrade request first so the path can be checked.
        beast::http::async_read(ws_.next_layer(), buf_, req_,
            [self = shared_from_this()](beast::error_code ec, std::size_t) { self->onUpgradeRequest(ec); });
    }

    void onUpgradeRequest(beast::error_code ec) {
        if (ec) { open_.store(false); return; }
        std::string target(req_.target());
        target = target.substr(0, target.find('?'));
        if (!websocket::is_upgrade(req_) || target != path_) {
            sbLog_Warning(QString("Rejected downstream request for %1").arg(QString::fromStdString(target)));
            open_.store(false);
            beast::error_code ignored;
            ws_.next_layer().socket().shutdown(tcp::socket::shutdown_both, ignored);
            return;
        }
        ws_.async_accept(req_, [self = shared_from_this()](beast::error_code ec) { self->onAccept(ec); });
    }

    void onAccept(beast::error_code ec) {
        if (ec) {
            sbLog_Data(QString("Downstream handshake failed: %1").arg(QString::fromStdString(ec.message())));
            open_.store(false);
            return;
        }
        {
            std::lock_guard<std::mutex> lock(tokenMx_);
            token_ = hub_.subscribe(shared_from_this());
        }
        doRead();
    }

    void doRead() {
        ws_.async_read(buf_, [self = shared_from_this()](beast::error_code ec, std::size_t) { self->onRead(ec); });
    }

    void onRead(beast::error_code ec) {
        if (ec) {
            if (ec != websocket::error::closed) {
                sbLog_Data(QString("Downstream read ended: %1").arg(QString::fromStdString(ec.message())));
            }
            open_.store(false);
            detach();
            return;
        }

        const std::string text = beast::buffers_to_string(buf_.data());
        buf_.consume(buf_.size());

        std::string reply = (text == "ping") ? std::string("pong") : "Message received: " + text;
        ++pending_;
        writeQueue_.emplace_back(std::move(reply));
        if (writeQueue_.size() == 1) doWrite();

        doRead();
    }

    void doWrite() {
        if (writeQueue_.empty()) return;
        ws_.text(true);
        ws_.async_write(net::buffer(writeQueue_.front()),
            [self = shared_from_this()](beast::error_code ec, std::size_t) {
                --self->pending_;
                self->writeQueue_.pop_front();
                if (ec) {
                    self->open_.store(false);
                    self->detach();
                    return;
                }
                if (!self->writeQueue_.empty()) self->doWrite();
            });
    }

    websocket::stream<beast::tcp_stream> ws_;
    beast::flat_buffer buf_;
    beast::http::request<beast::http::string_body> req_;
    std::deque<std::string> writeQueue_;

    FanoutHub& hub_;
    std::string path_;
    std::size_t maxPending_;

    std::atomic<bool> open_{true};
    std::atomic<std::size_t> pending_{0};
    std::mutex tokenMx_;
    std::optional<SubscriptionToken> token_;
};

SubscriberServer::SubscriberServer(FanoutHub& hub, ServerSettings settings)
    : m_hub(hub)
    , m_settings(std::move(settings))
{}

SubscriberServer::~SubscriberServer() {
    stop();
}

void SubscriberServer::start() {
    if (m_running.exchange(true)) return;

    try {
        const tcp::endpoint endpoint{net::ip::make_address(m_settings.bindAddress), m_settings.port};
        m_acceptor.open(endpoint.protocol());
        m_acceptor.set_option(net::socket_base::reuse_address(true));
        m_acceptor.bind(endpoint);
        m_acceptor.listen(net::socket_base::max_listen_connections);
        m_boundPort.store(m_acceptor.local_endpoint().port());
    } catch (const boost::system::system_error& ex) {
        sbLog_Error(QString("Subscriber server cannot listen: %1").arg(ex.what()));
        beast::error_code ignored;
        m_acceptor.close(ignored);
        m_running.store(false);
        throw;
    }

    sbLog_App(QString("Subscriber server listening on ws://%1:%2%3")
        .arg(QString::fromStdString(m_settings.bindAddress))
        .arg(m_boundPort.load())
        .arg(QString::fromStdString(m_settings.path)));

    doAccept();
    m_ioThread = std::thread([this]() { m_ioc.run(); });
}

void SubscriberServer::stop() {
    if (!m_running.exchange(false)) return;

    m_ioc.stop();
    if (m_ioThread.joinable()) m_ioThread.join();

    beast::error_code ignored;
    m_acceptor.close(ignored);

    std::vector<std::weak_ptr<SubscriberSession>> sessions;
    {
        std::lock_guard<std::mutex> lock(m_sessionsMx);
        sessions.swap(m_sessions);
    }
    for (auto& weak : sessions) {
        if (auto session = weak.lock()) session->detach();
    }
    sbLog_App("Subscriber server stopped");
}

void SubscriberServer::doAccept() {
    m_acceptor.async_accept(net::make_strand(m_ioc),
        [this](beast::error_code ec, tcp::socket socket) {
            if (ec) {
                if (ec != net::error::operation_aborted) {
                    sbLog_Warning(QString("Accept failed: %1").arg(QString::fromStdString(ec.message())));
                    doAccept();
                }
                return;
            }
            auto session = std::make_shared<SubscriberSession>(std::move(socket), m_hub, m_settings);
            {
                std::lock_guard<std::mutex> lock(m_sessionsMx);
                std::erase_if(m_sessions, [](const auto& w) { return w.expired(); });
                m_sessions.push_back(session);
            }
            session->run();
            doAccept();
        });
}
