#include "HttpsClient.hpp"
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace {

constexpr std::chrono::seconds kShutdownGrace{1};

// One request/response exchange driven asynchronously on the caller's io_context.
// Lives on the caller's stack; the caller runs the context until finished() or aborts it.
class PostExchange {
public:
    PostExchange(net::io_context& ioc, ssl::context& sslCtx, std::chrono::seconds timeout,
                 http::request<http::string_body> req)
        : resolver_(ioc)
        , stream_(ioc, sslCtx)
        , timeout_(timeout)
        , req_(std::move(req))
    {}

    beast::ssl_stream<beast::tcp_stream>& stream() { return stream_; }

    void start(const std::string& host, const std::string& port) {
        resolver_.async_resolve(host, port, beast::bind_front_handler(&PostExchange::onResolve, this));
    }

    void abort() {
        resolver_.cancel();
        beast::get_lowest_layer(stream_).close();
    }

    [[nodiscard]] bool finished() const { return finished_; }
    [[nodiscard]] const beast::error_code& error() const { return ec_; }
    http::response<http::string_body>& response() { return res_; }

private:
    void finish(beast::error_code ec) {
        ec_ = ec;
        finished_ = true;
    }

    void onResolve(beast::error_code ec, tcp::resolver::results_type results) {
        if (ec) return finish(ec);
        beast::get_lowest_layer(stream_).expires_after(timeout_);
        beast::get_lowest_layer(stream_).async_connect(results,
            beast::bind_front_handler(&PostExchange::onConnect, this));
    }

    void onConnect(beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
        if (ec) return finish(ec);
        stream_.async_handshake(ssl::stream_base::client,
            beast::bind_front_handler(&PostExchange::onHandshake, this));
    }

    void onHandshake(beast::error_code ec) {
        if (ec) return finish(ec);
        http::async_write(stream_, req_, beast::bind_front_handler(&PostExchange::onWrite, this));
    }

    void onWrite(beast::error_code ec, std::size_t) {
        if (ec) return finish(ec);
        http::async_read(stream_, buffer_, res_, beast::bind_front_handler(&PostExchange::onRead, this));
    }

    void onRead(beast::error_code ec, std::size_t) {
        if (ec) return finish(ec);
        finish({});
        // Venue hosts often drop the connection without close_notify; the outcome is already settled.
        beast::get_lowest_layer(stream_).expires_after(kShutdownGrace);
        stream_.async_shutdown([](beast::error_code) {});
    }

    tcp::resolver resolver_;
    beast::ssl_stream<beast::tcp_stream> stream_;
    std::chrono::seconds timeout_;
    http::request<http::string_body> req_;
    beast::flat_buffer buffer_;
    http::response<http::string_body> res_;
    beast::error_code ec_;
    bool finished_ = false;
};

} // namespace

HttpsClient::HttpsClient(std::string host, std::string port, std::chrono::seconds timeout)
    : m_host(std::move(host))
    , m_port(std::move(port))
    , m_timeout(timeout)
{
    m_sslCtx.set_default_verify_paths();
    m_sslCtx.set_verify_mode(ssl::verify_peer);
}

HttpResponse HttpsClient::post(const std::string& target, const std::string& body, const Headers& headers) {
    http::request<http::string_body> req{http::verb::post, target, 11};
    req.set(http::field::host, m_host);
    req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    req.set(http::field::content_type, "application/json");
    req.set(http::field::accept, "application/json");
    for (const auto& [name, value] : headers) {
        req.set(name, value);
    }
    req.body() = body;
    req.prepare_payload();

    PostExchange exchange(m_ioc, m_sslCtx, m_timeout, std::move(req));

    if (!SSL_set_tlsext_host_name(exchange.stream().native_handle(), m_host.c_str())) {
        beast::error_code sniEc{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
        throw beast::system_error{sniEc};
    }
    if (!SSL_set1_host(exchange.stream().native_handle(), m_host.c_str())) {
        beast::error_code hostEc{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
        throw beast::system_error{hostEc};
    }

    // The whole exchange, resolve included, must settle within one timeout.
    m_ioc.restart();
    exchange.start(m_host, m_port);
    m_ioc.run_for(m_timeout);

    const bool settled = exchange.finished();
    exchange.abort();
    m_ioc.restart();
    m_ioc.run();   // drain the cancelled handlers before the exchange leaves scope

    if (!settled) {
        throw beast::system_error{beast::error::timeout};
    }
    if (exchange.error()) {
        throw beast::system_error{exchange.error()};
    }

    HttpResponse out;
    out.status = exchange.response().result_int();
    out.body = std::move(exchange.response().body());
    return out;
}
