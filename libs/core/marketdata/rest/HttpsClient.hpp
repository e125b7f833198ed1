#pragma once
// ─────────────────────────────────────────────────────────────
// HttpsClient – blocking HTTPS POST over Boost.Beast, driven
// asynchronously on a private io_context.
// One TLS connection per request, settled within the timeout
// (beast::error::timeout otherwise); throws beast::system_error.
// ─────────────────────────────────────────────────────────────
#include <chrono>
#include <string>
#include <utility>
#include <vector>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>

struct HttpResponse {
    unsigned status = 0;
    std::string body;
};

class HttpsClient {
public:
    using Headers = std::vector<std::pair<std::string, std::string>>;

    HttpsClient(std::string host, std::string port, std::chrono::seconds timeout);

    /// POST `body` as application/json. Non-2xx replies are returned, not thrown.
    HttpResponse post(const std::string& target, const std::string& body, const Headers& headers);

    [[nodiscard]] const std::string& host() const { return m_host; }

    HttpsClient(const HttpsClient&)            = delete;
    HttpsClient& operator=(const HttpsClient&) = delete;

private:
    std::string m_host;
    std::string m_port;
    std::chrono::seconds m_timeout;
    boost::asio::io_context m_ioc;
    boost::asio::ssl::context m_sslCtx{boost::asio::ssl::context::tlsv12_client};
};
