#include "BeastWsTransport.hpp"
#include <boost/beast/core.hpp>  // covers buffers, flat_buffer, etc.
#include <boost/beast/version.hpp>
#include <openssl/err.h>


void BeastWsTransport::connect(std::string host, std::string port, std::string target) {
    net::post(strand_, [self = shared_from_this(), h = std::move(host), p = std::move(port), t = std::move(target)]() mutable {
        self->host_ = std::move(h);
        self->port_ = std::move(p);
        self->target_ = std::move(t);
        self->resolver_.async_resolve(self->host_, self->port_,
            [self](beast::error_code ec, tcp::resolver::results_type results){
                self->onResolve(ec, results);
            });
    });
}

void BeastWsTransport::close() {
    net::post(strand_, [self = shared_from_this()]() {
        if (self->closing_) return;
        self->closing_ = true;
        self->resolver_.cancel();
        if (self->ws_.is_open()) {
            self->ws_.async_close(websocket::close_code::normal, [self](beast::error_code ec){
                if (ec && self->onError_) self->onError_(ec.message());
                if (self->onStatus_) self->onStatus_(false);
            });
        } else {
            beast::get_lowest_layer(self->ws_).close();
            if (self->onStatus_) self->onStatus_(false);
        }
    });
}

void BeastWsTransport::send(std::string msg) {
    net::post(strand_, [self = shared_from_this(), m = std::move(msg)]() mutable {
        if (self->closing_) return;
        self->writeQueue_.emplace_back(std::move(m));
        if (self->writeQueue_.size() == 1) {
            self->doWrite();
        }
    });
}

void BeastWsTransport::fail(beast::error_code ec) {
    // Errors after close() was requested are the expected teardown of pending operations.
    if (closing_) return;
    closing_ = true;
    if (onError_) onError_(ec.message());
    if (onStatus_) onStatus_(false);
}

void BeastWsTransport::onResolve(beast::error_code ec, tcp::resolver::results_type results) {
    if (ec) { fail(ec); return; }
    beast::get_lowest_layer(ws_).expires_after(std::chrono::seconds(30));
    beast::get_lowest_layer(ws_).async_connect(results,
        [self = shared_from_this()](beast::error_code ec, tcp::resolver::results_type::endpoint_type ep){
            self->onConnect(ec, ep);
        });
}

void BeastWsTransport::onConnect(beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
    if (ec) { fail(ec); return; }
    if (!SSL_set_tlsext_host_name(ws_.next_layer().native_handle(), host_.c_str())) {
        fail(beast::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()));
        return;
    }
    if (!SSL_set1_host(ws_.next_layer().native_handle(), host_.c_str())) {
        fail(beast::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()));
        return;
    }
    ws_.next_layer().set_verify_mode(ssl::verify_peer);
    ws_.next_layer().async_handshake(ssl::stream_base::client,
        [self = shared_from_this()](beast::error_code ec){ self->onSslHandshake(ec); });
}

void BeastWsTransport::onSslHandshake(beast::error_code ec) {
    if (ec) { fail(ec); return; }
    beast::get_lowest_layer(ws_).expires_never();
    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
    ws_.set_option(websocket::stream_base::decorator(
        [headers = headers_](websocket::request_type& req) {
            req.set(beast::http::field::user_agent, std::string(BOOST_BEAST_VERSION_STRING) + " spreadbridge");
            for (const auto& [name, value] : headers) {
                req.set(name, value);
            }
        }));
    ws_.async_handshake(host_, target_,
        [self = shared_from_this()](beast::error_code ec){ self->onWsHandshake(ec); });
}

void BeastWsTransport::onWsHandshake(beast::error_code ec) {
    if (ec) { fail(ec); return; }
    if (onStatus_) onStatus_(true);
    doRead();
}

void BeastWsTransport::doRead() {
    ws_.async_read(buf_, [self = shared_from_this()](beast::error_code ec, std::size_t bytes){
        self->onRead(ec, bytes);
    });
}

void BeastWsTransport::onRead(beast::error_code ec, std::size_t) {
    if (ec) { fail(ec); return; }

    if (onMessage_) {
        auto payload = beast::buffers_to_string(buf_.data());
        buf_.consume(buf_.size());
        onMessage_(std::move(payload), ws_.got_binary());
    } else {
        buf_.consume(buf_.size());
    }

    doRead();
}

void BeastWsTransport::doWrite() {
    if (writeQueue_.empty()) return;
    ws_.text(true);
    ws_.async_write(net::buffer(writeQueue_.front()), [self = shared_from_this()](beast::error_code ec, std::size_t){
        if (ec) { self->fail(ec); return; }
        self->writeQueue_.pop_front();
        if (!self->writeQueue_.empty()) self->doWrite();
    });
}
