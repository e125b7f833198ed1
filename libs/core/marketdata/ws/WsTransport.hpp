#pragma once
#include <functional>
#include <string>
#include <utility>
#include <vector>

// Pure transport interface (no provider logic)
class WsTransport {
public:
    using MessageCb = std::function<void(std::string, bool binary)>; // own the data to avoid dangling views
    using StatusCb  = std::function<void(bool)>;
    using ErrorCb   = std::function<void(std::string)>;
    using Headers   = std::vector<std::pair<std::string, std::string>>;

    WsTransport() = default;
    virtual ~WsTransport() = default;

    // Extra upgrade-request headers; must be set before connect()
    virtual void setHandshakeHeaders(Headers headers) = 0;

    virtual void connect(std::string host, std::string port, std::string target) = 0;
    virtual void close() = 0;
    virtual void send(std::string msg) = 0; // text frame, serialized by implementation

    virtual void onMessage(MessageCb) = 0;
    virtual void onStatus(StatusCb) = 0;
    virtual void onError(ErrorCb) = 0;
};
