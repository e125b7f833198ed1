/*
SpreadBridge — bridge_server main.cpp
Role: Entry point for the bridge: loads config, logs in, serves the price fan-out until SIGINT/SIGTERM.
Usage: spreadbridge_server [bridge.json]
*/
#include "Log.hpp"
#include "marketdata/BridgeContext.hpp"
#include "marketdata/auth/SessionManager.hpp"
#include "marketdata/fanout/FanoutHub.hpp"
#include "marketdata/server/SubscriberServer.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <csignal>
#include <functional>
#include <memory>
#include <variant>

static constexpr auto CAT = "Bridge";
static constexpr std::chrono::seconds kStatusInterval{60};

int main(int argc, char* argv[])
{
    const std::string configPath = argc > 1 ? argv[1] : "bridge.json";
    LOG_I(CAT, "[SpreadBridge starting, config '{}']", configPath);

    std::unique_ptr<BridgeContext> context;
    try {
        context = std::make_unique<BridgeContext>(BridgeConfig::load(configPath));
    } catch (const std::exception& ex) {
        LOG_E(CAT, "Startup failed: {}", ex.what());
        return 1;
    }

    // A failed login here is not fatal: the feed and every REST call retry through ensureValid.
    auto auth = context->session().authenticate();
    if (const auto* err = std::get_if<AuthError>(&auth)) {
        LOG_W(CAT, "Initial login failed: {}", err->what());
    } else {
        LOG_I(CAT, "Venue session established for {}", context->session().clientCode());
    }

    SubscriberServer server(context->hub(), context->config().server);
    try {
        server.start();
    } catch (const std::exception& ex) {
        LOG_E(CAT, "Cannot listen on {}:{}: {}", context->config().server.bindAddress,
              context->config().server.port, ex.what());
        return 1;
    }
    LOG_I(CAT, "Serving price updates on ws://{}:{}{}", context->config().server.bindAddress,
          server.port(), context->config().server.path);

    boost::asio::io_context ioc;
    boost::asio::steady_timer statusTimer(ioc);
    std::function<void()> scheduleStatus = [&]() {
        statusTimer.expires_after(kStatusInterval);
        statusTimer.async_wait([&](const boost::system::error_code& ec) {
            if (ec) return;
            LOG_I(CAT, "Status: {}", context->status().dump());
            scheduleStatus();
        });
    };
    scheduleStatus();

    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signo) {
        if (ec) return;
        LOG_I(CAT, "Signal {} received, shutting down", signo);
        statusTimer.cancel();
    });

    ioc.run();

    server.stop();
    context->session().logout();
    context.reset();
    LOG_I(CAT, "[SpreadBridge stopped]");
    return 0;
}
