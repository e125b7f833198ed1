#include "FanoutHub.hpp"
#include "SpreadBridgeLogging.hpp"
#include "Cpp20Utils.hpp"
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

FanoutHub::FanoutHub(IFeedControl& feed)
    : m_feed(feed)
{}

SubscriptionToken FanoutHub::subscribe(std::shared_ptr<ISubscriberChannel> channel) {
    std::lock_guard<std::mutex> lock(m_mx);
    const SubscriptionToken token{m_nextId++};
    m_channels.emplace(token, std::move(channel));
    sbLog_App(QString("Subscriber connected. Total subscribers: %1").arg(m_channels.size()));

    // start()/stop() only post, so calling them under the lock keeps their order.
    if (m_channels.size() == 1) {
        m_feed.start();
    }
    return token;
}

void FanoutHub::unsubscribe(SubscriptionToken token) {
    std::lock_guard<std::mutex> lock(m_mx);
    if (m_channels.erase(token) == 0) return;
    sbLog_App(QString("Subscriber disconnected. Total subscribers: %1").arg(m_channels.size()));

    if (m_channels.empty()) {
        m_feed.stop();
    }
}

void FanoutHub::broadcast(const Tick& tick) {
    std::vector<std::pair<SubscriptionToken, std::shared_ptr<ISubscriberChannel>>> targets;
    {
        std::lock_guard<std::mutex> lock(m_mx);
        if (m_channels.empty()) return;
        targets.assign(m_channels.begin(), m_channels.end());
    }

    const std::string message = formatPriceUpdate(tick);

    std::vector<SubscriptionToken> failed;
    for (const auto& [token, channel] : targets) {
        if (!channel || !channel->deliver(message)) {
            failed.push_back(token);
        }
    }

    for (const auto& token : failed) {
        sbLog_Warning(QString("Dropping unresponsive subscriber #%1").arg(token.id));
        unsubscribe(token);
    }

    sbLog_Data(QString::fromStdString(
        Cpp20Utils::formatFanoutLog(tick.symbol, targets.size() - failed.size(), failed.size())));
}

std::size_t FanoutHub::subscriberCount() const {
    std::lock_guard<std::mutex> lock(m_mx);
    return m_channels.size();
}

std::string FanoutHub::formatPriceUpdate(const Tick& tick) {
    nlohmann::json data;
    data[tick.symbol] = {{"ltp", tick.last_traded_price}, {"symbol", tick.symbol}};

    nlohmann::json msg;
    msg["type"] = "price_update";
    msg["data"] = std::move(data);
    msg["timestamp"] = Cpp20Utils::formatIsoTimestamp(tick.received_at);
    return msg.dump();
}
