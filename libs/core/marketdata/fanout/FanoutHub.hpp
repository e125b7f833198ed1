#pragma once
/*
SpreadBridge — FanoutHub
Role: Registry of downstream subscriber channels; broadcasts each Tick to all of them.
Inputs/Outputs: Ticks in (from FeedConnection); one serialized "price_update" per tick out to every channel.
Threading: Registry behind a mutex; delivery happens outside the lock so a slow channel never blocks others.
Integration: Drives the feed lifetime through IFeedControl: start() on 0->1 subscribers, stop() on 1->0.
Observability: Logs subscribe/unsubscribe counts and dropped channels via SpreadBridgeLogging.
Assumptions: The IFeedControl outlives this object.
*/
#include <compare>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include "ISubscriberChannel.hpp"
#include "../feed/IFeedControl.hpp"
#include "../model/MarketTypes.h"

struct SubscriptionToken {
    std::uint64_t id = 0;

    friend bool operator==(const SubscriptionToken&, const SubscriptionToken&) = default;
    friend auto operator<=>(const SubscriptionToken&, const SubscriptionToken&) = default;
};

class FanoutHub {
public:
    explicit FanoutHub(IFeedControl& feed);

    SubscriptionToken subscribe(std::shared_ptr<ISubscriberChannel> channel);

    /// Unknown or already removed tokens are a no-op.
    void unsubscribe(SubscriptionToken token);

    void broadcast(const Tick& tick);

    [[nodiscard]] std::size_t subscriberCount() const;

    /// {"type":"price_update","data":{"NIFTY":{"ltp":..,"symbol":"NIFTY"}},"timestamp":".."}
    static std::string formatPriceUpdate(const Tick& tick);

    FanoutHub(const FanoutHub&)            = delete;
    FanoutHub& operator=(const FanoutHub&) = delete;

private:
    IFeedControl& m_feed;

    mutable std::mutex m_mx;
    std::map<SubscriptionToken, std::shared_ptr<ISubscriberChannel>> m_channels;
    std::uint64_t m_nextId = 1;
};
