/*
SpreadBridge — FanoutHub Tests
Role: Verify subscriber registry, feed lifecycle transitions and broadcast delivery
Testing Strategy: FakeFeedControl + SpyChannels → assert start/stop counts and delivered frames
Coverage: 0→1 / 1→0 transitions, unknown tokens, dead-channel removal, frame format
*/
#include <gtest/gtest.h>
#include "marketdata/fanout/FanoutHub.hpp"
#include "fixtures/fake_feed_control.hpp"
#include "fixtures/spy_channel.hpp"
#include <nlohmann/json.hpp>
#include <set>

namespace {
Tick niftyTick(double ltp) {
    Tick t;
    t.instrument_id = "99926000";
    t.symbol = "NIFTY";
    t.last_traded_price = ltp;
    t.received_at = std::chrono::system_clock::time_point{std::chrono::seconds{1706154300}}
                  + std::chrono::microseconds{123456};
    return t;
}
}

class FanoutHubTest : public ::testing::Test {
protected:
    FakeFeedControl feed_;
    FanoutHub hub_{feed_};
};

// =============================================================================
// Lifecycle Transitions
// =============================================================================

TEST_F(FanoutHubTest, FirstSubscriberStartsFeedOnce) {
    hub_.subscribe(std::make_shared<SpyChannel>());
    EXPECT_EQ(feed_.starts(), 1);

    hub_.subscribe(std::make_shared<SpyChannel>());
    hub_.subscribe(std::make_shared<SpyChannel>());
    EXPECT_EQ(feed_.starts(), 1);
    EXPECT_EQ(hub_.subscriberCount(), 3u);
}

TEST_F(FanoutHubTest, LastUnsubscribeStopsFeedOnce) {
    auto a = hub_.subscribe(std::make_shared<SpyChannel>());
    auto b = hub_.subscribe(std::make_shared<SpyChannel>());

    hub_.unsubscribe(a);
    EXPECT_EQ(feed_.stops(), 0);

    hub_.unsubscribe(b);
    EXPECT_EQ(feed_.stops(), 1);
    EXPECT_EQ(hub_.subscriberCount(), 0u);
}

TEST_F(FanoutHubTest, UnknownTokenIsNoOp) {
    auto a = hub_.subscribe(std::make_shared<SpyChannel>());
    hub_.unsubscribe(SubscriptionToken{9999});
    EXPECT_EQ(hub_.subscriberCount(), 1u);

    hub_.unsubscribe(a);
    hub_.unsubscribe(a);
    EXPECT_EQ(feed_.stops(), 1);
}

TEST_F(FanoutHubTest, ResubscribeAfterEmptyStartsAgain) {
    auto a = hub_.subscribe(std::make_shared<SpyChannel>());
    hub_.unsubscribe(a);
    hub_.subscribe(std::make_shared<SpyChannel>());

    EXPECT_EQ(feed_.starts(), 2);
    EXPECT_EQ(feed_.stops(), 1);
}

TEST_F(FanoutHubTest, TokensAreNeverReused) {
    std::set<std::uint64_t> ids;
    for (int i = 0; i < 5; ++i) {
        auto t = hub_.subscribe(std::make_shared<SpyChannel>());
        ids.insert(t.id);
        hub_.unsubscribe(t);
    }
    EXPECT_EQ(ids.size(), 5u);
}

// =============================================================================
// Broadcast
// =============================================================================

TEST_F(FanoutHubTest, BroadcastReachesEverySubscriber) {
    auto a = std::make_shared<SpyChannel>();
    auto b = std::make_shared<SpyChannel>();
    hub_.subscribe(a);
    hub_.subscribe(b);

    hub_.broadcast(niftyTick(21450.75));
    hub_.broadcast(niftyTick(21451.00));

    EXPECT_EQ(a->frameCount(), 2u);
    EXPECT_EQ(b->frameCount(), 2u);
    EXPECT_EQ(a->frames(), b->frames());
}

TEST_F(FanoutHubTest, BroadcastWithoutSubscribersIsHarmless) {
    EXPECT_NO_THROW(hub_.broadcast(niftyTick(1.0)));
    EXPECT_EQ(feed_.starts(), 0);
}

TEST_F(FanoutHubTest, FailedChannelIsRemovedOthersStillServed) {
    auto dead = std::make_shared<SpyChannel>();
    auto live = std::make_shared<SpyChannel>();
    dead->setFailing(true);
    hub_.subscribe(dead);
    hub_.subscribe(live);

    hub_.broadcast(niftyTick(100.0));
    EXPECT_EQ(hub_.subscriberCount(), 1u);
    EXPECT_EQ(live->frameCount(), 1u);

    hub_.broadcast(niftyTick(101.0));
    EXPECT_EQ(dead->attempts(), 1);
    EXPECT_EQ(live->frameCount(), 2u);
    EXPECT_EQ(feed_.stops(), 0);
}

TEST_F(FanoutHubTest, LosingLastChannelStopsFeed) {
    auto dead = std::make_shared<SpyChannel>();
    dead->setFailing(true);
    hub_.subscribe(dead);

    hub_.broadcast(niftyTick(100.0));
    EXPECT_EQ(hub_.subscriberCount(), 0u);
    EXPECT_EQ(feed_.stops(), 1);
}

TEST_F(FanoutHubTest, PriceUpdateFrameShape) {
    auto spy = std::make_shared<SpyChannel>();
    hub_.subscribe(spy);
    hub_.broadcast(niftyTick(21450.75));

    auto json = nlohmann::json::parse(spy->lastFrame());
    EXPECT_EQ(json["type"], "price_update");
    EXPECT_DOUBLE_EQ(json["data"]["NIFTY"]["ltp"].get<double>(), 21450.75);
    EXPECT_EQ(json["data"]["NIFTY"]["symbol"], "NIFTY");
    EXPECT_EQ(json["timestamp"], "2024-01-25T03:45:00.123456Z");
}
