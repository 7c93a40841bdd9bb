#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "gsim/event/event.hpp"
#include "gsim/event/event_bus.hpp"
#include "gsim/event/event_types.hpp"
#include "gsim/foundation/error_code.hpp"

using namespace gsim::event;
using gsim::foundation::ErrorCode;
using namespace std::chrono_literals;

namespace {

Event guildJoined(EventPriority priority = EventPriority::Medium) {
    return makeEvent("guild", std::string(types::kGuildMemberJoined), std::string("brenna"),
                     priority);
}

Event battleStarted(EventPriority priority = EventPriority::Medium) {
    return makeEvent("combat", std::string(types::kCombatBattleStarted), {}, priority);
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Envelope helpers
// ═══════════════════════════════════════════════════════════════════════════

TEST(EventEnvelopeTest, MakeEventStampsIdAndTime) {
    auto a = guildJoined();
    auto b = guildJoined();
    EXPECT_FALSE(a.id.empty());
    EXPECT_NE(a.id, b.id);
    EXPECT_NE(a.time, EventClock::time_point{});
    ASSERT_NE(a.payloadAs<std::string>(), nullptr);
    EXPECT_EQ(*a.payloadAs<std::string>(), "brenna");
    EXPECT_EQ(a.payloadAs<int>(), nullptr);
}

TEST(EventEnvelopeTest, TypeNamesNeedThreeLowercaseSegments) {
    EXPECT_TRUE(isValidEventType("guild.member.joined"));
    EXPECT_TRUE(isValidEventType("system.error.handler_disabled"));
    EXPECT_FALSE(isValidEventType("guild.member"));
    EXPECT_FALSE(isValidEventType("Guild.member.joined"));
    EXPECT_FALSE(isValidEventType("guild..joined"));
    EXPECT_FALSE(isValidEventType(""));
}

TEST(EventEnvelopeTest, PatternMatching) {
    EXPECT_TRUE(matchesPattern("*", "guild.member.joined"));
    EXPECT_TRUE(matchesPattern("guild.*", "guild.member.joined"));
    EXPECT_TRUE(matchesPattern("guild.member.*", "guild.member.left"));
    EXPECT_FALSE(matchesPattern("guild.*", "guildhall.door.opened"));
    EXPECT_FALSE(matchesPattern("guild.member.joined", "guild.member.left"));

    EXPECT_TRUE(isValidSubscriptionPattern("guild.*"));
    EXPECT_FALSE(isValidSubscriptionPattern(".*"));
    EXPECT_FALSE(isValidSubscriptionPattern("guild"));
}

// ═══════════════════════════════════════════════════════════════════════════
// Publish validation
// ═══════════════════════════════════════════════════════════════════════════

TEST(EventBusPublishTest, RejectsMalformedEnvelopes) {
    EventBus bus;

    auto noSource = guildJoined();
    noSource.source.clear();
    auto badType = makeEvent("guild", "guild.joined");
    auto noTime = guildJoined();
    noTime.time = {};
    auto future = guildJoined();
    future.time = EventClock::now() + std::chrono::hours(1);

    for (auto* e : {&noSource, &badType, &noTime, &future}) {
        auto result = bus.publish(*e);
        ASSERT_TRUE(result.hasError());
        EXPECT_EQ(result.error().code(), ErrorCode::InvalidEventFormat);
    }
    EXPECT_EQ(bus.pendingCount(), 0u);
    EXPECT_EQ(bus.metrics().rejected, 4u);
}

TEST(EventBusPublishTest, BatchIsAllOrNothing) {
    EventBus bus;
    auto bad = guildJoined();
    bad.id.clear();

    auto result = bus.publishBatch({guildJoined(), battleStarted(), bad});
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidEventFormat);
    const auto* rejection = result.error().context<BatchRejection>();
    ASSERT_NE(rejection, nullptr);
    EXPECT_EQ(rejection->index, 2u);
    EXPECT_EQ(bus.pendingCount(), 0u);
}

TEST(EventBusPublishTest, PublishDoesNotDeliverUntilDrain) {
    EventBus bus;
    int calls = 0;
    ASSERT_NE(bus.subscribe("guild.*", [&](const Event&) { ++calls; }), 0u);

    ASSERT_TRUE(bus.publish(guildJoined()).hasValue());
    EXPECT_EQ(calls, 0);
    EXPECT_EQ(bus.pendingCount(), 1u);

    auto stats = bus.drainAll();
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(stats.processed, 1u);
    EXPECT_EQ(stats.deliveries, 1u);
    EXPECT_EQ(stats.remaining, 0u);
}

// ═══════════════════════════════════════════════════════════════════════════
// Delivery
// ═══════════════════════════════════════════════════════════════════════════

TEST(EventBusDeliveryTest, DeliversOnlyToMatchingSubscribers) {
    EventBus bus;
    std::vector<std::string> guildSeen;
    std::vector<std::string> combatSeen;
    std::vector<std::string> allSeen;

    bus.subscribe(std::string(types::kGuildMemberJoined),
                  [&](const Event& e) { guildSeen.push_back(e.id); });
    bus.subscribe("combat.*", [&](const Event& e) { combatSeen.push_back(e.id); });
    bus.subscribe("*", [&](const Event& e) { allSeen.push_back(e.id); });

    auto joined = guildJoined();
    auto battle = battleStarted();
    ASSERT_TRUE(bus.publish(joined).hasValue());
    ASSERT_TRUE(bus.publish(battle).hasValue());
    bus.drainAll();

    EXPECT_EQ(guildSeen, std::vector<std::string>{joined.id});
    EXPECT_EQ(combatSeen, std::vector<std::string>{battle.id});
    EXPECT_EQ(allSeen.size(), 2u);
}

TEST(EventBusDeliveryTest, PriorityMajorOrderBeatsPublishOrder) {
    EventBus bus;
    std::vector<EventPriority> order;
    bus.subscribe("*", [&](const Event& e) { order.push_back(e.priority); });

    ASSERT_TRUE(bus.publish(guildJoined(EventPriority::Low)).hasValue());
    ASSERT_TRUE(bus.publish(guildJoined(EventPriority::Medium)).hasValue());
    ASSERT_TRUE(bus.publish(guildJoined(EventPriority::High)).hasValue());
    ASSERT_TRUE(bus.publish(guildJoined(EventPriority::Critical)).hasValue());
    bus.drainAll();

    std::vector<EventPriority> expected = {EventPriority::Critical, EventPriority::High,
                                           EventPriority::Medium, EventPriority::Low};
    EXPECT_EQ(order, expected);
}

TEST(EventBusDeliveryTest, EqualPriorityKeepsPublishOrder) {
    EventBus bus;
    std::vector<std::string> ids;
    bus.subscribe("*", [&](const Event& e) { ids.push_back(e.id); });

    std::vector<std::string> published;
    for (int i = 0; i < 5; ++i) {
        auto e = guildJoined();
        published.push_back(e.id);
        ASSERT_TRUE(bus.publish(std::move(e)).hasValue());
    }
    bus.drainAll();
    EXPECT_EQ(ids, published);
}

TEST(EventBusDeliveryTest, HandlerPriorityHigherFirst) {
    EventBus bus;
    std::vector<std::string> calls;
    bus.subscribe("guild.*", [&](const Event&) { calls.push_back("low"); }, -5);
    bus.subscribe("guild.*", [&](const Event&) { calls.push_back("high"); }, 10);
    bus.subscribe("guild.*", [&](const Event&) { calls.push_back("mid-a"); }, 0);
    bus.subscribe("guild.*", [&](const Event&) { calls.push_back("mid-b"); }, 0);

    ASSERT_TRUE(bus.publish(guildJoined()).hasValue());
    bus.drainAll();

    std::vector<std::string> expected = {"high", "mid-a", "mid-b", "low"};
    EXPECT_EQ(calls, expected);
}

TEST(EventBusDeliveryTest, PredicateOnceAndOwnerOptions) {
    EventBus bus;
    int filtered = 0;
    int once = 0;
    int owned = 0;

    SubscriptionOptions predicateOpts;
    predicateOpts.predicate = [](const Event& e) { return e.subject.has_value(); };
    bus.subscribe("guild.*", [&](const Event&) { ++filtered; }, predicateOpts);

    SubscriptionOptions onceOpts;
    onceOpts.once = true;
    bus.subscribe("guild.*", [&](const Event&) { ++once; }, onceOpts);

    SubscriptionOptions ownerOpts;
    ownerOpts.owner = "economy";
    bus.subscribe("guild.*", [&](const Event&) { ++owned; }, ownerOpts);
    bus.subscribe("combat.*", [&](const Event&) { ++owned; }, ownerOpts);

    auto withSubject = guildJoined();
    withSubject.subject = "ironhold";
    ASSERT_TRUE(bus.publish(guildJoined()).hasValue());
    ASSERT_TRUE(bus.publish(withSubject).hasValue());
    bus.drainAll();

    EXPECT_EQ(filtered, 1);
    EXPECT_EQ(once, 1);
    EXPECT_EQ(owned, 2);

    EXPECT_EQ(bus.unsubscribeOwner("economy"), 2u);
    EXPECT_EQ(bus.subscriptionCount(), 1u);
}

TEST(EventBusDeliveryTest, UnsubscribeStopsDelivery) {
    EventBus bus;
    int calls = 0;
    auto id = bus.subscribe("guild.*", [&](const Event&) { ++calls; });
    EXPECT_TRUE(bus.unsubscribe(id));
    EXPECT_FALSE(bus.unsubscribe(id));

    ASSERT_TRUE(bus.publish(guildJoined()).hasValue());
    bus.drainAll();
    EXPECT_EQ(calls, 0);
}

TEST(EventBusDeliveryTest, InvalidSubscriptionReturnsZero) {
    EventBus bus;
    EXPECT_EQ(bus.subscribe("guild", [](const Event&) {}), 0u);
    EXPECT_EQ(bus.subscribe("guild.*", EventHandler{}), 0u);
    EXPECT_EQ(bus.subscriptionCount(), 0u);
}

TEST(EventBusDeliveryTest, HandlerPublishedEventsJoinSameDrain) {
    EventBus bus;
    std::vector<std::string> seen;
    bus.subscribe("*", [&](const Event& e) { seen.push_back(e.type); });
    bus.subscribe(std::string(types::kGuildMemberJoined), [&](const Event&) {
        auto published = bus.publish(battleStarted());
        ASSERT_TRUE(published.hasValue());
    });

    ASSERT_TRUE(bus.publish(guildJoined()).hasValue());
    auto stats = bus.drainAll();

    EXPECT_EQ(stats.processed, 2u);
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[1], types::kCombatBattleStarted);
}

TEST(EventBusDeliveryTest, DrainBudgetLeavesRemainder) {
    EventBus bus;
    bus.subscribe("*", [](const Event&) { std::this_thread::sleep_for(2ms); });
    for (int i = 0; i < 10; ++i) {
        ASSERT_TRUE(bus.publish(guildJoined()).hasValue());
    }

    auto stats = bus.drain(1us);
    EXPECT_GE(stats.processed, 1u);
    EXPECT_LT(stats.processed, 10u);
    EXPECT_TRUE(stats.budgetExhausted);
    EXPECT_EQ(stats.remaining, 10u - stats.processed);
}

// ═══════════════════════════════════════════════════════════════════════════
// Handler failure isolation
// ═══════════════════════════════════════════════════════════════════════════

TEST(EventBusFailureTest, ThrowingHandlerDoesNotStopOthers) {
    EventBus bus;
    int healthy = 0;
    bus.subscribe("guild.*", [](const Event&) { throw std::runtime_error("bad handler"); }, 5);
    bus.subscribe("guild.*", [&](const Event&) { ++healthy; });

    ASSERT_TRUE(bus.publish(guildJoined()).hasValue());
    auto stats = bus.drainAll();

    EXPECT_EQ(healthy, 1);
    EXPECT_EQ(stats.handlerFailures, 1u);
}

TEST(EventBusFailureTest, ConsecutiveFailuresDisableHandler) {
    EventBusConfig config;
    config.handlerFailureThreshold = 3;
    EventBus bus(config);

    int attempts = 0;
    auto failing = bus.subscribe("guild.*", [&](const Event&) {
        ++attempts;
        throw std::runtime_error("always");
    });

    std::vector<HandlerDisabledPayload> notices;
    bus.subscribe(std::string(types::kHandlerDisabled), [&](const Event& e) {
        if (const auto* p = e.payloadAs<HandlerDisabledPayload>()) {
            notices.push_back(*p);
        }
    });

    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(bus.publish(guildJoined()).hasValue());
    }
    bus.drainAll();

    EXPECT_EQ(attempts, 3);
    ASSERT_EQ(notices.size(), 1u);
    EXPECT_EQ(notices[0].subscriptionId, failing);
    EXPECT_EQ(notices[0].consecutiveFailures, 3u);
    EXPECT_EQ(notices[0].lastError, "always");
    EXPECT_EQ(bus.metrics().disabledHandlers, 1u);
}

TEST(EventBusFailureTest, SuccessResetsFailureCount) {
    EventBusConfig config;
    config.handlerFailureThreshold = 2;
    EventBus bus(config);

    int calls = 0;
    bus.subscribe("guild.*", [&](const Event&) {
        // fail, succeed, fail, succeed...
        if (calls++ % 2 == 0) {
            throw std::runtime_error("flaky");
        }
    });

    for (int i = 0; i < 6; ++i) {
        ASSERT_TRUE(bus.publish(guildJoined()).hasValue());
    }
    bus.drainAll();

    EXPECT_EQ(calls, 6);
    EXPECT_EQ(bus.metrics().disabledHandlers, 0u);
    EXPECT_EQ(bus.subscriptionCount(), 1u);
}

TEST(EventBusFailureTest, FilteredOutEventsNeitherCountNorResetFailures) {
    EventBusConfig config;
    config.handlerFailureThreshold = 2;
    EventBus bus(config);

    int calls = 0;
    SubscriptionOptions opts;
    opts.predicate = [](const Event& e) { return e.subject.has_value(); };
    bus.subscribe("guild.*", [&](const Event&) {
        ++calls;
        throw std::runtime_error("broken");
    }, opts);

    auto tagged = guildJoined();
    tagged.subject = "ironhold";
    ASSERT_TRUE(bus.publish(tagged).hasValue());
    ASSERT_TRUE(bus.publish(guildJoined()).hasValue());
    auto taggedAgain = guildJoined();
    taggedAgain.subject = "ironhold";
    ASSERT_TRUE(bus.publish(taggedAgain).hasValue());

    auto stats = bus.drainAll();
    EXPECT_EQ(calls, 2);
    EXPECT_EQ(stats.deliveries, 0u);
    EXPECT_EQ(stats.handlerFailures, 2u);
    EXPECT_EQ(bus.metrics().deliveries, 0u);
    EXPECT_EQ(bus.metrics().disabledHandlers, 1u);
}

TEST(EventBusFailureTest, OnceSubscriptionWaitsForAcceptedEvent) {
    EventBus bus;
    int calls = 0;
    SubscriptionOptions opts;
    opts.once = true;
    opts.predicate = [](const Event& e) { return e.subject.value_or("") == "saltmarsh"; };
    bus.subscribe("guild.*", [&](const Event&) { ++calls; }, opts);

    ASSERT_TRUE(bus.publish(guildJoined()).hasValue());
    bus.drainAll();
    EXPECT_EQ(calls, 0);
    EXPECT_EQ(bus.subscriptionCount(), 1u);

    auto tagged = guildJoined();
    tagged.subject = "saltmarsh";
    ASSERT_TRUE(bus.publish(tagged).hasValue());
    ASSERT_TRUE(bus.publish(tagged).hasValue());
    bus.drainAll();
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(bus.subscriptionCount(), 0u);
}

TEST(EventBusFailureTest, ThrowingPredicateCountsAsFailure) {
    EventBus bus;
    int calls = 0;
    SubscriptionOptions opts;
    opts.predicate = [](const Event&) -> bool { throw std::runtime_error("bad filter"); };
    bus.subscribe("guild.*", [&](const Event&) { ++calls; }, opts);

    ASSERT_TRUE(bus.publish(guildJoined()).hasValue());
    auto stats = bus.drainAll();
    EXPECT_EQ(calls, 0);
    EXPECT_EQ(stats.handlerFailures, 1u);
    EXPECT_EQ(stats.deliveries, 0u);
}

// ═══════════════════════════════════════════════════════════════════════════
// History
// ═══════════════════════════════════════════════════════════════════════════

TEST(EventBusHistoryTest, KeepsMostRecentDeliveredEvents) {
    EventBusConfig config;
    config.historyCapacity = 3;
    EventBus bus(config);

    std::vector<std::string> ids;
    for (int i = 0; i < 5; ++i) {
        auto e = guildJoined();
        ids.push_back(e.id);
        ASSERT_TRUE(bus.publish(std::move(e)).hasValue());
    }
    EXPECT_TRUE(bus.history().empty());
    bus.drainAll();

    auto history = bus.history();
    ASSERT_EQ(history.size(), 3u);
    EXPECT_EQ(history[0].id, ids[2]);
    EXPECT_EQ(history[2].id, ids[4]);

    std::vector<std::string> replayed;
    EXPECT_EQ(bus.replayHistory([&](const Event& e) { replayed.push_back(e.id); }), 3u);
    EXPECT_EQ(replayed.front(), ids[2]);
}

TEST(EventBusHistoryTest, ClearDropsQueueSubscriptionsAndHistory) {
    EventBus bus;
    bus.subscribe("*", [](const Event&) {});
    ASSERT_TRUE(bus.publish(guildJoined()).hasValue());
    bus.drainAll();
    ASSERT_TRUE(bus.publish(guildJoined()).hasValue());

    bus.clear();
    EXPECT_EQ(bus.pendingCount(), 0u);
    EXPECT_EQ(bus.subscriptionCount(), 0u);
    EXPECT_TRUE(bus.history().empty());
    EXPECT_EQ(bus.metrics().published, 2u);
}
