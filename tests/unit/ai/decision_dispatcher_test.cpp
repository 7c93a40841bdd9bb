#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "gsim/ai/behavior_engine.hpp"
#include "gsim/ai/decision_dispatcher.hpp"
#include "gsim/event/event_bus.hpp"
#include "gsim/event/event_types.hpp"
#include "gsim/foundation/job_scheduler.hpp"

using namespace gsim::ai;
using gsim::foundation::ErrorCode;
using gsim::foundation::GameJobScheduler;
using gsim::foundation::GameResult;
using namespace std::chrono_literals;

namespace {

SituationContext memberContext(const std::string& agent, int64_t gold) {
    SituationContext ctx(agent, 0);
    ctx.set("gold", gold);
    return ctx;
}

} // namespace

class DecisionDispatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        BehaviorTreeBuilder b;
        auto poor = b.condition("poor", [](const SituationContext& c) {
            return c.number("gold") < 50;
        });
        auto trade = b.action("earn", "trade", 1.0);
        auto train = b.action("improve", "train", 0.5);
        auto root = b.selector({b.sequence({poor, trade}), train});
        auto tree = b.build(root);
        ASSERT_TRUE(tree.hasValue());
        ASSERT_TRUE(engine_.registerTree("member", std::move(tree).value()).hasValue());
    }

    /// Poll until @p count results have been collected or 2s pass.
    std::vector<ResolvedDecision> pollUntil(DecisionDispatcher& d, std::size_t count,
                                            uint64_t tick = 0) {
        std::vector<ResolvedDecision> all;
        auto until = std::chrono::steady_clock::now() + 2s;
        while (all.size() < count && std::chrono::steady_clock::now() < until) {
            for (auto& r : d.poll(tick)) {
                all.push_back(std::move(r));
            }
            std::this_thread::sleep_for(1ms);
        }
        return all;
    }

    BehaviorEngine engine_;
    GameJobScheduler scheduler_{2};
};

// ═══════════════════════════════════════════════════════════════════════════
// Requests
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(DecisionDispatcherTest, RejectsEmptyIds) {
    DecisionDispatcher dispatcher(engine_, scheduler_);
    auto r = dispatcher.requestDecision("", "member", memberContext("a", 10));
    ASSERT_TRUE(r.hasError());
    EXPECT_EQ(r.error().code(), ErrorCode::InvalidArgument);
}

TEST_F(DecisionDispatcherTest, AwaitReturnsTreeDecision) {
    DecisionDispatcher dispatcher(engine_, scheduler_);
    auto handle = dispatcher.requestDecision("kofi", "member", memberContext("kofi", 10));
    ASSERT_TRUE(handle.hasValue());

    auto decision = dispatcher.await(handle.value());
    ASSERT_TRUE(decision.hasValue());
    EXPECT_EQ(decision.value().actionId, "trade");
    EXPECT_EQ(decision.value().agentId, "kofi");
    EXPECT_FALSE(decision.value().fallback);
    EXPECT_EQ(handle.value().outcome(), DecisionOutcome::Completed);
    EXPECT_EQ(dispatcher.pendingCount(), 0u);
}

TEST_F(DecisionDispatcherTest, CacheHitSkipsSecondDispatch) {
    DecisionDispatcher dispatcher(engine_, scheduler_);
    auto first = dispatcher.requestDecision("brenna", "member", memberContext("brenna", 200));
    ASSERT_TRUE(first.hasValue());
    ASSERT_TRUE(dispatcher.await(first.value()).hasValue());
    (void)dispatcher.poll(1);

    auto second = dispatcher.requestDecision("brenna", "member", memberContext("brenna", 200));
    ASSERT_TRUE(second.hasValue());
    EXPECT_TRUE(second.value().ready());
    EXPECT_TRUE(second.value().fromCache());
    EXPECT_EQ(second.value().decision()->actionId, "train");

    auto stats = dispatcher.stats();
    EXPECT_EQ(stats.submitted, 2u);
    EXPECT_EQ(stats.dispatched, 1u);
    EXPECT_EQ(stats.cacheHits, 1u);

    auto resolved = dispatcher.poll(1);
    ASSERT_EQ(resolved.size(), 1u);
    EXPECT_TRUE(resolved[0].fromCache);
}

TEST_F(DecisionDispatcherTest, DifferentSituationMissesCache) {
    DecisionDispatcher dispatcher(engine_, scheduler_);
    auto first = dispatcher.requestDecision("brenna", "member", memberContext("brenna", 200));
    ASSERT_TRUE(dispatcher.await(first.value()).hasValue());

    auto second = dispatcher.requestDecision("brenna", "member", memberContext("brenna", 20));
    ASSERT_TRUE(second.hasValue());
    EXPECT_FALSE(second.value().fromCache());
    auto decision = dispatcher.await(second.value());
    ASSERT_TRUE(decision.hasValue());
    EXPECT_EQ(decision.value().actionId, "trade");
    EXPECT_EQ(dispatcher.stats().dispatched, 2u);
}

TEST_F(DecisionDispatcherTest, IdenticalPendingRequestsCoalesce) {
    DecisionDispatcher dispatcher(engine_, scheduler_);
    std::atomic<int> calls{0};
    dispatcher.setSolver([&](const DecisionTask& task) {
        ++calls;
        std::this_thread::sleep_for(20ms);
        Decision d;
        d.actionId = "rest";
        d.plan = {"rest"};
        d.computedAtTick = task.context.tick();
        return GameResult<Decision>::ok(std::move(d));
    });

    auto a = dispatcher.requestDecision("tamsin", "custom", memberContext("tamsin", 1));
    auto b = dispatcher.requestDecision("tamsin", "custom", memberContext("tamsin", 1));
    ASSERT_TRUE(a.hasValue());
    ASSERT_TRUE(b.hasValue());
    EXPECT_TRUE(a.value().sameRequest(b.value()));

    ASSERT_TRUE(dispatcher.await(b.value()).hasValue());
    EXPECT_EQ(calls.load(), 1);
    EXPECT_EQ(dispatcher.stats().coalesced, 1u);
}

TEST_F(DecisionDispatcherTest, CoalescedRequestRaisesPriorityAndTightensDeadline) {
    GameJobScheduler single{1};
    std::atomic<bool> entered{false};
    std::atomic<bool> release{false};
    std::mutex orderMutex;
    std::vector<std::string> order;

    DecisionDispatcher dispatcher(engine_, single);
    struct Release {
        std::atomic<bool>& flag;
        ~Release() { flag = true; }
    } releaseOnExit{release};

    dispatcher.setSolver([&](const DecisionTask& task) {
        if (task.agentId == "blocker") {
            entered = true;
            while (!release.load()) {
                std::this_thread::sleep_for(1ms);
            }
        }
        {
            std::lock_guard lock(orderMutex);
            order.push_back(task.agentId);
        }
        Decision d;
        d.actionId = "rest";
        return GameResult<Decision>::ok(std::move(d));
    });

    auto blocker = dispatcher.requestDecision("blocker", "custom", memberContext("blocker", 1));
    ASSERT_TRUE(blocker.hasValue());
    auto until = std::chrono::steady_clock::now() + 1s;
    while (!entered.load() && std::chrono::steady_clock::now() < until) {
        std::this_thread::sleep_for(1ms);
    }
    ASSERT_TRUE(entered.load());

    auto ulric = dispatcher.requestDecision("ulric", "custom", memberContext("ulric", 1),
                                            DecisionPriority::Normal, 5s);
    auto first = dispatcher.requestDecision("dario", "custom", memberContext("dario", 1),
                                            DecisionPriority::Low, 5s);
    ASSERT_TRUE(ulric.hasValue());
    ASSERT_TRUE(first.hasValue());
    auto looseDeadline = first.value().deadline();

    auto urgent = dispatcher.requestDecision("dario", "custom", memberContext("dario", 1),
                                             DecisionPriority::Critical, 1s);
    ASSERT_TRUE(urgent.hasValue());
    EXPECT_TRUE(urgent.value().sameRequest(first.value()));
    EXPECT_LT(first.value().deadline(), looseDeadline);
    auto tightDeadline = first.value().deadline();

    // A later, calmer duplicate does not loosen anything.
    auto calm = dispatcher.requestDecision("dario", "custom", memberContext("dario", 1),
                                           DecisionPriority::Low, 10s);
    ASSERT_TRUE(calm.hasValue());
    EXPECT_EQ(first.value().deadline(), tightDeadline);
    EXPECT_EQ(dispatcher.stats().coalesced, 2u);

    release = true;
    ASSERT_TRUE(dispatcher.await(first.value()).hasValue());
    ASSERT_TRUE(dispatcher.await(ulric.value()).hasValue());

    std::lock_guard lock(orderMutex);
    ASSERT_EQ(order.size(), 3u);
    EXPECT_EQ(order[0], "blocker");
    EXPECT_EQ(order[1], "dario");
    EXPECT_EQ(order[2], "ulric");
}

// ═══════════════════════════════════════════════════════════════════════════
// Deadlines and failures
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(DecisionDispatcherTest, SlowSolverTimesOutToFallback) {
    DecisionDispatcher dispatcher(engine_, scheduler_);
    dispatcher.setSolver([](const DecisionTask&) {
        std::this_thread::sleep_for(50ms);
        Decision d;
        d.actionId = "train";
        return GameResult<Decision>::ok(std::move(d));
    });

    auto started = std::chrono::steady_clock::now();
    auto handle = dispatcher.requestDecision("ulric", "slow", memberContext("ulric", 1),
                                             DecisionPriority::Normal, 10ms);
    ASSERT_TRUE(handle.hasValue());
    auto decision = dispatcher.await(handle.value());
    auto waited = std::chrono::steady_clock::now() - started;

    ASSERT_TRUE(decision.hasValue());
    EXPECT_TRUE(decision.value().fallback);
    EXPECT_EQ(decision.value().actionId, std::string(kFallbackActionId));
    EXPECT_EQ(handle.value().outcome(), DecisionOutcome::Timeout);
    ASSERT_TRUE(handle.value().error().has_value());
    EXPECT_EQ(handle.value().error()->code(), ErrorCode::DecisionTimeout);
    EXPECT_LT(waited, 45ms);

    // Let the worker finish; its result must be dropped, not cached.
    std::this_thread::sleep_for(80ms);
    (void)dispatcher.poll(0);
    EXPECT_EQ(dispatcher.stats().lateResultsDiscarded, 1u);
    EXPECT_EQ(dispatcher.stats().timeouts, 1u);
    EXPECT_EQ(dispatcher.cache().size(), 0u);
}

TEST_F(DecisionDispatcherTest, ThrowingSolverFallsBack) {
    DecisionDispatcher dispatcher(engine_, scheduler_);
    dispatcher.setSolver([](const DecisionTask&) -> GameResult<Decision> {
        throw std::runtime_error("solver bug");
    });

    auto handle = dispatcher.requestDecision("mira", "broken", memberContext("mira", 1));
    ASSERT_TRUE(handle.hasValue());
    auto decision = dispatcher.await(handle.value());
    ASSERT_TRUE(decision.hasValue());
    EXPECT_TRUE(decision.value().fallback);
    EXPECT_EQ(handle.value().outcome(), DecisionOutcome::Failed);
    ASSERT_TRUE(handle.value().error().has_value());
    EXPECT_EQ(handle.value().error()->code(), ErrorCode::DecisionFailed);
    EXPECT_NE(handle.value().error()->message().find("solver bug"), std::string_view::npos);
}

TEST_F(DecisionDispatcherTest, UnknownTreeFallsBack) {
    DecisionDispatcher dispatcher(engine_, scheduler_);
    auto handle = dispatcher.requestDecision("mira", "missing", memberContext("mira", 1));
    ASSERT_TRUE(handle.hasValue());
    auto decision = dispatcher.await(handle.value());
    ASSERT_TRUE(decision.hasValue());
    EXPECT_TRUE(decision.value().fallback);
    EXPECT_EQ(handle.value().outcome(), DecisionOutcome::Failed);
}

TEST_F(DecisionDispatcherTest, ShutdownResolvesPendingAndRefusesNew) {
    DecisionDispatcher dispatcher(engine_, scheduler_);
    std::atomic<bool> release{false};
    dispatcher.setSolver([&](const DecisionTask&) {
        while (!release.load()) {
            std::this_thread::sleep_for(1ms);
        }
        Decision d;
        d.actionId = "rest";
        return GameResult<Decision>::ok(std::move(d));
    });

    auto handle = dispatcher.requestDecision("dario", "blocked", memberContext("dario", 1));
    ASSERT_TRUE(handle.hasValue());

    std::thread releaser([&] {
        std::this_thread::sleep_for(20ms);
        release = true;
    });
    dispatcher.shutdown();
    releaser.join();

    EXPECT_TRUE(handle.value().ready());
    EXPECT_TRUE(handle.value().decision()->fallback);
    EXPECT_EQ(handle.value().error()->code(), ErrorCode::DispatcherStopped);

    auto refused = dispatcher.requestDecision("dario", "blocked", memberContext("dario", 1));
    ASSERT_TRUE(refused.hasError());
    EXPECT_EQ(refused.error().code(), ErrorCode::DispatcherStopped);
}

// ═══════════════════════════════════════════════════════════════════════════
// poll()
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(DecisionDispatcherTest, PollReturnsResultsInTaskOrder) {
    gsim::event::EventBus bus;
    std::vector<std::string> completed;
    bus.subscribe(std::string(gsim::event::types::kDecisionCompleted),
                  [&](const gsim::event::Event& e) {
                      completed.push_back(e.subject.value_or(""));
                  });

    DecisionDispatcher dispatcher(engine_, scheduler_, &bus);
    std::vector<uint64_t> ids;
    for (const char* agent : {"brenna", "dario", "tamsin", "ulric"}) {
        auto h = dispatcher.requestDecision(agent, "member", memberContext(agent, 100));
        ASSERT_TRUE(h.hasValue());
        ids.push_back(h.value().taskId());
    }

    auto resolved = pollUntil(dispatcher, ids.size(), 3);
    ASSERT_EQ(resolved.size(), ids.size());
    for (std::size_t i = 1; i < resolved.size(); ++i) {
        EXPECT_LT(resolved[i - 1].taskId, resolved[i].taskId);
    }
    for (const auto& r : resolved) {
        EXPECT_EQ(r.outcome, DecisionOutcome::Completed);
        EXPECT_EQ(r.decision.actionId, "train");
    }

    bus.drainAll();
    EXPECT_EQ(completed.size(), ids.size());
}

TEST(DecisionDispatcherKeyTest, KeyDependsOnTreeAndSituation) {
    SituationContext a("x", 0);
    a.set("gold", 1);
    SituationContext b("x", 50);
    b.set("gold", 1);

    auto k1 = DecisionDispatcher::cacheKeyFor("x", "member", a);
    auto k2 = DecisionDispatcher::cacheKeyFor("x", "member", b);
    auto k3 = DecisionDispatcher::cacheKeyFor("x", "other", a);
    auto k4 = DecisionDispatcher::cacheKeyFor("y", "member", a);

    EXPECT_EQ(k1, k2);
    EXPECT_NE(k1, k3);
    EXPECT_NE(k1, k4);
}
