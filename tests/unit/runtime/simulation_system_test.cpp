#include <gtest/gtest.h>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "gsim/ai/behavior_engine.hpp"
#include "gsim/ai/decision_dispatcher.hpp"
#include "gsim/event/event_bus.hpp"
#include "gsim/event/event_types.hpp"
#include "gsim/foundation/job_scheduler.hpp"
#include "gsim/runtime/simulation_system.hpp"
#include "gsim/state/state_manager.hpp"

using namespace gsim::runtime;
using namespace gsim::state;
using gsim::ai::Decision;
using gsim::ai::DecisionOutcome;
using gsim::ai::ResolvedDecision;
using namespace std::chrono_literals;

namespace {

GameState twoGuilds() {
    GameState s;
    Guild a;
    a.id = "a";
    a.members["a1"] = GuildMember{"a1", "A1", GuildRole::Leader, 3, 50};
    a.members["a2"] = GuildMember{"a2", "A2", GuildRole::Member, 1, 20};
    Guild b;
    b.id = "b";
    b.members["b1"] = GuildMember{"b1", "B1", GuildRole::Leader, 2, 70};
    Guild empty;
    empty.id = "empty";
    s.guild.guilds = {{"a", a}, {"b", b}, {"empty", empty}};
    s.economy.treasuries["a"] = ResourceAmount{100, 0, 0};
    return s;
}

ResolvedDecision resolved(uint64_t taskId, const std::string& agent, const std::string& action,
                          bool fallback = false) {
    ResolvedDecision r;
    r.taskId = taskId;
    r.decision.agentId = agent;
    r.decision.treeId = "member";
    r.decision.actionId = action;
    r.decision.fallback = fallback;
    r.outcome = fallback ? DecisionOutcome::Timeout : DecisionOutcome::Completed;
    return r;
}

} // namespace

class SimulationSystemTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(state_.initialize(twoGuilds()).hasValue());
    }

    TickContext context(uint64_t tick, const std::vector<ResolvedDecision>& decisions,
                        gsim::ai::DecisionDispatcher* dispatcher = nullptr) {
        return TickContext{tick, 16ms, decisions, state_, bus_, dispatcher};
    }

    gsim::event::EventBus bus_;
    StateManager state_;
    std::vector<ResolvedDecision> none_;
};

// ═══════════════════════════════════════════════════════════════════════════
// EconomySystem
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(SimulationSystemTest, IncomeTransactionSkipsEmptyGuilds) {
    EconomySystem economy(EconomyConfig{10, 5, 1, 0});
    auto tx = economy.buildIncomeTransaction(state_.state());
    EXPECT_EQ(tx.size(), 2u);
    EXPECT_EQ(tx.label(), "economy.income");
}

TEST_F(SimulationSystemTest, EconomyCollectsOnInterval) {
    EconomySystem economy(EconomyConfig{10, 5, 1, 0});
    std::vector<IncomeCollectedPayload> collected;
    bus_.subscribe(std::string(gsim::event::types::kEconomyIncomeCollected),
                   [&](const gsim::event::Event& e) {
                       if (const auto* p = e.payloadAs<IncomeCollectedPayload>()) {
                           collected.push_back(*p);
                       }
                   });

    auto early = context(9, none_);
    ASSERT_TRUE(economy.update(early).hasValue());
    EXPECT_EQ(state_.version(), 0u);

    auto due = context(10, none_);
    ASSERT_TRUE(economy.update(due).hasValue());
    EXPECT_EQ(state_.version(), 1u);
    EXPECT_EQ(state_.state().economy.treasuries.at("a").gold, 110);
    EXPECT_EQ(state_.state().economy.treasuries.at("a").materials, 2);
    EXPECT_EQ(state_.state().economy.treasuries.at("b").gold, 5);

    bus_.drainAll();
    ASSERT_EQ(collected.size(), 2u);
    EXPECT_EQ(collected[0].guildId, "a");
    EXPECT_EQ(collected[0].balance.gold, 110);
    EXPECT_EQ(collected[1].income.gold, 5);
}

// ═══════════════════════════════════════════════════════════════════════════
// DecisionApplySystem
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(SimulationSystemTest, AppliesCompletedDecisionsOnly) {
    DecisionApplySystem apply;
    apply.registerEffect("train", [](const Decision& d, const GameState& s)
                                      -> std::optional<StateTransaction> {
        Guild g = s.guild.guilds.at("a");
        g.members[d.agentId].level += 1;
        StateUpdate u;
        u.guilds["a"] = g;
        StateTransaction tx("train:" + d.agentId);
        tx.addUpdate("train", u);
        return tx;
    });

    std::vector<ActionExecutedPayload> executed;
    bus_.subscribe(std::string(gsim::event::types::kActionExecuted),
                   [&](const gsim::event::Event& e) {
                       if (const auto* p = e.payloadAs<ActionExecutedPayload>()) {
                           executed.push_back(*p);
                       }
                   });

    std::vector<ResolvedDecision> decisions = {resolved(1, "a1", "train"),
                                               resolved(2, "a2", "noop", true),
                                               resolved(3, "b1", "wander")};
    auto ctx = context(4, decisions);
    ASSERT_TRUE(apply.update(ctx).hasValue());

    EXPECT_EQ(apply.appliedCount(), 2u);
    EXPECT_EQ(apply.skippedFallbacks(), 1u);
    EXPECT_EQ(state_.pendingTransactions(), 1u);
    EXPECT_EQ(state_.state().guild.guilds.at("a").members.at("a1").level, 3);

    bus_.drainAll();
    ASSERT_EQ(executed.size(), 2u);
    EXPECT_EQ(executed[0].agentId, "a1");
    EXPECT_TRUE(executed[0].effectQueued);
    EXPECT_EQ(executed[1].actionId, "wander");
    EXPECT_FALSE(executed[1].effectQueued);

    // Effects land on the following tick.
    EXPECT_TRUE(state_.applyDueTransactions(4).empty());
    auto applied = state_.applyDueTransactions(5);
    ASSERT_EQ(applied.size(), 1u);
    EXPECT_TRUE(applied[0].committed);
    EXPECT_EQ(state_.state().guild.guilds.at("a").members.at("a1").level, 4);
}

// ═══════════════════════════════════════════════════════════════════════════
// AgentPlannerSystem
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(SimulationSystemTest, DefaultContextCarriesMemberFacts) {
    gsim::ai::SituationContext ctx("a2", 0);
    const auto& world = state_.state();
    const auto& guild = world.guild.guilds.at("a");
    AgentPlannerSystem::defaultContext(world, guild, guild.members.at("a2"), ctx);

    EXPECT_DOUBLE_EQ(ctx.number("level"), 1.0);
    EXPECT_DOUBLE_EQ(ctx.number("satisfaction"), 20.0);
    EXPECT_DOUBLE_EQ(ctx.number("guild_size"), 2.0);
    EXPECT_DOUBLE_EQ(ctx.number("gold"), 100.0);
    ASSERT_NE(ctx.get<std::string>("role"), nullptr);
    EXPECT_EQ(*ctx.get<std::string>("role"), "Member");
}

TEST_F(SimulationSystemTest, PlannerRequestsEachMemberOncePerInterval) {
    gsim::ai::BehaviorEngine engine;
    gsim::ai::BehaviorTreeBuilder b;
    auto root = b.action("idle", "rest", 0.1);
    auto tree = b.build(root);
    ASSERT_TRUE(tree.hasValue());
    ASSERT_TRUE(engine.registerTree("member", std::move(tree).value()).hasValue());

    gsim::foundation::GameJobScheduler workers(2);
    gsim::ai::DecisionDispatcher dispatcher(engine, workers);

    AgentPlannerConfig cfg;
    cfg.treeId = "member";
    cfg.intervalTicks = 4;
    AgentPlannerSystem planner(cfg);

    for (uint64_t tick = 1; tick <= 4; ++tick) {
        auto ctx = context(tick, none_, &dispatcher);
        ASSERT_TRUE(planner.update(ctx).hasValue());
    }
    EXPECT_EQ(planner.requestsIssued(), 3u);
    dispatcher.shutdown();
}

TEST_F(SimulationSystemTest, PlannerWithoutDispatcherIsIdle) {
    AgentPlannerSystem planner;
    auto ctx = context(1, none_);
    ASSERT_TRUE(planner.update(ctx).hasValue());
    EXPECT_EQ(planner.requestsIssued(), 0u);
}

TEST_F(SimulationSystemTest, PlannerReportsStoppedDispatcher) {
    gsim::ai::BehaviorEngine engine;
    gsim::foundation::GameJobScheduler workers(1);
    gsim::ai::DecisionDispatcher dispatcher(engine, workers);
    dispatcher.shutdown();

    AgentPlannerConfig cfg;
    cfg.intervalTicks = 1;
    AgentPlannerSystem planner(cfg);
    auto ctx = context(1, none_, &dispatcher);
    auto result = planner.update(ctx);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), gsim::foundation::ErrorCode::DispatcherStopped);
}
