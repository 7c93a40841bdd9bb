/// @file simulation_integration_test.cpp
/// @brief End-to-end scenarios across the bus, dispatcher, state manager,
///        snapshot store and tick scheduler, wired through Simulation.

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <future>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "gsim/ai/behavior_engine.hpp"
#include "gsim/ai/decision_dispatcher.hpp"
#include "gsim/app/demo_world.hpp"
#include "gsim/event/event_bus.hpp"
#include "gsim/event/event_types.hpp"
#include "gsim/foundation/error_code.hpp"
#include "gsim/runtime/simulation.hpp"
#include "gsim/runtime/tick_scheduler.hpp"
#include "gsim/state/snapshot_store.hpp"
#include "gsim/state/state_manager.hpp"

using namespace gsim;
using foundation::ErrorCode;
using foundation::GameResult;
using namespace std::chrono_literals;

class SimulationIntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        saveDir_ = std::filesystem::temp_directory_path() /
                   (std::string("gsim_integration_") + info->name());
        std::filesystem::remove_all(saveDir_);

        runtime::SimulationConfig config;
        config.workerPoolSize = 2;
        config.persistence.directory = saveDir_;
        config.decisions.defaultDeadline = 500ms;

        auto created = runtime::Simulation::create(config);
        ASSERT_TRUE(created.hasValue()) << created.error().describe();
        sim_ = std::move(created).value();

        auto tree = app::buildMemberTree();
        ASSERT_TRUE(tree.hasValue());
        ASSERT_TRUE(sim_->behaviors()
                        .registerTree(std::string(app::kMemberTreeId), std::move(tree).value())
                        .hasValue());
        ASSERT_TRUE(sim_->state().initialize(app::buildDemoWorld()).hasValue());
    }

    void TearDown() override {
        sim_.reset();
        std::error_code ec;
        std::filesystem::remove_all(saveDir_, ec);
    }

    std::filesystem::path saveDir_;
    std::unique_ptr<runtime::Simulation> sim_;
};

// ═══════════════════════════════════════════════════════════════════════════
// Event ordering
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(SimulationIntegrationTest, CriticalEventOvertakesEarlierHighEvent) {
    std::vector<std::string> order;
    sim_->bus().subscribe("*", [&](const event::Event& e) {
        if (e.source == "scenario") {
            order.push_back(e.type);
        }
    });

    std::vector<event::Event> batch;
    batch.push_back(event::makeEvent("scenario", std::string(event::types::kGuildMemberJoined),
                                     {}, event::EventPriority::High));
    batch.push_back(event::makeEvent("scenario",
                                     std::string(event::types::kCombatBattleStarted), {},
                                     event::EventPriority::Critical));
    ASSERT_TRUE(sim_->bus().publishBatch(std::move(batch)).hasValue());

    sim_->ticks().runTicks(1);
    ASSERT_EQ(order.size(), 2u);
    EXPECT_EQ(order[0], event::types::kCombatBattleStarted);
    EXPECT_EQ(order[1], event::types::kGuildMemberJoined);
}

TEST_F(SimulationIntegrationTest, DeliveryRespectsSubscribedType) {
    int guildEvents = 0;
    int combatEvents = 0;
    sim_->bus().subscribe(std::string(event::types::kGuildMemberJoined),
                          [&](const event::Event&) { ++guildEvents; });
    sim_->bus().subscribe("combat.*", [&](const event::Event&) { ++combatEvents; });

    ASSERT_TRUE(sim_->bus()
                    .publish(event::makeEvent("scenario",
                                              std::string(event::types::kGuildMemberJoined)))
                    .hasValue());
    sim_->ticks().runTicks(1);
    EXPECT_EQ(guildEvents, 1);
    EXPECT_EQ(combatEvents, 0);
}

// ═══════════════════════════════════════════════════════════════════════════
// Transactions and snapshots
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(SimulationIntegrationTest, ThrowingOperationLeavesVersionUnchanged) {
    auto& state = sim_->state();
    auto before = state.state();

    state::StateTransaction tx("scenario-b");
    state::StateUpdate pay;
    pay.treasuries["ironhold"] = state::ResourceAmount{1, 1, 1};
    tx.addUpdate("pay", pay);
    tx.add("explode", [](state::GameState&) -> GameResult<void> {
        throw std::runtime_error("operation 2 exploded");
    });
    tx.add("never", [](state::GameState&) { return GameResult<void>::ok(); });

    auto result = state.executeTransaction(tx);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::TransactionFailed);
    EXPECT_EQ(state.version(), before.version);
    EXPECT_EQ(state.state(), before);
}

TEST_F(SimulationIntegrationTest, SnapshotRoundTripThroughStore) {
    runtime::AgentPlannerConfig planner;
    planner.treeId = std::string(app::kMemberTreeId);
    ASSERT_TRUE(sim_->installDefaultSystems({}, planner).hasValue());
    sim_->ticks().runTicks(3);

    auto checksum = sim_->state().checksum();
    auto saved = sim_->saveSnapshot();
    ASSERT_TRUE(saved.hasValue()) << saved.error().describe();

    state::StateUpdate update;
    update.marketPrices["ore"] = 99;
    ASSERT_TRUE(sim_->state().updateState(update).hasValue());
    ASSERT_NE(sim_->state().checksum(), checksum);

    ASSERT_TRUE(sim_->restoreLatestSnapshot().hasValue());
    EXPECT_EQ(sim_->state().checksum(), checksum);
}

TEST_F(SimulationIntegrationTest, TamperedSnapshotFailsClosed) {
    auto snapshot = sim_->state().createSnapshot();
    snapshot.checksum[0] = snapshot.checksum[0] == 'a' ? 'b' : 'a';

    auto before = sim_->state().state();
    auto restored = sim_->state().restoreFromSnapshot(snapshot);
    ASSERT_TRUE(restored.hasError());
    EXPECT_EQ(restored.error().code(), ErrorCode::CorruptedSnapshot);
    EXPECT_EQ(sim_->state().state(), before);
}

// ═══════════════════════════════════════════════════════════════════════════
// Decisions
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(SimulationIntegrationTest, LateWorkerResultNeverReachesState) {
    // Only the apply system; no planner competing for the solver.
    auto apply = std::make_unique<runtime::DecisionApplySystem>();
    auto* applySystem = apply.get();
    ASSERT_TRUE(sim_->ticks().addSystem(std::move(apply)).hasValue());
    applySystem->registerEffect(
        "train", [](const ai::Decision&, const state::GameState&)
                     -> std::optional<state::StateTransaction> {
            state::StateTransaction tx("late-train");
            tx.add("mutate", [](state::GameState& s) {
                s.guild.guilds["ironhold"].reputation += 1000;
                return GameResult<void>::ok();
            });
            return tx;
        });

    sim_->dispatcher().setSolver([](const ai::DecisionTask& task) {
        std::this_thread::sleep_for(50ms);
        ai::Decision d;
        d.agentId = task.agentId;
        d.actionId = "train";
        d.plan = {"train"};
        return GameResult<ai::Decision>::ok(std::move(d));
    });

    ai::SituationContext ctx("brenna", 0);
    ctx.set("gold", 250);
    auto started = std::chrono::steady_clock::now();
    auto handle = sim_->dispatcher().requestDecision("brenna", "stub", ctx,
                                                     ai::DecisionPriority::Normal, 10ms);
    ASSERT_TRUE(handle.hasValue());

    auto decision = sim_->dispatcher().await(handle.value());
    auto waited = std::chrono::steady_clock::now() - started;
    ASSERT_TRUE(decision.hasValue());
    EXPECT_TRUE(decision.value().fallback);
    EXPECT_LT(waited, 45ms);

    auto version = sim_->state().version();
    auto reputation = sim_->state().state().guild.guilds.at("ironhold").reputation;

    std::this_thread::sleep_for(80ms);
    sim_->ticks().runTicks(3);

    EXPECT_EQ(sim_->dispatcher().stats().lateResultsDiscarded, 1u);
    EXPECT_EQ(sim_->state().state().guild.guilds.at("ironhold").reputation, reputation);
    EXPECT_EQ(sim_->state().version(), version);
    EXPECT_EQ(applySystem->appliedCount(), 0u);
}

TEST_F(SimulationIntegrationTest, BusySolverPoolDoesNotDelayCommitsOrTicks) {
    runtime::SimulationConfig config;
    config.workerPoolSize = 1;
    config.persistence.directory = saveDir_ / "single_worker";
    config.decisions.defaultDeadline = 2000ms;

    auto created = runtime::Simulation::create(config);
    ASSERT_TRUE(created.hasValue()) << created.error().describe();
    auto sim = std::move(created).value();
    ASSERT_TRUE(sim->state().initialize(app::buildDemoWorld()).hasValue());

    runtime::EconomyConfig economy;
    economy.intervalTicks = 1;
    ASSERT_TRUE(
        sim->ticks().addSystem(std::make_unique<runtime::EconomySystem>(economy)).hasValue());

    // Hold the only solver worker until the end of the test.
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    struct OpenGate {
        std::promise<void>& p;
        ~OpenGate() { p.set_value(); }
    } openOnExit{release};
    auto entered = std::make_shared<std::atomic<bool>>(false);
    sim->dispatcher().setSolver([gate, entered](const ai::DecisionTask& task) {
        *entered = true;
        gate.wait();
        ai::Decision d;
        d.agentId = task.agentId;
        d.actionId = "rest";
        d.plan = {"rest"};
        return GameResult<ai::Decision>::ok(std::move(d));
    });

    ai::SituationContext ctx("tamsin", 0);
    ASSERT_TRUE(sim->dispatcher().requestDecision("tamsin", "stub", ctx).hasValue());
    auto waitStart = std::chrono::steady_clock::now();
    while (!*entered && std::chrono::steady_clock::now() - waitStart < 1s) {
        std::this_thread::sleep_for(1ms);
    }
    ASSERT_TRUE(*entered);

    auto version = sim->state().version();
    auto started = std::chrono::steady_clock::now();
    sim->ticks().runTicks(5);
    state::StateUpdate update;
    update.marketPrices["ore"] = 13;
    auto committed = sim->state().updateState(update);
    auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_TRUE(committed.hasValue());
    EXPECT_EQ(sim->state().version(), version + 6);
    EXPECT_LT(elapsed, 100ms);
    auto health = sim->ticks().health();
    EXPECT_LT(health.averageTickTime, health.budget);
    EXPECT_EQ(health.consecutiveOverBudget, 0u);
}

TEST_F(SimulationIntegrationTest, CachedDecisionServedWithoutDispatch) {
    ai::SituationContext ctx("kofi", 0);
    ctx.set("satisfaction", 45).set("gold", 60).set("level", 2).set("guild_size", 3);

    auto first = sim_->dispatcher().requestDecision("kofi", std::string(app::kMemberTreeId), ctx);
    ASSERT_TRUE(first.hasValue());
    auto firstDecision = sim_->dispatcher().await(first.value());
    ASSERT_TRUE(firstDecision.hasValue());

    auto second = sim_->dispatcher().requestDecision("kofi", std::string(app::kMemberTreeId), ctx);
    ASSERT_TRUE(second.hasValue());
    EXPECT_TRUE(second.value().fromCache());
    EXPECT_EQ(second.value().decision()->actionId, firstDecision.value().actionId);
    EXPECT_EQ(sim_->dispatcher().stats().dispatched, 1u);
}

// ═══════════════════════════════════════════════════════════════════════════
// Full run
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(SimulationIntegrationTest, DemoWorldEvolvesAndStaysValid) {
    runtime::EconomyConfig economy;
    economy.intervalTicks = 10;
    runtime::AgentPlannerConfig planner;
    planner.treeId = std::string(app::kMemberTreeId);
    planner.intervalTicks = 5;
    ASSERT_TRUE(sim_->installDefaultSystems(economy, planner).hasValue());
    app::registerDemoEffects(*sim_->decisionApply());

    int executed = 0;
    sim_->bus().subscribe(std::string(event::types::kActionExecuted),
                          [&](const event::Event&) { ++executed; });

    // Give workers time between ticks so decisions resolve.
    for (int i = 0; i < 40; ++i) {
        sim_->ticks().runTicks(1);
        std::this_thread::sleep_for(2ms);
    }
    sim_->ticks().runTicks(1);

    EXPECT_EQ(sim_->ticks().tickCount(), 41u);
    EXPECT_GT(sim_->agentPlanner()->requestsIssued(), 0u);
    EXPECT_GT(sim_->decisionApply()->appliedCount(), 0u);
    EXPECT_GT(executed, 0);
    EXPECT_GT(sim_->state().version(), 0u);
    EXPECT_TRUE(sim_->state().validate().ok());

    auto saved = sim_->saveSnapshot();
    ASSERT_TRUE(saved.hasValue());
    EXPECT_EQ(sim_->snapshots().snapshotCount(), 1u);

    sim_->shutdown();
    sim_->shutdown();
}
