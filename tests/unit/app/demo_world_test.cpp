#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "gsim/ai/behavior_engine.hpp"
#include "gsim/app/demo_world.hpp"
#include "gsim/event/event_bus.hpp"
#include "gsim/runtime/simulation_system.hpp"
#include "gsim/state/state_manager.hpp"
#include "gsim/state/state_validator.hpp"

using namespace gsim::app;
using gsim::ai::ResolvedDecision;
using gsim::ai::SituationContext;
using gsim::runtime::AgentPlannerSystem;

class DemoWorldTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto tree = buildMemberTree();
        ASSERT_TRUE(tree.hasValue()) << tree.error().describe();
        ASSERT_TRUE(engine_.registerTree(std::string(kMemberTreeId), std::move(tree).value())
                        .hasValue());
        ASSERT_TRUE(state_.initialize(buildDemoWorld()).hasValue());
    }

    /// Facts the planner would hand the tree for @p memberId.
    SituationContext contextFor(const std::string& memberId) const {
        const auto& world = state_.state();
        for (const auto& [id, guild] : world.guild.guilds) {
            auto member = guild.members.find(memberId);
            if (member != guild.members.end()) {
                SituationContext ctx(memberId, 1);
                AgentPlannerSystem::defaultContext(world, guild, member->second, ctx);
                return ctx;
            }
        }
        ADD_FAILURE() << "no member " << memberId;
        return SituationContext(memberId, 1);
    }

    std::string decide(const std::string& memberId) {
        auto result = engine_.evaluateTree(std::string(kMemberTreeId), contextFor(memberId));
        EXPECT_TRUE(result.hasValue());
        if (!result.hasValue() || !result.value().decision) {
            return {};
        }
        return result.value().decision->actionId;
    }

    gsim::ai::BehaviorEngine engine_;
    gsim::event::EventBus bus_;
    gsim::state::StateManager state_;
};

TEST_F(DemoWorldTest, WorldPassesBuiltinValidators) {
    auto report = gsim::state::ValidatorRegistry::withBuiltins().run(buildDemoWorld());
    EXPECT_TRUE(report.ok()) << report.summary();
    EXPECT_EQ(state_.state().guild.guilds.size(), 2u);
}

TEST_F(DemoWorldTest, MemberTreeBranches) {
    EXPECT_EQ(decide("tamsin"), "rest");   // satisfaction 35
    EXPECT_EQ(decide("ines"), "trade");    // saltmarsh holds 60 gold
    EXPECT_EQ(decide("brenna"), "train");  // 0.6 beats trade 0.44 and rest 0.3
}

TEST_F(DemoWorldTest, EffectsQueueNextTickChanges) {
    gsim::runtime::DecisionApplySystem apply;
    registerDemoEffects(apply);

    auto resolvedFor = [](uint64_t id, const std::string& agent, const std::string& action) {
        ResolvedDecision r;
        r.taskId = id;
        r.decision.agentId = agent;
        r.decision.treeId = std::string(kMemberTreeId);
        r.decision.actionId = action;
        return r;
    };
    std::vector<ResolvedDecision> decisions = {resolvedFor(1, "brenna", "train"),
                                               resolvedFor(2, "tamsin", "rest"),
                                               resolvedFor(3, "ines", "trade")};
    gsim::runtime::TickContext ctx{1, std::chrono::microseconds(16'667), decisions, state_, bus_,
                                   nullptr};
    ASSERT_TRUE(apply.update(ctx).hasValue());
    EXPECT_EQ(state_.pendingTransactions(), 3u);

    auto applied = state_.applyDueTransactions(2);
    ASSERT_EQ(applied.size(), 3u);
    for (const auto& a : applied) {
        EXPECT_TRUE(a.committed) << a.label;
    }

    const auto& world = state_.state();
    EXPECT_EQ(world.guild.guilds.at("ironhold").members.at("brenna").level, 9);
    EXPECT_EQ(world.economy.treasuries.at("ironhold").gold, 240);
    EXPECT_EQ(world.guild.guilds.at("ironhold").members.at("tamsin").satisfaction, 40);
    EXPECT_EQ(world.economy.treasuries.at("saltmarsh").gold, 72);
    EXPECT_EQ(world.economy.treasuries.at("saltmarsh").materials, 11);
}
