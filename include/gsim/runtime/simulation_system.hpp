#pragma once

/// @file simulation_system.hpp
/// @brief Per-tick simulation systems run by the TickScheduler, and the
///        built-in economy, agent-planning and decision-apply systems.

#include "gsim/ai/decision_dispatcher.hpp"
#include "gsim/foundation/game_result.hpp"
#include "gsim/state/game_state.hpp"
#include "gsim/state/state_transaction.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gsim::event {
class EventBus;
}

namespace gsim::state {
class StateManager;
}

namespace gsim::runtime {

/// Everything a system may touch during one logic tick.
struct TickContext {
    uint64_t tick = 0;
    std::chrono::microseconds tickLength{0};

    /// Decisions resolved by this tick's poll(), ordered by task id.
    const std::vector<ai::ResolvedDecision>& decisions;

    state::StateManager& state;
    event::EventBus& bus;
    ai::DecisionDispatcher* dispatcher = nullptr;
};

/// A unit of per-tick simulation logic. Systems run on the simulation
/// thread in registration order; an error result is logged and the
/// remaining systems still run.
class ISimulationSystem {
public:
    virtual ~ISimulationSystem() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    virtual foundation::GameResult<void> update(TickContext& ctx) = 0;
};

// ── EconomySystem ───────────────────────────────────────────────────────────

struct EconomyConfig {
    uint64_t intervalTicks = 60;
    int64_t goldPerMember = 5;
    int64_t materialsPerMember = 1;
    int64_t influencePerMember = 0;
};

/// Payload of economy.income.collected.
struct IncomeCollectedPayload {
    std::string guildId;
    state::ResourceAmount income;
    state::ResourceAmount balance;
    uint64_t tick = 0;
};

/// Credits each guild's treasury with per-member income every
/// intervalTicks, as one transaction per collection.
class EconomySystem final : public ISimulationSystem {
public:
    explicit EconomySystem(EconomyConfig config = {});

    [[nodiscard]] std::string_view name() const noexcept override { return "economy"; }
    foundation::GameResult<void> update(TickContext& ctx) override;

    [[nodiscard]] const EconomyConfig& config() const noexcept { return config_; }

    /// The collection transaction for @p state (empty when no guild earns).
    [[nodiscard]] state::StateTransaction buildIncomeTransaction(
        const state::GameState& state) const;

private:
    EconomyConfig config_;
};

// ── AgentPlannerSystem ──────────────────────────────────────────────────────

/// Builds the facts an agent decides on from the current state.
using ContextBuilder = std::function<void(const state::GameState&, const state::Guild&,
                                          const state::GuildMember&, ai::SituationContext&)>;

struct AgentPlannerConfig {
    std::string treeId = "guild_member";
    uint64_t intervalTicks = 30;
    std::optional<std::chrono::milliseconds> deadline;
    ai::DecisionPriority priority = ai::DecisionPriority::Normal;
};

/// Requests one decision per guild member every intervalTicks. Members
/// are spread over the interval by a stable hash of their id.
class AgentPlannerSystem final : public ISimulationSystem {
public:
    explicit AgentPlannerSystem(AgentPlannerConfig config = {});

    [[nodiscard]] std::string_view name() const noexcept override { return "agent_planner"; }
    foundation::GameResult<void> update(TickContext& ctx) override;

    /// Replace the default facts (role, level, satisfaction, guild size,
    /// treasury gold).
    void setContextBuilder(ContextBuilder builder);

    [[nodiscard]] uint64_t requestsIssued() const noexcept { return requests_; }

    /// Default fact set.
    static void defaultContext(const state::GameState& state, const state::Guild& guild,
                               const state::GuildMember& member, ai::SituationContext& ctx);

private:
    AgentPlannerConfig config_;
    ContextBuilder builder_;
    uint64_t requests_ = 0;
};

// ── DecisionApplySystem ─────────────────────────────────────────────────────

/// Payload of ai.action.executed.
struct ActionExecutedPayload {
    std::string agentId;
    std::string treeId;
    std::string actionId;
    double score = 0.0;
    uint64_t tick = 0;
    bool effectQueued = false;
};

/// Maps a decision to the state change it causes; nullopt for none.
using ActionEffect = std::function<std::optional<state::StateTransaction>(
    const ai::Decision&, const state::GameState&)>;

/// Turns completed, non-fallback decisions into ai.action.executed events
/// at the tick boundary and queues the registered effect for next tick.
class DecisionApplySystem final : public ISimulationSystem {
public:
    DecisionApplySystem() = default;

    [[nodiscard]] std::string_view name() const noexcept override { return "decision_apply"; }
    foundation::GameResult<void> update(TickContext& ctx) override;

    void registerEffect(std::string actionId, ActionEffect effect);

    [[nodiscard]] uint64_t appliedCount() const noexcept { return applied_; }
    [[nodiscard]] uint64_t skippedFallbacks() const noexcept { return skipped_; }

private:
    std::map<std::string, ActionEffect, std::less<>> effects_;
    uint64_t applied_ = 0;
    uint64_t skipped_ = 0;
};

}  // namespace gsim::runtime
