#pragma once

/// @file simulation.hpp
/// @brief Composition root wiring the worker pool, event bus, behavior
///        engine, decision dispatcher, state manager, snapshot store and
///        tick scheduler together.

#include "gsim/foundation/game_result.hpp"
#include "gsim/runtime/simulation_config.hpp"
#include "gsim/runtime/simulation_system.hpp"

#include <memory>

namespace gsim::ai {
class BehaviorEngine;
class DecisionDispatcher;
}

namespace gsim::foundation {
class GameJobScheduler;
}

namespace gsim::state {
class SnapshotStore;
class StateManager;
struct SnapshotInfo;
}

namespace gsim::event {
class EventBus;
}

namespace gsim::runtime {

class TickScheduler;

/// Owns every simulation component; components see each other only
/// through the references handed out here.
///
/// @code
///   auto sim = Simulation::create(config);
///   if (!sim) { ... }
///   auto& s = *sim.value();
///   s.behaviors().registerTree("guild_member", std::move(tree));
///   s.installDefaultSystems();
///   s.ticks().runTicks(600);
///   s.saveSnapshot();
/// @endcode
class Simulation {
public:
    /// Builds all components and opens the snapshot store.
    /// @return PersistenceError when the store directory cannot be created.
    static foundation::GameResult<std::unique_ptr<Simulation>> create(SimulationConfig config);

    /// Stops the loop, then the dispatcher, then the pool.
    ~Simulation();

    Simulation(const Simulation&) = delete;
    Simulation& operator=(const Simulation&) = delete;

    /// Register DecisionApplySystem, EconomySystem and AgentPlannerSystem
    /// (in that order) and enable autosave.
    foundation::GameResult<void> installDefaultSystems(EconomyConfig economy = {},
                                                       AgentPlannerConfig planner = {});

    /// Snapshot the current state into the store.
    foundation::GameResult<state::SnapshotInfo> saveSnapshot();

    /// Restore the newest stored snapshot (verified by the state manager).
    foundation::GameResult<void> restoreLatestSnapshot();

    /// Idempotent.
    void shutdown();

    [[nodiscard]] event::EventBus& bus() noexcept;
    [[nodiscard]] ai::BehaviorEngine& behaviors() noexcept;
    [[nodiscard]] ai::DecisionDispatcher& dispatcher() noexcept;
    [[nodiscard]] state::StateManager& state() noexcept;
    [[nodiscard]] state::SnapshotStore& snapshots() noexcept;
    [[nodiscard]] foundation::GameJobScheduler& workers() noexcept;
    [[nodiscard]] TickScheduler& ticks() noexcept;
    [[nodiscard]] const SimulationConfig& config() const noexcept;

    /// Installed by installDefaultSystems(); nullptr before.
    [[nodiscard]] DecisionApplySystem* decisionApply() noexcept;
    [[nodiscard]] AgentPlannerSystem* agentPlanner() noexcept;

private:
    explicit Simulation(SimulationConfig config);

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace gsim::runtime
