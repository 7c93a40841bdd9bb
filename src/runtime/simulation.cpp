/// @file simulation.cpp
/// @brief Simulation composition root.

#include "gsim/runtime/simulation.hpp"

#include "gsim/ai/behavior_engine.hpp"
#include "gsim/ai/decision_dispatcher.hpp"
#include "gsim/event/event_bus.hpp"
#include "gsim/foundation/game_logger.hpp"
#include "gsim/foundation/job_scheduler.hpp"
#include "gsim/state/snapshot_store.hpp"
#include "gsim/state/state_manager.hpp"
#include "gsim/runtime/tick_scheduler.hpp"

#include <memory>

namespace gsim::runtime {

using foundation::GameResult;
using foundation::LogCategory;

// Member order is construction order; destruction runs in reverse.
struct Simulation::Impl {
    SimulationConfig config;
    foundation::GameJobScheduler workers;
    // Separate from workers so a slow solver never delays a commit.
    std::unique_ptr<foundation::GameJobScheduler> validationWorkers;
    event::EventBus bus;
    ai::BehaviorEngine engine;
    ai::DecisionDispatcher dispatcher;
    state::StateManager state;
    state::SnapshotStore store;
    TickScheduler ticks;

    DecisionApplySystem* decisionApply = nullptr;
    AgentPlannerSystem* agentPlanner = nullptr;
    bool stopped = false;

    explicit Impl(SimulationConfig cfg)
        : config(std::move(cfg)),
          workers(config.workerPoolSize),
          validationWorkers(config.validationPoolSize > 0
                                ? std::make_unique<foundation::GameJobScheduler>(
                                      config.validationPoolSize)
                                : nullptr),
          bus(config.events),
          engine(&bus),
          dispatcher(engine, workers, &bus, config.decisions),
          state(&bus, validationWorkers.get()),
          store(config.persistence),
          ticks(bus, state, &dispatcher, config.ticks) {}
};

Simulation::Simulation(SimulationConfig config)
    : impl_(std::make_unique<Impl>(std::move(config))) {}

Simulation::~Simulation() {
    shutdown();
}

GameResult<std::unique_ptr<Simulation>> Simulation::create(SimulationConfig config) {
    std::unique_ptr<Simulation> sim(new Simulation(std::move(config)));

    auto opened = sim->impl_->store.open();
    if (!opened) {
        return GameResult<std::unique_ptr<Simulation>>::err(std::move(opened).error());
    }

    GSIM_LOG_INFO(LogCategory::Core,
                  "simulation ready: " + std::to_string(sim->impl_->workers.workerCount()) +
                      " workers, " + std::to_string(sim->impl_->config.ticks.tickRate) +
                      " ticks/s");
    return GameResult<std::unique_ptr<Simulation>>::ok(std::move(sim));
}

GameResult<void> Simulation::installDefaultSystems(EconomyConfig economy,
                                                   AgentPlannerConfig planner) {
    auto apply = std::make_unique<DecisionApplySystem>();
    auto* applyPtr = apply.get();
    auto added = impl_->ticks.addSystem(std::move(apply));
    if (!added) {
        return added;
    }
    impl_->decisionApply = applyPtr;

    added = impl_->ticks.addSystem(std::make_unique<EconomySystem>(economy));
    if (!added) {
        return added;
    }

    auto agents = std::make_unique<AgentPlannerSystem>(std::move(planner));
    auto* agentsPtr = agents.get();
    added = impl_->ticks.addSystem(std::move(agents));
    if (!added) {
        return added;
    }
    impl_->agentPlanner = agentsPtr;

    impl_->ticks.setSnapshotStore(&impl_->store);
    return GameResult<void>::ok();
}

GameResult<state::SnapshotInfo> Simulation::saveSnapshot() {
    return impl_->store.save(impl_->state.createSnapshot());
}

GameResult<void> Simulation::restoreLatestSnapshot() {
    auto loaded = impl_->store.loadLatest();
    if (!loaded) {
        return GameResult<void>::err(std::move(loaded).error());
    }
    return impl_->state.restoreFromSnapshot(loaded.value());
}

void Simulation::shutdown() {
    if (impl_->stopped) {
        return;
    }
    impl_->stopped = true;
    impl_->ticks.stop();
    impl_->dispatcher.shutdown();
    impl_->workers.shutdown();
    if (impl_->validationWorkers) {
        impl_->validationWorkers->shutdown();
    }
    GSIM_LOG_INFO(LogCategory::Core, "simulation stopped at tick " +
                                         std::to_string(impl_->ticks.tickCount()));
}

// -- Accessors ---------------------------------------------------------------

event::EventBus& Simulation::bus() noexcept { return impl_->bus; }
ai::BehaviorEngine& Simulation::behaviors() noexcept { return impl_->engine; }
ai::DecisionDispatcher& Simulation::dispatcher() noexcept { return impl_->dispatcher; }
state::StateManager& Simulation::state() noexcept { return impl_->state; }
state::SnapshotStore& Simulation::snapshots() noexcept { return impl_->store; }
foundation::GameJobScheduler& Simulation::workers() noexcept { return impl_->workers; }
TickScheduler& Simulation::ticks() noexcept { return impl_->ticks; }
const SimulationConfig& Simulation::config() const noexcept { return impl_->config; }
DecisionApplySystem* Simulation::decisionApply() noexcept { return impl_->decisionApply; }
AgentPlannerSystem* Simulation::agentPlanner() noexcept { return impl_->agentPlanner; }

}  // namespace gsim::runtime
