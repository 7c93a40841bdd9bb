#pragma once

/// @file simulation_config.hpp
/// @brief Typed runtime configuration assembled from ConfigManager keys.

#include "gsim/ai/decision_dispatcher.hpp"
#include "gsim/event/event_bus.hpp"
#include "gsim/foundation/config_manager.hpp"
#include "gsim/foundation/game_result.hpp"
#include "gsim/state/snapshot_store.hpp"

#include <chrono>
#include <cstdint>
#include <thread>

namespace gsim::runtime {

struct TickSchedulerConfig {
    uint32_t tickRate = 60;
    uint32_t maxCatchUpTicks = 5;
    double performanceWarningRatio = 0.8;
    uint32_t performanceWarningTicks = 5;
    std::chrono::microseconds drainBudget{2000};
    uint64_t autosaveIntervalTicks = 0;  ///< 0 disables autosave.
    std::size_t healthWindow = 60;       ///< Ticks in the rolling average.
};

struct SimulationConfig {
    TickSchedulerConfig ticks;
    std::size_t workerPoolSize = std::thread::hardware_concurrency();
    /// Workers reserved for state validation, never shared with decision
    /// solvers. 0 validates inline on the committing thread.
    std::size_t validationPoolSize = 2;
    ai::DecisionDispatcherConfig decisions;
    event::EventBusConfig events;
    state::SnapshotStoreConfig persistence;
};

/// Read every runtime key from @p config, defaulting absent ones.
///
/// Keys: simulation.{tick_rate, max_catch_up_ticks,
/// performance_warning_ratio, performance_warning_ticks,
/// autosave_interval_ticks}, workers.{pool_size, validation_pool_size},
/// ai.{cache_ttl, cache_max_entries, default_deadline_ms},
/// events.{drain_budget_ms, handler_failure_threshold,
/// clock_skew_tolerance_ms, history_capacity},
/// persistence.{directory, max_retained}.
///
/// @return ConfigTypeMismatch for a value of the wrong type,
///         ConfigInvalidValue for a zero tick rate or pool size or a
///         warning ratio outside (0, 1].
foundation::GameResult<SimulationConfig> loadSimulationConfig(
    const foundation::ConfigManager& config);

}  // namespace gsim::runtime
