/// @file simulation_config.cpp
/// @brief loadSimulationConfig().

#include "gsim/runtime/simulation_config.hpp"

#include "gsim/foundation/game_logger.hpp"

#include <algorithm>
#include <string>
#include <string_view>
#include <utility>

namespace gsim::runtime {

using foundation::ConfigManager;
using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;

namespace {

GameError invalidValue(std::string_view key, const std::string& why) {
    return GameError(ErrorCode::ConfigInvalidValue,
                     "invalid value for " + std::string(key) + ": " + why);
}

/// Overwrite @p target with @p key when present; @p target is the default.
template <typename T>
GameResult<void> readKey(const ConfigManager& config, std::string_view key, T& target) {
    auto value = config.getOr<T>(key, target);
    if (!value) {
        return GameResult<void>::err(std::move(value).error());
    }
    target = std::move(value).value();
    return GameResult<void>::ok();
}

/// Keys whose raw form differs from the SimulationConfig field.
struct RawValues {
    uint64_t poolSize = 1;
    uint64_t validationPoolSize = 0;
    uint64_t cacheMaxEntries = 0;
    int64_t deadlineMs = 0;
    double drainBudgetMs = 2.0;
    int64_t skewMs = 0;
    uint64_t historyCapacity = 0;
    std::string directory;
};

GameResult<void> readAll(const ConfigManager& config, SimulationConfig& out, RawValues& raw) {
    if (auto r = readKey(config, "simulation.tick_rate", out.ticks.tickRate); !r) {
        return r;
    }
    if (auto r = readKey(config, "simulation.max_catch_up_ticks", out.ticks.maxCatchUpTicks); !r) {
        return r;
    }
    if (auto r = readKey(config, "simulation.performance_warning_ratio",
                         out.ticks.performanceWarningRatio);
        !r) {
        return r;
    }
    if (auto r = readKey(config, "simulation.performance_warning_ticks",
                         out.ticks.performanceWarningTicks);
        !r) {
        return r;
    }
    if (auto r = readKey(config, "simulation.autosave_interval_ticks",
                         out.ticks.autosaveIntervalTicks);
        !r) {
        return r;
    }
    if (auto r = readKey(config, "workers.pool_size", raw.poolSize); !r) {
        return r;
    }
    if (auto r = readKey(config, "workers.validation_pool_size", raw.validationPoolSize); !r) {
        return r;
    }
    if (auto r = readKey(config, "ai.cache_ttl", out.decisions.cacheTtlTicks); !r) {
        return r;
    }
    if (auto r = readKey(config, "ai.cache_max_entries", raw.cacheMaxEntries); !r) {
        return r;
    }
    if (auto r = readKey(config, "ai.default_deadline_ms", raw.deadlineMs); !r) {
        return r;
    }
    if (auto r = readKey(config, "events.drain_budget_ms", raw.drainBudgetMs); !r) {
        return r;
    }
    if (auto r = readKey(config, "events.handler_failure_threshold",
                         out.events.handlerFailureThreshold);
        !r) {
        return r;
    }
    if (auto r = readKey(config, "events.clock_skew_tolerance_ms", raw.skewMs); !r) {
        return r;
    }
    if (auto r = readKey(config, "events.history_capacity", raw.historyCapacity); !r) {
        return r;
    }
    if (auto r = readKey(config, "persistence.directory", raw.directory); !r) {
        return r;
    }
    return readKey(config, "persistence.max_retained", out.persistence.maxRetained);
}

}  // namespace

GameResult<SimulationConfig> loadSimulationConfig(const ConfigManager& config) {
    SimulationConfig out;

    RawValues raw;
    raw.poolSize = std::max<std::size_t>(out.workerPoolSize, 1);
    raw.validationPoolSize = out.validationPoolSize;
    raw.cacheMaxEntries = out.decisions.cacheMaxEntries;
    raw.deadlineMs = out.decisions.defaultDeadline.count();
    raw.skewMs = out.events.clockSkewTolerance.count();
    raw.historyCapacity = out.events.historyCapacity;
    raw.directory = out.persistence.directory.string();

    auto read = readAll(config, out, raw);
    if (!read) {
        return GameResult<SimulationConfig>::err(std::move(read).error());
    }
    const auto poolSize = raw.poolSize;
    const auto deadlineMs = raw.deadlineMs;
    const auto drainBudgetMs = raw.drainBudgetMs;
    const auto skewMs = raw.skewMs;
    const auto& directory = raw.directory;

    if (out.ticks.tickRate == 0) {
        return GameResult<SimulationConfig>::err(
            invalidValue("simulation.tick_rate", "must be positive"));
    }
    if (poolSize == 0) {
        return GameResult<SimulationConfig>::err(
            invalidValue("workers.pool_size", "must be positive"));
    }
    if (!(out.ticks.performanceWarningRatio > 0.0 && out.ticks.performanceWarningRatio <= 1.0)) {
        return GameResult<SimulationConfig>::err(invalidValue(
            "simulation.performance_warning_ratio", "must lie in (0, 1]"));
    }
    if (out.ticks.performanceWarningTicks == 0) {
        return GameResult<SimulationConfig>::err(
            invalidValue("simulation.performance_warning_ticks", "must be positive"));
    }
    if (deadlineMs <= 0) {
        return GameResult<SimulationConfig>::err(
            invalidValue("ai.default_deadline_ms", "must be positive"));
    }
    if (drainBudgetMs <= 0.0) {
        return GameResult<SimulationConfig>::err(
            invalidValue("events.drain_budget_ms", "must be positive"));
    }
    if (out.events.handlerFailureThreshold == 0) {
        return GameResult<SimulationConfig>::err(
            invalidValue("events.handler_failure_threshold", "must be positive"));
    }
    if (skewMs < 0) {
        return GameResult<SimulationConfig>::err(
            invalidValue("events.clock_skew_tolerance_ms", "must not be negative"));
    }
    if (directory.empty()) {
        return GameResult<SimulationConfig>::err(
            invalidValue("persistence.directory", "must not be empty"));
    }

    out.workerPoolSize = static_cast<std::size_t>(poolSize);
    out.validationPoolSize = static_cast<std::size_t>(raw.validationPoolSize);
    out.decisions.cacheMaxEntries = static_cast<std::size_t>(raw.cacheMaxEntries);
    out.decisions.defaultDeadline = std::chrono::milliseconds(deadlineMs);
    out.ticks.drainBudget =
        std::chrono::microseconds(static_cast<int64_t>(drainBudgetMs * 1000.0));
    out.events.clockSkewTolerance = std::chrono::milliseconds(skewMs);
    out.events.historyCapacity = static_cast<std::size_t>(raw.historyCapacity);
    out.persistence.directory = directory;

    GSIM_LOG_DEBUG(foundation::LogCategory::Config,
                   "simulation config: " + std::to_string(out.ticks.tickRate) + " ticks/s, " +
                       std::to_string(out.workerPoolSize) + " workers");
    return GameResult<SimulationConfig>::ok(std::move(out));
}

}  // namespace gsim::runtime
