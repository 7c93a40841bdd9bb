/// @file tick_scheduler.cpp
/// @brief TickScheduler implementation.

#include "gsim/runtime/tick_scheduler.hpp"

#include "gsim/ai/decision_dispatcher.hpp"
#include "gsim/event/event_types.hpp"
#include "gsim/foundation/game_logger.hpp"
#include "gsim/state/snapshot_store.hpp"
#include "gsim/state/state_manager.hpp"

#include <algorithm>
#include <exception>
#include <numeric>
#include <optional>

namespace gsim::runtime {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

namespace {

constexpr std::string_view kSource = "tick_scheduler";

std::chrono::nanoseconds tickLengthFor(uint32_t tickRate) {
    return std::chrono::nanoseconds(1'000'000'000LL / (tickRate > 0 ? tickRate : 60));
}

}  // namespace

TickScheduler::TickScheduler(event::EventBus& bus, state::StateManager& state,
                             ai::DecisionDispatcher* dispatcher, TickSchedulerConfig config)
    : bus_(bus),
      state_(state),
      dispatcher_(dispatcher),
      config_(config),
      tickLength_(tickLengthFor(config.tickRate)) {
    config_.maxCatchUpTicks = std::max<uint32_t>(config_.maxCatchUpTicks, 1);
    config_.healthWindow = std::max<std::size_t>(config_.healthWindow, 2);
    config_.performanceWarningTicks = std::max<uint32_t>(config_.performanceWarningTicks, 1);
}

TickScheduler::~TickScheduler() {
    stop();
}

GameResult<void> TickScheduler::addSystem(std::unique_ptr<ISimulationSystem> system) {
    if (!system) {
        return GameResult<void>::err(GameError(ErrorCode::InvalidArgument, "null system"));
    }
    auto duplicate = std::any_of(systems_.begin(), systems_.end(), [&](const auto& s) {
        return s->name() == system->name();
    });
    if (duplicate) {
        return GameResult<void>::err(GameError(
            ErrorCode::AlreadyExists,
            "system '" + std::string(system->name()) + "' already registered"));
    }
    GSIM_LOG_DEBUG(LogCategory::Runtime, "system added: " + std::string(system->name()));
    systems_.push_back(std::move(system));
    return GameResult<void>::ok();
}

void TickScheduler::setSnapshotStore(state::SnapshotStore* store) {
    store_ = store;
}

void TickScheduler::setFrameCallback(FrameCallback callback) {
    std::lock_guard lock(callbackMutex_);
    frameCallback_ = std::move(callback);
}

void TickScheduler::setTickCallback(TickCallback callback) {
    std::lock_guard lock(callbackMutex_);
    tickCallback_ = std::move(callback);
}

// ---------------------------------------------------------------------------
// Stepping
// ---------------------------------------------------------------------------

uint32_t TickScheduler::advance(std::chrono::nanoseconds elapsed) {
    auto acc = accumulatorNs_.load(std::memory_order_relaxed) +
               std::max<int64_t>(elapsed.count(), 0);
    auto step = tickLength_.count();

    auto due = static_cast<uint64_t>(acc / step);
    if (due > config_.maxCatchUpTicks) {
        auto dropped = due - config_.maxCatchUpTicks;
        acc -= static_cast<int64_t>(dropped) * step;
        due = config_.maxCatchUpTicks;
        {
            std::lock_guard lock(healthMutex_);
            droppedTicks_ += dropped;
        }
        GSIM_LOG_WARN(LogCategory::Runtime,
                      "falling behind: dropped " + std::to_string(dropped) + " tick(s)");
    }

    for (uint64_t i = 0; i < due; ++i) {
        executeTick();
        acc -= step;
        accumulatorNs_.store(acc, std::memory_order_relaxed);
    }
    accumulatorNs_.store(acc, std::memory_order_relaxed);
    return static_cast<uint32_t>(due);
}

void TickScheduler::runTicks(uint64_t count) {
    for (uint64_t i = 0; i < count; ++i) {
        executeTick();
    }
}

TickReport TickScheduler::executeTick() {
    auto start = std::chrono::steady_clock::now();

    TickReport report;
    report.tick = tickCount_.fetch_add(1, std::memory_order_relaxed) + 1;

    report.drain = bus_.drain(config_.drainBudget);

    for (const auto& applied : state_.applyDueTransactions(report.tick)) {
        if (applied.committed) {
            ++report.transactionsApplied;
            continue;
        }
        ++report.transactionsFailed;
        LogContext ctx;
        ctx.tick = report.tick;
        ctx.extra["transaction"] = applied.label;
        foundation::GameLogger::instance().logWithContext(
            LogLevel::Warning, LogCategory::Runtime,
            "scheduled transaction rejected: " +
                (applied.error ? applied.error->describe() : std::string("unknown")),
            ctx);
    }

    std::vector<ai::ResolvedDecision> decisions;
    if (dispatcher_ != nullptr) {
        decisions = dispatcher_->poll(report.tick);
    }
    report.decisionsResolved = decisions.size();

    TickContext ctx{report.tick,
                    std::chrono::duration_cast<std::chrono::microseconds>(tickLength_),
                    decisions,
                    state_,
                    bus_,
                    dispatcher_};

    for (auto& system : systems_) {
        std::string failure;
        try {
            auto updated = system->update(ctx);
            if (!updated) {
                failure = updated.error().describe();
            }
        } catch (const std::exception& e) {
            failure = std::string("threw: ") + e.what();
        } catch (...) {
            failure = "threw a non-standard exception";
        }
        if (!failure.empty()) {
            ++report.systemErrors;
            LogContext lc;
            lc.tick = report.tick;
            lc.extra["system"] = std::string(system->name());
            foundation::GameLogger::instance().logWithContext(
                LogLevel::Error, LogCategory::Runtime, failure, lc);
        }
    }

    report.duration = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start);

    recordTiming(report.tick, report.duration);
    autosave(report.tick);

    {
        std::lock_guard lock(healthMutex_);
        lastReport_ = report;
    }

    TickCallback callback;
    {
        std::lock_guard lock(callbackMutex_);
        callback = tickCallback_;
    }
    if (callback) {
        callback(report);
    }
    return report;
}

void TickScheduler::recordTiming(uint64_t tick, std::chrono::microseconds duration) {
    auto budget = std::chrono::duration_cast<std::chrono::microseconds>(tickLength_);
    std::optional<event::PerformanceWarningPayload> warning;

    {
        std::lock_guard lock(healthMutex_);
        window_.push_back(duration);
        tickTimes_.push_back(std::chrono::steady_clock::now());
        while (window_.size() > config_.healthWindow) {
            window_.pop_front();
        }
        while (tickTimes_.size() > config_.healthWindow) {
            tickTimes_.pop_front();
        }

        auto total = std::accumulate(window_.begin(), window_.end(),
                                     std::chrono::microseconds{0});
        auto average = total / static_cast<int64_t>(window_.size());
        auto threshold = static_cast<double>(budget.count()) * config_.performanceWarningRatio;

        if (static_cast<double>(average.count()) > threshold) {
            ++consecutiveOverBudget_;
            if (consecutiveOverBudget_ % config_.performanceWarningTicks == 0) {
                warning = event::PerformanceWarningPayload{tick, average, budget,
                                                           consecutiveOverBudget_};
            }
        } else {
            consecutiveOverBudget_ = 0;
        }
    }

    if (warning) {
        GSIM_LOG_WARN(LogCategory::Runtime,
                      "tick " + std::to_string(tick) + " average " +
                          std::to_string(warning->averageTickTime.count()) + "us exceeds " +
                          std::to_string(static_cast<int>(config_.performanceWarningRatio * 100)) +
                          "% of " + std::to_string(budget.count()) + "us budget");
        auto published = bus_.publish(event::makeEvent(
            std::string(kSource), std::string(event::types::kPerformanceWarning), *warning,
            event::EventPriority::High));
        if (!published) {
            GSIM_LOG_WARN(LogCategory::Runtime, published.error().describe());
        }
    }
}

void TickScheduler::autosave(uint64_t tick) {
    if (store_ == nullptr || config_.autosaveIntervalTicks == 0 ||
        tick % config_.autosaveIntervalTicks != 0) {
        return;
    }

    auto saved = store_->save(state_.createSnapshot());
    if (!saved) {
        GSIM_LOG_ERROR(LogCategory::Persistence, "autosave failed: " + saved.error().describe());
        return;
    }

    const auto& current = state_.state();
    event::StateChangedPayload payload{current.version, tick, current.checksum,
                                       saved.value().id};
    auto published = bus_.publish(event::makeEvent(std::string(kSource),
                                                   std::string(event::types::kSnapshotSaved),
                                                   std::move(payload), event::EventPriority::Low));
    if (!published) {
        GSIM_LOG_WARN(LogCategory::Runtime, published.error().describe());
    }
}

// ---------------------------------------------------------------------------
// Thread
// ---------------------------------------------------------------------------

bool TickScheduler::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return false;
    }

    GSIM_LOG_INFO(LogCategory::Runtime,
                  "tick loop starting at " + std::to_string(config_.tickRate) + " ticks/s");
    thread_ = std::thread([this] { run(); });
    return true;
}

void TickScheduler::stop() {
    running_.store(false);
    if (thread_.joinable()) {
        thread_.join();
        GSIM_LOG_INFO(LogCategory::Runtime,
                      "tick loop stopped after " + std::to_string(tickCount()) + " ticks");
    }
}

void TickScheduler::run() {
    auto last = std::chrono::steady_clock::now();

    while (running_.load()) {
        auto now = std::chrono::steady_clock::now();
        advance(now - last);
        last = now;

        FrameCallback frame;
        {
            std::lock_guard lock(callbackMutex_);
            frame = frameCallback_;
        }
        if (frame) {
            frame(interpolation());
        }

        // Sleep until the accumulator covers the next tick.
        auto remaining = tickLength_ -
                         std::chrono::nanoseconds(accumulatorNs_.load(std::memory_order_relaxed));
        if (remaining.count() > 0) {
            std::this_thread::sleep_for(remaining);
        }
    }
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

bool TickScheduler::isRunning() const noexcept {
    return running_.load();
}

double TickScheduler::interpolation() const noexcept {
    return static_cast<double>(accumulatorNs_.load(std::memory_order_relaxed)) /
           static_cast<double>(tickLength_.count());
}

uint64_t TickScheduler::tickCount() const noexcept {
    return tickCount_.load(std::memory_order_relaxed);
}

std::chrono::nanoseconds TickScheduler::tickLength() const noexcept {
    return tickLength_;
}

TickHealth TickScheduler::health() const {
    std::lock_guard lock(healthMutex_);
    TickHealth h;
    h.budget = std::chrono::duration_cast<std::chrono::microseconds>(tickLength_);
    h.consecutiveOverBudget = consecutiveOverBudget_;
    h.totalTicks = tickCount_.load(std::memory_order_relaxed);
    h.droppedTicks = droppedTicks_;
    if (!window_.empty()) {
        auto total = std::accumulate(window_.begin(), window_.end(),
                                     std::chrono::microseconds{0});
        h.averageTickTime = total / static_cast<int64_t>(window_.size());
    }
    if (tickTimes_.size() >= 2) {
        auto span = std::chrono::duration<double>(tickTimes_.back() - tickTimes_.front()).count();
        if (span > 0.0) {
            h.observedTicksPerSecond = static_cast<double>(tickTimes_.size() - 1) / span;
        }
    }
    return h;
}

TickReport TickScheduler::lastReport() const {
    std::lock_guard lock(healthMutex_);
    return lastReport_;
}

const TickSchedulerConfig& TickScheduler::config() const noexcept {
    return config_;
}

std::size_t TickScheduler::systemCount() const noexcept {
    return systems_.size();
}

}  // namespace gsim::runtime
