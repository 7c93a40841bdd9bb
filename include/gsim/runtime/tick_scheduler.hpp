#pragma once

/// @file tick_scheduler.hpp
/// @brief Fixed-step accumulator loop driving the simulation.
///
/// One logic tick runs, in order: event bus drain (time-boxed), due state
/// transactions, dispatcher poll, then every registered simulation system
/// with the decisions that poll resolved. Rendering-rate callers get the
/// leftover fraction of a tick through interpolation().

#include "gsim/event/event_bus.hpp"
#include "gsim/foundation/game_result.hpp"
#include "gsim/runtime/simulation_config.hpp"
#include "gsim/runtime/simulation_system.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace gsim::ai {
class DecisionDispatcher;
}

namespace gsim::state {
class StateManager;
class SnapshotStore;
}

namespace gsim::runtime {

/// Rolling tick-rate health.
struct TickHealth {
    double observedTicksPerSecond = 0.0;
    std::chrono::microseconds averageTickTime{0};
    std::chrono::microseconds budget{0};
    uint32_t consecutiveOverBudget = 0;
    uint64_t totalTicks = 0;
    uint64_t droppedTicks = 0;  ///< Catch-up ticks discarded by the cap.
};

/// What one logic tick did.
struct TickReport {
    uint64_t tick = 0;
    event::DrainStats drain;
    std::size_t transactionsApplied = 0;
    std::size_t transactionsFailed = 0;
    std::size_t decisionsResolved = 0;
    std::size_t systemErrors = 0;
    std::chrono::microseconds duration{0};
};

/// Drives the simulation at a fixed logic rate.
///
/// Usage:
/// @code
///   TickScheduler ticks(bus, stateManager, &dispatcher);
///   ticks.addSystem(std::make_unique<EconomySystem>());
///   ticks.setFrameCallback([&](double alpha) { render(state, alpha); });
///   ticks.start();
///   // ...
///   ticks.stop();
/// @endcode
///
/// advance() and runTicks() are the deterministic entry points; start()
/// calls advance() with wall-clock time on a dedicated thread. Do not mix
/// the two while the thread is running.
class TickScheduler {
public:
    using FrameCallback = std::function<void(double interpolation)>;
    using TickCallback = std::function<void(const TickReport&)>;

    TickScheduler(event::EventBus& bus, state::StateManager& state,
                  ai::DecisionDispatcher* dispatcher = nullptr,
                  TickSchedulerConfig config = {});

    ~TickScheduler();

    // Non-copyable, non-movable (owns a thread).
    TickScheduler(const TickScheduler&) = delete;
    TickScheduler& operator=(const TickScheduler&) = delete;
    TickScheduler(TickScheduler&&) = delete;
    TickScheduler& operator=(TickScheduler&&) = delete;

    /// @return AlreadyExists if a system with the same name is registered.
    foundation::GameResult<void> addSystem(std::unique_ptr<ISimulationSystem> system);

    /// Enable autosave (every autosaveIntervalTicks) into @p store.
    void setSnapshotStore(state::SnapshotStore* store);

    /// Invoked once per loop iteration on the loop thread.
    void setFrameCallback(FrameCallback callback);

    /// Invoked after every logic tick.
    void setTickCallback(TickCallback callback);

    /// Add @p elapsed to the accumulator and run the ticks it covers,
    /// at most maxCatchUpTicks; the excess is dropped and logged.
    /// @return Ticks executed.
    uint32_t advance(std::chrono::nanoseconds elapsed);

    /// Run exactly @p count ticks, ignoring the accumulator.
    void runTicks(uint64_t count);

    /// Start the loop on a dedicated thread.
    /// @return false if already running.
    [[nodiscard]] bool start();

    /// Signal the loop to stop and join the thread.
    void stop();

    [[nodiscard]] bool isRunning() const noexcept;

    /// Accumulator / tick length, in [0, 1).
    [[nodiscard]] double interpolation() const noexcept;

    [[nodiscard]] uint64_t tickCount() const noexcept;
    [[nodiscard]] std::chrono::nanoseconds tickLength() const noexcept;
    [[nodiscard]] TickHealth health() const;
    [[nodiscard]] TickReport lastReport() const;
    [[nodiscard]] const TickSchedulerConfig& config() const noexcept;
    [[nodiscard]] std::size_t systemCount() const noexcept;

private:
    void run();
    TickReport executeTick();
    void recordTiming(uint64_t tick, std::chrono::microseconds duration);
    void autosave(uint64_t tick);

    event::EventBus& bus_;
    state::StateManager& state_;
    ai::DecisionDispatcher* dispatcher_;
    state::SnapshotStore* store_ = nullptr;
    TickSchedulerConfig config_;
    std::chrono::nanoseconds tickLength_;

    std::vector<std::unique_ptr<ISimulationSystem>> systems_;

    std::atomic<std::int64_t> accumulatorNs_{0};
    std::atomic<uint64_t> tickCount_{0};
    std::atomic<bool> running_{false};
    std::thread thread_;

    mutable std::mutex healthMutex_;
    std::deque<std::chrono::microseconds> window_;
    std::deque<std::chrono::steady_clock::time_point> tickTimes_;
    uint32_t consecutiveOverBudget_ = 0;
    uint64_t droppedTicks_ = 0;
    TickReport lastReport_;

    mutable std::mutex callbackMutex_;
    FrameCallback frameCallback_;
    TickCallback tickCallback_;
};

}  // namespace gsim::runtime
