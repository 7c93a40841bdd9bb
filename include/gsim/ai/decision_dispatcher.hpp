#pragma once

/// @file decision_dispatcher.hpp
/// @brief Offloads decision computation to the worker pool with deadlines,
///        caching and deterministic fallback.

#include "gsim/ai/decision.hpp"
#include "gsim/ai/decision_cache.hpp"
#include "gsim/ai/situation_context.hpp"
#include "gsim/foundation/game_result.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace gsim::event {
class EventBus;
}

namespace gsim::foundation {
class GameJobScheduler;
}

namespace gsim::ai {

class BehaviorEngine;

using DispatchClock = std::chrono::steady_clock;

/// Immutable unit of work handed to a worker.
struct DecisionTask {
    uint64_t taskId = 0;
    std::string agentId;
    std::string treeId;
    SituationContext context;
    DecisionPriority priority = DecisionPriority::Normal;
    DispatchClock::time_point deadline{};
    DecisionCacheKey cacheKey;
};

/// Computes a decision for a task on a worker thread. May throw.
using DecisionSolver = std::function<foundation::GameResult<Decision>(const DecisionTask&)>;

struct DecisionDispatcherConfig {
    uint64_t cacheTtlTicks = kDefaultDecisionTtlTicks;
    std::size_t cacheMaxEntries = 4096;
    std::chrono::milliseconds defaultDeadline{5000};
};

/// Observer view of one request. Copies share the same underlying state.
class DecisionHandle {
public:
    DecisionHandle() = default;

    [[nodiscard]] bool valid() const noexcept { return state_ != nullptr; }
    [[nodiscard]] uint64_t taskId() const;
    [[nodiscard]] bool ready() const;
    [[nodiscard]] DecisionOutcome outcome() const;

    /// The resolved decision (a fallback on timeout/failure), or nullopt
    /// while pending.
    [[nodiscard]] std::optional<Decision> decision() const;

    /// Why the fallback was taken.
    [[nodiscard]] std::optional<foundation::GameError> error() const;

    [[nodiscard]] bool fromCache() const;
    [[nodiscard]] DispatchClock::time_point deadline() const;

    /// True if both handles observe the same request.
    [[nodiscard]] bool sameRequest(const DecisionHandle& other) const noexcept {
        return state_ == other.state_;
    }

    struct State;

private:
    friend class DecisionDispatcher;

    explicit DecisionHandle(std::shared_ptr<State> state) : state_(std::move(state)) {}

    std::shared_ptr<State> state_;
};

/// One request resolved since the previous poll().
struct ResolvedDecision {
    uint64_t taskId = 0;
    Decision decision;
    DecisionOutcome outcome = DecisionOutcome::Completed;
    bool fromCache = false;
    std::optional<foundation::GameError> error;
};

/// Payload of ai.decision.completed and ai.decision.fallback.
struct DecisionEventPayload {
    uint64_t taskId = 0;
    std::string agentId;
    std::string treeId;
    std::string actionId;
    double score = 0.0;
    DecisionOutcome outcome = DecisionOutcome::Completed;
    std::string reason;
};

struct DispatcherStats {
    uint64_t submitted = 0;
    uint64_t cacheHits = 0;
    uint64_t coalesced = 0;
    uint64_t dispatched = 0;
    uint64_t completed = 0;
    uint64_t timeouts = 0;
    uint64_t failures = 0;
    uint64_t lateResultsDiscarded = 0;
    uint64_t skippedExpired = 0;
};

/// Routes decision requests to the shared worker pool.
///
/// Threading: requestDecision() and poll() belong to the simulation
/// thread; await() may be called from any other thread. Workers only read
/// their own DecisionTask copy and report back through an internal result
/// channel that is consumed by poll() (or await()).
///
/// @code
///   DecisionDispatcher dispatcher(engine, scheduler, &bus);
///   auto handle = dispatcher.requestDecision("npc-1", "trader", ctx);
///   ...
///   for (auto& r : dispatcher.poll(tick)) { apply(r.decision); }
/// @endcode
class DecisionDispatcher {
public:
    DecisionDispatcher(BehaviorEngine& engine, foundation::GameJobScheduler& scheduler,
                       event::EventBus* bus = nullptr,
                       DecisionDispatcherConfig config = {});

    /// Stops dispatching and waits for running solver calls to return.
    ~DecisionDispatcher();

    DecisionDispatcher(const DecisionDispatcher&) = delete;
    DecisionDispatcher& operator=(const DecisionDispatcher&) = delete;

    /// Replace the default solver (tree evaluation in the BehaviorEngine).
    void setSolver(DecisionSolver solver);

    /// Non-blocking.
    ///
    /// A reconciled cache hit yields an already-ready handle. A request
    /// whose cache key matches an unresolved one returns that request's
    /// handle, raising its priority and deadline to the more urgent of the
    /// two. Otherwise a task is queued with @p deadline (default from
    /// config) and one worker job is scheduled.
    ///
    /// @return InvalidArgument for an empty agent or tree id,
    ///         DispatcherStopped after shutdown().
    foundation::GameResult<DecisionHandle> requestDecision(
        std::string agentId, std::string treeId, SituationContext context,
        DecisionPriority priority = DecisionPriority::Normal,
        std::optional<std::chrono::milliseconds> deadline = std::nullopt);

    /// Collect worker results, resolve expired requests to the fallback,
    /// publish notifications and return everything resolved since the last
    /// call, ordered by task id.
    std::vector<ResolvedDecision> poll(uint64_t tick);

    /// Block until @p handle resolves, at most until its deadline; an
    /// expired request is resolved to the fallback here.
    foundation::GameResult<Decision> await(const DecisionHandle& handle);

    /// Resolve every unresolved request to the fallback and refuse new ones.
    void shutdown();

    /// Unresolved requests.
    [[nodiscard]] std::size_t pendingCount() const;

    [[nodiscard]] DispatcherStats stats() const;
    [[nodiscard]] DecisionCache& cache() noexcept;
    [[nodiscard]] const DecisionDispatcherConfig& config() const noexcept;

    /// Cache key for a request: agent id plus a digest of tree id and
    /// context fingerprint.
    [[nodiscard]] static DecisionCacheKey cacheKeyFor(const std::string& agentId,
                                                      const std::string& treeId,
                                                      const SituationContext& context);

private:
    struct Impl;
    // Shared with worker jobs still sitting in the pool queue.
    std::shared_ptr<Impl> impl_;
};

}  // namespace gsim::ai
