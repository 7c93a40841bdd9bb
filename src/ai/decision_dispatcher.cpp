/// @file decision_dispatcher.cpp
/// @brief DecisionDispatcher: pull-model task queue over GameJobScheduler,
///        mutex-guarded result channel, tick-boundary resolution.

#include "gsim/ai/decision_dispatcher.hpp"

#include "gsim/ai/behavior_engine.hpp"
#include "gsim/event/event_bus.hpp"
#include "gsim/event/event_types.hpp"
#include "gsim/foundation/game_logger.hpp"
#include "gsim/foundation/job_scheduler.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <exception>
#include <map>
#include <mutex>
#include <set>
#include <tuple>
#include <unordered_map>
#include <utility>

namespace gsim::ai {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::JobPriority;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

// ── Handle state ────────────────────────────────────────────────────────────

struct DecisionHandle::State {
    uint64_t taskId = 0;
    DispatchClock::time_point deadline{};
    mutable std::mutex mutex;
    DecisionOutcome outcome = DecisionOutcome::Pending;
    std::optional<Decision> decision;
    std::optional<GameError> error;
    bool fromCache = false;
};

uint64_t DecisionHandle::taskId() const {
    return state_ ? state_->taskId : 0;
}

bool DecisionHandle::ready() const {
    if (!state_) {
        return false;
    }
    std::lock_guard lock(state_->mutex);
    return state_->outcome != DecisionOutcome::Pending;
}

DecisionOutcome DecisionHandle::outcome() const {
    if (!state_) {
        return DecisionOutcome::Pending;
    }
    std::lock_guard lock(state_->mutex);
    return state_->outcome;
}

std::optional<Decision> DecisionHandle::decision() const {
    if (!state_) {
        return std::nullopt;
    }
    std::lock_guard lock(state_->mutex);
    return state_->decision;
}

std::optional<GameError> DecisionHandle::error() const {
    if (!state_) {
        return std::nullopt;
    }
    std::lock_guard lock(state_->mutex);
    return state_->error;
}

bool DecisionHandle::fromCache() const {
    if (!state_) {
        return false;
    }
    std::lock_guard lock(state_->mutex);
    return state_->fromCache;
}

DispatchClock::time_point DecisionHandle::deadline() const {
    if (!state_) {
        return DispatchClock::time_point{};
    }
    std::lock_guard lock(state_->mutex);
    return state_->deadline;
}

// ── Internals ───────────────────────────────────────────────────────────────

namespace {

constexpr std::string_view kDispatcherSource = "decision_dispatcher";

enum class TaskPhase : uint8_t {
    Queued,   ///< Waiting for a worker.
    Running,  ///< A worker is solving it.
    Dropped   ///< Dequeued after its deadline; poll() will time it out.
};

struct TaskRecord {
    std::shared_ptr<const DecisionTask> task;
    std::shared_ptr<DecisionHandle::State> state;
    TaskPhase phase = TaskPhase::Queued;
};

/// Queue order: priority, then earliest deadline, then submission order.
struct QueueKey {
    DecisionPriority priority = DecisionPriority::Normal;
    DispatchClock::time_point deadline{};
    uint64_t taskId = 0;  // monotonically increasing, so also submission order

    bool operator<(const QueueKey& other) const {
        return std::tie(priority, deadline, taskId) <
               std::tie(other.priority, other.deadline, other.taskId);
    }
};

struct ChannelItem {
    uint64_t taskId = 0;
    std::optional<Decision> decision;
    std::optional<GameError> error;
};

JobPriority mapPriority(DecisionPriority p) {
    switch (p) {
        case DecisionPriority::Critical: return JobPriority::Critical;
        case DecisionPriority::High:     return JobPriority::High;
        case DecisionPriority::Normal:   return JobPriority::Normal;
        case DecisionPriority::Low:      return JobPriority::Low;
    }
    return JobPriority::Normal;
}

LogContext taskContext(const DecisionTask& task) {
    LogContext ctx;
    ctx.agentId = task.agentId;
    ctx.taskId = task.taskId;
    ctx.extra["tree"] = task.treeId;
    return ctx;
}

} // namespace

struct DecisionDispatcher::Impl {
    BehaviorEngine& engine;
    foundation::GameJobScheduler& scheduler;
    event::EventBus* bus = nullptr;
    DecisionDispatcherConfig config;
    DecisionCache cache;
    DecisionSolver solver;

    mutable std::mutex mutex;
    std::condition_variable cv;

    std::map<uint64_t, TaskRecord> tasks;  // unresolved only
    std::set<QueueKey> queue;
    std::unordered_map<DecisionCacheKey, uint64_t, DecisionCacheKeyHash> inflight;
    std::deque<ChannelItem> channel;
    std::vector<ResolvedDecision> unreported;
    std::vector<event::Event> outbox;
    DispatcherStats stats;

    uint64_t nextTaskId = 1;
    std::size_t running = 0;
    bool stopped = false;
    std::atomic<uint64_t> currentTick{0};

    Impl(BehaviorEngine& e, foundation::GameJobScheduler& s, event::EventBus* b,
         DecisionDispatcherConfig cfg)
        : engine(e), scheduler(s), bus(b), config(cfg),
          cache(DecisionCacheConfig{cfg.cacheMaxEntries, cfg.cacheTtlTicks}) {}

    // Caller holds mutex.
    void resolveLocked(std::map<uint64_t, TaskRecord>::iterator it,
                       DecisionOutcome outcome, std::optional<Decision> decision,
                       std::optional<GameError> error) {
        const auto& task = *it->second.task;
        bool isFallback = outcome != DecisionOutcome::Completed || !decision;
        if (isFallback) {
            decision = makeFallbackDecision(task.agentId, task.treeId,
                                            currentTick.load(std::memory_order_relaxed));
        }

        {
            std::lock_guard stateLock(it->second.state->mutex);
            it->second.state->outcome = outcome;
            it->second.state->decision = decision;
            it->second.state->error = error;
        }

        ResolvedDecision resolved;
        resolved.taskId = task.taskId;
        resolved.decision = *decision;
        resolved.outcome = outcome;
        resolved.error = error;
        unreported.push_back(resolved);

        switch (outcome) {
            case DecisionOutcome::Completed: ++stats.completed; break;
            case DecisionOutcome::Timeout:   ++stats.timeouts; break;
            case DecisionOutcome::Failed:    ++stats.failures; break;
            case DecisionOutcome::Pending:   break;
        }

        DecisionEventPayload payload;
        payload.taskId = task.taskId;
        payload.agentId = task.agentId;
        payload.treeId = task.treeId;
        payload.actionId = decision->actionId;
        payload.score = decision->score;
        payload.outcome = outcome;
        if (error) {
            payload.reason = error->describe();
        }

        if (isFallback) {
            foundation::GameLogger::instance().logWithContext(
                LogLevel::Debug, LogCategory::Dispatch,
                "fallback (" + std::string(decisionOutcomeName(outcome)) + ")" +
                    (error ? ": " + error->describe() : std::string()),
                taskContext(task));
        }

        if (bus != nullptr) {
            outbox.push_back(event::makeEvent(
                std::string(kDispatcherSource),
                std::string(isFallback ? event::types::kDecisionFallback
                                       : event::types::kDecisionCompleted),
                std::move(payload),
                isFallback ? event::EventPriority::Low : event::EventPriority::Medium));
            outbox.back().subject = task.agentId;
        }

        auto flight = inflight.find(task.cacheKey);
        if (flight != inflight.end() && flight->second == task.taskId) {
            inflight.erase(flight);
        }
        if (it->second.phase == TaskPhase::Queued) {
            queue.erase(QueueKey{task.priority, task.deadline, task.taskId});
        }
        tasks.erase(it);
        cv.notify_all();
    }

    // Caller holds mutex. Replaces the task rather than editing it; a running
    // solver keeps its own pointer to the old one.
    void tightenLocked(TaskRecord& record, DecisionPriority priority,
                       DispatchClock::time_point deadline) {
        const auto& current = *record.task;
        if (priority >= current.priority && deadline >= current.deadline) {
            return;
        }
        auto updated = std::make_shared<DecisionTask>(current);
        updated->priority = std::min(current.priority, priority);
        updated->deadline = std::min(current.deadline, deadline);
        if (record.phase == TaskPhase::Queued) {
            queue.erase(QueueKey{current.priority, current.deadline, current.taskId});
            queue.insert(QueueKey{updated->priority, updated->deadline, updated->taskId});
        }
        {
            std::lock_guard stateLock(record.state->mutex);
            record.state->deadline = updated->deadline;
        }
        record.task = std::move(updated);
    }

    // Caller holds mutex. Consumes the result channel, then times out
    // everything past its deadline.
    void collectLocked(DispatchClock::time_point now) {
        while (!channel.empty()) {
            auto item = std::move(channel.front());
            channel.pop_front();
            auto it = tasks.find(item.taskId);
            if (it == tasks.end()) {
                continue;
            }
            if (item.decision) {
                resolveLocked(it, DecisionOutcome::Completed, std::move(item.decision),
                              std::nullopt);
            } else {
                resolveLocked(it, DecisionOutcome::Failed, std::nullopt, std::move(item.error));
            }
        }

        for (auto it = tasks.begin(); it != tasks.end();) {
            auto next = std::next(it);
            const auto& task = *it->second.task;
            if (task.deadline <= now) {
                resolveLocked(it, DecisionOutcome::Timeout, std::nullopt,
                              GameError(ErrorCode::DecisionTimeout,
                                        "deadline exceeded for task " +
                                            std::to_string(task.taskId)));
            }
            it = next;
        }
    }

    void flushOutbox() {
        std::vector<event::Event> events;
        {
            std::lock_guard lock(mutex);
            events.swap(outbox);
        }
        if (bus == nullptr) {
            return;
        }
        for (auto& e : events) {
            auto published = bus->publish(std::move(e));
            if (!published) {
                GSIM_LOG_WARN(LogCategory::Dispatch, published.error().describe());
            }
        }
    }

    // Body of every pool job: take the most urgent live task and solve it.
    static void runWorker(const std::shared_ptr<Impl>& self) {
        std::shared_ptr<const DecisionTask> task;
        DecisionSolver solve;
        {
            std::lock_guard lock(self->mutex);
            if (self->stopped) {
                return;
            }
            auto now = DispatchClock::now();
            while (!self->queue.empty()) {
                auto key = *self->queue.begin();
                self->queue.erase(self->queue.begin());
                auto it = self->tasks.find(key.taskId);
                if (it == self->tasks.end()) {
                    continue;
                }
                if (key.deadline <= now) {
                    it->second.phase = TaskPhase::Dropped;
                    ++self->stats.skippedExpired;
                    continue;
                }
                it->second.phase = TaskPhase::Running;
                task = it->second.task;
                break;
            }
            if (!task) {
                return;
            }
            ++self->running;
            solve = self->solver;
        }

        std::optional<Decision> decision;
        std::optional<GameError> error;
        try {
            auto result = solve(*task);
            if (result) {
                decision = std::move(result).value();
            } else {
                error = GameError(ErrorCode::DecisionFailed, result.error().describe());
            }
        } catch (const std::exception& e) {
            error = GameError(ErrorCode::DecisionFailed,
                              std::string("solver threw: ") + e.what());
        } catch (...) {
            error = GameError(ErrorCode::DecisionFailed,
                              "solver threw a non-standard exception");
        }
        auto finishedAt = DispatchClock::now();

        if (decision) {
            decision->agentId = task->agentId;
            decision->treeId = task->treeId;
            decision->fallback = false;
        }

        std::lock_guard lock(self->mutex);
        --self->running;
        auto record = self->tasks.find(task->taskId);
        bool resolvedElsewhere = record == self->tasks.end();
        if (resolvedElsewhere || finishedAt > record->second.task->deadline) {
            ++self->stats.lateResultsDiscarded;
            foundation::GameLogger::instance().logWithContext(
                LogLevel::Info, LogCategory::Dispatch,
                "discarded late result", taskContext(*task));
        } else {
            if (decision) {
                self->cache.put(task->cacheKey, *decision, task->taskId,
                                self->currentTick.load(std::memory_order_relaxed));
            } else {
                foundation::GameLogger::instance().logWithContext(
                    LogLevel::Warning, LogCategory::Dispatch,
                    error ? error->describe() : std::string("solver failed"),
                    taskContext(*task));
            }
            self->channel.push_back(ChannelItem{task->taskId, std::move(decision),
                                                std::move(error)});
        }
        self->cv.notify_all();
    }
};

// ── Construction ────────────────────────────────────────────────────────────

DecisionDispatcher::DecisionDispatcher(BehaviorEngine& engine,
                                       foundation::GameJobScheduler& scheduler,
                                       event::EventBus* bus,
                                       DecisionDispatcherConfig config)
    : impl_(std::make_shared<Impl>(engine, scheduler, bus, config)) {
    auto* eng = &engine;
    impl_->solver = [eng](const DecisionTask& task) -> GameResult<Decision> {
        auto evaluated = eng->evaluateTree(task.treeId, task.context);
        if (!evaluated) {
            return GameResult<Decision>::err(std::move(evaluated).error());
        }
        auto& result = evaluated.value();
        if (!result.decision) {
            return GameResult<Decision>::err(GameError(
                ErrorCode::DecisionFailed,
                "tree '" + task.treeId + "' selected no action (" +
                    std::string(btStatusName(result.status)) + ")"));
        }
        return GameResult<Decision>::ok(std::move(*result.decision));
    };
}

DecisionDispatcher::~DecisionDispatcher() {
    shutdown();
}

void DecisionDispatcher::setSolver(DecisionSolver solver) {
    std::lock_guard lock(impl_->mutex);
    impl_->solver = std::move(solver);
}

DecisionCacheKey DecisionDispatcher::cacheKeyFor(const std::string& agentId,
                                                 const std::string& treeId,
                                                 const SituationContext& context) {
    // FNV-1a over the tree id, folded with the context digest.
    uint64_t h = 1469598103934665603ULL;
    for (unsigned char c : treeId) {
        h ^= c;
        h *= 1099511628211ULL;
    }
    auto fp = context.fingerprint();
    for (int shift = 0; shift < 64; shift += 8) {
        h ^= (fp >> shift) & 0xFF;
        h *= 1099511628211ULL;
    }
    return DecisionCacheKey{agentId, h};
}

// ── requestDecision() ───────────────────────────────────────────────────────

GameResult<DecisionHandle> DecisionDispatcher::requestDecision(
    std::string agentId, std::string treeId, SituationContext context,
    DecisionPriority priority, std::optional<std::chrono::milliseconds> deadline) {
    if (agentId.empty() || treeId.empty()) {
        return GameResult<DecisionHandle>::err(
            GameError(ErrorCode::InvalidArgument, "agent id and tree id are required"));
    }

    auto key = cacheKeyFor(agentId, treeId, context);
    auto tick = impl_->currentTick.load(std::memory_order_relaxed);
    auto now = DispatchClock::now();
    auto due = now + deadline.value_or(impl_->config.defaultDeadline);

    // Cache first. Decisions for registered trees are re-validated against
    // the new context before reuse.
    std::optional<Decision> reused;
    if (auto cached = impl_->cache.get(key, tick)) {
        if (impl_->engine.hasTree(treeId)) {
            reused = impl_->engine.reconcile(*cached, context);
        } else {
            reused = std::move(cached);
        }
        if (!reused) {
            impl_->cache.invalidate(key);
        }
    }

    std::unique_lock lock(impl_->mutex);
    if (impl_->stopped) {
        return GameResult<DecisionHandle>::err(
            GameError(ErrorCode::DispatcherStopped, "dispatcher is shut down"));
    }
    ++impl_->stats.submitted;

    if (reused) {
        auto state = std::make_shared<DecisionHandle::State>();
        state->taskId = impl_->nextTaskId++;
        state->deadline = due;
        state->outcome = DecisionOutcome::Completed;
        state->decision = reused;
        state->fromCache = true;
        ++impl_->stats.cacheHits;

        ResolvedDecision resolved;
        resolved.taskId = state->taskId;
        resolved.decision = *reused;
        resolved.outcome = DecisionOutcome::Completed;
        resolved.fromCache = true;
        impl_->unreported.push_back(std::move(resolved));
        return GameResult<DecisionHandle>::ok(DecisionHandle(std::move(state)));
    }

    auto flight = impl_->inflight.find(key);
    if (flight != impl_->inflight.end()) {
        auto existing = impl_->tasks.find(flight->second);
        if (existing != impl_->tasks.end()) {
            // The shared task takes the more urgent of both requests.
            impl_->tightenLocked(existing->second, priority, due);
            ++impl_->stats.coalesced;
            return GameResult<DecisionHandle>::ok(DecisionHandle(existing->second.state));
        }
    }

    auto task = std::make_shared<DecisionTask>();
    task->taskId = impl_->nextTaskId++;
    task->agentId = std::move(agentId);
    task->treeId = std::move(treeId);
    task->context = std::move(context);
    task->priority = priority;
    task->deadline = due;
    task->cacheKey = key;

    auto state = std::make_shared<DecisionHandle::State>();
    state->taskId = task->taskId;
    state->deadline = due;

    auto taskId = task->taskId;
    impl_->queue.insert(QueueKey{priority, due, taskId});
    impl_->inflight[key] = taskId;
    impl_->tasks.emplace(taskId, TaskRecord{task, state, TaskPhase::Queued});
    ++impl_->stats.dispatched;
    lock.unlock();

    auto self = impl_;
    auto posted = impl_->scheduler.post([self]() { Impl::runWorker(self); },
                                        mapPriority(priority));
    if (!posted) {
        lock.lock();
        auto it = impl_->tasks.find(taskId);
        if (it != impl_->tasks.end()) {
            impl_->resolveLocked(it, DecisionOutcome::Failed, std::nullopt, posted.error());
        }
        lock.unlock();
        impl_->flushOutbox();
    }

    return GameResult<DecisionHandle>::ok(DecisionHandle(std::move(state)));
}

// ── poll() / await() ────────────────────────────────────────────────────────

std::vector<ResolvedDecision> DecisionDispatcher::poll(uint64_t tick) {
    impl_->currentTick.store(tick, std::memory_order_relaxed);

    std::vector<ResolvedDecision> resolved;
    {
        std::lock_guard lock(impl_->mutex);
        impl_->collectLocked(DispatchClock::now());
        resolved.swap(impl_->unreported);
    }
    impl_->flushOutbox();

    std::sort(resolved.begin(), resolved.end(),
              [](const ResolvedDecision& a, const ResolvedDecision& b) {
                  return a.taskId < b.taskId;
              });
    return resolved;
}

GameResult<Decision> DecisionDispatcher::await(const DecisionHandle& handle) {
    if (!handle.valid()) {
        return GameResult<Decision>::err(
            GameError(ErrorCode::InvalidArgument, "invalid decision handle"));
    }

    {
        std::unique_lock lock(impl_->mutex);
        while (!handle.ready()) {
            impl_->collectLocked(DispatchClock::now());
            if (handle.ready()) {
                break;
            }
            impl_->cv.wait_until(lock, handle.deadline());
        }
    }
    impl_->flushOutbox();

    auto decision = handle.decision();
    if (!decision) {
        return GameResult<Decision>::err(
            GameError(ErrorCode::DecisionFailed, "request resolved without a decision"));
    }
    return GameResult<Decision>::ok(std::move(*decision));
}

// ── shutdown() ──────────────────────────────────────────────────────────────

void DecisionDispatcher::shutdown() {
    {
        std::unique_lock lock(impl_->mutex);
        if (impl_->stopped) {
            return;
        }
        impl_->stopped = true;
        while (!impl_->tasks.empty()) {
            impl_->resolveLocked(impl_->tasks.begin(), DecisionOutcome::Failed, std::nullopt,
                                 GameError(ErrorCode::DispatcherStopped,
                                           "dispatcher shut down"));
        }
        impl_->cv.wait(lock, [this] { return impl_->running == 0; });
    }
    impl_->flushOutbox();
    GSIM_LOG_DEBUG(LogCategory::Dispatch, "dispatcher stopped");
}

// ── Queries ─────────────────────────────────────────────────────────────────

std::size_t DecisionDispatcher::pendingCount() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->tasks.size();
}

DispatcherStats DecisionDispatcher::stats() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->stats;
}

DecisionCache& DecisionDispatcher::cache() noexcept {
    return impl_->cache;
}

const DecisionDispatcherConfig& DecisionDispatcher::config() const noexcept {
    return impl_->config;
}

}  // namespace gsim::ai
