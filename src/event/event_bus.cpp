/// @file event_bus.cpp
/// @brief EventBus implementation.

#include "gsim/event/event_bus.hpp"

#include "gsim/event/event_types.hpp"
#include "gsim/foundation/game_logger.hpp"

#include <algorithm>
#include <atomic>
#include <deque>
#include <exception>
#include <mutex>
#include <optional>
#include <queue>
#include <utility>

namespace gsim::event {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

namespace {

constexpr std::string_view kBusSource = "event_bus";

struct Subscription {
    SubscriptionId id = 0;
    std::string pattern;
    EventHandler handler;
    SubscriptionOptions options;
    uint32_t consecutiveFailures = 0;
    std::atomic<bool> active{true};
};

struct QueuedEvent {
    EventPriority priority = EventPriority::Medium;
    uint64_t sequence = 0;
    std::shared_ptr<const Event> event;
};

/// Heap order: smaller priority value first, then earlier sequence.
struct QueuedEventAfter {
    bool operator()(const QueuedEvent& a, const QueuedEvent& b) const {
        if (a.priority != b.priority) {
            return static_cast<uint8_t>(a.priority) > static_cast<uint8_t>(b.priority);
        }
        return a.sequence > b.sequence;
    }
};

GameResult<void> validateEnvelope(const Event& e,
                                  std::chrono::milliseconds skewTolerance) {
    auto reject = [](std::string reason) {
        return GameResult<void>::err(
            GameError(ErrorCode::InvalidEventFormat, std::move(reason)));
    };

    if (e.id.empty()) {
        return reject("event id is empty");
    }
    if (e.source.empty()) {
        return reject("event " + e.id + " has an empty source");
    }
    if (e.type.empty()) {
        return reject("event " + e.id + " has an empty type");
    }
    if (!isValidEventType(e.type)) {
        return reject("event " + e.id + " has malformed type '" + e.type + "'");
    }
    if (static_cast<uint8_t>(e.priority) >= kEventPriorityCount) {
        return reject("event " + e.id + " has an unknown priority");
    }
    if (e.time == EventClock::time_point{}) {
        return reject("event " + e.id + " has no time");
    }
    if (e.time > EventClock::now() + skewTolerance) {
        return reject("event " + e.id + " is dated beyond the clock-skew tolerance");
    }
    return GameResult<void>::ok();
}

} // namespace

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct EventBus::Impl {
    EventBusConfig config;

    mutable std::mutex mutex;
    std::vector<std::shared_ptr<Subscription>> subscriptions; // priority desc, then id
    std::priority_queue<QueuedEvent, std::vector<QueuedEvent>, QueuedEventAfter> queue;
    std::deque<std::shared_ptr<const Event>> history;
    EventBusMetrics metrics;
    SubscriptionId nextId = 1;
    uint64_t nextSequence = 0;

    explicit Impl(EventBusConfig cfg) : config(std::move(cfg)) {}

    // Caller holds mutex.
    void enqueueLocked(Event e) {
        QueuedEvent q;
        q.priority = e.priority;
        q.sequence = nextSequence++;
        q.event = std::make_shared<const Event>(std::move(e));
        queue.push(std::move(q));
        ++metrics.published;
    }

    // Caller holds mutex.
    bool removeLocked(SubscriptionId id) {
        auto it = std::find_if(subscriptions.begin(), subscriptions.end(),
                               [id](const auto& s) { return s->id == id; });
        if (it == subscriptions.end()) {
            return false;
        }
        (*it)->active.store(false, std::memory_order_release);
        subscriptions.erase(it);
        return true;
    }

    // Caller holds mutex.
    void recordHistoryLocked(std::shared_ptr<const Event> e) {
        if (config.historyCapacity == 0) {
            return;
        }
        history.push_back(std::move(e));
        while (history.size() > config.historyCapacity) {
            history.pop_front();
        }
    }

    enum class Filter { Pass, Skip, Threw };

    /// Apply the subscription predicate; @p error is set when it threw.
    static Filter filter(const Subscription& sub, const Event& e, std::string& error) {
        if (!sub.options.predicate) {
            return Filter::Pass;
        }
        try {
            return sub.options.predicate(e) ? Filter::Pass : Filter::Skip;
        } catch (const std::exception& ex) {
            error = std::string("predicate threw: ") + ex.what();
        } catch (...) {
            error = "predicate threw a non-standard exception";
        }
        return Filter::Threw;
    }

    /// Invoke one handler; returns the error text on failure.
    static std::optional<std::string> invoke(const Subscription& sub, const Event& e) {
        try {
            sub.handler(e);
        } catch (const std::exception& ex) {
            return std::string(ex.what());
        } catch (...) {
            return std::string("non-standard exception");
        }
        return std::nullopt;
    }

    /// Returns true if the failure disabled the subscription.
    bool recordFailure(const std::shared_ptr<Subscription>& sub, const Event& e,
                       const std::string& error, HandlerDisabledPayload& disabled) {
        LogContext ctx;
        ctx.eventId = e.id;
        ctx.extra["type"] = e.type;
        ctx.extra["subscription"] = std::to_string(sub->id);
        foundation::GameLogger::instance().logWithContext(
            LogLevel::Error, LogCategory::Event, "handler failed: " + error, ctx);

        std::lock_guard lock(mutex);
        ++metrics.handlerFailures;
        ++sub->consecutiveFailures;
        if (sub->consecutiveFailures < config.handlerFailureThreshold ||
            !sub->active.load(std::memory_order_acquire)) {
            return false;
        }
        removeLocked(sub->id);
        ++metrics.disabledHandlers;
        disabled.subscriptionId = sub->id;
        disabled.pattern = sub->pattern;
        disabled.owner = sub->options.owner;
        disabled.lastEventId = e.id;
        disabled.lastError = error;
        disabled.consecutiveFailures = sub->consecutiveFailures;
        return true;
    }
};

// ---------------------------------------------------------------------------
// Construction / Destruction / Move
// ---------------------------------------------------------------------------
EventBus::EventBus() : EventBus(EventBusConfig{}) {}

EventBus::EventBus(EventBusConfig config)
    : impl_(std::make_unique<Impl>(std::move(config))) {}

EventBus::~EventBus() = default;

EventBus::EventBus(EventBus&&) noexcept = default;
EventBus& EventBus::operator=(EventBus&&) noexcept = default;

// ---------------------------------------------------------------------------
// publish() / publishBatch()
// ---------------------------------------------------------------------------
GameResult<void> EventBus::publish(Event event) {
    auto valid = validateEnvelope(event, impl_->config.clockSkewTolerance);
    std::lock_guard lock(impl_->mutex);
    if (!valid) {
        ++impl_->metrics.rejected;
        return valid;
    }
    impl_->enqueueLocked(std::move(event));
    return GameResult<void>::ok();
}

GameResult<void> EventBus::publishBatch(std::vector<Event> events) {
    for (std::size_t i = 0; i < events.size(); ++i) {
        auto valid = validateEnvelope(events[i], impl_->config.clockSkewTolerance);
        if (!valid) {
            {
                std::lock_guard lock(impl_->mutex);
                ++impl_->metrics.rejected;
            }
            BatchRejection rejection{i, events[i].id, std::string(valid.error().message())};
            return GameResult<void>::err(GameError(
                ErrorCode::InvalidEventFormat,
                "batch rejected at index " + std::to_string(i) + ": " + rejection.reason,
                rejection));
        }
    }

    std::lock_guard lock(impl_->mutex);
    for (auto& e : events) {
        impl_->enqueueLocked(std::move(e));
    }
    return GameResult<void>::ok();
}

// ---------------------------------------------------------------------------
// subscribe() / unsubscribe()
// ---------------------------------------------------------------------------
SubscriptionId EventBus::subscribe(std::string eventType, EventHandler handler,
                                   int32_t priority) {
    SubscriptionOptions options;
    options.priority = priority;
    return subscribe(std::move(eventType), std::move(handler), std::move(options));
}

SubscriptionId EventBus::subscribe(std::string eventType, EventHandler handler,
                                   SubscriptionOptions options) {
    if (!handler || !isValidSubscriptionPattern(eventType)) {
        GSIM_LOG_WARN(LogCategory::Event,
                      "rejected subscription to '" + eventType + "'");
        return 0;
    }

    std::lock_guard lock(impl_->mutex);

    auto sub = std::make_shared<Subscription>();
    sub->id = impl_->nextId++;
    sub->pattern = std::move(eventType);
    sub->handler = std::move(handler);
    sub->options = std::move(options);

    // Insert after every subscription of equal or higher priority, which
    // keeps registration order within a priority level.
    auto pos = std::find_if(impl_->subscriptions.begin(), impl_->subscriptions.end(),
                            [p = sub->options.priority](const auto& s) {
                                return s->options.priority < p;
                            });
    auto id = sub->id;
    const auto& pattern = sub->pattern;
    auto sameType = std::count_if(impl_->subscriptions.begin(), impl_->subscriptions.end(),
                                  [&pattern](const auto& s) { return s->pattern == pattern; });
    if (static_cast<std::size_t>(sameType) >= impl_->config.maxListenersPerType) {
        GSIM_LOG_WARN(LogCategory::Event,
                      "'" + pattern + "' has more than " +
                      std::to_string(impl_->config.maxListenersPerType) + " listeners");
    }
    impl_->subscriptions.insert(pos, std::move(sub));
    return id;
}

bool EventBus::unsubscribe(SubscriptionId id) {
    std::lock_guard lock(impl_->mutex);
    return impl_->removeLocked(id);
}

std::size_t EventBus::unsubscribeOwner(std::string_view owner) {
    std::lock_guard lock(impl_->mutex);
    std::size_t removed = 0;
    auto& subs = impl_->subscriptions;
    for (auto it = subs.begin(); it != subs.end();) {
        if ((*it)->options.owner == owner) {
            (*it)->active.store(false, std::memory_order_release);
            it = subs.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

// ---------------------------------------------------------------------------
// drain()
// ---------------------------------------------------------------------------
DrainStats EventBus::drain(std::chrono::microseconds budget) {
    DrainStats stats;
    auto start = std::chrono::steady_clock::now();

    while (true) {
        std::shared_ptr<const Event> current;
        std::vector<std::shared_ptr<Subscription>> targets;
        {
            std::lock_guard lock(impl_->mutex);
            if (impl_->queue.empty()) {
                break;
            }
            current = impl_->queue.top().event;
            impl_->queue.pop();
            for (const auto& sub : impl_->subscriptions) {
                if (matchesPattern(sub->pattern, current->type)) {
                    targets.push_back(sub);
                }
            }
        }

        std::vector<HandlerDisabledPayload> disabledNow;
        for (const auto& sub : targets) {
            if (!sub->active.load(std::memory_order_acquire)) {
                continue;
            }
            std::string filterError;
            auto filtered = Impl::filter(*sub, *current, filterError);
            if (filtered == Impl::Filter::Skip) {
                continue;
            }

            std::optional<std::string> error;
            if (filtered == Impl::Filter::Threw) {
                error = std::move(filterError);
            } else {
                if (sub->options.once) {
                    std::lock_guard lock(impl_->mutex);
                    // Another delivery path may already have consumed it.
                    if (!impl_->removeLocked(sub->id)) {
                        continue;
                    }
                }
                error = Impl::invoke(*sub, *current);
            }
            if (error) {
                ++stats.handlerFailures;
                HandlerDisabledPayload disabled;
                if (impl_->recordFailure(sub, *current, *error, disabled)) {
                    disabledNow.push_back(std::move(disabled));
                }
            } else {
                ++stats.deliveries;
                std::lock_guard lock(impl_->mutex);
                sub->consecutiveFailures = 0;
                ++impl_->metrics.deliveries;
            }
        }

        for (auto& payload : disabledNow) {
            GSIM_LOG_WARN(LogCategory::Event,
                          "disabled handler " + std::to_string(payload.subscriptionId) +
                          " for '" + payload.pattern + "' after " +
                          std::to_string(payload.consecutiveFailures) + " failures");
            auto notice = makeEvent(std::string(kBusSource), std::string(types::kHandlerDisabled),
                                    std::move(payload), EventPriority::High);
            notice.correlationId = current->id;
            auto published = publish(std::move(notice));
            if (!published) {
                GSIM_LOG_ERROR(LogCategory::Event, published.error().describe());
            }
        }

        ++stats.processed;
        {
            std::lock_guard lock(impl_->mutex);
            ++impl_->metrics.processed;
            impl_->recordHistoryLocked(std::move(current));
        }

        auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - start);
        if (elapsed >= budget) {
            stats.budgetExhausted = pendingCount() > 0;
            break;
        }
    }

    stats.remaining = pendingCount();
    return stats;
}

DrainStats EventBus::drainAll() {
    return drain(std::chrono::microseconds::max());
}

// ---------------------------------------------------------------------------
// History
// ---------------------------------------------------------------------------
std::vector<Event> EventBus::history() const {
    std::lock_guard lock(impl_->mutex);
    std::vector<Event> out;
    out.reserve(impl_->history.size());
    for (const auto& e : impl_->history) {
        out.push_back(*e);
    }
    return out;
}

std::size_t EventBus::replayHistory(const EventHandler& handler) const {
    std::vector<std::shared_ptr<const Event>> copy;
    {
        std::lock_guard lock(impl_->mutex);
        copy.assign(impl_->history.begin(), impl_->history.end());
    }
    for (const auto& e : copy) {
        handler(*e);
    }
    return copy.size();
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------
std::size_t EventBus::pendingCount() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->queue.size();
}

std::size_t EventBus::subscriptionCount() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->subscriptions.size();
}

std::size_t EventBus::listenerCount(std::string_view type) const {
    std::lock_guard lock(impl_->mutex);
    return static_cast<std::size_t>(
        std::count_if(impl_->subscriptions.begin(), impl_->subscriptions.end(),
                      [type](const auto& s) { return matchesPattern(s->pattern, type); }));
}

EventBusMetrics EventBus::metrics() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->metrics;
}

const EventBusConfig& EventBus::config() const noexcept {
    return impl_->config;
}

void EventBus::clear() {
    std::lock_guard lock(impl_->mutex);
    for (auto& sub : impl_->subscriptions) {
        sub->active.store(false, std::memory_order_release);
    }
    impl_->subscriptions.clear();
    impl_->queue = {};
    impl_->history.clear();
}

} // namespace gsim::event
