#pragma once

/// @file event_bus.hpp
/// @brief Prioritized, queued publish/subscribe bus for the simulation core.
///
/// Events are validated and queued on publish() and delivered only when the
/// simulation thread calls drain(). Delivery is priority-major (Critical
/// first) and publish-order-minor, so an event published later with a
/// higher priority overtakes earlier lower-priority ones still queued.

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "gsim/event/event.hpp"
#include "gsim/foundation/game_result.hpp"

namespace gsim::event {

/// Unique identifier for a subscription. Zero is never issued.
using SubscriptionId = uint64_t;

using EventHandler = std::function<void(const Event&)>;
using EventPredicate = std::function<bool(const Event&)>;

/// Extra subscription settings.
struct SubscriptionOptions {
    /// Higher values are called first; equal values in registration order.
    int32_t priority = 0;
    /// Delivery is skipped when the predicate returns false.
    EventPredicate predicate;
    /// Tag used by unsubscribeOwner() to tear down a component's handlers.
    std::string owner;
    /// Remove the subscription after its first delivery.
    bool once = false;
};

struct EventBusConfig {
    /// Consecutive handler failures before the handler is disabled.
    uint32_t handlerFailureThreshold = 3;
    /// How far in the future an event's time may lie.
    std::chrono::milliseconds clockSkewTolerance{5000};
    /// Delivered events retained for history()/replayHistory().
    std::size_t historyCapacity = 256;
    /// A warning is logged when one type gains more subscribers than this.
    std::size_t maxListenersPerType = 100;
};

/// Outcome of one drain() call.
struct DrainStats {
    std::size_t processed = 0;
    std::size_t deliveries = 0;
    std::size_t handlerFailures = 0;
    std::size_t remaining = 0;
    bool budgetExhausted = false;
};

/// Lifetime counters.
struct EventBusMetrics {
    uint64_t published = 0;
    uint64_t rejected = 0;
    uint64_t processed = 0;
    uint64_t deliveries = 0;
    uint64_t handlerFailures = 0;
    uint64_t disabledHandlers = 0;
};

/// Error context attached to a rejected publishBatch().
struct BatchRejection {
    std::size_t index = 0;
    std::string eventId;
    std::string reason;
};

/// Queued event bus.
///
/// Thread-safety: publish(), publishBatch(), subscribe() and unsubscribe()
/// may be called from any thread. drain() is meant for the simulation
/// thread only; handlers run on the draining thread.
///
/// Usage:
/// @code
///   EventBus bus;
///   auto id = bus.subscribe("guild.*", [](const Event& e) { ... });
///   bus.publish(makeEvent("guild", "guild.member.joined"));
///   bus.drain(std::chrono::milliseconds(2));
///   bus.unsubscribe(id);
/// @endcode
class EventBus {
public:
    EventBus();
    explicit EventBus(EventBusConfig config);
    ~EventBus();

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;
    EventBus(EventBus&&) noexcept;
    EventBus& operator=(EventBus&&) noexcept;

    // -- Publish --------------------------------------------------------------

    /// Validate and enqueue. InvalidEventFormat on a malformed envelope.
    foundation::GameResult<void> publish(Event event);

    /// Validate every event, then enqueue all in order or none.
    /// The error carries a BatchRejection context naming the bad event.
    foundation::GameResult<void> publishBatch(std::vector<Event> events);

    // -- Subscribe ------------------------------------------------------------

    /// @param eventType Exact type, "<prefix>.*" or "*".
    /// @return The new id, or 0 when the pattern is malformed or the
    ///         handler is empty.
    SubscriptionId subscribe(std::string eventType, EventHandler handler,
                             int32_t priority = 0);

    SubscriptionId subscribe(std::string eventType, EventHandler handler,
                             SubscriptionOptions options);

    /// @return false if the id is unknown or already removed.
    bool unsubscribe(SubscriptionId id);

    /// Remove every subscription tagged with @p owner.
    /// @return Number of subscriptions removed.
    std::size_t unsubscribeOwner(std::string_view owner);

    // -- Delivery -------------------------------------------------------------

    /// Deliver queued events until the queue is empty or @p budget is spent.
    /// At least one event is processed when any is queued. Events published
    /// by handlers join the same queue and may be delivered in this call.
    DrainStats drain(std::chrono::microseconds budget);

    /// Deliver until the queue is empty, including handler-published events.
    DrainStats drainAll();

    // -- History --------------------------------------------------------------

    /// Most recently delivered events, oldest first.
    [[nodiscard]] std::vector<Event> history() const;

    /// Feed retained history, oldest first, to @p handler.
    /// @return Number of events replayed.
    std::size_t replayHistory(const EventHandler& handler) const;

    // -- Queries --------------------------------------------------------------

    [[nodiscard]] std::size_t pendingCount() const;
    [[nodiscard]] std::size_t subscriptionCount() const;

    /// Subscriptions that would receive an event of @p type.
    [[nodiscard]] std::size_t listenerCount(std::string_view type) const;

    [[nodiscard]] EventBusMetrics metrics() const;
    [[nodiscard]] const EventBusConfig& config() const noexcept;

    /// Drop subscriptions, queued events and history. Metrics are kept.
    void clear();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace gsim::event
