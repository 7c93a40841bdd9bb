#pragma once

/// @file event.hpp
/// @brief Immutable event envelope carried by the EventBus.

#include <any>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace gsim::event {

/// Delivery tier. Lower enumerator value is delivered first.
enum class EventPriority : uint8_t {
    Critical = 0,
    High     = 1,
    Medium   = 2,
    Low      = 3
};

inline constexpr std::size_t kEventPriorityCount = 4;

constexpr std::string_view eventPriorityName(EventPriority p) {
    switch (p) {
        case EventPriority::Critical: return "CRITICAL";
        case EventPriority::High:     return "HIGH";
        case EventPriority::Medium:   return "MEDIUM";
        case EventPriority::Low:      return "LOW";
    }
    return "UNKNOWN";
}

using EventClock = std::chrono::system_clock;

/// Envelope shared by every event crossing a component boundary.
///
/// `id`, `source`, `type` and `time` are mandatory. `type` is a dotted
/// `<context>.<entity>.<action>` name such as `guild.member.joined`.
struct Event {
    std::string id;
    std::string source;
    std::string type;
    EventClock::time_point time{};
    EventPriority priority = EventPriority::Medium;
    std::any payload;
    std::optional<std::string> correlationId;
    std::optional<std::string> subject;

    /// Typed payload, or nullptr when the payload holds another type.
    template <typename T>
    [[nodiscard]] const T* payloadAs() const noexcept {
        return std::any_cast<T>(&payload);
    }
};

/// Next process-unique event id ("evt-<n>").
std::string nextEventId();

/// Build a fully populated envelope stamped with the current time.
Event makeEvent(std::string source, std::string type,
                std::any payload = {},
                EventPriority priority = EventPriority::Medium);

/// True for at least three dot-separated, non-empty segments of [a-z0-9_].
[[nodiscard]] bool isValidEventType(std::string_view type);

/// True for "*", "<prefix>.*" with a valid dotted prefix, or a valid type.
[[nodiscard]] bool isValidSubscriptionPattern(std::string_view pattern);

/// True if @p type is selected by subscription @p pattern.
[[nodiscard]] bool matchesPattern(std::string_view pattern, std::string_view type);

} // namespace gsim::event
