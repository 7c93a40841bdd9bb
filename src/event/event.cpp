/// @file event.cpp
/// @brief Event id generation and type-name validation.

#include "gsim/event/event.hpp"

#include <atomic>
#include <utility>

namespace gsim::event {

namespace {

bool isSegmentChar(char c) {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_';
}

/// Count dot-separated segments; returns 0 if any segment is empty or
/// holds a character outside [a-z0-9_].
std::size_t countSegments(std::string_view text) {
    if (text.empty()) {
        return 0;
    }
    std::size_t segments = 1;
    std::size_t segmentLength = 0;
    for (char c : text) {
        if (c == '.') {
            if (segmentLength == 0) {
                return 0;
            }
            ++segments;
            segmentLength = 0;
        } else if (isSegmentChar(c)) {
            ++segmentLength;
        } else {
            return 0;
        }
    }
    return segmentLength == 0 ? 0 : segments;
}

} // namespace

std::string nextEventId() {
    static std::atomic<uint64_t> counter{1};
    return "evt-" + std::to_string(counter.fetch_add(1, std::memory_order_relaxed));
}

Event makeEvent(std::string source, std::string type,
                std::any payload, EventPriority priority) {
    Event e;
    e.id = nextEventId();
    e.source = std::move(source);
    e.type = std::move(type);
    e.time = EventClock::now();
    e.priority = priority;
    e.payload = std::move(payload);
    return e;
}

bool isValidEventType(std::string_view type) {
    return countSegments(type) >= 3;
}

bool isValidSubscriptionPattern(std::string_view pattern) {
    if (pattern == "*") {
        return true;
    }
    if (pattern.size() > 2 && pattern.substr(pattern.size() - 2) == ".*") {
        return countSegments(pattern.substr(0, pattern.size() - 2)) >= 1;
    }
    return isValidEventType(pattern);
}

bool matchesPattern(std::string_view pattern, std::string_view type) {
    if (pattern == "*") {
        return true;
    }
    if (pattern.size() > 2 && pattern.substr(pattern.size() - 2) == ".*") {
        // "guild.*" selects "guild.member.joined" but not "guildhall.x.y".
        auto prefix = pattern.substr(0, pattern.size() - 1);
        return type.size() > prefix.size() && type.substr(0, prefix.size()) == prefix;
    }
    return pattern == type;
}

} // namespace gsim::event
