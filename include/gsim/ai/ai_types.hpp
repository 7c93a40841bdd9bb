#pragma once

/// @file ai_types.hpp
/// @brief Enumerations and constants shared by the behavior engine and the
///        decision dispatcher.

#include <cstdint>
#include <limits>
#include <string_view>

namespace gsim::ai {

/// Arena index of a behavior-tree node.
using NodeIndex = uint32_t;

inline constexpr NodeIndex kInvalidNode = std::numeric_limits<NodeIndex>::max();

/// Action id of the decision returned on timeout or failure.
inline constexpr std::string_view kFallbackActionId = "noop";

/// Default decision cache lifetime, in simulation ticks.
inline constexpr uint64_t kDefaultDecisionTtlTicks = 300;

/// Behavior-tree node evaluation result.
enum class BTStatus : uint8_t {
    Success,  ///< Node completed successfully.
    Failure,  ///< Node failed.
    Running   ///< Node still in progress.
};

/// Closed set of node shapes stored in the arena.
enum class NodeKind : uint8_t {
    Sequence,
    Selector,
    Condition,
    Action,
    Decorator
};

enum class DecoratorKind : uint8_t {
    Inverter,      ///< Success <-> Failure, Running unchanged.
    ForceSuccess,  ///< Failure becomes Success.
    ForceFailure,  ///< Success becomes Failure.
    Repeat         ///< Re-evaluate the child up to n times while it succeeds.
};

/// Dispatcher priority. Lower enumerator value is served first.
enum class DecisionPriority : uint8_t {
    Critical = 0,
    High     = 1,
    Normal   = 2,
    Low      = 3
};

/// Final state of a decision request.
enum class DecisionOutcome : uint8_t {
    Pending,    ///< Not resolved yet.
    Completed,  ///< Computed by a worker (or served from the cache).
    Timeout,    ///< Deadline passed; fallback returned.
    Failed      ///< Solver threw or reported an error; fallback returned.
};

constexpr std::string_view btStatusName(BTStatus s) {
    switch (s) {
        case BTStatus::Success: return "SUCCESS";
        case BTStatus::Failure: return "FAILURE";
        case BTStatus::Running: return "RUNNING";
    }
    return "UNKNOWN";
}

constexpr std::string_view nodeKindName(NodeKind k) {
    switch (k) {
        case NodeKind::Sequence:  return "Sequence";
        case NodeKind::Selector:  return "Selector";
        case NodeKind::Condition: return "Condition";
        case NodeKind::Action:    return "Action";
        case NodeKind::Decorator: return "Decorator";
    }
    return "Unknown";
}

constexpr std::string_view decisionOutcomeName(DecisionOutcome o) {
    switch (o) {
        case DecisionOutcome::Pending:   return "pending";
        case DecisionOutcome::Completed: return "completed";
        case DecisionOutcome::Timeout:   return "timeout";
        case DecisionOutcome::Failed:    return "failed";
    }
    return "unknown";
}

}  // namespace gsim::ai
