#pragma once

/// @file decision.hpp
/// @brief Decision records produced by the behavior engine and dispatcher.

#include "gsim/ai/ai_types.hpp"
#include "gsim/ai/situation_context.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace gsim::ai {

/// The action an agent should take.
struct Decision {
    std::string agentId;
    std::string treeId;
    std::string actionId;
    double score = 0.0;
    FactMap params;
    /// True for the deterministic "noop" produced on timeout or failure.
    bool fallback = false;
    uint64_t computedAtTick = 0;
    /// Action ids selected along the winning path, in evaluation order.
    /// actionId is plan.front().
    std::vector<std::string> plan;
};

/// The deterministic "hold position" decision.
inline Decision makeFallbackDecision(std::string agentId, std::string treeId,
                                     uint64_t tick) {
    Decision d;
    d.agentId = std::move(agentId);
    d.treeId = std::move(treeId);
    d.actionId = std::string(kFallbackActionId);
    d.fallback = true;
    d.computedAtTick = tick;
    d.plan.push_back(d.actionId);
    return d;
}

/// Result of one synchronous tree evaluation.
struct BehaviorResult {
    BTStatus status = BTStatus::Failure;
    /// Present when the root did not fail and an Action node was selected.
    std::optional<Decision> decision;
    std::size_t nodesVisited = 0;
};

}  // namespace gsim::ai
