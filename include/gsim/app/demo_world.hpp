#pragma once

/// @file demo_world.hpp
/// @brief Seed world, member behavior tree and action effects used by
///        gsim_runner.

#include "gsim/ai/behavior_tree.hpp"
#include "gsim/foundation/game_result.hpp"
#include "gsim/runtime/simulation_system.hpp"
#include "gsim/state/game_state.hpp"

#include <string_view>

namespace gsim::app {

/// Tree id the agent planner requests decisions from.
inline constexpr std::string_view kMemberTreeId = "guild_member";

/// Two guilds with members, treasuries, market prices and relationships.
/// Passes every built-in validator.
[[nodiscard]] state::GameState buildDemoWorld();

/// Selector over three branches:
///   1. satisfaction < 40           -> rest
///   2. guild gold < 100            -> trade
///   3. otherwise the best-scoring of train / trade / rest
foundation::GameResult<ai::BehaviorTree> buildMemberTree();

/// Register the train, trade and rest effects. Each reads the state the
/// queued transaction runs against, not the state at decision time.
///
///  - train: member level +1, guild pays 10 gold (fails when poorer)
///  - trade: guild gains the "ore" market price in gold, loses 1 material
///  - rest:  member satisfaction +5, capped at 100
void registerDemoEffects(runtime::DecisionApplySystem& system);

}  // namespace gsim::app
