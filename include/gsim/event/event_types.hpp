#pragma once

/// @file event_types.hpp
/// @brief Event type names published by the simulation core, and the
///        payloads the core attaches to them.

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace gsim::event {

namespace types {

// -- guild.* ------------------------------------------------------------------
inline constexpr std::string_view kGuildMemberJoined = "guild.member.joined";
inline constexpr std::string_view kGuildMemberLeft = "guild.member.left";
inline constexpr std::string_view kGuildReputationChanged = "guild.reputation.changed";

// -- combat.* -----------------------------------------------------------------
inline constexpr std::string_view kCombatBattleStarted = "combat.battle.started";
inline constexpr std::string_view kCombatBattleResolved = "combat.battle.resolved";

// -- economy.* ----------------------------------------------------------------
inline constexpr std::string_view kEconomyIncomeCollected = "economy.income.collected";
inline constexpr std::string_view kEconomyPriceChanged = "economy.price.changed";

// -- social.* -----------------------------------------------------------------
inline constexpr std::string_view kSocialAffinityChanged = "social.affinity.changed";

// -- system.* -----------------------------------------------------------------
inline constexpr std::string_view kHandlerDisabled = "system.error.handler_disabled";
inline constexpr std::string_view kPerformanceWarning = "system.performance.warning";
inline constexpr std::string_view kStateCommitted = "system.state.committed";
inline constexpr std::string_view kStateRestored = "system.state.restored";
inline constexpr std::string_view kSnapshotSaved = "system.snapshot.saved";

// -- ai.* ---------------------------------------------------------------------
inline constexpr std::string_view kTreeRegistered = "ai.tree.registered";
inline constexpr std::string_view kDecisionCompleted = "ai.decision.completed";
inline constexpr std::string_view kDecisionFallback = "ai.decision.fallback";
inline constexpr std::string_view kActionExecuted = "ai.action.executed";

} // namespace types

/// Payload of system.error.handler_disabled.
struct HandlerDisabledPayload {
    uint64_t subscriptionId = 0;
    std::string pattern;
    std::string owner;
    std::string lastEventId;
    std::string lastError;
    uint32_t consecutiveFailures = 0;
};

/// Payload of system.performance.warning.
struct PerformanceWarningPayload {
    uint64_t tick = 0;
    std::chrono::microseconds averageTickTime{0};
    std::chrono::microseconds budget{0};
    uint32_t consecutiveOverBudget = 0;
};

/// Payload of system.state.committed / system.state.restored.
struct StateChangedPayload {
    uint64_t version = 0;
    uint64_t tick = 0;
    std::string checksum;
    std::string reason;
};

} // namespace gsim::event
