#pragma once

/// @file game_state.hpp
/// @brief Aggregate simulation state (guild, combat, economy, social) and the
///        partial StateUpdate merged by StateManager::updateState().

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gsim::state {

// ── Guild ───────────────────────────────────────────────────────────────────

enum class GuildRole : uint8_t { Leader = 0, Officer, Member, Recruit };

[[nodiscard]] constexpr std::string_view guildRoleName(GuildRole role) noexcept {
    switch (role) {
        case GuildRole::Leader:  return "Leader";
        case GuildRole::Officer: return "Officer";
        case GuildRole::Member:  return "Member";
        case GuildRole::Recruit: return "Recruit";
    }
    return "Unknown";
}

struct GuildMember {
    std::string id;
    std::string name;
    GuildRole role = GuildRole::Member;
    int32_t level = 1;
    int32_t satisfaction = 50;  ///< 0..100

    bool operator==(const GuildMember&) const = default;
};

struct Guild {
    std::string id;
    std::string name;
    uint32_t maxMembers = 20;
    int64_t reputation = 0;
    std::map<std::string, GuildMember> members;

    bool operator==(const Guild&) const = default;
};

struct GuildState {
    std::map<std::string, Guild> guilds;

    bool operator==(const GuildState&) const = default;
};

// ── Combat ──────────────────────────────────────────────────────────────────

enum class BattlePhase : uint8_t { Preparing = 0, Engaged, Resolved };

struct Battle {
    std::string id;
    std::string guildId;
    std::vector<std::string> participants;  ///< Member ids of guildId.
    BattlePhase phase = BattlePhase::Preparing;
    uint32_t round = 0;

    bool operator==(const Battle&) const = default;
};

struct CombatState {
    std::map<std::string, Battle> battles;

    bool operator==(const CombatState&) const = default;
};

// ── Economy ─────────────────────────────────────────────────────────────────

struct ResourceAmount {
    int64_t gold = 0;
    int64_t materials = 0;
    int64_t influence = 0;

    bool operator==(const ResourceAmount&) const = default;
};

struct EconomyState {
    std::map<std::string, ResourceAmount> treasuries;  ///< guildId -> funds
    std::map<std::string, int64_t> marketPrices;       ///< item -> price

    bool operator==(const EconomyState&) const = default;
};

// ── Social ──────────────────────────────────────────────────────────────────

struct Relationship {
    std::string from;
    std::string to;
    int32_t affinity = 0;  ///< -100..100

    bool operator==(const Relationship&) const = default;
};

/// Map key of a directed relationship: "from|to".
[[nodiscard]] inline std::string relationshipKey(std::string_view from, std::string_view to) {
    std::string key;
    key.reserve(from.size() + to.size() + 1);
    key.append(from).append("|").append(to);
    return key;
}

struct SocialState {
    std::map<std::string, Relationship> relationships;

    bool operator==(const SocialState&) const = default;
};

// ── Aggregate ───────────────────────────────────────────────────────────────

struct GameState {
    GuildState guild;
    CombatState combat;
    EconomyState economy;
    SocialState social;

    uint64_t version = 0;
    uint64_t tick = 0;      ///< Simulation tick of the last commit.
    std::string checksum;   ///< Hex SHA-256 of everything above.

    bool operator==(const GameState&) const = default;
};

/// Partial update. An engaged optional upserts the entity, an empty one
/// erases it.
struct StateUpdate {
    std::map<std::string, std::optional<Guild>> guilds;
    std::map<std::string, std::optional<Battle>> battles;
    std::map<std::string, std::optional<ResourceAmount>> treasuries;
    std::map<std::string, std::optional<int64_t>> marketPrices;
    std::map<std::string, std::optional<Relationship>> relationships;

    [[nodiscard]] bool empty() const noexcept {
        return guilds.empty() && battles.empty() && treasuries.empty() &&
               marketPrices.empty() && relationships.empty();
    }
};

/// Merge @p update into @p state. Does not touch version, tick or checksum.
void applyUpdate(GameState& state, const StateUpdate& update);

using SnapshotClock = std::chrono::system_clock;

struct StateSnapshot {
    std::string id;
    GameState state;
    SnapshotClock::time_point timestamp{};
    uint64_t version = 0;
    std::string checksum;
};

}  // namespace gsim::state
