/// @file demo_world.cpp
/// @brief Demo world content for gsim_runner.

#include "gsim/app/demo_world.hpp"

#include "gsim/state/state_transaction.hpp"

#include <algorithm>
#include <memory>
#include <optional>
#include <utility>

namespace gsim::app {

using state::GameState;
using state::Guild;
using state::GuildMember;
using state::GuildRole;

namespace {

constexpr int64_t kTrainingCost = 10;
constexpr int32_t kRestGain = 5;

void addMember(Guild& guild, std::string id, std::string name, GuildRole role, int32_t level,
               int32_t satisfaction) {
    GuildMember m;
    m.id = id;
    m.name = std::move(name);
    m.role = role;
    m.level = level;
    m.satisfaction = satisfaction;
    guild.members.emplace(std::move(id), std::move(m));
}

void addRelationship(GameState& s, const std::string& from, const std::string& to,
                     int32_t affinity) {
    s.social.relationships[state::relationshipKey(from, to)] = state::Relationship{from, to, affinity};
}

/// Guild whose roster contains @p memberId, or nullptr.
const Guild* guildOf(const GameState& s, const std::string& memberId) {
    for (const auto& [id, guild] : s.guild.guilds) {
        if (guild.members.count(memberId) != 0) {
            return &guild;
        }
    }
    return nullptr;
}

Guild* findGuild(GameState& s, const std::string& memberId) {
    for (auto& [id, guild] : s.guild.guilds) {
        if (guild.members.count(memberId) != 0) {
            return &guild;
        }
    }
    return nullptr;
}

}  // namespace

// ---------------------------------------------------------------------------
// World
// ---------------------------------------------------------------------------

GameState buildDemoWorld() {
    GameState s;

    Guild ironhold;
    ironhold.id = "ironhold";
    ironhold.name = "Ironhold Wardens";
    ironhold.maxMembers = 12;
    ironhold.reputation = 40;
    addMember(ironhold, "brenna", "Brenna", GuildRole::Leader, 8, 70);
    addMember(ironhold, "dario", "Dario", GuildRole::Officer, 5, 55);
    addMember(ironhold, "tamsin", "Tamsin", GuildRole::Member, 3, 35);
    addMember(ironhold, "ulric", "Ulric", GuildRole::Recruit, 1, 60);

    Guild saltmarsh;
    saltmarsh.id = "saltmarsh";
    saltmarsh.name = "Saltmarsh Traders";
    saltmarsh.maxMembers = 8;
    saltmarsh.reputation = 15;
    addMember(saltmarsh, "ines", "Ines", GuildRole::Leader, 6, 80);
    addMember(saltmarsh, "kofi", "Kofi", GuildRole::Member, 2, 45);
    addMember(saltmarsh, "mira", "Mira", GuildRole::Member, 4, 90);

    s.guild.guilds.emplace(ironhold.id, ironhold);
    s.guild.guilds.emplace(saltmarsh.id, saltmarsh);

    s.economy.treasuries["ironhold"] = state::ResourceAmount{250, 40, 10};
    s.economy.treasuries["saltmarsh"] = state::ResourceAmount{60, 12, 25};
    s.economy.marketPrices["ore"] = 12;
    s.economy.marketPrices["cloth"] = 7;
    s.economy.marketPrices["herbs"] = 4;

    state::Battle drill;
    drill.id = "drill-1";
    drill.guildId = "ironhold";
    drill.participants = {"dario", "ulric"};
    s.combat.battles.emplace(drill.id, drill);

    addRelationship(s, "brenna", "dario", 60);
    addRelationship(s, "dario", "tamsin", -10);
    addRelationship(s, "ines", "brenna", 20);
    addRelationship(s, "kofi", "mira", 75);

    return s;
}

// ---------------------------------------------------------------------------
// Member tree
// ---------------------------------------------------------------------------

foundation::GameResult<ai::BehaviorTree> buildMemberTree() {
    ai::BehaviorTreeBuilder b;

    auto unhappy = b.condition("unhappy", [](const ai::SituationContext& c) {
        return c.number("satisfaction") < 40;
    });
    auto recover = b.action("recover", "rest", 1.0);

    auto poor = b.condition("treasury_low", [](const ai::SituationContext& c) {
        return c.number("gold") < 100;
    });
    auto earn = b.action("earn", "trade", 1.0);

    ai::ActionCandidate train;
    train.actionId = "train";
    train.scorer = [](const ai::SituationContext& c) {
        return 0.5 + std::max(0.0, 10.0 - c.number("level", 1)) / 20.0;
    };
    train.precondition = [](const ai::SituationContext& c) {
        return c.number("gold") >= static_cast<double>(kTrainingCost);
    };

    ai::ActionCandidate trade;
    trade.actionId = "trade";
    trade.scorer = [](const ai::SituationContext& c) {
        return 0.4 + c.number("guild_size") / 100.0;
    };

    ai::ActionCandidate rest;
    rest.actionId = "rest";
    rest.scorer = [](const ai::SituationContext& c) {
        return (100.0 - c.number("satisfaction", 100)) / 100.0;
    };

    auto improve = b.action("improve", {std::move(train), std::move(trade), std::move(rest)});

    auto root = b.selector({b.sequence({unhappy, recover}), b.sequence({poor, earn}), improve});
    return b.build(root);
}

// ---------------------------------------------------------------------------
// Effects
// ---------------------------------------------------------------------------

// Effects are resolved against the state current when the transaction
// runs on the next tick, so several members of one guild acting in the
// same tick compose instead of overwriting each other.

void registerDemoEffects(runtime::DecisionApplySystem& system) {
    system.registerEffect(
        "train", [](const ai::Decision& d, const GameState& s) -> std::optional<state::StateTransaction> {
            if (guildOf(s, d.agentId) == nullptr) {
                return std::nullopt;
            }
            auto agent = d.agentId;
            state::StateTransaction tx("train:" + agent);
            tx.add(
                "train",
                [agent](GameState& st) -> foundation::GameResult<void> {
                    auto* guild = findGuild(st, agent);
                    if (guild == nullptr) {
                        return foundation::GameResult<void>::err(foundation::GameError(
                            foundation::ErrorCode::NotFound, agent + " left their guild"));
                    }
                    auto& funds = st.economy.treasuries[guild->id];
                    if (funds.gold < kTrainingCost) {
                        return foundation::GameResult<void>::err(foundation::GameError(
                            foundation::ErrorCode::InvalidState, "cannot afford training"));
                    }
                    funds.gold -= kTrainingCost;
                    guild->members[agent].level += 1;
                    return foundation::GameResult<void>::ok();
                },
                [agent](GameState& st) {
                    if (auto* guild = findGuild(st, agent)) {
                        st.economy.treasuries[guild->id].gold += kTrainingCost;
                        guild->members[agent].level -= 1;
                    }
                });
            return tx;
        });

    system.registerEffect(
        "trade", [](const ai::Decision& d, const GameState& s) -> std::optional<state::StateTransaction> {
            if (guildOf(s, d.agentId) == nullptr || s.economy.marketPrices.count("ore") == 0) {
                return std::nullopt;
            }
            auto agent = d.agentId;
            auto earned = std::make_shared<int64_t>(0);
            state::StateTransaction tx("trade:" + agent);
            tx.add(
                "trade",
                [agent, earned](GameState& st) -> foundation::GameResult<void> {
                    auto* guild = findGuild(st, agent);
                    auto price = st.economy.marketPrices.find("ore");
                    if (guild == nullptr || price == st.economy.marketPrices.end()) {
                        return foundation::GameResult<void>::err(foundation::GameError(
                            foundation::ErrorCode::NotFound, "no market for " + agent));
                    }
                    auto& funds = st.economy.treasuries[guild->id];
                    if (funds.materials < 1) {
                        return foundation::GameResult<void>::err(foundation::GameError(
                            foundation::ErrorCode::InvalidState, "nothing left to sell"));
                    }
                    *earned = price->second;
                    funds.materials -= 1;
                    funds.gold += *earned;
                    return foundation::GameResult<void>::ok();
                },
                [agent, earned](GameState& st) {
                    if (auto* guild = findGuild(st, agent)) {
                        auto& funds = st.economy.treasuries[guild->id];
                        funds.materials += 1;
                        funds.gold -= *earned;
                    }
                });
            return tx;
        });

    system.registerEffect(
        "rest", [](const ai::Decision& d, const GameState& s) -> std::optional<state::StateTransaction> {
            if (guildOf(s, d.agentId) == nullptr) {
                return std::nullopt;
            }
            auto agent = d.agentId;
            auto gained = std::make_shared<int32_t>(0);
            state::StateTransaction tx("rest:" + agent);
            tx.add(
                "rest",
                [agent, gained](GameState& st) -> foundation::GameResult<void> {
                    auto* guild = findGuild(st, agent);
                    if (guild == nullptr) {
                        return foundation::GameResult<void>::err(foundation::GameError(
                            foundation::ErrorCode::NotFound, agent + " left their guild"));
                    }
                    auto& member = guild->members[agent];
                    *gained = std::min(100, member.satisfaction + kRestGain) - member.satisfaction;
                    member.satisfaction += *gained;
                    return foundation::GameResult<void>::ok();
                },
                [agent, gained](GameState& st) {
                    if (auto* guild = findGuild(st, agent)) {
                        guild->members[agent].satisfaction -= *gained;
                    }
                });
            return tx;
        });
}

}  // namespace gsim::app
