/// @file simulation_system.cpp
/// @brief Built-in simulation systems.

#include "gsim/runtime/simulation_system.hpp"

#include "gsim/event/event_bus.hpp"
#include "gsim/event/event_types.hpp"
#include "gsim/foundation/game_logger.hpp"
#include "gsim/state/state_manager.hpp"

#include <exception>

namespace gsim::runtime {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

namespace {

void publishOrWarn(event::EventBus& bus, event::Event e) {
    auto published = bus.publish(std::move(e));
    if (!published) {
        GSIM_LOG_WARN(LogCategory::Runtime, published.error().describe());
    }
}

uint64_t stableHash(std::string_view s) {
    uint64_t h = 1469598103934665603ULL;
    for (unsigned char c : s) {
        h ^= c;
        h *= 1099511628211ULL;
    }
    return h;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// EconomySystem
// ═══════════════════════════════════════════════════════════════════════════

EconomySystem::EconomySystem(EconomyConfig config) : config_(config) {}

state::StateTransaction EconomySystem::buildIncomeTransaction(
    const state::GameState& state) const {
    state::StateTransaction tx("economy.income");

    for (const auto& [guildId, guild] : state.guild.guilds) {
        auto members = static_cast<int64_t>(guild.members.size());
        if (members == 0) {
            continue;
        }
        state::ResourceAmount income{members * config_.goldPerMember,
                                     members * config_.materialsPerMember,
                                     members * config_.influencePerMember};
        if (income == state::ResourceAmount{}) {
            continue;
        }

        auto id = guildId;
        tx.add(
            "income:" + id,
            [id, income](state::GameState& s) -> GameResult<void> {
                auto& t = s.economy.treasuries[id];
                t.gold += income.gold;
                t.materials += income.materials;
                t.influence += income.influence;
                return GameResult<void>::ok();
            },
            [id, income](state::GameState& s) {
                auto& t = s.economy.treasuries[id];
                t.gold -= income.gold;
                t.materials -= income.materials;
                t.influence -= income.influence;
            });
    }
    return tx;
}

GameResult<void> EconomySystem::update(TickContext& ctx) {
    if (config_.intervalTicks == 0 || ctx.tick % config_.intervalTicks != 0) {
        return GameResult<void>::ok();
    }

    auto tx = buildIncomeTransaction(ctx.state.state());
    if (tx.empty()) {
        return GameResult<void>::ok();
    }

    auto committed = ctx.state.executeTransaction(tx);
    if (!committed) {
        return GameResult<void>::err(std::move(committed).error());
    }

    const auto& current = ctx.state.state();
    for (const auto& [guildId, guild] : current.guild.guilds) {
        auto members = static_cast<int64_t>(guild.members.size());
        auto treasury = current.economy.treasuries.find(guildId);
        if (members == 0 || treasury == current.economy.treasuries.end()) {
            continue;
        }
        IncomeCollectedPayload payload;
        payload.guildId = guildId;
        payload.income = {members * config_.goldPerMember, members * config_.materialsPerMember,
                          members * config_.influencePerMember};
        payload.balance = treasury->second;
        payload.tick = ctx.tick;

        auto e = event::makeEvent("economy", std::string(event::types::kEconomyIncomeCollected),
                                  std::move(payload), event::EventPriority::Low);
        e.subject = guildId;
        publishOrWarn(ctx.bus, std::move(e));
    }
    return GameResult<void>::ok();
}

// ═══════════════════════════════════════════════════════════════════════════
// AgentPlannerSystem
// ═══════════════════════════════════════════════════════════════════════════

AgentPlannerSystem::AgentPlannerSystem(AgentPlannerConfig config)
    : config_(std::move(config)), builder_(&AgentPlannerSystem::defaultContext) {}

void AgentPlannerSystem::setContextBuilder(ContextBuilder builder) {
    builder_ = builder ? std::move(builder) : ContextBuilder(&AgentPlannerSystem::defaultContext);
}

void AgentPlannerSystem::defaultContext(const state::GameState& state, const state::Guild& guild,
                                        const state::GuildMember& member,
                                        ai::SituationContext& ctx) {
    ctx.set("role", std::string(state::guildRoleName(member.role)));
    ctx.set("level", static_cast<int64_t>(member.level));
    ctx.set("satisfaction", static_cast<int64_t>(member.satisfaction));
    ctx.set("guild_size", static_cast<int64_t>(guild.members.size()));
    ctx.set("guild_reputation", guild.reputation);

    auto treasury = state.economy.treasuries.find(guild.id);
    ctx.set("gold", treasury != state.economy.treasuries.end() ? treasury->second.gold
                                                               : int64_t{0});
}

GameResult<void> AgentPlannerSystem::update(TickContext& ctx) {
    if (ctx.dispatcher == nullptr || config_.intervalTicks == 0) {
        return GameResult<void>::ok();
    }

    const auto& current = ctx.state.state();
    for (const auto& [guildId, guild] : current.guild.guilds) {
        for (const auto& [memberId, member] : guild.members) {
            if (stableHash(memberId) % config_.intervalTicks != ctx.tick % config_.intervalTicks) {
                continue;
            }

            ai::SituationContext situation(memberId, ctx.tick);
            builder_(current, guild, member, situation);

            auto handle = ctx.dispatcher->requestDecision(memberId, config_.treeId,
                                                          std::move(situation), config_.priority,
                                                          config_.deadline);
            if (!handle) {
                if (handle.error().code() == ErrorCode::DispatcherStopped) {
                    return GameResult<void>::err(std::move(handle).error());
                }
                LogContext lc;
                lc.agentId = memberId;
                lc.tick = ctx.tick;
                foundation::GameLogger::instance().logWithContext(
                    LogLevel::Warning, LogCategory::Runtime,
                    "decision request rejected: " + handle.error().describe(), lc);
                continue;
            }
            ++requests_;
        }
    }
    return GameResult<void>::ok();
}

// ═══════════════════════════════════════════════════════════════════════════
// DecisionApplySystem
// ═══════════════════════════════════════════════════════════════════════════

void DecisionApplySystem::registerEffect(std::string actionId, ActionEffect effect) {
    effects_.insert_or_assign(std::move(actionId), std::move(effect));
}

GameResult<void> DecisionApplySystem::update(TickContext& ctx) {
    for (const auto& resolved : ctx.decisions) {
        const auto& decision = resolved.decision;
        if (resolved.outcome != ai::DecisionOutcome::Completed || decision.fallback) {
            ++skipped_;
            continue;
        }

        ActionExecutedPayload payload;
        payload.agentId = decision.agentId;
        payload.treeId = decision.treeId;
        payload.actionId = decision.actionId;
        payload.score = decision.score;
        payload.tick = ctx.tick;

        auto effect = effects_.find(decision.actionId);
        if (effect != effects_.end() && effect->second) {
            std::optional<state::StateTransaction> tx;
            try {
                tx = effect->second(decision, ctx.state.state());
            } catch (const std::exception& e) {
                LogContext lc;
                lc.agentId = decision.agentId;
                lc.tick = ctx.tick;
                foundation::GameLogger::instance().logWithContext(
                    LogLevel::Error, LogCategory::Runtime,
                    "effect for '" + decision.actionId + "' threw: " + e.what(), lc);
            }
            if (tx && !tx->empty()) {
                auto queued = ctx.state.enqueueTransaction(std::move(*tx), ctx.tick + 1);
                payload.effectQueued = queued.hasValue();
                if (!queued) {
                    GSIM_LOG_WARN(LogCategory::Runtime, queued.error().describe());
                }
            }
        }

        auto e = event::makeEvent("decision_apply", std::string(event::types::kActionExecuted),
                                  std::move(payload), event::EventPriority::Medium);
        e.subject = decision.agentId;
        publishOrWarn(ctx.bus, std::move(e));
        ++applied_;
    }
    return GameResult<void>::ok();
}

}  // namespace gsim::runtime
