/// @file state_validator.cpp
/// @brief ValidatorRegistry and the built-in state validators.

#include "gsim/state/state_validator.hpp"

#include "gsim/foundation/game_logger.hpp"
#include "gsim/foundation/job_scheduler.hpp"

#include <algorithm>
#include <exception>
#include <map>
#include <set>
#include <sstream>

namespace gsim::state {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

// ── ValidationResult ────────────────────────────────────────────────────────

bool ValidationResult::hasViolation(std::string_view validator) const {
    return std::any_of(violations.begin(), violations.end(),
                       [&](const ValidationViolation& v) { return v.validator == validator; });
}

std::string ValidationResult::summary() const {
    constexpr std::size_t kMaxListed = 5;
    std::ostringstream out;
    for (std::size_t i = 0; i < violations.size() && i < kMaxListed; ++i) {
        if (i > 0) {
            out << "; ";
        }
        out << violations[i].validator << ": " << violations[i].path << " "
            << violations[i].message;
    }
    if (violations.size() > kMaxListed) {
        out << "; (+" << (violations.size() - kMaxListed) << " more)";
    }
    return out.str();
}

// ── Built-ins ───────────────────────────────────────────────────────────────

namespace {

using Violations = std::vector<ValidationViolation>;

std::string guildPath(const std::string& guildId) {
    return "guild.guilds[" + guildId + "]";
}

Violations checkMemberCount(const GameState& s) {
    const std::string name(validators::kGuildMemberCount);
    Violations out;
    for (const auto& [id, g] : s.guild.guilds) {
        if (id != g.id) {
            out.push_back({name, guildPath(id), "key does not match id '" + g.id + "'"});
        }
        if (g.maxMembers == 0) {
            out.push_back({name, guildPath(id), "maxMembers must be positive"});
        }
        if (g.members.size() > g.maxMembers) {
            out.push_back({name, guildPath(id) + ".members",
                           std::to_string(g.members.size()) + " members exceed capacity " +
                               std::to_string(g.maxMembers)});
        }
        for (const auto& [memberId, m] : g.members) {
            auto path = guildPath(id) + ".members[" + memberId + "]";
            if (memberId != m.id) {
                out.push_back({name, path, "key does not match id '" + m.id + "'"});
            }
            if (m.level < 1) {
                out.push_back({name, path, "level must be at least 1"});
            }
            if (m.satisfaction < 0 || m.satisfaction > 100) {
                out.push_back({name, path,
                               "satisfaction " + std::to_string(m.satisfaction) +
                                   " outside 0..100"});
            }
        }
    }
    return out;
}

Violations checkNonNegative(const GameState& s) {
    const std::string name(validators::kEconomyNonNegative);
    Violations out;
    for (const auto& [guildId, r] : s.economy.treasuries) {
        auto path = "economy.treasuries[" + guildId + "]";
        if (r.gold < 0) {
            out.push_back({name, path + ".gold", "negative: " + std::to_string(r.gold)});
        }
        if (r.materials < 0) {
            out.push_back({name, path + ".materials",
                           "negative: " + std::to_string(r.materials)});
        }
        if (r.influence < 0) {
            out.push_back({name, path + ".influence",
                           "negative: " + std::to_string(r.influence)});
        }
    }
    for (const auto& [item, price] : s.economy.marketPrices) {
        if (price < 0) {
            out.push_back({name, "economy.marketPrices[" + item + "]",
                           "negative: " + std::to_string(price)});
        }
    }
    return out;
}

Violations checkSingleLeader(const GameState& s) {
    const std::string name(validators::kGuildSingleLeader);
    Violations out;
    for (const auto& [id, g] : s.guild.guilds) {
        if (g.members.empty()) {
            continue;
        }
        auto leaders = std::count_if(g.members.begin(), g.members.end(), [](const auto& kv) {
            return kv.second.role == GuildRole::Leader;
        });
        if (leaders != 1) {
            out.push_back({name, guildPath(id),
                           "expected exactly one leader, found " + std::to_string(leaders)});
        }
    }
    return out;
}

Violations checkCrossConsistency(const GameState& s) {
    const std::string name(validators::kCrossConsistency);
    Violations out;
    for (const auto& entry : s.economy.treasuries) {
        if (s.guild.guilds.count(entry.first) == 0) {
            out.push_back({name, "economy.treasuries[" + entry.first + "]", "unknown guild"});
        }
    }
    for (const auto& [battleId, b] : s.combat.battles) {
        auto path = "combat.battles[" + battleId + "]";
        if (battleId != b.id) {
            out.push_back({name, path, "key does not match id '" + b.id + "'"});
        }
        auto guild = s.guild.guilds.find(b.guildId);
        if (guild == s.guild.guilds.end()) {
            out.push_back({name, path, "unknown guild '" + b.guildId + "'"});
            continue;
        }
        for (const auto& p : b.participants) {
            if (guild->second.members.count(p) == 0) {
                out.push_back({name, path + ".participants",
                               "'" + p + "' is not a member of " + b.guildId});
            }
        }
    }
    return out;
}

Violations checkAffinityRange(const GameState& s) {
    const std::string name(validators::kSocialAffinity);
    Violations out;
    for (const auto& [key, rel] : s.social.relationships) {
        auto path = "social.relationships[" + key + "]";
        if (key != relationshipKey(rel.from, rel.to)) {
            out.push_back({name, path, "key does not match from|to"});
        }
        if (rel.from.empty() || rel.to.empty() || rel.from == rel.to) {
            out.push_back({name, path, "endpoints must be two distinct ids"});
        }
        if (rel.affinity < -100 || rel.affinity > 100) {
            out.push_back({name, path + ".affinity",
                           std::to_string(rel.affinity) + " outside -100..100"});
        }
    }
    return out;
}

/// Run one check, turning an escaping exception into a violation.
Violations runCheck(const ValidatorDef& def, const GameState& state) {
    try {
        return def.check(state);
    } catch (const std::exception& e) {
        GSIM_LOG_ERROR(LogCategory::State, "validator " + def.name + " threw: " + e.what());
        return {{def.name, "", std::string("validator threw: ") + e.what()}};
    } catch (...) {
        GSIM_LOG_ERROR(LogCategory::State, "validator " + def.name + " threw");
        return {{def.name, "", "validator threw a non-standard exception"}};
    }
}

}  // namespace

// ── Impl ────────────────────────────────────────────────────────────────────

struct ValidatorRegistry::Impl {
    struct Entry {
        ValidatorDef def;
        std::size_t level = 0;
    };

    std::map<std::string, Entry> entries;

    std::vector<std::vector<const Entry*>> grouped() const {
        std::vector<std::vector<const Entry*>> out;
        for (const auto& [name, entry] : entries) {
            if (out.size() <= entry.level) {
                out.resize(entry.level + 1);
            }
            out[entry.level].push_back(&entry);  // map order keeps names sorted
        }
        return out;
    }
};

ValidatorRegistry::ValidatorRegistry() : impl_(std::make_unique<Impl>()) {}
ValidatorRegistry::~ValidatorRegistry() = default;
ValidatorRegistry::ValidatorRegistry(ValidatorRegistry&&) noexcept = default;
ValidatorRegistry& ValidatorRegistry::operator=(ValidatorRegistry&&) noexcept = default;

ValidatorRegistry ValidatorRegistry::withBuiltins() {
    ValidatorRegistry registry;
    const std::string memberCount(validators::kGuildMemberCount);

    // Built-ins are well formed; add() cannot fail for them.
    (void)registry.add({memberCount, {}, checkMemberCount});
    (void)registry.add({std::string(validators::kEconomyNonNegative), {}, checkNonNegative});
    (void)registry.add({std::string(validators::kSocialAffinity), {}, checkAffinityRange});
    (void)registry.add(
        {std::string(validators::kGuildSingleLeader), {memberCount}, checkSingleLeader});
    (void)registry.add(
        {std::string(validators::kCrossConsistency), {memberCount}, checkCrossConsistency});
    return registry;
}

GameResult<void> ValidatorRegistry::add(ValidatorDef def) {
    if (def.name.empty() || !def.check) {
        return GameResult<void>::err(
            GameError(ErrorCode::InvalidArgument, "validator needs a name and a check"));
    }
    if (impl_->entries.count(def.name) != 0) {
        return GameResult<void>::err(
            GameError(ErrorCode::AlreadyExists, "validator '" + def.name + "' exists"));
    }

    std::size_t level = 0;
    for (const auto& dep : def.dependsOn) {
        auto it = impl_->entries.find(dep);
        if (it == impl_->entries.end()) {
            return GameResult<void>::err(GameError(
                ErrorCode::NotFound,
                "validator '" + def.name + "' depends on unknown '" + dep + "'"));
        }
        level = std::max(level, it->second.level + 1);
    }

    auto name = def.name;
    impl_->entries.emplace(std::move(name), Impl::Entry{std::move(def), level});
    return GameResult<void>::ok();
}

ValidationResult ValidatorRegistry::run(const GameState& state,
                                        foundation::GameJobScheduler* scheduler) const {
    ValidationResult result;
    std::set<std::string> blocked;  // failed or skipped

    for (const auto& level : impl_->grouped()) {
        std::vector<const Impl::Entry*> runnable;
        for (const auto* entry : level) {
            bool depBlocked = std::any_of(
                entry->def.dependsOn.begin(), entry->def.dependsOn.end(),
                [&](const std::string& dep) { return blocked.count(dep) != 0; });
            if (depBlocked) {
                result.skipped.push_back(entry->def.name);
                blocked.insert(entry->def.name);
            } else {
                runnable.push_back(entry);
            }
        }

        std::vector<Violations> found(runnable.size());
        std::vector<bool> done(runnable.size(), false);

        if (scheduler != nullptr && runnable.size() > 1) {
            std::vector<std::pair<std::size_t, foundation::GameJobScheduler::JobId>> jobs;
            for (std::size_t i = 0; i < runnable.size(); ++i) {
                const auto* entry = runnable[i];
                auto* slot = &found[i];
                auto id = scheduler->schedule(
                    [entry, slot, &state] { *slot = runCheck(entry->def, state); },
                    foundation::JobPriority::High);
                if (id) {
                    jobs.emplace_back(i, id.value());
                }
            }
            for (const auto& [index, id] : jobs) {
                auto waited = scheduler->wait(id);
                if (waited) {
                    done[index] = true;
                } else {
                    GSIM_LOG_WARN(LogCategory::State,
                                  "validator job failed, rerunning inline: " +
                                      waited.error().describe());
                }
            }
        }

        // Inline path, and the fallback for anything the pool did not run.
        for (std::size_t i = 0; i < runnable.size(); ++i) {
            if (!done[i]) {
                found[i] = runCheck(runnable[i]->def, state);
            }
        }

        for (std::size_t i = 0; i < runnable.size(); ++i) {
            const auto& name = runnable[i]->def.name;
            result.executed.push_back(name);
            if (!found[i].empty()) {
                blocked.insert(name);
                result.violations.insert(result.violations.end(),
                                         std::make_move_iterator(found[i].begin()),
                                         std::make_move_iterator(found[i].end()));
            }
        }
    }

    return result;
}

std::vector<std::vector<std::string>> ValidatorRegistry::levels() const {
    std::vector<std::vector<std::string>> out;
    for (const auto& level : impl_->grouped()) {
        auto& names = out.emplace_back();
        for (const auto* entry : level) {
            names.push_back(entry->def.name);
        }
    }
    return out;
}

std::size_t ValidatorRegistry::size() const {
    return impl_->entries.size();
}

}  // namespace gsim::state
