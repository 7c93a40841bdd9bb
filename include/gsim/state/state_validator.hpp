#pragma once

/// @file state_validator.hpp
/// @brief Named state validators with dependencies, executed level by level
///        (optionally in parallel on the worker pool).

#include "gsim/foundation/game_result.hpp"
#include "gsim/state/game_state.hpp"

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace gsim::foundation {
class GameJobScheduler;
}

namespace gsim::state {

namespace validators {
inline constexpr std::string_view kGuildMemberCount   = "guild.member_count";
inline constexpr std::string_view kEconomyNonNegative = "economy.non_negative";
inline constexpr std::string_view kGuildSingleLeader  = "guild.single_leader";
inline constexpr std::string_view kCrossConsistency   = "cross.consistency";
inline constexpr std::string_view kSocialAffinity     = "social.affinity_range";
}  // namespace validators

struct ValidationViolation {
    std::string validator;
    std::string path;     ///< e.g. "guild.guilds[g1].members"
    std::string message;
};

/// Aggregated outcome of one validation run. Attached as the error context
/// of InvalidState / InvalidSnapshot failures.
struct ValidationResult {
    std::vector<ValidationViolation> violations;
    std::vector<std::string> skipped;  ///< Validators whose dependency failed.
    std::vector<std::string> executed;

    [[nodiscard]] bool ok() const noexcept { return violations.empty(); }

    [[nodiscard]] bool hasViolation(std::string_view validator) const;

    /// "validator: message; ..." capped to the first few violations.
    [[nodiscard]] std::string summary() const;
};

using ValidatorCheck = std::function<std::vector<ValidationViolation>(const GameState&)>;

struct ValidatorDef {
    std::string name;
    std::vector<std::string> dependsOn;
    ValidatorCheck check;
};

/// Validators grouped into dependency levels. Level 0 has no dependencies;
/// every validator sits one level above its deepest dependency.
class ValidatorRegistry {
public:
    ValidatorRegistry();
    ~ValidatorRegistry();

    ValidatorRegistry(const ValidatorRegistry&) = delete;
    ValidatorRegistry& operator=(const ValidatorRegistry&) = delete;
    ValidatorRegistry(ValidatorRegistry&&) noexcept;
    ValidatorRegistry& operator=(ValidatorRegistry&&) noexcept;

    /// Registry pre-loaded with the five built-in validators.
    [[nodiscard]] static ValidatorRegistry withBuiltins();

    /// @return InvalidArgument for an empty name or missing check,
    ///         AlreadyExists for a duplicate name, NotFound for an
    ///         unregistered dependency.
    foundation::GameResult<void> add(ValidatorDef def);

    /// Run every validator against @p state. With a @p scheduler, each
    /// level with more than one validator is fanned out on the pool and
    /// joined before the next level starts. A validator whose dependency
    /// reported violations (or was itself skipped) is skipped.
    [[nodiscard]] ValidationResult run(const GameState& state,
                                       foundation::GameJobScheduler* scheduler = nullptr) const;

    /// Validator names per level, each level sorted by name.
    [[nodiscard]] std::vector<std::vector<std::string>> levels() const;

    [[nodiscard]] std::size_t size() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace gsim::state
