#pragma once

/// @file situation_context.hpp
/// @brief The only per-evaluation input to a behavior tree.

#include <cstdint>
#include <map>
#include <optional>
#include <random>
#include <string>
#include <variant>
#include <vector>

namespace gsim::ai {

/// A single piece of world knowledge handed to a tree.
using FactValue = std::variant<bool, int64_t, double, std::string>;

/// Ordered fact map; ordering keeps fingerprints stable.
using FactMap = std::map<std::string, FactValue>;

/// Everything a tree may look at while deciding for one agent.
///
/// Evaluation is pure: two evaluations of the same tree with equal
/// contexts return equal results. Randomness is only available through
/// random(), which is seeded from the context itself.
class SituationContext {
public:
    SituationContext() = default;
    SituationContext(std::string agentId, uint64_t tick);

    [[nodiscard]] const std::string& agentId() const noexcept { return agentId_; }
    [[nodiscard]] uint64_t tick() const noexcept { return tick_; }
    void setTick(uint64_t tick) noexcept { tick_ = tick; }

    // -- Facts ----------------------------------------------------------------

    SituationContext& set(std::string key, FactValue value);
    SituationContext& set(std::string key, bool value);
    SituationContext& set(std::string key, int value);
    SituationContext& set(std::string key, int64_t value);
    SituationContext& set(std::string key, double value);
    SituationContext& set(std::string key, std::string value);
    SituationContext& set(std::string key, const char* value);

    [[nodiscard]] bool has(const std::string& key) const;

    /// Typed fact lookup; nullptr if absent or of another type.
    template <typename T>
    [[nodiscard]] const T* get(const std::string& key) const {
        auto it = facts_.find(key);
        if (it == facts_.end()) {
            return nullptr;
        }
        return std::get_if<T>(&it->second);
    }

    /// Numeric fact as double (int64 or double), or @p fallback.
    [[nodiscard]] double number(const std::string& key, double fallback = 0.0) const;

    /// Boolean fact, or @p fallback.
    [[nodiscard]] bool flag(const std::string& key, bool fallback = false) const;

    [[nodiscard]] const FactMap& facts() const noexcept { return facts_; }

    // -- Randomness -----------------------------------------------------------

    void setSeed(uint64_t seed) { seed_ = seed; }
    [[nodiscard]] const std::optional<uint64_t>& seed() const noexcept { return seed_; }

    /// Fresh generator seeded from the context seed (or zero), so repeated
    /// calls observe the same sequence.
    [[nodiscard]] std::mt19937_64 random() const;

    // -- Fingerprint ----------------------------------------------------------

    /// Restrict the fingerprint to these fact keys. By default every fact
    /// participates.
    void setFingerprintKeys(std::vector<std::string> keys);

    /// Stable 64-bit digest of the situation (selected facts and seed).
    /// The agent id and tick do not participate.
    [[nodiscard]] uint64_t fingerprint() const;

private:
    std::string agentId_;
    uint64_t tick_ = 0;
    FactMap facts_;
    std::optional<uint64_t> seed_;
    std::optional<std::vector<std::string>> fingerprintKeys_;
};

}  // namespace gsim::ai
