#pragma once

/// @file decision_cache.hpp
/// @brief Thread-safe LRU cache of agent decisions with tick-based TTL.

#include "gsim/ai/decision.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace gsim::ai {

/// (agentId, situation fingerprint).
struct DecisionCacheKey {
    std::string agentId;
    uint64_t fingerprint = 0;

    bool operator==(const DecisionCacheKey& other) const = default;
};

struct DecisionCacheKeyHash {
    std::size_t operator()(const DecisionCacheKey& key) const noexcept {
        auto h = std::hash<std::string>{}(key.agentId);
        return h ^ (std::hash<uint64_t>{}(key.fingerprint) + 0x9e3779b97f4a7c15ULL +
                    (h << 6) + (h >> 2));
    }
};

struct DecisionCacheConfig {
    std::size_t maxEntries = 4096;
    uint64_t defaultTtlTicks = kDefaultDecisionTtlTicks;
};

/// Stored entry, as returned by peek().
struct DecisionCacheEntry {
    DecisionCacheKey key;
    Decision decision;
    uint64_t expiresAt = 0;     ///< First tick at which the entry is absent.
    uint64_t writerTaskId = 0;  ///< Task that produced the decision.
};

/// Advisory memo of decisions.
///
/// Written by dispatcher workers on completion, read by the simulation
/// thread. Entries at or past `expiresAt` are treated as absent on every
/// read. Concurrent writes to one key resolve to the highest task id.
///
/// @code
///   DecisionCache cache(DecisionCacheConfig{});
///   cache.put(key, decision, taskId, currentTick);
///   if (auto hit = cache.get(key, currentTick)) { ... }
/// @endcode
class DecisionCache {
public:
    explicit DecisionCache(DecisionCacheConfig config = {});
    ~DecisionCache();

    DecisionCache(const DecisionCache&) = delete;
    DecisionCache& operator=(const DecisionCache&) = delete;
    DecisionCache(DecisionCache&&) noexcept;
    DecisionCache& operator=(DecisionCache&&) noexcept;

    /// Live entry for @p key at tick @p now, or nullopt. Counts hit/miss.
    [[nodiscard]] std::optional<Decision> get(const DecisionCacheKey& key, uint64_t now);

    /// As get() but returns the whole entry and does not touch statistics
    /// or recency.
    [[nodiscard]] std::optional<DecisionCacheEntry> peek(const DecisionCacheKey& key,
                                                         uint64_t now) const;

    /// Store with the default TTL.
    /// @return false if a newer task already wrote this key.
    bool put(const DecisionCacheKey& key, const Decision& decision,
             uint64_t writerTaskId, uint64_t now);

    bool put(const DecisionCacheKey& key, const Decision& decision,
             uint64_t writerTaskId, uint64_t now, uint64_t ttlTicks);

    bool invalidate(const DecisionCacheKey& key);

    /// Drop every entry belonging to @p agentId.
    /// @return Number of entries removed.
    std::size_t invalidateAgent(const std::string& agentId);

    /// Remove entries expired at tick @p now.
    std::size_t purgeExpired(uint64_t now);

    void clear();

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] uint64_t hitCount() const;
    [[nodiscard]] uint64_t missCount() const;
    [[nodiscard]] double hitRate() const;
    [[nodiscard]] const DecisionCacheConfig& config() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace gsim::ai
