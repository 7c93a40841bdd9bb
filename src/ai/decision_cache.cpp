/// @file decision_cache.cpp
/// @brief DecisionCache implementation using a doubly-linked list + hash map
///        for O(1) LRU eviction and lookup.

#include "gsim/ai/decision_cache.hpp"

#include <atomic>
#include <list>
#include <mutex>
#include <unordered_map>

namespace gsim::ai {

// ── Impl ────────────────────────────────────────────────────────────────────

struct DecisionCache::Impl {
    DecisionCacheConfig config;

    // Front = most recently used.
    std::list<DecisionCacheEntry> lruList;
    std::unordered_map<DecisionCacheKey, std::list<DecisionCacheEntry>::iterator,
                       DecisionCacheKeyHash> index;

    mutable std::mutex mutex;

    std::atomic<uint64_t> hits{0};
    std::atomic<uint64_t> misses{0};

    void touch(std::list<DecisionCacheEntry>::iterator it) {
        lruList.splice(lruList.begin(), lruList, it);
    }

    void erase(std::list<DecisionCacheEntry>::iterator it) {
        index.erase(it->key);
        lruList.erase(it);
    }

    void evictLru() {
        if (!lruList.empty()) {
            erase(std::prev(lruList.end()));
        }
    }
};

// ── Construction / destruction / move ───────────────────────────────────────

DecisionCache::DecisionCache(DecisionCacheConfig config)
    : impl_(std::make_unique<Impl>()) {
    impl_->config = config;
}

DecisionCache::~DecisionCache() = default;

DecisionCache::DecisionCache(DecisionCache&&) noexcept = default;
DecisionCache& DecisionCache::operator=(DecisionCache&&) noexcept = default;

// ── get() / peek() ──────────────────────────────────────────────────────────

std::optional<Decision> DecisionCache::get(const DecisionCacheKey& key, uint64_t now) {
    std::lock_guard lock(impl_->mutex);

    auto it = impl_->index.find(key);
    if (it == impl_->index.end()) {
        impl_->misses.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    }

    auto listIt = it->second;
    if (listIt->expiresAt <= now) {
        impl_->erase(listIt);
        impl_->misses.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    }

    impl_->touch(listIt);
    impl_->hits.fetch_add(1, std::memory_order_relaxed);
    return listIt->decision;
}

std::optional<DecisionCacheEntry> DecisionCache::peek(const DecisionCacheKey& key,
                                                      uint64_t now) const {
    std::lock_guard lock(impl_->mutex);
    auto it = impl_->index.find(key);
    if (it == impl_->index.end() || it->second->expiresAt <= now) {
        return std::nullopt;
    }
    return *it->second;
}

// ── put() ───────────────────────────────────────────────────────────────────

bool DecisionCache::put(const DecisionCacheKey& key, const Decision& decision,
                        uint64_t writerTaskId, uint64_t now) {
    return put(key, decision, writerTaskId, now, impl_->config.defaultTtlTicks);
}

bool DecisionCache::put(const DecisionCacheKey& key, const Decision& decision,
                        uint64_t writerTaskId, uint64_t now, uint64_t ttlTicks) {
    if (impl_->config.maxEntries == 0 || ttlTicks == 0) {
        return false;
    }

    std::lock_guard lock(impl_->mutex);

    auto it = impl_->index.find(key);
    if (it != impl_->index.end()) {
        auto listIt = it->second;
        // Last writer wins, ordered by task id rather than arrival.
        if (listIt->writerTaskId > writerTaskId && listIt->expiresAt > now) {
            return false;
        }
        listIt->decision = decision;
        listIt->expiresAt = now + ttlTicks;
        listIt->writerTaskId = writerTaskId;
        impl_->touch(listIt);
        return true;
    }

    if (impl_->lruList.size() >= impl_->config.maxEntries) {
        impl_->evictLru();
    }

    DecisionCacheEntry entry;
    entry.key = key;
    entry.decision = decision;
    entry.expiresAt = now + ttlTicks;
    entry.writerTaskId = writerTaskId;

    impl_->lruList.push_front(std::move(entry));
    impl_->index[key] = impl_->lruList.begin();
    return true;
}

// ── invalidate ──────────────────────────────────────────────────────────────

bool DecisionCache::invalidate(const DecisionCacheKey& key) {
    std::lock_guard lock(impl_->mutex);
    auto it = impl_->index.find(key);
    if (it == impl_->index.end()) {
        return false;
    }
    impl_->erase(it->second);
    return true;
}

std::size_t DecisionCache::invalidateAgent(const std::string& agentId) {
    std::lock_guard lock(impl_->mutex);
    std::size_t count = 0;
    for (auto it = impl_->lruList.begin(); it != impl_->lruList.end();) {
        if (it->key.agentId == agentId) {
            impl_->index.erase(it->key);
            it = impl_->lruList.erase(it);
            ++count;
        } else {
            ++it;
        }
    }
    return count;
}

std::size_t DecisionCache::purgeExpired(uint64_t now) {
    std::lock_guard lock(impl_->mutex);
    std::size_t count = 0;
    for (auto it = impl_->lruList.begin(); it != impl_->lruList.end();) {
        if (it->expiresAt <= now) {
            impl_->index.erase(it->key);
            it = impl_->lruList.erase(it);
            ++count;
        } else {
            ++it;
        }
    }
    return count;
}

void DecisionCache::clear() {
    std::lock_guard lock(impl_->mutex);
    impl_->lruList.clear();
    impl_->index.clear();
}

// ── Accessors ───────────────────────────────────────────────────────────────

std::size_t DecisionCache::size() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->lruList.size();
}

uint64_t DecisionCache::hitCount() const {
    return impl_->hits.load(std::memory_order_relaxed);
}

uint64_t DecisionCache::missCount() const {
    return impl_->misses.load(std::memory_order_relaxed);
}

double DecisionCache::hitRate() const {
    auto h = impl_->hits.load(std::memory_order_relaxed);
    auto m = impl_->misses.load(std::memory_order_relaxed);
    auto total = h + m;
    if (total == 0) {
        return 0.0;
    }
    return static_cast<double>(h) / static_cast<double>(total);
}

const DecisionCacheConfig& DecisionCache::config() const noexcept {
    return impl_->config;
}

}  // namespace gsim::ai
