/// @file situation_context.cpp
/// @brief SituationContext fact storage and fingerprinting.

#include "gsim/ai/situation_context.hpp"

#include <algorithm>
#include <type_traits>
#include <utility>

namespace gsim::ai {

namespace {

// FNV-1a, 64 bit.
constexpr uint64_t kFnvOffset = 1469598103934665603ULL;
constexpr uint64_t kFnvPrime = 1099511628211ULL;

void mix(uint64_t& h, const void* data, std::size_t size) {
    const auto* bytes = static_cast<const unsigned char*>(data);
    for (std::size_t i = 0; i < size; ++i) {
        h ^= bytes[i];
        h *= kFnvPrime;
    }
}

void mixString(uint64_t& h, const std::string& s) {
    uint64_t len = s.size();
    mix(h, &len, sizeof(len));
    mix(h, s.data(), s.size());
}

void mixFact(uint64_t& h, const std::string& key, const FactValue& value) {
    mixString(h, key);
    auto tag = static_cast<uint8_t>(value.index());
    mix(h, &tag, sizeof(tag));
    std::visit([&h](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            mixString(h, v);
        } else if constexpr (std::is_same_v<T, bool>) {
            uint8_t b = v ? 1 : 0;
            mix(h, &b, sizeof(b));
        } else {
            mix(h, &v, sizeof(v));
        }
    }, value);
}

} // namespace

SituationContext::SituationContext(std::string agentId, uint64_t tick)
    : agentId_(std::move(agentId)), tick_(tick) {}

SituationContext& SituationContext::set(std::string key, FactValue value) {
    facts_[std::move(key)] = std::move(value);
    return *this;
}

SituationContext& SituationContext::set(std::string key, bool value) {
    return set(std::move(key), FactValue(value));
}

SituationContext& SituationContext::set(std::string key, int value) {
    return set(std::move(key), FactValue(static_cast<int64_t>(value)));
}

SituationContext& SituationContext::set(std::string key, int64_t value) {
    return set(std::move(key), FactValue(value));
}

SituationContext& SituationContext::set(std::string key, double value) {
    return set(std::move(key), FactValue(value));
}

SituationContext& SituationContext::set(std::string key, std::string value) {
    return set(std::move(key), FactValue(std::move(value)));
}

SituationContext& SituationContext::set(std::string key, const char* value) {
    return set(std::move(key), FactValue(std::string(value)));
}

bool SituationContext::has(const std::string& key) const {
    return facts_.count(key) > 0;
}

double SituationContext::number(const std::string& key, double fallback) const {
    if (const auto* i = get<int64_t>(key)) {
        return static_cast<double>(*i);
    }
    if (const auto* d = get<double>(key)) {
        return *d;
    }
    return fallback;
}

bool SituationContext::flag(const std::string& key, bool fallback) const {
    if (const auto* b = get<bool>(key)) {
        return *b;
    }
    return fallback;
}

std::mt19937_64 SituationContext::random() const {
    return std::mt19937_64(seed_.value_or(0));
}

void SituationContext::setFingerprintKeys(std::vector<std::string> keys) {
    fingerprintKeys_ = std::move(keys);
}

uint64_t SituationContext::fingerprint() const {
    uint64_t h = kFnvOffset;

    if (fingerprintKeys_) {
        // Sorted copy so that key order in the selection does not matter.
        std::vector<std::string> keys = *fingerprintKeys_;
        std::sort(keys.begin(), keys.end());
        keys.erase(std::unique(keys.begin(), keys.end()), keys.end());
        for (const auto& key : keys) {
            auto it = facts_.find(key);
            if (it != facts_.end()) {
                mixFact(h, it->first, it->second);
            } else {
                // Absent keys still shape the digest.
                mixString(h, key);
                uint8_t absent = 0xFF;
                mix(h, &absent, sizeof(absent));
            }
        }
    } else {
        for (const auto& [key, value] : facts_) {
            mixFact(h, key, value);
        }
    }

    uint8_t hasSeed = seed_ ? 1 : 0;
    mix(h, &hasSeed, sizeof(hasSeed));
    if (seed_) {
        mix(h, &*seed_, sizeof(*seed_));
    }
    return h;
}

}  // namespace gsim::ai
