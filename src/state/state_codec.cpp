/// @file state_codec.cpp
/// @brief Little-endian binary writer/reader for GameState plus SHA-256 via
///        OpenSSL EVP.

#include "gsim/state/state_codec.hpp"

#include "gsim/foundation/game_logger.hpp"
#include "gsim/version.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <chrono>

namespace gsim::state {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;

namespace {

constexpr std::array<uint8_t, 4> kMagic = {'G', 'S', 'I', 'M'};

// ── Writer ──────────────────────────────────────────────────────────────────

class Writer {
public:
    explicit Writer(std::vector<uint8_t>& buf) : buf_(buf) {}

    void u8(uint8_t v) { buf_.push_back(v); }

    void u32(uint32_t v) {
        for (int i = 0; i < 4; ++i) {
            buf_.push_back(static_cast<uint8_t>(v >> (8 * i)));
        }
    }

    void u64(uint64_t v) {
        for (int i = 0; i < 8; ++i) {
            buf_.push_back(static_cast<uint8_t>(v >> (8 * i)));
        }
    }

    void i32(int32_t v) { u32(static_cast<uint32_t>(v)); }
    void i64(int64_t v) { u64(static_cast<uint64_t>(v)); }

    void str(const std::string& s) {
        u32(static_cast<uint32_t>(s.size()));
        buf_.insert(buf_.end(), s.begin(), s.end());
    }

private:
    std::vector<uint8_t>& buf_;
};

// ── Reader ──────────────────────────────────────────────────────────────────

/// Sticky-failure reader: once a read runs past the end every further read
/// fails and ok() stays false.
class Reader {
public:
    explicit Reader(std::span<const uint8_t> data) : data_(data) {}

    [[nodiscard]] bool ok() const noexcept { return ok_; }
    [[nodiscard]] bool atEnd() const noexcept { return pos_ == data_.size(); }
    [[nodiscard]] std::size_t position() const noexcept { return pos_; }

    uint8_t u8() {
        if (!need(1)) return 0;
        return data_[pos_++];
    }

    uint32_t u32() {
        if (!need(4)) return 0;
        uint32_t v = 0;
        for (int i = 0; i < 4; ++i) {
            v |= static_cast<uint32_t>(data_[pos_++]) << (8 * i);
        }
        return v;
    }

    uint64_t u64() {
        if (!need(8)) return 0;
        uint64_t v = 0;
        for (int i = 0; i < 8; ++i) {
            v |= static_cast<uint64_t>(data_[pos_++]) << (8 * i);
        }
        return v;
    }

    int32_t i32() { return static_cast<int32_t>(u32()); }
    int64_t i64() { return static_cast<int64_t>(u64()); }

    std::string str() {
        auto len = u32();
        if (!need(len)) return {};
        std::string s(reinterpret_cast<const char*>(data_.data() + pos_), len);
        pos_ += len;
        return s;
    }

    /// Element count for a following sequence; each element takes at least
    /// @p minElementSize bytes, which bounds allocations on garbage input.
    uint32_t count(std::size_t minElementSize) {
        auto n = u32();
        if (ok_ && minElementSize > 0 && n > (data_.size() - pos_) / minElementSize) {
            ok_ = false;
            return 0;
        }
        return n;
    }

private:
    bool need(std::size_t n) {
        if (!ok_ || n > data_.size() - pos_) {
            ok_ = false;
            return false;
        }
        return true;
    }

    std::span<const uint8_t> data_;
    std::size_t pos_ = 0;
    bool ok_ = true;
};

// ── State body ──────────────────────────────────────────────────────────────

void writeBody(Writer& w, const GameState& s) {
    w.u64(s.version);
    w.u64(s.tick);

    w.u32(static_cast<uint32_t>(s.guild.guilds.size()));
    for (const auto& [id, g] : s.guild.guilds) {
        w.str(id);
        w.str(g.name);
        w.u32(g.maxMembers);
        w.i64(g.reputation);
        w.u32(static_cast<uint32_t>(g.members.size()));
        for (const auto& [memberId, m] : g.members) {
            w.str(memberId);
            w.str(m.name);
            w.u8(static_cast<uint8_t>(m.role));
            w.i32(m.level);
            w.i32(m.satisfaction);
        }
    }

    w.u32(static_cast<uint32_t>(s.combat.battles.size()));
    for (const auto& [id, b] : s.combat.battles) {
        w.str(id);
        w.str(b.guildId);
        w.u32(static_cast<uint32_t>(b.participants.size()));
        for (const auto& p : b.participants) {
            w.str(p);
        }
        w.u8(static_cast<uint8_t>(b.phase));
        w.u32(b.round);
    }

    w.u32(static_cast<uint32_t>(s.economy.treasuries.size()));
    for (const auto& [guildId, r] : s.economy.treasuries) {
        w.str(guildId);
        w.i64(r.gold);
        w.i64(r.materials);
        w.i64(r.influence);
    }
    w.u32(static_cast<uint32_t>(s.economy.marketPrices.size()));
    for (const auto& [item, price] : s.economy.marketPrices) {
        w.str(item);
        w.i64(price);
    }

    w.u32(static_cast<uint32_t>(s.social.relationships.size()));
    for (const auto& [key, rel] : s.social.relationships) {
        w.str(key);
        w.str(rel.from);
        w.str(rel.to);
        w.i32(rel.affinity);
    }
}

bool readBody(Reader& r, GameState& s) {
    s.version = r.u64();
    s.tick = r.u64();

    auto guildCount = r.count(4 + 4 + 4 + 8 + 4);
    for (uint32_t i = 0; i < guildCount && r.ok(); ++i) {
        Guild g;
        g.id = r.str();
        g.name = r.str();
        g.maxMembers = r.u32();
        g.reputation = r.i64();
        auto memberCount = r.count(4 + 4 + 1 + 4 + 4);
        for (uint32_t j = 0; j < memberCount && r.ok(); ++j) {
            GuildMember m;
            m.id = r.str();
            m.name = r.str();
            auto role = r.u8();
            if (role > static_cast<uint8_t>(GuildRole::Recruit)) {
                return false;
            }
            m.role = static_cast<GuildRole>(role);
            m.level = r.i32();
            m.satisfaction = r.i32();
            g.members.emplace(m.id, std::move(m));
        }
        s.guild.guilds.emplace(g.id, std::move(g));
    }

    auto battleCount = r.count(4 + 4 + 4 + 1 + 4);
    for (uint32_t i = 0; i < battleCount && r.ok(); ++i) {
        Battle b;
        b.id = r.str();
        b.guildId = r.str();
        auto participantCount = r.count(4);
        for (uint32_t j = 0; j < participantCount && r.ok(); ++j) {
            b.participants.push_back(r.str());
        }
        auto phase = r.u8();
        if (phase > static_cast<uint8_t>(BattlePhase::Resolved)) {
            return false;
        }
        b.phase = static_cast<BattlePhase>(phase);
        b.round = r.u32();
        s.combat.battles.emplace(b.id, std::move(b));
    }

    auto treasuryCount = r.count(4 + 8 * 3);
    for (uint32_t i = 0; i < treasuryCount && r.ok(); ++i) {
        auto guildId = r.str();
        ResourceAmount amount;
        amount.gold = r.i64();
        amount.materials = r.i64();
        amount.influence = r.i64();
        s.economy.treasuries.emplace(std::move(guildId), amount);
    }
    auto priceCount = r.count(4 + 8);
    for (uint32_t i = 0; i < priceCount && r.ok(); ++i) {
        auto item = r.str();
        auto price = r.i64();
        s.economy.marketPrices.emplace(std::move(item), price);
    }

    auto relCount = r.count(4 * 3 + 4);
    for (uint32_t i = 0; i < relCount && r.ok(); ++i) {
        auto key = r.str();
        Relationship rel;
        rel.from = r.str();
        rel.to = r.str();
        rel.affinity = r.i32();
        s.social.relationships.emplace(std::move(key), std::move(rel));
    }

    return r.ok();
}

GameResult<StateSnapshot> corrupted(const std::string& what, std::size_t offset) {
    return GameResult<StateSnapshot>::err(GameError(
        ErrorCode::CorruptedSnapshot, what + " at byte " + std::to_string(offset)));
}

}  // namespace

// ── Checksum ────────────────────────────────────────────────────────────────

std::string sha256Hex(std::span<const uint8_t> bytes) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;

    auto* ctx = EVP_MD_CTX_new();
    if (ctx == nullptr) {
        GSIM_LOG_ERROR(foundation::LogCategory::State, "EVP_MD_CTX_new failed");
        return {};
    }
    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx, bytes.data(), bytes.size()) != 1 ||
        EVP_DigestFinal_ex(ctx, digest, &digestLen) != 1) {
        EVP_MD_CTX_free(ctx);
        GSIM_LOG_ERROR(foundation::LogCategory::State, "SHA-256 digest failed");
        return {};
    }
    EVP_MD_CTX_free(ctx);

    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(digestLen * 2);
    for (unsigned int i = 0; i < digestLen; ++i) {
        out.push_back(kHex[digest[i] >> 4]);
        out.push_back(kHex[digest[i] & 0x0F]);
    }
    return out;
}

// ── StateCodec ──────────────────────────────────────────────────────────────

std::vector<uint8_t> StateCodec::encodeState(const GameState& state) {
    std::vector<uint8_t> buf;
    Writer w(buf);
    writeBody(w, state);
    return buf;
}

std::string StateCodec::computeChecksum(const GameState& state) {
    auto bytes = encodeState(state);
    return sha256Hex(bytes);
}

std::vector<uint8_t> StateCodec::encodeSnapshot(const StateSnapshot& snapshot) {
    std::vector<uint8_t> buf;
    buf.insert(buf.end(), kMagic.begin(), kMagic.end());

    Writer w(buf);
    w.u32(Version::stateFormat);
    w.str(snapshot.id);
    w.i64(std::chrono::duration_cast<std::chrono::microseconds>(
              snapshot.timestamp.time_since_epoch())
              .count());
    w.u64(snapshot.version);
    w.str(snapshot.checksum);
    w.str(snapshot.state.checksum);
    writeBody(w, snapshot.state);
    return buf;
}

GameResult<StateSnapshot> StateCodec::decodeSnapshot(std::span<const uint8_t> bytes) {
    if (bytes.size() < kMagic.size() ||
        !std::equal(kMagic.begin(), kMagic.end(), bytes.begin())) {
        return corrupted("bad magic", 0);
    }

    Reader r(bytes.subspan(kMagic.size()));
    auto format = r.u32();
    if (!r.ok()) {
        return corrupted("truncated header", kMagic.size());
    }
    if (format != Version::stateFormat) {
        return GameResult<StateSnapshot>::err(GameError(
            ErrorCode::InvalidSnapshot,
            "unsupported state format " + std::to_string(format) + " (expected " +
                std::to_string(Version::stateFormat) + ")"));
    }

    StateSnapshot snap;
    snap.id = r.str();
    auto timestampUs = r.i64();
    snap.timestamp = SnapshotClock::time_point(
        std::chrono::duration_cast<SnapshotClock::duration>(
            std::chrono::microseconds(timestampUs)));
    snap.version = r.u64();
    snap.checksum = r.str();
    snap.state.checksum = r.str();
    if (!r.ok()) {
        return corrupted("truncated header", kMagic.size() + r.position());
    }

    if (!readBody(r, snap.state)) {
        return corrupted("malformed state body", kMagic.size() + r.position());
    }
    if (!r.atEnd()) {
        return corrupted("trailing bytes", kMagic.size() + r.position());
    }
    return GameResult<StateSnapshot>::ok(std::move(snap));
}

}  // namespace gsim::state
