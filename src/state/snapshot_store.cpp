/// @file snapshot_store.cpp
/// @brief SnapshotStore: StateCodec files on disk with a retention policy.

#include "gsim/state/snapshot_store.hpp"

#include "gsim/foundation/game_logger.hpp"
#include "gsim/state/state_codec.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <mutex>
#include <optional>
#include <regex>
#include <stdexcept>
#include <tuple>

namespace gsim::state {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

namespace {

const std::regex& snapshotNamePattern() {
    static const std::regex pattern(R"(^snapshot_(\d+)_(\d+)_(\d+)$)");
    return pattern;
}

/// Parse "snapshot_<sequence>_<version>_<timestampUs>"; nullopt for
/// foreign names.
std::optional<SnapshotInfo> parseId(const std::string& stem) {
    std::smatch match;
    if (!std::regex_match(stem, match, snapshotNamePattern())) {
        return std::nullopt;
    }
    SnapshotInfo info;
    info.id = stem;
    try {
        info.sequence = std::stoull(match[1].str());
        info.version = std::stoull(match[2].str());
        info.timestampUs = std::stoull(match[3].str());
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
    return info;
}

uint64_t toMicros(SnapshotClock::time_point tp) {
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count();
    return us > 0 ? static_cast<uint64_t>(us) : 0;
}

uint64_t nowMicros() {
    return toMicros(SnapshotClock::now());
}

}  // namespace

// -- Impl -------------------------------------------------------------------

struct SnapshotStore::Impl {
    SnapshotStoreConfig config;
    mutable std::mutex mutex;
    bool open = false;

    explicit Impl(SnapshotStoreConfig cfg) : config(std::move(cfg)) {}

    std::filesystem::path pathFor(const std::string& id) const {
        return config.directory / (id + ".bin");
    }

    /// All snapshot files in save order, oldest first. State versions are
    /// not monotonic across saves: a restore rewinds them.
    std::vector<SnapshotInfo> listSnapshots() const {
        std::vector<SnapshotInfo> out;
        std::error_code ec;
        if (!std::filesystem::exists(config.directory, ec)) {
            return out;
        }

        for (const auto& entry : std::filesystem::directory_iterator(config.directory, ec)) {
            if (!entry.is_regular_file() || entry.path().extension() != ".bin") {
                continue;
            }
            auto info = parseId(entry.path().stem().string());
            if (!info) {
                continue;
            }
            info->path = entry.path();
            std::error_code sizeEc;
            info->sizeBytes = entry.file_size(sizeEc);
            out.push_back(std::move(*info));
        }

        std::sort(out.begin(), out.end(), [](const SnapshotInfo& a, const SnapshotInfo& b) {
            return std::tie(a.sequence, a.timestampUs) < std::tie(b.sequence, b.timestampUs);
        });
        return out;
    }

    void pruneOldSnapshots() {
        auto files = listSnapshots();
        std::size_t excess = files.size() > config.maxRetained
                                 ? files.size() - config.maxRetained
                                 : 0;
        for (std::size_t i = 0; i < excess; ++i) {
            std::error_code ec;
            std::filesystem::remove(files[i].path, ec);
            if (ec) {
                GSIM_LOG_WARN(LogCategory::Persistence,
                              "failed to prune " + files[i].id + ": " + ec.message());
            } else {
                GSIM_LOG_DEBUG(LogCategory::Persistence, "pruned " + files[i].id);
            }
        }
    }

    GameResult<StateSnapshot> readFile(const SnapshotInfo& info) const {
        std::ifstream file(info.path, std::ios::binary);
        if (!file) {
            return GameResult<StateSnapshot>::err(GameError(
                ErrorCode::SnapshotReadFailed, "cannot open snapshot file " + info.id));
        }

        std::error_code ec;
        auto fileSize = std::filesystem::file_size(info.path, ec);
        if (ec) {
            return GameResult<StateSnapshot>::err(GameError(
                ErrorCode::SnapshotReadFailed, "cannot stat " + info.id + ": " + ec.message()));
        }

        std::vector<uint8_t> data(static_cast<std::size_t>(fileSize));
        file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(fileSize));
        if (static_cast<std::uintmax_t>(file.gcount()) < fileSize) {
            return GameResult<StateSnapshot>::err(GameError(
                ErrorCode::SnapshotReadFailed, "snapshot file read incomplete: " + info.id));
        }

        return StateCodec::decodeSnapshot(data);
    }
};

// -- Construction / destruction ----------------------------------------------

SnapshotStore::SnapshotStore(SnapshotStoreConfig config)
    : impl_(std::make_unique<Impl>(std::move(config))) {}

SnapshotStore::~SnapshotStore() {
    if (impl_ && impl_->open) {
        close();
    }
}

// -- Lifecycle ---------------------------------------------------------------

GameResult<void> SnapshotStore::open() {
    std::lock_guard lock(impl_->mutex);

    if (impl_->open) {
        return GameResult<void>::ok();
    }

    std::error_code ec;
    std::filesystem::create_directories(impl_->config.directory, ec);
    if (ec) {
        return GameResult<void>::err(GameError(
            ErrorCode::PersistenceError, "failed to create snapshot directory: " + ec.message()));
    }

    impl_->open = true;
    GSIM_LOG_INFO(LogCategory::Persistence,
                  "snapshot store at " + impl_->config.directory.string());
    return GameResult<void>::ok();
}

void SnapshotStore::close() {
    std::lock_guard lock(impl_->mutex);
    impl_->open = false;
}

// -- Save / Load -------------------------------------------------------------

GameResult<SnapshotInfo> SnapshotStore::save(const StateSnapshot& snapshot) {
    std::lock_guard lock(impl_->mutex);

    if (!impl_->open) {
        return GameResult<SnapshotInfo>::err(
            GameError(ErrorCode::PersistenceError, "snapshot store is not open"));
    }

    auto existing = impl_->listSnapshots();

    SnapshotInfo info;
    info.sequence = existing.empty() ? 1 : existing.back().sequence + 1;
    info.version = snapshot.version;
    info.timestampUs = snapshot.timestamp.time_since_epoch().count() != 0
                           ? toMicros(snapshot.timestamp)
                           : nowMicros();
    info.id = "snapshot_" + std::to_string(info.sequence) + "_" +
              std::to_string(info.version) + "_" + std::to_string(info.timestampUs);
    info.path = impl_->pathFor(info.id);

    auto data = StateCodec::encodeSnapshot(snapshot);
    // Written under a .tmp name, then renamed into place.
    auto tmpPath = info.path;
    tmpPath += ".tmp";

    {
        std::ofstream file(tmpPath, std::ios::binary | std::ios::trunc);
        if (!file) {
            return GameResult<SnapshotInfo>::err(GameError(
                ErrorCode::SnapshotWriteFailed, "cannot open snapshot file for writing"));
        }
        file.write(reinterpret_cast<const char*>(data.data()),
                   static_cast<std::streamsize>(data.size()));
        file.flush();
        if (!file) {
            std::error_code ec;
            std::filesystem::remove(tmpPath, ec);
            return GameResult<SnapshotInfo>::err(
                GameError(ErrorCode::SnapshotWriteFailed, "failed to write snapshot data"));
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmpPath, info.path, ec);
    if (ec) {
        std::error_code rmEc;
        std::filesystem::remove(tmpPath, rmEc);
        return GameResult<SnapshotInfo>::err(GameError(
            ErrorCode::SnapshotWriteFailed, "failed to finalize snapshot: " + ec.message()));
    }
    info.sizeBytes = data.size();

    GSIM_LOG_INFO(LogCategory::Persistence,
                  "saved " + info.id + " (" + std::to_string(info.sizeBytes) + " bytes)");
    impl_->pruneOldSnapshots();
    return GameResult<SnapshotInfo>::ok(std::move(info));
}

GameResult<StateSnapshot> SnapshotStore::load(const std::string& id) const {
    std::lock_guard lock(impl_->mutex);

    auto info = parseId(id);
    if (!info) {
        return GameResult<StateSnapshot>::err(
            GameError(ErrorCode::SnapshotNotFound, "not a snapshot id: '" + id + "'"));
    }
    info->path = impl_->pathFor(id);

    std::error_code ec;
    if (!std::filesystem::is_regular_file(info->path, ec)) {
        return GameResult<StateSnapshot>::err(
            GameError(ErrorCode::SnapshotNotFound, "snapshot '" + id + "' not found"));
    }
    return impl_->readFile(*info);
}

GameResult<StateSnapshot> SnapshotStore::loadLatest() const {
    std::lock_guard lock(impl_->mutex);

    auto files = impl_->listSnapshots();
    if (files.empty()) {
        return GameResult<StateSnapshot>::err(
            GameError(ErrorCode::SnapshotNotFound, "no snapshots found"));
    }
    return impl_->readFile(files.back());
}

std::vector<SnapshotInfo> SnapshotStore::list() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->listSnapshots();
}

GameResult<void> SnapshotStore::remove(const std::string& id) {
    std::lock_guard lock(impl_->mutex);

    if (!parseId(id)) {
        return GameResult<void>::err(
            GameError(ErrorCode::SnapshotNotFound, "not a snapshot id: '" + id + "'"));
    }
    std::error_code ec;
    if (!std::filesystem::remove(impl_->pathFor(id), ec)) {
        if (ec) {
            return GameResult<void>::err(GameError(
                ErrorCode::PersistenceError, "failed to remove '" + id + "': " + ec.message()));
        }
        return GameResult<void>::err(
            GameError(ErrorCode::SnapshotNotFound, "snapshot '" + id + "' not found"));
    }
    return GameResult<void>::ok();
}

// -- Queries -----------------------------------------------------------------

std::size_t SnapshotStore::snapshotCount() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->listSnapshots().size();
}

bool SnapshotStore::isOpen() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->open;
}

const SnapshotStoreConfig& SnapshotStore::config() const noexcept {
    return impl_->config;
}

}  // namespace gsim::state
