#pragma once

/// @file snapshot_store.hpp
/// @brief File-based save slots for StateSnapshot, with retention.
///
/// Reference implementation of the persistence contract: snapshots are
/// encoded by StateCodec and written as
/// `snapshot_<sequence>_<version>_<timestampUs>.bin` under one directory.
/// The sequence grows by one per save and orders list(), loadLatest() and
/// retention. Loaded snapshots are only decoded here; callers verify them
/// through StateManager::restoreFromSnapshot().

#include "gsim/foundation/game_result.hpp"
#include "gsim/state/game_state.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace gsim::state {

struct SnapshotStoreConfig {
    std::filesystem::path directory = "./saves";

    /// Snapshots kept on disk; older ones are pruned after each save.
    uint32_t maxRetained = 10;
};

/// Directory entry for one stored snapshot.
struct SnapshotInfo {
    std::string id;  ///< File stem, accepted by load() and remove().
    uint64_t sequence = 0;
    uint64_t version = 0;
    uint64_t timestampUs = 0;
    std::filesystem::path path;
    std::uintmax_t sizeBytes = 0;
};

/// @code
///   SnapshotStore store({.directory = "./saves"});
///   store.open();
///   store.save(manager.createSnapshot());
///
///   auto latest = store.loadLatest();
///   if (latest.hasValue()) {
///       manager.restoreFromSnapshot(latest.value());
///   }
/// @endcode
///
/// Thread-safe: all operations use internal synchronization.
class SnapshotStore {
public:
    explicit SnapshotStore(SnapshotStoreConfig config);
    ~SnapshotStore();

    SnapshotStore(const SnapshotStore&) = delete;
    SnapshotStore& operator=(const SnapshotStore&) = delete;

    /// Open or create the snapshot directory.
    [[nodiscard]] foundation::GameResult<void> open();

    void close();

    /// @return The stored entry, SnapshotWriteFailed on I/O failure or
    ///         PersistenceError when the store is not open.
    [[nodiscard]] foundation::GameResult<SnapshotInfo> save(const StateSnapshot& snapshot);

    /// @return SnapshotNotFound for an unknown id, SnapshotReadFailed on
    ///         I/O failure, or the StateCodec decode error.
    [[nodiscard]] foundation::GameResult<StateSnapshot> load(const std::string& id) const;

    /// Most recently saved snapshot, whatever its state version.
    [[nodiscard]] foundation::GameResult<StateSnapshot> loadLatest() const;

    /// Stored snapshots in save order, oldest first.
    [[nodiscard]] std::vector<SnapshotInfo> list() const;

    [[nodiscard]] foundation::GameResult<void> remove(const std::string& id);

    [[nodiscard]] std::size_t snapshotCount() const;
    [[nodiscard]] bool isOpen() const;
    [[nodiscard]] const SnapshotStoreConfig& config() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace gsim::state
