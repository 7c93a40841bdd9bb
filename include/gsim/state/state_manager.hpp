#pragma once

/// @file state_manager.hpp
/// @brief Owner of the authoritative GameState: validated updates,
///        compensating transactions, scheduled transactions and snapshots.

#include "gsim/foundation/game_result.hpp"
#include "gsim/state/game_state.hpp"
#include "gsim/state/state_transaction.hpp"
#include "gsim/state/state_validator.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace gsim::event {
class EventBus;
}

namespace gsim::foundation {
class GameJobScheduler;
}

namespace gsim::state {

/// Outcome of one transaction run by applyDueTransactions().
struct AppliedTransaction {
    std::string label;
    uint64_t dueTick = 0;
    bool committed = false;
    uint64_t version = 0;  ///< State version after the commit.
    std::optional<foundation::GameError> error;
};

/// Single-writer state store.
///
/// Every mutation builds a candidate copy, runs the validators and swaps
/// the candidate in only when they pass, so callers never observe a
/// partially applied change. Owned by the simulation thread;
/// enqueueTransaction() may also be called from other threads.
///
/// @code
///   StateManager manager(&bus, &scheduler);
///   StateUpdate update;
///   update.treasuries["g1"] = ResourceAmount{100, 10, 0};
///   auto committed = manager.updateState(update);
///   if (!committed) {
///       auto* report = committed.error().context<ValidationResult>();
///   }
/// @endcode
class StateManager {
public:
    explicit StateManager(event::EventBus* bus = nullptr,
                          foundation::GameJobScheduler* scheduler = nullptr);
    ~StateManager();

    StateManager(const StateManager&) = delete;
    StateManager& operator=(const StateManager&) = delete;

    /// Replace the whole state (world seeding). Keeps @p initial's version,
    /// recomputes the checksum.
    /// @return InvalidState with a ValidationResult context.
    foundation::GameResult<void> initialize(GameState initial);

    /// Merge @p update, validate, commit.
    /// @return The new version, or InvalidState with a ValidationResult
    ///         context (state untouched).
    foundation::GameResult<uint64_t> updateState(const StateUpdate& update);

    /// Apply @p tx in order on a candidate; on failure compensate the
    /// applied operations in reverse order and report TransactionFailed
    /// (TransactionFailure context) or InvalidState (ValidationResult).
    foundation::GameResult<uint64_t> executeTransaction(const StateTransaction& tx);

    /// Queue @p tx for the first applyDueTransactions() call with
    /// tick >= @p dueTick. Same-tick transactions run in enqueue order.
    foundation::GameResult<void> enqueueTransaction(StateTransaction tx, uint64_t dueTick);

    /// Set the current tick and run every due transaction.
    std::vector<AppliedTransaction> applyDueTransactions(uint64_t tick);

    [[nodiscard]] StateSnapshot createSnapshot() const;

    /// Verify and adopt @p snapshot. Fails closed:
    /// CorruptedSnapshot on checksum mismatch, InvalidSnapshot on
    /// structural or validator failure (ValidationResult context).
    foundation::GameResult<void> restoreFromSnapshot(const StateSnapshot& snapshot);

    /// Run the validators against the current state.
    [[nodiscard]] ValidationResult validate() const;

    [[nodiscard]] const GameState& state() const noexcept;
    [[nodiscard]] uint64_t version() const noexcept;
    [[nodiscard]] const std::string& checksum() const noexcept;

    [[nodiscard]] uint64_t currentTick() const noexcept;
    void setCurrentTick(uint64_t tick) noexcept;

    [[nodiscard]] std::size_t pendingTransactions() const;

    /// Register custom validators here.
    [[nodiscard]] ValidatorRegistry& validators() noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace gsim::state
