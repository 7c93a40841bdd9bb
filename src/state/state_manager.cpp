/// @file state_manager.cpp
/// @brief StateManager: candidate-copy commits, compensation, snapshots.

#include "gsim/state/state_manager.hpp"

#include "gsim/event/event_bus.hpp"
#include "gsim/event/event_types.hpp"
#include "gsim/foundation/game_logger.hpp"
#include "gsim/state/state_codec.hpp"

#include <atomic>
#include <exception>
#include <limits>
#include <map>
#include <mutex>
#include <utility>

namespace gsim::state {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

namespace {

constexpr std::string_view kSource = "state_manager";

/// Outcome of one apply() call, exceptions folded in.
GameResult<void> runApply(const Operation& op, GameState& candidate) {
    if (!op.apply) {
        return GameResult<void>::err(
            GameError(ErrorCode::InvalidArgument, "operation '" + op.name + "' has no apply"));
    }
    try {
        return op.apply(candidate);
    } catch (const std::exception& e) {
        return GameResult<void>::err(GameError(
            ErrorCode::TransactionFailed, "operation '" + op.name + "' threw: " + e.what()));
    } catch (...) {
        return GameResult<void>::err(GameError(
            ErrorCode::TransactionFailed, "operation '" + op.name + "' threw"));
    }
}

}  // namespace

// ── Impl ────────────────────────────────────────────────────────────────────

struct StateManager::Impl {
    event::EventBus* bus = nullptr;
    foundation::GameJobScheduler* scheduler = nullptr;
    ValidatorRegistry validators = ValidatorRegistry::withBuiltins();

    GameState current;
    std::atomic<uint64_t> tick{0};

    // Keyed by (dueTick, sequence): FIFO within a tick.
    std::map<std::pair<uint64_t, uint64_t>, StateTransaction> pending;
    uint64_t nextSequence = 0;
    mutable std::mutex pendingMutex;

    void publish(std::string_view type, event::EventPriority priority, std::string reason) {
        if (bus == nullptr) {
            return;
        }
        event::StateChangedPayload payload{current.version, current.tick, current.checksum,
                                           std::move(reason)};
        auto published = bus->publish(
            event::makeEvent(std::string(kSource), std::string(type), payload, priority));
        if (!published) {
            GSIM_LOG_WARN(LogCategory::State,
                          "state notification dropped: " + published.error().describe());
        }
    }

    /// Validate @p candidate; on success stamp it and make it current.
    GameResult<uint64_t> commit(GameState candidate, std::string reason) {
        auto report = validators.run(candidate, scheduler);
        if (!report.ok()) {
            auto message = report.summary();
            LogContext ctx;
            ctx.tick = tick.load(std::memory_order_relaxed);
            ctx.extra["reason"] = reason;
            foundation::GameLogger::instance().logWithContext(
                LogLevel::Info, LogCategory::State, "rejected: " + message, ctx);
            return GameResult<uint64_t>::err(
                GameError(ErrorCode::InvalidState, std::move(message), std::move(report)));
        }

        candidate.version = current.version + 1;
        candidate.tick = tick.load(std::memory_order_relaxed);
        candidate.checksum = StateCodec::computeChecksum(candidate);
        current = std::move(candidate);

        GSIM_LOG_DEBUG(LogCategory::State,
                       "committed v" + std::to_string(current.version) + " (" + reason + ")");
        publish(event::types::kStateCommitted, event::EventPriority::Medium, std::move(reason));
        return GameResult<uint64_t>::ok(current.version);
    }
};

StateManager::StateManager(event::EventBus* bus, foundation::GameJobScheduler* scheduler)
    : impl_(std::make_unique<Impl>()) {
    impl_->bus = bus;
    impl_->scheduler = scheduler;
    impl_->current.checksum = StateCodec::computeChecksum(impl_->current);
}

StateManager::~StateManager() = default;

// ── Mutation ────────────────────────────────────────────────────────────────

GameResult<void> StateManager::initialize(GameState initial) {
    auto report = impl_->validators.run(initial, impl_->scheduler);
    if (!report.ok()) {
        auto message = report.summary();
        return GameResult<void>::err(
            GameError(ErrorCode::InvalidState, std::move(message), std::move(report)));
    }
    initial.checksum = StateCodec::computeChecksum(initial);
    impl_->current = std::move(initial);
    GSIM_LOG_INFO(LogCategory::State,
                  "initialized at v" + std::to_string(impl_->current.version) + " with " +
                      std::to_string(impl_->current.guild.guilds.size()) + " guild(s)");
    return GameResult<void>::ok();
}

GameResult<uint64_t> StateManager::updateState(const StateUpdate& update) {
    GameState candidate = impl_->current;
    applyUpdate(candidate, update);
    return impl_->commit(std::move(candidate), "update");
}

GameResult<uint64_t> StateManager::executeTransaction(const StateTransaction& tx) {
    GameState candidate = impl_->current;
    const auto& ops = tx.operations();

    for (std::size_t i = 0; i < ops.size(); ++i) {
        auto applied = runApply(ops[i], candidate);
        if (applied) {
            continue;
        }

        // Compensate in reverse order. The candidate is discarded either
        // way; rollbacks keep side effects of custom operations paired.
        std::size_t rolledBack = 0;
        for (std::size_t j = i; j-- > 0;) {
            if (!ops[j].rollback) {
                continue;
            }
            try {
                ops[j].rollback(candidate);
                ++rolledBack;
            } catch (const std::exception& e) {
                GSIM_LOG_ERROR(LogCategory::State,
                               "rollback of '" + ops[j].name + "' threw: " + e.what());
            } catch (...) {
                GSIM_LOG_ERROR(LogCategory::State, "rollback of '" + ops[j].name + "' threw");
            }
        }

        TransactionFailure failure{tx.label(), i, ops[i].name, rolledBack};
        LogContext ctx;
        ctx.tick = impl_->tick.load(std::memory_order_relaxed);
        ctx.extra["transaction"] = tx.label();
        foundation::GameLogger::instance().logWithContext(
            LogLevel::Info, LogCategory::State,
            "transaction aborted at '" + ops[i].name + "': " + applied.error().describe(), ctx);

        return GameResult<uint64_t>::err(GameError(
            ErrorCode::TransactionFailed,
            "transaction '" + tx.label() + "' failed at operation " + std::to_string(i) +
                " ('" + ops[i].name + "'): " + std::string(applied.error().message()),
            std::move(failure)));
    }

    return impl_->commit(std::move(candidate),
                         tx.label().empty() ? std::string("transaction") : tx.label());
}

GameResult<void> StateManager::enqueueTransaction(StateTransaction tx, uint64_t dueTick) {
    if (tx.empty()) {
        return GameResult<void>::err(
            GameError(ErrorCode::InvalidArgument, "transaction has no operations"));
    }
    std::lock_guard lock(impl_->pendingMutex);
    impl_->pending.emplace(std::make_pair(dueTick, impl_->nextSequence++), std::move(tx));
    return GameResult<void>::ok();
}

std::vector<AppliedTransaction> StateManager::applyDueTransactions(uint64_t tick) {
    setCurrentTick(tick);

    std::vector<std::pair<uint64_t, StateTransaction>> due;
    {
        std::lock_guard lock(impl_->pendingMutex);
        auto end = impl_->pending.upper_bound({tick, std::numeric_limits<uint64_t>::max()});
        for (auto it = impl_->pending.begin(); it != end; ++it) {
            due.emplace_back(it->first.first, std::move(it->second));
        }
        impl_->pending.erase(impl_->pending.begin(), end);
    }

    std::vector<AppliedTransaction> out;
    out.reserve(due.size());
    for (auto& [dueTick, tx] : due) {
        AppliedTransaction applied;
        applied.label = tx.label();
        applied.dueTick = dueTick;
        auto result = executeTransaction(tx);
        if (result) {
            applied.committed = true;
            applied.version = result.value();
        } else {
            applied.version = impl_->current.version;
            applied.error = std::move(result).error();
        }
        out.push_back(std::move(applied));
    }
    return out;
}

// ── Snapshots ───────────────────────────────────────────────────────────────

StateSnapshot StateManager::createSnapshot() const {
    StateSnapshot snap;
    snap.state = impl_->current;
    snap.version = impl_->current.version;
    snap.checksum = impl_->current.checksum;
    snap.timestamp = SnapshotClock::now();
    snap.id = "snap-v" + std::to_string(snap.version) + "-t" +
              std::to_string(impl_->current.tick);
    return snap;
}

GameResult<void> StateManager::restoreFromSnapshot(const StateSnapshot& snapshot) {
    auto recomputed = StateCodec::computeChecksum(snapshot.state);
    if (recomputed.empty() || recomputed != snapshot.checksum ||
        recomputed != snapshot.state.checksum) {
        GSIM_LOG_WARN(LogCategory::State, "snapshot '" + snapshot.id + "' checksum mismatch");
        return GameResult<void>::err(GameError(
            ErrorCode::CorruptedSnapshot,
            "checksum mismatch for snapshot '" + snapshot.id + "'"));
    }

    if (snapshot.id.empty() || snapshot.version != snapshot.state.version) {
        return GameResult<void>::err(GameError(
            ErrorCode::InvalidSnapshot,
            "snapshot header does not match its state (id '" + snapshot.id + "', version " +
                std::to_string(snapshot.version) + " vs " +
                std::to_string(snapshot.state.version) + ")"));
    }

    auto report = impl_->validators.run(snapshot.state, impl_->scheduler);
    if (!report.ok()) {
        auto message = "snapshot '" + snapshot.id + "' fails validation: " + report.summary();
        return GameResult<void>::err(
            GameError(ErrorCode::InvalidSnapshot, std::move(message), std::move(report)));
    }

    impl_->current = snapshot.state;
    GSIM_LOG_INFO(LogCategory::State, "restored snapshot '" + snapshot.id + "' at v" +
                                          std::to_string(impl_->current.version));
    impl_->publish(event::types::kStateRestored, event::EventPriority::High, snapshot.id);
    return GameResult<void>::ok();
}

// ── Queries ─────────────────────────────────────────────────────────────────

ValidationResult StateManager::validate() const {
    return impl_->validators.run(impl_->current, impl_->scheduler);
}

const GameState& StateManager::state() const noexcept {
    return impl_->current;
}

uint64_t StateManager::version() const noexcept {
    return impl_->current.version;
}

const std::string& StateManager::checksum() const noexcept {
    return impl_->current.checksum;
}

uint64_t StateManager::currentTick() const noexcept {
    return impl_->tick.load(std::memory_order_relaxed);
}

void StateManager::setCurrentTick(uint64_t tick) noexcept {
    impl_->tick.store(tick, std::memory_order_relaxed);
}

std::size_t StateManager::pendingTransactions() const {
    std::lock_guard lock(impl_->pendingMutex);
    return impl_->pending.size();
}

ValidatorRegistry& StateManager::validators() noexcept {
    return impl_->validators;
}

}  // namespace gsim::state
