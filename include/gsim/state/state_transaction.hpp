#pragma once

/// @file state_transaction.hpp
/// @brief Ordered list of state operations with paired compensating actions.

#include "gsim/foundation/game_result.hpp"
#include "gsim/state/game_state.hpp"

#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace gsim::state {

/// Forward step of an operation. May return an error or throw.
using OperationApply = std::function<foundation::GameResult<void>(GameState&)>;

/// Undo step, run in reverse order for already-applied operations when a
/// later operation fails.
using OperationRollback = std::function<void(GameState&)>;

struct Operation {
    std::string name;
    OperationApply apply;
    OperationRollback rollback;
};

/// Context attached to a TransactionFailed error.
struct TransactionFailure {
    std::string transaction;
    std::size_t failedIndex = 0;
    std::string failedOperation;
    std::size_t rolledBack = 0;
};

/// @code
///   StateTransaction tx("recruit");
///   tx.add("add member", [](GameState& s) { ...; return GameResult<void>::ok(); },
///          [](GameState& s) { ... });
///   manager.executeTransaction(tx);
/// @endcode
class StateTransaction {
public:
    StateTransaction() = default;
    explicit StateTransaction(std::string label) : label_(std::move(label)) {}

    StateTransaction& add(Operation op) {
        ops_.push_back(std::move(op));
        return *this;
    }

    StateTransaction& add(std::string name, OperationApply apply,
                          OperationRollback rollback = {}) {
        ops_.push_back(Operation{std::move(name), std::move(apply), std::move(rollback)});
        return *this;
    }

    /// Convenience operation that merges @p update; its rollback restores
    /// the entities the update touched.
    StateTransaction& addUpdate(std::string name, StateUpdate update);

    [[nodiscard]] const std::vector<Operation>& operations() const noexcept { return ops_; }
    [[nodiscard]] const std::string& label() const noexcept { return label_; }
    [[nodiscard]] std::size_t size() const noexcept { return ops_.size(); }
    [[nodiscard]] bool empty() const noexcept { return ops_.empty(); }

private:
    std::string label_;
    std::vector<Operation> ops_;
};

}  // namespace gsim::state
