#pragma once

/// @file behavior_engine.hpp
/// @brief Registry of named behavior trees and their synchronous evaluator.

#include "gsim/ai/behavior_tree.hpp"
#include "gsim/ai/decision.hpp"
#include "gsim/foundation/game_result.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gsim::event {
class EventBus;
}

namespace gsim::ai {

/// Payload of ai.tree.registered.
struct TreeRegisteredPayload {
    std::string treeId;
    std::size_t nodeCount = 0;
};

/// Evaluates registered trees against a SituationContext.
///
/// Evaluation never touches I/O or shared state and may run on any thread;
/// registration is safe while evaluations are in flight.
class BehaviorEngine {
public:
    /// @param bus Optional; receives ai.tree.registered notifications.
    explicit BehaviorEngine(event::EventBus* bus = nullptr);
    ~BehaviorEngine();

    BehaviorEngine(const BehaviorEngine&) = delete;
    BehaviorEngine& operator=(const BehaviorEngine&) = delete;
    BehaviorEngine(BehaviorEngine&&) noexcept;
    BehaviorEngine& operator=(BehaviorEngine&&) noexcept;

    /// AlreadyExists if @p treeId is taken, InvalidTree if @p tree is empty.
    foundation::GameResult<void> registerTree(std::string treeId, BehaviorTree tree);

    /// UnknownTree on lookup miss. A predicate or scorer that throws fails
    /// the evaluation with DecisionFailed.
    [[nodiscard]] foundation::GameResult<BehaviorResult> evaluateTree(
        std::string_view treeId, const SituationContext& context) const;

    /// Re-check a previously computed decision against @p context.
    ///
    /// The chosen candidate must still exist, its precondition must still
    /// hold and its score must still be finite. Returns the decision
    /// re-targeted to the context's agent and re-scored, or nullopt.
    [[nodiscard]] std::optional<Decision> reconcile(const Decision& decision,
                                                    const SituationContext& context) const;

    [[nodiscard]] bool hasTree(std::string_view treeId) const;
    [[nodiscard]] std::size_t treeCount() const;

    /// Sorted.
    [[nodiscard]] std::vector<std::string> treeIds() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace gsim::ai
