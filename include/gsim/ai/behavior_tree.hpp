#pragma once

/// @file behavior_tree.hpp
/// @brief Arena-allocated, immutable behavior trees and their builder.
///
/// Nodes are a closed variant {Sequence, Selector, Condition, Action,
/// Decorator} stored contiguously and addressed by NodeIndex. Children are
/// always created before their parent, so every edge points to a lower
/// index and a built tree cannot contain a cycle.

#include "gsim/ai/ai_types.hpp"
#include "gsim/ai/situation_context.hpp"
#include "gsim/foundation/game_result.hpp"

#include <functional>
#include <string>
#include <variant>
#include <vector>

namespace gsim::ai {

using ContextPredicate = std::function<bool(const SituationContext&)>;
using ContextScorer = std::function<double(const SituationContext&)>;

// ═══════════════════════════════════════════════════════════════════════════
// Node shapes
// ═══════════════════════════════════════════════════════════════════════════

/// One alternative inside an Action node.
///
/// The highest finite score among candidates whose precondition holds wins;
/// equal scores go to the lexicographically smallest actionId.
struct ActionCandidate {
    std::string actionId;
    ContextScorer scorer;
    ContextPredicate precondition;  ///< Empty means always eligible.
    FactMap params;
    BTStatus resultStatus = BTStatus::Success;
};

struct SequenceNode {
    std::vector<NodeIndex> children;
};

struct SelectorNode {
    std::vector<NodeIndex> children;
};

struct ConditionNode {
    std::string name;
    ContextPredicate predicate;
};

struct ActionNode {
    std::string name;
    std::vector<ActionCandidate> candidates;
};

struct DecoratorNode {
    DecoratorKind kind = DecoratorKind::Inverter;
    NodeIndex child = kInvalidNode;
    uint32_t repeatCount = 1;  ///< Only used by Repeat.
};

using BehaviorNode =
    std::variant<SequenceNode, SelectorNode, ConditionNode, ActionNode, DecoratorNode>;

[[nodiscard]] NodeKind kindOf(const BehaviorNode& node) noexcept;

// ═══════════════════════════════════════════════════════════════════════════
// BehaviorTree
// ═══════════════════════════════════════════════════════════════════════════

/// Immutable tree produced by BehaviorTreeBuilder::build().
class BehaviorTree {
public:
    BehaviorTree() = default;

    [[nodiscard]] NodeIndex root() const noexcept { return root_; }
    [[nodiscard]] std::size_t size() const noexcept { return nodes_.size(); }
    [[nodiscard]] bool empty() const noexcept { return nodes_.empty(); }

    /// Node at @p index. The index must be < size().
    [[nodiscard]] const BehaviorNode& node(NodeIndex index) const { return nodes_[index]; }

    /// Locate the candidate with @p actionId in any Action node.
    [[nodiscard]] const ActionCandidate* findCandidate(const std::string& actionId) const;

private:
    friend class BehaviorTreeBuilder;

    std::vector<BehaviorNode> nodes_;
    NodeIndex root_ = kInvalidNode;
};

// ═══════════════════════════════════════════════════════════════════════════
// BehaviorTreeBuilder
// ═══════════════════════════════════════════════════════════════════════════

/// Bottom-up builder.
///
/// @code
///   BehaviorTreeBuilder b;
///   auto lowGold = b.condition("low_gold", [](auto& c) { return c.number("gold") < 50; });
///   auto trade   = b.action("trade", "sell_loot", 1.0);
///   auto idle    = b.action("idle", "rest", 0.1);
///   auto root    = b.selector({b.sequence({lowGold, trade}), idle});
///   auto tree    = b.build(root);
/// @endcode
class BehaviorTreeBuilder {
public:
    NodeIndex sequence(std::vector<NodeIndex> children);
    NodeIndex selector(std::vector<NodeIndex> children);
    NodeIndex condition(std::string name, ContextPredicate predicate);
    NodeIndex action(std::string name, std::vector<ActionCandidate> candidates);

    /// Action node with a single constant-score candidate.
    NodeIndex action(std::string name, std::string actionId, double score);

    NodeIndex inverter(NodeIndex child);
    NodeIndex forceSuccess(NodeIndex child);
    NodeIndex forceFailure(NodeIndex child);
    NodeIndex repeat(NodeIndex child, uint32_t count);

    [[nodiscard]] std::size_t size() const noexcept { return nodes_.size(); }

    /// Validate the arena and hand it over as a tree rooted at @p root.
    /// InvalidTree if a node is malformed or references a later node.
    /// The builder is empty afterwards.
    foundation::GameResult<BehaviorTree> build(NodeIndex root);

private:
    NodeIndex push(BehaviorNode node);

    std::vector<BehaviorNode> nodes_;
};

}  // namespace gsim::ai
