/// @file behavior_tree.cpp
/// @brief BehaviorTreeBuilder validation and tree lookups.

#include "gsim/ai/behavior_tree.hpp"

#include <set>
#include <utility>

namespace gsim::ai {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;

NodeKind kindOf(const BehaviorNode& node) noexcept {
    switch (node.index()) {
        case 0: return NodeKind::Sequence;
        case 1: return NodeKind::Selector;
        case 2: return NodeKind::Condition;
        case 3: return NodeKind::Action;
        default: return NodeKind::Decorator;
    }
}

const ActionCandidate* BehaviorTree::findCandidate(const std::string& actionId) const {
    for (const auto& node : nodes_) {
        if (const auto* action = std::get_if<ActionNode>(&node)) {
            for (const auto& candidate : action->candidates) {
                if (candidate.actionId == actionId) {
                    return &candidate;
                }
            }
        }
    }
    return nullptr;
}

// ---------------------------------------------------------------------------
// Builder
// ---------------------------------------------------------------------------
NodeIndex BehaviorTreeBuilder::push(BehaviorNode node) {
    auto index = static_cast<NodeIndex>(nodes_.size());
    nodes_.push_back(std::move(node));
    return index;
}

NodeIndex BehaviorTreeBuilder::sequence(std::vector<NodeIndex> children) {
    return push(SequenceNode{std::move(children)});
}

NodeIndex BehaviorTreeBuilder::selector(std::vector<NodeIndex> children) {
    return push(SelectorNode{std::move(children)});
}

NodeIndex BehaviorTreeBuilder::condition(std::string name, ContextPredicate predicate) {
    return push(ConditionNode{std::move(name), std::move(predicate)});
}

NodeIndex BehaviorTreeBuilder::action(std::string name,
                                      std::vector<ActionCandidate> candidates) {
    return push(ActionNode{std::move(name), std::move(candidates)});
}

NodeIndex BehaviorTreeBuilder::action(std::string name, std::string actionId, double score) {
    ActionCandidate candidate;
    candidate.actionId = std::move(actionId);
    candidate.scorer = [score](const SituationContext&) { return score; };
    std::vector<ActionCandidate> candidates;
    candidates.push_back(std::move(candidate));
    return action(std::move(name), std::move(candidates));
}

NodeIndex BehaviorTreeBuilder::inverter(NodeIndex child) {
    return push(DecoratorNode{DecoratorKind::Inverter, child, 1});
}

NodeIndex BehaviorTreeBuilder::forceSuccess(NodeIndex child) {
    return push(DecoratorNode{DecoratorKind::ForceSuccess, child, 1});
}

NodeIndex BehaviorTreeBuilder::forceFailure(NodeIndex child) {
    return push(DecoratorNode{DecoratorKind::ForceFailure, child, 1});
}

NodeIndex BehaviorTreeBuilder::repeat(NodeIndex child, uint32_t count) {
    return push(DecoratorNode{DecoratorKind::Repeat, child, count});
}

GameResult<BehaviorTree> BehaviorTreeBuilder::build(NodeIndex root) {
    auto invalid = [this](std::string message) {
        nodes_.clear();
        return GameResult<BehaviorTree>::err(
            GameError(ErrorCode::InvalidTree, std::move(message)));
    };

    if (root >= nodes_.size()) {
        return invalid("root index " + std::to_string(root) + " is out of range");
    }

    for (NodeIndex i = 0; i < nodes_.size(); ++i) {
        auto where = "node " + std::to_string(i) + " (" +
                     std::string(nodeKindName(kindOf(nodes_[i]))) + ")";

        auto checkChild = [i](NodeIndex child) { return child < i; };

        if (const auto* seq = std::get_if<SequenceNode>(&nodes_[i])) {
            if (seq->children.empty()) {
                return invalid(where + " has no children");
            }
            for (auto c : seq->children) {
                if (!checkChild(c)) {
                    return invalid(where + " references node " + std::to_string(c));
                }
            }
        } else if (const auto* sel = std::get_if<SelectorNode>(&nodes_[i])) {
            if (sel->children.empty()) {
                return invalid(where + " has no children");
            }
            for (auto c : sel->children) {
                if (!checkChild(c)) {
                    return invalid(where + " references node " + std::to_string(c));
                }
            }
        } else if (const auto* cond = std::get_if<ConditionNode>(&nodes_[i])) {
            if (!cond->predicate) {
                return invalid(where + " '" + cond->name + "' has no predicate");
            }
        } else if (const auto* act = std::get_if<ActionNode>(&nodes_[i])) {
            if (act->candidates.empty()) {
                return invalid(where + " '" + act->name + "' has no candidates");
            }
            std::set<std::string> seen;
            for (const auto& candidate : act->candidates) {
                if (candidate.actionId.empty() || !candidate.scorer) {
                    return invalid(where + " '" + act->name + "' has an incomplete candidate");
                }
                if (!seen.insert(candidate.actionId).second) {
                    return invalid(where + " repeats action '" + candidate.actionId + "'");
                }
                if (candidate.resultStatus == BTStatus::Failure) {
                    return invalid(where + " candidate '" + candidate.actionId +
                                   "' cannot report FAILURE when chosen");
                }
            }
        } else if (const auto* dec = std::get_if<DecoratorNode>(&nodes_[i])) {
            if (!checkChild(dec->child)) {
                return invalid(where + " references node " + std::to_string(dec->child));
            }
            if (dec->kind == DecoratorKind::Repeat && dec->repeatCount == 0) {
                return invalid(where + " repeats zero times");
            }
        }
    }

    BehaviorTree tree;
    tree.nodes_ = std::move(nodes_);
    tree.root_ = root;
    nodes_.clear();
    return GameResult<BehaviorTree>::ok(std::move(tree));
}

}  // namespace gsim::ai
