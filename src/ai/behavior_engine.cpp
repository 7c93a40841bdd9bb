/// @file behavior_engine.cpp
/// @brief BehaviorEngine: tree registry and arena evaluator.

#include "gsim/ai/behavior_engine.hpp"

#include "gsim/event/event_bus.hpp"
#include "gsim/event/event_types.hpp"
#include "gsim/foundation/game_logger.hpp"

#include <cmath>
#include <exception>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <utility>

namespace gsim::ai {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

namespace {

struct SelectedAction {
    const ActionCandidate* candidate = nullptr;
    double score = 0.0;
};

struct Outcome {
    BTStatus status = BTStatus::Failure;
    std::vector<SelectedAction> actions;
};

Outcome failure() {
    return Outcome{BTStatus::Failure, {}};
}

/// Single-use walker over one tree for one context.
class Evaluator {
public:
    Evaluator(const BehaviorTree& tree, const SituationContext& ctx)
        : tree_(tree), ctx_(ctx) {}

    Outcome run() { return eval(tree_.root()); }

    [[nodiscard]] std::size_t visited() const noexcept { return visited_; }

private:
    Outcome eval(NodeIndex index) {
        ++visited_;
        return std::visit([this](const auto& node) { return evalNode(node); },
                          tree_.node(index));
    }

    Outcome evalNode(const SequenceNode& node) {
        Outcome acc{BTStatus::Success, {}};
        for (auto child : node.children) {
            auto out = eval(child);
            if (out.status == BTStatus::Failure) {
                return failure();
            }
            acc.actions.insert(acc.actions.end(), out.actions.begin(), out.actions.end());
            if (out.status == BTStatus::Running) {
                acc.status = BTStatus::Running;
                return acc;
            }
        }
        return acc;
    }

    Outcome evalNode(const SelectorNode& node) {
        for (auto child : node.children) {
            auto out = eval(child);
            if (out.status != BTStatus::Failure) {
                return out;
            }
        }
        return failure();
    }

    Outcome evalNode(const ConditionNode& node) {
        return node.predicate(ctx_) ? Outcome{BTStatus::Success, {}} : failure();
    }

    Outcome evalNode(const ActionNode& node) {
        const ActionCandidate* best = nullptr;
        double bestScore = 0.0;
        for (const auto& candidate : node.candidates) {
            if (candidate.precondition && !candidate.precondition(ctx_)) {
                continue;
            }
            double score = candidate.scorer(ctx_);
            if (!std::isfinite(score)) {
                continue;
            }
            // Equal scores resolve to the smallest action id.
            if (best == nullptr || score > bestScore ||
                (score == bestScore && candidate.actionId < best->actionId)) {
                best = &candidate;
                bestScore = score;
            }
        }
        if (best == nullptr) {
            return failure();
        }
        return Outcome{best->resultStatus, {SelectedAction{best, bestScore}}};
    }

    Outcome evalNode(const DecoratorNode& node) {
        switch (node.kind) {
            case DecoratorKind::Inverter: {
                auto out = eval(node.child);
                if (out.status == BTStatus::Success) {
                    return failure();
                }
                if (out.status == BTStatus::Failure) {
                    return Outcome{BTStatus::Success, {}};
                }
                return out;
            }
            case DecoratorKind::ForceSuccess: {
                auto out = eval(node.child);
                if (out.status == BTStatus::Failure) {
                    return Outcome{BTStatus::Success, {}};
                }
                return out;
            }
            case DecoratorKind::ForceFailure: {
                auto out = eval(node.child);
                if (out.status == BTStatus::Running) {
                    return out;
                }
                return failure();
            }
            case DecoratorKind::Repeat: {
                Outcome out;
                for (uint32_t i = 0; i < node.repeatCount; ++i) {
                    out = eval(node.child);
                    if (out.status != BTStatus::Success) {
                        break;
                    }
                }
                return out;
            }
        }
        return failure();
    }

    const BehaviorTree& tree_;
    const SituationContext& ctx_;
    std::size_t visited_ = 0;
};

} // namespace

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct BehaviorEngine::Impl {
    event::EventBus* bus = nullptr;
    mutable std::shared_mutex mutex;
    std::map<std::string, std::shared_ptr<const BehaviorTree>, std::less<>> trees;

    std::shared_ptr<const BehaviorTree> find(std::string_view treeId) const {
        std::shared_lock lock(mutex);
        auto it = trees.find(treeId);
        return it == trees.end() ? nullptr : it->second;
    }
};

BehaviorEngine::BehaviorEngine(event::EventBus* bus)
    : impl_(std::make_unique<Impl>()) {
    impl_->bus = bus;
}

BehaviorEngine::~BehaviorEngine() = default;

BehaviorEngine::BehaviorEngine(BehaviorEngine&&) noexcept = default;
BehaviorEngine& BehaviorEngine::operator=(BehaviorEngine&&) noexcept = default;

// ---------------------------------------------------------------------------
// registerTree()
// ---------------------------------------------------------------------------
GameResult<void> BehaviorEngine::registerTree(std::string treeId, BehaviorTree tree) {
    if (treeId.empty() || tree.empty()) {
        return GameResult<void>::err(
            GameError(ErrorCode::InvalidTree, "tree id and tree must be non-empty"));
    }

    auto nodeCount = tree.size();
    {
        std::unique_lock lock(impl_->mutex);
        if (impl_->trees.count(treeId) > 0) {
            return GameResult<void>::err(
                GameError(ErrorCode::AlreadyExists, "tree already registered: " + treeId));
        }
        impl_->trees.emplace(treeId, std::make_shared<const BehaviorTree>(std::move(tree)));
    }

    GSIM_LOG_DEBUG(LogCategory::AI, "registered tree '" + treeId + "' (" +
                   std::to_string(nodeCount) + " nodes)");

    if (impl_->bus != nullptr) {
        auto published = impl_->bus->publish(event::makeEvent(
            "behavior_engine", std::string(event::types::kTreeRegistered),
            TreeRegisteredPayload{treeId, nodeCount}, event::EventPriority::Low));
        if (!published) {
            GSIM_LOG_WARN(LogCategory::AI, published.error().describe());
        }
    }
    return GameResult<void>::ok();
}

// ---------------------------------------------------------------------------
// evaluateTree()
// ---------------------------------------------------------------------------
GameResult<BehaviorResult> BehaviorEngine::evaluateTree(
    std::string_view treeId, const SituationContext& context) const {
    auto tree = impl_->find(treeId);
    if (!tree) {
        return GameResult<BehaviorResult>::err(
            GameError(ErrorCode::UnknownTree, "unknown tree: " + std::string(treeId)));
    }

    Evaluator evaluator(*tree, context);
    Outcome outcome;
    try {
        outcome = evaluator.run();
    } catch (const std::exception& e) {
        return GameResult<BehaviorResult>::err(GameError(
            ErrorCode::DecisionFailed,
            "tree '" + std::string(treeId) + "' threw: " + e.what()));
    } catch (...) {
        return GameResult<BehaviorResult>::err(GameError(
            ErrorCode::DecisionFailed,
            "tree '" + std::string(treeId) + "' threw a non-standard exception"));
    }

    BehaviorResult result;
    result.status = outcome.status;
    result.nodesVisited = evaluator.visited();

    if (outcome.status != BTStatus::Failure && !outcome.actions.empty()) {
        const auto& first = outcome.actions.front();
        Decision d;
        d.agentId = context.agentId();
        d.treeId = std::string(treeId);
        d.actionId = first.candidate->actionId;
        d.score = first.score;
        d.params = first.candidate->params;
        d.computedAtTick = context.tick();
        d.plan.reserve(outcome.actions.size());
        for (const auto& selected : outcome.actions) {
            d.plan.push_back(selected.candidate->actionId);
        }
        result.decision = std::move(d);
    }

    return GameResult<BehaviorResult>::ok(std::move(result));
}

// ---------------------------------------------------------------------------
// reconcile()
// ---------------------------------------------------------------------------
std::optional<Decision> BehaviorEngine::reconcile(const Decision& decision,
                                                  const SituationContext& context) const {
    if (decision.fallback) {
        return std::nullopt;
    }
    auto tree = impl_->find(decision.treeId);
    if (!tree) {
        return std::nullopt;
    }
    const auto* candidate = tree->findCandidate(decision.actionId);
    if (candidate == nullptr) {
        return std::nullopt;
    }

    try {
        if (candidate->precondition && !candidate->precondition(context)) {
            return std::nullopt;
        }
        double score = candidate->scorer(context);
        if (!std::isfinite(score)) {
            return std::nullopt;
        }
        Decision adapted = decision;
        adapted.agentId = context.agentId();
        adapted.score = score;
        adapted.params = candidate->params;
        return adapted;
    } catch (const std::exception& e) {
        GSIM_LOG_WARN(LogCategory::AI, "reconcile of '" + decision.actionId +
                      "' threw: " + e.what());
    } catch (...) {
        GSIM_LOG_WARN(LogCategory::AI, "reconcile of '" + decision.actionId +
                      "' threw a non-standard exception");
    }
    return std::nullopt;
}

bool BehaviorEngine::hasTree(std::string_view treeId) const {
    return impl_->find(treeId) != nullptr;
}

std::size_t BehaviorEngine::treeCount() const {
    std::shared_lock lock(impl_->mutex);
    return impl_->trees.size();
}

std::vector<std::string> BehaviorEngine::treeIds() const {
    std::shared_lock lock(impl_->mutex);
    std::vector<std::string> ids;
    ids.reserve(impl_->trees.size());
    for (const auto& [id, tree] : impl_->trees) {
        ids.push_back(id);
    }
    return ids;
}

}  // namespace gsim::ai
