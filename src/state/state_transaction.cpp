/// @file state_transaction.cpp
/// @brief StateTransaction::addUpdate with before-image rollback.

#include "gsim/state/state_transaction.hpp"

#include <memory>

namespace gsim::state {

namespace {

template <typename T, typename U>
void captureBefore(const std::map<std::string, T>& current,
                   const std::map<std::string, std::optional<U>>& changes,
                   std::map<std::string, std::optional<U>>& before) {
    for (const auto& entry : changes) {
        auto it = current.find(entry.first);
        if (it == current.end()) {
            before[entry.first] = std::nullopt;
        } else {
            before[entry.first] = it->second;
        }
    }
}

}  // namespace

StateTransaction& StateTransaction::addUpdate(std::string name, StateUpdate update) {
    auto forward = std::make_shared<const StateUpdate>(std::move(update));
    auto beforeImage = std::make_shared<StateUpdate>();

    return add(
        std::move(name),
        [forward, beforeImage](GameState& s) -> foundation::GameResult<void> {
            *beforeImage = StateUpdate{};
            captureBefore(s.guild.guilds, forward->guilds, beforeImage->guilds);
            captureBefore(s.combat.battles, forward->battles, beforeImage->battles);
            captureBefore(s.economy.treasuries, forward->treasuries, beforeImage->treasuries);
            captureBefore(s.economy.marketPrices, forward->marketPrices,
                          beforeImage->marketPrices);
            captureBefore(s.social.relationships, forward->relationships,
                          beforeImage->relationships);
            applyUpdate(s, *forward);
            return foundation::GameResult<void>::ok();
        },
        [beforeImage](GameState& s) { applyUpdate(s, *beforeImage); });
}

}  // namespace gsim::state
