/// @file game_state.cpp
/// @brief StateUpdate merge.

#include "gsim/state/game_state.hpp"

namespace gsim::state {

namespace {

template <typename T, typename U>
void mergeInto(std::map<std::string, T>& target,
               const std::map<std::string, std::optional<U>>& changes) {
    for (const auto& [key, value] : changes) {
        if (value) {
            target.insert_or_assign(key, *value);
        } else {
            target.erase(key);
        }
    }
}

}  // namespace

void applyUpdate(GameState& state, const StateUpdate& update) {
    mergeInto(state.guild.guilds, update.guilds);
    mergeInto(state.combat.battles, update.battles);
    mergeInto(state.economy.treasuries, update.treasuries);
    mergeInto(state.economy.marketPrices, update.marketPrices);
    mergeInto(state.social.relationships, update.relationships);
}

}  // namespace gsim::state
