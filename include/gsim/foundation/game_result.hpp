#pragma once

/// @file game_result.hpp
/// @brief GameResult<T> alias used across the simulation core.

#include "gsim/core/result.hpp"
#include "gsim/foundation/game_error.hpp"

namespace gsim::foundation {

/// Result type specialized with GameError.
///
/// @code
///   GameResult<Decision> pick(const SituationContext& ctx) {
///       if (ctx.agentId.empty()) {
///           return GameResult<Decision>::err(
///               GameError(ErrorCode::InvalidArgument, "context has no agent"));
///       }
///       ...
///   }
/// @endcode
template <typename T>
using GameResult = gsim::Result<T, GameError>;

}  // namespace gsim::foundation
