#pragma once

/// @file game_result.hpp
/// @brief GameResult<T> type alias for the core's error handling.

#include "brk/core/result.hpp"
#include "brk/foundation/game_error.hpp"

namespace breakout::foundation {

/// Result type specialized with GameError.
///
/// Every loader, catalog, store and session method that can fail returns
/// GameResult<T> instead of throwing exceptions.
///
/// Example:
/// @code
///   GameResult<int> checkDensity(int density) {
///       if (density < 1) {
///           return GameResult<int>::err(
///               GameError(ErrorCode::InvalidLevel, "density must be positive"));
///       }
///       return GameResult<int>::ok(density);
///   }
/// @endcode
template <typename T>
using GameResult = breakout::Result<T, GameError>;

}  // namespace breakout::foundation
