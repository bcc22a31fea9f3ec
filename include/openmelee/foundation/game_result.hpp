#pragma once

/// @file game_result.hpp
/// @brief GameResult<T> type alias for server error handling.

#include "openmelee/core/result.hpp"
#include "openmelee/foundation/game_error.hpp"

namespace openmelee::foundation {

/// Result type specialized with GameError.
///
/// Example:
/// @code
///   GameResult<ControllerPort> portFromCode(int code) {
///       if (code < 1 || code > 4) {
///           return GameResult<ControllerPort>::err(
///               GameError(ErrorCode::MalformedMessage, "unknown port"));
///       }
///       return GameResult<ControllerPort>::ok(static_cast<ControllerPort>(code));
///   }
/// @endcode
template <typename T>
using GameResult = openmelee::Result<T, GameError>;

}  // namespace openmelee::foundation
