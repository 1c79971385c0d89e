#pragma once

/// @file game_result.hpp
/// @brief GameResult<T>: Result specialized with GameError.

#include "lhe/core/result.hpp"
#include "lhe/foundation/game_error.hpp"

namespace lhe::foundation {

/// Result type used by every fallible engine operation.
///
/// Example:
/// @code
///   GameResult<void> RemoveLast() {
///       if (segments_.size() == 1) {
///           return GameResult<void>::err(
///               GameError(ErrorCode::OutOfRange, "cannot remove the only segment"));
///       }
///       segments_.pop_back();
///       return GameResult<void>::ok();
///   }
/// @endcode
template <typename T>
using GameResult = lhe::Result<T, GameError>;

}  // namespace lhe::foundation
