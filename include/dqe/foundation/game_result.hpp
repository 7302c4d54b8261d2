#pragma once

/// @file game_result.hpp
/// @brief GameResult<T>, the return type of fallible engine operations.

#include "dqe/core/result.hpp"
#include "dqe/foundation/game_error.hpp"

namespace dqe::foundation {

/// Combat operations return a declined GameResult instead of throwing; the
/// caller logs error().message() and asks the player again.
///
/// @code
///   auto used = resolver.Resolve(caster, target, skill);
///   if (!used) {
///       log.push_back(std::string(used.error().message()));
///       return;  // no turn consumed
///   }
/// @endcode
template <typename T>
using GameResult = dqe::Result<T, GameError>;

} // namespace dqe::foundation
