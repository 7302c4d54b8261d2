#pragma once

/// @file progression.hpp
/// @brief Experience accumulation and level-up stat growth.

#include <cstdint>

#include "dqe/game/combat_rules.hpp"
#include "dqe/game/stat_components.hpp"

namespace dqe::game {

/// Experience needed to leave @p level, saturating at INT32_MAX.
[[nodiscard]] constexpr int32_t ExpThreshold(int32_t level, const ProgressionRules& rules) {
    return saturateToInt32(static_cast<int64_t>(level) * rules.expPerLevel);
}

/// Add experience and level up when the threshold is reached.
///
/// With the default rules at most one level is gained per call, even when
/// @p amount crosses several thresholds; the surplus stays in exp and is
/// picked up by the next grant.  rules.cascadeLevelUps lifts that limit.
///
/// @return Number of levels gained.
int32_t GainExp(Stats& stats, int32_t amount, const ProgressionRules& rules = {});

/// Apply one level-up: level + 1, maxHp/maxMp/attack grow by
/// floor(value * growthRate), pools fully restored, speed + 1.
void LevelUp(Stats& stats, const ProgressionRules& rules = {});

}  // namespace dqe::game
