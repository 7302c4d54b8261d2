#pragma once

/// @file combat_rules.hpp
/// @brief Tunable combat and progression constants.

#include <cstdint>

#include "dqe/foundation/config_manager.hpp"
#include "dqe/foundation/game_result.hpp"

namespace dqe::game {

/// Random variance and flee odds used by a combat session.
///
/// Config keys (all optional):
/// | Key                          | Default |
/// |------------------------------|---------|
/// | combat.attack_variance_min   | 0.8     |
/// | combat.attack_variance_max   | 1.2     |
/// | combat.skill_variance_min    | 0.9     |
/// | combat.skill_variance_max    | 1.1     |
/// | combat.flee_chance           | 0.5     |
struct CombatRules {
    double attackVarianceMin = 0.8;
    double attackVarianceMax = 1.2;
    double skillVarianceMin = 0.9;
    double skillVarianceMax = 1.1;
    double fleeChance = 0.5;  ///< Flee succeeds iff roll < fleeChance.

    /// Read overrides from @p config.
    /// @return InvalidArgument for inverted ranges or a chance outside [0, 1].
    static foundation::GameResult<CombatRules> FromConfig(const foundation::ConfigManager& config);
};

/// Experience curve and level-up growth.
///
/// Config keys (all optional):
/// | Key                            | Default |
/// |--------------------------------|---------|
/// | progression.exp_per_level      | 100     |
/// | progression.growth_rate        | 0.1     |
/// | progression.cascade_level_ups  | false   |
struct ProgressionRules {
    int32_t expPerLevel = 100;   ///< Threshold is level * expPerLevel.
    double growthRate = 0.1;     ///< Fraction added to maxHp, maxMp, attack.
    bool cascadeLevelUps = false;

    static foundation::GameResult<ProgressionRules> FromConfig(
        const foundation::ConfigManager& config);
};

}  // namespace dqe::game
