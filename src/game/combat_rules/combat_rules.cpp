/// @file combat_rules.cpp
/// @brief CombatRules / ProgressionRules configuration readers.

#include "dqe/game/combat_rules.hpp"

#include <string>

namespace dqe::game {

using foundation::ConfigManager;
using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;

namespace {

/// Read an optional key into @p out, keeping the current value as default.
template <typename T>
GameResult<void> readInto(const ConfigManager& config, std::string_view key, T& out) {
    auto value = config.getOr<T>(key, out);
    if (!value) {
        return GameResult<void>::err(value.error());
    }
    out = value.value();
    return GameResult<void>::ok();
}

GameError invalid(const std::string& what) {
    return GameError(ErrorCode::InvalidArgument, what);
}

}  // namespace

GameResult<CombatRules> CombatRules::FromConfig(const ConfigManager& config) {
    CombatRules rules;
    for (auto result : {readInto(config, "combat.attack_variance_min", rules.attackVarianceMin),
                        readInto(config, "combat.attack_variance_max", rules.attackVarianceMax),
                        readInto(config, "combat.skill_variance_min", rules.skillVarianceMin),
                        readInto(config, "combat.skill_variance_max", rules.skillVarianceMax),
                        readInto(config, "combat.flee_chance", rules.fleeChance)}) {
        if (!result) {
            return GameResult<CombatRules>::err(result.error());
        }
    }

    if (rules.attackVarianceMin < 0.0 || rules.attackVarianceMin > rules.attackVarianceMax) {
        return GameResult<CombatRules>::err(invalid("combat.attack_variance range is inverted or negative"));
    }
    if (rules.skillVarianceMin < 0.0 || rules.skillVarianceMin > rules.skillVarianceMax) {
        return GameResult<CombatRules>::err(invalid("combat.skill_variance range is inverted or negative"));
    }
    if (rules.fleeChance < 0.0 || rules.fleeChance > 1.0) {
        return GameResult<CombatRules>::err(invalid("combat.flee_chance must be within [0, 1]"));
    }
    return GameResult<CombatRules>::ok(rules);
}

GameResult<ProgressionRules> ProgressionRules::FromConfig(const ConfigManager& config) {
    ProgressionRules rules;
    for (auto result : {readInto(config, "progression.exp_per_level", rules.expPerLevel),
                        readInto(config, "progression.growth_rate", rules.growthRate),
                        readInto(config, "progression.cascade_level_ups", rules.cascadeLevelUps)}) {
        if (!result) {
            return GameResult<ProgressionRules>::err(result.error());
        }
    }

    if (rules.expPerLevel <= 0) {
        return GameResult<ProgressionRules>::err(invalid("progression.exp_per_level must be positive"));
    }
    if (rules.growthRate < 0.0) {
        return GameResult<ProgressionRules>::err(invalid("progression.growth_rate must not be negative"));
    }
    return GameResult<ProgressionRules>::ok(rules);
}

}  // namespace dqe::game
