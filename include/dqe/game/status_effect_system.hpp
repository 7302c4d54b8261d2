#pragma once

/// @file status_effect_system.hpp
/// @brief End-of-turn status effect processing.
///
/// Stacking and queries live on StatusEffectList; this module ages the
/// effects once per turn and renders them for display.

#include <string>
#include <string_view>
#include <vector>

#include "dqe/game/stat_components.hpp"

namespace dqe::game {

/// Run one end-of-turn tick over every effect on @p stats.
///
/// For each effect present when the tick starts, in order:
///   1. DamageOverTime deals its power through Stats::TakeDamage
///   2. duration is decremented
///   3. at duration 0 the effect is scheduled for removal
/// Removals are applied after the pass, so every effect fires exactly once.
///
/// @param owner Combatant name, used for logging only.
/// @return Combat log lines, in the order the events happened.
std::vector<std::string> TickStatusEffects(Stats& stats, std::string_view owner = {});

/// Add an effect through the stacking rule and log the result.
StatusEffect& ApplyStatusEffect(Stats& stats, const StatusEffect& effect,
                                std::string_view owner = {});

/// Short display text of active effects, or "None".
///
/// Example: "Battle Cry +5 (3t), Poison 7/turn (2t), Stunned (1t)"
[[nodiscard]] std::string DescribeStatusEffects(const StatusEffectList& list);

}  // namespace dqe::game
