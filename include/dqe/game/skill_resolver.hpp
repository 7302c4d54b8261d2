#pragma once

/// @file skill_resolver.hpp
/// @brief SkillResolver: applies skills and basic attacks to combatants.

#include <cstdint>
#include <string>

#include "dqe/foundation/game_result.hpp"
#include "dqe/foundation/random_source.hpp"
#include "dqe/game/combat_rules.hpp"
#include "dqe/game/combatant.hpp"
#include "dqe/game/content_types.hpp"

namespace dqe::game {

/// Result of a resolved skill.
struct SkillOutcome {
    SkillType type = SkillType::Damage;
    int32_t amount = 0;    ///< Damage dealt, HP reported healed, or effect power.
    std::string message;   ///< Combat log line.
};

/// Result of a basic attack.
struct AttackOutcome {
    int32_t damage = 0;
    std::string message;
};

/// Interprets skills against caster and target combatants.
///
/// effectAmount = floor(caster.EffectiveAttack() * skill.power), then per type:
/// | Type           | Effect                                                  |
/// |----------------|---------------------------------------------------------|
/// | Damage         | round(effectAmount * U(skill variance)) to target       |
/// | Heal           | Heal(effectAmount) on target                            |
/// | Buff           | +max(1, effectAmount) attack modifier on caster         |
/// | Debuff         | -max(1, effectAmount) attack modifier on target         |
/// | DamageOverTime | max(1, effectAmount) per tick on target                 |
/// | Stun           | "Stunned" for skill.duration turns on target            |
class SkillResolver {
public:
    SkillResolver(foundation::RandomSource& rng, const CombatRules& rules);

    /// Pay the MP cost and apply @p skill.
    ///
    /// @return The outcome, InsufficientMana (nothing changed) or, for a
    ///         skill type outside the closed set, UnknownSkillType.
    foundation::GameResult<SkillOutcome> Resolve(Combatant& caster, Combatant& target,
                                                 const Skill& skill);

    /// round(attacker.EffectiveAttack() * U(attack variance)) to target.
    /// Never fails and costs nothing.
    AttackOutcome BasicAttack(Combatant& attacker, Combatant& target);

    /// floor(caster effective attack * skill power).
    [[nodiscard]] static int32_t EffectAmount(const Stats& caster, const Skill& skill);

private:
    foundation::RandomSource* rng_;
    CombatRules rules_;
};

}  // namespace dqe::game
