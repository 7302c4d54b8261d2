/// @file skill_resolver.cpp
/// @brief Skill and basic attack resolution.

#include "dqe/game/skill_resolver.hpp"

#include <algorithm>

#include "dqe/foundation/game_logger.hpp"
#include "dqe/game/status_effect_system.hpp"

namespace dqe::game {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

SkillResolver::SkillResolver(foundation::RandomSource& rng, const CombatRules& rules)
    : rng_(&rng), rules_(rules) {}

int32_t SkillResolver::EffectAmount(const Stats& caster, const Skill& skill) {
    return floorToInt32(static_cast<double>(caster.EffectiveAttack()) * skill.power);
}

GameResult<SkillOutcome> SkillResolver::Resolve(Combatant& caster, Combatant& target,
                                                const Skill& skill) {
    if (!isKnownSkillType(skill.type)) {
        DQE_LOG_CRITICAL(LogCategory::Skill,
                         "skill '" + skill.name + "' has a type outside the known set");
        return GameResult<SkillOutcome>::err(
            GameError(ErrorCode::UnknownSkillType, "Unknown skill type for " + skill.name));
    }

    if (!caster.stats.UseMp(skill.mpCost)) {
        DQE_LOG_DEBUG(LogCategory::Skill, caster.name + " lacks MP for " + skill.name);
        return GameResult<SkillOutcome>::err(
            GameError(ErrorCode::InsufficientMana,
                      "Not enough MP! Need " + std::to_string(skill.mpCost) + " MP."));
    }

    const int32_t effectAmount = EffectAmount(caster.stats, skill);
    const std::string prefix = caster.name + " uses " + skill.name + "! ";

    SkillOutcome outcome;
    outcome.type = skill.type;

    switch (skill.type) {
        case SkillType::Damage: {
            double roll = rng_->uniform(rules_.skillVarianceMin, rules_.skillVarianceMax);
            auto damage = roundToInt32(effectAmount * roll);
            outcome.amount = target.stats.TakeDamage(damage);
            outcome.message = prefix + "Deals " + std::to_string(outcome.amount) + " damage!";
            break;
        }
        case SkillType::Heal: {
            outcome.amount = target.stats.Heal(effectAmount);
            outcome.message = prefix + "Restored " + std::to_string(outcome.amount) + " HP!";
            break;
        }
        case SkillType::Buff: {
            outcome.amount = std::max(1, effectAmount);
            ApplyStatusEffect(caster.stats,
                              StatusEffect::Modifier(skill.name, kStatAttack, outcome.amount,
                                                     skill.duration),
                              caster.name);
            outcome.message = prefix + "Attack +" + std::to_string(outcome.amount) + " for " +
                              std::to_string(skill.duration) + " turns!";
            break;
        }
        case SkillType::Debuff: {
            outcome.amount = std::max(1, effectAmount);
            ApplyStatusEffect(target.stats,
                              StatusEffect::Modifier(skill.name, kStatAttack, -outcome.amount,
                                                     skill.duration),
                              target.name);
            outcome.message = prefix + target.name + "'s attack -" +
                              std::to_string(outcome.amount) + " for " +
                              std::to_string(skill.duration) + " turns!";
            break;
        }
        case SkillType::DamageOverTime: {
            outcome.amount = std::max(1, effectAmount);
            std::string effectName = skill.statusEffectName.value_or(skill.name);
            ApplyStatusEffect(target.stats,
                              StatusEffect::DamageOverTime(effectName, outcome.amount,
                                                           skill.duration),
                              target.name);
            outcome.message = prefix + target.name + " is afflicted with " + effectName + "!";
            break;
        }
        case SkillType::Stun: {
            ApplyStatusEffect(target.stats, StatusEffect::Stun(skill.duration), target.name);
            outcome.message = prefix + target.name + " is stunned for " +
                              std::to_string(skill.duration) + " turns!";
            break;
        }
    }

    DQE_LOG_DEBUG(LogCategory::Skill,
                  caster.name + " resolved " + skill.name + " (" +
                  std::string(skillTypeName(skill.type)) + ", amount=" +
                  std::to_string(outcome.amount) + ")");
    return GameResult<SkillOutcome>::ok(std::move(outcome));
}

AttackOutcome SkillResolver::BasicAttack(Combatant& attacker, Combatant& target) {
    double roll = rng_->uniform(rules_.attackVarianceMin, rules_.attackVarianceMax);
    auto damage = roundToInt32(static_cast<double>(attacker.stats.EffectiveAttack()) * roll);

    AttackOutcome outcome;
    outcome.damage = target.stats.TakeDamage(damage);
    outcome.message = attacker.name + " attacks " + target.name + " for " +
                      std::to_string(outcome.damage) + " damage!";
    return outcome;
}

}  // namespace dqe::game
