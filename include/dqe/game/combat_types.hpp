#pragma once

/// @file combat_types.hpp
/// @brief Enumerations and constants for the combat engine.

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <string_view>

namespace dqe::game {

/// Stat names understood by StatModifier effects.
inline constexpr std::string_view kStatAttack = "attack";
inline constexpr std::string_view kStatSpeed = "speed";

/// Name given to every effect created by a Stun skill.
inline constexpr std::string_view kStunEffectName = "Stunned";

/// Largest stat, cost, duration, effect magnitude or reward that content
/// may declare.
inline constexpr int32_t kMaxContentValue = 1'000'000;

/// Largest skill power multiplier that content may declare.
inline constexpr double kMaxSkillPower = 100.0;

/// Narrow a 64-bit intermediate to int32_t, saturating at the limits.
constexpr int32_t saturateToInt32(int64_t value) {
    return static_cast<int32_t>(std::clamp<int64_t>(value, std::numeric_limits<int32_t>::min(),
                                                    std::numeric_limits<int32_t>::max()));
}

/// a + b without signed overflow.
constexpr int32_t saturatingAdd(int32_t a, int32_t b) {
    return saturateToInt32(static_cast<int64_t>(a) + b);
}

/// Clamp an already integral double into the int32_t range.
inline int32_t clampToInt32(double integral) {
    constexpr double lo = std::numeric_limits<int32_t>::min();
    constexpr double hi = std::numeric_limits<int32_t>::max();
    if (std::isnan(integral)) {
        return 0;
    }
    return static_cast<int32_t>(std::clamp(integral, lo, hi));
}

/// Round half away from zero, saturating at the int32_t limits.
inline int32_t roundToInt32(double value) { return clampToInt32(std::round(value)); }

/// Round toward negative infinity, saturating at the int32_t limits.
inline int32_t floorToInt32(double value) { return clampToInt32(std::floor(value)); }

/// Status effect behaviour.
enum class EffectType : uint8_t {
    StatModifier,    ///< Adds power to a named stat while active.
    DamageOverTime,  ///< Deals power damage on each end-of-turn tick.
    Stun             ///< Owner skips its action phase while active.
};

/// Skill behaviour; a closed set validated at content-load time.
enum class SkillType : uint8_t {
    Damage,
    Heal,
    Buff,
    Debuff,
    DamageOverTime,
    Stun
};

/// Combat session state; every state except Active is terminal.
enum class CombatState : uint8_t {
    Active,
    PlayerVictory,
    PlayerDefeat,
    PlayerFled
};

/// Player decision kinds accepted by CombatSession::SubmitAction.
enum class ActionKind : uint8_t {
    Attack,
    UseSkill,
    UseItem,
    Flee,
    Cancel,  ///< Sub-menu was closed without a choice.
    Wait     ///< Acknowledge a turn in which the player is stunned.
};

constexpr std::string_view effectTypeName(EffectType type) {
    switch (type) {
        case EffectType::StatModifier:   return "stat_mod";
        case EffectType::DamageOverTime: return "damage_over_time";
        case EffectType::Stun:           return "stun";
    }
    return "unknown";
}

constexpr std::string_view skillTypeName(SkillType type) {
    switch (type) {
        case SkillType::Damage:         return "damage";
        case SkillType::Heal:           return "heal";
        case SkillType::Buff:           return "buff";
        case SkillType::Debuff:         return "debuff";
        case SkillType::DamageOverTime: return "dot";
        case SkillType::Stun:           return "stun";
    }
    return "unknown";
}

constexpr std::string_view combatStateName(CombatState state) {
    switch (state) {
        case CombatState::Active:        return "Active";
        case CombatState::PlayerVictory: return "PlayerVictory";
        case CombatState::PlayerDefeat:  return "PlayerDefeat";
        case CombatState::PlayerFled:    return "PlayerFled";
    }
    return "Unknown";
}

/// True for every enumerator of SkillType.
constexpr bool isKnownSkillType(SkillType type) {
    return static_cast<uint8_t>(type) <= static_cast<uint8_t>(SkillType::Stun);
}

/// Parse a content-file skill type ("damage", "dot", "damage_over_time", ...).
constexpr std::optional<SkillType> parseSkillType(std::string_view name) {
    if (name == "damage") return SkillType::Damage;
    if (name == "heal") return SkillType::Heal;
    if (name == "buff") return SkillType::Buff;
    if (name == "debuff") return SkillType::Debuff;
    if (name == "dot" || name == "damage_over_time") return SkillType::DamageOverTime;
    if (name == "stun") return SkillType::Stun;
    return std::nullopt;
}

/// Heal and Buff skills act on the caster; everything else on the enemy.
constexpr bool skillTargetsCaster(SkillType type) {
    return type == SkillType::Heal || type == SkillType::Buff;
}

constexpr bool isTerminal(CombatState state) {
    return state != CombatState::Active;
}

}  // namespace dqe::game
