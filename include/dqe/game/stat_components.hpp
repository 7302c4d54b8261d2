#pragma once

/// @file stat_components.hpp
/// @brief Stat container components: StatusEffect, StatusEffectList, Stats.
///
/// Plain data with small invariant-keeping helpers.  The end-of-turn tick
/// that ages effects lives in status_effect_system.hpp.

#include <algorithm>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "dqe/game/combat_types.hpp"

namespace dqe::game {

// ── StatusEffect ────────────────────────────────────────────────────────

/// A temporary modifier, damage-over-time or stun on one combatant.
struct StatusEffect {
    std::string name;               ///< Identity key within one Stats.
    EffectType type = EffectType::StatModifier;
    std::string statAffected;       ///< StatModifier only ("attack", "speed").
    int32_t power = 0;              ///< Buff (+), debuff (-) or DOT tick damage.
    int32_t duration = 0;           ///< Turns remaining.

    static StatusEffect Modifier(std::string name, std::string_view stat,
                                 int32_t power, int32_t duration) {
        return {std::move(name), EffectType::StatModifier, std::string(stat), power, duration};
    }

    static StatusEffect DamageOverTime(std::string name, int32_t power, int32_t duration) {
        return {std::move(name), EffectType::DamageOverTime, {}, power, duration};
    }

    static StatusEffect Stun(int32_t duration) {
        return {std::string(kStunEffectName), EffectType::Stun, {}, 0, duration};
    }
};

// ── StatusEffectList ────────────────────────────────────────────────────

/// Active effects of one combatant, at most one entry per name.
struct StatusEffectList {
    std::vector<StatusEffect> effects;

    /// Add a new effect or merge it into the existing one of the same name.
    ///
    /// A merge keeps the longer duration; DamageOverTime effects also
    /// accumulate power, so several poison sources stack in damage but
    /// never in count.
    ///
    /// @return Reference to the added or merged entry.
    StatusEffect& Add(const StatusEffect& effect) {
        for (auto& existing : effects) {
            if (existing.name == effect.name) {
                existing.duration = std::max(existing.duration, effect.duration);
                if (effect.type == EffectType::DamageOverTime) {
                    existing.power = saturatingAdd(existing.power, effect.power);
                }
                return existing;
            }
        }
        effects.push_back(effect);
        return effects.back();
    }

    /// Remove the effect with the given name; no-op if absent.
    void Remove(std::string_view name) {
        std::erase_if(effects, [name](const StatusEffect& e) { return e.name == name; });
    }

    [[nodiscard]] bool Has(std::string_view name) const {
        return Find(name) != nullptr;
    }

    [[nodiscard]] const StatusEffect* Find(std::string_view name) const {
        auto it = std::find_if(effects.begin(), effects.end(),
                               [name](const StatusEffect& e) { return e.name == name; });
        return it != effects.end() ? &(*it) : nullptr;
    }

    [[nodiscard]] bool IsStunned() const {
        return std::any_of(effects.begin(), effects.end(),
                           [](const StatusEffect& e) { return e.type == EffectType::Stun; });
    }

    /// Sum of StatModifier power affecting @p stat.
    [[nodiscard]] int32_t StatModifierTotal(std::string_view stat) const {
        int32_t total = 0;
        for (const auto& e : effects) {
            if (e.type == EffectType::StatModifier && e.statAffected == stat) {
                total = saturatingAdd(total, e.power);
            }
        }
        return total;
    }

    [[nodiscard]] bool Empty() const noexcept { return effects.empty(); }
    [[nodiscard]] std::size_t Size() const noexcept { return effects.size(); }
};

// ── Stats ───────────────────────────────────────────────────────────────

/// Resource pools, base combat stats, progression and status effects of
/// one combatant.
///
/// Mutators keep 0 <= hp <= maxHp and 0 <= mp <= maxMp.
struct Stats {
    int32_t hp = 0;
    int32_t maxHp = 0;
    int32_t mp = 0;
    int32_t maxMp = 0;
    int32_t attack = 0;
    int32_t speed = 0;
    int32_t level = 1;
    int32_t exp = 0;
    StatusEffectList statusEffects;

    /// Full pools at the given maxima.
    static Stats Create(int32_t maxHp, int32_t maxMp, int32_t attack,
                        int32_t speed, int32_t level = 1) {
        Stats s;
        s.hp = maxHp;
        s.maxHp = maxHp;
        s.mp = maxMp;
        s.maxMp = maxMp;
        s.attack = attack;
        s.speed = speed;
        s.level = level;
        return s;
    }

    /// Apply damage, never less than 1 point.
    ///
    /// @return Damage actually dealt (max(1, amount)).
    int32_t TakeDamage(int32_t amount) noexcept {
        int32_t actual = std::max(1, amount);
        hp = std::max(0, hp - actual);
        return actual;
    }

    /// Heal up to maxHp.
    ///
    /// @return max(1, amount).  Near full health this overstates the
    ///         real HP delta; callers report it as-is.
    int32_t Heal(int32_t amount) noexcept {
        int32_t reported = std::max(1, amount);
        hp = saturateToInt32(std::clamp<int64_t>(static_cast<int64_t>(hp) + amount, 0, maxHp));
        return reported;
    }

    /// Spend MP if enough is available.
    ///
    /// @return false (and no change) when mp < amount.
    bool UseMp(int32_t amount) noexcept {
        if (mp < amount) {
            return false;
        }
        mp = saturateToInt32(static_cast<int64_t>(mp) - amount);
        return true;
    }

    void RestoreMp(int32_t amount) noexcept {
        mp = saturateToInt32(std::clamp<int64_t>(static_cast<int64_t>(mp) + amount, 0, maxMp));
    }

    [[nodiscard]] bool IsAlive() const noexcept { return hp > 0; }

    [[nodiscard]] int32_t EffectiveAttack() const {
        return std::max(1, saturatingAdd(attack, statusEffects.StatModifierTotal(kStatAttack)));
    }

    [[nodiscard]] int32_t EffectiveSpeed() const {
        return std::max(1, saturatingAdd(speed, statusEffects.StatModifierTotal(kStatSpeed)));
    }
};

}  // namespace dqe::game
