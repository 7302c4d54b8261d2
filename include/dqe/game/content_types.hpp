#pragma once

/// @file content_types.hpp
/// @brief Static content definitions: Skill, Item, ClassLoadout, EnemyTemplate.
///
/// These are read-only after the content catalog is loaded.

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "dqe/game/combat_types.hpp"

namespace dqe::game {

/// Resource keys an item effect may restore.
inline constexpr std::string_view kResourceHp = "hp";
inline constexpr std::string_view kResourceMp = "mp";

/// A skill costing MP, resolved by SkillResolver.
struct Skill {
    std::string name;
    std::string description;
    int32_t mpCost = 0;
    SkillType type = SkillType::Damage;
    double power = 0.0;       ///< Multiplier over the caster's effective attack.
    int32_t duration = 0;     ///< Turns, for effect-creating types.
    std::optional<std::string> statusEffectName;  ///< Label for DOT effects.
};

/// A consumable; one instance is removed from the inventory per use.
struct Item {
    std::string name;
    std::string description;
    std::string category;                    ///< "potion", "ether", ...
    std::map<std::string, int32_t, std::less<>> effect;  ///< e.g. {"hp": 40}
};

/// Starting stats and ordered skill list of a playable class.
struct ClassLoadout {
    std::string className;
    std::string description;
    int32_t maxHp = 0;
    int32_t maxMp = 0;
    int32_t attack = 0;
    int32_t speed = 0;
    std::vector<Skill> skills;
};

/// Prototype from which fresh enemies are spawned.
struct EnemyTemplate {
    std::string name;
    int32_t maxHp = 0;
    int32_t maxMp = 0;
    int32_t attack = 0;
    int32_t speed = 0;
    int32_t level = 1;
    int32_t expReward = 0;
    int32_t goldReward = 0;
    std::string visual;
};

}  // namespace dqe::game
