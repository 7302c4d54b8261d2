#pragma once

/// @file content_catalog.hpp
/// @brief ContentCatalog: class loadouts, enemy templates and starting items.
///
/// Content is loaded once at startup and read-only afterwards.  Every skill
/// type is checked against the closed SkillType set while loading, so a
/// malformed definition never reaches a combat session.

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "dqe/foundation/game_result.hpp"
#include "dqe/game/combatant.hpp"
#include "dqe/game/content_types.hpp"

namespace dqe::game {

/// Static content tables and factories for fresh combatants.
///
/// YAML layout accepted by LoadFromFile / LoadFromString:
/// @code
///   classes:
///     - name: Warrior
///       stats: {hp: 120, mp: 30, attack: 18, speed: 8}
///       skills:
///         - {name: Power Strike, mp_cost: 10, type: damage, power: 1.5}
///   enemies:
///     - name: Slime
///       stats: {hp: 30, mp: 5, attack: 6, speed: 4, level: 1}
///       exp_reward: 20
///       gold_reward: 10
///   starting_items:
///     - {name: Health Potion, category: potion, effect: {hp: 40}}
/// @endcode
class ContentCatalog {
public:
    ContentCatalog() = default;

    /// The stock Dungeon Quest content: Warrior, Wizard, Ranger and Thief;
    /// Goblin Scout, Orc Warrior, Skeleton Archer and Slime; two Health
    /// Potions and one Mana Potion to start.
    static ContentCatalog BuiltIn();

    static foundation::GameResult<ContentCatalog> LoadFromFile(const std::filesystem::path& path);
    static foundation::GameResult<ContentCatalog> LoadFromString(std::string_view yaml);

    /// Reject skills whose type, cost, power or duration is malformed.
    static foundation::GameResult<void> ValidateSkill(const Skill& skill);

    /// Reject items with an unknown resource key or a negative magnitude.
    static foundation::GameResult<void> ValidateItem(const Item& item);

    /// Add a class; DuplicateContent if the name is taken.
    foundation::GameResult<void> RegisterClass(ClassLoadout loadout);

    /// Add an enemy template; DuplicateContent if the name is taken.
    foundation::GameResult<void> RegisterEnemy(EnemyTemplate tmpl);

    foundation::GameResult<void> AddStartingItem(Item item);

    [[nodiscard]] const ClassLoadout* FindClass(std::string_view className) const;
    [[nodiscard]] const EnemyTemplate* FindEnemy(std::string_view name) const;

    [[nodiscard]] const std::vector<ClassLoadout>& Classes() const noexcept { return classes_; }
    [[nodiscard]] const std::vector<EnemyTemplate>& Enemies() const noexcept { return enemies_; }
    [[nodiscard]] const std::vector<Item>& StartingItems() const noexcept { return startingItems_; }

    /// A level 1 player of @p className carrying the starting items.
    /// An empty @p name becomes "Hero".
    [[nodiscard]] foundation::GameResult<Player> CreatePlayer(std::string_view name,
                                                              std::string_view className) const;

    /// A fresh enemy at full HP/MP from the template named @p name.
    [[nodiscard]] foundation::GameResult<Enemy> SpawnEnemy(std::string_view name) const;

private:
    static foundation::GameResult<ContentCatalog> fromYaml(const YAML::Node& root);

    std::vector<ClassLoadout> classes_;
    std::vector<EnemyTemplate> enemies_;
    std::vector<Item> startingItems_;
};

}  // namespace dqe::game
