#pragma once

/// @file combatant.hpp
/// @brief Combatant, Player and Enemy: the two sides of an encounter.

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "dqe/foundation/game_result.hpp"
#include "dqe/game/content_types.hpp"
#include "dqe/game/stat_components.hpp"

namespace dqe::game {

/// State shared by both sides: a name and exclusively owned Stats.
struct Combatant {
    std::string name;
    Stats stats;
    std::string visual;  ///< Opaque art reference for the renderer.
};

/// The player character.  Classes differ only in their ClassLoadout.
struct Player : Combatant {
    std::string className;
    std::vector<Item> inventory;
    std::vector<Skill> skills;
    int32_t gold = 0;

    void AddItem(Item item) { inventory.push_back(std::move(item)); }

    /// Consume the inventory item at @p index and apply its effect once.
    ///
    /// @return The log line for the use, or EmptyInventory /
    ///         InvalidSelection (inventory untouched).
    foundation::GameResult<std::string> UseItem(std::size_t index);
};

/// An enemy; rewards are fixed for its lifetime.
struct Enemy : Combatant {
    int32_t expReward = 0;
    int32_t goldReward = 0;
};

/// Recovery granted by resting outside combat.
struct RestOutcome {
    int32_t hpRestored = 0;
    int32_t mpRestored = 0;
};

/// Rest at a campfire: heal maxHp / 3 and restore maxMp / 2.
RestOutcome RestAtCampfire(Stats& stats);

}  // namespace dqe::game
