/// @file combatant.cpp
/// @brief Player item use and out-of-combat rest.

#include "dqe/game/combatant.hpp"

#include "dqe/foundation/game_logger.hpp"

namespace dqe::game {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;

GameResult<std::string> Player::UseItem(std::size_t index) {
    if (inventory.empty()) {
        return GameResult<std::string>::err(
            GameError(ErrorCode::EmptyInventory, "You have no items!"));
    }
    if (index >= inventory.size()) {
        return GameResult<std::string>::err(
            GameError(ErrorCode::InvalidSelection, "Invalid item selection!"));
    }

    Item item = std::move(inventory[index]);
    inventory.erase(inventory.begin() + static_cast<std::ptrdiff_t>(index));

    std::string restored;
    auto appendPart = [&restored](const std::string& part) {
        restored += restored.empty() ? part : " and " + part;
    };

    if (auto it = item.effect.find(kResourceHp); it != item.effect.end()) {
        stats.Heal(it->second);
        appendPart(std::to_string(it->second) + " HP");
    }
    if (auto it = item.effect.find(kResourceMp); it != item.effect.end()) {
        stats.RestoreMp(it->second);
        appendPart(std::to_string(it->second) + " MP");
    }

    DQE_LOG_DEBUG(foundation::LogCategory::Combat, name + " consumed " + item.name);

    if (restored.empty()) {
        return GameResult<std::string>::ok("Used " + item.name + ".");
    }
    return GameResult<std::string>::ok("Used " + item.name + "! Restored " + restored + ".");
}

RestOutcome RestAtCampfire(Stats& stats) {
    RestOutcome outcome;
    outcome.hpRestored = stats.maxHp / 3;
    outcome.mpRestored = stats.maxMp / 2;
    stats.Heal(outcome.hpRestored);
    stats.RestoreMp(outcome.mpRestored);
    return outcome;
}

}  // namespace dqe::game
