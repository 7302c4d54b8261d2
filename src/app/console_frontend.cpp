/// @file console_frontend.cpp
/// @brief Terminal renderer, input source and exploration loop.

#include "dqe/app/console_frontend.hpp"

#include <algorithm>
#include <charconv>
#include <istream>
#include <ostream>
#include <string_view>
#include <system_error>

#include "dqe/foundation/game_logger.hpp"
#include "dqe/game/combat_types.hpp"
#include "dqe/game/status_effect_system.hpp"

namespace dqe::app {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;
using game::PlayerAction;

namespace {

/// Parse a menu number; std::nullopt for anything that is not an integer.
std::optional<int> parseChoice(std::string_view text) {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
        text.remove_prefix(1);
    }
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t' || text.back() == '\r')) {
        text.remove_suffix(1);
    }
    int value = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || end != text.data() + text.size() || text.empty()) {
        return std::nullopt;
    }
    return value;
}

void printCombatant(std::ostream& out, const game::Combatant& who, std::string_view label) {
    const auto& s = who.stats;
    out << "  " << label << "  Lv " << s.level
        << "  HP " << s.hp << '/' << s.maxHp
        << "  MP " << s.mp << '/' << s.maxMp
        << "  ATK " << s.EffectiveAttack() << "  SPD " << s.EffectiveSpeed()
        << "  Status: " << game::DescribeStatusEffects(s.statusEffects) << '\n';
}

std::optional<std::string> readLineFrom(std::istream& in, std::ostream& out,
                                        const std::string& prompt) {
    out << prompt << std::flush;
    std::string line;
    if (!std::getline(in, line)) {
        return std::nullopt;
    }
    return line;
}

} // namespace

// -- ConsoleRenderer ---------------------------------------------------------

void ConsoleRenderer::Render(const game::CombatSnapshot& snapshot) {
    auto& out = *out_;

    if (snapshot.messages != nullptr) {
        const auto& log = *snapshot.messages;
        if (printed_ > log.size()) {
            printed_ = 0;
        }
        for (std::size_t i = printed_; i < log.size(); ++i) {
            out << "> " << log[i] << '\n';
        }
        printed_ = log.size();
    }

    if (snapshot.state != game::CombatState::Active) {
        return;
    }

    out << "---- Turn " << (snapshot.turn + 1) << " ----\n";
    if (snapshot.player != nullptr) {
        printCombatant(out, *snapshot.player,
                       snapshot.player->name + " (" + snapshot.player->className + ")");
    }
    if (snapshot.enemy != nullptr) {
        printCombatant(out, *snapshot.enemy, snapshot.enemy->name);
    }
}

// -- ConsoleActionSource -----------------------------------------------------

std::optional<std::string> ConsoleActionSource::readLine(const std::string& prompt) {
    if (exhausted_) {
        return std::nullopt;
    }
    auto line = readLineFrom(*in_, *out_, prompt);
    if (!line) {
        exhausted_ = true;
        DQE_LOG_DEBUG(LogCategory::Core, "input exhausted; defaulting to basic attacks");
    }
    return line;
}

PlayerAction ConsoleActionSource::NextAction(const game::CombatSnapshot& snapshot) {
    while (true) {
        auto line = readLine("[1] Attack  [2] Skills  [3] Items  [4] Run\nChoose action: ");
        if (!line) {
            return PlayerAction::Attack();
        }

        switch (parseChoice(*line).value_or(-1)) {
            case 1:
                return PlayerAction::Attack();
            case 2:
                return chooseSkill(*snapshot.player);
            case 3:
                return chooseItem(*snapshot.player);
            case 4:
                return PlayerAction::Flee();
            default:
                *out_ << "Invalid choice!\n";
                break;
        }
    }
}

PlayerAction ConsoleActionSource::chooseSkill(const game::Player& player) {
    *out_ << "Skills:\n";
    for (std::size_t i = 0; i < player.skills.size(); ++i) {
        const auto& skill = player.skills[i];
        *out_ << "  [" << (i + 1) << "] " << skill.name << " (" << skill.mpCost << " MP) - "
              << skill.description << '\n';
    }
    *out_ << "  [0] Back\n";

    auto line = readLine("Choose skill: ");
    if (!line) {
        return PlayerAction::Attack();
    }
    auto choice = parseChoice(*line);
    if (choice && *choice == 0) {
        return PlayerAction::Cancel();
    }
    if (!choice || *choice < 0) {
        // Out of range on purpose: the session reports the invalid selection.
        return PlayerAction::UseSkill(player.skills.size());
    }
    return PlayerAction::UseSkill(static_cast<std::size_t>(*choice) - 1);
}

PlayerAction ConsoleActionSource::chooseItem(const game::Player& player) {
    if (player.inventory.empty()) {
        return PlayerAction::UseItem(0);
    }

    *out_ << "Items:\n";
    for (std::size_t i = 0; i < player.inventory.size(); ++i) {
        const auto& item = player.inventory[i];
        *out_ << "  [" << (i + 1) << "] " << item.name << " - " << item.description << '\n';
    }
    *out_ << "  [0] Back\n";

    auto line = readLine("Choose item: ");
    if (!line) {
        return PlayerAction::Attack();
    }
    auto choice = parseChoice(*line);
    if (choice && *choice == 0) {
        return PlayerAction::Cancel();
    }
    if (!choice || *choice < 0) {
        return PlayerAction::UseItem(player.inventory.size());
    }
    return PlayerAction::UseItem(static_cast<std::size_t>(*choice) - 1);
}

// -- ConsoleAdventure --------------------------------------------------------

std::optional<std::string> ConsoleAdventure::readLine(const std::string& prompt) {
    return readLineFrom(*in_, *out_, prompt);
}

GameResult<game::Player> ConsoleAdventure::createPlayer() {
    const auto& classes = settings_->content.Classes();

    *out_ << "\n==== CHARACTER CREATION ====\n";
    auto name = readLine("Enter your hero's name: ").value_or("");

    *out_ << "\nChoose your class:\n";
    for (std::size_t i = 0; i < classes.size(); ++i) {
        *out_ << "  [" << (i + 1) << "] " << classes[i].className << " - "
              << classes[i].description << '\n';
    }

    const std::string prompt = "Class choice (1-" + std::to_string(classes.size()) + "): ";
    while (true) {
        auto line = readLine(prompt);
        if (!line) {
            return GameResult<game::Player>::err(
                GameError(ErrorCode::InvalidArgument, "input ended before a class was chosen"));
        }
        auto choice = parseChoice(*line);
        if (choice && *choice >= 1 && static_cast<std::size_t>(*choice) <= classes.size()) {
            return settings_->content.CreatePlayer(
                name, classes[static_cast<std::size_t>(*choice) - 1].className);
        }
        *out_ << "Invalid choice!\n";
    }
}

GameResult<game::CombatState> ConsoleAdventure::explore(game::Player& player) {
    if (rng_->chance() >= kEncounterChance) {
        *out_ << "You find an empty chamber. The silence is eerie.\n";
        return GameResult<game::CombatState>::ok(game::CombatState::Active);
    }

    const auto& enemies = settings_->content.Enemies();
    if (enemies.empty()) {
        return GameResult<game::CombatState>::err(
            GameError(ErrorCode::NotFound, "content defines no enemies"));
    }
    auto pick = std::min(enemies.size() - 1,
                         static_cast<std::size_t>(rng_->chance() *
                                                  static_cast<double>(enemies.size())));
    auto enemy = settings_->content.SpawnEnemy(enemies[pick].name);
    if (!enemy) {
        return GameResult<game::CombatState>::err(enemy.error());
    }

    auto session = game::CombatSession::Start(player, enemy.value(), *rng_,
                                              settings_->combat, settings_->progression);
    if (!session) {
        return GameResult<game::CombatState>::err(session.error());
    }

    ConsoleRenderer renderer(*out_);
    ConsoleActionSource source(*in_, *out_);
    game::CombatRunner runner(renderer, source);
    return GameResult<game::CombatState>::ok(runner.Run(session.value()));
}

void ConsoleAdventure::searchForTreasure(game::Player& player) {
    if (rng_->chance() >= kTreasureChance) {
        *out_ << "You search thoroughly but find nothing of value.\n";
        return;
    }
    // Whole amounts from kTreasureGoldMin to kTreasureGoldMax inclusive.
    auto gold = std::min(kTreasureGoldMax,
                         game::floorToInt32(rng_->uniform(kTreasureGoldMin, kTreasureGoldMax + 1)));
    player.gold = game::saturatingAdd(player.gold, gold);
    DQE_LOG_DEBUG(LogCategory::Core, "treasure found: " + std::to_string(gold) + " gold");
    *out_ << "You found " << gold << " gold hidden in a dusty chest!\n";
}

GameResult<bool> ConsoleAdventure::Run() {
    *out_ << "==================================\n"
          << "   DUNGEON QUEST: ASCII ADVENTURE\n"
          << "==================================\n";

    auto created = createPlayer();
    if (!created) {
        return GameResult<bool>::err(created.error());
    }
    game::Player player = std::move(created.value());
    *out_ << '\n' << player.name << " the " << player.className
          << " is ready for adventure!\n";

    while (true) {
        const auto& s = player.stats;
        *out_ << "\n[" << player.name << " - " << player.className << "] LVL:" << s.level
              << " | HP:" << s.hp << '/' << s.maxHp << " | MP:" << s.mp << '/' << s.maxMp
              << " | Gold:" << player.gold << " | EXP:" << s.exp << '\n'
              << "  [1] Explore deeper\n  [2] Search for treasure\n  [3] Rest at campfire\n"
              << "  [4] Exit dungeon\n";

        auto line = readLine("Your choice: ");
        if (!line) {
            return GameResult<bool>::ok(true);
        }

        switch (parseChoice(*line).value_or(-1)) {
            case 1: {
                auto state = explore(player);
                if (!state) {
                    return GameResult<bool>::err(state.error());
                }
                if (state.value() == game::CombatState::PlayerDefeat) {
                    *out_ << "\n======== GAME OVER ========\n";
                    return GameResult<bool>::ok(false);
                }
                break;
            }
            case 2:
                searchForTreasure(player);
                break;
            case 3: {
                auto rest = game::RestAtCampfire(player.stats);
                *out_ << "You rest by the campfire. Recovered " << rest.hpRestored
                      << " HP and " << rest.mpRestored << " MP.\n";
                break;
            }
            case 4:
                *out_ << "You leave the dungeon with " << player.gold << " gold.\n";
                return GameResult<bool>::ok(true);
            default:
                *out_ << "Invalid choice!\n";
                break;
        }
    }
}

} // namespace dqe::app
