#pragma once

/// @file console_frontend.hpp
/// @brief Line-oriented terminal front-end for dungeon_quest.
///
/// ConsoleRenderer and ConsoleActionSource plug into game::CombatRunner;
/// ConsoleAdventure owns the character creation and exploration loop
/// around the encounters.

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>

#include "dqe/app/app_support.hpp"
#include "dqe/foundation/random_source.hpp"
#include "dqe/game/combat_runner.hpp"

namespace dqe::app {

/// Prints new combat log lines and both combatants' stat blocks.
class ConsoleRenderer : public game::CombatRenderer {
public:
    explicit ConsoleRenderer(std::ostream& out) : out_(&out) {}

    void Render(const game::CombatSnapshot& snapshot) override;

    /// Forget which log lines were printed; call between encounters.
    void Reset() noexcept { printed_ = 0; }

private:
    std::ostream* out_;
    std::size_t printed_ = 0;
};

/// Reads the player's choice from a text stream.
///
/// Main menu: 1 attack, 2 skills, 3 items, 4 run.  Inside the skill or
/// item menu, 0 backs out (PlayerAction::Cancel).  At end of input every
/// request is answered with a basic attack so that a scripted session
/// always terminates.
class ConsoleActionSource : public game::ActionSource {
public:
    ConsoleActionSource(std::istream& in, std::ostream& out) : in_(&in), out_(&out) {}

    game::PlayerAction NextAction(const game::CombatSnapshot& snapshot) override;

    [[nodiscard]] bool Exhausted() const noexcept { return exhausted_; }

private:
    std::optional<std::string> readLine(const std::string& prompt);
    game::PlayerAction chooseSkill(const game::Player& player);
    game::PlayerAction chooseItem(const game::Player& player);

    std::istream* in_;
    std::ostream* out_;
    bool exhausted_ = false;
};

/// Character creation followed by the explore / search / rest loop.
class ConsoleAdventure {
public:
    /// Chance that exploring deeper leads to an encounter.
    static constexpr double kEncounterChance = 0.7;
    /// Chance that searching turns up a chest.
    static constexpr double kTreasureChance = 0.4;
    static constexpr int32_t kTreasureGoldMin = 10;
    static constexpr int32_t kTreasureGoldMax = 30;

    ConsoleAdventure(EngineSettings& settings, foundation::RandomSource& rng,
                     std::istream& in, std::ostream& out)
        : settings_(&settings), rng_(&rng), in_(&in), out_(&out) {}

    /// Play until the player exits, dies or input runs out.
    ///
    /// @return false if the hero was defeated.
    foundation::GameResult<bool> Run();

private:
    foundation::GameResult<game::Player> createPlayer();
    foundation::GameResult<game::CombatState> explore(game::Player& player);
    void searchForTreasure(game::Player& player);
    std::optional<std::string> readLine(const std::string& prompt);

    EngineSettings* settings_;
    foundation::RandomSource* rng_;
    std::istream* in_;
    std::ostream* out_;
};

} // namespace dqe::app
