#pragma once

/// @file combat_session.hpp
/// @brief CombatSession: the turn state machine of one encounter.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "dqe/foundation/game_result.hpp"
#include "dqe/foundation/random_source.hpp"
#include "dqe/game/combat_rules.hpp"
#include "dqe/game/combat_types.hpp"
#include "dqe/game/combatant.hpp"
#include "dqe/game/skill_resolver.hpp"

namespace dqe::game {

/// One player decision.
struct PlayerAction {
    ActionKind kind = ActionKind::Attack;
    std::size_t index = 0;  ///< Skill or inventory index for UseSkill / UseItem.

    static PlayerAction Attack() { return {ActionKind::Attack, 0}; }
    static PlayerAction UseSkill(std::size_t i) { return {ActionKind::UseSkill, i}; }
    static PlayerAction UseItem(std::size_t i) { return {ActionKind::UseItem, i}; }
    static PlayerAction Flee() { return {ActionKind::Flee, 0}; }
    static PlayerAction Cancel() { return {ActionKind::Cancel, 0}; }
    static PlayerAction Wait() { return {ActionKind::Wait, 0}; }
};

/// What one SubmitAction call did.
struct TurnOutcome {
    std::vector<std::string> messages;  ///< Log lines appended by this call.
    CombatState state = CombatState::Active;
    bool requery = false;        ///< Action cancelled/declined; ask again.
    bool turnConsumed = false;   ///< A full or terminal turn was resolved.
    uint32_t turn = 0;           ///< Turns resolved so far.

    /// Set when the action was refused: a Combat-range code (InsufficientMana,
    /// InvalidSelection, EmptyInventory, ActionCancelled, SessionFinished).
    std::optional<foundation::GameError> declined;
};

/// Turn state machine for one player-versus-enemy encounter.
///
/// Each accepted turn runs:
///   1. Player action (skipped while the player is stunned)
///   2. Enemy basic attack (skipped while the enemy is stunned)
///   3. End-of-turn status effect tick, player first, then enemy
/// and then checks both sides' HP.  Victory, defeat and flight are
/// terminal; the session then rejects further actions.
///
/// The session references the combatants and the random source; all
/// three must outlive it.
///
/// Example:
/// @code
///   auto started = CombatSession::Start(player, enemy, rng);
///   auto& session = started.value();
///   while (!session.IsFinished()) {
///       auto outcome = session.SubmitAction(PlayerAction::Attack());
///   }
/// @endcode
class CombatSession {
public:
    /// Begin an encounter.
    ///
    /// @return The session with "A wild <enemy> appears!" logged, or
    ///         CombatantDefeated if either side is already at 0 HP.
    static foundation::GameResult<CombatSession> Start(Player& player, Enemy& enemy,
                                                       foundation::RandomSource& rng,
                                                       const CombatRules& rules = {},
                                                       const ProgressionRules& progression = {});

    /// Consume one player decision and advance the state machine.
    ///
    /// While the player is stunned the action is ignored and the stunned
    /// turn is resolved.  Cancelled, invalid or unaffordable choices leave
    /// the state untouched, set TurnOutcome::requery and report the reason
    /// in TurnOutcome::declined.  A finished session declines every action
    /// with SessionFinished and requery unset.
    TurnOutcome SubmitAction(const PlayerAction& action);

    [[nodiscard]] CombatState State() const noexcept { return state_; }
    [[nodiscard]] bool IsFinished() const noexcept { return isTerminal(state_); }
    [[nodiscard]] const std::vector<std::string>& Messages() const noexcept { return log_; }
    [[nodiscard]] uint32_t Turn() const noexcept { return turn_; }
    [[nodiscard]] bool IsPlayerStunned() const { return player_->stats.statusEffects.IsStunned(); }

    [[nodiscard]] const Player& GetPlayer() const noexcept { return *player_; }
    [[nodiscard]] const Enemy& GetEnemy() const noexcept { return *enemy_; }

private:
    CombatSession(Player& player, Enemy& enemy, foundation::RandomSource& rng,
                  const CombatRules& rules, const ProgressionRules& progression);

    /// Run the player's chosen action.
    /// @return The reason the action was declined, or nullopt when it
    ///         consumed the turn.
    std::optional<foundation::GameError> resolvePlayerAction(const PlayerAction& action);

    std::optional<foundation::GameError> useSkill(std::size_t index);
    std::optional<foundation::GameError> useItem(std::size_t index);
    void enemyPhase();
    void endOfTurn();
    void checkTermination();
    void enterVictory();
    void enterDefeat();
    void enterFled();

    void append(std::string message);
    TurnOutcome makeOutcome(std::size_t mark, bool consumed) const;
    TurnOutcome makeDeclined(std::size_t mark, foundation::GameError reason) const;

    Player* player_;
    Enemy* enemy_;
    foundation::RandomSource* rng_;
    CombatRules rules_;
    ProgressionRules progression_;
    SkillResolver resolver_;
    std::vector<std::string> log_;
    CombatState state_ = CombatState::Active;
    uint32_t turn_ = 0;
};

}  // namespace dqe::game
