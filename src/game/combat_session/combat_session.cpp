/// @file combat_session.cpp
/// @brief CombatSession implementation.
///
/// Turn order: player action -> enemy action -> status effect tick ->
/// termination check.  A victory or defeat found mid-turn ends the turn
/// immediately (the enemy does not act, the tick does not run).

#include "dqe/game/combat_session.hpp"

#include "dqe/foundation/game_logger.hpp"
#include "dqe/game/progression.hpp"
#include "dqe/game/status_effect_system.hpp"

namespace dqe::game {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

GameResult<CombatSession> CombatSession::Start(Player& player, Enemy& enemy,
                                               foundation::RandomSource& rng,
                                               const CombatRules& rules,
                                               const ProgressionRules& progression) {
    if (!player.stats.IsAlive()) {
        return GameResult<CombatSession>::err(
            GameError(ErrorCode::CombatantDefeated, player.name + " cannot fight at 0 HP"));
    }
    if (!enemy.stats.IsAlive()) {
        return GameResult<CombatSession>::err(
            GameError(ErrorCode::CombatantDefeated, enemy.name + " is already defeated"));
    }

    CombatSession session(player, enemy, rng, rules, progression);
    session.append("A wild " + enemy.name + " appears!");

    LogContext ctx;
    ctx.combatant = player.name;
    ctx.extra["enemy"] = enemy.name;
    foundation::GameLogger::instance().logWithContext(LogLevel::Info, LogCategory::Combat,
                                                      "encounter started", ctx);
    return GameResult<CombatSession>::ok(std::move(session));
}

CombatSession::CombatSession(Player& player, Enemy& enemy, foundation::RandomSource& rng,
                             const CombatRules& rules, const ProgressionRules& progression)
    : player_(&player),
      enemy_(&enemy),
      rng_(&rng),
      rules_(rules),
      progression_(progression),
      resolver_(rng, rules) {}

TurnOutcome CombatSession::SubmitAction(const PlayerAction& action) {
    const std::size_t mark = log_.size();

    if (IsFinished()) {
        GameError finished(ErrorCode::SessionFinished,
                           "The battle is already over (" +
                               std::string(combatStateName(state_)) + ").");
        DQE_LOG_WARN(LogCategory::Combat,
                     "action submitted to a finished session: " + finished.describe());
        return makeDeclined(mark, std::move(finished));
    }

    // 1. Player phase.
    if (IsPlayerStunned()) {
        append(player_->name + " is stunned and cannot act!");
    } else if (auto refused = resolvePlayerAction(action)) {
        return makeDeclined(mark, std::move(*refused));
    }

    ++turn_;

    if (IsFinished()) {
        return makeOutcome(mark, true);
    }
    if (!enemy_->stats.IsAlive()) {
        enterVictory();
        return makeOutcome(mark, true);
    }

    // 2. Enemy phase.
    enemyPhase();
    if (!player_->stats.IsAlive()) {
        enterDefeat();
        return makeOutcome(mark, true);
    }

    // 3. End of turn.
    endOfTurn();
    checkTermination();

    if (foundation::GameLogger::instance().isEnabled(LogLevel::Debug, LogCategory::Combat)) {
        LogContext ctx;
        ctx.turn = turn_;
        ctx.extra["player_hp"] = std::to_string(player_->stats.hp);
        ctx.extra["enemy_hp"] = std::to_string(enemy_->stats.hp);
        ctx.extra["state"] = std::string(combatStateName(state_));
        foundation::GameLogger::instance().logWithContext(LogLevel::Debug, LogCategory::Combat,
                                                          "turn resolved", ctx);
    }
    return makeOutcome(mark, true);
}

std::optional<GameError> CombatSession::resolvePlayerAction(const PlayerAction& action) {
    switch (action.kind) {
        case ActionKind::Attack:
            append(resolver_.BasicAttack(*player_, *enemy_).message);
            return std::nullopt;

        case ActionKind::UseSkill:
            return useSkill(action.index);

        case ActionKind::UseItem:
            return useItem(action.index);

        case ActionKind::Flee:
            if (rng_->chance() < rules_.fleeChance) {
                append(player_->name + " successfully fled!");
                enterFled();
            } else {
                append(player_->name + " couldn't escape!");
            }
            return std::nullopt;

        case ActionKind::Cancel:
            return GameError(ErrorCode::ActionCancelled, "Action cancelled.");

        case ActionKind::Wait:
            // Only meaningful while stunned, which never reaches here.
            DQE_LOG_DEBUG(LogCategory::Combat, "wait submitted while able to act");
            return GameError(ErrorCode::ActionCancelled, "Nothing to wait for.");
    }
    return GameError(ErrorCode::InvalidSelection, "Invalid action!");
}

std::optional<GameError> CombatSession::useSkill(std::size_t index) {
    if (index >= player_->skills.size()) {
        GameError invalid(ErrorCode::InvalidSelection, "Invalid skill selection!");
        append(std::string(invalid.message()));
        return invalid;
    }

    const Skill& skill = player_->skills[index];
    Combatant& target = skillTargetsCaster(skill.type)
                            ? static_cast<Combatant&>(*player_)
                            : static_cast<Combatant&>(*enemy_);

    auto result = resolver_.Resolve(*player_, target, skill);
    if (!result) {
        append(std::string(result.error().message()));
        return result.error();
    }
    append(std::move(result.value().message));
    return std::nullopt;
}

std::optional<GameError> CombatSession::useItem(std::size_t index) {
    auto result = player_->UseItem(index);
    if (!result) {
        append(std::string(result.error().message()));
        return result.error();
    }
    append(std::move(result.value()));
    return std::nullopt;
}

void CombatSession::enemyPhase() {
    if (enemy_->stats.statusEffects.IsStunned()) {
        append(enemy_->name + " is stunned and cannot act!");
        return;
    }
    append(resolver_.BasicAttack(*enemy_, *player_).message);
}

void CombatSession::endOfTurn() {
    for (auto& line : TickStatusEffects(player_->stats, player_->name)) {
        append(std::move(line));
    }
    for (auto& line : TickStatusEffects(enemy_->stats, enemy_->name)) {
        append(std::move(line));
    }
}

void CombatSession::checkTermination() {
    // Player death takes precedence when a tick drops both sides.
    if (!player_->stats.IsAlive()) {
        enterDefeat();
    } else if (!enemy_->stats.IsAlive()) {
        enterVictory();
    }
}

void CombatSession::enterVictory() {
    state_ = CombatState::PlayerVictory;
    append(enemy_->name + " defeated!");

    const int32_t oldLevel = player_->stats.level;
    GainExp(player_->stats, enemy_->expReward, progression_);
    player_->gold = saturatingAdd(player_->gold, enemy_->goldReward);

    append("Gained " + std::to_string(enemy_->expReward) + " EXP and " +
           std::to_string(enemy_->goldReward) + " gold!");
    if (player_->stats.level > oldLevel) {
        append("[LEVEL UP!] Now level " + std::to_string(player_->stats.level) + "!");
    }

    LogContext ctx;
    ctx.combatant = player_->name;
    ctx.turn = turn_;
    ctx.extra["enemy"] = enemy_->name;
    ctx.extra["exp"] = std::to_string(enemy_->expReward);
    ctx.extra["gold"] = std::to_string(enemy_->goldReward);
    foundation::GameLogger::instance().logWithContext(LogLevel::Info, LogCategory::Combat,
                                                      "player victory", ctx);
}

void CombatSession::enterDefeat() {
    state_ = CombatState::PlayerDefeat;
    append(player_->name + " has been defeated...");

    LogContext ctx;
    ctx.combatant = player_->name;
    ctx.turn = turn_;
    ctx.extra["enemy"] = enemy_->name;
    foundation::GameLogger::instance().logWithContext(LogLevel::Info, LogCategory::Combat,
                                                      "player defeat", ctx);
}

void CombatSession::enterFled() {
    state_ = CombatState::PlayerFled;
    DQE_LOG_INFO(LogCategory::Combat, player_->name + " fled from " + enemy_->name);
}

void CombatSession::append(std::string message) {
    log_.push_back(std::move(message));
}

TurnOutcome CombatSession::makeOutcome(std::size_t mark, bool consumed) const {
    TurnOutcome outcome;
    outcome.messages.assign(log_.begin() + static_cast<std::ptrdiff_t>(mark), log_.end());
    outcome.state = state_;
    outcome.turnConsumed = consumed;
    outcome.turn = turn_;
    return outcome;
}

TurnOutcome CombatSession::makeDeclined(std::size_t mark, GameError reason) const {
    TurnOutcome outcome = makeOutcome(mark, false);
    // A finished session has nothing left to ask for.
    outcome.requery = reason.code() != ErrorCode::SessionFinished;
    outcome.declined = std::move(reason);
    return outcome;
}

}  // namespace dqe::game
