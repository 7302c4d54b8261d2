/// @file combat_runner.cpp
/// @brief CombatRunner implementation.

#include "dqe/game/combat_runner.hpp"

#include "dqe/foundation/game_logger.hpp"

namespace dqe::game {

using foundation::LogCategory;

CombatSnapshot CombatSnapshot::Of(const CombatSession& session) {
    CombatSnapshot snapshot;
    snapshot.player = &session.GetPlayer();
    snapshot.enemy = &session.GetEnemy();
    snapshot.messages = &session.Messages();
    snapshot.state = session.State();
    snapshot.playerStunned = session.IsPlayerStunned();
    snapshot.turn = session.Turn();
    return snapshot;
}

CombatState CombatRunner::Run(CombatSession& session) {
    uint32_t submitted = 0;

    while (!session.IsFinished()) {
        if (actionLimit_ != 0 && submitted >= actionLimit_) {
            DQE_LOG_WARN(LogCategory::Combat,
                         "action limit reached after " + std::to_string(submitted) +
                         " submissions; leaving encounter unresolved");
            return session.State();
        }

        auto snapshot = CombatSnapshot::Of(session);
        renderer_->Render(snapshot);

        PlayerAction action = snapshot.playerStunned ? PlayerAction::Wait()
                                                     : source_->NextAction(snapshot);
        session.SubmitAction(action);
        ++submitted;
    }

    renderer_->Render(CombatSnapshot::Of(session));
    return session.State();
}

}  // namespace dqe::game
