#pragma once

/// @file combat_runner.hpp
/// @brief CombatRunner and the renderer / input seams it drives.
///
/// The engine never prints or reads.  A front-end implements
/// CombatRenderer and ActionSource; CombatRunner connects them to a
/// CombatSession until the encounter ends.

#include <cstdint>
#include <string>
#include <vector>

#include "dqe/game/combat_session.hpp"

namespace dqe::game {

/// Read-only view of an encounter handed to the collaborators.
struct CombatSnapshot {
    const Player* player = nullptr;
    const Enemy* enemy = nullptr;
    const std::vector<std::string>* messages = nullptr;  ///< Whole session log.
    CombatState state = CombatState::Active;
    bool playerStunned = false;
    uint32_t turn = 0;

    static CombatSnapshot Of(const CombatSession& session);
};

/// Draws the current encounter.
class CombatRenderer {
public:
    virtual ~CombatRenderer() = default;

    virtual void Render(const CombatSnapshot& snapshot) = 0;
};

/// Supplies the player's next decision.
class ActionSource {
public:
    virtual ~ActionSource() = default;

    /// Asked only while the session is active and the player can act.
    virtual PlayerAction NextAction(const CombatSnapshot& snapshot) = 0;
};

/// Drives one encounter to a terminal state.
///
/// Each iteration renders, then either acknowledges a stunned turn with
/// PlayerAction::Wait or asks the ActionSource.  Declined actions are
/// rendered and asked again without advancing the turn.
class CombatRunner {
public:
    CombatRunner(CombatRenderer& renderer, ActionSource& source)
        : renderer_(&renderer), source_(&source) {}

    /// @return The terminal state reached.
    CombatState Run(CombatSession& session);

    /// Upper bound on SubmitAction calls before Run gives up and returns
    /// the current (still Active) state.  0 means unbounded.
    void SetActionLimit(uint32_t limit) noexcept { actionLimit_ = limit; }

private:
    CombatRenderer* renderer_;
    ActionSource* source_;
    uint32_t actionLimit_ = 0;
};

}  // namespace dqe::game
