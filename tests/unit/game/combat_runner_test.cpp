#include <gtest/gtest.h>

#include <deque>
#include <vector>

#include "dqe/game/combat_runner.hpp"
#include "support/mock_logger.hpp"
#include "support/scripted_random_source.hpp"

using namespace dqe::game;
using dqe::test::ScopedMockLogger;
using dqe::test::ScriptedRandomSource;

namespace {

/// Records what each Render call saw.
class RecordingRenderer : public CombatRenderer {
public:
    void Render(const CombatSnapshot& snapshot) override {
        turns.push_back(snapshot.turn);
        states.push_back(snapshot.state);
        stunned.push_back(snapshot.playerStunned);
        lastLogSize = snapshot.messages->size();
    }

    std::vector<uint32_t> turns;
    std::vector<CombatState> states;
    std::vector<bool> stunned;
    std::size_t lastLogSize = 0;
};

/// Replays a fixed list of actions, then attacks.
class ScriptedActionSource : public ActionSource {
public:
    explicit ScriptedActionSource(std::deque<PlayerAction> script = {})
        : script_(std::move(script)) {}

    PlayerAction NextAction(const CombatSnapshot& snapshot) override {
        ++asked;
        sawStunned = sawStunned || snapshot.playerStunned;
        if (script_.empty()) {
            return PlayerAction::Attack();
        }
        auto action = script_.front();
        script_.pop_front();
        return action;
    }

    int asked = 0;
    bool sawStunned = false;

private:
    std::deque<PlayerAction> script_;
};

} // namespace

class CombatRunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        player_.name = "Hero";
        player_.stats = Stats::Create(100, 20, 10, 8);
        Skill strike;
        strike.name = "Power Strike";
        strike.type = SkillType::Damage;
        strike.power = 1.5;
        strike.mpCost = 10;
        player_.skills.push_back(strike);

        enemy_.name = "Slime";
        enemy_.stats = Stats::Create(30, 5, 6, 4);
        enemy_.expReward = 20;
        enemy_.goldReward = 10;
    }

    CombatSession begin() {
        auto started = CombatSession::Start(player_, enemy_, rng_);
        EXPECT_TRUE(started.hasValue());
        return std::move(started).value();
    }

    Player player_;
    Enemy enemy_;
    ScriptedRandomSource rng_;
    RecordingRenderer renderer_;
};

TEST_F(CombatRunnerTest, RunsToVictoryAndRendersFinalState) {
    auto session = begin();
    ScriptedActionSource source;
    CombatRunner runner(renderer_, source);

    EXPECT_EQ(runner.Run(session), CombatState::PlayerVictory);
    EXPECT_EQ(source.asked, 3);
    EXPECT_EQ(renderer_.turns, (std::vector<uint32_t>{0, 1, 2, 3}));
    EXPECT_EQ(renderer_.states.back(), CombatState::PlayerVictory);
    EXPECT_EQ(renderer_.lastLogSize, session.Messages().size());
    EXPECT_EQ(player_.gold, 10);
}

TEST_F(CombatRunnerTest, DeclinedActionsAreAskedAgain) {
    player_.stats.mp = 0;
    auto session = begin();
    ScriptedActionSource source({PlayerAction::UseSkill(0), PlayerAction::Cancel(),
                                 PlayerAction::UseSkill(5)});
    CombatRunner runner(renderer_, source);

    EXPECT_EQ(runner.Run(session), CombatState::PlayerVictory);
    EXPECT_EQ(source.asked, 6);
    EXPECT_EQ(session.Turn(), 3u);
    // Three declined submissions re-render at turn 0.
    EXPECT_EQ(renderer_.turns[0], 0u);
    EXPECT_EQ(renderer_.turns[3], 0u);
    EXPECT_EQ(renderer_.turns[4], 1u);
}

TEST_F(CombatRunnerTest, StunnedTurnsAreAcknowledgedWithoutAsking) {
    player_.stats.statusEffects.Add(StatusEffect::Stun(2));
    auto session = begin();
    ScriptedActionSource source;
    CombatRunner runner(renderer_, source);

    EXPECT_EQ(runner.Run(session), CombatState::PlayerVictory);
    EXPECT_FALSE(source.sawStunned);
    EXPECT_EQ(source.asked, 3);
    EXPECT_EQ(session.Turn(), 5u);
    ASSERT_GE(renderer_.stunned.size(), 3u);
    EXPECT_TRUE(renderer_.stunned[0]);
    EXPECT_TRUE(renderer_.stunned[1]);
    EXPECT_FALSE(renderer_.stunned[2]);
}

TEST_F(CombatRunnerTest, FleeEndsRun) {
    rng_.queueChance(0.2);
    auto session = begin();
    ScriptedActionSource source({PlayerAction::Flee()});
    CombatRunner runner(renderer_, source);

    EXPECT_EQ(runner.Run(session), CombatState::PlayerFled);
    EXPECT_EQ(source.asked, 1);
    EXPECT_EQ(renderer_.states.back(), CombatState::PlayerFled);
}

TEST_F(CombatRunnerTest, ActionLimitLeavesEncounterActive) {
    ScopedMockLogger sink;
    auto session = begin();
    ScriptedActionSource source({PlayerAction::Cancel(), PlayerAction::Cancel(),
                                 PlayerAction::Cancel()});
    CombatRunner runner(renderer_, source);
    runner.SetActionLimit(2);

    EXPECT_EQ(runner.Run(session), CombatState::Active);
    EXPECT_EQ(source.asked, 2);
    EXPECT_FALSE(session.IsFinished());
    EXPECT_TRUE(sink->contains("action limit reached"));
}

TEST(CombatSnapshotTest, ReflectsSession) {
    Player player;
    player.name = "Hero";
    player.stats = Stats::Create(50, 10, 5, 5);
    player.stats.statusEffects.Add(StatusEffect::Stun(1));
    Enemy enemy;
    enemy.name = "Slime";
    enemy.stats = Stats::Create(30, 5, 6, 4);
    ScriptedRandomSource rng;

    auto started = CombatSession::Start(player, enemy, rng);
    ASSERT_TRUE(started.hasValue());
    auto snapshot = CombatSnapshot::Of(started.value());
    EXPECT_EQ(snapshot.player, &player);
    EXPECT_EQ(snapshot.enemy, &enemy);
    EXPECT_EQ(snapshot.state, CombatState::Active);
    EXPECT_TRUE(snapshot.playerStunned);
    EXPECT_EQ(snapshot.turn, 0u);
    ASSERT_EQ(snapshot.messages->size(), 1u);
    EXPECT_EQ(snapshot.messages->front(), "A wild Slime appears!");
}
