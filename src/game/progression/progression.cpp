/// @file progression.cpp
/// @brief Experience and level-up rules.

#include "dqe/game/progression.hpp"

#include <limits>
#include <string>

#include "dqe/foundation/game_logger.hpp"

namespace dqe::game {

namespace {

int32_t grown(int32_t value, double rate) {
    return saturatingAdd(value, floorToInt32(static_cast<double>(value) * rate));
}

}  // namespace

int32_t GainExp(Stats& stats, int32_t amount, const ProgressionRules& rules) {
    stats.exp = saturatingAdd(stats.exp, amount);

    int32_t gained = 0;
    for (;;) {
        const int32_t threshold = ExpThreshold(stats.level, rules);
        if (stats.exp < threshold) {
            break;
        }
        LevelUp(stats, rules);
        ++gained;
        // A saturated threshold never grows, so cascading would not stop.
        if (!rules.cascadeLevelUps || rules.expPerLevel <= 0 ||
            threshold == std::numeric_limits<int32_t>::max()) {
            break;
        }
    }
    return gained;
}

void LevelUp(Stats& stats, const ProgressionRules& rules) {
    stats.level = saturatingAdd(stats.level, 1);
    stats.maxHp = grown(stats.maxHp, rules.growthRate);
    stats.maxMp = grown(stats.maxMp, rules.growthRate);
    stats.hp = stats.maxHp;
    stats.mp = stats.maxMp;
    stats.attack = grown(stats.attack, rules.growthRate);
    stats.speed = saturatingAdd(stats.speed, 1);

    DQE_LOG_INFO(foundation::LogCategory::Progression,
                 "level up to " + std::to_string(stats.level) +
                 " (maxHp=" + std::to_string(stats.maxHp) +
                 ", maxMp=" + std::to_string(stats.maxMp) +
                 ", attack=" + std::to_string(stats.attack) + ")");
}

}  // namespace dqe::game
