/// @file status_effect_system.cpp
/// @brief Status effect tick, application logging and display text.

#include "dqe/game/status_effect_system.hpp"

#include <sstream>

#include "dqe/foundation/game_logger.hpp"

namespace dqe::game {

using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

std::vector<std::string> TickStatusEffects(Stats& stats, std::string_view owner) {
    std::vector<std::string> messages;
    std::vector<std::string> expired;

    // Index loop: TakeDamage never touches the effect list, but the list
    // must not be reshaped until the pass is over.
    for (std::size_t i = 0; i < stats.statusEffects.effects.size(); ++i) {
        auto& effect = stats.statusEffects.effects[i];

        if (effect.type == EffectType::DamageOverTime) {
            int32_t dealt = stats.TakeDamage(effect.power);
            messages.push_back("[DOT] " + effect.name + " deals " +
                               std::to_string(dealt) + " damage!");
        }

        effect.duration -= 1;
        if (effect.duration <= 0) {
            expired.push_back(effect.name);
            messages.push_back("[*] " + effect.name + " wore off!");
        }
    }

    for (const auto& name : expired) {
        stats.statusEffects.Remove(name);
    }

    if (!messages.empty()) {
        auto& logger = foundation::GameLogger::instance();
        if (logger.isEnabled(LogLevel::Debug, LogCategory::Status)) {
            LogContext ctx;
            ctx.combatant = std::string(owner);
            ctx.extra["hp"] = std::to_string(stats.hp);
            ctx.extra["expired"] = std::to_string(expired.size());
            ctx.extra["active"] = std::to_string(stats.statusEffects.Size());
            logger.logWithContext(LogLevel::Debug, LogCategory::Status,
                                  "status effects ticked", ctx);
        }
    }

    return messages;
}

StatusEffect& ApplyStatusEffect(Stats& stats, const StatusEffect& effect,
                                std::string_view owner) {
    bool merged = stats.statusEffects.Has(effect.name);
    auto& applied = stats.statusEffects.Add(effect);

    auto& logger = foundation::GameLogger::instance();
    if (logger.isEnabled(LogLevel::Debug, LogCategory::Status)) {
        LogContext ctx;
        ctx.combatant = std::string(owner);
        ctx.extra["effect"] = applied.name;
        ctx.extra["type"] = std::string(effectTypeName(applied.type));
        ctx.extra["power"] = std::to_string(applied.power);
        ctx.extra["duration"] = std::to_string(applied.duration);
        logger.logWithContext(LogLevel::Debug, LogCategory::Status,
                              merged ? "status effect refreshed" : "status effect applied",
                              ctx);
    }
    return applied;
}

std::string DescribeStatusEffects(const StatusEffectList& list) {
    if (list.Empty()) {
        return "None";
    }

    std::ostringstream oss;
    bool first = true;
    for (const auto& effect : list.effects) {
        if (!first) {
            oss << ", ";
        }
        first = false;

        switch (effect.type) {
            case EffectType::StatModifier:
                oss << effect.name << ' ' << (effect.power > 0 ? "+" : "") << effect.power
                    << " (" << effect.duration << "t)";
                break;
            case EffectType::DamageOverTime:
                oss << effect.name << ' ' << effect.power << "/turn (" << effect.duration << "t)";
                break;
            case EffectType::Stun:
                oss << effect.name << " (" << effect.duration << "t)";
                break;
        }
    }
    return oss.str();
}

}  // namespace dqe::game
