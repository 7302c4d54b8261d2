/// @file content_catalog.cpp
/// @brief ContentCatalog: built-in tables, YAML loading and validation.

#include "dqe/game/content_catalog.hpp"

#include <algorithm>
#include <cctype>

#include "dqe/foundation/game_logger.hpp"

namespace dqe::game {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

namespace {

bool equalsIgnoreCase(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

Skill makeSkill(std::string name, std::string description, int32_t mpCost, SkillType type,
                double power, int32_t duration = 0,
                std::optional<std::string> statusEffectName = std::nullopt) {
    Skill skill;
    skill.name = std::move(name);
    skill.description = std::move(description);
    skill.mpCost = mpCost;
    skill.type = type;
    skill.power = power;
    skill.duration = duration;
    skill.statusEffectName = std::move(statusEffectName);
    return skill;
}

Item makeItem(std::string name, std::string description, std::string category,
              std::string_view resource, int32_t amount) {
    Item item;
    item.name = std::move(name);
    item.description = std::move(description);
    item.category = std::move(category);
    item.effect.emplace(std::string(resource), amount);
    return item;
}

GameError contentError(ErrorCode code, const std::string& message) {
    return GameError(code, message);
}

bool withinContentRange(int32_t value) {
    return value >= 0 && value <= kMaxContentValue;
}

const std::string kRangeText = " (at most " + std::to_string(kMaxContentValue) + ")";

// ── YAML field readers ──────────────────────────────────────────────────
// Each reader throws YAML::Exception on a malformed scalar; fromYaml turns
// that into ContentLoadFailed.

template <typename T>
GameResult<T> requiredField(const YAML::Node& node, const char* key, const std::string& where) {
    auto child = node[key];
    if (!child.IsDefined() || child.IsNull()) {
        return GameResult<T>::err(contentError(
            ErrorCode::InvalidContent, where + ": missing required field '" + key + "'"));
    }
    return GameResult<T>::ok(child.template as<T>());
}

template <typename T>
T optionalField(const YAML::Node& node, const char* key, T fallback) {
    auto child = node[key];
    if (!child.IsDefined() || child.IsNull()) {
        return fallback;
    }
    return child.template as<T>();
}

GameResult<Skill> parseSkill(const YAML::Node& node, const std::string& owner) {
    auto name = requiredField<std::string>(node, "name", owner + " skill");
    if (!name) {
        return GameResult<Skill>::err(name.error());
    }
    const std::string where = owner + " skill '" + name.value() + "'";

    auto typeName = requiredField<std::string>(node, "type", where);
    if (!typeName) {
        return GameResult<Skill>::err(typeName.error());
    }
    auto type = parseSkillType(typeName.value());
    if (!type) {
        return GameResult<Skill>::err(contentError(
            ErrorCode::UnknownSkillType, where + ": unknown skill type '" + typeName.value() + "'"));
    }

    Skill skill;
    skill.name = name.value();
    skill.description = optionalField<std::string>(node, "description", "");
    skill.mpCost = optionalField<int32_t>(node, "mp_cost", 0);
    skill.type = *type;
    skill.power = optionalField<double>(node, "power", 0.0);
    skill.duration = optionalField<int32_t>(node, "duration", 0);
    if (node["status_effect"].IsDefined() && !node["status_effect"].IsNull()) {
        skill.statusEffectName = node["status_effect"].as<std::string>();
    }
    return GameResult<Skill>::ok(std::move(skill));
}

GameResult<Item> parseItem(const YAML::Node& node) {
    auto name = requiredField<std::string>(node, "name", "starting item");
    if (!name) {
        return GameResult<Item>::err(name.error());
    }

    Item item;
    item.name = name.value();
    item.description = optionalField<std::string>(node, "description", "");
    item.category = optionalField<std::string>(node, "category", "misc");
    auto effect = node["effect"];
    if (effect.IsDefined() && !effect.IsNull()) {
        if (!effect.IsMap()) {
            return GameResult<Item>::err(contentError(
                ErrorCode::InvalidContent, "item '" + item.name + "': effect must be a mapping"));
        }
        for (auto it = effect.begin(); it != effect.end(); ++it) {
            item.effect.emplace(it->first.as<std::string>(), it->second.as<int32_t>());
        }
    }
    return GameResult<Item>::ok(std::move(item));
}

struct StatBlock {
    int32_t hp = 0;
    int32_t mp = 0;
    int32_t attack = 0;
    int32_t speed = 0;
    int32_t level = 1;
};

/// Classes always start at level 1, so only enemies may declare a level.
GameResult<StatBlock> parseStats(const YAML::Node& node, const std::string& where,
                                 bool levelAllowed) {
    auto stats = node["stats"];
    if (!stats.IsMap()) {
        return GameResult<StatBlock>::err(
            contentError(ErrorCode::InvalidContent, where + ": missing 'stats' mapping"));
    }
    if (!levelAllowed && stats["level"].IsDefined()) {
        return GameResult<StatBlock>::err(contentError(
            ErrorCode::InvalidContent, where + ": 'level' is not allowed, classes start at level 1"));
    }
    auto hp = requiredField<int32_t>(stats, "hp", where);
    if (!hp) {
        return GameResult<StatBlock>::err(hp.error());
    }
    StatBlock block;
    block.hp = hp.value();
    block.mp = optionalField<int32_t>(stats, "mp", 0);
    block.attack = optionalField<int32_t>(stats, "attack", 1);
    block.speed = optionalField<int32_t>(stats, "speed", 1);
    block.level = optionalField<int32_t>(stats, "level", 1);

    if (block.hp <= 0 || block.level < 1 || !withinContentRange(block.hp) ||
        !withinContentRange(block.mp) || !withinContentRange(block.attack) ||
        !withinContentRange(block.speed) || !withinContentRange(block.level)) {
        return GameResult<StatBlock>::err(contentError(
            ErrorCode::InvalidContent,
            where + ": stats need hp > 0, level >= 1 and non-negative mp/attack/speed" +
                kRangeText));
    }
    return GameResult<StatBlock>::ok(block);
}

}  // namespace

// ── Built-in content ────────────────────────────────────────────────────

ContentCatalog ContentCatalog::BuiltIn() {
    ContentCatalog catalog;

    catalog.classes_ = {
        ClassLoadout{"Warrior", "High HP, powerful physical attacks", 120, 30, 18, 8,
                     {makeSkill("Power Strike", "Heavy attack dealing 150% damage", 10,
                                SkillType::Damage, 1.5),
                      makeSkill("Whirlwind", "Spinning attack dealing 200% damage", 20,
                                SkillType::Damage, 2.0),
                      makeSkill("Battle Cry", "Boost attack by 30% for 3 turns", 15,
                                SkillType::Buff, 0.3, 3)}},
        ClassLoadout{"Ranger", "Balanced, quick ranged attacks", 100, 40, 15, 12,
                     {makeSkill("Rapid Shot", "Quick attack dealing 130% damage", 8,
                                SkillType::Damage, 1.3),
                      makeSkill("Piercing Arrow", "Armor-piercing shot dealing 180% damage", 15,
                                SkillType::Damage, 1.8)}},
        ClassLoadout{"Wizard", "High MP, devastating magic", 80, 60, 12, 10,
                     {makeSkill("Fireball", "Fire spell dealing 160% damage", 12,
                                SkillType::Damage, 1.6),
                      makeSkill("Poison Cloud", "Poison enemy for 50% attack/turn for 3 turns", 15,
                                SkillType::DamageOverTime, 0.5, 3, "Poison"),
                      makeSkill("Flame Curse", "Burn enemy for 40% attack/turn for 4 turns", 18,
                                SkillType::DamageOverTime, 0.4, 4, "Burn"),
                      makeSkill("Heal", "Restore HP based on 80% of attack", 15,
                                SkillType::Heal, 0.8)}},
        ClassLoadout{"Thief", "High speed, critical strikes", 90, 35, 14, 15,
                     {makeSkill("Backstab", "Critical strike dealing 170% damage", 10,
                                SkillType::Damage, 1.7),
                      makeSkill("Poison Blade", "Attack that poisons for 60% attack/turn for 3 turns",
                                12, SkillType::DamageOverTime, 0.6, 3, "Poison"),
                      makeSkill("Stunning Strike", "Stun enemy for 1 turn", 15,
                                SkillType::Stun, 0.0, 1)}},
    };

    catalog.enemies_ = {
        EnemyTemplate{"Goblin Scout", 40, 10, 10, 8, 1, 30, 15, "goblin"},
        EnemyTemplate{"Orc Warrior", 80, 20, 18, 6, 3, 75, 35, "orc"},
        EnemyTemplate{"Skeleton Archer", 60, 15, 14, 10, 2, 50, 25, "skeleton"},
        EnemyTemplate{"Slime", 30, 5, 6, 4, 1, 20, 10, "slime"},
    };

    catalog.startingItems_ = {
        makeItem("Health Potion", "Restores 40 HP", "potion", kResourceHp, 40),
        makeItem("Mana Potion", "Restores 30 MP", "ether", kResourceMp, 30),
        makeItem("Health Potion", "Restores 40 HP", "potion", kResourceHp, 40),
    };

    return catalog;
}

// ── Loading ─────────────────────────────────────────────────────────────

GameResult<ContentCatalog> ContentCatalog::LoadFromFile(const std::filesystem::path& path) {
    try {
        auto result = fromYaml(YAML::LoadFile(path.string()));
        if (!result) {
            DQE_LOG_ERROR(LogCategory::Content,
                          "rejected content file " + path.string() + ": " +
                          std::string(result.error().message()));
        } else {
            DQE_LOG_INFO(LogCategory::Content, "loaded content from " + path.string());
        }
        return result;
    } catch (const YAML::BadFile&) {
        return GameResult<ContentCatalog>::err(
            GameError(ErrorCode::ContentLoadFailed, "failed to open content file: " + path.string()));
    } catch (const YAML::ParserException& e) {
        return GameResult<ContentCatalog>::err(
            GameError(ErrorCode::ContentLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

GameResult<ContentCatalog> ContentCatalog::LoadFromString(std::string_view yaml) {
    try {
        return fromYaml(YAML::Load(std::string(yaml)));
    } catch (const YAML::ParserException& e) {
        return GameResult<ContentCatalog>::err(
            GameError(ErrorCode::ContentLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

GameResult<ContentCatalog> ContentCatalog::fromYaml(const YAML::Node& root) {
    if (!root.IsMap()) {
        return GameResult<ContentCatalog>::err(
            GameError(ErrorCode::ContentLoadFailed, "content root must be a mapping"));
    }

    ContentCatalog catalog;
    try {
        for (const auto& node : root["classes"]) {
            auto name = requiredField<std::string>(node, "name", "class");
            if (!name) {
                return GameResult<ContentCatalog>::err(name.error());
            }
            const std::string where = "class '" + name.value() + "'";
            auto stats = parseStats(node, where, false);
            if (!stats) {
                return GameResult<ContentCatalog>::err(stats.error());
            }

            ClassLoadout loadout;
            loadout.className = name.value();
            loadout.description = optionalField<std::string>(node, "description", "");
            loadout.maxHp = stats.value().hp;
            loadout.maxMp = stats.value().mp;
            loadout.attack = stats.value().attack;
            loadout.speed = stats.value().speed;
            for (const auto& skillNode : node["skills"]) {
                auto skill = parseSkill(skillNode, where);
                if (!skill) {
                    return GameResult<ContentCatalog>::err(skill.error());
                }
                loadout.skills.push_back(std::move(skill.value()));
            }

            auto registered = catalog.RegisterClass(std::move(loadout));
            if (!registered) {
                return GameResult<ContentCatalog>::err(registered.error());
            }
        }

        for (const auto& node : root["enemies"]) {
            auto name = requiredField<std::string>(node, "name", "enemy");
            if (!name) {
                return GameResult<ContentCatalog>::err(name.error());
            }
            auto stats = parseStats(node, "enemy '" + name.value() + "'", true);
            if (!stats) {
                return GameResult<ContentCatalog>::err(stats.error());
            }

            EnemyTemplate tmpl;
            tmpl.name = name.value();
            tmpl.maxHp = stats.value().hp;
            tmpl.maxMp = stats.value().mp;
            tmpl.attack = stats.value().attack;
            tmpl.speed = stats.value().speed;
            tmpl.level = stats.value().level;
            tmpl.expReward = optionalField<int32_t>(node, "exp_reward", 0);
            tmpl.goldReward = optionalField<int32_t>(node, "gold_reward", 0);
            tmpl.visual = optionalField<std::string>(node, "visual", "");

            auto registered = catalog.RegisterEnemy(std::move(tmpl));
            if (!registered) {
                return GameResult<ContentCatalog>::err(registered.error());
            }
        }

        for (const auto& node : root["starting_items"]) {
            auto item = parseItem(node);
            if (!item) {
                return GameResult<ContentCatalog>::err(item.error());
            }
            auto added = catalog.AddStartingItem(std::move(item.value()));
            if (!added) {
                return GameResult<ContentCatalog>::err(added.error());
            }
        }
    } catch (const YAML::Exception& e) {
        return GameResult<ContentCatalog>::err(
            GameError(ErrorCode::ContentLoadFailed, std::string("malformed content: ") + e.what()));
    }

    if (catalog.classes_.empty()) {
        return GameResult<ContentCatalog>::err(
            GameError(ErrorCode::InvalidContent, "content defines no playable class"));
    }
    return GameResult<ContentCatalog>::ok(std::move(catalog));
}

// ── Validation and registration ─────────────────────────────────────────

GameResult<void> ContentCatalog::ValidateSkill(const Skill& skill) {
    const std::string where = "skill '" + skill.name + "'";
    if (!isKnownSkillType(skill.type)) {
        return GameResult<void>::err(GameError(ErrorCode::UnknownSkillType,
                                               where + ": skill type outside the known set"));
    }
    if (skill.name.empty()) {
        return GameResult<void>::err(GameError(ErrorCode::InvalidContent, "skill without a name"));
    }
    if (!withinContentRange(skill.mpCost) || !withinContentRange(skill.duration)) {
        return GameResult<void>::err(GameError(
            ErrorCode::InvalidContent, where + ": mp_cost and duration must be >= 0" + kRangeText));
    }
    if (!(skill.power >= 0.0 && skill.power <= kMaxSkillPower)) {
        return GameResult<void>::err(GameError(
            ErrorCode::InvalidContent,
            where + ": power must be within [0, " +
                std::to_string(static_cast<int32_t>(kMaxSkillPower)) + "]"));
    }
    bool needsDuration = skill.type == SkillType::Buff || skill.type == SkillType::Debuff ||
                         skill.type == SkillType::DamageOverTime || skill.type == SkillType::Stun;
    if (needsDuration && skill.duration == 0) {
        return GameResult<void>::err(GameError(
            ErrorCode::InvalidContent, where + ": " + std::string(skillTypeName(skill.type)) +
                                           " skills need a positive duration"));
    }
    return GameResult<void>::ok();
}

GameResult<void> ContentCatalog::ValidateItem(const Item& item) {
    if (item.name.empty()) {
        return GameResult<void>::err(GameError(ErrorCode::InvalidContent, "item without a name"));
    }
    for (const auto& [resource, amount] : item.effect) {
        if (resource != kResourceHp && resource != kResourceMp) {
            return GameResult<void>::err(GameError(
                ErrorCode::InvalidContent,
                "item '" + item.name + "': unknown effect resource '" + resource + "'"));
        }
        if (!withinContentRange(amount)) {
            return GameResult<void>::err(GameError(
                ErrorCode::InvalidContent,
                "item '" + item.name + "': effect magnitude must be >= 0" + kRangeText));
        }
    }
    return GameResult<void>::ok();
}

GameResult<void> ContentCatalog::RegisterClass(ClassLoadout loadout) {
    if (FindClass(loadout.className) != nullptr) {
        return GameResult<void>::err(GameError(
            ErrorCode::DuplicateContent, "class '" + loadout.className + "' defined twice"));
    }
    if (loadout.maxHp <= 0 || !withinContentRange(loadout.maxHp) ||
        !withinContentRange(loadout.maxMp) || !withinContentRange(loadout.attack) ||
        !withinContentRange(loadout.speed)) {
        return GameResult<void>::err(GameError(
            ErrorCode::InvalidContent, "class '" + loadout.className + "' has invalid stats"));
    }
    for (const auto& skill : loadout.skills) {
        auto valid = ValidateSkill(skill);
        if (!valid) {
            return valid;
        }
    }
    classes_.push_back(std::move(loadout));
    return GameResult<void>::ok();
}

GameResult<void> ContentCatalog::RegisterEnemy(EnemyTemplate tmpl) {
    if (FindEnemy(tmpl.name) != nullptr) {
        return GameResult<void>::err(GameError(
            ErrorCode::DuplicateContent, "enemy '" + tmpl.name + "' defined twice"));
    }
    if (tmpl.maxHp <= 0 || tmpl.level < 1 || !withinContentRange(tmpl.maxHp) ||
        !withinContentRange(tmpl.maxMp) || !withinContentRange(tmpl.attack) ||
        !withinContentRange(tmpl.speed) || !withinContentRange(tmpl.level) ||
        !withinContentRange(tmpl.expReward) || !withinContentRange(tmpl.goldReward)) {
        return GameResult<void>::err(GameError(
            ErrorCode::InvalidContent,
            "enemy '" + tmpl.name + "' needs hp > 0, level >= 1 and non-negative stats and rewards" +
                kRangeText));
    }
    enemies_.push_back(std::move(tmpl));
    return GameResult<void>::ok();
}

GameResult<void> ContentCatalog::AddStartingItem(Item item) {
    auto valid = ValidateItem(item);
    if (!valid) {
        return valid;
    }
    startingItems_.push_back(std::move(item));
    return GameResult<void>::ok();
}

// ── Lookup and factories ────────────────────────────────────────────────

const ClassLoadout* ContentCatalog::FindClass(std::string_view className) const {
    auto it = std::find_if(classes_.begin(), classes_.end(), [className](const ClassLoadout& c) {
        return equalsIgnoreCase(c.className, className);
    });
    return it != classes_.end() ? &(*it) : nullptr;
}

const EnemyTemplate* ContentCatalog::FindEnemy(std::string_view name) const {
    auto it = std::find_if(enemies_.begin(), enemies_.end(), [name](const EnemyTemplate& e) {
        return equalsIgnoreCase(e.name, name);
    });
    return it != enemies_.end() ? &(*it) : nullptr;
}

GameResult<Player> ContentCatalog::CreatePlayer(std::string_view name,
                                                std::string_view className) const {
    const auto* loadout = FindClass(className);
    if (loadout == nullptr) {
        return GameResult<Player>::err(
            GameError(ErrorCode::NotFound, "unknown class: " + std::string(className)));
    }

    Player player;
    player.name = name.empty() ? std::string("Hero") : std::string(name);
    player.className = loadout->className;
    player.stats = Stats::Create(loadout->maxHp, loadout->maxMp, loadout->attack, loadout->speed);
    player.skills = loadout->skills;
    player.inventory = startingItems_;

    DQE_LOG_INFO(LogCategory::Content,
                 "created " + player.name + " the " + player.className);
    return GameResult<Player>::ok(std::move(player));
}

GameResult<Enemy> ContentCatalog::SpawnEnemy(std::string_view name) const {
    const auto* tmpl = FindEnemy(name);
    if (tmpl == nullptr) {
        return GameResult<Enemy>::err(
            GameError(ErrorCode::NotFound, "unknown enemy: " + std::string(name)));
    }

    Enemy enemy;
    enemy.name = tmpl->name;
    enemy.visual = tmpl->visual;
    enemy.stats = Stats::Create(tmpl->maxHp, tmpl->maxMp, tmpl->attack, tmpl->speed, tmpl->level);
    enemy.expReward = tmpl->expReward;
    enemy.goldReward = tmpl->goldReward;
    return GameResult<Enemy>::ok(std::move(enemy));
}

}  // namespace dqe::game
