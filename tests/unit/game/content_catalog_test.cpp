#include <gtest/gtest.h>

#include <cmath>
#include <filesystem>
#include <limits>
#include <fstream>
#include <string>

#include "dqe/foundation/error_code.hpp"
#include "dqe/game/content_catalog.hpp"

using namespace dqe::game;
using dqe::foundation::ErrorCode;

namespace {

constexpr const char* kMinimalContent = R"(
classes:
  - name: Paladin
    description: Holy knight
    stats: {hp: 110, mp: 40, attack: 16, speed: 7}
    skills:
      - {name: Smite, mp_cost: 12, type: damage, power: 1.4}
      - {name: Lay on Hands, mp_cost: 20, type: heal, power: 1.0}
      - {name: Sear, mp_cost: 10, type: damage_over_time, power: 0.3, duration: 2, status_effect: Burn}
enemies:
  - name: Bat
    stats: {hp: 15, attack: 4, speed: 14}
    exp_reward: 8
    gold_reward: 3
starting_items:
  - {name: Elixir, category: potion, effect: {hp: 25, mp: 25}}
)";

} // namespace

// ===========================================================================
// Built-in tables
// ===========================================================================

TEST(ContentCatalogBuiltInTest, HasFourClassesWithTheirLoadouts) {
    auto catalog = ContentCatalog::BuiltIn();
    ASSERT_EQ(catalog.Classes().size(), 4u);

    const auto* warrior = catalog.FindClass("Warrior");
    ASSERT_NE(warrior, nullptr);
    EXPECT_EQ(warrior->maxHp, 120);
    EXPECT_EQ(warrior->maxMp, 30);
    EXPECT_EQ(warrior->attack, 18);
    EXPECT_EQ(warrior->speed, 8);
    ASSERT_EQ(warrior->skills.size(), 3u);
    EXPECT_EQ(warrior->skills[2].name, "Battle Cry");
    EXPECT_EQ(warrior->skills[2].type, SkillType::Buff);

    const auto* wizard = catalog.FindClass("Wizard");
    ASSERT_NE(wizard, nullptr);
    ASSERT_EQ(wizard->skills.size(), 4u);
    EXPECT_EQ(wizard->skills[2].statusEffectName.value_or(""), "Burn");

    const auto* thief = catalog.FindClass("Thief");
    ASSERT_NE(thief, nullptr);
    EXPECT_EQ(thief->skills.back().type, SkillType::Stun);
    EXPECT_EQ(thief->skills.back().duration, 1);
}

TEST(ContentCatalogBuiltInTest, EveryBuiltInSkillValidates) {
    auto catalog = ContentCatalog::BuiltIn();
    for (const auto& loadout : catalog.Classes()) {
        for (const auto& skill : loadout.skills) {
            EXPECT_TRUE(ContentCatalog::ValidateSkill(skill).hasValue()) << skill.name;
        }
    }
}

TEST(ContentCatalogBuiltInTest, EnemiesAndStartingItems) {
    auto catalog = ContentCatalog::BuiltIn();
    ASSERT_EQ(catalog.Enemies().size(), 4u);

    const auto* orc = catalog.FindEnemy("Orc Warrior");
    ASSERT_NE(orc, nullptr);
    EXPECT_EQ(orc->level, 3);
    EXPECT_EQ(orc->expReward, 75);
    EXPECT_EQ(orc->goldReward, 35);

    const auto& items = catalog.StartingItems();
    ASSERT_EQ(items.size(), 3u);
    EXPECT_EQ(items[0].name, "Health Potion");
    EXPECT_EQ(items[1].name, "Mana Potion");
    EXPECT_EQ(items[2].name, "Health Potion");
}

// ===========================================================================
// Factories
// ===========================================================================

TEST(ContentCatalogFactoryTest, CreatePlayerIsCaseInsensitive) {
    auto catalog = ContentCatalog::BuiltIn();
    auto result = catalog.CreatePlayer("Aria", "rAnGeR");
    ASSERT_TRUE(result.hasValue());

    const auto& player = result.value();
    EXPECT_EQ(player.name, "Aria");
    EXPECT_EQ(player.className, "Ranger");
    EXPECT_EQ(player.stats.hp, 100);
    EXPECT_EQ(player.stats.maxMp, 40);
    EXPECT_EQ(player.stats.level, 1);
    EXPECT_EQ(player.gold, 0);
    EXPECT_EQ(player.skills.size(), 2u);
    EXPECT_EQ(player.inventory.size(), 3u);
}

TEST(ContentCatalogFactoryTest, EmptyNameBecomesHero) {
    auto catalog = ContentCatalog::BuiltIn();
    auto result = catalog.CreatePlayer("", "Thief");
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value().name, "Hero");
}

TEST(ContentCatalogFactoryTest, UnknownClassIsNotFound) {
    auto catalog = ContentCatalog::BuiltIn();
    auto result = catalog.CreatePlayer("Hero", "Bard");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::NotFound);
    EXPECT_EQ(result.error().message(), "unknown class: Bard");
}

TEST(ContentCatalogFactoryTest, SpawnedEnemiesAreIndependent) {
    auto catalog = ContentCatalog::BuiltIn();
    auto first = catalog.SpawnEnemy("slime");
    auto second = catalog.SpawnEnemy("Slime");
    ASSERT_TRUE(first.hasValue());
    ASSERT_TRUE(second.hasValue());

    first.value().stats.TakeDamage(10);
    EXPECT_EQ(first.value().stats.hp, 20);
    EXPECT_EQ(second.value().stats.hp, 30);
    EXPECT_EQ(second.value().expReward, 20);
    EXPECT_EQ(second.value().visual, "slime");
}

TEST(ContentCatalogFactoryTest, UnknownEnemyIsNotFound) {
    auto catalog = ContentCatalog::BuiltIn();
    auto result = catalog.SpawnEnemy("Dragon");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::NotFound);
}

// ===========================================================================
// Registration and validation
// ===========================================================================

TEST(ContentCatalogRegisterTest, DuplicateClassNameRejected) {
    auto catalog = ContentCatalog::BuiltIn();
    ClassLoadout copy = *catalog.FindClass("Warrior");
    copy.className = "WARRIOR";
    auto result = catalog.RegisterClass(copy);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::DuplicateContent);
    EXPECT_EQ(catalog.Classes().size(), 4u);
}

TEST(ContentCatalogRegisterTest, DuplicateEnemyNameRejected) {
    auto catalog = ContentCatalog::BuiltIn();
    EnemyTemplate tmpl;
    tmpl.name = "Slime";
    tmpl.maxHp = 10;
    EXPECT_EQ(catalog.RegisterEnemy(tmpl).error().code(), ErrorCode::DuplicateContent);
}

TEST(ContentCatalogRegisterTest, ClassWithBadSkillRejected) {
    ContentCatalog catalog;
    ClassLoadout loadout;
    loadout.className = "Bard";
    loadout.maxHp = 70;
    Skill lullaby;
    lullaby.name = "Lullaby";
    lullaby.type = SkillType::Stun;
    lullaby.mpCost = 10;
    loadout.skills.push_back(lullaby);  // stun without a duration

    auto result = catalog.RegisterClass(loadout);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidContent);
    EXPECT_TRUE(catalog.Classes().empty());
}

TEST(ContentCatalogRegisterTest, ValidateSkillRejectsNegativeCost) {
    Skill skill;
    skill.name = "Overdraw";
    skill.type = SkillType::Damage;
    skill.power = 1.0;
    skill.mpCost = -5;
    EXPECT_EQ(ContentCatalog::ValidateSkill(skill).error().code(), ErrorCode::InvalidContent);
}

TEST(ContentCatalogRegisterTest, ValidateItemRejectsUnknownResource) {
    Item item;
    item.name = "Strength Tonic";
    item.effect.emplace("attack", 5);
    EXPECT_EQ(ContentCatalog::ValidateItem(item).error().code(), ErrorCode::InvalidContent);

    ContentCatalog catalog;
    EXPECT_TRUE(catalog.AddStartingItem(item).hasError());
    EXPECT_TRUE(catalog.StartingItems().empty());
}

TEST(ContentCatalogRegisterTest, ValidateItemRejectsOversizedEffect) {
    Item item;
    item.name = "Bottomless Flask";
    item.effect.emplace("hp", std::numeric_limits<int32_t>::max());
    auto result = ContentCatalog::ValidateItem(item);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidContent);

    item.effect["hp"] = kMaxContentValue;
    EXPECT_TRUE(ContentCatalog::ValidateItem(item).hasValue());
}

TEST(ContentCatalogRegisterTest, ValidateSkillRejectsOutOfRangePower) {
    Skill skill;
    skill.name = "Cataclysm";
    skill.type = SkillType::Damage;
    skill.mpCost = 10;

    skill.power = 1000.0;
    EXPECT_EQ(ContentCatalog::ValidateSkill(skill).error().code(), ErrorCode::InvalidContent);
    skill.power = std::nan("");
    EXPECT_EQ(ContentCatalog::ValidateSkill(skill).error().code(), ErrorCode::InvalidContent);
    skill.power = kMaxSkillPower;
    EXPECT_TRUE(ContentCatalog::ValidateSkill(skill).hasValue());
}

TEST(ContentCatalogRegisterTest, ValidateSkillRejectsOversizedCost) {
    Skill skill;
    skill.name = "Overcharge";
    skill.type = SkillType::Damage;
    skill.power = 1.0;
    skill.mpCost = kMaxContentValue + 1;
    EXPECT_EQ(ContentCatalog::ValidateSkill(skill).error().code(), ErrorCode::InvalidContent);
}

TEST(ContentCatalogRegisterTest, EnemyWithOversizedStatsRejected) {
    ContentCatalog catalog;
    EnemyTemplate tmpl;
    tmpl.name = "Titan";
    tmpl.maxHp = 500;
    tmpl.attack = std::numeric_limits<int32_t>::max();
    EXPECT_EQ(catalog.RegisterEnemy(tmpl).error().code(), ErrorCode::InvalidContent);

    tmpl.attack = 40;
    tmpl.goldReward = kMaxContentValue + 1;
    EXPECT_EQ(catalog.RegisterEnemy(tmpl).error().code(), ErrorCode::InvalidContent);
    EXPECT_TRUE(catalog.Enemies().empty());
}

// ===========================================================================
// YAML loading
// ===========================================================================

TEST(ContentCatalogYamlTest, LoadsMinimalContent) {
    auto result = ContentCatalog::LoadFromString(kMinimalContent);
    ASSERT_TRUE(result.hasValue()) << result.error().message();
    const auto& catalog = result.value();

    const auto* paladin = catalog.FindClass("paladin");
    ASSERT_NE(paladin, nullptr);
    EXPECT_EQ(paladin->description, "Holy knight");
    ASSERT_EQ(paladin->skills.size(), 3u);
    EXPECT_EQ(paladin->skills[1].type, SkillType::Heal);
    EXPECT_EQ(paladin->skills[2].type, SkillType::DamageOverTime);
    EXPECT_EQ(paladin->skills[2].statusEffectName.value_or(""), "Burn");

    const auto* bat = catalog.FindEnemy("Bat");
    ASSERT_NE(bat, nullptr);
    EXPECT_EQ(bat->maxMp, 0);
    EXPECT_EQ(bat->level, 1);
    EXPECT_EQ(bat->expReward, 8);

    ASSERT_EQ(catalog.StartingItems().size(), 1u);
    EXPECT_EQ(catalog.StartingItems()[0].effect.at("mp"), 25);
}

TEST(ContentCatalogYamlTest, UnknownSkillTypeRejectedAtLoad) {
    auto result = ContentCatalog::LoadFromString(R"(
classes:
  - name: Bard
    stats: {hp: 70, mp: 50, attack: 9, speed: 11}
    skills:
      - {name: Song, mp_cost: 5, type: charm, power: 1.0}
)");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::UnknownSkillType);
    EXPECT_NE(result.error().message().find("charm"), std::string::npos);
}

TEST(ContentCatalogYamlTest, DuplicateClassInFileRejected) {
    auto result = ContentCatalog::LoadFromString(R"(
classes:
  - {name: Monk, stats: {hp: 90, attack: 12}}
  - {name: monk, stats: {hp: 95, attack: 13}}
)");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::DuplicateContent);
}

TEST(ContentCatalogYamlTest, MissingStatsRejected) {
    auto result = ContentCatalog::LoadFromString(R"(
classes:
  - name: Ghost
)");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidContent);
}

TEST(ContentCatalogYamlTest, NonPositiveHpRejected) {
    auto result = ContentCatalog::LoadFromString(R"(
classes:
  - {name: Warrior, stats: {hp: 100, attack: 10}}
enemies:
  - {name: Wisp, stats: {hp: 0, attack: 3}}
)");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidContent);
}

TEST(ContentCatalogYamlTest, NoClassesRejected) {
    auto result = ContentCatalog::LoadFromString(R"(
enemies:
  - {name: Bat, stats: {hp: 15, attack: 4}}
)");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidContent);
}

TEST(ContentCatalogYamlTest, MalformedYamlFailsToLoad) {
    auto result = ContentCatalog::LoadFromString("classes: [unclosed");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ContentLoadFailed);
}

TEST(ContentCatalogYamlTest, WrongScalarTypeFailsToLoad) {
    auto result = ContentCatalog::LoadFromString(R"(
classes:
  - {name: Warrior, stats: {hp: lots, attack: 10}}
)");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ContentLoadFailed);
}

TEST(ContentCatalogYamlTest, RootMustBeMapping) {
    auto result = ContentCatalog::LoadFromString("- just\n- a list\n");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ContentLoadFailed);
}

TEST(ContentCatalogYamlTest, MissingFileFailsToLoad) {
    auto result = ContentCatalog::LoadFromFile("/nonexistent/dqe/content.yaml");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ContentLoadFailed);
}

TEST(ContentCatalogYamlTest, LoadsFromFile) {
    auto path = std::filesystem::temp_directory_path() / "dqe_test_content.yaml";
    {
        std::ofstream out(path);
        out << kMinimalContent;
    }
    auto result = ContentCatalog::LoadFromFile(path);
    std::filesystem::remove(path);

    ASSERT_TRUE(result.hasValue()) << result.error().message();
    EXPECT_NE(result.value().FindClass("Paladin"), nullptr);
}

TEST(ContentCatalogYamlTest, ShippedContentMatchesBuiltIn) {
    auto result = ContentCatalog::LoadFromFile(
        std::filesystem::path(DQE_SOURCE_DIR) / "content" / "content.yaml");
    ASSERT_TRUE(result.hasValue()) << result.error().message();

    auto loaded = std::move(result).value();
    auto builtIn = ContentCatalog::BuiltIn();
    ASSERT_EQ(loaded.Classes().size(), builtIn.Classes().size());
    ASSERT_EQ(loaded.Enemies().size(), builtIn.Enemies().size());
    ASSERT_EQ(loaded.StartingItems().size(), builtIn.StartingItems().size());

    for (std::size_t i = 0; i < builtIn.Classes().size(); ++i) {
        const auto& a = loaded.Classes()[i];
        const auto& b = builtIn.Classes()[i];
        EXPECT_EQ(a.className, b.className);
        EXPECT_EQ(a.maxHp, b.maxHp);
        EXPECT_EQ(a.attack, b.attack);
        ASSERT_EQ(a.skills.size(), b.skills.size()) << a.className;
        for (std::size_t s = 0; s < b.skills.size(); ++s) {
            EXPECT_EQ(a.skills[s].name, b.skills[s].name);
            EXPECT_EQ(a.skills[s].type, b.skills[s].type);
            EXPECT_DOUBLE_EQ(a.skills[s].power, b.skills[s].power);
            EXPECT_EQ(a.skills[s].mpCost, b.skills[s].mpCost);
            EXPECT_EQ(a.skills[s].duration, b.skills[s].duration);
        }
    }
    for (std::size_t i = 0; i < builtIn.Enemies().size(); ++i) {
        EXPECT_EQ(loaded.Enemies()[i].name, builtIn.Enemies()[i].name);
        EXPECT_EQ(loaded.Enemies()[i].expReward, builtIn.Enemies()[i].expReward);
    }
}

TEST(ContentCatalogYamlTest, OversizedEnemyStatRejected) {
    auto result = ContentCatalog::LoadFromString(R"(
classes:
  - {name: Warrior, stats: {hp: 100, attack: 10}}
enemies:
  - {name: Colossus, stats: {hp: 2147483647, attack: 3}}
)");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidContent);
}

TEST(ContentCatalogYamlTest, ClassLevelRejected) {
    auto result = ContentCatalog::LoadFromString(R"(
classes:
  - {name: Veteran, stats: {hp: 10, level: 3}}
)");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidContent);
    EXPECT_NE(result.error().message().find("level"), std::string::npos);
}

TEST(ContentCatalogYamlTest, EnemyLevelAccepted) {
    auto result = ContentCatalog::LoadFromString(R"(
classes:
  - {name: Warrior, stats: {hp: 100, attack: 10}}
enemies:
  - {name: Ogre Chief, stats: {hp: 90, attack: 12, level: 4}}
)");
    ASSERT_TRUE(result.hasValue()) << result.error().message();
    EXPECT_EQ(result.value().FindEnemy("Ogre Chief")->level, 4);
}
