#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "dqe/app/app_support.hpp"
#include "dqe/foundation/error_code.hpp"

using namespace dqe::app;
using namespace dqe::foundation;

namespace {

/// Build a mutable argv from string literals.
class Argv {
public:
    Argv(std::initializer_list<std::string> args) : storage_(args) {
        for (auto& s : storage_) {
            pointers_.push_back(s.data());
        }
        pointers_.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(storage_.size()); }
    char** argv() { return pointers_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};

/// Unsets DQE_CONFIG_PATH for the duration of a test.
class ConfigEnvGuard {
public:
    ConfigEnvGuard() { ::unsetenv("DQE_CONFIG_PATH"); }
    ~ConfigEnvGuard() { ::unsetenv("DQE_CONFIG_PATH"); }
};

std::filesystem::path writeTempFile(const std::string& name, const std::string& content) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path);
    out << content;
    return path;
}

} // namespace

// --- parseConfigArg ---

TEST(ParseConfigArgTest, FindsFlagValue) {
    Argv args{"dungeon_quest", "--config", "config/dqe.yaml"};
    EXPECT_EQ(parseConfigArg(args.argc(), args.argv()), std::filesystem::path("config/dqe.yaml"));
}

TEST(ParseConfigArgTest, AbsentFlagGivesEmptyPath) {
    Argv args{"dungeon_quest", "--verbose"};
    EXPECT_TRUE(parseConfigArg(args.argc(), args.argv()).empty());
}

TEST(ParseConfigArgTest, FlagWithoutValueIsIgnored) {
    Argv args{"dungeon_quest", "--config"};
    EXPECT_TRUE(parseConfigArg(args.argc(), args.argv()).empty());
}

// --- loadConfig ---

TEST(LoadConfigTest, NoSourceLeavesDefaults) {
    ConfigEnvGuard guard;
    ConfigManager config;
    auto result = loadConfig(config, {});
    EXPECT_TRUE(result.hasValue());
    EXPECT_FALSE(config.hasKey("combat.flee_chance"));
}

TEST(LoadConfigTest, CliPathWins) {
    ConfigEnvGuard guard;
    auto cliFile = writeTempFile("dqe_test_cli.yaml", "combat:\n  flee_chance: 0.25\n");
    auto envFile = writeTempFile("dqe_test_env.yaml", "combat:\n  flee_chance: 0.75\n");
    ::setenv("DQE_CONFIG_PATH", envFile.c_str(), 1);

    ConfigManager config;
    ASSERT_TRUE(loadConfig(config, cliFile).hasValue());
    EXPECT_DOUBLE_EQ(config.get<double>("combat.flee_chance").value(), 0.25);

    std::filesystem::remove(cliFile);
    std::filesystem::remove(envFile);
}

TEST(LoadConfigTest, EnvironmentFallback) {
    ConfigEnvGuard guard;
    auto envFile = writeTempFile("dqe_test_env_only.yaml", "progression:\n  exp_per_level: 50\n");
    ::setenv("DQE_CONFIG_PATH", envFile.c_str(), 1);

    ConfigManager config;
    ASSERT_TRUE(loadConfig(config, {}).hasValue());
    EXPECT_EQ(config.get<int>("progression.exp_per_level").value(), 50);

    std::filesystem::remove(envFile);
}

TEST(LoadConfigTest, MissingFileIsAnError) {
    ConfigEnvGuard guard;
    ConfigManager config;
    auto result = loadConfig(config, "/nonexistent/dqe.yaml");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST(LoadConfigTest, ShippedConfigLoads) {
    ConfigEnvGuard guard;
    ConfigManager config;
    auto path = std::filesystem::path(DQE_SOURCE_DIR) / "config" / "dqe.yaml";
    ASSERT_TRUE(loadConfig(config, path).hasValue());
    EXPECT_EQ(config.get<std::string>("content.path").value(), "content/content.yaml");
}

// --- applyLoggingConfig ---

TEST(ApplyLoggingConfigTest, SetsCategoryLevels) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("logging:\n  combat: warn\n  SKILL: error\n").hasValue());

    GameLogger logger;
    ASSERT_TRUE(applyLoggingConfig(config, logger).hasValue());
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Combat), LogLevel::Warning);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Skill), LogLevel::Error);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Core), LogLevel::Info);
}

TEST(ApplyLoggingConfigTest, UnknownCategoryRejected) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("logging:\n  network: debug\n").hasValue());

    GameLogger logger;
    auto result = applyLoggingConfig(config, logger);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
}

TEST(ApplyLoggingConfigTest, UnknownLevelRejected) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("logging:\n  combat: chatty\n").hasValue());

    GameLogger logger;
    auto result = applyLoggingConfig(config, logger);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Combat), LogLevel::Debug);
}

TEST(ApplyLoggingConfigTest, NoLoggingSectionIsNoOp) {
    ConfigManager config;
    GameLogger logger;
    EXPECT_TRUE(applyLoggingConfig(config, logger).hasValue());
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Status), LogLevel::Debug);
}

// --- buildEngineSettings ---

TEST(BuildEngineSettingsTest, DefaultsUseBuiltInContent) {
    ConfigManager config;
    auto result = buildEngineSettings(config);
    ASSERT_TRUE(result.hasValue());
    const auto& settings = result.value();
    EXPECT_DOUBLE_EQ(settings.combat.fleeChance, 0.5);
    EXPECT_EQ(settings.progression.expPerLevel, 100);
    EXPECT_EQ(settings.content.Classes().size(), 4u);
    EXPECT_EQ(settings.content.Enemies().size(), 4u);
}

TEST(BuildEngineSettingsTest, ReadsRulesAndContentPath) {
    auto contentPath = (std::filesystem::path(DQE_SOURCE_DIR) / "content" / "content.yaml").string();
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("combat:\n  flee_chance: 0.3\n"
                                      "progression:\n  cascade_level_ups: true\n"
                                      "content:\n  path: \"" + contentPath + "\"\n")
                    .hasValue());

    auto result = buildEngineSettings(config);
    ASSERT_TRUE(result.hasValue()) << result.error().message();
    EXPECT_DOUBLE_EQ(result.value().combat.fleeChance, 0.3);
    EXPECT_TRUE(result.value().progression.cascadeLevelUps);
    EXPECT_NE(result.value().content.FindClass("Wizard"), nullptr);
}

TEST(BuildEngineSettingsTest, BadContentPathPropagates) {
    ConfigManager config;
    config.set<std::string>("content.path", "/nonexistent/content.yaml");
    auto result = buildEngineSettings(config);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ContentLoadFailed);
}

TEST(BuildEngineSettingsTest, InvalidRulesPropagate) {
    ConfigManager config;
    config.set("combat.flee_chance", 1.5);
    auto result = buildEngineSettings(config);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
}

// --- makeRandomSource ---

TEST(MakeRandomSourceTest, FixedSeedIsReproducible) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("combat:\n  rng_seed: 42\n").hasValue());

    auto first = makeRandomSource(config);
    auto second = makeRandomSource(config);
    ASSERT_TRUE(first.hasValue());
    ASSERT_TRUE(second.hasValue());
    for (int i = 0; i < 5; ++i) {
        EXPECT_DOUBLE_EQ(first.value()->chance(), second.value()->chance());
    }
}

TEST(MakeRandomSourceTest, EntropyWhenUnset) {
    ConfigManager config;
    auto result = makeRandomSource(config);
    ASSERT_TRUE(result.hasValue());
    double roll = result.value()->chance();
    EXPECT_GE(roll, 0.0);
    EXPECT_LT(roll, 1.0);
}

TEST(MakeRandomSourceTest, NonNumericSeedRejected) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("combat:\n  rng_seed: banana\n").hasValue());
    auto result = makeRandomSource(config);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigTypeMismatch);
}
