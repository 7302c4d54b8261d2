/// @file app_support.cpp
/// @brief Implementation of dungeon_quest start-up helpers.

#include "dqe/app/app_support.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>

namespace dqe::app {

using foundation::ConfigManager;
using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

namespace {

std::optional<LogCategory> parseLogCategory(std::string_view name) {
    for (std::size_t i = 0; i < foundation::kLogCategoryCount; ++i) {
        auto cat = static_cast<LogCategory>(i);
        auto canonical = foundation::logCategoryName(cat);
        bool same = canonical.size() == name.size() &&
                    std::equal(canonical.begin(), canonical.end(), name.begin(),
                               [](unsigned char a, unsigned char b) {
                                   return std::tolower(a) == std::tolower(b);
                               });
        if (same) {
            return cat;
        }
    }
    return std::nullopt;
}

} // namespace

// -- CLI argument parsing ----------------------------------------------------

std::filesystem::path parseConfigArg(int argc, char* argv[]) {
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string_view(argv[i]) == "--config") {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            return argv[i + 1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
    }
    return {};
}

// -- Config loading ----------------------------------------------------------

GameResult<void> loadConfig(ConfigManager& config, const std::filesystem::path& cliPath) {
    std::filesystem::path configPath = cliPath;

    if (configPath.empty()) {
        const char* envPath = std::getenv("DQE_CONFIG_PATH");
        if (envPath != nullptr && *envPath != '\0') {
            configPath = envPath;
        }
    }

    if (configPath.empty()) {
        DQE_LOG_INFO(LogCategory::Config, "no configuration file given; using defaults");
        return GameResult<void>::ok();
    }
    return config.load(configPath);
}

// -- Logging -----------------------------------------------------------------

GameResult<void> applyLoggingConfig(const ConfigManager& config,
                                    foundation::GameLogger& logger) {
    static constexpr std::string_view kPrefix = "logging.";

    for (const auto& key : config.keysUnder("logging")) {
        auto categoryName = std::string_view(key).substr(kPrefix.size());
        auto category = parseLogCategory(categoryName);
        if (!category) {
            return GameResult<void>::err(
                GameError(ErrorCode::InvalidArgument, "unknown log category: " + key));
        }

        auto levelName = config.get<std::string>(key);
        if (!levelName) {
            return GameResult<void>::err(levelName.error());
        }
        auto level = foundation::parseLogLevel(levelName.value());
        if (!level) {
            return GameResult<void>::err(GameError(
                ErrorCode::InvalidArgument,
                "unknown log level '" + levelName.value() + "' for " + key));
        }
        logger.setCategoryLevel(*category, *level);
    }
    return GameResult<void>::ok();
}

// -- Engine settings ---------------------------------------------------------

GameResult<EngineSettings> buildEngineSettings(const ConfigManager& config) {
    auto combat = game::CombatRules::FromConfig(config);
    if (!combat) {
        return GameResult<EngineSettings>::err(combat.error());
    }
    auto progression = game::ProgressionRules::FromConfig(config);
    if (!progression) {
        return GameResult<EngineSettings>::err(progression.error());
    }

    EngineSettings settings;
    settings.combat = combat.value();
    settings.progression = progression.value();

    auto contentPath = config.get<std::string>("content.path");
    if (contentPath) {
        auto catalog = game::ContentCatalog::LoadFromFile(contentPath.value());
        if (!catalog) {
            return GameResult<EngineSettings>::err(catalog.error());
        }
        settings.content = std::move(catalog.value());
    } else {
        settings.content = game::ContentCatalog::BuiltIn();
    }
    return GameResult<EngineSettings>::ok(std::move(settings));
}

GameResult<std::unique_ptr<foundation::RandomSource>> makeRandomSource(
    const ConfigManager& config) {
    using RandomPtr = std::unique_ptr<foundation::RandomSource>;

    if (!config.hasKey("combat.rng_seed")) {
        return GameResult<RandomPtr>::ok(std::make_unique<foundation::MersenneRandomSource>(
            foundation::MersenneRandomSource::fromEntropy()));
    }

    auto seed = config.get<uint64_t>("combat.rng_seed");
    if (!seed) {
        return GameResult<RandomPtr>::err(seed.error());
    }
    DQE_LOG_INFO(LogCategory::Core, "using fixed RNG seed " + std::to_string(seed.value()));
    return GameResult<RandomPtr>::ok(
        std::make_unique<foundation::MersenneRandomSource>(seed.value()));
}

} // namespace dqe::app
