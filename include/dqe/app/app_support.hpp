#pragma once

/// @file app_support.hpp
/// @brief Shared start-up helpers for the dungeon_quest executable.
///
/// Provides command-line parsing, configuration loading with environment
/// override, logging level setup and construction of the engine settings.

#include <filesystem>
#include <memory>

#include "dqe/foundation/config_manager.hpp"
#include "dqe/foundation/game_logger.hpp"
#include "dqe/foundation/game_result.hpp"
#include "dqe/foundation/random_source.hpp"
#include "dqe/game/combat_rules.hpp"
#include "dqe/game/content_catalog.hpp"

namespace dqe::app {

/// Extract the value of `--config <path>` from the command line.
///
/// @return The path, or an empty path when the flag is absent.
std::filesystem::path parseConfigArg(int argc, char* argv[]);

/// Load configuration for the executable.
///
/// Resolution order: @p cliPath, then the DQE_CONFIG_PATH environment
/// variable.  With neither set the manager is left empty and every
/// setting takes its built-in default.
foundation::GameResult<void> loadConfig(foundation::ConfigManager& config,
                                        const std::filesystem::path& cliPath);

/// Apply `logging.<category>: <level>` entries to @p logger.
///
/// Example:
/// @code
///   logging:
///     combat: info
///     skill: warn
/// @endcode
///
/// @return InvalidArgument for an unknown category or level name.
foundation::GameResult<void> applyLoggingConfig(const foundation::ConfigManager& config,
                                                foundation::GameLogger& logger);

/// Rules and content an encounter loop needs.
struct EngineSettings {
    game::CombatRules combat;
    game::ProgressionRules progression;
    game::ContentCatalog content;
};

/// Build the engine settings from configuration.
///
/// Content comes from `content.path` when set, otherwise from
/// ContentCatalog::BuiltIn().
foundation::GameResult<EngineSettings> buildEngineSettings(
    const foundation::ConfigManager& config);

/// Random source seeded from `combat.rng_seed`, or from entropy when unset.
foundation::GameResult<std::unique_ptr<foundation::RandomSource>> makeRandomSource(
    const foundation::ConfigManager& config);

} // namespace dqe::app
