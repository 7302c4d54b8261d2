#pragma once

/// @file dqe.hpp
/// @brief Umbrella header for the Dungeon Quest combat engine.

#include "dqe/version.hpp"
#include "dqe/core/result.hpp"

#include "dqe/foundation/config_manager.hpp"
#include "dqe/foundation/error_code.hpp"
#include "dqe/foundation/game_error.hpp"
#include "dqe/foundation/game_logger.hpp"
#include "dqe/foundation/game_result.hpp"
#include "dqe/foundation/random_source.hpp"

#include "dqe/game/combat_rules.hpp"
#include "dqe/game/combat_runner.hpp"
#include "dqe/game/combat_session.hpp"
#include "dqe/game/combat_types.hpp"
#include "dqe/game/combatant.hpp"
#include "dqe/game/content_catalog.hpp"
#include "dqe/game/content_types.hpp"
#include "dqe/game/progression.hpp"
#include "dqe/game/skill_resolver.hpp"
#include "dqe/game/stat_components.hpp"
#include "dqe/game/status_effect_system.hpp"
