/**
 * Compile Engine - C++ Implementation
 *
 * Rules engine and AI for the two-player card game Compile.
 *
 * Include this header to get access to the complete engine API.
 */

#pragma once

// Core types
#include "types.hpp"

// Data structures
#include "played_card.hpp"
#include "zone.hpp"
#include "board.hpp"
#include "player_state.hpp"
#include "action.hpp"
#include "action_required.hpp"
#include "game_state.hpp"

// Card catalog
#include "card_catalog.hpp"
#include "cards/protocol_registry.hpp"

// Engine
#include "game_config.hpp"
#include "passive_rules.hpp"
#include "engine.hpp"

// AI and drivers
#include "ai/ai_player.hpp"
#include "statistics.hpp"
#include "xray_logger.hpp"

namespace compile {

/**
 * Version information.
 */
constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;

inline std::string get_version() {
    return std::to_string(VERSION_MAJOR) + "." +
           std::to_string(VERSION_MINOR) + "." +
           std::to_string(VERSION_PATCH);
}

} // namespace compile
