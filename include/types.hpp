/**
 * Compile Engine - Core Type Definitions
 *
 * This file defines the enums, identifiers and rule constants shared by
 * every part of the engine.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <array>
#include <unordered_set>
#include <unordered_map>
#include <optional>
#include <memory>

namespace compile {

// ============================================================================
// ENUMS
// ============================================================================

enum class Phase : uint8_t {
    START,
    CONTROL,
    COMPILE,
    ACTION,
    HAND_LIMIT,
    END
};

enum class Difficulty : uint8_t {
    EASY,
    NORMAL,
    HARD
};

/**
 * Reason a transition was rejected. The input state is never modified
 * when one of these is reported.
 */
enum class IllegalIntent : uint8_t {
    NONE,
    GAME_OVER,
    WRONG_ACTOR,
    WRONG_PHASE,
    ACTION_PENDING,
    NO_ACTION_PENDING,
    ACTION_TYPE_MISMATCH,
    CARD_NOT_FOUND,
    UNTARGETABLE,
    INVALID_LANE,
    PLAY_NOT_ALLOWED,
    NOT_COMPILABLE,
    NOT_OPTIONAL,
    INVALID_SELECTION,
    ALREADY_ACTED
};

enum class ControlChoice : uint8_t {
    SKIP,
    REARRANGE_OWN,
    REARRANGE_OPPONENT
};

// ============================================================================
// TYPE ALIASES
// ============================================================================

using CardID = std::string;       // Unique instance ID (e.g., "p0_12")
using CardDefID = std::string;    // Catalog key (e.g., "Speed-0")
using PlayerID = uint8_t;         // 0 or 1
using ProtocolList = std::array<std::string, 3>;

// ============================================================================
// CONSTANTS
// ============================================================================

constexpr PlayerID PLAYER = 0;
constexpr PlayerID OPPONENT = 1;

constexpr int LANE_COUNT = 3;
constexpr int HAND_LIMIT = 5;
constexpr int STARTING_HAND = 5;
constexpr int COMPILE_THRESHOLD = 10;
constexpr int FACE_DOWN_VALUE = 2;
constexpr int BOOSTED_FACE_DOWN_VALUE = 4;
constexpr int MIN_CARD_VALUE = 0;
constexpr int MAX_CARD_VALUE = 6;

inline PlayerID other(PlayerID player) {
    return static_cast<PlayerID>(1 - player);
}

inline bool is_valid_lane(int lane) {
    return lane >= 0 && lane < LANE_COUNT;
}

// ============================================================================
// UTILITY FUNCTIONS
// ============================================================================

inline const char* to_string(Phase phase) {
    switch (phase) {
        case Phase::START: return "start";
        case Phase::CONTROL: return "control";
        case Phase::COMPILE: return "compile";
        case Phase::ACTION: return "action";
        case Phase::HAND_LIMIT: return "hand_limit";
        case Phase::END: return "end";
        default: return "unknown";
    }
}

inline const char* to_string(Difficulty difficulty) {
    switch (difficulty) {
        case Difficulty::EASY: return "easy";
        case Difficulty::NORMAL: return "normal";
        case Difficulty::HARD: return "hard";
        default: return "unknown";
    }
}

inline const char* to_string(IllegalIntent error) {
    switch (error) {
        case IllegalIntent::NONE: return "none";
        case IllegalIntent::GAME_OVER: return "game_over";
        case IllegalIntent::WRONG_ACTOR: return "wrong_actor";
        case IllegalIntent::WRONG_PHASE: return "wrong_phase";
        case IllegalIntent::ACTION_PENDING: return "action_pending";
        case IllegalIntent::NO_ACTION_PENDING: return "no_action_pending";
        case IllegalIntent::ACTION_TYPE_MISMATCH: return "action_type_mismatch";
        case IllegalIntent::CARD_NOT_FOUND: return "card_not_found";
        case IllegalIntent::UNTARGETABLE: return "untargetable";
        case IllegalIntent::INVALID_LANE: return "invalid_lane";
        case IllegalIntent::PLAY_NOT_ALLOWED: return "play_not_allowed";
        case IllegalIntent::NOT_COMPILABLE: return "not_compilable";
        case IllegalIntent::NOT_OPTIONAL: return "not_optional";
        case IllegalIntent::INVALID_SELECTION: return "invalid_selection";
        case IllegalIntent::ALREADY_ACTED: return "already_acted";
        default: return "unknown";
    }
}

inline const char* player_name(PlayerID player) {
    return player == PLAYER ? "player" : "opponent";
}

inline std::optional<Difficulty> parse_difficulty(const std::string& name) {
    if (name == "easy") return Difficulty::EASY;
    if (name == "normal") return Difficulty::NORMAL;
    if (name == "hard") return Difficulty::HARD;
    return std::nullopt;
}

} // namespace compile
