/**
 * Compile Engine - Effect Programs
 *
 * Card effects are small programs over a closed instruction set.
 * Built-in protocols assemble them in C++, custom protocols load them
 * from JSON; both are validated when the catalog is filled, never when
 * a trigger fires.
 *
 * Instruction set version: 1
 */

#pragma once

#include "types.hpp"

namespace compile {

constexpr int EFFECT_SCHEMA_VERSION = 1;

// ============================================================================
// ENUMS
// ============================================================================

enum class EffectOp : uint8_t {
    DRAW,
    DRAW_FROM_OPPONENT_DECK,
    DISCARD,
    REFRESH,
    FLIP,
    FLIP_ALL,
    FLIP_SELF,
    DELETE,
    DELETE_ALL_IN_LANE,
    DELETE_HIGHEST,
    DELETE_LOWEST_COVERED,
    DELETE_EACH_OTHER_LANE,
    DELETE_SELF,
    SHIFT,
    SHIFT_ALL,
    SHIFT_SELF,
    RETURN,
    RETURN_ALL_IN_LANE,
    PLAY_FROM_HAND,
    PLAY_FROM_DECK,
    REVEAL_HAND,
    REVEAL_FROM_HAND,
    REVEAL_BOARD_CARD,
    GIVE_CARD,
    TAKE_RANDOM_CARD,
    REARRANGE_PROTOCOLS,
    SWAP_PROTOCOLS,
    BLOCK_COMPILE,
    CHOOSE
};

enum class Trigger : uint8_t {
    ON_PLAY,                  // Played face-up, flipped face-up, or uncovered
    ON_COVER,                 // About to be covered
    START,
    END,
    AFTER_DELETE,             // Owner deleted cards
    AFTER_OPPONENT_DISCARD,   // Owner's opponent discarded cards
    AFTER_CLEAR_CACHE,        // Owner's hand limit was checked
    AFTER_DRAW                // Owner drew cards
};

enum class Box : uint8_t {
    TOP,       // Active while face-up, even if covered
    MIDDLE,    // Runs when played, flipped face-up or uncovered
    BOTTOM     // Active while face-up and uncovered
};

enum class OwnerFilter : uint8_t {
    ANY,
    OWN,
    OPPONENT
};

enum class FaceFilter : uint8_t {
    ANY,
    FACE_UP,
    FACE_DOWN
};

enum class PositionFilter : uint8_t {
    UNCOVERED,
    COVERED,
    ANY
};

enum class LaneScope : uint8_t {
    ANY,
    THIS_LANE,
    OTHER_LANES
};

// Who performs an instruction, relative to the card's owner
enum class EffectActor : uint8_t {
    SELF,
    OPPONENT
};

enum class Condition : uint8_t {
    ALWAYS,
    IF_PREVIOUS,   // Previous step did something ("if you do")
    IF_COVERING    // Source card sits on top of another card
};

enum class Subject : uint8_t {
    CHOSEN,        // Actor picks a target
    PREVIOUS,      // "that card"
    SELF           // "this card"
};

enum class AmountMode : uint8_t {
    FIXED,
    PREVIOUS_PLUS_ONE,
    PREVIOUS_TARGET_VALUE
};

enum class ShiftDestination : uint8_t {
    ANY_OTHER_LANE,
    THIS_LANE,
    TO_OR_FROM_THIS_LANE
};

enum class DeckPlayMode : uint8_t {
    THIS_LANE,
    ANOTHER_LANE,
    EACH_OTHER_LANE,
    EACH_LANE_WITH_OWN_CARD,
    UNDER_SELF_PER_TWO
};

enum class PassiveKind : uint8_t {
    FACE_DOWN_VALUE_4,                // Own face-down cards in this stack are worth 4
    OPPONENT_TOTAL_MINUS,             // Opponent's total in this line reduced by amount
    OWN_TOTAL_PLUS_PER_FACE_DOWN,     // +1 per face-down card in this line
    BLOCK_FACE_DOWN_PLAY_IN_LANE,     // Opponent cannot play face-down in this line
    BLOCK_PLAY_IN_LANE,               // Opponent cannot play in this line
    OPPONENT_PLAYS_FACE_DOWN_ONLY,
    PLAY_ANY_LANE,                    // Own cards may be played face-up in any line
    SKIP_CHECK_CACHE,
    IGNORE_MIDDLE_IN_LANE,
    SHIFT_ON_COMPILE_DELETE,
    DELETE_WHEN_FLIPPED,
    INVERT_PROTOCOL_MATCHING,
    IGNORE_PROTOCOL_MATCHING_SELF
};

// ============================================================================
// PROGRAM STRUCTURES
// ============================================================================

/**
 * TargetFilter - Which board cards an instruction may pick.
 *
 * Owner is relative to the owner of the card running the program.
 * Value bounds are inclusive, -1 disables a bound.
 */
struct TargetFilter {
    OwnerFilter owner = OwnerFilter::ANY;
    FaceFilter face = FaceFilter::ANY;
    PositionFilter position = PositionFilter::UNCOVERED;
    int min_value = -1;
    int max_value = -1;
    bool exclude_self = false;
    LaneScope lane = LaneScope::ANY;
};

/**
 * EffectInstruction - One step of an effect program.
 */
struct EffectInstruction {
    EffectOp op = EffectOp::DRAW;
    EffectActor actor = EffectActor::SELF;
    int count = 1;
    AmountMode amount = AmountMode::FIXED;
    TargetFilter filter;
    ShiftDestination destination = ShiftDestination::ANY_OTHER_LANE;
    DeckPlayMode deck_mode = DeckPlayMode::THIS_LANE;
    Subject subject = Subject::CHOSEN;
    Condition condition = Condition::ALWAYS;
    bool optional = false;
    bool variable = false;           // "1 or more"
    bool face_down_only = false;     // For plays from hand
    int lane_min_cards = 0;          // For whole-lane steps
    std::vector<EffectInstruction> alternatives;  // For CHOOSE
    std::string label;
};

using EffectProgram = std::vector<EffectInstruction>;

/**
 * CardEffect - A triggered program printed in one box of a card.
 */
struct CardEffect {
    Trigger trigger = Trigger::ON_PLAY;
    Box box = Box::MIDDLE;
    EffectProgram program;
};

/**
 * PassiveRule - A continuous rule printed in one box of a card.
 */
struct PassiveRule {
    PassiveKind kind = PassiveKind::FACE_DOWN_VALUE_4;
    Box box = Box::TOP;
    int amount = 0;
};

/**
 * EffectContext - Execution state of a running program.
 *
 * Copied into every action the program emits, so a resolved action
 * resumes the program exactly where it stopped.
 */
struct EffectContext {
    CardID source_card_id;
    CardDefID source_def_id;
    PlayerID owner = PLAYER;
    int lane = -1;
    Trigger trigger = Trigger::ON_PLAY;
    int effect_index = 0;
    int pc = 0;
    int alternative = -1;        // Branch picked for a CHOOSE step
    uint8_t lanes_done = 0;      // Progress of per-lane steps
    CardID last_target;
    int last_value = 0;
    int amount = 0;
    bool did = true;
    bool confirmed = false;      // "You may" already accepted for this step

    PlayerID actor_for(EffectActor actor) const {
        return actor == EffectActor::SELF ? owner : other(owner);
    }
};

// ============================================================================
// UTILITY FUNCTIONS
// ============================================================================

inline const char* to_string(Trigger trigger) {
    switch (trigger) {
        case Trigger::ON_PLAY: return "on_play";
        case Trigger::ON_COVER: return "on_cover";
        case Trigger::START: return "start";
        case Trigger::END: return "end";
        case Trigger::AFTER_DELETE: return "after_delete";
        case Trigger::AFTER_OPPONENT_DISCARD: return "after_opponent_discard";
        case Trigger::AFTER_CLEAR_CACHE: return "after_clear_cache";
        case Trigger::AFTER_DRAW: return "after_draw";
        default: return "unknown";
    }
}

inline const char* to_string(Box box) {
    switch (box) {
        case Box::TOP: return "top";
        case Box::MIDDLE: return "middle";
        case Box::BOTTOM: return "bottom";
        default: return "unknown";
    }
}

inline const char* to_string(EffectOp op) {
    switch (op) {
        case EffectOp::DRAW: return "draw";
        case EffectOp::DRAW_FROM_OPPONENT_DECK: return "draw_from_opponent_deck";
        case EffectOp::DISCARD: return "discard";
        case EffectOp::REFRESH: return "refresh";
        case EffectOp::FLIP: return "flip";
        case EffectOp::FLIP_ALL: return "flip_all";
        case EffectOp::FLIP_SELF: return "flip_self";
        case EffectOp::DELETE: return "delete";
        case EffectOp::DELETE_ALL_IN_LANE: return "delete_all_in_lane";
        case EffectOp::DELETE_HIGHEST: return "delete_highest";
        case EffectOp::DELETE_LOWEST_COVERED: return "delete_lowest_covered";
        case EffectOp::DELETE_EACH_OTHER_LANE: return "delete_each_other_lane";
        case EffectOp::DELETE_SELF: return "delete_self";
        case EffectOp::SHIFT: return "shift";
        case EffectOp::SHIFT_ALL: return "shift_all";
        case EffectOp::SHIFT_SELF: return "shift_self";
        case EffectOp::RETURN: return "return";
        case EffectOp::RETURN_ALL_IN_LANE: return "return_all_in_lane";
        case EffectOp::PLAY_FROM_HAND: return "play_from_hand";
        case EffectOp::PLAY_FROM_DECK: return "play_from_deck";
        case EffectOp::REVEAL_HAND: return "reveal_hand";
        case EffectOp::REVEAL_FROM_HAND: return "reveal_from_hand";
        case EffectOp::REVEAL_BOARD_CARD: return "reveal_board_card";
        case EffectOp::GIVE_CARD: return "give_card";
        case EffectOp::TAKE_RANDOM_CARD: return "take_random_card";
        case EffectOp::REARRANGE_PROTOCOLS: return "rearrange_protocols";
        case EffectOp::SWAP_PROTOCOLS: return "swap_protocols";
        case EffectOp::BLOCK_COMPILE: return "block_compile";
        case EffectOp::CHOOSE: return "choose";
        default: return "unknown";
    }
}

inline const char* to_string(PassiveKind kind) {
    switch (kind) {
        case PassiveKind::FACE_DOWN_VALUE_4: return "face_down_value_4";
        case PassiveKind::OPPONENT_TOTAL_MINUS: return "opponent_total_minus";
        case PassiveKind::OWN_TOTAL_PLUS_PER_FACE_DOWN: return "own_total_plus_per_face_down";
        case PassiveKind::BLOCK_FACE_DOWN_PLAY_IN_LANE: return "block_face_down_play_in_lane";
        case PassiveKind::BLOCK_PLAY_IN_LANE: return "block_play_in_lane";
        case PassiveKind::OPPONENT_PLAYS_FACE_DOWN_ONLY: return "opponent_plays_face_down_only";
        case PassiveKind::PLAY_ANY_LANE: return "play_any_lane";
        case PassiveKind::SKIP_CHECK_CACHE: return "skip_check_cache";
        case PassiveKind::IGNORE_MIDDLE_IN_LANE: return "ignore_middle_in_lane";
        case PassiveKind::SHIFT_ON_COMPILE_DELETE: return "shift_on_compile_delete";
        case PassiveKind::DELETE_WHEN_FLIPPED: return "delete_when_flipped";
        case PassiveKind::INVERT_PROTOCOL_MATCHING: return "invert_protocol_matching";
        case PassiveKind::IGNORE_PROTOCOL_MATCHING_SELF: return "ignore_protocol_matching_self";
        default: return "unknown";
    }
}

// Instructions that always ask the actor to pick a board card
inline bool targets_board_card(EffectOp op) {
    switch (op) {
        case EffectOp::FLIP:
        case EffectOp::DELETE:
        case EffectOp::DELETE_HIGHEST:
        case EffectOp::DELETE_LOWEST_COVERED:
        case EffectOp::DELETE_EACH_OTHER_LANE:
        case EffectOp::SHIFT:
        case EffectOp::RETURN:
        case EffectOp::REVEAL_BOARD_CARD:
            return true;
        default:
            return false;
    }
}

} // namespace compile
