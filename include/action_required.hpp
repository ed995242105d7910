/**
 * Compile Engine - Required Actions
 *
 * The closed set of decisions the engine can ask a player for.
 * Exactly one is active at a time (GameState::action_required); others wait
 * on the interrupt stack or the follow-up queue.
 *
 * Every variant shares the ActionBase fields: who must answer (actor),
 * which card spawned it, whether it may be skipped, and the program
 * context that continues once it is answered.
 *
 * ResumeEffect and CompletePlay never become active. They only live on the
 * interrupt stack or queue and are run automatically when popped.
 */

#pragma once

#include "effect_program.hpp"
#include <variant>
#include <type_traits>

namespace compile {

// ============================================================================
// ENUMS
// ============================================================================

enum class DiscardPurpose : uint8_t {
    EFFECT,
    HAND_LIMIT
};

enum class LanePurpose : uint8_t {
    DELETE_ALL,
    RETURN_ALL,
    SHIFT_ALL,
    PLAY_FROM_DECK
};

enum class HandCardPurpose : uint8_t {
    GIVE,
    REVEAL
};

// Transition that continues after a control prompt
enum class ControlOrigin : uint8_t {
    NONE,
    COMPILE,
    FILL_HAND
};

// ============================================================================
// ACTION VARIANTS
// ============================================================================

struct ActionBase {
    PlayerID actor = PLAYER;
    CardID source_card_id;
    bool optional = false;
    bool from_effect = true;     // ctx is meaningful
    EffectContext ctx;
};

struct DiscardAction : ActionBase {
    int count = 1;
    bool variable = false;       // "1 or more", count is the minimum
    DiscardPurpose purpose = DiscardPurpose::EFFECT;
};

/**
 * BoardTargetAction - Common targeting constraints for board selections.
 *
 * allowed_ids, when non-empty, narrows the candidates further than the
 * filter can (e.g. "your highest value card").
 */
struct BoardTargetAction : ActionBase {
    TargetFilter filter;
    std::vector<CardID> allowed_ids;
    std::vector<CardID> disallowed_ids;
    int only_lane = -1;
};

struct SelectCardToDelete : BoardTargetAction {};
struct SelectCardToFlip : BoardTargetAction {};
struct SelectCardToShift : BoardTargetAction {};
struct SelectCardToReturn : BoardTargetAction {};
struct SelectCardToReveal : BoardTargetAction {};

struct SelectLaneForShift : ActionBase {
    CardID card_id;
    PlayerID card_owner = PLAYER;
    int from_lane = -1;
    std::vector<int> allowed_lanes;
};

struct SelectLane : ActionBase {
    LanePurpose purpose = LanePurpose::DELETE_ALL;
    std::vector<int> allowed_lanes;
};

struct SelectHandCardToPlay : ActionBase {
    bool face_down_only = false;
    int excluded_lane = -1;
};

struct SelectHandCard : ActionBase {
    HandCardPurpose purpose = HandCardPurpose::GIVE;
};

struct PromptOptionalEffect : ActionBase {
    std::string description;
};

struct PromptChoice : ActionBase {
    std::vector<std::string> options;
};

// Start/end effects are ordered by the turn player, one at a time
struct SelectEffectToResolve : ActionBase {
    Trigger trigger = Trigger::START;
    std::vector<CardID> candidates;
};

struct RearrangeProtocols : ActionBase {
    PlayerID target_player = PLAYER;
    ControlOrigin follow_up = ControlOrigin::NONE;
    int follow_up_lane = -1;
};

struct SwapProtocols : ActionBase {
    PlayerID target_player = PLAYER;
};

struct PromptUseControl : ActionBase {
    ControlOrigin origin = ControlOrigin::NONE;
    int lane = -1;
};

struct ResumeEffect : ActionBase {};

// Lands a committed card after the covered card's on-cover effect
struct CompletePlay : ActionBase {
    PlayerID player = PLAYER;
    int lane = -1;
};

using ActionRequired = std::variant<
    DiscardAction,
    SelectCardToDelete,
    SelectCardToFlip,
    SelectCardToShift,
    SelectCardToReturn,
    SelectCardToReveal,
    SelectLaneForShift,
    SelectLane,
    SelectHandCardToPlay,
    SelectHandCard,
    PromptOptionalEffect,
    PromptChoice,
    SelectEffectToResolve,
    RearrangeProtocols,
    SwapProtocols,
    PromptUseControl,
    ResumeEffect,
    CompletePlay
>;

// ============================================================================
// ACCESSORS
// ============================================================================

inline const ActionBase& action_base(const ActionRequired& action) {
    return std::visit([](const auto& a) -> const ActionBase& { return a; }, action);
}

inline ActionBase& action_base(ActionRequired& action) {
    return std::visit([](auto& a) -> ActionBase& { return a; }, action);
}

inline const BoardTargetAction* as_board_target(const ActionRequired& action) {
    return std::visit([](const auto& a) -> const BoardTargetAction* {
        using T = std::decay_t<decltype(a)>;
        if constexpr (std::is_base_of_v<BoardTargetAction, T>) {
            return &a;
        } else {
            return nullptr;
        }
    }, action);
}

inline bool requires_input(const ActionRequired& action) {
    return !std::holds_alternative<ResumeEffect>(action)
        && !std::holds_alternative<CompletePlay>(action);
}

inline const char* action_type_name(const ActionRequired& action) {
    static const char* const names[] = {
        "discard",
        "select_card_to_delete",
        "select_card_to_flip",
        "select_card_to_shift",
        "select_card_to_return",
        "select_card_to_reveal",
        "select_lane_for_shift",
        "select_lane",
        "select_hand_card_to_play",
        "select_hand_card",
        "prompt_optional_effect",
        "prompt_choice",
        "select_effect_to_resolve",
        "rearrange_protocols",
        "swap_protocols",
        "prompt_use_control",
        "resume_effect",
        "complete_play"
    };
    return names[action.index()];
}

} // namespace compile
