/**
 * Compile Engine - Action Representation
 *
 * Defines the AIAction struct: one player intent, produced by the AI
 * tiers or the console and applied with CompileEngine::step().
 */

#pragma once

#include "types.hpp"
#include <optional>

namespace compile {

enum class ActionType : uint8_t {
    // Turn actions
    PLAY_CARD,
    FILL_HAND,
    COMPILE,

    // Resolving a required action
    DISCARD_CARDS,
    SELECT_CARD,
    SELECT_LANE,
    SELECT_HAND_CARD,
    PLAY_FROM_HAND,
    ACCEPT_PROMPT,
    DECLINE_PROMPT,
    CHOOSE_OPTION,
    REARRANGE_PROTOCOLS,
    SWAP_PROTOCOLS,
    CONTROL_CHOICE,
    SKIP
};

/**
 * AIAction - A single player intent.
 *
 * Designed for fast comparison and hashing.
 */
struct AIAction {
    ActionType action_type = ActionType::SKIP;
    PlayerID player_id = PLAYER;

    // Optional parameters based on action type
    std::optional<CardID> card_id;
    std::optional<int> lane;
    bool face_up = false;
    std::vector<CardID> card_ids;
    std::optional<int> choice_index;
    std::optional<int> second_index;
    std::optional<ProtocolList> protocol_order;
    ControlChoice control = ControlChoice::SKIP;

    // ========================================================================
    // CONSTRUCTORS
    // ========================================================================

    AIAction() = default;

    AIAction(ActionType type, PlayerID player)
        : action_type(type)
        , player_id(player)
    {}

    // ========================================================================
    // FACTORY METHODS
    // ========================================================================

    static AIAction play_card(PlayerID player, const CardID& card, int lane_index, bool up) {
        AIAction a(ActionType::PLAY_CARD, player);
        a.card_id = card;
        a.lane = lane_index;
        a.face_up = up;
        return a;
    }

    static AIAction fill_hand(PlayerID player) {
        return AIAction(ActionType::FILL_HAND, player);
    }

    static AIAction compile_lane(PlayerID player, int lane_index) {
        AIAction a(ActionType::COMPILE, player);
        a.lane = lane_index;
        return a;
    }

    static AIAction discard_cards(PlayerID player, std::vector<CardID> cards) {
        AIAction a(ActionType::DISCARD_CARDS, player);
        a.card_ids = std::move(cards);
        return a;
    }

    static AIAction select_card(PlayerID player, const CardID& card) {
        AIAction a(ActionType::SELECT_CARD, player);
        a.card_id = card;
        return a;
    }

    static AIAction select_lane(PlayerID player, int lane_index) {
        AIAction a(ActionType::SELECT_LANE, player);
        a.lane = lane_index;
        return a;
    }

    static AIAction select_hand_card(PlayerID player, const CardID& card) {
        AIAction a(ActionType::SELECT_HAND_CARD, player);
        a.card_id = card;
        return a;
    }

    static AIAction play_from_hand(PlayerID player, const CardID& card, int lane_index, bool up) {
        AIAction a(ActionType::PLAY_FROM_HAND, player);
        a.card_id = card;
        a.lane = lane_index;
        a.face_up = up;
        return a;
    }

    static AIAction accept(PlayerID player) {
        return AIAction(ActionType::ACCEPT_PROMPT, player);
    }

    static AIAction decline(PlayerID player) {
        return AIAction(ActionType::DECLINE_PROMPT, player);
    }

    static AIAction choose(PlayerID player, int index) {
        AIAction a(ActionType::CHOOSE_OPTION, player);
        a.choice_index = index;
        return a;
    }

    static AIAction rearrange(PlayerID player, const ProtocolList& order) {
        AIAction a(ActionType::REARRANGE_PROTOCOLS, player);
        a.protocol_order = order;
        return a;
    }

    static AIAction swap_protocols(PlayerID player, int first, int second) {
        AIAction a(ActionType::SWAP_PROTOCOLS, player);
        a.choice_index = first;
        a.second_index = second;
        return a;
    }

    static AIAction control_choice(PlayerID player, ControlChoice choice) {
        AIAction a(ActionType::CONTROL_CHOICE, player);
        a.control = choice;
        return a;
    }

    static AIAction skip(PlayerID player) {
        return AIAction(ActionType::SKIP, player);
    }

    // ========================================================================
    // STRING REPRESENTATION
    // ========================================================================

    std::string to_string() const {
        std::string result = "AIAction(";
        result += type_name(action_type);
        result += ", p" + std::to_string(player_id);

        if (card_id.has_value()) {
            result += ", card=" + *card_id;
        }
        if (lane.has_value()) {
            result += ", lane=" + std::to_string(*lane);
            if (action_type == ActionType::PLAY_CARD || action_type == ActionType::PLAY_FROM_HAND) {
                result += face_up ? ", up" : ", down";
            }
        }
        if (!card_ids.empty()) {
            result += ", cards=[";
            for (size_t i = 0; i < card_ids.size(); i++) {
                if (i > 0) result += ",";
                result += card_ids[i];
            }
            result += "]";
        }
        if (choice_index.has_value()) {
            result += ", choice=" + std::to_string(*choice_index);
        }
        if (second_index.has_value()) {
            result += ", second=" + std::to_string(*second_index);
        }
        if (protocol_order.has_value()) {
            result += ", order=" + (*protocol_order)[0] + "/" + (*protocol_order)[1] + "/" + (*protocol_order)[2];
        }
        result += ")";
        return result;
    }

    static const char* type_name(ActionType type) {
        switch (type) {
            case ActionType::PLAY_CARD: return "PLAY_CARD";
            case ActionType::FILL_HAND: return "FILL_HAND";
            case ActionType::COMPILE: return "COMPILE";
            case ActionType::DISCARD_CARDS: return "DISCARD_CARDS";
            case ActionType::SELECT_CARD: return "SELECT_CARD";
            case ActionType::SELECT_LANE: return "SELECT_LANE";
            case ActionType::SELECT_HAND_CARD: return "SELECT_HAND_CARD";
            case ActionType::PLAY_FROM_HAND: return "PLAY_FROM_HAND";
            case ActionType::ACCEPT_PROMPT: return "ACCEPT_PROMPT";
            case ActionType::DECLINE_PROMPT: return "DECLINE_PROMPT";
            case ActionType::CHOOSE_OPTION: return "CHOOSE_OPTION";
            case ActionType::REARRANGE_PROTOCOLS: return "REARRANGE_PROTOCOLS";
            case ActionType::SWAP_PROTOCOLS: return "SWAP_PROTOCOLS";
            case ActionType::CONTROL_CHOICE: return "CONTROL_CHOICE";
            case ActionType::SKIP: return "SKIP";
            default: return "UNKNOWN";
        }
    }

    // ========================================================================
    // COMPARISON
    // ========================================================================

    bool operator==(const AIAction& other) const {
        return action_type == other.action_type
            && player_id == other.player_id
            && card_id == other.card_id
            && lane == other.lane
            && face_up == other.face_up
            && card_ids == other.card_ids
            && choice_index == other.choice_index
            && second_index == other.second_index
            && protocol_order == other.protocol_order
            && control == other.control;
    }

    bool operator!=(const AIAction& other) const {
        return !(*this == other);
    }
};

} // namespace compile

// Hash function for AIAction (for use in unordered_set/map)
namespace std {
    template<>
    struct hash<compile::AIAction> {
        size_t operator()(const compile::AIAction& a) const {
            size_t h = hash<int>()(static_cast<int>(a.action_type));
            h ^= hash<int>()(a.player_id) << 1;
            if (a.card_id) h ^= hash<string>()(*a.card_id) << 2;
            if (a.lane) h ^= hash<int>()(*a.lane) << 3;
            h ^= hash<bool>()(a.face_up) << 4;
            for (const auto& id : a.card_ids) h ^= hash<string>()(id) << 5;
            if (a.choice_index) h ^= hash<int>()(*a.choice_index) << 6;
            if (a.second_index) h ^= hash<int>()(*a.second_index) << 7;
            return h;
        }
    };
}
