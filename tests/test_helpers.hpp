/**
 * Compile Engine - Test Helpers
 *
 * Board setup shortcuts shared by the test files. Cards are always moved
 * between containers, never created, so every state built here still
 * passes CompileEngine::check_invariants().
 */

#pragma once

#include "engine.hpp"
#include <stdexcept>
#include <variant>

#ifndef COMPILE_DATA_DIR
#define COMPILE_DATA_DIR "data"
#endif

namespace compile {
namespace test_support {

inline std::string data_path(const std::string& file) {
    return std::string(COMPILE_DATA_DIR) + "/" + file;
}

// ============================================================================
// CARD LOOKUP
// ============================================================================

inline CardID find_card_id(const GameState& state, PlayerID owner, const std::string& protocol, int value) {
    const PlayerState& player = state.players[owner];
    for (const Zone* zone : {&player.deck, &player.hand, &player.discard}) {
        for (const auto& card : zone->cards) {
            if (card.protocol == protocol && card.value == value) return card.id;
        }
    }
    for (const auto& lane : player.board.lanes) {
        for (const auto& card : lane) {
            if (card.protocol == protocol && card.value == value) return card.id;
        }
    }
    throw std::runtime_error("no card " + protocol + "-" + std::to_string(value)
                             + " for player " + std::to_string(owner));
}

inline PlayedCard extract_card(GameState& state, PlayerID owner, const CardID& card_id) {
    PlayerState& player = state.players[owner];
    for (Zone* zone : {&player.deck, &player.hand, &player.discard}) {
        if (auto card = zone->take_card(card_id)) return *card;
    }
    if (auto card = player.board.take_card(card_id)) return *card;
    throw std::runtime_error("card " + card_id + " is not owned by player " + std::to_string(owner));
}

// ============================================================================
// BOARD SETUP
// ============================================================================

/**
 * Move a card onto the top of one of its owner's stacks, no rules applied.
 */
inline CardID place(const CompileEngine& engine, GameState& state, PlayerID owner, int lane,
                    const std::string& protocol, int value, bool face_up) {
    CardID id = find_card_id(state, owner, protocol, value);
    PlayedCard card = extract_card(state, owner, id);
    card.face_up = face_up;
    state.players[owner].board.place_on_top(lane, std::move(card));
    recalculate_lane_values(engine.catalog(), state);
    return id;
}

inline CardID give(GameState& state, PlayerID owner, const std::string& protocol, int value) {
    CardID id = find_card_id(state, owner, protocol, value);
    PlayedCard card = extract_card(state, owner, id);
    card.reset();
    state.players[owner].hand.add_card(std::move(card));
    return id;
}

inline void empty_hand(GameState& state, PlayerID owner) {
    PlayerState& player = state.players[owner];
    for (auto& card : player.hand.cards) {
        player.deck.add_to_bottom(std::move(card));
    }
    player.hand.cards.clear();
}

// Everything left in the deck goes to the discard pile
inline void deck_to_discard(GameState& state, PlayerID owner) {
    PlayerState& player = state.players[owner];
    for (auto& card : player.deck.cards) {
        player.discard.add_card(std::move(card));
    }
    player.deck.cards.clear();
}

inline void reset_turn(const CompileEngine& engine, GameState& state, PlayerID turn, Phase phase) {
    state.turn = turn;
    state.phase = phase;
    state.action_taken = false;
    state.compiled_this_turn = false;
    state.cache_checked = false;
    state.action_required.reset();
    state.interrupt_stack.clear();
    state.queued_actions.clear();
    state.processed_start_ids.clear();
    state.processed_end_ids.clear();
    state.processed_uncover_ids.clear();
    state.processed_clear_cache_ids.clear();
    recalculate_lane_values(engine.catalog(), state);
    state.compilable_lanes = phase == Phase::COMPILE
        ? engine.compilable_lanes(state, turn)
        : std::vector<int>();
}

inline void action_phase(const CompileEngine& engine, GameState& state, PlayerID turn) {
    reset_turn(engine, state, turn, Phase::ACTION);
}

inline void compile_phase(const CompileEngine& engine, GameState& state, PlayerID turn) {
    reset_turn(engine, state, turn, Phase::COMPILE);
}

/**
 * Seeded game with both hands put back into the decks.
 */
inline GameState blank_game(const CompileEngine& engine,
                            const ProtocolList& player_protocols,
                            const ProtocolList& opponent_protocols,
                            PlayerID first = PLAYER,
                            bool use_control = false,
                            uint32_t seed = 42) {
    GameState state = engine.create_initial_state(player_protocols, opponent_protocols,
                                                  use_control, first, seed);
    empty_hand(state, PLAYER);
    empty_hand(state, OPPONENT);
    action_phase(engine, state, first);
    return state;
}

inline GameState standard_game(const CompileEngine& engine, PlayerID first = PLAYER) {
    return blank_game(engine, {"Speed", "Life", "Water"}, {"Metal", "Death", "Hate"}, first);
}

// ============================================================================
// PENDING ACTION
// ============================================================================

template<typename T>
bool pending_is(const GameState& state) {
    return state.action_required.has_value() && std::holds_alternative<T>(*state.action_required);
}

template<typename T>
const T& pending_as(const GameState& state) {
    return std::get<T>(*state.action_required);
}

inline bool contains_id(const std::vector<CardID>& ids, const CardID& id) {
    for (const auto& entry : ids) {
        if (entry == id) return true;
    }
    return false;
}

} // namespace test_support
} // namespace compile
