/**
 * Compile Engine - Player State
 *
 * Represents a single player's complete state including zones, lanes,
 * protocols and per-game counters.
 */

#pragma once

#include "zone.hpp"
#include "board.hpp"

namespace compile {

/**
 * PlayerStats - Per-game counters.
 */
struct PlayerStats {
    int cards_played = 0;
    int cards_discarded = 0;
    int cards_deleted = 0;
    int cards_flipped = 0;
    int cards_shifted = 0;
    int cards_drawn = 0;
    int hands_refreshed = 0;
    int compiles = 0;
    int recompiles = 0;
};

/**
 * PlayerState - Complete state for one player.
 */
struct PlayerState {
    PlayerID player_id = PLAYER;

    // Zones
    Zone deck{true};
    Zone hand{false};
    Zone discard{false};

    // Lanes
    Board board;

    // Protocols, one per lane
    ProtocolList protocols;
    ProtocolList starting_protocols;    // As chosen at setup, before any rearrange
    std::array<bool, LANE_COUNT> compiled = {false, false, false};

    // Cached lane totals, recomputed after every board mutation
    std::array<int, LANE_COUNT> lane_values = {0, 0, 0};

    PlayerStats stats;

    // Set by a compile block, cleared at the end of this player's turn
    bool cannot_compile = false;

    // ========================================================================
    // CONSTRUCTORS
    // ========================================================================

    PlayerState() = default;

    explicit PlayerState(PlayerID id) : player_id(id) {}

    // ========================================================================
    // QUERIES
    // ========================================================================

    int compiled_count() const {
        int count = 0;
        for (bool c : compiled) {
            if (c) count++;
        }
        return count;
    }

    bool all_compiled() const {
        return compiled_count() == LANE_COUNT;
    }

    int protocol_lane(const std::string& protocol) const {
        for (int i = 0; i < LANE_COUNT; i++) {
            if (protocols[i] == protocol) return i;
        }
        return -1;
    }

    // Find card in any zone
    PlayedCard* find_card_anywhere(const CardID& card_id) {
        if (auto* c = board.find_card(card_id)) return c;
        if (auto* c = hand.find_card(card_id)) return c;
        if (auto* c = deck.find_card(card_id)) return c;
        if (auto* c = discard.find_card(card_id)) return c;
        return nullptr;
    }

    const PlayedCard* find_card_anywhere(const CardID& card_id) const {
        if (auto* c = board.find_card(card_id)) return c;
        if (auto* c = hand.find_card(card_id)) return c;
        if (auto* c = deck.find_card(card_id)) return c;
        if (auto* c = discard.find_card(card_id)) return c;
        return nullptr;
    }

    int total_cards() const {
        return deck.count() + hand.count() + discard.count() + board.card_count();
    }

    // ========================================================================
    // CLONING
    // ========================================================================

    PlayerState clone() const {
        PlayerState copy(player_id);
        copy.deck = deck.clone();
        copy.hand = hand.clone();
        copy.discard = discard.clone();
        copy.board = board;
        copy.protocols = protocols;
        copy.starting_protocols = starting_protocols;
        copy.compiled = compiled;
        copy.lane_values = lane_values;
        copy.stats = stats;
        copy.cannot_compile = cannot_compile;
        return copy;
    }
};

} // namespace compile
