/**
 * Compile Engine - Game State
 *
 * The root state object representing the complete game snapshot.
 * Every public engine transition takes one of these by const reference
 * and returns a new one.
 */

#pragma once

#include "player_state.hpp"
#include "action_required.hpp"
#include <deque>
#include <random>

namespace compile {

/**
 * LogEntry - One line of the move/effect log.
 */
struct LogEntry {
    int turn_number = 0;
    PlayerID player = PLAYER;
    Phase phase = Phase::START;
    std::string source;      // Card that caused it, empty for rules text
    std::string message;
    int depth = 0;           // Interrupt nesting when written
};

enum class EventType : uint8_t {
    PLAY,
    FLIP,
    DELETE,
    SHIFT,
    RETURN,
    DRAW,
    DISCARD,
    COMPILE,
    REVEAL,
    PROTOCOLS_CHANGED,
    GAME_OVER
};

/**
 * BoardEvent - Post-transition event consumed by presentation layers.
 * Cleared at the start of every transition.
 */
struct BoardEvent {
    EventType type = EventType::PLAY;
    PlayerID player = PLAYER;
    CardID card_id;
    int from_lane = -1;
    int to_lane = -1;
    int count = 0;
};

/**
 * BoardPosition - A card located on either player's board.
 */
struct BoardPosition {
    PlayerID owner = PLAYER;
    int lane = -1;
    int index = -1;

    bool is_valid() const { return lane >= 0 && index >= 0; }
};

/**
 * CommittedCard - A card being played whose covered card's on-cover
 * effect resolves before it lands.
 */
struct CommittedCard {
    PlayedCard card;
    PlayerID owner = PLAYER;
    int lane = -1;
};

/**
 * GameState - The complete game snapshot.
 */
struct GameState {
    // Players (always exactly 2)
    std::array<PlayerState, 2> players;

    // Turn tracking
    PlayerID turn = PLAYER;
    Phase phase = Phase::START;
    int turn_number = 1;

    // Decisions
    std::optional<ActionRequired> action_required;
    std::vector<ActionRequired> interrupt_stack;     // LIFO
    std::deque<ActionRequired> queued_actions;       // FIFO

    // Game result
    std::optional<PlayerID> winner;

    // Phase pass bookkeeping
    std::unordered_set<CardID> processed_start_ids;
    std::unordered_set<CardID> processed_end_ids;
    std::unordered_set<CardID> processed_uncover_ids;
    std::unordered_set<CardID> processed_clear_cache_ids;
    bool action_taken = false;
    bool compiled_this_turn = false;
    bool cache_checked = false;

    // Compile
    std::vector<int> compilable_lanes;

    // Control mechanic
    bool use_control_mechanic = false;
    std::optional<PlayerID> control_card_holder;

    // Play in progress
    std::optional<CommittedCard> committed;
    CardID last_played_card_id;

    // Triggers fired by the mutation in progress; always empty between transitions
    std::vector<EffectContext> fired_triggers;

    // History
    std::vector<LogEntry> log;
    std::vector<BoardEvent> events;

    // RNG for game randomness (mutable since it changes state when used)
    uint32_t seed = 0;
    mutable std::mt19937 rng;
    int next_card_serial = 0;

    // ========================================================================
    // CONSTRUCTORS
    // ========================================================================

    GameState() {
        players[0] = PlayerState(PLAYER);
        players[1] = PlayerState(OPPONENT);
    }

    // ========================================================================
    // PLAYER ACCESS
    // ========================================================================

    PlayerState& get_player(PlayerID id) {
        return players[id];
    }

    const PlayerState& get_player(PlayerID id) const {
        return players[id];
    }

    PlayerState& get_turn_player() {
        return players[turn];
    }

    const PlayerState& get_turn_player() const {
        return players[turn];
    }

    // ========================================================================
    // GAME STATUS
    // ========================================================================

    bool is_game_over() const {
        return winner.has_value();
    }

    bool has_pending_action() const {
        return action_required.has_value();
    }

    // ========================================================================
    // ACTION STACK
    // ========================================================================

    /**
     * Install an action. A still-pending action is suspended on the
     * interrupt stack and restored once the new one resolves.
     */
    void issue(ActionRequired action) {
        if (action_required.has_value()) {
            interrupt_stack.push_back(std::move(*action_required));
        }
        action_required = std::move(action);
    }

    void push_interrupt(ActionRequired action) {
        interrupt_stack.push_back(std::move(action));
    }

    std::optional<ActionRequired> pop_interrupt() {
        if (interrupt_stack.empty()) {
            return std::nullopt;
        }
        ActionRequired action = std::move(interrupt_stack.back());
        interrupt_stack.pop_back();
        return action;
    }

    void queue_action(ActionRequired action) {
        queued_actions.push_back(std::move(action));
    }

    std::optional<ActionRequired> pop_queued() {
        if (queued_actions.empty()) {
            return std::nullopt;
        }
        ActionRequired action = std::move(queued_actions.front());
        queued_actions.pop_front();
        return action;
    }

    bool has_deferred_work() const {
        return !interrupt_stack.empty() || !queued_actions.empty();
    }

    // ========================================================================
    // LOGGING
    // ========================================================================

    void add_log(PlayerID player, const std::string& message, const std::string& source = "") {
        LogEntry entry;
        entry.turn_number = turn_number;
        entry.player = player;
        entry.phase = phase;
        entry.source = source;
        entry.message = message;
        entry.depth = static_cast<int>(interrupt_stack.size());
        log.push_back(std::move(entry));
    }

    void add_event(EventType type, PlayerID player, const CardID& card_id = "",
                   int from_lane = -1, int to_lane = -1, int count = 0) {
        events.push_back(BoardEvent{type, player, card_id, from_lane, to_lane, count});
    }

    // ========================================================================
    // CLONING
    // ========================================================================

    GameState clone() const {
        return *this;
    }

    // ========================================================================
    // UTILITY
    // ========================================================================

    BoardPosition locate_on_board(const CardID& card_id) const {
        for (PlayerID p = 0; p < 2; p++) {
            CardLocation loc = players[p].board.locate(card_id);
            if (loc.is_valid()) {
                return BoardPosition{p, loc.lane, loc.index};
            }
        }
        return BoardPosition{};
    }

    PlayedCard* board_card(const BoardPosition& pos) {
        if (!pos.is_valid()) return nullptr;
        return &players[pos.owner].board.lanes[pos.lane][pos.index];
    }

    const PlayedCard* board_card(const BoardPosition& pos) const {
        if (!pos.is_valid()) return nullptr;
        return &players[pos.owner].board.lanes[pos.lane][pos.index];
    }

    bool is_uncovered(const BoardPosition& pos) const {
        return pos.is_valid() && pos.index == players[pos.owner].board.lane_size(pos.lane) - 1;
    }

    // Find a card anywhere in the game (either player, or committed)
    const PlayedCard* find_card(const CardID& card_id) const {
        if (auto* c = players[0].find_card_anywhere(card_id)) return c;
        if (auto* c = players[1].find_card_anywhere(card_id)) return c;
        if (committed.has_value() && committed->card.id == card_id) {
            return &committed->card;
        }
        return nullptr;
    }

    CardID make_card_id(PlayerID owner) {
        return "p" + std::to_string(owner) + "_" + std::to_string(next_card_serial++);
    }
};

} // namespace compile
