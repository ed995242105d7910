/**
 * Compile Engine - Statistics Implementation
 */

#include "statistics.hpp"

namespace compile {

GameSummary summarize(const GameState& state, Difficulty player_difficulty, Difficulty opponent_difficulty) {
    GameSummary summary;
    summary.winner = state.winner;
    summary.turns = state.turn_number;
    summary.difficulties = {player_difficulty, opponent_difficulty};
    for (PlayerID p = 0; p < 2; p++) {
        summary.protocols[p] = state.players[p].starting_protocols;
        summary.stats[p] = state.players[p].stats;
    }
    return summary;
}

void TallySink::record_game(const GameSummary& summary) {
    games_++;
    total_turns_ += summary.turns;
    if (summary.winner.has_value()) {
        wins_[*summary.winner]++;
    } else {
        unfinished_++;
    }

    for (int p = 0; p < 2; p++) {
        const PlayerStats& s = summary.stats[p];
        PlayerStats& t = totals_[p];
        t.cards_played += s.cards_played;
        t.cards_discarded += s.cards_discarded;
        t.cards_deleted += s.cards_deleted;
        t.cards_flipped += s.cards_flipped;
        t.cards_shifted += s.cards_shifted;
        t.cards_drawn += s.cards_drawn;
        t.hands_refreshed += s.hands_refreshed;
        t.compiles += s.compiles;
        t.recompiles += s.recompiles;
    }
}

double TallySink::average_turns() const {
    return games_ == 0 ? 0.0 : static_cast<double>(total_turns_) / games_;
}

} // namespace compile
