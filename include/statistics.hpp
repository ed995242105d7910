/**
 * Compile Engine - Statistics
 *
 * Port for game statistics. The engine and the AI never write to it;
 * drivers (console self-play, Python) hand finished games to a sink.
 */

#pragma once

#include "game_state.hpp"

namespace compile {

/**
 * GameSummary - What a sink learns about one finished game.
 */
struct GameSummary {
    std::optional<PlayerID> winner;
    int turns = 0;
    std::array<Difficulty, 2> difficulties = {Difficulty::NORMAL, Difficulty::NORMAL};
    std::array<ProtocolList, 2> protocols;       // As chosen at setup
    std::array<PlayerStats, 2> stats;
};

GameSummary summarize(const GameState& state, Difficulty player_difficulty, Difficulty opponent_difficulty);

/**
 * StatisticsSink - Receives finished games.
 */
class StatisticsSink {
public:
    virtual ~StatisticsSink() = default;

    virtual void record_game(const GameSummary& summary) = 0;
};

/**
 * TallySink - In-memory sink counting wins and summing per-player stats.
 */
class TallySink : public StatisticsSink {
public:
    void record_game(const GameSummary& summary) override;

    int games() const { return games_; }
    int wins(PlayerID player) const { return wins_[player]; }
    int unfinished() const { return unfinished_; }
    double average_turns() const;
    const PlayerStats& totals(PlayerID player) const { return totals_[player]; }

private:
    int games_ = 0;
    int unfinished_ = 0;
    long total_turns_ = 0;
    std::array<int, 2> wins_ = {0, 0};
    std::array<PlayerStats, 2> totals_;
};

} // namespace compile
