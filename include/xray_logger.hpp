/**
 * Compile Engine - X-Ray Logger
 *
 * Complete game state visibility for debugging.
 * Logs all game state including hidden zones (decks, face-down cards,
 * both hands). Shows card IDs so exact card movement can be tracked.
 */

#pragma once

#include "game_state.hpp"
#include "action.hpp"
#include <string>
#include <fstream>

namespace compile {

/**
 * XRayLogger - Complete game state visibility for debugging.
 *
 * Logs all game state including hidden information.
 * Useful for auditing card movements and verifying rules enforcement.
 */
class XRayLogger {
public:
    /**
     * Constructor - creates timestamped log file.
     *
     * @param output_dir Directory for log files
     */
    explicit XRayLogger(const std::string& output_dir = "logs");

    ~XRayLogger();

    /**
     * Log an action header.
     *
     * @param turn_number Current turn number
     * @param action Intent being applied
     */
    void log_action(int turn_number, const AIAction& action);

    /**
     * Log complete game state snapshot (including hidden zones).
     */
    void log_state(const GameState& state);

    /**
     * Log game end result.
     *
     * @param winner Winning player ID (nullopt if the game was cut off)
     * @param reason Reason for game end
     */
    void log_game_end(std::optional<PlayerID> winner, const std::string& reason);

    const std::string& get_log_path() const { return log_path_; }

    bool is_enabled() const { return enabled_; }

    void set_enabled(bool enabled) { enabled_ = enabled; }

private:
    std::string log_path_;
    std::ofstream log_file_;
    bool enabled_ = true;

    /**
     * Format card as "Speed-3 (p0_7)", with orientation marks on the board.
     */
    std::string fmt_card(const PlayedCard& card, bool on_board) const;

    std::string fmt_zone(const Zone& zone) const;

    void write_player(const GameState& state, PlayerID player);
};

} // namespace compile
