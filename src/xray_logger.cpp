/**
 * Compile Engine - X-Ray Logger Implementation
 */

#include "xray_logger.hpp"
#include <filesystem>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <iostream>

namespace compile {

XRayLogger::XRayLogger(const std::string& output_dir) {
    // Create output directory if it doesn't exist
    std::error_code ec;
    std::filesystem::create_directories(output_dir, ec);
    if (ec) {
        std::cerr << "[X-Ray Logger] Cannot create " << output_dir << ": " << ec.message() << std::endl;
        enabled_ = false;
        return;
    }

    // Create timestamped log file
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm = *std::localtime(&time_t);

    std::ostringstream filename;
    filename << output_dir << "/xray_game_"
             << std::put_time(&tm, "%Y%m%d_%H%M%S") << ".log";
    log_path_ = filename.str();

    log_file_.open(log_path_);
    if (!log_file_.is_open()) {
        std::cerr << "[X-Ray Logger] Failed to open log file: " << log_path_ << std::endl;
        enabled_ = false;
        return;
    }

    log_file_ << std::string(80, '=') << "\n";
    log_file_ << "X-RAY GAME LOG - COMPILE\n";

    std::ostringstream timestamp;
    timestamp << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    log_file_ << "Started: " << timestamp.str() << "\n";
    log_file_ << std::string(80, '=') << "\n\n";

    std::cout << "[X-Ray Logger] Logging to: " << log_path_ << std::endl;
}

XRayLogger::~XRayLogger() {
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

std::string XRayLogger::fmt_card(const PlayedCard& card, bool on_board) const {
    std::string text = card.name() + " (" + card.id + ")";
    if (on_board) {
        text += card.face_up ? " [up]" : " [down]";
    }
    if (card.revealed) {
        text += " *";
    }
    return text;
}

std::string XRayLogger::fmt_zone(const Zone& zone) const {
    std::ostringstream line;
    line << "(" << zone.cards.size() << "): [";
    for (size_t i = 0; i < zone.cards.size(); i++) {
        if (i > 0) line << ", ";
        line << fmt_card(zone.cards[i], false);
    }
    line << "]";
    return line.str();
}

void XRayLogger::write_player(const GameState& state, PlayerID player) {
    const PlayerState& p = state.players[player];
    log_file_ << "[PLAYER " << static_cast<int>(player) << "]"
              << (state.turn == player ? " <turn>" : "")
              << (state.control_card_holder == player ? " <control>" : "")
              << (p.cannot_compile ? " <cannot compile>" : "") << "\n";

    for (int lane = 0; lane < LANE_COUNT; lane++) {
        log_file_ << "LANE " << lane << " " << p.protocols[lane]
                  << (p.compiled[lane] ? " [compiled]" : "")
                  << " = " << p.lane_values[lane] << ": [";
        const Lane& stack = p.board.lanes[lane];
        for (size_t i = 0; i < stack.size(); i++) {
            if (i > 0) log_file_ << ", ";
            log_file_ << fmt_card(stack[i], true);
        }
        log_file_ << "]\n";
    }

    log_file_ << "HAND " << fmt_zone(p.hand) << "\n";
    log_file_ << "DECK " << fmt_zone(p.deck) << "\n";
    log_file_ << "DISCARD " << fmt_zone(p.discard) << "\n";
}

void XRayLogger::log_action(int turn_number, const AIAction& action) {
    if (!enabled_ || !log_file_.is_open()) return;

    log_file_ << std::string(80, '#') << "\n";
    log_file_ << "[TURN " << turn_number << " | PLAYER: P" << static_cast<int>(action.player_id)
              << "] ACTION: " << action.to_string() << "\n";
    log_file_ << std::string(80, '#') << "\n\n";

    log_file_.flush();
}

void XRayLogger::log_state(const GameState& state) {
    if (!enabled_ || !log_file_.is_open()) return;

    log_file_ << std::string(80, '=') << "\n";
    write_player(state, PLAYER);
    log_file_ << "\n";
    write_player(state, OPPONENT);

    log_file_ << "\n[GLOBAL]\n";
    log_file_ << "Phase: " << to_string(state.phase)
              << " | Turn: " << state.turn_number
              << " | Turn Player: P" << static_cast<int>(state.turn) << "\n";

    if (state.action_required.has_value()) {
        const ActionBase& base = action_base(*state.action_required);
        log_file_ << "Required: " << action_type_name(*state.action_required)
                  << " by P" << static_cast<int>(base.actor);
        if (!base.source_card_id.empty()) {
            log_file_ << " from " << base.source_card_id;
        }
        log_file_ << (base.optional ? " (optional)" : "") << "\n";
    }
    if (!state.interrupt_stack.empty() || !state.queued_actions.empty()) {
        log_file_ << "Interrupts: " << state.interrupt_stack.size()
                  << " | Queued: " << state.queued_actions.size() << "\n";
    }

    log_file_ << std::string(80, '=') << "\n\n";

    log_file_.flush();
}

void XRayLogger::log_game_end(std::optional<PlayerID> winner, const std::string& reason) {
    if (!enabled_ || !log_file_.is_open()) return;

    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm = *std::localtime(&time_t);

    log_file_ << "\n" << std::string(80, '=') << "\n";
    log_file_ << "GAME END\n";
    log_file_ << std::string(80, '=') << "\n";

    if (winner.has_value()) {
        log_file_ << "Winner: Player " << static_cast<int>(*winner) << "\n";
    } else {
        log_file_ << "Result: No winner\n";
    }

    log_file_ << "Reason: " << reason << "\n";

    std::ostringstream timestamp;
    timestamp << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    log_file_ << "Ended: " << timestamp.str() << "\n";

    log_file_ << std::string(80, '=') << "\n";

    log_file_.flush();
}

} // namespace compile
