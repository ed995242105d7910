/**
 * Compile Engine - Interactive Test Console
 *
 * Simple REPL for manual testing of game mechanics against an AI
 * opponent, plus a batch self-play mode:
 *
 *   compile_console [--config file] [--seed n] [--control] [--xray]
 *                   [--catalog file] [--random-protocols]
 *   compile_console --selfplay <easy|normal|hard> <easy|normal|hard> [games]
 */

#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <algorithm>
#include <random>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <cctype>

#include "compile_engine.hpp"

using namespace compile;

// ============================================================================
// HELPER FUNCTIONS
// ============================================================================

std::vector<std::string> split(const std::string& s, char delim = ' ') {
    std::vector<std::string> tokens;
    std::istringstream iss(s);
    std::string token;
    while (std::getline(iss, token, delim)) {
        if (!token.empty()) {
            tokens.push_back(token);
        }
    }
    return tokens;
}

std::optional<int> parse_int(const std::string& text) {
    try {
        size_t used = 0;
        int value = std::stoi(text, &used);
        if (used != text.size()) return std::nullopt;
        return value;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

uint32_t clock_seed() {
    return static_cast<uint32_t>(std::chrono::high_resolution_clock::now().time_since_epoch().count());
}

/**
 * Two disjoint random protocol lists drawn from the catalog.
 */
std::array<ProtocolList, 2> random_protocols(const CardCatalog& catalog, uint32_t seed) {
    std::vector<std::string> names = catalog.protocols();
    std::mt19937 rng(seed);
    std::shuffle(names.begin(), names.end(), rng);
    std::array<ProtocolList, 2> lists;
    for (int i = 0; i < LANE_COUNT; i++) {
        lists[0][i] = names[i];
        lists[1][i] = names[LANE_COUNT + i];
    }
    return lists;
}

// ============================================================================
// PRINT HELP
// ============================================================================

void print_help() {
    std::cout << R"(
=== Compile C++ Test Console ===

Commands:
  help                    - Show this help
  quit / exit             - Exit console

Game Setup:
  new [seed]              - Start a new game (you are P0, the AI is P1)
  show / s                - Show board, hand and required action
  log [n]                 - Show the last n log lines (default 10)
  stack                   - Show interrupt stack and queue
  check                   - Run the invariant checks

Legal Actions:
  actions / a             - Show all legal actions (numbered)
  do <number>...          - Execute actions by number
  play <card> <lane> <up|down>
  fill                    - Refresh your hand
  compile <lane>          - Compile a lane
  pick <card>             - Resolve the required action with a card
  lane <lane>             - Resolve the required action with a lane
  skip                    - Skip an optional action

AI:
  ai                      - Let the AI answer for whoever must act
  hint                    - Show the hard AI's scores for your turn
  auto on|off             - Let the AI move for P1 automatically (default on)

Examples:
  new 42                  # Seeded game
  a                       # See legal actions
  do 0                    # Execute action #0
  play p0_3 1 up          # Play card p0_3 face-up in lane 1
)" << std::endl;
}

// ============================================================================
// GAME STATE DISPLAY
// ============================================================================

std::string card_label(const PlayedCard& card, bool visible) {
    if (!visible) {
        return "[??? " + card.id + "]";
    }
    std::string text = "[" + card.name();
    if (!card.face_up) text += " down";
    if (card.revealed) text += " *";
    return text + " " + card.id + "]";
}

void show_player(const GameState& state, PlayerID player, PlayerID viewer) {
    const PlayerState& p = state.players[player];
    bool own = player == viewer;

    std::cout << "  " << (own ? "YOU" : "OPPONENT") << " (P" << static_cast<int>(player) << ")"
              << "  hand " << p.hand.count() << "  deck " << p.deck.count()
              << "  discard " << p.discard.count()
              << (state.control_card_holder == player ? "  <control>" : "")
              << (p.cannot_compile ? "  <cannot compile>" : "") << std::endl;

    for (int lane = 0; lane < LANE_COUNT; lane++) {
        std::cout << "    " << lane << ": " << p.protocols[lane]
                  << (p.compiled[lane] ? " (compiled)" : "")
                  << " = " << p.lane_values[lane] << "  ";
        for (const auto& card : p.board.lanes[lane]) {
            std::cout << card_label(card, card.face_up || own || card.revealed) << " ";
        }
        std::cout << std::endl;
    }

    if (own) {
        std::cout << "    hand: ";
        for (const auto& card : p.hand.cards) {
            std::cout << card_label(card, true) << " ";
        }
        std::cout << std::endl;
    } else {
        bool any = false;
        for (const auto& card : p.hand.cards) {
            if (card.revealed) {
                if (!any) std::cout << "    revealed hand: ";
                std::cout << card_label(card, true) << " ";
                any = true;
            }
        }
        if (any) std::cout << std::endl;
    }
}

void show_board(const GameState& state) {
    std::cout << "\n================ TURN " << state.turn_number << " | P"
              << static_cast<int>(state.turn) << " | " << to_string(state.phase)
              << " ================" << std::endl;
    show_player(state, OPPONENT, PLAYER);
    std::cout << "  ------------------------------------------------" << std::endl;
    show_player(state, PLAYER, PLAYER);

    if (state.action_required.has_value()) {
        const ActionBase& base = action_base(*state.action_required);
        std::cout << "\n  Required: " << action_type_name(*state.action_required)
                  << " by P" << static_cast<int>(base.actor);
        if (!base.source_card_id.empty()) {
            std::cout << " (from " << base.source_card_id << ")";
        }
        if (base.optional) std::cout << " [optional]";
        std::cout << std::endl;
    }
    if (state.winner.has_value()) {
        std::cout << "\n  GAME OVER - " << player_name(*state.winner) << " wins" << std::endl;
    }
}

void show_actions(const std::vector<AIAction>& actions, const GameState& state) {
    std::cout << "\n+-------------------------------------------------------------+" << std::endl;
    std::cout << "|  LEGAL ACTIONS (" << actions.size() << "):" << std::endl;
    std::cout << "+-------------------------------------------------------------+" << std::endl;

    for (size_t i = 0; i < actions.size(); i++) {
        const auto& a = actions[i];
        std::cout << "   [" << i << "] " << AIAction::type_name(a.action_type);
        if (a.card_id.has_value()) {
            const PlayedCard* card = state.find_card(*a.card_id);
            std::cout << " - " << (card ? card->name() : *a.card_id) << " (" << *a.card_id << ")";
        }
        if (a.lane.has_value()) {
            std::cout << " lane " << *a.lane;
            if (a.action_type == ActionType::PLAY_CARD || a.action_type == ActionType::PLAY_FROM_HAND) {
                std::cout << (a.face_up ? " up" : " down");
            }
        }
        if (!a.card_ids.empty()) {
            std::cout << " [";
            for (size_t j = 0; j < a.card_ids.size(); j++) {
                if (j > 0) std::cout << ", ";
                std::cout << a.card_ids[j];
            }
            std::cout << "]";
        }
        if (a.choice_index.has_value()) std::cout << " #" << *a.choice_index;
        if (a.second_index.has_value()) std::cout << " <-> #" << *a.second_index;
        if (a.protocol_order.has_value()) {
            const ProtocolList& order = *a.protocol_order;
            std::cout << " " << order[0] << "/" << order[1] << "/" << order[2];
        }
        if (a.action_type == ActionType::CONTROL_CHOICE) {
            static const char* const names[] = {"skip", "rearrange own", "rearrange opponent"};
            std::cout << " " << names[static_cast<int>(a.control)];
        }
        std::cout << std::endl;
    }
    std::cout << "+-------------------------------------------------------------+" << std::endl;
}

void show_stack(const GameState& state) {
    std::cout << "\nInterrupt stack (top first):" << std::endl;
    for (auto it = state.interrupt_stack.rbegin(); it != state.interrupt_stack.rend(); ++it) {
        std::cout << "  " << action_type_name(*it) << " P" << static_cast<int>(action_base(*it).actor)
                  << " " << action_base(*it).source_card_id << std::endl;
    }
    std::cout << "Queue (front first):" << std::endl;
    for (const auto& action : state.queued_actions) {
        std::cout << "  " << action_type_name(action) << " P" << static_cast<int>(action_base(action).actor)
                  << " " << action_base(action).source_card_id << std::endl;
    }
}

// ============================================================================
// SELF-PLAY
// ============================================================================

int run_selfplay(const GameConfig& config, bool random_lists, Difficulty first, Difficulty second, int games) {
    CompileEngine engine(config);
    TallySink tally;
    uint32_t base_seed = config.seed.has_value() ? *config.seed : clock_seed();

    std::unique_ptr<XRayLogger> xray_logger;
    if (config.xray_logging) {
        xray_logger = std::make_unique<XRayLogger>(config.xray_directory);
    }

    std::cout << "[SelfPlay] " << games << " games, P0 " << to_string(first)
              << " vs P1 " << to_string(second) << ", seed " << base_seed << std::endl;

    for (int g = 0; g < games; g++) {
        uint32_t seed = base_seed + static_cast<uint32_t>(g);
        ProtocolList player_protocols = config.player_protocols;
        ProtocolList opponent_protocols = config.opponent_protocols;
        if (random_lists) {
            auto lists = random_protocols(engine.catalog(), seed);
            player_protocols = lists[0];
            opponent_protocols = lists[1];
        }

        GameState state;
        try {
            state = engine.create_initial_state(player_protocols, opponent_protocols,
                                                config.use_control_mechanic, std::nullopt, seed);
        } catch (const std::invalid_argument& e) {
            std::cerr << "[SelfPlay] Cannot start game: " << e.what() << std::endl;
            return 1;
        }

        ai::StepObserver observer;
        if (xray_logger) {
            observer = [&xray_logger](const AIAction& action, const GameState& next) {
                xray_logger->log_action(next.turn_number, action);
                xray_logger->log_state(next);
            };
        }

        GameState final_state = ai::play_game(engine, std::move(state), {first, second}, 5000, observer);
        tally.record_game(summarize(final_state, first, second));

        if (xray_logger) {
            xray_logger->log_game_end(final_state.winner,
                final_state.winner.has_value() ? "all protocols compiled" : "step limit reached");
        }
        auto problems = engine.check_invariants(final_state);
        for (const auto& problem : problems) {
            std::cerr << "[SelfPlay] Game " << g << " invariant: " << problem << std::endl;
        }
    }

    std::cout << "\nResults after " << tally.games() << " games:" << std::endl;
    std::cout << "  P0 (" << to_string(first) << ") wins: " << tally.wins(PLAYER) << std::endl;
    std::cout << "  P1 (" << to_string(second) << ") wins: " << tally.wins(OPPONENT) << std::endl;
    std::cout << "  Unfinished: " << tally.unfinished() << std::endl;
    std::cout << "  Average turns: " << tally.average_turns() << std::endl;
    for (PlayerID p = 0; p < 2; p++) {
        const PlayerStats& s = tally.totals(p);
        std::cout << "  P" << static_cast<int>(p) << " totals: played " << s.cards_played
                  << ", deleted " << s.cards_deleted << ", flipped " << s.cards_flipped
                  << ", shifted " << s.cards_shifted << ", drawn " << s.cards_drawn
                  << ", discarded " << s.cards_discarded << ", compiles " << s.compiles
                  << " (" << s.recompiles << " recompiles)" << std::endl;
    }
    return 0;
}

// ============================================================================
// CONSOLE CLASS
// ============================================================================

class Console {
public:
    GameConfig config;
    CompileEngine engine;
    GameState state;
    std::vector<AIAction> current_actions;
    bool random_lists = false;
    bool auto_opponent = true;
    size_t log_cursor = 0;

    // X-Ray logger for debugging
    std::unique_ptr<XRayLogger> xray_logger;

    Console(const GameConfig& cfg, bool random_protocol_lists)
        : config(cfg)
        , engine(cfg)
        , random_lists(random_protocol_lists)
    {
        std::cout << "Catalog loaded: " << engine.catalog().card_count() << " cards, "
                  << engine.catalog().protocols().size() << " protocols" << std::endl;
        if (config.xray_logging) {
            xray_logger = std::make_unique<XRayLogger>(config.xray_directory);
        }
    }

    void refresh_actions() {
        current_actions = engine.get_legal_actions(state);
    }

    void print_new_log() {
        for (; log_cursor < state.log.size(); log_cursor++) {
            const LogEntry& entry = state.log[log_cursor];
            std::cout << "  " << std::string(entry.depth * 2, ' ') << "P" << static_cast<int>(entry.player)
                      << (entry.source.empty() ? "" : " [" + entry.source + "]") << ": " << entry.message << std::endl;
        }
    }

    void show_game_state_and_actions() {
        show_board(state);
        refresh_actions();
        if (!state.is_game_over() && engine.expected_actor(state) == PLAYER) {
            show_actions(current_actions, state);
        }
    }

    void cmd_new(const std::vector<std::string>& args) {
        uint32_t seed = config.seed.has_value() ? *config.seed : clock_seed();
        if (args.size() > 1) {
            auto parsed = parse_int(args[1]);
            if (!parsed.has_value() || *parsed < 0) {
                std::cout << "Usage: new [seed]" << std::endl;
                return;
            }
            seed = static_cast<uint32_t>(*parsed);
        }

        ProtocolList player_protocols = config.player_protocols;
        ProtocolList opponent_protocols = config.opponent_protocols;
        if (random_lists) {
            auto lists = random_protocols(engine.catalog(), seed);
            player_protocols = lists[0];
            opponent_protocols = lists[1];
        }

        try {
            state = engine.create_initial_state(player_protocols, opponent_protocols,
                                                config.use_control_mechanic, std::nullopt, seed);
        } catch (const std::invalid_argument& e) {
            std::cout << "Cannot start game: " << e.what() << std::endl;
            return;
        }
        log_cursor = 0;
        std::cout << "New game, seed " << seed << ". "
                  << player_name(state.turn) << " goes first." << std::endl;
        print_new_log();
        run_opponent();
        show_game_state_and_actions();
    }

    /**
     * Apply an intent, reporting a rejection instead of changing the state.
     */
    bool apply(const AIAction& action) {
        if (xray_logger) {
            xray_logger->log_action(state.turn_number, action);
        }
        StepResult result = engine.step(state, action);
        if (!result.ok) {
            std::cout << "Rejected (" << to_string(result.error) << "): " << result.message << std::endl;
            return false;
        }
        state = std::move(result.state);
        if (xray_logger) {
            xray_logger->log_state(state);
            if (state.is_game_over()) {
                xray_logger->log_game_end(state.winner, "all protocols compiled");
            }
        }
        print_new_log();
        return true;
    }

    void run_opponent() {
        if (!auto_opponent) return;
        int guard = 0;
        while (!state.is_game_over() && engine.expected_actor(state) == OPPONENT && guard++ < 500) {
            AIAction action = ai::choose_action(engine, state, config.opponent_difficulty);
            std::cout << "  AI> " << action.to_string() << std::endl;
            if (!apply(action)) break;
        }
    }

    void after_move() {
        run_opponent();
        show_game_state_and_actions();
    }

    void cmd_do(const std::vector<std::string>& args) {
        if (args.size() < 2) {
            std::cout << "Usage: do <action_number> [action_number...]" << std::endl;
            return;
        }

        for (size_t i = 1; i < args.size(); i++) {
            refresh_actions();
            auto idx = parse_int(args[i]);
            if (!idx.has_value() || *idx < 0 || *idx >= static_cast<int>(current_actions.size())) {
                std::cout << "Invalid action index: " << args[i] << std::endl;
                continue;
            }
            const AIAction action = current_actions[*idx];
            std::cout << "\n>>> Executing: " << action.to_string() << std::endl;
            apply(action);
        }
        after_move();
    }

    void cmd_play(const std::vector<std::string>& args) {
        if (args.size() < 4) {
            std::cout << "Usage: play <card> <lane> <up|down>" << std::endl;
            return;
        }
        auto lane = parse_int(args[2]);
        if (!lane.has_value()) {
            std::cout << "Invalid lane: " << args[2] << std::endl;
            return;
        }
        bool up = args[3] == "up" || args[3] == "u";
        ActionType type = state.has_pending_action() ? ActionType::PLAY_FROM_HAND : ActionType::PLAY_CARD;
        AIAction action = type == ActionType::PLAY_CARD
            ? AIAction::play_card(PLAYER, args[1], *lane, up)
            : AIAction::play_from_hand(PLAYER, args[1], *lane, up);
        if (apply(action)) after_move();
    }

    void cmd_lane(const std::vector<std::string>& args, bool compile) {
        if (args.size() < 2) {
            std::cout << "Usage: " << args[0] << " <lane>" << std::endl;
            return;
        }
        auto lane = parse_int(args[1]);
        if (!lane.has_value()) {
            std::cout << "Invalid lane: " << args[1] << std::endl;
            return;
        }
        AIAction action = compile ? AIAction::compile_lane(PLAYER, *lane) : AIAction::select_lane(PLAYER, *lane);
        if (apply(action)) after_move();
    }

    void cmd_pick(const std::vector<std::string>& args) {
        if (args.size() < 2 || !state.action_required.has_value()) {
            std::cout << "Usage: pick <card> (with a required action)" << std::endl;
            return;
        }
        const ActionRequired& required = *state.action_required;
        AIAction action = AIAction::select_card(PLAYER, args[1]);
        if (std::holds_alternative<SelectHandCard>(required)) {
            action = AIAction::select_hand_card(PLAYER, args[1]);
        } else if (std::holds_alternative<DiscardAction>(required)) {
            action = AIAction::discard_cards(PLAYER, std::vector<CardID>(args.begin() + 1, args.end()));
        }
        if (apply(action)) after_move();
    }

    void cmd_ai() {
        if (state.is_game_over()) {
            std::cout << "The game is over." << std::endl;
            return;
        }
        PlayerID actor = engine.expected_actor(state);
        Difficulty difficulty = actor == PLAYER ? config.player_difficulty : config.opponent_difficulty;
        AIAction action = ai::choose_action(engine, state, difficulty);
        std::cout << "  AI(" << to_string(difficulty) << ")> " << action.to_string() << std::endl;
        if (apply(action)) after_move();
    }

    void cmd_hint() {
        if (state.has_pending_action() || state.turn != PLAYER) {
            std::cout << "Hints are only available for your own turn actions." << std::endl;
            return;
        }
        auto scored = ai::hard_score_turn(engine, state);
        std::sort(scored.begin(), scored.end(),
                  [](const ai::ScoredAction& a, const ai::ScoredAction& b) { return a.score > b.score; });
        for (const auto& entry : scored) {
            std::cout << "  " << entry.score << "  " << entry.description << std::endl;
        }
    }

    void cmd_log(const std::vector<std::string>& args) {
        int count = 10;
        if (args.size() > 1) {
            count = parse_int(args[1]).value_or(10);
        }
        size_t start = state.log.size() > static_cast<size_t>(count) ? state.log.size() - count : 0;
        for (size_t i = start; i < state.log.size(); i++) {
            const LogEntry& entry = state.log[i];
            std::cout << "  T" << entry.turn_number << " " << to_string(entry.phase) << " P"
                      << static_cast<int>(entry.player) << ": " << entry.message << std::endl;
        }
    }

    void cmd_check() {
        auto problems = engine.check_invariants(state);
        if (problems.empty()) {
            std::cout << "State is consistent." << std::endl;
        }
        for (const auto& problem : problems) {
            std::cout << "  ! " << problem << std::endl;
        }
    }

    void run() {
        std::cout << "Compile C++ Test Console" << std::endl;
        std::cout << "=====================================\n" << std::endl;

        cmd_new({"new"});

        std::string line;
        while (true) {
            std::cout << "\n> ";
            if (!std::getline(std::cin, line)) {
                break;
            }

            auto args = split(line);
            if (args.empty()) continue;

            const std::string& cmd = args[0];

            // Allow just typing a number as shorthand for "do <number>"
            if (std::isdigit(static_cast<unsigned char>(cmd[0]))) {
                std::vector<std::string> do_args = {"do"};
                do_args.insert(do_args.end(), args.begin(), args.end());
                cmd_do(do_args);
                continue;
            }

            if (cmd == "quit" || cmd == "exit" || cmd == "q") {
                break;
            } else if (cmd == "help" || cmd == "h" || cmd == "?") {
                print_help();
            } else if (cmd == "new" || cmd == "reset" || cmd == "restart") {
                cmd_new(args);
            } else if (cmd == "show" || cmd == "s") {
                show_game_state_and_actions();
            } else if (cmd == "actions" || cmd == "a") {
                refresh_actions();
                show_actions(current_actions, state);
            } else if (cmd == "do" || cmd == "d") {
                cmd_do(args);
            } else if (cmd == "play") {
                cmd_play(args);
            } else if (cmd == "fill") {
                if (apply(AIAction::fill_hand(PLAYER))) after_move();
            } else if (cmd == "compile") {
                cmd_lane(args, true);
            } else if (cmd == "lane") {
                cmd_lane(args, false);
            } else if (cmd == "pick") {
                cmd_pick(args);
            } else if (cmd == "skip") {
                if (apply(AIAction::skip(PLAYER))) after_move();
            } else if (cmd == "ai") {
                cmd_ai();
            } else if (cmd == "hint") {
                cmd_hint();
            } else if (cmd == "auto") {
                auto_opponent = args.size() < 2 || args[1] != "off";
                std::cout << "AI opponent " << (auto_opponent ? "on" : "off") << std::endl;
                if (auto_opponent) after_move();
            } else if (cmd == "log") {
                cmd_log(args);
            } else if (cmd == "stack") {
                show_stack(state);
            } else if (cmd == "check") {
                cmd_check();
            } else {
                std::cout << "Unknown command: '" << cmd << "'. Type 'help' for commands." << std::endl;
            }
        }

        std::cout << "Goodbye!" << std::endl;
    }
};

// ============================================================================
// MAIN
// ============================================================================

int main(int argc, char** argv) {
    GameConfig config;
    bool random_lists = false;
    std::optional<std::array<Difficulty, 2>> selfplay;
    int games = 1;

    std::vector<std::string> args(argv + 1, argv + argc);
    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];
        bool has_next = i + 1 < args.size();

        if (arg == "--config" && has_next) {
            if (!config.load_from_json(args[++i])) {
                return 1;
            }
        } else if (arg == "--seed" && has_next) {
            auto seed = parse_int(args[++i]);
            if (!seed.has_value() || *seed < 0) {
                std::cerr << "Invalid seed: " << args[i] << std::endl;
                return 1;
            }
            config.seed = static_cast<uint32_t>(*seed);
        } else if (arg == "--control") {
            config.use_control_mechanic = true;
        } else if (arg == "--xray") {
            config.xray_logging = true;
        } else if (arg == "--catalog" && has_next) {
            config.custom_protocols_path = args[++i];
        } else if (arg == "--random-protocols") {
            random_lists = true;
        } else if (arg == "--selfplay" && i + 2 < args.size()) {
            auto first = parse_difficulty(args[i + 1]);
            auto second = parse_difficulty(args[i + 2]);
            if (!first.has_value() || !second.has_value()) {
                std::cerr << "Usage: --selfplay <easy|normal|hard> <easy|normal|hard> [games]" << std::endl;
                return 1;
            }
            selfplay = std::array<Difficulty, 2>{*first, *second};
            i += 2;
            if (i + 1 < args.size()) {
                auto count = parse_int(args[i + 1]);
                if (count.has_value() && *count > 0) {
                    games = *count;
                    i++;
                }
            }
        } else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            return 1;
        }
    }

    if (selfplay.has_value()) {
        return run_selfplay(config, random_lists, (*selfplay)[0], (*selfplay)[1], games);
    }

    Console console(config, random_lists);
    console.run();
    return 0;
}
