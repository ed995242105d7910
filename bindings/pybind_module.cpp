/**
 * Compile Engine - Python Bindings
 *
 * pybind11 wrapper for the C++ engine.
 * Exposes the state types, the transition API and the AI entry points
 * so a Python front end or training loop can drive games.
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/operators.h>
#include <pybind11/functional.h>

#include "compile_engine.hpp"

namespace py = pybind11;

PYBIND11_MODULE(compile_engine_cpp, m) {
    m.doc() = "Rules engine and AI for the Compile card game";

    // ========================================================================
    // ENUMS
    // ========================================================================

    py::enum_<compile::Phase>(m, "Phase")
        .value("START", compile::Phase::START)
        .value("CONTROL", compile::Phase::CONTROL)
        .value("COMPILE", compile::Phase::COMPILE)
        .value("ACTION", compile::Phase::ACTION)
        .value("HAND_LIMIT", compile::Phase::HAND_LIMIT)
        .value("END", compile::Phase::END)
        .export_values();

    py::enum_<compile::Difficulty>(m, "Difficulty")
        .value("EASY", compile::Difficulty::EASY)
        .value("NORMAL", compile::Difficulty::NORMAL)
        .value("HARD", compile::Difficulty::HARD)
        .export_values();

    py::enum_<compile::IllegalIntent>(m, "IllegalIntent")
        .value("NONE", compile::IllegalIntent::NONE)
        .value("GAME_OVER", compile::IllegalIntent::GAME_OVER)
        .value("WRONG_ACTOR", compile::IllegalIntent::WRONG_ACTOR)
        .value("WRONG_PHASE", compile::IllegalIntent::WRONG_PHASE)
        .value("ACTION_PENDING", compile::IllegalIntent::ACTION_PENDING)
        .value("NO_ACTION_PENDING", compile::IllegalIntent::NO_ACTION_PENDING)
        .value("ACTION_TYPE_MISMATCH", compile::IllegalIntent::ACTION_TYPE_MISMATCH)
        .value("CARD_NOT_FOUND", compile::IllegalIntent::CARD_NOT_FOUND)
        .value("UNTARGETABLE", compile::IllegalIntent::UNTARGETABLE)
        .value("INVALID_LANE", compile::IllegalIntent::INVALID_LANE)
        .value("PLAY_NOT_ALLOWED", compile::IllegalIntent::PLAY_NOT_ALLOWED)
        .value("NOT_COMPILABLE", compile::IllegalIntent::NOT_COMPILABLE)
        .value("NOT_OPTIONAL", compile::IllegalIntent::NOT_OPTIONAL)
        .value("INVALID_SELECTION", compile::IllegalIntent::INVALID_SELECTION)
        .value("ALREADY_ACTED", compile::IllegalIntent::ALREADY_ACTED)
        .export_values();

    py::enum_<compile::ControlChoice>(m, "ControlChoice")
        .value("SKIP", compile::ControlChoice::SKIP)
        .value("REARRANGE_OWN", compile::ControlChoice::REARRANGE_OWN)
        .value("REARRANGE_OPPONENT", compile::ControlChoice::REARRANGE_OPPONENT)
        .export_values();

    py::enum_<compile::ActionType>(m, "ActionType")
        .value("PLAY_CARD", compile::ActionType::PLAY_CARD)
        .value("FILL_HAND", compile::ActionType::FILL_HAND)
        .value("COMPILE", compile::ActionType::COMPILE)
        .value("DISCARD_CARDS", compile::ActionType::DISCARD_CARDS)
        .value("SELECT_CARD", compile::ActionType::SELECT_CARD)
        .value("SELECT_LANE", compile::ActionType::SELECT_LANE)
        .value("SELECT_HAND_CARD", compile::ActionType::SELECT_HAND_CARD)
        .value("PLAY_FROM_HAND", compile::ActionType::PLAY_FROM_HAND)
        .value("ACCEPT_PROMPT", compile::ActionType::ACCEPT_PROMPT)
        .value("DECLINE_PROMPT", compile::ActionType::DECLINE_PROMPT)
        .value("CHOOSE_OPTION", compile::ActionType::CHOOSE_OPTION)
        .value("REARRANGE_PROTOCOLS", compile::ActionType::REARRANGE_PROTOCOLS)
        .value("SWAP_PROTOCOLS", compile::ActionType::SWAP_PROTOCOLS)
        .value("CONTROL_CHOICE", compile::ActionType::CONTROL_CHOICE)
        .value("SKIP", compile::ActionType::SKIP)
        .export_values();

    py::enum_<compile::EventType>(m, "EventType")
        .value("PLAY", compile::EventType::PLAY)
        .value("FLIP", compile::EventType::FLIP)
        .value("DELETE", compile::EventType::DELETE)
        .value("SHIFT", compile::EventType::SHIFT)
        .value("RETURN", compile::EventType::RETURN)
        .value("DRAW", compile::EventType::DRAW)
        .value("DISCARD", compile::EventType::DISCARD)
        .value("COMPILE", compile::EventType::COMPILE)
        .value("REVEAL", compile::EventType::REVEAL)
        .value("PROTOCOLS_CHANGED", compile::EventType::PROTOCOLS_CHANGED)
        .value("GAME_OVER", compile::EventType::GAME_OVER)
        .export_values();

    // ========================================================================
    // CARDS AND ZONES
    // ========================================================================

    py::class_<compile::PlayedCard>(m, "PlayedCard")
        .def(py::init<>())
        .def_readonly("id", &compile::PlayedCard::id)
        .def_readonly("protocol", &compile::PlayedCard::protocol)
        .def_readonly("value", &compile::PlayedCard::value)
        .def_readonly("face_up", &compile::PlayedCard::face_up)
        .def_readonly("revealed", &compile::PlayedCard::revealed)
        .def("name", &compile::PlayedCard::name)
        .def("__repr__", &compile::PlayedCard::name);

    py::class_<compile::Zone>(m, "Zone")
        .def(py::init<>())
        .def_readonly("cards", &compile::Zone::cards)
        .def_readonly("is_hidden", &compile::Zone::is_hidden)
        .def("count", &compile::Zone::count)
        .def("is_empty", &compile::Zone::is_empty)
        .def("contains", &compile::Zone::contains);

    py::class_<compile::Board>(m, "Board")
        .def(py::init<>())
        .def_readonly("lanes", &compile::Board::lanes)
        .def("lane_size", &compile::Board::lane_size)
        .def("card_count", &compile::Board::card_count);

    // ========================================================================
    // PLAYER STATE
    // ========================================================================

    py::class_<compile::PlayerStats>(m, "PlayerStats")
        .def(py::init<>())
        .def_readonly("cards_played", &compile::PlayerStats::cards_played)
        .def_readonly("cards_discarded", &compile::PlayerStats::cards_discarded)
        .def_readonly("cards_deleted", &compile::PlayerStats::cards_deleted)
        .def_readonly("cards_flipped", &compile::PlayerStats::cards_flipped)
        .def_readonly("cards_shifted", &compile::PlayerStats::cards_shifted)
        .def_readonly("cards_drawn", &compile::PlayerStats::cards_drawn)
        .def_readonly("hands_refreshed", &compile::PlayerStats::hands_refreshed)
        .def_readonly("compiles", &compile::PlayerStats::compiles)
        .def_readonly("recompiles", &compile::PlayerStats::recompiles);

    py::class_<compile::PlayerState>(m, "PlayerState")
        .def(py::init<>())
        .def_readonly("player_id", &compile::PlayerState::player_id)
        .def_readonly("deck", &compile::PlayerState::deck)
        .def_readonly("hand", &compile::PlayerState::hand)
        .def_readonly("discard", &compile::PlayerState::discard)
        .def_readonly("board", &compile::PlayerState::board)
        .def_readonly("protocols", &compile::PlayerState::protocols)
        .def_readonly("starting_protocols", &compile::PlayerState::starting_protocols)
        .def_readonly("compiled", &compile::PlayerState::compiled)
        .def_readonly("lane_values", &compile::PlayerState::lane_values)
        .def_readonly("stats", &compile::PlayerState::stats)
        .def_readonly("cannot_compile", &compile::PlayerState::cannot_compile)
        .def("compiled_count", &compile::PlayerState::compiled_count);

    // ========================================================================
    // REQUIRED ACTIONS
    // ========================================================================

    py::class_<compile::ActionBase>(m, "ActionBase")
        .def_readonly("actor", &compile::ActionBase::actor)
        .def_readonly("source_card_id", &compile::ActionBase::source_card_id)
        .def_readonly("optional", &compile::ActionBase::optional);

    py::class_<compile::DiscardAction, compile::ActionBase>(m, "DiscardAction")
        .def_readonly("count", &compile::DiscardAction::count)
        .def_readonly("variable", &compile::DiscardAction::variable);

    py::class_<compile::BoardTargetAction, compile::ActionBase>(m, "BoardTargetAction")
        .def_readonly("allowed_ids", &compile::BoardTargetAction::allowed_ids)
        .def_readonly("disallowed_ids", &compile::BoardTargetAction::disallowed_ids)
        .def_readonly("only_lane", &compile::BoardTargetAction::only_lane);

    py::class_<compile::SelectCardToDelete, compile::BoardTargetAction>(m, "SelectCardToDelete");
    py::class_<compile::SelectCardToFlip, compile::BoardTargetAction>(m, "SelectCardToFlip");
    py::class_<compile::SelectCardToShift, compile::BoardTargetAction>(m, "SelectCardToShift");
    py::class_<compile::SelectCardToReturn, compile::BoardTargetAction>(m, "SelectCardToReturn");
    py::class_<compile::SelectCardToReveal, compile::BoardTargetAction>(m, "SelectCardToReveal");

    py::class_<compile::SelectLaneForShift, compile::ActionBase>(m, "SelectLaneForShift")
        .def_readonly("card_id", &compile::SelectLaneForShift::card_id)
        .def_readonly("allowed_lanes", &compile::SelectLaneForShift::allowed_lanes);

    py::class_<compile::SelectLane, compile::ActionBase>(m, "SelectLane")
        .def_readonly("allowed_lanes", &compile::SelectLane::allowed_lanes);

    py::class_<compile::SelectHandCardToPlay, compile::ActionBase>(m, "SelectHandCardToPlay")
        .def_readonly("face_down_only", &compile::SelectHandCardToPlay::face_down_only)
        .def_readonly("excluded_lane", &compile::SelectHandCardToPlay::excluded_lane);

    py::class_<compile::SelectHandCard, compile::ActionBase>(m, "SelectHandCard");

    py::class_<compile::PromptOptionalEffect, compile::ActionBase>(m, "PromptOptionalEffect")
        .def_readonly("description", &compile::PromptOptionalEffect::description);

    py::class_<compile::PromptChoice, compile::ActionBase>(m, "PromptChoice")
        .def_readonly("options", &compile::PromptChoice::options);

    py::class_<compile::SelectEffectToResolve, compile::ActionBase>(m, "SelectEffectToResolve")
        .def_readonly("candidates", &compile::SelectEffectToResolve::candidates);

    py::class_<compile::RearrangeProtocols, compile::ActionBase>(m, "RearrangeProtocols")
        .def_readonly("target_player", &compile::RearrangeProtocols::target_player);

    py::class_<compile::SwapProtocols, compile::ActionBase>(m, "SwapProtocols")
        .def_readonly("target_player", &compile::SwapProtocols::target_player);

    py::class_<compile::PromptUseControl, compile::ActionBase>(m, "PromptUseControl")
        .def_readonly("lane", &compile::PromptUseControl::lane);

    py::class_<compile::ResumeEffect, compile::ActionBase>(m, "ResumeEffect");

    py::class_<compile::CompletePlay, compile::ActionBase>(m, "CompletePlay")
        .def_readonly("lane", &compile::CompletePlay::lane);

    m.def("action_type_name", &compile::action_type_name);

    // ========================================================================
    // ACTION
    // ========================================================================

    py::class_<compile::AIAction>(m, "AIAction")
        .def(py::init<>())
        .def(py::init<compile::ActionType, compile::PlayerID>())
        .def_readwrite("action_type", &compile::AIAction::action_type)
        .def_readwrite("player_id", &compile::AIAction::player_id)
        .def_readwrite("card_id", &compile::AIAction::card_id)
        .def_readwrite("lane", &compile::AIAction::lane)
        .def_readwrite("face_up", &compile::AIAction::face_up)
        .def_readwrite("card_ids", &compile::AIAction::card_ids)
        .def_readwrite("choice_index", &compile::AIAction::choice_index)
        .def_readwrite("second_index", &compile::AIAction::second_index)
        .def_readwrite("protocol_order", &compile::AIAction::protocol_order)
        .def_readwrite("control", &compile::AIAction::control)
        .def("__str__", &compile::AIAction::to_string)
        .def("__repr__", &compile::AIAction::to_string)
        .def(py::self == py::self)
        .def(py::self != py::self)
        // Factory methods
        .def_static("play_card", &compile::AIAction::play_card)
        .def_static("fill_hand", &compile::AIAction::fill_hand)
        .def_static("compile_lane", &compile::AIAction::compile_lane)
        .def_static("discard_cards", &compile::AIAction::discard_cards)
        .def_static("select_card", &compile::AIAction::select_card)
        .def_static("select_lane", &compile::AIAction::select_lane)
        .def_static("select_hand_card", &compile::AIAction::select_hand_card)
        .def_static("play_from_hand", &compile::AIAction::play_from_hand)
        .def_static("accept", &compile::AIAction::accept)
        .def_static("decline", &compile::AIAction::decline)
        .def_static("choose", &compile::AIAction::choose)
        .def_static("rearrange", &compile::AIAction::rearrange)
        .def_static("swap_protocols", &compile::AIAction::swap_protocols)
        .def_static("control_choice", &compile::AIAction::control_choice)
        .def_static("skip", &compile::AIAction::skip);

    // ========================================================================
    // GAME STATE
    // ========================================================================

    py::class_<compile::LogEntry>(m, "LogEntry")
        .def_readonly("turn_number", &compile::LogEntry::turn_number)
        .def_readonly("player", &compile::LogEntry::player)
        .def_readonly("phase", &compile::LogEntry::phase)
        .def_readonly("source", &compile::LogEntry::source)
        .def_readonly("message", &compile::LogEntry::message)
        .def_readonly("depth", &compile::LogEntry::depth);

    py::class_<compile::BoardEvent>(m, "BoardEvent")
        .def_readonly("type", &compile::BoardEvent::type)
        .def_readonly("player", &compile::BoardEvent::player)
        .def_readonly("card_id", &compile::BoardEvent::card_id)
        .def_readonly("from_lane", &compile::BoardEvent::from_lane)
        .def_readonly("to_lane", &compile::BoardEvent::to_lane)
        .def_readonly("count", &compile::BoardEvent::count);

    py::class_<compile::GameState>(m, "GameState")
        .def(py::init<>())
        .def_readonly("players", &compile::GameState::players)
        .def_readonly("turn", &compile::GameState::turn)
        .def_readonly("phase", &compile::GameState::phase)
        .def_readonly("turn_number", &compile::GameState::turn_number)
        .def_readonly("action_required", &compile::GameState::action_required)
        .def_readonly("interrupt_stack", &compile::GameState::interrupt_stack)
        .def_readonly("winner", &compile::GameState::winner)
        .def_readonly("compilable_lanes", &compile::GameState::compilable_lanes)
        .def_readonly("use_control_mechanic", &compile::GameState::use_control_mechanic)
        .def_readonly("control_card_holder", &compile::GameState::control_card_holder)
        .def_readonly("last_played_card_id", &compile::GameState::last_played_card_id)
        .def_readonly("log", &compile::GameState::log)
        .def_readonly("events", &compile::GameState::events)
        .def_readonly("seed", &compile::GameState::seed)
        .def("get_player", py::overload_cast<compile::PlayerID>(&compile::GameState::get_player, py::const_),
             py::return_value_policy::reference_internal)
        .def("is_game_over", &compile::GameState::is_game_over)
        .def("has_pending_action", &compile::GameState::has_pending_action)
        .def("clone", &compile::GameState::clone);

    py::class_<compile::StepResult>(m, "StepResult")
        .def_readonly("state", &compile::StepResult::state)
        .def_readonly("ok", &compile::StepResult::ok)
        .def_readonly("error", &compile::StepResult::error)
        .def_readonly("message", &compile::StepResult::message)
        .def_readonly("events", &compile::StepResult::events);

    py::class_<compile::LanePlayability>(m, "LanePlayability")
        .def_readonly("is_playable", &compile::LanePlayability::is_playable)
        .def_readonly("face_up_allowed", &compile::LanePlayability::face_up_allowed)
        .def_readonly("face_down_allowed", &compile::LanePlayability::face_down_allowed)
        .def_readonly("reason", &compile::LanePlayability::reason);

    // ========================================================================
    // CONFIGURATION AND CATALOG
    // ========================================================================

    py::class_<compile::GameConfig>(m, "GameConfig")
        .def(py::init<>())
        .def_readwrite("use_control_mechanic", &compile::GameConfig::use_control_mechanic)
        .def_readwrite("allow_recompile", &compile::GameConfig::allow_recompile)
        .def_readwrite("hand_limit", &compile::GameConfig::hand_limit)
        .def_readwrite("starting_hand", &compile::GameConfig::starting_hand)
        .def_readwrite("seed", &compile::GameConfig::seed)
        .def_readwrite("player_protocols", &compile::GameConfig::player_protocols)
        .def_readwrite("opponent_protocols", &compile::GameConfig::opponent_protocols)
        .def_readwrite("player_difficulty", &compile::GameConfig::player_difficulty)
        .def_readwrite("opponent_difficulty", &compile::GameConfig::opponent_difficulty)
        .def_readwrite("custom_protocols_path", &compile::GameConfig::custom_protocols_path)
        .def("load_from_json", &compile::GameConfig::load_from_json)
        .def("load_from_json_string", &compile::GameConfig::load_from_json_string)
        .def("to_json_string", &compile::GameConfig::to_json_string);

    py::class_<compile::CardDef>(m, "CardDef")
        .def_readonly("protocol", &compile::CardDef::protocol)
        .def_readonly("value", &compile::CardDef::value)
        .def_readonly("top_text", &compile::CardDef::top_text)
        .def_readonly("middle_text", &compile::CardDef::middle_text)
        .def_readonly("bottom_text", &compile::CardDef::bottom_text)
        .def_readonly("custom", &compile::CardDef::custom)
        .def("id", &compile::CardDef::id)
        .def("is_disruptive", &compile::CardDef::is_disruptive);

    py::class_<compile::CardCatalog>(m, "CardCatalog")
        .def(py::init<>())
        .def("load_from_json", &compile::CardCatalog::load_from_json)
        .def("load_from_json_string", &compile::CardCatalog::load_from_json_string)
        .def("get_card", py::overload_cast<const compile::CardDefID&>(&compile::CardCatalog::get_card, py::const_),
             py::return_value_policy::reference_internal)
        .def("has_protocol", &compile::CardCatalog::has_protocol)
        .def("protocols", &compile::CardCatalog::protocols)
        .def("card_count", &compile::CardCatalog::card_count)
        .def("errors", &compile::CardCatalog::errors);

    m.def("register_all_protocols", &compile::protocols::register_all_protocols);

    // ========================================================================
    // ENGINE
    // ========================================================================

    py::class_<compile::CompileEngine>(m, "CompileEngine")
        .def(py::init<compile::GameConfig>(), py::arg("config") = compile::GameConfig())
        .def(py::init<compile::CardCatalog, compile::GameConfig>())
        .def("create_initial_state",
             py::overload_cast<const compile::ProtocolList&, const compile::ProtocolList&, bool,
                               std::optional<compile::PlayerID>, std::optional<uint32_t>>(
                 &compile::CompileEngine::create_initial_state, py::const_),
             py::arg("player_protocols"), py::arg("opponent_protocols"),
             py::arg("use_control_mechanic") = false,
             py::arg("starting_player") = py::none(), py::arg("seed") = py::none())
        .def("play_card", &compile::CompileEngine::play_card,
             py::arg("state"), py::arg("card_id"), py::arg("lane"), py::arg("face_up"), py::arg("actor") = py::none())
        .def("fill_hand", &compile::CompileEngine::fill_hand,
             py::arg("state"), py::arg("actor") = py::none())
        .def("compile_lane", &compile::CompileEngine::compile_lane,
             py::arg("state"), py::arg("lane"), py::arg("actor") = py::none())
        .def("resolve_action_with_card", &compile::CompileEngine::resolve_action_with_card,
             py::arg("state"), py::arg("card_id"), py::arg("actor") = py::none())
        .def("resolve_action_with_lane", &compile::CompileEngine::resolve_action_with_lane,
             py::arg("state"), py::arg("lane"), py::arg("actor") = py::none())
        .def("resolve_discard", &compile::CompileEngine::resolve_discard,
             py::arg("state"), py::arg("card_ids"), py::arg("actor") = py::none())
        .def("resolve_hand_play", &compile::CompileEngine::resolve_hand_play,
             py::arg("state"), py::arg("card_id"), py::arg("lane"), py::arg("face_up"), py::arg("actor") = py::none())
        .def("resolve_hand_card", &compile::CompileEngine::resolve_hand_card,
             py::arg("state"), py::arg("card_id"), py::arg("actor") = py::none())
        .def("resolve_prompt", &compile::CompileEngine::resolve_prompt,
             py::arg("state"), py::arg("accept"), py::arg("actor") = py::none())
        .def("resolve_choice", &compile::CompileEngine::resolve_choice,
             py::arg("state"), py::arg("index"), py::arg("actor") = py::none())
        .def("resolve_rearrange", &compile::CompileEngine::resolve_rearrange,
             py::arg("state"), py::arg("order"), py::arg("actor") = py::none())
        .def("resolve_swap", &compile::CompileEngine::resolve_swap,
             py::arg("state"), py::arg("first"), py::arg("second"), py::arg("actor") = py::none())
        .def("resolve_control", &compile::CompileEngine::resolve_control,
             py::arg("state"), py::arg("choice"), py::arg("actor") = py::none())
        .def("skip_action", &compile::CompileEngine::skip_action,
             py::arg("state"), py::arg("actor") = py::none())
        .def("step", &compile::CompileEngine::step)
        .def("get_legal_actions", &compile::CompileEngine::get_legal_actions)
        .def("expected_actor", &compile::CompileEngine::expected_actor)
        .def("is_card_targetable", &compile::CompileEngine::is_card_targetable)
        .def("get_lane_playability", &compile::CompileEngine::get_lane_playability,
             py::arg("state"), py::arg("player"), py::arg("lane"), py::arg("card_id") = py::none())
        .def("compilable_lanes", &compile::CompileEngine::compilable_lanes)
        .def("check_invariants", &compile::CompileEngine::check_invariants)
        .def("catalog", &compile::CompileEngine::catalog, py::return_value_policy::reference_internal)
        .def("config", &compile::CompileEngine::config, py::return_value_policy::reference_internal);

    // ========================================================================
    // AI
    // ========================================================================

    m.def("run_turn", &compile::ai::run_turn,
          py::arg("engine"), py::arg("state"), py::arg("difficulty"));
    m.def("resolve_pending_action", &compile::ai::resolve_pending_action,
          py::arg("engine"), py::arg("state"), py::arg("difficulty"));
    m.def("choose_action", &compile::ai::choose_action,
          py::arg("engine"), py::arg("state"), py::arg("difficulty"));
    m.def("play_game", &compile::ai::play_game,
          py::arg("engine"), py::arg("state"), py::arg("difficulties"),
          py::arg("max_steps") = 5000, py::arg("observer") = nullptr);

    // ========================================================================
    // STATISTICS
    // ========================================================================

    py::class_<compile::GameSummary>(m, "GameSummary")
        .def_readonly("winner", &compile::GameSummary::winner)
        .def_readonly("turns", &compile::GameSummary::turns)
        .def_readonly("stats", &compile::GameSummary::stats);

    m.def("summarize", &compile::summarize);

    py::class_<compile::TallySink>(m, "TallySink")
        .def(py::init<>())
        .def("record_game", &compile::TallySink::record_game)
        .def("games", &compile::TallySink::games)
        .def("wins", &compile::TallySink::wins)
        .def("unfinished", &compile::TallySink::unfinished)
        .def("average_turns", &compile::TallySink::average_turns);

    // ========================================================================
    // MODULE INFO
    // ========================================================================

    m.attr("VERSION") = compile::get_version();
    m.attr("__version__") = compile::get_version();
}
