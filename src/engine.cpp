/**
 * Compile Engine - Engine Implementation
 *
 * Setup, intent validation and dispatch to the effect resolver.
 * The phase machine lives in phase_machine.cpp, compile and control in
 * compile.cpp.
 */

#include "engine.hpp"
#include "cards/protocol_registry.hpp"
#include <algorithm>
#include <bitset>
#include <chrono>
#include <iostream>
#include <stdexcept>

namespace compile {

namespace {

bool contains_lane(const std::vector<int>& lanes, int lane) {
    return std::find(lanes.begin(), lanes.end(), lane) != lanes.end();
}

bool is_permutation_of(const ProtocolList& order, const ProtocolList& current) {
    return std::is_permutation(order.begin(), order.end(), current.begin());
}

// Guards against a broken custom program looping forever
constexpr int MAX_SETTLE_STEPS = 10000;

// Larger hands list a single discard choice
constexpr int MAX_DISCARD_ENUMERATION = 16;

} // anonymous namespace

CompileEngine::CompileEngine(GameConfig config)
    : config_(std::move(config))
{
    protocols::register_all_protocols(catalog_);
    if (!config_.custom_protocols_path.empty()) {
        if (!catalog_.load_from_json(config_.custom_protocols_path)) {
            std::cerr << "[CompileEngine] Custom protocols not fully loaded from "
                      << config_.custom_protocols_path << std::endl;
        }
    }
}

CompileEngine::CompileEngine(CardCatalog catalog, GameConfig config)
    : catalog_(std::move(catalog))
    , config_(std::move(config))
{}

// ============================================================================
// GAME SETUP
// ============================================================================

GameState CompileEngine::create_initial_state(const ProtocolList& player_protocols,
                                              const ProtocolList& opponent_protocols,
                                              bool use_control_mechanic,
                                              std::optional<PlayerID> starting_player,
                                              std::optional<uint32_t> seed) const {
    const ProtocolList* lists[2] = {&player_protocols, &opponent_protocols};
    for (const ProtocolList* list : lists) {
        for (int i = 0; i < LANE_COUNT; i++) {
            if (!catalog_.has_protocol((*list)[i])) {
                throw std::invalid_argument("unknown protocol '" + (*list)[i] + "'");
            }
            for (int j = 0; j < i; j++) {
                if ((*list)[i] == (*list)[j]) {
                    throw std::invalid_argument("protocol '" + (*list)[i] + "' chosen twice");
                }
            }
        }
    }
    if (starting_player.has_value() && *starting_player > OPPONENT) {
        throw std::invalid_argument("starting player must be 0 or 1");
    }

    GameState state;
    if (seed.has_value()) {
        state.seed = *seed;
    } else if (config_.seed.has_value()) {
        state.seed = *config_.seed;
    } else {
        auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
        state.seed = static_cast<uint32_t>(now);
    }
    state.rng.seed(state.seed);
    state.use_control_mechanic = use_control_mechanic;

    for (PlayerID p = 0; p < 2; p++) {
        PlayerState& player = state.players[p];
        player.protocols = *lists[p];
        player.starting_protocols = *lists[p];
        for (const auto& protocol : player.protocols) {
            for (const CardDef* def : catalog_.protocol_cards(protocol)) {
                player.deck.add_card(PlayedCard(state.make_card_id(p), def->protocol, def->value));
            }
        }
        player.deck.shuffle(state.rng);
    }

    if (starting_player.has_value()) {
        state.turn = *starting_player;
    } else {
        std::uniform_int_distribution<int> coin(0, 1);
        state.turn = static_cast<PlayerID>(coin(state.rng));
    }

    EffectResolver effects = resolver();
    for (PlayerID p = 0; p < 2; p++) {
        effects.draw_cards(state, p, config_.starting_hand, false);
    }
    state.add_log(state.turn, std::string(player_name(state.turn)) + " goes first");

    settle(state);
    state.events.clear();
    return state;
}

GameState CompileEngine::create_initial_state() const {
    return create_initial_state(config_.player_protocols, config_.opponent_protocols,
                                config_.use_control_mechanic, std::nullopt, config_.seed);
}

// ============================================================================
// TRANSITION PLUMBING
// ============================================================================

GameState CompileEngine::begin(const GameState& state) const {
    GameState next = state.clone();
    next.events.clear();
    return next;
}

StepResult CompileEngine::reject(const GameState& state, IllegalIntent error, const std::string& message) const {
    StepResult result;
    result.state = state;
    result.ok = false;
    result.error = error;
    result.message = message;
    return result;
}

StepResult CompileEngine::finish(GameState state) const {
    settle(state);
    StepResult result;
    result.events = state.events;
    result.state = std::move(state);
    return result;
}

IllegalIntent CompileEngine::check_pending(const GameState& state, std::optional<PlayerID> actor) const {
    if (state.is_game_over()) {
        return IllegalIntent::GAME_OVER;
    }
    if (!state.action_required.has_value()) {
        return IllegalIntent::NO_ACTION_PENDING;
    }
    if (actor.has_value() && *actor != action_base(*state.action_required).actor) {
        return IllegalIntent::WRONG_ACTOR;
    }
    return IllegalIntent::NONE;
}

IllegalIntent CompileEngine::check_turn_action(const GameState& state, std::optional<PlayerID> actor) const {
    if (state.is_game_over()) {
        return IllegalIntent::GAME_OVER;
    }
    if (state.action_required.has_value()) {
        return IllegalIntent::ACTION_PENDING;
    }
    if (actor.has_value() && *actor != state.turn) {
        return IllegalIntent::WRONG_ACTOR;
    }
    if (state.phase != Phase::ACTION) {
        return IllegalIntent::WRONG_PHASE;
    }
    if (state.action_taken) {
        return IllegalIntent::ALREADY_ACTED;
    }
    return IllegalIntent::NONE;
}

void CompileEngine::settle(GameState& state) const {
    EffectResolver effects = resolver();
    recalculate_lane_values(catalog_, state);

    for (int steps = 0; steps < MAX_SETTLE_STEPS; steps++) {
        if (!state.fired_triggers.empty()) {
            effects.push_fired_triggers(state);
        }
        if (state.action_required.has_value() || state.is_game_over()) {
            break;
        }
        if (auto entry = state.pop_interrupt()) {
            effects.process_deferred(state, std::move(*entry));
        } else if (auto queued = state.pop_queued()) {
            effects.process_deferred(state, std::move(*queued));
        } else if (!advance_phase(state)) {
            break;
        }
        recalculate_lane_values(catalog_, state);
    }

    if (state.is_game_over()) {
        state.action_required.reset();
        state.interrupt_stack.clear();
        state.queued_actions.clear();
        state.fired_triggers.clear();
    }
    state.compilable_lanes = state.phase == Phase::COMPILE && !state.action_required.has_value()
        ? compute_compilable_lanes(state, state.turn, config_.allow_recompile)
        : std::vector<int>();
}

// ============================================================================
// TURN ACTIONS
// ============================================================================

StepResult CompileEngine::play_card(const GameState& state, const CardID& card_id, int lane, bool face_up,
                                    std::optional<PlayerID> actor) const {
    IllegalIntent error = check_turn_action(state, actor);
    if (error != IllegalIntent::NONE) {
        return reject(state, error, "cannot play a card now");
    }
    if (!is_valid_lane(lane)) {
        return reject(state, IllegalIntent::INVALID_LANE, "lane " + std::to_string(lane) + " does not exist");
    }
    const PlayedCard* card = state.players[state.turn].hand.find_card(card_id);
    if (!card) {
        return reject(state, IllegalIntent::CARD_NOT_FOUND, card_id + " is not in hand");
    }
    PlayCheck check = can_play_card(catalog_, state, state.turn, *card, lane, face_up);
    if (!check.allowed) {
        return reject(state, IllegalIntent::PLAY_NOT_ALLOWED, check.reason);
    }

    GameState next = begin(state);
    next.action_taken = true;
    EffectResolver effects = resolver();
    effects.play_from_hand(next, next.turn, card_id, lane, face_up);
    effects.push_fired_triggers(next);
    return finish(std::move(next));
}

StepResult CompileEngine::fill_hand(const GameState& state, std::optional<PlayerID> actor) const {
    IllegalIntent error = check_turn_action(state, actor);
    if (error != IllegalIntent::NONE) {
        return reject(state, error, "cannot fill hand now");
    }

    GameState next = begin(state);
    next.action_taken = true;
    if (!offer_control(next, next.turn, ControlOrigin::FILL_HAND, -1)) {
        do_fill_hand(next, next.turn);
    }
    return finish(std::move(next));
}

StepResult CompileEngine::compile_lane(const GameState& state, int lane, std::optional<PlayerID> actor) const {
    if (state.is_game_over()) {
        return reject(state, IllegalIntent::GAME_OVER, "game is over");
    }
    if (state.action_required.has_value()) {
        return reject(state, IllegalIntent::ACTION_PENDING, "an action is pending");
    }
    if (actor.has_value() && *actor != state.turn) {
        return reject(state, IllegalIntent::WRONG_ACTOR, "not this player's turn");
    }
    if (state.phase != Phase::COMPILE) {
        return reject(state, IllegalIntent::WRONG_PHASE, "compiling is only possible in the compile phase");
    }
    if (!is_valid_lane(lane)) {
        return reject(state, IllegalIntent::INVALID_LANE, "lane " + std::to_string(lane) + " does not exist");
    }
    if (!contains_lane(compilable_lanes(state, state.turn), lane)) {
        return reject(state, IllegalIntent::NOT_COMPILABLE, "lane " + std::to_string(lane) + " cannot compile");
    }

    GameState next = begin(state);
    if (!offer_control(next, next.turn, ControlOrigin::COMPILE, lane)) {
        do_compile(next, lane);
    }
    return finish(std::move(next));
}

GameState CompileEngine::perform_compile(const GameState& state, int lane,
                                         const std::function<void(PlayerID)>& on_end_game) const {
    if (state.is_game_over() || !is_valid_lane(lane) ||
        !contains_lane(compilable_lanes(state, state.turn), lane)) {
        return state;
    }
    GameState next = begin(state);
    do_compile(next, lane);
    settle(next);
    if (next.winner.has_value() && on_end_game) {
        on_end_game(*next.winner);
    }
    return next;
}

// ============================================================================
// RESOLVING THE ACTIVE ACTION
// ============================================================================

StepResult CompileEngine::resolve_action_with_card(const GameState& state, const CardID& card_id,
                                                   std::optional<PlayerID> actor) const {
    IllegalIntent error = check_pending(state, actor);
    if (error != IllegalIntent::NONE) {
        return reject(state, error, "cannot resolve now");
    }
    const ActionRequired& action = *state.action_required;

    if (auto* order = std::get_if<SelectEffectToResolve>(&action)) {
        if (std::find(order->candidates.begin(), order->candidates.end(), card_id) == order->candidates.end()) {
            return reject(state, IllegalIntent::UNTARGETABLE, card_id + " has no effect to resolve");
        }
    } else if (const BoardTargetAction* target = as_board_target(action)) {
        if (!state.locate_on_board(card_id).is_valid()) {
            return reject(state, IllegalIntent::CARD_NOT_FOUND, card_id + " is not on the board");
        }
        if (!is_valid_target(catalog_, state, *target, card_id)) {
            return reject(state, IllegalIntent::UNTARGETABLE, card_id + " is not a legal target");
        }
    } else {
        return reject(state, IllegalIntent::ACTION_TYPE_MISMATCH,
                      std::string("active action is ") + action_type_name(action));
    }

    GameState next = begin(state);
    ActionRequired active = std::move(*next.action_required);
    next.action_required.reset();
    resolver().resolve_card_choice(next, active, card_id);
    return finish(std::move(next));
}

StepResult CompileEngine::resolve_action_with_lane(const GameState& state, int lane,
                                                   std::optional<PlayerID> actor) const {
    IllegalIntent error = check_pending(state, actor);
    if (error != IllegalIntent::NONE) {
        return reject(state, error, "cannot resolve now");
    }
    const ActionRequired& action = *state.action_required;

    const std::vector<int>* allowed = nullptr;
    if (auto* shift = std::get_if<SelectLaneForShift>(&action)) {
        allowed = &shift->allowed_lanes;
    } else if (auto* select = std::get_if<SelectLane>(&action)) {
        allowed = &select->allowed_lanes;
    } else {
        return reject(state, IllegalIntent::ACTION_TYPE_MISMATCH,
                      std::string("active action is ") + action_type_name(action));
    }
    if (!contains_lane(*allowed, lane)) {
        return reject(state, IllegalIntent::INVALID_LANE, "lane " + std::to_string(lane) + " is not allowed");
    }

    GameState next = begin(state);
    ActionRequired active = std::move(*next.action_required);
    next.action_required.reset();
    resolver().resolve_lane_choice(next, active, lane);
    return finish(std::move(next));
}

StepResult CompileEngine::resolve_discard(const GameState& state, const std::vector<CardID>& card_ids,
                                          std::optional<PlayerID> actor) const {
    IllegalIntent error = check_pending(state, actor);
    if (error != IllegalIntent::NONE) {
        return reject(state, error, "cannot resolve now");
    }
    auto* discard = std::get_if<DiscardAction>(&*state.action_required);
    if (!discard) {
        return reject(state, IllegalIntent::ACTION_TYPE_MISMATCH,
                      std::string("active action is ") + action_type_name(*state.action_required));
    }

    const Zone& hand = state.players[discard->actor].hand;
    int size = static_cast<int>(card_ids.size());
    bool count_ok = discard->variable ? size >= discard->count : size == discard->count;
    if (!count_ok || size > hand.count()) {
        return reject(state, IllegalIntent::INVALID_SELECTION,
                      "expected " + std::to_string(discard->count) + (discard->variable ? " or more" : "") + " cards");
    }
    for (size_t i = 0; i < card_ids.size(); i++) {
        if (!hand.contains(card_ids[i])) {
            return reject(state, IllegalIntent::CARD_NOT_FOUND, card_ids[i] + " is not in hand");
        }
        if (std::find(card_ids.begin(), card_ids.begin() + i, card_ids[i]) != card_ids.begin() + i) {
            return reject(state, IllegalIntent::INVALID_SELECTION, card_ids[i] + " listed twice");
        }
    }

    GameState next = begin(state);
    DiscardAction active = std::get<DiscardAction>(std::move(*next.action_required));
    next.action_required.reset();
    resolver().resolve_discard(next, active, card_ids);
    return finish(std::move(next));
}

StepResult CompileEngine::resolve_hand_play(const GameState& state, const CardID& card_id, int lane, bool face_up,
                                            std::optional<PlayerID> actor) const {
    IllegalIntent error = check_pending(state, actor);
    if (error != IllegalIntent::NONE) {
        return reject(state, error, "cannot resolve now");
    }
    auto* play = std::get_if<SelectHandCardToPlay>(&*state.action_required);
    if (!play) {
        return reject(state, IllegalIntent::ACTION_TYPE_MISMATCH,
                      std::string("active action is ") + action_type_name(*state.action_required));
    }
    if (!is_valid_lane(lane) || lane == play->excluded_lane) {
        return reject(state, IllegalIntent::INVALID_LANE, "lane " + std::to_string(lane) + " is not allowed");
    }
    const PlayedCard* card = state.players[play->actor].hand.find_card(card_id);
    if (!card) {
        return reject(state, IllegalIntent::CARD_NOT_FOUND, card_id + " is not in hand");
    }
    if (face_up && play->face_down_only) {
        return reject(state, IllegalIntent::PLAY_NOT_ALLOWED, "this card must be played face-down");
    }
    PlayCheck check = can_play_card(catalog_, state, play->actor, *card, lane, face_up);
    if (!check.allowed) {
        return reject(state, IllegalIntent::PLAY_NOT_ALLOWED, check.reason);
    }

    GameState next = begin(state);
    SelectHandCardToPlay active = std::get<SelectHandCardToPlay>(std::move(*next.action_required));
    next.action_required.reset();
    resolver().resolve_hand_play(next, active, card_id, lane, face_up);
    return finish(std::move(next));
}

StepResult CompileEngine::resolve_hand_card(const GameState& state, const CardID& card_id,
                                            std::optional<PlayerID> actor) const {
    IllegalIntent error = check_pending(state, actor);
    if (error != IllegalIntent::NONE) {
        return reject(state, error, "cannot resolve now");
    }
    auto* select = std::get_if<SelectHandCard>(&*state.action_required);
    if (!select) {
        return reject(state, IllegalIntent::ACTION_TYPE_MISMATCH,
                      std::string("active action is ") + action_type_name(*state.action_required));
    }
    if (!state.players[select->actor].hand.contains(card_id)) {
        return reject(state, IllegalIntent::CARD_NOT_FOUND, card_id + " is not in hand");
    }

    GameState next = begin(state);
    SelectHandCard active = std::get<SelectHandCard>(std::move(*next.action_required));
    next.action_required.reset();
    resolver().resolve_hand_card(next, active, card_id);
    return finish(std::move(next));
}

StepResult CompileEngine::resolve_prompt(const GameState& state, bool accept, std::optional<PlayerID> actor) const {
    IllegalIntent error = check_pending(state, actor);
    if (error != IllegalIntent::NONE) {
        return reject(state, error, "cannot resolve now");
    }
    if (!std::holds_alternative<PromptOptionalEffect>(*state.action_required)) {
        return reject(state, IllegalIntent::ACTION_TYPE_MISMATCH,
                      std::string("active action is ") + action_type_name(*state.action_required));
    }

    GameState next = begin(state);
    PromptOptionalEffect active = std::get<PromptOptionalEffect>(std::move(*next.action_required));
    next.action_required.reset();
    resolver().resolve_prompt(next, active, accept);
    return finish(std::move(next));
}

StepResult CompileEngine::resolve_choice(const GameState& state, int index, std::optional<PlayerID> actor) const {
    IllegalIntent error = check_pending(state, actor);
    if (error != IllegalIntent::NONE) {
        return reject(state, error, "cannot resolve now");
    }
    auto* choice = std::get_if<PromptChoice>(&*state.action_required);
    if (!choice) {
        return reject(state, IllegalIntent::ACTION_TYPE_MISMATCH,
                      std::string("active action is ") + action_type_name(*state.action_required));
    }
    if (index < 0 || index >= static_cast<int>(choice->options.size())) {
        return reject(state, IllegalIntent::INVALID_SELECTION, "no option " + std::to_string(index));
    }

    GameState next = begin(state);
    PromptChoice active = std::get<PromptChoice>(std::move(*next.action_required));
    next.action_required.reset();
    resolver().resolve_choice(next, active, index);
    return finish(std::move(next));
}

StepResult CompileEngine::resolve_rearrange(const GameState& state, const ProtocolList& order,
                                            std::optional<PlayerID> actor) const {
    IllegalIntent error = check_pending(state, actor);
    if (error != IllegalIntent::NONE) {
        return reject(state, error, "cannot resolve now");
    }
    auto* rearrange = std::get_if<RearrangeProtocols>(&*state.action_required);
    if (!rearrange) {
        return reject(state, IllegalIntent::ACTION_TYPE_MISMATCH,
                      std::string("active action is ") + action_type_name(*state.action_required));
    }
    if (!is_permutation_of(order, state.players[rearrange->target_player].protocols)) {
        return reject(state, IllegalIntent::INVALID_SELECTION, "order must list the same three protocols");
    }

    GameState next = begin(state);
    RearrangeProtocols active = std::get<RearrangeProtocols>(std::move(*next.action_required));
    next.action_required.reset();
    resolver().resolve_rearrange(next, active, order);
    if (active.follow_up != ControlOrigin::NONE) {
        continue_after_control(next, active.follow_up, active.follow_up_lane);
    }
    return finish(std::move(next));
}

StepResult CompileEngine::resolve_swap(const GameState& state, int first, int second,
                                       std::optional<PlayerID> actor) const {
    IllegalIntent error = check_pending(state, actor);
    if (error != IllegalIntent::NONE) {
        return reject(state, error, "cannot resolve now");
    }
    if (!std::holds_alternative<SwapProtocols>(*state.action_required)) {
        return reject(state, IllegalIntent::ACTION_TYPE_MISMATCH,
                      std::string("active action is ") + action_type_name(*state.action_required));
    }
    if (!is_valid_lane(first) || !is_valid_lane(second) || first == second) {
        return reject(state, IllegalIntent::INVALID_SELECTION, "swap needs two different protocols");
    }

    GameState next = begin(state);
    SwapProtocols active = std::get<SwapProtocols>(std::move(*next.action_required));
    next.action_required.reset();
    resolver().resolve_swap(next, active, first, second);
    return finish(std::move(next));
}

StepResult CompileEngine::resolve_control(const GameState& state, ControlChoice choice,
                                          std::optional<PlayerID> actor) const {
    IllegalIntent error = check_pending(state, actor);
    if (error != IllegalIntent::NONE) {
        return reject(state, error, "cannot resolve now");
    }
    if (!std::holds_alternative<PromptUseControl>(*state.action_required)) {
        return reject(state, IllegalIntent::ACTION_TYPE_MISMATCH,
                      std::string("active action is ") + action_type_name(*state.action_required));
    }

    GameState next = begin(state);
    PromptUseControl active = std::get<PromptUseControl>(std::move(*next.action_required));
    next.action_required.reset();

    if (choice == ControlChoice::SKIP) {
        next.add_log(active.actor, "Does not use control");
        continue_after_control(next, active.origin, active.lane);
    } else {
        RearrangeProtocols rearrange;
        rearrange.actor = active.actor;
        rearrange.from_effect = false;
        rearrange.target_player = choice == ControlChoice::REARRANGE_OWN ? active.actor : other(active.actor);
        rearrange.follow_up = active.origin;
        rearrange.follow_up_lane = active.lane;
        next.add_log(active.actor, std::string("Uses control to rearrange ")
                     + player_name(rearrange.target_player) + " protocols");
        next.issue(rearrange);
    }
    return finish(std::move(next));
}

StepResult CompileEngine::skip_action(const GameState& state, std::optional<PlayerID> actor) const {
    IllegalIntent error = check_pending(state, actor);
    if (error != IllegalIntent::NONE) {
        return reject(state, error, "cannot skip now");
    }
    if (!action_base(*state.action_required).optional) {
        return reject(state, IllegalIntent::NOT_OPTIONAL,
                      std::string(action_type_name(*state.action_required)) + " is mandatory");
    }

    GameState next = begin(state);
    ActionRequired active = std::move(*next.action_required);
    next.action_required.reset();
    resolver().skip(next, active);
    return finish(std::move(next));
}

// ============================================================================
// GENERIC API
// ============================================================================

StepResult CompileEngine::step(const GameState& state, const AIAction& action) const {
    std::optional<PlayerID> actor = action.player_id;

    switch (action.action_type) {
        case ActionType::PLAY_CARD:
            if (!action.card_id || !action.lane) break;
            return play_card(state, *action.card_id, *action.lane, action.face_up, actor);
        case ActionType::FILL_HAND:
            return fill_hand(state, actor);
        case ActionType::COMPILE:
            if (!action.lane) break;
            return compile_lane(state, *action.lane, actor);
        case ActionType::DISCARD_CARDS:
            return resolve_discard(state, action.card_ids, actor);
        case ActionType::SELECT_CARD:
            if (!action.card_id) break;
            return resolve_action_with_card(state, *action.card_id, actor);
        case ActionType::SELECT_LANE:
            if (!action.lane) break;
            return resolve_action_with_lane(state, *action.lane, actor);
        case ActionType::SELECT_HAND_CARD:
            if (!action.card_id) break;
            return resolve_hand_card(state, *action.card_id, actor);
        case ActionType::PLAY_FROM_HAND:
            if (!action.card_id || !action.lane) break;
            return resolve_hand_play(state, *action.card_id, *action.lane, action.face_up, actor);
        case ActionType::ACCEPT_PROMPT:
            return resolve_prompt(state, true, actor);
        case ActionType::DECLINE_PROMPT:
            return resolve_prompt(state, false, actor);
        case ActionType::CHOOSE_OPTION:
            if (!action.choice_index) break;
            return resolve_choice(state, *action.choice_index, actor);
        case ActionType::REARRANGE_PROTOCOLS:
            if (!action.protocol_order) break;
            return resolve_rearrange(state, *action.protocol_order, actor);
        case ActionType::SWAP_PROTOCOLS:
            if (!action.choice_index || !action.second_index) break;
            return resolve_swap(state, *action.choice_index, *action.second_index, actor);
        case ActionType::CONTROL_CHOICE:
            return resolve_control(state, action.control, actor);
        case ActionType::SKIP:
            return skip_action(state, actor);
    }
    return reject(state, IllegalIntent::INVALID_SELECTION, "incomplete intent " + action.to_string());
}

PlayerID CompileEngine::expected_actor(const GameState& state) const {
    if (state.action_required.has_value()) {
        return action_base(*state.action_required).actor;
    }
    return state.turn;
}

std::vector<AIAction> CompileEngine::get_legal_actions(const GameState& state) const {
    std::vector<AIAction> actions;
    if (state.is_game_over()) {
        return actions;
    }

    if (!state.action_required.has_value()) {
        PlayerID player = state.turn;
        if (state.phase == Phase::COMPILE) {
            for (int lane : compilable_lanes(state, player)) {
                actions.push_back(AIAction::compile_lane(player, lane));
            }
        } else if (state.phase == Phase::ACTION && !state.action_taken) {
            for (const auto& card : state.players[player].hand.cards) {
                for (int lane = 0; lane < LANE_COUNT; lane++) {
                    for (bool up : {true, false}) {
                        if (can_play_card(catalog_, state, player, card, lane, up).allowed) {
                            actions.push_back(AIAction::play_card(player, card.id, lane, up));
                        }
                    }
                }
            }
            actions.push_back(AIAction::fill_hand(player));
        }
        return actions;
    }

    const ActionRequired& action = *state.action_required;
    const ActionBase& base = action_base(action);
    PlayerID actor = base.actor;
    const Zone& hand = state.players[actor].hand;

    if (const BoardTargetAction* target = as_board_target(action)) {
        for (const auto& id : collect_targets(catalog_, state, *target)) {
            actions.push_back(AIAction::select_card(actor, id));
        }
    } else if (auto* order = std::get_if<SelectEffectToResolve>(&action)) {
        for (const auto& id : order->candidates) {
            actions.push_back(AIAction::select_card(actor, id));
        }
    } else if (auto* shift = std::get_if<SelectLaneForShift>(&action)) {
        for (int lane : shift->allowed_lanes) {
            actions.push_back(AIAction::select_lane(actor, lane));
        }
    } else if (auto* select = std::get_if<SelectLane>(&action)) {
        for (int lane : select->allowed_lanes) {
            actions.push_back(AIAction::select_lane(actor, lane));
        }
    } else if (auto* discard = std::get_if<DiscardAction>(&action)) {
        int count = std::min(discard->count, hand.count());
        int n = hand.count();
        if (n > MAX_DISCARD_ENUMERATION) {
            std::vector<CardID> ids;
            for (int i = 0; i < count; i++) ids.push_back(hand.cards[i].id);
            actions.push_back(AIAction::discard_cards(actor, std::move(ids)));
        } else {
            // Every subset of each allowed size, by bitmask over the hand.
            // "1 or more" allows any size from the minimum up to the whole hand.
            int largest = discard->variable ? n : count;
            for (int size = count; size <= largest; size++) {
                for (uint32_t mask = 0; mask < (1u << n); mask++) {
                    if (static_cast<int>(std::bitset<32>(mask).count()) != size) continue;
                    std::vector<CardID> ids;
                    for (int i = 0; i < n; i++) {
                        if (mask & (1u << i)) ids.push_back(hand.cards[i].id);
                    }
                    actions.push_back(AIAction::discard_cards(actor, std::move(ids)));
                }
            }
        }
    } else if (auto* play = std::get_if<SelectHandCardToPlay>(&action)) {
        for (const auto& card : hand.cards) {
            for (int lane = 0; lane < LANE_COUNT; lane++) {
                if (lane == play->excluded_lane) continue;
                for (bool up : {true, false}) {
                    if (up && play->face_down_only) continue;
                    if (can_play_card(catalog_, state, actor, card, lane, up).allowed) {
                        actions.push_back(AIAction::play_from_hand(actor, card.id, lane, up));
                    }
                }
            }
        }
    } else if (std::holds_alternative<SelectHandCard>(action)) {
        for (const auto& card : hand.cards) {
            actions.push_back(AIAction::select_hand_card(actor, card.id));
        }
    } else if (std::holds_alternative<PromptOptionalEffect>(action)) {
        actions.push_back(AIAction::accept(actor));
        actions.push_back(AIAction::decline(actor));
    } else if (auto* choice = std::get_if<PromptChoice>(&action)) {
        for (int i = 0; i < static_cast<int>(choice->options.size()); i++) {
            actions.push_back(AIAction::choose(actor, i));
        }
    } else if (auto* rearrange = std::get_if<RearrangeProtocols>(&action)) {
        ProtocolList order = state.players[rearrange->target_player].protocols;
        std::sort(order.begin(), order.end());
        do {
            actions.push_back(AIAction::rearrange(actor, order));
        } while (std::next_permutation(order.begin(), order.end()));
    } else if (std::holds_alternative<SwapProtocols>(action)) {
        actions.push_back(AIAction::swap_protocols(actor, 0, 1));
        actions.push_back(AIAction::swap_protocols(actor, 0, 2));
        actions.push_back(AIAction::swap_protocols(actor, 1, 2));
    } else if (std::holds_alternative<PromptUseControl>(action)) {
        actions.push_back(AIAction::control_choice(actor, ControlChoice::SKIP));
        actions.push_back(AIAction::control_choice(actor, ControlChoice::REARRANGE_OWN));
        actions.push_back(AIAction::control_choice(actor, ControlChoice::REARRANGE_OPPONENT));
    }

    if (base.optional && !std::holds_alternative<PromptOptionalEffect>(action)) {
        actions.push_back(AIAction::skip(actor));
    }
    return actions;
}

// ============================================================================
// QUERIES
// ============================================================================

bool CompileEngine::is_card_targetable(const GameState& state, const CardID& card_id) const {
    if (!state.action_required.has_value()) {
        return false;
    }
    const ActionRequired& action = *state.action_required;
    if (const BoardTargetAction* target = as_board_target(action)) {
        return is_valid_target(catalog_, state, *target, card_id);
    }
    if (auto* order = std::get_if<SelectEffectToResolve>(&action)) {
        return std::find(order->candidates.begin(), order->candidates.end(), card_id) != order->candidates.end();
    }
    if (std::holds_alternative<DiscardAction>(action)
        || std::holds_alternative<SelectHandCard>(action)
        || std::holds_alternative<SelectHandCardToPlay>(action)) {
        return state.players[action_base(action).actor].hand.contains(card_id);
    }
    return false;
}

LanePlayability CompileEngine::get_lane_playability(const GameState& state, PlayerID player, int lane,
                                                    const std::optional<CardID>& card_id) const {
    if (!is_valid_lane(lane)) {
        LanePlayability result;
        result.reason = "no such lane";
        return result;
    }
    const PlayedCard* card = card_id.has_value() ? state.players[player].hand.find_card(*card_id) : nullptr;
    return compile::get_lane_playability(catalog_, state, player, lane, card);
}

std::vector<int> CompileEngine::compilable_lanes(const GameState& state, PlayerID player) const {
    GameState scratch = state.clone();
    recalculate_lane_values(catalog_, scratch);
    return compute_compilable_lanes(scratch, player, config_.allow_recompile);
}

std::vector<std::string> CompileEngine::check_invariants(const GameState& state) const {
    std::vector<std::string> problems;

    // Each identity in exactly one container
    std::unordered_map<CardID, int> seen;
    int total = 0;
    for (PlayerID p = 0; p < 2; p++) {
        const PlayerState& player = state.players[p];
        for (const Zone* zone : {&player.deck, &player.hand, &player.discard}) {
            for (const auto& card : zone->cards) {
                seen[card.id]++;
                total++;
            }
        }
        for (const auto& lane : player.board.lanes) {
            for (const auto& card : lane) {
                seen[card.id]++;
                total++;
            }
        }
    }
    if (state.committed.has_value()) {
        seen[state.committed->card.id]++;
        total++;
    }
    for (const auto& entry : seen) {
        if (entry.second > 1) {
            problems.push_back("card " + entry.first + " appears " + std::to_string(entry.second) + " times");
        }
    }
    if (total != state.next_card_serial) {
        problems.push_back("expected " + std::to_string(state.next_card_serial) + " cards, found "
                           + std::to_string(total));
    }

    // Cached lane values
    for (PlayerID p = 0; p < 2; p++) {
        for (int lane = 0; lane < LANE_COUNT; lane++) {
            int expected = compute_lane_value(catalog_, state, p, lane);
            if (state.players[p].lane_values[lane] != expected) {
                problems.push_back(std::string(player_name(p)) + " lane " + std::to_string(lane)
                                   + " caches " + std::to_string(state.players[p].lane_values[lane])
                                   + ", derived " + std::to_string(expected));
            }
        }
    }

    // Action stack
    if (state.action_required.has_value()) {
        const ActionRequired& action = *state.action_required;
        if (!requires_input(action)) {
            problems.push_back(std::string("automatic entry ") + action_type_name(action) + " is active");
        }
        if (action_base(action).actor > OPPONENT) {
            problems.push_back("active action has no valid actor");
        }
        if (state.is_game_over()) {
            problems.push_back("action pending after the game ended");
        }
    } else if (!state.is_game_over() && state.has_deferred_work()) {
        problems.push_back("deferred work left without an active action");
    }
    if (!state.fired_triggers.empty()) {
        problems.push_back("fired triggers left between transitions");
    }
    if (!state.is_game_over() && !state.action_required.has_value()
        && state.phase != Phase::ACTION && state.phase != Phase::COMPILE) {
        problems.push_back(std::string("waiting in phase ") + to_string(state.phase));
    }
    return problems;
}

} // namespace compile
