/**
 * Compile Engine - Phase Machine
 *
 * start -> control -> compile -> action -> hand_limit -> end -> (other player)
 *
 * advance_phase() performs one step of progress and returns false only
 * when the turn player has to act (compile a lane, or play/fill).
 */

#include "engine.hpp"

namespace compile {

bool CompileEngine::advance_phase(GameState& state) const {
    switch (state.phase) {
        case Phase::START:
            if (!run_phase_effects(state, Trigger::START)) {
                state.phase = Phase::CONTROL;
            }
            return true;

        case Phase::CONTROL:
            if (state.use_control_mechanic) {
                update_control(state);
            }
            state.phase = Phase::COMPILE;
            return true;

        case Phase::COMPILE: {
            std::vector<int> lanes = compute_compilable_lanes(state, state.turn, config_.allow_recompile);
            if (!lanes.empty()) {
                state.compilable_lanes = lanes;
                return false;
            }
            state.phase = Phase::ACTION;
            return true;
        }

        case Phase::ACTION:
            if (!state.action_taken) {
                return false;
            }
            state.phase = Phase::HAND_LIMIT;
            return true;

        case Phase::HAND_LIMIT:
            if (!run_clear_cache(state)) {
                state.phase = Phase::END;
            }
            return true;

        case Phase::END:
            if (!run_phase_effects(state, Trigger::END)) {
                end_turn(state);
            }
            return true;
    }
    return false;
}

// Start one pending start/end effect, or ask which goes first.
// Returns false once none is left.
bool CompileEngine::run_phase_effects(GameState& state, Trigger trigger) const {
    EffectResolver effects = resolver();
    std::vector<CardID> eligible = effects.collect_phase_effects(state, state.turn, trigger);
    if (eligible.empty()) {
        return false;
    }

    if (eligible.size() == 1) {
        auto& processed = trigger == Trigger::START ? state.processed_start_ids : state.processed_end_ids;
        processed.insert(eligible[0]);
        auto ctx = effects.make_context(state, eligible[0], trigger);
        if (ctx.has_value()) {
            effects.run(state, *ctx);
        }
        return true;
    }

    SelectEffectToResolve order;
    order.actor = state.turn;
    order.from_effect = false;
    order.trigger = trigger;
    order.candidates = std::move(eligible);
    state.issue(std::move(order));
    return true;
}

// Check cache: discard down to the hand limit, then after-clear-cache
// effects. Returns false once the phase is done.
bool CompileEngine::run_clear_cache(GameState& state) const {
    EffectResolver effects = resolver();
    PlayerState& player = state.players[state.turn];

    if (player_has_passive(catalog_, state, state.turn, PassiveKind::SKIP_CHECK_CACHE)) {
        if (!state.cache_checked) {
            state.cache_checked = true;
            state.add_log(state.turn, "Skips the check cache phase");
        }
        return false;
    }

    if (!state.cache_checked) {
        state.cache_checked = true;
        int excess = player.hand.count() - config_.hand_limit;
        if (excess > 0) {
            DiscardAction discard;
            discard.actor = state.turn;
            discard.from_effect = false;
            discard.count = excess;
            discard.purpose = DiscardPurpose::HAND_LIMIT;
            state.add_log(state.turn, "Must discard " + std::to_string(excess) + " for the hand limit");
            state.issue(std::move(discard));
            return true;
        }
    }

    bool fired = false;
    for (int lane = 0; lane < LANE_COUNT; lane++) {
        const Lane& stack = player.board.lanes[lane];
        for (int i = 0; i < static_cast<int>(stack.size()); i++) {
            const PlayedCard& card = stack[i];
            if (!card.face_up || state.processed_clear_cache_ids.count(card.id) > 0) {
                continue;
            }
            const CardDef* def = catalog_.get_card(card.def_id());
            const CardEffect* effect = def ? def->find_effect(Trigger::AFTER_CLEAR_CACHE) : nullptr;
            if (!effect || !is_box_active(state, BoardPosition{state.turn, lane, i}, effect->box)) {
                continue;
            }
            state.processed_clear_cache_ids.insert(card.id);
            auto ctx = effects.make_context(state, card.id, Trigger::AFTER_CLEAR_CACHE);
            if (ctx.has_value()) {
                state.fired_triggers.push_back(*ctx);
                fired = true;
            }
        }
    }
    if (fired) {
        effects.push_fired_triggers(state);
    }
    return fired;
}

// The turn player takes control with a higher value in at least two lines
void CompileEngine::update_control(GameState& state) const {
    const PlayerState& me = state.players[state.turn];
    const PlayerState& them = state.players[other(state.turn)];
    int leading = 0;
    for (int lane = 0; lane < LANE_COUNT; lane++) {
        if (me.lane_values[lane] > them.lane_values[lane]) {
            leading++;
        }
    }
    if (leading >= 2 && state.control_card_holder != state.turn) {
        state.control_card_holder = state.turn;
        state.add_log(state.turn, "Takes control");
    }
}

void CompileEngine::end_turn(GameState& state) const {
    PlayerID ending = state.turn;
    state.players[ending].cannot_compile = false;

    state.processed_start_ids.clear();
    state.processed_end_ids.clear();
    state.processed_uncover_ids.clear();
    state.processed_clear_cache_ids.clear();
    state.action_taken = false;
    state.compiled_this_turn = false;
    state.cache_checked = false;
    state.compilable_lanes.clear();

    state.turn = other(ending);
    state.turn_number++;
    state.phase = Phase::START;
    state.add_log(state.turn, "Turn " + std::to_string(state.turn_number) + " begins");
}

} // namespace compile
