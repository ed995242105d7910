/**
 * Compile Engine - Compile and Control
 *
 * Compiling clears a line on both sides and marks the protocol compiled.
 * Compiling an already compiled protocol draws the top card of the
 * opposing deck instead. The control component, when in use, lets its
 * holder rearrange protocols before a compile or a hand refill.
 */

#include "engine.hpp"
#include <algorithm>

namespace compile {

void CompileEngine::do_compile(GameState& state, int lane) const {
    EffectResolver effects = resolver();
    PlayerID player = state.turn;
    PlayerState& me = state.players[player];

    state.add_log(player, "Compiles " + me.protocols[lane] + " (lane " + std::to_string(lane) + ", value "
                  + std::to_string(me.lane_values[lane]) + " vs "
                  + std::to_string(state.players[other(player)].lane_values[lane]) + ")");

    // Clear the line on both sides. A face-up card with the survive
    // passive stays and is shifted once the compile is done.
    for (PlayerID p = 0; p < 2; p++) {
        Lane& stack = state.players[p].board.lanes[lane];
        std::vector<CardID> survivors;
        for (int i = 0; i < static_cast<int>(stack.size()); i++) {
            if (is_passive_active(catalog_, state, BoardPosition{p, lane, i}, PassiveKind::SHIFT_ON_COMPILE_DELETE)) {
                survivors.push_back(stack[i].id);
            }
        }

        std::vector<PlayedCard> cleared = state.players[p].board.clear_lane(lane);
        for (auto& card : cleared) {
            bool survives = std::find(survivors.begin(), survivors.end(), card.id) != survivors.end();
            if (survives) {
                state.players[p].board.place_on_top(lane, std::move(card));
                continue;
            }
            state.processed_uncover_ids.erase(card.id);
            state.add_event(EventType::DELETE, p, card.id, lane);
            card.reset();
            state.players[p].discard.add_card(std::move(card));
        }

        for (const auto& id : survivors) {
            SelectLaneForShift shift;
            shift.actor = p;
            shift.source_card_id = id;
            shift.from_effect = false;
            shift.card_id = id;
            shift.card_owner = p;
            shift.from_lane = lane;
            for (int to = 0; to < LANE_COUNT; to++) {
                if (to != lane) shift.allowed_lanes.push_back(to);
            }
            state.add_log(p, "A card survives the compile and must shift");
            state.queue_action(std::move(shift));
        }
    }

    bool recompile = me.compiled[lane];
    me.compiled[lane] = true;
    me.stats.compiles++;
    state.compiled_this_turn = true;
    state.compilable_lanes.clear();
    state.add_event(EventType::COMPILE, player, "", lane, lane);

    if (recompile) {
        me.stats.recompiles++;
        state.add_log(player, "Recompiles " + me.protocols[lane]);
        effects.draw_from_opponent_deck(state, player);
    }

    if (me.all_compiled()) {
        state.winner = player;
        state.add_event(EventType::GAME_OVER, player);
        state.add_log(player, std::string(player_name(player)) + " compiled all protocols and wins");
    }

    state.phase = Phase::HAND_LIMIT;
}

void CompileEngine::do_fill_hand(GameState& state, PlayerID player) const {
    EffectResolver effects = resolver();
    int missing = config_.hand_limit - state.players[player].hand.count();
    state.add_log(player, "Refreshes their hand");
    if (missing > 0) {
        effects.draw_cards(state, player, missing);
    }
    state.players[player].stats.hands_refreshed++;
}

bool CompileEngine::offer_control(GameState& state, PlayerID player, ControlOrigin origin, int lane) const {
    if (!state.use_control_mechanic || state.control_card_holder != player) {
        return false;
    }
    // The component returns to neutral whatever the choice
    state.control_card_holder.reset();

    PromptUseControl prompt;
    prompt.actor = player;
    prompt.from_effect = false;
    prompt.optional = false;
    prompt.origin = origin;
    prompt.lane = lane;
    state.add_log(player, "Has control and may rearrange protocols");
    state.issue(std::move(prompt));
    return true;
}

void CompileEngine::continue_after_control(GameState& state, ControlOrigin origin, int lane) const {
    switch (origin) {
        case ControlOrigin::COMPILE:
            do_compile(state, lane);
            break;
        case ControlOrigin::FILL_HAND:
            do_fill_hand(state, state.turn);
            break;
        case ControlOrigin::NONE:
            break;
    }
}

} // namespace compile
