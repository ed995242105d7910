/**
 * Compile Engine - Passive Rules Implementation
 */

#include "passive_rules.hpp"
#include <algorithm>

namespace compile {

// ============================================================================
// BOX ACTIVITY
// ============================================================================

bool is_box_active(const GameState& state, const BoardPosition& pos, Box box) {
    const PlayedCard* card = state.board_card(pos);
    if (!card || !card->face_up) {
        return false;
    }
    if (box == Box::BOTTOM) {
        return state.is_uncovered(pos);
    }
    return true;
}

bool is_passive_active(const CardCatalog& catalog, const GameState& state,
                       const BoardPosition& pos, PassiveKind kind) {
    const PlayedCard* card = state.board_card(pos);
    if (!card || !card->face_up) {
        return false;
    }
    const CardDef* def = catalog.get_card(card->def_id());
    if (!def) {
        return false;
    }
    for (const auto& rule : def->passives) {
        if (rule.kind == kind && is_box_active(state, pos, rule.box)) {
            return true;
        }
    }
    return false;
}

int stack_passive_total(const CardCatalog& catalog, const GameState& state,
                        PlayerID owner, int lane, PassiveKind kind) {
    int total = 0;
    const Lane& stack = state.players[owner].board.lanes[lane];
    for (int i = 0; i < static_cast<int>(stack.size()); i++) {
        BoardPosition pos{owner, lane, i};
        if (!is_passive_active(catalog, state, pos, kind)) {
            continue;
        }
        const PassiveRule* rule = catalog.get_card(stack[i].def_id())->find_passive(kind);
        total += rule->amount;
    }
    return total;
}

bool stack_has_passive(const CardCatalog& catalog, const GameState& state,
                       PlayerID owner, int lane, PassiveKind kind) {
    const Lane& stack = state.players[owner].board.lanes[lane];
    for (int i = 0; i < static_cast<int>(stack.size()); i++) {
        if (is_passive_active(catalog, state, BoardPosition{owner, lane, i}, kind)) {
            return true;
        }
    }
    return false;
}

bool player_has_passive(const CardCatalog& catalog, const GameState& state,
                        PlayerID owner, PassiveKind kind) {
    for (int lane = 0; lane < LANE_COUNT; lane++) {
        if (stack_has_passive(catalog, state, owner, lane, kind)) {
            return true;
        }
    }
    return false;
}

bool any_player_has_passive(const CardCatalog& catalog, const GameState& state, PassiveKind kind) {
    return player_has_passive(catalog, state, PLAYER, kind)
        || player_has_passive(catalog, state, OPPONENT, kind);
}

bool middle_ignored_in_lane(const CardCatalog& catalog, const GameState& state, int lane) {
    if (!is_valid_lane(lane)) {
        return false;
    }
    return stack_has_passive(catalog, state, PLAYER, lane, PassiveKind::IGNORE_MIDDLE_IN_LANE)
        || stack_has_passive(catalog, state, OPPONENT, lane, PassiveKind::IGNORE_MIDDLE_IN_LANE);
}

// ============================================================================
// VALUES
// ============================================================================

int effective_value(const CardCatalog& catalog, const GameState& state, const BoardPosition& pos) {
    const PlayedCard* card = state.board_card(pos);
    if (!card) {
        return 0;
    }
    if (card->face_up) {
        return card->value;
    }
    if (stack_has_passive(catalog, state, pos.owner, pos.lane, PassiveKind::FACE_DOWN_VALUE_4)) {
        return BOOSTED_FACE_DOWN_VALUE;
    }
    return FACE_DOWN_VALUE;
}

int compute_lane_value(const CardCatalog& catalog, const GameState& state, PlayerID owner, int lane) {
    const Lane& stack = state.players[owner].board.lanes[lane];
    int total = 0;
    for (int i = 0; i < static_cast<int>(stack.size()); i++) {
        total += effective_value(catalog, state, BoardPosition{owner, lane, i});
    }

    // +1 per face-down card in the whole line, once per active card
    int per_face_down = 0;
    for (int i = 0; i < static_cast<int>(stack.size()); i++) {
        if (is_passive_active(catalog, state, BoardPosition{owner, lane, i},
                              PassiveKind::OWN_TOTAL_PLUS_PER_FACE_DOWN)) {
            per_face_down++;
        }
    }
    if (per_face_down > 0) {
        int face_down = 0;
        for (PlayerID p = 0; p < 2; p++) {
            for (const auto& card : state.players[p].board.lanes[lane]) {
                if (!card.face_up) face_down++;
            }
        }
        total += per_face_down * face_down;
    }

    total -= stack_passive_total(catalog, state, other(owner), lane, PassiveKind::OPPONENT_TOTAL_MINUS);
    return std::max(0, total);
}

void recalculate_lane_values(const CardCatalog& catalog, GameState& state) {
    for (PlayerID p = 0; p < 2; p++) {
        for (int lane = 0; lane < LANE_COUNT; lane++) {
            state.players[p].lane_values[lane] = compute_lane_value(catalog, state, p, lane);
        }
    }
}

// ============================================================================
// PLAY LEGALITY
// ============================================================================

namespace {

bool lane_blocked_for(const CardCatalog& catalog, const GameState& state, PlayerID player, int lane) {
    return stack_has_passive(catalog, state, other(player), lane, PassiveKind::BLOCK_PLAY_IN_LANE);
}

bool matches_lane_protocol(const GameState& state, const PlayedCard& card, int lane) {
    return state.players[PLAYER].protocols[lane] == card.protocol
        || state.players[OPPONENT].protocols[lane] == card.protocol;
}

} // anonymous namespace

PlayCheck can_play_card(const CardCatalog& catalog, const GameState& state, PlayerID player,
                        const PlayedCard& card, int lane, bool face_up) {
    PlayCheck check;
    if (!is_valid_lane(lane)) {
        check.reason = "invalid lane";
        return check;
    }

    // 1. Opponent's blocking card locks the whole line
    if (lane_blocked_for(catalog, state, player, lane)) {
        check.reason = "line is blocked by an opposing card";
        return check;
    }

    if (!face_up) {
        // 2. Face-down plays ignore protocols but can be locked out
        if (stack_has_passive(catalog, state, other(player), lane, PassiveKind::BLOCK_FACE_DOWN_PLAY_IN_LANE)) {
            check.reason = "face-down plays are blocked in this line";
            return check;
        }
        check.allowed = true;
        return check;
    }

    // 3. Opponent forces face-down plays
    if (player_has_passive(catalog, state, other(player), PassiveKind::OPPONENT_PLAYS_FACE_DOWN_ONLY)) {
        check.reason = "cards can only be played face-down";
        return check;
    }

    // 4. Inverted matching overrides everything below it
    if (any_player_has_passive(catalog, state, PassiveKind::INVERT_PROTOCOL_MATCHING)) {
        if (matches_lane_protocol(state, card, lane)) {
            check.reason = "face-up cards must not match this line's protocols";
            return check;
        }
        check.allowed = true;
        return check;
    }

    // 5. Baseline matching with its exemptions
    if (matches_lane_protocol(state, card, lane)) {
        check.allowed = true;
        return check;
    }
    if (player_has_passive(catalog, state, player, PassiveKind::PLAY_ANY_LANE)) {
        check.allowed = true;
        return check;
    }
    const CardDef* def = catalog.get_card(card.def_id());
    if (def && def->has_passive(PassiveKind::IGNORE_PROTOCOL_MATCHING_SELF)) {
        check.allowed = true;
        return check;
    }

    check.reason = "protocol does not match this line";
    return check;
}

LanePlayability get_lane_playability(const CardCatalog& catalog, const GameState& state,
                                     PlayerID player, int lane, const PlayedCard* card) {
    LanePlayability result;
    if (!is_valid_lane(lane)) {
        result.reason = "invalid lane";
        return result;
    }
    if (lane_blocked_for(catalog, state, player, lane)) {
        result.reason = "line is blocked by an opposing card";
        return result;
    }

    if (card) {
        PlayCheck up = can_play_card(catalog, state, player, *card, lane, true);
        PlayCheck down = can_play_card(catalog, state, player, *card, lane, false);
        result.face_up_allowed = up.allowed;
        result.face_down_allowed = down.allowed;
        result.reason = !up.allowed ? up.reason : "";
        if (!down.allowed && !up.allowed) {
            result.reason = down.reason;
        }
    } else {
        PlayedCard blank;
        result.face_down_allowed = can_play_card(catalog, state, player, blank, lane, false).allowed;
        for (const auto& hand_card : state.players[player].hand.cards) {
            if (can_play_card(catalog, state, player, hand_card, lane, true).allowed) {
                result.face_up_allowed = true;
                break;
            }
        }
        if (!result.face_down_allowed && !result.face_up_allowed) {
            result.reason = "no card can be played in this line";
        }
    }

    result.is_playable = result.face_up_allowed || result.face_down_allowed;
    return result;
}

// ============================================================================
// TARGETING
// ============================================================================

bool matches_filter(const CardCatalog& catalog, const GameState& state, const BoardPosition& pos,
                    const TargetFilter& filter, const EffectContext& ctx) {
    const PlayedCard* card = state.board_card(pos);
    if (!card) {
        return false;
    }

    if (filter.owner == OwnerFilter::OWN && pos.owner != ctx.owner) return false;
    if (filter.owner == OwnerFilter::OPPONENT && pos.owner == ctx.owner) return false;

    if (filter.face == FaceFilter::FACE_UP && !card->face_up) return false;
    if (filter.face == FaceFilter::FACE_DOWN && card->face_up) return false;

    bool uncovered = state.is_uncovered(pos);
    if (filter.position == PositionFilter::UNCOVERED && !uncovered) return false;
    if (filter.position == PositionFilter::COVERED && uncovered) return false;

    if (filter.exclude_self && card->id == ctx.source_card_id) return false;

    if (filter.lane == LaneScope::THIS_LANE && pos.lane != ctx.lane) return false;
    if (filter.lane == LaneScope::OTHER_LANES && pos.lane == ctx.lane) return false;

    if (filter.min_value >= 0 || filter.max_value >= 0) {
        int value = effective_value(catalog, state, pos);
        if (filter.min_value >= 0 && value < filter.min_value) return false;
        if (filter.max_value >= 0 && value > filter.max_value) return false;
    }
    return true;
}

std::vector<CardID> collect_filter_targets(const CardCatalog& catalog, const GameState& state,
                                           const TargetFilter& filter, const EffectContext& ctx) {
    std::vector<CardID> targets;
    for (PlayerID p = 0; p < 2; p++) {
        for (int lane = 0; lane < LANE_COUNT; lane++) {
            const Lane& stack = state.players[p].board.lanes[lane];
            for (int i = 0; i < static_cast<int>(stack.size()); i++) {
                if (matches_filter(catalog, state, BoardPosition{p, lane, i}, filter, ctx)) {
                    targets.push_back(stack[i].id);
                }
            }
        }
    }
    return targets;
}

bool is_valid_target(const CardCatalog& catalog, const GameState& state,
                     const BoardTargetAction& action, const CardID& card_id) {
    BoardPosition pos = state.locate_on_board(card_id);
    if (!pos.is_valid()) {
        return false;
    }
    if (action.only_lane >= 0 && pos.lane != action.only_lane) {
        return false;
    }
    if (!action.allowed_ids.empty()
        && std::find(action.allowed_ids.begin(), action.allowed_ids.end(), card_id) == action.allowed_ids.end()) {
        return false;
    }
    if (std::find(action.disallowed_ids.begin(), action.disallowed_ids.end(), card_id) != action.disallowed_ids.end()) {
        return false;
    }
    return matches_filter(catalog, state, pos, action.filter, action.ctx);
}

std::vector<CardID> collect_targets(const CardCatalog& catalog, const GameState& state,
                                    const BoardTargetAction& action) {
    std::vector<CardID> targets;
    for (PlayerID p = 0; p < 2; p++) {
        for (int lane = 0; lane < LANE_COUNT; lane++) {
            for (const auto& card : state.players[p].board.lanes[lane]) {
                if (is_valid_target(catalog, state, action, card.id)) {
                    targets.push_back(card.id);
                }
            }
        }
    }
    return targets;
}

// ============================================================================
// COMPILE
// ============================================================================

std::vector<int> compute_compilable_lanes(const GameState& state, PlayerID player, bool allow_recompile) {
    std::vector<int> lanes;
    const PlayerState& me = state.players[player];
    if (me.cannot_compile) {
        return lanes;
    }
    const PlayerState& them = state.players[other(player)];
    for (int lane = 0; lane < LANE_COUNT; lane++) {
        if (!allow_recompile && me.compiled[lane]) {
            continue;
        }
        int mine = me.lane_values[lane];
        if (mine >= COMPILE_THRESHOLD && mine > them.lane_values[lane]) {
            lanes.push_back(lane);
        }
    }
    return lanes;
}

} // namespace compile
