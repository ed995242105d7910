/**
 * Compile Engine - AI Heuristics Implementation
 */

#include "ai/ai_common.hpp"
#include <algorithm>

namespace compile {
namespace ai {

// ============================================================================
// CARD AND LANE READING
// ============================================================================

int card_power(const CardCatalog& catalog, const PlayedCard& card) {
    int power = 10 - card.value;
    const CardDef* def = catalog.get_card(card.def_id());
    if (!def) {
        return power;
    }
    if (def->is_disruptive()) power += 5;
    if (def->has_keyword(Keyword::DRAW)) power += 3;
    if (def->has_keyword(Keyword::PLAY)) power += 6;
    return power;
}

int card_threat(const CardCatalog& catalog, const GameState& state, const BoardPosition& pos) {
    const PlayedCard* card = state.board_card(pos);
    if (!card) {
        return 0;
    }
    if (!card->face_up) {
        return face_down_value(catalog, state, pos.owner, pos.lane);
    }

    int threat = card->value * 2;
    const CardDef* def = catalog.get_card(card->def_id());
    if (!def) {
        return threat;
    }

    bool persistent_top = false;
    bool recurring = false;
    bool on_cover = false;
    for (const auto& effect : def->effects) {
        if (effect.box == Box::TOP) persistent_top = true;
        if (effect.box == Box::BOTTOM && (effect.trigger == Trigger::START || effect.trigger == Trigger::END)) {
            recurring = true;
        }
        if (effect.trigger == Trigger::ON_COVER) on_cover = true;
    }
    for (const auto& passive : def->passives) {
        if (passive.box == Box::TOP) persistent_top = true;
    }

    if (persistent_top) threat += 5;
    if (recurring) threat += 6;
    if (on_cover) threat += 4;
    return threat;
}

int lane_threat(const GameState& state, PlayerID owner, int lane) {
    const PlayerState& p = state.players[owner];
    if (p.compiled[lane]) return 0;
    int value = p.lane_values[lane];
    if (value >= COMPILE_THRESHOLD) return 3;
    if (value >= 8) return 2;
    if (value >= 6) return 1;
    return 0;
}

int face_down_value(const CardCatalog& catalog, const GameState& state, PlayerID owner, int lane) {
    return stack_has_passive(catalog, state, owner, lane, PassiveKind::FACE_DOWN_VALUE_4)
        ? BOOSTED_FACE_DOWN_VALUE : FACE_DOWN_VALUE;
}

int play_gain(const CardCatalog& catalog, const GameState& state, PlayerID player,
              const PlayedCard& card, int lane, bool face_up) {
    if (face_up) {
        return card.value;
    }
    return face_down_value(catalog, state, player, lane)
        + stack_passive_total(catalog, state, player, lane, PassiveKind::OWN_TOTAL_PLUS_PER_FACE_DOWN);
}

std::optional<BoardPosition> strongest_face_up(const CardCatalog& catalog, const GameState& state, PlayerID owner) {
    std::optional<BoardPosition> best;
    int best_threat = -1;
    const Board& board = state.players[owner].board;
    for (int lane = 0; lane < LANE_COUNT; lane++) {
        for (int i = 0; i < board.lane_size(lane); i++) {
            if (!board.lanes[lane][i].face_up) continue;
            BoardPosition pos{owner, lane, i};
            int threat = card_threat(catalog, state, pos);
            if (threat > best_threat) {
                best_threat = threat;
                best = pos;
            }
        }
    }
    return best;
}

// ============================================================================
// POSITION EVALUATION
// ============================================================================

namespace {

double side_score(const GameState& state, PlayerID player) {
    const PlayerState& me = state.players[player];
    const PlayerState& them = state.players[other(player)];

    double score = me.compiled_count() * 1000.0;
    for (int lane = 0; lane < LANE_COUNT; lane++) {
        int mine = me.lane_values[lane];
        int theirs = them.lane_values[lane];
        if (me.compiled[lane]) {
            // Only worth a recompile
            score += std::min(mine, COMPILE_THRESHOLD);
            continue;
        }
        score += std::min(mine, COMPILE_THRESHOLD) * 5.0;
        if (mine >= COMPILE_THRESHOLD && mine > theirs) {
            score += 200.0;
        }
        score += (mine - theirs) * 2.0;
    }
    score += std::min(me.hand.count(), HAND_LIMIT) * 6.0;
    if (me.cannot_compile) score -= 50.0;
    return score;
}

} // anonymous namespace

double evaluate(const GameState& state, PlayerID me) {
    if (state.winner.has_value()) {
        return *state.winner == me ? 100000.0 : -100000.0;
    }
    return side_score(state, me) - side_score(state, other(me));
}

double protocol_order_score(const GameState& state, PlayerID owner, const ProtocolList& order) {
    const PlayerState& p = state.players[owner];
    const PlayerState& opp = state.players[other(owner)];

    double score = 0.0;
    for (int lane = 0; lane < LANE_COUNT; lane++) {
        int from = p.protocol_lane(order[lane]);
        if (from >= 0 && p.compiled[from]) continue;

        int lead = p.lane_values[lane] - opp.lane_values[lane];
        score += lead;
        if (p.lane_values[lane] >= COMPILE_THRESHOLD && lead > 0) {
            score += 20.0;
        }
    }
    return score;
}

// ============================================================================
// SELECTION
// ============================================================================

std::optional<AIAction> pick_best(const std::vector<ScoredAction>& scored) {
    const ScoredAction* best = nullptr;
    for (const auto& candidate : scored) {
        if (!best || candidate.score > best->score) {
            best = &candidate;
        }
    }
    if (!best) {
        return std::nullopt;
    }
    return best->action;
}

AIAction safe_default(const CompileEngine& engine, const GameState& state) {
    std::vector<AIAction> legal = engine.get_legal_actions(state);
    for (const auto& action : legal) {
        if (action.action_type == ActionType::SKIP) {
            return action;
        }
    }
    if (!legal.empty()) {
        return legal.front();
    }
    return AIAction::skip(engine.expected_actor(state));
}

bool is_skip_like(const AIAction& action) {
    return action.action_type == ActionType::SKIP || action.action_type == ActionType::DECLINE_PROMPT;
}

} // namespace ai
} // namespace compile
