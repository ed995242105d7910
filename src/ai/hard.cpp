/**
 * Compile Engine - Hard AI
 *
 * Turn actions are scored with board-threat heuristics: card power,
 * point gain, compile setups and defence against the opponent's
 * strongest lines. Required actions use fixed targeting rules per
 * action kind; anything without a rule is handed to the Normal tier.
 */

#include "ai/ai_player.hpp"
#include <algorithm>

namespace compile {
namespace ai {

namespace {

constexpr int FRAGILE_SAFE_STACK = 4;

// Power of an average fresh draw, for "discard 1 or more" trades
constexpr int FRESH_DRAW_POWER = 10;

// ============================================================================
// TURN SCORING
// ============================================================================

/**
 * Score one play. nullopt means the hard tier refuses the move outright.
 */
std::optional<double> score_play(const CardCatalog& catalog, const GameState& state, PlayerID me,
                                 const PlayedCard& card, int lane, bool face_up, std::string& description) {
    const PlayerState& self = state.players[me];
    const PlayerState& them = state.players[other(me)];
    const CardDef* def = catalog.get_card(card.def_id());

    int current = self.lane_values[lane];
    int theirs = them.lane_values[lane];
    int gain = play_gain(catalog, state, me, card, lane, face_up);
    int result = current + gain;
    bool setup = result >= COMPILE_THRESHOLD && result > theirs;

    // Cards that delete themselves when covered are only worth it on a deep stack
    bool fragile = def && def->has_passive(PassiveKind::DELETE_WHEN_FLIPPED)
        && self.board.lane_size(lane) < FRAGILE_SAFE_STACK;

    double score = 0.0;
    if (face_up) {
        if (fragile && !setup) return std::nullopt;

        score = card_power(catalog, card) + gain;
        if (setup) {
            score += 200.0;
            description += " [compile setup]";
        } else if (result >= 8) {
            score += 100.0;
        }
        score += result - theirs;

        if (def && def->is_disruptive()) {
            int threat = lane_threat(state, other(me), lane);
            if (threat > 0) {
                score += 150.0 * threat;
                description += " [defends threat " + std::to_string(threat) + "]";
            }
            auto strongest = strongest_face_up(catalog, state, other(me));
            if (strongest.has_value() && (def->has_keyword(Keyword::FLIP) || def->has_keyword(Keyword::DELETE))) {
                score += card_threat(catalog, state, *strongest) * 2.0;
            }
        }
    } else {
        if (fragile) return std::nullopt;

        if (setup && current >= 8) {
            score = 250.0;
            description += " [compile setup]";
        } else if (current >= 6) {
            score = 20.0 * current;
        } else {
            score = 1.0;
        }
    }

    if (self.compiled[lane]) {
        score -= 50.0;
    }
    return score;
}

double score_fill_hand(const CardCatalog& catalog, const GameState& state, PlayerID me, int hand_limit) {
    const Zone& hand = state.players[me].hand;
    if (hand.is_empty()) return 500.0;
    if (hand.count() >= hand_limit) return 0.0;

    int total = 0;
    for (const auto& card : hand.cards) {
        total += card_power(catalog, card);
    }
    double average = static_cast<double>(total) / hand.count();
    return average < 8.0 ? 5.0 : 1.0;
}

// ============================================================================
// TARGETING RULES
// ============================================================================

double board_target_score(const CardCatalog& catalog, const GameState& state, PlayerID me,
                          const ActionRequired& action, const CardID& card_id) {
    BoardPosition pos = state.locate_on_board(card_id);
    const PlayedCard* card = state.board_card(pos);
    if (!card) return 0.0;

    int threat = card_threat(catalog, state, pos);
    bool theirs = pos.owner != me;
    int pressure = lane_threat(state, pos.owner, pos.lane) * 10;

    if (std::holds_alternative<SelectCardToDelete>(action) || std::holds_alternative<SelectCardToReturn>(action)) {
        return theirs ? 100.0 + threat + pressure : -threat;
    }
    if (std::holds_alternative<SelectCardToFlip>(action)) {
        if (theirs) {
            return card->face_up ? 100.0 + threat + pressure : 30.0;
        }
        return card->face_up ? -threat : 60.0 + card->value * 2.0;
    }
    if (std::holds_alternative<SelectCardToShift>(action)) {
        return theirs ? 50.0 + threat + pressure : 10.0 - threat;
    }
    if (std::holds_alternative<SelectCardToReveal>(action)) {
        return theirs && !card->face_up ? 50.0 : 0.0;
    }
    return 0.0;
}

double shift_lane_score(const CardCatalog& catalog, const GameState& state, PlayerID me,
                        const SelectLaneForShift& shift, int to) {
    const PlayerState& owner = state.players[shift.card_owner];
    if (shift.card_owner != me) {
        // Park the opponent's card where it does the least
        return owner.compiled[to] ? 100.0 : -owner.lane_values[to];
    }

    if (owner.compiled[to]) return -50.0;
    const PlayedCard* card = state.players[shift.card_owner].board.find_card(shift.card_id);
    int value = 0;
    if (card) {
        value = card->face_up ? card->value : face_down_value(catalog, state, me, to);
    }
    int result = owner.lane_values[to] + value;
    double score = owner.lane_values[to];
    if (result >= COMPILE_THRESHOLD && result > state.players[other(me)].lane_values[to]) {
        score += 100.0;
    }
    return score;
}

// Score of a protocol order from the point of view of the deciding player
double order_score(const GameState& state, PlayerID me, PlayerID target, const ProtocolList& order) {
    double score = protocol_order_score(state, target, order);
    return target == me ? score : -score;
}

double best_order_gain(const GameState& state, PlayerID me, PlayerID target) {
    ProtocolList order = state.players[target].protocols;
    double current = order_score(state, me, target, order);
    double best = current;
    std::sort(order.begin(), order.end());
    do {
        best = std::max(best, order_score(state, me, target, order));
    } while (std::next_permutation(order.begin(), order.end()));
    return best - current;
}

} // anonymous namespace

// ============================================================================
// TURN ACTIONS
// ============================================================================

std::vector<ScoredAction> hard_score_turn(const CompileEngine& engine, const GameState& state) {
    const CardCatalog& catalog = engine.catalog();
    PlayerID me = state.turn;
    const PlayerState& self = state.players[me];
    const PlayerState& them = state.players[other(me)];

    std::vector<ScoredAction> scored;
    for (const auto& action : engine.get_legal_actions(state)) {
        switch (action.action_type) {
            case ActionType::COMPILE: {
                int lane = *action.lane;
                double score = (self.compiled[lane] ? 0.0 : 500.0) + them.lane_values[lane] + self.lane_values[lane];
                scored.push_back(ScoredAction{action, score, "Compile " + self.protocols[lane]});
                break;
            }

            case ActionType::PLAY_CARD: {
                const PlayedCard* card = self.hand.find_card(*action.card_id);
                if (!card) break;
                std::string description = "Play " + card->name() + (action.face_up ? " face-up" : " face-down")
                    + " in lane " + std::to_string(*action.lane);
                auto score = score_play(catalog, state, me, *card, *action.lane, action.face_up, description);
                if (score.has_value()) {
                    scored.push_back(ScoredAction{action, *score, description});
                }
                break;
            }

            case ActionType::FILL_HAND:
                scored.push_back(ScoredAction{action,
                    score_fill_hand(catalog, state, me, engine.config().hand_limit), "Fill hand"});
                break;

            default:
                break;
        }
    }
    return scored;
}

AIAction hard_turn(const CompileEngine& engine, const GameState& state) {
    std::vector<ScoredAction> scored = hard_score_turn(engine, state);

    const ScoredAction* best = nullptr;
    for (const auto& candidate : scored) {
        if (!best || candidate.score > best->score) {
            best = &candidate;
        }
    }

    if (!best || best->score <= 0.0) {
        for (const auto& candidate : scored) {
            if (candidate.action.action_type == ActionType::FILL_HAND) {
                return candidate.action;
            }
        }
    }
    if (best) {
        return best->action;
    }
    return normal_turn(engine, state);
}

// ============================================================================
// REQUIRED ACTIONS
// ============================================================================

AIAction hard_pending(const CompileEngine& engine, const GameState& state) {
    if (!state.action_required.has_value()) {
        return hard_turn(engine, state);
    }

    const CardCatalog& catalog = engine.catalog();
    const ActionRequired& action = *state.action_required;
    PlayerID me = action_base(action).actor;
    const PlayerState& self = state.players[me];
    std::vector<AIAction> legal = engine.get_legal_actions(state);

    std::vector<ScoredAction> scored;
    bool handled = true;

    if (as_board_target(action)) {
        for (const auto& a : legal) {
            double score = a.action_type == ActionType::SELECT_CARD
                ? board_target_score(catalog, state, me, action, *a.card_id) : 0.0;
            scored.push_back(ScoredAction{a, score, ""});
        }
    } else if (auto* shift = std::get_if<SelectLaneForShift>(&action)) {
        for (const auto& a : legal) {
            double score = a.action_type == ActionType::SELECT_LANE
                ? shift_lane_score(catalog, state, me, *shift, *a.lane) : 0.0;
            scored.push_back(ScoredAction{a, score, ""});
        }
    } else if (auto* discard = std::get_if<DiscardAction>(&action)) {
        // Throw away the weakest cards. With a free size, only trade the
        // cards a fresh draw would beat.
        int baseline = discard->variable ? FRESH_DRAW_POWER : 0;
        for (const auto& a : legal) {
            double score = 0.0;
            for (const auto& id : a.card_ids) {
                if (const PlayedCard* card = self.hand.find_card(id)) {
                    score += baseline - card_power(catalog, *card);
                }
            }
            scored.push_back(ScoredAction{a, score, ""});
        }
    } else if (std::holds_alternative<SelectHandCardToPlay>(action)) {
        for (const auto& a : legal) {
            if (a.action_type != ActionType::PLAY_FROM_HAND) {
                scored.push_back(ScoredAction{a, 0.0, ""});
                continue;
            }
            const PlayedCard* card = self.hand.find_card(*a.card_id);
            if (!card) continue;
            std::string description;
            auto score = score_play(catalog, state, me, *card, *a.lane, a.face_up, description);
            scored.push_back(ScoredAction{a, score.has_value() ? *score : -100.0, description});
        }
    } else if (std::holds_alternative<SelectHandCard>(action)) {
        for (const auto& a : legal) {
            const PlayedCard* card = a.card_id.has_value() ? self.hand.find_card(*a.card_id) : nullptr;
            scored.push_back(ScoredAction{a, card ? -card_power(catalog, *card) : -100.0, ""});
        }
    } else if (auto* rearrange = std::get_if<RearrangeProtocols>(&action)) {
        for (const auto& a : legal) {
            double score = a.protocol_order.has_value()
                ? order_score(state, me, rearrange->target_player, *a.protocol_order) : -1000.0;
            scored.push_back(ScoredAction{a, score, ""});
        }
    } else if (auto* swap = std::get_if<SwapProtocols>(&action)) {
        for (const auto& a : legal) {
            if (!a.choice_index.has_value() || !a.second_index.has_value()) {
                scored.push_back(ScoredAction{a, -1000.0, ""});
                continue;
            }
            ProtocolList order = state.players[swap->target_player].protocols;
            std::swap(order[*a.choice_index], order[*a.second_index]);
            scored.push_back(ScoredAction{a, order_score(state, me, swap->target_player, order), ""});
        }
    } else if (std::holds_alternative<PromptUseControl>(action)) {
        double own_gain = best_order_gain(state, me, me);
        double opponent_gain = best_order_gain(state, me, other(me));
        ControlChoice choice = ControlChoice::SKIP;
        if (own_gain > 0.0 || opponent_gain > 0.0) {
            choice = own_gain >= opponent_gain ? ControlChoice::REARRANGE_OWN : ControlChoice::REARRANGE_OPPONENT;
        }
        return AIAction::control_choice(me, choice);
    } else {
        handled = false;
    }

    if (handled) {
        auto best = pick_best(scored);
        if (best.has_value()) {
            return *best;
        }
    }
    return normal_pending(engine, state);
}

} // namespace ai
} // namespace compile
