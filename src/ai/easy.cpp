/**
 * Compile Engine - Easy AI
 *
 * Only looks at its own board: compiles whenever it can and pushes the
 * line closest to 10, with some noise. Effect decisions are random,
 * weighted away from skipping.
 */

#include "ai/ai_player.hpp"
#include <random>

namespace compile {
namespace ai {

AIAction easy_turn(const CompileEngine& engine, const GameState& state) {
    std::vector<AIAction> legal = engine.get_legal_actions(state);
    if (legal.empty()) {
        return safe_default(engine, state);
    }

    const CardCatalog& catalog = engine.catalog();
    PlayerID me = state.turn;
    const PlayerState& self = state.players[me];
    std::mt19937 rng = state.rng;
    std::uniform_real_distribution<double> noise(0.0, 15.0);

    std::vector<ScoredAction> scored;
    for (const auto& action : legal) {
        ScoredAction entry{action, 0.0, ""};
        switch (action.action_type) {
            case ActionType::COMPILE:
                entry.score = 1000.0 + (self.compiled[*action.lane] ? 0.0 : 100.0) + self.lane_values[*action.lane];
                break;

            case ActionType::PLAY_CARD: {
                const PlayedCard* card = self.hand.find_card(*action.card_id);
                if (!card) continue;
                int lane = *action.lane;
                int gain = play_gain(catalog, state, me, *card, lane, action.face_up);
                int result = self.lane_values[lane] + gain;
                if (self.compiled[lane]) {
                    entry.score = gain - 20.0;
                } else {
                    entry.score = result * 10.0;
                    if (result >= COMPILE_THRESHOLD) entry.score += 100.0;
                }
                if (action.face_up) entry.score += 5.0;
                entry.score += noise(rng);
                break;
            }

            case ActionType::FILL_HAND:
                entry.score = self.hand.is_empty() ? 5000.0 : 0.0;
                break;

            default:
                break;
        }
        scored.push_back(std::move(entry));
    }

    auto best = pick_best(scored);
    return best.has_value() ? *best : safe_default(engine, state);
}

AIAction easy_pending(const CompileEngine& engine, const GameState& state) {
    std::vector<AIAction> legal = engine.get_legal_actions(state);
    if (legal.empty()) {
        return safe_default(engine, state);
    }

    std::vector<double> weights;
    weights.reserve(legal.size());
    for (const auto& action : legal) {
        weights.push_back(is_skip_like(action) ? 0.3 : 1.0);
    }

    std::mt19937 rng = state.rng;
    std::discrete_distribution<size_t> pick(weights.begin(), weights.end());
    return legal[pick(rng)];
}

} // namespace ai
} // namespace compile
