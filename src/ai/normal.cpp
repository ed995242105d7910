/**
 * Compile Engine - Normal AI
 *
 * One-ply lookahead: every legal intent is applied to a copy of the
 * state and the resulting position is scored with evaluate().
 */

#include "ai/ai_player.hpp"

namespace compile {
namespace ai {

namespace {

std::vector<ScoredAction> lookahead(const CompileEngine& engine, const GameState& state, PlayerID me) {
    std::vector<ScoredAction> scored;
    for (const auto& action : engine.get_legal_actions(state)) {
        StepResult result = engine.step(state, action);
        if (!result.ok) continue;
        scored.push_back(ScoredAction{action, evaluate(result.state, me), ""});
    }
    return scored;
}

} // anonymous namespace

AIAction normal_turn(const CompileEngine& engine, const GameState& state) {
    auto best = pick_best(lookahead(engine, state, state.turn));
    return best.has_value() ? *best : safe_default(engine, state);
}

AIAction normal_pending(const CompileEngine& engine, const GameState& state) {
    auto best = pick_best(lookahead(engine, state, engine.expected_actor(state)));
    return best.has_value() ? *best : safe_default(engine, state);
}

} // namespace ai
} // namespace compile
