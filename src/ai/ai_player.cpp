/**
 * Compile Engine - AI Player Implementation
 */

#include "ai/ai_player.hpp"
#include <iostream>

namespace compile {
namespace ai {

// ============================================================================
// ENTRY POINTS
// ============================================================================

AIAction run_turn(const CompileEngine& engine, const GameState& state, Difficulty difficulty) {
    if (state.has_pending_action()) {
        return resolve_pending_action(engine, state, difficulty);
    }
    switch (difficulty) {
        case Difficulty::EASY: return easy_turn(engine, state);
        case Difficulty::NORMAL: return normal_turn(engine, state);
        case Difficulty::HARD: return hard_turn(engine, state);
    }
    return safe_default(engine, state);
}

AIAction resolve_pending_action(const CompileEngine& engine, const GameState& state, Difficulty difficulty) {
    if (!state.has_pending_action()) {
        return run_turn(engine, state, difficulty);
    }
    switch (difficulty) {
        case Difficulty::EASY: return easy_pending(engine, state);
        case Difficulty::NORMAL: return normal_pending(engine, state);
        case Difficulty::HARD: return hard_pending(engine, state);
    }
    return safe_default(engine, state);
}

AIAction choose_action(const CompileEngine& engine, const GameState& state, Difficulty difficulty) {
    return state.has_pending_action()
        ? resolve_pending_action(engine, state, difficulty)
        : run_turn(engine, state, difficulty);
}

// ============================================================================
// AI PLAYER
// ============================================================================

StepResult AIPlayer::act(const GameState& state, AIAction* applied) const {
    AIAction action = choose(state);
    if (applied) *applied = action;
    StepResult result = engine_.step(state, action);
    if (result.ok) {
        return result;
    }

    std::cerr << "[AI] " << to_string(difficulty_) << " chose an illegal intent "
              << action.to_string() << ": " << result.message << std::endl;
    std::vector<AIAction> legal = engine_.get_legal_actions(state);
    if (legal.empty()) {
        return result;
    }
    if (applied) *applied = legal.front();
    return engine_.step(state, legal.front());
}

GameState play_game(const CompileEngine& engine, GameState state,
                    const std::array<Difficulty, 2>& difficulties,
                    int max_steps, const StepObserver& observer) {
    for (int steps = 0; steps < max_steps && !state.is_game_over(); steps++) {
        PlayerID actor = engine.expected_actor(state);
        AIPlayer seat(engine, difficulties[actor]);
        AIAction action;
        StepResult result = seat.act(state, &action);
        if (!result.ok) {
            std::cerr << "[AI] No legal intent for P" << static_cast<int>(actor)
                      << " at turn " << state.turn_number << ": " << result.message << std::endl;
            break;
        }
        state = std::move(result.state);
        if (observer) {
            observer(action, state);
        }
    }
    return state;
}

} // namespace ai
} // namespace compile
