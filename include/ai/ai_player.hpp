/**
 * Compile Engine - AI Player
 *
 * Three interchangeable strategies choosing an intent for whichever
 * player the engine is waiting on:
 *
 *   EASY   - Races its own lines to 10; answers effects at random.
 *   NORMAL - One-ply lookahead over every legal intent.
 *   HARD   - Weighted board-threat heuristics with deterministic
 *            targeting rules, falling back to NORMAL.
 *
 * Every tier only ever returns an intent taken from
 * CompileEngine::get_legal_actions(), and draws randomness from a copy
 * of the state's RNG, so the same state always yields the same intent.
 */

#pragma once

#include "ai_common.hpp"
#include <functional>

namespace compile {
namespace ai {

// ============================================================================
// ENTRY POINTS
// ============================================================================

/**
 * Choose a turn action (play, fill hand, compile).
 * Delegates to resolve_pending_action() when an action is pending.
 */
AIAction run_turn(const CompileEngine& engine, const GameState& state, Difficulty difficulty);

/**
 * Answer the active required action.
 * Falls back to run_turn() when nothing is pending.
 */
AIAction resolve_pending_action(const CompileEngine& engine, const GameState& state, Difficulty difficulty);

// Whichever of the two the state calls for
AIAction choose_action(const CompileEngine& engine, const GameState& state, Difficulty difficulty);

// ============================================================================
// TIERS
// ============================================================================

AIAction easy_turn(const CompileEngine& engine, const GameState& state);
AIAction easy_pending(const CompileEngine& engine, const GameState& state);

AIAction normal_turn(const CompileEngine& engine, const GameState& state);
AIAction normal_pending(const CompileEngine& engine, const GameState& state);

AIAction hard_turn(const CompileEngine& engine, const GameState& state);
AIAction hard_pending(const CompileEngine& engine, const GameState& state);

/**
 * Hard tier scores for every legal turn action, exposed for tests and
 * the console's hint command.
 */
std::vector<ScoredAction> hard_score_turn(const CompileEngine& engine, const GameState& state);

// ============================================================================
// AI PLAYER
// ============================================================================

/**
 * AIPlayer - One seat driven by an AI tier.
 */
class AIPlayer {
public:
    AIPlayer(const CompileEngine& engine, Difficulty difficulty)
        : engine_(engine)
        , difficulty_(difficulty)
    {}

    AIAction choose(const GameState& state) const {
        return choose_action(engine_, state, difficulty_);
    }

    /**
     * Choose and apply. A rejected choice is retried once with the first
     * legal intent. The intent actually applied is written to applied.
     */
    StepResult act(const GameState& state, AIAction* applied = nullptr) const;

    Difficulty difficulty() const { return difficulty_; }

private:
    const CompileEngine& engine_;
    Difficulty difficulty_;
};

// Called after every applied intent with the intent and the new state
using StepObserver = std::function<void(const AIAction&, const GameState&)>;

/**
 * Drive a game with an AI on both seats until it ends or max_steps
 * intents have been applied.
 */
GameState play_game(const CompileEngine& engine, GameState state,
                    const std::array<Difficulty, 2>& difficulties,
                    int max_steps = 5000,
                    const StepObserver& observer = nullptr);

} // namespace ai
} // namespace compile
