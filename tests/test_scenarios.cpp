/**
 * End-to-end rule scenarios driven through the generic intent interface
 */

#include "test_helpers.hpp"
#include "ai/ai_player.hpp"

using namespace compile;
using namespace compile::test_support;

// ============================================================================
// SCENARIO TESTS
// ============================================================================

TEST(Scenario, FlipInterruptsOpponentTurn) {
    CompileEngine engine;
    GameState state = standard_game(engine, OPPONENT);
    CardID speed0 = place(engine, state, PLAYER, 0, "Speed", 0, false);
    CardID life4 = give(state, PLAYER, "Life", 4);
    CardID metal0 = give(state, OPPONENT, "Metal", 0);

    StepResult played = engine.step(state, AIAction::play_card(OPPONENT, metal0, 0, true));
    TEST_ASSERT_TRUE(played.ok);
    StepResult flipped = engine.step(played.state, AIAction::select_card(OPPONENT, speed0));
    TEST_ASSERT_TRUE(flipped.ok);

    // Opponent's turn is on hold until the player answers Speed-0
    const GameState& held = flipped.state;
    TEST_ASSERT_EQ(1, static_cast<int>(held.turn));
    TEST_ASSERT(pending_is<SelectHandCardToPlay>(held));
    std::vector<AIAction> legal = engine.get_legal_actions(held);
    TEST_ASSERT_EQ(4u, legal.size());
    for (const auto& action : legal) {
        TEST_ASSERT_EQ(0, static_cast<int>(action.player_id));
        TEST_ASSERT(action.action_type == ActionType::PLAY_FROM_HAND);
    }
    TEST_ASSERT(engine.step(held, AIAction::fill_hand(OPPONENT)).error == IllegalIntent::ACTION_PENDING);

    StepResult answered = engine.step(held, AIAction::play_from_hand(PLAYER, life4, 1, true));
    TEST_ASSERT_TRUE(answered.ok);
    TEST_ASSERT_EQ(0, static_cast<int>(answered.state.turn));
    TEST_ASSERT_EQ(4, answered.state.players[PLAYER].lane_values[1]);
    TEST_ASSERT_TRUE(engine.check_invariants(answered.state).empty());
}

TEST(Scenario, LeadingLineBecomesCompilable) {
    CompileEngine engine;
    GameState state = standard_game(engine, OPPONENT);
    for (int value = 0; value < 5; value++) {
        place(engine, state, PLAYER, 1, "Life", value, false);
    }
    place(engine, state, OPPONENT, 1, "Hate", 0, false);
    place(engine, state, OPPONENT, 1, "Hate", 4, false);
    place(engine, state, OPPONENT, 1, "Death", 3, true);
    TEST_ASSERT_EQ(10, state.players[PLAYER].lane_values[1]);
    TEST_ASSERT_EQ(7, state.players[OPPONENT].lane_values[1]);

    StepResult turn = engine.step(state, AIAction::fill_hand(OPPONENT));
    TEST_ASSERT_TRUE(turn.ok);
    const GameState& ready = turn.state;
    TEST_ASSERT_EQ(0, static_cast<int>(ready.turn));
    TEST_ASSERT(ready.phase == Phase::COMPILE);
    TEST_ASSERT_EQ(1u, ready.compilable_lanes.size());
    TEST_ASSERT_EQ(1, ready.compilable_lanes[0]);

    // Compiling is the only thing the player may do
    std::vector<AIAction> legal = engine.get_legal_actions(ready);
    TEST_ASSERT_EQ(1u, legal.size());
    TEST_ASSERT(legal[0] == AIAction::compile_lane(PLAYER, 1));
    TEST_ASSERT(engine.step(ready, AIAction::fill_hand(PLAYER)).error == IllegalIntent::WRONG_PHASE);

    StepResult done = engine.step(ready, legal[0]);
    TEST_ASSERT_TRUE(done.ok);
    TEST_ASSERT_TRUE(done.state.players[PLAYER].compiled[1]);
    TEST_ASSERT_EQ(0, done.state.players[PLAYER].board.lane_size(1));
    TEST_ASSERT_EQ(0, done.state.players[OPPONENT].board.lane_size(1));
    TEST_ASSERT_EQ(5, done.state.players[PLAYER].discard.count());
    TEST_ASSERT_EQ(3, done.state.players[OPPONENT].discard.count());
}

TEST(Scenario, DrawOverLimitForcesDiscard) {
    CompileEngine engine;
    GameState state = standard_game(engine);
    CardID speed1 = give(state, PLAYER, "Speed", 1);
    for (int value = 0; value < 4; value++) {
        give(state, PLAYER, "Life", value);
    }

    StepResult played = engine.step(state, AIAction::play_card(PLAYER, speed1, 0, true));
    TEST_ASSERT_TRUE(played.ok);
    const GameState& limit = played.state;
    TEST_ASSERT_EQ(6, limit.players[PLAYER].hand.count());
    TEST_ASSERT(limit.phase == Phase::HAND_LIMIT);
    TEST_ASSERT(pending_is<DiscardAction>(limit));
    TEST_ASSERT_EQ(1, pending_as<DiscardAction>(limit).count);
    TEST_ASSERT(engine.step(limit, AIAction::skip(PLAYER)).error == IllegalIntent::NOT_OPTIONAL);

    const auto& hand = limit.players[PLAYER].hand.cards;
    StepResult too_many = engine.step(limit, AIAction::discard_cards(PLAYER, {hand[0].id, hand[1].id}));
    TEST_ASSERT(too_many.error == IllegalIntent::INVALID_SELECTION);
    TEST_ASSERT(too_many.state.phase == Phase::HAND_LIMIT);

    // Speed-1 draws again once the cache is cleared
    StepResult cleared = engine.step(limit, AIAction::discard_cards(PLAYER, {hand[0].id}));
    TEST_ASSERT_TRUE(cleared.ok);
    TEST_ASSERT_EQ(6, cleared.state.players[PLAYER].hand.count());
    TEST_ASSERT_EQ(1, cleared.state.players[PLAYER].discard.count());
    TEST_ASSERT_EQ(1, static_cast<int>(cleared.state.turn));
}

TEST(Scenario, PlagueZeroLocksLine) {
    CompileEngine engine;
    GameState state = blank_game(engine, {"Speed", "Life", "Water"}, {"Plague", "Death", "Hate"});
    place(engine, state, OPPONENT, 0, "Plague", 0, true);
    CardID speed3 = give(state, PLAYER, "Speed", 3);

    LanePlayability any = engine.get_lane_playability(state, PLAYER, 0);
    TEST_ASSERT_FALSE(any.is_playable);
    TEST_ASSERT_FALSE(any.face_up_allowed);
    TEST_ASSERT_FALSE(any.face_down_allowed);
    TEST_ASSERT_FALSE(engine.get_lane_playability(state, PLAYER, 0, speed3).is_playable);
    TEST_ASSERT_TRUE(engine.get_lane_playability(state, PLAYER, 1, speed3).is_playable);
    TEST_ASSERT(engine.play_card(state, speed3, 0, false).error == IllegalIntent::PLAY_NOT_ALLOWED);
    for (const auto& action : engine.get_legal_actions(state)) {
        if (action.action_type == ActionType::PLAY_CARD) {
            TEST_ASSERT_NE(0, *action.lane);
        }
    }

    // Covered, the bottom box stops applying
    place(engine, state, OPPONENT, 0, "Death", 5, false);
    TEST_ASSERT_TRUE(engine.get_lane_playability(state, PLAYER, 0, speed3).is_playable);
}

TEST(Scenario, HardTakesCompileSetup) {
    CompileEngine engine;
    GameState state = standard_game(engine);
    place(engine, state, PLAYER, 0, "Life", 0, false);
    place(engine, state, PLAYER, 0, "Life", 1, false);
    place(engine, state, PLAYER, 0, "Life", 2, false);
    CardID speed4 = give(state, PLAYER, "Speed", 4);
    give(state, PLAYER, "Water", 0);
    TEST_ASSERT_EQ(6, state.players[PLAYER].lane_values[0]);

    AIAction chosen = ai::run_turn(engine, state, Difficulty::HARD);
    TEST_ASSERT(chosen == AIAction::play_card(PLAYER, speed4, 0, true));

    // The setup outscores every other candidate
    std::vector<ai::ScoredAction> scored = ai::hard_score_turn(engine, state);
    double setup_score = 0.0;
    double best_other = -1000.0;
    for (const auto& candidate : scored) {
        if (candidate.action == chosen) {
            setup_score = candidate.score;
        } else if (candidate.score > best_other) {
            best_other = candidate.score;
        }
    }
    TEST_ASSERT(setup_score >= 200.0);
    TEST_ASSERT(setup_score > best_other);

    StepResult result = engine.step(state, chosen);
    TEST_ASSERT_TRUE(result.ok);
    TEST_ASSERT_EQ(10, result.state.players[PLAYER].lane_values[0]);
}
