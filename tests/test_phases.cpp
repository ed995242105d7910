/**
 * Tests for the turn phases: start and end effects, check cache, turn end
 */

#include "test_helpers.hpp"

using namespace compile;
using namespace compile::test_support;

namespace {

// Opponent refreshes and passes the turn, so the player's start phase runs
StepResult pass_to_player(const CompileEngine& engine, const GameState& state) {
    return engine.fill_hand(state, OPPONENT);
}

} // anonymous namespace

// ============================================================================
// START PHASE TESTS
// ============================================================================

TEST(StartPhase, DeathOneCanBeDeclined) {
    CompileEngine engine;
    GameState state = blank_game(engine, {"Death", "Speed", "Life"}, {"Metal", "Fire", "Hate"}, OPPONENT);
    CardID death1 = place(engine, state, PLAYER, 0, "Death", 1, true);
    place(engine, state, OPPONENT, 2, "Metal", 5, true);

    StepResult start = pass_to_player(engine, state);
    TEST_ASSERT_TRUE(start.ok);
    TEST_ASSERT_EQ(0, static_cast<int>(start.state.turn));
    TEST_ASSERT(start.state.phase == Phase::START);
    TEST_ASSERT(pending_is<PromptOptionalEffect>(start.state));
    TEST_ASSERT_EQ(death1, pending_as<PromptOptionalEffect>(start.state).source_card_id);
    TEST_ASSERT_EQ(2u, engine.get_legal_actions(start.state).size());

    StepResult declined = engine.resolve_prompt(start.state, false);
    TEST_ASSERT_TRUE(declined.ok);
    TEST_ASSERT(declined.state.phase == Phase::ACTION);
    TEST_ASSERT_EQ(death1, declined.state.players[PLAYER].board.top(0)->id);
    TEST_ASSERT_EQ(0, declined.state.players[PLAYER].hand.count());
    TEST_ASSERT_EQ(1, declined.state.players[OPPONENT].board.lane_size(2));
}

TEST(StartPhase, DeathOneTradesItselfForDeletion) {
    CompileEngine engine;
    GameState state = blank_game(engine, {"Death", "Speed", "Life"}, {"Metal", "Fire", "Hate"}, OPPONENT);
    CardID death1 = place(engine, state, PLAYER, 0, "Death", 1, true);
    CardID metal5 = place(engine, state, OPPONENT, 2, "Metal", 5, true);

    StepResult start = pass_to_player(engine, state);
    StepResult accepted = engine.resolve_prompt(start.state, true);
    TEST_ASSERT_TRUE(accepted.ok);

    // Only one other card on the board: deleted without asking
    const GameState& after = accepted.state;
    TEST_ASSERT(after.phase == Phase::ACTION);
    TEST_ASSERT_EQ(1, after.players[PLAYER].hand.count());
    TEST_ASSERT_TRUE(after.players[OPPONENT].discard.contains(metal5));
    TEST_ASSERT_TRUE(after.players[PLAYER].discard.contains(death1));
    TEST_ASSERT_EQ(0, after.players[PLAYER].board.lane_size(0));
    TEST_ASSERT_EQ(2, after.players[PLAYER].stats.cards_deleted);
    TEST_ASSERT_TRUE(engine.check_invariants(after).empty());
}

TEST(StartPhase, TurnPlayerOrdersEffects) {
    CompileEngine engine;
    GameState state = blank_game(engine, {"Death", "Spirit", "Life"}, {"Metal", "Fire", "Hate"}, OPPONENT);
    CardID death1 = place(engine, state, PLAYER, 0, "Death", 1, true);
    CardID spirit1 = place(engine, state, PLAYER, 1, "Spirit", 1, true);

    StepResult start = pass_to_player(engine, state);
    TEST_ASSERT(pending_is<SelectEffectToResolve>(start.state));
    const SelectEffectToResolve& order = pending_as<SelectEffectToResolve>(start.state);
    TEST_ASSERT_EQ(2u, order.candidates.size());
    TEST_ASSERT_FALSE(order.optional);
    TEST_ASSERT_EQ(2u, engine.get_legal_actions(start.state).size());
    TEST_ASSERT_TRUE(engine.is_card_targetable(start.state, spirit1));

    StepResult wrong = engine.resolve_action_with_card(start.state, "p1_0");
    TEST_ASSERT(wrong.error == IllegalIntent::UNTARGETABLE);

    // Spirit-1 first: discard or flip itself
    StepResult spirit = engine.resolve_action_with_card(start.state, spirit1);
    TEST_ASSERT_TRUE(spirit.ok);
    TEST_ASSERT(pending_is<PromptChoice>(spirit.state));
    TEST_ASSERT_EQ(2u, pending_as<PromptChoice>(spirit.state).options.size());
    TEST_ASSERT_EQ(2u, engine.get_legal_actions(spirit.state).size());
    TEST_ASSERT(engine.resolve_choice(spirit.state, 2).error == IllegalIntent::INVALID_SELECTION);

    StepResult flipped = engine.resolve_choice(spirit.state, 1);
    TEST_ASSERT_TRUE(flipped.ok);
    TEST_ASSERT_FALSE(flipped.state.players[PLAYER].board.top(1)->face_up);

    // The remaining start effect runs without another ordering prompt
    TEST_ASSERT(pending_is<PromptOptionalEffect>(flipped.state));
    TEST_ASSERT_EQ(death1, pending_as<PromptOptionalEffect>(flipped.state).source_card_id);
    StepResult done = engine.resolve_prompt(flipped.state, false);
    TEST_ASSERT(done.state.phase == Phase::ACTION);
}

TEST(EndPhase, CoveredBottomEffectDoesNotRun) {
    CompileEngine engine;
    GameState state = blank_game(engine, {"Plague", "Speed", "Life"}, {"Metal", "Fire", "Hate"}, OPPONENT);
    place(engine, state, PLAYER, 0, "Plague", 4, true);
    place(engine, state, PLAYER, 0, "Life", 0, false);
    place(engine, state, OPPONENT, 1, "Metal", 5, false);

    // Plague-4 is an end effect, and covered: the player's whole turn is quiet
    StepResult start = pass_to_player(engine, state);
    TEST_ASSERT(start.state.phase == Phase::ACTION);
    StepResult ended = engine.fill_hand(start.state);
    TEST_ASSERT_TRUE(ended.ok);
    TEST_ASSERT_EQ(1, static_cast<int>(ended.state.turn));
    TEST_ASSERT_EQ(1, ended.state.players[OPPONENT].board.lane_size(1));
}

// ============================================================================
// CHECK CACHE TESTS
// ============================================================================

TEST(CheckCache, DiscardDownToHandLimit) {
    CompileEngine engine;
    GameState state = standard_game(engine);
    for (int value = 0; value <= 5; value++) {
        give(state, PLAYER, "Speed", value);
    }
    CardID life0 = give(state, PLAYER, "Life", 0);
    CardID speed5 = find_card_id(state, PLAYER, "Speed", 5);
    CardID speed4 = find_card_id(state, PLAYER, "Speed", 4);

    StepResult played = engine.play_card(state, life0, 0, false);
    TEST_ASSERT_TRUE(played.ok);
    TEST_ASSERT(played.state.phase == Phase::HAND_LIMIT);
    TEST_ASSERT(pending_is<DiscardAction>(played.state));
    const DiscardAction& discard = pending_as<DiscardAction>(played.state);
    TEST_ASSERT_EQ(1, discard.count);
    TEST_ASSERT(discard.purpose == DiscardPurpose::HAND_LIMIT);
    TEST_ASSERT_FALSE(discard.optional);
    TEST_ASSERT_EQ(6u, engine.get_legal_actions(played.state).size());

    TEST_ASSERT(engine.skip_action(played.state).error == IllegalIntent::NOT_OPTIONAL);
    TEST_ASSERT(engine.resolve_discard(played.state, {speed5, speed4}).error == IllegalIntent::INVALID_SELECTION);
    TEST_ASSERT(engine.resolve_discard(played.state, {life0}).error == IllegalIntent::CARD_NOT_FOUND);

    StepResult done = engine.resolve_discard(played.state, {speed5});
    TEST_ASSERT_TRUE(done.ok);
    TEST_ASSERT_EQ(5, done.state.players[PLAYER].hand.count());
    TEST_ASSERT_TRUE(done.state.players[PLAYER].discard.contains(speed5));
    TEST_ASSERT_EQ(1, done.state.players[PLAYER].stats.cards_discarded);
    TEST_ASSERT_EQ(1, static_cast<int>(done.state.turn));
}

TEST(CheckCache, AtLimitNeedsNoDiscard) {
    CompileEngine engine;
    GameState state = standard_game(engine);
    for (int value = 0; value <= 5; value++) {
        give(state, PLAYER, "Speed", value);
    }
    CardID speed0 = find_card_id(state, PLAYER, "Speed", 0);

    StepResult played = engine.play_card(state, speed0, 0, false);
    TEST_ASSERT_TRUE(played.ok);
    TEST_ASSERT_FALSE(played.state.has_pending_action());
    TEST_ASSERT_EQ(5, played.state.players[PLAYER].hand.count());
    TEST_ASSERT_EQ(1, static_cast<int>(played.state.turn));
}

TEST(CheckCache, SpiritZeroSkipsDiscard) {
    CompileEngine engine;
    GameState state = blank_game(engine, {"Spirit", "Speed", "Life"}, {"Metal", "Fire", "Hate"});
    place(engine, state, PLAYER, 0, "Spirit", 0, true);
    for (int value = 0; value <= 5; value++) {
        give(state, PLAYER, "Speed", value);
    }
    CardID life0 = give(state, PLAYER, "Life", 0);

    StepResult played = engine.play_card(state, life0, 1, false);
    TEST_ASSERT_TRUE(played.ok);
    TEST_ASSERT_FALSE(played.state.has_pending_action());
    TEST_ASSERT_EQ(6, played.state.players[PLAYER].hand.count());
    TEST_ASSERT_EQ(1, static_cast<int>(played.state.turn));
}

// ============================================================================
// END PHASE TESTS
// ============================================================================

TEST(EndPhase, PlagueFourMakesOpponentDelete) {
    CompileEngine engine;
    GameState state = blank_game(engine, {"Plague", "Speed", "Life"}, {"Metal", "Fire", "Hate"});
    CardID plague4 = place(engine, state, PLAYER, 0, "Plague", 4, true);
    CardID metal5 = place(engine, state, OPPONENT, 1, "Metal", 5, false);
    CardID fire5 = place(engine, state, OPPONENT, 2, "Fire", 5, false);
    place(engine, state, OPPONENT, 0, "Hate", 5, true);

    StepResult filled = engine.fill_hand(state);
    TEST_ASSERT_TRUE(filled.ok);
    TEST_ASSERT(filled.state.phase == Phase::END);
    TEST_ASSERT(pending_is<SelectCardToDelete>(filled.state));
    TEST_ASSERT_EQ(1, static_cast<int>(engine.expected_actor(filled.state)));

    std::vector<AIAction> legal = engine.get_legal_actions(filled.state);
    TEST_ASSERT_EQ(2u, legal.size());
    TEST_ASSERT(engine.resolve_action_with_card(filled.state, metal5, PLAYER).error
                == IllegalIntent::WRONG_ACTOR);

    StepResult deleted = engine.resolve_action_with_card(filled.state, fire5, OPPONENT);
    TEST_ASSERT_TRUE(deleted.ok);
    TEST_ASSERT_TRUE(deleted.state.players[OPPONENT].discard.contains(fire5));

    // Then the owner may flip Plague-4
    TEST_ASSERT(pending_is<PromptOptionalEffect>(deleted.state));
    TEST_ASSERT_EQ(0, static_cast<int>(engine.expected_actor(deleted.state)));
    StepResult accepted = engine.resolve_prompt(deleted.state, true);
    TEST_ASSERT_TRUE(accepted.ok);
    const PlayedCard* top = accepted.state.players[PLAYER].board.top(0);
    TEST_ASSERT_EQ(plague4, top->id);
    TEST_ASSERT_FALSE(top->face_up);
    TEST_ASSERT_EQ(1, static_cast<int>(accepted.state.turn));
    TEST_ASSERT(accepted.state.phase == Phase::ACTION);
}

TEST(EndPhase, SpeedThreeFlipsAfterShift) {
    CompileEngine engine;
    GameState state = standard_game(engine);
    CardID life0 = place(engine, state, PLAYER, 0, "Life", 0, false);
    CardID speed3 = place(engine, state, PLAYER, 1, "Speed", 3, true);

    StepResult filled = engine.fill_hand(state);
    TEST_ASSERT(pending_is<SelectCardToShift>(filled.state));
    TEST_ASSERT_TRUE(pending_as<SelectCardToShift>(filled.state).optional);
    TEST_ASSERT_EQ(3u, engine.get_legal_actions(filled.state).size());

    StepResult chosen = engine.resolve_action_with_card(filled.state, life0);
    TEST_ASSERT(pending_is<SelectLaneForShift>(chosen.state));
    TEST_ASSERT_EQ(0, pending_as<SelectLaneForShift>(chosen.state).from_lane);

    StepResult shifted = engine.resolve_action_with_lane(chosen.state, 2);
    TEST_ASSERT_TRUE(shifted.ok);
    TEST_ASSERT_EQ(life0, shifted.state.players[PLAYER].board.top(2)->id);
    TEST_ASSERT_EQ(speed3, shifted.state.players[PLAYER].board.top(1)->id);
    TEST_ASSERT_FALSE(shifted.state.players[PLAYER].board.top(1)->face_up);
    TEST_ASSERT_EQ(1, static_cast<int>(shifted.state.turn));
}

TEST(EndPhase, SpeedThreeSkipKeepsFaceUp) {
    CompileEngine engine;
    GameState state = standard_game(engine);
    place(engine, state, PLAYER, 0, "Life", 0, false);
    place(engine, state, PLAYER, 1, "Speed", 3, true);

    StepResult filled = engine.fill_hand(state);
    StepResult skipped = engine.skip_action(filled.state);
    TEST_ASSERT_TRUE(skipped.ok);
    TEST_ASSERT_TRUE(skipped.state.players[PLAYER].board.top(1)->face_up);
    TEST_ASSERT_EQ(1, static_cast<int>(skipped.state.turn));
}

// ============================================================================
// TURN END TESTS
// ============================================================================

TEST(TurnEnd, FillHandPassesTurn) {
    CompileEngine engine;
    GameState state = standard_game(engine);
    state.players[PLAYER].cannot_compile = true;

    StepResult filled = engine.fill_hand(state);
    TEST_ASSERT_TRUE(filled.ok);
    const GameState& after = filled.state;
    TEST_ASSERT_EQ(5, after.players[PLAYER].hand.count());
    TEST_ASSERT_EQ(1, after.players[PLAYER].stats.hands_refreshed);
    TEST_ASSERT_FALSE(after.players[PLAYER].cannot_compile);
    TEST_ASSERT_EQ(1, static_cast<int>(after.turn));
    TEST_ASSERT(after.phase == Phase::ACTION);
    TEST_ASSERT_FALSE(after.action_taken);
    TEST_ASSERT_TRUE(after.processed_end_ids.empty());
    TEST_ASSERT(engine.fill_hand(after, PLAYER).error == IllegalIntent::WRONG_ACTOR);
    TEST_ASSERT_TRUE(engine.fill_hand(after, OPPONENT).ok);
}

TEST(TurnEnd, FullHandStillRefreshes) {
    CompileEngine engine;
    GameState state = standard_game(engine);
    for (int value = 0; value < 5; value++) {
        give(state, PLAYER, "Water", value);
    }
    int deck = state.players[PLAYER].deck.count();

    StepResult filled = engine.fill_hand(state);
    TEST_ASSERT_TRUE(filled.ok);
    TEST_ASSERT_EQ(5, filled.state.players[PLAYER].hand.count());
    TEST_ASSERT_EQ(deck, filled.state.players[PLAYER].deck.count());
    TEST_ASSERT_EQ(1, static_cast<int>(filled.state.turn));
}
