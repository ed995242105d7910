/**
 * Tests for the action stack: interrupts, suspended programs, committed
 * plays, legal intents and illegal intent rejection
 */

#include "test_helpers.hpp"

using namespace compile;
using namespace compile::test_support;

// ============================================================================
// INTERRUPT TESTS
// ============================================================================

TEST(ActionStack, CrossPlayerInterrupt) {
    CompileEngine engine;
    GameState state = standard_game(engine, OPPONENT);
    CardID speed0 = place(engine, state, PLAYER, 0, "Speed", 0, false);
    CardID life4 = give(state, PLAYER, "Life", 4);
    CardID metal0 = give(state, OPPONENT, "Metal", 0);

    StepResult played = engine.play_card(state, metal0, 0, true, OPPONENT);
    TEST_ASSERT_TRUE(played.ok);
    TEST_ASSERT(pending_is<SelectCardToFlip>(played.state));
    TEST_ASSERT_EQ(1, static_cast<int>(engine.expected_actor(played.state)));
    TEST_ASSERT_TRUE(engine.is_card_targetable(played.state, speed0));
    TEST_ASSERT_TRUE(engine.is_card_targetable(played.state, metal0));
    TEST_ASSERT_FALSE(engine.is_card_targetable(played.state, life4));

    // Flipping Speed-0 face-up hands the decision to its owner
    StepResult flipped = engine.resolve_action_with_card(played.state, speed0, OPPONENT);
    TEST_ASSERT_TRUE(flipped.ok);
    TEST_ASSERT(pending_is<SelectHandCardToPlay>(flipped.state));
    TEST_ASSERT_EQ(1, static_cast<int>(flipped.state.turn));
    TEST_ASSERT_EQ(0, static_cast<int>(engine.expected_actor(flipped.state)));

    StepResult wrong = engine.resolve_hand_play(flipped.state, life4, 1, false, OPPONENT);
    TEST_ASSERT_FALSE(wrong.ok);
    TEST_ASSERT(wrong.error == IllegalIntent::WRONG_ACTOR);

    StepResult answered = engine.resolve_hand_play(flipped.state, life4, 1, false, PLAYER);
    TEST_ASSERT_TRUE(answered.ok);
    const GameState& after = answered.state;
    TEST_ASSERT_EQ(0, static_cast<int>(after.turn));
    TEST_ASSERT(after.phase == Phase::ACTION);
    TEST_ASSERT_FALSE(after.has_pending_action());
    TEST_ASSERT_TRUE(after.players[PLAYER].board.find_card(speed0)->face_up);
    TEST_ASSERT_EQ(life4, after.players[PLAYER].board.top(1)->id);
    TEST_ASSERT_TRUE(engine.check_invariants(after).empty());
}

TEST(ActionStack, SuspendedProgramResumesAfterTrigger) {
    CompileEngine engine;
    GameState state = standard_game(engine);
    CardID speed0 = place(engine, state, PLAYER, 0, "Speed", 0, false);
    place(engine, state, OPPONENT, 2, "Metal", 3, true);
    CardID life1 = give(state, PLAYER, "Life", 1);
    CardID water4 = give(state, PLAYER, "Water", 4);

    StepResult played = engine.play_card(state, life1, 1, true);
    TEST_ASSERT(pending_is<SelectCardToFlip>(played.state));
    TEST_ASSERT_EQ(0, pending_as<SelectCardToFlip>(played.state).ctx.pc);

    StepResult flipped = engine.resolve_action_with_card(played.state, speed0);
    TEST_ASSERT(pending_is<SelectHandCardToPlay>(flipped.state));
    TEST_ASSERT_EQ(speed0, action_base(*flipped.state.action_required).source_card_id);
    TEST_ASSERT_EQ(1u, flipped.state.interrupt_stack.size());

    // Speed-0 finishes, then Life-1 asks for its second flip
    StepResult placed = engine.resolve_hand_play(flipped.state, water4, 2, false);
    TEST_ASSERT_TRUE(placed.ok);
    TEST_ASSERT(pending_is<SelectCardToFlip>(placed.state));
    const SelectCardToFlip& second = pending_as<SelectCardToFlip>(placed.state);
    TEST_ASSERT_EQ(life1, second.source_card_id);
    TEST_ASSERT_EQ(1, second.ctx.pc);
    TEST_ASSERT_TRUE(placed.state.interrupt_stack.empty());
    TEST_ASSERT_EQ(4u, engine.get_legal_actions(placed.state).size());
}

TEST(ActionStack, OnCoverResolvesBeforeCardLands) {
    CompileEngine engine;
    GameState state = blank_game(engine, {"Fire", "Life", "Water"}, {"Metal", "Death", "Hate"});
    CardID fire0 = place(engine, state, PLAYER, 0, "Fire", 0, true);
    CardID metal3 = place(engine, state, OPPONENT, 1, "Metal", 3, true);
    place(engine, state, OPPONENT, 2, "Death", 4, true);
    CardID life2 = give(state, PLAYER, "Life", 2);

    StepResult played = engine.play_card(state, life2, 0, false);
    TEST_ASSERT_TRUE(played.ok);
    const GameState& waiting = played.state;

    // Fire-0 drew first and now wants a flip; Life-2 is held aside
    TEST_ASSERT(pending_is<SelectCardToFlip>(waiting));
    TEST_ASSERT_EQ(fire0, pending_as<SelectCardToFlip>(waiting).source_card_id);
    TEST_ASSERT_TRUE(waiting.committed.has_value());
    TEST_ASSERT_EQ(life2, waiting.committed->card.id);
    TEST_ASSERT_EQ(1, waiting.players[PLAYER].board.lane_size(0));
    TEST_ASSERT_EQ(1, waiting.players[PLAYER].hand.count());
    TEST_ASSERT_TRUE(engine.check_invariants(waiting).empty());

    StepResult landed = engine.resolve_action_with_card(waiting, metal3);
    TEST_ASSERT_TRUE(landed.ok);
    const GameState& after = landed.state;
    TEST_ASSERT_FALSE(after.committed.has_value());
    TEST_ASSERT_FALSE(after.players[OPPONENT].board.find_card(metal3)->face_up);
    TEST_ASSERT_EQ(2, after.players[PLAYER].board.lane_size(0));
    TEST_ASSERT_EQ(life2, after.players[PLAYER].board.top(0)->id);
    TEST_ASSERT_FALSE(after.players[PLAYER].board.top(0)->face_up);
    TEST_ASSERT_EQ(1, after.players[PLAYER].hand.count());
}

TEST(ActionStack, OptionalTargetCanBeSkipped) {
    CompileEngine engine;
    GameState state = standard_game(engine);
    CardID down = place(engine, state, OPPONENT, 0, "Metal", 3, false);
    CardID life2 = give(state, PLAYER, "Life", 2);

    StepResult played = engine.play_card(state, life2, 1, true);
    TEST_ASSERT(pending_is<SelectCardToFlip>(played.state));
    TEST_ASSERT_TRUE(pending_as<SelectCardToFlip>(played.state).optional);
    TEST_ASSERT_EQ(1, played.state.players[PLAYER].hand.count());

    std::vector<AIAction> legal = engine.get_legal_actions(played.state);
    TEST_ASSERT_EQ(2u, legal.size());
    TEST_ASSERT(legal[0] == AIAction::select_card(PLAYER, down));
    TEST_ASSERT(legal[1] == AIAction::skip(PLAYER));

    StepResult skipped = engine.skip_action(played.state, PLAYER);
    TEST_ASSERT_TRUE(skipped.ok);
    TEST_ASSERT_FALSE(skipped.state.players[OPPONENT].board.find_card(down)->face_up);
    TEST_ASSERT_EQ(1, static_cast<int>(skipped.state.turn));
}

TEST(ActionStack, SuspendedDiscardShrinksWithHand) {
    CompileEngine engine;
    GameState state = standard_game(engine);
    CardID first = give(state, PLAYER, "Life", 1);
    CardID second = give(state, PLAYER, "Life", 2);

    DiscardAction waiting;
    waiting.from_effect = false;
    waiting.count = 2;
    state.push_interrupt(waiting);
    DiscardAction active;
    active.from_effect = false;
    active.count = 1;
    state.issue(active);

    StepResult one_left = engine.resolve_discard(state, {first}, PLAYER);
    TEST_ASSERT_TRUE(one_left.ok);
    TEST_ASSERT(pending_is<DiscardAction>(one_left.state));
    TEST_ASSERT_EQ(1, pending_as<DiscardAction>(one_left.state).count);

    std::vector<AIAction> legal = engine.get_legal_actions(one_left.state);
    TEST_ASSERT_EQ(1u, legal.size());
    StepResult done = engine.step(one_left.state, legal[0]);
    TEST_ASSERT_TRUE(done.ok);
    TEST_ASSERT_TRUE(done.state.players[PLAYER].discard.contains(second));
    TEST_ASSERT_TRUE(done.state.players[PLAYER].hand.is_empty());
}

// ============================================================================
// ILLEGAL INTENT TESTS
// ============================================================================

TEST(IllegalIntent, TurnActionChecks) {
    CompileEngine engine;
    GameState state = standard_game(engine);
    CardID life4 = give(state, PLAYER, "Life", 4);
    CardID metal1 = give(state, OPPONENT, "Metal", 1);

    StepResult wrong_actor = engine.fill_hand(state, OPPONENT);
    TEST_ASSERT_FALSE(wrong_actor.ok);
    TEST_ASSERT(wrong_actor.error == IllegalIntent::WRONG_ACTOR);

    StepResult bad_lane = engine.play_card(state, life4, 3, false);
    TEST_ASSERT(bad_lane.error == IllegalIntent::INVALID_LANE);

    StepResult not_in_hand = engine.play_card(state, metal1, 0, false);
    TEST_ASSERT(not_in_hand.error == IllegalIntent::CARD_NOT_FOUND);

    StepResult mismatch = engine.play_card(state, life4, 0, true);
    TEST_ASSERT(mismatch.error == IllegalIntent::PLAY_NOT_ALLOWED);
    TEST_ASSERT_FALSE(mismatch.message.empty());

    StepResult not_compile = engine.compile_lane(state, 0);
    TEST_ASSERT(not_compile.error == IllegalIntent::WRONG_PHASE);

    GameState acted = state;
    acted.action_taken = true;
    StepResult again = engine.fill_hand(acted);
    TEST_ASSERT(again.error == IllegalIntent::ALREADY_ACTED);
}

TEST(IllegalIntent, ResolveChecks) {
    CompileEngine engine;
    GameState state = standard_game(engine);

    StepResult nothing = engine.resolve_prompt(state, true);
    TEST_ASSERT(nothing.error == IllegalIntent::NO_ACTION_PENDING);
    TEST_ASSERT(engine.skip_action(state).error == IllegalIntent::NO_ACTION_PENDING);

    CardID target = place(engine, state, OPPONENT, 0, "Death", 3, true);
    place(engine, state, OPPONENT, 2, "Hate", 4, true);
    CardID life1 = give(state, PLAYER, "Life", 1);
    CardID spare = give(state, PLAYER, "Water", 1);
    GameState pending = engine.play_card(state, life1, 1, true).state;
    TEST_ASSERT(pending_is<SelectCardToFlip>(pending));

    TEST_ASSERT(engine.resolve_action_with_card(pending, target, OPPONENT).error == IllegalIntent::WRONG_ACTOR);
    TEST_ASSERT(engine.resolve_action_with_lane(pending, 0).error == IllegalIntent::ACTION_TYPE_MISMATCH);
    TEST_ASSERT(engine.resolve_discard(pending, {spare}).error == IllegalIntent::ACTION_TYPE_MISMATCH);
    TEST_ASSERT(engine.resolve_action_with_card(pending, spare).error == IllegalIntent::CARD_NOT_FOUND);
    TEST_ASSERT(engine.skip_action(pending).error == IllegalIntent::NOT_OPTIONAL);
    TEST_ASSERT(engine.fill_hand(pending).error == IllegalIntent::ACTION_PENDING);
    TEST_ASSERT(engine.play_card(pending, spare, 2, true).error == IllegalIntent::ACTION_PENDING);
}

TEST(IllegalIntent, RejectionLeavesStateUntouched) {
    CompileEngine engine;
    GameState state = standard_game(engine);
    CardID life4 = give(state, PLAYER, "Life", 4);

    StepResult rejected = engine.play_card(state, life4, 0, true);
    TEST_ASSERT_FALSE(rejected.ok);
    TEST_ASSERT_TRUE(rejected.events.empty());
    TEST_ASSERT_TRUE(rejected.state.players[PLAYER].hand.contains(life4));
    TEST_ASSERT_EQ(state.log.size(), rejected.state.log.size());
    TEST_ASSERT(rejected.state.phase == state.phase);
    TEST_ASSERT_FALSE(rejected.state.action_taken);
}

TEST(IllegalIntent, IncompleteGenericIntent) {
    CompileEngine engine;
    GameState state = standard_game(engine);

    AIAction missing_card(ActionType::PLAY_CARD, PLAYER);
    missing_card.lane = 0;
    StepResult result = engine.step(state, missing_card);
    TEST_ASSERT_FALSE(result.ok);
    TEST_ASSERT(result.error == IllegalIntent::INVALID_SELECTION);

    AIAction missing_lane(ActionType::COMPILE, PLAYER);
    TEST_ASSERT(engine.step(state, missing_lane).error == IllegalIntent::INVALID_SELECTION);
}

// ============================================================================
// LEGAL ACTION TESTS
// ============================================================================

TEST(LegalActions, ActionPhasePlaysAndFill) {
    CompileEngine engine;
    GameState state = standard_game(engine);
    CardID life4 = give(state, PLAYER, "Life", 4);

    std::vector<AIAction> legal = engine.get_legal_actions(state);
    TEST_ASSERT_EQ(5u, legal.size());
    TEST_ASSERT(legal.back() == AIAction::fill_hand(PLAYER));

    int face_up = 0;
    for (const auto& action : legal) {
        if (action.action_type == ActionType::PLAY_CARD && action.face_up) {
            face_up++;
            TEST_ASSERT(action == AIAction::play_card(PLAYER, life4, 1, true));
        }
    }
    TEST_ASSERT_EQ(1, face_up);

    // Every listed intent is accepted
    for (const auto& action : legal) {
        TEST_ASSERT_TRUE(engine.step(state, action).ok);
    }
}

TEST(LegalActions, EmptyHandStillFills) {
    CompileEngine engine;
    GameState state = standard_game(engine);

    std::vector<AIAction> legal = engine.get_legal_actions(state);
    TEST_ASSERT_EQ(1u, legal.size());

    StepResult filled = engine.step(state, legal[0]);
    TEST_ASSERT_TRUE(filled.ok);
    TEST_ASSERT_EQ(5, filled.state.players[PLAYER].hand.count());
    TEST_ASSERT_EQ(1, filled.state.players[PLAYER].stats.hands_refreshed);
}

TEST(LegalActions, DiscardSubsetsForOtherPlayer) {
    CompileEngine engine;
    GameState state = blank_game(engine, {"Speed", "Life", "Water"}, {"Plague", "Death", "Hate"}, OPPONENT);
    give(state, PLAYER, "Speed", 1);
    give(state, PLAYER, "Life", 2);
    CardID water = give(state, PLAYER, "Water", 3);
    CardID plague0 = give(state, OPPONENT, "Plague", 0);

    StepResult played = engine.play_card(state, plague0, 0, true);
    TEST_ASSERT(pending_is<DiscardAction>(played.state));
    const DiscardAction& discard = pending_as<DiscardAction>(played.state);
    TEST_ASSERT_EQ(0, static_cast<int>(discard.actor));
    TEST_ASSERT_EQ(1, discard.count);
    TEST_ASSERT(discard.purpose == DiscardPurpose::EFFECT);

    std::vector<AIAction> legal = engine.get_legal_actions(played.state);
    TEST_ASSERT_EQ(3u, legal.size());
    for (const auto& action : legal) {
        TEST_ASSERT(action.action_type == ActionType::DISCARD_CARDS);
        TEST_ASSERT_EQ(1u, action.card_ids.size());
    }

    StepResult done = engine.resolve_discard(played.state, {water}, PLAYER);
    TEST_ASSERT_TRUE(done.ok);
    TEST_ASSERT_TRUE(done.state.players[PLAYER].discard.contains(water));
    TEST_ASSERT_EQ(1, done.state.players[PLAYER].stats.cards_discarded);
}

TEST(LegalActions, RearrangeListsEveryOrder) {
    CompileEngine engine;
    GameState state = standard_game(engine);
    CardID water2 = give(state, PLAYER, "Water", 2);

    StepResult played = engine.play_card(state, water2, 2, true);
    TEST_ASSERT(pending_is<RearrangeProtocols>(played.state));
    TEST_ASSERT_EQ(2, played.state.players[PLAYER].hand.count());

    std::vector<AIAction> legal = engine.get_legal_actions(played.state);
    TEST_ASSERT_EQ(6u, legal.size());

    StepResult bad = engine.resolve_rearrange(played.state, {"Water", "Water", "Life"});
    TEST_ASSERT(bad.error == IllegalIntent::INVALID_SELECTION);

    StepResult done = engine.resolve_rearrange(played.state, {"Water", "Speed", "Life"});
    TEST_ASSERT_TRUE(done.ok);
    TEST_ASSERT_EQ(std::string("Water"), done.state.players[PLAYER].protocols[0]);
    TEST_ASSERT_EQ(std::string("Life"), done.state.players[PLAYER].protocols[2]);
    // Cards stay where they are
    TEST_ASSERT_EQ(water2, done.state.players[PLAYER].board.top(2)->id);
}

TEST(LegalActions, SwapListsThreePairs) {
    CompileEngine engine;
    GameState state = blank_game(engine, {"Spirit", "Life", "Water"}, {"Metal", "Death", "Hate"});
    CardID spirit4 = give(state, PLAYER, "Spirit", 4);
    state.players[PLAYER].compiled[0] = true;

    StepResult played = engine.play_card(state, spirit4, 0, true);
    TEST_ASSERT(pending_is<SwapProtocols>(played.state));
    TEST_ASSERT_EQ(3u, engine.get_legal_actions(played.state).size());
    TEST_ASSERT(engine.resolve_swap(played.state, 1, 1).error == IllegalIntent::INVALID_SELECTION);

    StepResult done = engine.resolve_swap(played.state, 0, 2);
    TEST_ASSERT_TRUE(done.ok);
    const PlayerState& player = done.state.players[PLAYER];
    TEST_ASSERT_EQ(std::string("Water"), player.protocols[0]);
    TEST_ASSERT_EQ(std::string("Spirit"), player.protocols[2]);
    // Compiled status travels with the protocol
    TEST_ASSERT_FALSE(player.compiled[0]);
    TEST_ASSERT_TRUE(player.compiled[2]);
}

TEST(LegalActions, GameOverHasNone) {
    CompileEngine engine;
    GameState state = standard_game(engine);
    state.winner = OPPONENT;

    TEST_ASSERT_TRUE(engine.get_legal_actions(state).empty());
    TEST_ASSERT(engine.fill_hand(state).error == IllegalIntent::GAME_OVER);
    TEST_ASSERT(engine.resolve_prompt(state, false).error == IllegalIntent::GAME_OVER);
}
