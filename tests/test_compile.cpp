/**
 * Tests for compiling and the control mechanic
 */

#include "test_helpers.hpp"

using namespace compile;
using namespace compile::test_support;

namespace {

// Five face-down cards: value 10 in the lane
void stack_ten(const CompileEngine& engine, GameState& state, PlayerID owner, int lane,
               const std::string& protocol) {
    for (int value = 0; value < 5; value++) {
        place(engine, state, owner, lane, protocol, value, false);
    }
}

bool has_event(const std::vector<BoardEvent>& events, EventType type) {
    for (const auto& event : events) {
        if (event.type == type) return true;
    }
    return false;
}

} // anonymous namespace

// ============================================================================
// COMPILE TESTS
// ============================================================================

TEST(Compile, ClearsBothSidesOfLine) {
    CompileEngine engine;
    GameState state = standard_game(engine);
    place(engine, state, PLAYER, 0, "Speed", 4, true);
    place(engine, state, PLAYER, 0, "Speed", 3, true);
    place(engine, state, PLAYER, 0, "Speed", 0, false);
    place(engine, state, PLAYER, 0, "Speed", 1, false);
    CardID metal3 = place(engine, state, OPPONENT, 0, "Metal", 3, true);
    compile_phase(engine, state, PLAYER);
    TEST_ASSERT_EQ(11, state.players[PLAYER].lane_values[0]);
    TEST_ASSERT_EQ(1u, state.compilable_lanes.size());

    StepResult not_ready = engine.compile_lane(state, 1);
    TEST_ASSERT(not_ready.error == IllegalIntent::NOT_COMPILABLE);
    TEST_ASSERT(engine.compile_lane(state, 5).error == IllegalIntent::INVALID_LANE);
    TEST_ASSERT(engine.fill_hand(state).error == IllegalIntent::WRONG_PHASE);

    StepResult result = engine.compile_lane(state, 0);
    TEST_ASSERT_TRUE(result.ok);
    TEST_ASSERT_TRUE(has_event(result.events, EventType::COMPILE));
    TEST_ASSERT_TRUE(has_event(result.events, EventType::DELETE));

    const GameState& after = result.state;
    TEST_ASSERT_TRUE(after.players[PLAYER].compiled[0]);
    TEST_ASSERT_EQ(0, after.players[PLAYER].board.lane_size(0));
    TEST_ASSERT_EQ(0, after.players[OPPONENT].board.lane_size(0));
    TEST_ASSERT_EQ(4, after.players[PLAYER].discard.count());
    TEST_ASSERT_TRUE(after.players[OPPONENT].discard.contains(metal3));
    TEST_ASSERT_EQ(1, after.players[PLAYER].stats.compiles);

    // Compiling replaces the action: the turn passes straight on
    TEST_ASSERT_EQ(1, static_cast<int>(after.turn));
    TEST_ASSERT(after.phase == Phase::ACTION);
    TEST_ASSERT_TRUE(engine.check_invariants(after).empty());
}

TEST(Compile, LegalActionsListCompilableLanes) {
    CompileEngine engine;
    GameState state = standard_game(engine);
    stack_ten(engine, state, PLAYER, 0, "Life");
    stack_ten(engine, state, PLAYER, 2, "Speed");
    compile_phase(engine, state, PLAYER);

    std::vector<AIAction> legal = engine.get_legal_actions(state);
    TEST_ASSERT_EQ(2u, legal.size());
    TEST_ASSERT(legal[0] == AIAction::compile_lane(PLAYER, 0));
    TEST_ASSERT(legal[1] == AIAction::compile_lane(PLAYER, 2));
}

TEST(Compile, SpeedTwoSurvivesAndShifts) {
    CompileEngine engine;
    GameState state = standard_game(engine);
    CardID speed2 = place(engine, state, PLAYER, 0, "Speed", 2, true);
    for (int value = 0; value < 4; value++) {
        place(engine, state, PLAYER, 0, "Life", value, false);
    }
    compile_phase(engine, state, PLAYER);
    TEST_ASSERT_EQ(10, state.players[PLAYER].lane_values[0]);

    StepResult compiled = engine.compile_lane(state, 0);
    TEST_ASSERT_TRUE(compiled.ok);
    TEST_ASSERT(pending_is<SelectLaneForShift>(compiled.state));
    const SelectLaneForShift& shift = pending_as<SelectLaneForShift>(compiled.state);
    TEST_ASSERT_EQ(speed2, shift.card_id);
    TEST_ASSERT_FALSE(shift.optional);
    TEST_ASSERT_FALSE(shift.from_effect);
    TEST_ASSERT_EQ(2u, shift.allowed_lanes.size());
    TEST_ASSERT_EQ(4, compiled.state.players[PLAYER].discard.count());
    TEST_ASSERT(compiled.state.phase == Phase::HAND_LIMIT);

    StepResult shifted = engine.resolve_action_with_lane(compiled.state, 1);
    TEST_ASSERT_TRUE(shifted.ok);
    TEST_ASSERT_EQ(speed2, shifted.state.players[PLAYER].board.top(1)->id);
    TEST_ASSERT_EQ(0, shifted.state.players[PLAYER].board.lane_size(0));
    TEST_ASSERT_TRUE(shifted.state.players[PLAYER].compiled[0]);
}

TEST(Compile, FaceDownSpeedTwoIsDeleted) {
    CompileEngine engine;
    GameState state = standard_game(engine);
    CardID speed2 = place(engine, state, PLAYER, 0, "Speed", 2, false);
    for (int value = 0; value < 4; value++) {
        place(engine, state, PLAYER, 0, "Life", value, false);
    }
    compile_phase(engine, state, PLAYER);

    StepResult compiled = engine.compile_lane(state, 0);
    TEST_ASSERT_TRUE(compiled.ok);
    TEST_ASSERT_FALSE(pending_is<SelectLaneForShift>(compiled.state));
    TEST_ASSERT_TRUE(compiled.state.players[PLAYER].discard.contains(speed2));
}

TEST(Compile, RecompileDrawsFromOpposingDeck) {
    CompileEngine engine;
    GameState state = standard_game(engine);
    stack_ten(engine, state, PLAYER, 0, "Life");
    state.players[PLAYER].compiled[0] = true;
    compile_phase(engine, state, PLAYER);
    int opponent_deck = state.players[OPPONENT].deck.count();

    StepResult result = engine.compile_lane(state, 0);
    TEST_ASSERT_TRUE(result.ok);
    const GameState& after = result.state;
    TEST_ASSERT_EQ(1, after.players[PLAYER].hand.count());
    TEST_ASSERT_EQ(opponent_deck - 1, after.players[OPPONENT].deck.count());
    TEST_ASSERT_EQ(1, after.players[PLAYER].stats.recompiles);
    TEST_ASSERT_FALSE(after.is_game_over());

    // The drawn card still belongs to the opponent's card set
    const PlayedCard& drawn = after.players[PLAYER].hand.cards[0];
    TEST_ASSERT_EQ(std::string("p1_"), drawn.id.substr(0, 3));
    TEST_ASSERT_TRUE(engine.check_invariants(after).empty());
}

TEST(Compile, ThirdProtocolWins) {
    CompileEngine engine;
    GameState state = standard_game(engine);
    stack_ten(engine, state, PLAYER, 0, "Life");
    state.players[PLAYER].compiled[1] = true;
    state.players[PLAYER].compiled[2] = true;
    compile_phase(engine, state, PLAYER);

    StepResult result = engine.compile_lane(state, 0);
    TEST_ASSERT_TRUE(result.ok);
    TEST_ASSERT_TRUE(result.state.winner.has_value());
    TEST_ASSERT_EQ(0, static_cast<int>(*result.state.winner));
    TEST_ASSERT_TRUE(has_event(result.events, EventType::GAME_OVER));
    TEST_ASSERT_FALSE(result.state.has_pending_action());
    TEST_ASSERT_TRUE(engine.get_legal_actions(result.state).empty());
    TEST_ASSERT(engine.fill_hand(result.state).error == IllegalIntent::GAME_OVER);
    TEST_ASSERT(engine.compile_lane(result.state, 1).error == IllegalIntent::GAME_OVER);
    TEST_ASSERT_TRUE(engine.check_invariants(result.state).empty());
}

TEST(Compile, PerformCompileReportsWinner) {
    CompileEngine engine;
    GameState state = standard_game(engine);
    stack_ten(engine, state, OPPONENT, 2, "Hate");
    state.players[OPPONENT].compiled[0] = true;
    state.players[OPPONENT].compiled[1] = true;
    compile_phase(engine, state, OPPONENT);

    int reported = -1;
    GameState after = engine.perform_compile(state, 2, [&reported](PlayerID winner) {
        reported = winner;
    });
    TEST_ASSERT_EQ(1, reported);
    TEST_ASSERT_TRUE(after.players[OPPONENT].all_compiled());
    TEST_ASSERT_EQ(5, after.players[OPPONENT].discard.count());
}

TEST(Compile, PerformCompileRefusesIneligibleLane) {
    CompileEngine engine;
    GameState state = standard_game(engine);
    stack_ten(engine, state, PLAYER, 1, "Life");
    compile_phase(engine, state, PLAYER);

    bool called = false;
    auto report = [&called](PlayerID) { called = true; };

    GameState missing = engine.perform_compile(state, 5, report);
    TEST_ASSERT_EQ(0, missing.players[PLAYER].stats.compiles);
    TEST_ASSERT_EQ(5, missing.players[PLAYER].board.lane_size(1));

    GameState empty_lane = engine.perform_compile(state, 0, report);
    TEST_ASSERT_FALSE(empty_lane.players[PLAYER].compiled[0]);
    TEST_ASSERT_EQ(0, empty_lane.players[PLAYER].stats.compiles);

    // Blocked by Metal-1, even the leading line stays
    GameState blocked = state;
    blocked.players[PLAYER].cannot_compile = true;
    GameState after = engine.perform_compile(blocked, 1, report);
    TEST_ASSERT_FALSE(after.players[PLAYER].compiled[1]);
    TEST_ASSERT_EQ(5, after.players[PLAYER].board.lane_size(1));
    TEST_ASSERT_FALSE(called);

    GameState compiled = engine.perform_compile(state, 1);
    TEST_ASSERT_TRUE(compiled.players[PLAYER].compiled[1]);
    TEST_ASSERT_EQ(1, compiled.players[PLAYER].stats.compiles);
}

TEST(Compile, MetalOneBlocksNextCompile) {
    CompileEngine engine;
    GameState state = standard_game(engine, OPPONENT);
    stack_ten(engine, state, PLAYER, 0, "Life");
    CardID metal1 = give(state, OPPONENT, "Metal", 1);

    StepResult blocked = engine.play_card(state, metal1, 0, true);
    TEST_ASSERT_TRUE(blocked.ok);
    const GameState& mine = blocked.state;
    TEST_ASSERT_EQ(0, static_cast<int>(mine.turn));
    TEST_ASSERT(mine.phase == Phase::ACTION);
    TEST_ASSERT_TRUE(mine.players[PLAYER].cannot_compile);
    TEST_ASSERT_TRUE(engine.compilable_lanes(mine, PLAYER).empty());
    TEST_ASSERT_EQ(2, mine.players[OPPONENT].hand.count());

    // The block ends with the blocked player's turn
    StepResult filled = engine.fill_hand(mine);
    TEST_ASSERT_TRUE(filled.ok);
    TEST_ASSERT_FALSE(filled.state.players[PLAYER].cannot_compile);
}

TEST(Compile, RecompileDisabledByConfig) {
    GameConfig config;
    config.allow_recompile = false;
    CompileEngine engine(config);
    GameState state = standard_game(engine);
    stack_ten(engine, state, PLAYER, 0, "Life");
    state.players[PLAYER].compiled[0] = true;
    compile_phase(engine, state, PLAYER);

    TEST_ASSERT_TRUE(state.compilable_lanes.empty());
    TEST_ASSERT(engine.compile_lane(state, 0).error == IllegalIntent::NOT_COMPILABLE);
}

// ============================================================================
// CONTROL TESTS
// ============================================================================

TEST(Control, PromptBeforeFillHand) {
    CompileEngine engine;
    GameState state = blank_game(engine, {"Speed", "Life", "Water"}, {"Metal", "Death", "Hate"}, PLAYER, true);
    state.control_card_holder = PLAYER;

    StepResult prompted = engine.fill_hand(state);
    TEST_ASSERT_TRUE(prompted.ok);
    TEST_ASSERT(pending_is<PromptUseControl>(prompted.state));
    TEST_ASSERT_FALSE(pending_as<PromptUseControl>(prompted.state).optional);
    TEST_ASSERT_FALSE(prompted.state.control_card_holder.has_value());
    TEST_ASSERT_EQ(3u, engine.get_legal_actions(prompted.state).size());
    TEST_ASSERT_EQ(0, prompted.state.players[PLAYER].hand.count());

    StepResult rearranging = engine.resolve_control(prompted.state, ControlChoice::REARRANGE_OWN);
    TEST_ASSERT_TRUE(rearranging.ok);
    TEST_ASSERT(pending_is<RearrangeProtocols>(rearranging.state));
    TEST_ASSERT_EQ(6u, engine.get_legal_actions(rearranging.state).size());

    StepResult bad = engine.resolve_rearrange(rearranging.state, {"Speed", "Speed", "Life"});
    TEST_ASSERT(bad.error == IllegalIntent::INVALID_SELECTION);

    StepResult done = engine.resolve_rearrange(rearranging.state, {"Life", "Water", "Speed"});
    TEST_ASSERT_TRUE(done.ok);
    TEST_ASSERT_EQ(std::string("Life"), done.state.players[PLAYER].protocols[0]);
    TEST_ASSERT_EQ(5, done.state.players[PLAYER].hand.count());
    TEST_ASSERT_EQ(1, static_cast<int>(done.state.turn));
}

TEST(Control, SkipThenCompile) {
    CompileEngine engine;
    GameState state = blank_game(engine, {"Speed", "Life", "Water"}, {"Metal", "Death", "Hate"}, PLAYER, true);
    stack_ten(engine, state, PLAYER, 0, "Life");
    state.control_card_holder = PLAYER;
    compile_phase(engine, state, PLAYER);

    StepResult prompted = engine.compile_lane(state, 0);
    TEST_ASSERT(pending_is<PromptUseControl>(prompted.state));
    TEST_ASSERT_FALSE(prompted.state.players[PLAYER].compiled[0]);

    StepResult skipped = engine.resolve_control(prompted.state, ControlChoice::SKIP);
    TEST_ASSERT_TRUE(skipped.ok);
    TEST_ASSERT_TRUE(skipped.state.players[PLAYER].compiled[0]);
    TEST_ASSERT_EQ(std::string("Speed"), skipped.state.players[PLAYER].protocols[0]);
}

TEST(Control, RearrangeOpponentThenCompile) {
    CompileEngine engine;
    GameState state = blank_game(engine, {"Speed", "Life", "Water"}, {"Metal", "Death", "Hate"}, PLAYER, true);
    stack_ten(engine, state, PLAYER, 0, "Life");
    state.control_card_holder = PLAYER;
    compile_phase(engine, state, PLAYER);

    StepResult prompted = engine.compile_lane(state, 0);
    StepResult rearranging = engine.resolve_control(prompted.state, ControlChoice::REARRANGE_OPPONENT);
    TEST_ASSERT(pending_is<RearrangeProtocols>(rearranging.state));
    TEST_ASSERT_EQ(1, static_cast<int>(pending_as<RearrangeProtocols>(rearranging.state).target_player));
    TEST_ASSERT_EQ(0, static_cast<int>(engine.expected_actor(rearranging.state)));

    StepResult done = engine.resolve_rearrange(rearranging.state, {"Hate", "Death", "Metal"});
    TEST_ASSERT_TRUE(done.ok);
    TEST_ASSERT_EQ(std::string("Hate"), done.state.players[OPPONENT].protocols[0]);
    TEST_ASSERT_TRUE(done.state.players[PLAYER].compiled[0]);
}

TEST(Control, TakenWithLeadInTwoLines) {
    CompileEngine engine;
    GameState state = blank_game(engine, {"Speed", "Life", "Water"}, {"Metal", "Death", "Hate"}, OPPONENT, true);
    place(engine, state, PLAYER, 0, "Speed", 0, false);
    place(engine, state, PLAYER, 1, "Life", 0, false);
    TEST_ASSERT_FALSE(state.control_card_holder.has_value());

    StepResult result = engine.fill_hand(state, OPPONENT);
    TEST_ASSERT_TRUE(result.ok);
    TEST_ASSERT_EQ(0, static_cast<int>(result.state.turn));
    TEST_ASSERT(result.state.phase == Phase::ACTION);
    TEST_ASSERT_TRUE(result.state.control_card_holder.has_value());
    TEST_ASSERT_EQ(0, static_cast<int>(*result.state.control_card_holder));
}

TEST(Control, IgnoredWithoutMechanic) {
    CompileEngine engine;
    GameState state = standard_game(engine);
    state.control_card_holder = PLAYER;

    StepResult result = engine.fill_hand(state);
    TEST_ASSERT_TRUE(result.ok);
    TEST_ASSERT_FALSE(pending_is<PromptUseControl>(result.state));
    TEST_ASSERT_EQ(5, result.state.players[PLAYER].hand.count());
}
