/**
 * Tests for Effect Builders
 */

#include <sstream>
#include "cards/effect_builders.hpp"
#include "passive_rules.hpp"
#include "test_helpers.hpp"

using namespace compile;
using namespace compile::effects;
using namespace compile::test_support;

// ============================================================================
// FILTER BUILDER TESTS
// ============================================================================

TEST(FilterBuilder, Defaults) {
    TargetFilter filter = FilterBuilder().build();

    TEST_ASSERT(filter.owner == OwnerFilter::ANY);
    TEST_ASSERT(filter.face == FaceFilter::ANY);
    TEST_ASSERT(filter.position == PositionFilter::UNCOVERED);
    TEST_ASSERT(filter.lane == LaneScope::ANY);
    TEST_ASSERT_EQ(-1, filter.min_value);
    TEST_ASSERT_EQ(-1, filter.max_value);
    TEST_ASSERT_FALSE(filter.exclude_self);
}

TEST(FilterBuilder, ChainedFilter) {
    TargetFilter filter = FilterBuilder()
        .opponent()
        .face_down()
        .covered()
        .value_range(0, 1)
        .this_lane()
        .build();

    TEST_ASSERT(filter.owner == OwnerFilter::OPPONENT);
    TEST_ASSERT(filter.face == FaceFilter::FACE_DOWN);
    TEST_ASSERT(filter.position == PositionFilter::COVERED);
    TEST_ASSERT(filter.lane == LaneScope::THIS_LANE);
    TEST_ASSERT_EQ(0, filter.min_value);
    TEST_ASSERT_EQ(1, filter.max_value);
}

TEST(FilterBuilder, LastCallWins) {
    TargetFilter filter = FilterBuilder().own().opponent().covered().any_position().build();

    TEST_ASSERT(filter.owner == OwnerFilter::OPPONENT);
    TEST_ASSERT(filter.position == PositionFilter::ANY);
}

// ============================================================================
// STEP BUILDER TESTS
// ============================================================================

TEST(StepBuilder, DrawShorthand) {
    EffectInstruction ins = draw(3);

    TEST_ASSERT(ins.op == EffectOp::DRAW);
    TEST_ASSERT_EQ(3, ins.count);
    TEST_ASSERT(ins.actor == EffectActor::SELF);
    TEST_ASSERT(ins.condition == Condition::ALWAYS);
    TEST_ASSERT_FALSE(ins.optional);
}

TEST(StepBuilder, Modifiers) {
    EffectInstruction ins = discard(2).by_opponent().optional().if_previous().label("Make them discard");

    TEST_ASSERT(ins.op == EffectOp::DISCARD);
    TEST_ASSERT_EQ(2, ins.count);
    TEST_ASSERT(ins.actor == EffectActor::OPPONENT);
    TEST_ASSERT_TRUE(ins.optional);
    TEST_ASSERT(ins.condition == Condition::IF_PREVIOUS);
    TEST_ASSERT_EQ("Make them discard", ins.label);
}

TEST(StepBuilder, SelfSteps) {
    EffectInstruction flip = flip_self();
    EffectInstruction del = delete_self();
    EffectInstruction shift = shift_self().optional();

    TEST_ASSERT(flip.subject == Subject::SELF);
    TEST_ASSERT(del.subject == Subject::SELF);
    TEST_ASSERT(shift.subject == Subject::SELF);
    TEST_ASSERT_TRUE(shift.optional);
}

TEST(StepBuilder, ChooseHoldsAlternatives) {
    EffectInstruction ins = choose(discard(1), flip_self());

    TEST_ASSERT(ins.op == EffectOp::CHOOSE);
    TEST_ASSERT_EQ(2u, ins.alternatives.size());
    TEST_ASSERT(ins.alternatives[0].op == EffectOp::DISCARD);
    TEST_ASSERT(ins.alternatives[1].op == EffectOp::FLIP_SELF);
}

TEST(StepBuilder, DeckPlayAndAmount) {
    EffectInstruction deck = play_from_deck(DeckPlayMode::EACH_OTHER_LANE);
    EffectInstruction more = draw(1).amount(AmountMode::PREVIOUS_PLUS_ONE);
    EffectInstruction hand = play_from_hand().face_down_only();

    TEST_ASSERT(deck.deck_mode == DeckPlayMode::EACH_OTHER_LANE);
    TEST_ASSERT(more.amount == AmountMode::PREVIOUS_PLUS_ONE);
    TEST_ASSERT_TRUE(hand.face_down_only);
}

TEST(StepBuilder, ProgramFromSteps) {
    EffectProgram program = {
        draw(1),
        flip(FilterBuilder().face_down().build()).optional()
    };

    TEST_ASSERT_EQ(2u, program.size());
    TEST_ASSERT(program[1].filter.face == FaceFilter::FACE_DOWN);
    TEST_ASSERT_TRUE(program[1].optional);
}

// ============================================================================
// CARD SHORTHAND TESTS
// ============================================================================

TEST(CardShorthand, TriggerBoxes) {
    TEST_ASSERT(on_play({draw(1)}).box == Box::MIDDLE);
    TEST_ASSERT(on_cover({draw(1)}).box == Box::BOTTOM);
    TEST_ASSERT(reactive(Trigger::AFTER_DELETE, {draw(1)}).box == Box::TOP);
    TEST_ASSERT(start_effect(Box::BOTTOM, {draw(1)}).trigger == Trigger::START);
    TEST_ASSERT(end_effect(Box::TOP, {draw(1)}).trigger == Trigger::END);
}

TEST(CardShorthand, PassiveDefaults) {
    PassiveRule rule = passive(PassiveKind::FACE_DOWN_VALUE_4);
    TEST_ASSERT(rule.box == Box::TOP);
    TEST_ASSERT_EQ(0, rule.amount);

    PassiveRule minus = passive(PassiveKind::OPPONENT_TOTAL_MINUS, Box::TOP, 2);
    TEST_ASSERT_EQ(2, minus.amount);
}

TEST(CardShorthand, SharedValueFiveCard) {
    CardDef card = discard_one_card("Gravity");

    TEST_ASSERT_EQ("Gravity-5", card.id());
    TEST_ASSERT_EQ("Discard 1 card.", card.middle_text);
    const CardEffect* effect = card.find_effect(Trigger::ON_PLAY);
    TEST_ASSERT_NOT_NULL(effect);
    TEST_ASSERT_EQ(1u, effect->program.size());
    TEST_ASSERT(effect->program[0].op == EffectOp::DISCARD);
    TEST_ASSERT_TRUE(validate_card(card).empty());
}

// ============================================================================
// FILTER MATCHING TESTS
// ============================================================================

namespace {

EffectContext context_for(const GameState& state, const CardID& source) {
    BoardPosition pos = state.locate_on_board(source);
    EffectContext ctx;
    ctx.source_card_id = source;
    ctx.owner = pos.owner;
    ctx.lane = pos.lane;
    return ctx;
}

} // anonymous namespace

TEST(FilterMatching, OwnerAndFace) {
    CompileEngine engine;
    GameState state = standard_game(engine);
    CardID mine = place(engine, state, PLAYER, 0, "Speed", 3, true);
    CardID theirs_down = place(engine, state, OPPONENT, 1, "Metal", 3, false);
    CardID theirs_up = place(engine, state, OPPONENT, 2, "Death", 4, true);

    EffectContext ctx = context_for(state, mine);
    auto opponent_down = collect_filter_targets(engine.catalog(), state,
                                                FilterBuilder().opponent().face_down().build(), ctx);
    TEST_ASSERT_EQ(1u, opponent_down.size());
    TEST_ASSERT_EQ(theirs_down, opponent_down[0]);

    auto own = collect_filter_targets(engine.catalog(), state, FilterBuilder().own().build(), ctx);
    TEST_ASSERT_EQ(1u, own.size());
    TEST_ASSERT_EQ(mine, own[0]);

    auto face_up = collect_filter_targets(engine.catalog(), state, FilterBuilder().face_up().build(), ctx);
    TEST_ASSERT_EQ(2u, face_up.size());
    TEST_ASSERT_TRUE(contains_id(face_up, theirs_up));
}

TEST(FilterMatching, CoveredAndExcludeSelf) {
    CompileEngine engine;
    GameState state = standard_game(engine);
    CardID bottom = place(engine, state, PLAYER, 0, "Life", 1, false);
    CardID top = place(engine, state, PLAYER, 0, "Speed", 3, true);

    EffectContext ctx = context_for(state, top);
    auto uncovered = collect_filter_targets(engine.catalog(), state, FilterBuilder().build(), ctx);
    TEST_ASSERT_EQ(1u, uncovered.size());
    TEST_ASSERT_EQ(top, uncovered[0]);

    auto others = collect_filter_targets(engine.catalog(), state, FilterBuilder().exclude_self().build(), ctx);
    TEST_ASSERT_TRUE(others.empty());

    auto covered = collect_filter_targets(engine.catalog(), state, FilterBuilder().covered().build(), ctx);
    TEST_ASSERT_EQ(1u, covered.size());
    TEST_ASSERT_EQ(bottom, covered[0]);

    auto all = collect_filter_targets(engine.catalog(), state, FilterBuilder().any_position().build(), ctx);
    TEST_ASSERT_EQ(2u, all.size());
}

TEST(FilterMatching, LaneScopeAndValues) {
    CompileEngine engine;
    GameState state = standard_game(engine);
    CardID source = place(engine, state, PLAYER, 1, "Life", 1, true);
    CardID same_lane = place(engine, state, OPPONENT, 1, "Death", 4, true);
    CardID other_lane = place(engine, state, OPPONENT, 2, "Hate", 0, true);
    CardID face_down = place(engine, state, OPPONENT, 0, "Metal", 6, false);

    EffectContext ctx = context_for(state, source);
    auto here = collect_filter_targets(engine.catalog(), state,
                                       FilterBuilder().this_lane().exclude_self().build(), ctx);
    TEST_ASSERT_EQ(1u, here.size());
    TEST_ASSERT_EQ(same_lane, here[0]);

    auto elsewhere = collect_filter_targets(engine.catalog(), state, FilterBuilder().other_lanes().build(), ctx);
    TEST_ASSERT_EQ(2u, elsewhere.size());
    TEST_ASSERT_TRUE(contains_id(elsewhere, other_lane));

    // Face-down cards count as 2 for value filters
    auto low = collect_filter_targets(engine.catalog(), state, FilterBuilder().value_range(0, 1).build(), ctx);
    TEST_ASSERT_EQ(2u, low.size());
    TEST_ASSERT_TRUE(contains_id(low, source));
    TEST_ASSERT_TRUE(contains_id(low, other_lane));

    auto two = collect_filter_targets(engine.catalog(), state, FilterBuilder().value_range(2, 2).build(), ctx);
    TEST_ASSERT_EQ(1u, two.size());
    TEST_ASSERT_EQ(face_down, two[0]);
}
