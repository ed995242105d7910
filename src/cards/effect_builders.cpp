/**
 * Compile Engine - Effect Builders Implementation
 */

#include "cards/effect_builders.hpp"

namespace compile {
namespace effects {

// ============================================================================
// FILTER BUILDER
// ============================================================================

FilterBuilder& FilterBuilder::own() {
    filter_.owner = OwnerFilter::OWN;
    return *this;
}

FilterBuilder& FilterBuilder::opponent() {
    filter_.owner = OwnerFilter::OPPONENT;
    return *this;
}

FilterBuilder& FilterBuilder::face_up() {
    filter_.face = FaceFilter::FACE_UP;
    return *this;
}

FilterBuilder& FilterBuilder::face_down() {
    filter_.face = FaceFilter::FACE_DOWN;
    return *this;
}

FilterBuilder& FilterBuilder::covered() {
    filter_.position = PositionFilter::COVERED;
    return *this;
}

FilterBuilder& FilterBuilder::any_position() {
    filter_.position = PositionFilter::ANY;
    return *this;
}

FilterBuilder& FilterBuilder::value_range(int min_value, int max_value) {
    filter_.min_value = min_value;
    filter_.max_value = max_value;
    return *this;
}

FilterBuilder& FilterBuilder::exclude_self() {
    filter_.exclude_self = true;
    return *this;
}

FilterBuilder& FilterBuilder::this_lane() {
    filter_.lane = LaneScope::THIS_LANE;
    return *this;
}

FilterBuilder& FilterBuilder::other_lanes() {
    filter_.lane = LaneScope::OTHER_LANES;
    return *this;
}

// ============================================================================
// STEP BUILDER
// ============================================================================

Step::Step(EffectOp op) {
    ins_.op = op;
}

Step& Step::count(int n) {
    ins_.count = n;
    return *this;
}

Step& Step::by_opponent() {
    ins_.actor = EffectActor::OPPONENT;
    return *this;
}

Step& Step::target(const TargetFilter& filter) {
    ins_.filter = filter;
    return *this;
}

Step& Step::optional() {
    ins_.optional = true;
    return *this;
}

Step& Step::if_previous() {
    ins_.condition = Condition::IF_PREVIOUS;
    return *this;
}

Step& Step::if_covering() {
    ins_.condition = Condition::IF_COVERING;
    return *this;
}

Step& Step::on_previous() {
    ins_.subject = Subject::PREVIOUS;
    return *this;
}

Step& Step::on_self() {
    ins_.subject = Subject::SELF;
    return *this;
}

Step& Step::amount(AmountMode mode) {
    ins_.amount = mode;
    return *this;
}

Step& Step::destination(ShiftDestination dest) {
    ins_.destination = dest;
    return *this;
}

Step& Step::deck_mode(DeckPlayMode mode) {
    ins_.deck_mode = mode;
    return *this;
}

Step& Step::variable() {
    ins_.variable = true;
    return *this;
}

Step& Step::face_down_only() {
    ins_.face_down_only = true;
    return *this;
}

Step& Step::lane_min_cards(int n) {
    ins_.lane_min_cards = n;
    return *this;
}

Step& Step::alternative(const EffectInstruction& ins) {
    ins_.alternatives.push_back(ins);
    return *this;
}

Step& Step::label(const std::string& text) {
    ins_.label = text;
    return *this;
}

// ============================================================================
// INSTRUCTION SHORTHANDS
// ============================================================================

Step draw(int n) {
    return Step(EffectOp::DRAW).count(n);
}

Step discard(int n) {
    return Step(EffectOp::DISCARD).count(n);
}

Step refresh() {
    return Step(EffectOp::REFRESH);
}

Step flip(const TargetFilter& filter) {
    return Step(EffectOp::FLIP).target(filter);
}

Step flip_all(const TargetFilter& filter) {
    return Step(EffectOp::FLIP_ALL).target(filter);
}

Step flip_self() {
    return Step(EffectOp::FLIP_SELF).on_self();
}

Step delete_card(const TargetFilter& filter) {
    return Step(EffectOp::DELETE).target(filter);
}

Step delete_self() {
    return Step(EffectOp::DELETE_SELF).on_self();
}

Step shift(const TargetFilter& filter) {
    return Step(EffectOp::SHIFT).target(filter);
}

Step shift_self() {
    return Step(EffectOp::SHIFT_SELF).on_self();
}

Step return_card(const TargetFilter& filter) {
    return Step(EffectOp::RETURN).target(filter);
}

Step play_from_hand() {
    return Step(EffectOp::PLAY_FROM_HAND);
}

Step play_from_deck(DeckPlayMode mode) {
    return Step(EffectOp::PLAY_FROM_DECK).deck_mode(mode);
}

Step choose(const EffectInstruction& first, const EffectInstruction& second) {
    return Step(EffectOp::CHOOSE).alternative(first).alternative(second);
}

// ============================================================================
// CARD SHORTHANDS
// ============================================================================

CardDef make_card(const std::string& protocol, int value,
                  const std::string& top, const std::string& middle, const std::string& bottom) {
    CardDef card;
    card.protocol = protocol;
    card.value = value;
    card.top_text = top;
    card.middle_text = middle;
    card.bottom_text = bottom;
    return card;
}

CardEffect on_play(EffectProgram program) {
    return CardEffect{Trigger::ON_PLAY, Box::MIDDLE, std::move(program)};
}

CardEffect on_cover(EffectProgram program) {
    return CardEffect{Trigger::ON_COVER, Box::BOTTOM, std::move(program)};
}

CardEffect start_effect(Box box, EffectProgram program) {
    return CardEffect{Trigger::START, box, std::move(program)};
}

CardEffect end_effect(Box box, EffectProgram program) {
    return CardEffect{Trigger::END, box, std::move(program)};
}

CardEffect reactive(Trigger trigger, EffectProgram program) {
    return CardEffect{trigger, Box::TOP, std::move(program)};
}

PassiveRule passive(PassiveKind kind, Box box, int amount) {
    return PassiveRule{kind, box, amount};
}

CardDef discard_one_card(const std::string& protocol) {
    CardDef card = make_card(protocol, 5, "", "Discard 1 card.", "");
    card.effects.push_back(on_play({discard(1)}));
    return card;
}

} // namespace effects
} // namespace compile
