/**
 * Compile Engine - Effect Builders
 *
 * Reusable building blocks for card definitions.
 * Protocol files assemble their programs from these instead of filling
 * EffectInstruction fields by hand.
 *
 * Usage:
 *   auto program = EffectProgram{
 *       effects::draw(2),
 *       effects::flip(FilterBuilder().face_down().build()).optional()
 *   };
 */

#pragma once

#include "../card_catalog.hpp"
#include <string>

namespace compile {
namespace effects {

// ============================================================================
// FILTER BUILDER
// ============================================================================

/**
 * FilterBuilder - Fluent interface for building target filters.
 *
 * Defaults to any owner, any face, uncovered cards only.
 */
class FilterBuilder {
public:
    FilterBuilder& own();
    FilterBuilder& opponent();
    FilterBuilder& face_up();
    FilterBuilder& face_down();
    FilterBuilder& covered();
    FilterBuilder& any_position();
    FilterBuilder& value_range(int min_value, int max_value);
    FilterBuilder& exclude_self();
    FilterBuilder& this_lane();
    FilterBuilder& other_lanes();

    TargetFilter build() const { return filter_; }

private:
    TargetFilter filter_;
};

// ============================================================================
// STEP BUILDER
// ============================================================================

/**
 * Step - Fluent wrapper around one EffectInstruction.
 * Converts implicitly so it can be listed directly in an EffectProgram.
 */
class Step {
public:
    explicit Step(EffectOp op);

    Step& count(int n);
    Step& by_opponent();
    Step& target(const TargetFilter& filter);
    Step& optional();
    Step& if_previous();
    Step& if_covering();
    Step& on_previous();
    Step& on_self();
    Step& amount(AmountMode mode);
    Step& destination(ShiftDestination dest);
    Step& deck_mode(DeckPlayMode mode);
    Step& variable();
    Step& face_down_only();
    Step& lane_min_cards(int n);
    Step& alternative(const EffectInstruction& ins);
    Step& label(const std::string& text);

    const EffectInstruction& build() const { return ins_; }
    operator EffectInstruction() const { return ins_; }

private:
    EffectInstruction ins_;
};

// ============================================================================
// INSTRUCTION SHORTHANDS
// ============================================================================

Step draw(int n);
Step discard(int n);
Step refresh();
Step flip(const TargetFilter& filter);
Step flip_all(const TargetFilter& filter);
Step flip_self();
Step delete_card(const TargetFilter& filter);
Step delete_self();
Step shift(const TargetFilter& filter);
Step shift_self();
Step return_card(const TargetFilter& filter);
Step play_from_hand();
Step play_from_deck(DeckPlayMode mode);
Step choose(const EffectInstruction& first, const EffectInstruction& second);

// ============================================================================
// CARD SHORTHANDS
// ============================================================================

CardDef make_card(const std::string& protocol, int value,
                  const std::string& top, const std::string& middle, const std::string& bottom);

CardEffect on_play(EffectProgram program);
CardEffect on_cover(EffectProgram program);
CardEffect start_effect(Box box, EffectProgram program);
CardEffect end_effect(Box box, EffectProgram program);
CardEffect reactive(Trigger trigger, EffectProgram program);

PassiveRule passive(PassiveKind kind, Box box = Box::TOP, int amount = 0);

/**
 * The value-5 card every protocol shares: "Discard 1 card."
 */
CardDef discard_one_card(const std::string& protocol);

} // namespace effects
} // namespace compile
