/**
 * Metal - Protocol
 *
 * Blocking and protection. Metal has no value-4 card; its sixth card is
 * value 6.
 */

#include "cards/protocol_registry.hpp"

namespace compile {
namespace protocols {

using namespace effects;

namespace {

CardDef metal_0() {
    CardDef card = make_card("Metal", 0,
        "Your opponent's total value in this line is reduced by 2.",
        "Flip 1 card.", "");
    card.passives.push_back(passive(PassiveKind::OPPONENT_TOTAL_MINUS, Box::TOP, 2));
    card.effects.push_back(on_play({flip(FilterBuilder().build())}));
    return card;
}

CardDef metal_1() {
    CardDef card = make_card("Metal", 1, "",
        "Draw 2 cards. Your opponent cannot compile next turn.", "");
    card.effects.push_back(on_play({
        draw(2),
        Step(EffectOp::BLOCK_COMPILE)
    }));
    return card;
}

CardDef metal_2() {
    CardDef card = make_card("Metal", 2,
        "Your opponent cannot play cards face-down in this line.", "", "");
    card.passives.push_back(passive(PassiveKind::BLOCK_FACE_DOWN_PLAY_IN_LANE));
    return card;
}

CardDef metal_3() {
    CardDef card = make_card("Metal", 3, "",
        "Draw 1 card. Delete all cards in 1 other line with 8 or more cards.", "");
    card.effects.push_back(on_play({
        draw(1),
        Step(EffectOp::DELETE_ALL_IN_LANE)
            .target(FilterBuilder().any_position().other_lanes().build())
            .lane_min_cards(8)
    }));
    return card;
}

/**
 * Metal-6: deleted instead of flipped, and deletes itself when covered.
 */
CardDef metal_6() {
    CardDef card = make_card("Metal", 6,
        "When this card would be covered or flipped: First, delete this card.", "", "");
    card.passives.push_back(passive(PassiveKind::DELETE_WHEN_FLIPPED));
    card.effects.push_back(CardEffect{Trigger::ON_COVER, Box::TOP, {delete_self()}});
    return card;
}

} // anonymous namespace

void register_metal(CardCatalog& catalog) {
    catalog.register_card(metal_0());
    catalog.register_card(metal_1());
    catalog.register_card(metal_2());
    catalog.register_card(metal_3());
    catalog.register_card(discard_one_card("Metal"));
    catalog.register_card(metal_6());
}

} // namespace protocols
} // namespace compile
