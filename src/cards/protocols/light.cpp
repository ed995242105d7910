/**
 * Light - Protocol
 *
 * Draws and reveals.
 */

#include "cards/protocol_registry.hpp"

namespace compile {
namespace protocols {

using namespace effects;

namespace {

// Draws as many cards as the flipped card's value
CardDef light_0() {
    CardDef card = make_card("Light", 0, "",
        "Flip 1 card. Draw cards equal to that card's value.", "");
    card.effects.push_back(on_play({
        flip(FilterBuilder().build()),
        draw(1).amount(AmountMode::PREVIOUS_TARGET_VALUE).if_previous()
    }));
    return card;
}

CardDef light_1() {
    CardDef card = make_card("Light", 1, "", "", "End: Draw 1 card.");
    card.effects.push_back(end_effect(Box::BOTTOM, {draw(1)}));
    return card;
}

/**
 * Light-2: reveal a face-down card, then either shift it or flip it.
 * Works on either player's cards.
 */
CardDef light_2() {
    CardDef card = make_card("Light", 2, "",
        "Draw 2 cards. Reveal 1 face-down card. You may shift or flip that card.", "");
    card.effects.push_back(on_play({
        draw(2),
        Step(EffectOp::REVEAL_BOARD_CARD).target(FilterBuilder().face_down().build()),
        choose(Step(EffectOp::SHIFT).on_previous(), Step(EffectOp::FLIP).on_previous())
            .optional().if_previous()
    }));
    return card;
}

CardDef light_3() {
    CardDef card = make_card("Light", 3, "",
        "Shift all face-down cards in this line to another line.", "");
    card.effects.push_back(on_play({
        Step(EffectOp::SHIFT_ALL).target(FilterBuilder().face_down().any_position().build())
    }));
    return card;
}

CardDef light_4() {
    CardDef card = make_card("Light", 4, "",
        "Your opponent reveals their hand.", "");
    card.effects.push_back(on_play({Step(EffectOp::REVEAL_HAND).by_opponent()}));
    return card;
}

} // anonymous namespace

void register_light(CardCatalog& catalog) {
    catalog.register_card(light_0());
    catalog.register_card(light_1());
    catalog.register_card(light_2());
    catalog.register_card(light_3());
    catalog.register_card(light_4());
    catalog.register_card(discard_one_card("Light"));
}

} // namespace protocols
} // namespace compile
