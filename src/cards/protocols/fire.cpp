/**
 * Fire - Protocol
 *
 * Pay with discards for stronger effects.
 */

#include "cards/protocol_registry.hpp"

namespace compile {
namespace protocols {

using namespace effects;

namespace {

CardDef fire_0() {
    CardDef card = make_card("Fire", 0, "",
        "Flip 1 other card. Draw 2 cards.",
        "When this card would be covered: First, draw 1 card and flip 1 other card.");
    card.effects.push_back(on_play({
        flip(FilterBuilder().exclude_self().build()),
        draw(2)
    }));
    card.effects.push_back(on_cover({
        draw(1),
        flip(FilterBuilder().exclude_self().build())
    }));
    return card;
}

CardDef fire_1() {
    CardDef card = make_card("Fire", 1, "",
        "Discard 1 card. If you do, delete 1 card.", "");
    card.effects.push_back(on_play({
        discard(1),
        delete_card(FilterBuilder().build()).if_previous()
    }));
    return card;
}

CardDef fire_2() {
    CardDef card = make_card("Fire", 2, "",
        "Discard 1 card. If you do, return 1 card.", "");
    card.effects.push_back(on_play({
        discard(1),
        return_card(FilterBuilder().build()).if_previous()
    }));
    return card;
}

CardDef fire_3() {
    CardDef card = make_card("Fire", 3, "", "",
        "End: You may discard 1 card. If you do, flip 1 card.");
    card.effects.push_back(end_effect(Box::BOTTOM, {
        discard(1).optional(),
        flip(FilterBuilder().build()).if_previous()
    }));
    return card;
}

// Draws one more card than were discarded
CardDef fire_4() {
    CardDef card = make_card("Fire", 4, "",
        "Discard 1 or more cards. Draw the amount discarded plus 1.", "");
    card.effects.push_back(on_play({
        discard(1).variable(),
        draw(1).amount(AmountMode::PREVIOUS_PLUS_ONE)
    }));
    return card;
}

} // anonymous namespace

void register_fire(CardCatalog& catalog) {
    catalog.register_card(fire_0());
    catalog.register_card(fire_1());
    catalog.register_card(fire_2());
    catalog.register_card(fire_3());
    catalog.register_card(fire_4());
    catalog.register_card(discard_one_card("Fire"));
}

} // namespace protocols
} // namespace compile
