/**
 * Water - Protocol
 *
 * Returns cards to hand and reorders protocols.
 */

#include "cards/protocol_registry.hpp"

namespace compile {
namespace protocols {

using namespace effects;

namespace {

CardDef water_0() {
    CardDef card = make_card("Water", 0, "",
        "Flip 1 other card. Flip this card.", "");
    card.effects.push_back(on_play({
        flip(FilterBuilder().exclude_self().build()),
        flip_self()
    }));
    return card;
}

CardDef water_1() {
    CardDef card = make_card("Water", 1, "",
        "Play the top card of your deck face-down in each other line.", "");
    card.effects.push_back(on_play({
        play_from_deck(DeckPlayMode::EACH_OTHER_LANE)
    }));
    return card;
}

CardDef water_2() {
    CardDef card = make_card("Water", 2, "",
        "Draw 2 cards. Rearrange your protocols.", "");
    card.effects.push_back(on_play({
        draw(2),
        Step(EffectOp::REARRANGE_PROTOCOLS)
    }));
    return card;
}

CardDef water_3() {
    CardDef card = make_card("Water", 3, "",
        "Return all cards with a value of 2 in 1 line.", "");
    card.effects.push_back(on_play({
        Step(EffectOp::RETURN_ALL_IN_LANE)
            .target(FilterBuilder().any_position().value_range(2, 2).build())
    }));
    return card;
}

CardDef water_4() {
    CardDef card = make_card("Water", 4, "",
        "Return 1 of your cards.", "");
    card.effects.push_back(on_play({
        return_card(FilterBuilder().own().build())
    }));
    return card;
}

} // anonymous namespace

void register_water(CardCatalog& catalog) {
    catalog.register_card(water_0());
    catalog.register_card(water_1());
    catalog.register_card(water_2());
    catalog.register_card(water_3());
    catalog.register_card(water_4());
    catalog.register_card(discard_one_card("Water"));
}

} // namespace protocols
} // namespace compile
