/**
 * Life - Protocol
 *
 * Fills lines from the top of the deck.
 */

#include "cards/protocol_registry.hpp"

namespace compile {
namespace protocols {

using namespace effects;

namespace {

CardDef life_0() {
    CardDef card = make_card("Life", 0, "",
        "Play the top card of your deck face-down in each line where you have a card.",
        "When this card would be covered: First, delete this card.");
    card.effects.push_back(on_play({
        play_from_deck(DeckPlayMode::EACH_LANE_WITH_OWN_CARD)
    }));
    card.effects.push_back(on_cover({delete_self()}));
    return card;
}

CardDef life_1() {
    CardDef card = make_card("Life", 1, "", "Flip 1 card. Flip 1 card.", "");
    card.effects.push_back(on_play({
        flip(FilterBuilder().build()),
        flip(FilterBuilder().build())
    }));
    return card;
}

CardDef life_2() {
    CardDef card = make_card("Life", 2, "",
        "Draw 1 card. You may flip 1 face-down card.", "");
    card.effects.push_back(on_play({
        draw(1),
        flip(FilterBuilder().face_down().build()).optional()
    }));
    return card;
}

CardDef life_3() {
    CardDef card = make_card("Life", 3, "", "",
        "When this card would be covered: First, play the top card of your deck face-down in another line.");
    card.effects.push_back(on_cover({
        play_from_deck(DeckPlayMode::ANOTHER_LANE)
    }));
    return card;
}

CardDef life_4() {
    CardDef card = make_card("Life", 4, "",
        "If this card is covering a card, draw 1 card.", "");
    card.effects.push_back(on_play({draw(1).if_covering()}));
    return card;
}

} // anonymous namespace

void register_life(CardCatalog& catalog) {
    catalog.register_card(life_0());
    catalog.register_card(life_1());
    catalog.register_card(life_2());
    catalog.register_card(life_3());
    catalog.register_card(life_4());
    catalog.register_card(discard_one_card("Life"));
}

} // namespace protocols
} // namespace compile
