/**
 * Gravity - Protocol
 *
 * Pulls cards into its own line. Gravity has no value-3 card; its
 * sixth card is value 6.
 */

#include "cards/protocol_registry.hpp"

namespace compile {
namespace protocols {

using namespace effects;

namespace {

CardDef gravity_0() {
    CardDef card = make_card("Gravity", 0, "",
        "For every 2 cards in this line, play the top card of your deck face-down under this card.", "");
    card.effects.push_back(on_play({
        play_from_deck(DeckPlayMode::UNDER_SELF_PER_TWO)
    }));
    return card;
}

CardDef gravity_1() {
    CardDef card = make_card("Gravity", 1, "",
        "Draw 2 cards. Shift 1 card either to or from this line.", "");
    card.effects.push_back(on_play({
        draw(2),
        shift(FilterBuilder().build()).destination(ShiftDestination::TO_OR_FROM_THIS_LANE)
    }));
    return card;
}

CardDef gravity_2() {
    CardDef card = make_card("Gravity", 2, "",
        "Flip 1 card. Shift that card to this line.", "");
    card.effects.push_back(on_play({
        flip(FilterBuilder().build()),
        Step(EffectOp::SHIFT).on_previous().if_previous()
            .destination(ShiftDestination::THIS_LANE)
    }));
    return card;
}

CardDef gravity_4() {
    CardDef card = make_card("Gravity", 4, "",
        "Shift 1 face-down card to this line.", "");
    card.effects.push_back(on_play({
        shift(FilterBuilder().face_down().build()).destination(ShiftDestination::THIS_LANE)
    }));
    return card;
}

CardDef gravity_6() {
    CardDef card = make_card("Gravity", 6, "",
        "Your opponent plays the top card of their deck face-down in this line.", "");
    card.effects.push_back(on_play({
        play_from_deck(DeckPlayMode::THIS_LANE).by_opponent()
    }));
    return card;
}

} // anonymous namespace

void register_gravity(CardCatalog& catalog) {
    catalog.register_card(gravity_0());
    catalog.register_card(gravity_1());
    catalog.register_card(gravity_2());
    catalog.register_card(gravity_4());
    catalog.register_card(discard_one_card("Gravity"));
    catalog.register_card(gravity_6());
}

} // namespace protocols
} // namespace compile
