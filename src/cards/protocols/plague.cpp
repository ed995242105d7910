/**
 * Plague - Protocol
 *
 * Makes the opponent discard. Plague-0 in the bottom box locks its line
 * for the opponent while it is uncovered.
 */

#include "cards/protocol_registry.hpp"

namespace compile {
namespace protocols {

using namespace effects;

namespace {

CardDef plague_0() {
    CardDef card = make_card("Plague", 0, "",
        "Your opponent discards 1 card.",
        "Your opponent cannot play cards in this line.");
    card.effects.push_back(on_play({discard(1).by_opponent()}));
    card.passives.push_back(passive(PassiveKind::BLOCK_PLAY_IN_LANE, Box::BOTTOM));
    return card;
}

CardDef plague_1() {
    CardDef card = make_card("Plague", 1,
        "After your opponent discards cards: Draw 1 card.",
        "Your opponent discards 1 card.", "");
    card.effects.push_back(reactive(Trigger::AFTER_OPPONENT_DISCARD, {draw(1)}));
    card.effects.push_back(on_play({discard(1).by_opponent()}));
    return card;
}

CardDef plague_2() {
    CardDef card = make_card("Plague", 2, "",
        "Discard 1 or more cards. Your opponent discards the amount of cards discarded plus 1.", "");
    card.effects.push_back(on_play({
        discard(1).variable(),
        discard(1).by_opponent().amount(AmountMode::PREVIOUS_PLUS_ONE)
    }));
    return card;
}

CardDef plague_3() {
    CardDef card = make_card("Plague", 3, "",
        "Flip each other face-up card.", "");
    card.effects.push_back(on_play({
        flip_all(FilterBuilder().face_up().exclude_self().build())
    }));
    return card;
}

CardDef plague_4() {
    CardDef card = make_card("Plague", 4, "", "",
        "End: Your opponent deletes 1 of their face-down cards. You may flip this card.");
    card.effects.push_back(end_effect(Box::BOTTOM, {
        delete_card(FilterBuilder().opponent().face_down().build()).by_opponent(),
        flip_self().optional()
    }));
    return card;
}

} // anonymous namespace

void register_plague(CardCatalog& catalog) {
    catalog.register_card(plague_0());
    catalog.register_card(plague_1());
    catalog.register_card(plague_2());
    catalog.register_card(plague_3());
    catalog.register_card(plague_4());
    catalog.register_card(discard_one_card("Plague"));
}

} // namespace protocols
} // namespace compile
