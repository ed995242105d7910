/**
 * Death - Protocol
 *
 * Card text is mostly "delete". Death-1 trades itself for a deletion at
 * the start of its owner's turn.
 */

#include "cards/protocol_registry.hpp"

namespace compile {
namespace protocols {

using namespace effects;

namespace {

CardDef death_0() {
    CardDef card = make_card("Death", 0, "",
        "Delete 1 card from each other line.", "");
    card.effects.push_back(on_play({
        Step(EffectOp::DELETE_EACH_OTHER_LANE)
    }));
    return card;
}

CardDef death_1() {
    CardDef card = make_card("Death", 1,
        "Start: You may draw 1 card. If you do, delete 1 other card, then delete this card.",
        "", "");
    card.effects.push_back(start_effect(Box::TOP, {
        draw(1).optional(),
        delete_card(FilterBuilder().exclude_self().build()).if_previous(),
        delete_self().if_previous()
    }));
    return card;
}

CardDef death_2() {
    CardDef card = make_card("Death", 2, "",
        "Delete all cards in 1 line with a value of 1 or 2.", "");
    card.effects.push_back(on_play({
        Step(EffectOp::DELETE_ALL_IN_LANE)
            .target(FilterBuilder().any_position().value_range(1, 2).build())
    }));
    return card;
}

CardDef death_3() {
    CardDef card = make_card("Death", 3, "",
        "Delete 1 face-down card.", "");
    card.effects.push_back(on_play({
        delete_card(FilterBuilder().face_down().build())
    }));
    return card;
}

CardDef death_4() {
    CardDef card = make_card("Death", 4, "",
        "Delete a card with a value of 0 or 1.", "");
    card.effects.push_back(on_play({
        delete_card(FilterBuilder().value_range(0, 1).build())
    }));
    return card;
}

} // anonymous namespace

void register_death(CardCatalog& catalog) {
    catalog.register_card(death_0());
    catalog.register_card(death_1());
    catalog.register_card(death_2());
    catalog.register_card(death_3());
    catalog.register_card(death_4());
    catalog.register_card(discard_one_card("Death"));
}

} // namespace protocols
} // namespace compile
