/**
 * Psychic - Protocol
 *
 * Hand disruption and protocol control.
 */

#include "cards/protocol_registry.hpp"

namespace compile {
namespace protocols {

using namespace effects;

namespace {

CardDef psychic_0() {
    CardDef card = make_card("Psychic", 0, "",
        "Draw 2 cards. Your opponent discards 2 cards, then reveals their hand.", "");
    card.effects.push_back(on_play({
        draw(2),
        discard(2).by_opponent(),
        Step(EffectOp::REVEAL_HAND).by_opponent()
    }));
    return card;
}

CardDef psychic_1() {
    CardDef card = make_card("Psychic", 1,
        "Your opponent can only play cards face-down. Start: Flip this card.", "", "");
    card.passives.push_back(passive(PassiveKind::OPPONENT_PLAYS_FACE_DOWN_ONLY));
    card.effects.push_back(start_effect(Box::TOP, {flip_self()}));
    return card;
}

CardDef psychic_2() {
    CardDef card = make_card("Psychic", 2, "",
        "Your opponent discards 2 cards. Rearrange their protocols.", "");
    Step rearrange(EffectOp::REARRANGE_PROTOCOLS);
    rearrange.target(FilterBuilder().opponent().build());
    card.effects.push_back(on_play({
        discard(2).by_opponent(),
        rearrange
    }));
    return card;
}

CardDef psychic_3() {
    CardDef card = make_card("Psychic", 3, "",
        "Your opponent discards 1 card. Shift 1 of their cards.", "");
    card.effects.push_back(on_play({
        discard(1).by_opponent(),
        shift(FilterBuilder().opponent().build())
    }));
    return card;
}

CardDef psychic_4() {
    CardDef card = make_card("Psychic", 4, "", "",
        "End: You may return 1 of your opponent's cards. If you do, flip this card.");
    card.effects.push_back(end_effect(Box::BOTTOM, {
        return_card(FilterBuilder().opponent().build()).optional(),
        flip_self().if_previous()
    }));
    return card;
}

} // anonymous namespace

void register_psychic(CardCatalog& catalog) {
    catalog.register_card(psychic_0());
    catalog.register_card(psychic_1());
    catalog.register_card(psychic_2());
    catalog.register_card(psychic_3());
    catalog.register_card(psychic_4());
    catalog.register_card(discard_one_card("Psychic"));
}

} // namespace protocols
} // namespace compile
