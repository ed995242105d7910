/**
 * Love - Protocol
 *
 * Trades cards with the opponent. Love has no value-0 card; its sixth
 * card is value 6.
 */

#include "cards/protocol_registry.hpp"

namespace compile {
namespace protocols {

using namespace effects;

namespace {

CardDef love_1() {
    CardDef card = make_card("Love", 1, "",
        "Draw the top card of your opponent's deck.",
        "End: You may give 1 card from your hand to your opponent. If you do, draw 2 cards.");
    card.effects.push_back(on_play({Step(EffectOp::DRAW_FROM_OPPONENT_DECK)}));
    card.effects.push_back(end_effect(Box::BOTTOM, {
        Step(EffectOp::GIVE_CARD).optional(),
        draw(2).if_previous()
    }));
    return card;
}

CardDef love_2() {
    CardDef card = make_card("Love", 2, "",
        "Your opponent draws 1 card. Refresh.", "");
    card.effects.push_back(on_play({
        draw(1).by_opponent(),
        refresh()
    }));
    return card;
}

CardDef love_3() {
    CardDef card = make_card("Love", 3, "",
        "Take 1 random card from your opponent's hand. Give 1 card from your hand to your opponent.", "");
    card.effects.push_back(on_play({
        Step(EffectOp::TAKE_RANDOM_CARD),
        Step(EffectOp::GIVE_CARD)
    }));
    return card;
}

CardDef love_4() {
    CardDef card = make_card("Love", 4, "",
        "Reveal 1 card from your hand. Flip 1 card.", "");
    card.effects.push_back(on_play({
        Step(EffectOp::REVEAL_FROM_HAND),
        flip(FilterBuilder().build())
    }));
    return card;
}

CardDef love_6() {
    CardDef card = make_card("Love", 6, "", "Your opponent draws 2 cards.", "");
    card.effects.push_back(on_play({draw(2).by_opponent()}));
    return card;
}

} // anonymous namespace

void register_love(CardCatalog& catalog) {
    catalog.register_card(love_1());
    catalog.register_card(love_2());
    catalog.register_card(love_3());
    catalog.register_card(love_4());
    catalog.register_card(discard_one_card("Love"));
    catalog.register_card(love_6());
}

} // namespace protocols
} // namespace compile
