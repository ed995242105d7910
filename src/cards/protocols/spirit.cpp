/**
 * Spirit - Protocol
 *
 * Loosens the play rules and the clear cache check.
 */

#include "cards/protocol_registry.hpp"

namespace compile {
namespace protocols {

using namespace effects;

namespace {

CardDef spirit_0() {
    CardDef card = make_card("Spirit", 0,
        "Skip your check cache phase.", "Refresh. Draw 1 card.", "");
    card.passives.push_back(passive(PassiveKind::SKIP_CHECK_CACHE));
    card.effects.push_back(on_play({refresh(), draw(1)}));
    return card;
}

CardDef spirit_1() {
    CardDef card = make_card("Spirit", 1,
        "You can play cards in any line. Start: Either discard 1 card or flip this card.",
        "Draw 2 cards.", "");
    card.passives.push_back(passive(PassiveKind::PLAY_ANY_LANE));
    card.effects.push_back(start_effect(Box::TOP, {
        choose(discard(1), flip_self())
    }));
    card.effects.push_back(on_play({draw(2)}));
    return card;
}

CardDef spirit_2() {
    CardDef card = make_card("Spirit", 2, "", "You may flip 1 card.", "");
    card.effects.push_back(on_play({flip(FilterBuilder().build()).optional()}));
    return card;
}

CardDef spirit_3() {
    CardDef card = make_card("Spirit", 3,
        "After you draw cards: You may shift this card, even if this card is covered.", "", "");
    card.effects.push_back(reactive(Trigger::AFTER_DRAW, {shift_self().optional()}));
    return card;
}

CardDef spirit_4() {
    CardDef card = make_card("Spirit", 4, "",
        "Swap the positions of 2 of your protocols.", "");
    card.effects.push_back(on_play({Step(EffectOp::SWAP_PROTOCOLS)}));
    return card;
}

} // anonymous namespace

void register_spirit(CardCatalog& catalog) {
    catalog.register_card(spirit_0());
    catalog.register_card(spirit_1());
    catalog.register_card(spirit_2());
    catalog.register_card(spirit_3());
    catalog.register_card(spirit_4());
    catalog.register_card(discard_one_card("Spirit"));
}

} // namespace protocols
} // namespace compile
