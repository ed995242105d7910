/**
 * Speed - Protocol
 *
 * Extra plays and repositioning.
 */

#include "cards/protocol_registry.hpp"

namespace compile {
namespace protocols {

using namespace effects;

namespace {

CardDef speed_0() {
    CardDef card = make_card("Speed", 0, "", "Play 1 card.", "");
    card.effects.push_back(on_play({play_from_hand()}));
    return card;
}

CardDef speed_1() {
    CardDef card = make_card("Speed", 1,
        "After you clear cache: Draw 1 card.", "Draw 2 cards.", "");
    card.effects.push_back(reactive(Trigger::AFTER_CLEAR_CACHE, {draw(1)}));
    card.effects.push_back(on_play({draw(2)}));
    return card;
}

/**
 * Speed-2: when its line is compiled it is shifted instead of deleted.
 */
CardDef speed_2() {
    CardDef card = make_card("Speed", 2,
        "When this card would be deleted by compiling: Shift this card, even if this card is covered.",
        "", "");
    card.passives.push_back(passive(PassiveKind::SHIFT_ON_COMPILE_DELETE));
    return card;
}

CardDef speed_3() {
    CardDef card = make_card("Speed", 3, "",
        "Shift 1 of your other cards.",
        "End: You may shift 1 of your cards. If you do, flip this card.");
    card.effects.push_back(on_play({
        shift(FilterBuilder().own().exclude_self().build())
    }));
    card.effects.push_back(end_effect(Box::BOTTOM, {
        shift(FilterBuilder().own().build()).optional(),
        flip_self().if_previous()
    }));
    return card;
}

CardDef speed_4() {
    CardDef card = make_card("Speed", 4, "",
        "Shift 1 of your opponent's face-down cards.", "");
    card.effects.push_back(on_play({
        shift(FilterBuilder().opponent().face_down().build())
    }));
    return card;
}

} // anonymous namespace

void register_speed(CardCatalog& catalog) {
    catalog.register_card(speed_0());
    catalog.register_card(speed_1());
    catalog.register_card(speed_2());
    catalog.register_card(speed_3());
    catalog.register_card(speed_4());
    catalog.register_card(discard_one_card("Speed"));
}

} // namespace protocols
} // namespace compile
