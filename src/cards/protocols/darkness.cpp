/**
 * Darkness - Protocol
 *
 * Shifts and face-down pressure.
 */

#include "cards/protocol_registry.hpp"

namespace compile {
namespace protocols {

using namespace effects;

namespace {

CardDef darkness_0() {
    CardDef card = make_card("Darkness", 0, "",
        "Draw 3 cards. Shift 1 of your opponent's covered cards.", "");
    card.effects.push_back(on_play({
        draw(3),
        shift(FilterBuilder().opponent().covered().build())
    }));
    return card;
}

CardDef darkness_1() {
    CardDef card = make_card("Darkness", 1, "",
        "Flip 1 of your opponent's cards. You may shift that card.", "");
    card.effects.push_back(on_play({
        flip(FilterBuilder().opponent().build()),
        Step(EffectOp::SHIFT).on_previous().optional().if_previous()
    }));
    return card;
}

/**
 * Darkness-2: face-down cards in this stack count as 4.
 */
CardDef darkness_2() {
    CardDef card = make_card("Darkness", 2,
        "All face-down cards in this stack have a value of 4.",
        "You may flip 1 covered card in this line.", "");
    card.passives.push_back(passive(PassiveKind::FACE_DOWN_VALUE_4));
    card.effects.push_back(on_play({
        flip(FilterBuilder().covered().this_lane().build()).optional()
    }));
    return card;
}

CardDef darkness_3() {
    CardDef card = make_card("Darkness", 3, "",
        "Play 1 card face-down in another line.", "");
    card.effects.push_back(on_play({
        play_from_hand().face_down_only().target(FilterBuilder().other_lanes().build())
    }));
    return card;
}

CardDef darkness_4() {
    CardDef card = make_card("Darkness", 4, "",
        "Shift 1 face-down card.", "");
    card.effects.push_back(on_play({
        shift(FilterBuilder().face_down().build())
    }));
    return card;
}

} // anonymous namespace

void register_darkness(CardCatalog& catalog) {
    catalog.register_card(darkness_0());
    catalog.register_card(darkness_1());
    catalog.register_card(darkness_2());
    catalog.register_card(darkness_3());
    catalog.register_card(darkness_4());
    catalog.register_card(discard_one_card("Darkness"));
}

} // namespace protocols
} // namespace compile
