/**
 * Apathy - Protocol
 *
 * Face-down cards and mass flips. Apathy-0 grows with every face-down
 * card in its line and Apathy-2 shuts off middle commands around it.
 */

#include "cards/protocol_registry.hpp"

namespace compile {
namespace protocols {

using namespace effects;

namespace {

CardDef apathy_0() {
    CardDef card = make_card("Apathy", 0,
        "Your total value in this line is increased by 1 for each face-down card in this line.",
        "", "");
    card.passives.push_back(passive(PassiveKind::OWN_TOTAL_PLUS_PER_FACE_DOWN));
    return card;
}

CardDef apathy_1() {
    CardDef card = make_card("Apathy", 1, "",
        "Flip all other face-up cards in this line.", "");
    card.effects.push_back(on_play({
        flip_all(FilterBuilder().face_up().this_lane().exclude_self().any_position().build())
    }));
    return card;
}

/**
 * Apathy-2: middle commands in its line are ignored while it is face-up.
 * It turns itself face-down before anything lands on top of it.
 */
CardDef apathy_2() {
    CardDef card = make_card("Apathy", 2,
        "Ignore all middle commands of cards in this line.", "",
        "When this card would be covered: First, flip this card.");
    card.passives.push_back(passive(PassiveKind::IGNORE_MIDDLE_IN_LANE));
    card.effects.push_back(on_cover({flip_self()}));
    return card;
}

CardDef apathy_3() {
    CardDef card = make_card("Apathy", 3, "",
        "Flip 1 of your opponent's face-up cards.", "");
    card.effects.push_back(on_play({
        flip(FilterBuilder().opponent().face_up().build())
    }));
    return card;
}

CardDef apathy_4() {
    CardDef card = make_card("Apathy", 4, "",
        "You may flip 1 of your face-up covered cards.", "");
    card.effects.push_back(on_play({
        flip(FilterBuilder().own().face_up().covered().build()).optional()
    }));
    return card;
}

} // anonymous namespace

void register_apathy(CardCatalog& catalog) {
    catalog.register_card(apathy_0());
    catalog.register_card(apathy_1());
    catalog.register_card(apathy_2());
    catalog.register_card(apathy_3());
    catalog.register_card(apathy_4());
    catalog.register_card(discard_one_card("Apathy"));
}

} // namespace protocols
} // namespace compile
