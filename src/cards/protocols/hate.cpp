/**
 * Hate - Protocol
 */

#include "cards/protocol_registry.hpp"

namespace compile {
namespace protocols {

using namespace effects;

namespace {

CardDef hate_0() {
    CardDef card = make_card("Hate", 0, "", "Delete 1 card.", "");
    card.effects.push_back(on_play({delete_card(FilterBuilder().build())}));
    return card;
}

CardDef hate_1() {
    CardDef card = make_card("Hate", 1, "",
        "Discard 3 cards. Delete 1 card. Delete 1 card.", "");
    card.effects.push_back(on_play({
        discard(3),
        delete_card(FilterBuilder().build()),
        delete_card(FilterBuilder().build())
    }));
    return card;
}

/**
 * Hate-2: both sides lose their highest uncovered card.
 * The owner's own pick comes first and may be Hate-2 itself.
 */
CardDef hate_2() {
    CardDef card = make_card("Hate", 2, "",
        "Delete your highest value uncovered card. Delete your opponent's highest value uncovered card.", "");
    card.effects.push_back(on_play({
        Step(EffectOp::DELETE_HIGHEST).target(FilterBuilder().own().build()),
        Step(EffectOp::DELETE_HIGHEST).target(FilterBuilder().opponent().build())
    }));
    return card;
}

CardDef hate_3() {
    CardDef card = make_card("Hate", 3,
        "After you delete cards: Draw 1 card.", "", "");
    card.effects.push_back(reactive(Trigger::AFTER_DELETE, {draw(1)}));
    return card;
}

CardDef hate_4() {
    CardDef card = make_card("Hate", 4, "", "",
        "When this card would be covered: First, delete the lowest value covered card in this line.");
    card.effects.push_back(on_cover({Step(EffectOp::DELETE_LOWEST_COVERED)}));
    return card;
}

} // anonymous namespace

void register_hate(CardCatalog& catalog) {
    catalog.register_card(hate_0());
    catalog.register_card(hate_1());
    catalog.register_card(hate_2());
    catalog.register_card(hate_3());
    catalog.register_card(hate_4());
    catalog.register_card(discard_one_card("Hate"));
}

} // namespace protocols
} // namespace compile
