/**
 * Tests for the Card Catalog and Game Configuration
 */

#include <sstream>
#include "card_catalog.hpp"
#include "cards/protocol_registry.hpp"
#include "game_config.hpp"
#include "test_helpers.hpp"

using namespace compile;
using namespace compile::test_support;

// ============================================================================
// BUILT-IN PROTOCOLS
// ============================================================================

TEST(Catalog, BuiltInProtocolsRegistered) {
    CardCatalog catalog;
    protocols::register_all_protocols(catalog);

    TEST_ASSERT_EQ(15u, catalog.protocols().size());
    TEST_ASSERT_EQ(90u, catalog.card_count());
    TEST_ASSERT_TRUE(catalog.errors().empty());

    for (const auto& info : protocols::get_protocol_info()) {
        TEST_ASSERT_MSG(catalog.has_protocol(info.name), info.name);
        TEST_ASSERT_EQ(6u, catalog.protocol_cards(info.name).size());
    }
}

TEST(Catalog, ProtocolCardsSortedByValue) {
    CardCatalog catalog;
    protocols::register_all_protocols(catalog);

    auto metal = catalog.protocol_cards("Metal");
    TEST_ASSERT_EQ(6u, metal.size());
    for (size_t i = 1; i < metal.size(); i++) {
        TEST_ASSERT(metal[i - 1]->value < metal[i]->value);
    }
    // Metal skips 4 and ends on 6
    TEST_ASSERT_NULL(catalog.get_card("Metal", 4));
    TEST_ASSERT_EQ(6, metal.back()->value);
}

TEST(Catalog, LookupById) {
    CardCatalog catalog;
    protocols::register_all_protocols(catalog);

    const CardDef* speed0 = catalog.get_card("Speed-0");
    TEST_ASSERT_NOT_NULL(speed0);
    TEST_ASSERT_EQ("Speed", speed0->protocol);
    TEST_ASSERT_EQ(0, speed0->value);
    TEST_ASSERT_EQ("Speed-0", speed0->id());
    TEST_ASSERT_FALSE(speed0->custom);

    TEST_ASSERT_NULL(catalog.get_card("Speed-9"));
    TEST_ASSERT_NULL(catalog.get_card("Nothing-1"));
}

TEST(Catalog, BuiltInNamesKnown) {
    TEST_ASSERT_TRUE(protocols::is_built_in_protocol("Gravity"));
    TEST_ASSERT_TRUE(protocols::is_built_in_protocol("Water"));
    TEST_ASSERT_FALSE(protocols::is_built_in_protocol("Anarchy"));
    TEST_ASSERT_EQ(15u, protocols::get_protocol_info().size());
}

// ============================================================================
// KEYWORDS
// ============================================================================

TEST(Keywords, DerivedFromPrograms) {
    CardCatalog catalog;
    protocols::register_all_protocols(catalog);

    TEST_ASSERT_TRUE(catalog.get_card("Speed-4")->has_keyword(Keyword::SHIFT));
    TEST_ASSERT_TRUE(catalog.get_card("Speed-1")->has_keyword(Keyword::DRAW));
    TEST_ASSERT_TRUE(catalog.get_card("Speed-0")->has_keyword(Keyword::PLAY));
    TEST_ASSERT_TRUE(catalog.get_card("Hate-0")->has_keyword(Keyword::DELETE));
    TEST_ASSERT_TRUE(catalog.get_card("Water-4")->has_keyword(Keyword::RETURN));
    TEST_ASSERT_TRUE(catalog.get_card("Plague-0")->has_keyword(Keyword::DISCARD));
    TEST_ASSERT_TRUE(catalog.get_card("Water-0")->has_keyword(Keyword::FLIP));

    // Passive-only cards carry no keywords
    TEST_ASSERT_EQ(0, catalog.get_card("Apathy-0")->keywords);
    TEST_ASSERT_EQ(0, catalog.get_card("Speed-2")->keywords);
}

TEST(Keywords, Disruptive) {
    CardCatalog catalog;
    protocols::register_all_protocols(catalog);

    TEST_ASSERT_TRUE(catalog.get_card("Hate-0")->is_disruptive());
    TEST_ASSERT_TRUE(catalog.get_card("Plague-0")->is_disruptive());
    TEST_ASSERT_FALSE(catalog.get_card("Speed-1")->is_disruptive());
    TEST_ASSERT_FALSE(catalog.get_card("Speed-0")->is_disruptive());
}

TEST(Keywords, ChooseAlternativesCount) {
    CardDef card = effects::make_card("Test", 1, "", "", "");
    card.effects.push_back(effects::on_play({effects::choose(effects::draw(1), effects::discard(1))}));

    uint8_t flags = derive_keywords(card);
    TEST_ASSERT(flags & static_cast<uint8_t>(Keyword::DRAW));
    TEST_ASSERT(flags & static_cast<uint8_t>(Keyword::DISCARD));
    TEST_ASSERT_FALSE(flags & static_cast<uint8_t>(Keyword::DELETE));
}

// ============================================================================
// VALIDATION
// ============================================================================

TEST(Validation, ValueOutOfRange) {
    CardDef card = effects::make_card("Test", 7, "", "Draw 1 card.", "");
    card.effects.push_back(effects::on_play({effects::draw(1)}));
    TEST_ASSERT_FALSE(validate_card(card).empty());

    card.value = -1;
    TEST_ASSERT_FALSE(validate_card(card).empty());

    card.value = 6;
    TEST_ASSERT_TRUE(validate_card(card).empty());
}

TEST(Validation, TriggerBoxPairing) {
    CardDef card = effects::make_card("Test", 1, "", "", "");
    card.effects.push_back(CardEffect{Trigger::ON_PLAY, Box::TOP, {effects::draw(1)}});
    TEST_ASSERT_FALSE(validate_card(card).empty());

    CardDef start = effects::make_card("Test", 2, "", "", "");
    start.effects.push_back(CardEffect{Trigger::START, Box::MIDDLE, {effects::draw(1)}});
    TEST_ASSERT_FALSE(validate_card(start).empty());

    CardDef reactive = effects::make_card("Test", 3, "", "", "");
    reactive.effects.push_back(effects::reactive(Trigger::AFTER_DRAW, {effects::draw(1)}));
    TEST_ASSERT_TRUE(validate_card(reactive).empty());
}

TEST(Validation, EmptyProgramAndBadFilter) {
    CardDef empty = effects::make_card("Test", 1, "", "", "");
    empty.effects.push_back(effects::on_play({}));
    TEST_ASSERT_FALSE(validate_card(empty).empty());

    CardDef bad_filter = effects::make_card("Test", 2, "", "", "");
    bad_filter.effects.push_back(effects::on_play({
        effects::delete_card(effects::FilterBuilder().value_range(4, 1).build())
    }));
    TEST_ASSERT_FALSE(validate_card(bad_filter).empty());
}

TEST(Validation, RegisterRejectsInvalidCard) {
    CardCatalog catalog;
    CardDef card = effects::make_card("Test", 9, "", "", "");

    TEST_ASSERT_FALSE(catalog.register_card(card));
    TEST_ASSERT_EQ(0u, catalog.card_count());
    TEST_ASSERT_EQ(1u, catalog.errors().size());
    TEST_ASSERT_FALSE(catalog.has_protocol("Test"));
}

// ============================================================================
// JSON LOADING
// ============================================================================

TEST(CatalogJson, LoadsValidProtocol) {
    const std::string doc = R"({
        "schema_version": 1,
        "protocols": [{
            "name": "Echo",
            "cards": [
                {"value": 1, "middle": "Draw 2 cards.",
                 "effects": [{"trigger": "on_play", "box": "middle",
                              "program": [{"op": "draw", "count": 2}]}]},
                {"value": 3, "top": "All face-down cards in this stack have a value of 4.",
                 "passives": [{"kind": "face_down_value_4", "box": "top"}]}
            ]
        }]
    })";

    CardCatalog catalog;
    TEST_ASSERT_TRUE(catalog.load_from_json_string(doc));
    TEST_ASSERT_TRUE(catalog.has_protocol("Echo"));
    TEST_ASSERT_EQ(2u, catalog.card_count());

    const CardDef* echo1 = catalog.get_card("Echo-1");
    TEST_ASSERT_NOT_NULL(echo1);
    TEST_ASSERT_TRUE(echo1->custom);
    TEST_ASSERT_TRUE(echo1->has_keyword(Keyword::DRAW));
    TEST_ASSERT_EQ(2, echo1->find_effect(Trigger::ON_PLAY)->program[0].count);

    const CardDef* echo3 = catalog.get_card("Echo-3");
    TEST_ASSERT_TRUE(echo3->has_passive(PassiveKind::FACE_DOWN_VALUE_4));
}

TEST(CatalogJson, UnknownOpRejectsProtocol) {
    const std::string doc = R"({
        "schema_version": 1,
        "protocols": [
            {"name": "Broken", "cards": [
                {"value": 0, "effects": [{"trigger": "on_play", "box": "middle",
                                          "program": [{"op": "explode"}]}]},
                {"value": 1, "effects": [{"trigger": "on_play", "box": "middle",
                                          "program": [{"op": "draw"}]}]}
            ]},
            {"name": "Fine", "cards": [
                {"value": 2, "effects": [{"trigger": "on_play", "box": "middle",
                                          "program": [{"op": "draw"}]}]}
            ]}
        ]
    })";

    CardCatalog catalog;
    TEST_ASSERT_FALSE(catalog.load_from_json_string(doc));
    // Rejected whole, the valid card of the protocol included
    TEST_ASSERT_FALSE(catalog.has_protocol("Broken"));
    TEST_ASSERT_NULL(catalog.get_card("Broken-1"));
    TEST_ASSERT_TRUE(catalog.has_protocol("Fine"));
    TEST_ASSERT_FALSE(catalog.errors().empty());
}

TEST(CatalogJson, InvalidCardRejectsProtocol) {
    const std::string doc = R"({
        "schema_version": 1,
        "protocols": [{"name": "Loud", "cards": [
            {"value": 1, "effects": [{"trigger": "on_play", "box": "top",
                                      "program": [{"op": "draw"}]}]}
        ]}]
    })";

    CardCatalog catalog;
    TEST_ASSERT_FALSE(catalog.load_from_json_string(doc));
    TEST_ASSERT_FALSE(catalog.has_protocol("Loud"));
}

TEST(CatalogJson, DuplicateValueRejected) {
    const std::string doc = R"({
        "schema_version": 1,
        "protocols": [{"name": "Twin", "cards": [
            {"value": 1, "middle": "a"},
            {"value": 1, "middle": "b"}
        ]}]
    })";

    CardCatalog catalog;
    TEST_ASSERT_FALSE(catalog.load_from_json_string(doc));
    TEST_ASSERT_FALSE(catalog.has_protocol("Twin"));
}

TEST(CatalogJson, BuiltInNameCannotBeReplaced) {
    const std::string doc = R"({
        "schema_version": 1,
        "protocols": [{"name": "Speed", "cards": [{"value": 1, "middle": "x"}]}]
    })";

    CardCatalog catalog;
    protocols::register_all_protocols(catalog);
    TEST_ASSERT_FALSE(catalog.load_from_json_string(doc));
    TEST_ASSERT_EQ(90u, catalog.card_count());
    TEST_ASSERT_TRUE(catalog.get_card("Speed-1")->has_keyword(Keyword::DRAW));
}

TEST(CatalogJson, WrongSchemaVersion) {
    CardCatalog catalog;
    TEST_ASSERT_FALSE(catalog.load_from_json_string(R"({"schema_version": 2, "protocols": []})"));
    TEST_ASSERT_FALSE(catalog.load_from_json_string(R"({"protocols": []})"));
    TEST_ASSERT_FALSE(catalog.load_from_json_string("{ not json"));
    TEST_ASSERT_EQ(3u, catalog.errors().size());
}

TEST(CatalogJson, MissingFile) {
    CardCatalog catalog;
    TEST_ASSERT_FALSE(catalog.load_from_json("does/not/exist.json"));
    TEST_ASSERT_EQ(1u, catalog.errors().size());
}

TEST(CatalogJson, LoadsCustomProtocolFile) {
    CardCatalog catalog;
    protocols::register_all_protocols(catalog);

    TEST_ASSERT_TRUE(catalog.load_from_json(data_path("custom_protocols.json")));
    TEST_ASSERT_TRUE(catalog.has_protocol("Anarchy"));
    TEST_ASSERT_EQ(96u, catalog.card_count());
    TEST_ASSERT_TRUE(catalog.get_card("Anarchy-1")->has_passive(PassiveKind::INVERT_PROTOCOL_MATCHING));
    TEST_ASSERT_TRUE(catalog.get_card("Anarchy-6")->has_passive(PassiveKind::IGNORE_PROTOCOL_MATCHING_SELF));
}

TEST(CatalogJson, EngineLoadsCustomProtocols) {
    GameConfig config;
    config.custom_protocols_path = data_path("custom_protocols.json");
    CompileEngine engine(config);

    TEST_ASSERT_TRUE(engine.catalog().has_protocol("Anarchy"));
    GameState state = engine.create_initial_state({"Anarchy", "Life", "Water"}, {"Metal", "Death", "Hate"},
                                                  false, PLAYER, 7u);
    TEST_ASSERT_EQ(36, state.next_card_serial);
    TEST_ASSERT_TRUE(engine.check_invariants(state).empty());
}

// ============================================================================
// GAME CONFIG
// ============================================================================

TEST(Config, Defaults) {
    GameConfig config;
    TEST_ASSERT_EQ(5, config.hand_limit);
    TEST_ASSERT_EQ(5, config.starting_hand);
    TEST_ASSERT_FALSE(config.use_control_mechanic);
    TEST_ASSERT_TRUE(config.allow_recompile);
    TEST_ASSERT_FALSE(config.seed.has_value());
    TEST_ASSERT_EQ("Speed", config.player_protocols[0]);
    TEST_ASSERT_EQ("Hate", config.opponent_protocols[2]);
}

TEST(Config, LoadFromString) {
    GameConfig config;
    bool ok = config.load_from_json_string(R"({
        "use_control_mechanic": true,
        "seed": 1234,
        "player_protocols": ["Fire", "Light", "Love"],
        "opponent_difficulty": "hard"
    })");

    TEST_ASSERT_TRUE(ok);
    TEST_ASSERT_TRUE(config.use_control_mechanic);
    TEST_ASSERT_TRUE(config.seed.has_value());
    TEST_ASSERT_EQ(1234u, *config.seed);
    TEST_ASSERT_EQ("Love", config.player_protocols[2]);
    TEST_ASSERT(config.opponent_difficulty == Difficulty::HARD);
    // Untouched keys keep their defaults
    TEST_ASSERT_EQ(5, config.hand_limit);
    TEST_ASSERT_EQ("Metal", config.opponent_protocols[0]);
}

TEST(Config, BadValueLeavesConfigUnchanged) {
    GameConfig config;
    TEST_ASSERT_FALSE(config.load_from_json_string(R"({"hand_limit": 7, "seed": "soon"})"));
    TEST_ASSERT_EQ(5, config.hand_limit);
    TEST_ASSERT_FALSE(config.seed.has_value());

    TEST_ASSERT_FALSE(config.load_from_json_string(R"({"player_protocols": ["Fire", "Light"]})"));
    TEST_ASSERT_EQ("Speed", config.player_protocols[0]);

    TEST_ASSERT_FALSE(config.load_from_json_string(R"({"player_difficulty": "brutal"})"));
    TEST_ASSERT(config.player_difficulty == Difficulty::NORMAL);

    TEST_ASSERT_FALSE(config.load_from_json_string("[1, 2"));
}

TEST(Config, RoundTripThroughJson) {
    GameConfig config;
    config.hand_limit = 6;
    config.seed = 99u;
    config.opponent_protocols = {"Psychic", "Spirit", "Gravity"};

    GameConfig copy;
    TEST_ASSERT_TRUE(copy.load_from_json_string(config.to_json_string()));
    TEST_ASSERT_EQ(6, copy.hand_limit);
    TEST_ASSERT_EQ(99u, *copy.seed);
    TEST_ASSERT_EQ("Gravity", copy.opponent_protocols[2]);
}

TEST(Config, LoadsShippedFile) {
    GameConfig config;
    TEST_ASSERT_TRUE(config.load_from_json(data_path("game_config.json")));
    TEST_ASSERT_FALSE(config.load_from_json(data_path("missing.json")));
}
