/**
 * Compile Engine - Card Catalog Implementation
 *
 * Loads custom protocol definitions from JSON using nlohmann/json.
 * Parsing is strict: an unknown op, trigger or filter value rejects the
 * whole protocol at load time.
 */

#include "card_catalog.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <unordered_set>

using json = nlohmann::json;

namespace compile {

// ============================================================================
// ENUM PARSING
// ============================================================================

namespace {

template<typename E>
E parse_enum(const std::unordered_map<std::string, E>& table, const std::string& text, const char* what) {
    auto it = table.find(text);
    if (it == table.end()) {
        throw std::invalid_argument(std::string("unknown ") + what + " '" + text + "'");
    }
    return it->second;
}

const std::unordered_map<std::string, EffectOp> OP_NAMES = {
    {"draw", EffectOp::DRAW},
    {"draw_from_opponent_deck", EffectOp::DRAW_FROM_OPPONENT_DECK},
    {"discard", EffectOp::DISCARD},
    {"refresh", EffectOp::REFRESH},
    {"flip", EffectOp::FLIP},
    {"flip_all", EffectOp::FLIP_ALL},
    {"flip_self", EffectOp::FLIP_SELF},
    {"delete", EffectOp::DELETE},
    {"delete_all_in_lane", EffectOp::DELETE_ALL_IN_LANE},
    {"delete_highest", EffectOp::DELETE_HIGHEST},
    {"delete_lowest_covered", EffectOp::DELETE_LOWEST_COVERED},
    {"delete_each_other_lane", EffectOp::DELETE_EACH_OTHER_LANE},
    {"delete_self", EffectOp::DELETE_SELF},
    {"shift", EffectOp::SHIFT},
    {"shift_all", EffectOp::SHIFT_ALL},
    {"shift_self", EffectOp::SHIFT_SELF},
    {"return", EffectOp::RETURN},
    {"return_all_in_lane", EffectOp::RETURN_ALL_IN_LANE},
    {"play_from_hand", EffectOp::PLAY_FROM_HAND},
    {"play_from_deck", EffectOp::PLAY_FROM_DECK},
    {"reveal_hand", EffectOp::REVEAL_HAND},
    {"reveal_from_hand", EffectOp::REVEAL_FROM_HAND},
    {"reveal_board_card", EffectOp::REVEAL_BOARD_CARD},
    {"give_card", EffectOp::GIVE_CARD},
    {"take_random_card", EffectOp::TAKE_RANDOM_CARD},
    {"rearrange_protocols", EffectOp::REARRANGE_PROTOCOLS},
    {"swap_protocols", EffectOp::SWAP_PROTOCOLS},
    {"block_compile", EffectOp::BLOCK_COMPILE},
    {"choose", EffectOp::CHOOSE},
};

const std::unordered_map<std::string, Trigger> TRIGGER_NAMES = {
    {"on_play", Trigger::ON_PLAY},
    {"on_cover", Trigger::ON_COVER},
    {"start", Trigger::START},
    {"end", Trigger::END},
    {"after_delete", Trigger::AFTER_DELETE},
    {"after_opponent_discard", Trigger::AFTER_OPPONENT_DISCARD},
    {"after_clear_cache", Trigger::AFTER_CLEAR_CACHE},
    {"after_draw", Trigger::AFTER_DRAW},
};

const std::unordered_map<std::string, Box> BOX_NAMES = {
    {"top", Box::TOP},
    {"middle", Box::MIDDLE},
    {"bottom", Box::BOTTOM},
};

const std::unordered_map<std::string, PassiveKind> PASSIVE_NAMES = {
    {"face_down_value_4", PassiveKind::FACE_DOWN_VALUE_4},
    {"opponent_total_minus", PassiveKind::OPPONENT_TOTAL_MINUS},
    {"own_total_plus_per_face_down", PassiveKind::OWN_TOTAL_PLUS_PER_FACE_DOWN},
    {"block_face_down_play_in_lane", PassiveKind::BLOCK_FACE_DOWN_PLAY_IN_LANE},
    {"block_play_in_lane", PassiveKind::BLOCK_PLAY_IN_LANE},
    {"opponent_plays_face_down_only", PassiveKind::OPPONENT_PLAYS_FACE_DOWN_ONLY},
    {"play_any_lane", PassiveKind::PLAY_ANY_LANE},
    {"skip_check_cache", PassiveKind::SKIP_CHECK_CACHE},
    {"ignore_middle_in_lane", PassiveKind::IGNORE_MIDDLE_IN_LANE},
    {"shift_on_compile_delete", PassiveKind::SHIFT_ON_COMPILE_DELETE},
    {"delete_when_flipped", PassiveKind::DELETE_WHEN_FLIPPED},
    {"invert_protocol_matching", PassiveKind::INVERT_PROTOCOL_MATCHING},
    {"ignore_protocol_matching_self", PassiveKind::IGNORE_PROTOCOL_MATCHING_SELF},
};

const std::unordered_map<std::string, OwnerFilter> OWNER_NAMES = {
    {"any", OwnerFilter::ANY},
    {"own", OwnerFilter::OWN},
    {"opponent", OwnerFilter::OPPONENT},
};

const std::unordered_map<std::string, FaceFilter> FACE_NAMES = {
    {"any", FaceFilter::ANY},
    {"face_up", FaceFilter::FACE_UP},
    {"face_down", FaceFilter::FACE_DOWN},
};

const std::unordered_map<std::string, PositionFilter> POSITION_NAMES = {
    {"uncovered", PositionFilter::UNCOVERED},
    {"covered", PositionFilter::COVERED},
    {"any", PositionFilter::ANY},
};

const std::unordered_map<std::string, LaneScope> LANE_SCOPE_NAMES = {
    {"any", LaneScope::ANY},
    {"this_lane", LaneScope::THIS_LANE},
    {"other_lanes", LaneScope::OTHER_LANES},
};

const std::unordered_map<std::string, EffectActor> ACTOR_NAMES = {
    {"self", EffectActor::SELF},
    {"opponent", EffectActor::OPPONENT},
};

const std::unordered_map<std::string, Condition> CONDITION_NAMES = {
    {"always", Condition::ALWAYS},
    {"if_previous", Condition::IF_PREVIOUS},
    {"if_covering", Condition::IF_COVERING},
};

const std::unordered_map<std::string, Subject> SUBJECT_NAMES = {
    {"chosen", Subject::CHOSEN},
    {"previous", Subject::PREVIOUS},
    {"self", Subject::SELF},
};

const std::unordered_map<std::string, AmountMode> AMOUNT_NAMES = {
    {"fixed", AmountMode::FIXED},
    {"previous_plus_one", AmountMode::PREVIOUS_PLUS_ONE},
    {"previous_target_value", AmountMode::PREVIOUS_TARGET_VALUE},
};

const std::unordered_map<std::string, ShiftDestination> DESTINATION_NAMES = {
    {"any_other_lane", ShiftDestination::ANY_OTHER_LANE},
    {"this_lane", ShiftDestination::THIS_LANE},
    {"to_or_from_this_lane", ShiftDestination::TO_OR_FROM_THIS_LANE},
};

const std::unordered_map<std::string, DeckPlayMode> DECK_MODE_NAMES = {
    {"this_lane", DeckPlayMode::THIS_LANE},
    {"another_lane", DeckPlayMode::ANOTHER_LANE},
    {"each_other_lane", DeckPlayMode::EACH_OTHER_LANE},
    {"each_lane_with_own_card", DeckPlayMode::EACH_LANE_WITH_OWN_CARD},
    {"under_self_per_two", DeckPlayMode::UNDER_SELF_PER_TWO},
};

TargetFilter parse_filter(const json& j) {
    TargetFilter filter;
    if (!j.is_object()) {
        throw std::invalid_argument("filter must be an object");
    }
    if (j.contains("owner")) filter.owner = parse_enum(OWNER_NAMES, j["owner"].get<std::string>(), "owner");
    if (j.contains("face")) filter.face = parse_enum(FACE_NAMES, j["face"].get<std::string>(), "face");
    if (j.contains("position")) filter.position = parse_enum(POSITION_NAMES, j["position"].get<std::string>(), "position");
    if (j.contains("lane")) filter.lane = parse_enum(LANE_SCOPE_NAMES, j["lane"].get<std::string>(), "lane scope");
    filter.min_value = j.value("min_value", -1);
    filter.max_value = j.value("max_value", -1);
    filter.exclude_self = j.value("exclude_self", false);
    return filter;
}

EffectInstruction parse_instruction(const json& j) {
    if (!j.is_object() || !j.contains("op")) {
        throw std::invalid_argument("instruction without 'op'");
    }

    EffectInstruction ins;
    ins.op = parse_enum(OP_NAMES, j["op"].get<std::string>(), "op");
    if (j.contains("actor")) ins.actor = parse_enum(ACTOR_NAMES, j["actor"].get<std::string>(), "actor");
    if (j.contains("amount")) ins.amount = parse_enum(AMOUNT_NAMES, j["amount"].get<std::string>(), "amount mode");
    if (j.contains("filter")) ins.filter = parse_filter(j["filter"]);
    if (j.contains("destination")) {
        ins.destination = parse_enum(DESTINATION_NAMES, j["destination"].get<std::string>(), "destination");
    }
    if (j.contains("deck_mode")) {
        ins.deck_mode = parse_enum(DECK_MODE_NAMES, j["deck_mode"].get<std::string>(), "deck mode");
    }
    if (j.contains("subject")) ins.subject = parse_enum(SUBJECT_NAMES, j["subject"].get<std::string>(), "subject");
    if (j.contains("condition")) {
        ins.condition = parse_enum(CONDITION_NAMES, j["condition"].get<std::string>(), "condition");
    }
    ins.count = j.value("count", 1);
    ins.optional = j.value("optional", false);
    ins.variable = j.value("variable", false);
    ins.face_down_only = j.value("face_down_only", false);
    ins.lane_min_cards = j.value("lane_min_cards", 0);
    ins.label = j.value("label", "");

    if (j.contains("alternatives")) {
        for (const auto& alt : j["alternatives"]) {
            ins.alternatives.push_back(parse_instruction(alt));
        }
    }
    return ins;
}

void collect_keywords(const EffectInstruction& ins, uint8_t& flags) {
    auto set = [&flags](Keyword k) { flags |= static_cast<uint8_t>(k); };

    switch (ins.op) {
        case EffectOp::DRAW:
        case EffectOp::DRAW_FROM_OPPONENT_DECK:
        case EffectOp::REFRESH:
            set(Keyword::DRAW);
            break;
        case EffectOp::DISCARD:
            set(Keyword::DISCARD);
            break;
        case EffectOp::FLIP:
        case EffectOp::FLIP_ALL:
        case EffectOp::FLIP_SELF:
            set(Keyword::FLIP);
            break;
        case EffectOp::DELETE:
        case EffectOp::DELETE_ALL_IN_LANE:
        case EffectOp::DELETE_HIGHEST:
        case EffectOp::DELETE_LOWEST_COVERED:
        case EffectOp::DELETE_EACH_OTHER_LANE:
        case EffectOp::DELETE_SELF:
            set(Keyword::DELETE);
            break;
        case EffectOp::SHIFT:
        case EffectOp::SHIFT_ALL:
        case EffectOp::SHIFT_SELF:
            set(Keyword::SHIFT);
            break;
        case EffectOp::RETURN:
        case EffectOp::RETURN_ALL_IN_LANE:
            set(Keyword::RETURN);
            break;
        case EffectOp::PLAY_FROM_HAND:
        case EffectOp::PLAY_FROM_DECK:
            set(Keyword::PLAY);
            break;
        default:
            break;
    }

    for (const auto& alt : ins.alternatives) {
        collect_keywords(alt, flags);
    }
}

std::string validate_instruction(const EffectInstruction& ins, bool nested) {
    if (ins.count < 1) {
        return std::string("count must be at least 1 for ") + to_string(ins.op);
    }
    if (ins.filter.min_value >= 0 && ins.filter.max_value >= 0 && ins.filter.min_value > ins.filter.max_value) {
        return "filter min_value exceeds max_value";
    }
    if (ins.op == EffectOp::CHOOSE) {
        if (nested) {
            return "choose cannot be nested";
        }
        if (ins.alternatives.size() < 2) {
            return "choose needs at least two alternatives";
        }
        for (const auto& alt : ins.alternatives) {
            std::string error = validate_instruction(alt, true);
            if (!error.empty()) return error;
        }
    } else if (!ins.alternatives.empty()) {
        return std::string("alternatives given for ") + to_string(ins.op);
    }
    if (ins.subject == Subject::PREVIOUS) {
        switch (ins.op) {
            case EffectOp::FLIP:
            case EffectOp::SHIFT:
            case EffectOp::DELETE:
            case EffectOp::RETURN:
                break;
            default:
                return std::string("'previous' subject not supported for ") + to_string(ins.op);
        }
    }
    return "";
}

} // anonymous namespace

// ============================================================================
// VALIDATION
// ============================================================================

uint8_t derive_keywords(const CardDef& card) {
    uint8_t flags = 0;
    for (const auto& effect : card.effects) {
        for (const auto& ins : effect.program) {
            collect_keywords(ins, flags);
        }
    }
    return flags;
}

std::string validate_card(const CardDef& card) {
    if (card.protocol.empty()) {
        return "card without protocol";
    }
    if (card.value < MIN_CARD_VALUE || card.value > MAX_CARD_VALUE) {
        return card.id() + ": value out of range";
    }

    for (const auto& effect : card.effects) {
        if (effect.program.empty()) {
            return card.id() + ": empty program for " + to_string(effect.trigger);
        }

        bool box_ok = true;
        switch (effect.trigger) {
            case Trigger::ON_PLAY:
                box_ok = effect.box == Box::MIDDLE;
                break;
            case Trigger::ON_COVER:
            case Trigger::START:
            case Trigger::END:
                box_ok = effect.box != Box::MIDDLE;
                break;
            default:
                box_ok = effect.box == Box::TOP;
                break;
        }
        if (!box_ok) {
            return card.id() + ": trigger " + to_string(effect.trigger) + " cannot live in the "
                + to_string(effect.box) + " box";
        }

        for (const auto& ins : effect.program) {
            std::string error = validate_instruction(ins, false);
            if (!error.empty()) {
                return card.id() + ": " + error;
            }
        }
    }
    return "";
}

// ============================================================================
// CATALOG
// ============================================================================

CardCatalog::CardCatalog() {}

bool CardCatalog::load_from_json(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "[CardCatalog] Failed to open: " << filepath << std::endl;
        errors_.push_back("failed to open " + filepath);
        return false;
    }

    try {
        json data = json::parse(file);
        return load_document(data);
    } catch (const json::parse_error& e) {
        std::cerr << "[CardCatalog] JSON parse error: " << e.what() << std::endl;
        errors_.push_back(e.what());
        return false;
    }
}

bool CardCatalog::load_from_json_string(const std::string& text) {
    try {
        json data = json::parse(text);
        return load_document(data);
    } catch (const json::parse_error& e) {
        std::cerr << "[CardCatalog] JSON parse error: " << e.what() << std::endl;
        errors_.push_back(e.what());
        return false;
    }
}

bool CardCatalog::load_document(const json& data) {
    int version = data.value("schema_version", 0);
    if (version != EFFECT_SCHEMA_VERSION) {
        std::cerr << "[CardCatalog] Unsupported schema_version " << version << std::endl;
        errors_.push_back("unsupported schema_version " + std::to_string(version));
        return false;
    }

    if (!data.contains("protocols") || !data["protocols"].is_array()) {
        std::cerr << "[CardCatalog] No 'protocols' array found" << std::endl;
        errors_.push_back("no 'protocols' array");
        return false;
    }

    bool all_loaded = true;
    int card_count = 0;

    for (const auto& protocol_json : data["protocols"]) {
        std::string name = protocol_json.value("name", "");
        try {
            std::vector<CardDef> cards = parse_protocol(protocol_json);
            for (auto& card : cards) {
                register_card(std::move(card));
                card_count++;
            }
        } catch (const json::exception& e) {
            std::cerr << "[CardCatalog] Rejected protocol '" << name << "': " << e.what() << std::endl;
            errors_.push_back(name + ": " + e.what());
            all_loaded = false;
        } catch (const std::invalid_argument& e) {
            std::cerr << "[CardCatalog] Rejected protocol '" << name << "': " << e.what() << std::endl;
            errors_.push_back(name + ": " + e.what());
            all_loaded = false;
        }
    }

    std::cout << "[CardCatalog] Loaded " << card_count << " custom cards" << std::endl;
    return all_loaded;
}

std::vector<CardDef> CardCatalog::parse_protocol(const json& protocol_json) const {
    std::string name = protocol_json.value("name", "");
    if (name.empty()) {
        throw std::invalid_argument("protocol without name");
    }
    if (has_protocol(name)) {
        throw std::invalid_argument("protocol already registered");
    }
    if (!protocol_json.contains("cards") || !protocol_json["cards"].is_array()) {
        throw std::invalid_argument("no 'cards' array");
    }

    std::vector<CardDef> cards;
    std::unordered_set<int> seen_values;

    for (const auto& card_json : protocol_json["cards"]) {
        CardDef card = parse_card(name, card_json);
        if (!seen_values.insert(card.value).second) {
            throw std::invalid_argument("duplicate value " + std::to_string(card.value));
        }
        card.keywords = derive_keywords(card);
        std::string error = validate_card(card);
        if (!error.empty()) {
            throw std::invalid_argument(error);
        }
        cards.push_back(std::move(card));
    }

    if (cards.empty()) {
        throw std::invalid_argument("protocol has no cards");
    }
    return cards;
}

CardDef CardCatalog::parse_card(const std::string& protocol, const json& card_json) const {
    CardDef card;
    card.protocol = protocol;
    card.custom = true;
    card.value = card_json.at("value").get<int>();
    card.top_text = card_json.value("top", "");
    card.middle_text = card_json.value("middle", "");
    card.bottom_text = card_json.value("bottom", "");

    if (card_json.contains("effects")) {
        for (const auto& effect_json : card_json["effects"]) {
            CardEffect effect;
            effect.trigger = parse_enum(TRIGGER_NAMES, effect_json.at("trigger").get<std::string>(), "trigger");
            effect.box = parse_enum(BOX_NAMES, effect_json.at("box").get<std::string>(), "box");
            for (const auto& ins_json : effect_json.at("program")) {
                effect.program.push_back(parse_instruction(ins_json));
            }
            card.effects.push_back(std::move(effect));
        }
    }

    if (card_json.contains("passives")) {
        for (const auto& passive_json : card_json["passives"]) {
            PassiveRule rule;
            rule.kind = parse_enum(PASSIVE_NAMES, passive_json.at("kind").get<std::string>(), "passive");
            rule.box = parse_enum(BOX_NAMES, passive_json.value("box", std::string("top")), "box");
            rule.amount = passive_json.value("amount", 0);
            card.passives.push_back(rule);
        }
    }

    return card;
}

bool CardCatalog::register_card(CardDef card) {
    card.keywords = derive_keywords(card);
    std::string error = validate_card(card);
    if (!error.empty()) {
        std::cerr << "[CardCatalog] Invalid card: " << error << std::endl;
        errors_.push_back(error);
        return false;
    }

    CardDefID id = card.id();
    auto& ids = protocols_[card.protocol];
    if (std::find(ids.begin(), ids.end(), id) == ids.end()) {
        ids.push_back(id);
        std::sort(ids.begin(), ids.end(), [this, &card, &id](const CardDefID& a, const CardDefID& b) {
            int va = (a == id) ? card.value : cards_.at(a).value;
            int vb = (b == id) ? card.value : cards_.at(b).value;
            return va < vb;
        });
    }
    cards_[id] = std::move(card);
    return true;
}

const CardDef* CardCatalog::get_card(const CardDefID& card_id) const {
    auto it = cards_.find(card_id);
    if (it == cards_.end()) {
        return nullptr;
    }
    return &it->second;
}

const CardDef* CardCatalog::get_card(const std::string& protocol, int value) const {
    return get_card(protocol + "-" + std::to_string(value));
}

std::vector<const CardDef*> CardCatalog::protocol_cards(const std::string& protocol) const {
    std::vector<const CardDef*> result;
    auto it = protocols_.find(protocol);
    if (it == protocols_.end()) {
        return result;
    }
    for (const auto& id : it->second) {
        result.push_back(&cards_.at(id));
    }
    return result;
}

bool CardCatalog::has_protocol(const std::string& protocol) const {
    return protocols_.count(protocol) > 0;
}

std::vector<std::string> CardCatalog::protocols() const {
    std::vector<std::string> names;
    for (const auto& entry : protocols_) {
        names.push_back(entry.first);
    }
    return names;
}

} // namespace compile
