/**
 * Compile Engine - Card Catalog
 *
 * Stores immutable card definitions keyed "<Protocol>-<value>".
 * Built-in protocols are registered from C++; custom protocols are
 * loaded from JSON and validated before they become visible.
 */

#pragma once

#include "effect_program.hpp"
#include <map>
#include <unordered_map>
#include <nlohmann/json_fwd.hpp>

namespace compile {

// ============================================================================
// KEYWORDS
// ============================================================================

enum class Keyword : uint8_t {
    DELETE  = 1 << 0,
    FLIP    = 1 << 1,
    SHIFT   = 1 << 2,
    RETURN  = 1 << 3,
    DRAW    = 1 << 4,
    PLAY    = 1 << 5,
    DISCARD = 1 << 6
};

// ============================================================================
// CARD DEFINITION
// ============================================================================

/**
 * Card definition (immutable).
 */
struct CardDef {
    std::string protocol;
    int value = 0;

    // Printed text, one entry per box
    std::string top_text;
    std::string middle_text;
    std::string bottom_text;

    std::vector<CardEffect> effects;
    std::vector<PassiveRule> passives;

    uint8_t keywords = 0;      // Derived from the effect programs
    bool custom = false;       // Loaded from JSON

    CardDefID id() const {
        return protocol + "-" + std::to_string(value);
    }

    bool has_keyword(Keyword k) const {
        return (keywords & static_cast<uint8_t>(k)) != 0;
    }

    // Has at least one keyword that changes the opponent's board or hand
    bool is_disruptive() const {
        return has_keyword(Keyword::DELETE) || has_keyword(Keyword::FLIP)
            || has_keyword(Keyword::SHIFT) || has_keyword(Keyword::RETURN)
            || has_keyword(Keyword::DISCARD);
    }

    const CardEffect* find_effect(Trigger trigger) const {
        for (const auto& effect : effects) {
            if (effect.trigger == trigger) {
                return &effect;
            }
        }
        return nullptr;
    }

    int effect_index(Trigger trigger) const {
        for (size_t i = 0; i < effects.size(); i++) {
            if (effects[i].trigger == trigger) {
                return static_cast<int>(i);
            }
        }
        return -1;
    }

    const PassiveRule* find_passive(PassiveKind kind) const {
        for (const auto& passive : passives) {
            if (passive.kind == kind) {
                return &passive;
            }
        }
        return nullptr;
    }

    bool has_passive(PassiveKind kind) const {
        return find_passive(kind) != nullptr;
    }
};

/**
 * Compute keyword flags from every instruction of every program.
 */
uint8_t derive_keywords(const CardDef& card);

/**
 * Check a definition against the instruction set rules.
 * Returns an empty string when the card is valid.
 */
std::string validate_card(const CardDef& card);

// ============================================================================
// CARD CATALOG
// ============================================================================

/**
 * CardCatalog - Card definition store.
 */
class CardCatalog {
public:
    CardCatalog();

    /**
     * Load custom protocols from a JSON file.
     * Invalid protocols are rejected whole; valid ones are still added.
     * Returns false if the file could not be read or any protocol was rejected.
     */
    bool load_from_json(const std::string& filepath);

    /**
     * Load custom protocols from a JSON document held in memory.
     */
    bool load_from_json_string(const std::string& text);

    /**
     * Add a definition. Keywords are derived here.
     * Returns false (and records an error) if the card fails validation.
     */
    bool register_card(CardDef card);

    /**
     * Get card definition by ID ("Speed-0").
     * Returns nullptr if not found.
     */
    const CardDef* get_card(const CardDefID& card_id) const;

    const CardDef* get_card(const std::string& protocol, int value) const;

    /**
     * Cards of one protocol, sorted by value.
     */
    std::vector<const CardDef*> protocol_cards(const std::string& protocol) const;

    bool has_protocol(const std::string& protocol) const;

    std::vector<std::string> protocols() const;

    size_t card_count() const { return cards_.size(); }

    const std::vector<std::string>& errors() const { return errors_; }

private:
    std::unordered_map<CardDefID, CardDef> cards_;
    std::map<std::string, std::vector<CardDefID>> protocols_;
    std::vector<std::string> errors_;

    bool load_document(const nlohmann::json& data);
    std::vector<CardDef> parse_protocol(const nlohmann::json& protocol_json) const;
    CardDef parse_card(const std::string& protocol, const nlohmann::json& card_json) const;
};

} // namespace compile
