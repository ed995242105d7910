/**
 * Compile Engine - Protocol Registry
 *
 * Central registration point for the built-in protocols.
 * Each protocol lives in its own file under src/cards/protocols/ and
 * registers its six cards into a CardCatalog.
 */

#pragma once

#include "../card_catalog.hpp"
#include "effect_builders.hpp"
#include <string>
#include <vector>

namespace compile {
namespace protocols {

// ============================================================================
// PROTOCOL INFO STRUCTURE
// ============================================================================

/**
 * ProtocolInfo - Metadata about a built-in protocol.
 */
struct ProtocolInfo {
    std::string name;
    std::string theme;      // What the protocol's cards mostly do
    std::vector<int> values;
};

// ============================================================================
// REGISTRATION FUNCTIONS
// ============================================================================

/**
 * Register all built-in protocols.
 *
 * Call this once per catalog at startup.
 */
void register_all_protocols(CardCatalog& catalog);

/**
 * Get list of all built-in protocols.
 */
std::vector<ProtocolInfo> get_protocol_info();

/**
 * Check if a protocol ships with the engine.
 */
bool is_built_in_protocol(const std::string& name);

// ============================================================================
// INDIVIDUAL PROTOCOL REGISTRATIONS
// ============================================================================

void register_apathy(CardCatalog& catalog);
void register_darkness(CardCatalog& catalog);
void register_death(CardCatalog& catalog);
void register_fire(CardCatalog& catalog);
void register_gravity(CardCatalog& catalog);
void register_hate(CardCatalog& catalog);
void register_life(CardCatalog& catalog);
void register_light(CardCatalog& catalog);
void register_love(CardCatalog& catalog);
void register_metal(CardCatalog& catalog);
void register_plague(CardCatalog& catalog);
void register_psychic(CardCatalog& catalog);
void register_speed(CardCatalog& catalog);
void register_spirit(CardCatalog& catalog);
void register_water(CardCatalog& catalog);

} // namespace protocols
} // namespace compile
