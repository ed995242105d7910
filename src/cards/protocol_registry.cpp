/**
 * Compile Engine - Protocol Registry Implementation
 *
 * Central registration point for the built-in protocols.
 */

#include "cards/protocol_registry.hpp"
#include <algorithm>

namespace compile {
namespace protocols {

// ============================================================================
// PROTOCOL INFO DATABASE
// ============================================================================

namespace {

const std::vector<ProtocolInfo> g_protocol_info = {
    {"Apathy", "face-down value and mass flips", {0, 1, 2, 3, 4, 5}},
    {"Darkness", "shifts and hidden pressure", {0, 1, 2, 3, 4, 5}},
    {"Death", "deletes", {0, 1, 2, 3, 4, 5}},
    {"Fire", "discard for effect", {0, 1, 2, 3, 4, 5}},
    {"Gravity", "pulling cards into a line", {0, 1, 2, 4, 5, 6}},
    {"Hate", "deletes at a cost", {0, 1, 2, 3, 4, 5}},
    {"Life", "plays from the deck", {0, 1, 2, 3, 4, 5}},
    {"Light", "draws and reveals", {0, 1, 2, 3, 4, 5}},
    {"Love", "trading cards with the opponent", {1, 2, 3, 4, 5, 6}},
    {"Metal", "blocking and protection", {0, 1, 2, 3, 5, 6}},
    {"Plague", "opponent discards", {0, 1, 2, 3, 4, 5}},
    {"Psychic", "hand disruption and control", {0, 1, 2, 3, 4, 5}},
    {"Speed", "extra plays and shifts", {0, 1, 2, 3, 4, 5}},
    {"Spirit", "flexible plays and draws", {0, 1, 2, 3, 4, 5}},
    {"Water", "returns and protocol changes", {0, 1, 2, 3, 4, 5}},
};

} // anonymous namespace

// ============================================================================
// REGISTRATION
// ============================================================================

void register_all_protocols(CardCatalog& catalog) {
    register_apathy(catalog);
    register_darkness(catalog);
    register_death(catalog);
    register_fire(catalog);
    register_gravity(catalog);
    register_hate(catalog);
    register_life(catalog);
    register_light(catalog);
    register_love(catalog);
    register_metal(catalog);
    register_plague(catalog);
    register_psychic(catalog);
    register_speed(catalog);
    register_spirit(catalog);
    register_water(catalog);
}

std::vector<ProtocolInfo> get_protocol_info() {
    return g_protocol_info;
}

bool is_built_in_protocol(const std::string& name) {
    return std::any_of(g_protocol_info.begin(), g_protocol_info.end(),
                       [&name](const ProtocolInfo& info) { return info.name == name; });
}

} // namespace protocols
} // namespace compile
