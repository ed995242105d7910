/**
 * Compile Engine - Game Configuration
 *
 * Options fixed at game creation. Loaded from JSON with nlohmann/json and
 * overridable from the console command line.
 */

#pragma once

#include "types.hpp"
#include <nlohmann/json_fwd.hpp>

namespace compile {

struct GameConfig {
    bool use_control_mechanic = false;
    bool allow_recompile = true;       // A compiled protocol may compile again for a card
    int hand_limit = HAND_LIMIT;
    int starting_hand = STARTING_HAND;
    std::optional<uint32_t> seed;      // Unset: seeded from the clock

    ProtocolList player_protocols = {"Speed", "Life", "Water"};
    ProtocolList opponent_protocols = {"Metal", "Death", "Hate"};

    Difficulty player_difficulty = Difficulty::NORMAL;
    Difficulty opponent_difficulty = Difficulty::NORMAL;

    bool xray_logging = false;
    std::string xray_directory = "logs";
    std::string custom_protocols_path;

    /**
     * Load settings from a JSON file. Missing keys keep their defaults.
     * Returns false if the file cannot be read or a value has the wrong type.
     */
    bool load_from_json(const std::string& filepath);

    bool load_from_json_string(const std::string& text);

    std::string to_json_string() const;

private:
    bool apply(const nlohmann::json& data);
};

} // namespace compile
