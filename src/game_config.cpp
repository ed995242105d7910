/**
 * Compile Engine - Game Configuration Implementation
 */

#include "game_config.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

namespace compile {

namespace {

ProtocolList parse_protocols(const json& j) {
    ProtocolList protocols;
    if (!j.is_array() || j.size() != protocols.size()) {
        throw std::invalid_argument("protocol list must name exactly 3 protocols");
    }
    for (size_t i = 0; i < protocols.size(); i++) {
        protocols[i] = j[i].get<std::string>();
    }
    return protocols;
}

Difficulty parse_difficulty_field(const json& j) {
    auto difficulty = parse_difficulty(j.get<std::string>());
    if (!difficulty.has_value()) {
        throw std::invalid_argument("unknown difficulty '" + j.get<std::string>() + "'");
    }
    return *difficulty;
}

} // anonymous namespace

bool GameConfig::load_from_json(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "[GameConfig] Failed to open: " << filepath << std::endl;
        return false;
    }

    try {
        json data = json::parse(file);
        return apply(data);
    } catch (const json::parse_error& e) {
        std::cerr << "[GameConfig] JSON parse error: " << e.what() << std::endl;
        return false;
    }
}

bool GameConfig::load_from_json_string(const std::string& text) {
    try {
        json data = json::parse(text);
        return apply(data);
    } catch (const json::parse_error& e) {
        std::cerr << "[GameConfig] JSON parse error: " << e.what() << std::endl;
        return false;
    }
}

bool GameConfig::apply(const json& data) {
    // Work on a copy so a bad value leaves the config untouched
    GameConfig next = *this;

    try {
        next.use_control_mechanic = data.value("use_control_mechanic", next.use_control_mechanic);
        next.allow_recompile = data.value("allow_recompile", next.allow_recompile);
        next.hand_limit = data.value("hand_limit", next.hand_limit);
        next.starting_hand = data.value("starting_hand", next.starting_hand);
        if (data.contains("seed") && !data["seed"].is_null()) {
            next.seed = data["seed"].get<uint32_t>();
        }
        if (data.contains("player_protocols")) {
            next.player_protocols = parse_protocols(data["player_protocols"]);
        }
        if (data.contains("opponent_protocols")) {
            next.opponent_protocols = parse_protocols(data["opponent_protocols"]);
        }
        if (data.contains("player_difficulty")) {
            next.player_difficulty = parse_difficulty_field(data["player_difficulty"]);
        }
        if (data.contains("opponent_difficulty")) {
            next.opponent_difficulty = parse_difficulty_field(data["opponent_difficulty"]);
        }
        next.xray_logging = data.value("xray_logging", next.xray_logging);
        next.xray_directory = data.value("xray_directory", next.xray_directory);
        next.custom_protocols_path = data.value("custom_protocols_path", next.custom_protocols_path);
    } catch (const json::exception& e) {
        std::cerr << "[GameConfig] Invalid value: " << e.what() << std::endl;
        return false;
    } catch (const std::invalid_argument& e) {
        std::cerr << "[GameConfig] Invalid value: " << e.what() << std::endl;
        return false;
    }

    if (next.hand_limit < 1 || next.starting_hand < 0) {
        std::cerr << "[GameConfig] Hand sizes out of range" << std::endl;
        return false;
    }

    *this = next;
    return true;
}

std::string GameConfig::to_json_string() const {
    json data;
    data["use_control_mechanic"] = use_control_mechanic;
    data["allow_recompile"] = allow_recompile;
    data["hand_limit"] = hand_limit;
    data["starting_hand"] = starting_hand;
    if (seed.has_value()) {
        data["seed"] = *seed;
    } else {
        data["seed"] = nullptr;
    }
    data["player_protocols"] = json::array({player_protocols[0], player_protocols[1], player_protocols[2]});
    data["opponent_protocols"] = json::array({opponent_protocols[0], opponent_protocols[1], opponent_protocols[2]});
    data["player_difficulty"] = to_string(player_difficulty);
    data["opponent_difficulty"] = to_string(opponent_difficulty);
    data["xray_logging"] = xray_logging;
    data["xray_directory"] = xray_directory;
    data["custom_protocols_path"] = custom_protocols_path;
    return data.dump(2);
}

} // namespace compile
