/**
 * Compile Engine - Board State
 *
 * Represents one player's side of the three lanes.
 * Each lane is ordered bottom (oldest, covered) to top (newest, uncovered).
 */

#pragma once

#include "played_card.hpp"
#include <optional>

namespace compile {

using Lane = std::vector<PlayedCard>;

/**
 * CardLocation - Where a card sits on a board.
 */
struct CardLocation {
    int lane = -1;
    int index = -1;

    bool is_valid() const { return lane >= 0 && index >= 0; }
};

/**
 * Board - A player's three stacks.
 */
struct Board {
    std::array<Lane, LANE_COUNT> lanes;

    // ========================================================================
    // STACK ACCESS
    // ========================================================================

    PlayedCard* top(int lane) {
        if (!is_valid_lane(lane) || lanes[lane].empty()) {
            return nullptr;
        }
        return &lanes[lane].back();
    }

    const PlayedCard* top(int lane) const {
        if (!is_valid_lane(lane) || lanes[lane].empty()) {
            return nullptr;
        }
        return &lanes[lane].back();
    }

    int lane_size(int lane) const {
        return static_cast<int>(lanes[lane].size());
    }

    bool is_uncovered(const CardLocation& loc) const {
        return loc.is_valid() && loc.index == lane_size(loc.lane) - 1;
    }

    int card_count() const {
        int total = 0;
        for (const auto& lane : lanes) {
            total += static_cast<int>(lane.size());
        }
        return total;
    }

    // ========================================================================
    // LOOKUP
    // ========================================================================

    CardLocation locate(const CardID& card_id) const {
        for (int lane = 0; lane < LANE_COUNT; lane++) {
            for (int i = 0; i < lane_size(lane); i++) {
                if (lanes[lane][i].id == card_id) {
                    return CardLocation{lane, i};
                }
            }
        }
        return CardLocation{};
    }

    PlayedCard* find_card(const CardID& card_id) {
        CardLocation loc = locate(card_id);
        if (!loc.is_valid()) {
            return nullptr;
        }
        return &lanes[loc.lane][loc.index];
    }

    const PlayedCard* find_card(const CardID& card_id) const {
        CardLocation loc = locate(card_id);
        if (!loc.is_valid()) {
            return nullptr;
        }
        return &lanes[loc.lane][loc.index];
    }

    // ========================================================================
    // MUTATION
    // ========================================================================

    void place_on_top(int lane, PlayedCard card) {
        lanes[lane].push_back(std::move(card));
    }

    void insert_at(int lane, int index, PlayedCard card) {
        if (index < 0 || index > lane_size(lane)) {
            lanes[lane].push_back(std::move(card));
        } else {
            lanes[lane].insert(lanes[lane].begin() + index, std::move(card));
        }
    }

    std::optional<PlayedCard> take_card(const CardID& card_id) {
        CardLocation loc = locate(card_id);
        if (!loc.is_valid()) {
            return std::nullopt;
        }
        PlayedCard removed = std::move(lanes[loc.lane][loc.index]);
        lanes[loc.lane].erase(lanes[loc.lane].begin() + loc.index);
        return removed;
    }

    std::vector<PlayedCard> clear_lane(int lane) {
        std::vector<PlayedCard> removed = std::move(lanes[lane]);
        lanes[lane].clear();
        return removed;
    }
};

} // namespace compile
