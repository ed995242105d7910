/**
 * Compile Engine - Played Card
 *
 * A physical card bound to a unique identity. The identity never changes;
 * moves, shifts and flips only change orientation and container membership.
 */

#pragma once

#include "types.hpp"

namespace compile {

/**
 * PlayedCard - A card instance in a deck, hand, discard pile or lane.
 */
struct PlayedCard {
    // Identity (immutable after creation)
    CardID id;                  // Unique instance ID (e.g., "p0_12")
    std::string protocol;       // Protocol name (e.g., "Speed")
    int value = 0;              // Printed value

    // Runtime state (mutable)
    bool face_up = false;
    bool revealed = false;      // Known to the other player while hidden

    // ========================================================================
    // CONSTRUCTORS
    // ========================================================================

    PlayedCard() = default;

    PlayedCard(CardID id_, std::string protocol_, int value_)
        : id(std::move(id_))
        , protocol(std::move(protocol_))
        , value(value_)
    {}

    // ========================================================================
    // QUERIES
    // ========================================================================

    CardDefID def_id() const {
        return protocol + "-" + std::to_string(value);
    }

    std::string name() const {
        return def_id();
    }

    /**
     * Reset runtime state when the card leaves the field.
     */
    void reset() {
        face_up = false;
        revealed = false;
    }

    PlayedCard clone() const {
        return *this;
    }
};

} // namespace compile
