/**
 * Compile Engine - Zone Container
 *
 * Represents a card zone (deck, hand, discard pile).
 * Index 0 of a deck is its top card.
 */

#pragma once

#include "played_card.hpp"
#include <algorithm>
#include <random>

namespace compile {

/**
 * Zone - Ordered container for cards.
 */
struct Zone {
    std::vector<PlayedCard> cards;
    bool is_hidden = false;    // Whether zone is hidden from both players

    // ========================================================================
    // CONSTRUCTORS
    // ========================================================================

    Zone() = default;

    explicit Zone(bool hidden)
        : is_hidden(hidden)
    {}

    // ========================================================================
    // BASIC OPERATIONS
    // ========================================================================

    void add_card(PlayedCard card, int position = -1) {
        if (position < 0 || position >= static_cast<int>(cards.size())) {
            cards.push_back(std::move(card));
        } else {
            cards.insert(cards.begin() + position, std::move(card));
        }
    }

    // Remove and return card (move semantics)
    std::optional<PlayedCard> take_card(const CardID& card_id) {
        for (auto it = cards.begin(); it != cards.end(); ++it) {
            if (it->id == card_id) {
                PlayedCard removed = std::move(*it);
                cards.erase(it);
                return removed;
            }
        }
        return std::nullopt;
    }

    std::optional<PlayedCard> take_at(int index) {
        if (index < 0 || index >= static_cast<int>(cards.size())) {
            return std::nullopt;
        }
        PlayedCard removed = std::move(cards[index]);
        cards.erase(cards.begin() + index);
        return removed;
    }

    PlayedCard* find_card(const CardID& card_id) {
        for (auto& card : cards) {
            if (card.id == card_id) {
                return &card;
            }
        }
        return nullptr;
    }

    const PlayedCard* find_card(const CardID& card_id) const {
        for (const auto& card : cards) {
            if (card.id == card_id) {
                return &card;
            }
        }
        return nullptr;
    }

    bool contains(const CardID& card_id) const {
        return find_card(card_id) != nullptr;
    }

    int count() const {
        return static_cast<int>(cards.size());
    }

    bool is_empty() const {
        return cards.empty();
    }

    // ========================================================================
    // DECK OPERATIONS
    // ========================================================================

    // Draw from top of deck (index 0)
    std::optional<PlayedCard> draw_top() {
        if (cards.empty()) {
            return std::nullopt;
        }
        PlayedCard top = std::move(cards.front());
        cards.erase(cards.begin());
        return top;
    }

    const PlayedCard* peek_top() const {
        if (cards.empty()) {
            return nullptr;
        }
        return &cards.front();
    }

    void add_to_bottom(PlayedCard card) {
        cards.push_back(std::move(card));
    }

    void add_to_top(PlayedCard card) {
        cards.insert(cards.begin(), std::move(card));
    }

    template<typename RNG>
    void shuffle(RNG& rng) {
        std::shuffle(cards.begin(), cards.end(), rng);
    }

    // ========================================================================
    // CLONING
    // ========================================================================

    Zone clone() const {
        Zone copy;
        copy.is_hidden = is_hidden;
        copy.cards = cards;
        return copy;
    }
};

} // namespace compile
