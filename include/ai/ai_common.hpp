/**
 * Compile Engine - AI Heuristics
 *
 * Board reading shared by the AI tiers: card power, board threat,
 * static position evaluation and move scoring helpers.
 */

#pragma once

#include "../engine.hpp"
#include <string>
#include <vector>

namespace compile {
namespace ai {

/**
 * ScoredAction - A legal intent and the score a tier gave it.
 */
struct ScoredAction {
    AIAction action;
    double score = 0.0;
    std::string description;
};

// ============================================================================
// CARD AND LANE READING
// ============================================================================

/**
 * Strength of a card in hand: low printed value with useful keywords.
 * 10 - value, +5 if disruptive, +3 draw, +6 play.
 */
int card_power(const CardCatalog& catalog, const PlayedCard& card);

/**
 * Threat of a card already on the board, used for targeting.
 * Face-down cards are worth their hidden value; face-up cards weigh
 * their value twice plus their persistent boxes.
 */
int card_threat(const CardCatalog& catalog, const GameState& state, const BoardPosition& pos);

/**
 * Compile threat of one player's line: 3 at 10+, 2 at 8+, 1 at 6+.
 * Compiled protocols are no threat.
 */
int lane_threat(const GameState& state, PlayerID owner, int lane);

// Value a face-down card would add on top of this stack
int face_down_value(const CardCatalog& catalog, const GameState& state, PlayerID owner, int lane);

// Lane value gained by playing card there in the given orientation
int play_gain(const CardCatalog& catalog, const GameState& state, PlayerID player,
              const PlayedCard& card, int lane, bool face_up);

/**
 * Face-up card of the opponent with the highest threat, if any.
 */
std::optional<BoardPosition> strongest_face_up(const CardCatalog& catalog, const GameState& state, PlayerID owner);

// ============================================================================
// POSITION EVALUATION
// ============================================================================

/**
 * Static evaluation from one player's point of view.
 * Compiled protocols dominate, then lines close to compiling, then
 * lane leads and cards in hand.
 */
double evaluate(const GameState& state, PlayerID me);

/**
 * Protocol lead of one player for a given protocol order.
 * Compiled flags travel with their protocols.
 */
double protocol_order_score(const GameState& state, PlayerID owner, const ProtocolList& order);

// ============================================================================
// SELECTION
// ============================================================================

/**
 * Highest score wins; ties keep the earliest candidate.
 */
std::optional<AIAction> pick_best(const std::vector<ScoredAction>& scored);

// Skip if the active action allows it, else the first legal intent
AIAction safe_default(const CompileEngine& engine, const GameState& state);

bool is_skip_like(const AIAction& action);

} // namespace ai
} // namespace compile
