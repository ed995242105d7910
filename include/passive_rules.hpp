/**
 * Compile Engine - Passive Rules
 *
 * Pure queries over a GameState: which boxes are active, effective card
 * and lane values, play legality and target filtering.
 * Nothing here mutates state except recalculate_lane_values().
 */

#pragma once

#include "game_state.hpp"
#include "card_catalog.hpp"

namespace compile {

// ============================================================================
// RESULT TYPES
// ============================================================================

struct PlayCheck {
    bool allowed = false;
    std::string reason;       // Why the play is refused, empty when allowed
};

struct LanePlayability {
    bool is_playable = false;
    bool face_up_allowed = false;
    bool face_down_allowed = false;
    std::string reason;
};

// ============================================================================
// BOX ACTIVITY
// ============================================================================

/**
 * Top box: face-up, covered or not.
 * Middle box: face-up (only consulted when it runs).
 * Bottom box: face-up and uncovered.
 */
bool is_box_active(const GameState& state, const BoardPosition& pos, Box box);

bool is_passive_active(const CardCatalog& catalog, const GameState& state,
                       const BoardPosition& pos, PassiveKind kind);

// Sum of amounts of active passives of one kind in a single stack
int stack_passive_total(const CardCatalog& catalog, const GameState& state,
                        PlayerID owner, int lane, PassiveKind kind);

bool stack_has_passive(const CardCatalog& catalog, const GameState& state,
                       PlayerID owner, int lane, PassiveKind kind);

bool player_has_passive(const CardCatalog& catalog, const GameState& state,
                        PlayerID owner, PassiveKind kind);

bool any_player_has_passive(const CardCatalog& catalog, const GameState& state, PassiveKind kind);

// An active Apathy-2 style card in either stack of the line
bool middle_ignored_in_lane(const CardCatalog& catalog, const GameState& state, int lane);

// ============================================================================
// VALUES
// ============================================================================

int effective_value(const CardCatalog& catalog, const GameState& state, const BoardPosition& pos);

int compute_lane_value(const CardCatalog& catalog, const GameState& state, PlayerID owner, int lane);

void recalculate_lane_values(const CardCatalog& catalog, GameState& state);

// ============================================================================
// PLAY LEGALITY
// ============================================================================

PlayCheck can_play_card(const CardCatalog& catalog, const GameState& state, PlayerID player,
                        const PlayedCard& card, int lane, bool face_up);

/**
 * Lane-level view for presentation and AI.
 * With a card: both orientations are checked for that card.
 * Without: face-up is allowed if any card in hand could go face-up there.
 */
LanePlayability get_lane_playability(const CardCatalog& catalog, const GameState& state,
                                     PlayerID player, int lane, const PlayedCard* card = nullptr);

// ============================================================================
// TARGETING
// ============================================================================

bool matches_filter(const CardCatalog& catalog, const GameState& state, const BoardPosition& pos,
                    const TargetFilter& filter, const EffectContext& ctx);

std::vector<CardID> collect_filter_targets(const CardCatalog& catalog, const GameState& state,
                                           const TargetFilter& filter, const EffectContext& ctx);

bool is_valid_target(const CardCatalog& catalog, const GameState& state,
                     const BoardTargetAction& action, const CardID& card_id);

std::vector<CardID> collect_targets(const CardCatalog& catalog, const GameState& state,
                                    const BoardTargetAction& action);

// ============================================================================
// COMPILE
// ============================================================================

std::vector<int> compute_compilable_lanes(const GameState& state, PlayerID player, bool allow_recompile);

} // namespace compile
