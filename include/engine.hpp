/**
 * Compile Engine - Main Engine Interface
 *
 * This is the primary interface for the rules engine.
 * Every transition takes a state by const reference and returns a
 * StepResult holding the next state. Illegal intents are reported in the
 * result and leave the input untouched; no rule violation throws.
 * Setup is the exception: create_initial_state throws std::invalid_argument
 * for arguments no game can start from.
 */

#pragma once

#include "game_state.hpp"
#include "card_catalog.hpp"
#include "game_config.hpp"
#include "effect_resolver.hpp"
#include "passive_rules.hpp"
#include "action.hpp"
#include <functional>

namespace compile {

/**
 * StepResult - Outcome of one transition.
 */
struct StepResult {
    GameState state;
    bool ok = true;
    IllegalIntent error = IllegalIntent::NONE;
    std::string message;
    std::vector<BoardEvent> events;     // Copy of state.events for convenience
};

/**
 * CompileEngine - The game engine.
 *
 * Stateless apart from the catalog and configuration, both read-only after
 * construction. Safe to share between threads as long as each thread works
 * on its own GameState.
 */
class CompileEngine {
public:
    /**
     * Built-in protocols plus config.custom_protocols_path, if set.
     */
    explicit CompileEngine(GameConfig config = GameConfig());

    /**
     * Use a caller-provided catalog (built-ins are not added).
     */
    CompileEngine(CardCatalog catalog, GameConfig config);

    // ========================================================================
    // GAME SETUP
    // ========================================================================

    /**
     * Build decks from the six cards of each protocol, shuffle, deal and
     * advance to the first decision.
     * Throws std::invalid_argument for an unknown or repeated protocol, or
     * a starting player other than 0 or 1.
     * No starting player: decided by a coin flip on the seeded RNG.
     */
    GameState create_initial_state(const ProtocolList& player_protocols,
                                   const ProtocolList& opponent_protocols,
                                   bool use_control_mechanic,
                                   std::optional<PlayerID> starting_player = std::nullopt,
                                   std::optional<uint32_t> seed = std::nullopt) const;

    // Protocols, control mechanic and seed taken from the config
    GameState create_initial_state() const;

    // ========================================================================
    // TURN ACTIONS
    // ========================================================================

    StepResult play_card(const GameState& state, const CardID& card_id, int lane, bool face_up,
                         std::optional<PlayerID> actor = std::nullopt) const;

    StepResult fill_hand(const GameState& state, std::optional<PlayerID> actor = std::nullopt) const;

    /**
     * Compile one of the compilable lanes. Raises the control prompt first
     * when the turn player holds the control component.
     */
    StepResult compile_lane(const GameState& state, int lane, std::optional<PlayerID> actor = std::nullopt) const;

    /**
     * Run the compile itself, skipping the phase check and the control prompt.
     * Returns the state unchanged for a lane the turn player cannot compile
     * (no such lane, not leading at 10 or more, or blocked by Metal-1).
     * on_end_game is called with the winner if this compile ends the game.
     */
    GameState perform_compile(const GameState& state, int lane,
                              const std::function<void(PlayerID)>& on_end_game = nullptr) const;

    // ========================================================================
    // RESOLVING THE ACTIVE ACTION
    // ========================================================================

    StepResult resolve_action_with_card(const GameState& state, const CardID& card_id,
                                        std::optional<PlayerID> actor = std::nullopt) const;

    StepResult resolve_action_with_lane(const GameState& state, int lane,
                                        std::optional<PlayerID> actor = std::nullopt) const;

    StepResult resolve_discard(const GameState& state, const std::vector<CardID>& card_ids,
                               std::optional<PlayerID> actor = std::nullopt) const;

    StepResult resolve_hand_play(const GameState& state, const CardID& card_id, int lane, bool face_up,
                                 std::optional<PlayerID> actor = std::nullopt) const;

    StepResult resolve_hand_card(const GameState& state, const CardID& card_id,
                                 std::optional<PlayerID> actor = std::nullopt) const;

    StepResult resolve_prompt(const GameState& state, bool accept,
                              std::optional<PlayerID> actor = std::nullopt) const;

    StepResult resolve_choice(const GameState& state, int index,
                              std::optional<PlayerID> actor = std::nullopt) const;

    StepResult resolve_rearrange(const GameState& state, const ProtocolList& order,
                                 std::optional<PlayerID> actor = std::nullopt) const;

    StepResult resolve_swap(const GameState& state, int first, int second,
                            std::optional<PlayerID> actor = std::nullopt) const;

    StepResult resolve_control(const GameState& state, ControlChoice choice,
                               std::optional<PlayerID> actor = std::nullopt) const;

    // Only valid when the active action is optional
    StepResult skip_action(const GameState& state, std::optional<PlayerID> actor = std::nullopt) const;

    // ========================================================================
    // GENERIC API
    // ========================================================================

    /**
     * Apply an intent produced by the AI or the console.
     */
    StepResult step(const GameState& state, const AIAction& action) const;

    /**
     * Every intent the expected actor may submit.
     * Variable discards list the minimal single-card choices only.
     */
    std::vector<AIAction> get_legal_actions(const GameState& state) const;

    // Player who must supply the next intent
    PlayerID expected_actor(const GameState& state) const;

    // ========================================================================
    // QUERIES
    // ========================================================================

    /**
     * Whether a card may be picked for the active action. Pure.
     */
    bool is_card_targetable(const GameState& state, const CardID& card_id) const;

    LanePlayability get_lane_playability(const GameState& state, PlayerID player, int lane,
                                         const std::optional<CardID>& card_id = std::nullopt) const;

    std::vector<int> compilable_lanes(const GameState& state, PlayerID player) const;

    /**
     * Internal consistency checks. Empty when the state is sound.
     */
    std::vector<std::string> check_invariants(const GameState& state) const;

    const CardCatalog& catalog() const { return catalog_; }
    const GameConfig& config() const { return config_; }

private:
    CardCatalog catalog_;
    GameConfig config_;

    EffectResolver resolver() const { return EffectResolver(catalog_, config_); }

    // ========================================================================
    // TRANSITION PLUMBING
    // ========================================================================

    GameState begin(const GameState& state) const;
    StepResult reject(const GameState& state, IllegalIntent error, const std::string& message) const;
    StepResult finish(GameState state) const;

    // Common checks for resolving the active action
    IllegalIntent check_pending(const GameState& state, std::optional<PlayerID> actor) const;

    // Common checks for turn actions of the action phase
    IllegalIntent check_turn_action(const GameState& state, std::optional<PlayerID> actor) const;

    /**
     * Drain the interrupt stack and the queue, then let the phase machine
     * run until an action needs input or the game ends.
     */
    void settle(GameState& state) const;

    // ========================================================================
    // PHASE MACHINE (phase_machine.cpp)
    // ========================================================================

    // Returns false when the phase waits for the turn player
    bool advance_phase(GameState& state) const;

    bool run_phase_effects(GameState& state, Trigger trigger) const;
    bool run_clear_cache(GameState& state) const;
    void update_control(GameState& state) const;
    void end_turn(GameState& state) const;

    // ========================================================================
    // COMPILE AND CONTROL (compile.cpp)
    // ========================================================================

    void do_compile(GameState& state, int lane) const;
    void do_fill_hand(GameState& state, PlayerID player) const;

    // Raise the control prompt if the player holds control; true if raised
    bool offer_control(GameState& state, PlayerID player, ControlOrigin origin, int lane) const;

    void continue_after_control(GameState& state, ControlOrigin origin, int lane) const;
};

} // namespace compile
