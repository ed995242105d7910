/**
 * Compile Engine - Effect Resolver
 *
 * Interprets card effect programs and performs every board mutation
 * (draw, discard, delete, flip, shift, return, play) together with the
 * triggers those mutations fire.
 *
 * Execution model:
 *   - run() executes a program from ctx.pc until it needs input or ends.
 *   - Immediate steps mutate the state and collect fired triggers in
 *     GameState::fired_triggers.
 *   - When triggers fire, the rest of the program is suspended as a
 *     ResumeEffect on the interrupt stack and the triggered programs are
 *     pushed above it, so they finish first.
 *   - Steps that need a choice install an ActionRequired carrying the
 *     context; the resolve_* functions apply the choice and call
 *     finish_step() to carry on.
 */

#pragma once

#include "game_state.hpp"
#include "card_catalog.hpp"
#include "game_config.hpp"

namespace compile {

class EffectResolver {
public:
    EffectResolver(const CardCatalog& catalog, const GameConfig& config);

    // ========================================================================
    // PROGRAM EXECUTION
    // ========================================================================

    /**
     * Run a program from ctx.pc.
     */
    void run(GameState& state, EffectContext ctx) const;

    /**
     * Advance past the step at ctx.pc and keep running.
     * Per-lane steps stay on the same pc until every lane is handled.
     */
    void finish_step(GameState& state, EffectContext ctx) const;

    /**
     * Move collected triggers onto the interrupt stack, first fired on top.
     */
    void push_fired_triggers(GameState& state) const;

    /**
     * Process one deferred entry: run a ResumeEffect, land a CompletePlay,
     * or install a real action (dropping it if it has no legal choice left).
     */
    void process_deferred(GameState& state, ActionRequired action) const;

    /**
     * Build a context for one triggered effect of a board card.
     */
    std::optional<EffectContext> make_context(const GameState& state, const CardID& card_id,
                                              Trigger trigger) const;

    /**
     * Face-up cards of a player whose start or end effect is active and
     * has not been processed in this phase pass.
     */
    std::vector<CardID> collect_phase_effects(const GameState& state, PlayerID player, Trigger trigger) const;

    // Cards of a player whose top-box reactive effect matches the trigger
    void fire_reactive(GameState& state, PlayerID player, Trigger trigger) const;

    // ========================================================================
    // RESOLVING CHOICES
    // ========================================================================

    void resolve_card_choice(GameState& state, const ActionRequired& action, const CardID& card_id) const;
    void resolve_lane_choice(GameState& state, const ActionRequired& action, int lane) const;
    void resolve_discard(GameState& state, const DiscardAction& action, const std::vector<CardID>& card_ids) const;
    void resolve_hand_play(GameState& state, const SelectHandCardToPlay& action,
                           const CardID& card_id, int lane, bool face_up) const;
    void resolve_hand_card(GameState& state, const SelectHandCard& action, const CardID& card_id) const;
    void resolve_prompt(GameState& state, const PromptOptionalEffect& action, bool accept) const;
    void resolve_choice(GameState& state, const PromptChoice& action, int index) const;
    void resolve_effect_order(GameState& state, const SelectEffectToResolve& action, const CardID& card_id) const;
    void resolve_rearrange(GameState& state, const RearrangeProtocols& action, const ProtocolList& order) const;
    void resolve_swap(GameState& state, const SwapProtocols& action, int first, int second) const;

    /**
     * Decline an optional action, or drop a mandatory one that lost its
     * targets. The owning program continues with "did" cleared.
     */
    void skip(GameState& state, const ActionRequired& action) const;

    // ========================================================================
    // BOARD MUTATIONS
    // ========================================================================

    // Returns the number of cards actually drawn
    int draw_cards(GameState& state, PlayerID player, int count, bool fire = true) const;

    // Top card of the opposing deck into the player's hand
    bool draw_from_opponent_deck(GameState& state, PlayerID player) const;

    void discard_from_hand(GameState& state, PlayerID player, const std::vector<CardID>& card_ids) const;

    // Delete a board card, "by" is the player performing the delete
    bool delete_card(GameState& state, const CardID& card_id, PlayerID by, bool check_uncover = true) const;

    void flip_card(GameState& state, const CardID& card_id, PlayerID by) const;

    bool shift_card(GameState& state, const CardID& card_id, int to_lane, PlayerID by) const;

    bool return_card(GameState& state, const CardID& card_id, bool check_uncover = true) const;

    /**
     * Play a card from hand. If the covered card has an active on-cover
     * effect, the card waits in GameState::committed until it resolves.
     */
    void play_from_hand(GameState& state, PlayerID player, const CardID& card_id, int lane, bool face_up) const;

    void complete_play(GameState& state, const CompletePlay& action) const;

    // Top card of the deck, face-down. index -1 plays on top of the stack
    bool play_top_of_deck(GameState& state, PlayerID player, int lane, int index = -1) const;

    void set_protocols(GameState& state, PlayerID player, const ProtocolList& order) const;

    void swap_protocols(GameState& state, PlayerID player, int first, int second) const;

    void reveal_hand(GameState& state, PlayerID player) const;

    const CardCatalog& catalog() const { return catalog_; }

private:
    const CardCatalog& catalog_;
    const GameConfig& config_;

    enum class StepOutcome : uint8_t {
        DONE,       // Step applied (or skipped), continue with the next one
        WAITING,    // Step installed an action
        STOPPED     // Program ends here
    };

    const EffectInstruction* instruction_at(const EffectContext& ctx) const;
    const EffectInstruction* effective_instruction(const EffectContext& ctx) const;
    bool source_valid(const GameState& state, const EffectContext& ctx, const EffectInstruction& ins) const;
    bool condition_met(const GameState& state, const EffectContext& ctx, const EffectInstruction& ins) const;
    int amount_for(const GameState& state, const EffectContext& ctx, const EffectInstruction& ins) const;
    std::string describe(const EffectContext& ctx, const EffectInstruction& ins) const;

    StepOutcome execute(GameState& state, EffectContext& ctx, const EffectInstruction& ins) const;
    StepOutcome execute_board_target(GameState& state, EffectContext& ctx, const EffectInstruction& ins) const;
    StepOutcome execute_on_previous(GameState& state, EffectContext& ctx, const EffectInstruction& ins) const;
    StepOutcome execute_lane_op(GameState& state, EffectContext& ctx, const EffectInstruction& ins) const;
    StepOutcome execute_deck_play(GameState& state, EffectContext& ctx, const EffectInstruction& ins) const;

    StepOutcome select_extreme(GameState& state, EffectContext& ctx, const EffectInstruction& ins,
                               const TargetFilter& filter, bool highest) const;

    // Returns true when a follow-up action was installed
    bool apply_card_choice(GameState& state, EffectContext& ctx, const ActionRequired& action,
                           const CardID& card_id) const;
    bool begin_shift(GameState& state, EffectContext& ctx, const CardID& card_id,
                     const EffectInstruction& ins, bool optional) const;
    void apply_lane_op(GameState& state, const EffectContext& ctx, const EffectInstruction& ins, int lane) const;
    void continue_program(GameState& state, EffectContext ctx, bool advance) const;
    void continue_below(GameState& state, EffectContext ctx, size_t stack_base) const;

    void fire(GameState& state, const CardID& card_id, Trigger trigger) const;
    void handle_uncover(GameState& state, PlayerID owner, int lane, const CardID& previous_top) const;
    void place_card(GameState& state, PlayerID player, PlayedCard card, int lane, bool face_up) const;
    bool has_on_cover(const GameState& state, PlayerID owner, int lane) const;
    void ensure_deck(GameState& state, PlayerID player) const;
};

} // namespace compile
