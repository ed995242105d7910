/**
 * Compile Engine - Effect Resolver Implementation
 */

#include "effect_resolver.hpp"
#include "passive_rules.hpp"
#include <algorithm>
#include <iterator>
#include <random>

namespace compile {

// ============================================================================
// HELPERS
// ============================================================================

namespace {

ResumeEffect make_resume(const EffectContext& ctx) {
    ResumeEffect resume;
    resume.actor = ctx.owner;
    resume.source_card_id = ctx.source_card_id;
    resume.ctx = ctx;
    return resume;
}

template<typename T>
T make_action(const EffectContext& ctx, PlayerID actor, bool optional) {
    T action;
    action.actor = actor;
    action.source_card_id = ctx.source_card_id;
    action.optional = optional;
    action.from_effect = true;
    action.ctx = ctx;
    return action;
}

template<typename T>
T make_board_action(const EffectContext& ctx, const EffectInstruction& ins) {
    T action = make_action<T>(ctx, ctx.actor_for(ins.actor), ins.optional);
    action.filter = ins.filter;
    return action;
}

// Steps whose action carries its own "skip" and needs no separate prompt
bool has_own_skip(const EffectInstruction& ins) {
    if (ins.subject == Subject::PREVIOUS) {
        return ins.op == EffectOp::SHIFT;
    }
    switch (ins.op) {
        case EffectOp::DISCARD:
        case EffectOp::FLIP:
        case EffectOp::DELETE:
        case EffectOp::SHIFT:
        case EffectOp::RETURN:
        case EffectOp::REVEAL_BOARD_CARD:
        case EffectOp::SHIFT_SELF:
        case EffectOp::DELETE_ALL_IN_LANE:
        case EffectOp::RETURN_ALL_IN_LANE:
        case EffectOp::SHIFT_ALL:
        case EffectOp::PLAY_FROM_HAND:
        case EffectOp::GIVE_CARD:
        case EffectOp::REVEAL_FROM_HAND:
        case EffectOp::CHOOSE:
            return true;
        default:
            return false;
    }
}

int cards_in_line(const GameState& state, int lane) {
    return state.players[PLAYER].board.lane_size(lane) + state.players[OPPONENT].board.lane_size(lane);
}

CardID top_id(const GameState& state, PlayerID owner, int lane) {
    const PlayedCard* top = state.players[owner].board.top(lane);
    return top ? top->id : CardID();
}

} // anonymous namespace

EffectResolver::EffectResolver(const CardCatalog& catalog, const GameConfig& config)
    : catalog_(catalog)
    , config_(config)
{}

// ============================================================================
// PROGRAM EXECUTION
// ============================================================================

const EffectInstruction* EffectResolver::instruction_at(const EffectContext& ctx) const {
    const CardDef* def = catalog_.get_card(ctx.source_def_id);
    if (!def || ctx.effect_index < 0 || ctx.effect_index >= static_cast<int>(def->effects.size())) {
        return nullptr;
    }
    const EffectProgram& program = def->effects[ctx.effect_index].program;
    if (ctx.pc < 0 || ctx.pc >= static_cast<int>(program.size())) {
        return nullptr;
    }
    return &program[ctx.pc];
}

const EffectInstruction* EffectResolver::effective_instruction(const EffectContext& ctx) const {
    const EffectInstruction* ins = instruction_at(ctx);
    if (ins && ins->op == EffectOp::CHOOSE && ctx.alternative >= 0
        && ctx.alternative < static_cast<int>(ins->alternatives.size())) {
        return &ins->alternatives[ctx.alternative];
    }
    return ins;
}

bool EffectResolver::source_valid(const GameState& state, const EffectContext& ctx,
                                  const EffectInstruction& ins) const {
    if (ins.op == EffectOp::DELETE_SELF) {
        return true;
    }
    BoardPosition pos = state.locate_on_board(ctx.source_card_id);
    if (!pos.is_valid()) {
        return false;
    }
    if (ctx.trigger == Trigger::ON_COVER) {
        return true;
    }
    return state.board_card(pos)->face_up;
}

bool EffectResolver::condition_met(const GameState& state, const EffectContext& ctx,
                                   const EffectInstruction& ins) const {
    switch (ins.condition) {
        case Condition::ALWAYS:
            return true;
        case Condition::IF_PREVIOUS:
            return ctx.did;
        case Condition::IF_COVERING: {
            BoardPosition pos = state.locate_on_board(ctx.source_card_id);
            return pos.is_valid() && pos.index > 0;
        }
        default:
            return false;
    }
}

int EffectResolver::amount_for(const GameState& state, const EffectContext& ctx,
                               const EffectInstruction& ins) const {
    switch (ins.amount) {
        case AmountMode::PREVIOUS_PLUS_ONE:
            return ctx.amount + 1;
        case AmountMode::PREVIOUS_TARGET_VALUE: {
            // A card that left the board is worth nothing
            BoardPosition pos = state.locate_on_board(ctx.last_target);
            return pos.is_valid() ? effective_value(catalog_, state, pos) : 0;
        }
        case AmountMode::FIXED:
        default:
            return ins.count;
    }
}

std::string EffectResolver::describe(const EffectContext& ctx, const EffectInstruction& ins) const {
    if (!ins.label.empty()) {
        return ins.label;
    }
    std::string text = ctx.source_def_id + ": " + to_string(ins.op);
    if (ins.op == EffectOp::DRAW || ins.op == EffectOp::DISCARD) {
        text += " " + std::to_string(ins.count);
    }
    return text;
}

void EffectResolver::run(GameState& state, EffectContext ctx) const {
    const CardDef* def = catalog_.get_card(ctx.source_def_id);
    if (!def || ctx.effect_index < 0 || ctx.effect_index >= static_cast<int>(def->effects.size())) {
        return;
    }
    const EffectProgram& program = def->effects[ctx.effect_index].program;

    if (ctx.pc == 0 && ctx.trigger == Trigger::ON_PLAY) {
        BoardPosition pos = state.locate_on_board(ctx.source_card_id);
        if (pos.is_valid() && middle_ignored_in_lane(catalog_, state, pos.lane)) {
            state.add_log(ctx.owner, "Middle commands are ignored in this line", ctx.source_def_id);
            return;
        }
    }

    while (ctx.pc < static_cast<int>(program.size())) {
        if (state.is_game_over()) {
            return;
        }

        const EffectInstruction& ins = program[ctx.pc];
        BoardPosition pos = state.locate_on_board(ctx.source_card_id);
        if (pos.is_valid()) {
            ctx.lane = pos.lane;
        }

        if (!source_valid(state, ctx, ins)) {
            state.add_log(ctx.owner, "Effect ends, its card is no longer active", ctx.source_def_id);
            return;
        }

        if (!condition_met(state, ctx, ins)) {
            ctx.did = false;
        } else {
            StepOutcome outcome = execute(state, ctx, ins);
            if (outcome != StepOutcome::DONE) {
                return;
            }
        }

        ctx.pc++;
        ctx.alternative = -1;
        ctx.lanes_done = 0;
        ctx.confirmed = false;

        if (!state.fired_triggers.empty()) {
            if (ctx.pc < static_cast<int>(program.size())) {
                state.push_interrupt(make_resume(ctx));
            }
            push_fired_triggers(state);
            return;
        }
    }
}

void EffectResolver::continue_program(GameState& state, EffectContext ctx, bool advance) const {
    if (advance) {
        ctx.pc++;
        ctx.alternative = -1;
        ctx.lanes_done = 0;
        ctx.confirmed = false;
    }
    if (!state.fired_triggers.empty()) {
        state.push_interrupt(make_resume(ctx));
        push_fired_triggers(state);
        return;
    }
    run(state, ctx);
}

void EffectResolver::finish_step(GameState& state, EffectContext ctx) const {
    const EffectInstruction* ins = instruction_at(ctx);
    bool per_lane = ins && ins->op == EffectOp::DELETE_EACH_OTHER_LANE;
    continue_program(state, ctx, !per_lane);
}

// Entries pushed above stack_base must finish before the program goes on
void EffectResolver::continue_below(GameState& state, EffectContext ctx, size_t stack_base) const {
    if (state.interrupt_stack.size() <= stack_base) {
        finish_step(state, ctx);
        return;
    }
    std::vector<ActionRequired> pending(
        std::make_move_iterator(state.interrupt_stack.begin() + stack_base),
        std::make_move_iterator(state.interrupt_stack.end()));
    state.interrupt_stack.erase(state.interrupt_stack.begin() + stack_base, state.interrupt_stack.end());

    ctx.pc++;
    ctx.alternative = -1;
    ctx.lanes_done = 0;
    ctx.confirmed = false;
    state.push_interrupt(make_resume(ctx));

    for (auto& entry : pending) {
        state.push_interrupt(std::move(entry));
    }
    push_fired_triggers(state);
}

void EffectResolver::push_fired_triggers(GameState& state) const {
    std::vector<EffectContext> fired = std::move(state.fired_triggers);
    state.fired_triggers.clear();
    for (auto it = fired.rbegin(); it != fired.rend(); ++it) {
        state.push_interrupt(make_resume(*it));
    }
}

void EffectResolver::process_deferred(GameState& state, ActionRequired action) const {
    if (auto* resume = std::get_if<ResumeEffect>(&action)) {
        run(state, resume->ctx);
        return;
    }
    if (auto* play = std::get_if<CompletePlay>(&action)) {
        complete_play(state, *play);
        push_fired_triggers(state);
        return;
    }

    // A suspended action may have lost its choices while it waited
    bool still_valid = true;
    if (const BoardTargetAction* target = as_board_target(action)) {
        still_valid = !collect_targets(catalog_, state, *target).empty();
    } else if (auto* lane_shift = std::get_if<SelectLaneForShift>(&action)) {
        BoardPosition pos = state.locate_on_board(lane_shift->card_id);
        still_valid = pos.is_valid() && pos.lane == lane_shift->from_lane;
    } else if (auto* discard = std::get_if<DiscardAction>(&action)) {
        int held = state.players[discard->actor].hand.count();
        still_valid = held > 0;
        discard->count = std::min(discard->count, held);
    } else if (auto* hand = std::get_if<SelectHandCard>(&action)) {
        still_valid = !state.players[hand->actor].hand.is_empty();
    }

    if (!still_valid) {
        skip(state, action);
        return;
    }
    state.issue(std::move(action));
}

std::optional<EffectContext> EffectResolver::make_context(const GameState& state, const CardID& card_id,
                                                          Trigger trigger) const {
    BoardPosition pos = state.locate_on_board(card_id);
    if (!pos.is_valid()) {
        return std::nullopt;
    }
    const PlayedCard* card = state.board_card(pos);
    const CardDef* def = catalog_.get_card(card->def_id());
    if (!def) {
        return std::nullopt;
    }
    int index = def->effect_index(trigger);
    if (index < 0) {
        return std::nullopt;
    }

    EffectContext ctx;
    ctx.source_card_id = card_id;
    ctx.source_def_id = def->id();
    ctx.owner = pos.owner;
    ctx.lane = pos.lane;
    ctx.trigger = trigger;
    ctx.effect_index = index;
    return ctx;
}

std::vector<CardID> EffectResolver::collect_phase_effects(const GameState& state, PlayerID player,
                                                          Trigger trigger) const {
    const auto& processed = trigger == Trigger::START ? state.processed_start_ids : state.processed_end_ids;
    std::vector<CardID> result;
    for (int lane = 0; lane < LANE_COUNT; lane++) {
        const Lane& stack = state.players[player].board.lanes[lane];
        for (int i = 0; i < static_cast<int>(stack.size()); i++) {
            const PlayedCard& card = stack[i];
            if (!card.face_up || processed.count(card.id) > 0) {
                continue;
            }
            const CardDef* def = catalog_.get_card(card.def_id());
            const CardEffect* effect = def ? def->find_effect(trigger) : nullptr;
            if (effect && is_box_active(state, BoardPosition{player, lane, i}, effect->box)) {
                result.push_back(card.id);
            }
        }
    }
    return result;
}

void EffectResolver::fire(GameState& state, const CardID& card_id, Trigger trigger) const {
    auto ctx = make_context(state, card_id, trigger);
    if (ctx.has_value()) {
        state.fired_triggers.push_back(*ctx);
    }
}

void EffectResolver::fire_reactive(GameState& state, PlayerID player, Trigger trigger) const {
    for (int lane = 0; lane < LANE_COUNT; lane++) {
        const Lane& stack = state.players[player].board.lanes[lane];
        for (int i = 0; i < static_cast<int>(stack.size()); i++) {
            const PlayedCard& card = stack[i];
            if (!card.face_up) {
                continue;
            }
            const CardDef* def = catalog_.get_card(card.def_id());
            const CardEffect* effect = def ? def->find_effect(trigger) : nullptr;
            if (effect && is_box_active(state, BoardPosition{player, lane, i}, effect->box)) {
                fire(state, card.id, trigger);
            }
        }
    }
}

// ============================================================================
// INSTRUCTIONS
// ============================================================================

EffectResolver::StepOutcome EffectResolver::execute(GameState& state, EffectContext& ctx,
                                                    const EffectInstruction& ins) const {
    PlayerID actor = ctx.actor_for(ins.actor);

    if (ins.optional && !ctx.confirmed && !has_own_skip(ins)) {
        auto prompt = make_action<PromptOptionalEffect>(ctx, actor, true);
        prompt.description = describe(ctx, ins);
        state.issue(prompt);
        return StepOutcome::WAITING;
    }

    if (ins.subject == Subject::PREVIOUS) {
        return execute_on_previous(state, ctx, ins);
    }

    switch (ins.op) {
        case EffectOp::DRAW: {
            int drawn = draw_cards(state, actor, amount_for(state, ctx, ins));
            ctx.amount = drawn;
            ctx.did = true;
            return StepOutcome::DONE;
        }

        case EffectOp::DRAW_FROM_OPPONENT_DECK:
            ctx.did = draw_from_opponent_deck(state, actor);
            return StepOutcome::DONE;

        case EffectOp::DISCARD: {
            const Zone& hand = state.players[actor].hand;
            if (hand.is_empty()) {
                ctx.did = false;
                ctx.amount = 0;
                return StepOutcome::DONE;
            }
            int count = std::min(amount_for(state, ctx, ins), hand.count());
            if (!ins.variable && !ins.optional && count == hand.count()) {
                // No choice left: the whole hand goes
                std::vector<CardID> all;
                for (const auto& card : hand.cards) all.push_back(card.id);
                discard_from_hand(state, actor, all);
                ctx.did = true;
                ctx.amount = count;
                return StepOutcome::DONE;
            }
            auto action = make_action<DiscardAction>(ctx, actor, ins.optional);
            action.count = ins.variable ? 1 : count;
            action.variable = ins.variable;
            action.purpose = DiscardPurpose::EFFECT;
            state.issue(action);
            return StepOutcome::WAITING;
        }

        case EffectOp::REFRESH: {
            int missing = config_.hand_limit - state.players[actor].hand.count();
            int drawn = missing > 0 ? draw_cards(state, actor, missing) : 0;
            state.players[actor].stats.hands_refreshed++;
            ctx.amount = drawn;
            ctx.did = true;
            return StepOutcome::DONE;
        }

        case EffectOp::FLIP:
        case EffectOp::DELETE:
        case EffectOp::SHIFT:
        case EffectOp::RETURN:
        case EffectOp::REVEAL_BOARD_CARD:
            return execute_board_target(state, ctx, ins);

        case EffectOp::FLIP_ALL: {
            std::vector<CardID> targets = collect_filter_targets(catalog_, state, ins.filter, ctx);
            for (const auto& id : targets) {
                flip_card(state, id, actor);
            }
            ctx.did = !targets.empty();
            return StepOutcome::DONE;
        }

        case EffectOp::FLIP_SELF:
            flip_card(state, ctx.source_card_id, actor);
            ctx.did = true;
            return StepOutcome::DONE;

        case EffectOp::DELETE_HIGHEST:
            return select_extreme(state, ctx, ins, ins.filter, true);

        case EffectOp::DELETE_LOWEST_COVERED: {
            TargetFilter filter = ins.filter;
            filter.position = PositionFilter::COVERED;
            filter.lane = LaneScope::THIS_LANE;
            return select_extreme(state, ctx, ins, filter, false);
        }

        case EffectOp::DELETE_EACH_OTHER_LANE: {
            for (int lane = 0; lane < LANE_COUNT; lane++) {
                if (lane == ctx.lane || (ctx.lanes_done & (1u << lane))) {
                    continue;
                }
                auto action = make_board_action<SelectCardToDelete>(ctx, ins);
                action.only_lane = lane;
                std::vector<CardID> targets = collect_targets(catalog_, state, action);
                if (targets.empty()) {
                    ctx.lanes_done |= static_cast<uint8_t>(1u << lane);
                    continue;
                }
                if (targets.size() == 1 && !ins.optional) {
                    ctx.lanes_done |= static_cast<uint8_t>(1u << lane);
                    delete_card(state, targets[0], actor);
                    fire_reactive(state, actor, Trigger::AFTER_DELETE);
                    ctx.last_target = targets[0];
                    if (!state.fired_triggers.empty()) {
                        // Let the triggers finish before the next line
                        state.push_interrupt(make_resume(ctx));
                        push_fired_triggers(state);
                        return StepOutcome::STOPPED;
                    }
                    continue;
                }
                action.ctx = ctx;
                state.issue(action);
                return StepOutcome::WAITING;
            }
            ctx.did = true;
            return StepOutcome::DONE;
        }

        case EffectOp::DELETE_SELF: {
            bool deleted = delete_card(state, ctx.source_card_id, ctx.owner);
            if (deleted) {
                fire_reactive(state, ctx.owner, Trigger::AFTER_DELETE);
            }
            ctx.did = deleted;
            return StepOutcome::DONE;
        }

        case EffectOp::SHIFT_SELF:
            return begin_shift(state, ctx, ctx.source_card_id, ins, ins.optional)
                ? StepOutcome::WAITING : StepOutcome::DONE;

        case EffectOp::DELETE_ALL_IN_LANE:
        case EffectOp::RETURN_ALL_IN_LANE:
        case EffectOp::SHIFT_ALL:
            return execute_lane_op(state, ctx, ins);

        case EffectOp::PLAY_FROM_HAND: {
            const PlayerState& player = state.players[actor];
            int excluded = ins.filter.lane == LaneScope::OTHER_LANES ? ctx.lane : -1;
            bool any_play = false;
            for (const auto& card : player.hand.cards) {
                for (int lane = 0; lane < LANE_COUNT && !any_play; lane++) {
                    if (lane == excluded) continue;
                    any_play = can_play_card(catalog_, state, actor, card, lane, false).allowed
                        || (!ins.face_down_only && can_play_card(catalog_, state, actor, card, lane, true).allowed);
                }
                if (any_play) break;
            }
            if (!any_play) {
                ctx.did = false;
                return StepOutcome::DONE;
            }
            auto action = make_action<SelectHandCardToPlay>(ctx, actor, ins.optional);
            action.face_down_only = ins.face_down_only;
            action.excluded_lane = excluded;
            state.issue(action);
            return StepOutcome::WAITING;
        }

        case EffectOp::PLAY_FROM_DECK:
            return execute_deck_play(state, ctx, ins);

        case EffectOp::REVEAL_HAND:
            reveal_hand(state, actor);
            ctx.did = true;
            return StepOutcome::DONE;

        case EffectOp::REVEAL_FROM_HAND:
        case EffectOp::GIVE_CARD: {
            if (state.players[actor].hand.is_empty()) {
                ctx.did = false;
                return StepOutcome::DONE;
            }
            auto action = make_action<SelectHandCard>(ctx, actor, ins.optional);
            action.purpose = ins.op == EffectOp::GIVE_CARD ? HandCardPurpose::GIVE : HandCardPurpose::REVEAL;
            state.issue(action);
            return StepOutcome::WAITING;
        }

        case EffectOp::TAKE_RANDOM_CARD: {
            Zone& from = state.players[other(actor)].hand;
            if (from.is_empty()) {
                ctx.did = false;
                return StepOutcome::DONE;
            }
            std::uniform_int_distribution<int> pick(0, from.count() - 1);
            auto card = from.take_at(pick(state.rng));
            card->revealed = false;
            state.add_log(actor, "Takes a random card from the opposing hand", ctx.source_def_id);
            state.players[actor].hand.add_card(std::move(*card));
            ctx.did = true;
            return StepOutcome::DONE;
        }

        case EffectOp::REARRANGE_PROTOCOLS: {
            auto action = make_action<RearrangeProtocols>(ctx, actor, ins.optional);
            action.target_player = ins.filter.owner == OwnerFilter::OPPONENT ? other(ctx.owner) : ctx.owner;
            state.issue(action);
            return StepOutcome::WAITING;
        }

        case EffectOp::SWAP_PROTOCOLS: {
            auto action = make_action<SwapProtocols>(ctx, actor, ins.optional);
            action.target_player = ins.filter.owner == OwnerFilter::OPPONENT ? other(ctx.owner) : ctx.owner;
            state.issue(action);
            return StepOutcome::WAITING;
        }

        case EffectOp::BLOCK_COMPILE:
            state.players[other(ctx.owner)].cannot_compile = true;
            state.add_log(ctx.owner, std::string(player_name(other(ctx.owner))) + " cannot compile next turn",
                          ctx.source_def_id);
            ctx.did = true;
            return StepOutcome::DONE;

        case EffectOp::CHOOSE: {
            if (ctx.alternative >= 0 && ctx.alternative < static_cast<int>(ins.alternatives.size())) {
                return execute(state, ctx, ins.alternatives[ctx.alternative]);
            }
            auto action = make_action<PromptChoice>(ctx, actor, ins.optional);
            for (const auto& alt : ins.alternatives) {
                action.options.push_back(describe(ctx, alt));
            }
            state.issue(action);
            return StepOutcome::WAITING;
        }

        default:
            return StepOutcome::DONE;
    }
}

EffectResolver::StepOutcome EffectResolver::execute_board_target(GameState& state, EffectContext& ctx,
                                                                 const EffectInstruction& ins) const {
    ActionRequired action = make_board_action<SelectCardToFlip>(ctx, ins);
    switch (ins.op) {
        case EffectOp::DELETE:
            action = make_board_action<SelectCardToDelete>(ctx, ins);
            break;
        case EffectOp::SHIFT: {
            auto shift = make_board_action<SelectCardToShift>(ctx, ins);
            if (ins.destination == ShiftDestination::THIS_LANE && is_valid_lane(ctx.lane)) {
                for (PlayerID p = 0; p < 2; p++) {
                    for (const auto& card : state.players[p].board.lanes[ctx.lane]) {
                        shift.disallowed_ids.push_back(card.id);
                    }
                }
            }
            action = shift;
            break;
        }
        case EffectOp::RETURN:
            action = make_board_action<SelectCardToReturn>(ctx, ins);
            break;
        case EffectOp::REVEAL_BOARD_CARD:
            action = make_board_action<SelectCardToReveal>(ctx, ins);
            break;
        default:
            break;
    }

    std::vector<CardID> targets = collect_targets(catalog_, state, *as_board_target(action));
    if (targets.empty()) {
        state.add_log(ctx.owner, std::string("No valid target for ") + to_string(ins.op), ctx.source_def_id);
        ctx.did = false;
        return StepOutcome::DONE;
    }
    if (targets.size() == 1 && !ins.optional) {
        return apply_card_choice(state, ctx, action, targets[0]) ? StepOutcome::WAITING : StepOutcome::DONE;
    }
    state.issue(std::move(action));
    return StepOutcome::WAITING;
}

EffectResolver::StepOutcome EffectResolver::execute_on_previous(GameState& state, EffectContext& ctx,
                                                                const EffectInstruction& ins) const {
    PlayerID actor = ctx.actor_for(ins.actor);
    if (!state.locate_on_board(ctx.last_target).is_valid()) {
        ctx.did = false;
        return StepOutcome::DONE;
    }

    switch (ins.op) {
        case EffectOp::FLIP:
            flip_card(state, ctx.last_target, actor);
            ctx.did = true;
            return StepOutcome::DONE;
        case EffectOp::DELETE:
            ctx.did = delete_card(state, ctx.last_target, actor);
            if (ctx.did) {
                fire_reactive(state, actor, Trigger::AFTER_DELETE);
            }
            return StepOutcome::DONE;
        case EffectOp::RETURN:
            ctx.did = return_card(state, ctx.last_target);
            return StepOutcome::DONE;
        case EffectOp::SHIFT:
            return begin_shift(state, ctx, ctx.last_target, ins, ins.optional)
                ? StepOutcome::WAITING : StepOutcome::DONE;
        default:
            ctx.did = false;
            return StepOutcome::DONE;
    }
}

EffectResolver::StepOutcome EffectResolver::select_extreme(GameState& state, EffectContext& ctx,
                                                           const EffectInstruction& ins,
                                                           const TargetFilter& filter, bool highest) const {
    std::vector<CardID> candidates = collect_filter_targets(catalog_, state, filter, ctx);
    if (candidates.empty()) {
        ctx.did = false;
        return StepOutcome::DONE;
    }

    int best = highest ? -1 : 1000;
    for (const auto& id : candidates) {
        int value = effective_value(catalog_, state, state.locate_on_board(id));
        best = highest ? std::max(best, value) : std::min(best, value);
    }
    std::vector<CardID> tied;
    for (const auto& id : candidates) {
        if (effective_value(catalog_, state, state.locate_on_board(id)) == best) {
            tied.push_back(id);
        }
    }

    auto action = make_board_action<SelectCardToDelete>(ctx, ins);
    action.filter = filter;
    action.allowed_ids = tied;
    if (tied.size() == 1 && !ins.optional) {
        apply_card_choice(state, ctx, action, tied[0]);
        return StepOutcome::DONE;
    }
    state.issue(action);
    return StepOutcome::WAITING;
}

EffectResolver::StepOutcome EffectResolver::execute_lane_op(GameState& state, EffectContext& ctx,
                                                            const EffectInstruction& ins) const {
    PlayerID actor = ctx.actor_for(ins.actor);
    std::vector<int> lanes;
    LanePurpose purpose = LanePurpose::DELETE_ALL;

    auto lane_has_match = [&](int lane) {
        for (PlayerID p = 0; p < 2; p++) {
            for (int i = 0; i < state.players[p].board.lane_size(lane); i++) {
                if (matches_filter(catalog_, state, BoardPosition{p, lane, i}, ins.filter, ctx)) {
                    return true;
                }
            }
        }
        return false;
    };

    if (ins.op == EffectOp::SHIFT_ALL) {
        purpose = LanePurpose::SHIFT_ALL;
        if (!is_valid_lane(ctx.lane) || !lane_has_match(ctx.lane)) {
            ctx.did = false;
            return StepOutcome::DONE;
        }
        for (int lane = 0; lane < LANE_COUNT; lane++) {
            if (lane != ctx.lane) lanes.push_back(lane);
        }
    } else {
        purpose = ins.op == EffectOp::DELETE_ALL_IN_LANE ? LanePurpose::DELETE_ALL : LanePurpose::RETURN_ALL;
        for (int lane = 0; lane < LANE_COUNT; lane++) {
            if (ins.lane_min_cards > 0 && cards_in_line(state, lane) < ins.lane_min_cards) {
                continue;
            }
            if (lane_has_match(lane)) {
                lanes.push_back(lane);
            }
        }
    }

    if (lanes.empty()) {
        ctx.did = false;
        return StepOutcome::DONE;
    }
    if (lanes.size() == 1 && !ins.optional) {
        apply_lane_op(state, ctx, ins, lanes[0]);
        ctx.did = true;
        return StepOutcome::DONE;
    }

    auto action = make_action<SelectLane>(ctx, actor, ins.optional);
    action.purpose = purpose;
    action.allowed_lanes = lanes;
    state.issue(action);
    return StepOutcome::WAITING;
}

void EffectResolver::apply_lane_op(GameState& state, const EffectContext& ctx,
                                   const EffectInstruction& ins, int lane) const {
    PlayerID actor = ctx.actor_for(ins.actor);
    int source_lane = ins.op == EffectOp::SHIFT_ALL ? ctx.lane : lane;

    std::array<CardID, 2> previous_tops = {top_id(state, PLAYER, source_lane), top_id(state, OPPONENT, source_lane)};
    std::array<std::vector<CardID>, 2> matched;
    for (PlayerID p = 0; p < 2; p++) {
        for (int i = 0; i < state.players[p].board.lane_size(source_lane); i++) {
            if (matches_filter(catalog_, state, BoardPosition{p, source_lane, i}, ins.filter, ctx)) {
                matched[p].push_back(state.players[p].board.lanes[source_lane][i].id);
            }
        }
    }

    int moved = 0;
    for (PlayerID p = 0; p < 2; p++) {
        if (ins.op == EffectOp::SHIFT_ALL) {
            if (matched[p].empty()) continue;
            CardID covered = top_id(state, p, lane);
            bool cover_fires = has_on_cover(state, p, lane);
            for (const auto& id : matched[p]) {
                auto card = state.players[p].board.take_card(id);
                if (!card) continue;
                state.players[p].board.place_on_top(lane, std::move(*card));
                state.add_event(EventType::SHIFT, p, id, source_lane, lane);
                moved++;
            }
            state.players[actor].stats.cards_shifted += static_cast<int>(matched[p].size());
            state.processed_uncover_ids.erase(covered);
            if (cover_fires) {
                fire(state, covered, Trigger::ON_COVER);
            }
        } else {
            for (const auto& id : matched[p]) {
                bool ok = ins.op == EffectOp::DELETE_ALL_IN_LANE
                    ? delete_card(state, id, actor, false)
                    : return_card(state, id, false);
                if (ok) moved++;
            }
        }
    }

    for (PlayerID p = 0; p < 2; p++) {
        handle_uncover(state, p, source_lane, previous_tops[p]);
    }

    state.add_log(actor, std::string(to_string(ins.op)) + " in lane " + std::to_string(lane)
                  + " (" + std::to_string(moved) + " cards)", ctx.source_def_id);

    if (ins.op == EffectOp::DELETE_ALL_IN_LANE && moved > 0) {
        fire_reactive(state, actor, Trigger::AFTER_DELETE);
    }
}

EffectResolver::StepOutcome EffectResolver::execute_deck_play(GameState& state, EffectContext& ctx,
                                                              const EffectInstruction& ins) const {
    PlayerID actor = ctx.actor_for(ins.actor);
    const PlayerState& player = state.players[actor];
    if (player.deck.is_empty() && player.discard.is_empty()) {
        ctx.did = false;
        return StepOutcome::DONE;
    }

    int played = 0;
    switch (ins.deck_mode) {
        case DeckPlayMode::THIS_LANE:
            if (is_valid_lane(ctx.lane) && play_top_of_deck(state, actor, ctx.lane)) played++;
            break;

        case DeckPlayMode::ANOTHER_LANE: {
            auto action = make_action<SelectLane>(ctx, actor, ins.optional);
            action.purpose = LanePurpose::PLAY_FROM_DECK;
            for (int lane = 0; lane < LANE_COUNT; lane++) {
                if (lane != ctx.lane) action.allowed_lanes.push_back(lane);
            }
            state.issue(action);
            return StepOutcome::WAITING;
        }

        case DeckPlayMode::EACH_OTHER_LANE:
            for (int lane = 0; lane < LANE_COUNT; lane++) {
                if (lane != ctx.lane && play_top_of_deck(state, actor, lane)) played++;
            }
            break;

        case DeckPlayMode::EACH_LANE_WITH_OWN_CARD: {
            std::vector<int> lanes;
            for (int lane = 0; lane < LANE_COUNT; lane++) {
                if (player.board.lane_size(lane) > 0) lanes.push_back(lane);
            }
            for (int lane : lanes) {
                if (play_top_of_deck(state, actor, lane)) played++;
            }
            break;
        }

        case DeckPlayMode::UNDER_SELF_PER_TWO: {
            if (!is_valid_lane(ctx.lane)) break;
            int count = cards_in_line(state, ctx.lane) / 2;
            for (int i = 0; i < count; i++) {
                BoardPosition pos = state.locate_on_board(ctx.source_card_id);
                if (!pos.is_valid() || pos.owner != actor) {
                    // Not under this card: fall back to the top of the own stack
                    if (play_top_of_deck(state, actor, ctx.lane)) played++;
                    continue;
                }
                if (play_top_of_deck(state, actor, ctx.lane, pos.index)) played++;
            }
            break;
        }
    }

    ctx.did = played > 0;
    ctx.amount = played;
    return StepOutcome::DONE;
}

// ============================================================================
// RESOLVING CHOICES
// ============================================================================

bool EffectResolver::apply_card_choice(GameState& state, EffectContext& ctx, const ActionRequired& action,
                                       const CardID& card_id) const {
    const ActionBase& base = action_base(action);
    PlayerID actor = base.actor;
    ctx.last_target = card_id;
    ctx.did = true;

    if (std::holds_alternative<SelectCardToDelete>(action)) {
        BoardPosition pos = state.locate_on_board(card_id);
        const EffectInstruction* ins = instruction_at(ctx);
        if (ins && ins->op == EffectOp::DELETE_EACH_OTHER_LANE && pos.is_valid()) {
            ctx.lanes_done |= static_cast<uint8_t>(1u << pos.lane);
        }
        delete_card(state, card_id, actor);
        fire_reactive(state, actor, Trigger::AFTER_DELETE);
    } else if (std::holds_alternative<SelectCardToFlip>(action)) {
        flip_card(state, card_id, actor);
    } else if (std::holds_alternative<SelectCardToReturn>(action)) {
        return_card(state, card_id);
    } else if (std::holds_alternative<SelectCardToReveal>(action)) {
        BoardPosition pos = state.locate_on_board(card_id);
        if (PlayedCard* card = state.board_card(pos)) {
            card->revealed = true;
            state.add_event(EventType::REVEAL, pos.owner, card_id, pos.lane);
            state.add_log(actor, "Reveals " + card->name(), ctx.source_def_id);
        }
    } else if (std::holds_alternative<SelectCardToShift>(action)) {
        const EffectInstruction* ins = effective_instruction(ctx);
        if (!ins) {
            return false;
        }
        return begin_shift(state, ctx, card_id, *ins, false);
    }
    return false;
}

bool EffectResolver::begin_shift(GameState& state, EffectContext& ctx, const CardID& card_id,
                                 const EffectInstruction& ins, bool optional) const {
    BoardPosition pos = state.locate_on_board(card_id);
    if (!pos.is_valid()) {
        ctx.did = false;
        return false;
    }

    std::vector<int> lanes;
    switch (ins.destination) {
        case ShiftDestination::THIS_LANE:
            if (pos.lane != ctx.lane && is_valid_lane(ctx.lane)) lanes.push_back(ctx.lane);
            break;
        case ShiftDestination::TO_OR_FROM_THIS_LANE:
            if (pos.lane != ctx.lane) {
                if (is_valid_lane(ctx.lane)) lanes.push_back(ctx.lane);
                break;
            }
            // From this line: any other line
            for (int lane = 0; lane < LANE_COUNT; lane++) {
                if (lane != pos.lane) lanes.push_back(lane);
            }
            break;
        case ShiftDestination::ANY_OTHER_LANE:
        default:
            for (int lane = 0; lane < LANE_COUNT; lane++) {
                if (lane != pos.lane) lanes.push_back(lane);
            }
            break;
    }

    PlayerID actor = ctx.actor_for(ins.actor);
    if (lanes.empty()) {
        ctx.did = false;
        return false;
    }
    if (lanes.size() == 1 && !optional) {
        shift_card(state, card_id, lanes[0], actor);
        ctx.did = true;
        ctx.last_target = card_id;
        return false;
    }

    auto action = make_action<SelectLaneForShift>(ctx, actor, optional);
    action.card_id = card_id;
    action.card_owner = pos.owner;
    action.from_lane = pos.lane;
    action.allowed_lanes = lanes;
    state.issue(action);
    return true;
}

void EffectResolver::resolve_card_choice(GameState& state, const ActionRequired& action,
                                         const CardID& card_id) const {
    if (auto* order = std::get_if<SelectEffectToResolve>(&action)) {
        resolve_effect_order(state, *order, card_id);
        return;
    }
    EffectContext ctx = action_base(action).ctx;
    if (!apply_card_choice(state, ctx, action, card_id)) {
        finish_step(state, ctx);
    }
}

void EffectResolver::resolve_lane_choice(GameState& state, const ActionRequired& action, int lane) const {
    const ActionBase& base = action_base(action);
    EffectContext ctx = base.ctx;

    if (auto* shift = std::get_if<SelectLaneForShift>(&action)) {
        shift_card(state, shift->card_id, lane, base.actor);
        if (!base.from_effect) {
            push_fired_triggers(state);
            return;
        }
        ctx.did = true;
        ctx.last_target = shift->card_id;
        finish_step(state, ctx);
        return;
    }

    if (auto* select = std::get_if<SelectLane>(&action)) {
        if (select->purpose == LanePurpose::PLAY_FROM_DECK) {
            ctx.did = play_top_of_deck(state, base.actor, lane);
        } else {
            const EffectInstruction* ins = effective_instruction(ctx);
            if (ins) {
                apply_lane_op(state, ctx, *ins, lane);
            }
            ctx.did = true;
        }
        finish_step(state, ctx);
    }
}

void EffectResolver::resolve_discard(GameState& state, const DiscardAction& action,
                                     const std::vector<CardID>& card_ids) const {
    discard_from_hand(state, action.actor, card_ids);
    if (!action.from_effect) {
        push_fired_triggers(state);
        return;
    }
    EffectContext ctx = action.ctx;
    ctx.did = !card_ids.empty();
    ctx.amount = static_cast<int>(card_ids.size());
    finish_step(state, ctx);
}

void EffectResolver::resolve_hand_play(GameState& state, const SelectHandCardToPlay& action,
                                       const CardID& card_id, int lane, bool face_up) const {
    size_t base = state.interrupt_stack.size();
    play_from_hand(state, action.actor, card_id, lane, face_up);
    EffectContext ctx = action.ctx;
    ctx.did = true;
    continue_below(state, ctx, base);
}

void EffectResolver::resolve_hand_card(GameState& state, const SelectHandCard& action,
                                       const CardID& card_id) const {
    EffectContext ctx = action.ctx;
    PlayerState& player = state.players[action.actor];

    if (action.purpose == HandCardPurpose::GIVE) {
        auto card = player.hand.take_card(card_id);
        if (card) {
            card->revealed = false;
            state.players[other(action.actor)].hand.add_card(std::move(*card));
            state.add_log(action.actor, "Gives a card to " + std::string(player_name(other(action.actor))),
                          ctx.source_def_id);
        }
        ctx.did = card.has_value();
    } else {
        PlayedCard* card = player.hand.find_card(card_id);
        if (card) {
            card->revealed = true;
            state.add_event(EventType::REVEAL, action.actor, card_id);
            state.add_log(action.actor, "Reveals " + card->name() + " from hand", ctx.source_def_id);
        }
        ctx.did = card != nullptr;
    }
    finish_step(state, ctx);
}

void EffectResolver::resolve_prompt(GameState& state, const PromptOptionalEffect& action, bool accept) const {
    if (!accept) {
        skip(state, action);
        return;
    }
    EffectContext ctx = action.ctx;
    ctx.confirmed = true;
    run(state, ctx);
}

void EffectResolver::resolve_choice(GameState& state, const PromptChoice& action, int index) const {
    EffectContext ctx = action.ctx;
    ctx.alternative = index;
    run(state, ctx);
}

void EffectResolver::resolve_effect_order(GameState& state, const SelectEffectToResolve& action,
                                          const CardID& card_id) const {
    if (action.trigger == Trigger::START) {
        state.processed_start_ids.insert(card_id);
    } else {
        state.processed_end_ids.insert(card_id);
    }
    auto ctx = make_context(state, card_id, action.trigger);
    if (ctx.has_value()) {
        run(state, *ctx);
    }
}

void EffectResolver::resolve_rearrange(GameState& state, const RearrangeProtocols& action,
                                       const ProtocolList& order) const {
    set_protocols(state, action.target_player, order);
    if (!action.from_effect) {
        return;
    }
    EffectContext ctx = action.ctx;
    ctx.did = true;
    finish_step(state, ctx);
}

void EffectResolver::resolve_swap(GameState& state, const SwapProtocols& action, int first, int second) const {
    swap_protocols(state, action.target_player, first, second);
    EffectContext ctx = action.ctx;
    ctx.did = true;
    finish_step(state, ctx);
}

void EffectResolver::skip(GameState& state, const ActionRequired& action) const {
    const ActionBase& base = action_base(action);
    state.add_log(base.actor, std::string("Skips ") + action_type_name(action), base.ctx.source_def_id);
    if (!base.from_effect) {
        return;
    }

    EffectContext ctx = base.ctx;
    const EffectInstruction* ins = instruction_at(ctx);
    if (ins && ins->op == EffectOp::DELETE_EACH_OTHER_LANE) {
        // Drop only the line this action was for
        if (const BoardTargetAction* target = as_board_target(action)) {
            if (target->only_lane >= 0) {
                ctx.lanes_done |= static_cast<uint8_t>(1u << target->only_lane);
            }
        }
        continue_program(state, ctx, false);
        return;
    }

    ctx.did = false;
    continue_program(state, ctx, true);
}

// ============================================================================
// BOARD MUTATIONS
// ============================================================================

void EffectResolver::ensure_deck(GameState& state, PlayerID player) const {
    PlayerState& p = state.players[player];
    if (!p.deck.is_empty() || p.discard.is_empty()) {
        return;
    }
    for (auto& card : p.discard.cards) {
        card.reset();
        p.deck.add_card(std::move(card));
    }
    p.discard.cards.clear();
    p.deck.shuffle(state.rng);
    state.add_log(player, "Shuffles the discard pile into a new deck");
}

int EffectResolver::draw_cards(GameState& state, PlayerID player, int count, bool fire) const {
    int drawn = 0;
    for (int i = 0; i < count; i++) {
        ensure_deck(state, player);
        auto card = state.players[player].deck.draw_top();
        if (!card) {
            break;
        }
        card->reset();
        state.players[player].hand.add_card(std::move(*card));
        drawn++;
    }
    if (drawn == 0) {
        return 0;
    }

    state.players[player].stats.cards_drawn += drawn;
    state.add_event(EventType::DRAW, player, "", -1, -1, drawn);
    state.add_log(player, "Draws " + std::to_string(drawn) + (drawn == 1 ? " card" : " cards"));
    if (fire) {
        fire_reactive(state, player, Trigger::AFTER_DRAW);
    }
    return drawn;
}

bool EffectResolver::draw_from_opponent_deck(GameState& state, PlayerID player) const {
    PlayerID from = other(player);
    ensure_deck(state, from);
    auto card = state.players[from].deck.draw_top();
    if (!card) {
        return false;
    }
    card->reset();
    state.players[player].hand.add_card(std::move(*card));
    state.players[player].stats.cards_drawn++;
    state.add_event(EventType::DRAW, player, "", -1, -1, 1);
    state.add_log(player, "Draws the top card of the opposing deck");
    fire_reactive(state, player, Trigger::AFTER_DRAW);
    return true;
}

void EffectResolver::discard_from_hand(GameState& state, PlayerID player, const std::vector<CardID>& card_ids) const {
    PlayerState& p = state.players[player];
    int discarded = 0;
    for (const auto& id : card_ids) {
        auto card = p.hand.take_card(id);
        if (!card) continue;
        std::string name = card->name();
        card->reset();
        p.discard.add_card(std::move(*card));
        state.add_event(EventType::DISCARD, player, id);
        state.add_log(player, "Discards " + name);
        discarded++;
    }
    if (discarded == 0) {
        return;
    }
    p.stats.cards_discarded += discarded;
    fire_reactive(state, other(player), Trigger::AFTER_OPPONENT_DISCARD);
}

bool EffectResolver::delete_card(GameState& state, const CardID& card_id, PlayerID by, bool check_uncover) const {
    BoardPosition pos = state.locate_on_board(card_id);
    if (!pos.is_valid()) {
        return false;
    }
    CardID previous_top = top_id(state, pos.owner, pos.lane);
    auto card = state.players[pos.owner].board.take_card(card_id);
    std::string name = card->face_up ? card->name() : "a face-down card";
    card->reset();
    state.players[pos.owner].discard.add_card(std::move(*card));
    state.processed_uncover_ids.erase(card_id);

    state.players[by].stats.cards_deleted++;
    state.add_event(EventType::DELETE, pos.owner, card_id, pos.lane);
    state.add_log(by, "Deletes " + name + " in lane " + std::to_string(pos.lane));

    if (check_uncover) {
        handle_uncover(state, pos.owner, pos.lane, previous_top);
    }
    return true;
}

void EffectResolver::flip_card(GameState& state, const CardID& card_id, PlayerID by) const {
    BoardPosition pos = state.locate_on_board(card_id);
    PlayedCard* card = state.board_card(pos);
    if (!card) {
        return;
    }

    if (card->face_up && is_passive_active(catalog_, state, pos, PassiveKind::DELETE_WHEN_FLIPPED)) {
        state.add_log(by, card->name() + " is deleted instead of flipped");
        delete_card(state, card_id, by);
        return;
    }

    card->face_up = !card->face_up;
    card->revealed = false;
    state.players[by].stats.cards_flipped++;
    state.add_event(EventType::FLIP, pos.owner, card_id, pos.lane);
    state.add_log(by, "Flips " + card->name() + (card->face_up ? " face-up" : " face-down"));

    if (card->face_up && state.is_uncovered(pos)) {
        state.processed_uncover_ids.insert(card_id);
        fire(state, card_id, Trigger::ON_PLAY);
    }
}

bool EffectResolver::shift_card(GameState& state, const CardID& card_id, int to_lane, PlayerID by) const {
    BoardPosition pos = state.locate_on_board(card_id);
    if (!pos.is_valid() || !is_valid_lane(to_lane) || pos.lane == to_lane) {
        return false;
    }

    CardID previous_top = top_id(state, pos.owner, pos.lane);
    CardID covered = top_id(state, pos.owner, to_lane);
    bool cover_fires = has_on_cover(state, pos.owner, to_lane);

    auto card = state.players[pos.owner].board.take_card(card_id);
    std::string name = card->face_up ? card->name() : "a face-down card";
    state.players[pos.owner].board.place_on_top(to_lane, std::move(*card));
    state.processed_uncover_ids.erase(covered);

    state.players[by].stats.cards_shifted++;
    state.add_event(EventType::SHIFT, pos.owner, card_id, pos.lane, to_lane);
    state.add_log(by, "Shifts " + name + " from lane " + std::to_string(pos.lane)
                  + " to lane " + std::to_string(to_lane));

    handle_uncover(state, pos.owner, pos.lane, previous_top);
    if (cover_fires) {
        fire(state, covered, Trigger::ON_COVER);
    }
    return true;
}

bool EffectResolver::return_card(GameState& state, const CardID& card_id, bool check_uncover) const {
    BoardPosition pos = state.locate_on_board(card_id);
    if (!pos.is_valid()) {
        return false;
    }
    CardID previous_top = top_id(state, pos.owner, pos.lane);
    auto card = state.players[pos.owner].board.take_card(card_id);
    std::string name = card->face_up ? card->name() : "a face-down card";
    card->reset();
    state.players[pos.owner].hand.add_card(std::move(*card));
    state.processed_uncover_ids.erase(card_id);

    state.add_event(EventType::RETURN, pos.owner, card_id, pos.lane);
    state.add_log(pos.owner, "Returns " + name + " to hand");

    if (check_uncover) {
        handle_uncover(state, pos.owner, pos.lane, previous_top);
    }
    return true;
}

void EffectResolver::handle_uncover(GameState& state, PlayerID owner, int lane, const CardID& previous_top) const {
    const PlayedCard* top = state.players[owner].board.top(lane);
    if (!top || top->id == previous_top) {
        return;
    }
    // About to be covered again by the card waiting to land
    if (state.committed.has_value() && state.committed->owner == owner && state.committed->lane == lane) {
        return;
    }
    if (!top->face_up || state.processed_uncover_ids.count(top->id) > 0) {
        return;
    }
    state.processed_uncover_ids.insert(top->id);
    state.add_log(owner, top->name() + " is uncovered");
    fire(state, top->id, Trigger::ON_PLAY);
}

bool EffectResolver::has_on_cover(const GameState& state, PlayerID owner, int lane) const {
    const Board& board = state.players[owner].board;
    const PlayedCard* top = board.top(lane);
    if (!top || !top->face_up) {
        return false;
    }
    const CardDef* def = catalog_.get_card(top->def_id());
    const CardEffect* effect = def ? def->find_effect(Trigger::ON_COVER) : nullptr;
    return effect && is_box_active(state, BoardPosition{owner, lane, board.lane_size(lane) - 1}, effect->box);
}

void EffectResolver::place_card(GameState& state, PlayerID player, PlayedCard card, int lane, bool face_up) const {
    CardID covered = top_id(state, player, lane);
    state.processed_uncover_ids.erase(covered);

    CardID id = card.id;
    card.face_up = face_up;
    state.players[player].board.place_on_top(lane, std::move(card));
    if (face_up) {
        state.processed_uncover_ids.insert(id);
        fire(state, id, Trigger::ON_PLAY);
    }
}

void EffectResolver::play_from_hand(GameState& state, PlayerID player, const CardID& card_id,
                                    int lane, bool face_up) const {
    auto card = state.players[player].hand.take_card(card_id);
    if (!card) {
        return;
    }
    card->revealed = false;
    card->face_up = face_up;
    std::string name = face_up ? card->name() : "a card";

    state.players[player].stats.cards_played++;
    state.last_played_card_id = card_id;
    state.add_event(EventType::PLAY, player, card_id, -1, lane);
    state.add_log(player, "Plays " + name + (face_up ? " face-up" : " face-down") + " in lane " + std::to_string(lane));

    if (has_on_cover(state, player, lane)) {
        CardID covered = top_id(state, player, lane);
        state.committed = CommittedCard{std::move(*card), player, lane};

        CompletePlay landing;
        landing.actor = player;
        landing.source_card_id = card_id;
        landing.from_effect = false;
        landing.player = player;
        landing.lane = lane;
        state.push_interrupt(landing);

        fire(state, covered, Trigger::ON_COVER);
        push_fired_triggers(state);
        return;
    }

    place_card(state, player, std::move(*card), lane, face_up);
}

void EffectResolver::complete_play(GameState& state, const CompletePlay& action) const {
    if (!state.committed.has_value()) {
        return;
    }
    CommittedCard committed = std::move(*state.committed);
    state.committed.reset();
    bool face_up = committed.card.face_up;
    place_card(state, action.player, std::move(committed.card), action.lane, face_up);
}

bool EffectResolver::play_top_of_deck(GameState& state, PlayerID player, int lane, int index) const {
    ensure_deck(state, player);
    auto card = state.players[player].deck.draw_top();
    if (!card) {
        return false;
    }
    card->reset();
    CardID id = card->id;

    if (index < 0) {
        CardID covered = top_id(state, player, lane);
        bool cover_fires = has_on_cover(state, player, lane);
        place_card(state, player, std::move(*card), lane, false);
        if (cover_fires) {
            fire(state, covered, Trigger::ON_COVER);
        }
    } else {
        state.players[player].board.insert_at(lane, index, std::move(*card));
    }

    state.add_event(EventType::PLAY, player, id, -1, lane);
    state.add_log(player, "Plays the top card of the deck face-down in lane " + std::to_string(lane));
    return true;
}

void EffectResolver::set_protocols(GameState& state, PlayerID player, const ProtocolList& order) const {
    PlayerState& p = state.players[player];
    std::array<bool, LANE_COUNT> compiled = p.compiled;
    for (int i = 0; i < LANE_COUNT; i++) {
        int from = p.protocol_lane(order[i]);
        compiled[i] = from >= 0 ? p.compiled[from] : false;
    }
    p.protocols = order;
    p.compiled = compiled;
    state.add_event(EventType::PROTOCOLS_CHANGED, player);
    state.add_log(player, "Protocols are now " + order[0] + ", " + order[1] + ", " + order[2]);
}

void EffectResolver::swap_protocols(GameState& state, PlayerID player, int first, int second) const {
    PlayerState& p = state.players[player];
    std::swap(p.protocols[first], p.protocols[second]);
    std::swap(p.compiled[first], p.compiled[second]);
    state.add_event(EventType::PROTOCOLS_CHANGED, player);
    state.add_log(player, "Swaps protocols " + p.protocols[second] + " and " + p.protocols[first]);
}

void EffectResolver::reveal_hand(GameState& state, PlayerID player) const {
    for (auto& card : state.players[player].hand.cards) {
        card.revealed = true;
    }
    state.add_event(EventType::REVEAL, player);
    state.add_log(player, "Reveals their hand");
}

} // namespace compile
