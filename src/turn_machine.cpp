// turn_machine.cpp
// Phase legality table and turn/phase transitions.

#include "hexsettle/turn_machine.h"
#include "hexsettle/log.h"

#include <array>
#include <string>

namespace hexsettle {

namespace {

// Rows: ActionType. Columns: Roll, Robber, Discard, Main, SpecialBuild.
// Playing a card during Roll is limited to knights by the card validator.
constexpr std::array<std::array<bool, NUM_TURN_PHASES>, NUM_ACTION_TYPES> PHASE_TABLE = {{
    //  Roll   Robber Discard Main   Special
    {{ false, false, false,  true,  true  }},  // PlaceSettlement
    {{ false, false, false,  true,  true  }},  // PlaceRoad
    {{ false, false, false,  true,  true  }},  // UpgradeToCity
    {{ false, false, false,  true,  true  }},  // BuyDevCard
    {{ true,  false, false,  true,  false }},  // PlayDevCard
    {{ false, true,  false,  false, false }},  // MoveRobber
    {{ true,  false, false,  false, false }},  // RollDice
    {{ false, false, true,   false, false }},  // DiscardResources
    {{ false, false, false,  true,  false }},  // BankTrade
    {{ false, false, false,  true,  true  }},  // EndTurn
}};

} // namespace

bool setup_allows(ActionType action) {
    return action == ActionType::PlaceSettlement || action == ActionType::PlaceRoad;
}

bool turn_phase_allows(TurnPhase phase, ActionType action) {
    const auto a = static_cast<std::size_t>(action);
    const auto p = static_cast<std::size_t>(phase);
    if (a >= NUM_ACTION_TYPES || p >= NUM_TURN_PHASES) return false;
    return PHASE_TABLE[a][p];
}

ActionResult check_phase(const GameState& state, ActionType action) {
    switch (state.game_phase) {
        case GamePhase::Finished:
            return ActionResult::fail(RuleViolation::GameOver, "the game is over");
        case GamePhase::Setup:
            if (!setup_allows(action)) {
                return ActionResult::fail(RuleViolation::WrongPhase,
                    std::string(action_type_name(action)) + " is not allowed during setup");
            }
            return ActionResult::ok();
        case GamePhase::Playing:
            if (!turn_phase_allows(state.turn_phase, action)) {
                return ActionResult::fail(RuleViolation::WrongPhase,
                    std::string(action_type_name(action)) + " is not allowed in the " +
                    turn_phase_name(state.turn_phase) + " phase");
            }
            return ActionResult::ok();
    }
    return ActionResult::fail(RuleViolation::WrongPhase, "unknown game phase");
}

TurnPhase resume_phase(const GameState& state) {
    return state.has_rolled_this_turn ? TurnPhase::Main : TurnPhase::Roll;
}

void finish_robber(GameState& state) {
    state.turn_phase = resume_phase(state);
}

void enter_seven(GameState& state) {
    state.pending_discards.assign(state.num_players(), 0);

    bool anyone_discarding = false;
    for (std::uint8_t p = 0; p < state.num_players(); ++p) {
        const unsigned held = state.players[p].total_resources();
        if (held > state.options.discard_limit) {
            state.pending_discards[p] = static_cast<std::uint8_t>(held / 2);
            anyone_discarding = true;
        }
    }

    state.turn_phase = anyone_discarding ? TurnPhase::Discard : TurnPhase::Robber;
}

void finish_discard_if_done(GameState& state) {
    for (std::uint8_t owed : state.pending_discards) {
        if (owed > 0) return;
    }
    state.turn_phase = TurnPhase::Robber;
}

void finish_turn(GameState& state) {
    PlayerState& player = state.players[state.current_player];
    for (std::size_t i = 0; i < NUM_DEV_CARD_TYPES; ++i) {
        player.dev_cards[i] = static_cast<std::uint8_t>(player.dev_cards[i] + player.new_dev_cards[i]);
        player.new_dev_cards[i] = 0;
    }

    state.has_rolled_this_turn = false;
    state.dev_card_played_this_turn = false;
    state.free_roads_remaining = 0;
    state.pending_discards.assign(state.num_players(), 0);

    if (state.options.special_build_phase && state.num_players() > 1) {
        state.turn_phase = TurnPhase::SpecialBuild;
        state.special_build_player =
            static_cast<std::uint8_t>((state.current_player + 1) % state.num_players());
        return;
    }
    pass_turn(state);
}

void advance_special_build(GameState& state) {
    const auto next = static_cast<std::uint8_t>((state.special_build_player + 1) % state.num_players());
    if (next == state.current_player) {
        pass_turn(state);
    } else {
        state.special_build_player = next;
    }
}

void pass_turn(GameState& state) {
    state.special_build_player = NO_PLAYER;
    state.current_player = static_cast<std::uint8_t>((state.current_player + 1) % state.num_players());

    // Turn counter counts full rounds.
    if (state.current_player == 0) {
        state.turn_number++;
    }
    state.turn_phase = TurnPhase::Roll;
    log::get()->debug("turn passes to {}", state.players[state.current_player].id);
}

void advance_setup_turn(GameState& state) {
    // Round 1: players 0,1,...,N-1 place settlement+road (forward order)
    // Round 2: players N-1,...,1,0 place settlement+road (reverse order)
    // The last player places twice in a row at the turn-around.
    const std::uint8_t current = state.current_player;
    const std::uint8_t last_player = static_cast<std::uint8_t>(state.num_players() - 1);

    const std::uint8_t s = state.setup_settlements_placed[current];
    const std::uint8_t r = state.setup_roads_placed[current];

    // Player must complete settlement+road pair before turn can advance
    if (!(s == r && s > 0)) return;

    if (s == 1) {
        if (current < last_player) {
            state.current_player++;
        }
        // else: last player just finished round 1, they stay to start round 2
    } else if (current > 0) {
        state.current_player--;
    } else {
        state.game_phase = GamePhase::Playing;
        state.turn_phase = TurnPhase::Roll;
        state.current_player = 0;
        state.has_rolled_this_turn = false;
        state.turn_number = 1;
        log::get()->info("game '{}': setup complete, play begins", state.id);
    }
}

} // namespace hexsettle
