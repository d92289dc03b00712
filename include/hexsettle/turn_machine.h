// turn_machine.h
// Which actions are legal in which phase, and the phase transitions.
//
//   Setup --(last setup road)--> Playing --(victory threshold)--> Finished
//
//   Roll --7--> Discard? --> Robber --> Main --end--> SpecialBuild* --> Roll (next seat)
//   Roll --knight--> Robber --> Roll
//   Main --knight--> Robber --> Main
//
// Robber and Discard are interrupts: they resume Main if the dice were rolled
// this turn, otherwise Roll.

#pragma once

#include "hexsettle/action.h"
#include "hexsettle/action_result.h"
#include "hexsettle/game_state.h"

namespace hexsettle {

// Static legality table lookups.
bool setup_allows(ActionType action);
bool turn_phase_allows(TurnPhase phase, ActionType action);

// Game phase + turn phase gate for an action. Does not check whose turn it is.
ActionResult check_phase(const GameState& state, ActionType action);

// Phase an interrupt returns to.
TurnPhase resume_phase(const GameState& state);

// Close the robber interrupt.
void finish_robber(GameState& state);

// After a 7: Discard if anyone is over the hand limit, else Robber.
// Fills pending_discards.
void enter_seven(GameState& state);

// Called after every discard; moves on to Robber once nobody owes cards.
void finish_discard_if_done(GameState& state);

// Turn owner ended Main: reset per-turn flags, release bought cards, then
// either open the special build round or pass the turn.
void finish_turn(GameState& state);

// Special builder ended: next seat builds, or the turn passes.
void advance_special_build(GameState& state);

// Next seat, Roll phase.
void pass_turn(GameState& state);

// Setup snake order: 0..N-1 then N-1..0. Enters Playing after the last pair.
void advance_setup_turn(GameState& state);

} // namespace hexsettle
