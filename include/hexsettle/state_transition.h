// state_transition.h
// Validated state transitions. Every function checks all preconditions before
// touching the state and reports the outcome as an ActionResult; a rejected
// action leaves the state unchanged.
//
// Coordinates are the renderer's string keys (any equivalent key). A key that
// does not parse throws MalformedCoordinate.

#pragma once

#include <cstdint>
#include <string>

#include "hexsettle/action.h"
#include "hexsettle/action_result.h"
#include "hexsettle/game_state.h"

namespace hexsettle {

class RandomSource;

// ============================================================================
// Lobby
// ============================================================================

// Join a game that has not started. Ids are unique.
ActionResult add_player(GameState& state, const std::string& player_id, const std::string& name);

// Fix the seats (optionally shuffled) and shuffle the development deck.
// Needs at least two players.
ActionResult start_game(GameState& state, RandomSource& rng);

// ============================================================================
// Building
// ============================================================================

// is_setup must match the game phase. The second setup settlement collects
// one card per adjacent producing hex.
ActionResult place_settlement(GameState& state, const std::string& player_id,
                              const std::string& vertex, bool is_setup);

// A free road consumes one road granted by a road building card.
ActionResult place_road(GameState& state, const std::string& player_id,
                        const std::string& edge, bool free = false);

ActionResult upgrade_to_city(GameState& state, const std::string& player_id,
                             const std::string& vertex);

// ============================================================================
// Development cards
// ============================================================================

// Draws the top of the deck. Cards bought on your own turn are playable from
// your next turn.
ActionResult buy_dev_card(GameState& state, const std::string& player_id);

ActionResult play_dev_card(GameState& state, const std::string& player_id, DevCardType card,
                           const DevCardPayload& payload = DevCardPayload{});

// ============================================================================
// Dice, robber, discards
// ============================================================================

ActionResult roll_dice(GameState& state, const std::string& player_id, RandomSource& rng);

// steal_from may be empty. A named victim must own a building on the new hex.
ActionResult move_robber(GameState& state, const std::string& player_id, const std::string& hex,
                         const std::string& steal_from, RandomSource& rng);

// Any player owing cards after a 7 discards exactly what they owe.
ActionResult discard_resources(GameState& state, const std::string& player_id,
                               const ResourceHand& cards);

// ============================================================================
// Trading and turn end
// ============================================================================

// 4:1, or 3:1 / 2:1 through a harbor.
ActionResult bank_trade(GameState& state, const std::string& player_id, ResourceType give,
                        ResourceType receive);

ActionResult end_turn(GameState& state, const std::string& player_id);

// ============================================================================
// Dispatcher
// ============================================================================

ActionResult apply_action(GameState& state, const std::string& player_id, const Action& action,
                          RandomSource& rng);

} // namespace hexsettle
