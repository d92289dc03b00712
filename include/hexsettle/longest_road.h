// longest_road.h
// Longest continuous road per player and the longest road bonus.
//
// A player's roads form a graph over canonical vertices. The road length is
// the longest trail (no edge reused) in that graph. A vertex holding another
// player's building can start or end a trail but cannot be passed through,
// so a foreign settlement splits a line in two while a closed loop keeps its
// full length (the trail starts and ends on the foreign vertex).

#pragma once

#include <cstdint>

#include "hexsettle/game_state.h"

namespace hexsettle {

// Longest trail length (edge count) for one player. 0 with no roads.
std::uint8_t compute_road_length(const GameState& state, std::uint8_t player_idx);

// Recompute road_length for every player and reassign the bonus:
//  - needs length >= 5;
//  - the holder keeps it on a tie and loses it only to a strictly longer road;
//  - with no holder, a unique maximum takes it and a tie awards nobody;
//  - a holder cut below 5 loses it and the award is decided as if nobody held it;
//  - a cut holder overtaken by several tied challengers loses it to nobody.
void update_longest_road(GameState& state);

} // namespace hexsettle
