// resource_distribution.h
// Converts a dice roll into resource payouts.

#pragma once

#include <cstdint>
#include <vector>

#include "hexsettle/game_state.h"

namespace hexsettle {

// Resources owed per seat for a roll, ignoring the bank. Every matching,
// producing hex not under the robber pays each adjacent building once:
// 1 for a settlement, 2 for a city. A building on two matching hexes is paid
// by each of them. 7 and out-of-range rolls pay nothing.
std::vector<ResourceHand> compute_distribution(const GameState& state, std::uint8_t dice_value);

// Apply compute_distribution against the bank. When the bank cannot cover a
// resource and more than one player is owed it, nobody receives it; a single
// owed player receives what is left. Returns what was actually paid.
std::vector<ResourceHand> distribute_resources(GameState& state, std::uint8_t dice_value);

} // namespace hexsettle
