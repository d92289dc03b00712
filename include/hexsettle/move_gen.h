// move_gen.h
// Placement rule checks and legal-location enumeration.
// The checks here are location-only: turn, phase and cost are validated by
// state_transition. The enumerators back the renderer's highlighting.

#pragma once

#include <cstdint>
#include <vector>

#include "hexsettle/action_result.h"
#include "hexsettle/game_state.h"

namespace hexsettle {

// Vertex and all adjacent vertices are empty.
bool check_distance_rule(const GameState& state, const VertexCoord& v);

// Player has a road on an edge incident to the vertex.
bool is_connected_to_road_network(const GameState& state, std::uint8_t player_idx,
                                  const VertexCoord& v);

// An endpoint holds the player's building, or holds the player's road and is
// not occupied by an opponent (roads cannot be extended through a foreign
// settlement).
bool is_road_connected(const GameState& state, std::uint8_t player_idx, const EdgeCoord& e);

// Location rules for a settlement: on board, empty, distance rule, and
// outside setup a connecting road.
ActionResult check_settlement_location(const GameState& state, std::uint8_t player_idx,
                                       const VertexCoord& v, bool setup);

// Location rules for a road: on board, empty, and connected. During setup
// the road must touch the settlement the player just placed.
ActionResult check_road_location(const GameState& state, std::uint8_t player_idx,
                                 const EdgeCoord& e, bool setup);

// Location rules for a city: the player's own settlement.
ActionResult check_city_location(const GameState& state, std::uint8_t player_idx,
                                 const VertexCoord& v);

// Enumerators (canonical keys, sorted). Costs are not considered.
std::vector<VertexCoord> legal_settlement_vertices(const GameState& state, std::uint8_t player_idx,
                                                   bool setup);
std::vector<EdgeCoord> legal_road_edges(const GameState& state, std::uint8_t player_idx, bool setup);
std::vector<VertexCoord> legal_city_vertices(const GameState& state, std::uint8_t player_idx);

// Every hex except the robber's current one.
std::vector<HexCoord> legal_robber_hexes(const GameState& state);

// Seats other than the thief with a building on a corner of the hex.
std::vector<std::uint8_t> steal_candidates(const GameState& state, std::uint8_t thief_idx,
                                           const HexCoord& hex);

} // namespace hexsettle
