// move_gen.cpp
// Placement rules over canonical coordinates.

#include "hexsettle/move_gen.h"

#include <algorithm>

namespace hexsettle {

// ============================================================================
// Helper: Distance Rule
// ============================================================================

bool check_distance_rule(const GameState& state, const VertexCoord& v) {
    if (state.is_vertex_occupied(v)) return false;

    for (const VertexCoord& other : adjacent_vertices(v)) {
        if (state.is_vertex_occupied(other)) return false;
    }
    return true;
}

// ============================================================================
// Helper: Road Network Connectivity
// ============================================================================

bool is_connected_to_road_network(const GameState& state, std::uint8_t player_idx,
                                  const VertexCoord& v) {
    for (const EdgeCoord& e : vertex_edges(v)) {
        const Road* road = state.road_at(e);
        if (road != nullptr && road->owner == player_idx) return true;
    }
    return false;
}

bool is_road_connected(const GameState& state, std::uint8_t player_idx, const EdgeCoord& e) {
    const EdgeCoord self = canonical_edge(e);

    for (const VertexCoord& end : edge_vertices(self)) {
        const Building* b = state.building_at(end);
        if (b != nullptr) {
            if (b->owner == player_idx) return true;
            continue;  // Opponent building blocks extension through this corner
        }
        for (const EdgeCoord& other : vertex_edges(end)) {
            if (other == self) continue;
            const Road* road = state.road_at(other);
            if (road != nullptr && road->owner == player_idx) return true;
        }
    }
    return false;
}

// ============================================================================
// Location checks
// ============================================================================

ActionResult check_settlement_location(const GameState& state, std::uint8_t player_idx,
                                       const VertexCoord& v, bool setup) {
    if (!state.board.is_vertex_on_board(v)) {
        return ActionResult::fail(RuleViolation::InvalidLocation,
                                  vertex_key(v) + " is not on the board");
    }
    if (state.is_vertex_occupied(v)) {
        return ActionResult::fail(RuleViolation::Occupied, vertex_key(v) + " is already occupied");
    }
    if (!check_distance_rule(state, v)) {
        return ActionResult::fail(RuleViolation::DistanceRule,
                                  "too close to another settlement or city");
    }
    if (!setup && !is_connected_to_road_network(state, player_idx, v)) {
        return ActionResult::fail(RuleViolation::NotConnected,
                                  "settlement must connect to one of your roads");
    }
    return ActionResult::ok();
}

ActionResult check_road_location(const GameState& state, std::uint8_t player_idx,
                                 const EdgeCoord& e, bool setup) {
    if (!state.board.is_edge_on_board(e)) {
        return ActionResult::fail(RuleViolation::InvalidLocation,
                                  edge_key(e) + " is not on the board");
    }
    if (state.is_edge_occupied(e)) {
        return ActionResult::fail(RuleViolation::Occupied, "a road already exists there");
    }

    if (setup) {
        // Must touch the settlement just placed in this setup round.
        if (player_idx >= state.setup_last_settlement.size() ||
            state.setup_settlements_placed[player_idx] == 0) {
            return ActionResult::fail(RuleViolation::NotConnected, "place a settlement first");
        }
        const VertexCoord anchor = state.setup_last_settlement[player_idx];
        for (const VertexCoord& end : edge_vertices(e)) {
            if (end == anchor) return ActionResult::ok();
        }
        return ActionResult::fail(RuleViolation::NotConnected,
                                  "setup road must touch the settlement just placed");
    }

    if (!is_road_connected(state, player_idx, e)) {
        return ActionResult::fail(RuleViolation::NotConnected,
                                  "road must connect to your road network");
    }
    return ActionResult::ok();
}

ActionResult check_city_location(const GameState& state, std::uint8_t player_idx,
                                 const VertexCoord& v) {
    const Building* b = state.building_at(v);
    if (b == nullptr || b->type != BuildingType::Settlement) {
        return ActionResult::fail(RuleViolation::InvalidLocation,
                                  "a city must replace a settlement");
    }
    if (b->owner != player_idx) {
        return ActionResult::fail(RuleViolation::NotYourPiece, "that settlement is not yours");
    }
    return ActionResult::ok();
}

// ============================================================================
// Enumerators
// ============================================================================

std::vector<VertexCoord> legal_settlement_vertices(const GameState& state, std::uint8_t player_idx,
                                                   bool setup) {
    std::vector<VertexCoord> out;
    for (const VertexCoord& v : state.board.all_vertices()) {
        if (check_settlement_location(state, player_idx, v, setup)) out.push_back(v);
    }
    return out;
}

std::vector<EdgeCoord> legal_road_edges(const GameState& state, std::uint8_t player_idx, bool setup) {
    std::vector<EdgeCoord> out;
    for (const EdgeCoord& e : state.board.all_edges()) {
        if (check_road_location(state, player_idx, e, setup)) out.push_back(e);
    }
    return out;
}

std::vector<VertexCoord> legal_city_vertices(const GameState& state, std::uint8_t player_idx) {
    std::vector<VertexCoord> out;
    for (const auto& entry : state.vertices) {
        if (entry.second.type == BuildingType::Settlement && entry.second.owner == player_idx) {
            out.push_back(entry.first);
        }
    }
    return out;
}

std::vector<HexCoord> legal_robber_hexes(const GameState& state) {
    std::vector<HexCoord> out;
    for (const auto& entry : state.board.hexes) {
        if (entry.first != state.robber) out.push_back(entry.first);
    }
    return out;
}

std::vector<std::uint8_t> steal_candidates(const GameState& state, std::uint8_t thief_idx,
                                           const HexCoord& hex) {
    std::vector<std::uint8_t> out;
    for (const VertexCoord& v : state.board.get_hex_vertices(hex)) {
        const Building* b = state.building_at(v);
        if (b == nullptr || b->owner == thief_idx || b->owner >= state.num_players()) continue;
        if (std::find(out.begin(), out.end(), b->owner) == out.end()) out.push_back(b->owner);
    }
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace hexsettle
