// longest_road.cpp
// Depth-first longest trail search with the opponent pass-through cut.

#include "hexsettle/longest_road.h"
#include "hexsettle/log.h"

#include <algorithm>
#include <map>
#include <utility>
#include <vector>

namespace hexsettle {

namespace {

struct RoadGraph {
    // adjacency[node] = (edge id, neighbor node)
    std::vector<std::vector<std::pair<int, int>>> adjacency;
    // Node holds another player's building: trails may end here but not continue.
    std::vector<bool> blocked;
    int num_edges{0};
};

RoadGraph build_graph(const GameState& state, std::uint8_t player_idx) {
    RoadGraph g;
    std::map<VertexCoord, int> node_ids;

    auto node_for = [&](const VertexCoord& v) -> int {
        auto it = node_ids.find(v);
        if (it != node_ids.end()) return it->second;
        const int id = static_cast<int>(g.adjacency.size());
        node_ids.emplace(v, id);
        g.adjacency.emplace_back();
        g.blocked.push_back(state.is_opponent_building(v, player_idx));
        return id;
    };

    // Map keys are canonical, so each physical road appears once.
    for (const auto& entry : state.edges) {
        if (entry.second.owner != player_idx) continue;

        const auto ends = edge_vertices(entry.first);
        const int a = node_for(ends[0]);
        const int b = node_for(ends[1]);
        const int edge_id = g.num_edges++;
        g.adjacency[a].emplace_back(edge_id, b);
        g.adjacency[b].emplace_back(edge_id, a);
    }
    return g;
}

int dfs_longest_trail(const RoadGraph& g, int node, int depth, std::vector<bool>& used) {
    // An opponent's building ends the trail unless we are just leaving it.
    if (depth > 0 && g.blocked[node]) return depth;

    int best = depth;
    for (const auto& step : g.adjacency[node]) {
        const int edge_id = step.first;
        if (used[edge_id]) continue;

        used[edge_id] = true;
        best = std::max(best, dfs_longest_trail(g, step.second, depth + 1, used));
        used[edge_id] = false;

        // Every edge used: nothing can be longer.
        if (best == g.num_edges) break;
    }
    return best;
}

} // namespace

std::uint8_t compute_road_length(const GameState& state, std::uint8_t player_idx) {
    const RoadGraph g = build_graph(state, player_idx);
    if (g.num_edges == 0) return 0;

    int best = 0;
    std::vector<bool> used(static_cast<std::size_t>(g.num_edges), false);
    for (int node = 0; node < static_cast<int>(g.adjacency.size()); ++node) {
        if (g.adjacency[node].empty()) continue;
        best = std::max(best, dfs_longest_trail(g, node, 0, used));
        if (best == g.num_edges) break;
    }
    return static_cast<std::uint8_t>(best);
}

void update_longest_road(GameState& state) {
    const std::uint8_t n = state.num_players();
    for (std::uint8_t p = 0; p < n; ++p) {
        state.players[p].road_length = compute_road_length(state, p);
    }

    const std::uint8_t old_holder = state.longest_road_player;
    std::uint8_t holder = old_holder;

    // A holder below the minimum loses the bonus outright.
    if (holder != NO_PLAYER &&
        (holder >= n || state.players[holder].road_length < LONGEST_ROAD_MIN_LENGTH)) {
        holder = NO_PLAYER;
    }

    // Longest road among everyone except the holder, and how many share it.
    std::uint8_t best_len = 0;
    std::uint8_t best_player = NO_PLAYER;
    unsigned best_count = 0;
    for (std::uint8_t p = 0; p < n; ++p) {
        if (p == holder) continue;
        const std::uint8_t len = state.players[p].road_length;
        if (len > best_len) {
            best_len = len;
            best_player = p;
            best_count = 1;
        } else if (len == best_len && len > 0) {
            ++best_count;
        }
    }

    if (holder != NO_PLAYER) {
        if (best_len > state.players[holder].road_length) {
            holder = (best_count == 1) ? best_player : NO_PLAYER;
        }
    } else if (best_len >= LONGEST_ROAD_MIN_LENGTH && best_count == 1) {
        holder = best_player;
    }

    state.longest_road_player = holder;
    state.longest_road_length = (holder == NO_PLAYER) ? 0 : state.players[holder].road_length;

    if (holder == old_holder) return;

    if (old_holder != NO_PLAYER && old_holder < n) {
        state.players[old_holder].has_longest_road = false;
        state.update_victory_points(old_holder);
    }
    if (holder != NO_PLAYER) {
        state.players[holder].has_longest_road = true;
        state.update_victory_points(holder);
    }

    log::get()->info("longest road: {} -> {} (length {})",
                     old_holder == NO_PLAYER ? std::string("nobody") : state.players[old_holder].id,
                     holder == NO_PLAYER ? std::string("nobody") : state.players[holder].id,
                     state.longest_road_length);
}

} // namespace hexsettle
