// game_state.cpp
// Game creation, canonical lookups, scoring and harbor queries.

#include "hexsettle/game_state.h"
#include "hexsettle/log.h"
#include "hexsettle/random_source.h"

#include <algorithm>

namespace hexsettle {

GameState GameState::create_game(const std::string& id, const GameOptions& options,
                                 RandomSource& rng) {
    GameState state;
    state.id = id;
    state.options = options;
    state.options.max_players = std::min<std::uint8_t>(
        std::max<std::uint8_t>(options.max_players, MIN_PLAYERS),
        static_cast<std::uint8_t>(MAX_PLAYERS));

    state.board = BoardGrid::create_default();
    if (options.randomize_board) {
        state.board.randomize(rng);
    }

    // Robber starts on the desert.
    if (!state.board.find_desert(state.robber) && !state.board.hexes.empty()) {
        state.robber = state.board.hexes.begin()->first;
    }

    // The deck is shuffled by start_game, once the order of draws matters.
    state.dev_deck.clear();
    for (std::size_t i = 0; i < NUM_DEV_CARD_TYPES; ++i) {
        for (std::uint8_t n = 0; n < STANDARD_DEV_CARD_COUNTS[i]; ++n) {
            state.dev_deck.push_back(static_cast<DevCardType>(i));
        }
    }

    state.resource_bank.fill(BANK_CARDS_PER_RESOURCE);

    state.game_phase = GamePhase::Setup;
    state.turn_phase = TurnPhase::Roll;  // Not used in setup, but set for consistency
    state.current_player = 0;
    state.turn_number = 0;

    log::get()->debug("game '{}' created with {} hexes", id, state.board.hexes.size());
    return state;
}

std::uint8_t GameState::find_player(const std::string& player_id) const {
    for (std::size_t i = 0; i < players.size(); ++i) {
        if (players[i].id == player_id) return static_cast<std::uint8_t>(i);
    }
    return NO_PLAYER;
}

std::uint8_t GameState::acting_player() const {
    if (game_phase == GamePhase::Playing && turn_phase == TurnPhase::SpecialBuild) {
        return special_build_player;
    }
    return current_player;
}

const Building* GameState::building_at(const VertexCoord& v) const {
    auto it = vertices.find(canonical_vertex(v));
    if (it == vertices.end() || it->second.type == BuildingType::None) return nullptr;
    return &it->second;
}

const Road* GameState::road_at(const EdgeCoord& e) const {
    auto it = edges.find(canonical_edge(e));
    if (it == edges.end() || it->second.owner == NO_PLAYER) return nullptr;
    return &it->second;
}

bool GameState::is_opponent_building(const VertexCoord& v, std::uint8_t player_idx) const {
    const Building* b = building_at(v);
    return b != nullptr && b->owner != player_idx;
}

void GameState::put_settlement(std::uint8_t player_idx, const VertexCoord& v) {
    vertices[canonical_vertex(v)] = Building{BuildingType::Settlement, player_idx};

    PlayerState& player = players[player_idx];
    if (player.settlements_remaining > 0) {
        player.settlements_remaining--;
    }
    update_victory_points(player_idx);
}

void GameState::put_city(std::uint8_t player_idx, const VertexCoord& v) {
    vertices[canonical_vertex(v)] = Building{BuildingType::City, player_idx};

    // Settlement returns to supply, city is used.
    PlayerState& player = players[player_idx];
    player.settlements_remaining++;
    if (player.cities_remaining > 0) {
        player.cities_remaining--;
    }
    update_victory_points(player_idx);
}

void GameState::put_road(std::uint8_t player_idx, const EdgeCoord& e) {
    edges[canonical_edge(e)] = Road{player_idx};

    PlayerState& player = players[player_idx];
    if (player.roads_remaining > 0) {
        player.roads_remaining--;
    }
    // Roads affect longest road; callers run update_longest_road().
}

void GameState::pay_to_bank(std::uint8_t player_idx, const ResourceHand& cost) {
    players[player_idx].pay_resources(cost);
    for (std::size_t i = 0; i < NUM_RESOURCE_TYPES; ++i) {
        resource_bank[i] = static_cast<std::uint8_t>(resource_bank[i] + cost[i]);
    }
}

void GameState::take_from_bank(std::uint8_t player_idx, ResourceType r, std::uint8_t count) {
    const std::size_t idx = resource_index(r);
    const std::uint8_t given = std::min(count, resource_bank[idx]);
    resource_bank[idx] = static_cast<std::uint8_t>(resource_bank[idx] - given);
    players[player_idx].resources[idx] = static_cast<std::uint8_t>(players[player_idx].resources[idx] + given);
}

void GameState::update_victory_points(std::uint8_t player_idx) {
    if (player_idx >= num_players()) return;

    PlayerState& player = players[player_idx];

    // Settlements: 1 VP each, cities: 2 VP each.
    unsigned public_vp = 0;
    for (const auto& entry : vertices) {
        const Building& b = entry.second;
        if (b.owner != player_idx) continue;
        if (b.type == BuildingType::Settlement) public_vp += 1;
        else if (b.type == BuildingType::City) public_vp += 2;
    }

    if (player.has_longest_road) public_vp += BONUS_VICTORY_POINTS;
    if (player.has_largest_army) public_vp += BONUS_VICTORY_POINTS;
    public_vp += player.revealed_victory_cards;

    player.public_victory_points = static_cast<std::uint8_t>(public_vp);

    // Face-down victory point cards, playable or bought this turn.
    const std::size_t vp_idx = dev_card_index(DevCardType::VictoryPoint);
    player.hidden_victory_points =
        static_cast<std::uint8_t>(player.dev_cards[vp_idx] + player.new_dev_cards[vp_idx]);
}

void GameState::update_all_victory_points() {
    for (std::uint8_t p = 0; p < num_players(); ++p) {
        update_victory_points(p);
    }
}

void GameState::update_largest_army() {
    std::uint8_t new_owner = largest_army_player;
    std::uint8_t best = (largest_army_player == NO_PLAYER)
        ? static_cast<std::uint8_t>(LARGEST_ARMY_MIN_KNIGHTS - 1)
        : players[largest_army_player].knights_played;

    // Must strictly beat the holder (or the minimum) to take it.
    for (std::uint8_t p = 0; p < num_players(); ++p) {
        if (players[p].knights_played > best) {
            best = players[p].knights_played;
            new_owner = p;
        }
    }

    if (new_owner == NO_PLAYER) return;
    largest_army_size = best;
    if (new_owner == largest_army_player) return;

    if (largest_army_player != NO_PLAYER) {
        players[largest_army_player].has_largest_army = false;
        update_victory_points(largest_army_player);
    }
    log::get()->info("largest army: {} -> {} ({} knights)",
                     largest_army_player == NO_PLAYER ? std::string("nobody")
                                                      : players[largest_army_player].id,
                     players[new_owner].id, best);
    largest_army_player = new_owner;
    players[new_owner].has_largest_army = true;
    update_victory_points(new_owner);
}

bool GameState::check_winner() {
    if (game_phase != GamePhase::Playing) return false;

    // Acting player first, then everyone else in seat order.
    const std::uint8_t first = acting_player() < num_players() ? acting_player() : current_player;
    for (std::uint8_t i = 0; i < num_players(); ++i) {
        const std::uint8_t p = static_cast<std::uint8_t>((first + i) % num_players());
        if (players[p].total_victory_points() >= options.victory_points_to_win) {
            game_phase = GamePhase::Finished;
            winner = p;
            special_build_player = NO_PLAYER;
            log::get()->info("game '{}' finished: {} wins with {} points",
                             id, players[p].id, players[p].total_victory_points());
            return true;
        }
    }
    return false;
}

bool GameState::has_harbor_access(std::uint8_t player_idx, HarborType harbor_type) const {
    if (player_idx >= num_players()) return false;

    for (const Harbor& harbor : board.harbors) {
        if (harbor.type != harbor_type) continue;

        for (const VertexCoord& v : edge_vertices(harbor.edge)) {
            const Building* b = building_at(v);
            if (b != nullptr && b->owner == player_idx) return true;
        }
    }
    return false;
}

std::uint8_t GameState::get_trade_ratio(std::uint8_t player_idx, ResourceType resource) const {
    if (player_idx >= num_players() || !is_valid_resource(resource)) {
        return 4;
    }

    if (has_harbor_access(player_idx, harbor_for_resource(resource))) {
        return 2;
    }
    if (has_harbor_access(player_idx, HarborType::Generic)) {
        return 3;
    }
    return 4;
}

} // namespace hexsettle
