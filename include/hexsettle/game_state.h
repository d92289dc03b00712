// game_state.h
// Complete authoritative game state for one match.
// Vertex and edge maps only ever hold canonical keys; every accessor
// canonicalizes its argument, so callers may pass any equivalent key.

#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "hexsettle/board_grid.h"
#include "hexsettle/dev_cards.h"
#include "hexsettle/hex_coords.h"
#include "hexsettle/player_state.h"

namespace hexsettle {

class RandomSource;

enum class GamePhase : std::uint8_t {
    Setup,              // Joining and initial placement
    Playing,            // Normal gameplay
    Finished            // Someone reached the victory threshold
};

enum class TurnPhase : std::uint8_t {
    Roll,               // Player must roll (or play a knight first)
    Robber,             // Player must move the robber
    Discard,            // Players over the hand limit must discard
    Main,               // Trade, build, play cards, end turn
    SpecialBuild,       // 5-6 player variant: other players may build
    COUNT
};

constexpr std::size_t NUM_TURN_PHASES = 5;

enum class BuildingType : std::uint8_t {
    None = 0,
    Settlement,
    City
};

struct Building {
    BuildingType type{BuildingType::None};
    std::uint8_t owner{NO_PLAYER};
};

struct Road {
    std::uint8_t owner{NO_PLAYER};
};

struct GameOptions {
    std::uint8_t victory_points_to_win{10};
    std::uint8_t discard_limit{7};              // Hands above this discard half on a 7
    std::uint8_t max_players{DEFAULT_MAX_PLAYERS};
    bool special_build_phase{false};            // 5-6 player variant
    bool shuffle_turn_order{true};              // Randomize seats at start_game
    bool randomize_board{true};                 // Shuffle terrain/numbers/harbors at creation
};

struct GameState {
    std::string id;
    GameOptions options;

    BoardGrid board;

    // Buildings and roads, keyed by canonical coordinate.
    std::map<VertexCoord, Building> vertices;
    std::map<EdgeCoord, Road> edges;

    // Players in seat order.
    std::vector<PlayerState> players;

    std::uint8_t current_player{0};

    GamePhase game_phase{GamePhase::Setup};
    TurnPhase turn_phase{TurnPhase::Roll};

    // Seats are fixed and placement has begun (set by start_game).
    bool started{false};

    HexCoord robber;

    std::uint8_t longest_road_player{NO_PLAYER};
    std::uint8_t longest_road_length{0};
    std::uint8_t largest_army_player{NO_PLAYER};
    std::uint8_t largest_army_size{0};

    // Per-turn bookkeeping.
    bool has_rolled_this_turn{false};
    bool dev_card_played_this_turn{false};
    std::uint8_t last_dice_roll{0};
    std::uint8_t free_roads_remaining{0};       // Granted by a road building card

    // Cards each player still owes after a 7 (indexed by seat).
    std::vector<std::uint8_t> pending_discards;

    // Seat currently allowed to special-build (NO_PLAYER outside that phase).
    std::uint8_t special_build_player{NO_PLAYER};

    // Setup progress, indexed by seat.
    std::vector<std::uint8_t> setup_settlements_placed;
    std::vector<std::uint8_t> setup_roads_placed;
    std::vector<VertexCoord> setup_last_settlement;

    // Development cards left to buy; the back of the vector is the top.
    std::vector<DevCardType> dev_deck;

    ResourceHand resource_bank{};

    std::uint8_t winner{NO_PLAYER};
    std::uint32_t turn_number{0};

    // Fresh game in Setup with the board generated and the robber on the desert.
    static GameState create_game(const std::string& id, const GameOptions& options,
                                 RandomSource& rng);

    std::uint8_t num_players() const { return static_cast<std::uint8_t>(players.size()); }

    // Seat index for a player id, or NO_PLAYER.
    std::uint8_t find_player(const std::string& player_id) const;

    // The seat whose actions are accepted right now (special builder or current player).
    std::uint8_t acting_player() const;

    // Lookups accept any equivalent key. nullptr when empty.
    const Building* building_at(const VertexCoord& v) const;
    const Road* road_at(const EdgeCoord& e) const;

    bool is_vertex_occupied(const VertexCoord& v) const { return building_at(v) != nullptr; }
    bool is_edge_occupied(const EdgeCoord& e) const { return road_at(e) != nullptr; }

    // True if the vertex holds a building of someone other than player_idx.
    bool is_opponent_building(const VertexCoord& v, std::uint8_t player_idx) const;

    // Raw board mutations (caller must validate legality).
    void put_settlement(std::uint8_t player_idx, const VertexCoord& v);
    void put_city(std::uint8_t player_idx, const VertexCoord& v);
    void put_road(std::uint8_t player_idx, const EdgeCoord& e);

    // Move resources between a player and the bank.
    void pay_to_bank(std::uint8_t player_idx, const ResourceHand& cost);
    void take_from_bank(std::uint8_t player_idx, ResourceType r, std::uint8_t count);

    // Recalculate public/hidden victory points from the board and cards.
    void update_victory_points(std::uint8_t player_idx);
    void update_all_victory_points();

    // Recalculate largest army (call when knights are played).
    void update_largest_army();

    // Enter Finished if someone reached the threshold. Returns true if the game ended.
    bool check_winner();

    // Harbor access through any settlement/city on a harbor edge endpoint.
    bool has_harbor_access(std::uint8_t player_idx, HarborType harbor_type) const;

    // Best bank trade ratio for giving `resource`: 2, 3 or 4.
    std::uint8_t get_trade_ratio(std::uint8_t player_idx, ResourceType resource) const;
};

inline const char* game_phase_name(GamePhase p) {
    switch (p) {
        case GamePhase::Setup:    return "setup";
        case GamePhase::Playing:  return "playing";
        case GamePhase::Finished: return "finished";
        default:                  return "unknown";
    }
}

inline const char* turn_phase_name(TurnPhase p) {
    switch (p) {
        case TurnPhase::Roll:         return "roll";
        case TurnPhase::Robber:       return "robber";
        case TurnPhase::Discard:      return "discard";
        case TurnPhase::Main:         return "main";
        case TurnPhase::SpecialBuild: return "specialBuild";
        default:                      return "unknown";
    }
}

} // namespace hexsettle
