// test_support.h
// Shared fixtures for the test harnesses.

#pragma once

#include <iostream>
#include <string>
#include <vector>

#include "hexsettle/game_state.h"
#include "hexsettle/hex_coords.h"
#include "hexsettle/random_source.h"
#include "hexsettle/state_transition.h"

namespace hexsettle {
namespace test {

inline int failures = 0;

inline void report(bool ok) {
    std::cout << (ok ? "PASSED" : "FAILED") << "\n";
    if (!ok) ++failures;
}

inline int finish(const char* suite) {
    std::cout << "\n========================================\n";
    std::cout << "  " << suite << ": " << (failures == 0 ? "all passed" : "FAILURES")
              << " (" << failures << " failed)\n";
    std::cout << "========================================\n";
    return failures == 0 ? 0 : 1;
}

inline const std::vector<std::string>& player_ids() {
    static const std::vector<std::string> ids = {"alice", "bob", "carol", "dave", "erin", "frank"};
    return ids;
}

// Fixed default board, seats in join order, deck shuffled with a fixed seed.
inline GameState make_started_game(std::size_t num_players = 2, GameOptions options = GameOptions{}) {
    options.randomize_board = false;
    options.shuffle_turn_order = false;
    if (options.max_players < num_players) {
        options.max_players = static_cast<std::uint8_t>(num_players);
    }

    Mt19937Source rng(7);
    GameState state = GameState::create_game("test", options, rng);
    for (std::size_t i = 0; i < num_players; ++i) {
        add_player(state, player_ids()[i], player_ids()[i]);
    }
    start_game(state, rng);
    return state;
}

// Started game past initial placement: first seat to act, dice already rolled.
inline GameState make_playing_game(std::size_t num_players = 2, GameOptions options = GameOptions{}) {
    GameState state = make_started_game(num_players, options);
    state.game_phase = GamePhase::Playing;
    state.turn_phase = TurnPhase::Main;
    state.has_rolled_this_turn = true;
    state.turn_number = 1;
    return state;
}

inline ResourceHand hand(int brick, int lumber, int wool, int grain, int ore) {
    return ResourceHand{{
        static_cast<std::uint8_t>(brick), static_cast<std::uint8_t>(lumber),
        static_cast<std::uint8_t>(wool), static_cast<std::uint8_t>(grain),
        static_cast<std::uint8_t>(ore),
    }};
}

inline VertexCoord vtx(const std::string& key) { return parse_vertex_key(key); }
inline EdgeCoord edge(const std::string& key) { return parse_edge_key(key); }

// Place roads directly (no validation) for the given owner.
inline void put_roads(GameState& state, std::uint8_t owner, const std::vector<std::string>& keys) {
    for (const std::string& key : keys) state.put_road(owner, edge(key));
}

inline std::size_t res(ResourceType r) { return resource_index(r); }
inline std::size_t card(DevCardType t) { return dev_card_index(t); }

} // namespace test
} // namespace hexsettle
