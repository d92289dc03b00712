// test_game_state.cpp
// Test harness for game creation, the lobby, canonical storage and scoring.

#include <algorithm>
#include <iostream>
#include <iomanip>

#include "hexsettle/game_state.h"
#include "hexsettle/log.h"
#include "hexsettle/state_transition.h"
#include "test_support.h"

using namespace hexsettle;
using namespace hexsettle::test;

static void print_player_state(const PlayerState& player, std::uint8_t player_idx) {
    std::cout << "  --- Player " << static_cast<int>(player_idx) << " (" << player.id << ") ---\n";

    std::cout << "  Resources:";
    for (std::size_t i = 0; i < NUM_RESOURCE_TYPES; ++i) {
        std::cout << " " << resource_name(static_cast<ResourceType>(i)) << "="
                  << static_cast<int>(player.resources[i]);
    }
    std::cout << "\n";

    std::cout << "  Pieces: " << static_cast<int>(player.settlements_remaining) << "/"
              << static_cast<int>(MAX_SETTLEMENTS_PER_PLAYER) << " settlements, "
              << static_cast<int>(player.cities_remaining) << "/"
              << static_cast<int>(MAX_CITIES_PER_PLAYER) << " cities, "
              << static_cast<int>(player.roads_remaining) << "/"
              << static_cast<int>(MAX_ROADS_PER_PLAYER) << " roads\n";

    std::cout << "  VP: public " << static_cast<int>(player.public_victory_points)
              << ", hidden " << static_cast<int>(player.hidden_victory_points) << "\n";
}

static void test_game_initialization() {
    std::cout << "\n=== Test: Game Initialization ===\n";
    bool ok = true;

    GameOptions options;
    options.randomize_board = false;
    Mt19937Source rng(12345);
    GameState game = GameState::create_game("init", options, rng);

    if (game.game_phase != GamePhase::Setup || game.started) {
        std::cout << "  ERROR: New game should be in setup and not started\n";
        ok = false;
    }
    if (game.robber != HexCoord{0, 0}) {
        std::cout << "  ERROR: Robber should start on the desert, found " << hex_key(game.robber) << "\n";
        ok = false;
    }
    for (std::size_t i = 0; i < NUM_RESOURCE_TYPES; ++i) {
        if (game.resource_bank[i] != BANK_CARDS_PER_RESOURCE) {
            std::cout << "  ERROR: Bank should hold " << static_cast<int>(BANK_CARDS_PER_RESOURCE)
                      << " of each resource\n";
            ok = false;
        }
    }

    if (game.dev_deck.size() != TOTAL_DEV_CARDS) {
        std::cout << "  ERROR: Deck should hold " << TOTAL_DEV_CARDS << " cards, has "
                  << game.dev_deck.size() << "\n";
        ok = false;
    }
    for (std::size_t i = 0; i < NUM_DEV_CARD_TYPES; ++i) {
        const auto n = std::count(game.dev_deck.begin(), game.dev_deck.end(), static_cast<DevCardType>(i));
        if (n != STANDARD_DEV_CARD_COUNTS[i]) {
            std::cout << "  ERROR: Wrong count of " << dev_card_name(static_cast<DevCardType>(i)) << "\n";
            ok = false;
        }
    }

    // Seat limits are clamped to what the engine supports.
    options.max_players = 9;
    GameState big = GameState::create_game("big", options, rng);
    if (big.options.max_players != MAX_PLAYERS) {
        std::cout << "  ERROR: max_players should clamp to " << MAX_PLAYERS << "\n";
        ok = false;
    }

    report(ok);
}

static void test_lobby() {
    std::cout << "\n=== Test: Joining and Starting ===\n";
    bool ok = true;

    GameOptions options;
    options.max_players = 2;
    options.shuffle_turn_order = true;
    Mt19937Source rng(99);
    GameState game = GameState::create_game("lobby", options, rng);

    if (add_player(game, "alice", "Alice").violation != RuleViolation::None) {
        std::cout << "  ERROR: First player should join\n";
        ok = false;
    }
    if (start_game(game, rng).violation != RuleViolation::NotEnoughPlayers) {
        std::cout << "  ERROR: One player should not be able to start\n";
        ok = false;
    }
    if (add_player(game, "alice", "Again").violation != RuleViolation::DuplicatePlayer) {
        std::cout << "  ERROR: Duplicate id should be rejected\n";
        ok = false;
    }
    if (!add_player(game, "bob", "Bob")) {
        std::cout << "  ERROR: Second player should join\n";
        ok = false;
    }
    if (add_player(game, "carol", "Carol").violation != RuleViolation::GameFull) {
        std::cout << "  ERROR: Third player should find the game full\n";
        ok = false;
    }

    // Placement is refused until the game starts.
    if (place_settlement(game, "alice", "v_0_0_0", true).violation != RuleViolation::WrongPhase) {
        std::cout << "  ERROR: Placement before start should be rejected\n";
        ok = false;
    }

    if (!start_game(game, rng)) {
        std::cout << "  ERROR: Two players should be able to start\n";
        ok = false;
    }
    if (!game.started || game.setup_settlements_placed.size() != 2 || game.pending_discards.size() != 2) {
        std::cout << "  ERROR: Start should fix the seats and size per-seat bookkeeping\n";
        ok = false;
    }
    if (game.find_player("alice") == NO_PLAYER || game.find_player("bob") == NO_PLAYER) {
        std::cout << "  ERROR: Shuffled seats should keep both players\n";
        ok = false;
    }
    if (add_player(game, "dave", "Dave").violation != RuleViolation::WrongPhase ||
        start_game(game, rng).violation != RuleViolation::WrongPhase) {
        std::cout << "  ERROR: Lobby actions after start should be rejected\n";
        ok = false;
    }

    report(ok);
}

static void test_canonical_storage() {
    std::cout << "\n=== Test: Canonical Storage ===\n";
    bool ok = true;

    GameState game = make_playing_game(2);

    game.put_settlement(0, vtx("v_0_0_3"));
    game.put_road(0, edge("e_1_0_4"));

    if (game.vertices.size() != 1 || game.vertices.begin()->first != canonical_vertex(vtx("v_0_0_3"))) {
        std::cout << "  ERROR: Vertex map should hold exactly the canonical key\n";
        ok = false;
    }
    if (game.edges.size() != 1 || game.edges.begin()->first != canonical_edge(edge("e_0_0_1"))) {
        std::cout << "  ERROR: Edge map should hold exactly the canonical key\n";
        ok = false;
    }

    // Any spelling finds the same pieces.
    if (game.building_at(vtx("v_0_1_5")) == nullptr || game.building_at(vtx("v_-1_1_1")) == nullptr) {
        std::cout << "  ERROR: Building not found through an equivalent key\n";
        ok = false;
    }
    if (game.road_at(edge("e_0_0_1")) == nullptr) {
        std::cout << "  ERROR: Road not found through an equivalent key\n";
        ok = false;
    }
    if (!game.is_opponent_building(vtx("v_0_1_5"), 1) || game.is_opponent_building(vtx("v_0_1_5"), 0)) {
        std::cout << "  ERROR: Opponent building check is wrong\n";
        ok = false;
    }

    report(ok);
}

static void test_victory_points() {
    std::cout << "\n=== Test: Victory Points ===\n";
    bool ok = true;

    GameState game = make_playing_game(2);

    game.put_settlement(0, vtx("v_0_0_0"));
    game.put_settlement(0, vtx("v_0_0_3"));
    if (game.players[0].public_victory_points != 2) {
        std::cout << "  ERROR: Two settlements should be worth 2 points\n";
        ok = false;
    }

    game.put_city(0, vtx("v_0_0_0"));
    print_player_state(game.players[0], 0);
    if (game.players[0].public_victory_points != 3) {
        std::cout << "  ERROR: City + settlement should be worth 3 points\n";
        ok = false;
    }
    if (game.players[0].settlements_remaining != MAX_SETTLEMENTS_PER_PLAYER - 1 ||
        game.players[0].cities_remaining != MAX_CITIES_PER_PLAYER - 1) {
        std::cout << "  ERROR: Upgrading should return the settlement to supply\n";
        ok = false;
    }

    // Face-down point cards are hidden, revealed ones are public.
    game.players[0].new_dev_cards[card(DevCardType::VictoryPoint)] = 1;
    game.players[0].dev_cards[card(DevCardType::VictoryPoint)] = 1;
    game.players[0].revealed_victory_cards = 1;
    game.update_victory_points(0);
    if (game.players[0].hidden_victory_points != 2 || game.players[0].public_victory_points != 4) {
        std::cout << "  ERROR: Expected 4 public and 2 hidden points\n";
        ok = false;
    }

    report(ok);
}

static void test_largest_army() {
    std::cout << "\n=== Test: Largest Army ===\n";
    bool ok = true;

    GameState game = make_playing_game(2);

    game.players[0].knights_played = 2;
    game.update_largest_army();
    if (game.largest_army_player != NO_PLAYER) {
        std::cout << "  ERROR: Two knights should not earn the bonus\n";
        ok = false;
    }

    game.players[0].knights_played = 3;
    game.update_largest_army();
    if (game.largest_army_player != 0 || !game.players[0].has_largest_army ||
        game.players[0].public_victory_points != BONUS_VICTORY_POINTS) {
        std::cout << "  ERROR: Three knights should earn the bonus\n";
        ok = false;
    }

    game.players[1].knights_played = 3;
    game.update_largest_army();
    if (game.largest_army_player != 0) {
        std::cout << "  ERROR: A tie should leave the bonus with the holder\n";
        ok = false;
    }

    game.players[1].knights_played = 4;
    game.update_largest_army();
    if (game.largest_army_player != 1 || game.players[0].has_largest_army ||
        game.players[0].public_victory_points != 0 || game.largest_army_size != 4) {
        std::cout << "  ERROR: A larger army should take the bonus\n";
        ok = false;
    }

    report(ok);
}

static void test_trade_ratios() {
    std::cout << "\n=== Test: Harbor Trade Ratios ===\n";
    bool ok = true;

    GameState game = make_playing_game(2);
    const Harbor generic = game.board.harbors[0];
    const Harbor lumber = game.board.harbors[1];
    if (generic.type != HarborType::Generic || lumber.type != HarborType::Lumber) {
        std::cout << "  ERROR: Unexpected harbor types on the default board\n";
        ok = false;
    }

    if (game.get_trade_ratio(0, ResourceType::Brick) != 4) {
        std::cout << "  ERROR: Without harbors the ratio should be 4\n";
        ok = false;
    }

    game.put_settlement(0, edge_vertices(lumber.edge)[1]);
    if (game.get_trade_ratio(0, ResourceType::Lumber) != 2 || game.get_trade_ratio(0, ResourceType::Brick) != 4) {
        std::cout << "  ERROR: Lumber harbor should give 2:1 lumber only\n";
        ok = false;
    }

    game.put_settlement(0, edge_vertices(generic.edge)[0]);
    if (game.get_trade_ratio(0, ResourceType::Brick) != 3 || game.get_trade_ratio(0, ResourceType::Lumber) != 2) {
        std::cout << "  ERROR: Generic harbor should give 3:1, specific harbor still 2:1\n";
        ok = false;
    }
    if (game.get_trade_ratio(1, ResourceType::Brick) != 4) {
        std::cout << "  ERROR: Harbor access belongs to the owner only\n";
        ok = false;
    }

    report(ok);
}

static void test_winner_check() {
    std::cout << "\n=== Test: Winner Check ===\n";
    bool ok = true;

    GameState game = make_playing_game(3);
    game.current_player = 1;
    game.players[0].public_victory_points = 10;
    game.players[1].public_victory_points = 9;
    game.players[1].hidden_victory_points = 1;

    // Both have 10; the acting player is checked first.
    if (!game.check_winner() || game.winner != 1 || game.game_phase != GamePhase::Finished) {
        std::cout << "  ERROR: Acting player with 10 points should win first\n";
        ok = false;
    }

    GameState quiet = make_playing_game(2);
    quiet.players[0].public_victory_points = 9;
    if (quiet.check_winner() || quiet.game_phase != GamePhase::Playing) {
        std::cout << "  ERROR: 9 points should not win\n";
        ok = false;
    }

    report(ok);
}

int main() {
    std::cout << "========================================\n";
    std::cout << "  Game State Test Suite\n";
    std::cout << "========================================\n";

    log::set_level(spdlog::level::off);

    test_game_initialization();
    test_lobby();
    test_canonical_storage();
    test_victory_points();
    test_largest_army();
    test_trade_ratios();
    test_winner_check();

    return finish("Game State Test Suite");
}
