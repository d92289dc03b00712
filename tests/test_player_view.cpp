// test_player_view.cpp
// Hidden information in per-player views.

#include <algorithm>
#include <iostream>

#include "hexsettle/log.h"
#include "hexsettle/player_view.h"
#include "test_support.h"

using namespace hexsettle;
using namespace hexsettle::test;

// Alice and bob each hold one face-down point card; bob also has one bought
// this turn plus a fresh monopoly. Carol holds three knights.
static GameState make_secret_game() {
    GameState game = make_playing_game(3);
    game.players[0].dev_cards[card(DevCardType::VictoryPoint)] = 1;
    game.players[0].dev_cards[card(DevCardType::Knight)] = 2;
    game.players[1].dev_cards[card(DevCardType::VictoryPoint)] = 1;
    game.players[1].new_dev_cards[card(DevCardType::VictoryPoint)] = 1;
    game.players[1].new_dev_cards[card(DevCardType::Monopoly)] = 1;
    game.players[2].dev_cards[card(DevCardType::Knight)] = 3;
    game.update_all_victory_points();
    return game;
}

static void test_hidden_points() {
    std::cout << "\n=== Test: Opponents' Hidden Points ===\n";
    bool ok = true;

    const GameState game = make_secret_game();
    const PlayerView view = get_player_view(game, "alice");

    if (view.my_index != 0) {
        std::cout << "  ERROR: Alice's view should know her seat\n";
        ok = false;
    }

    const PlayerState& me = view.state.players[0];
    if (me.hidden_victory_points != 1 || me.playable_cards(DevCardType::VictoryPoint) != 1) {
        std::cout << "  ERROR: Own point cards should stay visible\n";
        ok = false;
    }

    const PlayerState& bob = view.state.players[1];
    if (bob.hidden_victory_points != 0 || bob.playable_cards(DevCardType::VictoryPoint) != 0 ||
        bob.fresh_cards(DevCardType::VictoryPoint) != 0) {
        std::cout << "  ERROR: Bob's point cards should be hidden from alice\n";
        ok = false;
    }
    if (me.playable_cards(DevCardType::Knight) != 2) {
        std::cout << "  ERROR: Own knights should stay visible\n";
        ok = false;
    }

    // Bob (two point cards and a monopoly) and carol (three knights) look the same.
    const PlayerState& carol = view.state.players[2];
    if (bob.total_dev_cards() != 0 || carol.total_dev_cards() != 0 ||
        bob.dev_cards != carol.dev_cards || bob.new_dev_cards != carol.new_dev_cards) {
        std::cout << "  ERROR: Opponents' card types should not be visible\n";
        ok = false;
    }
    if (view.dev_card_counts != std::vector<std::uint8_t>{3, 3, 3}) {
        std::cout << "  ERROR: Every seat's card count should be public\n";
        ok = false;
    }

    // The authoritative state is untouched.
    if (game.players[1].hidden_victory_points != 2) {
        std::cout << "  ERROR: Source state should be unchanged\n";
        ok = false;
    }

    report(ok);
}

static void test_spectator_view() {
    std::cout << "\n=== Test: Spectator View ===\n";
    bool ok = true;

    const GameState game = make_secret_game();
    const PlayerView view = get_player_view(game, "mallory");

    if (view.my_index != NO_PLAYER) {
        std::cout << "  ERROR: A spectator has no seat\n";
        ok = false;
    }
    for (const PlayerState& p : view.state.players) {
        if (p.hidden_victory_points != 0 || p.total_dev_cards() != 0) {
            std::cout << "  ERROR: Spectators see no hidden points or card types (" << p.id << ")\n";
            ok = false;
        }
    }

    report(ok);
}

static void test_finished_game_reveals() {
    std::cout << "\n=== Test: Finished Game Reveals All ===\n";
    bool ok = true;

    GameState game = make_secret_game();
    game.game_phase = GamePhase::Finished;
    game.winner = 1;

    const PlayerView view = get_player_view(game, "alice");
    if (view.state.players[1].hidden_victory_points != 2 ||
        view.state.players[1].fresh_cards(DevCardType::Monopoly) != 1 ||
        view.state.players[2].playable_cards(DevCardType::Knight) != 3 ||
        view.state.players[1].total_victory_points() != game.players[1].total_victory_points()) {
        std::cout << "  ERROR: Every point is shown once the game is over\n";
        ok = false;
    }

    report(ok);
}

static void test_deck_order_hidden() {
    std::cout << "\n=== Test: Deck Order Hidden ===\n";
    bool ok = true;

    const GameState game = make_secret_game();
    const PlayerView view = get_player_view(game, "bob");

    const std::vector<DevCardType>& deck = view.state.dev_deck;
    if (deck.size() != game.dev_deck.size() || !std::is_sorted(deck.begin(), deck.end())) {
        std::cout << "  ERROR: View deck should keep its size but lose its order\n";
        ok = false;
    }
    if (std::is_sorted(game.dev_deck.begin(), game.dev_deck.end())) {
        std::cout << "  ERROR: The real deck should still be shuffled\n";
        ok = false;
    }

    report(ok);
}

int main() {
    std::cout << "========================================\n";
    std::cout << "  Player View Test Suite\n";
    std::cout << "========================================\n";

    log::set_level(spdlog::level::off);

    test_hidden_points();
    test_spectator_view();
    test_finished_game_reveals();
    test_deck_order_hidden();

    return finish("Player View Test Suite");
}
