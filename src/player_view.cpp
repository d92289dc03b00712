// player_view.cpp

#include "hexsettle/player_view.h"

#include <algorithm>

namespace hexsettle {

PlayerView get_player_view(const GameState& state, const std::string& viewer_id) {
    PlayerView view;
    view.state = state;
    view.my_index = state.find_player(viewer_id);

    std::sort(view.state.dev_deck.begin(), view.state.dev_deck.end());

    view.dev_card_counts.reserve(state.players.size());
    for (const PlayerState& p : state.players) {
        view.dev_card_counts.push_back(static_cast<std::uint8_t>(p.total_dev_cards()));
    }

    if (state.game_phase == GamePhase::Finished) {
        return view;
    }

    // Opponents keep only their card count.
    for (std::uint8_t p = 0; p < view.state.num_players(); ++p) {
        if (p == view.my_index) continue;

        PlayerState& other = view.state.players[p];
        other.hidden_victory_points = 0;
        other.dev_cards.fill(0);
        other.new_dev_cards.fill(0);
    }
    return view;
}

} // namespace hexsettle
