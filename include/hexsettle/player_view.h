// player_view.h
// Per-viewer projection of the authoritative state.

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "hexsettle/game_state.h"

namespace hexsettle {

struct PlayerView {
    GameState state;
    std::uint8_t my_index{NO_PLAYER};   // NO_PLAYER for a spectator

    // Unplayed development cards per seat (playable plus bought this turn).
    // The count is public; the card types are only shown for the viewer.
    std::vector<std::uint8_t> dev_card_counts;
};

// Copy of the state with the deck order hidden and, for every seat but the
// viewer's, unplayed development cards and hidden points removed. Once the
// game is finished every player's cards and points are shown. The source state
// is not modified.
PlayerView get_player_view(const GameState& state, const std::string& viewer_id);

} // namespace hexsettle
