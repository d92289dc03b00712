// player_state.h
// Per-player record: hand, development cards, pieces in supply and scores.

#pragma once

#include <array>
#include <cstdint>
#include <string>

#include "hexsettle/dev_cards.h"
#include "hexsettle/resources.h"

namespace hexsettle {

// Base game seats 4; the 5-6 player extension plays with the special build phase.
constexpr std::size_t MAX_PLAYERS = 6;
constexpr std::uint8_t DEFAULT_MAX_PLAYERS = 4;
constexpr std::uint8_t MIN_PLAYERS = 2;

// Index value meaning "nobody" (longest road holder, winner, etc.).
constexpr std::uint8_t NO_PLAYER = 0xFF;

// Piece limits per player.
constexpr std::uint8_t MAX_SETTLEMENTS_PER_PLAYER = 5;
constexpr std::uint8_t MAX_CITIES_PER_PLAYER = 4;
constexpr std::uint8_t MAX_ROADS_PER_PLAYER = 15;

// Bonus thresholds and values.
constexpr std::uint8_t LONGEST_ROAD_MIN_LENGTH = 5;
constexpr std::uint8_t LARGEST_ARMY_MIN_KNIGHTS = 3;
constexpr std::uint8_t BONUS_VICTORY_POINTS = 2;

struct PlayerState {
    std::string id;
    std::string name;

    // Resource cards in hand (count per resource type).
    ResourceHand resources{};

    // Playable development cards, and cards bought this turn which only
    // become playable after the turn ends.
    DevCardHand dev_cards{};
    DevCardHand new_dev_cards{};

    std::uint8_t knights_played{0};

    // Victory point cards the player has turned face up.
    std::uint8_t revealed_victory_cards{0};

    // Pieces remaining in supply.
    std::uint8_t settlements_remaining{MAX_SETTLEMENTS_PER_PLAYER};
    std::uint8_t cities_remaining{MAX_CITIES_PER_PLAYER};
    std::uint8_t roads_remaining{MAX_ROADS_PER_PLAYER};

    // Public VP: buildings, bonuses, revealed point cards.
    // Hidden VP: victory point cards still face down.
    std::uint8_t public_victory_points{0};
    std::uint8_t hidden_victory_points{0};

    bool has_longest_road{false};
    bool has_largest_army{false};

    // Cached by the longest road engine.
    std::uint8_t road_length{0};

    unsigned total_resources() const { return hand_total(resources); }

    std::uint8_t total_victory_points() const {
        return static_cast<std::uint8_t>(public_victory_points + hidden_victory_points);
    }

    bool can_afford(const ResourceHand& cost) const {
        for (std::size_t i = 0; i < NUM_RESOURCE_TYPES; ++i) {
            if (resources[i] < cost[i]) return false;
        }
        return true;
    }

    // Caller must check affordability first.
    void pay_resources(const ResourceHand& cost) {
        for (std::size_t i = 0; i < NUM_RESOURCE_TYPES; ++i) {
            resources[i] = static_cast<std::uint8_t>(resources[i] - cost[i]);
        }
    }

    std::uint8_t playable_cards(DevCardType t) const { return dev_cards[dev_card_index(t)]; }
    std::uint8_t fresh_cards(DevCardType t) const { return new_dev_cards[dev_card_index(t)]; }

    unsigned total_dev_cards() const {
        unsigned total = 0;
        for (std::size_t i = 0; i < NUM_DEV_CARD_TYPES; ++i) total += dev_cards[i] + new_dev_cards[i];
        return total;
    }
};

// Standard costs for building pieces and buying development cards.
namespace BuildCost {
    constexpr ResourceHand ROAD       = {1, 1, 0, 0, 0};  // 1 brick, 1 lumber
    constexpr ResourceHand SETTLEMENT = {1, 1, 1, 1, 0};  // 1 brick, 1 lumber, 1 wool, 1 grain
    constexpr ResourceHand CITY       = {0, 0, 0, 2, 3};  // 2 grain, 3 ore
    constexpr ResourceHand DEV_CARD   = {0, 0, 1, 1, 1};  // 1 wool, 1 grain, 1 ore
}

} // namespace hexsettle
