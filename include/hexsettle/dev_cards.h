// dev_cards.h
// Development card types and distribution.

#pragma once

#include <array>
#include <cstdint>

namespace hexsettle {

enum class DevCardType : std::uint8_t {
    Knight = 0,      // 14 knights in deck
    VictoryPoint,    // 5 victory point cards
    RoadBuilding,    // 2 road building cards
    YearOfPlenty,    // 2 year of plenty cards
    Monopoly,        // 2 monopoly cards
    COUNT            // Sentinel for array sizing
};

constexpr std::size_t NUM_DEV_CARD_TYPES = 5;

// Count per card type, indexed by DevCardType.
using DevCardHand = std::array<std::uint8_t, NUM_DEV_CARD_TYPES>;

// Standard distribution (25 total cards).
constexpr DevCardHand STANDARD_DEV_CARD_COUNTS = {
    14,  // Knight
    5,   // VictoryPoint
    2,   // RoadBuilding
    2,   // YearOfPlenty
    2    // Monopoly
};

constexpr std::size_t TOTAL_DEV_CARDS = 25;

inline std::size_t dev_card_index(DevCardType t) {
    return static_cast<std::size_t>(t);
}

inline bool is_valid_dev_card(DevCardType t) {
    return dev_card_index(t) < NUM_DEV_CARD_TYPES;
}

// Point cards do not count against the one-card-per-turn limit.
inline bool is_trivial_card(DevCardType t) {
    return t == DevCardType::VictoryPoint;
}

inline const char* dev_card_name(DevCardType t) {
    switch (t) {
        case DevCardType::Knight:       return "knight";
        case DevCardType::VictoryPoint: return "victory_point";
        case DevCardType::RoadBuilding: return "road_building";
        case DevCardType::YearOfPlenty: return "year_of_plenty";
        case DevCardType::Monopoly:     return "monopoly";
        default:                        return "unknown";
    }
}

} // namespace hexsettle
