// resources.h
// Resource types for player hands, the bank and trading.

#pragma once

#include <array>
#include <cstdint>

namespace hexsettle {

// Standard game has 5 resource types.
enum class ResourceType : std::uint8_t {
    Brick = 0,
    Lumber,
    Wool,
    Grain,
    Ore,
    COUNT  // Sentinel for array sizing, also "no resource"
};

constexpr std::size_t NUM_RESOURCE_TYPES = 5;

// 19 cards of each resource in the bank.
constexpr std::uint8_t BANK_CARDS_PER_RESOURCE = 19;

// Count per resource type, indexed by ResourceType.
using ResourceHand = std::array<std::uint8_t, NUM_RESOURCE_TYPES>;

inline std::size_t resource_index(ResourceType r) {
    return static_cast<std::size_t>(r);
}

inline bool is_valid_resource(ResourceType r) {
    return r != ResourceType::COUNT;
}

inline const char* resource_name(ResourceType r) {
    switch (r) {
        case ResourceType::Brick:  return "brick";
        case ResourceType::Lumber: return "lumber";
        case ResourceType::Wool:   return "wool";
        case ResourceType::Grain:  return "grain";
        case ResourceType::Ore:    return "ore";
        default:                   return "none";
    }
}

inline unsigned hand_total(const ResourceHand& hand) {
    unsigned total = 0;
    for (std::uint8_t count : hand) total += count;
    return total;
}

} // namespace hexsettle
