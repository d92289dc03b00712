// resource_distribution.cpp

#include "hexsettle/resource_distribution.h"
#include "hexsettle/log.h"

#include <set>
#include <utility>

namespace hexsettle {

std::vector<ResourceHand> compute_distribution(const GameState& state, std::uint8_t dice_value) {
    std::vector<ResourceHand> owed(state.num_players(), ResourceHand{});
    if (dice_value == 7 || dice_value < 2 || dice_value > 12) return owed;

    // (hex, canonical vertex) pairs already paid.
    std::set<std::pair<HexCoord, VertexCoord>> paid;

    for (const auto& entry : state.board.hexes) {
        const Hex& hex = entry.second;

        if (hex.number != dice_value) continue;
        if (hex.coord == state.robber) continue;

        const ResourceType res = hex.resource();
        if (!is_valid_resource(res)) continue;

        for (std::uint8_t dir = 0; dir < 6; ++dir) {
            const VertexCoord v = canonical_vertex(VertexCoord{hex.coord.q, hex.coord.r, dir});
            const Building* b = state.building_at(v);
            if (b == nullptr || b->owner >= state.num_players()) continue;

            if (!paid.emplace(hex.coord, v).second) continue;

            const std::uint8_t amount = (b->type == BuildingType::City) ? 2 : 1;
            auto& slot = owed[b->owner][resource_index(res)];
            slot = static_cast<std::uint8_t>(slot + amount);
        }
    }
    return owed;
}

std::vector<ResourceHand> distribute_resources(GameState& state, std::uint8_t dice_value) {
    std::vector<ResourceHand> owed = compute_distribution(state, dice_value);

    for (std::size_t r = 0; r < NUM_RESOURCE_TYPES; ++r) {
        unsigned total = 0;
        unsigned claimants = 0;
        for (const ResourceHand& hand : owed) {
            if (hand[r] == 0) continue;
            total += hand[r];
            ++claimants;
        }
        if (total == 0 || total <= state.resource_bank[r]) continue;

        // Shortage.
        if (claimants > 1) {
            log::get()->debug("bank short of {}: {} owed, {} left, nobody paid",
                              resource_name(static_cast<ResourceType>(r)), total,
                              state.resource_bank[r]);
            for (ResourceHand& hand : owed) hand[r] = 0;
        } else {
            for (ResourceHand& hand : owed) {
                if (hand[r] > 0) hand[r] = state.resource_bank[r];
            }
        }
    }

    for (std::uint8_t p = 0; p < state.num_players(); ++p) {
        for (std::size_t r = 0; r < NUM_RESOURCE_TYPES; ++r) {
            if (owed[p][r] > 0) state.take_from_bank(p, static_cast<ResourceType>(r), owed[p][r]);
        }
    }
    return owed;
}

} // namespace hexsettle
