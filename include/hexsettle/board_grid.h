// board_grid.h
// Hex map, terrain, dice numbers and harbors.
// Immutable after generation; the robber lives on GameState, not here.

#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <vector>

#include "hexsettle/hex_coords.h"
#include "hexsettle/resources.h"

namespace hexsettle {

class RandomSource;

// Standard board: 19 hexes within axial radius 2 of the origin.
constexpr int STANDARD_BOARD_RADIUS = 2;
constexpr std::size_t STANDARD_NUM_HEXES    = 19;
constexpr std::size_t STANDARD_NUM_VERTICES = 54;
constexpr std::size_t STANDARD_NUM_EDGES    = 72;
constexpr std::size_t STANDARD_NUM_HARBORS  = 9;

enum class Terrain : std::uint8_t {
    Desert = 0,
    Hills,      // brick
    Forest,     // lumber
    Pasture,    // wool
    Fields,     // grain
    Mountains,  // ore
};

enum class HarborType : std::uint8_t {
    None = 0,
    Generic,        // 3:1 any resource
    Brick,          // 2:1 brick
    Lumber,         // 2:1 lumber
    Wool,           // 2:1 wool
    Grain,          // 2:1 grain
    Ore,            // 2:1 ore
};

// Desert produces nothing (ResourceType::COUNT).
inline ResourceType terrain_resource(Terrain t) {
    switch (t) {
        case Terrain::Hills:     return ResourceType::Brick;
        case Terrain::Forest:    return ResourceType::Lumber;
        case Terrain::Pasture:   return ResourceType::Wool;
        case Terrain::Fields:    return ResourceType::Grain;
        case Terrain::Mountains: return ResourceType::Ore;
        default:                 return ResourceType::COUNT;
    }
}

inline HarborType harbor_for_resource(ResourceType r) {
    switch (r) {
        case ResourceType::Brick:  return HarborType::Brick;
        case ResourceType::Lumber: return HarborType::Lumber;
        case ResourceType::Wool:   return HarborType::Wool;
        case ResourceType::Grain:  return HarborType::Grain;
        case ResourceType::Ore:    return HarborType::Ore;
        default:                   return HarborType::None;
    }
}

struct Hex {
    HexCoord coord;
    Terrain terrain{Terrain::Desert};
    std::uint8_t number{0};   // Dice number 2..12 (0 for desert)

    ResourceType resource() const { return terrain_resource(terrain); }
};

// A harbor sits on a coastal edge; both endpoints of the edge grant access.
struct Harbor {
    EdgeCoord edge;   // canonical
    HarborType type{HarborType::None};
};

struct BoardGrid {
    std::map<HexCoord, Hex> hexes;
    std::vector<Harbor> harbors;

    // Standard 19-hex layout with a fixed terrain/number assignment,
    // desert in the center and 9 harbors on the coast.
    // Call randomize() for a shuffled board.
    static BoardGrid create_default();

    // No hexes, no harbors. Used by tests to build custom boards.
    static BoardGrid create_empty();

    // Shuffle terrain, dice numbers and harbor types.
    // Uses standard distribution: 4 forest, 4 fields, 4 pasture, 3 hills, 3 mountains, 1 desert.
    void randomize(RandomSource& rng);

    // Insert or overwrite one hex.
    void set_hex(const HexCoord& coord, Terrain terrain, std::uint8_t number);

    const Hex* find_hex(const HexCoord& coord) const;
    bool has_hex(const HexCoord& coord) const { return find_hex(coord) != nullptr; }

    // A vertex/edge is on the board if at least one hex touching it exists.
    bool is_vertex_on_board(const VertexCoord& v) const;
    bool is_edge_on_board(const EdgeCoord& e) const;

    // Canonical vertices/edges of every hex, sorted and deduplicated.
    std::vector<VertexCoord> all_vertices() const;
    std::vector<EdgeCoord> all_edges() const;

    // Canonical corners of a hex, in direction order 0..5.
    std::array<VertexCoord, 6> get_hex_vertices(const HexCoord& coord) const;

    // Edges with exactly one on-board hex, clockwise from the top.
    std::vector<EdgeCoord> coastal_edges() const;

    // First desert hex in coordinate order; returns false if there is none.
    bool find_desert(HexCoord& out) const;
};

} // namespace hexsettle
