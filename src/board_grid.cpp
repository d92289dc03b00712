// board_grid.cpp
// Standard board layout, shuffling and on-board queries.

#include "hexsettle/board_grid.h"
#include "hexsettle/random_source.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <set>

namespace hexsettle {

namespace {

// Resources in a fixed order for the default board; the desert is placed
// separately at the center.
constexpr std::array<Terrain, STANDARD_NUM_HEXES - 1> STANDARD_TERRAIN = {
    Terrain::Mountains, Terrain::Pasture, Terrain::Forest,
    Terrain::Fields, Terrain::Hills, Terrain::Pasture, Terrain::Hills,
    Terrain::Fields, Terrain::Forest, Terrain::Forest, Terrain::Mountains,
    Terrain::Forest, Terrain::Mountains, Terrain::Fields, Terrain::Pasture,
    Terrain::Hills, Terrain::Fields, Terrain::Pasture,
};

// Two each of 3,4,5,6,8,9,10,11 and one each of 2,12 = 18 numbers.
constexpr std::array<std::uint8_t, STANDARD_NUM_HEXES - 1> STANDARD_NUMBERS = {
    10, 2, 9, 12, 6, 4, 10, 9, 11, 3, 8, 8, 3, 4, 5, 5, 6, 11,
};

constexpr std::array<HarborType, STANDARD_NUM_HARBORS> STANDARD_HARBORS = {
    HarborType::Generic, HarborType::Lumber, HarborType::Generic,
    HarborType::Brick,   HarborType::Generic, HarborType::Grain,
    HarborType::Generic, HarborType::Ore,     HarborType::Wool,
};

std::vector<HexCoord> standard_coords() {
    std::vector<HexCoord> out;
    const int n = STANDARD_BOARD_RADIUS;
    for (int q = -n; q <= n; ++q) {
        for (int r = -n; r <= n; ++r) {
            if (std::abs(q + r) <= n) out.push_back(HexCoord{q, r});
        }
    }
    return out;
}

// Clockwise angle of an edge midpoint measured from straight up, in the
// pointy-top pixel frame. Only used to order the coast.
double edge_clock_angle(const EdgeCoord& e) {
    const double pi = 3.14159265358979323846;
    const double cx = std::sqrt(3.0) * (e.q + e.r / 2.0);
    const double cy = 1.5 * e.r;
    const double a1 = (90.0 - 60.0 * e.dir) * pi / 180.0;
    const double a2 = (90.0 - 60.0 * ((e.dir + 1) % 6)) * pi / 180.0;
    const double mx = cx + (std::cos(a1) + std::cos(a2)) / 2.0;
    const double my = cy - (std::sin(a1) + std::sin(a2)) / 2.0;
    double angle = std::atan2(mx, -my);
    if (angle < 0) angle += 2.0 * pi;
    return angle;
}

} // namespace

BoardGrid BoardGrid::create_empty() {
    return BoardGrid{};
}

BoardGrid BoardGrid::create_default() {
    BoardGrid board;

    std::size_t next = 0;
    for (const HexCoord& c : standard_coords()) {
        if (c.q == 0 && c.r == 0) {
            board.set_hex(c, Terrain::Desert, 0);
        } else {
            board.set_hex(c, STANDARD_TERRAIN[next], STANDARD_NUMBERS[next]);
            ++next;
        }
    }

    // Spread harbors evenly along the 30 coastal edges.
    const std::vector<EdgeCoord> coast = board.coastal_edges();
    for (std::size_t i = 0; i < STANDARD_NUM_HARBORS && !coast.empty(); ++i) {
        const std::size_t idx = static_cast<std::size_t>(
            std::lround(static_cast<double>(i) * coast.size() / STANDARD_NUM_HARBORS)) % coast.size();
        board.harbors.push_back(Harbor{coast[idx], STANDARD_HARBORS[i]});
    }

    return board;
}

void BoardGrid::randomize(RandomSource& rng) {
    std::vector<Terrain> terrain(STANDARD_TERRAIN.begin(), STANDARD_TERRAIN.end());
    terrain.push_back(Terrain::Desert);
    std::vector<std::uint8_t> numbers(STANDARD_NUMBERS.begin(), STANDARD_NUMBERS.end());

    rng.shuffle(terrain.begin(), terrain.end());
    rng.shuffle(numbers.begin(), numbers.end());

    // Assign in coordinate order (desert gets no number). Boards with a
    // different hex count reuse the lists cyclically.
    std::size_t t_idx = 0;
    std::size_t n_idx = 0;
    for (auto& entry : hexes) {
        Hex& hex = entry.second;
        hex.terrain = terrain[t_idx++ % terrain.size()];
        if (hex.terrain == Terrain::Desert) {
            hex.number = 0;
        } else {
            hex.number = numbers[n_idx++ % numbers.size()];
        }
    }

    std::vector<HarborType> types;
    for (const Harbor& h : harbors) types.push_back(h.type);
    rng.shuffle(types.begin(), types.end());
    for (std::size_t i = 0; i < harbors.size(); ++i) harbors[i].type = types[i];
}

void BoardGrid::set_hex(const HexCoord& coord, Terrain terrain, std::uint8_t number) {
    Hex& hex = hexes[coord];
    hex.coord = coord;
    hex.terrain = terrain;
    hex.number = (terrain == Terrain::Desert) ? 0 : number;
}

const Hex* BoardGrid::find_hex(const HexCoord& coord) const {
    auto it = hexes.find(coord);
    return it == hexes.end() ? nullptr : &it->second;
}

bool BoardGrid::is_vertex_on_board(const VertexCoord& v) const {
    for (const HexCoord& h : vertex_hexes(v)) {
        if (has_hex(h)) return true;
    }
    return false;
}

bool BoardGrid::is_edge_on_board(const EdgeCoord& e) const {
    for (const HexCoord& h : edge_hexes(e)) {
        if (has_hex(h)) return true;
    }
    return false;
}

std::vector<VertexCoord> BoardGrid::all_vertices() const {
    std::set<VertexCoord> seen;
    for (const auto& entry : hexes) {
        for (const VertexCoord& v : get_hex_vertices(entry.first)) seen.insert(v);
    }
    return std::vector<VertexCoord>(seen.begin(), seen.end());
}

std::vector<EdgeCoord> BoardGrid::all_edges() const {
    std::set<EdgeCoord> seen;
    for (const auto& entry : hexes) {
        for (std::uint8_t d = 0; d < 6; ++d) {
            seen.insert(canonical_edge(EdgeCoord{entry.first.q, entry.first.r, d}));
        }
    }
    return std::vector<EdgeCoord>(seen.begin(), seen.end());
}

std::array<VertexCoord, 6> BoardGrid::get_hex_vertices(const HexCoord& coord) const {
    std::array<VertexCoord, 6> out{};
    for (std::uint8_t d = 0; d < 6; ++d) {
        out[d] = canonical_vertex(VertexCoord{coord.q, coord.r, d});
    }
    return out;
}

std::vector<EdgeCoord> BoardGrid::coastal_edges() const {
    // Keep the edge as seen from its on-board hex for the angle, but report
    // the canonical key.
    std::vector<std::pair<double, EdgeCoord>> coast;
    for (const auto& entry : hexes) {
        for (std::uint8_t d = 0; d < 6; ++d) {
            const EdgeCoord local{entry.first.q, entry.first.r, d};
            if (has_hex(hex_neighbor(entry.first, d))) continue;
            coast.emplace_back(edge_clock_angle(local), canonical_edge(local));
        }
    }
    std::sort(coast.begin(), coast.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });

    std::vector<EdgeCoord> out;
    out.reserve(coast.size());
    for (const auto& c : coast) out.push_back(c.second);
    return out;
}

bool BoardGrid::find_desert(HexCoord& out) const {
    for (const auto& entry : hexes) {
        if (entry.second.terrain == Terrain::Desert) {
            out = entry.first;
            return true;
        }
    }
    return false;
}

} // namespace hexsettle
