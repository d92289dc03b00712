// hex_coords.h
// Axial hex coordinates plus the vertex/edge equivalence relation.
// Pointy-top layout. Vertex directions run clockwise from the top corner:
//   0 = top, 1 = upper-right, 2 = lower-right, 3 = bottom, 4 = lower-left, 5 = upper-left
// Edge direction d connects vertex d to vertex (d+1) % 6 of the same hex.

#pragma once

#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <tuple>

namespace hexsettle {

// Thrown for keys that cannot be parsed or carry an out-of-range direction.
// This is an integration error, not a game-rule outcome.
class MalformedCoordinate : public std::invalid_argument {
public:
    explicit MalformedCoordinate(const std::string& what)
        : std::invalid_argument(what) {}
};

// Parsed q and r must lie in [-MAX_COORDINATE, MAX_COORDINATE]. Neighbor
// arithmetic on larger values would overflow.
constexpr int MAX_COORDINATE = 1024;

struct HexCoord {
    int q{0};
    int r{0};

    bool operator==(const HexCoord& o) const { return q == o.q && r == o.r; }
    bool operator!=(const HexCoord& o) const { return !(*this == o); }
    bool operator<(const HexCoord& o) const { return std::tie(q, r) < std::tie(o.q, o.r); }
};

struct VertexCoord {
    int q{0};
    int r{0};
    std::uint8_t dir{0};

    bool operator==(const VertexCoord& o) const { return q == o.q && r == o.r && dir == o.dir; }
    bool operator!=(const VertexCoord& o) const { return !(*this == o); }
    bool operator<(const VertexCoord& o) const {
        return std::tie(q, r, dir) < std::tie(o.q, o.r, o.dir);
    }

    HexCoord hex() const { return HexCoord{q, r}; }
};

struct EdgeCoord {
    int q{0};
    int r{0};
    std::uint8_t dir{0};

    bool operator==(const EdgeCoord& o) const { return q == o.q && r == o.r && dir == o.dir; }
    bool operator!=(const EdgeCoord& o) const { return !(*this == o); }
    bool operator<(const EdgeCoord& o) const {
        return std::tie(q, r, dir) < std::tie(o.q, o.r, o.dir);
    }

    HexCoord hex() const { return HexCoord{q, r}; }
};

// Neighbor of a hex across side `side` (same indexing as edge directions).
HexCoord hex_neighbor(const HexCoord& h, std::uint8_t side);

// Equivalence sets. The first element is always the input triple.
std::array<VertexCoord, 3> equivalent_vertices(const VertexCoord& v);
std::array<EdgeCoord, 2>   equivalent_edges(const EdgeCoord& e);

// Smallest (q, r, dir) triple of the equivalence set.
// Two keys denote the same physical feature iff their canonical forms match.
VertexCoord canonical_vertex(const VertexCoord& v);
EdgeCoord   canonical_edge(const EdgeCoord& e);

bool are_vertices_equal(const VertexCoord& a, const VertexCoord& b);
bool are_edges_equal(const EdgeCoord& a, const EdgeCoord& b);

// The 3 physical edges meeting at a vertex, canonical and deduplicated.
std::array<EdgeCoord, 3> vertex_edges(const VertexCoord& v);

// The 2 canonical endpoints of an edge.
std::array<VertexCoord, 2> edge_vertices(const EdgeCoord& e);

// The 3 vertices one edge away, canonical.
std::array<VertexCoord, 3> adjacent_vertices(const VertexCoord& v);

// Hexes touching a vertex (3) or an edge (2). Not filtered by board membership.
std::array<HexCoord, 3> vertex_hexes(const VertexCoord& v);
std::array<HexCoord, 2> edge_hexes(const EdgeCoord& e);

// Key formats shared with the board renderer:
//   hex "{q},{r}", vertex "v_{q}_{r}_{dir}", edge "e_{q}_{r}_{dir}"
std::string hex_key(const HexCoord& h);
std::string vertex_key(const VertexCoord& v);
std::string edge_key(const EdgeCoord& e);

// Parsers throw MalformedCoordinate on bad input.
HexCoord    parse_hex_key(const std::string& key);
VertexCoord parse_vertex_key(const std::string& key);
EdgeCoord   parse_edge_key(const std::string& key);

} // namespace hexsettle
