// hex_coords.cpp
// Combinatorial equivalence for the axial hex grid.

#include "hexsettle/hex_coords.h"
#include "hexsettle/log.h"

#include <algorithm>
#include <charconv>

namespace hexsettle {

namespace {

// Axial offset of the neighbor across each side, pointy-top.
constexpr std::array<std::array<int, 2>, 6> SIDE_OFFSETS = {{
    {{ 1, -1}},  // side 0: upper-right
    {{ 1,  0}},  // side 1: right
    {{ 0,  1}},  // side 2: lower-right
    {{-1,  1}},  // side 3: lower-left
    {{-1,  0}},  // side 4: left
    {{ 0, -1}},  // side 5: upper-left
}};

// For each vertex direction, the two other hexes sharing that corner and
// the direction the corner has as seen from them.
struct CornerShare {
    int dq;
    int dr;
    std::uint8_t dir;
};

constexpr std::array<std::array<CornerShare, 2>, 6> CORNER_SHARES = {{
    {{ { 0, -1, 2}, { 1, -1, 4} }},  // 0: top
    {{ { 1, -1, 3}, { 1,  0, 5} }},  // 1: upper-right
    {{ { 1,  0, 4}, { 0,  1, 0} }},  // 2: lower-right
    {{ { 0,  1, 5}, {-1,  1, 1} }},  // 3: bottom
    {{ {-1,  1, 0}, {-1,  0, 2} }},  // 4: lower-left
    {{ {-1,  0, 1}, { 0, -1, 3} }},  // 5: upper-left
}};

void check_dir(std::uint8_t dir, const char* what) {
    if (dir > 5) {
        throw MalformedCoordinate(std::string(what) + " direction out of range: " +
                                  std::to_string(static_cast<int>(dir)));
    }
}

// Parses a signed decimal integer at [pos, end) up to `stop` (or end).
// Advances pos past the number.
bool read_int(const std::string& s, std::size_t& pos, char stop, int& out) {
    const std::size_t end = (stop == '\0') ? s.size() : s.find(stop, pos);
    if (end == std::string::npos || end == pos) return false;
    const char* first = s.data() + pos;
    const char* last  = s.data() + end;
    auto res = std::from_chars(first, last, out);
    if (res.ec != std::errc() || res.ptr != last) return false;
    pos = (stop == '\0') ? end : end + 1;
    return true;
}

bool in_range(int value) {
    return value >= -MAX_COORDINATE && value <= MAX_COORDINATE;
}

// Shared parser for "v_q_r_d" and "e_q_r_d".
void parse_triple(const std::string& key, char prefix, int& q, int& r, std::uint8_t& dir) {
    auto fail = [&]() -> void {
        log::get()->error("malformed coordinate key '{}'", key);
        throw MalformedCoordinate("malformed coordinate key: '" + key + "'");
    };

    if (key.size() < 7 || key[0] != prefix || key[1] != '_') fail();

    std::size_t pos = 2;
    int d = 0;
    if (!read_int(key, pos, '_', q)) fail();
    if (!read_int(key, pos, '_', r)) fail();
    if (!read_int(key, pos, '\0', d)) fail();
    if (!in_range(q) || !in_range(r)) fail();
    if (d < 0 || d > 5) fail();
    dir = static_cast<std::uint8_t>(d);
}

} // namespace

HexCoord hex_neighbor(const HexCoord& h, std::uint8_t side) {
    check_dir(side, "side");
    return HexCoord{h.q + SIDE_OFFSETS[side][0], h.r + SIDE_OFFSETS[side][1]};
}

std::array<VertexCoord, 3> equivalent_vertices(const VertexCoord& v) {
    check_dir(v.dir, "vertex");
    const auto& shares = CORNER_SHARES[v.dir];
    return {{
        v,
        VertexCoord{v.q + shares[0].dq, v.r + shares[0].dr, shares[0].dir},
        VertexCoord{v.q + shares[1].dq, v.r + shares[1].dr, shares[1].dir},
    }};
}

std::array<EdgeCoord, 2> equivalent_edges(const EdgeCoord& e) {
    check_dir(e.dir, "edge");
    const HexCoord across = hex_neighbor(e.hex(), e.dir);
    return {{
        e,
        EdgeCoord{across.q, across.r, static_cast<std::uint8_t>((e.dir + 3) % 6)},
    }};
}

VertexCoord canonical_vertex(const VertexCoord& v) {
    const auto eq = equivalent_vertices(v);
    return *std::min_element(eq.begin(), eq.end());
}

EdgeCoord canonical_edge(const EdgeCoord& e) {
    const auto eq = equivalent_edges(e);
    return std::min(eq[0], eq[1]);
}

bool are_vertices_equal(const VertexCoord& a, const VertexCoord& b) {
    return canonical_vertex(a) == canonical_vertex(b);
}

bool are_edges_equal(const EdgeCoord& a, const EdgeCoord& b) {
    return canonical_edge(a) == canonical_edge(b);
}

std::array<EdgeCoord, 3> vertex_edges(const VertexCoord& v) {
    // Each hex at the corner contributes the two sides meeting there:
    // side `dir` (leaving clockwise) and side `dir - 1` (arriving).
    // Every physical edge shows up twice across the three hexes.
    std::array<EdgeCoord, 3> out{};
    std::size_t count = 0;
    for (const VertexCoord& eq : equivalent_vertices(v)) {
        const EdgeCoord sides[2] = {
            EdgeCoord{eq.q, eq.r, eq.dir},
            EdgeCoord{eq.q, eq.r, static_cast<std::uint8_t>((eq.dir + 5) % 6)},
        };
        for (const EdgeCoord& side : sides) {
            const EdgeCoord c = canonical_edge(side);
            if (std::find(out.begin(), out.begin() + count, c) == out.begin() + count) {
                out[count++] = c;
            }
        }
    }
    return out;
}

std::array<VertexCoord, 2> edge_vertices(const EdgeCoord& e) {
    check_dir(e.dir, "edge");
    return {{
        canonical_vertex(VertexCoord{e.q, e.r, e.dir}),
        canonical_vertex(VertexCoord{e.q, e.r, static_cast<std::uint8_t>((e.dir + 1) % 6)}),
    }};
}

std::array<VertexCoord, 3> adjacent_vertices(const VertexCoord& v) {
    const VertexCoord self = canonical_vertex(v);
    std::array<VertexCoord, 3> out{};
    std::size_t i = 0;
    for (const EdgeCoord& e : vertex_edges(self)) {
        const auto ends = edge_vertices(e);
        out[i++] = (ends[0] == self) ? ends[1] : ends[0];
    }
    return out;
}

std::array<HexCoord, 3> vertex_hexes(const VertexCoord& v) {
    const auto eq = equivalent_vertices(v);
    return {{ eq[0].hex(), eq[1].hex(), eq[2].hex() }};
}

std::array<HexCoord, 2> edge_hexes(const EdgeCoord& e) {
    const auto eq = equivalent_edges(e);
    return {{ eq[0].hex(), eq[1].hex() }};
}

std::string hex_key(const HexCoord& h) {
    return std::to_string(h.q) + "," + std::to_string(h.r);
}

std::string vertex_key(const VertexCoord& v) {
    return "v_" + std::to_string(v.q) + "_" + std::to_string(v.r) + "_" +
           std::to_string(static_cast<int>(v.dir));
}

std::string edge_key(const EdgeCoord& e) {
    return "e_" + std::to_string(e.q) + "_" + std::to_string(e.r) + "_" +
           std::to_string(static_cast<int>(e.dir));
}

HexCoord parse_hex_key(const std::string& key) {
    HexCoord h;
    std::size_t pos = 0;
    if (!read_int(key, pos, ',', h.q) || !read_int(key, pos, '\0', h.r) ||
        !in_range(h.q) || !in_range(h.r)) {
        log::get()->error("malformed hex key '{}'", key);
        throw MalformedCoordinate("malformed hex key: '" + key + "'");
    }
    return h;
}

VertexCoord parse_vertex_key(const std::string& key) {
    VertexCoord v;
    parse_triple(key, 'v', v.q, v.r, v.dir);
    return v;
}

EdgeCoord parse_edge_key(const std::string& key) {
    EdgeCoord e;
    parse_triple(key, 'e', e.q, e.r, e.dir);
    return e;
}

} // namespace hexsettle
