// test_hex_coords.cpp
// Coordinate equivalence, canonical keys and key parsing.

#include <algorithm>
#include <iostream>
#include <set>
#include <string>

#include "hexsettle/hex_coords.h"
#include "hexsettle/log.h"
#include "test_support.h"

using namespace hexsettle;
using namespace hexsettle::test;

static void test_vertex_equivalence() {
    std::cout << "\n=== Test: Vertex Equivalence ===\n";
    bool ok = true;

    // The bottom corner of the origin is shared with (0,1) and (-1,1).
    if (!are_vertices_equal(vtx("v_0_0_3"), vtx("v_0_1_5")) ||
        !are_vertices_equal(vtx("v_0_0_3"), vtx("v_-1_1_1"))) {
        std::cout << "  ERROR: v_0_0_3, v_0_1_5 and v_-1_1_1 should be one vertex\n";
        ok = false;
    }

    // Neighboring corners of the same hex are different vertices.
    if (are_vertices_equal(vtx("v_0_0_3"), vtx("v_0_0_2"))) {
        std::cout << "  ERROR: v_0_0_3 and v_0_0_2 should differ\n";
        ok = false;
    }

    // Every spelling of every corner of the origin maps to one canonical key.
    for (std::uint8_t d = 0; d < 6; ++d) {
        const VertexCoord v{0, 0, d};
        const VertexCoord c = canonical_vertex(v);
        for (const VertexCoord& eq : equivalent_vertices(v)) {
            if (canonical_vertex(eq) != c) {
                std::cout << "  ERROR: " << vertex_key(eq) << " canonicalizes differently from "
                          << vertex_key(v) << "\n";
                ok = false;
            }
            // Each equivalent must list the others back.
            const auto back = equivalent_vertices(eq);
            if (std::find(back.begin(), back.end(), v) == back.end()) {
                std::cout << "  ERROR: equivalence of " << vertex_key(v) << " is not symmetric\n";
                ok = false;
            }
        }
    }

    if (vertex_key(canonical_vertex(vtx("v_0_0_3"))) != "v_-1_1_1") {
        std::cout << "  ERROR: canonical of v_0_0_3 should be v_-1_1_1, got "
                  << vertex_key(canonical_vertex(vtx("v_0_0_3"))) << "\n";
        ok = false;
    }

    report(ok);
}

static void test_edge_equivalence() {
    std::cout << "\n=== Test: Edge Equivalence ===\n";
    bool ok = true;

    if (!are_edges_equal(edge("e_1_0_4"), edge("e_0_0_1"))) {
        std::cout << "  ERROR: e_1_0_4 and e_0_0_1 should be one edge\n";
        ok = false;
    }
    if (!are_edges_equal(edge("e_1_-1_3"), edge("e_0_0_0"))) {
        std::cout << "  ERROR: e_1_-1_3 and e_0_0_0 should be one edge\n";
        ok = false;
    }
    if (are_edges_equal(edge("e_0_0_0"), edge("e_0_0_1"))) {
        std::cout << "  ERROR: e_0_0_0 and e_0_0_1 should differ\n";
        ok = false;
    }

    const auto eq = equivalent_edges(edge("e_0_0_2"));
    if (eq[1] != EdgeCoord{0, 1, 5}) {
        std::cout << "  ERROR: e_0_0_2 should pair with e_0_1_5, got " << edge_key(eq[1]) << "\n";
        ok = false;
    }

    report(ok);
}

static void test_incidence() {
    std::cout << "\n=== Test: Vertex/Edge Incidence ===\n";
    bool ok = true;

    // Edge d joins corners d and d+1 of its hex.
    const auto ends = edge_vertices(edge("e_0_0_0"));
    if (!are_vertices_equal(ends[0], vtx("v_0_0_0")) || !are_vertices_equal(ends[1], vtx("v_0_0_1"))) {
        std::cout << "  ERROR: e_0_0_0 should join v_0_0_0 and v_0_0_1\n";
        ok = false;
    }

    // Three distinct edges meet at every interior vertex.
    for (std::uint8_t d = 0; d < 6; ++d) {
        const auto edges = vertex_edges(VertexCoord{0, 0, d});
        std::set<EdgeCoord> distinct(edges.begin(), edges.end());
        if (distinct.size() != 3) {
            std::cout << "  ERROR: vertex dir " << static_cast<int>(d) << " has "
                      << distinct.size() << " distinct edges\n";
            ok = false;
        }
        for (const EdgeCoord& e : edges) {
            if (e != canonical_edge(e)) {
                std::cout << "  ERROR: vertex_edges returned a non-canonical edge\n";
                ok = false;
            }
        }
    }

    // v_0_0_2 touches e_0_0_1, e_0_0_2 and the spoke e_1_0_3.
    const auto spokes = vertex_edges(vtx("v_0_0_2"));
    for (const char* key : {"e_0_0_1", "e_0_0_2", "e_1_0_3"}) {
        if (std::find(spokes.begin(), spokes.end(), canonical_edge(edge(key))) == spokes.end()) {
            std::cout << "  ERROR: v_0_0_2 should touch " << key << "\n";
            ok = false;
        }
    }

    // Neighbors of the top corner: the two ring corners and the corner up the spoke.
    const auto adj = adjacent_vertices(vtx("v_0_0_0"));
    std::set<VertexCoord> adj_set(adj.begin(), adj.end());
    for (const char* key : {"v_0_0_1", "v_0_0_5", "v_0_-1_1"}) {
        if (adj_set.count(canonical_vertex(vtx(key))) == 0) {
            std::cout << "  ERROR: v_0_0_0 should be adjacent to " << key << "\n";
            ok = false;
        }
    }

    const auto hexes = vertex_hexes(vtx("v_0_0_3"));
    std::set<HexCoord> hex_set(hexes.begin(), hexes.end());
    if (hex_set != std::set<HexCoord>{HexCoord{0, 0}, HexCoord{0, 1}, HexCoord{-1, 1}}) {
        std::cout << "  ERROR: v_0_0_3 should touch hexes 0,0 / 0,1 / -1,1\n";
        ok = false;
    }

    report(ok);
}

static void test_key_parsing() {
    std::cout << "\n=== Test: Key Parsing ===\n";
    bool ok = true;

    const VertexCoord v = parse_vertex_key("v_-2_1_4");
    if (v.q != -2 || v.r != 1 || v.dir != 4 || vertex_key(v) != "v_-2_1_4") {
        std::cout << "  ERROR: v_-2_1_4 parsed incorrectly\n";
        ok = false;
    }

    const HexCoord h = parse_hex_key("-1,2");
    if (h.q != -1 || h.r != 2 || hex_key(h) != "-1,2") {
        std::cout << "  ERROR: -1,2 parsed incorrectly\n";
        ok = false;
    }

    const char* bad_vertices[] = {"", "v_1_2", "v_a_0_1", "v_0_0_6", "e_0_0_1", "v_0_0_1_2", "v__0_1",
                                  "v_2147483647_0_1", "v_0_-1025_2", "v_99999999999_0_0"};
    for (const char* key : bad_vertices) {
        bool threw = false;
        try {
            parse_vertex_key(key);
        } catch (const MalformedCoordinate&) {
            threw = true;
        }
        if (!threw) {
            std::cout << "  ERROR: '" << key << "' should be rejected as a vertex key\n";
            ok = false;
        }
    }

    const char* bad_edges[] = {"e_0_0_-1", "e_0_0", "v_0_0_1", "e_0_0_7", "e_1025_0_0", "e_0_-2147483648_3"};
    for (const char* key : bad_edges) {
        bool threw = false;
        try {
            parse_edge_key(key);
        } catch (const MalformedCoordinate&) {
            threw = true;
        }
        if (!threw) {
            std::cout << "  ERROR: '" << key << "' should be rejected as an edge key\n";
            ok = false;
        }
    }

    // Coordinates at the limit still parse and canonicalize.
    const VertexCoord far = parse_vertex_key("v_1024_-1024_1");
    if (far.q != MAX_COORDINATE || canonical_vertex(far) != canonical_vertex(VertexCoord{1025, -1025, 3})) {
        std::cout << "  ERROR: v_1024_-1024_1 should parse at the coordinate limit\n";
        ok = false;
    }

    for (const char* key : {"2147483647,0", "0,-1025"}) {
        bool threw = false;
        try {
            parse_hex_key(key);
        } catch (const MalformedCoordinate&) {
            threw = true;
        }
        if (!threw) {
            std::cout << "  ERROR: '" << key << "' is out of range as a hex key\n";
            ok = false;
        }
    }

    // Malformed keys are invalid_argument for callers that do not know the type.
    bool threw_std = false;
    try {
        parse_hex_key("1;2");
    } catch (const std::invalid_argument&) {
        threw_std = true;
    }
    if (!threw_std) {
        std::cout << "  ERROR: '1;2' should be rejected as a hex key\n";
        ok = false;
    }

    report(ok);
}

int main() {
    std::cout << "========================================\n";
    std::cout << "  Hex Coordinate Test Suite\n";
    std::cout << "========================================\n";

    // Parsing failures log at error level; keep the harness output readable.
    log::set_level(spdlog::level::off);

    test_vertex_equivalence();
    test_edge_equivalence();
    test_incidence();
    test_key_parsing();

    return finish("Hex Coordinate Test Suite");
}
