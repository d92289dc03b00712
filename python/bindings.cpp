// bindings.cpp
// Python bindings for the hexsettle rules engine using pybind11

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <map>
#include <string>
#include <vector>

#include "hexsettle/action.h"
#include "hexsettle/board_grid.h"
#include "hexsettle/game_state.h"
#include "hexsettle/hex_coords.h"
#include "hexsettle/log.h"
#include "hexsettle/move_gen.h"
#include "hexsettle/player_state.h"
#include "hexsettle/player_view.h"
#include "hexsettle/random_source.h"
#include "hexsettle/resource_distribution.h"
#include "hexsettle/state_transition.h"

namespace py = pybind11;

using namespace hexsettle;

namespace {

std::vector<std::string> vertex_keys(const std::vector<VertexCoord>& coords) {
    std::vector<std::string> keys;
    keys.reserve(coords.size());
    for (const VertexCoord& c : coords) keys.push_back(vertex_key(c));
    return keys;
}

std::vector<std::string> edge_keys(const std::vector<EdgeCoord>& coords) {
    std::vector<std::string> keys;
    keys.reserve(coords.size());
    for (const EdgeCoord& c : coords) keys.push_back(edge_key(c));
    return keys;
}

} // namespace

PYBIND11_MODULE(hexsettle_engine, m) {
    m.doc() = "hexsettle - hex-grid settlement game rules engine";

    // ========================================================================
    // Enums
    // ========================================================================

    py::enum_<ActionType>(m, "ActionType")
        .value("PlaceSettlement", ActionType::PlaceSettlement)
        .value("PlaceRoad", ActionType::PlaceRoad)
        .value("UpgradeToCity", ActionType::UpgradeToCity)
        .value("BuyDevCard", ActionType::BuyDevCard)
        .value("PlayDevCard", ActionType::PlayDevCard)
        .value("MoveRobber", ActionType::MoveRobber)
        .value("RollDice", ActionType::RollDice)
        .value("DiscardResources", ActionType::DiscardResources)
        .value("BankTrade", ActionType::BankTrade)
        .value("EndTurn", ActionType::EndTurn)
        .export_values();

    py::enum_<ResourceType>(m, "ResourceType")
        .value("Brick", ResourceType::Brick)
        .value("Lumber", ResourceType::Lumber)
        .value("Wool", ResourceType::Wool)
        .value("Grain", ResourceType::Grain)
        .value("Ore", ResourceType::Ore)
        .export_values();

    py::enum_<DevCardType>(m, "DevCardType")
        .value("Knight", DevCardType::Knight)
        .value("VictoryPoint", DevCardType::VictoryPoint)
        .value("RoadBuilding", DevCardType::RoadBuilding)
        .value("YearOfPlenty", DevCardType::YearOfPlenty)
        .value("Monopoly", DevCardType::Monopoly)
        .export_values();

    py::enum_<GamePhase>(m, "GamePhase")
        .value("Setup", GamePhase::Setup)
        .value("Playing", GamePhase::Playing)
        .value("Finished", GamePhase::Finished)
        .export_values();

    py::enum_<TurnPhase>(m, "TurnPhase")
        .value("Roll", TurnPhase::Roll)
        .value("Robber", TurnPhase::Robber)
        .value("Discard", TurnPhase::Discard)
        .value("Main", TurnPhase::Main)
        .value("SpecialBuild", TurnPhase::SpecialBuild)
        .export_values();

    py::enum_<BuildingType>(m, "BuildingType")
        .value("None_", BuildingType::None)
        .value("Settlement", BuildingType::Settlement)
        .value("City", BuildingType::City)
        .export_values();

    py::enum_<Terrain>(m, "Terrain")
        .value("Desert", Terrain::Desert)
        .value("Hills", Terrain::Hills)
        .value("Forest", Terrain::Forest)
        .value("Pasture", Terrain::Pasture)
        .value("Fields", Terrain::Fields)
        .value("Mountains", Terrain::Mountains)
        .export_values();

    py::enum_<HarborType>(m, "HarborType")
        .value("None_", HarborType::None)
        .value("Generic", HarborType::Generic)
        .value("Brick", HarborType::Brick)
        .value("Lumber", HarborType::Lumber)
        .value("Wool", HarborType::Wool)
        .value("Grain", HarborType::Grain)
        .value("Ore", HarborType::Ore)
        .export_values();

    py::enum_<RuleViolation>(m, "RuleViolation")
        .value("None_", RuleViolation::None)
        .value("GameOver", RuleViolation::GameOver)
        .value("UnknownPlayer", RuleViolation::UnknownPlayer)
        .value("NotYourTurn", RuleViolation::NotYourTurn)
        .value("WrongPhase", RuleViolation::WrongPhase)
        .value("InvalidLocation", RuleViolation::InvalidLocation)
        .value("Occupied", RuleViolation::Occupied)
        .value("DistanceRule", RuleViolation::DistanceRule)
        .value("NotConnected", RuleViolation::NotConnected)
        .value("InsufficientResources", RuleViolation::InsufficientResources)
        .value("NoPiecesLeft", RuleViolation::NoPiecesLeft)
        .value("NotYourPiece", RuleViolation::NotYourPiece)
        .value("CardNotHeld", RuleViolation::CardNotHeld)
        .value("CardBoughtThisTurn", RuleViolation::CardBoughtThisTurn)
        .value("CardAlreadyPlayed", RuleViolation::CardAlreadyPlayed)
        .value("DeckEmpty", RuleViolation::DeckEmpty)
        .value("InvalidTarget", RuleViolation::InvalidTarget)
        .value("InvalidDiscard", RuleViolation::InvalidDiscard)
        .value("BankEmpty", RuleViolation::BankEmpty)
        .value("GameFull", RuleViolation::GameFull)
        .value("DuplicatePlayer", RuleViolation::DuplicatePlayer)
        .value("NotEnoughPlayers", RuleViolation::NotEnoughPlayers)
        .export_values();

    // ========================================================================
    // Coordinates
    // ========================================================================

    m.def("canonical_vertex_key", [](const std::string& key) {
        return vertex_key(canonical_vertex(parse_vertex_key(key)));
    }, py::arg("key"), "Canonical spelling of a vertex key");

    m.def("canonical_edge_key", [](const std::string& key) {
        return edge_key(canonical_edge(parse_edge_key(key)));
    }, py::arg("key"), "Canonical spelling of an edge key");

    m.def("are_vertices_equal", [](const std::string& a, const std::string& b) {
        return are_vertices_equal(parse_vertex_key(a), parse_vertex_key(b));
    });

    m.def("are_edges_equal", [](const std::string& a, const std::string& b) {
        return are_edges_equal(parse_edge_key(a), parse_edge_key(b));
    });

    // ========================================================================
    // Randomness
    // ========================================================================

    py::class_<RandomSource>(m, "RandomSource")
        .def("uniform_int", &RandomSource::uniform_int);

    py::class_<Mt19937Source, RandomSource>(m, "Mt19937Source")
        .def(py::init<std::uint32_t>(), py::arg("seed") = 0);

    py::class_<ScriptedSource, RandomSource>(m, "ScriptedSource")
        .def(py::init<std::vector<int>, std::uint32_t>(),
            py::arg("script"), py::arg("fallback_seed") = 1)
        .def("remaining", &ScriptedSource::remaining);

    // ========================================================================
    // Board and pieces
    // ========================================================================

    py::class_<Hex>(m, "Hex")
        .def(py::init<>())
        .def_property_readonly("key", [](const Hex& h) { return hex_key(h.coord); })
        .def_readonly("terrain", &Hex::terrain)
        .def_readonly("number", &Hex::number)
        .def("resource", &Hex::resource);

    py::class_<Harbor>(m, "Harbor")
        .def(py::init<>())
        .def_property_readonly("edge", [](const Harbor& h) { return edge_key(h.edge); })
        .def_readonly("type", &Harbor::type);

    py::class_<Building>(m, "Building")
        .def(py::init<>())
        .def_readonly("type", &Building::type)
        .def_readonly("owner", &Building::owner)
        .def("__repr__", [](const Building& b) {
            return "Building(type=" + std::to_string(static_cast<int>(b.type)) +
                   ", owner=" + std::to_string(static_cast<int>(b.owner)) + ")";
        });

    py::class_<PlayerState>(m, "PlayerState")
        .def(py::init<>())
        .def_readonly("id", &PlayerState::id)
        .def_readonly("name", &PlayerState::name)
        .def_readonly("resources", &PlayerState::resources)
        .def_readonly("dev_cards", &PlayerState::dev_cards)
        .def_readonly("new_dev_cards", &PlayerState::new_dev_cards)
        .def_readonly("knights_played", &PlayerState::knights_played)
        .def_readonly("revealed_victory_cards", &PlayerState::revealed_victory_cards)
        .def_readonly("settlements_remaining", &PlayerState::settlements_remaining)
        .def_readonly("cities_remaining", &PlayerState::cities_remaining)
        .def_readonly("roads_remaining", &PlayerState::roads_remaining)
        .def_readonly("public_victory_points", &PlayerState::public_victory_points)
        .def_readonly("hidden_victory_points", &PlayerState::hidden_victory_points)
        .def_readonly("has_longest_road", &PlayerState::has_longest_road)
        .def_readonly("has_largest_army", &PlayerState::has_largest_army)
        .def_readonly("road_length", &PlayerState::road_length)
        .def("total_victory_points", &PlayerState::total_victory_points)
        .def("total_resources", &PlayerState::total_resources)
        .def("__repr__", [](const PlayerState& p) {
            return "PlayerState(id=" + p.id + ", vp=" + std::to_string(p.total_victory_points()) +
                   ", resources=" + std::to_string(p.total_resources()) + ")";
        });

    // ========================================================================
    // Actions
    // ========================================================================

    py::class_<DevCardPayload>(m, "DevCardPayload")
        .def(py::init<>())
        .def_readwrite("first", &DevCardPayload::first)
        .def_readwrite("second", &DevCardPayload::second);

    py::class_<ActionResult>(m, "ActionResult")
        .def_readonly("success", &ActionResult::success)
        .def_readonly("violation", &ActionResult::violation)
        .def_readonly("error", &ActionResult::error)
        .def("__bool__", [](const ActionResult& r) { return r.success; })
        .def("__repr__", [](const ActionResult& r) {
            if (r.success) return std::string("ActionResult(ok)");
            return std::string("ActionResult(") + rule_violation_name(r.violation) + ": " + r.error + ")";
        });

    py::class_<Action>(m, "Action")
        .def(py::init<>())
        .def_readwrite("type", &Action::type)
        .def_readwrite("location", &Action::location)
        .def_readwrite("setup", &Action::setup)
        .def_readwrite("free", &Action::free)
        .def_readwrite("card", &Action::card)
        .def_readwrite("payload", &Action::payload)
        .def_readwrite("target_player", &Action::target_player)
        .def_readwrite("cards", &Action::cards)
        .def_readwrite("give", &Action::give)
        .def_readwrite("receive", &Action::receive)
        .def_static("place_settlement", &Action::place_settlement,
            py::arg("vertex"), py::arg("setup") = false)
        .def_static("place_road", &Action::place_road, py::arg("edge"), py::arg("free") = false)
        .def_static("upgrade_to_city", &Action::upgrade_to_city)
        .def_static("buy_dev_card", &Action::buy_dev_card)
        .def_static("play_dev_card", &Action::play_dev_card,
            py::arg("card"), py::arg("payload") = DevCardPayload{})
        .def_static("move_robber", &Action::move_robber,
            py::arg("hex"), py::arg("steal_from") = std::string())
        .def_static("roll_dice", &Action::roll_dice)
        .def_static("discard_resources", &Action::discard_resources)
        .def_static("bank_trade", &Action::bank_trade)
        .def_static("end_turn", &Action::end_turn)
        .def("__repr__", [](const Action& a) {
            return std::string("Action(type=") + action_type_name(a.type) +
                   ", location=" + a.location + ")";
        });

    // ========================================================================
    // GameState
    // ========================================================================

    py::class_<GameOptions>(m, "GameOptions")
        .def(py::init<>())
        .def_readwrite("victory_points_to_win", &GameOptions::victory_points_to_win)
        .def_readwrite("discard_limit", &GameOptions::discard_limit)
        .def_readwrite("max_players", &GameOptions::max_players)
        .def_readwrite("special_build_phase", &GameOptions::special_build_phase)
        .def_readwrite("shuffle_turn_order", &GameOptions::shuffle_turn_order)
        .def_readwrite("randomize_board", &GameOptions::randomize_board);

    py::class_<GameState>(m, "GameState")
        .def(py::init<>())
        .def_static("create_game", &GameState::create_game,
            py::arg("id"), py::arg("options"), py::arg("rng"),
            "Create a game in setup with a generated board")
        .def_readonly("id", &GameState::id)
        .def_readonly("options", &GameState::options)
        .def_readonly("players", &GameState::players)
        .def_readonly("current_player", &GameState::current_player)
        .def_readonly("game_phase", &GameState::game_phase)
        .def_readonly("turn_phase", &GameState::turn_phase)
        .def_readonly("started", &GameState::started)
        .def_readonly("longest_road_player", &GameState::longest_road_player)
        .def_readonly("longest_road_length", &GameState::longest_road_length)
        .def_readonly("largest_army_player", &GameState::largest_army_player)
        .def_readonly("largest_army_size", &GameState::largest_army_size)
        .def_readonly("has_rolled_this_turn", &GameState::has_rolled_this_turn)
        .def_readonly("dev_card_played_this_turn", &GameState::dev_card_played_this_turn)
        .def_readonly("last_dice_roll", &GameState::last_dice_roll)
        .def_readonly("free_roads_remaining", &GameState::free_roads_remaining)
        .def_readonly("pending_discards", &GameState::pending_discards)
        .def_readonly("special_build_player", &GameState::special_build_player)
        .def_readonly("resource_bank", &GameState::resource_bank)
        .def_readonly("winner", &GameState::winner)
        .def_readonly("turn_number", &GameState::turn_number)
        .def_property_readonly("robber", [](const GameState& s) { return hex_key(s.robber); })
        .def_property_readonly("dev_deck_size", [](const GameState& s) { return s.dev_deck.size(); })
        .def_property_readonly("hexes", [](const GameState& s) {
            std::map<std::string, Hex> out;
            for (const auto& entry : s.board.hexes) out[hex_key(entry.first)] = entry.second;
            return out;
        }, "Hexes keyed by 'q,r'")
        .def_property_readonly("harbors", [](const GameState& s) { return s.board.harbors; })
        .def_property_readonly("vertices", [](const GameState& s) {
            std::map<std::string, Building> out;
            for (const auto& entry : s.vertices) out[vertex_key(entry.first)] = entry.second;
            return out;
        }, "Buildings keyed by canonical vertex key")
        .def_property_readonly("edges", [](const GameState& s) {
            std::map<std::string, std::uint8_t> out;
            for (const auto& entry : s.edges) out[edge_key(entry.first)] = entry.second.owner;
            return out;
        }, "Road owners keyed by canonical edge key")
        .def("find_player", &GameState::find_player)
        .def("get_trade_ratio", &GameState::get_trade_ratio)
        .def("copy", [](const GameState& state) {
            return GameState(state);
        }, "Create a copy of the game state")
        .def("__repr__", [](const GameState& state) {
            return "GameState(id=" + state.id +
                   ", players=" + std::to_string(state.num_players()) +
                   ", turn=" + std::to_string(state.turn_number) +
                   ", phase=" + game_phase_name(state.game_phase) + ")";
        });

    py::class_<PlayerView>(m, "PlayerView")
        .def_readonly("state", &PlayerView::state)
        .def_readonly("my_index", &PlayerView::my_index)
        .def_readonly("dev_card_counts", &PlayerView::dev_card_counts);

    // ========================================================================
    // Actions (mutate state in-place)
    // ========================================================================

    m.def("add_player", &add_player, py::arg("state"), py::arg("player_id"), py::arg("name") = "");
    m.def("start_game", &start_game, py::arg("state"), py::arg("rng"));
    m.def("place_settlement", &place_settlement,
        py::arg("state"), py::arg("player_id"), py::arg("vertex"), py::arg("is_setup") = false);
    m.def("place_road", &place_road,
        py::arg("state"), py::arg("player_id"), py::arg("edge"), py::arg("free") = false);
    m.def("upgrade_to_city", &upgrade_to_city,
        py::arg("state"), py::arg("player_id"), py::arg("vertex"));
    m.def("buy_dev_card", &buy_dev_card, py::arg("state"), py::arg("player_id"));
    m.def("play_dev_card", &play_dev_card,
        py::arg("state"), py::arg("player_id"), py::arg("card"), py::arg("payload") = DevCardPayload{});
    m.def("roll_dice", &roll_dice, py::arg("state"), py::arg("player_id"), py::arg("rng"));
    m.def("move_robber",
        [](GameState& state, const std::string& player_id, const std::string& hex,
           RandomSource& rng, const std::string& steal_from) {
            return move_robber(state, player_id, hex, steal_from, rng);
        },
        py::arg("state"), py::arg("player_id"), py::arg("hex"), py::arg("rng"),
        py::arg("steal_from") = std::string());
    m.def("discard_resources", &discard_resources,
        py::arg("state"), py::arg("player_id"), py::arg("cards"));
    m.def("bank_trade", &bank_trade,
        py::arg("state"), py::arg("player_id"), py::arg("give"), py::arg("receive"));
    m.def("end_turn", &end_turn, py::arg("state"), py::arg("player_id"));
    m.def("apply_action", &apply_action,
        py::arg("state"), py::arg("player_id"), py::arg("action"), py::arg("rng"),
        "Validate and apply an action (mutates state in-place)");

    // ========================================================================
    // Queries
    // ========================================================================

    m.def("get_player_view", &get_player_view, py::arg("state"), py::arg("player_id"));

    m.def("legal_settlement_vertices", [](const GameState& s, std::uint8_t player, bool setup) {
        return vertex_keys(legal_settlement_vertices(s, player, setup));
    }, py::arg("state"), py::arg("player_idx"), py::arg("setup") = false);

    m.def("legal_road_edges", [](const GameState& s, std::uint8_t player, bool setup) {
        return edge_keys(legal_road_edges(s, player, setup));
    }, py::arg("state"), py::arg("player_idx"), py::arg("setup") = false);

    m.def("legal_city_vertices", [](const GameState& s, std::uint8_t player) {
        return vertex_keys(legal_city_vertices(s, player));
    }, py::arg("state"), py::arg("player_idx"));

    m.def("legal_robber_hexes", [](const GameState& s) {
        std::vector<std::string> keys;
        for (const HexCoord& h : legal_robber_hexes(s)) keys.push_back(hex_key(h));
        return keys;
    }, py::arg("state"));

    m.def("steal_candidates", [](const GameState& s, std::uint8_t thief, const std::string& hex) {
        return steal_candidates(s, thief, parse_hex_key(hex));
    }, py::arg("state"), py::arg("thief_idx"), py::arg("hex"));

    m.def("compute_distribution", &compute_distribution, py::arg("state"), py::arg("roll"));

    // ========================================================================
    // Logging
    // ========================================================================

    m.def("set_log_level", [](const std::string& level) {
        log::set_level(spdlog::level::from_str(level));
    }, py::arg("level"), "trace, debug, info, warn, error, critical or off");
}
