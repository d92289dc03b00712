// state_transition.cpp
// Rule validation and application for every player action.

#include "hexsettle/state_transition.h"
#include "hexsettle/log.h"
#include "hexsettle/longest_road.h"
#include "hexsettle/move_gen.h"
#include "hexsettle/random_source.h"
#include "hexsettle/resource_distribution.h"
#include "hexsettle/turn_machine.h"

#include <algorithm>
#include <utility>

namespace hexsettle {

namespace {

ActionResult rejected(const GameState& state, const char* what, ActionResult result) {
    log::get()->debug("game '{}': {} rejected ({}): {}", state.id, what,
                      rule_violation_name(result.violation), result.error);
    return result;
}

ActionResult rejected(const GameState& state, ActionType action, ActionResult result) {
    return rejected(state, action_type_name(action), std::move(result));
}

// Finished game, started game, known player, then phase.
ActionResult check_player(const GameState& state, const std::string& player_id, ActionType action,
                          std::uint8_t& player_idx) {
    if (state.game_phase == GamePhase::Finished) {
        return ActionResult::fail(RuleViolation::GameOver, "the game is over");
    }
    if (!state.started) {
        return ActionResult::fail(RuleViolation::WrongPhase, "the game has not started");
    }
    player_idx = state.find_player(player_id);
    if (player_idx == NO_PLAYER) {
        return ActionResult::fail(RuleViolation::UnknownPlayer, "unknown player '" + player_id + "'");
    }
    return check_phase(state, action);
}

// check_player plus "it is this player's turn" (or special-build slot).
ActionResult check_actor(const GameState& state, const std::string& player_id, ActionType action,
                         std::uint8_t& player_idx) {
    ActionResult r = check_player(state, player_id, action, player_idx);
    if (!r) return r;
    if (player_idx != state.acting_player()) {
        return ActionResult::fail(RuleViolation::NotYourTurn, "it is not your turn");
    }
    return r;
}

// Recompute bonuses that depend on the board and test for a winner.
void after_board_change(GameState& state) {
    update_longest_road(state);
    state.check_winner();
}

void grant_starting_resources(GameState& state, std::uint8_t player_idx, const VertexCoord& v) {
    for (const HexCoord& h : vertex_hexes(v)) {
        const Hex* hex = state.board.find_hex(h);
        if (hex == nullptr) continue;
        const ResourceType r = hex->resource();
        if (!is_valid_resource(r)) continue;
        state.take_from_bank(player_idx, r, 1);
    }
}

void steal_random_card(GameState& state, std::uint8_t thief_idx, std::uint8_t victim_idx,
                       RandomSource& rng) {
    PlayerState& victim = state.players[victim_idx];
    const unsigned total = victim.total_resources();
    if (total == 0) return;

    const int pick = rng.uniform_int(0, static_cast<int>(total) - 1);
    unsigned cumulative = 0;
    for (std::size_t r = 0; r < NUM_RESOURCE_TYPES; ++r) {
        cumulative += victim.resources[r];
        if (static_cast<unsigned>(pick) < cumulative) {
            victim.resources[r]--;
            state.players[thief_idx].resources[r]++;
            log::get()->debug("{} steals a card from {}", state.players[thief_idx].id, victim.id);
            return;
        }
    }
}

} // namespace

// ============================================================================
// Lobby
// ============================================================================

ActionResult add_player(GameState& state, const std::string& player_id, const std::string& name) {
    const char* tag = "AddPlayer";
    if (state.game_phase != GamePhase::Setup || state.started) {
        return rejected(state, tag,
            ActionResult::fail(RuleViolation::WrongPhase, "the game has already started"));
    }
    if (player_id.empty()) {
        return rejected(state, tag,
            ActionResult::fail(RuleViolation::UnknownPlayer, "player id must not be empty"));
    }
    if (state.find_player(player_id) != NO_PLAYER) {
        return rejected(state, tag,
            ActionResult::fail(RuleViolation::DuplicatePlayer, "'" + player_id + "' already joined"));
    }
    if (state.num_players() >= state.options.max_players) {
        return rejected(state, tag, ActionResult::fail(RuleViolation::GameFull, "the game is full"));
    }

    PlayerState player;
    player.id = player_id;
    player.name = name.empty() ? player_id : name;
    state.players.push_back(player);

    log::get()->debug("game '{}': {} joined as seat {}", state.id, player_id, state.num_players() - 1);
    return ActionResult::ok();
}

ActionResult start_game(GameState& state, RandomSource& rng) {
    const char* tag = "StartGame";
    if (state.game_phase != GamePhase::Setup || state.started) {
        return rejected(state, tag,
            ActionResult::fail(RuleViolation::WrongPhase, "the game has already started"));
    }
    if (state.num_players() < MIN_PLAYERS) {
        return rejected(state, tag,
            ActionResult::fail(RuleViolation::NotEnoughPlayers, "at least two players are needed"));
    }

    if (state.options.shuffle_turn_order) {
        rng.shuffle(state.players.begin(), state.players.end());
    }
    rng.shuffle(state.dev_deck.begin(), state.dev_deck.end());

    const std::size_t n = state.players.size();
    state.setup_settlements_placed.assign(n, 0);
    state.setup_roads_placed.assign(n, 0);
    state.setup_last_settlement.assign(n, VertexCoord{});
    state.pending_discards.assign(n, 0);

    state.current_player = 0;
    state.special_build_player = NO_PLAYER;
    state.started = true;
    state.update_all_victory_points();

    log::get()->info("game '{}' started with {} players, {} to move first",
                     state.id, n, state.players[0].id);
    return ActionResult::ok();
}

// ============================================================================
// Building
// ============================================================================

ActionResult place_settlement(GameState& state, const std::string& player_id,
                              const std::string& vertex, bool is_setup) {
    const ActionType tag = ActionType::PlaceSettlement;
    const VertexCoord v = canonical_vertex(parse_vertex_key(vertex));

    std::uint8_t p = NO_PLAYER;
    ActionResult r = check_actor(state, player_id, tag, p);
    if (!r) return rejected(state, tag, r);

    const bool in_setup = state.game_phase == GamePhase::Setup;
    if (is_setup != in_setup) {
        return rejected(state, tag, ActionResult::fail(RuleViolation::WrongPhase,
            in_setup ? "initial placement is in progress" : "initial placement is over"));
    }
    if (in_setup) {
        const std::uint8_t s = state.setup_settlements_placed[p];
        if (s != state.setup_roads_placed[p] || s >= 2) {
            return rejected(state, tag,
                ActionResult::fail(RuleViolation::WrongPhase, "place your road first"));
        }
    }

    r = check_settlement_location(state, p, v, in_setup);
    if (!r) return rejected(state, tag, r);

    PlayerState& player = state.players[p];
    if (player.settlements_remaining == 0) {
        return rejected(state, tag,
            ActionResult::fail(RuleViolation::NoPiecesLeft, "no settlements left"));
    }
    if (!in_setup && !player.can_afford(BuildCost::SETTLEMENT)) {
        return rejected(state, tag, ActionResult::fail(RuleViolation::InsufficientResources,
            "a settlement costs brick, lumber, wool and grain"));
    }

    // Apply
    if (!in_setup) {
        state.pay_to_bank(p, BuildCost::SETTLEMENT);
    }
    state.put_settlement(p, v);

    if (in_setup) {
        state.setup_settlements_placed[p]++;
        state.setup_last_settlement[p] = v;
        if (state.setup_settlements_placed[p] == 2) {
            grant_starting_resources(state, p, v);
        }
    }

    log::get()->debug("game '{}': {} settles {}", state.id, player.id, vertex_key(v));
    after_board_change(state);
    return ActionResult::ok();
}

ActionResult place_road(GameState& state, const std::string& player_id,
                        const std::string& edge, bool free) {
    const ActionType tag = ActionType::PlaceRoad;
    const EdgeCoord e = canonical_edge(parse_edge_key(edge));

    std::uint8_t p = NO_PLAYER;
    ActionResult r = check_actor(state, player_id, tag, p);
    if (!r) return rejected(state, tag, r);

    const bool in_setup = state.game_phase == GamePhase::Setup;
    if (in_setup && state.setup_settlements_placed[p] != state.setup_roads_placed[p] + 1) {
        return rejected(state, tag,
            ActionResult::fail(RuleViolation::WrongPhase, "place your settlement first"));
    }
    if (free && (in_setup || state.free_roads_remaining == 0)) {
        return rejected(state, tag,
            ActionResult::fail(RuleViolation::InsufficientResources, "no free roads available"));
    }

    r = check_road_location(state, p, e, in_setup);
    if (!r) return rejected(state, tag, r);

    PlayerState& player = state.players[p];
    if (player.roads_remaining == 0) {
        return rejected(state, tag, ActionResult::fail(RuleViolation::NoPiecesLeft, "no roads left"));
    }
    const bool pays = !in_setup && !free;
    if (pays && !player.can_afford(BuildCost::ROAD)) {
        return rejected(state, tag, ActionResult::fail(RuleViolation::InsufficientResources,
            "a road costs brick and lumber"));
    }

    // Apply
    if (pays) {
        state.pay_to_bank(p, BuildCost::ROAD);
    }
    if (free) {
        state.free_roads_remaining--;
    }
    state.put_road(p, e);

    log::get()->debug("game '{}': {} builds road {}", state.id, player.id, edge_key(e));

    if (in_setup) {
        state.setup_roads_placed[p]++;
        update_longest_road(state);
        advance_setup_turn(state);
        return ActionResult::ok();
    }

    after_board_change(state);
    return ActionResult::ok();
}

ActionResult upgrade_to_city(GameState& state, const std::string& player_id,
                             const std::string& vertex) {
    const ActionType tag = ActionType::UpgradeToCity;
    const VertexCoord v = canonical_vertex(parse_vertex_key(vertex));

    std::uint8_t p = NO_PLAYER;
    ActionResult r = check_actor(state, player_id, tag, p);
    if (!r) return rejected(state, tag, r);

    r = check_city_location(state, p, v);
    if (!r) return rejected(state, tag, r);

    PlayerState& player = state.players[p];
    if (player.cities_remaining == 0) {
        return rejected(state, tag, ActionResult::fail(RuleViolation::NoPiecesLeft, "no cities left"));
    }
    if (!player.can_afford(BuildCost::CITY)) {
        return rejected(state, tag, ActionResult::fail(RuleViolation::InsufficientResources,
            "a city costs two grain and three ore"));
    }

    state.pay_to_bank(p, BuildCost::CITY);
    state.put_city(p, v);

    log::get()->debug("game '{}': {} upgrades {} to a city", state.id, player.id, vertex_key(v));
    state.check_winner();
    return ActionResult::ok();
}

// ============================================================================
// Development cards
// ============================================================================

ActionResult buy_dev_card(GameState& state, const std::string& player_id) {
    const ActionType tag = ActionType::BuyDevCard;

    std::uint8_t p = NO_PLAYER;
    ActionResult r = check_actor(state, player_id, tag, p);
    if (!r) return rejected(state, tag, r);

    PlayerState& player = state.players[p];
    if (state.dev_deck.empty()) {
        return rejected(state, tag,
            ActionResult::fail(RuleViolation::DeckEmpty, "no development cards left"));
    }
    if (!player.can_afford(BuildCost::DEV_CARD)) {
        return rejected(state, tag, ActionResult::fail(RuleViolation::InsufficientResources,
            "a development card costs wool, grain and ore"));
    }

    state.pay_to_bank(p, BuildCost::DEV_CARD);
    const DevCardType card = state.dev_deck.back();
    state.dev_deck.pop_back();

    // A special builder buys before their own turn, so the card is usable then.
    if (state.turn_phase == TurnPhase::SpecialBuild) {
        player.dev_cards[dev_card_index(card)]++;
    } else {
        player.new_dev_cards[dev_card_index(card)]++;
    }
    state.update_victory_points(p);

    log::get()->debug("game '{}': {} buys a development card ({} left)",
                      state.id, player.id, state.dev_deck.size());
    state.check_winner();
    return ActionResult::ok();
}

ActionResult play_dev_card(GameState& state, const std::string& player_id, DevCardType card,
                           const DevCardPayload& payload) {
    const ActionType tag = ActionType::PlayDevCard;

    std::uint8_t p = NO_PLAYER;
    ActionResult r = check_actor(state, player_id, tag, p);
    if (!r) return rejected(state, tag, r);

    if (!is_valid_dev_card(card)) {
        return rejected(state, tag, ActionResult::fail(RuleViolation::CardNotHeld, "unknown card"));
    }

    PlayerState& player = state.players[p];
    const std::size_t ci = dev_card_index(card);
    if (player.dev_cards[ci] == 0) {
        if (player.new_dev_cards[ci] > 0) {
            return rejected(state, tag, ActionResult::fail(RuleViolation::CardBoughtThisTurn,
                std::string(dev_card_name(card)) + " was bought this turn"));
        }
        return rejected(state, tag, ActionResult::fail(RuleViolation::CardNotHeld,
            std::string("you hold no ") + dev_card_name(card)));
    }

    const bool trivial = is_trivial_card(card);
    if (!trivial && state.dev_card_played_this_turn) {
        return rejected(state, tag, ActionResult::fail(RuleViolation::CardAlreadyPlayed,
            "only one development card may be played per turn"));
    }
    if (state.turn_phase == TurnPhase::Roll && card != DevCardType::Knight && !trivial) {
        return rejected(state, tag, ActionResult::fail(RuleViolation::WrongPhase,
            "only a knight may be played before rolling"));
    }

    // Card specific checks
    switch (card) {
        case DevCardType::RoadBuilding:
            if (player.roads_remaining == 0) {
                return rejected(state, tag,
                    ActionResult::fail(RuleViolation::NoPiecesLeft, "no roads left"));
            }
            break;
        case DevCardType::YearOfPlenty: {
            if (!is_valid_resource(payload.first) || !is_valid_resource(payload.second)) {
                return rejected(state, tag,
                    ActionResult::fail(RuleViolation::InvalidTarget, "choose two resources"));
            }
            ResourceHand wanted{};
            wanted[resource_index(payload.first)]++;
            wanted[resource_index(payload.second)]++;
            for (std::size_t i = 0; i < NUM_RESOURCE_TYPES; ++i) {
                if (state.resource_bank[i] < wanted[i]) {
                    return rejected(state, tag, ActionResult::fail(RuleViolation::BankEmpty,
                        std::string("the bank is out of ") + resource_name(static_cast<ResourceType>(i))));
                }
            }
            break;
        }
        case DevCardType::Monopoly:
            if (!is_valid_resource(payload.first)) {
                return rejected(state, tag,
                    ActionResult::fail(RuleViolation::InvalidTarget, "choose a resource"));
            }
            break;
        default:
            break;
    }

    // Apply
    player.dev_cards[ci]--;
    if (!trivial) {
        state.dev_card_played_this_turn = true;
    }

    switch (card) {
        case DevCardType::Knight:
            player.knights_played++;
            state.update_largest_army();
            state.turn_phase = TurnPhase::Robber;
            break;

        case DevCardType::VictoryPoint:
            player.revealed_victory_cards++;
            state.update_victory_points(p);
            break;

        case DevCardType::RoadBuilding:
            state.free_roads_remaining = std::min<std::uint8_t>(2, player.roads_remaining);
            break;

        case DevCardType::YearOfPlenty:
            state.take_from_bank(p, payload.first, 1);
            state.take_from_bank(p, payload.second, 1);
            break;

        case DevCardType::Monopoly: {
            const std::size_t ri = resource_index(payload.first);
            for (std::uint8_t other = 0; other < state.num_players(); ++other) {
                if (other == p) continue;
                player.resources[ri] = static_cast<std::uint8_t>(
                    player.resources[ri] + state.players[other].resources[ri]);
                state.players[other].resources[ri] = 0;
            }
            break;
        }

        default:
            break;
    }

    log::get()->debug("game '{}': {} plays {}", state.id, player.id, dev_card_name(card));
    state.check_winner();
    return ActionResult::ok();
}

// ============================================================================
// Dice, robber, discards
// ============================================================================

ActionResult roll_dice(GameState& state, const std::string& player_id, RandomSource& rng) {
    const ActionType tag = ActionType::RollDice;

    std::uint8_t p = NO_PLAYER;
    ActionResult r = check_actor(state, player_id, tag, p);
    if (!r) return rejected(state, tag, r);

    const int die1 = rng.uniform_int(1, 6);
    const int die2 = rng.uniform_int(1, 6);
    const auto roll = static_cast<std::uint8_t>(die1 + die2);

    state.last_dice_roll = roll;
    state.has_rolled_this_turn = true;

    log::get()->debug("game '{}': {} rolls {} ({}+{})", state.id, state.players[p].id, roll, die1, die2);

    if (roll == 7) {
        enter_seven(state);
    } else {
        distribute_resources(state, roll);
        state.turn_phase = TurnPhase::Main;
    }
    state.check_winner();
    return ActionResult::ok();
}

ActionResult move_robber(GameState& state, const std::string& player_id, const std::string& hex,
                         const std::string& steal_from, RandomSource& rng) {
    const ActionType tag = ActionType::MoveRobber;
    const HexCoord target = parse_hex_key(hex);

    std::uint8_t p = NO_PLAYER;
    ActionResult r = check_actor(state, player_id, tag, p);
    if (!r) return rejected(state, tag, r);

    if (!state.board.has_hex(target)) {
        return rejected(state, tag, ActionResult::fail(RuleViolation::InvalidLocation,
            hex + " is not on the board"));
    }
    if (target == state.robber) {
        return rejected(state, tag, ActionResult::fail(RuleViolation::InvalidTarget,
            "the robber must move to a different hex"));
    }

    std::uint8_t victim = NO_PLAYER;
    if (!steal_from.empty()) {
        victim = state.find_player(steal_from);
        if (victim == NO_PLAYER) {
            return rejected(state, tag, ActionResult::fail(RuleViolation::UnknownPlayer,
                "unknown player '" + steal_from + "'"));
        }
        const std::vector<std::uint8_t> candidates = steal_candidates(state, p, target);
        if (std::find(candidates.begin(), candidates.end(), victim) == candidates.end()) {
            return rejected(state, tag, ActionResult::fail(RuleViolation::InvalidTarget,
                steal_from + " has no building on " + hex));
        }
    }

    state.robber = target;
    if (victim != NO_PLAYER) {
        steal_random_card(state, p, victim, rng);
    }
    finish_robber(state);

    log::get()->debug("game '{}': {} moves the robber to {}", state.id, state.players[p].id, hex_key(target));
    return ActionResult::ok();
}

ActionResult discard_resources(GameState& state, const std::string& player_id,
                               const ResourceHand& cards) {
    const ActionType tag = ActionType::DiscardResources;

    // Not turn-bound: every player over the limit discards.
    std::uint8_t p = NO_PLAYER;
    ActionResult r = check_player(state, player_id, tag, p);
    if (!r) return rejected(state, tag, r);

    const std::uint8_t owed = p < state.pending_discards.size() ? state.pending_discards[p] : 0;
    if (owed == 0) {
        return rejected(state, tag,
            ActionResult::fail(RuleViolation::InvalidDiscard, "you do not need to discard"));
    }

    PlayerState& player = state.players[p];
    if (!player.can_afford(cards)) {
        return rejected(state, tag,
            ActionResult::fail(RuleViolation::InvalidDiscard, "you do not hold those cards"));
    }
    if (hand_total(cards) != owed) {
        return rejected(state, tag, ActionResult::fail(RuleViolation::InvalidDiscard,
            "you must discard exactly " + std::to_string(owed) + " cards"));
    }

    state.pay_to_bank(p, cards);
    state.pending_discards[p] = 0;
    finish_discard_if_done(state);

    log::get()->debug("game '{}': {} discards {} cards", state.id, player.id, owed);
    return ActionResult::ok();
}

// ============================================================================
// Trading and turn end
// ============================================================================

ActionResult bank_trade(GameState& state, const std::string& player_id, ResourceType give,
                        ResourceType receive) {
    const ActionType tag = ActionType::BankTrade;

    std::uint8_t p = NO_PLAYER;
    ActionResult r = check_actor(state, player_id, tag, p);
    if (!r) return rejected(state, tag, r);

    if (!is_valid_resource(give) || !is_valid_resource(receive) || give == receive) {
        return rejected(state, tag, ActionResult::fail(RuleViolation::InvalidTarget,
            "trade one resource for a different one"));
    }

    const std::uint8_t ratio = state.get_trade_ratio(p, give);
    ResourceHand cost{};
    cost[resource_index(give)] = ratio;

    if (!state.players[p].can_afford(cost)) {
        return rejected(state, tag, ActionResult::fail(RuleViolation::InsufficientResources,
            "you need " + std::to_string(ratio) + " " + resource_name(give)));
    }
    if (state.resource_bank[resource_index(receive)] == 0) {
        return rejected(state, tag, ActionResult::fail(RuleViolation::BankEmpty,
            std::string("the bank is out of ") + resource_name(receive)));
    }

    state.pay_to_bank(p, cost);
    state.take_from_bank(p, receive, 1);

    log::get()->debug("game '{}': {} trades {} {} for {}", state.id, state.players[p].id,
                      ratio, resource_name(give), resource_name(receive));
    return ActionResult::ok();
}

ActionResult end_turn(GameState& state, const std::string& player_id) {
    const ActionType tag = ActionType::EndTurn;

    std::uint8_t p = NO_PLAYER;
    ActionResult r = check_actor(state, player_id, tag, p);
    if (!r) return rejected(state, tag, r);

    log::get()->debug("game '{}': {} ends {} phase", state.id, state.players[p].id,
                      turn_phase_name(state.turn_phase));

    if (state.turn_phase == TurnPhase::SpecialBuild) {
        advance_special_build(state);
    } else {
        finish_turn(state);
    }
    return ActionResult::ok();
}

// ============================================================================
// Main Action Dispatcher
// ============================================================================

ActionResult apply_action(GameState& state, const std::string& player_id, const Action& action,
                          RandomSource& rng) {
    switch (action.type) {
        case ActionType::PlaceSettlement:
            return place_settlement(state, player_id, action.location, action.setup);
        case ActionType::PlaceRoad:
            return place_road(state, player_id, action.location, action.free);
        case ActionType::UpgradeToCity:
            return upgrade_to_city(state, player_id, action.location);
        case ActionType::BuyDevCard:
            return buy_dev_card(state, player_id);
        case ActionType::PlayDevCard:
            return play_dev_card(state, player_id, action.card, action.payload);
        case ActionType::MoveRobber:
            return move_robber(state, player_id, action.location, action.target_player, rng);
        case ActionType::RollDice:
            return roll_dice(state, player_id, rng);
        case ActionType::DiscardResources:
            return discard_resources(state, player_id, action.cards);
        case ActionType::BankTrade:
            return bank_trade(state, player_id, action.give, action.receive);
        case ActionType::EndTurn:
            return end_turn(state, player_id);
        default:
            break;
    }
    return rejected(state, action.type,
        ActionResult::fail(RuleViolation::WrongPhase, "unknown action type"));
}

} // namespace hexsettle
