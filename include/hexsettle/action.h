// action.h
// Compact action value for the transport layer and the dispatcher.
// Coordinates travel as the renderer's string keys; any equivalent key works.

#pragma once

#include <cstdint>
#include <string>

#include "hexsettle/dev_cards.h"
#include "hexsettle/resources.h"

namespace hexsettle {

enum class ActionType : std::uint8_t {
    PlaceSettlement = 0,
    PlaceRoad,
    UpgradeToCity,
    BuyDevCard,
    PlayDevCard,
    MoveRobber,
    RollDice,
    DiscardResources,
    BankTrade,
    EndTurn,

    // Sentinel
    COUNT
};

constexpr std::size_t NUM_ACTION_TYPES = 10;

inline const char* action_type_name(ActionType type) {
    switch (type) {
        case ActionType::PlaceSettlement:  return "PlaceSettlement";
        case ActionType::PlaceRoad:        return "PlaceRoad";
        case ActionType::UpgradeToCity:    return "UpgradeToCity";
        case ActionType::BuyDevCard:       return "BuyDevCard";
        case ActionType::PlayDevCard:      return "PlayDevCard";
        case ActionType::MoveRobber:       return "MoveRobber";
        case ActionType::RollDice:         return "RollDice";
        case ActionType::DiscardResources: return "DiscardResources";
        case ActionType::BankTrade:        return "BankTrade";
        case ActionType::EndTurn:          return "EndTurn";
        default:                           return "???";
    }
}

// Extra arguments for playing a development card.
// Year of plenty uses both resources, monopoly uses `first`.
struct DevCardPayload {
    ResourceType first{ResourceType::COUNT};
    ResourceType second{ResourceType::COUNT};
};

struct Action {
    ActionType type{ActionType::COUNT};

    // Vertex key, edge key or hex key depending on type.
    std::string location;

    // Setup placement / free road from a road building card.
    bool setup{false};
    bool free{false};

    DevCardType card{DevCardType::COUNT};
    DevCardPayload payload;

    // Robber steal target (empty for none).
    std::string target_player;

    // Discard counts; bank trade uses give/receive.
    ResourceHand cards{};
    ResourceType give{ResourceType::COUNT};
    ResourceType receive{ResourceType::COUNT};

    static Action place_settlement(const std::string& vertex, bool setup = false) {
        Action a;
        a.type = ActionType::PlaceSettlement;
        a.location = vertex;
        a.setup = setup;
        return a;
    }

    static Action place_road(const std::string& edge, bool free = false) {
        Action a;
        a.type = ActionType::PlaceRoad;
        a.location = edge;
        a.free = free;
        return a;
    }

    static Action upgrade_to_city(const std::string& vertex) {
        Action a;
        a.type = ActionType::UpgradeToCity;
        a.location = vertex;
        return a;
    }

    static Action buy_dev_card() {
        Action a;
        a.type = ActionType::BuyDevCard;
        return a;
    }

    static Action play_dev_card(DevCardType card, DevCardPayload payload = DevCardPayload{}) {
        Action a;
        a.type = ActionType::PlayDevCard;
        a.card = card;
        a.payload = payload;
        return a;
    }

    static Action move_robber(const std::string& hex, const std::string& steal_from = std::string()) {
        Action a;
        a.type = ActionType::MoveRobber;
        a.location = hex;
        a.target_player = steal_from;
        return a;
    }

    static Action roll_dice() {
        Action a;
        a.type = ActionType::RollDice;
        return a;
    }

    static Action discard_resources(const ResourceHand& cards) {
        Action a;
        a.type = ActionType::DiscardResources;
        a.cards = cards;
        return a;
    }

    static Action bank_trade(ResourceType give, ResourceType receive) {
        Action a;
        a.type = ActionType::BankTrade;
        a.give = give;
        a.receive = receive;
        return a;
    }

    static Action end_turn() {
        Action a;
        a.type = ActionType::EndTurn;
        return a;
    }
};

} // namespace hexsettle
