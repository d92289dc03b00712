// action_result.h
// Structured outcome of every validator/applier.
// Rule violations are ordinary results, never exceptions.

#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace hexsettle {

enum class RuleViolation : std::uint8_t {
    None = 0,
    GameOver,
    UnknownPlayer,
    NotYourTurn,
    WrongPhase,
    InvalidLocation,
    Occupied,
    DistanceRule,
    NotConnected,
    InsufficientResources,
    NoPiecesLeft,
    NotYourPiece,
    CardNotHeld,
    CardBoughtThisTurn,
    CardAlreadyPlayed,
    DeckEmpty,
    InvalidTarget,
    InvalidDiscard,
    BankEmpty,
    GameFull,
    DuplicatePlayer,
    NotEnoughPlayers,
    COUNT
};

inline const char* rule_violation_name(RuleViolation v) {
    switch (v) {
        case RuleViolation::None:                  return "None";
        case RuleViolation::GameOver:              return "GameOver";
        case RuleViolation::UnknownPlayer:         return "UnknownPlayer";
        case RuleViolation::NotYourTurn:           return "NotYourTurn";
        case RuleViolation::WrongPhase:            return "WrongPhase";
        case RuleViolation::InvalidLocation:       return "InvalidLocation";
        case RuleViolation::Occupied:              return "Occupied";
        case RuleViolation::DistanceRule:          return "DistanceRule";
        case RuleViolation::NotConnected:          return "NotConnected";
        case RuleViolation::InsufficientResources: return "InsufficientResources";
        case RuleViolation::NoPiecesLeft:          return "NoPiecesLeft";
        case RuleViolation::NotYourPiece:          return "NotYourPiece";
        case RuleViolation::CardNotHeld:           return "CardNotHeld";
        case RuleViolation::CardBoughtThisTurn:    return "CardBoughtThisTurn";
        case RuleViolation::CardAlreadyPlayed:     return "CardAlreadyPlayed";
        case RuleViolation::DeckEmpty:             return "DeckEmpty";
        case RuleViolation::InvalidTarget:         return "InvalidTarget";
        case RuleViolation::InvalidDiscard:        return "InvalidDiscard";
        case RuleViolation::BankEmpty:             return "BankEmpty";
        case RuleViolation::GameFull:              return "GameFull";
        case RuleViolation::DuplicatePlayer:       return "DuplicatePlayer";
        case RuleViolation::NotEnoughPlayers:      return "NotEnoughPlayers";
        default:                                   return "Unknown";
    }
}

struct ActionResult {
    bool success{true};
    RuleViolation violation{RuleViolation::None};
    std::string error;

    static ActionResult ok() { return ActionResult{}; }

    static ActionResult fail(RuleViolation v, std::string message) {
        ActionResult r;
        r.success = false;
        r.violation = v;
        r.error = std::move(message);
        return r;
    }

    explicit operator bool() const { return success; }
};

} // namespace hexsettle
