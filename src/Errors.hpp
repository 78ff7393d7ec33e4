#pragma once
#include <cstdint>
#include <string>

// Every fallible operation reports one of these; None means success and
// any other value means nothing was changed.
enum class GameError : uint8_t
{
    None = 0,
    InvalidCoordinate,
    NotCollinear,
    RosterExhausted,
    Overlap,
    AdjacentShips,
    AlreadyFired,
    OutOfTurn,
    GameFinished,
    FleetIncomplete,
    InvalidShipRecord,
    PlacementStalled,
    IoFailure
};

const char *error_name(GameError e);
std::string error_message(GameError e);
