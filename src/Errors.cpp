#include "Errors.hpp"

const char *error_name(GameError e)
{
    switch (e)
    {
    case GameError::None:
        return "None";
    case GameError::InvalidCoordinate:
        return "InvalidCoordinate";
    case GameError::NotCollinear:
        return "NotCollinear";
    case GameError::RosterExhausted:
        return "RosterExhausted";
    case GameError::Overlap:
        return "Overlap";
    case GameError::AdjacentShips:
        return "AdjacentShips";
    case GameError::AlreadyFired:
        return "AlreadyFired";
    case GameError::OutOfTurn:
        return "OutOfTurn";
    case GameError::GameFinished:
        return "GameFinished";
    case GameError::FleetIncomplete:
        return "FleetIncomplete";
    case GameError::InvalidShipRecord:
        return "InvalidShipRecord";
    case GameError::PlacementStalled:
        return "PlacementStalled";
    case GameError::IoFailure:
        return "IoFailure";
    }
    return "Unknown";
}

std::string error_message(GameError e)
{
    switch (e)
    {
    case GameError::None:
        return "ok";
    case GameError::InvalidCoordinate:
        return "coordinates are a letter A-J followed by a number 1-10";
    case GameError::NotCollinear:
        return "ship must be horizontal or vertical";
    case GameError::RosterExhausted:
        return "no ship of that size is left to place";
    case GameError::Overlap:
        return "ship overlaps another ship";
    case GameError::AdjacentShips:
        return "ship is too close to another ship";
    case GameError::AlreadyFired:
        return "that cell was already shot";
    case GameError::OutOfTurn:
        return "it is not that side's turn";
    case GameError::GameFinished:
        return "the game is over";
    case GameError::FleetIncomplete:
        return "fleet is missing ships";
    case GameError::InvalidShipRecord:
        return "stored ship does not match its size";
    case GameError::PlacementStalled:
        return "could not find a random layout";
    case GameError::IoFailure:
        return "file could not be read or written";
    }
    return "unknown error";
}
