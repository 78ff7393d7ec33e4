#include "Placement.hpp"
#include <glog/logging.h>

Roster::Roster()
{
    for (int size : FLEET_SIZES)
        ++left[size];
}

int Roster::remaining(int size) const
{
    if (size < 1 || size > MAX_SHIP_SIZE)
        return 0;
    return left[size];
}

int Roster::remaining_total() const
{
    int n = 0;
    for (int size = 1; size <= MAX_SHIP_SIZE; ++size)
        n += left[size];
    return n;
}

std::vector<int> Roster::needed() const
{
    std::vector<int> out;
    for (int size = MAX_SHIP_SIZE; size >= 1; --size)
        for (int i = 0; i < left[size]; ++i)
            out.push_back(size);
    return out;
}

bool Roster::take(int size)
{
    if (remaining(size) == 0)
        return false;
    --left[size];
    return true;
}

GameError check_placement(const Board &board, const Roster &roster, const std::vector<Coord> &cells)
{
    if (roster.remaining((int)cells.size()) == 0)
        return GameError::RosterExhausted;

    for (const auto &c : cells)
    {
        if (!c.on_board())
            return GameError::InvalidCoordinate;
        if (board.is_occupied(c))
            return GameError::Overlap;
    }
    // the candidate is not on the board yet, so any occupied neighbour
    // belongs to a different ship
    for (const auto &c : cells)
        for (const auto &n : neighbors8(c))
            if (board.is_occupied(n))
                return GameError::AdjacentShips;
    return GameError::None;
}

GameError place_ship(Board &board, Roster &roster, const Coord &start, const Coord &end)
{
    std::vector<Coord> cells;
    GameError err = span(start, end, cells);
    if (err != GameError::None)
        return err;
    err = check_placement(board, roster, cells);
    if (err != GameError::None)
        return err;

    bool taken = roster.take((int)cells.size());
    CHECK(taken);
    const Ship &ship = board.add_ship(start, end, cells);
    VLOG(1) << "placed ship " << ship.id() << " " << format_coord(start) << "-" << format_coord(end)
            << " size " << ship.size();
    return GameError::None;
}
