#pragma once
#include <array>
#include <vector>
#include "Board.hpp"

static constexpr int MAX_SHIP_SIZE = 4;
static constexpr int FLEET_SHIPS = 10;
static constexpr int FLEET_CELLS = 20;
static constexpr int FLEET_SIZES[FLEET_SHIPS] = {4, 3, 3, 2, 2, 2, 1, 1, 1, 1};

// Remaining quota per ship size, starting from FLEET_SIZES.
class Roster
{
public:
    Roster();

    int remaining(int size) const;
    int remaining_total() const;
    bool complete() const { return remaining_total() == 0; }
    // sizes that still have quota, one entry per missing ship
    std::vector<int> needed() const;

    bool take(int size);

private:
    std::array<int, MAX_SHIP_SIZE + 1> left{};
};

// Checks a candidate against the roster and the ships already on the board,
// without changing anything.
GameError check_placement(const Board &board, const Roster &roster, const std::vector<Coord> &cells);

// check_placement, then registers the ship and consumes its quota.
GameError place_ship(Board &board, Roster &roster, const Coord &start, const Coord &end);
