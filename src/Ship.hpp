#pragma once
#include <vector>
#include "Coord.hpp"

// Persistence shape of a ship: declared endpoints plus size.
struct ShipRecord
{
    Coord start{};
    Coord end{};
    int size{};
    bool operator==(const ShipRecord &o) const noexcept { return start == o.start && end == o.end && size == o.size; }
};

class Ship
{
public:
    Ship(int id, const Coord &start, const Coord &end, std::vector<Coord> cells);

    int id() const { return shipId; }
    int size() const { return (int)cells.size(); }
    const Coord &start() const { return from; }
    const Coord &end() const { return to; }
    const std::vector<Coord> &occupied() const { return cells; }

    bool is_sunk() const { return hits == size(); }

    // returns false if c is not part of the ship or was hit before
    bool register_hit(const Coord &c);

    ShipRecord record() const { return ShipRecord{from, to, size()}; }

private:
    int shipId;
    Coord from;
    Coord to;
    std::vector<Coord> cells;
    std::vector<bool> hitMask;
    int hits{0};

    int position_of(const Coord &c) const;
};
