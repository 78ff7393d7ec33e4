#include "Ship.hpp"
#include <glog/logging.h>

Ship::Ship(int id, const Coord &start, const Coord &end, std::vector<Coord> occupiedCells)
    : shipId(id), from(start), to(end), cells(std::move(occupiedCells)), hitMask(cells.size(), false)
{
    CHECK(!cells.empty()) << "ship " << id << " has no cells";
}

int Ship::position_of(const Coord &c) const
{
    for (int i = 0; i < (int)cells.size(); ++i)
        if (cells[i] == c)
            return i;
    return -1;
}

bool Ship::register_hit(const Coord &c)
{
    int i = position_of(c);
    if (i < 0 || hitMask[i])
        return false;
    hitMask[i] = true;
    ++hits;
    return true;
}
