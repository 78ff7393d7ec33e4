#include "Board.hpp"
#include <glog/logging.h>

const char *shot_name(Shot s)
{
    switch (s)
    {
    case Shot::Unfired:
        return "unfired";
    case Shot::Miss:
        return "miss";
    case Shot::Hit:
        return "hit";
    case Shot::AutoMiss:
        return "auto-miss";
    }
    return "?";
}

Board::Board()
{
    owner.fill(-1);
    shots.fill(Shot::Unfired);
}

const Ship &Board::add_ship(const Coord &start, const Coord &end, const std::vector<Coord> &cells)
{
    int id = (int)fleet.size();
    for (const auto &c : cells)
    {
        CHECK(c.on_board()) << format_coord(c) << " is off the board";
        CHECK_EQ((int)owner[c.index()], -1) << format_coord(c) << " is already occupied";
        owner[c.index()] = (int8_t)id;
    }
    fleet.emplace_back(id, start, end, cells);
    return fleet.back();
}

bool Board::is_occupied(const Coord &c) const
{
    return ship_at(c) >= 0;
}

int Board::ship_at(const Coord &c) const
{
    if (!c.on_board())
        return -1;
    return owner[c.index()];
}

Shot Board::shot_at(const Coord &c) const
{
    if (!c.on_board())
        return Shot::Unfired;
    return shots[c.index()];
}

GameError Board::receive_shot(const Coord &c, ShotResult &out)
{
    if (!c.on_board())
        return GameError::InvalidCoordinate;
    if (shots[c.index()] != Shot::Unfired)
        return GameError::AlreadyFired;

    ShotResult res;
    res.target = c;
    int id = owner[c.index()];
    if (id < 0)
    {
        shots[c.index()] = Shot::Miss;
        res.outcome = Shot::Miss;
    }
    else
    {
        Ship &ship = fleet[id];
        bool fresh = ship.register_hit(c);
        CHECK(fresh) << "shot log and hit mask disagree at " << format_coord(c);
        shots[c.index()] = Shot::Hit;
        res.outcome = Shot::Hit;
        res.shipId = id;
        if (ship.is_sunk())
        {
            res.sunk = true;
            mark_perimeter(ship, res.autoMisses);
        }
    }
    ++fired;
    out = std::move(res);
    return GameError::None;
}

void Board::mark_perimeter(const Ship &ship, std::vector<Coord> &marked)
{
    for (const auto &cell : ship.occupied())
    {
        for (const auto &n : neighbors8(cell))
        {
            // only untouched water; own cells are all Hit by now
            if (shots[n.index()] != Shot::Unfired)
                continue;
            shots[n.index()] = Shot::AutoMiss;
            marked.push_back(n);
        }
    }
}

bool Board::all_sunk() const
{
    return ships_afloat() == 0;
}

int Board::ships_afloat() const
{
    int n = 0;
    for (const auto &s : fleet)
        if (!s.is_sunk())
            ++n;
    return n;
}

std::vector<Coord> Board::unfired() const
{
    std::vector<Coord> out;
    out.reserve(BOARD_CELLS - fired);
    for (int i = 0; i < BOARD_CELLS; ++i)
        if (shots[i] == Shot::Unfired)
            out.push_back(Coord::from_index(i));
    return out;
}

BoardView Board::view(bool reveal) const
{
    BoardView v;
    for (int i = 0; i < BOARD_CELLS; ++i)
    {
        switch (shots[i])
        {
        case Shot::Hit:
            v[i] = Cell::Hit;
            break;
        case Shot::Miss:
            v[i] = Cell::Miss;
            break;
        case Shot::AutoMiss:
            v[i] = Cell::AutoMiss;
            break;
        case Shot::Unfired:
            v[i] = (reveal && owner[i] >= 0) ? Cell::Ship : Cell::Empty;
            break;
        }
    }
    return v;
}

std::vector<ShipRecord> Board::ship_records() const
{
    std::vector<ShipRecord> out;
    out.reserve(fleet.size());
    for (const auto &s : fleet)
        out.push_back(s.record());
    return out;
}
