#pragma once
#include <array>
#include <cstdint>
#include <vector>
#include "Coord.hpp"
#include "Ship.hpp"

// shot-log outcome of one cell
enum class Shot : uint8_t
{
    Unfired = 0,
    Miss = 1,
    Hit = 2,
    AutoMiss = 3
};

const char *shot_name(Shot s);

// derived per-cell state as seen by a viewer
enum class Cell : uint8_t
{
    Empty = 0, // unknown water, or a hidden ship
    Ship = 1,
    Hit = 2,
    Miss = 3,
    AutoMiss = 4
};

using BoardView = std::array<Cell, BOARD_CELLS>;

struct ShotResult
{
    Coord target{};
    Shot outcome{Shot::Unfired};
    bool sunk{false};
    int shipId{-1};
    std::vector<Coord> autoMisses; // perimeter marked by a sinking shot
};

class Roster;

class Board
{
public:
    Board();

    bool is_occupied(const Coord &c) const;
    // index of the ship on c, or -1
    int ship_at(const Coord &c) const;
    Shot shot_at(const Coord &c) const;

    // Resolves a shot. AlreadyFired leaves the board untouched; a sinking
    // hit also turns the ship's unfired surroundings into AutoMiss.
    GameError receive_shot(const Coord &c, ShotResult &out);

    const std::vector<Ship> &ships() const { return fleet; }
    bool all_sunk() const;
    int ships_afloat() const;
    int shots_taken() const { return fired; }
    std::vector<Coord> unfired() const;

    // reveal=true: owner's view with ships; false: opponent's view
    BoardView view(bool reveal) const;

    std::vector<ShipRecord> ship_records() const;

private:
    // only place_ship may register ships, after validating them
    friend GameError place_ship(Board &board, Roster &roster, const Coord &start, const Coord &end);
    const Ship &add_ship(const Coord &start, const Coord &end, const std::vector<Coord> &cells);

    std::vector<Ship> fleet;
    std::array<int8_t, BOARD_CELLS> owner;
    std::array<Shot, BOARD_CELLS> shots;
    int fired{0};

    void mark_perimeter(const Ship &ship, std::vector<Coord> &marked);
};
