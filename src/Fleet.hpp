#pragma once
#include <random>
#include <string>
#include <vector>
#include "Board.hpp"
#include "Placement.hpp"

// Collects a full fleet one declared placement at a time. A rejected
// placement leaves the builder exactly as it was.
class FleetBuilder
{
public:
    GameError place(const Coord &start, const Coord &end);
    GameError place_tokens(const std::string &startToken, const std::string &endToken);

    bool complete() const { return roster.complete(); }
    const Roster &remaining() const { return roster; }
    const Board &board() const { return target; }

    // Hands over the finished board; FleetIncomplete until all ships are placed.
    GameError finish(Board &out);

private:
    Board target;
    Roster roster;
};

struct RandomFleetLimits
{
    int attemptCap = 5000; // placement attempts per layout
    int restartCap = 100;  // fresh layouts before giving up
};

// Rejection-sampled layout: random size, orientation and in-bounds anchor
// until the roster is filled.
GameError random_fleet(std::mt19937_64 &rng, Board &out, const RandomFleetLimits &limits = {});

// Rebuilds a board from stored (start, end, size) triples.
GameError rebuild_fleet(const std::vector<ShipRecord> &records, Board &out);
