#pragma once
#include <random>
#include "Board.hpp"
#include "Fleet.hpp"

// The computer opponent: random layout, uniform random targeting among
// cells it has not shot yet.
class Bot
{
public:
    explicit Bot(std::mt19937_64 &gen) : rng(gen) {}

    void set_limits(const RandomFleetLimits &l) { limits = l; }

    GameError layout(Board &out);

    // target on the opponent's board; GameFinished if every cell is used up
    GameError choose_target(const Board &opponent, Coord &out);

private:
    std::mt19937_64 &rng;
    RandomFleetLimits limits{};
};
