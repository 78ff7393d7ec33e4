#include "Bot.hpp"
#include <glog/logging.h>

GameError Bot::layout(Board &out)
{
    return random_fleet(rng, out, limits);
}

GameError Bot::choose_target(const Board &opponent, Coord &out)
{
    auto cand = opponent.unfired();
    if (cand.empty())
        return GameError::GameFinished;
    std::uniform_int_distribution<int> dist(0, (int)cand.size() - 1);
    out = cand[dist(rng)];
    VLOG(1) << "bot picks " << format_coord(out) << " out of " << cand.size() << " unfired cells";
    return GameError::None;
}
