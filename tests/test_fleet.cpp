#include <cassert>
#include <algorithm>
#include <cstdlib>
#include <glog/logging.h>
#include "Bot.hpp"
#include "TestFleets.hpp"

static void check_layout(const Board &b)
{
    std::vector<int> sizes;
    int cells = 0;
    for (auto &s : b.ships())
    {
        sizes.push_back(s.size());
        cells += s.size();
        std::vector<Coord> expect;
        assert(span(s.start(), s.end(), expect) == GameError::None);
        assert(expect == s.occupied());
    }
    std::sort(sizes.rbegin(), sizes.rend());
    assert(sizes == std::vector<int>(std::begin(FLEET_SIZES), std::end(FLEET_SIZES)));
    assert(cells == FLEET_CELLS);

    // distinct ships never come within one cell of each other
    const auto &ships = b.ships();
    for (size_t i = 0; i < ships.size(); ++i)
        for (size_t j = i + 1; j < ships.size(); ++j)
            for (auto &a : ships[i].occupied())
                for (auto &c : ships[j].occupied())
                    assert(std::max(std::abs(a.row - c.row), std::abs(a.col - c.col)) > 1);
}

static void random_fleets_are_valid()
{
    for (std::uint64_t seed = 1; seed <= 200; ++seed)
    {
        std::mt19937_64 rng(seed);
        Board b;
        assert(random_fleet(rng, b) == GameError::None);
        check_layout(b);
    }
}

static void same_seed_same_layout()
{
    std::mt19937_64 r1(42), r2(42);
    Bot a(r1), b(r2);
    Board x, y;
    assert(a.layout(x) == GameError::None);
    assert(b.layout(y) == GameError::None);
    assert(x.ship_records() == y.ship_records());
}

static void tiny_cap_reports_stall()
{
    std::mt19937_64 rng(7);
    RandomFleetLimits limits;
    limits.attemptCap = 3; // ten ships can never fit in three attempts
    limits.restartCap = 2;
    Board b;
    assert(random_fleet(rng, b, limits) == GameError::PlacementStalled);
    assert(b.ships().empty());
}

static void rebuild_reproduces_records()
{
    Board original = build(fleet_rows());
    check_layout(original);
    Board copy;
    assert(rebuild_fleet(original.ship_records(), copy) == GameError::None);
    assert(copy.ship_records() == original.ship_records());
    check_layout(copy);
}

static void rebuild_rejects_bad_records()
{
    auto records = build(fleet_rows()).ship_records();
    Board b;

    auto wrongSize = records;
    wrongSize[0].size = 3;
    assert(rebuild_fleet(wrongSize, b) == GameError::InvalidShipRecord);

    auto missing = records;
    missing.pop_back();
    assert(rebuild_fleet(missing, b) == GameError::FleetIncomplete);

    auto touching = records;
    touching[1].start = at("B1");
    touching[1].end = at("B3");
    assert(rebuild_fleet(touching, b) == GameError::AdjacentShips);
    assert(b.ships().empty());
}

int main(int, char **argv)
{
    google::InitGoogleLogging(argv[0]);
    random_fleets_are_valid();
    same_seed_same_layout();
    tiny_cap_reports_stall();
    rebuild_reproduces_records();
    rebuild_rejects_bad_records();
    return 0;
}
