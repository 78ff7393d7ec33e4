#include "Fleet.hpp"
#include <glog/logging.h>

GameError FleetBuilder::place(const Coord &start, const Coord &end)
{
    return place_ship(target, roster, start, end);
}

GameError FleetBuilder::place_tokens(const std::string &startToken, const std::string &endToken)
{
    Coord start, end;
    GameError err = parse_coord(startToken, start);
    if (err == GameError::None)
        err = parse_coord(endToken, end);
    if (err != GameError::None)
        return err;
    return place(start, end);
}

GameError FleetBuilder::finish(Board &out)
{
    if (!complete())
        return GameError::FleetIncomplete;
    out = std::move(target);
    target = Board{};
    roster = Roster{};
    return GameError::None;
}

static bool try_layout(std::mt19937_64 &rng, int attemptCap, Board &board, int &attempts)
{
    Roster roster;
    std::uniform_int_distribution<int> coin(0, 1);
    while (!roster.complete())
    {
        if (attempts >= attemptCap)
            return false;
        ++attempts;

        auto sizes = roster.needed();
        std::uniform_int_distribution<int> pick(0, (int)sizes.size() - 1);
        int size = sizes[pick(rng)];
        Orientation o = coin(rng) ? Orientation::Horizontal : Orientation::Vertical;

        // anchor range keeps the far end on the board
        int maxRow = BOARD_SIZE - 1, maxCol = BOARD_SIZE - 1;
        if (o == Orientation::Horizontal)
            maxCol -= size - 1;
        else
            maxRow -= size - 1;
        std::uniform_int_distribution<int> rowDist(0, maxRow), colDist(0, maxCol);
        Coord anchor{rowDist(rng), colDist(rng)};

        auto cells = ship_cells(anchor, o, size);
        GameError err = place_ship(board, roster, cells.front(), cells.back());
        if (err != GameError::None)
            VLOG(2) << "rejected " << format_coord(cells.front()) << "-" << format_coord(cells.back()) << ": "
                    << error_name(err);
    }
    return true;
}

GameError random_fleet(std::mt19937_64 &rng, Board &out, const RandomFleetLimits &limits)
{
    for (int restart = 0; restart < limits.restartCap; ++restart)
    {
        Board board;
        int attempts = 0;
        if (try_layout(rng, limits.attemptCap, board, attempts))
        {
            VLOG(1) << "random fleet after " << attempts << " attempts, " << restart << " restarts";
            out = std::move(board);
            return GameError::None;
        }
        LOG(WARNING) << "random layout stalled after " << attempts << " attempts, restarting";
    }
    LOG(ERROR) << "no random layout found in " << limits.restartCap << " restarts";
    return GameError::PlacementStalled;
}

GameError rebuild_fleet(const std::vector<ShipRecord> &records, Board &out)
{
    FleetBuilder builder;
    for (const auto &rec : records)
    {
        std::vector<Coord> cells;
        GameError err = span(rec.start, rec.end, cells);
        if (err != GameError::None)
            return err;
        if ((int)cells.size() != rec.size)
            return GameError::InvalidShipRecord;
        err = builder.place(rec.start, rec.end);
        if (err != GameError::None)
            return err;
    }
    return builder.finish(out);
}
