#include <cassert>
#include <glog/logging.h>
#include "Fleet.hpp"
#include "TestFleets.hpp"

static void roster_starts_full()
{
    Roster r;
    assert(r.remaining(4) == 1 && r.remaining(3) == 2 && r.remaining(2) == 3 && r.remaining(1) == 4);
    assert(r.remaining(5) == 0 && r.remaining(0) == 0);
    assert(r.remaining_total() == FLEET_SHIPS);
    assert(r.needed() == std::vector<int>({4, 3, 3, 2, 2, 2, 1, 1, 1, 1}));
    assert(r.take(4));
    assert(!r.take(4));
    assert(r.remaining_total() == FLEET_SHIPS - 1);
}

static void touching_ship_is_rejected()
{
    FleetBuilder fb;
    assert(fb.place_tokens("A1", "A4") == GameError::None);
    assert(fb.place_tokens("B1", "B3") == GameError::AdjacentShips);
    assert(fb.board().ships().size() == 1);
    assert(fb.remaining().remaining(3) == 2);
    assert(fb.place_tokens("C1", "C3") == GameError::None);
    assert(fb.remaining().remaining(3) == 1);
}

static void diagonal_contact_is_rejected()
{
    FleetBuilder fb;
    assert(fb.place_tokens("E5", "E5") == GameError::None);
    assert(fb.place_tokens("F6", "F6") == GameError::AdjacentShips);
    assert(fb.place_tokens("D4", "D4") == GameError::AdjacentShips);
    assert(fb.place_tokens("G7", "G7") == GameError::None);
}

static void overlap_wins_over_adjacency()
{
    FleetBuilder fb;
    assert(fb.place_tokens("C3", "F3") == GameError::None);
    assert(fb.place_tokens("D1", "D3") == GameError::Overlap);
    assert(fb.place_tokens("E3", "E3") == GameError::Overlap);
    assert(fb.board().ships().size() == 1);
}

static void quota_is_enforced()
{
    FleetBuilder fb;
    assert(fb.place_tokens("A1", "A4") == GameError::None);
    assert(fb.place_tokens("J1", "J4") == GameError::RosterExhausted);
    // no size-5 ships in the roster
    assert(fb.place_tokens("H1", "H5") == GameError::RosterExhausted);
    assert(fb.place_tokens("A1", "B2") == GameError::NotCollinear);
    assert(fb.place_tokens("Z1", "A2") == GameError::InvalidCoordinate);
    assert(fb.remaining().remaining_total() == FLEET_SHIPS - 1);
}

static void fleet_completes_in_any_order()
{
    auto rows = fleet_rows();
    FleetBuilder fb;
    for (auto it = rows.rbegin(); it != rows.rend(); ++it)
    {
        Board early;
        assert(fb.finish(early) == GameError::FleetIncomplete);
        // endpoints may be given in either order
        assert(fb.place_tokens(it->second, it->first) == GameError::None);
    }
    assert(fb.complete());
    Board b;
    assert(fb.finish(b) == GameError::None);
    assert(b.ships().size() == FLEET_SHIPS);
    int cells = 0;
    for (auto &s : b.ships())
        cells += s.size();
    assert(cells == FLEET_CELLS);
}

int main(int, char **argv)
{
    google::InitGoogleLogging(argv[0]);
    roster_starts_full();
    touching_ship_is_rejected();
    diagonal_contact_is_rejected();
    overlap_wins_over_adjacency();
    quota_is_enforced();
    fleet_completes_in_any_order();
    return 0;
}
