#pragma once
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "Errors.hpp"

static constexpr int BOARD_SIZE = 10;
static constexpr int BOARD_CELLS = BOARD_SIZE * BOARD_SIZE;

// row 0..9 is A..J, col 0..9 is 1..10
struct Coord {
    int row{};
    int col{};
    Coord() = default;
    Coord(int r, int c) : row(r), col(c) {}
    bool operator==(const Coord& o) const noexcept { return row==o.row && col==o.col; }
    bool operator!=(const Coord& o) const noexcept { return !(*this==o); }
    bool operator<(const Coord& o) const noexcept { return row!=o.row ? row<o.row : col<o.col; }

    bool on_board() const noexcept { return row>=0 && row<BOARD_SIZE && col>=0 && col<BOARD_SIZE; }
    // linear index, only valid for on_board() coordinates
    int index() const noexcept { return row*BOARD_SIZE + col; }
    static Coord from_index(int i) { return Coord{i / BOARD_SIZE, i % BOARD_SIZE}; }
};

struct CoordHasher {
    std::size_t operator()(const Coord& c) const noexcept {
        // 64-bit mix of two 32-bit ints
        std::uint64_t k = ( (std::uint64_t)(std::uint32_t)c.row << 32 ) ^ (std::uint32_t)c.col;
        k ^= (k >> 33);
        k *= 0xff51afd7ed558ccdULL;
        k ^= (k >> 33);
        return (std::size_t)k;
    }
};

enum class Orientation : uint8_t
{
    Horizontal = 0,
    Vertical = 1
};

// "b7" / " B7 " -> {1, 6}
GameError parse_coord(const std::string &token, Coord &out);
std::string format_coord(const Coord &c);

// inclusive list of cells from the lower to the higher endpoint
GameError span(const Coord &start, const Coord &end, std::vector<Coord> &out);

// up to 8 surrounding cells, clipped to the board
std::vector<Coord> neighbors8(const Coord &c);

// cells of a ship of `size` anchored at its top/left cell
std::vector<Coord> ship_cells(const Coord &anchor, Orientation o, int size);
