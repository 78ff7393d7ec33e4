#include "Coord.hpp"
#include <algorithm>
#include <cctype>

static std::string trim(const std::string &s)
{
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos)
        return {};
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

GameError parse_coord(const std::string &token, Coord &out)
{
    std::string t = trim(token);
    // letter plus one or two digits
    if (t.size() < 2 || t.size() > 3)
        return GameError::InvalidCoordinate;

    char letter = (char)std::toupper((unsigned char)t[0]);
    if (letter < 'A' || letter >= 'A' + BOARD_SIZE)
        return GameError::InvalidCoordinate;

    int number = 0;
    for (size_t i = 1; i < t.size(); ++i)
    {
        if (!std::isdigit((unsigned char)t[i]))
            return GameError::InvalidCoordinate;
        number = number * 10 + (t[i] - '0');
    }
    if (number < 1 || number > BOARD_SIZE)
        return GameError::InvalidCoordinate;

    out = Coord{letter - 'A', number - 1};
    return GameError::None;
}

std::string format_coord(const Coord &c)
{
    std::string s(1, (char)('A' + c.row));
    s += std::to_string(c.col + 1);
    return s;
}

GameError span(const Coord &start, const Coord &end, std::vector<Coord> &out)
{
    if (!start.on_board() || !end.on_board())
        return GameError::InvalidCoordinate;
    if (start.row != end.row && start.col != end.col)
        return GameError::NotCollinear;

    std::vector<Coord> cells;
    if (start.row == end.row)
    {
        for (int c = std::min(start.col, end.col); c <= std::max(start.col, end.col); ++c)
            cells.emplace_back(start.row, c);
    }
    else
    {
        for (int r = std::min(start.row, end.row); r <= std::max(start.row, end.row); ++r)
            cells.emplace_back(r, start.col);
    }
    out = std::move(cells);
    return GameError::None;
}

std::vector<Coord> neighbors8(const Coord &c)
{
    std::vector<Coord> out;
    out.reserve(8);
    for (int dr = -1; dr <= 1; ++dr)
    {
        for (int dc = -1; dc <= 1; ++dc)
        {
            if (!dr && !dc)
                continue;
            Coord n{c.row + dr, c.col + dc};
            if (n.on_board())
                out.push_back(n);
        }
    }
    return out;
}

std::vector<Coord> ship_cells(const Coord &anchor, Orientation o, int size)
{
    std::vector<Coord> out;
    out.reserve(size);
    for (int i = 0; i < size; ++i)
    {
        if (o == Orientation::Horizontal)
            out.emplace_back(anchor.row, anchor.col + i);
        else
            out.emplace_back(anchor.row + i, anchor.col);
    }
    return out;
}
