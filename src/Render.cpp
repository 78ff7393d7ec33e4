#include "Render.hpp"
#include <sstream>
#include <iomanip>
#include <vector>

char cell_char(Cell c)
{
    switch (c)
    {
    case Cell::Ship:
        return '#';
    case Cell::Hit:
        return 'X';
    case Cell::Miss:
        return 'O';
    case Cell::AutoMiss:
        return 'o';
    case Cell::Empty:
        break;
    }
    return '.';
}

static std::vector<std::string> board_lines(const BoardView &v, const std::string &title)
{
    std::vector<std::string> lines;
    lines.push_back("   " + title);
    std::ostringstream head;
    head << "   ";
    for (int c = 0; c < BOARD_SIZE; ++c)
        head << std::setw(2) << (c + 1) << ' ';
    lines.push_back(head.str());
    for (int r = 0; r < BOARD_SIZE; ++r)
    {
        std::ostringstream row;
        row << ' ' << (char)('A' + r) << ' ';
        for (int c = 0; c < BOARD_SIZE; ++c)
            row << ' ' << cell_char(v[Coord{r, c}.index()]) << ' ';
        lines.push_back(row.str());
    }
    return lines;
}

std::string render_board(const BoardView &v, const std::string &title)
{
    std::string out;
    for (const auto &l : board_lines(v, title))
        out += l + '\n';
    return out;
}

std::string render_game(const Game &g)
{
    auto left = board_lines(g.view(Side::Player, Side::Player), "Your board");
    auto right = board_lines(g.view(Side::Bot, Side::Player), "Enemy board");
    const size_t width = 36;
    std::string out;
    for (size_t i = 0; i < left.size(); ++i)
    {
        std::string l = left[i];
        if (l.size() < width)
            l.append(width - l.size(), ' ');
        out += l + "   " + right[i] + '\n';
    }
    return out;
}

std::string describe(const TurnRecord &rec)
{
    std::ostringstream ss;
    ss << (rec.shooter == Side::Player ? "You shot" : "Bot shot") << " at " << format_coord(rec.target) << ": ";
    if (rec.outcome == Shot::Hit)
        ss << (rec.sunk ? "HIT, ship destroyed!" : "HIT!");
    else
        ss << "Miss.";
    if (!rec.autoMisses.empty())
        ss << " (" << rec.autoMisses.size() << " cells around it cleared)";
    return ss.str();
}
