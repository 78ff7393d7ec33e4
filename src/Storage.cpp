#include "Storage.hpp"
#include <filesystem>
#include <fstream>
#include <glog/logging.h>

static const char *SHIPS_HEADER = "start,end,size";
static const char *ROUNDS_HEADER = "turn,player_move,player_hit,bot_move,bot_hit";

static std::vector<std::string> split_csv(std::string line)
{
    if (!line.empty() && line.back() == '\r')
        line.pop_back();
    std::vector<std::string> out;
    size_t start = 0;
    while (true)
    {
        size_t pos = line.find(',', start);
        out.push_back(line.substr(start, pos == std::string::npos ? std::string::npos : pos - start));
        if (pos == std::string::npos)
            break;
        start = pos + 1;
    }
    return out;
}

GameError ensure_directory(const std::string &dir)
{
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec)
    {
        LOG(ERROR) << "cannot create " << dir << ": " << ec.message();
        return GameError::IoFailure;
    }
    return GameError::None;
}

GameError save_ships(const std::string &path, const std::vector<ShipRecord> &ships)
{
    std::ofstream f(path, std::ios::trunc);
    if (!f)
    {
        LOG(ERROR) << "cannot open " << path << " for writing";
        return GameError::IoFailure;
    }
    f << SHIPS_HEADER << '\n';
    for (const auto &s : ships)
        f << format_coord(s.start) << ',' << format_coord(s.end) << ',' << s.size << '\n';
    if (!f)
        return GameError::IoFailure;
    LOG(INFO) << "saved " << ships.size() << " ships to " << path;
    return GameError::None;
}

GameError load_ships(const std::string &path, std::vector<ShipRecord> &out)
{
    std::ifstream f(path);
    if (!f)
    {
        LOG(ERROR) << "cannot open " << path;
        return GameError::IoFailure;
    }
    std::string line;
    if (!std::getline(f, line))
        return GameError::IoFailure;

    std::vector<ShipRecord> ships;
    int lineNo = 1;
    while (std::getline(f, line))
    {
        ++lineNo;
        if (line.empty() || line == "\r")
            continue;
        auto fields = split_csv(line);
        if (fields.size() != 3)
        {
            LOG(WARNING) << path << ":" << lineNo << ": expected 3 fields";
            return GameError::InvalidShipRecord;
        }
        ShipRecord rec;
        GameError err = parse_coord(fields[0], rec.start);
        if (err == GameError::None)
            err = parse_coord(fields[1], rec.end);
        if (err != GameError::None)
        {
            LOG(WARNING) << path << ":" << lineNo << ": bad coordinate";
            return err;
        }
        const std::string &size = fields[2];
        if (size.empty() || size.size() > 2 || size.find_first_not_of("0123456789") != std::string::npos)
        {
            LOG(WARNING) << path << ":" << lineNo << ": bad size '" << size << "'";
            return GameError::InvalidShipRecord;
        }
        rec.size = std::stoi(size);
        ships.push_back(rec);
    }
    out = std::move(ships);
    return GameError::None;
}

GameError save_rounds(const std::string &path, const std::vector<RoundRow> &rows)
{
    std::ofstream f(path, std::ios::trunc);
    if (!f)
    {
        LOG(ERROR) << "cannot open " << path << " for writing";
        return GameError::IoFailure;
    }
    f << ROUNDS_HEADER << '\n';
    for (const auto &r : rows)
        f << r.turn << ',' << r.playerMove << ',' << r.playerHit << ',' << r.botMove << ',' << r.botHit << '\n';
    if (!f)
        return GameError::IoFailure;
    LOG(INFO) << "saved " << rows.size() << " rounds to " << path;
    return GameError::None;
}
