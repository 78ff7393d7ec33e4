#pragma once
#include <string>
#include <vector>
#include "Game.hpp"
#include "Ship.hpp"

// CSV with header start,end,size
GameError save_ships(const std::string &path, const std::vector<ShipRecord> &ships);
GameError load_ships(const std::string &path, std::vector<ShipRecord> &out);

// CSV with header turn,player_move,player_hit,bot_move,bot_hit
GameError save_rounds(const std::string &path, const std::vector<RoundRow> &rows);

GameError ensure_directory(const std::string &dir);
