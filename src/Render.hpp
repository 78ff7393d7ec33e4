#pragma once
#include <string>
#include "Board.hpp"
#include "Game.hpp"

char cell_char(Cell c);

// 10x10 grid with A-J / 1-10 labels
std::string render_board(const BoardView &v, const std::string &title);

// player's own board next to what the player knows about the bot's board
std::string render_game(const Game &g);

std::string describe(const TurnRecord &rec);
