#include <iostream>
#include <sstream>
#include <glog/logging.h>
#include "Config.hpp"
#include "Game.hpp"
#include "Render.hpp"
#include "Storage.hpp"
#include "Utils.hpp"

static bool read_line(const std::string &prompt, std::string &line)
{
    std::cout << prompt;
    if (!std::getline(std::cin, line))
        return false;
    std::stringstream ss(to_lower(line));
    std::string word, rest;
    return !(ss >> word && word == "quit" && !(ss >> rest));
}

static bool setup_player(FleetBuilder &fleet)
{
    std::cout << "Place your ships as: START END  (e.g. A1 A4, B3 D3, E5 E5)\n";
    std::cout << "Ships must be straight and must not touch, not even diagonally.\n";
    while (!fleet.complete())
    {
        std::cout << render_board(fleet.board().view(true), "Your board");
        std::ostringstream still;
        for (int size : fleet.remaining().needed())
            still << size << ' ';
        std::string line;
        if (!read_line("Still to place: " + still.str() + "> ", line))
            return false;
        std::stringstream ss(line);
        std::string a, b, extra;
        if (!(ss >> a >> b) || (ss >> extra))
        {
            std::cout << "bad input, use: START END\n";
            continue;
        }
        GameError err = fleet.place_tokens(a, b);
        if (err != GameError::None)
            std::cout << "rejected: " << error_message(err) << "\n";
    }
    return true;
}

static void save_state(const GameConfig &cfg, const Game &game)
{
    if (!cfg.save)
        return;
    if (save_rounds(cfg.dataDir + "/game_state.csv", game.rounds()) != GameError::None)
        std::cout << "warning: could not write game state\n";
}

int main(int argc, char **argv)
{
    google::InitGoogleLogging(argv[0]);

    GameConfig cfg;
    std::string error;
    if (!parse_args(argc, argv, cfg, error))
    {
        std::cerr << error << '\n' << usage(argv[0]);
        return 2;
    }
    if (!cfg.seedGiven)
        cfg.seed = clock_seed();
    LOG(INFO) << "seed " << cfg.seed;
    std::mt19937_64 rng(cfg.seed);

    if (cfg.save && ensure_directory(cfg.dataDir) != GameError::None)
    {
        std::cerr << "cannot create " << cfg.dataDir << '\n';
        return 1;
    }

    std::cout << "SEA BATTLE. You against the bot on a 10x10 board. Type 'quit' to leave.\n";

    Board playerBoard;
    if (!cfg.loadPlayer.empty())
    {
        std::vector<ShipRecord> records;
        GameError err = load_ships(cfg.loadPlayer, records);
        if (err == GameError::None)
            err = rebuild_fleet(records, playerBoard);
        if (err != GameError::None)
        {
            std::cerr << cfg.loadPlayer << ": " << error_message(err) << '\n';
            return 1;
        }
    }
    else
    {
        FleetBuilder fleet;
        if (!setup_player(fleet))
            return 0;
        GameError err = fleet.finish(playerBoard);
        CHECK(err == GameError::None) << error_name(err);
    }

    Bot layoutBot(rng);
    layoutBot.set_limits(cfg.limits);
    Board botBoard;
    GameError err = layoutBot.layout(botBoard);
    if (err != GameError::None)
    {
        std::cerr << "bot fleet: " << error_message(err) << '\n';
        return 1;
    }

    if (cfg.save)
    {
        if (save_ships(cfg.dataDir + "/player_ships.csv", playerBoard.ship_records()) != GameError::None ||
            save_ships(cfg.dataDir + "/bot_ships.csv", botBoard.ship_records()) != GameError::None)
            std::cout << "warning: could not write fleets to " << cfg.dataDir << "\n";
    }

    std::unique_ptr<Game> game;
    err = Game::create(std::move(playerBoard), std::move(botBoard), rng, game);
    CHECK(err == GameError::None) << error_name(err);

    Timer timer;
    while (!game->over())
    {
        std::cout << "\n--- TURN " << game->turn() + 1 << " ---\n" << render_game(*game);
        std::string line;
        if (!read_line("Your shot: ", line))
        {
            save_state(cfg, *game);
            return 0;
        }
        TurnRecord rec;
        err = game->player_shot(line, rec);
        if (err != GameError::None)
        {
            std::cout << "invalid move: " << error_message(err) << "\n";
            continue;
        }
        std::cout << describe(rec) << "\n";
        if (!game->over())
        {
            err = game->bot_shot(rec);
            CHECK(err == GameError::None) << error_name(err);
            std::cout << describe(rec) << "\n";
        }
        save_state(cfg, *game);
    }

    std::cout << '\n' << render_game(*game);
    std::cout << (*game->winner() == Side::Player ? "YOU WIN! All enemy ships destroyed!\n"
                                                  : "YOU LOSE! All your ships destroyed!\n");
    LOG(INFO) << "game finished in " << timer.elapsed_ms() << " ms";
    return 0;
}
