#include "Game.hpp"
#include <glog/logging.h>

const char *side_name(Side s)
{
    return s == Side::Player ? "player" : "bot";
}

// exactly the roster sizes; placement already ruled out overlap and contact
static bool fleet_complete(const Board &b)
{
    if ((int)b.ships().size() != FLEET_SHIPS)
        return false;
    Roster roster;
    for (const auto &s : b.ships())
        if (!roster.take(s.size()))
            return false;
    return roster.complete();
}

Game::Game(PrivateTag, Board player, Board bot, std::mt19937_64 &rng)
    : playerBoard(std::move(player)), botBoard(std::move(bot)), botPlayer(rng)
{
}

GameError Game::create(Board player, Board bot, std::mt19937_64 &rng, std::unique_ptr<Game> &out)
{
    if (!fleet_complete(player) || !fleet_complete(bot))
        return GameError::FleetIncomplete;
    out = std::make_unique<Game>(PrivateTag{}, std::move(player), std::move(bot), rng);
    LOG(INFO) << "game started";
    return GameError::None;
}

GameError Game::check_turn(Side shooter) const
{
    if (state == Phase::GameOver)
        return GameError::GameFinished;
    Phase expected = shooter == Side::Player ? Phase::AwaitingPlayerShot : Phase::AwaitingBotShot;
    if (state != expected)
        return GameError::OutOfTurn;
    return GameError::None;
}

GameError Game::resolve(Side shooter, const Coord &c, TurnRecord &out)
{
    GameError err = check_turn(shooter);
    if (err != GameError::None)
        return err;

    Board &target = shooter == Side::Player ? botBoard : playerBoard;
    ShotResult res;
    err = target.receive_shot(c, res);
    if (err != GameError::None)
        return err;

    if (shooter == Side::Player)
        ++turnNo;

    TurnRecord rec;
    rec.turn = turnNo;
    rec.shooter = shooter;
    rec.target = c;
    rec.outcome = res.outcome;
    rec.sunk = res.sunk;
    rec.autoMisses = std::move(res.autoMisses);

    LOG(INFO) << "turn " << rec.turn << ": " << side_name(shooter) << " fires at " << format_coord(c) << " -> "
              << shot_name(rec.outcome) << (rec.sunk ? " (sunk)" : "");

    if (target.all_sunk())
    {
        state = Phase::GameOver;
        won = shooter;
        LOG(INFO) << side_name(shooter) << " wins after " << turnNo << " turns";
    }
    else
    {
        state = shooter == Side::Player ? Phase::AwaitingBotShot : Phase::AwaitingPlayerShot;
    }

    turns.push_back(rec);
    out = std::move(rec);
    return GameError::None;
}

GameError Game::player_shot(const Coord &c, TurnRecord &out)
{
    return resolve(Side::Player, c, out);
}

GameError Game::player_shot(const std::string &token, TurnRecord &out)
{
    Coord c;
    GameError err = parse_coord(token, c);
    if (err != GameError::None)
        return err;
    return player_shot(c, out);
}

GameError Game::bot_shot(TurnRecord &out)
{
    GameError err = check_turn(Side::Bot);
    if (err != GameError::None)
        return err;
    Coord c;
    err = botPlayer.choose_target(playerBoard, c);
    if (err != GameError::None)
        return err;
    return resolve(Side::Bot, c, out);
}

GameError Game::bot_shot_at(const Coord &c, TurnRecord &out)
{
    return resolve(Side::Bot, c, out);
}

std::vector<RoundRow> Game::rounds() const
{
    std::vector<RoundRow> rows;
    for (const auto &rec : turns)
    {
        // hit and sunk both count as hit; auto-miss never comes from a shot
        const char *result = rec.outcome == Shot::Hit ? "hit" : "miss";
        if (rec.shooter == Side::Player)
        {
            RoundRow row;
            row.turn = rec.turn;
            row.playerMove = format_coord(rec.target);
            row.playerHit = result;
            row.botHit = "miss";
            rows.push_back(row);
        }
        else
        {
            CHECK(!rows.empty() && rows.back().turn == rec.turn) << "bot shot without a player shot in turn " << rec.turn;
            rows.back().botMove = format_coord(rec.target);
            rows.back().botHit = result;
        }
    }
    return rows;
}
