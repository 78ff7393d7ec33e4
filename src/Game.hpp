#pragma once
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>
#include "Board.hpp"
#include "Bot.hpp"

enum class Side : uint8_t
{
    Player = 0,
    Bot = 1
};

inline Side opponent(Side s) { return s == Side::Player ? Side::Bot : Side::Player; }
const char *side_name(Side s);

enum class Phase : uint8_t
{
    AwaitingPlayerShot,
    AwaitingBotShot,
    GameOver
};

struct TurnRecord
{
    int turn{};
    Side shooter{Side::Player};
    Coord target{};
    Shot outcome{Shot::Unfired};
    bool sunk{false};
    std::vector<Coord> autoMisses;
};

// One round as stored on disk: the player's shot and the bot's answer.
struct RoundRow
{
    int turn{};
    std::string playerMove;
    std::string playerHit;
    std::string botMove;
    std::string botHit;
};

class Game
{
    struct PrivateTag
    {
        explicit PrivateTag() = default;
    };

public:
    // construct through create()
    Game(PrivateTag, Board player, Board bot, std::mt19937_64 &rng);

    // Both boards must hold a complete fleet, otherwise FleetIncomplete.
    static GameError create(Board player, Board bot, std::mt19937_64 &rng, std::unique_ptr<Game> &out);

    GameError player_shot(const Coord &c, TurnRecord &out);
    GameError player_shot(const std::string &token, TurnRecord &out);

    // bot picks a uniformly random unfired cell of the player's board
    GameError bot_shot(TurnRecord &out);
    // bot turn at a caller-chosen cell instead of a random one
    GameError bot_shot_at(const Coord &c, TurnRecord &out);

    Phase phase() const { return state; }
    bool over() const { return state == Phase::GameOver; }
    std::optional<Side> winner() const { return won; }
    int turn() const { return turnNo; }

    const Board &board(Side owner) const { return owner == Side::Player ? playerBoard : botBoard; }
    // owner's board as `viewer` sees it: ships hidden from the opponent
    BoardView view(Side owner, Side viewer) const { return board(owner).view(owner == viewer); }

    const std::vector<TurnRecord> &history() const { return turns; }
    std::vector<RoundRow> rounds() const;

private:
    Board playerBoard;
    Board botBoard;
    Bot botPlayer;
    Phase state{Phase::AwaitingPlayerShot};
    std::optional<Side> won;
    int turnNo{0};
    std::vector<TurnRecord> turns;

    GameError resolve(Side shooter, const Coord &c, TurnRecord &out);
    GameError check_turn(Side shooter) const;
};
