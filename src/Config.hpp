#pragma once
#include <cstdint>
#include <string>
#include "Fleet.hpp"

struct GameConfig
{
    std::uint64_t seed{0};
    bool seedGiven{false};
    std::string dataDir{"data"};
    bool save{true};
    std::string loadPlayer; // CSV fleet to use instead of prompting
    RandomFleetLimits limits{};
};

// Reads --seed N, --data-dir DIR, --no-save, --load-player FILE,
// --retry-cap N and --restart-cap N. On failure `error` names the bad argument.
bool parse_args(int argc, char **argv, GameConfig &cfg, std::string &error);

std::string usage(const char *prog);
