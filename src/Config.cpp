#include "Config.hpp"
#include <sstream>

static bool to_number(const std::string &s, std::uint64_t &out)
{
    if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos)
        return false;
    std::stringstream ss(s);
    ss >> out;
    return !ss.fail();
}

static bool to_positive(const std::string &s, int &out)
{
    std::uint64_t v = 0;
    if (!to_number(s, v) || v == 0 || v > 1000000)
        return false;
    out = (int)v;
    return true;
}

bool parse_args(int argc, char **argv, GameConfig &cfg, std::string &error)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        auto value = [&](std::string &v) {
            if (i + 1 >= argc)
                return false;
            v = argv[++i];
            return true;
        };
        std::string v;
        if (arg == "--no-save")
            cfg.save = false;
        else if (arg == "--seed")
        {
            if (!value(v) || !to_number(v, cfg.seed))
            {
                error = "--seed needs a non-negative integer";
                return false;
            }
            cfg.seedGiven = true;
        }
        else if (arg == "--data-dir")
        {
            if (!value(v) || v.empty())
            {
                error = "--data-dir needs a directory";
                return false;
            }
            cfg.dataDir = v;
        }
        else if (arg == "--load-player")
        {
            if (!value(v) || v.empty())
            {
                error = "--load-player needs a file";
                return false;
            }
            cfg.loadPlayer = v;
        }
        else if (arg == "--retry-cap")
        {
            if (!value(v) || !to_positive(v, cfg.limits.attemptCap))
            {
                error = "--retry-cap needs a positive integer";
                return false;
            }
        }
        else if (arg == "--restart-cap")
        {
            if (!value(v) || !to_positive(v, cfg.limits.restartCap))
            {
                error = "--restart-cap needs a positive integer";
                return false;
            }
        }
        else
        {
            error = "unknown argument: " + arg;
            return false;
        }
    }
    return true;
}

std::string usage(const char *prog)
{
    std::string s = "usage: ";
    s += prog;
    s += " [--seed N] [--data-dir DIR] [--no-save] [--load-player FILE] [--retry-cap N] [--restart-cap N]\n";
    return s;
}
