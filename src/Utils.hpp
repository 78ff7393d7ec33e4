#pragma once
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <string>

struct Timer
{
    using clock = std::chrono::steady_clock;
    clock::time_point t0;
    explicit Timer() : t0(clock::now()) {}
    int elapsed_ms() const
    {
        return (int)std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - t0).count();
    }
};

inline std::uint64_t clock_seed()
{
    return (std::uint64_t)std::chrono::system_clock::now().time_since_epoch().count();
}

inline std::string to_lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return (char)std::tolower(c); });
    return s;
}
