#pragma once

#include <cstdint>
#include <random>
#include <string>

namespace rf::utils
{

// Random version-4 style UUID text, e.g. "3f2b9c1e-8a4d-4c7e-9b1a-0d6e5f4a3b2c".
inline std::string generate_id()
{
    static constexpr char kHexDigits[] = "0123456789abcdef";
    thread_local std::mt19937_64 rng(std::random_device{}());
    std::uniform_int_distribution<std::uint64_t> dist;
    auto high = dist(rng);
    auto low = dist(rng);
    high = (high & 0xFFFFFFFFFFFF0FFFull) | 0x0000000000004000ull;
    low = (low & 0x3FFFFFFFFFFFFFFFull) | 0x8000000000000000ull;
    std::string id;
    id.reserve(36);
    auto append = [&](std::uint64_t value, int from_nibble, int to_nibble)
    {
        for (int nibble = from_nibble; nibble > to_nibble; --nibble)
        {
            id.push_back(kHexDigits[(value >> ((nibble - 1) * 4)) & 0xF]);
        }
    };
    append(high, 16, 8);
    id.push_back('-');
    append(high, 8, 4);
    id.push_back('-');
    append(high, 4, 0);
    id.push_back('-');
    append(low, 16, 12);
    id.push_back('-');
    append(low, 12, 0);
    return id;
}

} // namespace rf::utils
