#pragma once
#include <cstdint>
#include <string_view>

// 32-bit FNV-1a, constexpr so command names and config keys can be matched
// with `switch (fnv1a(name)) { case fnv1a("get"): ... }`.
inline constexpr uint32_t fnv1a_offset = 2166136261u;
inline constexpr uint32_t fnv1a_prime  = 16777619u;

constexpr char ascii_lower(char c)
{
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

template<bool FoldCase>
constexpr uint32_t fnv1a_hash(std::string_view sv)
{
    uint32_t hash = fnv1a_offset;
    for (char c : sv)
    {
        if constexpr (FoldCase)
            c = ascii_lower(c);
        hash ^= static_cast<uint8_t>(c);
        hash *= fnv1a_prime;
    }
    return hash;
}

constexpr uint32_t fnv1a(std::string_view sv)
{
    return fnv1a_hash<false>(sv);
}

// Clients send commands in any case; "GET", "get" and "Get" hash alike
constexpr uint32_t fnv1a_lower(std::string_view sv)
{
    return fnv1a_hash<true>(sv);
}
