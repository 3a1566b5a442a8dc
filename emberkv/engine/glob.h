#pragma once
#include <string_view>

// Channel pattern match for PSUBSCRIBE. Only '*' (any run, possibly empty)
// and '?' (exactly one character) are special; every other character,
// including '.', '[' and '\\', matches itself. The whole channel must match.
inline bool glob_match(std::string_view pattern, std::string_view text)
{
    size_t p = 0, t = 0;
    size_t star = std::string_view::npos;
    size_t resume = 0;

    while (t < text.size())
    {
        if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == text[t]) && pattern[p] != '*')
        {
            ++p;
            ++t;
        }
        else if (p < pattern.size() && pattern[p] == '*')
        {
            star = p++;
            resume = t;
        }
        else if (star != std::string_view::npos)
        {
            // Let the last '*' swallow one more character and retry
            p = star + 1;
            t = ++resume;
        }
        else
        {
            return false;
        }
    }

    while (p < pattern.size() && pattern[p] == '*')
        ++p;
    return p == pattern.size();
}
