#pragma once
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <deque>
#include <variant>
#include <chrono>
#include <cstdint>
#include <functional>

// Transparent hash for heterogeneous lookup (avoids string copies on find/erase)
struct string_hash
{
    using is_transparent = void;

    size_t operator()(std::string_view sv) const noexcept
    {
        return std::hash<std::string_view>{}(sv);
    }

    size_t operator()(const std::string& s) const noexcept
    {
        return std::hash<std::string_view>{}(s);
    }
};

struct string_equal
{
    using is_transparent = void;

    bool operator()(std::string_view lhs, std::string_view rhs) const noexcept
    {
        return lhs == rhs;
    }
};

using list_value = std::deque<std::string>;
using set_value  = std::unordered_set<std::string, string_hash, string_equal>;
using hash_value = std::unordered_map<std::string, std::string, string_hash, string_equal>;

// Exactly one alternative is active per key. The index order is part of the
// snapshot format (see value_type), so append new alternatives at the end.
using value = std::variant<std::string, int64_t, list_value, set_value, hash_value>;

enum value_type : uint8_t
{
    type_string  = 0,
    type_integer = 1,
    type_list    = 2,
    type_set     = 3,
    type_hash    = 4
};

inline value_type type_of(const value& v)
{
    return static_cast<value_type>(v.index());
}

inline constexpr const char* type_name(value_type t)
{
    switch (t)
    {
        case type_string:  return "string";
        case type_integer: return "integer";
        case type_list:    return "list";
        case type_set:     return "set";
        case type_hash:    return "hash";
    }
    return "unknown";
}

inline const char* type_name(const value& v)
{
    return type_name(type_of(v));
}

using engine_clock = std::chrono::steady_clock;
using clock_fn = std::function<engine_clock::time_point()>;

using data_map   = std::unordered_map<std::string, value, string_hash, string_equal>;
using expiry_map = std::unordered_map<std::string, engine_clock::time_point, string_hash, string_equal>;

// Result of a keyspace operation that can fail on client input
enum op_status : uint8_t
{
    status_ok            = 0,
    status_wrong_type    = 1,
    status_out_of_memory = 2,
    status_not_integer   = 3
};
