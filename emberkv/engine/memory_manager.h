#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <random>
#include <utility>
#include <cstdint>

#include "value.h"

class keyspace;

enum eviction_policy : uint8_t
{
    evict_none            = 0,
    evict_allkeys_lru     = 1,
    evict_allkeys_lfu     = 2,
    evict_volatile_lru    = 3,
    evict_volatile_lfu    = 4,
    evict_allkeys_random  = 5,
    evict_volatile_random = 6
};

// Accepts exactly the configuration names (noeviction, allkeys-lru, ...)
std::optional<eviction_policy> parse_eviction_policy(std::string_view name);
const char* policy_name(eviction_policy policy);

// "512B", "1.50KB", "64.00MB"
std::string format_bytes(size_t bytes);

struct access_info
{
    engine_clock::time_point last_access{};
    uint64_t access_count{0};
    // Orders accesses that land on the same clock tick
    uint64_t sequence{0};
};

// Per-key recency/frequency tracking plus the memory budget. Lives inside a
// keyspace and is only touched under that keyspace's lock.
class memory_manager
{
public:
    // Tunable estimator constants; only the relative ordering matters.
    static constexpr size_t BASE_OVERHEAD          = 1024;
    static constexpr size_t TRACKING_OVERHEAD      = 48;   // last-access + counter entries per key
    static constexpr size_t EXPIRY_ENTRY_OVERHEAD  = 40;
    static constexpr size_t INTEGER_SIZE           = 8;
    static constexpr size_t ELEMENT_OVERHEAD       = 8;    // per list/set element
    static constexpr size_t PAIR_OVERHEAD          = 16;   // per hash field
    static constexpr size_t MAX_EVICTIONS_PER_ROUND = 1000;

    memory_manager();

    void set_max_memory(size_t bytes) { m_max_memory = bytes; }
    size_t get_max_memory() const { return m_max_memory; }
    void set_eviction(eviction_policy policy) { m_policy = policy; }
    eviction_policy get_eviction() const { return m_policy; }
    void set_clock(clock_fn clock) { m_clock = std::move(clock); }

    void track_access(std::string_view key);
    void remove_tracking(std::string_view key);
    void clear_tracking();
    const access_info* tracking(std::string_view key) const;
    size_t tracked_count() const { return m_access.size(); }

    static size_t estimate_value_size(const value& v);
    size_t estimate_memory_usage(const keyspace& ks) const;

    // Brings usage back under the budget. Under noeviction an over-budget
    // keyspace is reported as status_out_of_memory and left untouched;
    // otherwise keys are evicted until usage reaches 90% of the budget.
    // `keep` is never chosen as a victim (the key a write just stored).
    op_status enforce_budget(keyspace& ks, std::optional<std::string_view> keep = std::nullopt);

    std::optional<std::string> select_victim(const keyspace& ks,
                                             std::optional<std::string_view> keep = std::nullopt);

    size_t last_eviction_count() const { return m_last_evictions; }

    std::vector<std::pair<std::string, std::string>> memory_info(const keyspace& ks) const;

private:
    size_t estimate_entry_size(std::string_view key, const value& v, bool volatile_key) const;
    std::optional<std::string> find_lru_key(const keyspace& ks, bool volatile_only,
                                            std::optional<std::string_view> keep) const;
    std::optional<std::string> find_lfu_key(const keyspace& ks, bool volatile_only,
                                            std::optional<std::string_view> keep) const;
    std::optional<std::string> find_random_key(const keyspace& ks, bool volatile_only,
                                               std::optional<std::string_view> keep);

    std::unordered_map<std::string, access_info, string_hash, string_equal> m_access;
    size_t m_max_memory{0};
    eviction_policy m_policy{evict_none};
    uint64_t m_sequence{0};
    size_t m_last_evictions{0};
    clock_fn m_clock;
    std::mt19937_64 m_rng;
};
