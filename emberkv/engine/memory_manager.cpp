#include "memory_manager.h"
#include "keyspace.h"
#include "../shared/logging.h"

#include <cstdio>
#include <type_traits>

std::optional<eviction_policy> parse_eviction_policy(std::string_view name)
{
    if (name == "noeviction")      return evict_none;
    if (name == "allkeys-lru")     return evict_allkeys_lru;
    if (name == "allkeys-lfu")     return evict_allkeys_lfu;
    if (name == "volatile-lru")    return evict_volatile_lru;
    if (name == "volatile-lfu")    return evict_volatile_lfu;
    if (name == "allkeys-random")  return evict_allkeys_random;
    if (name == "volatile-random") return evict_volatile_random;
    return std::nullopt;
}

const char* policy_name(eviction_policy policy)
{
    switch (policy)
    {
        case evict_none:            return "noeviction";
        case evict_allkeys_lru:     return "allkeys-lru";
        case evict_allkeys_lfu:     return "allkeys-lfu";
        case evict_volatile_lru:    return "volatile-lru";
        case evict_volatile_lfu:    return "volatile-lfu";
        case evict_allkeys_random:  return "allkeys-random";
        case evict_volatile_random: return "volatile-random";
    }
    return "unknown";
}

std::string format_bytes(size_t bytes)
{
    static constexpr const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    constexpr size_t unit_count = sizeof(units) / sizeof(units[0]);

    double size = static_cast<double>(bytes);
    size_t unit = 0;
    while (size >= 1024.0 && unit < unit_count - 1)
    {
        size /= 1024.0;
        ++unit;
    }

    char buf[32];
    if (unit == 0)
        std::snprintf(buf, sizeof(buf), "%zuB", bytes);
    else
        std::snprintf(buf, sizeof(buf), "%.2f%s", size, units[unit]);
    return buf;
}

namespace
{
    // Calls fn(key) for every eviction candidate other than `keep` until fn
    // returns false
    template<typename Fn>
    void for_each_candidate(const keyspace& ks, bool volatile_only,
                            std::optional<std::string_view> keep, Fn&& fn)
    {
        auto visit = [&](const std::string& key) {
            if (keep && key == *keep)
                return true;
            return fn(key);
        };

        if (volatile_only)
        {
            for (const auto& [key, _] : ks.expiries())
                if (!visit(key))
                    return;
        }
        else
        {
            for (const auto& [key, _] : ks.data())
                if (!visit(key))
                    return;
        }
    }
}

memory_manager::memory_manager()
    : m_rng(std::random_device{}())
{
}

// --- Access tracking ---

void memory_manager::track_access(std::string_view key)
{
    auto now = m_clock ? m_clock() : engine_clock::now();

    auto it = m_access.find(key);
    if (it == m_access.end())
        it = m_access.emplace(std::string(key), access_info{}).first;

    it->second.last_access = now;
    ++it->second.access_count;
    it->second.sequence = ++m_sequence;
}

void memory_manager::remove_tracking(std::string_view key)
{
    if (auto it = m_access.find(key); it != m_access.end())
        m_access.erase(it);
}

void memory_manager::clear_tracking()
{
    m_access.clear();
}

const access_info* memory_manager::tracking(std::string_view key) const
{
    auto it = m_access.find(key);
    return it != m_access.end() ? &it->second : nullptr;
}

// --- Estimation ---

size_t memory_manager::estimate_value_size(const value& v)
{
    return std::visit([](const auto& val) -> size_t {
        using T = std::decay_t<decltype(val)>;
        if constexpr (std::is_same_v<T, std::string>)
        {
            return val.size();
        }
        else if constexpr (std::is_same_v<T, int64_t>)
        {
            return INTEGER_SIZE;
        }
        else if constexpr (std::is_same_v<T, hash_value>)
        {
            size_t total = val.size() * PAIR_OVERHEAD;
            for (const auto& [f, s] : val)
                total += f.size() + s.size();
            return total;
        }
        else
        {
            // list_value and set_value
            size_t total = val.size() * ELEMENT_OVERHEAD;
            for (const auto& e : val)
                total += e.size();
            return total;
        }
    }, v);
}

size_t memory_manager::estimate_entry_size(std::string_view key, const value& v, bool volatile_key) const
{
    size_t total = key.size() + estimate_value_size(v) + TRACKING_OVERHEAD;
    if (volatile_key)
        total += EXPIRY_ENTRY_OVERHEAD;
    return total;
}

size_t memory_manager::estimate_memory_usage(const keyspace& ks) const
{
    size_t total = BASE_OVERHEAD;
    for (const auto& [key, val] : ks.data())
        total += key.size() + estimate_value_size(val) + TRACKING_OVERHEAD;
    total += ks.expiries().size() * EXPIRY_ENTRY_OVERHEAD;
    return total;
}

// --- Eviction ---

op_status memory_manager::enforce_budget(keyspace& ks, std::optional<std::string_view> keep)
{
    m_last_evictions = 0;

    // Inline fast-path: most configs have no memory limit
    if (__builtin_expect(m_max_memory == 0, 1))
        return status_ok;

    size_t usage = estimate_memory_usage(ks);
    if (usage <= m_max_memory)
        return status_ok;

    if (m_policy == evict_none)
    {
        LOG_WARN("write rejected: " + format_bytes(usage) + " used, maxmemory " +
                 format_bytes(m_max_memory) + " under noeviction");
        return status_out_of_memory;
    }

    size_t target = m_max_memory - m_max_memory / 10;
    while (usage > target && ks.size() > 0 && m_last_evictions < MAX_EVICTIONS_PER_ROUND)
    {
        auto victim = select_victim(ks, keep);
        if (!victim)
            break;

        auto it = ks.data().find(*victim);
        if (it == ks.data().end())
            break;

        size_t freed = estimate_entry_size(it->first, it->second, ks.has_expiry(*victim));
        // del() also drops the victim's tracking entry
        ks.del(*victim);

        usage = freed > usage ? 0 : usage - freed;
        ++m_last_evictions;
    }

    if (m_last_evictions > 0)
        LOG_DEBUG("evicted " + std::to_string(m_last_evictions) + " keys (" +
                  policy_name(m_policy) + "), usage now " + format_bytes(usage));

    return status_ok;
}

std::optional<std::string> memory_manager::select_victim(const keyspace& ks,
                                                         std::optional<std::string_view> keep)
{
    switch (m_policy)
    {
        case evict_none:            return std::nullopt;
        case evict_allkeys_lru:     return find_lru_key(ks, false, keep);
        case evict_volatile_lru:    return find_lru_key(ks, true, keep);
        case evict_allkeys_lfu:     return find_lfu_key(ks, false, keep);
        case evict_volatile_lfu:    return find_lfu_key(ks, true, keep);
        case evict_allkeys_random:  return find_random_key(ks, false, keep);
        case evict_volatile_random: return find_random_key(ks, true, keep);
    }
    return std::nullopt;
}

std::optional<std::string> memory_manager::find_lru_key(const keyspace& ks, bool volatile_only,
                                                        std::optional<std::string_view> keep) const
{
    const std::string* best_key = nullptr;
    const access_info* best = nullptr;

    for_each_candidate(ks, volatile_only, keep, [&](const std::string& key) {
        auto it = m_access.find(key);
        if (it == m_access.end())
        {
            // Never accessed counts as the oldest possible
            best_key = &key;
            best = nullptr;
            return false;
        }

        const access_info& info = it->second;
        if (!best_key || info.last_access < best->last_access ||
            (info.last_access == best->last_access && info.sequence < best->sequence))
        {
            best_key = &key;
            best = &info;
        }
        return true;
    });

    if (!best_key)
        return std::nullopt;
    return *best_key;
}

std::optional<std::string> memory_manager::find_lfu_key(const keyspace& ks, bool volatile_only,
                                                        std::optional<std::string_view> keep) const
{
    const std::string* best_key = nullptr;
    const access_info* best = nullptr;

    for_each_candidate(ks, volatile_only, keep, [&](const std::string& key) {
        auto it = m_access.find(key);
        if (it == m_access.end())
        {
            best_key = &key;
            best = nullptr;
            return false;
        }

        const access_info& info = it->second;
        if (!best_key || info.access_count < best->access_count ||
            (info.access_count == best->access_count && info.sequence < best->sequence))
        {
            best_key = &key;
            best = &info;
        }
        return true;
    });

    if (!best_key)
        return std::nullopt;
    return *best_key;
}

std::optional<std::string> memory_manager::find_random_key(const keyspace& ks, bool volatile_only,
                                                           std::optional<std::string_view> keep)
{
    std::vector<const std::string*> candidates;
    candidates.reserve(volatile_only ? ks.expiries().size() : ks.size());
    for_each_candidate(ks, volatile_only, keep, [&](const std::string& key) {
        candidates.push_back(&key);
        return true;
    });

    if (candidates.empty())
        return std::nullopt;

    std::uniform_int_distribution<size_t> dist(0, candidates.size() - 1);
    return *candidates[dist(m_rng)];
}

// --- Introspection ---

std::vector<std::pair<std::string, std::string>> memory_manager::memory_info(const keyspace& ks) const
{
    size_t used = estimate_memory_usage(ks);

    std::vector<std::pair<std::string, std::string>> info;
    info.reserve(7);
    info.emplace_back("used_memory", std::to_string(used));
    info.emplace_back("used_memory_human", format_bytes(used));

    if (m_max_memory > 0)
    {
        char pct[32];
        std::snprintf(pct, sizeof(pct), "%.2f%%",
            static_cast<double>(used) / static_cast<double>(m_max_memory) * 100.0);
        info.emplace_back("maxmemory", std::to_string(m_max_memory));
        info.emplace_back("maxmemory_human", format_bytes(m_max_memory));
        info.emplace_back("used_memory_percentage", pct);
    }
    else
    {
        info.emplace_back("maxmemory", "0");
        info.emplace_back("maxmemory_human", "unlimited");
        info.emplace_back("used_memory_percentage", "N/A");
    }

    info.emplace_back("maxmemory_policy", policy_name(m_policy));
    info.emplace_back("total_keys", std::to_string(ks.size()));
    return info;
}
