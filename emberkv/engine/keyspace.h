#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <utility>
#include <chrono>
#include <memory>
#include <shared_mutex>
#include <cstdint>

#include "value.h"
#include "memory_manager.h"

using field_pair = std::pair<std::string, std::string>;

// Key -> value mapping with lazy per-key expiry. Every successful read or
// write records an access with the co-located memory manager, and every
// removal path (delete, lazy expiry, eviction, clear) drops that tracking.
//
// Not thread-safe by itself; see shared_keyspace.
class keyspace
{
public:
    // ttl() result for a key that exists but has no deadline
    static constexpr std::chrono::milliseconds no_expiry{-1};

    keyspace()
    {
        m_data.reserve(1024);
    }

    // --- Core ---
    std::optional<value> get(std::string_view key);
    // Plain set drops any previous deadline
    op_status set(std::string_view key, value v);
    op_status set_with_expiry(std::string_view key, value v, std::chrono::milliseconds ttl);
    bool del(std::string_view key);
    bool exists(std::string_view key);
    bool expire(std::string_view key, std::chrono::milliseconds ttl);
    bool persist(std::string_view key);
    // Remaining time, no_expiry for persistent keys, nullopt if missing
    std::optional<std::chrono::milliseconds> ttl(std::string_view key);
    std::optional<value_type> type(std::string_view key);

    // Live keys only; expired entries are skipped but not removed
    std::vector<std::string> keys() const;
    std::vector<std::string> keys(std::string_view pattern) const;
    size_t size() const { return m_data.size(); }
    void clear();

    // --- Integers ---
    op_status incr_by(std::string_view key, int64_t delta, int64_t& result);

    // --- Lists ---
    op_status lpush(std::string_view key, const std::vector<std::string>& vals, size_t& len);
    op_status rpush(std::string_view key, const std::vector<std::string>& vals, size_t& len);
    op_status lpop(std::string_view key, std::optional<std::string>& out);
    op_status rpop(std::string_view key, std::optional<std::string>& out);
    op_status llen(std::string_view key, size_t& out);
    op_status lrange(std::string_view key, int64_t start, int64_t stop, std::vector<std::string>& out);

    // --- Sets ---
    op_status sadd(std::string_view key, const std::vector<std::string>& members, size_t& added);
    op_status srem(std::string_view key, const std::vector<std::string>& members, size_t& removed);
    op_status smembers(std::string_view key, std::vector<std::string>& out);
    op_status scard(std::string_view key, size_t& out);
    op_status sismember(std::string_view key, std::string_view member, bool& out);

    // --- Hashes ---
    op_status hset(std::string_view key, const std::vector<field_pair>& pairs, size_t& created);
    op_status hget(std::string_view key, std::string_view field, std::optional<std::string>& out);
    op_status hdel(std::string_view key, const std::vector<std::string>& fields, size_t& removed);
    op_status hgetall(std::string_view key, std::vector<field_pair>& out);
    op_status hkeys(std::string_view key, std::vector<std::string>& out);
    op_status hvals(std::string_view key, std::vector<std::string>& out);
    op_status hlen(std::string_view key, size_t& out);

    // --- Memory ---
    memory_manager& memory() { return m_memory; }
    const memory_manager& memory() const { return m_memory; }
    size_t memory_usage() const { return m_memory.estimate_memory_usage(*this); }

    // --- Snapshot access ---
    const data_map& data() const { return m_data; }
    const expiry_map& expiries() const { return m_expiry; }
    bool has_expiry(std::string_view key) const { return m_expiry.find(key) != m_expiry.end(); }
    // Replaces the whole contents. Restored keys carry no access history.
    void restore(data_map data, expiry_map expiries);

    void set_clock(clock_fn clock);
    engine_clock::time_point now() const
    {
        return m_clock ? m_clock() : engine_clock::now();
    }

private:
    // Removes the key if its deadline has passed; true if it was removed
    bool expire_if_due(std::string_view key);
    void erase_entry(data_map::iterator it);

    template<typename T>
    T* find_typed(std::string_view key, op_status& status);
    template<typename T>
    T* find_or_create(std::string_view key, op_status& status);
    void drop_if_empty(std::string_view key);

    op_status push(std::string_view key, const std::vector<std::string>& vals, bool front, size_t& len);
    op_status pop(std::string_view key, bool front, std::optional<std::string>& out);

    data_map m_data;
    expiry_map m_expiry;
    memory_manager m_memory;
    clock_fn m_clock;
};

// The single lock-guarded keyspace shared by every connection and the
// snapshot scheduler. Any call that may lazily expire takes the unique side.
struct shared_keyspace
{
    mutable std::shared_mutex mutex;
    keyspace store;
};

using keyspace_handle = std::shared_ptr<shared_keyspace>;

inline keyspace_handle make_shared_keyspace()
{
    return std::make_shared<shared_keyspace>();
}
