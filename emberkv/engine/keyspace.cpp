#include "keyspace.h"

#include <algorithm>
#include <charconv>
#include <type_traits>
#include <fnmatch.h>

// --- Expiry bookkeeping ---

bool keyspace::expire_if_due(std::string_view key)
{
    // Fast early-out: most workloads have no TTLs at all
    if (__builtin_expect(m_expiry.empty(), 1))
        return false;

    auto eit = m_expiry.find(key);
    if (eit == m_expiry.end())
        return false;

    if (now() < eit->second)
        return false;

    m_expiry.erase(eit);
    m_memory.remove_tracking(key);
    if (auto it = m_data.find(key); it != m_data.end())
        m_data.erase(it);
    return true;
}

void keyspace::erase_entry(data_map::iterator it)
{
    m_expiry.erase(it->first);
    m_memory.remove_tracking(it->first);
    m_data.erase(it);
}

template<typename T>
T* keyspace::find_typed(std::string_view key, op_status& status)
{
    status = status_ok;
    expire_if_due(key);

    auto it = m_data.find(key);
    if (it == m_data.end())
        return nullptr;

    T* ptr = std::get_if<T>(&it->second);
    if (!ptr)
        status = status_wrong_type;
    return ptr;
}

template<typename T>
T* keyspace::find_or_create(std::string_view key, op_status& status)
{
    T* ptr = find_typed<T>(key, status);
    if (ptr || status != status_ok)
        return ptr;

    auto [it, _] = m_data.emplace(std::string(key), value{T{}});
    return std::get_if<T>(&it->second);
}

void keyspace::drop_if_empty(std::string_view key)
{
    auto it = m_data.find(key);
    if (it == m_data.end())
        return;

    bool empty = std::visit([](const auto& v) -> bool {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, list_value> || std::is_same_v<T, set_value> ||
                      std::is_same_v<T, hash_value>)
            return v.empty();
        else
            return false;
    }, it->second);

    if (empty)
        erase_entry(it);
}

// --- Core ---

std::optional<value> keyspace::get(std::string_view key)
{
    if (expire_if_due(key))
        return std::nullopt;

    auto it = m_data.find(key);
    if (it == m_data.end())
        return std::nullopt;

    m_memory.track_access(key);
    return it->second;
}

op_status keyspace::set(std::string_view key, value v)
{
    op_status status = m_memory.enforce_budget(*this);
    if (status != status_ok)
        return status;

    auto it = m_data.find(key);
    if (it != m_data.end())
        it->second = std::move(v);
    else
        m_data.emplace(std::string(key), std::move(v));

    if (auto eit = m_expiry.find(key); eit != m_expiry.end())
        m_expiry.erase(eit);
    m_memory.track_access(key);

    if (m_memory.get_eviction() != evict_none)
        m_memory.enforce_budget(*this, key);
    return status_ok;
}

op_status keyspace::set_with_expiry(std::string_view key, value v, std::chrono::milliseconds ttl)
{
    op_status status = m_memory.enforce_budget(*this);
    if (status != status_ok)
        return status;

    auto deadline = now() + ttl;

    auto it = m_data.find(key);
    if (it != m_data.end())
        it->second = std::move(v);
    else
        m_data.emplace(std::string(key), std::move(v));

    if (auto eit = m_expiry.find(key); eit != m_expiry.end())
        eit->second = deadline;
    else
        m_expiry.emplace(std::string(key), deadline);

    m_memory.track_access(key);

    if (m_memory.get_eviction() != evict_none)
        m_memory.enforce_budget(*this, key);
    return status_ok;
}

bool keyspace::del(std::string_view key)
{
    if (expire_if_due(key))
        return false;

    auto it = m_data.find(key);
    if (it == m_data.end())
        return false;

    erase_entry(it);
    return true;
}

bool keyspace::exists(std::string_view key)
{
    if (expire_if_due(key))
        return false;
    return m_data.find(key) != m_data.end();
}

bool keyspace::expire(std::string_view key, std::chrono::milliseconds ttl)
{
    if (expire_if_due(key))
        return false;
    if (m_data.find(key) == m_data.end())
        return false;

    auto deadline = now() + ttl;
    if (auto eit = m_expiry.find(key); eit != m_expiry.end())
        eit->second = deadline;
    else
        m_expiry.emplace(std::string(key), deadline);
    return true;
}

bool keyspace::persist(std::string_view key)
{
    if (expire_if_due(key))
        return false;

    auto eit = m_expiry.find(key);
    if (eit == m_expiry.end())
        return false;

    m_expiry.erase(eit);
    return true;
}

std::optional<std::chrono::milliseconds> keyspace::ttl(std::string_view key)
{
    if (expire_if_due(key))
        return std::nullopt;
    if (m_data.find(key) == m_data.end())
        return std::nullopt;

    auto eit = m_expiry.find(key);
    if (eit == m_expiry.end())
        return no_expiry;

    return std::chrono::duration_cast<std::chrono::milliseconds>(eit->second - now());
}

std::optional<value_type> keyspace::type(std::string_view key)
{
    if (expire_if_due(key))
        return std::nullopt;

    auto it = m_data.find(key);
    if (it == m_data.end())
        return std::nullopt;
    return type_of(it->second);
}

std::vector<std::string> keyspace::keys() const
{
    return keys("*");
}

std::vector<std::string> keyspace::keys(std::string_view pattern) const
{
    bool match_all = (pattern.empty() || pattern == "*");
    // fnmatch requires null-terminated strings
    std::string pat_str(pattern);
    auto current = now();

    std::vector<std::string> out;
    out.reserve(match_all ? m_data.size() : 0);
    for (const auto& [key, _] : m_data)
    {
        if (auto eit = m_expiry.find(key); eit != m_expiry.end() && current >= eit->second)
            continue;
        if (match_all || fnmatch(pat_str.c_str(), key.c_str(), 0) == 0)
            out.push_back(key);
    }
    return out;
}

void keyspace::clear()
{
    m_data.clear();
    m_expiry.clear();
    m_memory.clear_tracking();
}

// --- Integers ---

op_status keyspace::incr_by(std::string_view key, int64_t delta, int64_t& result)
{
    expire_if_due(key);
    op_status status = m_memory.enforce_budget(*this);
    if (status != status_ok)
        return status;

    int64_t current = 0;
    auto it = m_data.find(key);
    if (it != m_data.end())
    {
        if (auto* i = std::get_if<int64_t>(&it->second))
        {
            current = *i;
        }
        else if (auto* s = std::get_if<std::string>(&it->second))
        {
            auto [ptr, ec] = std::from_chars(s->data(), s->data() + s->size(), current);
            if (ec != std::errc{} || ptr != s->data() + s->size() || s->empty())
                return status_not_integer;
        }
        else
        {
            return status_wrong_type;
        }
    }

    if (__builtin_add_overflow(current, delta, &result))
        return status_not_integer;

    if (it != m_data.end())
        it->second = result;
    else
        m_data.emplace(std::string(key), value{result});
    m_memory.track_access(key);

    if (m_memory.get_eviction() != evict_none)
        m_memory.enforce_budget(*this, key);
    return status_ok;
}

// --- Lists ---

op_status keyspace::push(std::string_view key, const std::vector<std::string>& vals, bool front, size_t& len)
{
    len = 0;
    expire_if_due(key);
    op_status status = m_memory.enforce_budget(*this);
    if (status != status_ok)
        return status;

    list_value* list = find_or_create<list_value>(key, status);
    if (!list)
        return status;

    for (const auto& v : vals)
    {
        if (front)
            list->push_front(v);
        else
            list->push_back(v);
    }
    len = list->size();
    m_memory.track_access(key);

    if (m_memory.get_eviction() != evict_none)
        m_memory.enforce_budget(*this, key);
    return status_ok;
}

op_status keyspace::lpush(std::string_view key, const std::vector<std::string>& vals, size_t& len)
{
    return push(key, vals, true, len);
}

op_status keyspace::rpush(std::string_view key, const std::vector<std::string>& vals, size_t& len)
{
    return push(key, vals, false, len);
}

op_status keyspace::pop(std::string_view key, bool front, std::optional<std::string>& out)
{
    out.reset();
    op_status status;
    list_value* list = find_typed<list_value>(key, status);
    if (!list || list->empty())
        return status;

    if (front)
    {
        out = std::move(list->front());
        list->pop_front();
    }
    else
    {
        out = std::move(list->back());
        list->pop_back();
    }
    m_memory.track_access(key);
    drop_if_empty(key);
    return status_ok;
}

op_status keyspace::lpop(std::string_view key, std::optional<std::string>& out)
{
    return pop(key, true, out);
}

op_status keyspace::rpop(std::string_view key, std::optional<std::string>& out)
{
    return pop(key, false, out);
}

op_status keyspace::llen(std::string_view key, size_t& out)
{
    op_status status;
    const list_value* list = find_typed<list_value>(key, status);
    out = list ? list->size() : 0;
    if (list)
        m_memory.track_access(key);
    return status;
}

op_status keyspace::lrange(std::string_view key, int64_t start, int64_t stop, std::vector<std::string>& out)
{
    out.clear();
    op_status status;
    const list_value* list = find_typed<list_value>(key, status);
    if (!list)
        return status;

    m_memory.track_access(key);

    auto n = static_cast<int64_t>(list->size());
    if (start < 0) start += n;
    if (stop < 0) stop += n;
    if (start < 0) start = 0;
    if (stop >= n) stop = n - 1;
    if (start > stop || start >= n)
        return status_ok;

    out.reserve(static_cast<size_t>(stop - start + 1));
    for (int64_t i = start; i <= stop; ++i)
        out.push_back((*list)[static_cast<size_t>(i)]);
    return status_ok;
}

// --- Sets ---

op_status keyspace::sadd(std::string_view key, const std::vector<std::string>& members, size_t& added)
{
    added = 0;
    expire_if_due(key);
    op_status status = m_memory.enforce_budget(*this);
    if (status != status_ok)
        return status;

    set_value* set = find_or_create<set_value>(key, status);
    if (!set)
        return status;

    for (const auto& m : members)
        if (set->insert(m).second)
            ++added;
    m_memory.track_access(key);

    if (m_memory.get_eviction() != evict_none)
        m_memory.enforce_budget(*this, key);
    return status_ok;
}

op_status keyspace::srem(std::string_view key, const std::vector<std::string>& members, size_t& removed)
{
    removed = 0;
    op_status status;
    set_value* set = find_typed<set_value>(key, status);
    if (!set)
        return status;

    for (const auto& m : members)
    {
        if (auto it = set->find(m); it != set->end())
        {
            set->erase(it);
            ++removed;
        }
    }
    m_memory.track_access(key);
    drop_if_empty(key);
    return status_ok;
}

op_status keyspace::smembers(std::string_view key, std::vector<std::string>& out)
{
    out.clear();
    op_status status;
    const set_value* set = find_typed<set_value>(key, status);
    if (!set)
        return status;

    out.assign(set->begin(), set->end());
    std::sort(out.begin(), out.end());
    m_memory.track_access(key);
    return status_ok;
}

op_status keyspace::scard(std::string_view key, size_t& out)
{
    op_status status;
    const set_value* set = find_typed<set_value>(key, status);
    out = set ? set->size() : 0;
    if (set)
        m_memory.track_access(key);
    return status;
}

op_status keyspace::sismember(std::string_view key, std::string_view member, bool& out)
{
    op_status status;
    const set_value* set = find_typed<set_value>(key, status);
    out = set && set->find(member) != set->end();
    if (set)
        m_memory.track_access(key);
    return status;
}

// --- Hashes ---

op_status keyspace::hset(std::string_view key, const std::vector<field_pair>& pairs, size_t& created)
{
    created = 0;
    expire_if_due(key);
    op_status status = m_memory.enforce_budget(*this);
    if (status != status_ok)
        return status;

    hash_value* hash = find_or_create<hash_value>(key, status);
    if (!hash)
        return status;

    for (const auto& [field, val] : pairs)
    {
        auto it = hash->find(field);
        if (it != hash->end())
        {
            it->second = val;
        }
        else
        {
            hash->emplace(field, val);
            ++created;
        }
    }
    m_memory.track_access(key);

    if (m_memory.get_eviction() != evict_none)
        m_memory.enforce_budget(*this, key);
    return status_ok;
}

op_status keyspace::hget(std::string_view key, std::string_view field, std::optional<std::string>& out)
{
    out.reset();
    op_status status;
    const hash_value* hash = find_typed<hash_value>(key, status);
    if (!hash)
        return status;

    if (auto it = hash->find(field); it != hash->end())
        out = it->second;
    m_memory.track_access(key);
    return status_ok;
}

op_status keyspace::hdel(std::string_view key, const std::vector<std::string>& fields, size_t& removed)
{
    removed = 0;
    op_status status;
    hash_value* hash = find_typed<hash_value>(key, status);
    if (!hash)
        return status;

    for (const auto& f : fields)
    {
        if (auto it = hash->find(f); it != hash->end())
        {
            hash->erase(it);
            ++removed;
        }
    }
    m_memory.track_access(key);
    drop_if_empty(key);
    return status_ok;
}

op_status keyspace::hgetall(std::string_view key, std::vector<field_pair>& out)
{
    out.clear();
    op_status status;
    const hash_value* hash = find_typed<hash_value>(key, status);
    if (!hash)
        return status;

    out.assign(hash->begin(), hash->end());
    std::sort(out.begin(), out.end());
    m_memory.track_access(key);
    return status_ok;
}

op_status keyspace::hkeys(std::string_view key, std::vector<std::string>& out)
{
    std::vector<field_pair> pairs;
    op_status status = hgetall(key, pairs);
    out.clear();
    out.reserve(pairs.size());
    for (auto& [field, _] : pairs)
        out.push_back(std::move(field));
    return status;
}

op_status keyspace::hvals(std::string_view key, std::vector<std::string>& out)
{
    std::vector<field_pair> pairs;
    op_status status = hgetall(key, pairs);
    out.clear();
    out.reserve(pairs.size());
    for (auto& [_, val] : pairs)
        out.push_back(std::move(val));
    return status;
}

op_status keyspace::hlen(std::string_view key, size_t& out)
{
    op_status status;
    const hash_value* hash = find_typed<hash_value>(key, status);
    out = hash ? hash->size() : 0;
    if (hash)
        m_memory.track_access(key);
    return status;
}

// --- Snapshot / clock ---

void keyspace::restore(data_map data, expiry_map expiries)
{
    m_data = std::move(data);
    m_expiry.clear();
    for (auto& [key, deadline] : expiries)
        if (m_data.find(key) != m_data.end())
            m_expiry.emplace(key, deadline);
    m_memory.clear_tracking();
}

void keyspace::set_clock(clock_fn clock)
{
    m_clock = clock;
    m_memory.set_clock(std::move(clock));
}
