#include "dispatcher.h"
#include "../shared/logging.h"

#include <algorithm>
#include <charconv>
#include <climits>
#include <mutex>
#include <shared_mutex>

namespace
{
    // Constant-time string compare to prevent timing attacks on password
    bool constant_time_eq(std::string_view a, std::string_view b)
    {
        if (a.size() != b.size())
        {
            // Still do work proportional to max size to avoid length leak
            volatile uint8_t dummy = 0;
            for (size_t i = 0; i < std::max(a.size(), b.size()); i++)
                dummy = dummy | 0;
            (void)dummy;
            return false;
        }
        volatile uint8_t diff = 0;
        for (size_t i = 0; i < a.size(); i++)
            diff = diff | (static_cast<uint8_t>(a[i]) ^ static_cast<uint8_t>(b[i]));
        return diff == 0;
    }

    bool parse_i64(std::string_view sv, int64_t& out)
    {
        auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), out);
        return !sv.empty() && ec == std::errc{} && ptr == sv.data() + sv.size();
    }

    reply status_error(op_status st)
    {
        switch (st)
        {
            case status_wrong_type:
                return reply::make_error("WRONGTYPE Operation against a key holding the wrong kind of value");
            case status_out_of_memory:
                return reply::make_error("OOM command not allowed when used memory > 'maxmemory'.");
            case status_not_integer:
                return reply::make_error("ERR value is not an integer or out of range");
            case status_ok:
                break;
        }
        return reply::ok();
    }

    reply not_integer()
    {
        return status_error(status_not_integer);
    }

    bool allowed_in_subscriber_mode(command_kind kind)
    {
        switch (kind)
        {
            case cmd_subscribe:
            case cmd_unsubscribe:
            case cmd_psubscribe:
            case cmd_punsubscribe:
            case cmd_ping:
            case cmd_quit:
                return true;
            default:
                return false;
        }
    }

    std::string lower(std::string_view s)
    {
        std::string out(s);
        for (auto& c : out)
            c = ascii_lower(c);
        return out;
    }
}

dispatcher::dispatcher(keyspace_handle ks, pubsub_handle pubsub,
                       std::shared_ptr<snapshot> snap, std::string requirepass)
    : m_keyspace(std::move(ks))
    , m_pubsub(std::move(pubsub))
    , m_snapshot(std::move(snap))
    , m_requirepass(std::move(requirepass))
    , m_started(std::chrono::steady_clock::now())
{
}

reply dispatcher::execute_line(session& s, std::string_view line)
{
    command cmd;
    parse_error err = parse_command(line, cmd);
    if (err == parse_empty)
        return reply::make_batch({});
    if (err != parse_ok)
        return reply::make_error(parse_error_message(err, cmd));
    return execute(s, cmd);
}

reply dispatcher::execute(session& s, const command& cmd)
{
    if (!m_requirepass.empty() && !s.authenticated &&
        cmd.kind != cmd_auth && cmd.kind != cmd_quit)
        return reply::make_error("NOAUTH Authentication required.");

    if (s.in_subscriber_mode() && !allowed_in_subscriber_mode(cmd.kind))
        return reply::make_error("ERR Can't execute '" + lower(cmd.name) +
            "': only (P)SUBSCRIBE / (P)UNSUBSCRIBE / PING / QUIT are allowed in this context");

    switch (cmd.kind)
    {
        case cmd_ping:
            if (cmd.args.empty())
                return reply::make_status("PONG");
            return reply::make_bulk(cmd.args[0]);

        case cmd_echo:
            return reply::make_bulk(cmd.args[0]);

        case cmd_auth:
            if (m_requirepass.empty())
                return reply::make_error("ERR Client sent AUTH, but no password is set");
            if (!constant_time_eq(cmd.args[0], m_requirepass))
            {
                s.authenticated = false;
                LOG_DEBUG("auth: invalid password");
                return reply::make_error("ERR invalid password");
            }
            s.authenticated = true;
            return reply::ok();

        case cmd_quit:
            s.quit = true;
            return reply::ok();

        default:
            break;
    }

    if (cmd.kind >= cmd_get && cmd.kind <= cmd_hlen)
        return exec_keyspace(cmd);
    if (cmd.kind >= cmd_flushall && cmd.kind <= cmd_recover_from_backup)
        return exec_server(cmd);
    if (cmd.kind >= cmd_publish && cmd.kind <= cmd_pubsub)
        return exec_pubsub(s, cmd);

    return reply::make_error("ERR unknown command '" + cmd.name + "'");
}

void dispatcher::end_session(session& s)
{
    if (s.sub_id != 0)
        m_pubsub->remove_subscriber(s.sub_id);
    s.sub_id = 0;
    s.subscriptions = 0;
    s.receiver.reset();
}

// ─── Keyspace ───

reply dispatcher::exec_keyspace(const command& cmd)
{
    // Every keyspace command may lazily expire, so all take the writer side
    std::unique_lock lock(m_keyspace->mutex);
    keyspace& ks = m_keyspace->store;
    const auto& args = cmd.args;

    // KEYS is the only keyspace command whose first argument is optional
    if (cmd.kind == cmd_keys)
    {
        auto keys = ks.keys(args.empty() ? std::string_view("*") : std::string_view(args[0]));
        std::sort(keys.begin(), keys.end());
        return reply::bulk_array(keys);
    }

    const std::string& key = args[0];

    switch (cmd.kind)
    {
        case cmd_get:
        {
            auto v = ks.get(key);
            if (!v)
                return reply::make_nil();
            if (auto* str = std::get_if<std::string>(&*v))
                return reply::make_bulk(std::move(*str));
            if (auto* i = std::get_if<int64_t>(&*v))
                return reply::make_integer(*i);
            return status_error(status_wrong_type);
        }
        case cmd_set:
            return status_error(ks.set(key, value{args[1]}));

        case cmd_setex:
        {
            int64_t secs;
            if (!parse_i64(args[1], secs))
                return not_integer();
            if (secs <= 0)
                return reply::make_error("ERR invalid expire time in 'setex' command");
            return status_error(ks.set_with_expiry(key, value{args[2]}, std::chrono::seconds(secs)));
        }
        case cmd_del:
        {
            int64_t count = 0;
            for (const auto& k : args)
                if (ks.del(k))
                    ++count;
            return reply::make_integer(count);
        }
        case cmd_exists:
        {
            int64_t count = 0;
            for (const auto& k : args)
                if (ks.exists(k))
                    ++count;
            return reply::make_integer(count);
        }
        case cmd_incr:
        case cmd_decr:
        case cmd_incrby:
        case cmd_decrby:
        {
            int64_t delta = 1;
            if (cmd.kind == cmd_incrby || cmd.kind == cmd_decrby)
            {
                if (!parse_i64(args[1], delta))
                    return not_integer();
            }
            if (cmd.kind == cmd_decr || cmd.kind == cmd_decrby)
            {
                if (delta == INT64_MIN)
                    return not_integer();
                delta = -delta;
            }
            int64_t result = 0;
            op_status st = ks.incr_by(key, delta, result);
            if (st != status_ok)
                return status_error(st);
            return reply::make_integer(result);
        }
        case cmd_type:
        {
            auto t = ks.type(key);
            return reply::make_status(t ? type_name(*t) : "none");
        }
        case cmd_expire:
        {
            int64_t secs;
            if (!parse_i64(args[1], secs))
                return not_integer();
            // A non-positive TTL expires the key immediately
            if (secs <= 0)
                return reply::make_integer(ks.del(key) ? 1 : 0);
            return reply::make_integer(ks.expire(key, std::chrono::seconds(secs)) ? 1 : 0);
        }
        case cmd_persist:
            return reply::make_integer(ks.persist(key) ? 1 : 0);

        case cmd_ttl:
        {
            auto remaining = ks.ttl(key);
            if (!remaining)
                return reply::make_integer(-2);
            if (*remaining == keyspace::no_expiry)
                return reply::make_integer(-1);
            return reply::make_integer((remaining->count() + 500) / 1000);
        }

        // ─── Lists ───

        case cmd_lpush:
        case cmd_rpush:
        {
            std::vector<std::string> vals(args.begin() + 1, args.end());
            size_t len = 0;
            op_status st = cmd.kind == cmd_lpush ? ks.lpush(key, vals, len) : ks.rpush(key, vals, len);
            if (st != status_ok)
                return status_error(st);
            return reply::make_integer(static_cast<int64_t>(len));
        }
        case cmd_lpop:
        case cmd_rpop:
        {
            std::optional<std::string> out;
            op_status st = cmd.kind == cmd_lpop ? ks.lpop(key, out) : ks.rpop(key, out);
            if (st != status_ok)
                return status_error(st);
            return out ? reply::make_bulk(std::move(*out)) : reply::make_nil();
        }
        case cmd_llen:
        {
            size_t len = 0;
            op_status st = ks.llen(key, len);
            if (st != status_ok)
                return status_error(st);
            return reply::make_integer(static_cast<int64_t>(len));
        }
        case cmd_lrange:
        {
            int64_t start, stop;
            if (!parse_i64(args[1], start) || !parse_i64(args[2], stop))
                return not_integer();
            std::vector<std::string> out;
            op_status st = ks.lrange(key, start, stop, out);
            if (st != status_ok)
                return status_error(st);
            return reply::bulk_array(out);
        }

        // ─── Sets ───

        case cmd_sadd:
        case cmd_srem:
        {
            std::vector<std::string> members(args.begin() + 1, args.end());
            size_t changed = 0;
            op_status st = cmd.kind == cmd_sadd ? ks.sadd(key, members, changed)
                                                : ks.srem(key, members, changed);
            if (st != status_ok)
                return status_error(st);
            return reply::make_integer(static_cast<int64_t>(changed));
        }
        case cmd_smembers:
        {
            std::vector<std::string> out;
            op_status st = ks.smembers(key, out);
            if (st != status_ok)
                return status_error(st);
            return reply::bulk_array(out);
        }
        case cmd_scard:
        {
            size_t n = 0;
            op_status st = ks.scard(key, n);
            if (st != status_ok)
                return status_error(st);
            return reply::make_integer(static_cast<int64_t>(n));
        }
        case cmd_sismember:
        {
            bool member = false;
            op_status st = ks.sismember(key, args[1], member);
            if (st != status_ok)
                return status_error(st);
            return reply::make_integer(member ? 1 : 0);
        }

        // ─── Hashes ───

        case cmd_hset:
        {
            std::vector<field_pair> pairs;
            for (size_t i = 1; i + 1 < args.size(); i += 2)
                pairs.emplace_back(args[i], args[i + 1]);
            size_t created = 0;
            op_status st = ks.hset(key, pairs, created);
            if (st != status_ok)
                return status_error(st);
            return reply::make_integer(static_cast<int64_t>(created));
        }
        case cmd_hget:
        {
            std::optional<std::string> out;
            op_status st = ks.hget(key, args[1], out);
            if (st != status_ok)
                return status_error(st);
            return out ? reply::make_bulk(std::move(*out)) : reply::make_nil();
        }
        case cmd_hdel:
        {
            std::vector<std::string> fields(args.begin() + 1, args.end());
            size_t removed = 0;
            op_status st = ks.hdel(key, fields, removed);
            if (st != status_ok)
                return status_error(st);
            return reply::make_integer(static_cast<int64_t>(removed));
        }
        case cmd_hgetall:
        {
            std::vector<field_pair> pairs;
            op_status st = ks.hgetall(key, pairs);
            if (st != status_ok)
                return status_error(st);
            std::vector<reply> items;
            items.reserve(pairs.size() * 2);
            for (auto& [field, val] : pairs)
            {
                items.push_back(reply::make_bulk(std::move(field)));
                items.push_back(reply::make_bulk(std::move(val)));
            }
            return reply::make_array(std::move(items));
        }
        case cmd_hkeys:
        case cmd_hvals:
        {
            std::vector<std::string> out;
            op_status st = cmd.kind == cmd_hkeys ? ks.hkeys(key, out) : ks.hvals(key, out);
            if (st != status_ok)
                return status_error(st);
            return reply::bulk_array(out);
        }
        case cmd_hlen:
        {
            size_t n = 0;
            op_status st = ks.hlen(key, n);
            if (st != status_ok)
                return status_error(st);
            return reply::make_integer(static_cast<int64_t>(n));
        }

        default:
            return reply::make_error("ERR unknown command '" + cmd.name + "'");
    }
}

// ─── Server ───

std::string dispatcher::info_text()
{
    std::string out;
    auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - m_started).count();

    out.append("# Server\n");
    out.append("emberkv_version:").append(EMBERKV_VERSION).append("\n");
    out.append("uptime_in_seconds:").append(std::to_string(uptime)).append("\n");

    size_t keys = 0, expires = 0;
    {
        std::shared_lock lock(m_keyspace->mutex);
        const keyspace& ks = m_keyspace->store;
        out.append("# Memory\n");
        for (const auto& [name, val] : ks.memory().memory_info(ks))
            out.append(name).append(":").append(val).append("\n");
        keys = ks.size();
        expires = ks.expiries().size();
    }

    if (m_snapshot)
    {
        out.append("# Persistence\n");
        out.append("dbfilename:").append(m_snapshot->path()).append("\n");
    }

    out.append("# Keyspace\n");
    out.append("db0:keys=").append(std::to_string(keys))
       .append(",expires=").append(std::to_string(expires)).append("\n");

    out.append("# Pubsub\n");
    out.append("pubsub_channels:").append(std::to_string(m_pubsub->channels().size())).append("\n");
    out.append("pubsub_patterns:").append(std::to_string(m_pubsub->numpat())).append("\n");
    return out;
}

reply dispatcher::exec_server(const command& cmd)
{
    switch (cmd.kind)
    {
        case cmd_flushall:
        {
            std::unique_lock lock(m_keyspace->mutex);
            m_keyspace->store.clear();
            return reply::ok();
        }
        case cmd_dbsize:
        {
            std::shared_lock lock(m_keyspace->mutex);
            return reply::make_integer(static_cast<int64_t>(m_keyspace->store.size()));
        }
        case cmd_info:
            return reply::make_text(info_text());

        case cmd_memory:
        {
            std::shared_lock lock(m_keyspace->mutex);
            const keyspace& ks = m_keyspace->store;
            std::string out;
            for (const auto& [name, val] : ks.memory().memory_info(ks))
                out.append(name).append(":").append(val).append("\n");
            return reply::make_text(std::move(out));
        }
        case cmd_save:
        {
            if (!m_snapshot)
                return reply::make_error("ERR persistence is disabled");

            std::string bytes;
            size_t keys = 0;
            {
                std::shared_lock lock(m_keyspace->mutex);
                bytes = snapshot::encode(m_keyspace->store);
                keys = m_keyspace->store.size();
            }
            snapshot_error err = m_snapshot->write_atomic(bytes);
            if (err != snap_none)
                return reply::make_error(std::string("ERR snapshot failed: ") + snapshot_error_name(err));
            LOG_INFO("snapshot saved (" + std::to_string(keys) + " keys)");
            return reply::ok();
        }
        case cmd_verify_integrity:
        {
            if (!m_snapshot)
                return reply::make_error("ERR persistence is disabled");
            if (!m_snapshot->verify_integrity())
                return reply::make_error("ERR snapshot integrity check failed");
            return reply::ok();
        }
        case cmd_recover_from_backup:
        {
            if (!m_snapshot)
                return reply::make_error("ERR persistence is disabled");

            snapshot_error err = m_snapshot->recover_from_backup(*m_keyspace);
            if (err != snap_none)
                return reply::make_error(std::string("ERR backup recovery failed: ") + snapshot_error_name(err));
            return reply::ok();
        }
        default:
            return reply::make_error("ERR unknown command '" + cmd.name + "'");
    }
}

// ─── Pub/Sub ───

reply dispatcher::subscribe(session& s, const command& cmd, bool pattern)
{
    if (s.sub_id == 0)
    {
        auto [id, receiver] = m_pubsub->create_subscriber();
        s.sub_id = id;
        s.receiver = std::move(receiver);
    }

    std::vector<reply> acks;
    acks.reserve(cmd.args.size());
    for (const auto& name : cmd.args)
    {
        s.subscriptions = pattern ? m_pubsub->psubscribe(s.sub_id, name)
                                  : m_pubsub->subscribe(s.sub_id, name);
        acks.push_back(reply::make_array({
            reply::make_bulk(pattern ? "psubscribe" : "subscribe"),
            reply::make_bulk(name),
            reply::make_integer(static_cast<int64_t>(s.subscriptions))
        }));
    }
    return reply::make_batch(std::move(acks));
}

reply dispatcher::unsubscribe(session& s, const command& cmd, bool pattern)
{
    const char* kind = pattern ? "punsubscribe" : "unsubscribe";

    std::vector<std::string> names = cmd.args;
    if (names.empty() && s.sub_id != 0)
        names = pattern ? m_pubsub->subscribed_patterns(s.sub_id)
                        : m_pubsub->subscribed_channels(s.sub_id);

    if (names.empty())
    {
        return reply::make_array({
            reply::make_bulk(kind),
            reply::make_nil(),
            reply::make_integer(static_cast<int64_t>(s.subscriptions))
        });
    }

    std::vector<reply> acks;
    acks.reserve(names.size());
    for (auto& name : names)
    {
        if (s.sub_id != 0)
            s.subscriptions = pattern ? m_pubsub->punsubscribe(s.sub_id, name)
                                      : m_pubsub->unsubscribe(s.sub_id, name);
        acks.push_back(reply::make_array({
            reply::make_bulk(kind),
            reply::make_bulk(std::move(name)),
            reply::make_integer(static_cast<int64_t>(s.subscriptions))
        }));
    }
    return reply::make_batch(std::move(acks));
}

reply dispatcher::exec_pubsub(session& s, const command& cmd)
{
    switch (cmd.kind)
    {
        case cmd_publish:
            return reply::make_integer(static_cast<int64_t>(m_pubsub->publish(cmd.args[0], cmd.args[1])));

        case cmd_subscribe:    return subscribe(s, cmd, false);
        case cmd_psubscribe:   return subscribe(s, cmd, true);
        case cmd_unsubscribe:  return unsubscribe(s, cmd, false);
        case cmd_punsubscribe: return unsubscribe(s, cmd, true);

        case cmd_pubsub:
        {
            const auto& sub = cmd.args[0];
            if (sub == "CHANNELS")
                return reply::bulk_array(m_pubsub->channels(cmd.args.size() > 1 ? cmd.args[1] : std::string_view{}));
            if (sub == "NUMSUB")
            {
                std::vector<reply> items;
                for (size_t i = 1; i < cmd.args.size(); ++i)
                {
                    items.push_back(reply::make_bulk(cmd.args[i]));
                    items.push_back(reply::make_integer(static_cast<int64_t>(m_pubsub->numsub(cmd.args[i]))));
                }
                return reply::make_array(std::move(items));
            }
            return reply::make_integer(static_cast<int64_t>(m_pubsub->numpat()));
        }
        default:
            return reply::make_error("ERR unknown command '" + cmd.name + "'");
    }
}
