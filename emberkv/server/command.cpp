#include "command.h"

#include <cctype>

namespace
{
    constexpr int UNBOUNDED = -1;

    struct command_arity
    {
        command_kind kind;
        int min_args;
        int max_args;
    };

    bool lookup(std::string_view name, command_arity& out)
    {
        switch (fnv1a_lower(name))
        {
            case fnv1a("ping"):         out = {cmd_ping, 0, 1}; return true;
            case fnv1a("echo"):         out = {cmd_echo, 1, 1}; return true;
            case fnv1a("auth"):         out = {cmd_auth, 1, 1}; return true;
            case fnv1a("quit"):         out = {cmd_quit, 0, 0}; return true;

            case fnv1a("get"):          out = {cmd_get, 1, 1}; return true;
            case fnv1a("set"):          out = {cmd_set, 2, 2}; return true;
            case fnv1a("setex"):        out = {cmd_setex, 3, 3}; return true;
            case fnv1a("del"):          out = {cmd_del, 1, UNBOUNDED}; return true;
            case fnv1a("exists"):       out = {cmd_exists, 1, UNBOUNDED}; return true;
            case fnv1a("incr"):         out = {cmd_incr, 1, 1}; return true;
            case fnv1a("decr"):         out = {cmd_decr, 1, 1}; return true;
            case fnv1a("incrby"):       out = {cmd_incrby, 2, 2}; return true;
            case fnv1a("decrby"):       out = {cmd_decrby, 2, 2}; return true;
            case fnv1a("keys"):         out = {cmd_keys, 0, 1}; return true;
            case fnv1a("type"):         out = {cmd_type, 1, 1}; return true;
            case fnv1a("expire"):       out = {cmd_expire, 2, 2}; return true;
            case fnv1a("persist"):      out = {cmd_persist, 1, 1}; return true;
            case fnv1a("ttl"):          out = {cmd_ttl, 1, 1}; return true;

            case fnv1a("lpush"):        out = {cmd_lpush, 2, UNBOUNDED}; return true;
            case fnv1a("rpush"):        out = {cmd_rpush, 2, UNBOUNDED}; return true;
            case fnv1a("lpop"):         out = {cmd_lpop, 1, 1}; return true;
            case fnv1a("rpop"):         out = {cmd_rpop, 1, 1}; return true;
            case fnv1a("llen"):         out = {cmd_llen, 1, 1}; return true;
            case fnv1a("lrange"):       out = {cmd_lrange, 3, 3}; return true;

            case fnv1a("sadd"):         out = {cmd_sadd, 2, UNBOUNDED}; return true;
            case fnv1a("srem"):         out = {cmd_srem, 2, UNBOUNDED}; return true;
            case fnv1a("smembers"):     out = {cmd_smembers, 1, 1}; return true;
            case fnv1a("scard"):        out = {cmd_scard, 1, 1}; return true;
            case fnv1a("sismember"):    out = {cmd_sismember, 2, 2}; return true;

            case fnv1a("hset"):         out = {cmd_hset, 3, UNBOUNDED}; return true;
            case fnv1a("hget"):         out = {cmd_hget, 2, 2}; return true;
            case fnv1a("hdel"):         out = {cmd_hdel, 2, UNBOUNDED}; return true;
            case fnv1a("hgetall"):      out = {cmd_hgetall, 1, 1}; return true;
            case fnv1a("hkeys"):        out = {cmd_hkeys, 1, 1}; return true;
            case fnv1a("hvals"):        out = {cmd_hvals, 1, 1}; return true;
            case fnv1a("hlen"):         out = {cmd_hlen, 1, 1}; return true;

            case fnv1a("flushall"):     out = {cmd_flushall, 0, 0}; return true;
            case fnv1a("dbsize"):       out = {cmd_dbsize, 0, 0}; return true;
            case fnv1a("info"):         out = {cmd_info, 0, 1}; return true;
            case fnv1a("memory"):       out = {cmd_memory, 0, 1}; return true;
            case fnv1a("save"):         out = {cmd_save, 0, 0}; return true;
            case fnv1a("verifyintegrity"):
            case fnv1a("verify"):       out = {cmd_verify_integrity, 0, 0}; return true;
            case fnv1a("recoverfrombackup"):
            case fnv1a("recover"):      out = {cmd_recover_from_backup, 0, 0}; return true;

            case fnv1a("publish"):      out = {cmd_publish, 2, UNBOUNDED}; return true;
            case fnv1a("subscribe"):    out = {cmd_subscribe, 1, UNBOUNDED}; return true;
            case fnv1a("unsubscribe"):  out = {cmd_unsubscribe, 0, UNBOUNDED}; return true;
            case fnv1a("psubscribe"):   out = {cmd_psubscribe, 1, UNBOUNDED}; return true;
            case fnv1a("punsubscribe"): out = {cmd_punsubscribe, 0, UNBOUNDED}; return true;
            case fnv1a("pubsub"):       out = {cmd_pubsub, 1, UNBOUNDED}; return true;

            default:
                return false;
        }
    }

    void to_upper(std::string& s)
    {
        for (auto& c : s)
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }

    std::string to_lower(std::string_view s)
    {
        std::string out(s);
        for (auto& c : out)
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        return out;
    }

    bool is_space(char c)
    {
        return c == ' ' || c == '\t' || c == '\r' || c == '\n';
    }
}

parse_error parse_command(std::string_view line, command& out)
{
    out.kind = cmd_unknown;
    out.name.clear();
    out.args.clear();

    std::vector<std::string_view> tokens;
    size_t i = 0;
    while (i < line.size())
    {
        while (i < line.size() && is_space(line[i]))
            ++i;
        size_t start = i;
        while (i < line.size() && !is_space(line[i]))
            ++i;
        if (i > start)
            tokens.push_back(line.substr(start, i - start));
    }

    if (tokens.empty())
        return parse_empty;

    out.name.assign(tokens[0]);
    to_upper(out.name);

    command_arity arity;
    if (!lookup(tokens[0], arity))
        return parse_unknown_command;
    out.kind = arity.kind;

    auto argc = static_cast<int>(tokens.size()) - 1;
    if (argc < arity.min_args || (arity.max_args != UNBOUNDED && argc > arity.max_args))
        return parse_wrong_arity;

    if (out.kind == cmd_publish)
    {
        std::string message;
        for (size_t t = 2; t < tokens.size(); ++t)
        {
            if (t > 2)
                message.push_back(' ');
            message.append(tokens[t]);
        }
        out.args.emplace_back(tokens[1]);
        out.args.push_back(std::move(message));
        return parse_ok;
    }

    out.args.reserve(tokens.size() - 1);
    for (size_t t = 1; t < tokens.size(); ++t)
        out.args.emplace_back(tokens[t]);

    // Field/value pairs must be complete
    if (out.kind == cmd_hset && (out.args.size() - 1) % 2 != 0)
        return parse_wrong_arity;

    if (out.kind == cmd_pubsub)
    {
        to_upper(out.args[0]);
        const auto& sub = out.args[0];
        if (sub == "CHANNELS")
            return out.args.size() <= 2 ? parse_ok : parse_wrong_arity;
        if (sub == "NUMSUB")
            return parse_ok;
        if (sub == "NUMPAT")
            return out.args.size() == 1 ? parse_ok : parse_wrong_arity;
        return parse_unknown_subcommand;
    }

    return parse_ok;
}

std::string parse_error_message(parse_error err, const command& cmd)
{
    switch (err)
    {
        case parse_ok:
        case parse_empty:
            return {};
        case parse_unknown_command:
            return "ERR unknown command '" + cmd.name + "'";
        case parse_wrong_arity:
            return "ERR wrong number of arguments for '" + to_lower(cmd.name) + "' command";
        case parse_unknown_subcommand:
            return "ERR unknown " + cmd.name + " subcommand '" +
                   (cmd.args.empty() ? std::string() : cmd.args[0]) + "'";
    }
    return "ERR syntax error";
}
