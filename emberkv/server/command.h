#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "../shared/command_hashing.h"

enum command_kind : uint8_t
{
    cmd_unknown = 0,

    // Connection
    cmd_ping, cmd_echo, cmd_auth, cmd_quit,

    // Keys and strings
    cmd_get, cmd_set, cmd_setex, cmd_del, cmd_exists,
    cmd_incr, cmd_decr, cmd_incrby, cmd_decrby,
    cmd_keys, cmd_type, cmd_expire, cmd_persist, cmd_ttl,

    // Lists
    cmd_lpush, cmd_rpush, cmd_lpop, cmd_rpop, cmd_llen, cmd_lrange,

    // Sets
    cmd_sadd, cmd_srem, cmd_smembers, cmd_scard, cmd_sismember,

    // Hashes
    cmd_hset, cmd_hget, cmd_hdel, cmd_hgetall, cmd_hkeys, cmd_hvals, cmd_hlen,

    // Server
    cmd_flushall, cmd_dbsize, cmd_info, cmd_memory,
    cmd_save, cmd_verify_integrity, cmd_recover_from_backup,

    // Pub/Sub
    cmd_publish, cmd_subscribe, cmd_unsubscribe, cmd_psubscribe, cmd_punsubscribe,
    cmd_pubsub
};

enum parse_error : uint8_t
{
    parse_ok                 = 0,
    parse_empty              = 1,
    parse_unknown_command    = 2,
    parse_wrong_arity        = 3,
    parse_unknown_subcommand = 4
};

// One tokenized request line. `name` is upper-cased; for PUBSUB the
// subcommand in args[0] is upper-cased too.
struct command
{
    command_kind kind{cmd_unknown};
    std::string name;
    std::vector<std::string> args;
};

// Splits on whitespace and checks arity. PUBLISH joins everything after the
// channel back into one message with single spaces.
parse_error parse_command(std::string_view line, command& out);

// "ERR unknown command 'FOO'" etc; empty for parse_ok / parse_empty
std::string parse_error_message(parse_error err, const command& cmd);
