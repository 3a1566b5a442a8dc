#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include "../../emberkv/server/command.h"

TEST_CASE("FNV-1a basic correctness")
{
    CHECK(fnv1a("") != 0);
    CHECK(fnv1a("get") != fnv1a("set"));
    CHECK(fnv1a("get") != fnv1a("GET"));
    CHECK(fnv1a("hello") == fnv1a("hello"));
    // Published FNV-1a 32-bit vectors
    CHECK(fnv1a("") == 2166136261u);
    CHECK(fnv1a("a") == 0xe40c292cu);
    static_assert(fnv1a("foobar") == 0xbf9cf968u);
}

TEST_CASE("FNV-1a case-insensitive variant")
{
    CHECK(fnv1a_lower("GET") == fnv1a("get"));
    CHECK(fnv1a_lower("Del") == fnv1a("del"));
    CHECK(fnv1a_lower("HGETALL") == fnv1a("hgetall"));
    CHECK(fnv1a_lower("PSubscribe") == fnv1a("psubscribe"));
    CHECK(fnv1a_lower("user:1") == fnv1a("user:1"));
    CHECK(ascii_lower('Q') == 'q');
    CHECK(ascii_lower('@') == '@');
    CHECK(ascii_lower('[') == '[');
}

TEST_CASE("FNV-1a command names unique")
{
    uint32_t hashes[] = {
        fnv1a("ping"), fnv1a("echo"), fnv1a("auth"), fnv1a("quit"),
        fnv1a("get"), fnv1a("set"), fnv1a("setex"), fnv1a("del"), fnv1a("exists"),
        fnv1a("incr"), fnv1a("decr"), fnv1a("incrby"), fnv1a("decrby"),
        fnv1a("keys"), fnv1a("type"), fnv1a("expire"), fnv1a("persist"), fnv1a("ttl"),
        fnv1a("lpush"), fnv1a("rpush"), fnv1a("lpop"), fnv1a("rpop"), fnv1a("llen"), fnv1a("lrange"),
        fnv1a("sadd"), fnv1a("srem"), fnv1a("smembers"), fnv1a("scard"), fnv1a("sismember"),
        fnv1a("hset"), fnv1a("hget"), fnv1a("hdel"), fnv1a("hgetall"), fnv1a("hkeys"),
        fnv1a("hvals"), fnv1a("hlen"),
        fnv1a("flushall"), fnv1a("dbsize"), fnv1a("info"), fnv1a("memory"), fnv1a("save"),
        fnv1a("verifyintegrity"), fnv1a("verify"), fnv1a("recoverfrombackup"), fnv1a("recover"),
        fnv1a("publish"), fnv1a("subscribe"), fnv1a("unsubscribe"), fnv1a("psubscribe"),
        fnv1a("punsubscribe"), fnv1a("pubsub")
    };

    size_t count = sizeof(hashes) / sizeof(hashes[0]);
    for (size_t i = 0; i < count; i++)
        for (size_t j = i + 1; j < count; j++)
            CHECK(hashes[i] != hashes[j]);
}

TEST_CASE("parse_command tokenizing")
{
    command cmd;

    SUBCASE("name is upper-cased, args kept verbatim")
    {
        REQUIRE(parse_command("set Key Value", cmd) == parse_ok);
        CHECK(cmd.kind == cmd_set);
        CHECK(cmd.name == "SET");
        CHECK(cmd.args == std::vector<std::string>{"Key", "Value"});
    }

    SUBCASE("extra whitespace is ignored")
    {
        REQUIRE(parse_command("  GET\t  k  \r", cmd) == parse_ok);
        CHECK(cmd.kind == cmd_get);
        CHECK(cmd.args == std::vector<std::string>{"k"});
    }

    SUBCASE("empty line")
    {
        CHECK(parse_command("", cmd) == parse_empty);
        CHECK(parse_command("   \t ", cmd) == parse_empty);
    }

    SUBCASE("unknown command")
    {
        CHECK(parse_command("frobnicate x", cmd) == parse_unknown_command);
        CHECK(parse_error_message(parse_unknown_command, cmd) == "ERR unknown command 'FROBNICATE'");
    }

    SUBCASE("aliases")
    {
        REQUIRE(parse_command("verify", cmd) == parse_ok);
        CHECK(cmd.kind == cmd_verify_integrity);
        REQUIRE(parse_command("RECOVERFROMBACKUP", cmd) == parse_ok);
        CHECK(cmd.kind == cmd_recover_from_backup);
    }
}

TEST_CASE("parse_command arity")
{
    command cmd;

    CHECK(parse_command("GET", cmd) == parse_wrong_arity);
    CHECK(parse_error_message(parse_wrong_arity, cmd) == "ERR wrong number of arguments for 'get' command");
    CHECK(parse_command("GET a b", cmd) == parse_wrong_arity);
    CHECK(parse_command("SETEX k 10", cmd) == parse_wrong_arity);
    CHECK(parse_command("DEL a b c d", cmd) == parse_ok);
    CHECK(parse_command("PING", cmd) == parse_ok);
    CHECK(parse_command("PING a b", cmd) == parse_wrong_arity);
    CHECK(parse_command("KEYS", cmd) == parse_ok);
    CHECK(parse_command("QUIT now", cmd) == parse_wrong_arity);
    CHECK(parse_command("UNSUBSCRIBE", cmd) == parse_ok);
    CHECK(parse_command("SUBSCRIBE", cmd) == parse_wrong_arity);
    CHECK(parse_command("LRANGE l 0", cmd) == parse_wrong_arity);

    SUBCASE("hset needs complete pairs")
    {
        CHECK(parse_command("HSET h f1 v1 f2 v2", cmd) == parse_ok);
        CHECK(parse_command("HSET h f1 v1 f2", cmd) == parse_wrong_arity);
        CHECK(parse_command("HSET h f1", cmd) == parse_wrong_arity);
    }
}

TEST_CASE("parse_command publish joins the message")
{
    command cmd;
    REQUIRE(parse_command("PUBLISH news  hello   big world", cmd) == parse_ok);
    CHECK(cmd.kind == cmd_publish);
    REQUIRE(cmd.args.size() == 2);
    CHECK(cmd.args[0] == "news");
    CHECK(cmd.args[1] == "hello big world");

    CHECK(parse_command("PUBLISH news", cmd) == parse_wrong_arity);
}

TEST_CASE("parse_command pubsub subcommands")
{
    command cmd;

    REQUIRE(parse_command("pubsub channels", cmd) == parse_ok);
    CHECK(cmd.args[0] == "CHANNELS");
    CHECK(parse_command("PUBSUB CHANNELS news.*", cmd) == parse_ok);
    CHECK(parse_command("PUBSUB CHANNELS a b", cmd) == parse_wrong_arity);
    CHECK(parse_command("PUBSUB NUMSUB", cmd) == parse_ok);
    CHECK(parse_command("PUBSUB NUMSUB a b c", cmd) == parse_ok);
    CHECK(parse_command("PUBSUB NUMPAT", cmd) == parse_ok);
    CHECK(parse_command("PUBSUB NUMPAT x", cmd) == parse_wrong_arity);

    CHECK(parse_command("PUBSUB bogus", cmd) == parse_unknown_subcommand);
    CHECK(parse_error_message(parse_unknown_subcommand, cmd) == "ERR unknown PUBSUB subcommand 'BOGUS'");
}
