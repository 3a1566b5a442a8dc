#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include "../../emberkv/engine/keyspace.h"

#include <algorithm>

using namespace std::chrono_literals;

namespace
{
    struct manual_clock
    {
        engine_clock::time_point now = engine_clock::now();

        void attach(keyspace& ks)
        {
            ks.set_clock([this] { return now; });
        }
    };

    std::string get_string(keyspace& ks, std::string_view key)
    {
        auto v = ks.get(key);
        if (!v)
            return "<nil>";
        auto* s = std::get_if<std::string>(&*v);
        return s ? *s : "<not a string>";
    }
}

TEST_CASE("keyspace string operations")
{
    keyspace ks;

    SUBCASE("set and get")
    {
        CHECK(ks.set("key1", value{std::string("value1")}) == status_ok);
        CHECK(get_string(ks, "key1") == "value1");
    }

    SUBCASE("get nonexistent")
    {
        CHECK_FALSE(ks.get("nokey").has_value());
    }

    SUBCASE("overwrite")
    {
        ks.set("k", value{std::string("v1")});
        ks.set("k", value{std::string("v2")});
        CHECK(get_string(ks, "k") == "v2");
        CHECK(ks.size() == 1);
    }

    SUBCASE("overwrite replaces type")
    {
        size_t len;
        ks.rpush("k", {"a"}, len);
        ks.set("k", value{std::string("v")});
        CHECK(ks.type("k") == type_string);
    }

    SUBCASE("del")
    {
        ks.set("k", value{std::string("v")});
        CHECK(ks.del("k"));
        CHECK_FALSE(ks.del("k"));
        CHECK_FALSE(ks.exists("k"));
    }

    SUBCASE("exists and size")
    {
        ks.set("a", value{std::string("1")});
        ks.set("b", value{std::string("2")});
        CHECK(ks.exists("a"));
        CHECK_FALSE(ks.exists("c"));
        CHECK(ks.size() == 2);
    }

    SUBCASE("clear")
    {
        ks.set("a", value{std::string("1")});
        ks.set_with_expiry("b", value{std::string("2")}, 10s);
        ks.clear();
        CHECK(ks.size() == 0);
        CHECK(ks.expiries().empty());
        CHECK(ks.memory().tracked_count() == 0);
    }
}

TEST_CASE("keyspace lazy expiry")
{
    keyspace ks;
    manual_clock clock;
    clock.attach(ks);

    SUBCASE("key disappears once its deadline passes")
    {
        ks.set_with_expiry("k", value{std::string("v")}, 1000ms);
        CHECK(ks.exists("k"));
        clock.now += 999ms;
        CHECK(get_string(ks, "k") == "v");
        clock.now += 1ms;
        CHECK_FALSE(ks.get("k").has_value());
        CHECK(ks.size() == 0);
        CHECK_FALSE(ks.has_expiry("k"));
        CHECK(ks.memory().tracking("k") == nullptr);
    }

    SUBCASE("expired key is removed by exists")
    {
        ks.set_with_expiry("k", value{std::string("v")}, 10ms);
        clock.now += 20ms;
        CHECK_FALSE(ks.exists("k"));
        CHECK(ks.size() == 0);
    }

    SUBCASE("del of an expired key reports nothing deleted")
    {
        ks.set_with_expiry("k", value{std::string("v")}, 10ms);
        clock.now += 10ms;
        CHECK_FALSE(ks.del("k"));
    }

    SUBCASE("ttl")
    {
        ks.set_with_expiry("k", value{std::string("v")}, 5s);
        clock.now += 2s;
        auto remaining = ks.ttl("k");
        REQUIRE(remaining.has_value());
        CHECK(*remaining == 3000ms);
    }

    SUBCASE("ttl without deadline and on missing key")
    {
        ks.set("k", value{std::string("v")});
        CHECK(ks.ttl("k") == keyspace::no_expiry);
        CHECK_FALSE(ks.ttl("missing").has_value());
    }

    SUBCASE("expire and persist")
    {
        ks.set("k", value{std::string("v")});
        CHECK(ks.expire("k", 1s));
        CHECK(ks.has_expiry("k"));
        CHECK(ks.persist("k"));
        CHECK_FALSE(ks.persist("k"));
        clock.now += 5s;
        CHECK(ks.exists("k"));
    }

    SUBCASE("expire on missing key")
    {
        CHECK_FALSE(ks.expire("nokey", 1s));
    }

    SUBCASE("plain set drops the deadline")
    {
        ks.set_with_expiry("k", value{std::string("v")}, 1s);
        ks.set("k", value{std::string("v2")});
        CHECK_FALSE(ks.has_expiry("k"));
        clock.now += 2s;
        CHECK(get_string(ks, "k") == "v2");
    }

    SUBCASE("keys skips expired entries without removing them")
    {
        ks.set("live", value{std::string("1")});
        ks.set_with_expiry("dead", value{std::string("2")}, 1s);
        clock.now += 1s;
        auto keys = ks.keys();
        CHECK(keys == std::vector<std::string>{"live"});
        CHECK(ks.size() == 2);
    }

    SUBCASE("collection ops expire first")
    {
        size_t len;
        ks.rpush("l", {"a", "b"}, len);
        ks.expire("l", 1s);
        clock.now += 1s;
        CHECK(ks.llen("l", len) == status_ok);
        CHECK(len == 0);
        ks.rpush("l", {"c"}, len);
        CHECK(len == 1);
        CHECK_FALSE(ks.has_expiry("l"));
    }
}

TEST_CASE("keyspace keys pattern")
{
    keyspace ks;
    ks.set("user:1", value{std::string("a")});
    ks.set("user:2", value{std::string("b")});
    ks.set("session:1", value{std::string("c")});

    auto users = ks.keys("user:*");
    std::sort(users.begin(), users.end());
    CHECK(users == std::vector<std::string>{"user:1", "user:2"});
    CHECK(ks.keys("*").size() == 3);
    CHECK(ks.keys("nothing*").empty());
    CHECK(ks.keys("session:?").size() == 1);
}

TEST_CASE("keyspace integers")
{
    keyspace ks;
    int64_t out = 0;

    SUBCASE("absent key starts at zero")
    {
        CHECK(ks.incr_by("n", 5, out) == status_ok);
        CHECK(out == 5);
        CHECK(ks.type("n") == type_integer);
    }

    SUBCASE("decimal string converts")
    {
        ks.set("n", value{std::string("41")});
        CHECK(ks.incr_by("n", 1, out) == status_ok);
        CHECK(out == 42);
        CHECK(ks.type("n") == type_integer);
    }

    SUBCASE("non-numeric string fails")
    {
        ks.set("n", value{std::string("abc")});
        CHECK(ks.incr_by("n", 1, out) == status_not_integer);
        CHECK(get_string(ks, "n") == "abc");
    }

    SUBCASE("overflow fails")
    {
        ks.set("n", value{INT64_MAX});
        CHECK(ks.incr_by("n", 1, out) == status_not_integer);
    }

    SUBCASE("wrong type")
    {
        size_t len;
        ks.rpush("l", {"a"}, len);
        CHECK(ks.incr_by("l", 1, out) == status_wrong_type);
    }

    SUBCASE("negative delta")
    {
        CHECK(ks.incr_by("n", -3, out) == status_ok);
        CHECK(out == -3);
    }
}

TEST_CASE("keyspace lists")
{
    keyspace ks;
    size_t len = 0;
    std::optional<std::string> popped;
    std::vector<std::string> range;

    SUBCASE("lpush and lpop")
    {
        CHECK(ks.lpush("l", {"a", "b"}, len) == status_ok);
        CHECK(len == 2);
        CHECK(ks.lpop("l", popped) == status_ok);
        CHECK(popped == "b");
    }

    SUBCASE("rpush and rpop")
    {
        ks.rpush("l", {"a", "b", "c"}, len);
        CHECK(ks.rpop("l", popped) == status_ok);
        CHECK(popped == "c");
    }

    SUBCASE("lrange with negative indexes")
    {
        ks.rpush("l", {"a", "b", "c", "d"}, len);
        CHECK(ks.lrange("l", 0, -1, range) == status_ok);
        CHECK(range == std::vector<std::string>{"a", "b", "c", "d"});
        ks.lrange("l", -2, -1, range);
        CHECK(range == std::vector<std::string>{"c", "d"});
        ks.lrange("l", 1, 100, range);
        CHECK(range.size() == 3);
        ks.lrange("l", 3, 1, range);
        CHECK(range.empty());
    }

    SUBCASE("popping the last element deletes the key")
    {
        ks.rpush("l", {"only"}, len);
        ks.lpop("l", popped);
        CHECK_FALSE(ks.exists("l"));
        CHECK(ks.lpop("l", popped) == status_ok);
        CHECK_FALSE(popped.has_value());
    }

    SUBCASE("wrong type")
    {
        ks.set("s", value{std::string("v")});
        CHECK(ks.lpush("s", {"a"}, len) == status_wrong_type);
        CHECK(ks.llen("s", len) == status_wrong_type);
        CHECK(get_string(ks, "s") == "v");
    }
}

TEST_CASE("keyspace sets")
{
    keyspace ks;
    size_t n = 0;
    bool member = false;

    SUBCASE("sadd counts new members only")
    {
        CHECK(ks.sadd("s", {"a", "b", "a"}, n) == status_ok);
        CHECK(n == 2);
        ks.sadd("s", {"b", "c"}, n);
        CHECK(n == 1);
        ks.scard("s", n);
        CHECK(n == 3);
    }

    SUBCASE("smembers sorted and sismember")
    {
        ks.sadd("s", {"c", "a", "b"}, n);
        std::vector<std::string> members;
        ks.smembers("s", members);
        CHECK(members == std::vector<std::string>{"a", "b", "c"});
        ks.sismember("s", "a", member);
        CHECK(member);
        ks.sismember("s", "z", member);
        CHECK_FALSE(member);
    }

    SUBCASE("srem to empty deletes the key")
    {
        ks.sadd("s", {"a"}, n);
        CHECK(ks.srem("s", {"a", "missing"}, n) == status_ok);
        CHECK(n == 1);
        CHECK_FALSE(ks.exists("s"));
    }

    SUBCASE("wrong type")
    {
        ks.set("k", value{std::string("v")});
        CHECK(ks.sadd("k", {"a"}, n) == status_wrong_type);
    }
}

TEST_CASE("keyspace hashes")
{
    keyspace ks;
    size_t n = 0;
    std::optional<std::string> field;

    SUBCASE("hset reports created fields")
    {
        CHECK(ks.hset("h", {{"f1", "v1"}, {"f2", "v2"}}, n) == status_ok);
        CHECK(n == 2);
        ks.hset("h", {{"f1", "changed"}}, n);
        CHECK(n == 0);
        ks.hget("h", "f1", field);
        CHECK(field == "changed");
    }

    SUBCASE("hget missing field")
    {
        ks.hset("h", {{"f", "v"}}, n);
        CHECK(ks.hget("h", "nope", field) == status_ok);
        CHECK_FALSE(field.has_value());
    }

    SUBCASE("hgetall, hkeys, hvals are sorted by field")
    {
        ks.hset("h", {{"b", "2"}, {"a", "1"}}, n);
        std::vector<field_pair> all;
        ks.hgetall("h", all);
        REQUIRE(all.size() == 2);
        CHECK(all[0] == field_pair{"a", "1"});
        std::vector<std::string> keys, vals;
        ks.hkeys("h", keys);
        ks.hvals("h", vals);
        CHECK(keys == std::vector<std::string>{"a", "b"});
        CHECK(vals == std::vector<std::string>{"1", "2"});
    }

    SUBCASE("hdel to empty deletes the key")
    {
        ks.hset("h", {{"f", "v"}}, n);
        ks.hdel("h", {"f"}, n);
        CHECK(n == 1);
        CHECK_FALSE(ks.exists("h"));
        CHECK(ks.hlen("h", n) == status_ok);
        CHECK(n == 0);
    }

    SUBCASE("wrong type")
    {
        size_t len;
        ks.rpush("l", {"a"}, len);
        CHECK(ks.hget("l", "f", field) == status_wrong_type);
    }
}

TEST_CASE("keyspace access tracking")
{
    keyspace ks;

    ks.set("k", value{std::string("v")});
    const access_info* info = ks.memory().tracking("k");
    REQUIRE(info != nullptr);
    CHECK(info->access_count == 1);

    ks.get("k");
    ks.get("k");
    CHECK(ks.memory().tracking("k")->access_count == 3);

    ks.get("missing");
    CHECK(ks.memory().tracking("missing") == nullptr);

    ks.del("k");
    CHECK(ks.memory().tracking("k") == nullptr);
}

TEST_CASE("keyspace restore")
{
    keyspace ks;
    ks.set("old", value{std::string("x")});

    data_map data;
    data.emplace("a", value{std::string("1")});
    expiry_map expiries;
    expiries.emplace("a", engine_clock::now() + 10s);
    expiries.emplace("ghost", engine_clock::now() + 10s);

    ks.restore(std::move(data), std::move(expiries));
    CHECK(ks.size() == 1);
    CHECK_FALSE(ks.exists("old"));
    CHECK(ks.has_expiry("a"));
    CHECK_FALSE(ks.has_expiry("ghost"));
    CHECK(ks.memory().tracking("a") == nullptr);
}
