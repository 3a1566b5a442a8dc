#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include "../../emberkv/server/reply.h"
#include "../../emberkv/engine/message_queue.h"

TEST_CASE("format_reply scalars")
{
    CHECK(format_reply(reply::ok()) == "OK\n");
    CHECK(format_reply(reply::make_status("PONG")) == "PONG\n");
    CHECK(format_reply(reply::make_nil()) == "(nil)\n");
    CHECK(format_reply(reply::make_integer(42)) == "(integer) 42\n");
    CHECK(format_reply(reply::make_integer(-7)) == "(integer) -7\n");
    CHECK(format_reply(reply::make_bulk("hello world")) == "\"hello world\"\n");
    CHECK(format_reply(reply::make_bulk("")) == "\"\"\n");
    CHECK(format_reply(reply::make_error("ERR boom")) == "(error) ERR boom\n");
}

TEST_CASE("format_reply text blocks")
{
    CHECK(format_reply(reply::make_text("a:1\nb:2\n")) == "a:1\nb:2\n");
    CHECK(format_reply(reply::make_text("a:1")) == "a:1\n");
    CHECK(format_reply(reply::make_text("")) == "\n");
}

TEST_CASE("format_reply arrays")
{
    SUBCASE("numbered items")
    {
        auto r = reply::bulk_array({"a", "b", "c"});
        CHECK(format_reply(r) == "1) \"a\"\n2) \"b\"\n3) \"c\"\n");
    }

    SUBCASE("empty")
    {
        CHECK(format_reply(reply::bulk_array({})) == "(empty array)\n");
    }

    SUBCASE("mixed element kinds")
    {
        auto r = reply::make_array({
            reply::make_bulk("subscribe"),
            reply::make_bulk("news"),
            reply::make_integer(1)
        });
        CHECK(format_reply(r) == "1) \"subscribe\"\n2) \"news\"\n3) (integer) 1\n");
    }

    SUBCASE("nested arrays are indented under their index")
    {
        auto r = reply::make_array({
            reply::make_bulk("x"),
            reply::bulk_array({"y", "z"})
        });
        CHECK(format_reply(r) == "1) \"x\"\n2) 1) \"y\"\n   2) \"z\"\n");
    }
}

TEST_CASE("format_reply batches")
{
    auto r = reply::make_batch({
        reply::make_array({reply::make_bulk("subscribe"), reply::make_bulk("a"), reply::make_integer(1)}),
        reply::make_array({reply::make_bulk("subscribe"), reply::make_bulk("b"), reply::make_integer(2)})
    });
    CHECK(format_reply(r) ==
          "1) \"subscribe\"\n2) \"a\"\n3) (integer) 1\n"
          "1) \"subscribe\"\n2) \"b\"\n3) (integer) 2\n");

    CHECK(format_reply(reply::make_batch({})).empty());
}

TEST_CASE("append_reply accumulates")
{
    std::string out;
    append_reply(out, reply::ok());
    append_reply(out, reply::make_integer(1));
    CHECK(out == "OK\n(integer) 1\n");
}

TEST_CASE("message_reply")
{
    SUBCASE("channel message")
    {
        pubsub_message msg;
        msg.kind = pubsub_message::message;
        msg.channel = "news";
        msg.payload = "hi";
        CHECK(format_reply(message_reply(msg)) == "1) \"message\"\n2) \"news\"\n3) \"hi\"\n");
    }

    SUBCASE("pattern message carries the pattern")
    {
        pubsub_message msg;
        msg.kind = pubsub_message::pmessage;
        msg.pattern = "n*";
        msg.channel = "news";
        msg.payload = "hi";
        auto r = message_reply(msg);
        REQUIRE(r.elements.size() == 4);
        CHECK(r.elements[0].str == "pmessage");
        CHECK(r.elements[1].str == "n*");
        CHECK(r.elements[3].str == "hi");
    }
}
