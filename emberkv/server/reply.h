#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

struct pubsub_message;

// Typed result of one command; turned into text only by format_reply()
struct reply
{
    enum kind_t : uint8_t
    {
        status  = 0,   // OK, PONG, type names
        nil     = 1,
        integer = 2,
        bulk    = 3,   // quoted string
        array   = 4,
        error   = 5,   // text carries the code: "WRONGTYPE ...", "ERR ..."
        text    = 6,   // unquoted multi-line block (INFO, MEMORY)
        batch   = 7    // several top-level replies, e.g. SUBSCRIBE a b
    };

    kind_t kind{status};
    std::string str;
    int64_t number{0};
    std::vector<reply> elements;

    static reply ok() { return make_status("OK"); }
    static reply make_status(std::string s) { reply r; r.kind = status; r.str = std::move(s); return r; }
    static reply make_nil() { reply r; r.kind = nil; return r; }
    static reply make_integer(int64_t n) { reply r; r.kind = integer; r.number = n; return r; }
    static reply make_bulk(std::string s) { reply r; r.kind = bulk; r.str = std::move(s); return r; }
    static reply make_error(std::string s) { reply r; r.kind = error; r.str = std::move(s); return r; }
    static reply make_text(std::string s) { reply r; r.kind = text; r.str = std::move(s); return r; }

    static reply make_array(std::vector<reply> items)
    {
        reply r;
        r.kind = array;
        r.elements = std::move(items);
        return r;
    }

    static reply make_batch(std::vector<reply> items)
    {
        reply r;
        r.kind = batch;
        r.elements = std::move(items);
        return r;
    }

    static reply bulk_array(const std::vector<std::string>& items);

    bool is_error() const { return kind == error; }
};

// Renders in the interactive client's style, one or more '\n'-terminated lines:
//   OK | (nil) | (integer) 3 | "value" | 1) "a"\n2) "b" | (error) ERR ...
std::string format_reply(const reply& r);
void append_reply(std::string& out, const reply& r);

// ["message", channel, payload] or ["pmessage", pattern, channel, payload]
reply message_reply(const pubsub_message& msg);
