#include "reply.h"
#include "../engine/message_queue.h"

#include <charconv>

namespace
{
    void append_int(std::string& out, int64_t v)
    {
        char buf[24];
        auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), v);
        out.append(buf, static_cast<size_t>(end - buf));
    }

    // Array items are numbered; nested arrays are indented under their index
    void append_value(std::string& out, const reply& r, size_t indent)
    {
        switch (r.kind)
        {
            case reply::status:
                out.append(r.str);
                out.push_back('\n');
                break;
            case reply::nil:
                out.append("(nil)\n");
                break;
            case reply::integer:
                out.append("(integer) ");
                append_int(out, r.number);
                out.push_back('\n');
                break;
            case reply::bulk:
                out.push_back('"');
                out.append(r.str);
                out.append("\"\n");
                break;
            case reply::error:
                out.append("(error) ");
                out.append(r.str);
                out.push_back('\n');
                break;
            case reply::text:
                out.append(r.str);
                if (r.str.empty() || r.str.back() != '\n')
                    out.push_back('\n');
                break;
            case reply::array:
            {
                if (r.elements.empty())
                {
                    out.append("(empty array)\n");
                    break;
                }
                for (size_t i = 0; i < r.elements.size(); ++i)
                {
                    if (i > 0)
                        out.append(indent, ' ');
                    std::string prefix = std::to_string(i + 1) + ") ";
                    out.append(prefix);
                    append_value(out, r.elements[i], indent + prefix.size());
                }
                break;
            }
            case reply::batch:
                for (const auto& e : r.elements)
                    append_value(out, e, 0);
                break;
        }
    }
}

reply reply::bulk_array(const std::vector<std::string>& items)
{
    std::vector<reply> out;
    out.reserve(items.size());
    for (const auto& s : items)
        out.push_back(make_bulk(s));
    return make_array(std::move(out));
}

void append_reply(std::string& out, const reply& r)
{
    append_value(out, r, 0);
}

std::string format_reply(const reply& r)
{
    std::string out;
    append_reply(out, r);
    return out;
}

reply message_reply(const pubsub_message& msg)
{
    std::vector<reply> items;
    if (msg.kind == pubsub_message::pmessage)
    {
        items.push_back(reply::make_bulk("pmessage"));
        items.push_back(reply::make_bulk(msg.pattern));
    }
    else
    {
        items.push_back(reply::make_bulk("message"));
    }
    items.push_back(reply::make_bulk(msg.channel));
    items.push_back(reply::make_bulk(msg.payload));
    return reply::make_array(std::move(items));
}
