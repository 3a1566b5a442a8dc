#include "pubsub.h"
#include "glob.h"

#include <algorithm>
#include <mutex>

std::pair<subscriber_id, message_receiver> pubsub_registry::create_subscriber()
{
    auto [sender, receiver] = make_message_queue();

    std::unique_lock lock(m_mutex);
    subscriber_id id = m_next_id++;
    m_subscribers.emplace(id, subscriber{std::move(sender), {}, {}});
    return {id, std::move(receiver)};
}

void pubsub_registry::add(topic_map& topics, name_set& own, subscriber_id id, std::string_view name)
{
    auto it = topics.find(name);
    if (it == topics.end())
        it = topics.emplace(std::string(name), id_set{}).first;
    it->second.insert(id);

    if (own.find(name) == own.end())
        own.emplace(name);
}

void pubsub_registry::remove(topic_map& topics, name_set& own, subscriber_id id, std::string_view name)
{
    if (auto it = topics.find(name); it != topics.end())
    {
        it->second.erase(id);
        if (it->second.empty())
            topics.erase(it);
    }

    if (auto oit = own.find(name); oit != own.end())
        own.erase(oit);
}

size_t pubsub_registry::subscribe(subscriber_id id, std::string_view channel)
{
    std::unique_lock lock(m_mutex);
    auto it = m_subscribers.find(id);
    if (it == m_subscribers.end())
        return 0;

    add(m_channels, it->second.channels, id, channel);
    return it->second.channels.size() + it->second.patterns.size();
}

size_t pubsub_registry::unsubscribe(subscriber_id id, std::string_view channel)
{
    std::unique_lock lock(m_mutex);
    auto it = m_subscribers.find(id);
    if (it == m_subscribers.end())
        return 0;

    remove(m_channels, it->second.channels, id, channel);
    return it->second.channels.size() + it->second.patterns.size();
}

size_t pubsub_registry::psubscribe(subscriber_id id, std::string_view pattern)
{
    std::unique_lock lock(m_mutex);
    auto it = m_subscribers.find(id);
    if (it == m_subscribers.end())
        return 0;

    add(m_patterns, it->second.patterns, id, pattern);
    return it->second.channels.size() + it->second.patterns.size();
}

size_t pubsub_registry::punsubscribe(subscriber_id id, std::string_view pattern)
{
    std::unique_lock lock(m_mutex);
    auto it = m_subscribers.find(id);
    if (it == m_subscribers.end())
        return 0;

    remove(m_patterns, it->second.patterns, id, pattern);
    return it->second.channels.size() + it->second.patterns.size();
}

size_t pubsub_registry::publish(std::string_view channel, std::string_view payload) const
{
    std::shared_lock lock(m_mutex);
    size_t delivered = 0;

    if (auto it = m_channels.find(channel); it != m_channels.end())
    {
        for (subscriber_id id : it->second)
        {
            auto sit = m_subscribers.find(id);
            if (sit == m_subscribers.end())
                continue;

            pubsub_message msg;
            msg.kind = pubsub_message::message;
            msg.channel.assign(channel);
            msg.payload.assign(payload);
            if (sit->second.sender.send(std::move(msg)))
                ++delivered;
        }
    }

    for (const auto& [pattern, ids] : m_patterns)
    {
        if (!glob_match(pattern, channel))
            continue;

        for (subscriber_id id : ids)
        {
            auto sit = m_subscribers.find(id);
            if (sit == m_subscribers.end())
                continue;

            pubsub_message msg;
            msg.kind = pubsub_message::pmessage;
            msg.pattern = pattern;
            msg.channel.assign(channel);
            msg.payload.assign(payload);
            if (sit->second.sender.send(std::move(msg)))
                ++delivered;
        }
    }

    return delivered;
}

void pubsub_registry::remove_subscriber(subscriber_id id)
{
    std::unique_lock lock(m_mutex);
    auto it = m_subscribers.find(id);
    if (it == m_subscribers.end())
        return;

    for (const auto& channel : it->second.channels)
    {
        if (auto cit = m_channels.find(channel); cit != m_channels.end())
        {
            cit->second.erase(id);
            if (cit->second.empty())
                m_channels.erase(cit);
        }
    }

    for (const auto& pattern : it->second.patterns)
    {
        if (auto pit = m_patterns.find(pattern); pit != m_patterns.end())
        {
            pit->second.erase(id);
            if (pit->second.empty())
                m_patterns.erase(pit);
        }
    }

    m_subscribers.erase(it);
}

std::vector<std::string> pubsub_registry::channels(std::string_view pattern) const
{
    std::shared_lock lock(m_mutex);
    std::vector<std::string> out;
    for (const auto& [channel, _] : m_channels)
        if (pattern.empty() || glob_match(pattern, channel))
            out.push_back(channel);
    std::sort(out.begin(), out.end());
    return out;
}

size_t pubsub_registry::numsub(std::string_view channel) const
{
    std::shared_lock lock(m_mutex);
    auto it = m_channels.find(channel);
    return it != m_channels.end() ? it->second.size() : 0;
}

size_t pubsub_registry::numpat() const
{
    std::shared_lock lock(m_mutex);
    return m_patterns.size();
}

size_t pubsub_registry::subscriptions(subscriber_id id) const
{
    std::shared_lock lock(m_mutex);
    auto it = m_subscribers.find(id);
    if (it == m_subscribers.end())
        return 0;
    return it->second.channels.size() + it->second.patterns.size();
}

std::vector<std::string> pubsub_registry::subscribed_channels(subscriber_id id) const
{
    std::shared_lock lock(m_mutex);
    std::vector<std::string> out;
    if (auto it = m_subscribers.find(id); it != m_subscribers.end())
        out.assign(it->second.channels.begin(), it->second.channels.end());
    std::sort(out.begin(), out.end());
    return out;
}

std::vector<std::string> pubsub_registry::subscribed_patterns(subscriber_id id) const
{
    std::shared_lock lock(m_mutex);
    std::vector<std::string> out;
    if (auto it = m_subscribers.find(id); it != m_subscribers.end())
        out.assign(it->second.patterns.begin(), it->second.patterns.end());
    std::sort(out.begin(), out.end());
    return out;
}

size_t pubsub_registry::subscriber_count() const
{
    std::shared_lock lock(m_mutex);
    return m_subscribers.size();
}
