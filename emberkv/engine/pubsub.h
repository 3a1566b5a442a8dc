#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <unordered_map>
#include <unordered_set>
#include <shared_mutex>
#include <memory>
#include <utility>
#include <cstdint>

#include "value.h"
#include "message_queue.h"

using subscriber_id = uint64_t;

// Channel and pattern subscriptions keyed by subscriber id. Internally
// locked; never call into it while holding the keyspace lock for longer
// than a single publish.
class pubsub_registry
{
public:
    // Ids start at 1 and are never reused
    std::pair<subscriber_id, message_receiver> create_subscriber();

    // All four return the subscriber's remaining channel + pattern count.
    // Unknown ids are ignored and report 0.
    size_t subscribe(subscriber_id id, std::string_view channel);
    size_t unsubscribe(subscriber_id id, std::string_view channel);
    size_t psubscribe(subscriber_id id, std::string_view pattern);
    size_t punsubscribe(subscriber_id id, std::string_view pattern);

    // Delivers to exact-channel subscribers, then to every matching pattern.
    // Returns the number of successful deliveries; a subscriber matched both
    // ways is counted twice.
    size_t publish(std::string_view channel, std::string_view payload) const;

    // Safe to call repeatedly
    void remove_subscriber(subscriber_id id);

    // Active channels, optionally filtered by a glob pattern, sorted
    std::vector<std::string> channels(std::string_view pattern = {}) const;
    size_t numsub(std::string_view channel) const;
    size_t numpat() const;
    size_t subscriptions(subscriber_id id) const;
    std::vector<std::string> subscribed_channels(subscriber_id id) const;
    std::vector<std::string> subscribed_patterns(subscriber_id id) const;
    size_t subscriber_count() const;

private:
    using id_set = std::unordered_set<subscriber_id>;
    using name_set = std::unordered_set<std::string, string_hash, string_equal>;
    using topic_map = std::unordered_map<std::string, id_set, string_hash, string_equal>;

    struct subscriber
    {
        message_sender sender;
        name_set channels;
        name_set patterns;
    };

    static void add(topic_map& topics, name_set& own, subscriber_id id, std::string_view name);
    static void remove(topic_map& topics, name_set& own, subscriber_id id, std::string_view name);

    mutable std::shared_mutex m_mutex;
    topic_map m_channels;
    topic_map m_patterns;
    std::unordered_map<subscriber_id, subscriber> m_subscribers;
    subscriber_id m_next_id{1};
};

using pubsub_handle = std::shared_ptr<pubsub_registry>;
