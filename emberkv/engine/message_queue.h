#pragma once
#include <string>
#include <deque>
#include <vector>
#include <memory>
#include <mutex>
#include <utility>
#include <cstdint>
#include <sys/eventfd.h>
#include <unistd.h>

#include "../shared/scoped_fd.h"

struct pubsub_message
{
    enum kind_t : uint8_t
    {
        message  = 0,   // exact channel subscription
        pmessage = 1    // pattern subscription; `pattern` is set
    };

    kind_t kind{message};
    std::string pattern;
    std::string channel;
    std::string payload;
};

struct message_queue_state
{
    std::mutex mutex;
    std::deque<pubsub_message> messages;
    // Bumped once per enqueue so an io_uring read can wait on it
    scoped_fd event_fd;
};

// Producer side. Holds only a weak reference: once the receiver is gone,
// send() fails quietly.
class message_sender
{
public:
    message_sender() = default;
    explicit message_sender(std::weak_ptr<message_queue_state> state) : m_state(std::move(state)) {}

    bool send(pubsub_message msg) const
    {
        auto state = m_state.lock();
        if (!state)
            return false;

        {
            std::lock_guard<std::mutex> lock(state->mutex);
            state->messages.push_back(std::move(msg));
        }

        if (state->event_fd)
        {
            uint64_t one = 1;
            // Blocks only if the counter nears 2^64; the reader resets it on every wakeup
            ssize_t n = ::write(state->event_fd.get(), &one, sizeof(one));
            (void)n;
        }
        return true;
    }

    bool connected() const { return !m_state.expired(); }

private:
    std::weak_ptr<message_queue_state> m_state;
};

// Consumer side, owned by exactly one connection
class message_receiver
{
public:
    message_receiver() = default;
    explicit message_receiver(std::shared_ptr<message_queue_state> state) : m_state(std::move(state)) {}

    // -1 if eventfd creation failed; messages can still be drained
    int fd() const { return m_state && m_state->event_fd ? m_state->event_fd.get() : -1; }

    std::vector<pubsub_message> drain()
    {
        std::vector<pubsub_message> out;
        if (!m_state)
            return out;

        std::lock_guard<std::mutex> lock(m_state->mutex);
        out.reserve(m_state->messages.size());
        for (auto& msg : m_state->messages)
            out.push_back(std::move(msg));
        m_state->messages.clear();
        return out;
    }

    size_t pending() const
    {
        if (!m_state)
            return 0;
        std::lock_guard<std::mutex> lock(m_state->mutex);
        return m_state->messages.size();
    }

    explicit operator bool() const { return m_state != nullptr; }
    void reset() { m_state.reset(); }

private:
    std::shared_ptr<message_queue_state> m_state;
};

inline std::pair<message_sender, message_receiver> make_message_queue()
{
    auto state = std::make_shared<message_queue_state>();
    // Left blocking: io_uring answers a read on an O_NONBLOCK fd with -EAGAIN
    // instead of waiting for the counter to move
    state->event_fd.reset(::eventfd(0, EFD_CLOEXEC));
    return {message_sender(state), message_receiver(state)};
}
