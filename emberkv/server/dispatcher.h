#pragma once
#include <string>
#include <string_view>
#include <memory>
#include <chrono>

#include "command.h"
#include "reply.h"
#include "../engine/keyspace.h"
#include "../engine/pubsub.h"
#include "../engine/snapshot.h"

inline constexpr const char* EMBERKV_VERSION = "1.0.0";

// Per-connection state the dispatcher reads and updates
struct session
{
    bool authenticated{false};
    bool quit{false};
    // 0 until the first (P)SUBSCRIBE; then fixed for the connection's life
    subscriber_id sub_id{0};
    message_receiver receiver;
    size_t subscriptions{0};

    bool in_subscriber_mode() const { return subscriptions > 0; }
};

// Executes parsed commands against the shared keyspace and pub/sub registry.
// Stateless apart from its handles, so one instance serves every connection.
class dispatcher
{
public:
    dispatcher(keyspace_handle ks, pubsub_handle pubsub,
               std::shared_ptr<snapshot> snap, std::string requirepass);

    reply execute(session& s, const command& cmd);
    // Parses and executes one request line
    reply execute_line(session& s, std::string_view line);
    // Connection teardown: drops every subscription the session holds
    void end_session(session& s);

    const keyspace_handle& keyspace_ref() const { return m_keyspace; }
    const pubsub_handle& pubsub_ref() const { return m_pubsub; }

private:
    reply exec_keyspace(const command& cmd);
    reply exec_server(const command& cmd);
    reply exec_pubsub(session& s, const command& cmd);

    reply subscribe(session& s, const command& cmd, bool pattern);
    reply unsubscribe(session& s, const command& cmd, bool pattern);
    std::string info_text();

    keyspace_handle m_keyspace;
    pubsub_handle m_pubsub;
    std::shared_ptr<snapshot> m_snapshot;
    std::string m_requirepass;
    std::chrono::steady_clock::time_point m_started;
};
