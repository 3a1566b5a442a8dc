#pragma once
#include <string>
#include <string_view>
#include <unordered_map>
#include <memory>
#include <deque>
#include <chrono>
#include <sys/uio.h>

#include "../shared/event_loop.h"
#include "../shared/event_loop_definitions.h"
#include "../shared/scoped_fd.h"
#include "dispatcher.h"

struct client_connection
{
    static constexpr size_t MAX_WRITE_BATCH = 16;
    static constexpr size_t MAX_WRITE_QUEUE = 4096;
    static constexpr size_t MAX_PARTIAL_SIZE = 1 * 1024 * 1024;

    int fd;
    io_request read_req;
    io_request write_req;
    // eventfd read that fires when pub/sub messages are queued
    io_request notify_req;
    char read_buf[4096];
    uint64_t notify_buf{0};
    std::string partial;
    std::string response_buf;
    std::deque<std::string> write_queue;

    std::string write_batch[MAX_WRITE_BATCH];
    struct iovec write_iovs[MAX_WRITE_BATCH];
    uint32_t write_batch_count{0};

    bool read_pending{false};
    bool write_pending{false};
    bool notify_pending{false};
    bool closing{false};

    session sess;
};

// TCP front end: one io_uring loop, line-delimited requests, redis-cli style
// text replies. Pub/sub deliveries arrive through each subscriber's eventfd.
class server_instance : public io_handler
{
public:
    server_instance(dispatcher& disp, std::string bind_addr, uint16_t port);
    ~server_instance() override;

    void set_max_connections(uint32_t max) { m_max_connections = max; }
    uint32_t get_max_connections() const { return m_max_connections; }

    bool setup(event_loop& loop);
    void teardown(event_loop& loop);
    void on_cqe(struct io_uring_cqe* cqe) override;

    size_t get_connection_count() const { return m_clients.size(); }
    uint16_t get_port() const { return m_port; }

private:
    void handle_accept(struct io_uring_cqe* cqe);
    void handle_read(struct io_uring_cqe* cqe, client_connection* conn);
    void handle_write(struct io_uring_cqe* cqe, client_connection* conn);
    void handle_notify(struct io_uring_cqe* cqe, client_connection* conn);

    void process_line(client_connection* conn, std::string_view line);
    void arm_notify(client_connection* conn);
    void deliver_messages(client_connection* conn);
    void flush_responses(client_connection* conn);
    void flush_write_queue(client_connection* conn);

    void begin_close(client_connection* conn);
    // Frees the connection once no operation references it
    void release_if_idle(client_connection* conn);

    client_connection* lookup(int fd) const;

    dispatcher& m_dispatcher;
    std::string m_bind_addr;
    uint16_t m_port;
    uint32_t m_max_connections{0};

    scoped_fd m_listener;
    io_request m_accept_req{};
    bool m_multishot_active{false};

    std::unordered_map<int, std::unique_ptr<client_connection>> m_clients;

    event_loop* m_loop{nullptr};
};
