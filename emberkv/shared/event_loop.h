#pragma once
#include <cstdint>
#include <liburing.h>
#include <sys/uio.h>

#include "event_loop_definitions.h"

// Single-threaded io_uring completion loop. Handlers own their io_request
// structs; a CQE is routed to req->owner->on_cqe(). The loop ends when a
// byte arrives on the signal pipe.
class event_loop
{
public:
    explicit event_loop(uint32_t queue_depth = 1024);
    ~event_loop();

    event_loop(const event_loop&) = delete;
    event_loop& operator=(const event_loop&) = delete;

    bool init();
    void run();
    // Write end of the stop pipe; writing one byte is async-signal-safe
    int get_signal_write_fd() const { return m_signal_pipe[1]; }

    // The submit_* calls queue an SQE without entering the kernel. They
    // return false only when the ring is still full after a flush; the
    // request was not queued and no completion will arrive for it.
    bool submit_multishot_accept(int listen_fd, io_request* req);
    bool submit_read(int fd, char* buf, uint32_t len, io_request* req);
    // read(2) rather than recv(2), for eventfds
    bool submit_fd_read(int fd, char* buf, uint32_t len, io_request* req);
    bool submit_write(int fd, const char* buf, uint32_t len, io_request* req);
    bool submit_writev(int fd, struct iovec* iovs, uint32_t count, io_request* req);
    // Cancels every pending op on fd; the cancel CQE itself carries no request
    bool submit_cancel_fd(int fd);

    // Submits everything queued so far in one syscall
    void flush();

    bool multishot_supported() const { return m_multishot_supported; }

private:
    struct io_uring_sqe* get_sqe();
    template<typename Prep>
    bool queue_sqe(void* data, Prep&& prep);
    bool setup_signal_pipe();
    static bool supports_multishot_accept(struct io_uring* ring);

    struct io_uring m_ring{};
    bool m_ring_ready{false};
    bool m_running{false};
    uint32_t m_queue_depth;
    uint32_t m_pending_submissions{0};
    int m_signal_pipe[2]{-1, -1};
    io_request m_signal_req{};
    char m_signal_buf{};
    bool m_multishot_supported{false};
};
