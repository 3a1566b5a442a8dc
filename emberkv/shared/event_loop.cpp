#include "event_loop.h"
#include "logging.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <string>
#include <sys/socket.h>
#include <unistd.h>

event_loop::event_loop(uint32_t queue_depth)
    : m_queue_depth(queue_depth)
{
}

event_loop::~event_loop()
{
    if (m_ring_ready)
        io_uring_queue_exit(&m_ring);

    for (int fd : m_signal_pipe)
        if (fd >= 0)
            close(fd);
}

// Multishot accept and IORING_OP_SOCKET both landed in 5.19
bool event_loop::supports_multishot_accept(struct io_uring* ring)
{
    struct io_uring_probe* probe = io_uring_get_probe_ring(ring);
    if (!probe)
        return false;

    bool supported = io_uring_opcode_supported(probe, IORING_OP_SOCKET);
    io_uring_free_probe(probe);
    return supported;
}

bool event_loop::init()
{
    // Single issuer with deferred task work first (6.1+), then a plain ring
    struct io_uring_params params{};
    params.flags = IORING_SETUP_SINGLE_ISSUER | IORING_SETUP_DEFER_TASKRUN
                 | IORING_SETUP_SUBMIT_ALL | IORING_SETUP_COOP_TASKRUN
                 | IORING_SETUP_CQSIZE;
    // Each client can have a read, a write and a pub/sub notify in flight
    params.cq_entries = m_queue_depth * 4;

    if (io_uring_queue_init_params(m_queue_depth, &m_ring, &params) == 0)
    {
        m_ring_ready = true;
    }
    else
    {
        int ret = io_uring_queue_init(m_queue_depth, &m_ring, 0);
        if (ret < 0)
        {
            LOG_ERROR(std::string("io_uring_queue_init: ") + std::strerror(-ret));
            return false;
        }
        m_ring_ready = true;
    }

    m_multishot_supported = supports_multishot_accept(&m_ring);
    LOG_DEBUG(std::string("io_uring ready, multishot accept ") +
              (m_multishot_supported ? "on" : "off"));

    return setup_signal_pipe();
}

bool event_loop::setup_signal_pipe()
{
    // Non-blocking so a signal handler writing the stop byte never blocks
    if (pipe2(m_signal_pipe, O_NONBLOCK | O_CLOEXEC) < 0)
    {
        LOG_ERROR(std::string("pipe2: ") + std::strerror(errno));
        return false;
    }

    m_signal_req = { nullptr, &m_signal_buf, m_signal_pipe[0], 1, op_read };
    if (!submit_fd_read(m_signal_pipe[0], &m_signal_buf, 1, &m_signal_req))
        return false;
    flush();
    return true;
}

// Flushes once if the ring is full
struct io_uring_sqe* event_loop::get_sqe()
{
    struct io_uring_sqe* sqe = io_uring_get_sqe(&m_ring);
    if (EMBERKV_UNLIKELY(!sqe))
    {
        io_uring_submit(&m_ring);
        m_pending_submissions = 0;
        sqe = io_uring_get_sqe(&m_ring);
    }
    return sqe;
}

template<typename Prep>
bool event_loop::queue_sqe(void* data, Prep&& prep)
{
    struct io_uring_sqe* sqe = get_sqe();
    if (EMBERKV_UNLIKELY(!sqe))
    {
        LOG_ERROR("io_uring submission queue full");
        return false;
    }

    prep(sqe);
    io_uring_sqe_set_data(sqe, data);
    m_pending_submissions++;
    return true;
}

void event_loop::flush()
{
    if (m_pending_submissions > 0)
    {
        io_uring_submit(&m_ring);
        m_pending_submissions = 0;
    }
}

void event_loop::run()
{
    m_running = true;
    struct io_uring_cqe* cqe;

    while (EMBERKV_LIKELY(m_running))
    {
        if (m_pending_submissions > 0)
        {
            io_uring_submit_and_wait(&m_ring, 1);
            m_pending_submissions = 0;
        }

        if (io_uring_peek_cqe(&m_ring, &cqe) != 0)
        {
            int ret = io_uring_wait_cqe(&m_ring, &cqe);
            if (ret == -EINTR)
                continue;
            if (ret < 0)
            {
                LOG_ERROR(std::string("io_uring_wait_cqe: ") + std::strerror(-ret));
                break;
            }
        }

        // Drain every available CQE, then advance once
        unsigned head;
        unsigned count = 0;

        io_uring_for_each_cqe(&m_ring, head, cqe)
        {
            count++;

            auto* req = static_cast<io_request*>(io_uring_cqe_get_data(cqe));
            if (EMBERKV_UNLIKELY(req == &m_signal_req))
            {
                m_running = false;
                break;
            }

            if (EMBERKV_LIKELY(req != nullptr && req->owner != nullptr))
                req->owner->on_cqe(cqe);
        }

        io_uring_cq_advance(&m_ring, count);
    }

    m_running = false;
}

bool event_loop::submit_multishot_accept(int listen_fd, io_request* req)
{
    bool multishot = m_multishot_supported;
    return queue_sqe(req, [&](struct io_uring_sqe* sqe)
    {
        // One multishot SQE serves every incoming connection
        if (multishot)
            io_uring_prep_multishot_accept(sqe, listen_fd, nullptr, nullptr, SOCK_CLOEXEC);
        else
            io_uring_prep_accept(sqe, listen_fd, nullptr, nullptr, SOCK_CLOEXEC);
    });
}

bool event_loop::submit_read(int fd, char* buf, uint32_t len, io_request* req)
{
    return queue_sqe(req, [&](struct io_uring_sqe* sqe)
    {
        io_uring_prep_recv(sqe, fd, buf, len, 0);
    });
}

bool event_loop::submit_fd_read(int fd, char* buf, uint32_t len, io_request* req)
{
    return queue_sqe(req, [&](struct io_uring_sqe* sqe)
    {
        io_uring_prep_read(sqe, fd, buf, len, 0);
    });
}

bool event_loop::submit_write(int fd, const char* buf, uint32_t len, io_request* req)
{
    return queue_sqe(req, [&](struct io_uring_sqe* sqe)
    {
        // No SIGPIPE if the peer is already gone
        io_uring_prep_send(sqe, fd, buf, len, MSG_NOSIGNAL);
    });
}

bool event_loop::submit_writev(int fd, struct iovec* iovs, uint32_t count, io_request* req)
{
    return queue_sqe(req, [&](struct io_uring_sqe* sqe)
    {
        io_uring_prep_writev(sqe, fd, iovs, count, 0);
    });
}

bool event_loop::submit_cancel_fd(int fd)
{
    return queue_sqe(nullptr, [&](struct io_uring_sqe* sqe)
    {
        // A connection can have a read, a write and an eventfd read in flight
        io_uring_prep_cancel_fd(sqe, fd, IORING_ASYNC_CANCEL_ALL);
    });
}
