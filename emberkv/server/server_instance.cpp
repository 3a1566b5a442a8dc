#include "server_instance.h"
#include "reply.h"
#include "../shared/logging.h"

#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <liburing.h>

server_instance::server_instance(dispatcher& disp, std::string bind_addr, uint16_t port)
    : m_dispatcher(disp)
    , m_bind_addr(std::move(bind_addr))
    , m_port(port)
{
}

server_instance::~server_instance()
{
    for (auto& [fd, conn] : m_clients)
        close(fd);
}

bool server_instance::setup(event_loop& loop)
{
    m_loop = &loop;

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(m_port);
    if (inet_pton(AF_INET, m_bind_addr.c_str(), &addr.sin_addr) != 1)
    {
        LOG_ERROR("invalid bind address '" + m_bind_addr + "'");
        return false;
    }

    // Only kept once listening succeeds
    scoped_fd listener(socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0));
    if (!listener)
    {
        LOG_ERROR(std::string("socket: ") + std::strerror(errno));
        return false;
    }

    int opt = 1;
    setsockopt(listener.get(), SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
    setsockopt(listener.get(), IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt));

    std::string where = m_bind_addr + ":" + std::to_string(m_port);
    if (bind(listener.get(), reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0)
    {
        LOG_ERROR("bind " + where + ": " + std::strerror(errno));
        return false;
    }
    if (listen(listener.get(), SOMAXCONN) < 0)
    {
        LOG_ERROR("listen " + where + ": " + std::strerror(errno));
        return false;
    }

    // Port 0 asks the kernel to pick one
    socklen_t len = sizeof(addr);
    if (m_port == 0 && getsockname(listener.get(), reinterpret_cast<struct sockaddr*>(&addr), &len) == 0)
        m_port = ntohs(addr.sin_port);

    m_multishot_active = loop.multishot_supported();
    m_accept_req = { this, nullptr, listener.get(), 0, op_accept };
    if (!loop.submit_multishot_accept(listener.get(), &m_accept_req))
        return false;

    m_listener = std::move(listener);
    LOG_INFO("listening on " + m_bind_addr + ":" + std::to_string(m_port));
    return true;
}

void server_instance::teardown(event_loop& loop)
{
    (void)loop;

    // Shutdown before close so the pending accept completes right away
    if (m_listener)
    {
        shutdown(m_listener.get(), SHUT_RDWR);
        m_listener.reset();
    }

    // Best-effort blocking flush of anything still queued
    for (auto& [fd, conn] : m_clients)
    {
        if (!conn->response_buf.empty())
            if (::write(fd, conn->response_buf.data(), conn->response_buf.size()) < 0)
                continue;
        while (!conn->write_queue.empty())
        {
            auto& msg = conn->write_queue.front();
            if (::write(fd, msg.data(), msg.size()) < 0)
                break;
            conn->write_queue.pop_front();
        }
    }

    for (auto& [fd, conn] : m_clients)
    {
        m_dispatcher.end_session(conn->sess);
        shutdown(fd, SHUT_RDWR);
        close(fd);
    }
    // The ring is torn down right after this, so no CQE can reach these again
    m_clients.clear();

    m_loop = nullptr;
    m_multishot_active = false;
}

client_connection* server_instance::lookup(int fd) const
{
    auto it = m_clients.find(fd);
    return it != m_clients.end() ? it->second.get() : nullptr;
}

void server_instance::on_cqe(struct io_uring_cqe* cqe)
{
    auto* req = static_cast<io_request*>(io_uring_cqe_get_data(cqe));
    if (!req || !m_loop)
        return;

    if (req->type == op_accept)
    {
        handle_accept(cqe);
        return;
    }

    client_connection* conn = lookup(req->fd);
    if (!conn)
        return;

    switch (req->type)
    {
        case op_read:
            handle_read(cqe, conn);
            break;
        case op_write:
        case op_writev:
            handle_write(cqe, conn);
            break;
        case op_notify_read:
            handle_notify(cqe, conn);
            break;
        default:
            break;
    }
}

void server_instance::handle_accept(struct io_uring_cqe* cqe)
{
    int client_fd = cqe->res;

    if (client_fd >= 0)
    {
        if (m_max_connections > 0 && m_clients.size() >= m_max_connections)
        {
            LOG_WARN("max connections reached, rejecting client");
            close(client_fd);
        }
        else
        {
            int opt = 1;
            setsockopt(client_fd, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt));

            auto conn = std::make_unique<client_connection>();
            conn->fd = client_fd;
            conn->partial.reserve(4096);
            conn->response_buf.reserve(4096);
            conn->read_req = { this, conn->read_buf, client_fd, sizeof(conn->read_buf), op_read };
            conn->write_req = { this, nullptr, client_fd, 0, op_write };
            // Carries the socket fd so the completion maps back to this connection
            conn->notify_req = { this, reinterpret_cast<char*>(&conn->notify_buf), client_fd,
                                 sizeof(conn->notify_buf), op_notify_read };

            auto* ptr = conn.get();
            m_clients[client_fd] = std::move(conn);
            LOG_DEBUG("client connected (fd " + std::to_string(client_fd) + ")");

            ptr->read_pending = m_loop->submit_read(client_fd, ptr->read_buf,
                                                    sizeof(ptr->read_buf), &ptr->read_req);
            if (!ptr->read_pending)
            {
                begin_close(ptr);
                release_if_idle(ptr);
            }
        }
    }
    else if (client_fd != -ECANCELED)
    {
        LOG_WARN(std::string("accept: ") + std::strerror(-client_fd));
    }

    if (!m_listener)
        return;
    if (!m_multishot_active || !(cqe->flags & IORING_CQE_F_MORE))
    {
        if (!m_loop->submit_multishot_accept(m_listener.get(), &m_accept_req))
            LOG_ERROR("could not re-arm accept; no new clients will be served");
    }
}

void server_instance::handle_read(struct io_uring_cqe* cqe, client_connection* conn)
{
    conn->read_pending = false;

    if (cqe->res <= 0 || conn->closing)
    {
        begin_close(conn);
        release_if_idle(conn);
        return;
    }

    conn->partial.append(conn->read_buf, static_cast<size_t>(cqe->res));

    size_t scan_from = 0;
    size_t pos;
    while (!conn->sess.quit && (pos = conn->partial.find('\n', scan_from)) != std::string::npos)
    {
        std::string_view line(conn->partial.data() + scan_from, pos - scan_from);

        if (!line.empty() && line.back() == '\r')
            line.remove_suffix(1);

        process_line(conn, line);

        scan_from = pos + 1;
    }

    if (scan_from > 0)
    {
        if (scan_from >= conn->partial.size())
            conn->partial.clear();
        else
            conn->partial.erase(0, scan_from);
    }

    bool too_long = conn->partial.size() > client_connection::MAX_PARTIAL_SIZE;
    if (too_long)
    {
        append_reply(conn->response_buf, reply::make_error("ERR request line too long"));
        conn->partial.clear();
    }

    arm_notify(conn);
    flush_responses(conn);

    if (conn->sess.quit || too_long)
    {
        begin_close(conn);
        release_if_idle(conn);
        return;
    }

    if (!conn->closing)
    {
        conn->read_pending = m_loop->submit_read(conn->fd, conn->read_buf,
                                                 sizeof(conn->read_buf), &conn->read_req);
        if (conn->read_pending)
            return;
        begin_close(conn);
    }
    release_if_idle(conn);
}

void server_instance::handle_write(struct io_uring_cqe* cqe, client_connection* conn)
{
    conn->write_pending = false;

    if (cqe->res < 0)
    {
        for (uint32_t i = 0; i < conn->write_batch_count; i++)
            conn->write_batch[i] = {};
        conn->write_batch_count = 0;
        begin_close(conn);
        release_if_idle(conn);
        return;
    }

    // Requeue whatever a short write left behind, in order
    size_t written = static_cast<size_t>(cqe->res);
    uint32_t first_unsent = conn->write_batch_count;
    for (uint32_t i = 0; i < conn->write_batch_count; i++)
    {
        size_t len = conn->write_batch[i].size();
        if (written >= len)
        {
            written -= len;
            continue;
        }
        conn->write_batch[i].erase(0, written);
        first_unsent = i;
        break;
    }
    for (uint32_t i = conn->write_batch_count; i > first_unsent; i--)
        conn->write_queue.push_front(std::move(conn->write_batch[i - 1]));

    for (uint32_t i = 0; i < conn->write_batch_count; i++)
        conn->write_batch[i] = {};
    conn->write_batch_count = 0;

    flush_write_queue(conn);
    release_if_idle(conn);
}

void server_instance::handle_notify(struct io_uring_cqe* cqe, client_connection* conn)
{
    conn->notify_pending = false;

    if (conn->closing)
    {
        release_if_idle(conn);
        return;
    }

    // Nothing else re-arms the eventfd, so a subscriber that lost it is dropped
    if (cqe->res < 0)
    {
        LOG_WARN("client fd " + std::to_string(conn->fd) + ": pub/sub notify read failed: " +
                 std::strerror(-cqe->res));
        begin_close(conn);
        release_if_idle(conn);
        return;
    }

    deliver_messages(conn);
    arm_notify(conn);
    flush_responses(conn);
    release_if_idle(conn);
}

void server_instance::process_line(client_connection* conn, std::string_view line)
{
    reply r = m_dispatcher.execute_line(conn->sess, line);
    append_reply(conn->response_buf, r);
}

void server_instance::arm_notify(client_connection* conn)
{
    if (conn->closing || conn->notify_pending || !conn->sess.receiver)
        return;

    int efd = conn->sess.receiver.fd();
    if (efd < 0)
        return;

    conn->notify_pending = m_loop->submit_fd_read(efd, reinterpret_cast<char*>(&conn->notify_buf),
                                                  sizeof(conn->notify_buf), &conn->notify_req);
    if (!conn->notify_pending)
        LOG_WARN("client fd " + std::to_string(conn->fd) + ": pub/sub delivery paused, ring full");
}

void server_instance::deliver_messages(client_connection* conn)
{
    for (const auto& msg : conn->sess.receiver.drain())
        append_reply(conn->response_buf, message_reply(msg));
}

void server_instance::flush_responses(client_connection* conn)
{
    if (conn->response_buf.empty() || !m_loop || conn->closing)
        return;

    if (conn->write_queue.size() >= client_connection::MAX_WRITE_QUEUE)
    {
        LOG_WARN("client fd " + std::to_string(conn->fd) + " is not reading, dropping it");
        begin_close(conn);
        return;
    }

    conn->write_queue.push_back(std::move(conn->response_buf));
    conn->response_buf.clear();
    conn->response_buf.reserve(4096);

    if (!conn->write_pending)
        flush_write_queue(conn);
}

void server_instance::flush_write_queue(client_connection* conn)
{
    if (!m_loop || conn->write_queue.empty())
        return;

    uint32_t count = 0;
    while (!conn->write_queue.empty() && count < client_connection::MAX_WRITE_BATCH)
    {
        conn->write_batch[count] = std::move(conn->write_queue.front());
        conn->write_queue.pop_front();

        conn->write_iovs[count].iov_base = conn->write_batch[count].data();
        conn->write_iovs[count].iov_len  = conn->write_batch[count].size();
        count++;
    }

    conn->write_batch_count = count;

    if (count == 1)
    {
        conn->write_req.type = op_write;
        conn->write_pending = m_loop->submit_write(conn->fd, conn->write_batch[0].data(),
            static_cast<uint32_t>(conn->write_batch[0].size()), &conn->write_req);
    }
    else
    {
        conn->write_req.type = op_writev;
        conn->write_pending = m_loop->submit_writev(conn->fd, conn->write_iovs, count, &conn->write_req);
    }

    if (!conn->write_pending)
    {
        for (uint32_t i = 0; i < count; i++)
            conn->write_batch[i] = {};
        conn->write_batch_count = 0;
        begin_close(conn);
    }
}

void server_instance::begin_close(client_connection* conn)
{
    if (conn->closing)
        return;
    conn->closing = true;

    // Stop deliveries now; the receiver itself lives until release
    if (conn->sess.sub_id != 0)
        m_dispatcher.pubsub_ref()->remove_subscriber(conn->sess.sub_id);

    // The eventfd read would otherwise wait for a message that never comes
    if (conn->notify_pending && !m_loop->submit_cancel_fd(conn->sess.receiver.fd()))
        LOG_ERROR("client fd " + std::to_string(conn->fd) + ": could not cancel pub/sub read");
    if (conn->read_pending)
        shutdown(conn->fd, SHUT_RD);
}

void server_instance::release_if_idle(client_connection* conn)
{
    if (!conn->closing || conn->read_pending || conn->write_pending || conn->notify_pending)
        return;

    int fd = conn->fd;
    m_dispatcher.end_session(conn->sess);
    close(fd);
    LOG_DEBUG("client disconnected (fd " + std::to_string(fd) + ")");
    m_clients.erase(fd);
}
