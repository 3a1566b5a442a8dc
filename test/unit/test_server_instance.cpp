#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include "../../emberkv/server/server_instance.h"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <thread>
#include <unistd.h>

namespace
{
    // Loopback server on a kernel-picked port, served from a background thread
    struct server_fixture
    {
        keyspace_handle ks = make_shared_keyspace();
        pubsub_handle pubsub = std::make_shared<pubsub_registry>();
        dispatcher disp{ks, pubsub, nullptr, std::string{}};
        event_loop loop{256};
        server_instance srv{disp, "127.0.0.1", 0};
        std::thread runner;
        bool ready{false};

        server_fixture()
        {
            ready = loop.init() && srv.setup(loop);
            if (ready)
                runner = std::thread([this] { loop.run(); });
        }

        ~server_fixture()
        {
            stop();
            srv.teardown(loop);
        }

        void stop()
        {
            if (!runner.joinable())
                return;
            char byte = 1;
            CHECK(::write(loop.get_signal_write_fd(), &byte, 1) == 1);
            runner.join();
        }

        scoped_fd connect_client() const
        {
            scoped_fd fd(socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0));
            REQUIRE(fd);

            struct timeval tv{5, 0};
            setsockopt(fd.get(), SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

            struct sockaddr_in addr{};
            addr.sin_family = AF_INET;
            addr.sin_port = htons(srv.get_port());
            inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
            REQUIRE(connect(fd.get(), reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) == 0);
            return fd;
        }
    };

    void send_line(const scoped_fd& fd, std::string_view text)
    {
        REQUIRE(::send(fd.get(), text.data(), text.size(), MSG_NOSIGNAL) ==
                static_cast<ssize_t>(text.size()));
    }

    // Reads until `needle` shows up, the peer closes, or the receive timeout hits
    std::string read_until(const scoped_fd& fd, std::string_view needle)
    {
        std::string out;
        char buf[1024];
        while (out.find(needle) == std::string::npos)
        {
            ssize_t n = ::recv(fd.get(), buf, sizeof(buf), 0);
            if (n <= 0)
                break;
            out.append(buf, static_cast<size_t>(n));
        }
        return out;
    }

    // The server's end of a loopback connection is the socket whose peer is
    // the client's local address
    int accepted_fd_for(const scoped_fd& client)
    {
        struct sockaddr_in local{};
        socklen_t len = sizeof(local);
        if (getsockname(client.get(), reinterpret_cast<struct sockaddr*>(&local), &len) != 0)
            return -1;

        for (int fd = 0; fd < 4096; ++fd)
        {
            if (fd == client.get())
                continue;
            struct sockaddr_in peer{};
            socklen_t peer_len = sizeof(peer);
            if (getpeername(fd, reinterpret_cast<struct sockaddr*>(&peer), &peer_len) != 0)
                continue;
            if (peer.sin_family == AF_INET && peer.sin_port == local.sin_port &&
                peer.sin_addr.s_addr == local.sin_addr.s_addr)
                return fd;
        }
        return -1;
    }
}

TEST_CASE("scoped_fd ownership")
{
    int fds[2];
    REQUIRE(::pipe(fds) == 0);
    scoped_fd read_end(fds[0]);
    scoped_fd write_end(fds[1]);

    scoped_fd moved(std::move(read_end));
    CHECK_FALSE(read_end);
    CHECK(moved.get() == fds[0]);

    CHECK(write_end.close() == 0);
    CHECK_FALSE(write_end);
    CHECK(write_end.close() == 0);

    // The write end is gone, so the read end sees EOF
    char byte;
    CHECK(::read(moved.get(), &byte, 1) == 0);

    int raw = moved.release();
    CHECK_FALSE(moved);
    CHECK(::close(raw) == 0);
}

TEST_CASE("commands round trip over tcp")
{
    server_fixture f;
    if (!f.ready)
    {
        MESSAGE("io_uring unavailable, skipping");
        return;
    }

    auto client = f.connect_client();
    send_line(client, "PING\r\nSET greeting hello\nGET greeting\n");
    CHECK(read_until(client, "\"hello\"\n") == "PONG\nOK\n\"hello\"\n");

    send_line(client, "KEYS\n");
    CHECK(read_until(client, "\n") == "1) \"greeting\"\n");
}

TEST_CASE("published messages reach a subscribed client")
{
    server_fixture f;
    if (!f.ready)
    {
        MESSAGE("io_uring unavailable, skipping");
        return;
    }

    auto listener = f.connect_client();
    send_line(listener, "SUBSCRIBE news\n");
    CHECK(read_until(listener, "(integer) 1\n") ==
          "1) \"subscribe\"\n2) \"news\"\n3) (integer) 1\n");

    auto publisher = f.connect_client();
    send_line(publisher, "PUBLISH news hi there\n");
    CHECK(read_until(publisher, "\n") == "(integer) 1\n");

    CHECK(read_until(listener, "there\"\n") ==
          "1) \"message\"\n2) \"news\"\n3) \"hi there\"\n");
}

TEST_CASE("a failed notify read drops the subscriber")
{
    server_fixture f;
    if (!f.ready)
    {
        MESSAGE("io_uring unavailable, skipping");
        return;
    }

    auto listener = f.connect_client();
    send_line(listener, "SUBSCRIBE news\n");
    REQUIRE(read_until(listener, "(integer) 1\n").find("(integer) 1\n") != std::string::npos);
    CHECK(f.pubsub->numsub("news") == 1);

    // With the loop stopped, hand the server an eventfd read that failed
    f.stop();
    int server_fd = accepted_fd_for(listener);
    REQUIRE(server_fd >= 0);

    io_request notify{ &f.srv, nullptr, server_fd, sizeof(uint64_t), op_notify_read };
    struct io_uring_cqe cqe;
    std::memset(&cqe, 0, sizeof(cqe));
    cqe.user_data = reinterpret_cast<uintptr_t>(&notify);
    cqe.res = -EIO;
    f.srv.on_cqe(&cqe);

    CHECK(f.pubsub->numsub("news") == 0);
    CHECK(f.pubsub->publish("news", "lost") == 0);
}
