#pragma once
#include <unistd.h>
#include <utility>

// Sole owner of a descriptor: listener and client sockets, pub/sub eventfds,
// snapshot temp files. Move-only.
class scoped_fd
{
public:
    scoped_fd() noexcept = default;
    explicit scoped_fd(int fd) noexcept : m_fd(fd) {}
    ~scoped_fd() { reset(); }

    scoped_fd(scoped_fd&& other) noexcept : m_fd(other.release()) {}
    scoped_fd& operator=(scoped_fd&& other) noexcept
    {
        scoped_fd tmp(std::move(other));
        std::swap(m_fd, tmp.m_fd);
        return *this;
    }

    scoped_fd(const scoped_fd&) = delete;
    scoped_fd& operator=(const scoped_fd&) = delete;

    int get() const noexcept { return m_fd; }
    explicit operator bool() const noexcept { return m_fd >= 0; }

    // Gives up ownership; the caller closes the descriptor
    int release() noexcept { return std::exchange(m_fd, -1); }

    void reset(int fd = -1) noexcept
    {
        int old = std::exchange(m_fd, fd);
        if (old >= 0)
            ::close(old);
    }

    // Closes now and reports the result, for writes where a failed close
    // means lost data. Returns 0 when nothing was open.
    int close() noexcept
    {
        int old = release();
        return old >= 0 ? ::close(old) : 0;
    }

private:
    int m_fd{-1};
};
