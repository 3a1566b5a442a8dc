#pragma once
#include <cstdint>

// Branch prediction hints for hot-path optimization
#ifndef EMBERKV_LIKELY
#define EMBERKV_LIKELY(x)   __builtin_expect(!!(x), 1)
#endif
#ifndef EMBERKV_UNLIKELY
#define EMBERKV_UNLIKELY(x) __builtin_expect(!!(x), 0)
#endif

class io_handler
{
public:
    virtual ~io_handler() = default;
    virtual void on_cqe(struct io_uring_cqe* cqe) = 0;
};

enum op_type : uint8_t
{
    op_accept      = 0,
    op_read        = 1,
    op_write       = 2,
    op_writev      = 3,
    op_notify_read = 4     // eventfd read signalling queued pub/sub messages
};

struct io_request
{
    io_handler* owner;
    char* buffer;
    int fd;
    uint32_t length;
    op_type type;
};
