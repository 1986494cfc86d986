#pragma once

#include <cerrno>
#include <cstdint>

#include <poll.h>
#include <sys/eventfd.h>
#include <unistd.h>


/**
 *  @brief C System call wrapper
 *
 *  @details Wraps the eventfd system call in a namespace with an owning
 *  handle. An event line is how the VMM raises a guest interrupt: the
 *  descriptor is handed to the interrupt controller (KVM irqfd) and a
 *  write injects the interrupt.
 */
namespace os
{

namespace event
{

using descriptor_t = int;
using counter_t    = std::uint64_t;

constexpr descriptor_t INVALID = -1;

typedef struct line_t
{
    // Opens a non-blocking descriptor
    line_t() noexcept:
        descriptor(::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC))
    {}

    // Adopts an existing descriptor
    explicit
    line_t(descriptor_t descriptor) noexcept:
        descriptor(descriptor)
    {}

    ~line_t()
    {
        if (descriptor != INVALID)
            ::close(descriptor);
    }

    line_t(line_t &&other) noexcept:
        descriptor(other.descriptor)
    {
        other.descriptor = INVALID;
    }

    line_t &operator=(line_t &&other) noexcept
    {
        if (this != &other)
        {
            if (descriptor != INVALID)
                ::close(descriptor);

            descriptor = other.descriptor;
            other.descriptor = INVALID;
        }

        return *this;
    }

    line_t(const line_t &line)            = delete;
    line_t &operator=(const line_t &line) = delete;

    [[nodiscard("Must use validity to call")]]
    bool
    valid() const noexcept
    {
        return descriptor != INVALID;
    }

    // Add one to the counter; returns errno or zero
    [[nodiscard("Event trigger status must be checked")]]
    int
    trigger() const noexcept
    {
        const counter_t value = 1;
        if (::write(descriptor, &value, sizeof(value)) != sizeof(value))
            return errno != 0 ? errno : EIO;

        return 0;
    }

    // Wait up to timeout milliseconds and drain the counter
    [[nodiscard("Must use drained count to call")]]
    counter_t
    wait(int timeout) const noexcept
    {
        ::pollfd target {descriptor, POLLIN, 0};
        if (::poll(&target, 1, timeout) <= 0)
            return 0;

        counter_t value = 0;
        if (::read(descriptor, &value, sizeof(value)) != sizeof(value))
            return 0;

        return value;
    }

    descriptor_t descriptor;
} line_t;

} // event namespace

} // os namespace
