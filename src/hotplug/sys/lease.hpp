#pragma once

#include <atomic>


namespace hotplug
{

/**
 *  @brief Hotplug Lease
 *
 *  @details Scoped, non-blocking claim on a VM's hotplug guard. The
 *  claim is a single compare and exchange, so it fails only when the
 *  guard is already taken. A lease that could not be claimed is not held
 *  and releases nothing; a held lease is released when it leaves scope
 *  on every exit path.
 */
class lease_t
{
public:
    explicit
    lease_t
    (
        std::atomic<bool> &guard
    ) noexcept:
        guard(guard),
        owned(claim(guard))
    {}

    ~lease_t()
    {
        if (owned)
            guard.store(false, std::memory_order_release);
    }

    lease_t(const lease_t &lease)            = delete;
    lease_t &operator=(const lease_t &lease) = delete;

    [[nodiscard("Must check lease was acquired")]]
    bool
    held() const noexcept
    {
        return owned;
    }

private:
    static bool
    claim
    (
        std::atomic<bool> &guard
    ) noexcept
    {
        bool expected = false;
        return guard.compare_exchange_strong(expected, true, std::memory_order_acquire);
    }

    std::atomic<bool> &guard;
    bool               owned;
};

} // hotplug namespace
