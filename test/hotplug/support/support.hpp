#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdlib>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <log/record.hpp>

#include "error/error.hpp"
#include "host/host.hpp"
#include "notifier/notifier.hpp"
#include "slot/slot.hpp"


/**
 *  @brief Test Support Header
 *
 *  @details Defines the checks shared by test cases and scripted stand
 *  ins for the hypervisor and the guest notifier
 */
namespace test
{

// Checks may run on caller threads
static std::atomic<std::size_t> failures(0);

// Records a failed check and keeps going
inline
bool
expect
(
          bool         condition,
    const std::string &check
) noexcept
{
    if (!condition)
    {
        ++failures;
        util::log::record("Check failed: " + check, util::log::type::ERROR);
    }

    return condition;
}

inline
int
finish
(
    const std::string &name
) noexcept
{
    if (failures.load() != 0)
    {
        util::log::record
        (
            name + ": " + std::to_string(failures.load()) + " checks failed",
            util::log::type::ABORT
        );

        return EXIT_FAILURE;
    }

    util::log::record(name + ": OK", util::log::type::STOP);

    return EXIT_SUCCESS;
}

// Polls a guest visible condition until it holds or the timeout passes
inline
bool
eventually
(
    const std::function<bool()>     &condition,
          std::chrono::milliseconds  timeout
)
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (condition())
            return true;

        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    return condition();
}

constexpr hotplug::slot::ordinal_t NEVER = static_cast<std::size_t>(-1);


/**
 *  @brief Scripted vCPU Host
 *
 *  @details Keeps the set of live vCPU contexts and their pins and logs
 *  every call. Creation, pinning and destruction can be failed at a
 *  chosen ordinal, and a creation can be held until released to keep a
 *  hotplug in flight.
 */
class host_t: public hotplug::host::host_t
{
public:
    explicit
    host_t
    (
        std::size_t boot_count,
        std::size_t number_of_pCPUs = 4
    ):
        number_of_pCPUs(number_of_pCPUs)
    {
        for (hotplug::slot::ordinal_t ordinal = 0; ordinal < boot_count; ++ordinal)
            live.insert(ordinal);
    }

    hotplug::status_code
    create
    (
        hotplug::slot::ordinal_t  ordinal,
        std::string              &reason
    ) noexcept override
    {
        std::unique_lock<std::mutex> lock(mutex);

        calls.push_back("create " + std::to_string(ordinal));
        entered = true;
        changed.notify_all();
        changed.wait(lock, [this] { return !holding; });

        if (ordinal == fail_create_at)
        {
            reason = "out of vCPU contexts";
            return EXIT_FAILURE;
        }
        if (live.count(ordinal) != 0)
        {
            reason = "vCPU " + std::to_string(ordinal) + " already live";
            return EXIT_FAILURE;
        }

        live.insert(ordinal);

        return EXIT_SUCCESS;
    }

    hotplug::status_code
    pin
    (
        hotplug::slot::ordinal_t  ordinal,
        hotplug::slot::pcpu_t     pCPU_rank,
        std::string              &reason
    ) noexcept override
    {
        std::lock_guard<std::mutex> guard(mutex);

        calls.push_back
        (
            "pin " + std::to_string(ordinal) + " " + std::to_string(pCPU_rank)
        );
        if (ordinal == fail_pin_at)
        {
            reason = "scheduler refused vCPU";
            return EXIT_FAILURE;
        }

        pins[ordinal] = pCPU_rank;

        return EXIT_SUCCESS;
    }

    hotplug::status_code
    destroy
    (
        hotplug::slot::ordinal_t  ordinal,
        std::string              &reason
    ) noexcept override
    {
        std::lock_guard<std::mutex> guard(mutex);

        calls.push_back("destroy " + std::to_string(ordinal));
        if (ordinal == fail_destroy_at)
        {
            reason = "vCPU " + std::to_string(ordinal) + " did not stop";
            return EXIT_FAILURE;
        }
        if (live.erase(ordinal) == 0)
        {
            reason = "vCPU " + std::to_string(ordinal) + " is not live";
            return EXIT_FAILURE;
        }
        pins.erase(ordinal);

        return EXIT_SUCCESS;
    }

    std::size_t
    pcpu_count() noexcept override
    {
        return number_of_pCPUs;
    }

    hotplug::status_code
    live_count
    (
        std::size_t &number_of_vCPUs,
        std::string &reason
    ) noexcept override
    {
        std::lock_guard<std::mutex> guard(mutex);

        if (fail_live_count)
        {
            reason = "domain not responding";
            return EXIT_FAILURE;
        }
        number_of_vCPUs = live.size() + live_offset;

        return EXIT_SUCCESS;
    }

    // Hold creations until released
    void
    hold()
    {
        std::lock_guard<std::mutex> guard(mutex);
        holding = true;
        entered = false;
    }

    void
    release()
    {
        std::lock_guard<std::mutex> guard(mutex);
        holding = false;
        changed.notify_all();
    }

    // Wait until a creation is in progress
    bool
    wait_entered
    (
        std::chrono::milliseconds timeout
    )
    {
        std::unique_lock<std::mutex> lock(mutex);
        return changed.wait_for(lock, timeout, [this] { return entered; });
    }

    std::vector<std::string>
    history()
    {
        std::lock_guard<std::mutex> guard(mutex);
        return calls;
    }

    std::size_t
    live_size()
    {
        std::lock_guard<std::mutex> guard(mutex);
        return live.size();
    }

    std::size_t
    pin_count()
    {
        std::lock_guard<std::mutex> guard(mutex);
        return pins.size();
    }

    hotplug::slot::ordinal_t fail_create_at  = NEVER;
    hotplug::slot::ordinal_t fail_pin_at     = NEVER;
    hotplug::slot::ordinal_t fail_destroy_at = NEVER;
    bool                     fail_live_count = false;
    std::size_t              live_offset     = 0;

private:
    std::mutex                                               mutex;
    std::condition_variable                                  changed;
    bool                                                     holding = false;
    bool                                                     entered = false;
    std::size_t                                              number_of_pCPUs;
    std::set<hotplug::slot::ordinal_t>                       live;
    std::map<hotplug::slot::ordinal_t, hotplug::slot::pcpu_t> pins;
    std::vector<std::string>                                 calls;
};


/**
 *  @brief Scripted Guest Notifier
 *
 *  @details Counts notifications and fails them on request
 */
class notifier_t: public hotplug::notifier::notifier_t
{
public:
    hotplug::status_code
    notify
    (
        std::size_t  new_total,
        std::string &reason
    ) noexcept override
    {
        ++calls;
        last_total = new_total;
        if (fail)
        {
            reason = "guest event line closed";
            return EXIT_FAILURE;
        }

        return EXIT_SUCCESS;
    }

    const char *
    name() const noexcept override
    {
        return "scripted";
    }

    bool        fail       = false;
    std::size_t calls      = 0;
    std::size_t last_total = 0;
};

} // test namespace
