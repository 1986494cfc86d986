#pragma once

#include <chrono>

#include <stat/statistics.hpp>


/**
 *  @brief Elapsed Time Utility Header
 *
 *  @details Measures durations of API calls on the monotonic clock
 */
namespace util
{

namespace time
{

using clock_t = std::chrono::steady_clock;

typedef struct stopwatch_t
{
    stopwatch_t() noexcept:
        start(clock_t::now())
    {}

    // Microseconds since construction
    [[nodiscard("Must use elapsed time to call")]]
    util::stat::usec_t
    elapsed() const noexcept
    {
        return static_cast<util::stat::usec_t>
        (
            std::chrono::duration_cast<std::chrono::microseconds>
            (
                clock_t::now() - start
            ).count()
        );
    }

    clock_t::time_point start;
} stopwatch_t;

} // time namespace

} // util namespace
