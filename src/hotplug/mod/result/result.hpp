#pragma once

#include <cstddef>

#include <stat/statistics.hpp>


namespace hotplug
{

// Outcome of a hotplug call as seen by the API caller
typedef struct result_t
{
    std::size_t        added_count    = 0;
    std::size_t        new_total      = 0;
    bool               guest_notified = false;
    util::stat::usec_t duration       = 0;
} result_t;

} // hotplug namespace
