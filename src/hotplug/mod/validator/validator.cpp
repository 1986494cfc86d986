#include <cstddef>
#include <cstdlib>
#include <string>

#include "validator.hpp"


/**
 *  @brief Hotplug Request Bounds Check
 *
 *  @param current total: number of slots in the VM's vCPU set
 *  @param add count:     number of vCPUs requested
 *  @param max supported: capacity of the VM's vCPU set
 *  @param reason:        string reference to write rejection reason to
 *
 *  @details Rules are checked in order and the first failing one wins.
 *  No state is touched; callers log the rejection.
 *
 *  @return execution status code
 */
hotplug::status_code
hotplug::validator::validate
(
    std::size_t  current_total,
    std::size_t  add_count,
    std::size_t  max_supported,
    std::string &reason
) noexcept
{
    if (add_count == 0)
    {
        reason = hotplug::REASON_ADD_ZERO;
        return EXIT_FAILURE;
    }

    if (add_count >= max_supported)
    {
        reason = hotplug::REASON_ADD_LIMIT
            + std::to_string(max_supported) + ".";
        return EXIT_FAILURE;
    }

    if (current_total + add_count > max_supported)
    {
        reason = hotplug::REASON_CAPACITY;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
