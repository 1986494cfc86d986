#include <cstddef>
#include <cstdlib>
#include <string>

#include <log/record.hpp>

#include "hypervisor.hpp"


hotplug::notifier::hypervisor_t::hypervisor_t
(
    hotplug::host::host_t &host
) noexcept:
    host(host)
{}


/**
 *  @brief Hypervisor Hotplug Confirmation
 *
 *  @param new total: number of vCPUs expected to be live
 *  @param reason:    string reference to write failure reason to
 *
 *  @return execution status code
 */
hotplug::status_code
hotplug::notifier::hypervisor_t::notify
(
    std::size_t  new_total,
    std::string &reason
) noexcept
{
    std::size_t number_of_vCPUs = 0;
    hotplug::status_code status = host.live_count(number_of_vCPUs, reason);
    if (static_cast<bool>(status))
    {
        reason = "Unable to query live vCPUs from hypervisor: " + reason;
        return EXIT_FAILURE;
    }

    if (number_of_vCPUs != new_total)
    {
        reason = "Hypervisor presents " + std::to_string(number_of_vCPUs)
            + " vCPUs to the guest, expected " + std::to_string(new_total);
        return EXIT_FAILURE;
    }

    util::log::record
    (
        "Hypervisor presents " + std::to_string(new_total)
            + " vCPUs to the guest"
    );

    return EXIT_SUCCESS;
}


const char *
hotplug::notifier::hypervisor_t::name() const noexcept
{
    return "hypervisor";
}
