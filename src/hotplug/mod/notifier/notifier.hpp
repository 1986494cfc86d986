#pragma once

#include <cstddef>
#include <string>

#include "error/error.hpp"


/**
 *  @brief Guest Notifier Header
 *
 *  @details Defines the capability through which the guest kernel is told
 *  new CPU devices are present. The variant is chosen once, by whoever
 *  constructs the VM: hypervisor_t where the hypervisor owns the ACPI
 *  device model, acpi_t where the VMM does and hands over an event line
 *  it has already wired to the guest. Notification is fire and forget:
 *  the guest is never waited on and a failed notification is not retried.
 */
namespace hotplug
{

namespace notifier
{

class notifier_t
{
public:
    virtual ~notifier_t() = default;

    [[nodiscard("Notification status must be checked")]]
    virtual status_code
    notify
    (
        std::size_t  new_total,
        std::string &reason
    ) noexcept = 0;

    [[nodiscard("Must use notifier name to call")]]
    virtual const char *
    name() const noexcept = 0;
};

} // notifier namespace

} // hotplug namespace
