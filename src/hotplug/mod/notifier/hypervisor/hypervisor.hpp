#pragma once

#include <cstddef>
#include <string>

#include "error/error.hpp"
#include "host/host.hpp"
#include "notifier/notifier.hpp"


/**
 *  @brief Hypervisor Delegated Notifier Header
 *
 *  @details Defines the notifier for hosts whose device model raises the
 *  guest's CPU hotplug event itself as each vCPU is created, as QEMU does
 *  for libvirt domains. Notification confirms the hypervisor presents
 *  the expected number of vCPUs to the guest.
 */
namespace hotplug
{

namespace notifier
{

class hypervisor_t: public notifier_t
{
public:
    explicit
    hypervisor_t
    (
        host::host_t &host
    ) noexcept;

    [[nodiscard("Notification status must be checked")]]
    status_code
    notify
    (
        std::size_t  new_total,
        std::string &reason
    ) noexcept override;

    [[nodiscard("Must use notifier name to call")]]
    const char *
    name() const noexcept override;

private:
    host::host_t &host;
};

} // notifier namespace

} // hotplug namespace
