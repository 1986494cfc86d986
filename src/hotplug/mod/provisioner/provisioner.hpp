#pragma once

#include <string>

#include "error/error.hpp"
#include "host/host.hpp"
#include "slot/slot.hpp"


/**
 *  @brief vCPU Provisioner Header
 *
 *  @details Defines the routines bringing a reserved slot up to a
 *  schedulable vCPU on the host, and tearing it down again on rollback
 */
namespace hotplug
{

namespace provisioner
{

class provisioner_t
{
public:
    explicit
    provisioner_t
    (
        host::host_t &host
    ) noexcept;

    [[nodiscard("Provisioning status must be checked")]]
    status_code
    provision
    (
        slot::slot_t &slot,
        std::string  &reason
    ) noexcept;

    [[nodiscard("Teardown status must be checked")]]
    status_code
    teardown
    (
        slot::slot_t &slot,
        std::string  &reason
    ) noexcept;

private:
    host::host_t &host;
};

} // provisioner namespace

} // hotplug namespace
