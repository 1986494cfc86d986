#include <cstddef>
#include <cstdlib>
#include <string>

#include <log/record.hpp>

#include "provisioner.hpp"


hotplug::provisioner::provisioner_t::provisioner_t
(
    hotplug::host::host_t &host
) noexcept:
    host(host)
{}


/**
 *  @brief vCPU Provisioner
 *
 *  @param slot:   reserved slot to bring up
 *  @param reason: string reference to write failure reason to
 *
 *  @details Creates the slot's execution context on the host and attaches
 *  it to the scheduler by pinning it to pCPU (ordinal mod pCPU count), so
 *  placement is reproducible for a fixed request. A context created before
 *  a failed pin is destroyed again so nothing stays registered; when that
 *  release fails too the slot stays provisioned so its teardown is retried.
 *
 *  @return execution status code
 */
hotplug::status_code
hotplug::provisioner::provisioner_t::provision
(
    hotplug::slot::slot_t &slot,
    std::string           &reason
) noexcept
{
    hotplug::status_code status;
    const std::string    vCPU_name = "vCPU " + std::to_string(slot.ordinal);

    if (slot.state != hotplug::slot::state_t::RESERVED)
    {
        reason = vCPU_name + " is "
            + hotplug::slot::state_name(slot.state) + ", not reserved";
        return EXIT_FAILURE;
    }

    // Scheduler must have somewhere to place the vCPU
    const std::size_t number_of_pCPUs = host.pcpu_count();
    if (number_of_pCPUs == 0)
    {
        slot.state = hotplug::slot::state_t::FAILED;
        reason = "no pCPUs available to schedule " + vCPU_name;

        return EXIT_FAILURE;
    }

    // Allocate execution context
    status = host.create(slot.ordinal, reason);
    if (static_cast<bool>(status))
    {
        slot.state = hotplug::slot::state_t::FAILED;
        util::log::record
        (
            "Unable to create " + vCPU_name + ": " + reason,
            util::log::type::ERROR
        );

        return EXIT_FAILURE;
    }

    // Attach to scheduler
    const hotplug::slot::pcpu_t pCPU_rank = slot.ordinal % number_of_pCPUs;
    status = host.pin(slot.ordinal, pCPU_rank, reason);
    if (static_cast<bool>(status))
    {
        util::log::record
        (
            "Unable to pin " + vCPU_name + " to pCPU "
                + std::to_string(pCPU_rank) + ": " + reason,
            util::log::type::ERROR
        );

        std::string destroy_reason;
        if (static_cast<bool>(host.destroy(slot.ordinal, destroy_reason)))
        {
            util::log::record
            (
                "Unable to release " + vCPU_name + " after failed pin: "
                    + destroy_reason,
                util::log::type::ERROR
            );

            reason += "; " + destroy_reason;

            // Context is still held, rollback retries its release
            slot.state = hotplug::slot::state_t::PROVISIONED;
            return EXIT_FAILURE;
        }

        slot.state = hotplug::slot::state_t::FAILED;

        return EXIT_FAILURE;
    }

    slot.pCPU_rank = pCPU_rank;
    slot.state     = hotplug::slot::state_t::PROVISIONED;

    return EXIT_SUCCESS;
}


/**
 *  @brief vCPU Teardown
 *
 *  @param slot:   slot to release
 *  @param reason: string reference to write failure reason to
 *
 *  @details Destroys the execution context of a provisioned or running
 *  slot. A failed slot already released what it held.
 *
 *  @return execution status code
 */
hotplug::status_code
hotplug::provisioner::provisioner_t::teardown
(
    hotplug::slot::slot_t &slot,
    std::string           &reason
) noexcept
{
    switch (slot.state)
    {
    case hotplug::slot::state_t::RESERVED:
    case hotplug::slot::state_t::FAILED:
        slot.pCPU_rank = hotplug::slot::NO_PCPU;
        return EXIT_SUCCESS;

    case hotplug::slot::state_t::PROVISIONED:
    case hotplug::slot::state_t::RUNNING:
        break;
    }

    hotplug::status_code status = host.destroy(slot.ordinal, reason);
    if (static_cast<bool>(status))
    {
        util::log::record
        (
            "Unable to destroy vCPU " + std::to_string(slot.ordinal)
                + ": " + reason,
            util::log::type::ERROR
        );

        return EXIT_FAILURE;
    }

    slot.pCPU_rank = hotplug::slot::NO_PCPU;
    slot.state     = hotplug::slot::state_t::RESERVED;

    return EXIT_SUCCESS;
}
