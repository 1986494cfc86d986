#include <algorithm>
#include <cstddef>
#include <cstdlib>
#include <string>

#include <log/record.hpp>

#include "slot.hpp"


/**
 *  @brief vCPU Set Constructor
 *
 *  @param capacity:   maximum number of slots the VM supports
 *  @param boot count: number of vCPUs the VM was booted with
 *
 *  @details Capacity is bound by the number of APIC ids a guest can be
 *  presented with. Boot vCPUs beyond capacity are dropped and flagged.
 */
hotplug::slot::set_t::set_t
(
    std::size_t capacity,
    std::size_t boot_count
) noexcept:
    limit(std::min(capacity, hotplug::slot::MAX_APIC_VCPUS))
{
    if (boot_count > limit)
    {
        util::log::record
        (
            "Boot vCPU count " + std::to_string(boot_count)
                + " exceeds capacity " + std::to_string(limit)
                + "; truncating",
            util::log::type::FLAG
        );

        boot_count = limit;
    }

    // Slot addresses stay stable for the VM lifetime
    slots.reserve(limit);
    for (hotplug::slot::ordinal_t ordinal = 0; ordinal < boot_count; ++ordinal)
    {
        slots.push_back
        (
            {
                ordinal,
                hotplug::slot::state_t::RUNNING,
                static_cast<hotplug::slot::apic_t>(ordinal),
                hotplug::slot::NO_PCPU
            }
        );
    }
}


std::size_t
hotplug::slot::set_t::size() const noexcept
{
    return slots.size();
}


std::size_t
hotplug::slot::set_t::capacity() const noexcept
{
    return limit;
}


/**
 *  @brief Slot Reservation
 *
 *  @param ordinal: variable reference to write reserved ordinal to
 *
 *  @details Appends a reserved slot with the next ordinal
 *
 *  @return execution status code
 */
hotplug::status_code
hotplug::slot::set_t::reserve
(
    hotplug::slot::ordinal_t &ordinal
) noexcept
{
    if (slots.size() >= limit)
    {
        util::log::record
        (
            "vCPU set is full at " + std::to_string(limit) + " slots",
            util::log::type::ERROR
        );

        return EXIT_FAILURE;
    }

    ordinal = slots.size();
    slots.push_back
    (
        {
            ordinal,
            hotplug::slot::state_t::RESERVED,
            static_cast<hotplug::slot::apic_t>(ordinal),
            hotplug::slot::NO_PCPU
        }
    );

    return EXIT_SUCCESS;
}


/**
 *  @brief Slot Truncation
 *
 *  @param length: number of slots to keep
 *
 *  @details Drops trailing slots; only used to restore the set to its
 *  length before a hotplug call that was rolled back
 *
 *  @return execution status code
 */
hotplug::status_code
hotplug::slot::set_t::truncate
(
    std::size_t length
) noexcept
{
    if (length > slots.size())
    {
        util::log::record
        (
            "Cannot truncate vCPU set of " + std::to_string(slots.size())
                + " slots to " + std::to_string(length),
            util::log::type::ERROR
        );

        return EXIT_FAILURE;
    }

    slots.resize(length);

    return EXIT_SUCCESS;
}


hotplug::slot::slot_t &
hotplug::slot::set_t::at
(
    hotplug::slot::ordinal_t ordinal
)
{
    return slots.at(ordinal);
}


const hotplug::slot::slot_t &
hotplug::slot::set_t::at
(
    hotplug::slot::ordinal_t ordinal
) const
{
    return slots.at(ordinal);
}


std::size_t
hotplug::slot::set_t::count
(
    hotplug::slot::state_t state
) const noexcept
{
    return static_cast<std::size_t>
    (
        std::count_if
        (
            slots.begin(), slots.end(),
            [state](const hotplug::slot::slot_t &slot)
            {
                return slot.state == state;
            }
        )
    );
}


const char *
hotplug::slot::state_name
(
    hotplug::slot::state_t state
) noexcept
{
    switch (state)
    {
    case hotplug::slot::state_t::RESERVED:
        return "reserved";
    case hotplug::slot::state_t::PROVISIONED:
        return "provisioned";
    case hotplug::slot::state_t::RUNNING:
        return "running";
    case hotplug::slot::state_t::FAILED:
        return "failed";
    }

    return "unknown";
}
