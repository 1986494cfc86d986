#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <string>
#include <utility>

#include <log/record.hpp>

#include "acpi.hpp"


/**
 *  @brief ACPI Notifier Constructor
 *
 *  @param capacity:   number of CPUs the VM may ever have
 *  @param boot count: number of CPUs enabled at boot
 *  @param line:       event line wired to the guest's SCI
 *
 *  @details Boot CPUs start enabled with no insertion pending, and the
 *  MADT is built once for the full capacity
 */
hotplug::notifier::acpi_t::acpi_t
(
    std::size_t           capacity,
    std::size_t           boot_count,
    os::event::line_t   &&line
):
    status(capacity, 0),
    gpe(0),
    present(boot_count < capacity ? boot_count : capacity),
    madt(hotplug::acpi::madt(present, capacity)),
    event(std::move(line))
{
    for (std::size_t cpu = 0; cpu < present; ++cpu)
        status[cpu] = hotplug::notifier::CPU_ENABLED;
}


/**
 *  @brief ACPI CPU Hotplug Notification
 *
 *  @param new total: number of CPUs present after the hotplug
 *  @param reason:    string reference to write failure reason to
 *
 *  @details Marks CPUs from the previous total up to the new total as
 *  enabled and inserting, latches the CPU hotplug GPE and raises the SCI.
 *  The guest's AML handler scans the status block for inserting CPUs and
 *  clears each bit as it creates the CPU device.
 *
 *  @return execution status code
 */
hotplug::status_code
hotplug::notifier::acpi_t::notify
(
    std::size_t  new_total,
    std::string &reason
) noexcept
{
    {
        std::lock_guard<std::mutex> guard(mutex);

        if (new_total > status.size())
        {
            reason = "ACPI CPU hotplug block holds "
                + std::to_string(status.size()) + " CPUs, cannot present "
                + std::to_string(new_total);
            return EXIT_FAILURE;
        }
        if (new_total <= present)
        {
            reason = "ACPI CPU hotplug block already presents "
                + std::to_string(present) + " CPUs";
            return EXIT_FAILURE;
        }

        for (std::size_t cpu = present; cpu < new_total; ++cpu)
        {
            status[cpu] = hotplug::notifier::CPU_ENABLED
                | hotplug::notifier::CPU_INSERTING;
        }
        gpe |= hotplug::notifier::GPE_CPU_HOTPLUG;
        present = new_total;
    }

    // Raise SCI
    if (!event.valid())
    {
        reason = "ACPI GPE event line is not open";
        return EXIT_FAILURE;
    }
    const int error = event.trigger();
    if (error != 0)
    {
        reason = std::string("Unable to raise ACPI GPE: ")
            + std::strerror(error);
        return EXIT_FAILURE;
    }

    util::log::record
    (
        "Raised ACPI CPU hotplug GPE for " + std::to_string(new_total)
            + " present CPUs"
    );

    return EXIT_SUCCESS;
}


const char *
hotplug::notifier::acpi_t::name() const noexcept
{
    return "acpi";
}


std::uint8_t
hotplug::notifier::acpi_t::cpu_status
(
    hotplug::slot::ordinal_t ordinal
) const noexcept
{
    std::lock_guard<std::mutex> guard(mutex);

    if (ordinal >= status.size())
        return 0;

    return status[ordinal];
}


std::uint8_t
hotplug::notifier::acpi_t::gpe_status() const noexcept
{
    std::lock_guard<std::mutex> guard(mutex);

    return gpe;
}


// Guest cleared the insert bit after creating the CPU device
void
hotplug::notifier::acpi_t::acknowledge
(
    hotplug::slot::ordinal_t ordinal
) noexcept
{
    std::lock_guard<std::mutex> guard(mutex);

    if (ordinal < status.size())
        status[ordinal] &= static_cast<std::uint8_t>(~CPU_INSERTING);
}


void
hotplug::notifier::acpi_t::clear_event() noexcept
{
    std::lock_guard<std::mutex> guard(mutex);

    gpe &= static_cast<std::uint8_t>(~GPE_CPU_HOTPLUG);
}


const hotplug::acpi::bytes_t &
hotplug::notifier::acpi_t::table() const noexcept
{
    return madt;
}


const os::event::line_t &
hotplug::notifier::acpi_t::line() const noexcept
{
    return event;
}
