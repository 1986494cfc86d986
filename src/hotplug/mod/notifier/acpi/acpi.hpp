#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include <lib/eventfd.hpp>

#include "error/error.hpp"
#include "notifier/notifier.hpp"
#include "slot/slot.hpp"

#include "madt.hpp"


/**
 *  @brief ACPI CPU Hotplug Notifier Header
 *
 *  @details Defines the x86_64 notifier. The VMM owns the ACPI CPU hotplug
 *  register block read by the guest's AML: one status byte per possible
 *  CPU plus the GPE0 status register. A notification marks the new CPUs
 *  as enabled and inserting, latches the CPU hotplug GPE and raises the
 *  SCI through an event line.
 */
namespace hotplug
{

namespace notifier
{

// CPU status register bits
constexpr std::uint8_t CPU_ENABLED   = 1u << 0;
constexpr std::uint8_t CPU_INSERTING = 1u << 1;

// GPE0 status bit of the CPU hotplug event
constexpr std::uint8_t GPE_CPU_HOTPLUG = 1u << 2;

class acpi_t: public notifier_t
{
public:
    explicit
    acpi_t
    (
        std::size_t          capacity,
        std::size_t          boot_count,
        os::event::line_t  &&line
    );

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

    // Guest facing register block
    [[nodiscard("Must use CPU status to call")]]
    std::uint8_t
    cpu_status
    (
        slot::ordinal_t ordinal
    ) const noexcept;

    [[nodiscard("Must use GPE status to call")]]
    std::uint8_t
    gpe_status() const noexcept;

    void
    acknowledge
    (
        slot::ordinal_t ordinal
    ) noexcept;

    void
    clear_event() noexcept;

    [[nodiscard("Must use table to call")]]
    const acpi::bytes_t &
    table() const noexcept;

    [[nodiscard("Must use event line to call")]]
    const os::event::line_t &
    line() const noexcept;

private:
    mutable std::mutex        mutex;
    std::vector<std::uint8_t> status;
    std::uint8_t              gpe;
    std::size_t               present;
    acpi::bytes_t             madt;
    os::event::line_t         event;
};

} // notifier namespace

} // hotplug namespace
