#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <vector>

#include "error/error.hpp"


/**
 *  @brief vCPU Slot Table Header
 *
 *  @details Defines the fixed capacity registry of a VM's vCPU slots.
 *  Slots are appended in ascending ordinal order and only the slots
 *  reserved by a failed hotplug call are ever removed again.
 */
namespace hotplug
{

namespace slot
{

// data types
using ordinal_t = std::size_t;
using apic_t    = std::uint8_t;
using pcpu_t    = std::size_t;

constexpr std::size_t MAX_SUPPORTED_VCPUS = 32;
constexpr std::size_t MAX_APIC_VCPUS
    = static_cast<std::size_t>(std::numeric_limits<apic_t>::max()) + 1;

constexpr pcpu_t NO_PCPU = std::numeric_limits<pcpu_t>::max();

enum class state_t: std::uint8_t
{
    RESERVED    = 0x00,
    PROVISIONED = 0x01,
    RUNNING     = 0x02,
    FAILED      = 0x03
};

typedef struct slot_t
{
    ordinal_t ordinal;
    state_t   state;
    apic_t    apic_id;
    pcpu_t    pCPU_rank;
} slot_t;

using list_t = std::vector<slot_t>;

class set_t
{
public:
    // Boot vCPUs are present as running slots from the start
    explicit
    set_t
    (
        std::size_t capacity,
        std::size_t boot_count
    ) noexcept;

    set_t(const set_t &set)            = delete;
    set_t &operator=(const set_t &set) = delete;

    [[nodiscard("Must use size to call")]]
    std::size_t
    size() const noexcept;

    [[nodiscard("Must use capacity to call")]]
    std::size_t
    capacity() const noexcept;

    [[nodiscard("Slot reservation status must be checked")]]
    status_code
    reserve
    (
        ordinal_t &ordinal
    ) noexcept;

    [[nodiscard("Slot truncation status must be checked")]]
    status_code
    truncate
    (
        std::size_t length
    ) noexcept;

    slot_t &
    at
    (
        ordinal_t ordinal
    );

    const slot_t &
    at
    (
        ordinal_t ordinal
    ) const;

    [[nodiscard("Must use count to call")]]
    std::size_t
    count
    (
        state_t state
    ) const noexcept;

private:
    list_t      slots;
    std::size_t limit;
};

[[nodiscard("Must use state name to call")]]
const char *
state_name
(
    state_t state
) noexcept;

} // slot namespace

} // hotplug namespace
