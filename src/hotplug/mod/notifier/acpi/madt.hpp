#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>


/**
 *  @brief Multiple APIC Description Table Header
 *
 *  @details Defines the MADT presented to the guest. Every possible CPU
 *  gets a processor local APIC structure: boot CPUs are enabled while the
 *  remaining ones are online capable, which lets the guest kernel accept
 *  them when a hotplug event arrives. Fields are little endian.
 */
namespace hotplug
{

namespace acpi
{

using byte_t  = std::uint8_t;
using bytes_t = std::vector<byte_t>;

constexpr std::size_t SDT_HEADER_LENGTH  = 36;
constexpr std::size_t MADT_HEADER_LENGTH = SDT_HEADER_LENGTH + 8;
constexpr std::size_t LOCAL_APIC_LENGTH  = 8;
constexpr std::size_t IO_APIC_LENGTH     = 12;

constexpr byte_t MADT_REVISION = 6;

constexpr std::uint32_t LOCAL_APIC_ADDRESS = 0xFEE00000;
constexpr std::uint32_t IO_APIC_ADDRESS    = 0xFEC00000;
constexpr byte_t        IO_APIC_ID         = 0;

// Local APIC flag bits
constexpr std::uint32_t LOCAL_APIC_ENABLED        = 1u << 0;
constexpr std::uint32_t LOCAL_APIC_ONLINE_CAPABLE = 1u << 1;

constexpr char SIGNATURE[]        = "APIC";
constexpr char OEM_ID[]           = "HOTMAN";
constexpr char OEM_TABLE_ID[]     = "HOTMMADT";
constexpr char CREATOR_ID[]       = "HTMN";

constexpr std::uint32_t OEM_REVISION     = 1;
constexpr std::uint32_t CREATOR_REVISION = 1;

typedef struct local_apic_t
{
    byte_t        type;
    byte_t        length;
    byte_t        processor_uid;
    byte_t        apic_id;
    std::uint32_t flags;
} local_apic_t;

[[nodiscard("Must use local APIC structure to call")]]
local_apic_t
local_apic
(
    byte_t cpu_id,
    bool   online_capable
) noexcept;

[[nodiscard("Must use table to call")]]
bytes_t
madt
(
    std::size_t boot_count,
    std::size_t capacity
);

// Value making the byte sum of a table zero
[[nodiscard("Must use checksum to call")]]
byte_t
checksum
(
    const bytes_t &table
) noexcept;

} // acpi namespace

} // hotplug namespace
