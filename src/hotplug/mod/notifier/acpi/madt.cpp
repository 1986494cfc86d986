#include <cstddef>
#include <cstdint>

#include "madt.hpp"


// Offset of the checksum byte within the SDT header
static constexpr std::size_t SDT_CHECKSUM_OFFSET = 9;

static constexpr hotplug::acpi::byte_t LOCAL_APIC_TYPE = 0;
static constexpr hotplug::acpi::byte_t IO_APIC_TYPE    = 1;


static void
append_u8
(
    hotplug::acpi::bytes_t &table,
    hotplug::acpi::byte_t   value
)
{
    table.push_back(value);
}


static void
append_u32
(
    hotplug::acpi::bytes_t &table,
    std::uint32_t           value
)
{
    for (std::size_t shift = 0; shift < 32; shift += 8)
        table.push_back(static_cast<hotplug::acpi::byte_t>(value >> shift));
}


// Copies exactly length characters of an identifier
static void
append_id
(
          hotplug::acpi::bytes_t &table,
    const char                   *id,
          std::size_t             length
)
{
    table.insert(table.end(), id, id + length);
}


/**
 *  @brief Processor Local APIC Structure
 *
 *  @param cpu id:         processor UID and APIC id of the CPU
 *  @param online capable: whether CPU is absent at boot but may be
 *                         hotplugged later
 *
 *  @return local APIC structure
 */
hotplug::acpi::local_apic_t
hotplug::acpi::local_apic
(
    hotplug::acpi::byte_t cpu_id,
    bool                  online_capable
) noexcept
{
    return
    {
        LOCAL_APIC_TYPE,
        static_cast<hotplug::acpi::byte_t>(hotplug::acpi::LOCAL_APIC_LENGTH),
        cpu_id,
        cpu_id,
        online_capable
            ? hotplug::acpi::LOCAL_APIC_ONLINE_CAPABLE
            : hotplug::acpi::LOCAL_APIC_ENABLED
    };
}


/**
 *  @brief MADT Builder
 *
 *  @param boot count: number of CPUs enabled at boot
 *  @param capacity:   number of CPUs the VM may ever have
 *
 *  @details Lays out the SDT header, local APIC address and flags, the
 *  I/O APIC and one local APIC per possible CPU, then fills in the
 *  checksum over the complete table
 *
 *  @return table bytes
 */
hotplug::acpi::bytes_t
hotplug::acpi::madt
(
    std::size_t boot_count,
    std::size_t capacity
)
{
    const std::size_t length = hotplug::acpi::MADT_HEADER_LENGTH
        + hotplug::acpi::IO_APIC_LENGTH
        + hotplug::acpi::LOCAL_APIC_LENGTH * capacity;

    hotplug::acpi::bytes_t table;
    table.reserve(length);

    /****************************** SDT HEADER ********************************/

    append_id(table, hotplug::acpi::SIGNATURE, 4);
    append_u32(table, static_cast<std::uint32_t>(length));
    append_u8(table, hotplug::acpi::MADT_REVISION);
    append_u8(table, 0);
    append_id(table, hotplug::acpi::OEM_ID, 6);
    append_id(table, hotplug::acpi::OEM_TABLE_ID, 8);
    append_u32(table, hotplug::acpi::OEM_REVISION);
    append_id(table, hotplug::acpi::CREATOR_ID, 4);
    append_u32(table, hotplug::acpi::CREATOR_REVISION);


    /****************************** MADT HEADER *******************************/

    append_u32(table, hotplug::acpi::LOCAL_APIC_ADDRESS);
    append_u32(table, 0);


    /************************* INTERRUPT CONTROLLERS **************************/

    append_u8(table, IO_APIC_TYPE);
    append_u8(table, static_cast<hotplug::acpi::byte_t>(IO_APIC_LENGTH));
    append_u8(table, hotplug::acpi::IO_APIC_ID);
    append_u8(table, 0);
    append_u32(table, hotplug::acpi::IO_APIC_ADDRESS);
    append_u32(table, 0);

    for (std::size_t cpu = 0; cpu < capacity; ++cpu)
    {
        const hotplug::acpi::local_apic_t entry = hotplug::acpi::local_apic
        (
            static_cast<hotplug::acpi::byte_t>(cpu),
            cpu >= boot_count
        );

        append_u8(table, entry.type);
        append_u8(table, entry.length);
        append_u8(table, entry.processor_uid);
        append_u8(table, entry.apic_id);
        append_u32(table, entry.flags);
    }

    table[SDT_CHECKSUM_OFFSET] = hotplug::acpi::checksum(table);

    return table;
}


hotplug::acpi::byte_t
hotplug::acpi::checksum
(
    const hotplug::acpi::bytes_t &table
) noexcept
{
    hotplug::acpi::byte_t sum = 0;
    for (const hotplug::acpi::byte_t byte: table)
        sum = static_cast<hotplug::acpi::byte_t>(sum + byte);

    return static_cast<hotplug::acpi::byte_t>(0x100 - sum);
}
