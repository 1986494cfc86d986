#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string>

#include "notifier/acpi/madt.hpp"
#include "support/support.hpp"


static std::uint32_t
read_u32
(
    const hotplug::acpi::bytes_t &table,
          std::size_t             offset
)
{
    std::uint32_t value = 0;
    for (std::size_t index = 0; index < 4; ++index)
        value |= static_cast<std::uint32_t>(table[offset + index]) << (8 * index);

    return value;
}


int
main()
{
    /************************* LOCAL APIC STRUCTURE ***************************/

    const hotplug::acpi::local_apic_t boot = hotplug::acpi::local_apic(0, false);
    test::expect(boot.type == 0, "local APIC type is 0");
    test::expect(boot.length == 8, "local APIC length is 8");
    test::expect(boot.processor_uid == 0 && boot.apic_id == 0, "boot CPU ids");
    test::expect(boot.flags == hotplug::acpi::LOCAL_APIC_ENABLED, "boot CPU enabled");

    const hotplug::acpi::local_apic_t spare = hotplug::acpi::local_apic(5, true);
    test::expect(spare.processor_uid == 5 && spare.apic_id == 5, "spare CPU ids");
    test::expect
    (
        spare.flags == hotplug::acpi::LOCAL_APIC_ONLINE_CAPABLE,
        "spare CPU online capable and not enabled"
    );


    /****************************** FULL TABLE ********************************/

    const std::size_t boot_count = 2;
    const std::size_t capacity   = 4;
    const hotplug::acpi::bytes_t table = hotplug::acpi::madt(boot_count, capacity);

    test::expect(table.size() == 44 + 12 + 8 * capacity, "table length");
    test::expect
    (
        std::string(table.begin(), table.begin() + 4) == "APIC",
        "signature"
    );
    test::expect(read_u32(table, 4) == table.size(), "header length field");
    test::expect(table[8] == hotplug::acpi::MADT_REVISION, "revision");
    test::expect
    (
        std::string(table.begin() + 10, table.begin() + 16) == "HOTMAN",
        "OEM id"
    );
    test::expect
    (
        std::string(table.begin() + 16, table.begin() + 24) == "HOTMMADT",
        "OEM table id"
    );
    test::expect(read_u32(table, 36) == 0xFEE00000, "local APIC address");
    test::expect(read_u32(table, 40) == 0, "MADT flags");

    // Bytes sum to zero
    std::uint8_t sum = 0;
    for (const std::uint8_t byte: table)
        sum = static_cast<std::uint8_t>(sum + byte);
    test::expect(sum == 0, "table bytes sum to zero");
    test::expect(hotplug::acpi::checksum(table) == 0, "checksum of valid table");

    // I/O APIC
    test::expect(table[44] == 1 && table[45] == 12, "I/O APIC type and length");
    test::expect(table[46] == hotplug::acpi::IO_APIC_ID, "I/O APIC id");
    test::expect(read_u32(table, 48) == 0xFEC00000, "I/O APIC address");
    test::expect(read_u32(table, 52) == 0, "I/O APIC interrupt base");

    // One local APIC per possible CPU
    for (std::size_t cpu = 0; cpu < capacity; ++cpu)
    {
        const std::size_t offset = 56 + 8 * cpu;
        const std::string where  = "CPU " + std::to_string(cpu);
        test::expect(table[offset] == 0 && table[offset + 1] == 8, where + " header");
        test::expect
        (
            table[offset + 2] == cpu && table[offset + 3] == cpu,
            where + " ids"
        );
        test::expect
        (
            read_u32(table, offset + 4) == (cpu < boot_count ? 1u : 2u),
            where + " flags"
        );
    }

    // A changed byte no longer sums to zero
    hotplug::acpi::bytes_t corrupt = table;
    corrupt[60] ^= 0x01;
    test::expect(hotplug::acpi::checksum(corrupt) != 0, "corrupted table detected");


    /***************************** LARGE TABLE ********************************/

    const hotplug::acpi::bytes_t large = hotplug::acpi::madt(1, 255);
    test::expect(large.size() == 44 + 12 + 8 * 255, "255 CPU table length");
    test::expect(hotplug::acpi::checksum(large) == 0, "255 CPU table checksum");
    test::expect(large[56 + 8 * 254 + 3] == 254, "last APIC id is 254");

    return test::finish("madt_layout");
}
