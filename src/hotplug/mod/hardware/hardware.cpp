#include <cstddef>
#include <cstdlib>
#include <string>

#include <log/record.hpp>
#include <stat/statistics.hpp>

#include "hardware.hpp"


/**
 *  @brief Node Counter
 *
 *  @param connection:      hypervisor connection via libvirt
 *  @param number of pCPUs: variable reference to write to
 *  @param reason:          string reference to write failure reason to
 *
 *  @details Retreives number of active pCPUs in hardware
 *
 *  @return execution status code
 */
libvirt::status_code
libvirt::hardware::node_count
(
    libvirt::virConnectPtr  connection,
    std::size_t            &number_of_pCPUs,
    std::string            &reason
) noexcept
{
    // Get hardware node information
    libvirt::virNodeInfo node {};
    if (libvirt::virNodeGetInfo(connection, &node) < 0)
    {
        reason = libvirt::last_error();
        util::log::record
        (
            "Unable to retreive hardware information: " + reason,
            util::log::type::ERROR
        );

        return EXIT_FAILURE;
    }

    // Get number of pCPUs in hardware
    number_of_pCPUs = static_cast<std::size_t>(node.cpus);

    return EXIT_SUCCESS;
}


/**
 *  @brief vCPU to pCPU Mapper
 *
 *  @param domain:          libvirt API domain handle owning the vCPU
 *  @param vCPU rank:       vCPU rank amongst domain's vCPUs
 *  @param pCPU rank:       pCPU rank to pin vCPU to
 *  @param number of pCPUs: number of active pCPUs in hardware
 *  @param reason:          string reference to write failure reason to
 *
 *  @details Pins the live vCPU to exactly one pCPU
 *
 *  @return execution status code
 */
libvirt::status_code
libvirt::hardware::map
(
    libvirt::virDomainPtr     domain,
    libvirt::hardware::rank_t vCPU_rank,
    libvirt::hardware::rank_t pCPU_rank,
    std::size_t               number_of_pCPUs,
    std::string              &reason
) noexcept
{
    if (pCPU_rank >= number_of_pCPUs)
    {
        reason = "pCPU " + std::to_string(pCPU_rank) + " is not one of "
            + std::to_string(number_of_pCPUs) + " active pCPUs";
        return EXIT_FAILURE;
    }

    // Create mapping
    const util::stat::uint_t length
        = libvirt::hardware::map_length(number_of_pCPUs);
    libvirt::hardware::mapping_t mapping(length, 0);
    libvirt::hardware::map_to_pCPU(pCPU_rank, mapping);

    // Execute mapping
    const int status = libvirt::virDomainPinVcpuFlags
    (
        domain,
        static_cast<util::stat::uint_t>(vCPU_rank),
        mapping.data(),
        static_cast<int>(length),
        libvirt::VIR_DOMAIN_AFFECT_LIVE
    );
    if (status < 0)
    {
        reason = libvirt::last_error();
        util::log::record
        (
            "Unable to map vCPU " + std::to_string(vCPU_rank)
                + " to pCPU " + std::to_string(pCPU_rank) + ": " + reason,
            util::log::type::ERROR
        );

        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}


/**
 *  @brief Set up Map for Specific pCPU to be Mapped
 *
 *  @param rank:    rank of pCPU to map
 *  @param mapping: variable reference to write to
 *
 *  @details Flips pCPU bit in provided map based on provied pCPU rank
 */
void
libvirt::hardware::map_to_pCPU
(
    libvirt::hardware::rank_t     rank,
    libvirt::hardware::mapping_t &mapping
) noexcept
{
    mapping[rank / 8] |= static_cast<libvirt::hardware::byte_t>(1 << rank % 8);
}


/**
 *  @brief Get Mapping Length
 *
 *  @param number of pCPUs: number of active pCPUs in hardware
 *
 *  @details Calculates length of bitmap based on number of pCPUs
 *
 *  @return bit map length in bytes
 */
util::stat::uint_t
libvirt::hardware::map_length
(
    std::size_t number_of_pCPUs
) noexcept
{
    return static_cast<util::stat::uint_t>((number_of_pCPUs + 7) / 8);
}
