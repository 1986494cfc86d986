#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include <lib/libvirt.hpp>
#include <stat/statistics.hpp>


/**
 *  @brief Hardware Utility Header
 *
 *  @details Defines routines to read host pCPU details and to pin a
 *  domain's vCPU to a single pCPU
 */
namespace libvirt
{

namespace hardware
{

// data types
using byte_t    = unsigned char;
using mapping_t = std::vector<byte_t>;
using rank_t    = std::size_t;

// Data collection routines
[[nodiscard("Node count status must be checked")]]
status_code
node_count
(
    virConnectPtr  connection,
    std::size_t   &number_of_pCPUs,
    std::string   &reason
) noexcept;

// State modifer routines
[[nodiscard("Pinning status must be checked")]]
status_code
map
(
    virDomainPtr  domain,
    rank_t        vCPU_rank,
    rank_t        pCPU_rank,
    std::size_t   number_of_pCPUs,
    std::string  &reason
) noexcept;

void
map_to_pCPU
(
    rank_t     rank,
    mapping_t &mapping
) noexcept;

[[nodiscard("Must use result length to call")]]
util::stat::uint_t
map_length
(
    std::size_t number_of_pCPUs
) noexcept;

} // hardware namespace

} // libvirt namespace
