#pragma once

#include <cstddef>
#include <string>

#include "error/error.hpp"
#include "slot/slot.hpp"


/**
 *  @brief vCPU Host Header
 *
 *  @details Defines the virtualization primitive vCPU execution contexts
 *  are created on. Contexts are created in ascending ordinal order and
 *  destroyed in descending ordinal order; every failing routine writes
 *  the host's description of the failure to its reason argument.
 */
namespace hotplug
{

namespace host
{

class host_t
{
public:
    virtual ~host_t() = default;

    // Allocate and start the execution context of a vCPU
    [[nodiscard("vCPU creation status must be checked")]]
    virtual status_code
    create
    (
        slot::ordinal_t  ordinal,
        std::string     &reason
    ) noexcept = 0;

    // Attach a vCPU to the scheduler by pinning it to a pCPU
    [[nodiscard("vCPU pinning status must be checked")]]
    virtual status_code
    pin
    (
        slot::ordinal_t  ordinal,
        slot::pcpu_t     pCPU_rank,
        std::string     &reason
    ) noexcept = 0;

    // Release the execution context and its scheduler registration
    [[nodiscard("vCPU destruction status must be checked")]]
    virtual status_code
    destroy
    (
        slot::ordinal_t  ordinal,
        std::string     &reason
    ) noexcept = 0;

    // Number of pCPUs vCPUs can be pinned to; zero when unknown
    [[nodiscard("Must use pCPU count to call")]]
    virtual std::size_t
    pcpu_count() noexcept = 0;

    // Number of vCPUs live in the hypervisor
    [[nodiscard("Live vCPU count status must be checked")]]
    virtual status_code
    live_count
    (
        std::size_t &number_of_vCPUs,
        std::string &reason
    ) noexcept = 0;
};

} // host namespace

} // hotplug namespace
