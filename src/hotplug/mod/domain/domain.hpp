#pragma once

#include <cstddef>
#include <string>

#include <lib/libvirt.hpp>
#include <stat/statistics.hpp>

#include "host/host.hpp"
#include "slot/slot.hpp"


/**
 *  @brief Domain Utility Header
 *
 *  @details Defines lookup of the running domain being hotplugged and the
 *  vCPU host backed by it. A vCPU context is the hypervisor's vCPU thread;
 *  creating vCPU n raises the domain's live vCPU count to n + 1.
 */
namespace libvirt
{

namespace domain
{

// Domain data constants
static constexpr util::stat::uint_t
domain_affect_live_flag
    = static_cast<util::stat::uint_t>(VIR_DOMAIN_AFFECT_LIVE);

static constexpr util::stat::uint_t
domain_vcpu_maximum_flag = static_cast<util::stat::uint_t>
(
    VIR_DOMAIN_AFFECT_LIVE | VIR_DOMAIN_VCPU_MAXIMUM
);

// Structure creation routines
[[nodiscard("Domain lookup status must be checked")]]
status_code
lookup
(
    const connection_t &connection,
    const std::string  &identifier,
          domain_t     &domain
) noexcept;

[[nodiscard("Domain maximum status must be checked")]]
status_code
maximum
(
    const domain_t    &domain,
          std::size_t &number_of_vCPUs
) noexcept;

class host_t: public hotplug::host::host_t
{
public:
    explicit
    host_t
    (
        const connection_t &connection,
        const domain_t     &domain
    ) noexcept;

    [[nodiscard("vCPU creation status must be checked")]]
    hotplug::status_code
    create
    (
        hotplug::slot::ordinal_t  ordinal,
        std::string              &reason
    ) noexcept override;

    [[nodiscard("vCPU pinning status must be checked")]]
    hotplug::status_code
    pin
    (
        hotplug::slot::ordinal_t  ordinal,
        hotplug::slot::pcpu_t     pCPU_rank,
        std::string              &reason
    ) noexcept override;

    [[nodiscard("vCPU destruction status must be checked")]]
    hotplug::status_code
    destroy
    (
        hotplug::slot::ordinal_t  ordinal,
        std::string              &reason
    ) noexcept override;

    [[nodiscard("Must use pCPU count to call")]]
    std::size_t
    pcpu_count() noexcept override;

    [[nodiscard("Live vCPU count status must be checked")]]
    hotplug::status_code
    live_count
    (
        std::size_t &number_of_vCPUs,
        std::string &reason
    ) noexcept override;

private:
    hotplug::status_code
    set_live
    (
        std::size_t  number_of_vCPUs,
        std::string &reason
    ) noexcept;

    const connection_t &connection;
    const domain_t     &domain;
};

} // domain namespace

} // libvirt namespace
