#include <cstddef>
#include <cstdlib>
#include <string>

#include <lib/libvirt.hpp>
#include <log/record.hpp>

#include "hardware/hardware.hpp"

#include "domain.hpp"


/**
 *  @brief Domain Handle Lookup
 *
 *  @param connection: hypervisor connection via libvirt
 *  @param identifier: domain UUID or name
 *  @param domain:     handle reference to write to
 *
 *  @details Resolves the identifier as a UUID first and as a name
 *  otherwise; the domain must be running to be hotplugged
 *
 *  @return execution status code
 */
libvirt::status_code
libvirt::domain::lookup
(
    const libvirt::connection_t &connection,
    const std::string           &identifier,
          libvirt::domain_t     &domain
) noexcept
{
    libvirt::virDomainPtr handle = libvirt::virDomainLookupByUUIDString
    (
        connection.get(),
        identifier.c_str()
    );
    if (handle == nullptr)
    {
        handle = libvirt::virDomainLookupByName
        (
            connection.get(),
            identifier.c_str()
        );
    }
    if (handle == nullptr)
    {
        util::log::record
        (
            "Unable to find domain " + identifier + ": "
                + libvirt::last_error(),
            util::log::type::ERROR
        );

        return EXIT_FAILURE;
    }

    // Transfer control of handle
    domain = libvirt::domain_t
    (
        handle,
        [](libvirt::virDomain *domain)
        {
            if (domain != nullptr)
                libvirt::virDomainFree(domain);
        }
    );

    if (libvirt::virDomainIsActive(domain.get()) != 1)
    {
        util::log::record
        (
            "Domain " + identifier + " is not running",
            util::log::type::ERROR
        );

        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}


/**
 *  @brief Domain vCPU Maximum
 *
 *  @param domain:          libvirt API domain handle
 *  @param number of vCPUs: variable reference to write to
 *
 *  @details Reads the most vCPUs the running domain was defined to take
 *
 *  @return execution status code
 */
libvirt::status_code
libvirt::domain::maximum
(
    const libvirt::domain_t &domain,
          std::size_t       &number_of_vCPUs
) noexcept
{
    const int count = libvirt::virDomainGetVcpusFlags
    (
        domain.get(),
        libvirt::domain::domain_vcpu_maximum_flag
    );
    if (count < 1)
    {
        util::log::record
        (
            "Unable to read maximum vCPUs of domain: " + libvirt::last_error(),
            util::log::type::ERROR
        );

        return EXIT_FAILURE;
    }

    number_of_vCPUs = static_cast<std::size_t>(count);

    return EXIT_SUCCESS;
}


libvirt::domain::host_t::host_t
(
    const libvirt::connection_t &connection,
    const libvirt::domain_t     &domain
) noexcept:
    connection(connection),
    domain(domain)
{}


// vCPU n is the n + 1th live vCPU
hotplug::status_code
libvirt::domain::host_t::create
(
    hotplug::slot::ordinal_t  ordinal,
    std::string              &reason
) noexcept
{
    return set_live(ordinal + 1, reason);
}


hotplug::status_code
libvirt::domain::host_t::pin
(
    hotplug::slot::ordinal_t  ordinal,
    hotplug::slot::pcpu_t     pCPU_rank,
    std::string              &reason
) noexcept
{
    std::size_t number_of_pCPUs = 0;
    libvirt::status_code status = libvirt::hardware::node_count
    (
        connection.get(),
        number_of_pCPUs,
        reason
    );
    if (static_cast<bool>(status))
        return EXIT_FAILURE;

    return libvirt::hardware::map
    (
        domain.get(),
        ordinal,
        pCPU_rank,
        number_of_pCPUs,
        reason
    );
}


// Rollback destroys in descending order so vCPU n is always the last live one
hotplug::status_code
libvirt::domain::host_t::destroy
(
    hotplug::slot::ordinal_t  ordinal,
    std::string              &reason
) noexcept
{
    return set_live(ordinal, reason);
}


std::size_t
libvirt::domain::host_t::pcpu_count() noexcept
{
    std::size_t number_of_pCPUs = 0;
    std::string reason;
    libvirt::status_code status = libvirt::hardware::node_count
    (
        connection.get(),
        number_of_pCPUs,
        reason
    );
    if (static_cast<bool>(status))
        return 0;

    return number_of_pCPUs;
}


hotplug::status_code
libvirt::domain::host_t::live_count
(
    std::size_t &number_of_vCPUs,
    std::string &reason
) noexcept
{
    const int count = libvirt::virDomainGetVcpusFlags
    (
        domain.get(),
        libvirt::domain::domain_affect_live_flag
    );
    if (count < 0)
    {
        reason = libvirt::last_error();
        return EXIT_FAILURE;
    }

    number_of_vCPUs = static_cast<std::size_t>(count);

    return EXIT_SUCCESS;
}


/**
 *  @brief Live vCPU Count Setter
 *
 *  @param number of vCPUs: live vCPU count to set
 *  @param reason:          string reference to write failure reason to
 *
 *  @details The hypervisor creates or removes vCPU threads to match and
 *  raises the guest's CPU hotplug event itself
 *
 *  @return execution status code
 */
hotplug::status_code
libvirt::domain::host_t::set_live
(
    std::size_t  number_of_vCPUs,
    std::string &reason
) noexcept
{
    const int status = libvirt::virDomainSetVcpusFlags
    (
        domain.get(),
        static_cast<util::stat::uint_t>(number_of_vCPUs),
        libvirt::domain::domain_affect_live_flag
    );
    if (status < 0)
    {
        reason = libvirt::last_error();
        util::log::record
        (
            "Unable to set live vCPUs of domain to "
                + std::to_string(number_of_vCPUs) + ": " + reason,
            util::log::type::ERROR
        );

        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
