#include <cstddef>
#include <cstdlib>
#include <iostream>
#include <string>

#include <lib/libvirt.hpp>
#include <lib/signal.hpp>
#include <log/record.hpp>

#include "config/options.hpp"
#include "domain/domain.hpp"
#include "notifier/hypervisor/hypervisor.hpp"
#include "provisioner/provisioner.hpp"
#include "slot/slot.hpp"
#include "sys/api.hpp"

#include "hotman.hpp"


// Interrupt sets accessible exit flag
static os::signal::flag_t exit_signal = os::signal::SIG_DEF;


/**
 *  @brief vCPU Hotplug Manager
 *
 *  @details A guest running atop a hypervisor may need more virtual CPUs
 *  (vCPUs) than it was booted with. hotman attaches to one running domain
 *  and grows its vCPU set while the guest keeps executing.
 *
 *  Each line read from standard input is one management API request body
 *  of the form {"Vcpu": {"add": N}}. The new vCPUs are created on the
 *  hypervisor, pinned to pCPUs and announced to the guest kernel, which
 *  brings them up offline until they are onlined from inside the guest.
 *  One JSON response is written to standard output per request.
 */
int main(int argc, char *argv[])
{
    /**************************** VALIDATE COMMAND ****************************/

    hotplug::config::options_t options;
    hotplug::status_code status = hotplug::config::parse(argc, argv, options);
    if (static_cast<bool>(status))
        return EXIT_FAILURE;


    /********************** CONNECT TO VIRTUALIZATION HOST ********************/

    // Make connection to hypervisor using libvirt
    libvirt::connection_t connection
    (
        libvirt::virConnectOpen(options.connection_uri.c_str()),
        [](libvirt::virConnect *connection)
        {
            if (connection != nullptr)
                libvirt::virConnectClose(connection);
        }
    );
    if (connection == nullptr)
    {
        util::log::record
        (
            "Unable to make connection to " + options.connection_uri,
            util::log::type::ABORT
        );

        return EXIT_FAILURE;
    }

    // Find running domain
    libvirt::domain_t domain;
    status = libvirt::domain::lookup(connection, options.domain, domain);
    if (static_cast<bool>(status))
    {
        util::log::record
        (
            "Unable to attach to domain " + options.domain,
            util::log::type::ABORT
        );

        return EXIT_FAILURE;
    }


    /**************************** SIZE vCPU SET *******************************/

    libvirt::domain::host_t host(connection, domain);

    std::size_t boot_count = 0;
    std::string reason;
    status = host.live_count(boot_count, reason);
    if (static_cast<bool>(status))
    {
        util::log::record
        (
            "Unable to read live vCPUs of domain: " + reason,
            util::log::type::ABORT
        );

        return EXIT_FAILURE;
    }

    // Capacity is bound by what the domain was defined to take
    std::size_t domain_maximum = 0;
    status = libvirt::domain::maximum(domain, domain_maximum);
    if (static_cast<bool>(status))
    {
        util::log::record
        (
            "Unable to read maximum vCPUs of domain",
            util::log::type::ABORT
        );

        return EXIT_FAILURE;
    }
    std::size_t capacity = options.maximum_vCPUs;
    if (domain_maximum < capacity)
    {
        util::log::record
        (
            "Domain takes at most " + std::to_string(domain_maximum)
                + " vCPUs; lowering maximum from "
                + std::to_string(capacity),
            util::log::type::FLAG
        );

        capacity = domain_maximum;
    }
    if (boot_count > capacity)
    {
        util::log::record
        (
            "Domain already runs " + std::to_string(boot_count)
                + " vCPUs, more than the maximum of "
                + std::to_string(capacity),
            util::log::type::ABORT
        );

        return EXIT_FAILURE;
    }


    /************************** ASSEMBLE CONTROLLER ***************************/

    hotplug::slot::set_t set(capacity, boot_count);
    hotplug::provisioner::provisioner_t provisioner(host);

    // QEMU's ACPI device model raises the guest event as libvirt adds vCPUs
    hotplug::notifier::hypervisor_t notifier(host);

    hotplug::controller_t controller(set, provisioner, notifier);

    util::log::record
    (
        "Attached to domain " + options.domain + " with "
            + std::to_string(boot_count) + " of "
            + std::to_string(capacity) + " vCPUs; notifying through "
            + notifier.name(),
        util::log::type::START
    );


    /************************* ASSIGN INTERRUPT HANDLER ***********************/

    const auto handler = [](os::signal::signal_t interrupt)
    {
        exit_signal = os::signal::SIG_EXT;
    };
    if (!os::signal::install(os::signal::SIG_INT, handler)
        || !os::signal::install(os::signal::SIG_TERM, handler))
    {
        util::log::record
        (
            "Unable to install interrupt handler",
            util::log::type::ABORT
        );

        return EXIT_FAILURE;
    }


    /*************************** SERVE REQUESTS *******************************/

    status = manager::serve(controller, std::cin, std::cout, exit_signal);

    util::log::record
    (
        "Detached from domain " + options.domain + " with "
            + std::to_string(controller.total()) + " vCPUs",
        util::log::type::STOP
    );

    return status;
}
