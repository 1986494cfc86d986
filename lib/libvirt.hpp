#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include <stdarg.h>
#include <stddef.h>
#include <sys/types.h>


/**
 *  @brief Libvirt C library namespace wrapper
 *
 *  @details Wraps the libvirt API and its error reporting in a namespace,
 *  with owning handles for the connection and the hotplugged domain.
 *  Domain and host subroutines are added to it by the hotplug modules.
 */
namespace libvirt
{

#include "libvirt/libvirt.h"
#include "libvirt/virterror.h"

// Code used to report on subroutines
using status_code = std::uint8_t;

// RAII connection pointer
using connection_t = std::unique_ptr
<
    virConnect,
    std::function<void (virConnect *)>
>;

// RAII domain pointer
using domain_t = std::unique_ptr
<
    virDomain,
    std::function<void (virDomain *)>
>;

/**
 *  @brief Last libvirt error message
 *
 *  @details Reads the thread local error libvirt recorded for the last
 *  failed API call on this thread
 *
 *  @return error message, never empty
 */
inline
std::string
last_error() noexcept
{
    const char *message = virGetLastErrorMessage();
    if (message == nullptr)
        return "unknown libvirt error";

    return std::string(message);
}

} // libvirt namespace
