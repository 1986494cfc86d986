#pragma once

#include <cstddef>
#include <string>

#include "error/error.hpp"
#include "slot/slot.hpp"


/**
 *  @brief Command Line Options Header
 *
 *  @details Defines the configuration of the hotplug service taken from
 *  its positional arguments and environment
 */
namespace hotplug
{

namespace config
{

constexpr char USAGE[]
    = "Usage follows as ./hotman <domain> [maximum vCPUs]";

constexpr char DEFAULT_CONNECTION_URI[] = "qemu:///system";
constexpr char CONNECTION_URI_ENV[]     = "HOTMAN_CONNECTION_URI";

typedef struct options_t
{
    std::string domain;
    std::size_t maximum_vCPUs  = slot::MAX_SUPPORTED_VCPUS;
    std::string connection_uri = DEFAULT_CONNECTION_URI;
} options_t;

[[nodiscard("Option parsing status must be checked")]]
status_code
parse
(
    int                 argc,
    const char * const  argv[],
    options_t          &options
) noexcept;

} // config namespace

} // hotplug namespace
