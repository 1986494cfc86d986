#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <functional>
#include <string>

#include <log/record.hpp>

#include "options.hpp"


/**
 *  @brief Command Line Option Parser
 *
 *  @param argument count:  number of arguments including program name
 *  @param argument vector: arguments
 *  @param options:         structure reference to write to
 *
 *  @details Takes the domain and an optional maximum number of vCPUs. The
 *  connection URI may be overridden through the environment.
 *
 *  @return execution status code
 */
hotplug::status_code
hotplug::config::parse
(
    int                               argc,
    const char * const                argv[],
    hotplug::config::options_t       &options
) noexcept
{
    // Command takes a domain and an optional maximum
    if (argc < 2 || argc > 3)
    {
        util::log::record
        (
            hotplug::config::USAGE,
            util::log::type::ABORT
        );

        return EXIT_FAILURE;
    }
    options.domain = argv[1];
    if (options.domain.empty())
    {
        util::log::record
        (
            "Domain argument must not be empty",
            util::log::type::ABORT
        );

        return EXIT_FAILURE;
    }

    // Maximum argument must be a positive integer an APIC id can address
    if (argc == 3)
    {
        std::function<bool(const char *)> is_count = [](const char *string)
        {
            const std::size_t length = std::strlen(string);
            return length > 0 && length <= 3 && std::all_of
            (
                string, string + length,
                [](unsigned char character)
                {
                    return std::isdigit(character);
                }
            );
        };

        const std::size_t maximum = is_count(argv[2])
            ? static_cast<std::size_t>(std::atoi(argv[2]))
            : 0;
        if (maximum < 1 || maximum > hotplug::slot::MAX_APIC_VCPUS - 1)
        {
            util::log::record
            (
                "Maximum vCPUs argument must be an integer from 1 to "
                    + std::to_string(hotplug::slot::MAX_APIC_VCPUS - 1),
                util::log::type::ABORT
            );

            return EXIT_FAILURE;
        }
        options.maximum_vCPUs = maximum;
    }

    const char *uri = std::getenv(hotplug::config::CONNECTION_URI_ENV);
    if (uri != nullptr && std::strlen(uri) > 0)
        options.connection_uri = uri;

    return EXIT_SUCCESS;
}
