#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <istream>
#include <ostream>
#include <string>

#include <log/record.hpp>
#include <stat/statistics.hpp>

#include "api.hpp"

#include "hotman.hpp"


/**
 *  @brief Request Loop
 *
 *  @param controller:  controller of the attached domain
 *  @param input:       stream of request bodies, one per line
 *  @param output:      stream responses are written to
 *  @param exit signal: flag set on interrupt
 *
 *  @details Serves requests on this thread one at a time until end of
 *  input or interrupt
 *
 *  @return execution status code
 */
manager::status_code
manager::serve
(
          hotplug::controller_t   &controller,
          std::istream            &input,
          std::ostream            &output,
    const os::signal::flag_t      &exit_signal
) noexcept
{
    std::string        body;
    util::stat::usec_t duration = 0;
    while (!static_cast<bool>(exit_signal) && std::getline(input, body))
    {
        // Skip blank lines
        const bool blank = std::all_of
        (
            body.begin(), body.end(),
            [](unsigned char character)
            {
                return std::isspace(character);
            }
        );
        if (blank)
            continue;

        output << hotplug::api::handle(controller, body, duration) << std::endl;
        if (!output)
        {
            util::log::record
            (
                "Unable to write response",
                util::log::type::ERROR
            );

            return EXIT_FAILURE;
        }
    }

    if (static_cast<bool>(exit_signal))
        util::log::record("Interrupted; stopping request loop");

    return EXIT_SUCCESS;
}
