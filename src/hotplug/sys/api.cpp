#include <string>

#include <log/record.hpp>
#include <time/stopwatch.hpp>

#include "request/request.hpp"
#include "result/result.hpp"

#include "api.hpp"


/**
 *  @brief Hotplug API Call
 *
 *  @param controller: controller of the VM being hotplugged
 *  @param body:       request body text
 *  @param duration:   variable reference to write call duration to
 *
 *  @details Bodies failing deserialization are answered without touching
 *  the controller. The duration covers the whole call and is logged for
 *  latency instrumentation.
 *
 *  @return response body
 */
std::string
hotplug::api::handle
(
          hotplug::controller_t &controller,
    const std::string           &body,
          util::stat::usec_t    &duration
) noexcept
{
    util::time::stopwatch_t stopwatch;

    hotplug::result_t   result;
    hotplug::error_code code;
    std::string         reason;

    hotplug::request::request_t request {};
    hotplug::status_code status = hotplug::request::parse(body, request, reason);
    if (static_cast<bool>(status))
    {
        code = hotplug::error_code::DESERIALIZATION;
        util::log::record(reason, util::log::type::ERROR);
    }
    else
        code = controller.execute(request, result, reason);

    std::string response = hotplug::request::respond(code, result, reason);
    if (code != hotplug::error_code::NONE)
    {
        util::log::record
        (
            std::string("Hotplug call answered with ")
                + hotplug::error_name(code) + " fault",
            util::log::type::FLAG
        );
    }

    duration = stopwatch.elapsed();
    util::log::record
    (
        hotplug::api::DURATION_PREFIX + std::to_string(duration)
            + hotplug::api::DURATION_SUFFIX
    );

    return response;
}
