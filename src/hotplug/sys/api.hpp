#pragma once

#include <string>

#include <stat/statistics.hpp>

#include "controller.hpp"


/**
 *  @brief Management API Handler Header
 *
 *  @details Defines the handling of one hotplug request body from
 *  deserialization to encoded response
 */
namespace hotplug
{

namespace api
{

constexpr char DURATION_PREFIX[] = "Total previous API call duration: ";
constexpr char DURATION_SUFFIX[] = " us.";

[[nodiscard("Must use response body to call")]]
std::string
handle
(
          controller_t       &controller,
    const std::string        &body,
          util::stat::usec_t &duration
) noexcept;

} // api namespace

} // hotplug namespace
