#pragma once

#include <string>

#include <stat/statistics.hpp>

#include "error/error.hpp"
#include "result/result.hpp"


/**
 *  @brief Management API Codec Header
 *
 *  @details Defines the deserialization boundary of hotplug requests and
 *  the encoding of their responses. A request body has the form
 *  {"Vcpu": {"add": <0-255>}}; anything else is rejected here and never
 *  reaches the controller.
 */
namespace hotplug
{

namespace request
{

typedef struct request_t
{
    util::stat::count_t add;
} request_t;

[[nodiscard("Deserialization status must be checked")]]
status_code
parse
(
    const std::string &body,
          request_t   &request,
          std::string &fault
) noexcept;

[[nodiscard("Must use response body to call")]]
std::string
respond
(
          error_code   code,
    const result_t    &result,
    const std::string &reason
) noexcept;

} // request namespace

} // hotplug namespace
