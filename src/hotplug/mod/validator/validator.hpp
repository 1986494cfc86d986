#pragma once

#include <cstddef>
#include <string>

#include "error/error.hpp"


/**
 *  @brief Hotplug Validator Header
 *
 *  @details Defines the bounds check run on every hotplug request once
 *  the add count has been decoded as an unsigned 8-bit integer
 */
namespace hotplug
{

namespace validator
{

[[nodiscard("Validation status must be checked")]]
status_code
validate
(
    std::size_t  current_total,
    std::size_t  add_count,
    std::size_t  max_supported,
    std::string &reason
) noexcept;

} // validator namespace

} // hotplug namespace
