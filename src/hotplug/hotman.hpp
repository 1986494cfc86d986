#pragma once

#include <cstdint>
#include <istream>
#include <ostream>

#include <lib/signal.hpp>

#include "sys/controller.hpp"


/**
 *  @brief Hotplug Manager Header
 *
 *  @details Defines manager's status code and request loop
 */
namespace manager
{

using status_code = std::uint8_t;

[[nodiscard("Request loop exit status must be checked")]]
status_code
serve
(
          hotplug::controller_t   &controller,
          std::istream            &input,
          std::ostream            &output,
    const os::signal::flag_t      &exit_signal
) noexcept;

} // manager namespace
