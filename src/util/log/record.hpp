#pragma once

#include <cstdint>
#include <string>


/**
 *  @brief Log Record Header
 *
 *  @details Defines the one line records written by the manager. Error
 *  kinds go to the error stream and every other kind to the log stream,
 *  so a hotplug request can be followed from START to STOP or ERROR.
 */
namespace util
{

namespace log
{

enum class type: std::uint32_t
{
    STATUS = 0x00,
    ERROR  = 0x01,
    START  = 0x02,
    STOP   = 0x04,
    FLAG   = 0x08,
    ABORT  = 0x10
};

// Error kinds
constexpr std::uint32_t ERROR_TYPES
    = static_cast<std::uint32_t>(type::ERROR)
    | static_cast<std::uint32_t>(type::FLAG)
    | static_cast<std::uint32_t>(type::ABORT);

constexpr bool FLUSH = true;
constexpr bool ASYNC = false;

void
record
(
    const std::string &message,
    const type         type  = type::STATUS,
    const bool         flush = ASYNC
) noexcept;

[[nodiscard("Must use label to call")]]
const char *
label
(
    const type type
) noexcept;

[[nodiscard("Must use error check to call")]]
constexpr bool
is_error
(
    const type type
) noexcept
{
    return (static_cast<std::uint32_t>(type) & ERROR_TYPES) != 0;
}

constexpr char SEPARATOR[] = " ";

} // log namespace

namespace clock
{

using time_t = std::string;

time_t
time() noexcept;

} // clock namespace

} // util namespace
