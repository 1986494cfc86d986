#pragma once

#include <cstdint>
#include <string>


/**
 *  @brief Hotplug Error Header
 *
 *  @details Defines the error taxonomy returned by the hotplug routines.
 *  Reasons accompanying an error are part of the management API contract
 *  and are matched exactly by external tooling.
 */
namespace hotplug
{

using status_code = std::uint8_t;

enum class error_code: std::uint8_t
{
    NONE            = 0x00,
    DESERIALIZATION = 0x01,
    VALIDATION      = 0x02,
    BUSY            = 0x03,
    RESOURCE        = 0x04,
    NOTIFICATION    = 0x05
};

// Canonical reasons
constexpr char REASON_ADD_ZERO[]
    = "The number of vCPUs added must be greater than 0.";
constexpr char REASON_ADD_LIMIT[]
    = "The number of vCPUs added must be less than ";
constexpr char REASON_CAPACITY[]
    = "would exceed maximum supported vCPU count";
constexpr char REASON_BUSY[]
    = "Another vCPU hotplug operation is in progress.";

// Prefixes placed before reasons at the API boundary
constexpr char FAULT_HOTPLUG[]
    = "Hotplug error: Vcpu hotplugging error: ";
constexpr char FAULT_DESERIALIZE[]
    = "An error occurred when deserializing the json body of a request: ";

[[nodiscard("Must use error name to call")]]
inline
const char *
error_name
(
    error_code code
) noexcept
{
    switch (code)
    {
    case error_code::NONE:
        return "none";
    case error_code::DESERIALIZATION:
        return "deserialization";
    case error_code::VALIDATION:
        return "validation";
    case error_code::BUSY:
        return "busy";
    case error_code::RESOURCE:
        return "resource";
    case error_code::NOTIFICATION:
        return "notification";
    }

    return "unknown";
}

} // hotplug namespace
