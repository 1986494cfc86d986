#pragma once

#include <cstddef>
#include <cstdint>


/**
 *  @brief Statistical Data Types Defintions
 *
 *  @details Defines data types used in counting vCPUs and storing
 *  measured durations
 */
namespace util
{

namespace stat
{

// libvirt API ranks and flags
using uint_t = unsigned int;

// vCPU counts fit the management API's unsigned 8-bit field
using count_t = std::uint8_t;

// Durations in microseconds
using usec_t = std::uint64_t;

} // stat namespace

} // util namespace
