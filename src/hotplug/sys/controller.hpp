#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>

#include <stat/statistics.hpp>

#include "error/error.hpp"
#include "notifier/notifier.hpp"
#include "provisioner/provisioner.hpp"
#include "request/request.hpp"
#include "result/result.hpp"
#include "slot/slot.hpp"


/**
 *  @brief Hotplug Controller Header
 *
 *  @details Defines the single entry point mutating a VM's vCPU set. At
 *  most one hotplug runs per VM; a request arriving while one is in
 *  flight fails fast as busy instead of waiting. A rollback that could
 *  not release every vCPU it created leaves the controller faulted: the
 *  host may still run vCPUs past the committed total, so later requests
 *  are refused until the VM is reconciled.
 */
namespace hotplug
{

enum class state_t: std::uint8_t
{
    IDLE        = 0x00,
    LEASE_HELD  = 0x01,
    COMMITTED   = 0x02,
    ROLLED_BACK = 0x04,
    FAULTED     = 0x08
};

class controller_t
{
public:
    explicit
    controller_t
    (
        slot::set_t                &set,
        provisioner::provisioner_t &provisioner,
        notifier::notifier_t       &notifier
    ) noexcept;

    controller_t(const controller_t &controller)            = delete;
    controller_t &operator=(const controller_t &controller) = delete;

    [[nodiscard("Hotplug outcome must be checked")]]
    error_code
    execute
    (
        const request::request_t &request,
              result_t           &result,
              std::string        &reason
    ) noexcept;

    [[nodiscard("Must use state to call")]]
    state_t
    state() const noexcept;

    // Duration of the last completed call
    [[nodiscard("Must use duration to call")]]
    util::stat::usec_t
    last_duration() const noexcept;

    // vCPU total as of the last completed call
    [[nodiscard("Must use total to call")]]
    std::size_t
    total() const noexcept;

private:
    error_code
    run
    (
        const request::request_t &request,
              result_t           &result,
              std::string        &reason
    ) noexcept;

    void
    rollback
    (
        std::size_t  previous_total,
        std::string &reason
    ) noexcept;

    slot::set_t                &set;
    provisioner::provisioner_t &provisioner;
    notifier::notifier_t       &notifier;

    std::atomic<bool>               guard;
    std::atomic<state_t>            current;
    std::string                     fault;
    std::atomic<util::stat::usec_t> duration;
    std::atomic<std::size_t>        published;
};

[[nodiscard("Must use state name to call")]]
const char *
state_name
(
    state_t state
) noexcept;

} // hotplug namespace
