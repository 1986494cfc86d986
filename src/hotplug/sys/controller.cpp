#include <cstddef>
#include <cstdlib>
#include <string>

#include <log/record.hpp>
#include <time/stopwatch.hpp>

#include "validator/validator.hpp"

#include "lease.hpp"
#include "controller.hpp"


hotplug::controller_t::controller_t
(
    hotplug::slot::set_t                &set,
    hotplug::provisioner::provisioner_t &provisioner,
    hotplug::notifier::notifier_t       &notifier
) noexcept:
    set(set),
    provisioner(provisioner),
    notifier(notifier),
    guard(false),
    current(hotplug::state_t::IDLE),
    duration(0),
    published(set.size())
{}


/**
 *  @brief vCPU Hotplug
 *
 *  @param request: decoded hotplug request
 *  @param result:  structure reference to write to
 *  @param reason:  string reference to write error reason to
 *
 *  @details Claims the VM's hotplug lease without waiting and runs the
 *  hotplug under it. A faulted controller refuses the request without
 *  touching the host. Every call, busy ones included, is timed and the
 *  duration is kept for latency instrumentation.
 *
 *  @return error code, NONE on success
 */
hotplug::error_code
hotplug::controller_t::execute
(
    const hotplug::request::request_t &request,
          hotplug::result_t           &result,
          std::string                 &reason
) noexcept
{
    util::time::stopwatch_t stopwatch;
    hotplug::error_code     code;

    result = hotplug::result_t();
    {
        hotplug::lease_t lease(guard);
        if (!lease.held())
        {
            reason = hotplug::REASON_BUSY;
            code   = hotplug::error_code::BUSY;

            util::log::record
            (
                "Refused hotplug of " + std::to_string(request.add)
                    + " vCPUs while another is in progress",
                util::log::type::FLAG
            );
        }

        else if (current.load() == hotplug::state_t::FAULTED)
        {
            reason = fault;
            code   = hotplug::error_code::RESOURCE;

            util::log::record
            (
                "Refused hotplug of " + std::to_string(request.add)
                    + " vCPUs: " + fault,
                util::log::type::ERROR
            );
        }

        else
        {
            current.store(hotplug::state_t::LEASE_HELD);
            code = run(request, result, reason);
            if (current.load() != hotplug::state_t::FAULTED)
                current.store(hotplug::state_t::IDLE);
        }
    }

    result.duration = stopwatch.elapsed();
    duration.store(result.duration);

    return code;
}


/**
 *  @brief Hotplug Under Lease
 *
 *  @param request: decoded hotplug request
 *  @param result:  structure reference to write to
 *  @param reason:  string reference to write error reason to
 *
 *  @details Validates the request, provisions the new slots one by one
 *  in ascending ordinal order, and notifies the guest once all of them
 *  are up. A failed slot rolls back every slot of this call. A failed
 *  notification leaves the slots in place.
 *
 *  @return error code, NONE on success
 */
hotplug::error_code
hotplug::controller_t::run
(
    const hotplug::request::request_t &request,
          hotplug::result_t           &result,
          std::string                 &reason
) noexcept
{
    hotplug::status_code status;
    const std::size_t    previous_total = set.size();
    const std::size_t    add_count      = request.add;

    util::log::record
    (
        "Hotplugging " + std::to_string(add_count) + " vCPUs onto "
            + std::to_string(previous_total),
        util::log::type::START
    );


    /****************************** VALIDATE **********************************/

    status = hotplug::validator::validate
    (
        previous_total,
        add_count,
        set.capacity(),
        reason
    );
    if (static_cast<bool>(status))
    {
        util::log::record
        (
            "Rejected hotplug of " + std::to_string(add_count)
                + " vCPUs: " + reason,
            util::log::type::ERROR
        );

        return hotplug::error_code::VALIDATION;
    }


    /****************************** PROVISION *********************************/

    for (std::size_t index = 0; index < add_count; ++index)
    {
        hotplug::slot::ordinal_t ordinal;
        status = set.reserve(ordinal);
        if (static_cast<bool>(status))
        {
            reason = "Unable to reserve a slot for vCPU "
                + std::to_string(previous_total + index);
            rollback(previous_total, reason);

            return hotplug::error_code::RESOURCE;
        }

        std::string host_reason;
        status = provisioner.provision(set.at(ordinal), host_reason);
        if (static_cast<bool>(status))
        {
            reason = "Unable to provision vCPU " + std::to_string(ordinal)
                + ": " + host_reason;
            rollback(previous_total, reason);

            return hotplug::error_code::RESOURCE;
        }
    }


    /******************************* COMMIT ***********************************/

    for (hotplug::slot::ordinal_t ordinal = previous_total;
         ordinal < set.size(); ++ordinal)
    {
        set.at(ordinal).state = hotplug::slot::state_t::RUNNING;
    }
    current.store(hotplug::state_t::COMMITTED);
    published.store(set.size());

    result.added_count = add_count;
    result.new_total   = set.size();


    /******************************* NOTIFY ***********************************/

    status = notifier.notify(result.new_total, reason);
    if (static_cast<bool>(status))
    {
        result.guest_notified = false;
        util::log::record
        (
            std::string("Guest notification through ") + notifier.name()
                + " failed; " + std::to_string(add_count)
                + " vCPUs stay provisioned: " + reason,
            util::log::type::FLAG
        );

        return hotplug::error_code::NOTIFICATION;
    }
    result.guest_notified = true;

    util::log::record
    (
        "Hotplugged " + std::to_string(add_count) + " vCPUs; VM now has "
            + std::to_string(result.new_total),
        util::log::type::STOP
    );

    return hotplug::error_code::NONE;
}


/**
 *  @brief Hotplug Rollback
 *
 *  @param previous total: set size before the failed call
 *  @param reason:         string reference to append teardown failures to
 *
 *  @details Tears down slots of the failed call in descending ordinal
 *  order and restores the set to its size before the call. The first
 *  slot that cannot be torn down stops the rollback: it and every slot
 *  below it stay in the set so the set never records fewer vCPUs than
 *  the host runs, and the controller is faulted.
 */
void
hotplug::controller_t::rollback
(
    std::size_t  previous_total,
    std::string &reason
) noexcept
{
    util::log::record
    (
        "Rolling back " + std::to_string(set.size() - previous_total)
            + " vCPU slots: " + reason,
        util::log::type::ERROR
    );

    for (std::size_t ordinal = set.size(); ordinal-- > previous_total;)
    {
        std::string teardown_reason;
        hotplug::status_code status = provisioner.teardown
        (
            set.at(ordinal),
            teardown_reason
        );
        if (static_cast<bool>(status))
        {
            reason += "; rollback of vCPU " + std::to_string(ordinal)
                + " incomplete: " + teardown_reason;

            // Host keeps every vCPU up to the stuck one
            if (static_cast<bool>(set.truncate(ordinal + 1)))
            {
                util::log::record
                (
                    "vCPU set could not be cut to "
                        + std::to_string(ordinal + 1) + " slots",
                    util::log::type::ABORT
                );
            }
            fault = "vCPU set is out of sync with the host after a failed rollback; vCPU "
                + std::to_string(ordinal) + " could not be released";
            current.store(hotplug::state_t::FAULTED);

            util::log::record
            (
                "Controller faulted with " + std::to_string(set.size())
                    + " slots recorded against "
                    + std::to_string(previous_total) + " committed",
                util::log::type::ABORT
            );

            return;
        }
    }

    if (static_cast<bool>(set.truncate(previous_total)))
    {
        util::log::record
        (
            "vCPU set could not be restored to "
                + std::to_string(previous_total) + " slots",
            util::log::type::ABORT
        );
    }
    current.store(hotplug::state_t::ROLLED_BACK);
}


hotplug::state_t
hotplug::controller_t::state() const noexcept
{
    return current.load();
}


util::stat::usec_t
hotplug::controller_t::last_duration() const noexcept
{
    return duration.load();
}


std::size_t
hotplug::controller_t::total() const noexcept
{
    return published.load();
}


const char *
hotplug::state_name
(
    hotplug::state_t state
) noexcept
{
    switch (state)
    {
    case hotplug::state_t::IDLE:
        return "idle";
    case hotplug::state_t::LEASE_HELD:
        return "lease held";
    case hotplug::state_t::COMMITTED:
        return "committed";
    case hotplug::state_t::ROLLED_BACK:
        return "rolled back";
    case hotplug::state_t::FAULTED:
        return "faulted";
    }

    return "unknown";
}
