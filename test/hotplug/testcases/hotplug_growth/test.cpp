#include <cstddef>
#include <cstdlib>
#include <string>
#include <vector>

#include "provisioner/provisioner.hpp"
#include "slot/slot.hpp"
#include "sys/controller.hpp"
#include "support/support.hpp"


int
main()
{
    /************************* BOOT WITH ONE vCPU *****************************/

    test::host_t                        host(1, 4);
    test::notifier_t                    notifier;
    hotplug::slot::set_t                set(hotplug::slot::MAX_SUPPORTED_VCPUS, 1);
    hotplug::provisioner::provisioner_t provisioner(host);
    hotplug::controller_t               controller(set, provisioner, notifier);

    test::expect(set.size() == 1, "boot set holds one vCPU");
    test::expect(set.capacity() == 32, "boot set capacity is 32");
    test::expect
    (
        set.at(0).state == hotplug::slot::state_t::RUNNING,
        "boot vCPU is running"
    );
    test::expect(controller.total() == 1, "controller publishes boot total");


    /************************** GROW TO CAPACITY ******************************/

    hotplug::result_t result;
    std::string       reason;

    hotplug::error_code code = controller.execute({31}, result, reason);
    test::expect(code == hotplug::error_code::NONE, "add of 31 succeeds: " + reason);
    test::expect(result.added_count == 31, "31 vCPUs added");
    test::expect(result.new_total == 32, "new total is 32");
    test::expect(result.guest_notified, "guest notified");
    test::expect(result.duration == controller.last_duration(), "duration kept");
    test::expect(set.size() == 32, "set holds 32 slots");
    test::expect
    (
        set.count(hotplug::slot::state_t::RUNNING) == 32,
        "every slot running after commit"
    );
    test::expect(controller.total() == 32, "controller publishes 32");
    test::expect(controller.state() == hotplug::state_t::IDLE, "controller idle");
    test::expect(host.live_size() == 32, "host runs 32 vCPUs");
    test::expect(host.pin_count() == 31, "every new vCPU pinned");

    // Guest is told once, with the new total
    test::expect(notifier.calls == 1, "notified exactly once");
    test::expect(notifier.last_total == 32, "notified with new total");

    // Slots came up in ascending ordinal order, pinned round robin
    const std::vector<std::string> history = host.history();
    test::expect(history.size() == 62, "create and pin per new vCPU");
    for (std::size_t index = 0; index < 31 && index * 2 + 1 < history.size(); ++index)
    {
        const std::size_t ordinal = index + 1;
        test::expect
        (
            history[index * 2] == "create " + std::to_string(ordinal),
            "create order at " + std::to_string(ordinal)
        );
        test::expect
        (
            history[index * 2 + 1] == "pin " + std::to_string(ordinal) + " "
                + std::to_string(ordinal % 4),
            "pin placement at " + std::to_string(ordinal)
        );
    }
    for (hotplug::slot::ordinal_t ordinal = 1; ordinal < set.size(); ++ordinal)
    {
        const hotplug::slot::slot_t &slot = set.at(ordinal);
        test::expect
        (
            slot.ordinal == ordinal
                && slot.apic_id == ordinal
                && slot.pCPU_rank == ordinal % 4
                && slot.state == hotplug::slot::state_t::RUNNING,
            "slot " + std::to_string(ordinal) + " running and pinned"
        );
    }


    /************************** REQUESTS PAST LIMIT ***************************/

    reason.clear();
    code = controller.execute({32}, result, reason);
    test::expect(code == hotplug::error_code::VALIDATION, "add of 32 rejected");
    test::expect
    (
        reason == "The number of vCPUs added must be less than 32.",
        "add of 32 reason, got: " + reason
    );
    test::expect(set.size() == 32, "rejected request leaves set unchanged");
    test::expect(notifier.calls == 1, "rejected request does not notify");

    reason.clear();
    code = controller.execute({1}, result, reason);
    test::expect(code == hotplug::error_code::VALIDATION, "add past capacity rejected");
    test::expect
    (
        reason == "would exceed maximum supported vCPU count",
        "capacity reason, got: " + reason
    );

    reason.clear();
    code = controller.execute({0}, result, reason);
    test::expect(code == hotplug::error_code::VALIDATION, "add of 0 rejected");
    test::expect
    (
        reason == "The number of vCPUs added must be greater than 0.",
        "add of 0 reason, got: " + reason
    );
    test::expect(host.history().size() == 62, "rejections never reach the host");
    test::expect(controller.state() == hotplug::state_t::IDLE, "lease released");


    /************************ SMALL STEPS ACCUMULATE **************************/

    test::host_t                        step_host(2, 3);
    test::notifier_t                    step_notifier;
    hotplug::slot::set_t                step_set(16, 2);
    hotplug::provisioner::provisioner_t step_provisioner(step_host);
    hotplug::controller_t               step_controller(step_set, step_provisioner, step_notifier);

    std::size_t expected_total = 2;
    for (hotplug::request::request_t request: {hotplug::request::request_t {1},
                                               hotplug::request::request_t {5},
                                               hotplug::request::request_t {8}})
    {
        reason.clear();
        code = step_controller.execute(request, result, reason);
        expected_total += request.add;
        test::expect(code == hotplug::error_code::NONE, "step succeeds: " + reason);
        test::expect
        (
            result.new_total == expected_total && step_set.size() == expected_total,
            "step total " + std::to_string(expected_total)
        );
    }
    test::expect(step_notifier.calls == 3, "one notification per step");
    test::expect(step_host.live_size() == 16, "host runs 16 vCPUs");

    return test::finish("hotplug_growth");
}
