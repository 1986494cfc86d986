#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <string>
#include <thread>

#include "provisioner/provisioner.hpp"
#include "slot/slot.hpp"
#include "sys/controller.hpp"
#include "support/support.hpp"


int
main()
{
    test::host_t                        host(1, 4);
    test::notifier_t                    notifier;
    hotplug::slot::set_t                set(32, 1);
    hotplug::provisioner::provisioner_t provisioner(host);
    hotplug::controller_t               controller(set, provisioner, notifier);

    /********************** FIRST REQUEST HELD IN FLIGHT **********************/

    host.hold();

    hotplug::result_t   first_result;
    hotplug::error_code first_code = hotplug::error_code::NONE;
    std::string         first_reason;
    std::thread first
    (
        [&]()
        {
            first_code = controller.execute({4}, first_result, first_reason);
        }
    );

    const bool in_flight = host.wait_entered(std::chrono::seconds(5));
    test::expect(in_flight, "first request reached the host");
    test::expect
    (
        controller.state() == hotplug::state_t::LEASE_HELD,
        std::string("controller holds lease, state is ")
            + hotplug::state_name(controller.state())
    );


    /********************* SECOND REQUEST FAILS FAST **************************/

    hotplug::result_t second_result;
    std::string       second_reason;
    const hotplug::error_code second_code
        = controller.execute({2}, second_result, second_reason);

    test::expect(second_code == hotplug::error_code::BUSY, "second request busy");
    test::expect
    (
        second_reason == "Another vCPU hotplug operation is in progress.",
        "busy reason, got: " + second_reason
    );
    test::expect(second_result.new_total == 0, "busy result carries no total");
    test::expect(controller.total() == 1, "busy request sees committed total");

    host.release();
    first.join();


    /*********************** FIRST REQUEST COMPLETES **************************/

    test::expect(first_code == hotplug::error_code::NONE, "first request succeeds: " + first_reason);
    test::expect(first_result.new_total == 5, "first request total is 5");
    test::expect(set.size() == 5, "set holds only first request's slots");
    test::expect(host.live_size() == 5, "host runs 5 vCPUs");
    test::expect(notifier.calls == 1, "only first request notified");
    test::expect(controller.state() == hotplug::state_t::IDLE, "lease released");

    // Lease is free again
    std::string reason;
    hotplug::result_t result;
    const hotplug::error_code code = controller.execute({2}, result, reason);
    test::expect(code == hotplug::error_code::NONE, "request after release succeeds");
    test::expect(result.new_total == 7, "total grows to 7");

    // Free lease is always claimed
    std::size_t total_busy = 0;
    for (std::size_t attempt = 0; attempt < 1000; ++attempt)
    {
        reason.clear();
        if (controller.execute({0}, result, reason) == hotplug::error_code::BUSY)
            ++total_busy;
    }
    test::expect(total_busy == 0, "sequential callers never see busy");
    test::expect(controller.state() == hotplug::state_t::IDLE, "lease free after sequential callers");


    /********************** MANY CONCURRENT CALLERS ***************************/

    test::host_t                        race_host(1, 4);
    test::notifier_t                    race_notifier;
    hotplug::slot::set_t                race_set(32, 1);
    hotplug::provisioner::provisioner_t race_provisioner(race_host);
    hotplug::controller_t               race_controller(race_set, race_provisioner, race_notifier);

    // Callers only record their outcome; checks run after every join
    constexpr std::size_t CALLERS = 8;
    hotplug::error_code codes[CALLERS] = {};
    std::thread         callers[CALLERS];
    for (std::size_t caller = 0; caller < CALLERS; ++caller)
    {
        callers[caller] = std::thread
        (
            [&, caller]()
            {
                hotplug::result_t caller_result;
                std::string       caller_reason;
                codes[caller] = race_controller.execute({3}, caller_result, caller_reason);
            }
        );
    }
    for (std::thread &caller: callers)
        caller.join();

    std::size_t total_succeeded = 0;
    for (std::size_t caller = 0; caller < CALLERS; ++caller)
    {
        if (codes[caller] == hotplug::error_code::NONE)
            ++total_succeeded;
        else
        {
            test::expect
            (
                codes[caller] == hotplug::error_code::BUSY,
                "concurrent caller " + std::to_string(caller) + " either succeeds or is busy"
            );
        }
    }

    test::expect(total_succeeded >= 1, "at least one concurrent caller succeeds");
    test::expect
    (
        race_set.size() == 1 + 3 * total_succeeded,
        "set size matches successful callers"
    );
    test::expect(race_host.live_size() == race_set.size(), "host matches set");
    test::expect(race_notifier.calls == total_succeeded, "one notification per success");

    return test::finish("busy_while_in_flight");
}
