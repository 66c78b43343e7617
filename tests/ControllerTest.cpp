#include <algorithm>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <set>
#include <sstream>
#include <string>

#include "routnet/core/config.hpp"
#include "routnet/core/errors.hpp"
#include "routnet/core/logger.hpp"
#include "routnet/services/hotspot_controller.hpp"
#include "routnet/services/policy_store.hpp"
#include "Fakes.hpp"

using namespace routnet;
using infrastructure::NatRuleKind;
using routnet::testing::expect;

namespace
{
    const std::string FORWARDING = "net.ipv4.ip_forward";
    const std::string PHONE = "AA:BB:CC:DD:EE:01";

    /**
     * One laptop with a single concurrent-capable radio, wlan0, that is
     * both the Wi-Fi client and the uplink
     */
    struct Rig
    {
        explicit Rig(const std::string &tag, bool with_delegate = false)
            : wireless(links), dir(testing::make_temp_dir(tag)), policy(dir + "/policy")
        {
            wireless.add_radio("wlan0", "phy0", true);
            wireless.combinations["phy0"] = {infrastructure::InterfaceCombination{"managed", "AP"}};
            sysctl.values[FORWARDING] = "0";

            config.interfaces.sta = "wlan0";
            config.interfaces.wan = "wlan0";
            config.access_point.ssid = "cafe";
            config.access_point.passphrase = "correct horse";
            config.access_point.startup_grace_ms = 0;
            config.paths.runtime_dir = dir + "/run";
            config.paths.policy_dir = dir + "/policy";
            config.backend.prefer_delegate = with_delegate;

            delegate.is_available = with_delegate;
            policy.load();
        }

        ~Rig()
        {
            controller.reset();
            std::filesystem::remove_all(dir);
        }

        services::HotspotController &make()
        {
            services::HotspotDependencies deps{runner, links, wireless, &delegate, &firewall,
                                               tc, sysctl, launcher};
            controller = std::make_unique<services::HotspotController>(config, deps, policy);
            return *controller;
        }

        // Nothing of ours left in the kernel, firewall or process table
        bool pristine() const
        {
            return links.links == std::set<std::string>{"wlan0"} && firewall.rules.empty() && !firewall.table &&
                   sysctl.values.at(FORWARDING) == "0" && tc.qdiscs.empty() && links.addresses.empty() &&
                   !launcher.running("hostapd") && !launcher.running("dnsmasq");
        }

        testing::FakeCommandRunner runner;
        testing::FakeLinkControl links;
        testing::FakeWirelessControl wireless;
        testing::FakeDelegate delegate;
        testing::FakeFirewall firewall;
        testing::FakeTrafficControl tc;
        testing::FakeSysctl sysctl;
        testing::FakeLauncher launcher;

        std::string dir;
        core::HotspotConfig config;
        services::PolicyStore policy;
        std::unique_ptr<services::HotspotController> controller;
    };

    bool fails_with(core::ErrorCode code, const std::function<void()> &action)
    {
        try
        {
            action();
        }
        catch (const core::HotspotError &e)
        {
            if (e.code() != code)
            {
                std::cerr << "INFO: got " << core::error_code_name(e.code()) << ": " << e.what() << std::endl;
            }
            return e.code() == code;
        }
        return false;
    }
}

int main()
{
    int test_result_code = EXIT_SUCCESS;
    core::setup_logging(core::LogLevel::ERROR);

    std::cout << "--- routnet Hotspot Controller Test ---" << std::endl;

    // --- Test 1: Weak passphrase is refused before any change ---
    std::cout << "\nTEST 1: WeakPassphrase..." << std::endl;
    {
        Rig rig("weak");
        rig.config.access_point.passphrase = "short1";
        auto &controller = rig.make();

        expect(fails_with(core::ErrorCode::WeakPassphrase, [&controller]() { controller.start(); }),
               "6 character passphrase is WeakPassphrase", test_result_code);
        expect(rig.wireless.added.empty() && rig.runner.calls.empty() && rig.sysctl.writes.empty() &&
                   rig.launcher.launched.empty(),
               "no system state touched", test_result_code);
        expect(controller.state() == services::HotspotState::Idle, "controller stays idle", test_result_code);
    }

    // --- Test 2: Self-hosted start, policy command, stop ---
    std::cout << "\nTEST 2: Full self-hosted run..." << std::endl;
    {
        Rig rig("selfhosted");
        auto &controller = rig.make();
        controller.start();

        expect(controller.running() && !controller.delegated(), "running in self-hosted mode", test_result_code);
        expect(controller.ap_interface() == "ap0", "virtual interface ap0", test_result_code);
        expect(rig.links.addresses["ap0"] == std::vector<std::string>{"192.168.50.1/24"}, "gateway address assigned",
               test_result_code);
        expect(rig.firewall.count(NatRuleKind::Masquerade) == 1 && rig.firewall.rules.size() == 3,
               "masquerade and forward rules installed", test_result_code);
        expect(rig.sysctl.values[FORWARDING] == "1", "forwarding enabled", test_result_code);
        expect(rig.tc.has_qdisc("ap0", "root") && rig.links.link_exists("ifb-ap0"), "shaping installed",
               test_result_code);
        expect(rig.launcher.running("hostapd") && rig.launcher.running("dnsmasq"), "daemons running",
               test_result_code);
        expect(rig.delegate.managed_changes.empty(), "no network manager, nothing to unmanage", test_result_code);
        expect(controller.check_health(), "healthy", test_result_code);
        expect(fails_with(core::ErrorCode::CommandInvalid, [&controller]() { controller.start(); }),
               "second start is refused", test_result_code);

        rig.tc.executed.clear();
        expect(controller.block(PHONE), "block accepted", test_result_code);
        bool drop_installed = false;
        for (const auto &line : rig.tc.executed_text())
        {
            drop_installed = drop_installed || line.find("action drop") != std::string::npos;
        }
        expect(drop_installed, "block rebuilt shaping with a drop filter", test_result_code);

        infrastructure::StationInfo station;
        station.mac = "aa:bb:cc:dd:ee:01";
        station.signal_dbm = -52;
        rig.wireless.station_list = {station};
        const auto clients = controller.show_clients();
        expect(clients.size() == 1 && clients[0].mac == PHONE && clients[0].blocked, "client shown as blocked",
               test_result_code);

        controller.stop();
        expect(controller.state() == services::HotspotState::Idle, "idle after stop", test_result_code);
        expect(rig.pristine(), "stop restores every change", test_result_code);
        expect(controller.transaction_log().empty(), "transaction log drained", test_result_code);

        controller.stop();
        expect(rig.pristine(), "second stop is harmless", test_result_code);
    }

    // --- Test 3: A daemon dying during startup rolls everything back ---
    std::cout << "\nTEST 3: DaemonDiedEarly..." << std::endl;
    {
        Rig rig("died");
        rig.launcher.die_on_start.insert("dnsmasq");
        auto &controller = rig.make();

        expect(fails_with(core::ErrorCode::DaemonDiedEarly, [&controller]() { controller.start(); }),
               "dnsmasq exit is DaemonDiedEarly", test_result_code);
        expect(rig.pristine(), "rollback left nothing behind", test_result_code);
        expect(!rig.wireless.removed.empty() && rig.wireless.removed.front() == "ap0", "virtual interface deleted",
               test_result_code);
        expect(std::find(rig.launcher.terminated.begin(), rig.launcher.terminated.end(), "dnsmasq") ==
                   rig.launcher.terminated.end(),
               "dead dnsmasq not signalled during rollback", test_result_code);
        expect(controller.state() == services::HotspotState::Idle, "controller idle again", test_result_code);
    }

    // --- Test 4: Rule failure after interface creation ---
    std::cout << "\nTEST 4: RuleApplyFailed..." << std::endl;
    {
        Rig rig("rules");
        rig.firewall.fail_kind = NatRuleKind::ForwardAccept;
        auto &controller = rig.make();

        expect(fails_with(core::ErrorCode::RuleApplyFailed, [&controller]() { controller.start(); }),
               "rejected forward rule is RuleApplyFailed", test_result_code);
        expect(rig.pristine(), "interface and partial rules removed", test_result_code);
        expect(rig.launcher.launched.empty(), "no daemon started", test_result_code);
    }

    // --- Test 5: Delegate path ---
    std::cout << "\nTEST 5: Network manager hotspot..." << std::endl;
    {
        Rig rig("delegate", true);
        auto &controller = rig.make();
        std::set<services::HotspotState> seen;
        rig.firewall.on_insert = [&seen, &controller]()
        { seen.insert(controller.state()); };
        rig.tc.on_execute = [&seen, &controller]()
        { seen.insert(controller.state()); };
        controller.start();

        expect(seen == std::set<services::HotspotState>{services::HotspotState::DelegateHotspotActive},
               "NAT and shaping applied while the managed hotspot is the current state", test_result_code);
        expect(rig.delegate.managed_changes.empty(), "managed hotspot interface left to network manager",
               test_result_code);

        expect(controller.delegated() && controller.ap_interface() == "wlan0", "delegate hotspot on the base radio",
               test_result_code);
        expect(rig.delegate.requests.size() == 1 && rig.delegate.requests[0].gateway_cidr == "192.168.50.1/24",
               "delegate asked for the hotspot subnet", test_result_code);
        expect(rig.wireless.added.empty() && rig.launcher.launched.empty(), "no virtual interface and no daemons",
               test_result_code);
        expect(rig.firewall.rules.size() == 3 && rig.tc.has_qdisc("wlan0", "root"), "NAT and shaping still applied",
               test_result_code);

        controller.stop();
        expect(rig.delegate.teardowns == 1 && !rig.delegate.active, "delegate hotspot torn down", test_result_code);
        expect(rig.pristine(), "nothing left after stop", test_result_code);
    }

    // --- Test 6: Delegate refusal falls back to hostapd ---
    std::cout << "\nTEST 6: Delegate refusal..." << std::endl;
    {
        Rig rig("fallback", true);
        rig.delegate.accept = false;
        auto &controller = rig.make();
        controller.start();

        expect(!controller.delegated() && controller.ap_interface() == "ap0", "self-hosted after refusal",
               test_result_code);
        expect(rig.launcher.running("hostapd"), "hostapd started", test_result_code);
        expect(rig.delegate.unmanaged == std::set<std::string>{"ap0"}, "network manager told to leave ap0 alone",
               test_result_code);
        controller.stop();
        expect(rig.delegate.teardowns == 0, "refused delegate needs no teardown", test_result_code);
        expect(rig.delegate.unmanaged.empty() &&
                   rig.delegate.managed_changes == std::vector<std::string>{"ap0 no", "ap0 yes"},
               "managed state restored on stop", test_result_code);
    }

    // --- Test 7: Failed rebuild keeps the hotspot up ---
    std::cout << "\nTEST 7: ShapingRebuildFailed during a command..." << std::endl;
    {
        Rig rig("rebuild");
        auto &controller = rig.make();
        controller.start();

        rig.tc.fail_device = "ifb-ap0";
        expect(fails_with(core::ErrorCode::ShapingRebuildFailed, [&controller]() { controller.set_rate(PHONE, "2mbit"); }),
               "rebuild failure reported", test_result_code);
        expect(controller.running(), "hotspot still running", test_result_code);
        expect(rig.policy.policy().rates.count(PHONE) == 1, "rate persisted anyway", test_result_code);
        expect(controller.status().find("shaping: inactive") != std::string::npos, "status shows shaping down",
               test_result_code);
        expect(rig.tc.qdiscs.empty(), "no partial hierarchy left", test_result_code);

        rig.tc.fail_device.clear();
        expect(!controller.set_rate(PHONE, "2mbit"), "same rate is no policy change", test_result_code);
        expect(rig.tc.has_qdisc("ap0", "root"), "next command restored shaping", test_result_code);

        controller.stop();
        expect(rig.pristine(), "clean stop after recovery", test_result_code);
    }

    // --- Test 8: Policy while stopped, dry run, health ---
    std::cout << "\nTEST 8: Idle commands, plan and health..." << std::endl;
    {
        Rig rig("idle");
        auto &controller = rig.make();

        expect(controller.set_priority(PHONE), "priority accepted while stopped", test_result_code);
        expect(rig.tc.executed.empty(), "nothing installed while stopped", test_result_code);
        expect(fails_with(core::ErrorCode::CommandInvalid, [&controller]() { controller.show_clients(); }),
               "show-clients needs a running hotspot", test_result_code);

        const auto plan = controller.plan();
        expect(plan.find("interface=ap0") != std::string::npos && plan.find("wpa=2") != std::string::npos,
               "plan shows hostapd.conf", test_result_code);
        expect(plan.find("priority high: " + PHONE) != std::string::npos, "plan shows the priority class",
               test_result_code);
        expect(rig.wireless.added.empty() && rig.tc.executed.empty() && rig.firewall.rules.empty(),
               "plan changes nothing", test_result_code);

        controller.start();
        rig.launcher.kill_program("hostapd");
        expect(!controller.check_health(), "dead hostapd detected", test_result_code);
        controller.stop();
        expect(std::find(rig.launcher.terminated.begin(), rig.launcher.terminated.end(), "hostapd") ==
                   rig.launcher.terminated.end(),
               "dead hostapd not signalled on stop", test_result_code);
        expect(rig.pristine(), "stop after crash is clean", test_result_code);
    }

    // --- Test 9: Radio without AP mode ---
    std::cout << "\nTEST 9: ConcurrencyUnsupported from start..." << std::endl;
    {
        Rig rig("noap");
        rig.wireless.combinations["phy0"] = {infrastructure::InterfaceCombination{"managed", "monitor"}};
        auto &controller = rig.make();

        expect(fails_with(core::ErrorCode::ConcurrencyUnsupported, [&controller]() { controller.start(); }),
               "radio without managed+AP is ConcurrencyUnsupported", test_result_code);
        expect(rig.wireless.added.empty() && rig.firewall.rules.empty() && rig.tc.executed.empty() &&
                   rig.sysctl.writes.empty() && rig.launcher.launched.empty() && rig.links.addresses.empty(),
               "nothing touched before the capability check", test_result_code);
        expect(controller.state() == services::HotspotState::Idle && controller.transaction_log().empty(),
               "idle with an empty transaction log", test_result_code);
    }

    // --- Test 10: Open network ---
    std::cout << "\nTEST 10: Empty passphrase starts an open network..." << std::endl;
    {
        Rig rig("open");
        rig.config.access_point.passphrase = "";
        auto &controller = rig.make();
        controller.start();

        std::ifstream file(rig.config.paths.runtime_dir + "/hostapd.conf");
        std::stringstream written;
        written << file.rdbuf();
        const std::string text = written.str();
        expect(controller.running() && text.find("ssid=cafe\n") != std::string::npos,
               "hostapd.conf written for the open network", test_result_code);
        expect(text.find("wpa") == std::string::npos, "no WPA lines in hostapd.conf", test_result_code);
        expect(controller.status().find("(open)") != std::string::npos, "status reports an open network",
               test_result_code);

        controller.stop();
        expect(rig.pristine(), "open network stops cleanly", test_result_code);
    }

    std::cout << "\n--- routnet Hotspot Controller Test Finished ---" << std::endl;
    return test_result_code;
}
