#include <filesystem>
#include <iostream>
#include <string>

#include "routnet/core/config.hpp"
#include "routnet/core/logger.hpp"
#include "routnet/services/command_shell.hpp"
#include "routnet/services/hotspot_controller.hpp"
#include "routnet/services/policy_store.hpp"
#include "Fakes.hpp"

using namespace routnet;
using routnet::testing::expect;

namespace
{
    bool contains(const std::string &text, const std::string &needle)
    {
        return text.find(needle) != std::string::npos;
    }
}

int main()
{
    int test_result_code = EXIT_SUCCESS;
    core::setup_logging(core::LogLevel::ERROR);

    std::cout << "--- routnet Command Shell Test ---" << std::endl;

    const std::string dir = testing::make_temp_dir("shell");

    testing::FakeCommandRunner runner;
    testing::FakeLinkControl links;
    testing::FakeWirelessControl wireless(links);
    testing::FakeFirewall firewall;
    testing::FakeTrafficControl tc;
    testing::FakeSysctl sysctl;
    testing::FakeLauncher launcher;

    wireless.add_radio("wlan0", "phy0", true);
    wireless.combinations["phy0"] = {infrastructure::InterfaceCombination{"managed", "AP"}};
    sysctl.values["net.ipv4.ip_forward"] = "1";

    core::HotspotConfig config;
    config.interfaces.sta = "wlan0";
    config.interfaces.wan = "wlan0";
    config.access_point.startup_grace_ms = 0;
    config.backend.prefer_delegate = false;
    config.paths.runtime_dir = dir + "/run";

    services::PolicyStore policy(dir + "/policy");
    policy.load();

    {
        services::HotspotDependencies deps{runner, links, wireless, nullptr, &firewall, tc, sysctl, launcher};
        services::HotspotController controller(config, deps, policy);
        services::CommandShell shell(controller);

        // --- Test 1: Commands before start ---
        std::cout << "\nTEST 1: Help, unknown and malformed commands..." << std::endl;
        {
            auto response = shell.execute("help");
            expect(response.ok && contains(response.text, "qos <mac> <rate>"), "help lists qos", test_result_code);

            response = shell.execute("   ");
            expect(response.ok && response.text.empty(), "blank line is ignored", test_result_code);

            response = shell.execute("frobnicate");
            expect(!response.ok && contains(response.text, "CommandInvalid"), "unknown command is CommandInvalid",
                   test_result_code);

            response = shell.execute("qos AA:BB:CC:DD:EE:01");
            expect(!response.ok && contains(response.text, "missing rate"), "qos without rate names the problem",
                   test_result_code);

            response = shell.execute("block nonsense");
            expect(!response.ok && contains(response.text, "invalid MAC"), "bad MAC reported", test_result_code);

            response = shell.execute("show-clients");
            expect(!response.ok, "show-clients before start fails", test_result_code);
        }

        // --- Test 2: Running hotspot ---
        std::cout << "\nTEST 2: start, policy and status..." << std::endl;
        {
            auto response = shell.execute("start");
            expect(response.ok && contains(response.text, "ap0"), "start reports the interface", test_result_code);

            response = shell.execute("qos aa:bb:cc:dd:ee:01 5mbit");
            expect(response.ok && response.text == "rate set\n", "rate set", test_result_code);

            response = shell.execute("block AA:BB:CC:DD:EE:02");
            expect(response.ok && response.text == "blocked\n", "device blocked", test_result_code);
            response = shell.execute("block AA:BB:CC:DD:EE:02");
            expect(response.ok && response.text == "already blocked\n", "second block is a no-op", test_result_code);

            response = shell.execute("status");
            expect(contains(response.text, "state: running") && contains(response.text, "1 blocked, 1 rate limited"),
                   "status summarises state and policy", test_result_code);

            infrastructure::StationInfo station;
            station.mac = "AA:BB:CC:DD:EE:01";
            wireless.station_list = {station};
            response = shell.execute("show-clients");
            expect(response.ok && contains(response.text, "AA:BB:CC:DD:EE:01") && contains(response.text, "5mbit"),
                   "client listed with its rate", test_result_code);

            response = shell.execute("start");
            expect(!response.ok && controller.running(), "failed command leaves the hotspot running",
                   test_result_code);

            response = shell.execute("reset");
            expect(response.ok && policy.policy().empty(), "reset clears the policy", test_result_code);
        }

        // --- Test 3: quit ---
        std::cout << "\nTEST 3: quit stops the hotspot..." << std::endl;
        {
            const auto response = shell.execute("quit");
            expect(response.quit, "quit requested", test_result_code);
            expect(!controller.running(), "hotspot stopped", test_result_code);
            expect(firewall.rules.empty() && tc.qdiscs.empty() && !links.link_exists("ap0"), "system restored",
                   test_result_code);
        }

        expect(services::CommandShell::format_clients({}) == "no clients connected\n", "empty client table",
               test_result_code);
    }

    std::filesystem::remove_all(dir);

    std::cout << "\n--- routnet Command Shell Test Finished ---" << std::endl;
    return test_result_code;
}
