#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "routnet/core/logger.hpp"
#include "routnet/infrastructure/dhcp_server.hpp"
#include "routnet/infrastructure/hostapd.hpp"
#include "routnet/infrastructure/process_launcher.hpp"
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

    std::cout << "--- routnet Daemon Configuration Test ---" << std::endl;

    // --- Test 1: hostapd.conf ---
    std::cout << "\nTEST 1: hostapd configuration..." << std::endl;
    {
        infrastructure::HostapdSettings settings;
        settings.interface = "ap0";
        settings.ssid = "cafe";
        settings.channel = 11;

        const auto open = infrastructure::render_hostapd_config(settings);
        expect(contains(open, "interface=ap0\n") && contains(open, "ssid=cafe\n") && contains(open, "channel=11\n"),
               "interface, ssid and channel written", test_result_code);
        expect(!contains(open, "wpa"), "open network has no wpa lines", test_result_code);
        expect(!contains(open, "country_code"), "no country without a code", test_result_code);

        settings.passphrase = "correct horse";
        settings.country_code = "DE";
        const auto secured = infrastructure::render_hostapd_config(settings);
        expect(contains(secured, "wpa=2\n") && contains(secured, "wpa_passphrase=correct horse\n") &&
                   contains(secured, "rsn_pairwise=CCMP\n"),
               "WPA2-PSK with CCMP", test_result_code);
        expect(contains(secured, "country_code=DE\nieee80211d=1\n"), "regulatory domain set", test_result_code);
    }

    // --- Test 2: dnsmasq.conf ---
    std::cout << "\nTEST 2: dnsmasq configuration..." << std::endl;
    {
        infrastructure::DnsmasqSettings settings;
        settings.interface = "ap0";
        settings.gateway = "192.168.50.1";
        settings.prefix_length = 24;
        settings.range_start = "192.168.50.10";
        settings.range_end = "192.168.50.100";
        settings.dns_servers = {"1.1.1.1", "8.8.8.8"};

        const auto config = infrastructure::render_dnsmasq_config(settings, "/run/routnet/dnsmasq.leases");
        expect(contains(config, "interface=ap0\nbind-interfaces\n"), "bound to the AP interface", test_result_code);
        expect(contains(config, "dhcp-range=192.168.50.10,192.168.50.100,255.255.255.0,24h\n"), "DHCP range",
               test_result_code);
        expect(contains(config, "dhcp-option=option:router,192.168.50.1\n"), "gateway handed out", test_result_code);
        expect(contains(config, "no-resolv\nserver=1.1.1.1\nserver=8.8.8.8\n"), "upstream resolvers",
               test_result_code);
        expect(infrastructure::prefix_to_netmask(20) == "255.255.240.0", "/20 netmask", test_result_code);
    }

    // --- Test 3: Managers write their files and supervise the daemons ---
    std::cout << "\nTEST 3: Daemon supervision..." << std::endl;
    {
        const std::string dir = testing::make_temp_dir("daemons");
        testing::FakeLauncher launcher;
        infrastructure::HostapdManager hostapd(launcher, dir + "/run");
        infrastructure::DhcpServerManager dhcp(launcher, dir + "/run");

        infrastructure::HostapdSettings ap;
        ap.interface = "ap0";
        ap.ssid = "cafe";
        ap.passphrase = "correct horse";

        hostapd.stop_stale();
        expect(launcher.stale_patterns.back() == "hostapd.*" + hostapd.config_path(),
               "stale instances matched by config path", test_result_code);

        // A world-readable file from an earlier run must not keep its mode
        std::filesystem::create_directories(dir + "/run");
        {
            std::ofstream old_config(hostapd.config_path());
            old_config << "ssid=old\n";
        }
        std::filesystem::permissions(hostapd.config_path(), std::filesystem::perms::others_read,
                                     std::filesystem::perm_options::add);

        hostapd.start(ap);
        expect(std::filesystem::exists(hostapd.config_path()), "hostapd.conf written", test_result_code);
        const auto perms = std::filesystem::status(hostapd.config_path()).permissions();
        expect((perms & (std::filesystem::perms::group_all | std::filesystem::perms::others_all)) ==
                   std::filesystem::perms::none,
               "hostapd.conf readable by owner only", test_result_code);
        expect(hostapd.is_running(), "hostapd supervised", test_result_code);

        infrastructure::DnsmasqSettings dns;
        dns.interface = "ap0";
        dns.gateway = "192.168.50.1";
        dns.range_start = "192.168.50.10";
        dns.range_end = "192.168.50.100";
        launcher.die_on_start.insert("dnsmasq");
        dhcp.start(dns);
        expect(std::filesystem::exists(dhcp.config_path()), "dnsmasq.conf written", test_result_code);
        expect(!dhcp.is_running(), "early exit detected", test_result_code);
        expect(dhcp.pid() <= 0, "exited dnsmasq forgotten", test_result_code);
        expect(dhcp.stop() && launcher.terminated.empty(), "no signal sent to a reaped pid", test_result_code);

        expect(hostapd.stop() && !hostapd.is_running(), "hostapd stopped", test_result_code);
        expect(hostapd.stop(), "stopping twice is harmless", test_result_code);
        expect(launcher.terminated.size() == 1, "terminated exactly once", test_result_code);

        {
            std::ofstream log(dir + "/daemon.log");
            for (int i = 1; i <= 15; ++i)
            {
                log << "line " << i << "\n";
            }
        }
        const auto tail = infrastructure::read_log_tail(dir + "/daemon.log", 10);
        expect(tail.rfind("line 6\n", 0) == 0 && tail.size() > 7 && tail.substr(tail.size() - 7) == "line 15",
               "log tail keeps the last ten lines", test_result_code);

        std::filesystem::remove_all(dir);
    }

    std::cout << "\n--- routnet Daemon Configuration Test Finished ---" << std::endl;
    return test_result_code;
}
