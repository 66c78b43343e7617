#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <sstream>
#include <string>

#include "routnet/core/config.hpp"
#include "routnet/core/errors.hpp"
#include "routnet/core/logger.hpp"
#include "routnet/core/net_units.hpp"
#include "routnet/services/policy_store.hpp"
#include "Fakes.hpp"

using namespace routnet;
using routnet::testing::expect;

namespace
{
    std::string read_file(const std::string &path)
    {
        std::ifstream file(path);
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    bool throws_code(core::ErrorCode code, const std::function<void()> &action)
    {
        try
        {
            action();
        }
        catch (const core::HotspotError &e)
        {
            return e.code() == code;
        }
        return false;
    }
}

int main()
{
    int test_result_code = EXIT_SUCCESS;
    core::setup_logging(core::LogLevel::ERROR);

    std::cout << "--- routnet Policy Store Test ---" << std::endl;

    // --- Test 1: Rates and MAC addresses ---
    std::cout << "\nTEST 1: Parsing rates and MAC addresses..." << std::endl;
    expect(core::parse_rate("2mbit") == 2000000ULL, "2mbit is 2000000 bit/s", test_result_code);
    expect(core::parse_rate("500kbit") == 500000ULL, "500kbit is 500000 bit/s", test_result_code);
    expect(core::parse_rate("1gbit") == 1000000000ULL, "1gbit is 10^9 bit/s", test_result_code);
    expect(core::parse_rate("100kbps") == 800000ULL, "100kbps counts bytes", test_result_code);
    expect(!core::parse_rate("fast"), "'fast' is rejected", test_result_code);
    expect(!core::parse_rate("0mbit"), "zero rate is rejected", test_result_code);
    expect(!core::parse_rate("mbit"), "missing digits are rejected", test_result_code);
    expect(core::format_rate(5000000) == "5mbit", "5000000 renders as 5mbit", test_result_code);
    expect(core::format_rate(1500000) == "1500kbit", "1500000 renders as 1500kbit", test_result_code);
    expect(core::normalize_mac("aa-bb-cc-dd-ee-0f") == std::string("AA:BB:CC:DD:EE:0F"),
           "dash separated MAC is normalized", test_result_code);
    expect(!core::normalize_mac("aa:bb:cc:dd:ee"), "short MAC is rejected", test_result_code);
    expect(!core::normalize_mac("gg:bb:cc:dd:ee:ff"), "non-hex MAC is rejected", test_result_code);

    // --- Test 2: Limits derived from config ---
    std::cout << "\nTEST 2: Ceil derivation..." << std::endl;
    {
        core::QosConfig config;
        config.link_rate = "100mbit";
        config.default_rate = "200mbit";
        config.ceil_factor = 2;
        const auto limits = services::QosLimits::from_config(config);
        expect(limits.default_rate == limits.link_rate, "default rate is capped at the link rate", test_result_code);
        expect(limits.ceil_for(2000000) == 4000000, "ceil is twice the rate", test_result_code);
        expect(limits.ceil_for(80000000) == 100000000, "ceil never exceeds the link", test_result_code);
        expect(limits.ceil_for(200000000) == 200000000, "ceil is never below the rate", test_result_code);

        config.link_rate = "lots";
        expect(throws_code(core::ErrorCode::ConfigInvalid, [&config]() { services::QosLimits::from_config(config); }),
               "bad link rate is ConfigInvalid", test_result_code);
    }

    const std::string dir = testing::make_temp_dir("policy");
    const std::string mac = "AA:BB:CC:DD:EE:01";

    // --- Test 3: Block and unblock round trip ---
    std::cout << "\nTEST 3: Block then unblock restores the file..." << std::endl;
    {
        services::PolicyStore store(dir);
        store.load();
        expect(store.policy().empty(), "missing files load as an empty policy", test_result_code);

        expect(store.block("aa:bb:cc:dd:ee:01"), "block reports a change", test_result_code);
        expect(!store.block(mac), "blocking twice reports no change", test_result_code);
        expect(read_file(store.blocked_path()) == mac + "\n", "blocked.list holds the normalized MAC", test_result_code);

        expect(store.unblock(mac), "unblock reports a change", test_result_code);
        expect(!store.unblock(mac), "unblocking twice reports no change", test_result_code);
        expect(read_file(store.blocked_path()).empty(), "blocked.list is empty again", test_result_code);
    }

    // --- Test 4: Last rate wins and survives a reload ---
    std::cout << "\nTEST 4: qos keeps one entry per MAC..." << std::endl;
    {
        services::PolicyStore store(dir);
        store.load();
        store.set_rate(mac, "2mbit");
        store.set_rate(mac, "5mbit");
        expect(!store.set_rate(mac, "5000kbit"), "same rate in other units is no change", test_result_code);
        expect(read_file(store.qos_path()) == mac + " 5mbit\n", "qos.list has a single 5mbit line", test_result_code);

        services::PolicyStore reloaded(dir);
        reloaded.load();
        expect(reloaded.policy().rates.size() == 1 && reloaded.policy().rates.at(mac) == 5000000,
               "reloaded store has the 5mbit rate", test_result_code);
    }

    // --- Test 5: Invalid input is CommandInvalid and changes nothing ---
    std::cout << "\nTEST 5: Invalid commands..." << std::endl;
    {
        services::PolicyStore store(dir);
        store.load();
        const auto before = store.policy();
        expect(throws_code(core::ErrorCode::CommandInvalid, [&store]() { store.set_rate("AA:BB:CC:DD:EE:01", ""); }),
               "missing rate is CommandInvalid", test_result_code);
        expect(throws_code(core::ErrorCode::CommandInvalid, [&store]() { store.set_rate("AA:BB:CC:DD:EE:01", "fast"); }),
               "bad rate is CommandInvalid", test_result_code);
        expect(throws_code(core::ErrorCode::CommandInvalid, [&store]() { store.block("not-a-mac"); }),
               "bad MAC is CommandInvalid", test_result_code);
        expect(store.policy() == before, "policy unchanged after invalid commands", test_result_code);
    }

    // --- Test 6: Comments and malformed lines ---
    std::cout << "\nTEST 6: Loading hand-edited lists..." << std::endl;
    {
        {
            std::ofstream file(dir + "/priority.list", std::ios::trunc);
            file << "# gaming console\n\naa:bb:cc:dd:ee:02  # desk\nbogus\n";
        }
        services::PolicyStore store(dir);
        store.load();
        expect(store.policy().priority.size() == 1 && store.policy().priority.count("AA:BB:CC:DD:EE:02"),
               "one priority MAC, comments and junk skipped", test_result_code);

        const auto entries = store.policy().entries(services::QosLimits());
        expect(entries.size() == 2, "entries cover rated and prioritized MACs", test_result_code);

        expect(store.reset(), "reset reports a change", test_result_code);
        expect(!store.reset(), "second reset reports no change", test_result_code);
        expect(read_file(store.qos_path()).empty() && read_file(store.priority_path()).empty(),
               "reset empties every list", test_result_code);
    }

    // --- Test 7: Unwritable directory ---
    std::cout << "\nTEST 7: Failed save leaves the policy unchanged..." << std::endl;
    {
        {
            std::ofstream blocker(dir + "/file", std::ios::trunc);
            blocker << "not a directory\n";
        }
        services::PolicyStore store(dir + "/file/routnet");
        store.load();

        bool threw = false;
        try
        {
            store.block("AA:BB:CC:DD:EE:01");
        }
        catch (const std::exception &)
        {
            threw = true;
        }
        expect(threw, "block into an unwritable directory fails", test_result_code);
        expect(store.policy().empty(), "failed block not kept in memory", test_result_code);

        threw = false;
        try
        {
            store.set_rate("AA:BB:CC:DD:EE:01", "2mbit");
        }
        catch (const std::exception &)
        {
            threw = true;
        }
        expect(threw && store.policy().rates.empty(), "failed qos not kept in memory", test_result_code);
    }

    std::filesystem::remove_all(dir);

    std::cout << "\n--- routnet Policy Store Test Finished ---" << std::endl;
    return test_result_code;
}
