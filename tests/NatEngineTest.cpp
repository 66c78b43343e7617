#include <iostream>
#include <string>

#include "routnet/core/errors.hpp"
#include "routnet/core/logger.hpp"
#include "routnet/core/transaction_log.hpp"
#include "routnet/infrastructure/firewall.hpp"
#include "routnet/services/nat_engine.hpp"
#include "Fakes.hpp"

using namespace routnet;
using infrastructure::NatRuleKind;
using routnet::testing::expect;

int main()
{
    int test_result_code = EXIT_SUCCESS;
    core::setup_logging(core::LogLevel::ERROR);

    std::cout << "--- routnet NAT Engine Test ---" << std::endl;

    const std::string forwarding = services::NatEngine::FORWARDING_KEY;

    // --- Test 1: Applying twice never duplicates rules ---
    std::cout << "\nTEST 1: Idempotent rule application..." << std::endl;
    {
        testing::FakeFirewall firewall;
        testing::FakeSysctl sysctl;
        sysctl.values[forwarding] = "1";
        core::TransactionLog log;
        services::NatEngine nat(&firewall, sysctl, log);

        nat.apply_rules("wlan0", "ap0");
        const size_t after_first = log.size();
        nat.apply_rules("wlan0", "ap0");

        expect(firewall.count(NatRuleKind::Masquerade) == 1, "one masquerade rule", test_result_code);
        expect(firewall.count(NatRuleKind::ForwardEstablished) + firewall.count(NatRuleKind::ForwardAccept) == 2,
               "two forward rules", test_result_code);
        expect(after_first == 4, "table plus three rules registered for undo", test_result_code);
        expect(log.size() == after_first, "second application registers nothing", test_result_code);

        log.drain();
        expect(firewall.rules.empty() && !firewall.table, "drain removes rules and table", test_result_code);
    }

    // --- Test 2: Forwarding is restored only when we changed it ---
    std::cout << "\nTEST 2: Forwarding restore..." << std::endl;
    {
        testing::FakeFirewall firewall;
        testing::FakeSysctl sysctl;
        sysctl.values[forwarding] = "0";
        core::TransactionLog log;
        services::NatEngine nat(&firewall, sysctl, log);

        nat.enable_forwarding();
        expect(sysctl.values[forwarding] == "1", "forwarding enabled", test_result_code);
        log.drain();
        expect(sysctl.values[forwarding] == "0", "forwarding restored to 0", test_result_code);

        sysctl.values[forwarding] = "1";
        sysctl.writes.clear();
        nat.enable_forwarding();
        expect(log.empty() && sysctl.writes.empty(), "already enabled forwarding is left alone", test_result_code);
    }

    // --- Test 3: Rejected rule keeps earlier rules registered ---
    std::cout << "\nTEST 3: Partial failure..." << std::endl;
    {
        testing::FakeFirewall firewall;
        firewall.fail_kind = NatRuleKind::ForwardAccept;
        testing::FakeSysctl sysctl;
        core::TransactionLog log;
        services::NatEngine nat(&firewall, sysctl, log);

        bool failed = false;
        try
        {
            nat.apply_rules("wlan0", "ap0");
        }
        catch (const core::HotspotError &e)
        {
            failed = e.code() == core::ErrorCode::RuleApplyFailed;
        }
        expect(failed, "rejected rule is RuleApplyFailed", test_result_code);
        expect(log.size() == 3, "table and two inserted rules are undoable", test_result_code);
        log.drain();
        expect(firewall.rules.empty(), "rollback leaves no rule", test_result_code);
    }

    // --- Test 4: No backend ---
    std::cout << "\nTEST 4: Missing firewall tool..." << std::endl;
    {
        testing::FakeSysctl sysctl;
        core::TransactionLog log;
        services::NatEngine nat(nullptr, sysctl, log);
        bool failed = false;
        try
        {
            nat.apply_rules("wlan0", "ap0");
        }
        catch (const core::HotspotError &e)
        {
            failed = e.code() == core::ErrorCode::RuleApplyFailed;
        }
        expect(failed, "no backend is RuleApplyFailed", test_result_code);
        expect(nat.backend_name() == "none", "backend reported as none", test_result_code);
    }

    // --- Test 5: nftables statements ---
    std::cout << "\nTEST 5: nft rendering and handle removal..." << std::endl;
    {
        testing::FakeCommandRunner runner;
        infrastructure::NftFirewallBackend nft(runner);
        const auto rules = infrastructure::build_nat_rule_set("wlan0", "ap0");

        expect(nft.render(rules[0]) ==
                   "nft add rule ip routnet postrouting oifname \"wlan0\" masquerade comment \"routnet:masquerade:wlan0\"",
               "masquerade statement", test_result_code);
        expect(nft.render(rules[1]).find("iifname \"wlan0\" oifname \"ap0\" ct state related,established accept") !=
                   std::string::npos,
               "established statement", test_result_code);

        runner.script("nft list table ip routnet", 1, "Error: No such file or directory");
        expect(nft.prepare(), "prepare reports a created table", test_result_code);
        expect(runner.count_prefix("nft add chain ip routnet") == 2, "both chains declared", test_result_code);

        runner.script("nft -a list chain ip routnet forward", 0,
                      "table ip routnet {\n\tchain forward {\n"
                      "\t\tiifname \"ap0\" oifname \"wlan0\" accept comment \"routnet:forward:ap0:wlan0\" # handle 7\n"
                      "\t}\n}\n");
        expect(nft.rule_exists(rules[2]), "tagged rule found in listing", test_result_code);
        expect(!nft.rule_exists(rules[1]), "untagged rule not found", test_result_code);
        expect(nft.remove_rule(rules[2]), "removal succeeds", test_result_code);
        expect(runner.calls.back() == "nft delete rule ip routnet forward handle 7", "removal by handle",
               test_result_code);
    }

    // --- Test 6: iptables statements ---
    std::cout << "\nTEST 6: iptables rendering..." << std::endl;
    {
        testing::FakeCommandRunner runner;
        infrastructure::IptablesFirewallBackend iptables(runner);
        const auto rules = infrastructure::build_nat_rule_set("wlan0", "ap0");

        expect(iptables.render(rules[0]) == "iptables -w -t nat -A POSTROUTING -o wlan0 -j MASQUERADE",
               "masquerade statement", test_result_code);
        expect(iptables.render(rules[2]) == "iptables -w -A FORWARD -i ap0 -o wlan0 -j ACCEPT",
               "forward statement", test_result_code);

        runner.default_result = core::CommandResult{1, ""};
        expect(!iptables.rule_exists(rules[0]), "-C failure means absent", test_result_code);
        expect(iptables.remove_rule(rules[0]), "removing an absent rule is fine", test_result_code);
        expect(runner.count_prefix("iptables -w -t nat -D") == 0, "no -D for an absent rule", test_result_code);
    }

    // --- Test 7: Backend selection ---
    std::cout << "\nTEST 7: Backend selection..." << std::endl;
    {
        testing::FakeCommandRunner runner;
        runner.tools = {"nft", "iptables"};
        auto preferred = infrastructure::select_firewall_backend(runner, "auto");
        expect(preferred && preferred->name() == "nftables", "nft wins when both exist", test_result_code);

        auto forced = infrastructure::select_firewall_backend(runner, "iptables");
        expect(forced && forced->name() == "iptables", "iptables when requested", test_result_code);

        runner.tools.clear();
        expect(!infrastructure::select_firewall_backend(runner, "auto"), "nothing without tools", test_result_code);
    }

    std::cout << "\n--- routnet NAT Engine Test Finished ---" << std::endl;
    return test_result_code;
}
