#include "routnet/infrastructure/firewall.hpp"
#include "routnet/core/command_runner.hpp"
#include "routnet/core/logger.hpp"

#include <stdexcept>

namespace routnet
{
    namespace infrastructure
    {

        IptablesFirewallBackend::IptablesFirewallBackend(core::CommandRunner &runner)
            : runner_(runner), logger_(core::get_logger("IptablesFirewall"))
        {
        }

        std::vector<std::string> IptablesFirewallBackend::rule_arguments(const std::string &action,
                                                                         const NatRule &rule) const
        {
            // -w waits for the xtables lock instead of failing
            switch (rule.kind)
            {
            case NatRuleKind::Masquerade:
                return {"iptables", "-w", "-t", "nat", action, "POSTROUTING",
                        "-o", rule.out_interface, "-j", "MASQUERADE"};
            case NatRuleKind::ForwardEstablished:
                return {"iptables", "-w", action, "FORWARD",
                        "-i", rule.in_interface, "-o", rule.out_interface,
                        "-m", "state", "--state", "RELATED,ESTABLISHED", "-j", "ACCEPT"};
            case NatRuleKind::ForwardAccept:
                return {"iptables", "-w", action, "FORWARD",
                        "-i", rule.in_interface, "-o", rule.out_interface, "-j", "ACCEPT"};
            }
            return {};
        }

        std::string IptablesFirewallBackend::render(const NatRule &rule) const
        {
            std::string text;
            for (const auto &arg : rule_arguments("-A", rule))
            {
                if (!text.empty())
                {
                    text += " ";
                }
                text += arg;
            }
            return text;
        }

        bool IptablesFirewallBackend::rule_exists(const NatRule &rule)
        {
            return runner_.run(rule_arguments("-C", rule)).ok();
        }

        void IptablesFirewallBackend::insert_rule(const NatRule &rule)
        {
            const auto result = runner_.run(rule_arguments("-A", rule));
            if (!result.ok())
            {
                throw std::runtime_error("iptables append failed for " + rule.describe() + ": " + result.output);
            }
            logger_->debug("Inserted rule", core::LogContext().add("rule", rule.describe()));
        }

        bool IptablesFirewallBackend::remove_rule(const NatRule &rule)
        {
            if (!rule_exists(rule))
            {
                return true;
            }
            const auto result = runner_.run(rule_arguments("-D", rule));
            if (!result.ok())
            {
                logger_->warning("Failed to delete rule",
                                 core::LogContext().add("rule", rule.describe()).add("output", result.output));
            }
            return result.ok();
        }

    } // namespace infrastructure
} // namespace routnet
