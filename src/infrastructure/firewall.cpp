#include "routnet/infrastructure/firewall.hpp"
#include "routnet/core/command_runner.hpp"
#include "routnet/core/logger.hpp"

namespace routnet
{
    namespace infrastructure
    {

        std::string NatRule::tag() const
        {
            switch (kind)
            {
            case NatRuleKind::Masquerade:
                return "routnet:masquerade:" + out_interface;
            case NatRuleKind::ForwardEstablished:
                return "routnet:established:" + in_interface + ":" + out_interface;
            case NatRuleKind::ForwardAccept:
                return "routnet:forward:" + in_interface + ":" + out_interface;
            }
            return "routnet:unknown";
        }

        std::string NatRule::describe() const
        {
            switch (kind)
            {
            case NatRuleKind::Masquerade:
                return "masquerade(out=" + out_interface + ")";
            case NatRuleKind::ForwardEstablished:
                return "forward(in=" + in_interface + ",out=" + out_interface + ",established)";
            case NatRuleKind::ForwardAccept:
                return "forward(in=" + in_interface + ",out=" + out_interface + ")";
            }
            return "unknown";
        }

        std::vector<NatRule> build_nat_rule_set(const std::string &wan, const std::string &ap)
        {
            return {
                NatRule{NatRuleKind::Masquerade, "", wan},
                NatRule{NatRuleKind::ForwardEstablished, wan, ap},
                NatRule{NatRuleKind::ForwardAccept, ap, wan},
            };
        }

        std::unique_ptr<FirewallBackend> select_firewall_backend(core::CommandRunner &runner,
                                                                 const std::string &preference)
        {
            auto logger = core::get_logger("Firewall");

            const bool have_nft = runner.has_tool("nft");
            const bool have_iptables = runner.has_tool("iptables");

            std::unique_ptr<FirewallBackend> backend;
            if ((preference == "auto" || preference == "nft") && have_nft)
            {
                backend = std::make_unique<NftFirewallBackend>(runner);
            }
            else if ((preference == "auto" || preference == "iptables") && have_iptables)
            {
                backend = std::make_unique<IptablesFirewallBackend>(runner);
            }

            if (backend)
            {
                logger->info("Selected firewall backend", core::LogContext().add("backend", backend->name()));
            }
            else
            {
                logger->error("No usable firewall backend",
                              core::LogContext()
                                  .add("preference", preference)
                                  .add("nft", have_nft)
                                  .add("iptables", have_iptables));
            }
            return backend;
        }

    } // namespace infrastructure
} // namespace routnet
