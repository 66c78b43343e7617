#include "routnet/infrastructure/firewall.hpp"
#include "routnet/core/command_runner.hpp"
#include "routnet/core/logger.hpp"

#include <sstream>
#include <stdexcept>

namespace routnet
{
    namespace infrastructure
    {

        namespace
        {
            std::string quoted(const std::string &value)
            {
                return "\"" + value + "\"";
            }

            std::string join(const std::vector<std::string> &args)
            {
                std::string text;
                for (const auto &arg : args)
                {
                    if (!text.empty())
                    {
                        text += " ";
                    }
                    text += arg;
                }
                return text;
            }
        } // namespace

        NftFirewallBackend::NftFirewallBackend(core::CommandRunner &runner)
            : runner_(runner), logger_(core::get_logger("NftFirewall"))
        {
        }

        const char *NftFirewallBackend::chain_for(const NatRule &rule)
        {
            return rule.kind == NatRuleKind::Masquerade ? "postrouting" : "forward";
        }

        std::vector<std::string> NftFirewallBackend::rule_arguments(const NatRule &rule) const
        {
            std::vector<std::string> args = {chain_for(rule)};
            switch (rule.kind)
            {
            case NatRuleKind::Masquerade:
                args.insert(args.end(), {"oifname", quoted(rule.out_interface), "masquerade"});
                break;
            case NatRuleKind::ForwardEstablished:
                args.insert(args.end(), {"iifname", quoted(rule.in_interface),
                                         "oifname", quoted(rule.out_interface),
                                         "ct", "state", "related,established", "accept"});
                break;
            case NatRuleKind::ForwardAccept:
                args.insert(args.end(), {"iifname", quoted(rule.in_interface),
                                         "oifname", quoted(rule.out_interface), "accept"});
                break;
            }
            args.insert(args.end(), {"comment", quoted(rule.tag())});
            return args;
        }

        std::string NftFirewallBackend::render(const NatRule &rule) const
        {
            return "nft add rule ip " + std::string(TABLE_NAME) + " " + join(rule_arguments(rule));
        }

        bool NftFirewallBackend::prepare()
        {
            const bool existed = runner_.run({"nft", "list", "table", "ip", TABLE_NAME}).ok();

            if (!existed)
            {
                const auto result = runner_.run({"nft", "add", "table", "ip", TABLE_NAME});
                if (!result.ok())
                {
                    throw std::runtime_error("nft add table failed: " + result.output);
                }
                logger_->info("Created nftables table", core::LogContext().add("table", TABLE_NAME));
            }

            // "add chain" is a no-op for an existing chain with the same definition
            const std::vector<std::vector<std::string>> chains = {
                {"nft", "add", "chain", "ip", TABLE_NAME, "postrouting",
                 "{", "type", "nat", "hook", "postrouting", "priority", "100", ";", "policy", "accept", ";", "}"},
                {"nft", "add", "chain", "ip", TABLE_NAME, "forward",
                 "{", "type", "filter", "hook", "forward", "priority", "0", ";", "policy", "accept", ";", "}"},
            };
            for (const auto &chain : chains)
            {
                const auto result = runner_.run(chain);
                if (!result.ok())
                {
                    throw std::runtime_error("nft add chain " + chain[5] + " failed: " + result.output);
                }
            }

            return !existed;
        }

        bool NftFirewallBackend::release()
        {
            const auto result = runner_.run({"nft", "delete", "table", "ip", TABLE_NAME});
            if (!result.ok())
            {
                logger_->warning("Failed to delete nftables table",
                                 core::LogContext().add("table", TABLE_NAME).add("output", result.output));
            }
            return result.ok();
        }

        std::string NftFirewallBackend::list_chain(const std::string &chain)
        {
            const auto result = runner_.run({"nft", "-a", "list", "chain", "ip", TABLE_NAME, chain});
            return result.ok() ? result.output : std::string();
        }

        bool NftFirewallBackend::rule_exists(const NatRule &rule)
        {
            return list_chain(chain_for(rule)).find(quoted(rule.tag())) != std::string::npos;
        }

        void NftFirewallBackend::insert_rule(const NatRule &rule)
        {
            std::vector<std::string> command = {"nft", "add", "rule", "ip", TABLE_NAME};
            const auto args = rule_arguments(rule);
            command.insert(command.end(), args.begin(), args.end());

            const auto result = runner_.run(command);
            if (!result.ok())
            {
                throw std::runtime_error("nft add rule failed for " + rule.describe() + ": " + result.output);
            }
            logger_->debug("Inserted rule", core::LogContext().add("rule", rule.describe()));
        }

        bool NftFirewallBackend::remove_rule(const NatRule &rule)
        {
            // Listed rules end with "comment "<tag>" # handle <n>"
            const std::string chain = chain_for(rule);
            std::istringstream stream(list_chain(chain));
            std::string line;
            while (std::getline(stream, line))
            {
                if (line.find(quoted(rule.tag())) == std::string::npos)
                {
                    continue;
                }
                const auto marker = line.rfind("# handle ");
                if (marker == std::string::npos)
                {
                    continue;
                }
                std::string handle = line.substr(marker + 9);
                handle.erase(handle.find_last_not_of(" \t\r") + 1);
                const auto result = runner_.run({"nft", "delete", "rule", "ip", TABLE_NAME, chain, "handle", handle});
                if (!result.ok())
                {
                    logger_->warning("Failed to delete rule",
                                     core::LogContext().add("rule", rule.describe()).add("output", result.output));
                }
                return result.ok();
            }

            logger_->debug("Rule already absent", core::LogContext().add("rule", rule.describe()));
            return true;
        }

    } // namespace infrastructure
} // namespace routnet
