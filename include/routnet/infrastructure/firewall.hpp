#ifndef ROUTNET_INFRASTRUCTURE_FIREWALL_HPP
#define ROUTNET_INFRASTRUCTURE_FIREWALL_HPP

#include <memory>
#include <string>
#include <vector>

namespace routnet
{
    namespace core
    {
        class CommandRunner;
        class Logger;
    }
}

namespace routnet
{
    namespace infrastructure
    {

        enum class NatRuleKind
        {
            Masquerade,         // out=WAN
            ForwardEstablished, // in=WAN, out=AP, related/established only
            ForwardAccept,      // in=AP, out=WAN
        };

        /**
         * Backend-agnostic NAT/forwarding rule
         */
        struct NatRule
        {
            NatRuleKind kind;
            std::string in_interface;  // Empty for masquerade
            std::string out_interface;

            // Stable identity, used as the nft rule comment
            std::string tag() const;
            std::string describe() const;

            bool operator==(const NatRule &other) const
            {
                return kind == other.kind && in_interface == other.in_interface &&
                       out_interface == other.out_interface;
            }
        };

        // The fixed rule set of a run, in application order
        std::vector<NatRule> build_nat_rule_set(const std::string &wan, const std::string &ap);

        /**
         * Firewall backend. Each NatRule maps to exactly one statement.
         * Mutations throw std::runtime_error; removals are best effort.
         */
        class FirewallBackend
        {
        public:
            virtual ~FirewallBackend() = default;

            virtual std::string name() const = 0;

            // Creates backend containers if needed. Returns true when it created them.
            virtual bool prepare() = 0;
            // Removes what prepare() created
            virtual bool release() = 0;

            virtual bool rule_exists(const NatRule &rule) = 0;
            virtual void insert_rule(const NatRule &rule) = 0;
            virtual bool remove_rule(const NatRule &rule) = 0;

            // Statement text as the backend tool would receive it
            virtual std::string render(const NatRule &rule) const = 0;
        };

        /**
         * nftables backend: rules live in "table ip routnet", tagged by comment
         */
        class NftFirewallBackend : public FirewallBackend
        {
        public:
            static constexpr const char *TABLE_NAME = "routnet";

            explicit NftFirewallBackend(core::CommandRunner &runner);

            std::string name() const override { return "nftables"; }
            bool prepare() override;
            bool release() override;
            bool rule_exists(const NatRule &rule) override;
            void insert_rule(const NatRule &rule) override;
            bool remove_rule(const NatRule &rule) override;
            std::string render(const NatRule &rule) const override;

            // nft arguments after "nft add rule ip routnet"
            std::vector<std::string> rule_arguments(const NatRule &rule) const;

        private:
            static const char *chain_for(const NatRule &rule);
            std::string list_chain(const std::string &chain);

            core::CommandRunner &runner_;
            std::shared_ptr<core::Logger> logger_;
        };

        /**
         * Legacy iptables backend: -C to test, -A to append, -D to remove
         */
        class IptablesFirewallBackend : public FirewallBackend
        {
        public:
            explicit IptablesFirewallBackend(core::CommandRunner &runner);

            std::string name() const override { return "iptables"; }
            bool prepare() override { return false; }
            bool release() override { return true; }
            bool rule_exists(const NatRule &rule) override;
            void insert_rule(const NatRule &rule) override;
            bool remove_rule(const NatRule &rule) override;
            std::string render(const NatRule &rule) const override;

            // Full argument vector; action is "-C", "-A" or "-D"
            std::vector<std::string> rule_arguments(const std::string &action, const NatRule &rule) const;

        private:
            core::CommandRunner &runner_;
            std::shared_ptr<core::Logger> logger_;
        };

        /**
         * Picks the backend by probing for the tools; nft wins when both exist.
         * preference is "auto", "nft" or "iptables". Returns nullptr when none fits.
         */
        std::unique_ptr<FirewallBackend> select_firewall_backend(core::CommandRunner &runner,
                                                                 const std::string &preference);

    } // namespace infrastructure
} // namespace routnet

#endif // ROUTNET_INFRASTRUCTURE_FIREWALL_HPP
