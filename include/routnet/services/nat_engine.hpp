#ifndef ROUTNET_SERVICES_NAT_ENGINE_HPP
#define ROUTNET_SERVICES_NAT_ENGINE_HPP

#include <memory>
#include <string>
#include <vector>

namespace routnet
{
    namespace core
    {
        class Logger;
        class TransactionLog;
    }

    namespace infrastructure
    {
        class FirewallBackend;
        class SysctlControl;
    }

    namespace services
    {

        /**
         * NAT/Forwarding Rule Engine
         * Programs masquerade and forward rules for the resolved interfaces.
         * Only state this engine actually changed gets a compensation.
         */
        class NatEngine
        {
        public:
            static constexpr const char *FORWARDING_KEY = "net.ipv4.ip_forward";

            // backend may be null when no firewall tool exists; apply_rules then fails
            NatEngine(infrastructure::FirewallBackend *backend,
                      infrastructure::SysctlControl &sysctl,
                      core::TransactionLog &log);

            // Throws HotspotError RuleApplyFailed
            void apply_rules(const std::string &wan, const std::string &ap);
            void enable_forwarding();

            // Backend statements for the rule set, nothing applied
            std::vector<std::string> render_rules(const std::string &wan, const std::string &ap) const;

            std::string backend_name() const;

        private:
            infrastructure::FirewallBackend *backend_;
            infrastructure::SysctlControl &sysctl_;
            core::TransactionLog &log_;
            std::shared_ptr<core::Logger> logger_;
        };

    } // namespace services
} // namespace routnet

#endif // ROUTNET_SERVICES_NAT_ENGINE_HPP
