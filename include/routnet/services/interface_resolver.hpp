#ifndef ROUTNET_SERVICES_INTERFACE_RESOLVER_HPP
#define ROUTNET_SERVICES_INTERFACE_RESOLVER_HPP

#include <memory>
#include <optional>
#include <string>

namespace routnet
{
    namespace core
    {
        class CommandRunner;
        class Logger;
    }

    namespace infrastructure
    {
        class LinkControl;
        class WirelessControl;
        class NetworkManagerDelegate;
    }

    namespace services
    {

        struct ResolvedInterfaces
        {
            std::string sta;
            std::string wan;
            std::string ap_base;
            bool single_radio = false; // ap_base doubles as the STA/WAN radio
        };

        struct CapabilityVerdict
        {
            std::string phy;
            bool concurrent_supported = false;
        };

        /**
         * Capability & Interface Resolver
         * Finds the STA, WAN and AP base interfaces and checks that the radio
         * can run station and access point modes at once. Read-only; every
         * failure here happens before the system is touched.
         */
        class InterfaceResolver
        {
        public:
            InterfaceResolver(core::CommandRunner &runner,
                              infrastructure::LinkControl &links,
                              infrastructure::WirelessControl &wireless,
                              infrastructure::NetworkManagerDelegate *delegate,
                              const std::string &route_probe = "1.1.1.1",
                              const std::string &managed_ap_name = "");

            // Throws HotspotError NoWirelessInterface or NoWanRoute
            ResolvedInterfaces resolve(const std::string &user_sta, const std::string &user_wan);

            std::string resolve_sta(const std::string &user_sta);
            std::string resolve_wan(const std::string &user_wan);

            // Throws HotspotError NoWirelessInterface when ap_base has no radio
            CapabilityVerdict check_capability(const std::string &ap_base);

            // Throws HotspotError ConcurrencyUnsupported
            void require_concurrency(const CapabilityVerdict &verdict) const;

        private:
            std::string select_ap_base(const std::string &sta, const std::string &wan, bool &single_radio);

            core::CommandRunner &runner_;
            infrastructure::LinkControl &links_;
            infrastructure::WirelessControl &wireless_;
            infrastructure::NetworkManagerDelegate *delegate_;
            std::string route_probe_;
            std::string managed_ap_name_;
            std::shared_ptr<core::Logger> logger_;
        };

        // "dev" token of "ip -o route get" output
        std::optional<std::string> parse_route_get_device(const std::string &output);

    } // namespace services
} // namespace routnet

#endif // ROUTNET_SERVICES_INTERFACE_RESOLVER_HPP
