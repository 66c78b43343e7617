#include "routnet/services/interface_resolver.hpp"
#include "routnet/core/command_runner.hpp"
#include "routnet/core/errors.hpp"
#include "routnet/core/logger.hpp"
#include "routnet/infrastructure/netlink_manager.hpp"
#include "routnet/infrastructure/network_manager.hpp"
#include "routnet/infrastructure/wireless.hpp"

#include <algorithm>
#include <set>
#include <sstream>

namespace routnet
{
    namespace services
    {

        std::optional<std::string> parse_route_get_device(const std::string &output)
        {
            // "1.1.1.1 via 192.168.1.1 dev wlan0 src 192.168.1.20 uid 0"
            std::istringstream words(output);
            std::string word;
            while (words >> word)
            {
                if (word == "dev")
                {
                    std::string device;
                    if (words >> device)
                    {
                        return device;
                    }
                }
            }
            return std::nullopt;
        }

        InterfaceResolver::InterfaceResolver(core::CommandRunner &runner,
                                             infrastructure::LinkControl &links,
                                             infrastructure::WirelessControl &wireless,
                                             infrastructure::NetworkManagerDelegate *delegate,
                                             const std::string &route_probe,
                                             const std::string &managed_ap_name)
            : runner_(runner), links_(links), wireless_(wireless), delegate_(delegate),
              route_probe_(route_probe), managed_ap_name_(managed_ap_name),
              logger_(core::get_logger("InterfaceResolver"))
        {
        }

        ResolvedInterfaces InterfaceResolver::resolve(const std::string &user_sta, const std::string &user_wan)
        {
            ResolvedInterfaces resolved;
            resolved.sta = resolve_sta(user_sta);
            resolved.wan = resolve_wan(user_wan);
            resolved.ap_base = select_ap_base(resolved.sta, resolved.wan, resolved.single_radio);

            logger_->info("Interfaces resolved",
                          core::LogContext()
                              .add("sta", resolved.sta)
                              .add("wan", resolved.wan)
                              .add("ap_base", resolved.ap_base)
                              .add("single_radio", resolved.single_radio));
            return resolved;
        }

        std::string InterfaceResolver::resolve_sta(const std::string &user_sta)
        {
            if (!user_sta.empty())
            {
                if (!links_.link_exists(user_sta))
                {
                    throw core::HotspotError(core::ErrorCode::NoWirelessInterface,
                                             "interface " + user_sta + " does not exist");
                }
                return user_sta;
            }

            if (delegate_ && delegate_->available())
            {
                if (auto device = delegate_->connected_wifi_device())
                {
                    logger_->debug("STA interface from network manager", core::LogContext().add("interface", *device));
                    return *device;
                }
            }

            for (const auto &iface : wireless_.wireless_interfaces())
            {
                if (wireless_.is_associated(iface))
                {
                    logger_->debug("STA interface from association scan", core::LogContext().add("interface", iface));
                    return iface;
                }
            }

            throw core::HotspotError(core::ErrorCode::NoWirelessInterface,
                                     "no connected Wi-Fi client interface found");
        }

        std::string InterfaceResolver::resolve_wan(const std::string &user_wan)
        {
            if (!user_wan.empty())
            {
                if (!links_.link_exists(user_wan))
                {
                    throw core::HotspotError(core::ErrorCode::NoWanRoute,
                                             "interface " + user_wan + " does not exist");
                }
                return user_wan;
            }

            const auto result = runner_.run({"ip", "-o", "route", "get", route_probe_});
            if (result.ok())
            {
                if (auto device = parse_route_get_device(result.output))
                {
                    return *device;
                }
            }

            throw core::HotspotError(core::ErrorCode::NoWanRoute, "no route to " + route_probe_);
        }

        std::string InterfaceResolver::select_ap_base(const std::string &sta, const std::string &wan, bool &single_radio)
        {
            const auto radios = wireless_.wireless_interfaces();

            // Radios are told apart by phy; extra netdevs on a busy phy do not count
            std::set<std::string> busy_phys;
            for (const auto &name : {wan, sta})
            {
                if (auto phy = wireless_.phy_of(name))
                {
                    busy_phys.insert(*phy);
                }
            }

            for (const auto &iface : radios)
            {
                if (iface == wan || iface == sta || iface == managed_ap_name_)
                {
                    continue;
                }
                const auto phy = wireless_.phy_of(iface);
                if (!phy || busy_phys.count(*phy))
                {
                    continue;
                }
                single_radio = false;
                return iface;
            }

            // One radio carries both roles
            single_radio = true;
            const bool wan_is_radio = std::find(radios.begin(), radios.end(), wan) != radios.end();
            const std::string base = wan_is_radio ? wan : sta;
            logger_->info("Only one radio available, sharing it between client and access point",
                          core::LogContext().add("interface", base));
            return base;
        }

        CapabilityVerdict InterfaceResolver::check_capability(const std::string &ap_base)
        {
            const auto phy = wireless_.phy_of(ap_base);
            if (!phy)
            {
                throw core::HotspotError(core::ErrorCode::NoWirelessInterface,
                                         ap_base + " is not a wireless interface");
            }

            CapabilityVerdict verdict;
            verdict.phy = *phy;
            verdict.concurrent_supported =
                infrastructure::supports_sta_ap_concurrency(wireless_.interface_combinations(*phy));

            logger_->info("Radio capability",
                          core::LogContext()
                              .add("phy", verdict.phy)
                              .add("sta_ap_concurrency", verdict.concurrent_supported));
            return verdict;
        }

        void InterfaceResolver::require_concurrency(const CapabilityVerdict &verdict) const
        {
            if (!verdict.concurrent_supported)
            {
                throw core::HotspotError(core::ErrorCode::ConcurrencyUnsupported,
                                         verdict.phy + " does not support managed and AP modes at once");
            }
        }

    } // namespace services
} // namespace routnet
