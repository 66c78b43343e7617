#ifndef ROUTNET_SERVICES_HOTSPOT_CONTROLLER_HPP
#define ROUTNET_SERVICES_HOTSPOT_CONTROLLER_HPP

#include "routnet/core/config.hpp"
#include "routnet/core/transaction_log.hpp"
#include "routnet/infrastructure/dhcp_server.hpp"
#include "routnet/infrastructure/hostapd.hpp"
#include "routnet/services/interface_lifecycle.hpp"
#include "routnet/services/interface_resolver.hpp"
#include "routnet/services/nat_engine.hpp"
#include "routnet/services/policy_store.hpp"
#include "routnet/services/shaping_engine.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

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
        class FirewallBackend;
        class TrafficControl;
        class SysctlControl;
        class ProcessLauncher;
    }

    namespace services
    {

        enum class HotspotState
        {
            Idle,
            CapabilityChecked,
            InterfaceCreated,
            DelegateHotspotActive,
            RuleEngineApplied,
            ShapingApplied,
            DaemonsRunning,
            Running,
            Stopping,
        };

        const char *hotspot_state_name(HotspotState state);

        /**
         * Every external capability the controller drives. The delegate and
         * the firewall backend are optional: either may be null when the
         * host has no such tool.
         */
        struct HotspotDependencies
        {
            core::CommandRunner &runner;
            infrastructure::LinkControl &links;
            infrastructure::WirelessControl &wireless;
            infrastructure::NetworkManagerDelegate *delegate;
            infrastructure::FirewallBackend *firewall;
            infrastructure::TrafficControl &traffic_control;
            infrastructure::SysctlControl &sysctl;
            infrastructure::ProcessLauncher &launcher;
        };

        struct ClientInfo
        {
            std::string mac;
            std::string ip;
            std::string hostname;
            uint64_t rx_bytes = 0;
            uint64_t tx_bytes = 0;
            std::optional<int> signal_dbm;
            bool blocked = false;
            std::optional<uint64_t> rate;
            bool priority = false;
        };

        /**
         * Hotspot Backend Selector
         *
         * Drives a run end to end: resolution and capability checks, then
         * either a managed hotspot through the network-management delegate
         * or a self-hosted virtual AP with hostapd and dnsmasq, with NAT and
         * shaping on top. Every mutation registers its compensation in the
         * transaction log; a failure after the first mutation drains the log
         * before the error leaves start().
         */
        class HotspotController
        {
        public:
            HotspotController(const core::HotspotConfig &config,
                              HotspotDependencies deps,
                              PolicyStore &policy);
            ~HotspotController();

            HotspotController(const HotspotController &) = delete;
            HotspotController &operator=(const HotspotController &) = delete;

            // Throws HotspotError; nothing is left behind on failure
            void start();
            void stop();

            // Dry run: what start() would do, without touching the system
            std::string plan();

            // False when a supervised daemon died while running
            bool check_health();

            std::vector<ClientInfo> show_clients();

            // Policy commands persist immediately and rebuild shaping while running.
            // They throw HotspotError CommandInvalid or ShapingRebuildFailed.
            bool block(const std::string &mac);
            bool unblock(const std::string &mac);
            bool set_rate(const std::string &mac, const std::string &rate);
            bool set_priority(const std::string &mac);
            bool reset_policy();

            HotspotState state() const { return state_; }
            bool running() const { return state_ == HotspotState::Running; }
            bool delegated() const { return delegated_; }
            const std::string &ap_interface() const { return ap_name_; }
            std::string status() const;

            const core::TransactionLog &transaction_log() const { return log_; }

        private:
            void validate_passphrase() const;
            void require_valid_config() const;

            bool start_delegated(const ResolvedInterfaces &resolved);
            void start_self_hosted(const ResolvedInterfaces &resolved);

            void apply_nat(const std::string &wan, const std::string &ap);
            void apply_shaping(const std::string &ap);
            void start_daemons(const std::string &ap);

            infrastructure::HostapdSettings hostapd_settings(const std::string &ap) const;
            infrastructure::DnsmasqSettings dnsmasq_settings(const std::string &ap) const;
            std::string gateway_cidr() const;

            bool apply_policy_change(const std::function<bool()> &mutation);

            core::HotspotConfig config_;
            HotspotDependencies deps_;
            PolicyStore &policy_;
            QosLimits limits_;
            std::shared_ptr<core::Logger> logger_;

            core::TransactionLog log_;
            InterfaceResolver resolver_;
            InterfaceLifecycle lifecycle_;
            NatEngine nat_;
            infrastructure::HostapdManager hostapd_;
            infrastructure::DhcpServerManager dhcp_;
            std::unique_ptr<ShapingEngine> shaping_;

            HotspotState state_ = HotspotState::Idle;
            bool delegated_ = false;
            std::string ap_name_;
            std::string leases_path_;
        };

    } // namespace services
} // namespace routnet

#endif // ROUTNET_SERVICES_HOTSPOT_CONTROLLER_HPP
