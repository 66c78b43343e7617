/**
 * Hotspot Controller Implementation
 * Sequences resolution, interface creation, NAT, shaping and the AP/DHCP
 * daemons, and unwinds all of it through the transaction log.
 */

#include "routnet/services/hotspot_controller.hpp"
#include "routnet/core/errors.hpp"
#include "routnet/core/logger.hpp"
#include "routnet/core/net_units.hpp"
#include "routnet/infrastructure/netlink_manager.hpp"
#include "routnet/infrastructure/network_manager.hpp"
#include "routnet/infrastructure/process_launcher.hpp"
#include "routnet/infrastructure/wireless.hpp"

#include <chrono>
#include <sstream>

namespace routnet
{
    namespace services
    {

        namespace
        {
            constexpr size_t LOG_TAIL_LINES = 10;
        }

        const char *hotspot_state_name(HotspotState state)
        {
            switch (state)
            {
            case HotspotState::Idle:
                return "idle";
            case HotspotState::CapabilityChecked:
                return "capability-checked";
            case HotspotState::InterfaceCreated:
                return "interface-created";
            case HotspotState::DelegateHotspotActive:
                return "delegate-hotspot-active";
            case HotspotState::RuleEngineApplied:
                return "rule-engine-applied";
            case HotspotState::ShapingApplied:
                return "shaping-applied";
            case HotspotState::DaemonsRunning:
                return "daemons-running";
            case HotspotState::Running:
                return "running";
            case HotspotState::Stopping:
                return "stopping";
            }
            return "unknown";
        }

        HotspotController::HotspotController(const core::HotspotConfig &config,
                                             HotspotDependencies deps,
                                             PolicyStore &policy)
            : config_(config),
              deps_(deps),
              policy_(policy),
              limits_(QosLimits::from_config(config.qos)),
              logger_(core::get_logger("HotspotController")),
              resolver_(deps.runner, deps.links, deps.wireless, deps.delegate,
                        config.interfaces.route_probe, config.interfaces.ap),
              lifecycle_(deps.links, deps.wireless, log_),
              nat_(deps.firewall, deps.sysctl, log_),
              hostapd_(deps.launcher, config.paths.runtime_dir),
              dhcp_(deps.launcher, config.paths.runtime_dir)
        {
        }

        HotspotController::~HotspotController()
        {
            stop();
        }

        void HotspotController::validate_passphrase() const
        {
            const auto &passphrase = config_.access_point.passphrase;
            if (!passphrase.empty() && passphrase.size() < 8)
            {
                throw core::HotspotError(core::ErrorCode::WeakPassphrase,
                                         "passphrase must be at least 8 characters, or empty for an open network");
            }
            if (passphrase.size() > 63)
            {
                throw core::HotspotError(core::ErrorCode::ConfigInvalid, "passphrase must be at most 63 characters");
            }
        }

        void HotspotController::require_valid_config() const
        {
            validate_passphrase();
            const std::string problem = config_.validate();
            if (!problem.empty())
            {
                throw core::HotspotError(core::ErrorCode::ConfigInvalid, problem);
            }
        }

        std::string HotspotController::gateway_cidr() const
        {
            return config_.dhcp.gateway + "/" + std::to_string(config_.dhcp.prefix_length);
        }

        void HotspotController::start()
        {
            if (state_ != HotspotState::Idle)
            {
                throw core::HotspotError(core::ErrorCode::CommandInvalid, "hotspot is already running");
            }

            // Nothing below touches the system until capability is confirmed
            require_valid_config();
            const auto resolved = resolver_.resolve(config_.interfaces.sta, config_.interfaces.wan);
            const auto verdict = resolver_.check_capability(resolved.ap_base);
            resolver_.require_concurrency(verdict);
            state_ = HotspotState::CapabilityChecked;

            try
            {
                bool started = false;
                if (config_.backend.prefer_delegate && deps_.delegate && deps_.delegate->available())
                {
                    started = start_delegated(resolved);
                }
                if (!started)
                {
                    start_self_hosted(resolved);
                }
            }
            catch (const std::exception &e)
            {
                logger_->error("Hotspot start failed, rolling back",
                               core::LogContext().add("error", e.what()).add("pending", log_.size()));
                log_.drain();
                shaping_.reset();
                delegated_ = false;
                ap_name_.clear();
                leases_path_.clear();
                state_ = HotspotState::Idle;
                throw;
            }

            state_ = HotspotState::Running;
            logger_->info("Hotspot running",
                          core::LogContext()
                              .add("ssid", config_.access_point.ssid)
                              .add("interface", ap_name_)
                              .add("mode", delegated_ ? "delegate" : "self-hosted")
                              .add("open", config_.access_point.passphrase.empty()));
        }

        bool HotspotController::start_delegated(const ResolvedInterfaces &resolved)
        {
            infrastructure::DelegateHotspotRequest request;
            request.interface = resolved.ap_base;
            request.ssid = config_.access_point.ssid;
            request.passphrase = config_.access_point.passphrase;
            request.channel = config_.access_point.channel;
            request.gateway_cidr = gateway_cidr();

            if (!deps_.delegate->create_hotspot(request))
            {
                logger_->warning("Network manager could not create the hotspot, using hostapd",
                                 core::LogContext().add("interface", resolved.ap_base));
                return false;
            }

            auto *delegate = deps_.delegate;
            log_.push("tear down managed hotspot", [delegate]()
                      { delegate->teardown_hotspot(); });
            delegated_ = true;
            ap_name_ = resolved.ap_base;
            leases_path_ = delegate->leases_file(ap_name_);
            state_ = HotspotState::DelegateHotspotActive;

            apply_nat(resolved.wan, ap_name_);
            apply_shaping(ap_name_);
            return true;
        }

        void HotspotController::start_self_hosted(const ResolvedInterfaces &resolved)
        {
            const auto iface = lifecycle_.create_virtual_ap(resolved.ap_base, config_.interfaces.ap);
            ap_name_ = iface.name;
            leases_path_ = dhcp_.leases_path();
            state_ = HotspotState::InterfaceCreated;

            // Keep a running network manager away from the interface hostapd drives
            if (deps_.delegate && deps_.delegate->available())
            {
                auto *delegate = deps_.delegate;
                const std::string unmanaged = iface.name;
                if (delegate->set_managed(unmanaged, false))
                {
                    log_.push("return " + unmanaged + " to network manager", [delegate, unmanaged]()
                              { delegate->set_managed(unmanaged, true); });
                }
                else
                {
                    logger_->warning("Network manager may interfere with the access point",
                                     core::LogContext().add("interface", unmanaged));
                }
            }

            if (!lifecycle_.bring_up(iface))
            {
                throw core::HotspotError(core::ErrorCode::InterfaceCreateFailed,
                                         "cannot bring " + iface.name + " up");
            }
            if (!deps_.links.set_link_state(resolved.sta, true))
            {
                logger_->warning("Failed to bring STA interface up", core::LogContext().add("interface", resolved.sta));
            }

            try
            {
                deps_.links.add_address(iface.name, gateway_cidr());
            }
            catch (const std::exception &e)
            {
                throw core::HotspotError(core::ErrorCode::InterfaceCreateFailed,
                                         "cannot assign " + gateway_cidr() + " to " + iface.name + ": " + e.what());
            }
            auto &links = deps_.links;
            const std::string name = iface.name;
            log_.push("flush addresses on " + name, [&links, name]()
                      { links.flush_addresses(name); });

            apply_nat(resolved.wan, ap_name_);
            apply_shaping(ap_name_);
            start_daemons(ap_name_);
        }

        void HotspotController::apply_nat(const std::string &wan, const std::string &ap)
        {
            nat_.apply_rules(wan, ap);
            nat_.enable_forwarding();
            if (!delegated_)
            {
                state_ = HotspotState::RuleEngineApplied;
            }
        }

        void HotspotController::apply_shaping(const std::string &ap)
        {
            shaping_ = std::make_unique<ShapingEngine>(deps_.traffic_control, deps_.links, limits_,
                                                       ap, config_.resolved_ifb_name(ap));
            shaping_->rebuild(policy_.policy());

            auto *engine = shaping_.get();
            log_.push("tear down shaping on " + ap, [engine]()
                      { engine->teardown(); });
            if (!delegated_)
            {
                state_ = HotspotState::ShapingApplied;
            }
        }

        infrastructure::HostapdSettings HotspotController::hostapd_settings(const std::string &ap) const
        {
            infrastructure::HostapdSettings settings;
            settings.interface = ap;
            settings.driver = config_.access_point.driver;
            settings.ssid = config_.access_point.ssid;
            settings.passphrase = config_.access_point.passphrase;
            settings.hw_mode = config_.access_point.hw_mode;
            settings.channel = config_.access_point.channel;
            settings.country_code = config_.access_point.country_code;
            return settings;
        }

        infrastructure::DnsmasqSettings HotspotController::dnsmasq_settings(const std::string &ap) const
        {
            const std::string base = config_.dhcp.subnet_base();

            infrastructure::DnsmasqSettings settings;
            settings.interface = ap;
            settings.gateway = config_.dhcp.gateway;
            settings.prefix_length = config_.dhcp.prefix_length;
            settings.range_start = base + "." + std::to_string(config_.dhcp.range_start);
            settings.range_end = base + "." + std::to_string(config_.dhcp.range_end);
            settings.lease_time = config_.dhcp.lease_time;
            settings.dns_servers = config_.dhcp.dns_servers;
            return settings;
        }

        void HotspotController::start_daemons(const std::string &ap)
        {
            hostapd_.stop_stale();
            dhcp_.stop_stale();

            const auto grace = std::chrono::milliseconds(config_.access_point.startup_grace_ms);

            try
            {
                hostapd_.start(hostapd_settings(ap));
            }
            catch (const std::exception &e)
            {
                throw core::HotspotError(core::ErrorCode::DaemonSpawnFailed, std::string("hostapd: ") + e.what());
            }
            auto &hostapd = hostapd_;
            log_.push("stop hostapd", [&hostapd]()
                      { hostapd.stop(); });

            deps_.launcher.wait(grace);
            if (!hostapd_.is_running())
            {
                throw core::HotspotError(core::ErrorCode::DaemonDiedEarly,
                                         "hostapd exited during startup:\n" +
                                             infrastructure::read_log_tail(hostapd_.log_path(), LOG_TAIL_LINES));
            }

            try
            {
                dhcp_.start(dnsmasq_settings(ap));
            }
            catch (const std::exception &e)
            {
                throw core::HotspotError(core::ErrorCode::DaemonSpawnFailed, std::string("dnsmasq: ") + e.what());
            }
            auto &dhcp = dhcp_;
            log_.push("stop dnsmasq", [&dhcp]()
                      { dhcp.stop(); });

            deps_.launcher.wait(grace);
            if (!dhcp_.is_running())
            {
                throw core::HotspotError(core::ErrorCode::DaemonDiedEarly,
                                         "dnsmasq exited during startup:\n" +
                                             infrastructure::read_log_tail(dhcp_.log_path(), LOG_TAIL_LINES));
            }

            state_ = HotspotState::DaemonsRunning;
        }

        void HotspotController::stop()
        {
            if (state_ == HotspotState::Idle)
            {
                return;
            }

            logger_->info("Stopping hotspot", core::LogContext().add("pending", log_.size()));
            state_ = HotspotState::Stopping;
            const size_t undone = log_.drain();
            shaping_.reset();
            delegated_ = false;
            ap_name_.clear();
            leases_path_.clear();
            state_ = HotspotState::Idle;
            logger_->info("Hotspot stopped", core::LogContext().add("compensations", undone));
        }

        std::string HotspotController::plan()
        {
            require_valid_config();
            const auto resolved = resolver_.resolve(config_.interfaces.sta, config_.interfaces.wan);
            const auto verdict = resolver_.check_capability(resolved.ap_base);
            resolver_.require_concurrency(verdict);

            const bool use_delegate = config_.backend.prefer_delegate && deps_.delegate && deps_.delegate->available();
            const std::string ap = use_delegate ? resolved.ap_base
                                                : lifecycle_.choose_name(resolved.ap_base, config_.interfaces.ap);

            std::ostringstream text;
            text << "interfaces: sta=" << resolved.sta << " wan=" << resolved.wan
                 << " ap_base=" << resolved.ap_base
                 << (resolved.single_radio ? " (single radio)" : "") << "\n";
            text << "radio: " << verdict.phy << " supports STA+AP concurrency\n";

            if (use_delegate)
            {
                text << "mode: network manager hotspot on " << ap << " (falls back to hostapd on refusal)\n";
            }
            else
            {
                text << "mode: self-hosted, virtual interface " << ap << " " << gateway_cidr() << "\n";
                text << "\n# " << hostapd_.config_path() << "\n"
                     << infrastructure::render_hostapd_config(hostapd_settings(ap));
                text << "\n# " << dhcp_.config_path() << "\n"
                     << infrastructure::render_dnsmasq_config(dnsmasq_settings(ap), dhcp_.leases_path());
            }

            text << "\nfirewall (" << nat_.backend_name() << "):\n";
            for (const auto &statement : nat_.render_rules(resolved.wan, ap))
            {
                text << "  " << statement << "\n";
            }
            text << "  net.ipv4.ip_forward=1\n";

            text << "\n"
                 << ShapingPlanner::plan(policy_.policy(), limits_, ap, config_.resolved_ifb_name(ap)).describe();
            return text.str();
        }

        bool HotspotController::check_health()
        {
            if (state_ != HotspotState::Running || delegated_)
            {
                return true;
            }

            if (!hostapd_.is_running())
            {
                logger_->error("hostapd is no longer running",
                               core::LogContext().add("log", infrastructure::read_log_tail(hostapd_.log_path(), LOG_TAIL_LINES)));
                return false;
            }
            if (!dhcp_.is_running())
            {
                logger_->error("dnsmasq is no longer running",
                               core::LogContext().add("log", infrastructure::read_log_tail(dhcp_.log_path(), LOG_TAIL_LINES)));
                return false;
            }
            return true;
        }

        std::vector<ClientInfo> HotspotController::show_clients()
        {
            if (state_ != HotspotState::Running)
            {
                throw core::HotspotError(core::ErrorCode::CommandInvalid, "hotspot is not running");
            }

            const auto leases = infrastructure::read_leases(leases_path_);
            const auto &policy = policy_.policy();

            std::vector<ClientInfo> clients;
            for (const auto &station : deps_.wireless.stations(ap_name_))
            {
                ClientInfo client;
                client.mac = core::normalize_mac(station.mac).value_or(station.mac);
                client.rx_bytes = station.rx_bytes;
                client.tx_bytes = station.tx_bytes;
                client.signal_dbm = station.signal_dbm;

                for (const auto &lease : leases)
                {
                    if (lease.mac == client.mac)
                    {
                        client.ip = lease.ip;
                        client.hostname = lease.hostname;
                        break;
                    }
                }

                client.blocked = policy.blocked.count(client.mac) > 0;
                client.priority = policy.priority.count(client.mac) > 0;
                if (auto it = policy.rates.find(client.mac); it != policy.rates.end())
                {
                    client.rate = it->second;
                }
                clients.push_back(client);
            }
            return clients;
        }

        bool HotspotController::apply_policy_change(const std::function<bool()> &mutation)
        {
            bool changed = false;
            try
            {
                changed = mutation();
            }
            catch (const core::HotspotError &)
            {
                throw;
            }
            catch (const std::exception &e)
            {
                throw core::HotspotError(core::ErrorCode::CommandInvalid, std::string("cannot save policy: ") + e.what());
            }

            // A previous failed rebuild left shaping down; any command retries it
            if (state_ == HotspotState::Running && shaping_ && (changed || !shaping_->active()))
            {
                shaping_->rebuild(policy_.policy());
            }
            return changed;
        }

        bool HotspotController::block(const std::string &mac)
        {
            return apply_policy_change([this, &mac]()
                                       { return policy_.block(mac); });
        }

        bool HotspotController::unblock(const std::string &mac)
        {
            return apply_policy_change([this, &mac]()
                                       { return policy_.unblock(mac); });
        }

        bool HotspotController::set_rate(const std::string &mac, const std::string &rate)
        {
            return apply_policy_change([this, &mac, &rate]()
                                       { return policy_.set_rate(mac, rate); });
        }

        bool HotspotController::set_priority(const std::string &mac)
        {
            return apply_policy_change([this, &mac]()
                                       { return policy_.set_priority(mac); });
        }

        bool HotspotController::reset_policy()
        {
            return apply_policy_change([this]()
                                       { return policy_.reset(); });
        }

        std::string HotspotController::status() const
        {
            std::ostringstream text;
            text << "state: " << hotspot_state_name(state_) << "\n";
            if (state_ == HotspotState::Running)
            {
                text << "mode: " << (delegated_ ? "network manager" : "hostapd + dnsmasq") << "\n";
                text << "interface: " << ap_name_ << " " << gateway_cidr() << "\n";
                text << "ssid: " << config_.access_point.ssid
                     << (config_.access_point.passphrase.empty() ? " (open)" : " (WPA2)") << "\n";
                text << "firewall: " << nat_.backend_name() << "\n";
                if (shaping_ && shaping_->active())
                {
                    text << shaping_->description();
                }
                else
                {
                    text << "shaping: inactive\n";
                }
            }

            const auto &policy = policy_.policy();
            text << "policy: " << policy.blocked.size() << " blocked, " << policy.rates.size()
                 << " rate limited, " << policy.priority.size() << " prioritized\n";
            return text.str();
        }

    } // namespace services
} // namespace routnet
