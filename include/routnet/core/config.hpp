#ifndef ROUTNET_CORE_CONFIG_HPP
#define ROUTNET_CORE_CONFIG_HPP

#include <string>
#include <memory>
#include <vector>
#include <nlohmann/json.hpp>

namespace routnet
{
    namespace core
    {

        /**
         * Interface selection; empty names are auto-detected
         */
        struct InterfaceConfig
        {
            std::string sta;
            std::string wan;
            std::string ap = "ap0";
            std::string ifb; // Empty means derived from the AP interface name
            std::string route_probe = "1.1.1.1";

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * Access point settings handed to hostapd or the delegate
         */
        struct AccessPointConfig
        {
            std::string ssid = "ROUTNET";
            std::string passphrase; // Empty means an open network
            int channel = 6;
            std::string hw_mode = "g";
            std::string driver = "nl80211";
            std::string country_code;
            int startup_grace_ms = 1500;

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * DHCP/DNS settings for the hotspot subnet
         */
        struct DhcpConfig
        {
            std::string gateway = "192.168.50.1";
            int prefix_length = 24;
            int range_start = 10;
            int range_end = 100;
            std::string lease_time = "24h";
            std::vector<std::string> dns_servers = {"1.1.1.1", "8.8.8.8"};

            // First three octets of the gateway, e.g. "192.168.50"
            std::string subnet_base() const;

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * Traffic shaping limits
         */
        struct QosConfig
        {
            std::string link_rate = "1000mbit";
            std::string default_rate = "100mbit";
            int ceil_factor = 2;

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * Backend selection
         */
        struct BackendConfig
        {
            bool prefer_delegate = true;
            std::string firewall = "auto"; // auto, nft or iptables

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        struct PathsConfig
        {
            std::string policy_dir; // Empty means the per-user config directory
            std::string runtime_dir = "/run/routnet";

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        struct LoggingConfig
        {
            std::string log_level = "INFO";
            std::string log_file; // Empty means console output

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * Complete hotspot configuration
         */
        class HotspotConfig
        {
        public:
            InterfaceConfig interfaces;
            AccessPointConfig access_point;
            DhcpConfig dhcp;
            QosConfig qos;
            BackendConfig backend;
            PathsConfig paths;
            LoggingConfig logging;

        public:
            HotspotConfig() = default;

            // Factory methods
            static std::unique_ptr<HotspotConfig> from_file(const std::string &config_path);
            static std::unique_ptr<HotspotConfig> from_json(const nlohmann::json &j);
            static std::unique_ptr<HotspotConfig> create_default();

            // A missing file yields the defaults, a broken one still throws
            static std::unique_ptr<HotspotConfig> from_file_or_default(const std::string &config_path);

            // Serialization
            nlohmann::json to_json() const;
            void save_to_file(const std::string &config_path) const;

            // Validation; returns the first problem found, empty when valid
            std::string validate() const;

            // Policy directory after applying the per-user default
            std::string resolved_policy_dir() const;

            // IFB device name; derived from ap_name (or interfaces.ap) unless set
            std::string resolved_ifb_name(const std::string &ap_name = "") const;
        };

        // $XDG_CONFIG_HOME/routnet, else ~/.config/routnet of the sudo caller or the current user
        std::string default_policy_dir();

    } // namespace core
} // namespace routnet

#endif // ROUTNET_CORE_CONFIG_HPP
