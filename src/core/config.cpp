#include "routnet/core/config.hpp"
#include "routnet/core/net_units.hpp"

#include <arpa/inet.h>
#include <pwd.h>
#include <unistd.h>

#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <net/if.h>

namespace routnet
{
    namespace core
    {

        namespace
        {
            // Values end up as single lines in generated daemon configs
            bool has_control_chars(const std::string &value)
            {
                for (unsigned char c : value)
                {
                    if (c < 0x20 || c == 0x7f)
                    {
                        return true;
                    }
                }
                return false;
            }
        }

        // InterfaceConfig implementation
        void InterfaceConfig::from_json(const nlohmann::json &j)
        {
            if (j.contains("sta"))
                sta = j["sta"];
            if (j.contains("wan"))
                wan = j["wan"];
            if (j.contains("ap"))
                ap = j["ap"];
            if (j.contains("ifb"))
                ifb = j["ifb"];
            if (j.contains("route_probe"))
                route_probe = j["route_probe"];
        }

        nlohmann::json InterfaceConfig::to_json() const
        {
            return nlohmann::json{
                {"sta", sta},
                {"wan", wan},
                {"ap", ap},
                {"ifb", ifb},
                {"route_probe", route_probe}};
        }

        // AccessPointConfig implementation
        void AccessPointConfig::from_json(const nlohmann::json &j)
        {
            if (j.contains("ssid"))
                ssid = j["ssid"];
            if (j.contains("passphrase"))
                passphrase = j["passphrase"];
            if (j.contains("channel"))
                channel = j["channel"];
            if (j.contains("hw_mode"))
                hw_mode = j["hw_mode"];
            if (j.contains("driver"))
                driver = j["driver"];
            if (j.contains("country_code"))
                country_code = j["country_code"];
            if (j.contains("startup_grace_ms"))
                startup_grace_ms = j["startup_grace_ms"];
        }

        nlohmann::json AccessPointConfig::to_json() const
        {
            return nlohmann::json{
                {"ssid", ssid},
                {"passphrase", passphrase},
                {"channel", channel},
                {"hw_mode", hw_mode},
                {"driver", driver},
                {"country_code", country_code},
                {"startup_grace_ms", startup_grace_ms}};
        }

        // DhcpConfig implementation
        std::string DhcpConfig::subnet_base() const
        {
            return gateway.substr(0, gateway.find_last_of('.'));
        }

        void DhcpConfig::from_json(const nlohmann::json &j)
        {
            if (j.contains("gateway"))
                gateway = j["gateway"];
            if (j.contains("prefix_length"))
                prefix_length = j["prefix_length"];
            if (j.contains("range_start"))
                range_start = j["range_start"];
            if (j.contains("range_end"))
                range_end = j["range_end"];
            if (j.contains("lease_time"))
                lease_time = j["lease_time"];
            if (j.contains("dns_servers"))
                dns_servers = j["dns_servers"].get<std::vector<std::string>>();
        }

        nlohmann::json DhcpConfig::to_json() const
        {
            return nlohmann::json{
                {"gateway", gateway},
                {"prefix_length", prefix_length},
                {"range_start", range_start},
                {"range_end", range_end},
                {"lease_time", lease_time},
                {"dns_servers", dns_servers}};
        }

        // QosConfig implementation
        void QosConfig::from_json(const nlohmann::json &j)
        {
            if (j.contains("link_rate"))
                link_rate = j["link_rate"];
            if (j.contains("default_rate"))
                default_rate = j["default_rate"];
            if (j.contains("ceil_factor"))
                ceil_factor = j["ceil_factor"];
        }

        nlohmann::json QosConfig::to_json() const
        {
            return nlohmann::json{
                {"link_rate", link_rate},
                {"default_rate", default_rate},
                {"ceil_factor", ceil_factor}};
        }

        // BackendConfig implementation
        void BackendConfig::from_json(const nlohmann::json &j)
        {
            if (j.contains("prefer_delegate"))
                prefer_delegate = j["prefer_delegate"];
            if (j.contains("firewall"))
                firewall = j["firewall"];
        }

        nlohmann::json BackendConfig::to_json() const
        {
            return nlohmann::json{
                {"prefer_delegate", prefer_delegate},
                {"firewall", firewall}};
        }

        // PathsConfig implementation
        void PathsConfig::from_json(const nlohmann::json &j)
        {
            if (j.contains("policy_dir"))
                policy_dir = j["policy_dir"];
            if (j.contains("runtime_dir"))
                runtime_dir = j["runtime_dir"];
        }

        nlohmann::json PathsConfig::to_json() const
        {
            return nlohmann::json{
                {"policy_dir", policy_dir},
                {"runtime_dir", runtime_dir}};
        }

        // LoggingConfig implementation
        void LoggingConfig::from_json(const nlohmann::json &j)
        {
            if (j.contains("log_level"))
                log_level = j["log_level"];
            if (j.contains("log_file") && !j["log_file"].is_null())
                log_file = j["log_file"];
        }

        nlohmann::json LoggingConfig::to_json() const
        {
            nlohmann::json j{{"log_level", log_level}};
            if (!log_file.empty())
            {
                j["log_file"] = log_file;
            }
            return j;
        }

        // HotspotConfig implementation
        std::unique_ptr<HotspotConfig> HotspotConfig::from_file(const std::string &config_path)
        {
            std::ifstream file(config_path);
            if (!file.is_open())
            {
                throw std::runtime_error("Configuration file not found: " + config_path);
            }

            nlohmann::json j;
            try
            {
                file >> j;
            }
            catch (const nlohmann::json::parse_error &e)
            {
                throw std::runtime_error("Invalid JSON in configuration file: " + std::string(e.what()));
            }

            return from_json(j);
        }

        std::unique_ptr<HotspotConfig> HotspotConfig::from_file_or_default(const std::string &config_path)
        {
            std::ifstream existing(config_path);
            if (!existing.is_open())
            {
                return create_default();
            }
            existing.close();
            return from_file(config_path);
        }

        std::unique_ptr<HotspotConfig> HotspotConfig::from_json(const nlohmann::json &j)
        {
            if (!j.is_object())
            {
                throw std::invalid_argument("configuration root must be an object");
            }

            auto config = std::make_unique<HotspotConfig>();

            try
            {
                if (j.contains("interfaces"))
                    config->interfaces.from_json(j["interfaces"]);
                if (j.contains("access_point"))
                    config->access_point.from_json(j["access_point"]);
                if (j.contains("dhcp"))
                    config->dhcp.from_json(j["dhcp"]);
                if (j.contains("qos"))
                    config->qos.from_json(j["qos"]);
                if (j.contains("backend"))
                    config->backend.from_json(j["backend"]);
                if (j.contains("paths"))
                    config->paths.from_json(j["paths"]);
                if (j.contains("logging"))
                    config->logging.from_json(j["logging"]);
            }
            catch (const nlohmann::json::type_error &e)
            {
                throw std::invalid_argument("Wrong value type in configuration: " + std::string(e.what()));
            }

            return config;
        }

        std::unique_ptr<HotspotConfig> HotspotConfig::create_default()
        {
            return std::make_unique<HotspotConfig>();
        }

        nlohmann::json HotspotConfig::to_json() const
        {
            return nlohmann::json{
                {"interfaces", interfaces.to_json()},
                {"access_point", access_point.to_json()},
                {"dhcp", dhcp.to_json()},
                {"qos", qos.to_json()},
                {"backend", backend.to_json()},
                {"paths", paths.to_json()},
                {"logging", logging.to_json()}};
        }

        void HotspotConfig::save_to_file(const std::string &config_path) const
        {
            std::ofstream file(config_path);
            if (!file.is_open())
            {
                throw std::runtime_error("Cannot open configuration file for writing: " + config_path);
            }

            file << to_json().dump(4);
        }

        std::string HotspotConfig::validate() const
        {
            if (interfaces.ap.empty() || interfaces.ap.size() >= IFNAMSIZ)
            {
                return "interfaces.ap must be 1-15 characters";
            }

            if (access_point.ssid.empty() || access_point.ssid.size() > 32)
            {
                return "access_point.ssid must be 1-32 characters";
            }

            if (access_point.passphrase.size() > 63)
            {
                return "access_point.passphrase must be at most 63 characters";
            }

            if (has_control_chars(access_point.ssid) || has_control_chars(access_point.passphrase))
            {
                return "access_point.ssid and access_point.passphrase must not contain control characters";
            }

            if (access_point.channel < 1 || access_point.channel > 196)
            {
                return "access_point.channel must be between 1 and 196";
            }

            if (access_point.startup_grace_ms < 0)
            {
                return "access_point.startup_grace_ms must not be negative";
            }

            in_addr gateway_addr{};
            if (inet_pton(AF_INET, dhcp.gateway.c_str(), &gateway_addr) != 1)
            {
                return "dhcp.gateway must be an IPv4 address";
            }

            if (dhcp.prefix_length < 8 || dhcp.prefix_length > 30)
            {
                return "dhcp.prefix_length must be between 8 and 30";
            }

            if (dhcp.range_start < 1 || dhcp.range_end > 254 || dhcp.range_start > dhcp.range_end)
            {
                return "dhcp range must satisfy 1 <= range_start <= range_end <= 254";
            }

            if (!parse_rate(qos.link_rate))
            {
                return "qos.link_rate is not a valid rate: " + qos.link_rate;
            }

            if (!parse_rate(qos.default_rate))
            {
                return "qos.default_rate is not a valid rate: " + qos.default_rate;
            }

            if (qos.ceil_factor < 1)
            {
                return "qos.ceil_factor must be at least 1";
            }

            if (backend.firewall != "auto" && backend.firewall != "nft" && backend.firewall != "iptables")
            {
                return "backend.firewall must be auto, nft or iptables";
            }

            if (paths.runtime_dir.empty())
            {
                return "paths.runtime_dir cannot be empty";
            }

            return "";
        }

        std::string HotspotConfig::resolved_policy_dir() const
        {
            return paths.policy_dir.empty() ? default_policy_dir() : paths.policy_dir;
        }

        std::string HotspotConfig::resolved_ifb_name(const std::string &ap_name) const
        {
            if (!interfaces.ifb.empty())
            {
                return interfaces.ifb;
            }
            std::string name = "ifb-" + (ap_name.empty() ? interfaces.ap : ap_name);
            if (name.size() >= IFNAMSIZ)
            {
                name.resize(IFNAMSIZ - 1);
            }
            return name;
        }

        std::string default_policy_dir()
        {
            if (const char *xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg && !std::getenv("SUDO_USER"))
            {
                return std::string(xdg) + "/routnet";
            }

            // Under sudo the lists belong to the invoking user, not root
            if (const char *sudo_user = std::getenv("SUDO_USER"); sudo_user && *sudo_user)
            {
                if (const passwd *pw = getpwnam(sudo_user); pw && pw->pw_dir)
                {
                    return std::string(pw->pw_dir) + "/.config/routnet";
                }
            }

            if (const char *home = std::getenv("HOME"); home && *home)
            {
                return std::string(home) + "/.config/routnet";
            }

            if (const passwd *pw = getpwuid(geteuid()); pw && pw->pw_dir)
            {
                return std::string(pw->pw_dir) + "/.config/routnet";
            }

            return "/etc/routnet";
        }

    } // namespace core
} // namespace routnet
