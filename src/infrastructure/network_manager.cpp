/**
 * NetworkManager delegate
 * Asks NetworkManager for the connected Wi-Fi client device and, when the
 * delegate path is chosen, for a managed hotspot connection.
 */

#include "routnet/infrastructure/network_manager.hpp"
#include "routnet/core/command_runner.hpp"
#include "routnet/core/logger.hpp"

#include <sstream>

namespace routnet
{
    namespace infrastructure
    {

        std::optional<std::string> parse_nmcli_connected_wifi(const std::string &output)
        {
            // Terse mode lines look like "wlp2s0:wifi:connected"
            std::istringstream stream(output);
            std::string line;
            while (std::getline(stream, line))
            {
                std::istringstream fields(line);
                std::string device;
                std::string type;
                std::string state;
                if (!std::getline(fields, device, ':') || !std::getline(fields, type, ':') ||
                    !std::getline(fields, state))
                {
                    continue;
                }
                if (!state.empty() && state.back() == '\r')
                {
                    state.pop_back();
                }
                if (type == "wifi" && state == "connected")
                {
                    return device;
                }
            }
            return std::nullopt;
        }

        NmcliDelegate::NmcliDelegate(core::CommandRunner &runner, const std::string &connection_name)
            : runner_(runner), logger_(core::get_logger("NmcliDelegate")), connection_name_(connection_name)
        {
        }

        bool NmcliDelegate::available()
        {
            if (!runner_.has_tool("nmcli"))
            {
                return false;
            }

            std::string output;
            if (!run_nmcli({"-t", "-f", "RUNNING", "general"}, &output))
            {
                return false;
            }
            return output.find("running") != std::string::npos;
        }

        std::optional<std::string> NmcliDelegate::connected_wifi_device()
        {
            std::string output;
            if (!run_nmcli({"-t", "-f", "DEVICE,TYPE,STATE", "device"}, &output))
            {
                logger_->debug("Failed to get device status from NetworkManager");
                return std::nullopt;
            }

            auto device = parse_nmcli_connected_wifi(output);
            if (device)
            {
                logger_->debug("NetworkManager reports connected Wi-Fi device", core::LogContext().add("interface", *device));
            }
            return device;
        }

        std::vector<std::string> NmcliDelegate::build_connection_args(const DelegateHotspotRequest &request) const
        {
            std::vector<std::string> args = {
                "connection", "add",
                "type", "wifi",
                "ifname", request.interface,
                "con-name", connection_name_,
                "autoconnect", "no",
                "wifi.mode", "ap",
                "wifi.ssid", request.ssid,
                "wifi.band", request.channel > 14 ? "a" : "bg",
                "wifi.channel", std::to_string(request.channel),
                "ipv4.method", "shared",
                "ipv4.addresses", request.gateway_cidr,
                "ipv6.method", "ignore"};

            if (!request.passphrase.empty())
            {
                const std::vector<std::string> security = {
                    "wifi-sec.key-mgmt", "wpa-psk",
                    "wifi-sec.psk", request.passphrase,
                    "wifi-sec.proto", "rsn",
                    "wifi-sec.pairwise", "ccmp",
                    "wifi-sec.group", "ccmp"};
                args.insert(args.end(), security.begin(), security.end());
            }

            return args;
        }

        bool NmcliDelegate::create_hotspot(const DelegateHotspotRequest &request)
        {
            logger_->info("Creating managed hotspot",
                          core::LogContext()
                              .add("connection", connection_name_)
                              .add("interface", request.interface)
                              .add("ssid", request.ssid)
                              .add("open", request.passphrase.empty()));

            remove_existing_connection();

            std::string output;
            if (!run_nmcli(build_connection_args(request), &output))
            {
                logger_->warning("NetworkManager refused hotspot connection", core::LogContext().add("output", output));
                return false;
            }

            if (!run_nmcli({"connection", "up", connection_name_}, &output))
            {
                logger_->warning("NetworkManager failed to activate hotspot", core::LogContext().add("output", output));
                remove_existing_connection();
                return false;
            }

            active_ = true;
            logger_->info("Managed hotspot active", core::LogContext().add("connection", connection_name_));
            return true;
        }

        bool NmcliDelegate::teardown_hotspot()
        {
            if (!active_)
            {
                return true;
            }

            logger_->info("Tearing down managed hotspot", core::LogContext().add("connection", connection_name_));
            const bool removed = remove_existing_connection();
            active_ = false;
            return removed;
        }

        bool NmcliDelegate::set_managed(const std::string &iface, bool managed)
        {
            std::string output;
            if (!run_nmcli({"device", "set", iface, "managed", managed ? "yes" : "no"}, &output))
            {
                logger_->warning("Failed to change managed state",
                                 core::LogContext().add("interface", iface).add("managed", managed).add("output", output));
                return false;
            }
            logger_->debug("Managed state changed", core::LogContext().add("interface", iface).add("managed", managed));
            return true;
        }

        std::string NmcliDelegate::leases_file(const std::string &iface) const
        {
            return "/var/lib/NetworkManager/dnsmasq-" + iface + ".leases";
        }

        bool NmcliDelegate::remove_existing_connection()
        {
            // Either step fails harmlessly when the connection does not exist
            run_nmcli({"connection", "down", connection_name_});
            run_nmcli({"connection", "delete", connection_name_});
            return true;
        }

        bool NmcliDelegate::run_nmcli(const std::vector<std::string> &args, std::string *output)
        {
            std::vector<std::string> command;
            command.reserve(args.size() + 1);
            command.push_back("nmcli");
            command.insert(command.end(), args.begin(), args.end());

            const auto result = runner_.run(command);
            if (output)
            {
                *output = result.output;
            }
            return result.ok();
        }

    } // namespace infrastructure
} // namespace routnet
