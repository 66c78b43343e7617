#ifndef ROUTNET_INFRASTRUCTURE_NETWORK_MANAGER_HPP
#define ROUTNET_INFRASTRUCTURE_NETWORK_MANAGER_HPP

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
}

namespace routnet
{
    namespace infrastructure
    {

        /**
         * Settings for a hotspot created by the network-management layer
         */
        struct DelegateHotspotRequest
        {
            std::string interface;
            std::string ssid;
            std::string passphrase; // Empty means open
            int channel = 6;
            std::string gateway_cidr; // e.g. "192.168.50.1/24"
        };

        /**
         * Host network-management layer. Capability-probed, never required.
         */
        class NetworkManagerDelegate
        {
        public:
            virtual ~NetworkManagerDelegate() = default;

            virtual bool available() = 0;

            // Wi-Fi device currently connected as a client, if any
            virtual std::optional<std::string> connected_wifi_device() = 0;

            virtual bool create_hotspot(const DelegateHotspotRequest &request) = 0;
            virtual bool teardown_hotspot() = 0;

            // Hands a device to, or takes it away from, the delegate
            virtual bool set_managed(const std::string &iface, bool managed) = 0;

            // Lease file of the DHCP server the delegate runs for the hotspot
            virtual std::string leases_file(const std::string &iface) const = 0;
        };

        /**
         * NetworkManager delegate driven through nmcli
         */
        class NmcliDelegate : public NetworkManagerDelegate
        {
        public:
            explicit NmcliDelegate(core::CommandRunner &runner,
                                   const std::string &connection_name = "routnet-hotspot");

            bool available() override;
            std::optional<std::string> connected_wifi_device() override;
            bool create_hotspot(const DelegateHotspotRequest &request) override;
            bool teardown_hotspot() override;
            bool set_managed(const std::string &iface, bool managed) override;
            std::string leases_file(const std::string &iface) const override;

            // Argument vector for "nmcli connection add", exposed for tests
            std::vector<std::string> build_connection_args(const DelegateHotspotRequest &request) const;

        private:
            bool remove_existing_connection();
            bool run_nmcli(const std::vector<std::string> &args, std::string *output = nullptr);

            core::CommandRunner &runner_;
            std::shared_ptr<core::Logger> logger_;
            std::string connection_name_;
            bool active_ = false;
        };

        // Device name of the first "wifi" device in state "connected" from nmcli -t output
        std::optional<std::string> parse_nmcli_connected_wifi(const std::string &output);

    } // namespace infrastructure
} // namespace routnet

#endif // ROUTNET_INFRASTRUCTURE_NETWORK_MANAGER_HPP
