#ifndef ROUTNET_INFRASTRUCTURE_WIRELESS_HPP
#define ROUTNET_INFRASTRUCTURE_WIRELESS_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <set>
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
         * One client associated with the access point
         */
        struct StationInfo
        {
            std::string mac;
            uint64_t rx_bytes = 0;
            uint64_t tx_bytes = 0;
            std::optional<int> signal_dbm;
        };

        // One "valid interface combinations" entry: every mode it allows together
        using InterfaceCombination = std::set<std::string>;

        /**
         * nl80211 radio control
         */
        class WirelessControl
        {
        public:
            virtual ~WirelessControl() = default;

            virtual std::vector<std::string> wireless_interfaces() = 0;
            virtual bool is_associated(const std::string &iface) = 0;

            // "phy0" for an interface bound to wiphy 0
            virtual std::optional<std::string> phy_of(const std::string &iface) = 0;
            virtual std::vector<InterfaceCombination> interface_combinations(const std::string &phy) = 0;

            // Adds an AP-mode virtual interface on the radio of base; throws std::runtime_error
            virtual void add_ap_interface(const std::string &base, const std::string &name) = 0;
            virtual bool delete_interface(const std::string &name) = 0;

            virtual std::vector<StationInfo> stations(const std::string &iface) = 0;
        };

        /**
         * WirelessControl backed by the iw tool
         */
        class IwWirelessControl : public WirelessControl
        {
        public:
            explicit IwWirelessControl(core::CommandRunner &runner);

            std::vector<std::string> wireless_interfaces() override;
            bool is_associated(const std::string &iface) override;
            std::optional<std::string> phy_of(const std::string &iface) override;
            std::vector<InterfaceCombination> interface_combinations(const std::string &phy) override;
            void add_ap_interface(const std::string &base, const std::string &name) override;
            bool delete_interface(const std::string &name) override;
            std::vector<StationInfo> stations(const std::string &iface) override;

        private:
            core::CommandRunner &runner_;
            std::shared_ptr<core::Logger> logger_;
        };

        // Parsers for iw output, kept free so they can be tested on captured text
        std::vector<std::string> parse_iw_dev_interfaces(const std::string &output);
        std::optional<std::string> parse_iw_wiphy(const std::string &output);
        std::vector<InterfaceCombination> parse_interface_combinations(const std::string &output);
        std::vector<StationInfo> parse_station_dump(const std::string &output);

        // True when one combination allows managed and AP at the same time
        bool supports_sta_ap_concurrency(const std::vector<InterfaceCombination> &combinations);

    } // namespace infrastructure
} // namespace routnet

#endif // ROUTNET_INFRASTRUCTURE_WIRELESS_HPP
