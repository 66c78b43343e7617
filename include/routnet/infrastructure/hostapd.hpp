#ifndef ROUTNET_INFRASTRUCTURE_HOSTAPD_HPP
#define ROUTNET_INFRASTRUCTURE_HOSTAPD_HPP

#include <memory>
#include <string>
#include <sys/types.h>

namespace routnet
{
    namespace core
    {
        class Logger;
    }
}

namespace routnet
{
    namespace infrastructure
    {
        class ProcessLauncher;

        struct HostapdSettings
        {
            std::string interface;
            std::string driver = "nl80211";
            std::string ssid;
            std::string passphrase; // Empty means an open network
            std::string hw_mode = "g";
            int channel = 6;
            std::string country_code;
        };

        // hostapd.conf contents; WPA2-PSK/CCMP unless the passphrase is empty
        std::string render_hostapd_config(const HostapdSettings &settings);

        /**
         * Hostapd Manager
         * Writes hostapd.conf into the runtime directory and supervises the
         * hostapd process that broadcasts the access point.
         */
        class HostapdManager
        {
        public:
            HostapdManager(ProcessLauncher &launcher, const std::string &runtime_dir);

            std::string config_path() const { return runtime_dir_ + "/hostapd.conf"; }
            std::string log_path() const { return runtime_dir_ + "/hostapd.log"; }

            // Kills hostapd instances left running on our configuration file
            int stop_stale();

            // Writes the config and spawns hostapd; throws std::runtime_error
            pid_t start(const HostapdSettings &settings);
            bool stop();
            bool is_running();

            pid_t pid() const { return pid_; }

        private:
            ProcessLauncher &launcher_;
            std::string runtime_dir_;
            std::shared_ptr<core::Logger> logger_;
            pid_t pid_ = -1;
        };

    } // namespace infrastructure
} // namespace routnet

#endif // ROUTNET_INFRASTRUCTURE_HOSTAPD_HPP
