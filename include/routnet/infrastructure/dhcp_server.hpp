#ifndef ROUTNET_INFRASTRUCTURE_DHCP_SERVER_HPP
#define ROUTNET_INFRASTRUCTURE_DHCP_SERVER_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
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

        struct DnsmasqSettings
        {
            std::string interface;
            std::string gateway;
            int prefix_length = 24;
            std::string range_start; // Full addresses, e.g. 192.168.50.10
            std::string range_end;
            std::string lease_time = "24h";
            std::vector<std::string> dns_servers; // Upstream resolvers
        };

        struct DhcpLease
        {
            std::string mac; // Normalized upper case
            std::string ip;
            std::string hostname; // Empty when the client sent none
            uint64_t expires = 0;
        };

        // Dotted netmask for a prefix length, e.g. 24 -> 255.255.255.0
        std::string prefix_to_netmask(int prefix_length);

        std::string render_dnsmasq_config(const DnsmasqSettings &settings, const std::string &leases_path);

        // dnsmasq lease file: "<expiry> <mac> <ip> <hostname> <client-id>" per line
        std::vector<DhcpLease> parse_leases(const std::string &content);
        std::vector<DhcpLease> read_leases(const std::string &path);

        /**
         * DHCP Server Manager
         * Manages the dnsmasq instance serving DHCP and DNS on the access point
         */
        class DhcpServerManager
        {
        public:
            DhcpServerManager(ProcessLauncher &launcher, const std::string &runtime_dir);

            std::string config_path() const { return runtime_dir_ + "/dnsmasq.conf"; }
            std::string log_path() const { return runtime_dir_ + "/dnsmasq.log"; }
            std::string leases_path() const { return runtime_dir_ + "/dnsmasq.leases"; }

            // Kills dnsmasq instances left running on our configuration file
            int stop_stale();

            // Writes the config and spawns dnsmasq; throws std::runtime_error
            pid_t start(const DnsmasqSettings &settings);
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

#endif // ROUTNET_INFRASTRUCTURE_DHCP_SERVER_HPP
