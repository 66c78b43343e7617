/**
 * DHCP Server Manager Implementation
 * Generates the dnsmasq configuration for the hotspot subnet and supervises
 * the dnsmasq process in the foreground.
 */

#include "routnet/infrastructure/dhcp_server.hpp"
#include "routnet/infrastructure/process_launcher.hpp"
#include "routnet/core/logger.hpp"
#include "routnet/core/net_units.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace routnet
{
    namespace infrastructure
    {

        std::string prefix_to_netmask(int prefix_length)
        {
            if (prefix_length < 0)
            {
                prefix_length = 0;
            }
            if (prefix_length > 32)
            {
                prefix_length = 32;
            }
            const uint32_t mask = prefix_length == 0 ? 0 : 0xffffffffu << (32 - prefix_length);

            std::ostringstream text;
            text << ((mask >> 24) & 0xff) << "." << ((mask >> 16) & 0xff) << "."
                 << ((mask >> 8) & 0xff) << "." << (mask & 0xff);
            return text.str();
        }

        std::string render_dnsmasq_config(const DnsmasqSettings &settings, const std::string &leases_path)
        {
            std::ostringstream config;
            config << "# routnet DHCP/DNS, generated at start\n";
            config << "interface=" << settings.interface << "\n";
            config << "bind-interfaces\n";
            config << "except-interface=lo\n";
            config << "dhcp-range=" << settings.range_start << "," << settings.range_end << ","
                   << prefix_to_netmask(settings.prefix_length) << "," << settings.lease_time << "\n";
            config << "dhcp-option=option:router," << settings.gateway << "\n";
            config << "dhcp-option=option:dns-server," << settings.gateway << "\n";
            config << "dhcp-leasefile=" << leases_path << "\n";
            config << "dhcp-authoritative\n";

            // Forward DNS to the configured resolvers only
            if (!settings.dns_servers.empty())
            {
                config << "no-resolv\n";
                for (const auto &server : settings.dns_servers)
                {
                    config << "server=" << server << "\n";
                }
            }
            config << "log-facility=-\n";
            return config.str();
        }

        std::vector<DhcpLease> parse_leases(const std::string &content)
        {
            std::vector<DhcpLease> leases;
            std::istringstream stream(content);
            std::string line;
            while (std::getline(stream, line))
            {
                std::istringstream fields(line);
                std::string expires;
                std::string mac;
                DhcpLease lease;
                if (!(fields >> expires >> mac >> lease.ip))
                {
                    continue;
                }

                auto normalized = core::normalize_mac(mac);
                if (!normalized)
                {
                    continue;
                }
                lease.mac = *normalized;

                std::string hostname;
                if (fields >> hostname && hostname != "*")
                {
                    lease.hostname = hostname;
                }

                try
                {
                    lease.expires = std::stoull(expires);
                }
                catch (const std::exception &)
                {
                    lease.expires = 0;
                }
                leases.push_back(lease);
            }
            return leases;
        }

        std::vector<DhcpLease> read_leases(const std::string &path)
        {
            std::ifstream file(path);
            if (!file.is_open())
            {
                return {};
            }
            std::stringstream buffer;
            buffer << file.rdbuf();
            return parse_leases(buffer.str());
        }

        DhcpServerManager::DhcpServerManager(ProcessLauncher &launcher, const std::string &runtime_dir)
            : launcher_(launcher), runtime_dir_(runtime_dir), logger_(core::get_logger("DhcpServerManager"))
        {
        }

        int DhcpServerManager::stop_stale()
        {
            return launcher_.kill_matching("dnsmasq.*" + config_path());
        }

        pid_t DhcpServerManager::start(const DnsmasqSettings &settings)
        {
            std::filesystem::create_directories(runtime_dir_);

            std::ofstream file(config_path(), std::ios::trunc);
            if (!file.is_open())
            {
                throw std::runtime_error("cannot write " + config_path());
            }
            file << render_dnsmasq_config(settings, leases_path());
            file.close();

            logger_->info("Starting dnsmasq",
                          core::LogContext()
                              .add("interface", settings.interface)
                              .add("dhcp_range", settings.range_start + "-" + settings.range_end)
                              .add("config_file", config_path()));

            pid_ = launcher_.launch({"dnsmasq", "--no-daemon", "--conf-file=" + config_path()}, log_path());
            return pid_;
        }

        bool DhcpServerManager::is_running()
        {
            if (pid_ <= 0)
            {
                return false;
            }
            if (!launcher_.is_alive(pid_))
            {
                // Reaped; the pid may be reused and must not be signalled
                logger_->warning("dnsmasq exited", core::LogContext().add("pid", pid_));
                pid_ = -1;
                return false;
            }
            return true;
        }

        bool DhcpServerManager::stop()
        {
            if (pid_ <= 0)
            {
                return true;
            }

            logger_->info("Stopping dnsmasq", core::LogContext().add("pid", pid_));
            const bool stopped = launcher_.terminate(pid_);
            pid_ = -1;
            return stopped;
        }

    } // namespace infrastructure
} // namespace routnet
