#include "routnet/infrastructure/hostapd.hpp"
#include "routnet/infrastructure/process_launcher.hpp"
#include "routnet/core/logger.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <sstream>
#include <stdexcept>

namespace routnet
{
    namespace infrastructure
    {

        std::string render_hostapd_config(const HostapdSettings &settings)
        {
            std::ostringstream config;
            config << "# routnet access point, generated at start\n";
            config << "interface=" << settings.interface << "\n";
            config << "driver=" << settings.driver << "\n";
            config << "ssid=" << settings.ssid << "\n";
            config << "hw_mode=" << settings.hw_mode << "\n";
            config << "channel=" << settings.channel << "\n";
            if (!settings.country_code.empty())
            {
                config << "country_code=" << settings.country_code << "\n";
                config << "ieee80211d=1\n";
            }
            config << "ignore_broadcast_ssid=0\n";
            config << "auth_algs=1\n";

            if (!settings.passphrase.empty())
            {
                config << "wpa=2\n";
                config << "wpa_passphrase=" << settings.passphrase << "\n";
                config << "wpa_key_mgmt=WPA-PSK\n";
                config << "rsn_pairwise=CCMP\n";
            }
            return config.str();
        }

        HostapdManager::HostapdManager(ProcessLauncher &launcher, const std::string &runtime_dir)
            : launcher_(launcher), runtime_dir_(runtime_dir), logger_(core::get_logger("HostapdManager"))
        {
        }

        int HostapdManager::stop_stale()
        {
            return launcher_.kill_matching("hostapd.*" + config_path());
        }

        pid_t HostapdManager::start(const HostapdSettings &settings)
        {
            std::filesystem::create_directories(runtime_dir_);

            // The file holds the passphrase; it is never readable by others
            const std::string text = render_hostapd_config(settings);
            int fd = open(config_path().c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
            if (fd < 0)
            {
                throw std::runtime_error("cannot write " + config_path() + ": " + std::strerror(errno));
            }
            bool written = fchmod(fd, 0600) == 0;
            size_t offset = 0;
            while (written && offset < text.size())
            {
                const ssize_t n = write(fd, text.data() + offset, text.size() - offset);
                if (n < 0 && errno == EINTR)
                {
                    continue;
                }
                written = n > 0;
                offset += written ? static_cast<size_t>(n) : 0;
            }
            const std::string error = std::strerror(errno);
            close(fd);
            if (!written)
            {
                throw std::runtime_error("failed writing " + config_path() + ": " + error);
            }

            logger_->info("Starting hostapd",
                          core::LogContext()
                              .add("interface", settings.interface)
                              .add("ssid", settings.ssid)
                              .add("channel", settings.channel)
                              .add("open", settings.passphrase.empty()));

            pid_ = launcher_.launch({"hostapd", config_path()}, log_path());
            return pid_;
        }

        bool HostapdManager::is_running()
        {
            if (pid_ <= 0)
            {
                return false;
            }
            if (!launcher_.is_alive(pid_))
            {
                // Reaped; the pid may be reused and must not be signalled
                logger_->warning("hostapd exited", core::LogContext().add("pid", pid_));
                pid_ = -1;
                return false;
            }
            return true;
        }

        bool HostapdManager::stop()
        {
            if (pid_ <= 0)
            {
                return true;
            }

            logger_->info("Stopping hostapd", core::LogContext().add("pid", pid_));
            const bool stopped = launcher_.terminate(pid_);
            pid_ = -1;
            return stopped;
        }

    } // namespace infrastructure
} // namespace routnet
