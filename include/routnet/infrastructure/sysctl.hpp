#ifndef ROUTNET_INFRASTRUCTURE_SYSCTL_HPP
#define ROUTNET_INFRASTRUCTURE_SYSCTL_HPP

#include <memory>
#include <optional>
#include <string>

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

        /**
         * Kernel parameters by dotted key, e.g. "net.ipv4.ip_forward"
         */
        class SysctlControl
        {
        public:
            virtual ~SysctlControl() = default;

            virtual std::optional<std::string> read(const std::string &key) = 0;
            // Throws std::runtime_error when the value cannot be written
            virtual void write(const std::string &key, const std::string &value) = 0;
        };

        /**
         * SysctlControl over /proc/sys
         */
        class ProcSysctl : public SysctlControl
        {
        public:
            explicit ProcSysctl(const std::string &root = "/proc/sys");

            std::optional<std::string> read(const std::string &key) override;
            void write(const std::string &key, const std::string &value) override;

            std::string path_of(const std::string &key) const;

        private:
            std::string root_;
            std::shared_ptr<core::Logger> logger_;
        };

    } // namespace infrastructure
} // namespace routnet

#endif // ROUTNET_INFRASTRUCTURE_SYSCTL_HPP
