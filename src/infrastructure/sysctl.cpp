#include "routnet/infrastructure/sysctl.hpp"
#include "routnet/core/logger.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>

namespace routnet
{
    namespace infrastructure
    {

        ProcSysctl::ProcSysctl(const std::string &root)
            : root_(root), logger_(core::get_logger("Sysctl"))
        {
        }

        std::string ProcSysctl::path_of(const std::string &key) const
        {
            std::string relative = key;
            std::replace(relative.begin(), relative.end(), '.', '/');
            return root_ + "/" + relative;
        }

        std::optional<std::string> ProcSysctl::read(const std::string &key)
        {
            std::ifstream file(path_of(key));
            if (!file.is_open())
            {
                logger_->warning("Cannot read kernel parameter", core::LogContext().add("key", key));
                return std::nullopt;
            }

            std::string value;
            std::getline(file, value);
            value.erase(value.find_last_not_of(" \t\r\n") + 1);
            return value;
        }

        void ProcSysctl::write(const std::string &key, const std::string &value)
        {
            std::ofstream file(path_of(key));
            if (!file.is_open())
            {
                throw std::runtime_error("cannot open " + path_of(key) + " for writing");
            }

            file << value << "\n";
            file.flush();
            if (!file)
            {
                throw std::runtime_error("failed to write " + key + "=" + value);
            }

            logger_->info("Kernel parameter set", core::LogContext().add("key", key).add("value", value));
        }

    } // namespace infrastructure
} // namespace routnet
