#include "routnet/services/policy_store.hpp"
#include "routnet/core/config.hpp"
#include "routnet/core/errors.hpp"
#include "routnet/core/logger.hpp"
#include "routnet/core/net_units.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace routnet
{
    namespace services
    {

        const char *priority_class_name(PriorityClass priority)
        {
            return priority == PriorityClass::High ? "high" : "normal";
        }

        QosLimits QosLimits::from_config(const core::QosConfig &config)
        {
            const auto link = core::parse_rate(config.link_rate);
            const auto fallback = core::parse_rate(config.default_rate);
            if (!link || !fallback)
            {
                throw core::HotspotError(core::ErrorCode::ConfigInvalid,
                                         "invalid qos rates: " + config.link_rate + ", " + config.default_rate);
            }

            QosLimits limits;
            limits.link_rate = *link;
            limits.default_rate = std::min(*fallback, *link);
            limits.ceil_factor = std::max(1, config.ceil_factor);
            return limits;
        }

        uint64_t QosLimits::ceil_for(uint64_t rate) const
        {
            const uint64_t factor = static_cast<uint64_t>(std::max(1, ceil_factor));
            uint64_t ceil = rate > link_rate / factor ? link_rate : rate * factor;
            return std::max(rate, std::min(ceil, link_rate));
        }

        std::vector<QosEntry> QosPolicy::entries(const QosLimits &limits) const
        {
            std::set<std::string> macs;
            for (const auto &entry : rates)
            {
                macs.insert(entry.first);
            }
            macs.insert(priority.begin(), priority.end());

            std::vector<QosEntry> result;
            for (const auto &mac : macs)
            {
                QosEntry entry;
                entry.mac = mac;
                auto it = rates.find(mac);
                entry.rate = it != rates.end() ? it->second : limits.default_rate;
                entry.ceil = limits.ceil_for(entry.rate);
                entry.priority = priority.count(mac) ? PriorityClass::High : PriorityClass::Normal;
                result.push_back(entry);
            }
            return result;
        }

        PolicyStore::PolicyStore(const std::string &directory)
            : directory_(directory), logger_(core::get_logger("PolicyStore"))
        {
        }

        std::vector<std::string> PolicyStore::read_lines(const std::string &path) const
        {
            std::vector<std::string> lines;
            std::ifstream file(path);
            if (!file.is_open())
            {
                return lines;
            }

            std::string line;
            while (std::getline(file, line))
            {
                const auto comment = line.find('#');
                if (comment != std::string::npos)
                {
                    line.erase(comment);
                }
                const auto begin = line.find_first_not_of(" \t\r");
                if (begin == std::string::npos)
                {
                    continue;
                }
                const auto end = line.find_last_not_of(" \t\r");
                lines.push_back(line.substr(begin, end - begin + 1));
            }
            return lines;
        }

        void PolicyStore::load()
        {
            QosPolicy loaded;

            for (const auto &line : read_lines(blocked_path()))
            {
                if (auto mac = core::normalize_mac(line))
                {
                    loaded.blocked.insert(*mac);
                }
                else
                {
                    logger_->warning("Skipping malformed entry", core::LogContext().add("file", blocked_path()).add("line", line));
                }
            }

            for (const auto &line : read_lines(qos_path()))
            {
                std::istringstream fields(line);
                std::string mac_text;
                std::string rate_text;
                fields >> mac_text >> rate_text;

                auto mac = core::normalize_mac(mac_text);
                auto rate = core::parse_rate(rate_text);
                if (mac && rate)
                {
                    // Later lines win
                    loaded.rates[*mac] = *rate;
                }
                else
                {
                    logger_->warning("Skipping malformed entry", core::LogContext().add("file", qos_path()).add("line", line));
                }
            }

            for (const auto &line : read_lines(priority_path()))
            {
                if (auto mac = core::normalize_mac(line))
                {
                    loaded.priority.insert(*mac);
                }
                else
                {
                    logger_->warning("Skipping malformed entry", core::LogContext().add("file", priority_path()).add("line", line));
                }
            }

            policy_ = loaded;
            logger_->info("Policy loaded",
                          core::LogContext()
                              .add("directory", directory_)
                              .add("blocked", policy_.blocked.size())
                              .add("rates", policy_.rates.size())
                              .add("priority", policy_.priority.size()));
        }

        void PolicyStore::write_lines(const std::string &path, const std::vector<std::string> &lines) const
        {
            std::filesystem::create_directories(directory_);

            const std::string temp_path = path + ".tmp";
            {
                std::ofstream file(temp_path, std::ios::trunc);
                if (!file.is_open())
                {
                    throw std::runtime_error("cannot write " + temp_path);
                }
                for (const auto &line : lines)
                {
                    file << line << "\n";
                }
                file.flush();
                if (!file)
                {
                    throw std::runtime_error("failed writing " + temp_path);
                }
            }
            std::filesystem::rename(temp_path, path);
        }

        void PolicyStore::save_blocked(const QosPolicy &policy) const
        {
            write_lines(blocked_path(), std::vector<std::string>(policy.blocked.begin(), policy.blocked.end()));
        }

        void PolicyStore::save_rates(const QosPolicy &policy) const
        {
            std::vector<std::string> lines;
            for (const auto &[mac, rate] : policy.rates)
            {
                lines.push_back(mac + " " + core::format_rate(rate));
            }
            write_lines(qos_path(), lines);
        }

        void PolicyStore::save_priority(const QosPolicy &policy) const
        {
            write_lines(priority_path(), std::vector<std::string>(policy.priority.begin(), policy.priority.end()));
        }

        std::string PolicyStore::require_mac(const std::string &mac) const
        {
            auto normalized = core::normalize_mac(mac);
            if (!normalized)
            {
                throw core::HotspotError(core::ErrorCode::CommandInvalid, "invalid MAC address: " + mac);
            }
            return *normalized;
        }

        bool PolicyStore::block(const std::string &mac)
        {
            const auto key = require_mac(mac);
            QosPolicy updated = policy_;
            if (!updated.blocked.insert(key).second)
            {
                return false;
            }
            save_blocked(updated);
            policy_ = std::move(updated);
            logger_->info("Device blocked", core::LogContext().add("mac", key));
            return true;
        }

        bool PolicyStore::unblock(const std::string &mac)
        {
            const auto key = require_mac(mac);
            QosPolicy updated = policy_;
            if (updated.blocked.erase(key) == 0)
            {
                return false;
            }
            save_blocked(updated);
            policy_ = std::move(updated);
            logger_->info("Device unblocked", core::LogContext().add("mac", key));
            return true;
        }

        bool PolicyStore::set_rate(const std::string &mac, const std::string &rate)
        {
            const auto key = require_mac(mac);
            if (rate.empty())
            {
                throw core::HotspotError(core::ErrorCode::CommandInvalid, "missing rate for " + key);
            }
            const auto bits = core::parse_rate(rate);
            if (!bits)
            {
                throw core::HotspotError(core::ErrorCode::CommandInvalid, "invalid rate: " + rate);
            }

            auto it = policy_.rates.find(key);
            if (it != policy_.rates.end() && it->second == *bits)
            {
                return false;
            }
            QosPolicy updated = policy_;
            updated.rates[key] = *bits;
            save_rates(updated);
            policy_ = std::move(updated);
            logger_->info("Device rate set", core::LogContext().add("mac", key).add("rate", core::format_rate(*bits)));
            return true;
        }

        bool PolicyStore::set_priority(const std::string &mac)
        {
            const auto key = require_mac(mac);
            QosPolicy updated = policy_;
            if (!updated.priority.insert(key).second)
            {
                return false;
            }
            save_priority(updated);
            policy_ = std::move(updated);
            logger_->info("Device prioritized", core::LogContext().add("mac", key));
            return true;
        }

        bool PolicyStore::reset()
        {
            if (policy_.empty())
            {
                return false;
            }
            const QosPolicy cleared{};
            save_blocked(cleared);
            save_rates(cleared);
            save_priority(cleared);
            policy_ = cleared;
            logger_->info("Policy reset");
            return true;
        }

    } // namespace services
} // namespace routnet
