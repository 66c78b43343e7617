#ifndef ROUTNET_SERVICES_POLICY_STORE_HPP
#define ROUTNET_SERVICES_POLICY_STORE_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace routnet
{
    namespace core
    {
        class Logger;
        struct QosConfig;
    }

    namespace services
    {

        enum class PriorityClass
        {
            High,
            Normal,
        };

        const char *priority_class_name(PriorityClass priority);

        /**
         * Rate limits every shaping decision is derived from, in bits per second
         */
        struct QosLimits
        {
            uint64_t link_rate = 1000000000ULL;
            uint64_t default_rate = 100000000ULL;
            int ceil_factor = 2;

            // Throws HotspotError ConfigInvalid on unparseable rates
            static QosLimits from_config(const core::QosConfig &config);

            // Guaranteed rate times ceil_factor, capped at the link rate, never below rate
            uint64_t ceil_for(uint64_t rate) const;
        };

        struct QosEntry
        {
            std::string mac;
            uint64_t rate = 0;
            uint64_t ceil = 0;
            PriorityClass priority = PriorityClass::Normal;
        };

        /**
         * Per-device policy built from the three persisted lists
         */
        struct QosPolicy
        {
            std::set<std::string> blocked;
            std::map<std::string, uint64_t> rates;
            std::set<std::string> priority;

            // One entry per MAC in rates or priority, ordered by MAC
            std::vector<QosEntry> entries(const QosLimits &limits) const;

            bool empty() const { return blocked.empty() && rates.empty() && priority.empty(); }

            bool operator==(const QosPolicy &other) const
            {
                return blocked == other.blocked && rates == other.rates && priority == other.priority;
            }
            bool operator!=(const QosPolicy &other) const { return !(*this == other); }
        };

        /**
         * Persistent Config Store
         * Owns the QoS policy and keeps blocked.list, qos.list and
         * priority.list in the policy directory in sync with it. Every
         * mutation rewrites the affected file before returning.
         */
        class PolicyStore
        {
        public:
            explicit PolicyStore(const std::string &directory);

            // Missing files are empty lists
            void load();

            const QosPolicy &policy() const { return policy_; }
            const std::string &directory() const { return directory_; }

            // Mutations throw HotspotError CommandInvalid on malformed input.
            // They return false when the policy already had the requested state.
            bool block(const std::string &mac);
            bool unblock(const std::string &mac);
            bool set_rate(const std::string &mac, const std::string &rate);
            bool set_priority(const std::string &mac);
            bool reset();

            std::string blocked_path() const { return directory_ + "/blocked.list"; }
            std::string qos_path() const { return directory_ + "/qos.list"; }
            std::string priority_path() const { return directory_ + "/priority.list"; }

        private:
            std::string require_mac(const std::string &mac) const;
            std::vector<std::string> read_lines(const std::string &path) const;
            void write_lines(const std::string &path, const std::vector<std::string> &lines) const;

            void save_blocked(const QosPolicy &policy) const;
            void save_rates(const QosPolicy &policy) const;
            void save_priority(const QosPolicy &policy) const;

            std::string directory_;
            QosPolicy policy_;
            std::shared_ptr<core::Logger> logger_;
        };

    } // namespace services
} // namespace routnet

#endif // ROUTNET_SERVICES_POLICY_STORE_HPP
