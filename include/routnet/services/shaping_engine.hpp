#ifndef ROUTNET_SERVICES_SHAPING_ENGINE_HPP
#define ROUTNET_SERVICES_SHAPING_ENGINE_HPP

#include "routnet/infrastructure/traffic_control.hpp"
#include "routnet/services/policy_store.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace routnet
{
    namespace core
    {
        class Logger;
    }

    namespace infrastructure
    {
        class LinkControl;
    }

    namespace services
    {

        /**
         * One HTB child class, shared by every device with the same
         * (rate, priority) pair
         */
        struct ShapingClass
        {
            uint32_t minor = 0;
            uint64_t rate = 0;
            uint64_t ceil = 0;
            PriorityClass priority = PriorityClass::Normal;
            std::vector<std::string> macs;

            std::string class_id() const { return infrastructure::tc::class_id(minor); }
        };

        /**
         * Complete shaping hierarchy for one policy. A pure value: the
         * same policy and limits always produce the same plan.
         */
        struct ShapingPlan
        {
            static constexpr uint32_t PARENT_MINOR = 0x1;
            static constexpr uint32_t DEFAULT_MINOR = 0x10;
            static constexpr uint32_t FIRST_CLASS_MINOR = 0x100;

            std::string ap;
            std::string ifb;
            QosLimits limits;
            std::vector<ShapingClass> classes;
            std::vector<std::string> blocked;

            // IFB hierarchy, then AP hierarchy, then the ingress redirect
            std::vector<infrastructure::TcCommand> commands() const;
            std::vector<infrastructure::TcCommand> device_commands(const std::string &dev,
                                                                   infrastructure::MacField field) const;
            std::vector<infrastructure::TcCommand> ingress_commands() const;

            const ShapingClass *class_for(const std::string &mac) const;

            std::string describe() const;
        };

        class ShapingPlanner
        {
        public:
            static ShapingPlan plan(const QosPolicy &policy,
                                    const QosLimits &limits,
                                    const std::string &ap,
                                    const std::string &ifb);
        };

        /**
         * QoS/Traffic-Shaping Engine
         * Every policy change rebuilds the whole hierarchy from scratch:
         * existing qdiscs are removed, the IFB device is ensured and the
         * plan is installed. A failed rebuild leaves nothing installed.
         */
        class ShapingEngine
        {
        public:
            ShapingEngine(infrastructure::TrafficControl &tc,
                          infrastructure::LinkControl &links,
                          const QosLimits &limits,
                          const std::string &ap,
                          const std::string &ifb);

            // Throws HotspotError ShapingRebuildFailed
            ShapingPlan rebuild(const QosPolicy &policy);

            // Removes qdiscs on both devices and deletes an IFB device we created
            bool teardown();

            bool active() const { return active_; }
            bool owns_ifb() const { return ifb_owned_; }
            const std::string &ap() const { return ap_; }
            const std::string &ifb() const { return ifb_; }
            const std::string &description() const { return description_; }

        private:
            bool clear_qdiscs();
            void ensure_ifb();

            infrastructure::TrafficControl &tc_;
            infrastructure::LinkControl &links_;
            QosLimits limits_;
            std::string ap_;
            std::string ifb_;
            std::shared_ptr<core::Logger> logger_;

            bool active_ = false;
            bool ifb_owned_ = false;
            std::string description_;
        };

    } // namespace services
} // namespace routnet

#endif // ROUTNET_SERVICES_SHAPING_ENGINE_HPP
