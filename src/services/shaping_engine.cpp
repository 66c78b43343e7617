#include "routnet/services/shaping_engine.hpp"
#include "routnet/core/errors.hpp"
#include "routnet/core/logger.hpp"
#include "routnet/core/net_units.hpp"
#include "routnet/infrastructure/netlink_manager.hpp"

#include <algorithm>
#include <map>
#include <sstream>
#include <stdexcept>
#include <tuple>

namespace routnet
{
    namespace services
    {

        namespace tc = infrastructure::tc;
        using infrastructure::MacField;
        using infrastructure::TcCommand;

        namespace
        {
            int htb_prio(PriorityClass priority)
            {
                return priority == PriorityClass::High ? 0 : 1;
            }
        } // namespace

        ShapingPlan ShapingPlanner::plan(const QosPolicy &policy,
                                         const QosLimits &limits,
                                         const std::string &ap,
                                         const std::string &ifb)
        {
            ShapingPlan plan;
            plan.ap = ap;
            plan.ifb = ifb;
            plan.limits = limits;
            plan.blocked.assign(policy.blocked.begin(), policy.blocked.end());

            // Blocked devices are dropped before classification, they get no class
            std::map<std::tuple<int, uint64_t>, ShapingClass> grouped;
            for (const auto &entry : policy.entries(limits))
            {
                if (policy.blocked.count(entry.mac))
                {
                    continue;
                }
                auto &cls = grouped[std::make_tuple(htb_prio(entry.priority), entry.rate)];
                cls.rate = entry.rate;
                cls.ceil = entry.ceil;
                cls.priority = entry.priority;
                cls.macs.push_back(entry.mac);
            }

            uint32_t minor = ShapingPlan::FIRST_CLASS_MINOR;
            for (auto &group : grouped)
            {
                group.second.minor = minor++;
                plan.classes.push_back(group.second);
            }
            return plan;
        }

        std::vector<TcCommand> ShapingPlan::device_commands(const std::string &dev, MacField field) const
        {
            const std::string parent = tc::class_id(PARENT_MINOR);

            std::vector<TcCommand> commands;
            commands.push_back(tc::htb_root_qdisc(dev, DEFAULT_MINOR));
            commands.push_back(tc::htb_class(dev, tc::ROOT_HANDLE, parent, limits.link_rate, limits.link_rate, 1));
            commands.push_back(tc::htb_class(dev, parent, tc::class_id(DEFAULT_MINOR),
                                             limits.default_rate, limits.link_rate, 1));

            for (const auto &cls : classes)
            {
                commands.push_back(tc::htb_class(dev, parent, cls.class_id(), cls.rate, cls.ceil, htb_prio(cls.priority)));
            }
            for (const auto &mac : blocked)
            {
                commands.push_back(tc::mac_drop_filter(dev, field, mac));
            }
            for (const auto &cls : classes)
            {
                for (const auto &mac : cls.macs)
                {
                    commands.push_back(tc::mac_classify_filter(dev, field, mac, cls.class_id()));
                }
            }
            return commands;
        }

        std::vector<TcCommand> ShapingPlan::ingress_commands() const
        {
            return {tc::ingress_qdisc(ap), tc::ingress_redirect(ap, ifb)};
        }

        std::vector<TcCommand> ShapingPlan::commands() const
        {
            // Upload direction first so the redirect never points at an unshaped device
            std::vector<TcCommand> all = device_commands(ifb, MacField::Source);
            const auto download = device_commands(ap, MacField::Destination);
            all.insert(all.end(), download.begin(), download.end());
            const auto ingress = ingress_commands();
            all.insert(all.end(), ingress.begin(), ingress.end());
            return all;
        }

        const ShapingClass *ShapingPlan::class_for(const std::string &mac) const
        {
            for (const auto &cls : classes)
            {
                if (std::find(cls.macs.begin(), cls.macs.end(), mac) != cls.macs.end())
                {
                    return &cls;
                }
            }
            return nullptr;
        }

        std::string ShapingPlan::describe() const
        {
            std::ostringstream text;
            text << "shaping " << ap << " (download) and " << ifb << " (upload)\n";
            text << "  link " << core::format_rate(limits.link_rate)
                 << ", default class " << tc::class_id(DEFAULT_MINOR)
                 << " rate " << core::format_rate(limits.default_rate)
                 << " ceil " << core::format_rate(limits.link_rate) << "\n";
            for (const auto &cls : classes)
            {
                text << "  class " << cls.class_id()
                     << " rate " << core::format_rate(cls.rate)
                     << " ceil " << core::format_rate(cls.ceil)
                     << " priority " << priority_class_name(cls.priority) << ":";
                for (const auto &mac : cls.macs)
                {
                    text << " " << mac;
                }
                text << "\n";
            }
            for (const auto &mac : blocked)
            {
                text << "  drop " << mac << "\n";
            }
            text << "  ingress " << ap << " -> " << ifb << "\n";
            return text.str();
        }

        ShapingEngine::ShapingEngine(infrastructure::TrafficControl &tc,
                                     infrastructure::LinkControl &links,
                                     const QosLimits &limits,
                                     const std::string &ap,
                                     const std::string &ifb)
            : tc_(tc), links_(links), limits_(limits), ap_(ap), ifb_(ifb),
              logger_(core::get_logger("ShapingEngine"))
        {
        }

        bool ShapingEngine::clear_qdiscs()
        {
            bool clean = tc_.delete_root_qdisc(ap_);
            clean = tc_.delete_ingress_qdisc(ap_) && clean;
            if (links_.link_exists(ifb_))
            {
                clean = tc_.delete_root_qdisc(ifb_) && clean;
            }
            return clean;
        }

        void ShapingEngine::ensure_ifb()
        {
            if (!links_.link_exists(ifb_))
            {
                links_.create_link(ifb_, "ifb");
                ifb_owned_ = true;
                logger_->info("Created ingress redirect device", core::LogContext().add("name", ifb_));
            }
            if (!links_.set_link_state(ifb_, true))
            {
                throw std::runtime_error("cannot bring " + ifb_ + " up");
            }
        }

        ShapingPlan ShapingEngine::rebuild(const QosPolicy &policy)
        {
            const ShapingPlan plan = ShapingPlanner::plan(policy, limits_, ap_, ifb_);
            active_ = false;

            try
            {
                if (!clear_qdiscs())
                {
                    throw std::runtime_error("existing qdiscs could not be removed");
                }
                ensure_ifb();
                for (const auto &command : plan.commands())
                {
                    tc_.execute(command);
                }
            }
            catch (const std::exception &e)
            {
                logger_->error("Shaping rebuild failed, tearing down", core::LogContext().add("error", e.what()));
                teardown();
                throw core::HotspotError(core::ErrorCode::ShapingRebuildFailed, e.what());
            }

            active_ = true;
            description_ = plan.describe();
            logger_->info("Shaping rebuilt",
                          core::LogContext()
                              .add("ap", ap_)
                              .add("ifb", ifb_)
                              .add("classes", plan.classes.size())
                              .add("blocked", plan.blocked.size()));
            return plan;
        }

        bool ShapingEngine::teardown()
        {
            bool clean = clear_qdiscs();
            if (ifb_owned_)
            {
                clean = links_.delete_link(ifb_) && clean;
                ifb_owned_ = false;
            }
            active_ = false;
            description_.clear();
            return clean;
        }

    } // namespace services
} // namespace routnet
