#include "routnet/services/interface_lifecycle.hpp"
#include "routnet/core/errors.hpp"
#include "routnet/core/logger.hpp"
#include "routnet/core/transaction_log.hpp"
#include "routnet/infrastructure/netlink_manager.hpp"
#include "routnet/infrastructure/wireless.hpp"

#include <net/if.h>
#include <openssl/rand.h>

#include <cstdio>

namespace routnet
{
    namespace services
    {

        namespace
        {
            std::string fit_ifname(const std::string &name)
            {
                return name.size() < IFNAMSIZ ? name : name.substr(0, IFNAMSIZ - 1);
            }
        } // namespace

        std::string random_interface_name()
        {
            unsigned char bytes[4];
            if (RAND_bytes(bytes, sizeof(bytes)) != 1)
            {
                throw core::HotspotError(core::ErrorCode::InterfaceCreateFailed,
                                         "failed to generate random interface name");
            }

            char name[16];
            std::snprintf(name, sizeof(name), "ap%02x%02x%02x%02x", bytes[0], bytes[1], bytes[2], bytes[3]);
            return name;
        }

        InterfaceLifecycle::InterfaceLifecycle(infrastructure::LinkControl &links,
                                               infrastructure::WirelessControl &wireless,
                                               core::TransactionLog &log)
            : links_(links), wireless_(wireless), log_(log), logger_(core::get_logger("InterfaceLifecycle"))
        {
        }

        std::vector<std::string> InterfaceLifecycle::candidate_names(const std::string &base,
                                                                     const std::string &preferred) const
        {
            std::vector<std::string> names;
            if (!preferred.empty())
            {
                names.push_back(fit_ifname(preferred));
            }
            names.push_back(fit_ifname(base + "ap"));
            for (int i = 1; i <= MAX_NAME_SUFFIXES; ++i)
            {
                names.push_back(fit_ifname(base + "ap" + std::to_string(i)));
            }
            return names;
        }

        std::string InterfaceLifecycle::choose_name(const std::string &base, const std::string &preferred)
        {
            for (const auto &name : candidate_names(base, preferred))
            {
                if (!links_.link_exists(name))
                {
                    return name;
                }
                logger_->debug("Interface name taken", core::LogContext().add("name", name));
            }

            std::string name = random_interface_name();
            while (links_.link_exists(name))
            {
                name = random_interface_name();
            }
            logger_->info("Using random interface name", core::LogContext().add("name", name));
            return name;
        }

        InterfaceDescriptor InterfaceLifecycle::create_virtual_ap(const std::string &base, const std::string &preferred)
        {
            InterfaceDescriptor iface;
            iface.name = choose_name(base, preferred);
            iface.role = InterfaceRole::Ap;

            try
            {
                wireless_.add_ap_interface(base, iface.name);
            }
            catch (const std::exception &e)
            {
                throw core::HotspotError(core::ErrorCode::InterfaceCreateFailed,
                                         "cannot add AP interface " + iface.name + " on " + base + ": " + e.what());
            }

            iface.owned = true;
            log_.push("delete interface " + iface.name, [this, iface]()
                      { destroy(iface); });

            logger_->info("Virtual AP interface created",
                          core::LogContext().add("name", iface.name).add("base", base));
            return iface;
        }

        bool InterfaceLifecycle::bring_up(const InterfaceDescriptor &iface)
        {
            if (!links_.set_link_state(iface.name, true))
            {
                logger_->warning("Failed to bring interface up", core::LogContext().add("name", iface.name));
                return false;
            }
            return true;
        }

        bool InterfaceLifecycle::destroy(const InterfaceDescriptor &iface)
        {
            if (!iface.owned)
            {
                return true;
            }
            if (!links_.link_exists(iface.name))
            {
                logger_->debug("Interface already absent", core::LogContext().add("name", iface.name));
                return true;
            }
            return wireless_.delete_interface(iface.name);
        }

    } // namespace services
} // namespace routnet
