#ifndef ROUTNET_SERVICES_INTERFACE_LIFECYCLE_HPP
#define ROUTNET_SERVICES_INTERFACE_LIFECYCLE_HPP

#include <memory>
#include <string>
#include <vector>

namespace routnet
{
    namespace core
    {
        class Logger;
        class TransactionLog;
    }

    namespace infrastructure
    {
        class LinkControl;
        class WirelessControl;
    }

    namespace services
    {

        enum class InterfaceRole
        {
            Sta,
            Ap,
            Shaping,
        };

        struct InterfaceDescriptor
        {
            std::string name;
            InterfaceRole role = InterfaceRole::Ap;
            bool owned = false; // Created by this run and destroyed by it
        };

        /**
         * Interface Lifecycle Manager
         * Creates and destroys the virtual AP interface. Destruction of a
         * created interface is registered in the transaction log before
         * create_virtual_ap() returns.
         */
        class InterfaceLifecycle
        {
        public:
            // Alternatives tried after the preferred name: <base>ap, <base>ap1 .. <base>ap4
            static constexpr int MAX_NAME_SUFFIXES = 4;

            InterfaceLifecycle(infrastructure::LinkControl &links,
                               infrastructure::WirelessControl &wireless,
                               core::TransactionLog &log);

            std::vector<std::string> candidate_names(const std::string &base, const std::string &preferred) const;

            // First free candidate, else a random "ap" + 8 hex digits name
            std::string choose_name(const std::string &base, const std::string &preferred);

            // Throws HotspotError InterfaceCreateFailed
            InterfaceDescriptor create_virtual_ap(const std::string &base, const std::string &preferred);

            bool bring_up(const InterfaceDescriptor &iface);
            bool destroy(const InterfaceDescriptor &iface);

        private:
            infrastructure::LinkControl &links_;
            infrastructure::WirelessControl &wireless_;
            core::TransactionLog &log_;
            std::shared_ptr<core::Logger> logger_;
        };

        // "ap" followed by 8 random hex digits
        std::string random_interface_name();

    } // namespace services
} // namespace routnet

#endif // ROUTNET_SERVICES_INTERFACE_LIFECYCLE_HPP
