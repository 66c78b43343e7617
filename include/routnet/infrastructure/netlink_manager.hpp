#ifndef ROUTNET_INFRASTRUCTURE_NETLINK_MANAGER_HPP
#define ROUTNET_INFRASTRUCTURE_NETLINK_MANAGER_HPP

#include <memory>
#include <string>
#include <vector>

struct nl_sock;
struct nl_cache;

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
         * Kernel link and address control.
         * Mutations throw std::runtime_error; best-effort calls return false.
         */
        class LinkControl
        {
        public:
            virtual ~LinkControl() = default;

            virtual bool link_exists(const std::string &name) = 0;
            virtual std::vector<std::string> list_links() = 0;

            virtual bool set_link_state(const std::string &name, bool up) = 0;

            // Creates a software link of the given kind ("ifb")
            virtual void create_link(const std::string &name, const std::string &kind) = 0;
            virtual bool delete_link(const std::string &name) = 0;

            // cidr like "192.168.50.1/24"
            virtual void add_address(const std::string &name, const std::string &cidr) = 0;
            virtual bool flush_addresses(const std::string &name) = 0;
        };

        /**
         * rtnetlink implementation on top of libnl-route-3
         */
        class NetlinkManager : public LinkControl
        {
        public:
            NetlinkManager();
            ~NetlinkManager() override;

            NetlinkManager(const NetlinkManager &) = delete;
            NetlinkManager &operator=(const NetlinkManager &) = delete;

            bool link_exists(const std::string &name) override;
            std::vector<std::string> list_links() override;
            bool set_link_state(const std::string &name, bool up) override;
            void create_link(const std::string &name, const std::string &kind) override;
            bool delete_link(const std::string &name) override;
            void add_address(const std::string &name, const std::string &cidr) override;
            bool flush_addresses(const std::string &name) override;

        private:
            bool refresh_cache();
            int interface_index(const std::string &name);

            nl_sock *nl_socket_ = nullptr;
            nl_cache *link_cache_ = nullptr;
            std::shared_ptr<core::Logger> logger_;
        };

    } // namespace infrastructure
} // namespace routnet

#endif // ROUTNET_INFRASTRUCTURE_NETLINK_MANAGER_HPP
