#include "routnet/infrastructure/netlink_manager.hpp"
#include "routnet/core/logger.hpp"

#include <net/if.h>
#include <sys/socket.h>

#include <netlink/addr.h>
#include <netlink/cache.h>
#include <netlink/errno.h>
#include <netlink/netlink.h>
#include <netlink/route/addr.h>
#include <netlink/route/link.h>

#include <stdexcept>

namespace routnet
{
    namespace infrastructure
    {

        NetlinkManager::NetlinkManager()
            : logger_(core::get_logger("NetlinkManager"))
        {
            nl_socket_ = nl_socket_alloc();
            if (!nl_socket_)
            {
                throw std::runtime_error("Cannot allocate netlink socket");
            }

            int err = nl_connect(nl_socket_, NETLINK_ROUTE);
            if (err < 0)
            {
                nl_socket_free(nl_socket_);
                nl_socket_ = nullptr;
                throw std::runtime_error(std::string("Cannot connect netlink socket: ") + nl_geterror(err));
            }

            err = rtnl_link_alloc_cache(nl_socket_, AF_UNSPEC, &link_cache_);
            if (err < 0)
            {
                nl_close(nl_socket_);
                nl_socket_free(nl_socket_);
                nl_socket_ = nullptr;
                throw std::runtime_error(std::string("Cannot allocate link cache: ") + nl_geterror(err));
            }
        }

        NetlinkManager::~NetlinkManager()
        {
            if (link_cache_)
            {
                nl_cache_free(link_cache_);
                link_cache_ = nullptr;
            }
            if (nl_socket_)
            {
                nl_close(nl_socket_);
                nl_socket_free(nl_socket_);
                nl_socket_ = nullptr;
            }
        }

        bool NetlinkManager::refresh_cache()
        {
            const int err = nl_cache_refill(nl_socket_, link_cache_);
            if (err < 0)
            {
                logger_->warning("Failed to refresh link cache", core::LogContext().add("error", nl_geterror(err)));
                return false;
            }
            return true;
        }

        int NetlinkManager::interface_index(const std::string &name)
        {
            if (!refresh_cache())
            {
                return 0;
            }
            return rtnl_link_name2i(link_cache_, name.c_str());
        }

        bool NetlinkManager::link_exists(const std::string &name)
        {
            return interface_index(name) > 0;
        }

        std::vector<std::string> NetlinkManager::list_links()
        {
            std::vector<std::string> names;
            if (!refresh_cache())
            {
                return names;
            }

            for (nl_object *obj = nl_cache_get_first(link_cache_); obj; obj = nl_cache_get_next(obj))
            {
                auto *link = reinterpret_cast<rtnl_link *>(obj);
                if (const char *link_name = rtnl_link_get_name(link))
                {
                    names.emplace_back(link_name);
                }
            }
            return names;
        }

        bool NetlinkManager::set_link_state(const std::string &name, bool up)
        {
            if (!refresh_cache())
            {
                return false;
            }

            rtnl_link *link = rtnl_link_get_by_name(link_cache_, name.c_str());
            if (!link)
            {
                logger_->warning("Interface not found", core::LogContext().add("interface", name));
                return false;
            }

            rtnl_link *change = rtnl_link_alloc();
            if (!change)
            {
                rtnl_link_put(link);
                logger_->error("Failed to allocate change link object");
                return false;
            }

            if (up)
            {
                rtnl_link_set_flags(change, IFF_UP);
            }
            else
            {
                rtnl_link_unset_flags(change, IFF_UP);
            }

            const int err = rtnl_link_change(nl_socket_, link, change, 0);

            rtnl_link_put(change);
            rtnl_link_put(link);

            if (err < 0)
            {
                logger_->warning("Failed to change interface state",
                                 core::LogContext()
                                     .add("interface", name)
                                     .add("up", up)
                                     .add("error", nl_geterror(err)));
                return false;
            }

            logger_->debug("Interface state changed", core::LogContext().add("interface", name).add("up", up));
            return true;
        }

        void NetlinkManager::create_link(const std::string &name, const std::string &kind)
        {
            rtnl_link *link = rtnl_link_alloc();
            if (!link)
            {
                throw std::runtime_error("Cannot allocate rtnl_link");
            }

            rtnl_link_set_name(link, name.c_str());
            int err = rtnl_link_set_type(link, kind.c_str());
            if (err >= 0)
            {
                err = rtnl_link_add(nl_socket_, link, NLM_F_CREATE | NLM_F_EXCL);
            }
            rtnl_link_put(link);

            if (err < 0)
            {
                throw std::runtime_error("Failed to create " + kind + " interface " + name + ": " + nl_geterror(err));
            }

            logger_->debug("Interface created", core::LogContext().add("interface", name).add("kind", kind));
        }

        bool NetlinkManager::delete_link(const std::string &name)
        {
            if (!link_exists(name))
            {
                return true;
            }

            rtnl_link *link = rtnl_link_alloc();
            if (!link)
            {
                return false;
            }
            rtnl_link_set_name(link, name.c_str());
            const int err = rtnl_link_delete(nl_socket_, link);
            rtnl_link_put(link);

            if (err < 0)
            {
                logger_->warning("Failed to delete interface",
                                 core::LogContext().add("interface", name).add("error", nl_geterror(err)));
                return false;
            }

            logger_->debug("Interface deleted", core::LogContext().add("interface", name));
            return true;
        }

        void NetlinkManager::add_address(const std::string &name, const std::string &cidr)
        {
            const int ifindex = interface_index(name);
            if (ifindex <= 0)
            {
                throw std::runtime_error("Interface " + name + " not found");
            }

            nl_addr *local = nullptr;
            int err = nl_addr_parse(cidr.c_str(), AF_INET, &local);
            if (err < 0)
            {
                throw std::runtime_error("Invalid address " + cidr + ": " + nl_geterror(err));
            }

            rtnl_addr *addr = rtnl_addr_alloc();
            if (!addr)
            {
                nl_addr_put(local);
                throw std::runtime_error("Cannot allocate rtnl_addr");
            }

            rtnl_addr_set_ifindex(addr, ifindex);
            rtnl_addr_set_family(addr, AF_INET);
            rtnl_addr_set_prefixlen(addr, nl_addr_get_prefixlen(local));
            err = rtnl_addr_set_local(addr, local);
            if (err >= 0)
            {
                err = rtnl_addr_add(nl_socket_, addr, 0);
            }

            rtnl_addr_put(addr);
            nl_addr_put(local);

            // An identical address left by an earlier run is fine
            if (err < 0 && err != -NLE_EXIST)
            {
                throw std::runtime_error("Failed to assign " + cidr + " to " + name + ": " + nl_geterror(err));
            }
        }

        bool NetlinkManager::flush_addresses(const std::string &name)
        {
            const int ifindex = interface_index(name);
            if (ifindex <= 0)
            {
                return true;
            }

            nl_cache *addr_cache = nullptr;
            int err = rtnl_addr_alloc_cache(nl_socket_, &addr_cache);
            if (err < 0)
            {
                logger_->warning("Failed to read addresses", core::LogContext().add("error", nl_geterror(err)));
                return false;
            }

            bool ok = true;
            for (nl_object *obj = nl_cache_get_first(addr_cache); obj; obj = nl_cache_get_next(obj))
            {
                auto *addr = reinterpret_cast<rtnl_addr *>(obj);
                if (rtnl_addr_get_ifindex(addr) != ifindex || rtnl_addr_get_family(addr) != AF_INET)
                {
                    continue;
                }

                err = rtnl_addr_delete(nl_socket_, addr, 0);
                if (err < 0 && err != -NLE_NOADDR && err != -NLE_OBJ_NOTFOUND)
                {
                    logger_->warning("Failed to remove address",
                                     core::LogContext().add("interface", name).add("error", nl_geterror(err)));
                    ok = false;
                }
            }

            nl_cache_free(addr_cache);
            return ok;
        }

    } // namespace infrastructure
} // namespace routnet
