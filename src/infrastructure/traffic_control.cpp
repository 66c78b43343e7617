#include "routnet/infrastructure/traffic_control.hpp"
#include "routnet/core/command_runner.hpp"
#include "routnet/core/logger.hpp"
#include "routnet/core/net_units.hpp"

#include <cstdio>
#include <stdexcept>

namespace routnet
{
    namespace infrastructure
    {

        namespace
        {
            std::string hex(uint32_t value, int width)
            {
                char buffer[16];
                std::snprintf(buffer, sizeof(buffer), "0x%0*x", width, value);
                return buffer;
            }

            // Splits "AA:BB:CC:DD:EE:FF" into 0xAABBCCDD and 0xEEFF
            void split_mac(const std::string &mac, uint32_t &high, uint32_t &low)
            {
                const auto normalized = core::normalize_mac(mac);
                if (!normalized)
                {
                    throw std::invalid_argument("invalid MAC address: " + mac);
                }

                uint32_t octets[6];
                for (size_t i = 0; i < 6; ++i)
                {
                    octets[i] = static_cast<uint32_t>(std::stoul(normalized->substr(i * 3, 2), nullptr, 16));
                }
                high = (octets[0] << 24) | (octets[1] << 16) | (octets[2] << 8) | octets[3];
                low = (octets[4] << 8) | octets[5];
            }

            // Offsets are relative to the network header, the Ethernet header sits at -14
            TcCommand mac_filter_base(const std::string &dev, MacField field, const std::string &mac, int prio)
            {
                uint32_t high = 0;
                uint32_t low = 0;
                split_mac(mac, high, low);

                TcCommand command = {"filter", "add", "dev", dev, "parent", tc::ROOT_HANDLE,
                                     "protocol", "all", "prio", std::to_string(prio), "u32"};
                if (field == MacField::Destination)
                {
                    command.insert(command.end(), {"match", "u32", hex(high, 8), "0xffffffff", "at", "-14",
                                                   "match", "u16", hex(low, 4), "0xffff", "at", "-10"});
                }
                else
                {
                    command.insert(command.end(), {"match", "u16", hex(low, 4), "0xffff", "at", "-4",
                                                   "match", "u32", hex(high, 8), "0xffffffff", "at", "-8"});
                }
                return command;
            }
        } // namespace

        TcCommandBackend::TcCommandBackend(core::CommandRunner &runner)
            : runner_(runner), logger_(core::get_logger("TrafficControl"))
        {
        }

        void TcCommandBackend::execute(const TcCommand &command)
        {
            std::vector<std::string> args = {"tc"};
            args.insert(args.end(), command.begin(), command.end());

            const auto result = runner_.run(args);
            if (!result.ok())
            {
                throw std::runtime_error("tc " + tc::to_string(command) + " failed: " + result.output);
            }
        }

        bool TcCommandBackend::delete_root_qdisc(const std::string &dev)
        {
            return delete_qdisc(dev, "root");
        }

        bool TcCommandBackend::delete_ingress_qdisc(const std::string &dev)
        {
            return delete_qdisc(dev, "ingress");
        }

        bool TcCommandBackend::delete_qdisc(const std::string &dev, const std::string &which)
        {
            const auto result = runner_.run({"tc", "qdisc", "del", "dev", dev, which});
            if (result.ok())
            {
                return true;
            }

            // Nothing installed, or the device itself is gone
            if (result.output.find("No such file or directory") != std::string::npos ||
                result.output.find("Cannot find device") != std::string::npos ||
                result.output.find("Cannot delete qdisc with handle of zero") != std::string::npos ||
                result.output.find("Invalid handle") != std::string::npos)
            {
                return true;
            }

            logger_->warning("Failed to delete qdisc",
                             core::LogContext().add("device", dev).add("qdisc", which).add("output", result.output));
            return false;
        }

        namespace tc
        {
            std::string class_id(uint32_t minor)
            {
                char buffer[16];
                std::snprintf(buffer, sizeof(buffer), "1:%x", minor);
                return buffer;
            }

            TcCommand htb_root_qdisc(const std::string &dev, uint32_t default_minor)
            {
                char minor[16];
                std::snprintf(minor, sizeof(minor), "%x", default_minor);
                return {"qdisc", "add", "dev", dev, "root", "handle", ROOT_HANDLE, "htb", "default", minor};
            }

            TcCommand htb_class(const std::string &dev,
                                const std::string &parent,
                                const std::string &classid,
                                uint64_t rate_bps,
                                uint64_t ceil_bps,
                                int prio)
            {
                return {"class", "add", "dev", dev, "parent", parent, "classid", classid, "htb",
                        "rate", core::format_rate(rate_bps),
                        "ceil", core::format_rate(ceil_bps),
                        "prio", std::to_string(prio)};
            }

            TcCommand ingress_qdisc(const std::string &dev)
            {
                return {"qdisc", "add", "dev", dev, "handle", INGRESS_HANDLE, "ingress"};
            }

            TcCommand ingress_redirect(const std::string &dev, const std::string &target)
            {
                return {"filter", "add", "dev", dev, "parent", INGRESS_HANDLE, "protocol", "all",
                        "u32", "match", "u32", "0", "0",
                        "action", "mirred", "egress", "redirect", "dev", target};
            }

            TcCommand mac_classify_filter(const std::string &dev, MacField field,
                                          const std::string &mac, const std::string &classid)
            {
                TcCommand command = mac_filter_base(dev, field, mac, CLASSIFY_FILTER_PRIO);
                command.insert(command.end(), {"flowid", classid});
                return command;
            }

            TcCommand mac_drop_filter(const std::string &dev, MacField field, const std::string &mac)
            {
                TcCommand command = mac_filter_base(dev, field, mac, BLOCK_FILTER_PRIO);
                command.insert(command.end(), {"action", "drop"});
                return command;
            }

            std::string to_string(const TcCommand &command)
            {
                std::string text;
                for (const auto &arg : command)
                {
                    if (!text.empty())
                    {
                        text += " ";
                    }
                    text += arg;
                }
                return text;
            }
        } // namespace tc

    } // namespace infrastructure
} // namespace routnet
