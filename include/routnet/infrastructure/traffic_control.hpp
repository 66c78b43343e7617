#ifndef ROUTNET_INFRASTRUCTURE_TRAFFIC_CONTROL_HPP
#define ROUTNET_INFRASTRUCTURE_TRAFFIC_CONTROL_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace routnet
{
    namespace core
    {
        class CommandRunner;
        class Logger;
    }
}

namespace routnet
{
    namespace infrastructure
    {

        // One tc invocation, without the leading "tc"
        using TcCommand = std::vector<std::string>;

        /**
         * Kernel traffic control. execute() throws std::runtime_error when
         * the kernel rejects an operation; qdisc removal tolerates absence.
         */
        class TrafficControl
        {
        public:
            virtual ~TrafficControl() = default;

            virtual void execute(const TcCommand &command) = 0;

            // Removes the root qdisc of dev; true when it is gone afterwards
            virtual bool delete_root_qdisc(const std::string &dev) = 0;
            virtual bool delete_ingress_qdisc(const std::string &dev) = 0;
        };

        /**
         * TrafficControl backed by the tc tool
         */
        class TcCommandBackend : public TrafficControl
        {
        public:
            explicit TcCommandBackend(core::CommandRunner &runner);

            void execute(const TcCommand &command) override;
            bool delete_root_qdisc(const std::string &dev) override;
            bool delete_ingress_qdisc(const std::string &dev) override;

        private:
            bool delete_qdisc(const std::string &dev, const std::string &which);

            core::CommandRunner &runner_;
            std::shared_ptr<core::Logger> logger_;
        };

        // Where a MAC filter looks in the Ethernet header
        enum class MacField
        {
            Destination,
            Source,
        };

        namespace tc
        {
            // HTB handle major used on every shaped device
            constexpr const char *ROOT_HANDLE = "1:";
            constexpr const char *INGRESS_HANDLE = "ffff:";

            constexpr int BLOCK_FILTER_PRIO = 1;
            constexpr int CLASSIFY_FILTER_PRIO = 10;

            TcCommand htb_root_qdisc(const std::string &dev, uint32_t default_minor);
            TcCommand htb_class(const std::string &dev,
                                const std::string &parent,
                                const std::string &classid,
                                uint64_t rate_bps,
                                uint64_t ceil_bps,
                                int prio);
            TcCommand ingress_qdisc(const std::string &dev);
            TcCommand ingress_redirect(const std::string &dev, const std::string &target);

            // u32 filter on the root qdisc matching one MAC; sends to classid
            TcCommand mac_classify_filter(const std::string &dev, MacField field,
                                          const std::string &mac, const std::string &classid);
            // Same match, dropping the packet
            TcCommand mac_drop_filter(const std::string &dev, MacField field, const std::string &mac);

            // "1:10" style class id; minor in hex the way tc reads it
            std::string class_id(uint32_t minor);

            std::string to_string(const TcCommand &command);
        } // namespace tc

    } // namespace infrastructure
} // namespace routnet

#endif // ROUTNET_INFRASTRUCTURE_TRAFFIC_CONTROL_HPP
