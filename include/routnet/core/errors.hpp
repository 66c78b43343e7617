#ifndef ROUTNET_CORE_ERRORS_HPP
#define ROUTNET_CORE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace routnet
{
    namespace core
    {

        enum class ErrorCode
        {
            // Resolution and capability, raised before any mutation
            NoWirelessInterface,
            NoWanRoute,
            ConcurrencyUnsupported,
            WeakPassphrase,
            ConfigInvalid,

            // Raised after mutations started, the transaction log is drained first
            InterfaceCreateFailed,
            RuleApplyFailed,
            ShapingRebuildFailed,
            DaemonSpawnFailed,
            DaemonDiedEarly,

            // Local to a single shell command
            CommandInvalid,
        };

        const char *error_code_name(ErrorCode code);

        /**
         * Error raised by the hotspot engine, tagged with its failure class
         */
        class HotspotError : public std::runtime_error
        {
        public:
            HotspotError(ErrorCode code, const std::string &message)
                : std::runtime_error(message), code_(code)
            {
            }

            ErrorCode code() const { return code_; }

        private:
            ErrorCode code_;
        };

    } // namespace core
} // namespace routnet

#endif // ROUTNET_CORE_ERRORS_HPP
