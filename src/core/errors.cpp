#include "routnet/core/errors.hpp"

namespace routnet
{
    namespace core
    {

        const char *error_code_name(ErrorCode code)
        {
            switch (code)
            {
            case ErrorCode::NoWirelessInterface:
                return "NoWirelessInterface";
            case ErrorCode::NoWanRoute:
                return "NoWanRoute";
            case ErrorCode::ConcurrencyUnsupported:
                return "ConcurrencyUnsupported";
            case ErrorCode::WeakPassphrase:
                return "WeakPassphrase";
            case ErrorCode::ConfigInvalid:
                return "ConfigInvalid";
            case ErrorCode::InterfaceCreateFailed:
                return "InterfaceCreateFailed";
            case ErrorCode::RuleApplyFailed:
                return "RuleApplyFailed";
            case ErrorCode::ShapingRebuildFailed:
                return "ShapingRebuildFailed";
            case ErrorCode::DaemonSpawnFailed:
                return "DaemonSpawnFailed";
            case ErrorCode::DaemonDiedEarly:
                return "DaemonDiedEarly";
            case ErrorCode::CommandInvalid:
                return "CommandInvalid";
            }
            return "Unknown";
        }

    } // namespace core
} // namespace routnet
