#ifndef ROUTNET_SERVICES_COMMAND_SHELL_HPP
#define ROUTNET_SERVICES_COMMAND_SHELL_HPP

#include <memory>
#include <string>
#include <vector>

namespace routnet
{
    namespace core
    {
        class Logger;
    }

    namespace services
    {
        class HotspotController;
        struct ClientInfo;

        struct ShellResponse
        {
            bool ok = true;
            bool quit = false;
            std::string text;
        };

        /**
         * Line-oriented command surface over the controller. Errors are
         * reported in the response and never stop a running hotspot.
         */
        class CommandShell
        {
        public:
            explicit CommandShell(HotspotController &controller);

            ShellResponse execute(const std::string &line);

            static std::string help_text();
            static std::string format_clients(const std::vector<ClientInfo> &clients);

        private:
            ShellResponse dispatch(const std::string &verb, const std::vector<std::string> &args);

            HotspotController &controller_;
            std::shared_ptr<core::Logger> logger_;
        };

    } // namespace services
} // namespace routnet

#endif // ROUTNET_SERVICES_COMMAND_SHELL_HPP
