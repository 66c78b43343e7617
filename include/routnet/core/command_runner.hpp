#ifndef ROUTNET_CORE_COMMAND_RUNNER_HPP
#define ROUTNET_CORE_COMMAND_RUNNER_HPP

#include <memory>
#include <string>
#include <vector>

namespace routnet
{
    namespace core
    {
        class Logger;

        struct CommandResult
        {
            int exit_code = -1;
            std::string output; // stdout and stderr, interleaved

            bool ok() const { return exit_code == 0; }
        };

        /**
         * Runs external tools (iw, ip, nft, iptables, tc, nmcli, pgrep) and
         * waits for them. Every adapter that shells out goes through this
         * seam so tests can script the tool output.
         */
        class CommandRunner
        {
        public:
            virtual ~CommandRunner() = default;

            // args[0] is the program, looked up in PATH
            virtual CommandResult run(const std::vector<std::string> &args) = 0;

            virtual bool has_tool(const std::string &program) const = 0;
        };

        /**
         * fork/execvp implementation with captured output
         */
        class SystemCommandRunner : public CommandRunner
        {
        public:
            SystemCommandRunner();

            CommandResult run(const std::vector<std::string> &args) override;
            bool has_tool(const std::string &program) const override;

        private:
            std::shared_ptr<Logger> logger_;
        };

    } // namespace core
} // namespace routnet

#endif // ROUTNET_CORE_COMMAND_RUNNER_HPP
