#ifndef ROUTNET_INFRASTRUCTURE_PROCESS_LAUNCHER_HPP
#define ROUTNET_INFRASTRUCTURE_PROCESS_LAUNCHER_HPP

#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <sys/types.h>

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

        /**
         * Supervised child processes (hostapd, dnsmasq)
         */
        class ProcessLauncher
        {
        public:
            virtual ~ProcessLauncher() = default;

            // Starts argv with stdout and stderr appended to log_file.
            // Throws std::runtime_error when the program cannot be executed.
            virtual pid_t launch(const std::vector<std::string> &argv, const std::string &log_file) = 0;

            // Reaps the child if it exited
            virtual bool is_alive(pid_t pid) = 0;

            // SIGTERM, then SIGKILL after the timeout; true once the child is gone
            virtual bool terminate(pid_t pid) = 0;

            // Sends SIGTERM to processes whose command line matches pattern (pgrep -f)
            virtual int kill_matching(const std::string &pattern) = 0;

            virtual void wait(std::chrono::milliseconds duration) = 0;
        };

        /**
         * fork/execvp implementation
         */
        class ChildProcessLauncher : public ProcessLauncher
        {
        public:
            explicit ChildProcessLauncher(core::CommandRunner &runner,
                                          std::chrono::milliseconds terminate_timeout = std::chrono::milliseconds(3000));

            pid_t launch(const std::vector<std::string> &argv, const std::string &log_file) override;
            bool is_alive(pid_t pid) override;
            bool terminate(pid_t pid) override;
            int kill_matching(const std::string &pattern) override;
            void wait(std::chrono::milliseconds duration) override;

        private:
            bool wait_for_exit(pid_t pid, std::chrono::milliseconds timeout);

            core::CommandRunner &runner_;
            std::shared_ptr<core::Logger> logger_;
            std::chrono::milliseconds terminate_timeout_;
        };

        // Last max_lines lines of a daemon log, empty when unreadable
        std::string read_log_tail(const std::string &path, size_t max_lines);

    } // namespace infrastructure
} // namespace routnet

#endif // ROUTNET_INFRASTRUCTURE_PROCESS_LAUNCHER_HPP
