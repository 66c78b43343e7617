#include "routnet/infrastructure/process_launcher.hpp"
#include "routnet/core/command_runner.hpp"
#include "routnet/core/logger.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <deque>
#include <fcntl.h>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace routnet
{
    namespace infrastructure
    {

        ChildProcessLauncher::ChildProcessLauncher(core::CommandRunner &runner,
                                                   std::chrono::milliseconds terminate_timeout)
            : runner_(runner), logger_(core::get_logger("ProcessLauncher")), terminate_timeout_(terminate_timeout)
        {
        }

        pid_t ChildProcessLauncher::launch(const std::vector<std::string> &argv, const std::string &log_file)
        {
            if (argv.empty())
            {
                throw std::runtime_error("empty command line");
            }

            int log_fd = open(log_file.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0640);
            if (log_fd < 0)
            {
                throw std::runtime_error("cannot open " + log_file + ": " + std::strerror(errno));
            }

            // The child writes its exec errno here; a clean exec closes it
            int error_pipe[2];
            if (pipe2(error_pipe, O_CLOEXEC) != 0)
            {
                const std::string error = std::strerror(errno);
                close(log_fd);
                throw std::runtime_error("pipe failed: " + error);
            }

            logger_->debug("Launching process", core::LogContext().add_args("args", argv).add("log", log_file));

            pid_t pid = fork();
            if (pid < 0)
            {
                const std::string error = std::strerror(errno);
                close(log_fd);
                close(error_pipe[0]);
                close(error_pipe[1]);
                throw std::runtime_error("fork failed: " + error);
            }

            if (pid == 0)
            {
                // Child process; keep terminal signals away, shutdown is ours to drive
                setpgid(0, 0);
                dup2(log_fd, STDOUT_FILENO);
                dup2(log_fd, STDERR_FILENO);
                int devnull = open("/dev/null", O_RDONLY);
                if (devnull >= 0)
                {
                    dup2(devnull, STDIN_FILENO);
                }

                std::vector<char *> args;
                args.reserve(argv.size() + 1);
                for (const auto &arg : argv)
                {
                    args.push_back(const_cast<char *>(arg.c_str()));
                }
                args.push_back(nullptr);

                execvp(args[0], args.data());
                int exec_errno = errno;
                ssize_t ignored = write(error_pipe[1], &exec_errno, sizeof(exec_errno));
                (void)ignored;
                _exit(127);
            }

            close(log_fd);
            close(error_pipe[1]);

            int exec_errno = 0;
            ssize_t n;
            do
            {
                n = read(error_pipe[0], &exec_errno, sizeof(exec_errno));
            } while (n < 0 && errno == EINTR);
            close(error_pipe[0]);

            if (n == static_cast<ssize_t>(sizeof(exec_errno)))
            {
                int status = 0;
                waitpid(pid, &status, 0);
                throw std::runtime_error("cannot execute " + argv[0] + ": " + std::strerror(exec_errno));
            }

            logger_->info("Process started", core::LogContext().add("program", argv[0]).add("pid", pid));
            return pid;
        }

        bool ChildProcessLauncher::is_alive(pid_t pid)
        {
            if (pid <= 0)
            {
                return false;
            }

            int status = 0;
            pid_t result = waitpid(pid, &status, WNOHANG);
            if (result == 0)
            {
                return true;
            }
            if (result == pid)
            {
                logger_->debug("Child exited",
                               core::LogContext()
                                   .add("pid", pid)
                                   .add("status", WIFEXITED(status) ? WEXITSTATUS(status) : -WTERMSIG(status)));
            }
            return false;
        }

        bool ChildProcessLauncher::wait_for_exit(pid_t pid, std::chrono::milliseconds timeout)
        {
            const auto deadline = std::chrono::steady_clock::now() + timeout;
            while (std::chrono::steady_clock::now() < deadline)
            {
                int status = 0;
                pid_t result = waitpid(pid, &status, WNOHANG);
                if (result == pid || (result < 0 && errno == ECHILD))
                {
                    return true;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
            return false;
        }

        bool ChildProcessLauncher::terminate(pid_t pid)
        {
            if (pid <= 0)
            {
                return true;
            }

            if (kill(pid, SIGTERM) != 0)
            {
                if (errno == ESRCH)
                {
                    // Already gone; reap it if it was ours
                    int status = 0;
                    waitpid(pid, &status, WNOHANG);
                    return true;
                }
                logger_->warning("Failed to send SIGTERM", core::LogContext().add("pid", pid).add("error", std::strerror(errno)));
                return false;
            }

            if (wait_for_exit(pid, terminate_timeout_))
            {
                logger_->debug("Process stopped", core::LogContext().add("pid", pid));
                return true;
            }

            logger_->warning("Process ignored SIGTERM, killing", core::LogContext().add("pid", pid));
            kill(pid, SIGKILL);
            int status = 0;
            waitpid(pid, &status, 0);
            return true;
        }

        int ChildProcessLauncher::kill_matching(const std::string &pattern)
        {
            const auto result = runner_.run({"pgrep", "-f", pattern});
            if (!result.ok())
            {
                return 0;
            }

            int killed = 0;
            std::istringstream stream(result.output);
            std::string pid_str;
            while (std::getline(stream, pid_str))
            {
                pid_t pid = 0;
                try
                {
                    pid = static_cast<pid_t>(std::stoi(pid_str));
                }
                catch (const std::exception &)
                {
                    continue;
                }
                if (pid <= 0 || pid == getpid())
                {
                    continue;
                }

                logger_->info("Stopping stale process", core::LogContext().add("pid", pid).add("pattern", pattern));
                if (kill(pid, SIGTERM) == 0)
                {
                    ++killed;
                }
            }

            if (killed > 0)
            {
                // Give processes time to terminate
                wait(std::chrono::milliseconds(500));
            }
            return killed;
        }

        void ChildProcessLauncher::wait(std::chrono::milliseconds duration)
        {
            std::this_thread::sleep_for(duration);
        }

        std::string read_log_tail(const std::string &path, size_t max_lines)
        {
            std::ifstream file(path);
            if (!file.is_open())
            {
                return "";
            }

            std::deque<std::string> lines;
            std::string line;
            while (std::getline(file, line))
            {
                lines.push_back(line);
                if (lines.size() > max_lines)
                {
                    lines.pop_front();
                }
            }

            std::string tail;
            for (const auto &entry : lines)
            {
                if (!tail.empty())
                {
                    tail += "\n";
                }
                tail += entry;
            }
            return tail;
        }

    } // namespace infrastructure
} // namespace routnet
