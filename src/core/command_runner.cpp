#include "routnet/core/command_runner.hpp"
#include "routnet/core/logger.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <sstream>
#include <sys/wait.h>
#include <unistd.h>

namespace routnet
{
    namespace core
    {

        SystemCommandRunner::SystemCommandRunner()
            : logger_(get_logger("CommandRunner"))
        {
        }

        CommandResult SystemCommandRunner::run(const std::vector<std::string> &args)
        {
            CommandResult result;
            if (args.empty())
            {
                return result;
            }

            logger_->debug("Running command", LogContext().add_args("args", args));

            int pipe_fds[2];
            if (pipe2(pipe_fds, O_CLOEXEC) != 0)
            {
                result.output = std::string("pipe failed: ") + std::strerror(errno);
                logger_->error("Failed to create output pipe", LogContext().add("error", result.output));
                return result;
            }

            pid_t pid = fork();
            if (pid < 0)
            {
                result.output = std::string("fork failed: ") + std::strerror(errno);
                close(pipe_fds[0]);
                close(pipe_fds[1]);
                logger_->error("Failed to fork command", LogContext().add("error", result.output));
                return result;
            }

            if (pid == 0)
            {
                // Child process
                dup2(pipe_fds[1], STDOUT_FILENO);
                dup2(pipe_fds[1], STDERR_FILENO);
                int devnull = open("/dev/null", O_RDONLY);
                if (devnull >= 0)
                {
                    dup2(devnull, STDIN_FILENO);
                }

                std::vector<char *> argv;
                argv.reserve(args.size() + 1);
                for (const auto &arg : args)
                {
                    argv.push_back(const_cast<char *>(arg.c_str()));
                }
                argv.push_back(nullptr);

                // C locale keeps tool output parseable
                setenv("LC_ALL", "C", 1);
                execvp(argv[0], argv.data());
                _exit(127);
            }

            close(pipe_fds[1]);

            char buffer[512];
            for (;;)
            {
                ssize_t n = read(pipe_fds[0], buffer, sizeof(buffer));
                if (n > 0)
                {
                    result.output.append(buffer, static_cast<size_t>(n));
                }
                else if (n < 0 && errno == EINTR)
                {
                    continue;
                }
                else
                {
                    break;
                }
            }
            close(pipe_fds[0]);

            int status = 0;
            while (waitpid(pid, &status, 0) < 0)
            {
                if (errno != EINTR)
                {
                    result.output += std::string("waitpid failed: ") + std::strerror(errno);
                    return result;
                }
            }

            if (WIFEXITED(status))
            {
                result.exit_code = WEXITSTATUS(status);
            }
            else if (WIFSIGNALED(status))
            {
                result.exit_code = 128 + WTERMSIG(status);
            }

            if (!result.ok())
            {
                logger_->debug("Command failed",
                               LogContext()
                                   .add("program", args[0])
                                   .add("exit_code", result.exit_code));
            }
            return result;
        }

        bool SystemCommandRunner::has_tool(const std::string &program) const
        {
            if (program.find('/') != std::string::npos)
            {
                return access(program.c_str(), X_OK) == 0;
            }

            const char *path_env = std::getenv("PATH");
            std::string path = path_env ? path_env : "/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin";

            std::istringstream stream(path);
            std::string dir;
            while (std::getline(stream, dir, ':'))
            {
                if (dir.empty())
                {
                    continue;
                }
                const std::string candidate = dir + "/" + program;
                if (access(candidate.c_str(), X_OK) == 0)
                {
                    return true;
                }
            }
            return false;
        }

    } // namespace core
} // namespace routnet
