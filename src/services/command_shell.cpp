#include "routnet/services/command_shell.hpp"
#include "routnet/core/errors.hpp"
#include "routnet/core/logger.hpp"
#include "routnet/core/net_units.hpp"
#include "routnet/services/hotspot_controller.hpp"

#include <iomanip>
#include <sstream>

namespace routnet
{
    namespace services
    {

        namespace
        {
            void require_args(const std::string &verb, const std::vector<std::string> &args, size_t count,
                              const std::string &usage)
            {
                if (args.size() != count)
                {
                    throw core::HotspotError(core::ErrorCode::CommandInvalid, "usage: " + verb + " " + usage);
                }
            }

            std::string changed_text(bool changed, const std::string &done, const std::string &unchanged)
            {
                return changed ? done : unchanged;
            }
        } // namespace

        CommandShell::CommandShell(HotspotController &controller)
            : controller_(controller), logger_(core::get_logger("CommandShell"))
        {
        }

        std::string CommandShell::help_text()
        {
            return "commands:\n"
                   "  start                  start the hotspot\n"
                   "  stop                   stop the hotspot and undo every change\n"
                   "  status                 show hotspot and policy state\n"
                   "  show-clients           list associated clients\n"
                   "  block <mac>            drop all traffic of a device\n"
                   "  unblock <mac>          lift a block\n"
                   "  qos <mac> <rate>       limit a device, e.g. qos AA:BB:CC:DD:EE:FF 5mbit\n"
                   "  priority <mac>         schedule a device ahead of others\n"
                   "  reset                  clear blocks, limits and priorities\n"
                   "  plan                   show what start would do\n"
                   "  help                   this text\n"
                   "  quit                   stop the hotspot and exit\n";
        }

        std::string CommandShell::format_clients(const std::vector<ClientInfo> &clients)
        {
            if (clients.empty())
            {
                return "no clients connected\n";
            }

            std::ostringstream text;
            text << std::left << std::setw(19) << "MAC" << std::setw(16) << "IP" << std::setw(20) << "HOSTNAME"
                 << std::setw(8) << "SIGNAL" << "POLICY\n";
            for (const auto &client : clients)
            {
                std::string policy;
                if (client.blocked)
                {
                    policy = "blocked";
                }
                else
                {
                    policy = client.rate ? core::format_rate(*client.rate) : "default";
                    if (client.priority)
                    {
                        policy += ", priority";
                    }
                }

                text << std::left << std::setw(19) << client.mac
                     << std::setw(16) << (client.ip.empty() ? "-" : client.ip)
                     << std::setw(20) << (client.hostname.empty() ? "-" : client.hostname)
                     << std::setw(8) << (client.signal_dbm ? std::to_string(*client.signal_dbm) : "-")
                     << policy << "\n";
            }
            return text.str();
        }

        ShellResponse CommandShell::execute(const std::string &line)
        {
            std::istringstream words(line);
            std::string verb;
            std::vector<std::string> args;
            words >> verb;
            for (std::string word; words >> word;)
            {
                args.push_back(word);
            }

            if (verb.empty())
            {
                return ShellResponse{};
            }

            try
            {
                return dispatch(verb, args);
            }
            catch (const core::HotspotError &e)
            {
                logger_->warning("Command failed",
                                 core::LogContext()
                                     .add("command", verb)
                                     .add("code", core::error_code_name(e.code()))
                                     .add("error", e.what()));
                ShellResponse response;
                response.ok = false;
                response.text = std::string("error (") + core::error_code_name(e.code()) + "): " + e.what() + "\n";
                return response;
            }
            catch (const std::exception &e)
            {
                logger_->error("Command failed", core::LogContext().add("command", verb).add("error", e.what()));
                ShellResponse response;
                response.ok = false;
                response.text = std::string("error: ") + e.what() + "\n";
                return response;
            }
        }

        ShellResponse CommandShell::dispatch(const std::string &verb, const std::vector<std::string> &args)
        {
            ShellResponse response;

            if (verb == "help")
            {
                response.text = help_text();
            }
            else if (verb == "start")
            {
                require_args(verb, args, 0, "");
                controller_.start();
                response.text = "hotspot running on " + controller_.ap_interface() + "\n";
            }
            else if (verb == "stop")
            {
                require_args(verb, args, 0, "");
                controller_.stop();
                response.text = "hotspot stopped\n";
            }
            else if (verb == "quit" || verb == "exit")
            {
                controller_.stop();
                response.quit = true;
            }
            else if (verb == "status")
            {
                response.text = controller_.status();
            }
            else if (verb == "show-clients")
            {
                response.text = format_clients(controller_.show_clients());
            }
            else if (verb == "block")
            {
                require_args(verb, args, 1, "<mac>");
                response.text = changed_text(controller_.block(args[0]), "blocked\n", "already blocked\n");
            }
            else if (verb == "unblock")
            {
                require_args(verb, args, 1, "<mac>");
                response.text = changed_text(controller_.unblock(args[0]), "unblocked\n", "not blocked\n");
            }
            else if (verb == "qos")
            {
                if (args.size() == 1)
                {
                    throw core::HotspotError(core::ErrorCode::CommandInvalid, "missing rate, e.g. qos " + args[0] + " 5mbit");
                }
                require_args(verb, args, 2, "<mac> <rate>");
                response.text = changed_text(controller_.set_rate(args[0], args[1]), "rate set\n", "rate unchanged\n");
            }
            else if (verb == "priority")
            {
                require_args(verb, args, 1, "<mac>");
                response.text = changed_text(controller_.set_priority(args[0]), "prioritized\n", "already prioritized\n");
            }
            else if (verb == "reset")
            {
                require_args(verb, args, 0, "");
                response.text = changed_text(controller_.reset_policy(), "policy cleared\n", "policy already empty\n");
            }
            else if (verb == "plan")
            {
                response.text = controller_.plan();
            }
            else
            {
                throw core::HotspotError(core::ErrorCode::CommandInvalid, "unknown command '" + verb + "', try help");
            }

            return response;
        }

    } // namespace services
} // namespace routnet
