/**
 * routnet
 * Main entry point: turns one wireless adapter into a client plus hotspot
 */

#include <iostream>
#include <csignal>
#include <unistd.h>
#include <poll.h>
#include <memory>
#include <string>
#include <thread>
#include <chrono>

#include "routnet/core/command_runner.hpp"
#include "routnet/core/config.hpp"
#include "routnet/core/errors.hpp"
#include "routnet/core/logger.hpp"
#include "routnet/infrastructure/firewall.hpp"
#include "routnet/infrastructure/netlink_manager.hpp"
#include "routnet/infrastructure/network_manager.hpp"
#include "routnet/infrastructure/process_launcher.hpp"
#include "routnet/infrastructure/sysctl.hpp"
#include "routnet/infrastructure/traffic_control.hpp"
#include "routnet/infrastructure/wireless.hpp"
#include "routnet/services/command_shell.hpp"
#include "routnet/services/hotspot_controller.hpp"
#include "routnet/services/policy_store.hpp"

// Command line argument parsing
#include <getopt.h>

namespace routnet {

/**
 * Set by the signal handler, observed by the command loop
 */
volatile sig_atomic_t g_stop_requested = 0;

void signal_handler(int) {
    g_stop_requested = 1;
}

/**
 * Setup signal handlers; no SA_RESTART so a blocked poll() wakes up
 */
void setup_signal_handlers() {
    struct sigaction action {};
    action.sa_handler = signal_handler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
    sigaction(SIGQUIT, &action, nullptr);
    sigaction(SIGHUP, &action, nullptr);
}

/**
 * Check if running with required privileges
 */
bool check_root_privileges() {
    if (geteuid() != 0) {
        std::cerr << "ERROR: routnet must be run as root to create interfaces and firewall rules." << std::endl;
        std::cerr << "Please run with: sudo routnet (or use --dry-run)" << std::endl;
        return false;
    }
    return true;
}

/**
 * Print usage information
 */
void print_usage(const char* program_name) {
    std::cout << "routnet - share a Wi-Fi connection through a hotspot on the same adapter\n\n";
    std::cout << "Usage: " << program_name << " [OPTIONS]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -c, --config FILE        Configuration file path (default: /etc/routnet/routnet.json)\n";
    std::cout << "  -a, --ap NAME            Preferred virtual AP interface name (default: ap0)\n";
    std::cout << "  -s, --sta IFACE          Wi-Fi client interface (default: auto-detect)\n";
    std::cout << "  -w, --wan IFACE          Upstream interface (default: route to 1.1.1.1)\n";
    std::cout << "  -S, --ssid SSID          Hotspot SSID (default: ROUTNET)\n";
    std::cout << "  -P, --passphrase PASS    WPA2 passphrase, 8-63 characters; empty for an open network\n";
    std::cout << "      --driver NAME        hostapd driver (default: nl80211)\n";
    std::cout << "      --channel N          Wi-Fi channel (default: 6)\n";
    std::cout << "      --no-delegate        Never use NetworkManager, always run hostapd + dnsmasq\n";
    std::cout << "      --dry-run            Print what would be done and exit\n";
    std::cout << "      --no-shell           Run without the interactive command shell\n";
    std::cout << "  -v, --verbose            Increase verbosity (-v for INFO, -vv for DEBUG)\n";
    std::cout << "  -l, --log-file FILE      Log to file instead of console\n";
    std::cout << "  -h, --help               Show this help message\n";
    std::cout << "      --version            Show version information\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " -S cafe -P 'correct horse'   # WPA2 hotspot\n";
    std::cout << "  " << program_name << " -s wlan0 -w wlan0 --dry-run   # Show the plan only\n";
    std::cout << "  " << program_name << " -vv --no-delegate             # Debug logging, hostapd path\n";
    std::cout << std::endl;
}

/**
 * Print version information
 */
void print_version() {
    std::cout << "routnet v0.1.0" << std::endl;
    std::cout << "Built for Linux (nl80211, netlink, nftables/iptables, tc)" << std::endl;
}

/**
 * Parsed command line
 */
struct Arguments {
    std::string config_file = "/etc/routnet/routnet.json";
    std::string ap;
    std::string sta;
    std::string wan;
    std::string ssid;
    std::string passphrase;
    bool passphrase_set = false;
    std::string driver;
    int channel = 0;
    bool no_delegate = false;
    bool dry_run = false;
    bool no_shell = false;
    int verbosity = 0;
    std::string log_file;
    bool help = false;
    bool version = false;
};

enum LongOnlyOption {
    OPT_DRIVER = 1000,
    OPT_CHANNEL,
    OPT_NO_DELEGATE,
    OPT_DRY_RUN,
    OPT_NO_SHELL,
    OPT_VERSION,
};

Arguments parse_arguments(int argc, char* argv[]) {
    Arguments args;

    static struct option long_options[] = {
        {"config",      required_argument, 0, 'c'},
        {"ap",          required_argument, 0, 'a'},
        {"sta",         required_argument, 0, 's'},
        {"wan",         required_argument, 0, 'w'},
        {"ssid",        required_argument, 0, 'S'},
        {"passphrase",  required_argument, 0, 'P'},
        {"driver",      required_argument, 0, OPT_DRIVER},
        {"channel",     required_argument, 0, OPT_CHANNEL},
        {"no-delegate", no_argument,       0, OPT_NO_DELEGATE},
        {"dry-run",     no_argument,       0, OPT_DRY_RUN},
        {"no-shell",    no_argument,       0, OPT_NO_SHELL},
        {"verbose",     no_argument,       0, 'v'},
        {"log-file",    required_argument, 0, 'l'},
        {"help",        no_argument,       0, 'h'},
        {"version",     no_argument,       0, OPT_VERSION},
        {0, 0, 0, 0}
    };

    int c;
    int option_index = 0;

    while ((c = getopt_long(argc, argv, "c:a:s:w:S:P:vl:h", long_options, &option_index)) != -1) {
        switch (c) {
            case 'c':
                args.config_file = optarg;
                break;
            case 'a':
                args.ap = optarg;
                break;
            case 's':
                args.sta = optarg;
                break;
            case 'w':
                args.wan = optarg;
                break;
            case 'S':
                args.ssid = optarg;
                break;
            case 'P':
                args.passphrase = optarg;
                args.passphrase_set = true;
                break;
            case OPT_DRIVER:
                args.driver = optarg;
                break;
            case OPT_CHANNEL:
                try {
                    args.channel = std::stoi(optarg);
                } catch (const std::exception&) {
                    std::cerr << "Invalid channel: " << optarg << std::endl;
                    exit(1);
                }
                break;
            case OPT_NO_DELEGATE:
                args.no_delegate = true;
                break;
            case OPT_DRY_RUN:
                args.dry_run = true;
                break;
            case OPT_NO_SHELL:
                args.no_shell = true;
                break;
            case 'v':
                args.verbosity++;
                break;
            case 'l':
                args.log_file = optarg;
                break;
            case 'h':
                args.help = true;
                break;
            case OPT_VERSION:
                args.version = true;
                break;
            case '?':
                // getopt_long already printed an error message
                exit(1);
                break;
            default:
                std::cerr << "Unknown option: " << c << std::endl;
                exit(1);
        }
    }

    return args;
}

void apply_overrides(const Arguments& args, core::HotspotConfig& config) {
    if (!args.ap.empty()) {
        config.interfaces.ap = args.ap;
    }
    if (!args.sta.empty()) {
        config.interfaces.sta = args.sta;
    }
    if (!args.wan.empty()) {
        config.interfaces.wan = args.wan;
    }
    if (!args.ssid.empty()) {
        config.access_point.ssid = args.ssid;
    }
    if (args.passphrase_set) {
        config.access_point.passphrase = args.passphrase;
    }
    if (!args.driver.empty()) {
        config.access_point.driver = args.driver;
    }
    if (args.channel > 0) {
        config.access_point.channel = args.channel;
    }
    if (args.no_delegate) {
        config.backend.prefer_delegate = false;
    }
    if (!args.log_file.empty()) {
        config.logging.log_file = args.log_file;
    }
}

/**
 * Reads shell commands until quit, EOF or a termination signal
 */
int run_shell(services::HotspotController& controller, bool interactive) {
    auto logger = core::get_logger("main");
    services::CommandShell shell(controller);

    if (interactive) {
        std::cout << "Type 'help' for commands." << std::endl;
        std::cout << "routnet> " << std::flush;
    }

    std::string line;
    while (!g_stop_requested) {
        if (!controller.check_health()) {
            std::cout << "\nA hotspot daemon died, stopping the hotspot." << std::endl;
            controller.stop();
            if (!interactive) {
                return 1;
            }
        }

        if (!interactive) {
            std::this_thread::sleep_for(std::chrono::milliseconds(500));
            continue;
        }

        pollfd pfd{STDIN_FILENO, POLLIN, 0};
        int ready = poll(&pfd, 1, 1000);
        if (ready <= 0) {
            continue;
        }

        if (!std::getline(std::cin, line)) {
            // EOF behaves like quit
            break;
        }

        auto response = shell.execute(line);
        if (!response.text.empty()) {
            std::cout << response.text;
        }
        if (response.quit) {
            break;
        }
        std::cout << "routnet> " << std::flush;
    }

    if (g_stop_requested) {
        logger->info("Termination requested");
    }
    controller.stop();
    return 0;
}

} // namespace routnet

/**
 * Main entry point
 */
int main(int argc, char* argv[]) {
    using namespace routnet;

    try {
        // Parse command line arguments
        auto args = parse_arguments(argc, argv);

        if (args.help) {
            print_usage(argv[0]);
            return 0;
        }

        if (args.version) {
            print_version();
            return 0;
        }

        // Setup logging
        core::LogLevel log_level = core::LogLevel::WARNING;
        if (args.verbosity == 1) {
            log_level = core::LogLevel::INFO;
        } else if (args.verbosity >= 2) {
            log_level = core::LogLevel::DEBUG;
        }

        core::setup_logging(log_level, args.log_file, args.log_file.empty());
        auto logger = core::get_logger("main");

        // Load configuration; a missing file means defaults
        std::unique_ptr<core::HotspotConfig> config;
        try {
            config = core::HotspotConfig::from_file_or_default(args.config_file);
        } catch (const std::exception& e) {
            logger->error("Failed to load configuration",
                         core::LogContext().add("config_file", args.config_file)
                                          .add("error", e.what()));
            return 1;
        }

        apply_overrides(args, *config);

        // Without -v the configured level applies
        if (args.verbosity == 0) {
            core::setup_logging(core::LoggerManager::string_to_level(config->logging.log_level),
                                config->logging.log_file, config->logging.log_file.empty());
        } else if (!config->logging.log_file.empty()) {
            core::setup_logging(log_level, config->logging.log_file, false);
        }

        // Validate configuration
        const std::string problem = config->validate();
        if (!problem.empty()) {
            logger->error("Configuration validation failed", core::LogContext().add("error", problem));
            std::cerr << "Invalid configuration: " << problem << std::endl;
            return 1;
        }

        if (!args.dry_run && !check_root_privileges()) {
            return 1;
        }

        setup_signal_handlers();

        // Production capabilities
        core::SystemCommandRunner runner;
        infrastructure::NetlinkManager links;
        infrastructure::IwWirelessControl wireless(runner);
        infrastructure::NmcliDelegate network_manager(runner);
        auto firewall = infrastructure::select_firewall_backend(runner, config->backend.firewall);
        infrastructure::TcCommandBackend traffic_control(runner);
        infrastructure::ProcSysctl sysctl;
        infrastructure::ChildProcessLauncher launcher(runner);

        services::HotspotDependencies deps{
            runner,
            links,
            wireless,
            config->backend.prefer_delegate ? &network_manager : nullptr,
            firewall.get(),
            traffic_control,
            sysctl,
            launcher};

        services::PolicyStore policy(config->resolved_policy_dir());
        policy.load();

        services::HotspotController controller(*config, deps, policy);

        if (args.dry_run) {
            try {
                std::cout << controller.plan();
            } catch (const core::HotspotError& e) {
                std::cerr << "error (" << core::error_code_name(e.code()) << "): " << e.what() << std::endl;
                return 1;
            }
            return 0;
        }

        logger->info("Starting routnet...",
                     core::LogContext().add("config_file", args.config_file)
                                      .add("policy_dir", policy.directory()));

        try {
            controller.start();
        } catch (const core::HotspotError& e) {
            logger->error("Failed to start hotspot",
                         core::LogContext().add("code", core::error_code_name(e.code()))
                                          .add("error", e.what()));
            std::cerr << "error (" << core::error_code_name(e.code()) << "): " << e.what() << std::endl;
            return 1;
        }

        std::cout << "Hotspot '" << config->access_point.ssid << "' running on "
                  << controller.ap_interface() << "." << std::endl;

        const bool interactive = !args.no_shell && isatty(STDIN_FILENO);
        if (!interactive) {
            std::cout << "Press Ctrl+C to stop." << std::endl;
        }
        int rc = run_shell(controller, interactive);

        logger->info("routnet stopped");
        return rc;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
