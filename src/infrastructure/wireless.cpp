#include "routnet/infrastructure/wireless.hpp"
#include "routnet/core/command_runner.hpp"
#include "routnet/core/logger.hpp"

#include <regex>
#include <sstream>
#include <stdexcept>

namespace routnet
{
    namespace infrastructure
    {

        namespace
        {
            std::string trim(const std::string &text)
            {
                const auto begin = text.find_first_not_of(" \t\r\n");
                if (begin == std::string::npos)
                {
                    return "";
                }
                const auto end = text.find_last_not_of(" \t\r\n");
                return text.substr(begin, end - begin + 1);
            }

            size_t leading_tabs(const std::string &line)
            {
                size_t count = 0;
                while (count < line.size() && line[count] == '\t')
                {
                    ++count;
                }
                return count;
            }

            InterfaceCombination modes_of_entry(const std::string &entry)
            {
                static const std::regex group_regex(R"(#\{([^}]*)\})");

                InterfaceCombination modes;
                for (auto it = std::sregex_iterator(entry.begin(), entry.end(), group_regex);
                     it != std::sregex_iterator(); ++it)
                {
                    std::istringstream group((*it)[1].str());
                    std::string mode;
                    while (std::getline(group, mode, ','))
                    {
                        mode = trim(mode);
                        if (!mode.empty())
                        {
                            modes.insert(mode);
                        }
                    }
                }
                return modes;
            }
        } // namespace

        std::vector<std::string> parse_iw_dev_interfaces(const std::string &output)
        {
            std::vector<std::string> interfaces;
            std::istringstream stream(output);
            std::string line;
            while (std::getline(stream, line))
            {
                std::istringstream words(line);
                std::string keyword;
                std::string name;
                if (words >> keyword >> name && keyword == "Interface")
                {
                    interfaces.push_back(name);
                }
            }
            return interfaces;
        }

        std::optional<std::string> parse_iw_wiphy(const std::string &output)
        {
            std::istringstream stream(output);
            std::string line;
            while (std::getline(stream, line))
            {
                std::istringstream words(line);
                std::string keyword;
                std::string index;
                if (words >> keyword >> index && keyword == "wiphy")
                {
                    return "phy" + index;
                }
            }
            return std::nullopt;
        }

        std::vector<InterfaceCombination> parse_interface_combinations(const std::string &output)
        {
            std::vector<InterfaceCombination> combinations;
            std::vector<std::string> entries;

            std::istringstream stream(output);
            std::string line;
            bool in_section = false;
            size_t section_indent = 0;

            while (std::getline(stream, line))
            {
                const std::string text = trim(line);

                if (!in_section)
                {
                    if (text == "valid interface combinations:")
                    {
                        in_section = true;
                        section_indent = leading_tabs(line);
                    }
                    continue;
                }

                if (text.empty())
                {
                    continue;
                }

                if (leading_tabs(line) <= section_indent)
                {
                    break;
                }

                if (text.rfind("* ", 0) == 0)
                {
                    entries.push_back(text.substr(2));
                }
                else if (!entries.empty())
                {
                    // Wrapped continuation of the previous entry
                    entries.back() += " " + text;
                }
            }

            for (const auto &entry : entries)
            {
                combinations.push_back(modes_of_entry(entry));
            }
            return combinations;
        }

        std::vector<StationInfo> parse_station_dump(const std::string &output)
        {
            static const std::regex station_regex(R"(^Station\s+([0-9A-Fa-f:]{17}))");
            static const std::regex counter_regex(R"(^\s*(rx|tx) bytes:\s*(\d+))");
            static const std::regex signal_regex(R"(^\s*signal:\s*(-?\d+))");

            std::vector<StationInfo> stations;
            std::istringstream stream(output);
            std::string line;
            while (std::getline(stream, line))
            {
                std::smatch match;
                if (std::regex_search(line, match, station_regex))
                {
                    StationInfo station;
                    station.mac = match[1].str();
                    stations.push_back(station);
                    continue;
                }
                if (stations.empty())
                {
                    continue;
                }
                if (std::regex_search(line, match, counter_regex))
                {
                    const uint64_t value = std::stoull(match[2].str());
                    if (match[1].str() == "rx")
                    {
                        stations.back().rx_bytes = value;
                    }
                    else
                    {
                        stations.back().tx_bytes = value;
                    }
                }
                else if (std::regex_search(line, match, signal_regex))
                {
                    stations.back().signal_dbm = std::stoi(match[1].str());
                }
            }
            return stations;
        }

        bool supports_sta_ap_concurrency(const std::vector<InterfaceCombination> &combinations)
        {
            for (const auto &combination : combinations)
            {
                if (combination.count("managed") && combination.count("AP"))
                {
                    return true;
                }
            }
            return false;
        }

        // IwWirelessControl implementation
        IwWirelessControl::IwWirelessControl(core::CommandRunner &runner)
            : runner_(runner), logger_(core::get_logger("IwWirelessControl"))
        {
        }

        std::vector<std::string> IwWirelessControl::wireless_interfaces()
        {
            const auto result = runner_.run({"iw", "dev"});
            if (!result.ok())
            {
                logger_->warning("Failed to list wireless interfaces", core::LogContext().add("output", trim(result.output)));
                return {};
            }
            return parse_iw_dev_interfaces(result.output);
        }

        bool IwWirelessControl::is_associated(const std::string &iface)
        {
            const auto result = runner_.run({"iw", "dev", iface, "link"});
            return result.ok() && result.output.find("SSID:") != std::string::npos;
        }

        std::optional<std::string> IwWirelessControl::phy_of(const std::string &iface)
        {
            const auto result = runner_.run({"iw", "dev", iface, "info"});
            if (!result.ok())
            {
                return std::nullopt;
            }
            return parse_iw_wiphy(result.output);
        }

        std::vector<InterfaceCombination> IwWirelessControl::interface_combinations(const std::string &phy)
        {
            const auto result = runner_.run({"iw", "phy", phy, "info"});
            if (!result.ok())
            {
                logger_->warning("Failed to query radio capabilities", core::LogContext().add("phy", phy));
                return {};
            }
            return parse_interface_combinations(result.output);
        }

        void IwWirelessControl::add_ap_interface(const std::string &base, const std::string &name)
        {
            const auto result = runner_.run({"iw", "dev", base, "interface", "add", name, "type", "__ap"});
            if (!result.ok())
            {
                throw std::runtime_error(trim(result.output).empty()
                                             ? "iw exited with status " + std::to_string(result.exit_code)
                                             : trim(result.output));
            }
        }

        bool IwWirelessControl::delete_interface(const std::string &name)
        {
            const auto result = runner_.run({"iw", "dev", name, "del"});
            if (!result.ok())
            {
                logger_->warning("Failed to delete wireless interface",
                                 core::LogContext().add("interface", name).add("output", trim(result.output)));
            }
            return result.ok();
        }

        std::vector<StationInfo> IwWirelessControl::stations(const std::string &iface)
        {
            const auto result = runner_.run({"iw", "dev", iface, "station", "dump"});
            if (!result.ok())
            {
                return {};
            }
            return parse_station_dump(result.output);
        }

    } // namespace infrastructure
} // namespace routnet
