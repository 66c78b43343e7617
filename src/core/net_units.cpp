#include "routnet/core/net_units.hpp"

#include <algorithm>
#include <cctype>
#include <limits>

namespace routnet
{
    namespace core
    {

        namespace
        {
            struct RateUnit
            {
                const char *suffix;
                uint64_t multiplier;
            };

            // Longest suffixes first so "kbit" is not read as "bit"
            constexpr RateUnit RATE_UNITS[] = {
                {"tbit", 1000ULL * 1000 * 1000 * 1000},
                {"gbit", 1000ULL * 1000 * 1000},
                {"mbit", 1000ULL * 1000},
                {"kbit", 1000ULL},
                {"gbps", 8ULL * 1000 * 1000 * 1000},
                {"mbps", 8ULL * 1000 * 1000},
                {"kbps", 8ULL * 1000},
                {"bit", 1ULL},
                {"bps", 8ULL},
            };

            bool ends_with(const std::string &text, const std::string &suffix)
            {
                return text.size() >= suffix.size() &&
                       text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
            }
        } // namespace

        std::optional<uint64_t> parse_rate(const std::string &text)
        {
            std::string lower = text;
            std::transform(lower.begin(), lower.end(), lower.begin(),
                           [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });

            for (const auto &unit : RATE_UNITS)
            {
                if (!ends_with(lower, unit.suffix))
                {
                    continue;
                }

                const std::string digits = lower.substr(0, lower.size() - std::char_traits<char>::length(unit.suffix));
                if (digits.empty() || digits.size() > 12 ||
                    !std::all_of(digits.begin(), digits.end(), [](unsigned char c)
                                 { return std::isdigit(c) != 0; }))
                {
                    return std::nullopt;
                }

                const uint64_t value = std::stoull(digits);
                if (value == 0 || value > std::numeric_limits<uint64_t>::max() / unit.multiplier)
                {
                    return std::nullopt;
                }
                return value * unit.multiplier;
            }

            return std::nullopt;
        }

        std::string format_rate(uint64_t bits_per_second)
        {
            static constexpr RateUnit BIT_UNITS[] = {
                {"tbit", 1000ULL * 1000 * 1000 * 1000},
                {"gbit", 1000ULL * 1000 * 1000},
                {"mbit", 1000ULL * 1000},
                {"kbit", 1000ULL},
            };

            for (const auto &unit : BIT_UNITS)
            {
                if (bits_per_second >= unit.multiplier && bits_per_second % unit.multiplier == 0)
                {
                    return std::to_string(bits_per_second / unit.multiplier) + unit.suffix;
                }
            }
            return std::to_string(bits_per_second) + "bit";
        }

        std::optional<std::string> normalize_mac(const std::string &text)
        {
            if (text.size() != 17)
            {
                return std::nullopt;
            }

            const char separator = text[2];
            if (separator != ':' && separator != '-')
            {
                return std::nullopt;
            }

            std::string normalized;
            normalized.reserve(17);
            for (size_t i = 0; i < text.size(); ++i)
            {
                const unsigned char c = static_cast<unsigned char>(text[i]);
                if (i % 3 == 2)
                {
                    if (c != static_cast<unsigned char>(separator))
                    {
                        return std::nullopt;
                    }
                    normalized.push_back(':');
                    continue;
                }
                if (!std::isxdigit(c))
                {
                    return std::nullopt;
                }
                normalized.push_back(static_cast<char>(std::toupper(c)));
            }
            return normalized;
        }

    } // namespace core
} // namespace routnet
