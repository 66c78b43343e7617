#ifndef ROUTNET_CORE_NET_UNITS_HPP
#define ROUTNET_CORE_NET_UNITS_HPP

#include <cstdint>
#include <optional>
#include <string>

namespace routnet
{
    namespace core
    {

        /**
         * Parses a rate in tc notation ("2mbit", "500kbit", "1gbit", "100kbps")
         * into bits per second. Multipliers are decimal, "bps" units are bytes.
         */
        std::optional<uint64_t> parse_rate(const std::string &text);

        // Renders bits per second in the largest exact bit unit, e.g. 5000000 -> "5mbit"
        std::string format_rate(uint64_t bits_per_second);

        /**
         * Accepts six hex octets separated by ':' or '-' and returns the
         * upper-case colon form, or nullopt when malformed.
         */
        std::optional<std::string> normalize_mac(const std::string &text);

    } // namespace core
} // namespace routnet

#endif // ROUTNET_CORE_NET_UNITS_HPP
