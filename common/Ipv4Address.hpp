#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace host_sweep::common
{
    // IPv4 address held as a host-order integer so ranges can be walked by
    // plain arithmetic.
    class Ipv4Address
    {
    public:
        constexpr Ipv4Address() = default;
        constexpr explicit Ipv4Address(uint32_t value) : m_value(value) {}

        static constexpr Ipv4Address FromOctets(uint8_t a, uint8_t b, uint8_t c, uint8_t d)
        {
            return Ipv4Address((static_cast<uint32_t>(a) << 24) |
                               (static_cast<uint32_t>(b) << 16) |
                               (static_cast<uint32_t>(c) << 8) |
                               static_cast<uint32_t>(d));
        }

        // Strict dotted quad only ("10.0.0.1"); anything else yields nullopt.
        static std::optional<Ipv4Address> Parse(std::string_view text);

        constexpr uint32_t Value() const { return m_value; }
        constexpr uint8_t Octet(int index) const
        {
            return static_cast<uint8_t>((m_value >> (8 * (3 - index))) & 0xFF);
        }

        std::string ToString() const;

        constexpr bool operator==(const Ipv4Address &other) const { return m_value == other.m_value; }
        constexpr bool operator!=(const Ipv4Address &other) const { return m_value != other.m_value; }
        constexpr bool operator<(const Ipv4Address &other) const { return m_value < other.m_value; }

    private:
        uint32_t m_value = 0;
    };

    inline std::ostream &operator<<(std::ostream &os, const Ipv4Address &address)
    {
        return os << address.ToString();
    }
}
