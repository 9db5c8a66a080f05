#include "Ipv4Address.hpp"
#include <arpa/inet.h>
#include <netinet/in.h>

namespace host_sweep::common
{
    std::optional<Ipv4Address> Ipv4Address::Parse(std::string_view text)
    {
        std::string buffer(text);
        in_addr addr{};
        if (inet_pton(AF_INET, buffer.c_str(), &addr) != 1)
            return std::nullopt;

        return Ipv4Address(ntohl(addr.s_addr));
    }

    std::string Ipv4Address::ToString() const
    {
        in_addr addr{};
        addr.s_addr = htonl(m_value);

        char buffer[INET_ADDRSTRLEN];
        if (inet_ntop(AF_INET, &addr, buffer, sizeof(buffer)) == nullptr)
            return "0.0.0.0";
        return buffer;
    }
}
