#pragma once

#include <string>
#include "../common/Ipv4Address.hpp"

namespace host_sweep::discovery
{
    using common::Ipv4Address;

    // Fetches a human-readable name for a reachable host. Throws an SnmpError
    // subclass when the name cannot be obtained.
    class IdentityQuery
    {
    public:
        virtual ~IdentityQuery() = default;
        virtual std::string QueryIdentity(const Ipv4Address &address) = 0;
    };
}
