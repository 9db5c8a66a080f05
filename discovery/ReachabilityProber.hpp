#pragma once

#include <chrono>
#include <memory>
#include <string>
#include "../common/Config.hpp"
#include "../common/Ipv4Address.hpp"

namespace host_sweep::discovery
{
    using common::Ipv4Address;

    // Single-attempt liveness check. Blocks for at most about `timeout` and
    // reports every failure as "not alive"; implementations never throw.
    class ReachabilityProber
    {
    public:
        virtual ~ReachabilityProber() = default;
        virtual bool Probe(const Ipv4Address &address, std::chrono::seconds timeout) = 0;
    };

    // Runs the system "ping -c 1 -W <timeout>" and reports its exit status.
    class PingProber : public ReachabilityProber
    {
    public:
        explicit PingProber(std::string program = "ping");

        bool Probe(const Ipv4Address &address, std::chrono::seconds timeout) override;

    private:
        std::string m_program;
    };

    // One ICMP echo request sent and matched through libtins. Needs raw socket
    // privileges (root or CAP_NET_RAW).
    class IcmpProber : public ReachabilityProber
    {
    public:
        bool Probe(const Ipv4Address &address, std::chrono::seconds timeout) override;
    };

    std::unique_ptr<ReachabilityProber> MakeProber(const common::DiscoveryConfig &config);
}
