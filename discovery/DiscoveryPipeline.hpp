#pragma once

#include <string>
#include <vector>
#include "../common/BoundedQueue.hpp"
#include "../common/Config.hpp"
#include "../common/Ipv4Address.hpp"
#include "HostRegistrar.hpp"
#include "IdentityQuery.hpp"
#include "ReachabilityProber.hpp"

namespace host_sweep::discovery
{
    using common::Ipv4Address;

    // Per-address progress. Unreachable, IdentityFailed, Registered and
    // RegistrationFailed are terminal.
    enum class HostState
    {
        Queued,
        Probing,
        Unreachable,
        Querying,
        IdentityFailed,
        Registering,
        Registered,
        RegistrationFailed
    };

    const char *ToString(HostState state);

    // Fixed pool of `config.workers` threads draining one bounded queue of
    // addresses through probe -> identity query -> registration. Run() returns
    // only after every worker has exited.
    class DiscoveryPipeline
    {
    public:
        // Throws std::invalid_argument when config.workers < 1.
        DiscoveryPipeline(const common::DiscoveryConfig &config,
                          ReachabilityProber &prober,
                          IdentityQuery &identity,
                          HostRegistrar &registrar);

        // Expands each range in order and feeds the result to the workers.
        // A malformed range is logged and skipped.
        void Run(const std::vector<std::string> &ranges);

        void Run(const std::vector<Ipv4Address> &addresses);

        // The whole state machine for one address; returns the terminal state.
        HostState ProcessAddress(const Ipv4Address &address);

    private:
        template <typename Producer>
        void RunPool(Producer produce);

        void WorkerLoop(common::BoundedQueue<Ipv4Address> &queue);

        const common::DiscoveryConfig &m_config;
        ReachabilityProber &m_prober;
        IdentityQuery &m_identity;
        HostRegistrar &m_registrar;
    };
}
