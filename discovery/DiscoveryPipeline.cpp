#include "DiscoveryPipeline.hpp"
#include "../common/Errors.hpp"
#include "../common/Log.hpp"
#include "RangeExpander.hpp"
#include <chrono>
#include <functional>
#include <stdexcept>
#include <thread>

namespace host_sweep::discovery
{
    namespace Log = common::Log;

    const char *ToString(HostState state)
    {
        switch (state)
        {
        case HostState::Queued:
            return "queued";
        case HostState::Probing:
            return "probing";
        case HostState::Unreachable:
            return "unreachable";
        case HostState::Querying:
            return "querying";
        case HostState::IdentityFailed:
            return "identity-failed";
        case HostState::Registering:
            return "registering";
        case HostState::Registered:
            return "registered";
        case HostState::RegistrationFailed:
            return "registration-failed";
        }
        return "unknown";
    }

    DiscoveryPipeline::DiscoveryPipeline(const common::DiscoveryConfig &config,
                                         ReachabilityProber &prober,
                                         IdentityQuery &identity,
                                         HostRegistrar &registrar)
        : m_config(config), m_prober(prober), m_identity(identity), m_registrar(registrar)
    {
        if (m_config.workers < 1)
            throw std::invalid_argument("worker count must be at least 1");
    }

    HostState DiscoveryPipeline::ProcessAddress(const Ipv4Address &address)
    {
        if (!m_prober.Probe(address, std::chrono::seconds(m_config.ping_timeout)))
            return HostState::Unreachable;

        HostRecord record;
        record.address = address;
        try
        {
            record.name = m_identity.QueryIdentity(address);
        }
        catch (const SnmpError &e)
        {
            Log::Warn("Pipeline") << "Ping OK but SNMP failed on " << address << ": " << e.what();
            return HostState::IdentityFailed;
        }

        try
        {
            m_registrar.Register(record, m_config.zabbix_group_id, m_config.zabbix_proxy_id);
        }
        catch (const RegistrationError &e)
        {
            Log::Error("Pipeline") << "Registration of " << record.name << " (" << address << ") failed: " << e.what();
            return HostState::RegistrationFailed;
        }

        return HostState::Registered;
    }

    void DiscoveryPipeline::WorkerLoop(common::BoundedQueue<Ipv4Address> &queue)
    {
        while (auto address = queue.Pop())
        {
            try
            {
                ProcessAddress(*address);
            }
            catch (const std::exception &e)
            {
                Log::Error("Pipeline") << "Unexpected failure on " << *address << ": " << e.what();
            }
        }
    }

    template <typename Producer>
    void DiscoveryPipeline::RunPool(Producer produce)
    {
        const size_t worker_count = static_cast<size_t>(m_config.workers);
        common::BoundedQueue<Ipv4Address> queue(worker_count);

        std::vector<std::thread> workers;
        workers.reserve(worker_count);
        for (size_t i = 0; i < worker_count; ++i)
            workers.emplace_back(&DiscoveryPipeline::WorkerLoop, this, std::ref(queue));

        // Close and join even if the producer throws, so no worker is left
        // blocked on the queue.
        try
        {
            produce(queue);
        }
        catch (...)
        {
            queue.Close();
            for (auto &worker : workers)
                worker.join();
            throw;
        }

        queue.Close();
        for (auto &worker : workers)
            worker.join();
    }

    void DiscoveryPipeline::Run(const std::vector<std::string> &ranges)
    {
        auto produce = [&ranges](common::BoundedQueue<Ipv4Address> &queue)
        {
            for (const auto &range : ranges)
            {
                std::vector<Ipv4Address> addresses;
                try
                {
                    addresses = ExpandRange(range);
                }
                catch (const RangeFormatError &e)
                {
                    Log::Error("Pipeline") << "Skipping range: " << e.what();
                    continue;
                }

                Log::Info("Pipeline") << "Range " << range << " expanded to " << addresses.size() << " addresses";
                for (const auto &address : addresses)
                {
                    if (!queue.Push(address))
                        return;
                }
            }
        };

        RunPool(produce);
    }

    void DiscoveryPipeline::Run(const std::vector<Ipv4Address> &addresses)
    {
        auto produce = [&addresses](common::BoundedQueue<Ipv4Address> &queue)
        {
            for (const auto &address : addresses)
            {
                if (!queue.Push(address))
                    return;
            }
        };

        RunPool(produce);
    }
}
