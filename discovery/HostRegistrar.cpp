#include "HostRegistrar.hpp"
#include "../common/Log.hpp"

namespace host_sweep::discovery
{
    void LoggingRegistrar::Register(const HostRecord &host, const std::string &group_id, const std::string &proxy_id)
    {
        common::Log::Info("Zabbix") << "Creating/verifying host " << host.name << " (" << host.address
                                    << ") in group " << group_id << " via proxy " << proxy_id << " (stub)";
    }
}
