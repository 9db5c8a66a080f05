#include "../common/Config.hpp"
#include "../common/Errors.hpp"
#include "../common/Log.hpp"
#include "DiscoveryPipeline.hpp"
#include "ReachabilityProber.hpp"
#include "SnmpClient.hpp"
#include "ZabbixRegistrar.hpp"
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

namespace Log = host_sweep::common::Log;

int main(int argc, char *argv[])
{
    if (argc > 2)
    {
        std::cout << "Usage: ./HostSweep [config-path]\n";
        return 1;
    }

    std::string config_path = (argc > 1) ? argv[1] : host_sweep::common::DEFAULT_CONFIG_PATH;

    Log::Info("Main") << "Starting discovery...";
    Log::Info("Config") << "Loading configuration file " << config_path;

    host_sweep::common::DiscoveryConfig config;
    std::unique_ptr<host_sweep::discovery::HostRegistrar> registrar;
    try
    {
        config = host_sweep::common::LoadConfig(config_path);
        registrar = host_sweep::discovery::MakeRegistrar(config);
    }
    catch (const host_sweep::ConfigError &e)
    {
        Log::Error("Config") << "Failed to load " << config_path << ": " << e.what();
        return 1;
    }
    catch (const host_sweep::HttpError &e)
    {
        Log::Error("Config") << "Cannot set up Zabbix client: " << e.what();
        return 1;
    }
    Log::Info("Config") << "Configuration loaded: " << host_sweep::common::DescribeConfig(config);

    auto prober = host_sweep::discovery::MakeProber(config);
    host_sweep::discovery::SnmpClient snmp(config.snmp_community, std::chrono::seconds(config.snmp_timeout),
                                           1, config.snmp_port);

    host_sweep::discovery::DiscoveryPipeline pipeline(config, *prober, snmp, *registrar);
    pipeline.Run(config.ranges);

    Log::Info("Main") << "Discovery finished!";
    return 0;
}
