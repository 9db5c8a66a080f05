#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace host_sweep::common
{
    enum class ProbeMethod
    {
        SystemPing,
        Icmp
    };

    enum class RegistrationMode
    {
        Stub,
        Zabbix
    };

    // Read-only after loading; shared by const reference with every component.
    struct DiscoveryConfig
    {
        std::string zabbix_url;
        std::string zabbix_user;
        std::string zabbix_pass;
        std::string zabbix_group_id;
        std::string zabbix_proxy_id;
        bool zabbix_verify_tls = true;
        int zabbix_timeout = 10;

        std::string snmp_community;
        uint16_t snmp_port = 161;

        int ping_timeout = 1;
        int snmp_timeout = 1;
        int workers = 1;

        ProbeMethod probe_method = ProbeMethod::SystemPing;
        RegistrationMode registration = RegistrationMode::Stub;

        std::vector<std::string> ranges;
    };

    inline constexpr const char *DEFAULT_CONFIG_PATH = "discovery.conf";

    // Both throw ConfigError on unreadable input, malformed JSON, wrongly typed
    // keys or values outside their allowed domain.
    DiscoveryConfig ParseConfig(const std::string &json_text);
    DiscoveryConfig LoadConfig(const std::string &path);

    std::string DescribeConfig(const DiscoveryConfig &config);
}
