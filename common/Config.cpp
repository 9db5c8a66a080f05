#include "Config.hpp"
#include "Errors.hpp"
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

namespace host_sweep::common
{
    namespace
    {
        using nlohmann::json;

        template <typename T>
        void ReadOptional(const json &doc, const char *key, T &out)
        {
            auto it = doc.find(key);
            if (it == doc.end() || it->is_null())
                return;

            try
            {
                out = it->get<T>();
            }
            catch (const json::exception &e)
            {
                throw ConfigError(std::string("invalid value for '") + key + "': " + e.what());
            }
        }

        ProbeMethod ParseProbeMethod(const std::string &value)
        {
            if (value == "ping")
                return ProbeMethod::SystemPing;
            if (value == "icmp")
                return ProbeMethod::Icmp;
            throw ConfigError("unknown probe_method '" + value + "' (expected \"ping\" or \"icmp\")");
        }

        RegistrationMode ParseRegistration(const std::string &value)
        {
            if (value == "stub")
                return RegistrationMode::Stub;
            if (value == "zabbix")
                return RegistrationMode::Zabbix;
            throw ConfigError("unknown registration '" + value + "' (expected \"stub\" or \"zabbix\")");
        }

        void Validate(const DiscoveryConfig &config)
        {
            if (config.workers < 1)
                throw ConfigError("workers must be at least 1");
            if (config.ping_timeout < 1)
                throw ConfigError("ping_timeout must be at least 1 second");
            if (config.snmp_timeout < 1)
                throw ConfigError("snmp_timeout must be at least 1 second");
            if (config.zabbix_timeout < 1)
                throw ConfigError("zabbix_timeout must be at least 1 second");
            if (config.registration == RegistrationMode::Zabbix && config.zabbix_url.empty())
                throw ConfigError("registration \"zabbix\" requires zabbix_url");
        }
    }

    DiscoveryConfig ParseConfig(const std::string &json_text)
    {
        json doc;
        try
        {
            doc = json::parse(json_text);
        }
        catch (const json::parse_error &e)
        {
            throw ConfigError(std::string("malformed JSON: ") + e.what());
        }

        if (!doc.is_object())
            throw ConfigError("top-level JSON value must be an object");

        DiscoveryConfig config;
        ReadOptional(doc, "zabbix_url", config.zabbix_url);
        ReadOptional(doc, "zabbix_user", config.zabbix_user);
        ReadOptional(doc, "zabbix_pass", config.zabbix_pass);
        ReadOptional(doc, "zabbix_group_id", config.zabbix_group_id);
        ReadOptional(doc, "zabbix_proxy_id", config.zabbix_proxy_id);
        ReadOptional(doc, "zabbix_verify_tls", config.zabbix_verify_tls);
        ReadOptional(doc, "zabbix_timeout", config.zabbix_timeout);
        ReadOptional(doc, "snmp_community", config.snmp_community);
        int snmp_port = config.snmp_port;
        ReadOptional(doc, "snmp_port", snmp_port);
        if (snmp_port < 1 || snmp_port > 65535)
            throw ConfigError("snmp_port must be between 1 and 65535");
        config.snmp_port = static_cast<uint16_t>(snmp_port);
        ReadOptional(doc, "ping_timeout", config.ping_timeout);
        ReadOptional(doc, "snmp_timeout", config.snmp_timeout);
        ReadOptional(doc, "workers", config.workers);
        ReadOptional(doc, "ranges", config.ranges);

        std::string probe = "ping";
        ReadOptional(doc, "probe_method", probe);
        config.probe_method = ParseProbeMethod(probe);

        std::string registration = "stub";
        ReadOptional(doc, "registration", registration);
        config.registration = ParseRegistration(registration);

        Validate(config);
        return config;
    }

    DiscoveryConfig LoadConfig(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
            throw ConfigError("cannot open config file " + path);

        std::stringstream buffer;
        buffer << file.rdbuf();
        if (file.bad())
            throw ConfigError("failed reading config file " + path);

        return ParseConfig(buffer.str());
    }

    std::string DescribeConfig(const DiscoveryConfig &config)
    {
        std::ostringstream out;
        out << "zabbix_url=" << config.zabbix_url
            << " zabbix_user=" << config.zabbix_user
            << " group=" << config.zabbix_group_id
            << " proxy=" << config.zabbix_proxy_id
            << " snmp_port=" << config.snmp_port
            << " ping_timeout=" << config.ping_timeout << "s"
            << " snmp_timeout=" << config.snmp_timeout << "s"
            << " workers=" << config.workers
            << " probe=" << (config.probe_method == ProbeMethod::Icmp ? "icmp" : "ping")
            << " registration=" << (config.registration == RegistrationMode::Zabbix ? "zabbix" : "stub")
            << " ranges=" << config.ranges.size();
        return out.str();
    }
}
