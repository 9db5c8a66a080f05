#include "ZabbixRegistrar.hpp"
#include "../common/Errors.hpp"
#include "../common/Log.hpp"
#include <cctype>
#include <utility>

namespace host_sweep::discovery
{
    namespace Log = common::Log;
    using nlohmann::json;

    namespace
    {
        constexpr int INTERFACE_TYPE_SNMP = 2;
        constexpr int SNMP_INTERFACE_VERSION_2C = 2;
    }

    HttpJsonRpcTransport::HttpJsonRpcTransport(Url endpoint, bool verify_tls, std::chrono::seconds timeout)
        : m_endpoint(std::move(endpoint)), m_http(verify_tls, timeout)
    {
    }

    json HttpJsonRpcTransport::Call(const json &request)
    {
        HttpResponse response = m_http.Post(m_endpoint, "application/json-rpc", request.dump());
        try
        {
            return json::parse(response.body);
        }
        catch (const json::parse_error &e)
        {
            throw HttpError(std::string("invalid JSON-RPC reply: ") + e.what());
        }
    }

    ZabbixRegistrar::ZabbixRegistrar(const common::DiscoveryConfig &config, std::unique_ptr<JsonRpcTransport> transport)
        : m_user(config.zabbix_user),
          m_password(config.zabbix_pass),
          m_community(config.snmp_community),
          m_transport(std::move(transport)),
          m_next_id(1)
    {
    }

    std::string ZabbixRegistrar::TechnicalName(const std::string &sys_name)
    {
        std::string name;
        name.reserve(sys_name.size());
        for (char c : sys_name)
        {
            unsigned char uc = static_cast<unsigned char>(c);
            if (std::isalnum(uc) || c == ' ' || c == '.' || c == '_' || c == '-')
                name += c;
            else
                name += '_';
        }

        size_t begin = name.find_first_not_of(' ');
        if (begin == std::string::npos)
            return "";
        size_t end = name.find_last_not_of(' ');
        return name.substr(begin, end - begin + 1);
    }

    json ZabbixRegistrar::Invoke(const std::string &method, const json &params, bool authenticated)
    {
        json request = json::object();
        request["jsonrpc"] = "2.0";
        request["method"] = method;
        request["params"] = params;
        request["id"] = m_next_id.fetch_add(1);
        if (authenticated)
            request["auth"] = AuthToken();

        json reply;
        try
        {
            reply = m_transport->Call(request);
        }
        catch (const std::exception &e)
        {
            throw RegistrationError(method + " failed: " + e.what());
        }

        if (!reply.is_object())
            throw RegistrationError(method + " returned a non-object reply");

        auto error = reply.find("error");
        if (error != reply.end())
        {
            std::string message = "unknown error";
            std::string data;
            if (error->is_object())
            {
                message = error->value("message", message);
                data = error->value("data", data);
            }
            throw RegistrationError(method + " rejected: " + message + (data.empty() ? "" : " " + data));
        }

        auto result = reply.find("result");
        if (result == reply.end())
            throw RegistrationError(method + " reply has no result");
        return *result;
    }

    std::string ZabbixRegistrar::AuthToken()
    {
        std::lock_guard<std::mutex> lock(m_auth_mutex);
        if (!m_auth_token.empty())
            return m_auth_token;

        json params = json::object();
        params["username"] = m_user;
        params["password"] = m_password;

        json result = Invoke("user.login", params, false);
        if (!result.is_string() || result.get<std::string>().empty())
            throw RegistrationError("user.login did not return a session token");

        m_auth_token = result.get<std::string>();
        Log::Info("Zabbix") << "Authenticated as " << m_user;
        return m_auth_token;
    }

    void ZabbixRegistrar::Register(const HostRecord &host, const std::string &group_id, const std::string &proxy_id)
    {
        std::string technical = TechnicalName(host.name);
        if (technical.empty())
            technical = host.address.ToString();

        Log::Info("Zabbix") << "Creating/verifying host " << host.name << " (" << host.address << ") in group "
                            << group_id << " via proxy " << proxy_id;

        json lookup = json::object();
        lookup["output"] = json::array({"hostid"});
        lookup["filter"] = json::object();
        lookup["filter"]["host"] = json::array({technical});

        json existing = Invoke("host.get", lookup, true);
        if (existing.is_array() && !existing.empty())
        {
            Log::Info("Zabbix") << "Host " << technical << " already registered";
            return;
        }

        json details = json::object();
        details["version"] = SNMP_INTERFACE_VERSION_2C;
        details["bulk"] = 1;
        details["community"] = m_community;

        json snmp_interface = json::object();
        snmp_interface["type"] = INTERFACE_TYPE_SNMP;
        snmp_interface["main"] = 1;
        snmp_interface["useip"] = 1;
        snmp_interface["ip"] = host.address.ToString();
        snmp_interface["dns"] = "";
        snmp_interface["port"] = "161";
        snmp_interface["details"] = details;

        json group = json::object();
        group["groupid"] = group_id;

        json create = json::object();
        create["host"] = technical;
        create["name"] = host.name;
        create["groups"] = json::array({group});
        create["interfaces"] = json::array({snmp_interface});
        if (!proxy_id.empty())
            create["proxy_hostid"] = proxy_id;

        json created = Invoke("host.create", create, true);

        std::string host_id = "?";
        auto ids = created.find("hostids");
        if (created.is_object() && ids != created.end() && ids->is_array() && !ids->empty() && ids->front().is_string())
            host_id = ids->front().get<std::string>();

        Log::Info("Zabbix") << "Created host " << technical << " with id " << host_id;
    }

    std::unique_ptr<HostRegistrar> MakeRegistrar(const common::DiscoveryConfig &config)
    {
        if (config.registration == common::RegistrationMode::Stub)
            return std::make_unique<LoggingRegistrar>();

        auto endpoint = Url::Parse(config.zabbix_url);
        if (!endpoint)
            throw ConfigError("zabbix_url is not a valid http(s) URL: " + config.zabbix_url);

        auto transport = std::make_unique<HttpJsonRpcTransport>(*endpoint, config.zabbix_verify_tls,
                                                                std::chrono::seconds(config.zabbix_timeout));
        return std::make_unique<ZabbixRegistrar>(config, std::move(transport));
    }
}
