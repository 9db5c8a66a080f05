#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>
#include "../common/Config.hpp"
#include "HostRegistrar.hpp"
#include "HttpClient.hpp"

namespace host_sweep::discovery
{
    // Carries one JSON-RPC request to the server and returns the decoded
    // reply. Throws on transport or decoding failures.
    class JsonRpcTransport
    {
    public:
        virtual ~JsonRpcTransport() = default;
        virtual nlohmann::json Call(const nlohmann::json &request) = 0;
    };

    class HttpJsonRpcTransport : public JsonRpcTransport
    {
    public:
        HttpJsonRpcTransport(Url endpoint, bool verify_tls, std::chrono::seconds timeout);

        nlohmann::json Call(const nlohmann::json &request) override;

    private:
        Url m_endpoint;
        HttpClient m_http;
    };

    // Registers hosts through the Zabbix API: logs in once, looks the host up
    // by technical name and creates it with an SNMPv2 interface when missing.
    class ZabbixRegistrar : public HostRegistrar
    {
    public:
        ZabbixRegistrar(const common::DiscoveryConfig &config, std::unique_ptr<JsonRpcTransport> transport);

        void Register(const HostRecord &host, const std::string &group_id, const std::string &proxy_id) override;

        // Zabbix host names accept letters, digits, space, '.', '_' and '-'.
        static std::string TechnicalName(const std::string &sys_name);

    private:
        nlohmann::json Invoke(const std::string &method, const nlohmann::json &params, bool authenticated);
        std::string AuthToken();

        std::string m_user;
        std::string m_password;
        std::string m_community;
        std::unique_ptr<JsonRpcTransport> m_transport;

        std::mutex m_auth_mutex;
        std::string m_auth_token;
        std::atomic<int> m_next_id;
    };

    // Builds the registrar selected by the configuration.
    std::unique_ptr<HostRegistrar> MakeRegistrar(const common::DiscoveryConfig &config);
}
