#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>
#include "IdentityQuery.hpp"
#include "SnmpCodec.hpp"

namespace host_sweep::discovery
{
    // UDP socket connected to one agent. The socket is closed when the session
    // goes out of scope, whichever way the query ends.
    class SnmpSession
    {
    public:
        SnmpSession(const Ipv4Address &address, uint16_t port);
        ~SnmpSession();

        SnmpSession(const SnmpSession &) = delete;
        SnmpSession &operator=(const SnmpSession &) = delete;

        void Send(const std::vector<uint8_t> &datagram);

        // Waits up to `timeout` for one datagram. Returns false on timeout and
        // throws SnmpQueryError on socket errors.
        bool Receive(std::vector<uint8_t> &datagram, std::chrono::milliseconds timeout);

    private:
        int m_sockfd;
        std::string m_target;
    };

    // SNMPv2c GET client. Each request makes 1 + retries attempts, each with
    // its own request-id and the full timeout.
    class SnmpClient : public IdentityQuery
    {
    public:
        SnmpClient(std::string community, std::chrono::seconds timeout, int retries = 1, uint16_t port = 161);

        std::vector<snmp::VarBind> Get(const Ipv4Address &address, const std::string &oid);

        // sysName.0 of the agent; first string-typed value wins.
        std::string QueryIdentity(const Ipv4Address &address) override;

    private:
        std::string m_community;
        std::chrono::milliseconds m_timeout;
        int m_retries;
        uint16_t m_port;
    };
}
