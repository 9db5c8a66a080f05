#include "SnmpClient.hpp"
#include "../common/Errors.hpp"
#include "../common/Log.hpp"
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <optional>
#include <poll.h>
#include <random>
#include <sys/socket.h>
#include <unistd.h>
#include <utility>

namespace host_sweep::discovery
{
    namespace Log = common::Log;

    namespace
    {
        int32_t NextRequestId()
        {
            thread_local std::mt19937 generator{std::random_device{}()};
            std::uniform_int_distribution<int32_t> distribution(1, 0x7FFFFFFF);
            return distribution(generator);
        }

        // Sends one request and waits for the matching response until the
        // deadline. Datagrams that do not decode or answer another request are
        // skipped. nullopt means the attempt timed out.
        std::optional<snmp::Message> Exchange(SnmpSession &session, const std::vector<uint8_t> &request,
                                              int32_t request_id, std::chrono::milliseconds timeout)
        {
            session.Send(request);

            const auto deadline = std::chrono::steady_clock::now() + timeout;
            while (true)
            {
                auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - std::chrono::steady_clock::now());
                if (remaining.count() <= 0)
                    return std::nullopt;

                std::vector<uint8_t> datagram;
                if (!session.Receive(datagram, remaining))
                    return std::nullopt;

                auto message = snmp::DecodeMessage(datagram.data(), datagram.size());
                if (!message)
                    continue;
                if (message->pdu.type != snmp::tag::Response || message->pdu.request_id != request_id)
                    continue;

                return message;
            }
        }
    }

    SnmpSession::SnmpSession(const Ipv4Address &address, uint16_t port)
        : m_sockfd(-1), m_target(address.ToString())
    {
        m_sockfd = socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
        if (m_sockfd < 0)
            throw SnmpConnectError("socket() failed for " + m_target + ": " + std::strerror(errno));

        struct sockaddr_in servaddr;
        std::memset(&servaddr, 0, sizeof(servaddr));
        servaddr.sin_family = AF_INET;
        servaddr.sin_port = htons(port);
        servaddr.sin_addr.s_addr = htonl(address.Value());

        if (connect(m_sockfd, reinterpret_cast<const struct sockaddr *>(&servaddr), sizeof(servaddr)) < 0)
        {
            int err = errno;
            close(m_sockfd);
            m_sockfd = -1;
            throw SnmpConnectError("connect() failed for " + m_target + ": " + std::strerror(err));
        }
    }

    SnmpSession::~SnmpSession()
    {
        if (m_sockfd >= 0)
            close(m_sockfd);
    }

    void SnmpSession::Send(const std::vector<uint8_t> &datagram)
    {
        ssize_t sent = send(m_sockfd, datagram.data(), datagram.size(), 0);
        if (sent < 0)
            throw SnmpQueryError("send to " + m_target + " failed: " + std::strerror(errno));
        if (static_cast<size_t>(sent) != datagram.size())
            throw SnmpQueryError("short send to " + m_target);
    }

    bool SnmpSession::Receive(std::vector<uint8_t> &datagram, std::chrono::milliseconds timeout)
    {
        pollfd pfd{};
        pfd.fd = m_sockfd;
        pfd.events = POLLIN;

        int ready = 0;
        do
        {
            ready = poll(&pfd, 1, static_cast<int>(timeout.count()));
        } while (ready < 0 && errno == EINTR);

        if (ready < 0)
            throw SnmpQueryError("poll on " + m_target + " failed: " + std::strerror(errno));
        if (ready == 0)
            return false;

        uint8_t buffer[65536];
        ssize_t n = recv(m_sockfd, buffer, sizeof(buffer), 0);
        if (n < 0)
            throw SnmpQueryError("receive from " + m_target + " failed: " + std::strerror(errno));

        datagram.assign(buffer, buffer + n);
        return true;
    }

    SnmpClient::SnmpClient(std::string community, std::chrono::seconds timeout, int retries, uint16_t port)
        : m_community(std::move(community)), m_timeout(timeout), m_retries(retries < 0 ? 0 : retries), m_port(port)
    {
    }

    std::vector<snmp::VarBind> SnmpClient::Get(const Ipv4Address &address, const std::string &oid)
    {
        const std::string target = address.ToString();
        Log::Info("SNMP") << "Connecting to host " << target;

        SnmpSession session(address, m_port);

        std::string last_error;
        const int attempts = 1 + m_retries;
        for (int attempt = 1; attempt <= attempts; ++attempt)
        {
            const int32_t request_id = NextRequestId();
            const std::vector<uint8_t> request = snmp::EncodeGetRequest(m_community, request_id, oid);

            std::optional<snmp::Message> response;
            try
            {
                response = Exchange(session, request, request_id, m_timeout);
            }
            catch (const SnmpQueryError &e)
            {
                last_error = e.what();
                continue;
            }

            if (!response)
            {
                last_error = "no response within " + std::to_string(m_timeout.count()) + "ms";
                continue;
            }

            if (response->pdu.error_status != 0)
            {
                throw SnmpQueryError("agent " + target + " returned error-status " +
                                     std::to_string(response->pdu.error_status) + " (index " +
                                     std::to_string(response->pdu.error_index) + ")");
            }

            return response->pdu.varbinds;
        }

        throw SnmpQueryError("query to " + target + " failed after " + std::to_string(attempts) +
                             " attempts: " + last_error);
    }

    std::string SnmpClient::QueryIdentity(const Ipv4Address &address)
    {
        std::vector<snmp::VarBind> varbinds = Get(address, snmp::SYS_NAME_OID);

        for (const auto &bind : varbinds)
        {
            if (bind.type == snmp::tag::OctetString)
            {
                std::string name = bind.AsString();
                Log::Info("SNMP") << "Host " << address << " answered sysName: " << name;
                return name;
            }
        }

        throw SnmpUnexpectedTypeError("OID " + std::string(snmp::SYS_NAME_OID) + " did not return a string on " +
                                      address.ToString());
    }
}
