#pragma once

#include <string>
#include "../common/Ipv4Address.hpp"

namespace host_sweep::discovery
{
    using common::Ipv4Address;

    // A host that answered both the probe and the identity query. Handed to the
    // registrar and then dropped.
    struct HostRecord
    {
        std::string name;
        Ipv4Address address;
    };

    class HostRegistrar
    {
    public:
        virtual ~HostRegistrar() = default;

        // Returns on success, throws RegistrationError otherwise. Called
        // concurrently from every worker.
        virtual void Register(const HostRecord &host, const std::string &group_id, const std::string &proxy_id) = 0;
    };

    // Logs the create/verify intent without contacting any backend.
    class LoggingRegistrar : public HostRegistrar
    {
    public:
        void Register(const HostRecord &host, const std::string &group_id, const std::string &proxy_id) override;
    };
}
