#pragma once

#include <stdexcept>
#include <string>

namespace host_sweep
{
    class ConfigError : public std::runtime_error
    {
    public:
        explicit ConfigError(const std::string &what) : std::runtime_error(what) {}
    };

    class RangeFormatError : public std::runtime_error
    {
    public:
        RangeFormatError(const std::string &range, const std::string &reason)
            : std::runtime_error("invalid range '" + range + "': " + reason), m_range(range)
        {
        }

        const std::string &Range() const { return m_range; }

    private:
        std::string m_range;
    };

    // Base of everything the identity query can raise for a single host.
    class SnmpError : public std::runtime_error
    {
    public:
        explicit SnmpError(const std::string &what) : std::runtime_error(what) {}
    };

    class SnmpConnectError : public SnmpError
    {
    public:
        explicit SnmpConnectError(const std::string &what) : SnmpError(what) {}
    };

    class SnmpQueryError : public SnmpError
    {
    public:
        explicit SnmpQueryError(const std::string &what) : SnmpError(what) {}
    };

    class SnmpUnexpectedTypeError : public SnmpError
    {
    public:
        explicit SnmpUnexpectedTypeError(const std::string &what) : SnmpError(what) {}
    };

    class RegistrationError : public std::runtime_error
    {
    public:
        explicit RegistrationError(const std::string &what) : std::runtime_error(what) {}
    };

    class HttpError : public std::runtime_error
    {
    public:
        explicit HttpError(const std::string &what) : std::runtime_error(what) {}
    };
}
