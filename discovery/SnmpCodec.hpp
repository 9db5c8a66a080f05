#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace host_sweep::discovery::snmp
{
    inline constexpr int VERSION_2C = 1;

    namespace tag
    {
        inline constexpr uint8_t Integer = 0x02;
        inline constexpr uint8_t OctetString = 0x04;
        inline constexpr uint8_t Null = 0x05;
        inline constexpr uint8_t ObjectId = 0x06;
        inline constexpr uint8_t Sequence = 0x30;
        inline constexpr uint8_t IpAddress = 0x40;
        inline constexpr uint8_t Counter32 = 0x41;
        inline constexpr uint8_t Gauge32 = 0x42;
        inline constexpr uint8_t TimeTicks = 0x43;
        inline constexpr uint8_t NoSuchObject = 0x80;
        inline constexpr uint8_t NoSuchInstance = 0x81;
        inline constexpr uint8_t EndOfMibView = 0x82;
        inline constexpr uint8_t GetRequest = 0xA0;
        inline constexpr uint8_t GetNextRequest = 0xA1;
        inline constexpr uint8_t Response = 0xA2;
    }

    inline constexpr const char *SYS_NAME_OID = "1.3.6.1.2.1.1.5.0";

    struct VarBind
    {
        std::string oid;
        uint8_t type = tag::Null;
        std::vector<uint8_t> value;

        std::string AsString() const { return std::string(value.begin(), value.end()); }
    };

    struct Pdu
    {
        uint8_t type = tag::GetRequest;
        int32_t request_id = 0;
        int32_t error_status = 0;
        int32_t error_index = 0;
        std::vector<VarBind> varbinds;
    };

    struct Message
    {
        int32_t version = VERSION_2C;
        std::string community;
        Pdu pdu;
    };

    // BER primitives, exposed for the encoder tests.
    void AppendLength(std::vector<uint8_t> &buf, size_t length);
    void AppendTLV(std::vector<uint8_t> &buf, uint8_t type, const std::vector<uint8_t> &value);
    void AppendInteger(std::vector<uint8_t> &buf, int32_t value);
    void AppendString(std::vector<uint8_t> &buf, const std::string &str);

    // Throws std::invalid_argument for an OID that is not dotted decimal with
    // at least two arcs.
    std::vector<uint8_t> EncodeOid(const std::string &oid);

    std::vector<uint8_t> EncodeMessage(const Message &message);
    std::vector<uint8_t> EncodeGetRequest(const std::string &community, int32_t request_id, const std::string &oid);

    // nullopt when the datagram is not a well-formed SNMP message.
    std::optional<Message> DecodeMessage(const uint8_t *data, size_t size);
}
