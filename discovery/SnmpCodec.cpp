#include "SnmpCodec.hpp"
#include <cctype>
#include <stdexcept>
#include <utility>

namespace host_sweep::discovery::snmp
{
    namespace
    {
        void AppendBase128(std::vector<uint8_t> &buf, uint64_t arc)
        {
            uint8_t groups[10];
            int count = 0;
            do
            {
                groups[count++] = static_cast<uint8_t>(arc & 0x7F);
                arc >>= 7;
            } while (arc != 0);

            for (int i = count - 1; i >= 0; --i)
            {
                uint8_t byte = groups[i];
                if (i != 0)
                    byte |= 0x80;
                buf.push_back(byte);
            }
        }

        std::vector<uint64_t> ParseArcs(const std::string &oid)
        {
            std::vector<uint64_t> arcs;
            uint64_t current = 0;
            bool has_digit = false;

            for (char c : oid)
            {
                if (c == '.')
                {
                    if (!has_digit)
                        throw std::invalid_argument("empty arc in OID " + oid);
                    arcs.push_back(current);
                    current = 0;
                    has_digit = false;
                    continue;
                }
                if (!std::isdigit(static_cast<unsigned char>(c)))
                    throw std::invalid_argument("non-numeric arc in OID " + oid);

                current = current * 10 + static_cast<uint64_t>(c - '0');
                if (current > 0xFFFFFFFFull)
                    throw std::invalid_argument("arc out of range in OID " + oid);
                has_digit = true;
            }

            if (!has_digit)
                throw std::invalid_argument("empty arc in OID " + oid);
            arcs.push_back(current);
            return arcs;
        }

        // Bounds-checked cursor over a BER-encoded buffer.
        class BerReader
        {
        public:
            BerReader(const uint8_t *data, size_t size) : m_data(data), m_size(size) {}

            bool AtEnd() const { return m_offset >= m_size; }

            bool ReadTLV(uint8_t &type, const uint8_t *&value, size_t &length)
            {
                if (m_offset + 2 > m_size)
                    return false;

                type = m_data[m_offset++];
                uint8_t first = m_data[m_offset++];

                if (first < 0x80)
                {
                    length = first;
                }
                else
                {
                    size_t octets = first & 0x7F;
                    if (octets == 0 || octets > 4 || m_offset + octets > m_size)
                        return false;

                    length = 0;
                    for (size_t i = 0; i < octets; ++i)
                        length = (length << 8) | m_data[m_offset++];
                }

                if (length > m_size - m_offset)
                    return false;

                value = m_data + m_offset;
                m_offset += length;
                return true;
            }

            bool Expect(uint8_t expected_type, const uint8_t *&value, size_t &length)
            {
                uint8_t type = 0;
                return ReadTLV(type, value, length) && type == expected_type;
            }

        private:
            const uint8_t *m_data;
            size_t m_size;
            size_t m_offset = 0;
        };

        bool DecodeInteger(const uint8_t *value, size_t length, int32_t &out)
        {
            if (length == 0 || length > 5)
                return false;

            int64_t result = (value[0] & 0x80) ? -1 : 0;
            for (size_t i = 0; i < length; ++i)
                result = (result << 8) | value[i];

            out = static_cast<int32_t>(result);
            return true;
        }

        bool ReadInteger(BerReader &reader, int32_t &out)
        {
            const uint8_t *value = nullptr;
            size_t length = 0;
            return reader.Expect(tag::Integer, value, length) && DecodeInteger(value, length, out);
        }

        bool DecodeOid(const uint8_t *value, size_t length, std::string &out)
        {
            if (length == 0)
                return false;

            std::vector<uint64_t> arcs;
            uint64_t current = 0;
            bool pending = false;
            for (size_t i = 0; i < length; ++i)
            {
                current = (current << 7) | (value[i] & 0x7F);
                if (current > 0xFFFFFFFFull + 80)
                    return false;
                pending = true;

                if ((value[i] & 0x80) == 0)
                {
                    if (arcs.empty())
                    {
                        uint64_t first = current < 80 ? current / 40 : 2;
                        arcs.push_back(first);
                        arcs.push_back(current - first * 40);
                    }
                    else
                    {
                        arcs.push_back(current);
                    }
                    current = 0;
                    pending = false;
                }
            }
            if (pending)
                return false;

            out.clear();
            for (size_t i = 0; i < arcs.size(); ++i)
            {
                if (i != 0)
                    out += '.';
                out += std::to_string(arcs[i]);
            }
            return true;
        }

        bool DecodeVarBinds(const uint8_t *data, size_t size, std::vector<VarBind> &out)
        {
            BerReader list(data, size);
            while (!list.AtEnd())
            {
                const uint8_t *entry = nullptr;
                size_t entry_length = 0;
                if (!list.Expect(tag::Sequence, entry, entry_length))
                    return false;

                BerReader fields(entry, entry_length);
                const uint8_t *oid = nullptr;
                size_t oid_length = 0;
                if (!fields.Expect(tag::ObjectId, oid, oid_length))
                    return false;

                VarBind bind;
                if (!DecodeOid(oid, oid_length, bind.oid))
                    return false;

                const uint8_t *value = nullptr;
                size_t value_length = 0;
                if (!fields.ReadTLV(bind.type, value, value_length))
                    return false;
                bind.value.assign(value, value + value_length);

                out.push_back(std::move(bind));
            }
            return true;
        }
    }

    void AppendLength(std::vector<uint8_t> &buf, size_t length)
    {
        if (length < 0x80)
        {
            buf.push_back(static_cast<uint8_t>(length));
            return;
        }

        uint8_t bytes[sizeof(size_t)];
        int count = 0;
        while (length != 0)
        {
            bytes[count++] = static_cast<uint8_t>(length & 0xFF);
            length >>= 8;
        }

        buf.push_back(static_cast<uint8_t>(0x80 | count));
        for (int i = count - 1; i >= 0; --i)
            buf.push_back(bytes[i]);
    }

    void AppendTLV(std::vector<uint8_t> &buf, uint8_t type, const std::vector<uint8_t> &value)
    {
        buf.push_back(type);
        AppendLength(buf, value.size());
        buf.insert(buf.end(), value.begin(), value.end());
    }

    void AppendInteger(std::vector<uint8_t> &buf, int32_t value)
    {
        const uint32_t raw = static_cast<uint32_t>(value);
        std::vector<uint8_t> bytes = {
            static_cast<uint8_t>(raw >> 24),
            static_cast<uint8_t>(raw >> 16),
            static_cast<uint8_t>(raw >> 8),
            static_cast<uint8_t>(raw)};

        // Minimal two's complement: drop leading bytes that only repeat the sign.
        while (bytes.size() > 1 &&
               ((bytes[0] == 0x00 && (bytes[1] & 0x80) == 0) ||
                (bytes[0] == 0xFF && (bytes[1] & 0x80) != 0)))
        {
            bytes.erase(bytes.begin());
        }

        AppendTLV(buf, tag::Integer, bytes);
    }

    void AppendString(std::vector<uint8_t> &buf, const std::string &str)
    {
        std::vector<uint8_t> bytes(str.begin(), str.end());
        AppendTLV(buf, tag::OctetString, bytes);
    }

    std::vector<uint8_t> EncodeOid(const std::string &oid)
    {
        std::vector<uint64_t> arcs = ParseArcs(oid);
        if (arcs.size() < 2)
            throw std::invalid_argument("OID needs at least two arcs: " + oid);
        if (arcs[0] > 2 || (arcs[0] < 2 && arcs[1] > 39))
            throw std::invalid_argument("invalid leading arcs in OID " + oid);

        std::vector<uint8_t> bytes;
        AppendBase128(bytes, arcs[0] * 40 + arcs[1]);
        for (size_t i = 2; i < arcs.size(); ++i)
            AppendBase128(bytes, arcs[i]);
        return bytes;
    }

    std::vector<uint8_t> EncodeMessage(const Message &message)
    {
        std::vector<uint8_t> var_bind_list;
        for (const auto &bind : message.pdu.varbinds)
        {
            std::vector<uint8_t> entry;
            AppendTLV(entry, tag::ObjectId, EncodeOid(bind.oid));
            AppendTLV(entry, bind.type, bind.value);
            AppendTLV(var_bind_list, tag::Sequence, entry);
        }

        std::vector<uint8_t> pdu_body;
        AppendInteger(pdu_body, message.pdu.request_id);
        AppendInteger(pdu_body, message.pdu.error_status);
        AppendInteger(pdu_body, message.pdu.error_index);
        AppendTLV(pdu_body, tag::Sequence, var_bind_list);

        std::vector<uint8_t> whole_packet_content;
        AppendInteger(whole_packet_content, message.version);
        AppendString(whole_packet_content, message.community);
        AppendTLV(whole_packet_content, message.pdu.type, pdu_body);

        std::vector<uint8_t> final_packet;
        AppendTLV(final_packet, tag::Sequence, whole_packet_content);
        return final_packet;
    }

    std::vector<uint8_t> EncodeGetRequest(const std::string &community, int32_t request_id, const std::string &oid)
    {
        Message message;
        message.version = VERSION_2C;
        message.community = community;
        message.pdu.type = tag::GetRequest;
        message.pdu.request_id = request_id;

        VarBind bind;
        bind.oid = oid;
        bind.type = tag::Null;
        message.pdu.varbinds.push_back(std::move(bind));

        return EncodeMessage(message);
    }

    std::optional<Message> DecodeMessage(const uint8_t *data, size_t size)
    {
        BerReader outer(data, size);
        const uint8_t *body = nullptr;
        size_t body_length = 0;
        if (!outer.Expect(tag::Sequence, body, body_length))
            return std::nullopt;

        Message message;
        BerReader reader(body, body_length);
        if (!ReadInteger(reader, message.version))
            return std::nullopt;

        const uint8_t *community = nullptr;
        size_t community_length = 0;
        if (!reader.Expect(tag::OctetString, community, community_length))
            return std::nullopt;
        message.community.assign(reinterpret_cast<const char *>(community), community_length);

        const uint8_t *pdu = nullptr;
        size_t pdu_length = 0;
        if (!reader.ReadTLV(message.pdu.type, pdu, pdu_length))
            return std::nullopt;
        if (message.pdu.type < tag::GetRequest || message.pdu.type > 0xA8)
            return std::nullopt;

        BerReader fields(pdu, pdu_length);
        if (!ReadInteger(fields, message.pdu.request_id) ||
            !ReadInteger(fields, message.pdu.error_status) ||
            !ReadInteger(fields, message.pdu.error_index))
            return std::nullopt;

        const uint8_t *list = nullptr;
        size_t list_length = 0;
        if (!fields.Expect(tag::Sequence, list, list_length))
            return std::nullopt;
        if (!DecodeVarBinds(list, list_length, message.pdu.varbinds))
            return std::nullopt;

        return message;
    }
}
