#include <catch2/catch_test_macros.hpp>
#include "discovery/SnmpCodec.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using namespace host_sweep::discovery;

TEST_CASE("GetRequest for sysName encodes to the canonical v2c packet", "[snmp][codec]") {
    auto packet = snmp::EncodeGetRequest("public", 1, snmp::SYS_NAME_OID);

    const std::vector<uint8_t> expected = {
        0x30, 0x26,
        0x02, 0x01, 0x01,
        0x04, 0x06, 'p', 'u', 'b', 'l', 'i', 'c',
        0xA0, 0x19,
        0x02, 0x01, 0x01,
        0x02, 0x01, 0x00,
        0x02, 0x01, 0x00,
        0x30, 0x0E,
        0x30, 0x0C,
        0x06, 0x08, 0x2B, 0x06, 0x01, 0x02, 0x01, 0x01, 0x05, 0x00,
        0x05, 0x00};

    REQUIRE(packet == expected);
}

TEST_CASE("Integers use minimal two's complement", "[snmp][codec]") {
    std::vector<uint8_t> buf;

    snmp::AppendInteger(buf, 0);
    REQUIRE(buf == std::vector<uint8_t>{0x02, 0x01, 0x00});

    buf.clear();
    snmp::AppendInteger(buf, 128);
    REQUIRE(buf == std::vector<uint8_t>{0x02, 0x02, 0x00, 0x80});

    buf.clear();
    snmp::AppendInteger(buf, 0x1234);
    REQUIRE(buf == std::vector<uint8_t>{0x02, 0x02, 0x12, 0x34});

    buf.clear();
    snmp::AppendInteger(buf, -1);
    REQUIRE(buf == std::vector<uint8_t>{0x02, 0x01, 0xFF});

    buf.clear();
    snmp::AppendInteger(buf, 0x7FFFFFFF);
    REQUIRE(buf == std::vector<uint8_t>{0x02, 0x04, 0x7F, 0xFF, 0xFF, 0xFF});
}

TEST_CASE("Lengths above 127 use the long form", "[snmp][codec]") {
    std::vector<uint8_t> buf;
    snmp::AppendLength(buf, 200);
    REQUIRE(buf == std::vector<uint8_t>{0x81, 0xC8});

    buf.clear();
    snmp::AppendLength(buf, 0x1234);
    REQUIRE(buf == std::vector<uint8_t>{0x82, 0x12, 0x34});
}

TEST_CASE("OID arcs above 127 are base-128 encoded", "[snmp][codec]") {
    REQUIRE(snmp::EncodeOid("1.3.6.1.4.1.311") == std::vector<uint8_t>{0x2B, 0x06, 0x01, 0x04, 0x01, 0x82, 0x37});
    REQUIRE_THROWS_AS(snmp::EncodeOid("1"), std::invalid_argument);
    REQUIRE_THROWS_AS(snmp::EncodeOid("1..3"), std::invalid_argument);
    REQUIRE_THROWS_AS(snmp::EncodeOid("3.1"), std::invalid_argument);
}

TEST_CASE("Response with a string sysName decodes", "[snmp][codec]") {
    const std::vector<uint8_t> response = {
        0x30, 0x2B,
        0x02, 0x01, 0x01,
        0x04, 0x06, 'p', 'u', 'b', 'l', 'i', 'c',
        0xA2, 0x1E,
        0x02, 0x01, 0x2A,
        0x02, 0x01, 0x00,
        0x02, 0x01, 0x00,
        0x30, 0x13,
        0x30, 0x11,
        0x06, 0x08, 0x2B, 0x06, 0x01, 0x02, 0x01, 0x01, 0x05, 0x00,
        0x04, 0x05, 'h', 'o', 's', 't', '1'};

    auto message = snmp::DecodeMessage(response.data(), response.size());

    REQUIRE(message.has_value());
    REQUIRE(message->version == snmp::VERSION_2C);
    REQUIRE(message->community == "public");
    REQUIRE(message->pdu.type == snmp::tag::Response);
    REQUIRE(message->pdu.request_id == 42);
    REQUIRE(message->pdu.error_status == 0);
    REQUIRE(message->pdu.varbinds.size() == 1);
    REQUIRE(message->pdu.varbinds[0].oid == snmp::SYS_NAME_OID);
    REQUIRE(message->pdu.varbinds[0].type == snmp::tag::OctetString);
    REQUIRE(message->pdu.varbinds[0].AsString() == "host1");
}

TEST_CASE("Encoded messages decode back with long strings", "[snmp][codec]") {
    snmp::Message original;
    original.community = std::string(300, 'c');
    original.pdu.type = snmp::tag::Response;
    original.pdu.request_id = 0x01020304;

    snmp::VarBind bind;
    bind.oid = "1.3.6.1.4.1.2021.10.1.3.1";
    bind.type = snmp::tag::OctetString;
    bind.value.assign(200, 'x');
    original.pdu.varbinds.push_back(bind);

    auto bytes = snmp::EncodeMessage(original);
    auto decoded = snmp::DecodeMessage(bytes.data(), bytes.size());

    REQUIRE(decoded.has_value());
    REQUIRE(decoded->community == original.community);
    REQUIRE(decoded->pdu.request_id == 0x01020304);
    REQUIRE(decoded->pdu.varbinds[0].oid == bind.oid);
    REQUIRE(decoded->pdu.varbinds[0].value == bind.value);
}

TEST_CASE("Truncated or garbage datagrams do not decode", "[snmp][codec]") {
    auto packet = snmp::EncodeGetRequest("public", 77, snmp::SYS_NAME_OID);

    for (size_t cut = 0; cut < packet.size(); ++cut) {
        REQUIRE_FALSE(snmp::DecodeMessage(packet.data(), cut).has_value());
    }

    const std::vector<uint8_t> garbage = {0x30, 0x84, 0xFF, 0xFF, 0xFF, 0xFF, 0x02};
    REQUIRE_FALSE(snmp::DecodeMessage(garbage.data(), garbage.size()).has_value());

    const std::vector<uint8_t> not_snmp = {'h', 'e', 'l', 'l', 'o'};
    REQUIRE_FALSE(snmp::DecodeMessage(not_snmp.data(), not_snmp.size()).has_value());
}
