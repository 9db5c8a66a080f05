#include <catch2/catch_test_macros.hpp>
#include "common/Ipv4Address.hpp"

using namespace host_sweep::common;

TEST_CASE("Ipv4Address parses dotted quads", "[address]") {
    auto address = Ipv4Address::Parse("192.168.1.10");

    REQUIRE(address.has_value());
    REQUIRE(address->Value() == 0xC0A8010Au);
    REQUIRE(address->Octet(0) == 192);
    REQUIRE(address->Octet(3) == 10);
    REQUIRE(address->ToString() == "192.168.1.10");
}

TEST_CASE("Ipv4Address rejects anything but a dotted quad", "[address]") {
    REQUIRE_FALSE(Ipv4Address::Parse("").has_value());
    REQUIRE_FALSE(Ipv4Address::Parse("10.0.0").has_value());
    REQUIRE_FALSE(Ipv4Address::Parse("10.0.0.256").has_value());
    REQUIRE_FALSE(Ipv4Address::Parse("10.0.0.1/24").has_value());
    REQUIRE_FALSE(Ipv4Address::Parse("host.example").has_value());
}

TEST_CASE("Ipv4Address built from octets orders numerically", "[address]") {
    auto low = Ipv4Address::FromOctets(10, 0, 0, 255);
    auto high = Ipv4Address::FromOctets(10, 0, 1, 0);

    REQUIRE(low < high);
    REQUIRE(Ipv4Address(low.Value() + 1) == high);
    REQUIRE(high.ToString() == "10.0.1.0");
}
