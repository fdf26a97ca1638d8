/*
 * File: tests/test_beacon_codec.cpp
 * Project: XPLink
 * Purpose: Beacon packet decoding and encoding
 * Last updated: 2026-10-19
 */

#include <catch2/catch_all.hpp>

#include "xplink/beacon_codec.hpp"
#include "xplink/errors.hpp"

using namespace xplink;

namespace
{
BeaconData sample()
{
    BeaconData b;
    b.host = "192.168.1.20";
    b.port = 49000;
    b.hostname = "sim-rig";
    b.simulator_version = 121400;
    b.role = 1;
    return b;
}
} // namespace

TEST_CASE("beacon encode then decode recovers every field")
{
    auto b = sample();
    auto packet = encode_beacon(b);
    REQUIRE(packet.size() == kBeaconHeaderSize + b.hostname.size() + 1);
    REQUIRE(decode_beacon(packet, "192.168.1.20") == b);
}

TEST_CASE("beacon fields are little endian at fixed offsets")
{
    auto packet = encode_beacon(sample());
    REQUIRE(std::string(packet.begin(), packet.begin() + 4) == "BECN");
    REQUIRE(packet[4] == 0);
    REQUIRE(packet[5] == 1); // major
    REQUIRE(packet[6] == 2); // minor
    REQUIRE(packet[7] == 1); // host id, low byte first
    REQUIRE(packet[8] == 0);
    // port 49000 = 0xBF68
    REQUIRE(packet[19] == 0x68);
    REQUIRE(packet[20] == 0xBF);
    REQUIRE(packet[21] == 's');
    REQUIRE(packet.back() == 0);
}

TEST_CASE("major version 2 is unsupported, not a decode error")
{
    auto packet = encode_beacon(sample(), 2, 0, 1);
    bool unsupported = false;
    try
    {
        decode_beacon(packet, "10.0.0.1");
    }
    catch (const UnsupportedVersion &e)
    {
        unsupported = true;
        REQUIRE(e.major() == 2);
    }
    catch (const DecodeError &)
    {
        FAIL("reported as a decode error");
    }
    REQUIRE(unsupported);
}

TEST_CASE("minor above 2 and foreign host ids are unsupported")
{
    REQUIRE_THROWS_AS(decode_beacon(encode_beacon(sample(), 1, 3, 1), "h"), UnsupportedVersion);
    REQUIRE_THROWS_AS(decode_beacon(encode_beacon(sample(), 1, 2, 2), "h"), UnsupportedVersion);
    REQUIRE_NOTHROW(decode_beacon(encode_beacon(sample(), 1, 1, 1), "h"));
}

TEST_CASE("bad magic and truncated packets are decode errors")
{
    auto packet = encode_beacon(sample());
    auto bad = packet;
    bad[0] = 'X';
    REQUIRE_THROWS_AS(decode_beacon(bad, "h"), DecodeError);

    std::vector<uint8_t> shortp(packet.begin(), packet.begin() + 12);
    REQUIRE_THROWS_AS(decode_beacon(shortp, "h"), DecodeError);

    REQUIRE_THROWS_AS(decode_beacon(std::vector<uint8_t>{}, "h"), DecodeError);
}

TEST_CASE("hostname without terminator runs to the end of the packet")
{
    auto packet = encode_beacon(sample());
    packet.pop_back();
    REQUIRE(decode_beacon(packet, "h").hostname == "sim-rig");
}
