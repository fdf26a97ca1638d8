/*
 * File: include/xplink/beacon_codec.hpp
 * Project: XPLink
 * Purpose: UDP discovery beacon packet codec
 * Notes:
 *  - "BECN\0" + little-endian packed record + NUL-terminated hostname
 *  - supported: major 1, minor <= 2, host id 1 (simulator, not the editor)
 * Last updated: 2026-10-19
 */

#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace xplink
{

struct BeaconData
{
    std::string host; // sender address, not part of the packet
    uint16_t port{0};
    std::string hostname;
    int32_t simulator_version{0};
    uint32_t role{0};

    bool operator==(const BeaconData &o) const
    {
        return host == o.host && port == o.port && hostname == o.hostname &&
               simulator_version == o.simulator_version && role == o.role;
    }
    bool operator!=(const BeaconData &o) const { return !(*this == o); }
};

constexpr std::array<char, 5> kBeaconMagic{{'B', 'E', 'C', 'N', '\0'}};
constexpr std::size_t kBeaconRecordSize = 16; // 1+1+4+4+4+2
constexpr std::size_t kBeaconHeaderSize = kBeaconMagic.size() + kBeaconRecordSize;

constexpr uint8_t kBeaconMajor = 1;
constexpr uint8_t kBeaconMaxMinor = 2;
constexpr int32_t kBeaconSimulatorHostId = 1;

/**
 * Decode a beacon datagram.
 *
 * @param sender_host address the datagram came from, copied into BeaconData::host
 * @throws DecodeError        magic mismatch or truncated record
 * @throws UnsupportedVersion valid packet from an unsupported beacon version or host type
 */
BeaconData decode_beacon(const uint8_t *data, std::size_t size, const std::string &sender_host);

inline BeaconData decode_beacon(const std::vector<uint8_t> &packet, const std::string &sender_host)
{
    return decode_beacon(packet.data(), packet.size(), sender_host);
}

std::vector<uint8_t> encode_beacon(const BeaconData &data,
                                   uint8_t major = kBeaconMajor,
                                   uint8_t minor = kBeaconMaxMinor,
                                   int32_t host_id = kBeaconSimulatorHostId);

std::string to_string(const BeaconData &data);

} // namespace xplink
