/*
 * File: src/beacon_codec.cpp
 * Project: XPLink
 * Purpose: UDP discovery beacon packet codec
 * Last updated: 2026-10-19
 */

#include "xplink/beacon_codec.hpp"
#include "xplink/errors.hpp"

#include <algorithm>
#include <cstring>
#include <sstream>
#include <type_traits>

namespace xplink
{

namespace
{

// explicit little-endian, independent of host byte order
template <typename T>
T read_le(const uint8_t *p)
{
    using U = std::make_unsigned_t<T>;
    U v = 0;
    for (std::size_t i = 0; i < sizeof(T); ++i)
        v |= static_cast<U>(static_cast<U>(p[i]) << (8 * i));
    return static_cast<T>(v);
}

template <typename T>
void write_le(std::vector<uint8_t> &out, T value)
{
    using U = std::make_unsigned_t<T>;
    U v = static_cast<U>(value);
    for (std::size_t i = 0; i < sizeof(T); ++i)
        out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
}

} // namespace

BeaconData decode_beacon(const uint8_t *data, std::size_t size, const std::string &sender_host)
{
    if (size < kBeaconMagic.size() || std::memcmp(data, kBeaconMagic.data(), kBeaconMagic.size()) != 0)
        throw DecodeError("beacon: bad magic header from " + sender_host + " (" + std::to_string(size) + " bytes)");
    if (size < kBeaconHeaderSize)
        throw DecodeError("beacon: truncated record (" + std::to_string(size) + " bytes)");

    const uint8_t *p = data + kBeaconMagic.size();
    const uint8_t major = p[0];
    const uint8_t minor = p[1];
    const int32_t host_id = read_le<int32_t>(p + 2);
    const int32_t version = read_le<int32_t>(p + 6);
    const uint32_t role = read_le<uint32_t>(p + 10);
    const uint16_t port = read_le<uint16_t>(p + 14);

    if (major != kBeaconMajor || minor > kBeaconMaxMinor || host_id != kBeaconSimulatorHostId)
        throw UnsupportedVersion(major, minor, host_id);

    const uint8_t *name_begin = data + kBeaconHeaderSize;
    const uint8_t *name_end = std::find(name_begin, data + size, uint8_t{0});

    BeaconData out;
    out.host = sender_host;
    out.port = port;
    out.hostname.assign(reinterpret_cast<const char *>(name_begin), static_cast<std::size_t>(name_end - name_begin));
    out.simulator_version = version;
    out.role = role;
    return out;
}

std::vector<uint8_t> encode_beacon(const BeaconData &data, uint8_t major, uint8_t minor, int32_t host_id)
{
    std::vector<uint8_t> out(kBeaconMagic.begin(), kBeaconMagic.end());
    out.reserve(kBeaconHeaderSize + data.hostname.size() + 1);
    out.push_back(major);
    out.push_back(minor);
    write_le(out, host_id);
    write_le(out, data.simulator_version);
    write_le(out, data.role);
    write_le(out, data.port);
    out.insert(out.end(), data.hostname.begin(), data.hostname.end());
    out.push_back(0);
    return out;
}

std::string to_string(const BeaconData &data)
{
    std::ostringstream oss;
    oss << data.hostname << " at " << data.host << ":" << data.port
        << " version " << data.simulator_version << " role " << data.role;
    return oss.str();
}

} // namespace xplink
