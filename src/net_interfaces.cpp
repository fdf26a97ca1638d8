/*
 * File: src/net_interfaces.cpp
 * Project: XPLink
 * Purpose: Local interface addresses for same-host beacon detection
 * Last updated: 2026-10-19
 */

#include "xplink/net_interfaces.hpp"
#include "xplink/logger.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <netinet/in.h>

namespace xplink
{

std::vector<std::string> list_local_ips()
{
    std::vector<std::string> out;
    ifaddrs *ifaddr = nullptr;
    if (getifaddrs(&ifaddr) != 0 || ifaddr == nullptr)
    {
        XPLINK_LOG_WARN("getifaddrs failed: {}", std::strerror(errno));
        return out;
    }

    char text[INET6_ADDRSTRLEN];
    for (auto *ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next)
    {
        if (ifa->ifa_addr == nullptr)
            continue;
        const void *src = nullptr;
        int family = ifa->ifa_addr->sa_family;
        if (family == AF_INET)
            src = &reinterpret_cast<sockaddr_in *>(ifa->ifa_addr)->sin_addr;
        else if (family == AF_INET6)
            src = &reinterpret_cast<sockaddr_in6 *>(ifa->ifa_addr)->sin6_addr;
        else
            continue;
        if (inet_ntop(family, src, text, sizeof(text)) != nullptr)
            out.emplace_back(text);
    }

    freeifaddrs(ifaddr);
    return out;
}

bool is_local_address(const std::string &host)
{
    auto ips = list_local_ips();
    return std::find(ips.begin(), ips.end(), host) != ips.end();
}

} // namespace xplink
