/*
 * File: include/xplink/net_interfaces.hpp
 * Project: XPLink
 * Purpose: Local interface addresses for same-host beacon detection
 * Last updated: 2026-10-19
 */

#pragma once
#include <string>
#include <vector>

namespace xplink
{

// Addresses of every local interface, IPv4 and IPv6, loopback included.
std::vector<std::string> list_local_ips();

// True when `host` is one of list_local_ips().
bool is_local_address(const std::string &host);

} // namespace xplink
