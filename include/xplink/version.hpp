/*
 * File: include/xplink/version.hpp
 * Project: XPLink
 * Purpose: Natural ordering of API and simulator version strings
 * Last updated: 2026-10-19
 */

#pragma once
#include <string>
#include <vector>

namespace xplink
{

// Natural order: digit runs compare numerically, so "v10" > "v2" and "12.1.10" > "12.1.9".
// Returns <0, 0, >0 like strcmp.
int natural_compare(const std::string &a, const std::string &b);

// "12.2.0-r1" -> "12.2.0"
std::string base_version(const std::string &version);

// Newest entry by natural order, empty string if none.
std::string newest_version(const std::vector<std::string> &versions);

} // namespace xplink
