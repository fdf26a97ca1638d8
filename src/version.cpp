/*
 * File: src/version.cpp
 * Project: XPLink
 * Purpose: Natural ordering of API and simulator version strings
 * Last updated: 2026-10-19
 */

#include "xplink/version.hpp"

#include <algorithm>
#include <cctype>

namespace xplink
{

namespace
{

bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

} // namespace

int natural_compare(const std::string &a, const std::string &b)
{
    std::size_t i = 0, j = 0;
    while (i < a.size() && j < b.size())
    {
        if (is_digit(a[i]) && is_digit(b[j]))
        {
            // skip leading zeros, then longer run wins, then lexical
            while (i < a.size() && a[i] == '0')
                ++i;
            while (j < b.size() && b[j] == '0')
                ++j;
            std::size_t si = i, sj = j;
            while (i < a.size() && is_digit(a[i]))
                ++i;
            while (j < b.size() && is_digit(b[j]))
                ++j;
            std::size_t la = i - si, lb = j - sj;
            if (la != lb)
                return la < lb ? -1 : 1;
            int c = a.compare(si, la, b, sj, lb);
            if (c != 0)
                return c < 0 ? -1 : 1;
            continue;
        }
        if (a[i] != b[j])
            return static_cast<unsigned char>(a[i]) < static_cast<unsigned char>(b[j]) ? -1 : 1;
        ++i;
        ++j;
    }
    if (i < a.size())
        return 1;
    if (j < b.size())
        return -1;
    return 0;
}

std::string base_version(const std::string &version)
{
    std::size_t n = 0;
    while (n < version.size() && (is_digit(version[n]) || version[n] == '.'))
        ++n;
    std::string out = version.substr(0, n);
    while (!out.empty() && out.back() == '.')
        out.pop_back();
    return out;
}

std::string newest_version(const std::vector<std::string> &versions)
{
    auto it = std::max_element(versions.begin(), versions.end(),
                               [](const std::string &x, const std::string &y)
                               { return natural_compare(x, y) < 0; });
    return it == versions.end() ? std::string() : *it;
}

} // namespace xplink
