/*
 * File: include/xplink/atomic_write.hpp
 * Project: XPLink
 * Purpose: Atomic file replacement for diagnostic dumps
 * Notes:
 *  - writes <path>.tmp, fsyncs, then rename() over the final path
 * Last updated: 2026-10-19
 */

#pragma once
#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace xplink
{

inline void write_atomic(const std::string &final_path, const std::string &data)
{
    const std::string tmp = final_path + ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs)
            throw std::runtime_error("open tmp failed: " + tmp);
        ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
        ofs.flush();
        if (!ofs)
            throw std::runtime_error("write tmp failed: " + tmp);
    }
    int fd = ::open(tmp.c_str(), O_RDONLY);
    if (fd >= 0)
    {
        ::fsync(fd);
        ::close(fd);
    }
    if (::rename(tmp.c_str(), final_path.c_str()) != 0)
    {
        std::remove(tmp.c_str());
        throw std::runtime_error("rename tmp->dst failed: " + final_path);
    }
}

} // namespace xplink
