/*
 * File: include/xplink/errors.hpp
 * Project: XPLink
 * Purpose: Exception types raised by the runtime
 * Notes:
 *  - TransportError is retried by the owning loop, never fatal
 *  - ContractError subclasses always reach the caller
 * Last updated: 2026-10-19
 */

#pragma once
#include <stdexcept>
#include <string>

namespace xplink
{

class Error : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Malformed beacon packet or WebSocket frame.
class DecodeError : public Error
{
public:
    using Error::Error;
};

// Well-formed beacon with a version this client does not speak.
class UnsupportedVersion : public Error
{
public:
    UnsupportedVersion(int major, int minor, int host_id)
        : Error("unsupported beacon version " + std::to_string(major) + "." + std::to_string(minor) +
                " host " + std::to_string(host_id)),
          major_(major), minor_(minor), host_id_(host_id) {}

    int major() const { return major_; }
    int minor() const { return minor_; }
    int host_id() const { return host_id_; }

private:
    int major_;
    int minor_;
    int host_id_;
};

// Socket, HTTP or WebSocket failure.
class TransportError : public Error
{
public:
    using Error::Error;
};

class ContractError : public Error
{
public:
    using Error::Error;
};

class NotConnected : public ContractError
{
public:
    NotConnected() : ContractError("not connected to simulator") {}
};

class UnknownPath : public ContractError
{
public:
    explicit UnknownPath(const std::string &path)
        : ContractError("unknown path " + path), path_(path) {}
    const std::string &path() const { return path_; }

private:
    std::string path_;
};

class NotWritable : public ContractError
{
public:
    explicit NotWritable(const std::string &path)
        : ContractError("dataref " + path + " is not writable"), path_(path) {}
    const std::string &path() const { return path_; }

private:
    std::string path_;
};

} // namespace xplink
