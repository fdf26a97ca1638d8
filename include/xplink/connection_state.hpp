/*
 * File: include/xplink/connection_state.hpp
 * Project: XPLink
 * Purpose: Connection states reported by the connection monitor
 * Last updated: 2026-10-19
 */

#pragma once

namespace xplink
{

enum class ConnectionState
{
    NoBeacon,
    ReceivingBeacon,
    RestReachable,
    RestUnreachable,
    WsConnected,
    WsDisconnected,
    Listening,
    Receiving
};

inline const char *to_string(ConnectionState s)
{
    switch (s)
    {
    case ConnectionState::NoBeacon:
        return "no beacon";
    case ConnectionState::ReceivingBeacon:
        return "receiving beacon";
    case ConnectionState::RestReachable:
        return "rest api reachable";
    case ConnectionState::RestUnreachable:
        return "rest api unreachable";
    case ConnectionState::WsConnected:
        return "websocket connected";
    case ConnectionState::WsDisconnected:
        return "websocket disconnected";
    case ConnectionState::Listening:
        return "listening for data";
    case ConnectionState::Receiving:
        return "receiving data";
    }
    return "unknown";
}

} // namespace xplink
