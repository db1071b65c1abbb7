/*
 * Part of the TwinGate (TG) project.
 *
 * SPDX-FileCopyrightText: 2025 TwinGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of TwinGate (TG). See LICENSE for details.
 */

#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace tg {

inline constexpr const char* VERSION = "0.1.0";

inline constexpr uint16_t DEFAULT_PORT         = 3508;
inline constexpr uint16_t DEFAULT_CLUSTER_PORT = 3509;

// Write buffer size used by BaseProvider before a flush is forced.
inline constexpr std::size_t MIN_DATA_WRITE_SIZE = 512;
inline constexpr std::size_t MAX_DATA_WRITE_SIZE = 6048;

inline constexpr std::chrono::milliseconds DEFAULT_FLUSH_DEADLINE{2000};

// Accept backoff bounds on temporary errors.
inline constexpr std::chrono::milliseconds ACCEPT_MIN_SLEEP{10};
inline constexpr std::chrono::milliseconds ACCEPT_MAX_SLEEP{1000};

inline constexpr std::size_t MAX_CONTROL_LINE_SIZE = 1024;
inline constexpr std::size_t MAX_PAYLOAD_SIZE      = 1024 * 1024;
inline constexpr std::size_t MAX_PENDING_SIZE      = 10 * 1024 * 1024;
inline constexpr int         DEFAULT_MAX_CONNECTIONS = 64 * 1024;

inline constexpr std::chrono::milliseconds TLS_TIMEOUT{500};
inline constexpr std::chrono::milliseconds AUTH_TIMEOUT{2 * TLS_TIMEOUT};
inline constexpr std::chrono::seconds      DEFAULT_PING_INTERVAL{120};
inline constexpr int                       DEFAULT_PING_MAX_OUT = 2;

// The two independent connection populations a server accepts.
enum class PeerClass { Client, Cluster };

inline const char* to_string(PeerClass c) {
    return c == PeerClass::Client ? "client" : "cluster";
}

// Username/password pair. Compared field by field.
struct Credential {
    std::string username;
    std::string password;
};

} // namespace tg
