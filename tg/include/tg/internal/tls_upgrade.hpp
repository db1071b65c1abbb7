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
#include <string>
#include <openssl/ssl.h>
#include "tg/log.hpp"
#include "tg/socket.hpp"

namespace tg::internal {

// Wraps `sock` as a TLS server session and runs the handshake under a
// deadline. A watchdog thread shuts the socket down if the handshake is
// still pending when the deadline passes. On failure the socket is
// closed and false is returned.
bool upgrade_to_tls(Socket& sock, SSL_CTX* ctx, std::chrono::milliseconds timeout,
                    Log& log, const std::string& target, const std::string& peer);

} // namespace tg::internal
