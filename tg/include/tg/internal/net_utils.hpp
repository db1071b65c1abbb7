/*
 * Part of the TwinGate (TG) project.
 *
 * SPDX-FileCopyrightText: 2025 TwinGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of TwinGate (TG). See LICENSE for details.
 */

#pragma once
#include <string>
#include <cstdint>
#include <sys/socket.h>

namespace tg::internal {

// Binds and listens on addr:port (port 0 = ephemeral).
// Throws std::runtime_error on failure.
int create_listen_socket(const std::string& addr, uint16_t port);

// Address actually bound by a listening socket.
bool local_endpoint(int fd, std::string& ip, int& port);

// Numeric host and port of a peer address.
std::string sockaddr_to_ip(const sockaddr_storage& ss);
int sockaddr_to_port(const sockaddr_storage& ss);

// True for accept(2) failures worth retrying after a pause
// (descriptor or buffer exhaustion, aborted handshakes, interrupts).
bool is_temporary_accept_error(int err);

// True when accept(2) failed because the listener itself is gone.
bool is_listener_gone(int err);

int set_nodelay(int s);

} // namespace tg::internal
