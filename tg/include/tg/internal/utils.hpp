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
#include <cstddef>

namespace tg::internal {

// Trim spaces from both sides (in-place).
void trim_inplace(std::string& s);

std::string bytes_to_hex(const unsigned char* p, std::size_t n);

// Random RFC 4122 version-4 UUID text. Uses OpenSSL's CSPRNG.
std::string random_uuid();

// Constant-time equality (length leaks, contents do not).
bool ct_equal(const std::string& a, const std::string& b);

// Drains the OpenSSL error queue into one line; empty when queue is empty.
std::string ssl_error_queue();

} // namespace tg::internal
