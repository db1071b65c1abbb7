/*
 * Part of the TwinGate (TG) project.
 *
 * SPDX-FileCopyrightText: 2025 TwinGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of TwinGate (TG). See LICENSE for details.
 */

#pragma once
#include <memory>
#include <string>
#include <openssl/ssl.h>
#include "tg/server_config.hpp"

namespace tg::internal {

// Lightweight RAII wrapper over the server SSL_CTX.
// Throws std::runtime_error when the certificate, key or CA cannot be used.
class TlsContext {
public:
    explicit TlsContext(const tg::ServerConfig& cfg);
    ~TlsContext();

    SSL_CTX* ctx() const { return _ctx; }

    // non-copyable
    TlsContext(const TlsContext&) = delete;
    TlsContext& operator=(const TlsContext&) = delete;

private:
    SSL_CTX* _ctx = nullptr;

    [[noreturn]] void fail(const char* where);
};

} // namespace tg::internal
