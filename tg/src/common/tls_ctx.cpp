/*
 * Part of the TwinGate (TG) project.
 *
 * SPDX-FileCopyrightText: 2025 TwinGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of TwinGate (TG). See LICENSE for details.
 */

#include "tg/internal/tls_ctx.hpp"
#include "tg/internal/utils.hpp"

#include <stdexcept>
#include <openssl/err.h>

namespace tg::internal {

TlsContext::TlsContext(const tg::ServerConfig& cfg) {
    if (cfg.tls_cert_file.empty() || cfg.tls_key_file.empty()) {
        throw std::runtime_error("TLS enabled but certificate or key path is empty");
    }

    const SSL_METHOD* method = TLS_server_method();
    _ctx = SSL_CTX_new(method);
    if (!_ctx) {
        fail("SSL_CTX_new");
    }

    // TLS1.2+
    if (!SSL_CTX_set_min_proto_version(_ctx, TLS1_2_VERSION)) {
        fail("set_min_proto");
    }

    // certificates
    if (SSL_CTX_use_certificate_chain_file(_ctx, cfg.tls_cert_file.c_str()) != 1) {
        fail("use_certificate_chain_file");
    }
    if (SSL_CTX_use_PrivateKey_file(_ctx, cfg.tls_key_file.c_str(), SSL_FILETYPE_PEM) != 1) {
        fail("use_privatekey_file");
    }
    if (SSL_CTX_check_private_key(_ctx) != 1) {
        fail("check_private_key");
    }

    if (!cfg.tls_ca_file.empty()) {
        if (SSL_CTX_load_verify_locations(_ctx, cfg.tls_ca_file.c_str(), nullptr) != 1) {
            fail("load_verify_locations");
        }
        int vmode = SSL_VERIFY_PEER;
        if (cfg.tls_verify) vmode |= SSL_VERIFY_FAIL_IF_NO_PEER_CERT;
        SSL_CTX_set_verify(_ctx, vmode, nullptr);
    }

    // session cache
    SSL_CTX_set_session_cache_mode(_ctx, SSL_SESS_CACHE_SERVER);
    const unsigned char sid_ctx[] = "tg_server_sid_ctx_v1";
    SSL_CTX_set_session_id_context(_ctx, sid_ctx, (unsigned int)sizeof(sid_ctx));
}

TlsContext::~TlsContext() {
    if (_ctx) {
        SSL_CTX_free(_ctx);
        _ctx = nullptr;
    }
}

void TlsContext::fail(const char* where) {
    std::string detail = ssl_error_queue();
    if (_ctx) {
        SSL_CTX_free(_ctx);
        _ctx = nullptr;
    }
    throw std::runtime_error(std::string("TLS setup failed at ") + where +
                             (detail.empty() ? "" : ": " + detail));
}

} // namespace tg::internal
