/*
 * Part of the TwinGate (TG) project.
 *
 * SPDX-FileCopyrightText: 2025 TwinGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of TwinGate (TG). See LICENSE for details.
 */

#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "tg/log.hpp"
#include "tg/provider.hpp"
#include "tg/types.hpp"

namespace tg {

struct ServerConfig {
    // Client listener. Port 0 binds an ephemeral port.
    std::string addr = "0.0.0.0";
    uint16_t    port = DEFAULT_PORT;

    // Cluster listener
    std::string clusters_addr = "0.0.0.0";
    uint16_t    clusters_port = DEFAULT_CLUSTER_PORT;

    // TLS (applies to both listeners)
    bool        use_tls = false;
    std::string tls_cert_file;
    std::string tls_key_file;
    std::string tls_ca_file;
    bool        tls_verify = false;   // require a client certificate
    int         tls_timeout_ms = static_cast<int>(TLS_TIMEOUT.count());

    // Authentication
    bool authenticate      = false;
    bool must_authenticate = false;
    std::vector<Credential> client_credentials;
    std::vector<Credential> cluster_credentials;
    std::shared_ptr<Authenticator> client_auth;
    std::shared_ptr<Authenticator> cluster_auth;

    // Limits
    std::size_t max_payload       = MAX_PAYLOAD_SIZE;
    std::size_t max_pending       = MAX_PENDING_SIZE;
    int         ping_interval_sec = static_cast<int>(DEFAULT_PING_INTERVAL.count());
    int         auth_timeout_ms   = static_cast<int>(AUTH_TIMEOUT.count());
    int         max_connections   = DEFAULT_MAX_CONNECTIONS;   // per class; 0 = unlimited

    // Accept backoff on temporary errors
    int accept_min_sleep_ms = static_cast<int>(ACCEPT_MIN_SLEEP.count());
    int accept_max_sleep_ms = static_cast<int>(ACCEPT_MAX_SLEEP.count());

    // When true, send_to_clients/send_to_clusters return false if any
    // recipient failed. Failures are always logged.
    bool broadcast_reports_failures = false;

    // Sinks; null means no-op.
    std::shared_ptr<Log>   log;
    std::shared_ptr<Trace> trace;

    // Installs no-op sinks where unset.
    void init_log_and_trace();

    // Static credential lists; exact match, first hit wins.
    bool match_client_credentials(const Credential& c) const;
    bool match_cluster_credentials(const Credential& c) const;
};

// Exact username/password equality, password compared in constant time.
bool match_credentials(const std::vector<Credential>& list, const Credential& c);

} // namespace tg
