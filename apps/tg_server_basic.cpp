/*
 * Part of the TwinGate (TG) project.
 *
 * SPDX-FileCopyrightText: 2025 TwinGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of TwinGate (TG). See LICENSE for details.
 */

// apps/tg_server_basic.cpp
// Line relay over both listeners: every line a peer sends is rebroadcast
// to all peers of the same class.

#include "tg/base_provider.hpp"
#include "tg/credential_store.hpp"
#include "tg/log.hpp"
#include "tg/server.hpp"
#include "tg/server_config.hpp"

#include <chrono>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <csignal>
#include <pthread.h>
#include <unistd.h>   // dup2, STDOUT_FILENO, STDERR_FILENO
#include <fcntl.h>    // open

namespace {

// Silences all console output by redirecting stdout/stderr to /dev/null.
// This is process-wide and affects all library logs printing to stdio.
void make_process_quiet() {
    int nullfd = ::open("/dev/null", O_WRONLY);
    if (nullfd >= 0) {
        (void)::dup2(nullfd, STDOUT_FILENO);
        (void)::dup2(nullfd, STDERR_FILENO);
        ::close(nullfd);
    }
}

void usage(const char* argv0) {
    std::cerr <<
      "Usage:\n  " << argv0
      << " [--addr 0.0.0.0] [--port 3508] [--cluster_addr 0.0.0.0] [--cluster_port 3509]\n"
         "  [--tls_cert <crt> --tls_key <key>] [--tls_ca <ca>] [--tls_verify 0|1]\n"
         "  [--tls_timeout_ms 500]\n"
         "  [--auth 0|1] [--must_auth 0|1] [--auth_timeout_ms 1000]\n"
         "  [--client_creds <path>] [--cluster_creds <path>]   (static lists)\n"
         "  [--auth_file <path>]                               (file authenticator)\n"
         "  [--max_payload <bytes>] [--max_pending <bytes>] [--ping_interval_sec 120]\n"
         "  [--max_connections 65536] [--accept_min_sleep_ms 10] [--accept_max_sleep_ms 1000]\n"
         "  [--broadcast_strict 0|1] [--trace 0|1]\n"
         "  [--log_file log.txt] [--quiet 0|1]\n"
         "  Redis authenticator:\n"
         "    --auth_redis 1 "
         "[--redis_host 127.0.0.1] [--redis_port 6379] [--redis_db 0]\n"
         "    [--redis_password ****] [--redis_prefix tg:user:] [--redis_pool 4]\n"
         "    [--redis_timeout_ms 200] [--auth_cache_ttl 60]\n";
}

// Provider speaking newline-delimited text. Offers the credentials sent
// in the optional "AUTH <user> <password>" first line.
class RelayProvider : public tg::BaseProvider, public tg::ClientAuth {
public:
    RelayProvider(tg::Connection& conn, tg::Credential cred)
        : tg::BaseProvider(conn),
          _cred(std::move(cred)),
          _bc(conn.broadcaster),
          _cls(conn.peer_class),
          _idle_limit(std::chrono::seconds(conn.config.ping_interval_sec) * tg::DEFAULT_PING_MAX_OUT),
          _last_seen(std::chrono::steady_clock::now()) {}

    tg::Credential credentials() const override { return _cred; }

    void begin() {
        start([](tg::BaseProvider& self) {
            static_cast<RelayProvider&>(self).relay_once();
        });
    }

private:
    tg::Credential   _cred;
    tg::Broadcaster& _bc;
    tg::PeerClass    _cls;
    std::chrono::seconds _idle_limit;
    std::chrono::steady_clock::time_point _last_seen;

    void relay_once() {
        std::string line;
        switch (read_line(line, std::chrono::seconds(1))) {
        case tg::IoStatus::Ok:
            _last_seen = std::chrono::steady_clock::now();
            break;
        case tg::IoStatus::Timeout:
            // Silent for ping_interval * DEFAULT_PING_MAX_OUT: drop the peer.
            if (_idle_limit.count() > 0 &&
                std::chrono::steady_clock::now() - _last_seen > _idle_limit) {
                stop();
            }
            return;
        case tg::IoStatus::Closed:
        case tg::IoStatus::Error:
            stop();
            return;
        }
        if (line.empty()) return;

        stat().increment_request();
        const std::string out = line + "\n";
        if (_cls == tg::PeerClass::Client) {
            (void)_bc.send_to_clients(out);
        } else {
            (void)_bc.send_to_clusters(out);
        }
    }
};

// Reads the optional AUTH line. False only when the peer is gone.
bool read_auth_line(tg::Connection& conn, tg::Credential& cred) {
    std::string first;
    const auto st = conn.socket->read_line(first, tg::MAX_CONTROL_LINE_SIZE,
                                           std::chrono::milliseconds(conn.config.auth_timeout_ms));
    if (st == tg::IoStatus::Timeout) return true;   // no credentials offered
    if (st != tg::IoStatus::Ok) return false;

    std::istringstream iss(first);
    std::string verb;
    if (iss >> verb && verb == "AUTH") {
        iss >> cred.username >> cred.password;
    }
    return true;
}

std::shared_ptr<tg::Provider> make_relay(tg::Connection& conn) {
    tg::Credential cred;
    if (conn.config.authenticate && !read_auth_line(conn, cred)) {
        return nullptr;
    }
    return std::make_shared<RelayProvider>(conn, std::move(cred));
}

void start_relay(const std::shared_ptr<tg::Provider>& p) {
    if (auto r = std::dynamic_pointer_cast<RelayProvider>(p)) r->begin();
}

} // namespace

int main(int argc, char** argv) {
    tg::ServerConfig cfg;
    std::string client_creds, cluster_creds, auth_file, log_file;
    bool quiet = false, trace = false, auth_redis = false;
    tg::CredentialStore::RedisOptions redis;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            if (a == "--addr" && i+1 < argc) cfg.addr = argv[++i];
            else if (a == "--port" && i+1 < argc) cfg.port = (uint16_t)std::stoi(argv[++i]);
            else if (a == "--cluster_addr" && i+1 < argc) cfg.clusters_addr = argv[++i];
            else if (a == "--cluster_port" && i+1 < argc) cfg.clusters_port = (uint16_t)std::stoi(argv[++i]);
            else if (a == "--tls_cert" && i+1 < argc) cfg.tls_cert_file = argv[++i];
            else if (a == "--tls_key"  && i+1 < argc) cfg.tls_key_file  = argv[++i];
            else if (a == "--tls_ca"   && i+1 < argc) cfg.tls_ca_file   = argv[++i];
            else if (a == "--tls_verify" && i+1 < argc) cfg.tls_verify = (std::stoi(argv[++i]) != 0);
            else if (a == "--tls_timeout_ms" && i+1 < argc) cfg.tls_timeout_ms = std::stoi(argv[++i]);
            else if (a == "--auth" && i+1 < argc) cfg.authenticate = (std::stoi(argv[++i]) != 0);
            else if (a == "--must_auth" && i+1 < argc) cfg.must_authenticate = (std::stoi(argv[++i]) != 0);
            else if (a == "--auth_timeout_ms" && i+1 < argc) cfg.auth_timeout_ms = std::stoi(argv[++i]);
            else if (a == "--client_creds" && i+1 < argc) client_creds = argv[++i];
            else if (a == "--cluster_creds" && i+1 < argc) cluster_creds = argv[++i];
            else if (a == "--auth_file" && i+1 < argc) auth_file = argv[++i];
            else if (a == "--max_payload" && i+1 < argc) cfg.max_payload = std::stoul(argv[++i]);
            else if (a == "--max_pending" && i+1 < argc) cfg.max_pending = std::stoul(argv[++i]);
            else if (a == "--ping_interval_sec" && i+1 < argc) cfg.ping_interval_sec = std::stoi(argv[++i]);
            else if (a == "--max_connections" && i+1 < argc) cfg.max_connections = std::stoi(argv[++i]);
            else if (a == "--accept_min_sleep_ms" && i+1 < argc) cfg.accept_min_sleep_ms = std::stoi(argv[++i]);
            else if (a == "--accept_max_sleep_ms" && i+1 < argc) cfg.accept_max_sleep_ms = std::stoi(argv[++i]);
            else if (a == "--broadcast_strict" && i+1 < argc) cfg.broadcast_reports_failures = (std::stoi(argv[++i]) != 0);
            else if (a == "--trace" && i+1 < argc) trace = (std::stoi(argv[++i]) != 0);
            else if (a == "--log_file" && i+1 < argc) log_file = argv[++i];
            else if (a == "--quiet" && i+1 < argc) quiet = (std::stoi(argv[++i]) != 0);

            // Redis backend flags
            else if (a == "--auth_redis" && i+1 < argc) auth_redis = (std::stoi(argv[++i]) != 0);
            else if (a == "--redis_host" && i+1 < argc) redis.host = argv[++i];
            else if (a == "--redis_port" && i+1 < argc) redis.port = std::stoi(argv[++i]);
            else if (a == "--redis_db" && i+1 < argc)   redis.db = std::stoi(argv[++i]);
            else if (a == "--redis_password" && i+1<argc) redis.password = argv[++i];
            else if (a == "--redis_prefix" && i+1<argc)   redis.key_prefix = argv[++i];
            else if (a == "--redis_pool" && i+1<argc)     redis.pool_size = std::stoi(argv[++i]);
            else if (a == "--redis_timeout_ms" && i+1<argc) redis.timeout_ms = std::stoi(argv[++i]);
            else if (a == "--auth_cache_ttl" && i+1<argc)   redis.cache_ttl_sec = std::stoi(argv[++i]);

            else { usage(argv[0]); return 2; }
        }
    } catch (const std::exception& e) {
        std::cerr << "bad flag value: " << e.what() << "\n";
        usage(argv[0]);
        return 2;
    }

    // Apply quiet mode before any logging can occur.
    if (quiet) {
        make_process_quiet();
    }
    if (!log_file.empty()) {
        tg::set_log_file(log_file);
    }

    cfg.use_tls = !cfg.tls_cert_file.empty() || !cfg.tls_key_file.empty();
    if (cfg.use_tls && (cfg.tls_cert_file.empty() || cfg.tls_key_file.empty())) {
        std::cerr << "TLS requires both --tls_cert and --tls_key\n";
        return 2;
    }

    cfg.log = std::make_shared<tg::LineLog>();
    if (trace) cfg.trace = std::make_shared<tg::LineTrace>();

    // Block the stop signals before any thread exists; main waits for them.
    sigset_t stop_set;
    sigemptyset(&stop_set);
    sigaddset(&stop_set, SIGINT);
    sigaddset(&stop_set, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &stop_set, nullptr);

    // hiredis writes to Redis with write(2); a dropped Redis link must not
    // end the process.
    std::signal(SIGPIPE, SIG_IGN);

    try {
        if (!client_creds.empty() && !tg::load_credentials(client_creds, cfg.client_credentials)) {
            throw std::runtime_error("cannot load client credentials from " + client_creds);
        }
        if (!cluster_creds.empty() && !tg::load_credentials(cluster_creds, cfg.cluster_credentials)) {
            throw std::runtime_error("cannot load cluster credentials from " + cluster_creds);
        }
        if (auth_redis || !auth_file.empty()) {
            auto store = std::make_shared<tg::CredentialStore>();
            const bool ok = auth_redis ? store->init_redis(redis) : store->init_file(auth_file);
            if (!ok) {
                throw std::runtime_error("credential store initialization failed");
            }
            cfg.client_auth  = store;
            cfg.cluster_auth = store;
        }

        tg::Server srv(cfg);
        srv.on_client_connect(start_relay);
        srv.on_cluster_connect(start_relay);
        srv.serve_clients(make_relay);
        srv.serve_clusters(make_relay);

        const tg::BaseInfo ci = srv.client_info();
        const tg::BaseInfo ki = srv.cluster_info();
        tg::log_line("[INFO] tg_server_basic " + std::string(tg::VERSION) +
                     " clients on " + ci.ip + ":" + std::to_string(ci.port) +
                     ", clusters on " + ki.ip + ":" + std::to_string(ki.port));

        int sig = 0;
        sigwait(&stop_set, &sig);
        tg::log_line("[INFO] signal " + std::to_string(sig) + " received, shutting down");

        srv.close();

        const tg::StatSnapshot s = srv.stat().snapshot();
        tg::log_line("[INFO] totals: clients=" + std::to_string(s.total_clients) +
                     " in_msg=" + std::to_string(s.in_msg) +
                     " out_msg=" + std::to_string(s.out_msg) +
                     " in_bytes=" + std::to_string(s.in_bytes) +
                     " out_bytes=" + std::to_string(s.out_bytes));
    } catch (const std::exception& e) {
        // Note: if --quiet 1 is used, this message is suppressed as well.
        std::cerr << "[FATAL] exception: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
