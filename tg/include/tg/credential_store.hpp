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
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// hiredis types live in the global namespace; include the header here
#include <hiredis/hiredis.h>

#include "tg/provider.hpp"
#include "tg/types.hpp"

namespace tg {

/**
 * Username -> password store usable as a pluggable Authenticator.
 * Backed by a flat file or by Redis (GET <prefix><username>). Accepted
 * Redis logins are remembered for cache_ttl_sec as a SHA-256 digest of
 * the password, so a repeated login skips the round trip. Thread-safe.
 */
class CredentialStore : public Authenticator {
public:
    CredentialStore();
    ~CredentialStore() override;

    CredentialStore(const CredentialStore&) = delete;
    CredentialStore& operator=(const CredentialStore&) = delete;

    // ---- File backend: "username password" per line, '#' comments ----
    bool init_file(const std::string& path);

    // ---- Redis backend ----
    struct RedisOptions {
        std::string host = "127.0.0.1";
        int         port = 6379;
        int         db   = 0;                 // SELECT db
        std::string password;                 // optional AUTH
        std::string key_prefix = "tg:user:";  // key = key_prefix + username
        int         pool_size  = 4;           // number of hiredis connections
        int         timeout_ms = 200;         // connect + command timeout
        int         cache_ttl_sec = 60;       // 0 disables the verdict cache
    };
    bool init_redis(const RedisOptions& opt);

    // Stored password for `username`, uncached.
    bool lookup(const std::string& username, std::string& out_password);

    bool authenticate(const ClientAuth& who) override;

    std::size_t file_entries() const;

private:
    enum class Backend { None, File, Redis };
    Backend _backend = Backend::None;

    mutable std::mutex _file_mtx;
    std::unordered_map<std::string, std::string> _file_map;

    struct RedisFree {
        void operator()(::redisContext* c) const { redisFree(c); }
    };
    using RedisPtr = std::unique_ptr<::redisContext, RedisFree>;

    RedisOptions _opt{};

    // Idle connections. A null entry is a broken link that the next
    // borrower replaces; the vector never holds more than pool_size.
    std::mutex              _pool_mtx;
    std::condition_variable _pool_cv;
    std::vector<RedisPtr>   _idle;

    // Borrows one pool entry for the lifetime of a single lookup.
    class Lease {
    public:
        explicit Lease(CredentialStore& s);
        ~Lease();
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        // Connected context or nullptr when Redis is unreachable.
        ::redisContext* get();

    private:
        CredentialStore& _store;
        RedisPtr _conn;
    };

    struct Verdict {
        std::string digest;
        std::chrono::steady_clock::time_point expires;
    };
    std::mutex _cache_mtx;
    std::unordered_map<std::string, Verdict> _cache;

    RedisPtr redis_connect() const;
    std::optional<std::string> redis_fetch(const std::string& username);
    std::optional<std::string> fetch(const std::string& username);

    bool cached_accept(const std::string& username, const std::string& digest);
    void remember(const std::string& username, std::string digest);
};

// Parses a credential file ("username password" lines) into `out`.
// Returns false (and logs) on unreadable files or malformed lines.
bool load_credentials(const std::string& path, std::vector<Credential>& out);

} // namespace tg
