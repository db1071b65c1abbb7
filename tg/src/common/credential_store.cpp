/*
 * Part of the TwinGate (TG) project.
 *
 * SPDX-FileCopyrightText: 2025 TwinGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of TwinGate (TG). See LICENSE for details.
 */

#include "tg/credential_store.hpp"
#include "tg/log.hpp"
#include "tg/internal/utils.hpp"

#include <fstream>
#include <sstream>
#include <sys/time.h>

#include <openssl/evp.h>

namespace tg {

/* ---------------- Credential file format ---------------- */

// "username password" per line; blank lines and '#' comments skipped.
static bool parse_credential_file(const std::string& path,
                                  std::vector<Credential>& out)
{
    std::ifstream in(path);
    if (!in.good()) {
        log_line("[AUTH] failed to open file: " + path);
        return false;
    }
    std::vector<Credential> tmp;
    size_t line_no = 0;
    for (std::string line; std::getline(in, line); ) {
        ++line_no;
        internal::trim_inplace(line);
        if (line.empty() || line[0] == '#') continue;

        std::istringstream iss(line);
        Credential c;
        std::string extra;
        if (!(iss >> c.username >> c.password) || (iss >> extra)) {
            log_line("[AUTH] bad line " + std::to_string(line_no) + " in " + path);
            return false;
        }
        tmp.push_back(std::move(c));
    }
    out.swap(tmp);
    return true;
}

bool load_credentials(const std::string& path, std::vector<Credential>& out) {
    std::vector<Credential> tmp;
    if (!parse_credential_file(path, tmp)) return false;
    out.insert(out.end(), tmp.begin(), tmp.end());
    log_line("[AUTH] loaded " + std::to_string(tmp.size()) + " credentials from " + path);
    return true;
}

CredentialStore::CredentialStore() = default;

CredentialStore::~CredentialStore() = default;

/* ---------------- File backend ---------------- */

bool CredentialStore::init_file(const std::string& path) {
    std::vector<Credential> list;
    if (!parse_credential_file(path, list)) return false;

    std::unordered_map<std::string, std::string> tmp;
    for (auto& c : list) {
        // Later lines override earlier ones for the same user.
        tmp[c.username] = std::move(c.password);
    }
    std::size_t n = 0;
    {
        std::lock_guard<std::mutex> lk(_file_mtx);
        _file_map.swap(tmp);
        n = _file_map.size();
        _backend = Backend::File;
    }
    log_line("[AUTH] file backend initialized: " + std::to_string(n) + " entries");
    return true;
}

std::size_t CredentialStore::file_entries() const {
    std::lock_guard<std::mutex> lk(_file_mtx);
    return _file_map.size();
}

/* ---------------- Redis backend ---------------- */

namespace {

struct ReplyFree {
    void operator()(redisReply* r) const { freeReplyObject(r); }
};
using ReplyPtr = std::unique_ptr<redisReply, ReplyFree>;

// Binary-safe command; nullptr when the connection failed.
ReplyPtr run(::redisContext* c, const std::vector<std::string>& args) {
    std::vector<const char*> argv;
    std::vector<size_t> lens;
    for (const auto& a : args) {
        argv.push_back(a.data());
        lens.push_back(a.size());
    }
    return ReplyPtr(static_cast<redisReply*>(
        redisCommandArgv(c, static_cast<int>(args.size()), argv.data(), lens.data())));
}

std::string reply_error(::redisContext* c, const redisReply* r) {
    if (!r) return c->errstr[0] ? c->errstr : "no reply";
    return r->str ? std::string(r->str, r->len) : "error reply";
}

std::string sha256(const std::string& s) {
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_Digest(s.data(), s.size(), md, &len, EVP_sha256(), nullptr) != 1) {
        return std::string();
    }
    return std::string(reinterpret_cast<const char*>(md), len);
}

} // namespace

bool CredentialStore::init_redis(const RedisOptions& opt) {
    _opt = opt;
    if (_opt.pool_size <= 0) _opt.pool_size = 1;
    if (_opt.timeout_ms <= 0) _opt.timeout_ms = 200;

    // Every connection is opened up front; at least one has to work.
    std::vector<RedisPtr> conns;
    std::size_t live = 0;
    for (int i = 0; i < _opt.pool_size; ++i) {
        conns.push_back(redis_connect());
        if (conns.back()) ++live;
    }
    if (live == 0) {
        log_line("[AUTH][redis] no connection to " + _opt.host + ":" + std::to_string(_opt.port));
        return false;
    }
    {
        std::lock_guard<std::mutex> lk(_pool_mtx);
        _idle.swap(conns);
    }
    {
        std::lock_guard<std::mutex> lk(_cache_mtx);
        _cache.clear();
    }
    _backend = Backend::Redis;
    log_line("[AUTH] redis backend initialized: pool=" + std::to_string(_opt.pool_size) +
             " live=" + std::to_string(live) +
             " host=" + _opt.host + ":" + std::to_string(_opt.port) +
             " db=" + std::to_string(_opt.db) +
             " prefix=" + _opt.key_prefix +
             " cache_ttl=" + std::to_string(_opt.cache_ttl_sec) + "s");
    return true;
}

CredentialStore::RedisPtr CredentialStore::redis_connect() const {
    timeval tv{};
    tv.tv_sec  = _opt.timeout_ms / 1000;
    tv.tv_usec = (_opt.timeout_ms % 1000) * 1000;

    RedisPtr c(redisConnectWithTimeout(_opt.host.c_str(), _opt.port, tv));
    if (!c || c->err) {
        log_line(std::string("[AUTH][redis] connect error: ") + (c ? c->errstr : "no context"));
        return nullptr;
    }
    if (redisSetTimeout(c.get(), tv) != REDIS_OK) {
        log_line("[AUTH][redis] cannot set command timeout");
        return nullptr;
    }

    std::vector<std::vector<std::string>> setup;
    if (!_opt.password.empty()) setup.push_back({"AUTH", _opt.password});
    if (_opt.db != 0) setup.push_back({"SELECT", std::to_string(_opt.db)});
    for (const auto& cmd : setup) {
        ReplyPtr r = run(c.get(), cmd);
        if (!r || r->type == REDIS_REPLY_ERROR) {
            log_line("[AUTH][redis] " + cmd[0] + " failed: " + reply_error(c.get(), r.get()));
            return nullptr;
        }
    }
    return c;
}

CredentialStore::Lease::Lease(CredentialStore& s) : _store(s) {
    std::unique_lock<std::mutex> lk(_store._pool_mtx);
    _store._pool_cv.wait(lk, [this] { return !_store._idle.empty(); });
    _conn = std::move(_store._idle.back());
    _store._idle.pop_back();
}

CredentialStore::Lease::~Lease() {
    // A connection that saw an I/O or protocol error is not reused.
    if (_conn && _conn->err) _conn.reset();
    {
        std::lock_guard<std::mutex> lk(_store._pool_mtx);
        _store._idle.push_back(std::move(_conn));
    }
    _store._pool_cv.notify_one();
}

::redisContext* CredentialStore::Lease::get() {
    if (!_conn || _conn->err) _conn = _store.redis_connect();
    return _conn.get();
}

std::optional<std::string> CredentialStore::redis_fetch(const std::string& username) {
    Lease lease(*this);
    ::redisContext* c = lease.get();
    if (!c) return std::nullopt;

    ReplyPtr r = run(c, {"GET", _opt.key_prefix + username});
    if (!r || r->type == REDIS_REPLY_ERROR) {
        log_line("[AUTH][redis] GET failed: " + reply_error(c, r.get()));
        return std::nullopt;
    }
    if (r->type != REDIS_REPLY_STRING) return std::nullopt;
    return std::string(r->str, r->len);
}

bool CredentialStore::cached_accept(const std::string& username, const std::string& digest) {
    std::lock_guard<std::mutex> lk(_cache_mtx);
    auto it = _cache.find(username);
    if (it == _cache.end()) return false;
    if (std::chrono::steady_clock::now() >= it->second.expires) {
        _cache.erase(it);
        return false;
    }
    return internal::ct_equal(it->second.digest, digest);
}

void CredentialStore::remember(const std::string& username, std::string digest) {
    std::lock_guard<std::mutex> lk(_cache_mtx);
    _cache[username] = Verdict{
        std::move(digest),
        std::chrono::steady_clock::now() + std::chrono::seconds(_opt.cache_ttl_sec)
    };
}

/* ---------------- Lookup ---------------- */

std::optional<std::string> CredentialStore::fetch(const std::string& username) {
    if (_backend == Backend::File) {
        std::lock_guard<std::mutex> lk(_file_mtx);
        auto it = _file_map.find(username);
        if (it == _file_map.end()) return std::nullopt;
        return it->second;
    }
    if (_backend == Backend::Redis) return redis_fetch(username);
    return std::nullopt;
}

bool CredentialStore::lookup(const std::string& username, std::string& out_password) {
    std::optional<std::string> pw = fetch(username);
    if (!pw) return false;
    out_password = std::move(*pw);
    return true;
}

bool CredentialStore::authenticate(const ClientAuth& who) {
    const Credential c = who.credentials();
    if (c.username.empty()) return false;

    const bool cache = _backend == Backend::Redis && _opt.cache_ttl_sec > 0;
    const std::string digest = cache ? sha256(c.password) : std::string();
    if (cache && !digest.empty() && cached_accept(c.username, digest)) return true;

    const std::optional<std::string> expected = fetch(c.username);
    if (!expected) {
        log_line("[AUTH] unknown user: " + c.username);
        return false;
    }
    if (!internal::ct_equal(*expected, c.password)) {
        log_line("[AUTH] bad password for user: " + c.username);
        return false;
    }
    if (cache && !digest.empty()) remember(c.username, digest);
    return true;
}

} // namespace tg
