/*
 * Part of the TwinGate (TG) project.
 *
 * SPDX-FileCopyrightText: 2025 TwinGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of TwinGate (TG). See LICENSE for details.
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "tg/credential_store.hpp"
#include "tg/internal/net_utils.hpp"
#include "test_support.hpp"

#include <map>

#include <poll.h>

using tg_test::TempFile;

namespace {

class Who : public tg::ClientAuth {
public:
    Who(std::string u, std::string p) : _c{std::move(u), std::move(p)} {}
    tg::Credential credentials() const override { return _c; }

private:
    tg::Credential _c;
};

// Loopback stand-in for Redis that speaks just enough RESP for the store.
// AUTH checks `password`, SELECT always succeeds and GET answers from
// `data`. Serves one connection at a time.
class FakeRedis {
public:
    FakeRedis(std::map<std::string, std::string> data, std::string password = "")
        : _data(std::move(data)), _password(std::move(password)) {
        _fd = tg::internal::create_listen_socket("127.0.0.1", 0);
        std::string ip;
        (void)tg::internal::local_endpoint(_fd, ip, _port);
        _th = std::thread([this] { serve(); });
    }

    ~FakeRedis() {
        _stop = true;
        _th.join();
        ::close(_fd);
    }

    FakeRedis(const FakeRedis&) = delete;
    FakeRedis& operator=(const FakeRedis&) = delete;

    int port() const { return _port; }

    int count(const std::string& cmd) const {
        std::lock_guard<std::mutex> lk(_mtx);
        auto it = _counts.find(cmd);
        return it == _counts.end() ? 0 : it->second;
    }

private:
    std::map<std::string, std::string> _data;
    std::string _password;
    int _fd = -1;
    int _port = 0;
    std::atomic<bool> _stop{false};
    std::thread _th;
    mutable std::mutex _mtx;
    std::map<std::string, int> _counts;

    void serve() {
        while (!_stop) {
            pollfd p{_fd, POLLIN, 0};
            if (::poll(&p, 1, 50) <= 0) continue;
            int c = ::accept(_fd, nullptr, nullptr);
            if (c < 0) continue;
            session(c);
            ::close(c);
        }
    }

    void session(int c) {
        std::string buf;
        while (!_stop) {
            pollfd p{c, POLLIN, 0};
            const int pr = ::poll(&p, 1, 50);
            if (pr == 0) continue;
            if (pr < 0) return;
            char tmp[512];
            const ssize_t n = ::recv(c, tmp, sizeof(tmp), 0);
            if (n <= 0) return;
            buf.append(tmp, static_cast<size_t>(n));

            std::vector<std::string> args;
            while (take_command(buf, args)) {
                if (!tg_test::send_all(c, answer(args))) return;
            }
        }
    }

    // Pops one "*N\r\n$len\r\narg\r\n..." array off the front of `buf`.
    static bool take_command(std::string& buf, std::vector<std::string>& args) {
        args.clear();
        if (buf.empty() || buf[0] != '*') return false;
        const size_t head = buf.find("\r\n");
        if (head == std::string::npos) return false;
        const long n = std::strtol(buf.c_str() + 1, nullptr, 10);
        size_t at = head + 2;
        for (long i = 0; i < n; ++i) {
            if (at >= buf.size() || buf[at] != '$') return false;
            const size_t eol = buf.find("\r\n", at);
            if (eol == std::string::npos) return false;
            const size_t len = std::strtoul(buf.c_str() + at + 1, nullptr, 10);
            if (buf.size() < eol + 2 + len + 2) return false;
            args.push_back(buf.substr(eol + 2, len));
            at = eol + 2 + len + 2;
        }
        buf.erase(0, at);
        return !args.empty();
    }

    std::string answer(const std::vector<std::string>& args) {
        std::lock_guard<std::mutex> lk(_mtx);
        ++_counts[args[0]];
        if (args[0] == "AUTH") {
            return args.size() == 2 && args[1] == _password ? "+OK\r\n" : "-ERR invalid password\r\n";
        }
        if (args[0] == "SELECT") return "+OK\r\n";
        if (args[0] == "GET" && args.size() == 2) {
            auto it = _data.find(args[1]);
            if (it == _data.end()) return "$-1\r\n";
            return "$" + std::to_string(it->second.size()) + "\r\n" + it->second + "\r\n";
        }
        return "-ERR unknown command\r\n";
    }
};

tg::CredentialStore::RedisOptions local_redis(int port) {
    tg::CredentialStore::RedisOptions opt;
    opt.host = "127.0.0.1";
    opt.port = port;
    opt.pool_size = 1;
    opt.timeout_ms = 1000;
    return opt;
}

} // namespace

TEST_CASE("file backend")
{
    TempFile f("# users\n"
               "alice secret\n"
               "\n"
               "  bob   hunter2  \n"
               "alice newer\n");

    tg::CredentialStore store;
    REQUIRE(store.init_file(f.path()));
    CHECK(store.file_entries() == 2);

    std::string pw;
    CHECK(store.lookup("bob", pw));
    CHECK(pw == "hunter2");
    CHECK(store.lookup("alice", pw));
    CHECK(pw == "newer");
    CHECK_FALSE(store.lookup("carol", pw));

    CHECK(store.authenticate(Who("bob", "hunter2")));
    CHECK(store.authenticate(Who("alice", "newer")));
    CHECK_FALSE(store.authenticate(Who("alice", "secret")));
    CHECK_FALSE(store.authenticate(Who("carol", "x")));
    CHECK_FALSE(store.authenticate(Who("", "")));
}

TEST_CASE("malformed or missing files are refused")
{
    tg::CredentialStore store;

    SUBCASE("missing password")
    {
        TempFile f("alice\n");
        CHECK_FALSE(store.init_file(f.path()));
    }

    SUBCASE("extra field")
    {
        TempFile f("alice secret extra\n");
        CHECK_FALSE(store.init_file(f.path()));
    }

    SUBCASE("missing file")
    {
        CHECK_FALSE(store.init_file("/nonexistent/tg_creds"));
    }

    std::string pw;
    CHECK_FALSE(store.lookup("alice", pw));
}

TEST_CASE("load_credentials appends static lists")
{
    TempFile f("alice secret\nnode token\n");
    std::vector<tg::Credential> list{{"root", "pw"}};

    REQUIRE(tg::load_credentials(f.path(), list));
    REQUIRE(list.size() == 3);
    CHECK(list[0].username == "root");
    CHECK(list[1].username == "alice");
    CHECK(list[1].password == "secret");
    CHECK(list[2].username == "node");

    CHECK(tg::match_credentials(list, {"node", "token"}));
    CHECK_FALSE(tg::match_credentials(list, {"node", "tok"}));

    TempFile bad("only-a-name\n");
    CHECK_FALSE(tg::load_credentials(bad.path(), list));
    CHECK(list.size() == 3);
}

TEST_CASE("redis backend reports an unreachable server")
{
    tg::CredentialStore store;
    tg::CredentialStore::RedisOptions opt;
    opt.host = "127.0.0.1";
    opt.port = 1;
    opt.pool_size = 1;
    opt.timeout_ms = 100;
    CHECK_FALSE(store.init_redis(opt));

    std::string pw;
    CHECK_FALSE(store.lookup("alice", pw));
}

TEST_CASE("redis logins are answered from the verdict cache")
{
    FakeRedis redis({{"tg:user:alice", "secret"}}, "redis-pass");
    REQUIRE(redis.port() > 0);

    auto opt = local_redis(redis.port());
    opt.password = "redis-pass";
    opt.db = 3;

    tg::CredentialStore store;
    REQUIRE(store.init_redis(opt));
    CHECK(redis.count("AUTH") == 1);
    CHECK(redis.count("SELECT") == 1);

    CHECK(store.authenticate(Who("alice", "secret")));
    CHECK(redis.count("GET") == 1);
    CHECK(store.authenticate(Who("alice", "secret")));
    CHECK(redis.count("GET") == 1);

    // A different password is never served from the cache.
    CHECK_FALSE(store.authenticate(Who("alice", "guess")));
    CHECK(redis.count("GET") == 2);

    CHECK_FALSE(store.authenticate(Who("carol", "secret")));
    CHECK(redis.count("GET") == 3);

    std::string pw;
    CHECK(store.lookup("alice", pw));
    CHECK(pw == "secret");
    CHECK(redis.count("GET") == 4);
}

TEST_CASE("a zero cache ttl asks redis every time")
{
    FakeRedis redis({{"tg:user:bob", "hunter2"}});
    auto opt = local_redis(redis.port());
    opt.cache_ttl_sec = 0;

    tg::CredentialStore store;
    REQUIRE(store.init_redis(opt));
    CHECK(redis.count("AUTH") == 0);
    CHECK(redis.count("SELECT") == 0);

    CHECK(store.authenticate(Who("bob", "hunter2")));
    CHECK(store.authenticate(Who("bob", "hunter2")));
    CHECK(redis.count("GET") == 2);
}

TEST_CASE("redis setup errors fail initialization")
{
    FakeRedis redis({}, "right");
    auto opt = local_redis(redis.port());
    opt.password = "wrong";

    tg::CredentialStore store;
    CHECK_FALSE(store.init_redis(opt));
    CHECK(redis.count("AUTH") == 1);
    CHECK_FALSE(store.authenticate(Who("alice", "secret")));
}
