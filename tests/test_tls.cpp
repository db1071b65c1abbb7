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

#include "tg/server.hpp"
#include "test_support.hpp"

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <atomic>
#include <memory>
#include <thread>

#include <signal.h>
#include <sys/socket.h>

using namespace tg_test;

namespace {

// Certificate and key for one test, removed afterwards.
struct CertFiles {
    TempFile cert;
    TempFile key;
    bool ok = write_self_signed(cert.path(), key.path());
};

tg::ServerConfig tls_config(const CertFiles& f) {
    tg::ServerConfig cfg;
    cfg.addr = "127.0.0.1";
    cfg.port = 0;
    cfg.clusters_addr = "127.0.0.1";
    cfg.clusters_port = 0;
    cfg.use_tls = true;
    cfg.tls_cert_file = f.cert.path();
    cfg.tls_key_file = f.key.path();
    return cfg;
}

// Minimal TLS client over a loopback socket, no certificate checks.
class TlsClient {
public:
    explicit TlsClient(int port) {
        _ctx = SSL_CTX_new(TLS_client_method());
        _fd = connect_loopback(port);
        if (!_ctx || _fd < 0) return;
        SSL_CTX_set_verify(_ctx, SSL_VERIFY_NONE, nullptr);
        _ssl = SSL_new(_ctx);
        if (!_ssl) return;
        SSL_set_fd(_ssl, _fd);
        _ok = SSL_connect(_ssl) == 1;
    }

    // No close_notify: the server may already be gone and these tests
    // leave SIGPIPE at its default disposition.
    ~TlsClient() {
        if (_ssl) SSL_free(_ssl);
        if (_fd >= 0) ::close(_fd);
        if (_ctx) SSL_CTX_free(_ctx);
    }

    TlsClient(const TlsClient&) = delete;
    TlsClient& operator=(const TlsClient&) = delete;

    bool connected() const { return _ok; }
    int fd() const { return _fd; }

    // Drops the connection with a TCP reset.
    void reset() {
        if (_fd < 0) return;
        linger lg{1, 0};
        ::setsockopt(_fd, SOL_SOCKET, SO_LINGER, &lg, sizeof(lg));
        ::close(_fd);
        _fd = -1;
    }

    bool write(const std::string& s) {
        return SSL_write(_ssl, s.data(), static_cast<int>(s.size())) == static_cast<int>(s.size());
    }

    std::string read(size_t want) {
        std::string out;
        char buf[512];
        while (out.size() < want) {
            int r = SSL_read(_ssl, buf, sizeof(buf));
            if (r <= 0) break;
            out.append(buf, static_cast<size_t>(r));
        }
        return out;
    }

private:
    SSL_CTX* _ctx = nullptr;
    SSL* _ssl = nullptr;
    int _fd = -1;
    bool _ok = false;
};

} // namespace

TEST_CASE("tls clients are admitted and exchange data")
{
    CertFiles files;
    REQUIRE(files.ok);

    tg::Server srv(tls_config(files));
    srv.on_client_connect(start_pump);
    srv.serve_clients([](tg::Connection& c) -> std::shared_ptr<tg::Provider> {
        CHECK(c.socket->is_tls());
        return std::make_shared<TestProvider>(c);
    });

    TlsClient cli(srv.client_info().port);
    REQUIRE(cli.connected());
    REQUIRE(wait_until([&] { return srv.clients().size() == 1; }));

    REQUIRE(cli.write("over tls\n"));
    CHECK(wait_until([&] { return srv.stat().snapshot().in_msg == 1; }));

    CHECK(srv.send_to_clients("pong\n"));
    CHECK(cli.read(5) == "pong\n");

    srv.close();
    CHECK(srv.clients().empty());
}

TEST_CASE("tls authentication line goes through the encrypted stream")
{
    CertFiles files;
    REQUIRE(files.ok);

    auto cfg = tls_config(files);
    cfg.authenticate = true;
    cfg.must_authenticate = true;
    cfg.client_credentials = {{"alice", "secret"}};

    tg::Server srv(cfg);
    srv.on_client_connect(start_pump);
    srv.serve_clients([](tg::Connection& c) -> std::shared_ptr<tg::Provider> {
        tg::Credential cred = read_auth(c);
        return std::make_shared<AuthTestProvider>(c, std::move(cred));
    });

    TlsClient good(srv.client_info().port);
    REQUIRE(good.connected());
    REQUIRE(good.write("AUTH alice secret\n"));
    CHECK(wait_until([&] { return srv.clients().size() == 1; }));

    TlsClient bad(srv.client_info().port);
    REQUIRE(bad.connected());
    REQUIRE(bad.write("AUTH alice nope\n"));
    CHECK(bad.read(64) == "Error: Authentication failed");
    CHECK(srv.clients().size() == 1);
}

TEST_CASE("a half-received tls record does not stall broadcasts")
{
    CertFiles files;
    REQUIRE(files.ok);

    tg::Server srv(tls_config(files));
    srv.on_client_connect(start_pump);
    srv.serve_clients([](tg::Connection& c) -> std::shared_ptr<tg::Provider> {
        return std::make_shared<TestProvider>(c);
    });
    const int port = srv.client_info().port;

    TlsClient stalled(port);
    TlsClient other(port);
    REQUIRE(stalled.connected());
    REQUIRE(other.connected());
    REQUIRE(wait_until([&] { return srv.clients().size() == 2; }));

    // Application-data header announcing 32 bytes, then only two of them.
    REQUIRE(send_all(stalled.fd(), std::string("\x17\x03\x03\x00\x20\xAA\xBB", 7)));
    std::this_thread::sleep_for(300ms);

    auto done = std::make_shared<std::atomic<bool>>(false);
    auto sent = std::make_shared<std::atomic<bool>>(false);
    std::thread t([&srv, done, sent] {
        sent->store(srv.send_to_clients("x\n"));
        (void)srv.clients();
        done->store(true);
    });
    if (!wait_until([&] { return done->load(); }, 3000ms)) {
        t.detach();
        FAIL("broadcast blocked behind a partial tls record");
    }
    t.join();
    CHECK(sent->load());
    CHECK(other.read(2) == "x\n");
    CHECK(stalled.read(2) == "x\n");

    srv.close();
    CHECK(srv.clients().empty());
}

TEST_CASE("tls writes to a reset peer leave the process alive")
{
    struct sigaction sa{};
    REQUIRE(::sigaction(SIGPIPE, nullptr, &sa) == 0);
    REQUIRE(sa.sa_handler == SIG_DFL);

    CertFiles files;
    REQUIRE(files.ok);

    tg::Server srv(tls_config(files));
    srv.serve_clients([](tg::Connection& c) -> std::shared_ptr<tg::Provider> {
        return std::make_shared<TestProvider>(c);
    });

    TlsClient cli(srv.client_info().port);
    REQUIRE(cli.connected());
    REQUIRE(wait_until([&] { return srv.clients().size() == 1; }));

    cli.reset();
    std::this_thread::sleep_for(100ms);

    // The first write sees ECONNRESET, later ones EPIPE.
    for (int i = 0; i < 3; ++i) {
        (void)srv.send_to_clients("after reset\n");
    }
    REQUIRE(::sigaction(SIGPIPE, nullptr, &sa) == 0);
    CHECK(sa.sa_handler == SIG_DFL);

    TlsClient next(srv.client_info().port);
    REQUIRE(next.connected());
    REQUIRE(wait_until([&] { return srv.clients().size() == 2; }));
    (void)srv.send_to_clients("still here\n");
    CHECK(next.read(11) == "still here\n");

    srv.close();
}

TEST_CASE("stalled handshakes are cut off at the deadline")
{
    CertFiles files;
    REQUIRE(files.ok);

    auto cfg = tls_config(files);
    cfg.tls_timeout_ms = 300;

    std::atomic<int> calls{0};
    tg::Server srv(cfg);
    srv.on_client_connect(start_pump);
    srv.serve_clients([&](tg::Connection& c) -> std::shared_ptr<tg::Provider> {
        ++calls;
        return std::make_shared<TestProvider>(c);
    });
    const int port = srv.client_info().port;

    // Plain TCP peer that never sends a ClientHello.
    const auto t0 = std::chrono::steady_clock::now();
    int fd = connect_loopback(port, 3000ms);
    REQUIRE(fd >= 0);
    bool eof = false;
    CHECK(recv_until_eof(fd, &eof).empty());
    const auto waited = std::chrono::steady_clock::now() - t0;
    CHECK(eof);
    CHECK(waited >= 250ms);
    CHECK(waited < 2500ms);
    CHECK(calls == 0);
    CHECK(srv.clients().empty());
    ::close(fd);

    // The accept loop keeps going after the timeout.
    TlsClient cli(port);
    REQUIRE(cli.connected());
    CHECK(wait_until([&] { return srv.clients().size() == 1; }));
    CHECK(calls == 1);
}

TEST_CASE("unusable tls material fails construction")
{
    CertFiles files;
    REQUIRE(files.ok);

    SUBCASE("missing key path")
    {
        auto cfg = tls_config(files);
        cfg.tls_key_file.clear();
        CHECK_THROWS_AS(tg::Server{cfg}, std::runtime_error);
    }

    SUBCASE("certificate file is not a certificate")
    {
        TempFile junk("not a certificate\n");
        auto cfg = tls_config(files);
        cfg.tls_cert_file = junk.path();
        CHECK_THROWS_AS(tg::Server{cfg}, std::runtime_error);
    }
}
