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

#include "tg/internal/net_utils.hpp"

#include <cerrno>
#include <stdexcept>
#include <string>

#include <sys/socket.h>
#include <unistd.h>

using tg::internal::is_listener_gone;
using tg::internal::is_temporary_accept_error;

TEST_CASE("resource exhaustion and aborted handshakes are temporary")
{
    for (int err : {EMFILE, ENFILE, ENOBUFS, ENOMEM, ECONNABORTED, ECONNRESET,
                    EPROTO, ETIMEDOUT, EAGAIN, EWOULDBLOCK, EINTR}) {
        CAPTURE(err);
        CHECK(is_temporary_accept_error(err));
        CHECK_FALSE(is_listener_gone(err));
    }
}

TEST_CASE("a closed or broken listener ends the loop")
{
    for (int err : {EBADF, EINVAL, ENOTSOCK}) {
        CAPTURE(err);
        CHECK(is_listener_gone(err));
        CHECK_FALSE(is_temporary_accept_error(err));
    }
}

TEST_CASE("other accept failures are neither")
{
    for (int err : {EPERM, EACCES, EFAULT, EOPNOTSUPP}) {
        CAPTURE(err);
        CHECK_FALSE(is_temporary_accept_error(err));
        CHECK_FALSE(is_listener_gone(err));
    }
}

TEST_CASE("listen sockets bind ephemeral ports and report them")
{
    int fd = tg::internal::create_listen_socket("127.0.0.1", 0);
    REQUIRE(fd >= 0);

    std::string ip;
    int port = 0;
    CHECK(tg::internal::local_endpoint(fd, ip, port));
    CHECK(ip == "127.0.0.1");
    CHECK(port > 0);

    // Same port again is refused.
    CHECK_THROWS_AS(tg::internal::create_listen_socket("127.0.0.1", static_cast<uint16_t>(port)),
                    std::runtime_error);
    ::close(fd);
}

TEST_CASE("unresolvable listen addresses throw")
{
    CHECK_THROWS_AS(tg::internal::create_listen_socket("not an address", 0), std::runtime_error);
}
