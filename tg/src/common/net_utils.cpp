/*
 * Part of the TwinGate (TG) project.
 *
 * SPDX-FileCopyrightText: 2025 TwinGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of TwinGate (TG). See LICENSE for details.
 */

#include "tg/internal/net_utils.hpp"

#include <stdexcept>
#include <cstdio>
#include <cstring>
#include <cerrno>

#include <sys/types.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <unistd.h>

namespace tg::internal {

static int set_reuseaddr(int s) { int o = 1; return ::setsockopt(s, SOL_SOCKET, SO_REUSEADDR, &o, sizeof(o)); }

int set_nodelay(int s) { int o = 1; return ::setsockopt(s, IPPROTO_TCP, TCP_NODELAY, &o, sizeof(o)); }

int create_listen_socket(const std::string& addr, uint16_t port) {
    struct addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags    = AI_PASSIVE | AI_NUMERICSERV;

    const std::string service = std::to_string(port);
    struct addrinfo* res = nullptr;
    int rc = getaddrinfo(addr.empty() ? nullptr : addr.c_str(), service.c_str(), &hints, &res);
    if (rc != 0 || !res) {
        const std::string why = std::string("getaddrinfo(") + addr + ") failed: " + gai_strerror(rc);
        throw std::runtime_error(why);
    }

    std::string last_err = "no usable address";
    int srv = -1;
    for (auto* p = res; p; p = p->ai_next) {
        int s = ::socket(p->ai_family, p->ai_socktype, p->ai_protocol);
        if (s < 0) {
            last_err = std::string("socket() failed: ") + std::strerror(errno);
            continue;
        }
        (void)set_reuseaddr(s);

        if (::bind(s, p->ai_addr, p->ai_addrlen) < 0) {
            last_err = std::string("bind() failed: ") + std::strerror(errno);
            ::close(s);
            continue;
        }
        if (::listen(s, 512) < 0) {
            last_err = std::string("listen() failed: ") + std::strerror(errno);
            ::close(s);
            continue;
        }
        srv = s;
        break;
    }
    freeaddrinfo(res);

    if (srv < 0) {
        const std::string why = last_err + " (" + addr + ":" + service + ")";
        throw std::runtime_error(why);
    }
    return srv;
}

std::string sockaddr_to_ip(const sockaddr_storage& ss) {
    char buf[INET6_ADDRSTRLEN] = {0};
    if (ss.ss_family == AF_INET) {
        const sockaddr_in* a = reinterpret_cast<const sockaddr_in*>(&ss);
        inet_ntop(AF_INET, &a->sin_addr, buf, sizeof(buf));
    } else if (ss.ss_family == AF_INET6) {
        const sockaddr_in6* a = reinterpret_cast<const sockaddr_in6*>(&ss);
        inet_ntop(AF_INET6, &a->sin6_addr, buf, sizeof(buf));
    } else {
        std::snprintf(buf, sizeof(buf), "unknown");
    }
    return std::string(buf);
}

int sockaddr_to_port(const sockaddr_storage& ss) {
    if (ss.ss_family == AF_INET) {
        return ntohs(reinterpret_cast<const sockaddr_in*>(&ss)->sin_port);
    } else if (ss.ss_family == AF_INET6) {
        return ntohs(reinterpret_cast<const sockaddr_in6*>(&ss)->sin6_port);
    }
    return 0;
}

bool local_endpoint(int fd, std::string& ip, int& port) {
    sockaddr_storage ss{};
    socklen_t len = sizeof(ss);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&ss), &len) < 0) return false;
    ip = sockaddr_to_ip(ss);
    port = sockaddr_to_port(ss);
    return true;
}

bool is_temporary_accept_error(int err) {
    switch (err) {
    case EINTR:
    case EAGAIN:
#if EWOULDBLOCK != EAGAIN
    case EWOULDBLOCK:
#endif
    case EMFILE:
    case ENFILE:
    case ENOBUFS:
    case ENOMEM:
    case ECONNABORTED:
    case ECONNRESET:
    case EPROTO:
    case ETIMEDOUT:
        return true;
    default:
        return false;
    }
}

bool is_listener_gone(int err) {
    return err == EBADF || err == EINVAL || err == ENOTSOCK;
}

} // namespace tg::internal
