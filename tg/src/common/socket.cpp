/*
 * Part of the TwinGate (TG) project.
 *
 * SPDX-FileCopyrightText: 2025 TwinGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of TwinGate (TG). See LICENSE for details.
 */

#include "tg/socket.hpp"
#include "tg/internal/utils.hpp"

#include <algorithm>
#include <climits>
#include <cstring>
#include <cerrno>

#include <sys/types.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <fcntl.h>
#include <poll.h>
#include <pthread.h>
#include <signal.h>
#include <time.h>
#include <unistd.h>

#include <openssl/err.h>

namespace tg {

// --- small helpers (internal) ---

static std::string describe_ssl_failure(SSL* ssl, int rc, const char* where) {
    const int e = SSL_get_error(ssl, rc);
    const int saved_errno = errno;
    std::string out = std::string(where) + " failed (ssl_error=" + std::to_string(e) + ")";
    const std::string q = internal::ssl_error_queue();
    if (!q.empty()) out += ": " + q;
    if (e == SSL_ERROR_SYSCALL && saved_errno != 0) {
        out += std::string(": ") + std::strerror(saved_errno);
    }
    return out;
}

static int poll_ms(long long ms) {
    return ms < 0 ? -1 : static_cast<int>(std::min<long long>(ms, INT_MAX));
}

// OpenSSL writes through write(2), which has no MSG_NOSIGNAL. The guard
// blocks SIGPIPE on the calling thread for one TLS write and consumes a
// SIGPIPE that write raised before the old mask is restored.
class SigpipeGuard {
public:
    SigpipeGuard() {
        sigemptyset(&_set);
        sigaddset(&_set, SIGPIPE);
        sigset_t pending;
        sigemptyset(&pending);
        _was_pending = ::sigpending(&pending) == 0 && sigismember(&pending, SIGPIPE) == 1;
        _blocked = ::pthread_sigmask(SIG_BLOCK, &_set, &_old) == 0;
    }
    ~SigpipeGuard() {
        if (!_blocked) return;
        if (!_was_pending) {
            const timespec zero{0, 0};
            while (::sigtimedwait(&_set, nullptr, &zero) == SIGPIPE) {}
        }
        ::pthread_sigmask(SIG_SETMASK, &_old, nullptr);
    }

    SigpipeGuard(const SigpipeGuard&) = delete;
    SigpipeGuard& operator=(const SigpipeGuard&) = delete;

private:
    sigset_t _set;
    sigset_t _old;
    bool _was_pending = false;
    bool _blocked = false;
};

static timeval to_timeval(std::chrono::milliseconds d) {
    timeval tv{};
    tv.tv_sec  = static_cast<time_t>(d.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((d.count() % 1000) * 1000);
    return tv;
}

// --- Socket ---

Socket::Socket(int fd) : _fd(fd) {}

Socket::~Socket() {
    close();
}

bool Socket::attach_tls(SSL_CTX* ctx) {
    std::lock_guard<std::mutex> lk(_io_mtx);
    if (_fd < 0 || !ctx) {
        _last_error = "attach_tls: socket closed or no TLS context";
        return false;
    }
    if (_ssl) return true;
    _ssl = SSL_new(ctx);
    if (!_ssl) {
        _last_error = "SSL_new failed: " + internal::ssl_error_queue();
        return false;
    }
    if (SSL_set_fd(_ssl, _fd) != 1) {
        _last_error = "SSL_set_fd failed: " + internal::ssl_error_queue();
        SSL_free(_ssl);
        _ssl = nullptr;
        return false;
    }
    return true;
}

bool Socket::handshake() {
    std::lock_guard<std::mutex> lk(_io_mtx);
    if (!_ssl) {
        _last_error = "handshake: no TLS session attached";
        return false;
    }
    ERR_clear_error();
    errno = 0;
    int rc = SSL_accept(_ssl);
    if (rc <= 0) {
        _last_error = describe_ssl_failure(_ssl, rc, "SSL_accept");
        return false;
    }
    _handshaken = true;
    const int fl = ::fcntl(_fd, F_GETFL, 0);
    if (fl < 0 || ::fcntl(_fd, F_SETFL, fl | O_NONBLOCK) != 0) {
        _last_error = std::string("fcntl(O_NONBLOCK) failed: ") + std::strerror(errno);
        return false;
    }
    return true;
}

bool Socket::set_deadline(std::chrono::milliseconds d) {
    if (_fd < 0) return false;
    _write_timeout_ms.store(d.count());
    timeval tv = to_timeval(d);
    bool ok = ::setsockopt(_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0;
    ok = ::setsockopt(_fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) == 0 && ok;
    return ok;
}

bool Socket::set_write_deadline(std::chrono::milliseconds d) {
    if (_fd < 0) return false;
    _write_timeout_ms.store(d.count());
    timeval tv = to_timeval(d);
    return ::setsockopt(_fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) == 0;
}

bool Socket::clear_deadline() {
    return set_deadline(std::chrono::milliseconds(0));
}

IoStatus Socket::wait_io(short events, std::chrono::milliseconds timeout) {
    struct pollfd pfd;
    pfd.fd      = _fd.load();
    if (pfd.fd < 0) return IoStatus::Closed;
    pfd.events  = events;
    pfd.revents = 0;
    const int ms = poll_ms(timeout.count());
    for (;;) {
        int pr = ::poll(&pfd, 1, ms);
        if (pr < 0 && errno == EINTR) continue;
        if (pr == 0) return IoStatus::Timeout;
        if (pr < 0) {
            std::lock_guard<std::mutex> lk(_io_mtx);
            _last_error = std::string("poll() failed: ") + std::strerror(errno);
            return IoStatus::Error;
        }
        // POLLHUP / POLLERR surface through the following read.
        return IoStatus::Ok;
    }
}

bool Socket::wait_writable_locked(short events) {
    struct pollfd pfd;
    pfd.fd      = _fd.load();
    pfd.events  = events;
    pfd.revents = 0;
    const long long limit = _write_timeout_ms.load();
    const int ms = limit <= 0 ? -1 : poll_ms(limit);
    for (;;) {
        int pr = ::poll(&pfd, 1, ms);
        if (pr < 0 && errno == EINTR) continue;
        if (pr > 0) return true;
        _last_error = pr == 0 ? std::string("SSL_write timed out")
                              : std::string("poll() failed: ") + std::strerror(errno);
        return false;
    }
}

// Timeout means "nothing to hand out yet"; `want` names the poll() event
// to wait for before retrying.
IoStatus Socket::read_locked(char* buf, std::size_t cap, std::size_t& n, short& want) {
    n = 0;
    want = POLLIN;
    if (_fd < 0) return IoStatus::Closed;

    if (_ssl) {
        ERR_clear_error();
        errno = 0;
        int r = SSL_read(_ssl, buf, static_cast<int>(std::min<std::size_t>(cap, INT_MAX)));
        if (r > 0) {
            n = static_cast<std::size_t>(r);
            return IoStatus::Ok;
        }
        const int e = SSL_get_error(_ssl, r);
        const int saved_errno = errno;
        if (e == SSL_ERROR_ZERO_RETURN) return IoStatus::Closed;
        if (e == SSL_ERROR_WANT_READ) return IoStatus::Timeout;
        if (e == SSL_ERROR_WANT_WRITE) {
            want = POLLOUT;
            return IoStatus::Timeout;
        }
        if (e == SSL_ERROR_SYSCALL) {
            if (saved_errno == EAGAIN || saved_errno == EWOULDBLOCK) return IoStatus::Timeout;
            if (saved_errno == 0 || saved_errno == ECONNRESET) {
                (void)internal::ssl_error_queue();
                return IoStatus::Closed;
            }
        }
        _last_error = describe_ssl_failure(_ssl, r, "SSL_read");
        return IoStatus::Error;
    }

    for (;;) {
        ssize_t r = ::recv(_fd, buf, cap, 0);
        if (r > 0) {
            n = static_cast<std::size_t>(r);
            return IoStatus::Ok;
        }
        if (r == 0) return IoStatus::Closed;
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return IoStatus::Timeout;
        if (errno == ECONNRESET) return IoStatus::Closed;
        _last_error = std::string("recv() failed: ") + std::strerror(errno);
        return IoStatus::Error;
    }
}

IoStatus Socket::fill_locked(short& want) {
    char tmp[4096];
    std::size_t n = 0;
    IoStatus st = read_locked(tmp, sizeof(tmp), n, want);
    if (st == IoStatus::Ok) _rbuf.append(tmp, n);
    return st;
}

// The lock is only held around non-blocking reads. A TLS record that
// arrives in pieces yields WANT_READ and the wait goes back to poll().
IoStatus Socket::fill(std::chrono::milliseconds timeout) {
    using clock = std::chrono::steady_clock;
    const bool forever = timeout.count() < 0;
    const auto deadline = clock::now() + (forever ? std::chrono::milliseconds(0) : timeout);

    short want = POLLIN;
    {
        std::lock_guard<std::mutex> lk(_io_mtx);
        if (_fd < 0) return IoStatus::Closed;
        // Decrypted bytes already buffered inside OpenSSL do not show up in poll().
        if (_ssl && SSL_pending(_ssl) > 0) return fill_locked(want);
    }
    for (;;) {
        std::chrono::milliseconds left(-1);
        if (!forever) {
            left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now());
            if (left.count() < 0) left = std::chrono::milliseconds(0);
        }
        IoStatus st = wait_io(want, left);
        if (st != IoStatus::Ok) return st;
        {
            std::lock_guard<std::mutex> lk(_io_mtx);
            st = fill_locked(want);
        }
        if (st != IoStatus::Timeout) return st;
        if (!forever && clock::now() >= deadline) return IoStatus::Timeout;
    }
}

IoStatus Socket::read_some(char* buf, std::size_t cap, std::size_t& n,
                           std::chrono::milliseconds timeout) {
    n = 0;
    {
        std::lock_guard<std::mutex> lk(_io_mtx);
        if (!_rbuf.empty()) {
            n = std::min(cap, _rbuf.size());
            std::memcpy(buf, _rbuf.data(), n);
            _rbuf.erase(0, n);
            return IoStatus::Ok;
        }
    }
    IoStatus st = fill(timeout);
    if (st != IoStatus::Ok) return st;
    std::lock_guard<std::mutex> lk(_io_mtx);
    n = std::min(cap, _rbuf.size());
    std::memcpy(buf, _rbuf.data(), n);
    _rbuf.erase(0, n);
    return IoStatus::Ok;
}

IoStatus Socket::read_line(std::string& out, std::size_t max_len,
                           std::chrono::milliseconds timeout) {
    using clock = std::chrono::steady_clock;
    const bool forever = timeout.count() < 0;
    const auto deadline = clock::now() + (forever ? std::chrono::milliseconds(0) : timeout);

    for (;;) {
        {
            std::lock_guard<std::mutex> lk(_io_mtx);
            const std::size_t pos = _rbuf.find('\n');
            if (pos != std::string::npos) {
                out.assign(_rbuf, 0, pos);
                _rbuf.erase(0, pos + 1);
                if (!out.empty() && out.back() == '\r') out.pop_back();
                return IoStatus::Ok;
            }
            if (_rbuf.size() >= max_len) {
                _last_error = "line exceeds " + std::to_string(max_len) + " bytes";
                return IoStatus::Error;
            }
        }

        std::chrono::milliseconds left(-1);
        if (!forever) {
            left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now());
            if (left.count() <= 0) return IoStatus::Timeout;
        }
        IoStatus st = fill(left);
        if (st != IoStatus::Ok) return st;
    }
}

bool Socket::write_all(const char* d, std::size_t len) {
    std::lock_guard<std::mutex> lk(_io_mtx);
    if (_fd < 0) {
        _last_error = "write on closed socket";
        return false;
    }
    SigpipeGuard nopipe;
    std::size_t off = 0;
    while (off < len) {
        if (_ssl) {
            ERR_clear_error();
            errno = 0;
            int n = SSL_write(_ssl, d + off, static_cast<int>(std::min<std::size_t>(len - off, INT_MAX)));
            if (n <= 0) {
                const int e = SSL_get_error(_ssl, n);
                if (e == SSL_ERROR_WANT_WRITE || e == SSL_ERROR_WANT_READ) {
                    if (!wait_writable_locked(e == SSL_ERROR_WANT_WRITE ? POLLOUT : POLLIN)) {
                        return false;
                    }
                    continue;
                }
                _last_error = describe_ssl_failure(_ssl, n, "SSL_write");
                return false;
            }
            off += static_cast<std::size_t>(n);
        } else {
            ssize_t n = ::send(_fd, d + off, len - off, MSG_NOSIGNAL);
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) {
                _last_error = std::string("send() failed: ") +
                              (n < 0 ? std::strerror(errno) : "connection closed");
                return false;
            }
            off += static_cast<std::size_t>(n);
        }
    }
    return true;
}

void Socket::shutdown_both() {
    // No lock: must not wait behind a reader parked in SSL_read.
    const int fd = _fd.load();
    if (fd >= 0) {
        _shut.store(true);
        (void)::shutdown(fd, SHUT_RDWR);
    }
}

void Socket::close() {
    std::lock_guard<std::mutex> lk(_io_mtx);
    if (_ssl) {
        if (_handshaken && !_shut.load()) {
            SigpipeGuard nopipe;
            (void)SSL_shutdown(_ssl);
        }
        SSL_free(_ssl);
        _ssl = nullptr;
        (void)internal::ssl_error_queue();
    }
    const int fd = _fd.exchange(-1);
    if (fd >= 0) {
        ::close(fd);
    }
    _rbuf.clear();
}

std::string Socket::last_error() const {
    std::lock_guard<std::mutex> lk(_io_mtx);
    return _last_error;
}

} // namespace tg
