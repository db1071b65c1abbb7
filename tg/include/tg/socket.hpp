/*
 * Part of the TwinGate (TG) project.
 *
 * SPDX-FileCopyrightText: 2025 TwinGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of TwinGate (TG). See LICENSE for details.
 */

#pragma once
#include <atomic>
#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <openssl/ssl.h>

namespace tg {

enum class IoStatus { Ok, Timeout, Closed, Error };

// Owning wrapper over an accepted stream socket, optionally upgraded to
// a TLS server session. Closes (and frees the SSL object) on destruction.
//
// Reads and writes are serialized on one mutex because an SSL object is
// not safe for concurrent use; reads wait for readability outside the
// lock so a blocked reader does not starve writers.
class Socket {
public:
    explicit Socket(int fd);
    ~Socket();

    // non-copyable
    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    int  fd() const { return _fd; }
    bool is_tls() const { return _ssl != nullptr; }
    bool is_open() const { return _fd >= 0; }

    // Creates the server-side SSL session on this fd. Handshake is separate.
    bool attach_tls(SSL_CTX* ctx);

    // Blocking SSL_accept. Honors the socket deadline. On success the fd
    // switches to O_NONBLOCK so later TLS reads and writes never park in
    // OpenSSL while the I/O lock is held.
    bool handshake();

    // Kernel send/receive timeouts (SO_RCVTIMEO / SO_SNDTIMEO). The write
    // deadline also bounds the poll() of a TLS write that would block.
    bool set_deadline(std::chrono::milliseconds d);
    bool set_write_deadline(std::chrono::milliseconds d);
    bool clear_deadline();

    // Reads at most `cap` bytes, waiting up to `timeout` for data
    // (negative timeout waits forever). Buffered line data is served first.
    IoStatus read_some(char* buf, std::size_t cap, std::size_t& n,
                       std::chrono::milliseconds timeout);

    // Reads one '\n'-terminated line (trailing "\r\n" stripped). Fails
    // with IoStatus::Error once `max_len` bytes arrive without a newline.
    IoStatus read_line(std::string& out, std::size_t max_len,
                       std::chrono::milliseconds timeout);

    // Writes all bytes or fails. Never raises SIGPIPE.
    bool write_all(const char* d, std::size_t len);
    bool write_all(const std::string& s) { return write_all(s.data(), s.size()); }

    // Half-closes both directions without releasing the fd; unblocks any
    // thread parked in a read on this socket.
    void shutdown_both();

    // TLS close_notify (best effort), SSL_free and close(2). Idempotent.
    void close();

    // Description of the most recent I/O failure.
    std::string last_error() const;

private:
    std::atomic<int>  _fd{-1};
    std::atomic<bool> _shut{false};
    SSL* _ssl = nullptr;
    bool _handshaken = false;
    std::atomic<long long> _write_timeout_ms{-1};
    std::string _rbuf;
    std::string _last_error;
    mutable std::mutex _io_mtx;

    IoStatus read_locked(char* buf, std::size_t cap, std::size_t& n, short& want);
    IoStatus fill_locked(short& want);
    IoStatus fill(std::chrono::milliseconds timeout);
    IoStatus wait_io(short events, std::chrono::milliseconds timeout);
    bool wait_writable_locked(short events);
};

} // namespace tg
