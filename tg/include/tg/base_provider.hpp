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
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "tg/log.hpp"
#include "tg/provider.hpp"
#include "tg/socket.hpp"
#include "tg/stat.hpp"

namespace tg {

// Ready-made Provider over an accepted Connection. Owns the socket,
// buffers small writes, counts traffic and optionally drives a read loop
// on its own thread. close_notify() fires when the read loop ends, or
// from close() when no loop was started.
class BaseProvider : public Provider,
                     public std::enable_shared_from_this<BaseProvider> {
public:
    // Takes the socket out of `conn`.
    explicit BaseProvider(Connection& conn);
    ~BaseProvider() override;

    BaseProvider(const BaseProvider&) = delete;
    BaseProvider& operator=(const BaseProvider&) = delete;

    bool close() override;
    bool send_message(const std::string& msg, bool flush = true) override;
    CloseSignal& close_notify() override { return _closed; }
    BaseInfo base_info() const override { return _info; }

    bool is_running() const { return _running.load(); }

    // Runs `step` repeatedly on a detached thread until close() or
    // stop(). The thread keeps this provider alive while it runs.
    void start(std::function<void(BaseProvider&)> step);

    // Ends the read loop from inside `step`.
    void stop() { _running.store(false); }

    // Reads one line from the peer; counts bytes and messages.
    IoStatus read_line(std::string& out, std::chrono::milliseconds timeout);

    Socket& socket() { return *_sock; }
    Stat& stat() { return _stat; }

private:
    std::unique_ptr<Socket> _sock;
    BaseInfo    _info;
    Stat&       _stat;
    std::size_t _max_payload;
    std::size_t _max_pending;
    std::shared_ptr<Log> _log;

    std::atomic<bool> _running{true};
    std::atomic<bool> _loop_started{false};
    CloseSignal _closed;

    std::mutex  _wmtx;
    std::string _wbuf;

    bool flush_locked();
    void run(const std::function<void(BaseProvider&)>& step);
};

} // namespace tg
