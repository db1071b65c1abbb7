/*
 * Part of the TwinGate (TG) project.
 *
 * SPDX-FileCopyrightText: 2025 TwinGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of TwinGate (TG). See LICENSE for details.
 */

#include "tg/base_provider.hpp"
#include "tg/server_config.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace tg {

BaseProvider::BaseProvider(Connection& conn)
    : _sock(conn.take_socket()),
      _info(conn.connection_info),
      _stat(conn.stat),
      _max_payload(conn.config.max_payload),
      _max_pending(conn.config.max_pending),
      _log(conn.config.log)
{
    if (!_sock) {
        throw std::invalid_argument("BaseProvider: connection socket already taken");
    }
    if (!_log) _log = std::make_shared<NullLog>();
}

BaseProvider::~BaseProvider() {
    _sock->close();
}

bool BaseProvider::send_message(const std::string& msg, bool flush) {
    if (msg.size() > _max_payload) {
        _log->error("BaseProvider", "payload too large",
                    "Rejected " + std::to_string(msg.size()) + " bytes : Info[" + _info.to_string() + "]");
        return false;
    }

    std::lock_guard<std::mutex> lk(_wmtx);
    if (!_sock->is_open()) return false;
    if (_wbuf.size() + msg.size() > _max_pending) {
        _log->error("BaseProvider", "pending buffer full",
                    "Dropped " + std::to_string(msg.size()) + " bytes : Info[" + _info.to_string() + "]");
        return false;
    }

    _wbuf += msg;
    _stat.increment_out_msg();

    if (flush || _wbuf.size() >= MIN_DATA_WRITE_SIZE) {
        return flush_locked();
    }
    return true;
}

bool BaseProvider::flush_locked() {
    if (_wbuf.empty()) return true;

    (void)_sock->set_write_deadline(DEFAULT_FLUSH_DEADLINE);

    // Large buffers go out in MAX_DATA_WRITE_SIZE slices.
    std::size_t off = 0;
    bool ok = true;
    while (off < _wbuf.size()) {
        const std::size_t n = std::min(MAX_DATA_WRITE_SIZE, _wbuf.size() - off);
        if (!_sock->write_all(_wbuf.data() + off, n)) {
            _log->error("BaseProvider", _sock->last_error(),
                        "Flush failed : Info[" + _info.to_string() + "]");
            ok = false;
            break;
        }
        _stat.increment_writes(n);
        off += n;
    }
    _wbuf.clear();
    return ok;
}

bool BaseProvider::close() {
    _running.store(false);
    _sock->shutdown_both();

    // Without a read loop nobody else will report the closure.
    if (!_loop_started.load()) {
        _sock->close();
        _closed.fire();
    }
    return true;
}

void BaseProvider::start(std::function<void(BaseProvider&)> step) {
    if (_loop_started.exchange(true)) return;

    auto self = shared_from_this();
    std::thread([self, step = std::move(step)]() {
        self->run(step);
    }).detach();
}

void BaseProvider::run(const std::function<void(BaseProvider&)>& step) {
    while (_running.load()) {
        try {
            step(*this);
        } catch (const std::exception& e) {
            _log->error("BaseProvider", e.what(), "Read loop aborted : Info[" + _info.to_string() + "]");
            _running.store(false);
        }
    }

    {
        std::lock_guard<std::mutex> lk(_wmtx);
        _wbuf.clear();
    }
    _sock->close();
    _closed.fire();
}

IoStatus BaseProvider::read_line(std::string& out, std::chrono::milliseconds timeout) {
    const std::size_t limit = std::max(MAX_CONTROL_LINE_SIZE, _max_payload);
    IoStatus st = _sock->read_line(out, limit, timeout);
    if (st == IoStatus::Ok) {
        _stat.increment_in_msg();
        _stat.increment_reads(out.size() + 1);
    }
    return st;
}

} // namespace tg
