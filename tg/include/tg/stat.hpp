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
#include <cstddef>
#include <cstdint>

namespace tg {

struct StatSnapshot {
    int64_t in_msg = 0;
    int64_t out_msg = 0;
    int64_t in_bytes = 0;
    int64_t out_bytes = 0;
    int64_t requests = 0;
    int64_t total_clients = 0;
};

// Traffic counters shared by every provider of one server.
// Lock-free; relaxed ordering is enough for monotonic counters.
class Stat {
public:
    Stat() = default;
    Stat(const Stat&) = delete;
    Stat& operator=(const Stat&) = delete;

    void increment_in_msg()  { _in_msg.fetch_add(1, std::memory_order_relaxed); }
    void increment_out_msg() { _out_msg.fetch_add(1, std::memory_order_relaxed); }
    void increment_request() { _requests.fetch_add(1, std::memory_order_relaxed); }
    void increment_clients() { _total_clients.fetch_add(1, std::memory_order_relaxed); }

    void increment_reads(std::size_t n) {
        _in_bytes.fetch_add(static_cast<int64_t>(n), std::memory_order_relaxed);
    }
    void increment_writes(std::size_t n) {
        _out_bytes.fetch_add(static_cast<int64_t>(n), std::memory_order_relaxed);
    }

    StatSnapshot snapshot() const;

private:
    std::atomic<int64_t> _in_msg{0};
    std::atomic<int64_t> _out_msg{0};
    std::atomic<int64_t> _in_bytes{0};
    std::atomic<int64_t> _out_bytes{0};
    std::atomic<int64_t> _requests{0};
    std::atomic<int64_t> _total_clients{0};
};

} // namespace tg
