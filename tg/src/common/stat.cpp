/*
 * Part of the TwinGate (TG) project.
 *
 * SPDX-FileCopyrightText: 2025 TwinGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of TwinGate (TG). See LICENSE for details.
 */

#include "tg/stat.hpp"

namespace tg {

StatSnapshot Stat::snapshot() const {
    StatSnapshot s;
    s.in_msg        = _in_msg.load(std::memory_order_relaxed);
    s.out_msg       = _out_msg.load(std::memory_order_relaxed);
    s.in_bytes      = _in_bytes.load(std::memory_order_relaxed);
    s.out_bytes     = _out_bytes.load(std::memory_order_relaxed);
    s.requests      = _requests.load(std::memory_order_relaxed);
    s.total_clients = _total_clients.load(std::memory_order_relaxed);
    return s;
}

} // namespace tg
