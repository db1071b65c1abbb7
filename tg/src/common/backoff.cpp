/*
 * Part of the TwinGate (TG) project.
 *
 * SPDX-FileCopyrightText: 2025 TwinGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of TwinGate (TG). See LICENSE for details.
 */

#include "tg/internal/backoff.hpp"
#include <algorithm>

namespace tg::internal {

AcceptBackoff::AcceptBackoff(std::chrono::milliseconds min, std::chrono::milliseconds max)
    : _min(std::max(min, std::chrono::milliseconds(1))),
      _max(std::max(max, _min)),
      _cur(_min)
{}

std::chrono::milliseconds AcceptBackoff::next() {
    const auto d = _cur;
    _cur = std::min(_cur * 2, _max);
    return d;
}

} // namespace tg::internal
