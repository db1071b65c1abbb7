/*
 * Part of the TwinGate (TG) project.
 *
 * SPDX-FileCopyrightText: 2025 TwinGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of TwinGate (TG). See LICENSE for details.
 */

#include "tg/provider.hpp"

namespace tg {

void CloseSignal::fire() {
    {
        std::lock_guard<std::mutex> lk(_mtx);
        if (_fired) return;
        _fired = true;
    }
    _cv.notify_all();
}

bool CloseSignal::fired() const {
    std::lock_guard<std::mutex> lk(_mtx);
    return _fired;
}

void CloseSignal::wait() {
    std::unique_lock<std::mutex> lk(_mtx);
    _cv.wait(lk, [&]{ return _fired; });
}

bool CloseSignal::wait_for(std::chrono::milliseconds d) {
    std::unique_lock<std::mutex> lk(_mtx);
    return _cv.wait_for(lk, d, [&]{ return _fired; });
}

} // namespace tg
