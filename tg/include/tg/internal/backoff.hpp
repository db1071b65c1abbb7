/*
 * Part of the TwinGate (TG) project.
 *
 * SPDX-FileCopyrightText: 2025 TwinGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of TwinGate (TG). See LICENSE for details.
 */

#pragma once
#include <chrono>

namespace tg::internal {

// Sleep schedule for consecutive temporary accept errors: starts at
// `min`, doubles per failure, never exceeds `max`, back to `min` after
// a successful accept.
class AcceptBackoff {
public:
    AcceptBackoff(std::chrono::milliseconds min, std::chrono::milliseconds max);

    // Delay to sleep now; advances the schedule.
    std::chrono::milliseconds next();

    // Delay next() would return, without advancing.
    std::chrono::milliseconds current() const { return _cur; }

    void reset() { _cur = _min; }

private:
    std::chrono::milliseconds _min;
    std::chrono::milliseconds _max;
    std::chrono::milliseconds _cur;
};

} // namespace tg::internal
