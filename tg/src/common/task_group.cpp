/*
 * Part of the TwinGate (TG) project.
 *
 * SPDX-FileCopyrightText: 2025 TwinGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of TwinGate (TG). See LICENSE for details.
 */

#include "tg/internal/task_group.hpp"
#include <utility>

namespace tg::internal {

TaskGroup::~TaskGroup() {
    wait();
}

void TaskGroup::spawn(std::function<void()> fn) {
    auto done = std::make_shared<std::atomic<bool>>(false);
    std::lock_guard<std::mutex> lk(_mtx);
    reap_locked();
    Task t;
    t.done = done;
    t.th = std::thread([fn = std::move(fn), done]() {
        fn();
        done->store(true);
    });
    _tasks.push_back(std::move(t));
}

void TaskGroup::wait() {
    // Tasks may spawn siblings while we join; loop until none are left.
    for (;;) {
        std::list<Task> batch;
        {
            std::lock_guard<std::mutex> lk(_mtx);
            if (_tasks.empty()) return;
            batch.swap(_tasks);
        }
        for (auto& t : batch) {
            if (t.th.joinable()) t.th.join();
        }
    }
}

void TaskGroup::reap_locked() {
    for (auto it = _tasks.begin(); it != _tasks.end();) {
        if (it->done->load()) {
            if (it->th.joinable()) it->th.join();
            it = _tasks.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace tg::internal
