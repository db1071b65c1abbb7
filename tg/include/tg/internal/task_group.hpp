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
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <thread>

namespace tg::internal {

// Owns a set of threads so they can be awaited together (accept loops,
// close-notify watchers). Finished threads are joined lazily on spawn().
class TaskGroup {
public:
    TaskGroup() = default;
    ~TaskGroup();

    TaskGroup(const TaskGroup&) = delete;
    TaskGroup& operator=(const TaskGroup&) = delete;

    void spawn(std::function<void()> fn);

    // Joins every task spawned so far. Must not be called from a task of
    // this group.
    void wait();

private:
    struct Task {
        std::thread th;
        std::shared_ptr<std::atomic<bool>> done;
    };

    std::mutex _mtx;
    std::list<Task> _tasks;

    void reap_locked();
};

} // namespace tg::internal
