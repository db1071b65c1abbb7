/*
 * Part of the TwinGate (TG) project.
 *
 * SPDX-FileCopyrightText: 2025 TwinGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of TwinGate (TG). See LICENSE for details.
 */

#pragma once
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

#include "tg/base_info.hpp"
#include "tg/provider.hpp"
#include "tg/types.hpp"

namespace tg::internal {

// All mutable server state behind one mutex: listener handles and
// running flags, both populations and their hook lists. Hooks run
// synchronously under the lock, so they must not call back into the
// server.
class Registry {
public:
    Registry() = default;

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    // Marks the class running with its listener. False if already running.
    bool begin_serving(PeerClass c, int listen_fd, const BaseInfo& info);

    bool running(PeerClass c) const;
    bool any_running() const;

    // Clears both running flags. Listener fds stay recorded.
    void stop_all();

    // Clears the running flag of one class whose accept loop gave up, and
    // hands over its listener fd (-1 when close() already took it).
    int end_serving(PeerClass c);

    // Not serving, no listener recorded and nobody registered.
    bool idle() const;

    // Hands over every recorded listener fd and forgets it.
    std::vector<int> take_listeners();

    BaseInfo listener_info(PeerClass c) const;

    void add_connect_hook(PeerClass c, Hook fn);
    void add_disconnect_hook(PeerClass c, Hook fn);

    // Appends `p` and fires the connect hooks. Refuses (false) a provider
    // already present in either population.
    bool admit(PeerClass c, const std::shared_ptr<Provider>& p);

    // Drops `p` and fires the disconnect hooks. False if `p` was not in `c`.
    bool remove(PeerClass c, const std::shared_ptr<Provider>& p);

    bool contains(const Provider* p) const;
    std::size_t size(PeerClass c) const;

    InfoList snapshot(PeerClass c) const;
    std::vector<std::shared_ptr<Provider>> members(PeerClass c) const;

    // Visits members of `c` in registry order while holding the lock.
    void for_each(PeerClass c,
                  const std::function<void(const std::shared_ptr<Provider>&)>& fn) const;

private:
    struct Population {
        int      listen_fd = -1;
        bool     running = false;
        BaseInfo info;
        std::vector<std::shared_ptr<Provider>> members;
        std::vector<Hook> on_connect;
        std::vector<Hook> on_disconnect;
    };

    mutable std::mutex _mtx;
    Population _clients;
    Population _clusters;

    Population& pop(PeerClass c) { return c == PeerClass::Client ? _clients : _clusters; }
    const Population& pop(PeerClass c) const { return c == PeerClass::Client ? _clients : _clusters; }
};

} // namespace tg::internal
