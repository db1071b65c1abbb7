/*
 * Part of the TwinGate (TG) project.
 *
 * SPDX-FileCopyrightText: 2025 TwinGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of TwinGate (TG). See LICENSE for details.
 */

#include "tg/internal/registry.hpp"
#include <algorithm>

namespace tg::internal {

bool Registry::begin_serving(PeerClass c, int listen_fd, const BaseInfo& info) {
    std::lock_guard<std::mutex> lk(_mtx);
    Population& p = pop(c);
    if (p.running) return false;
    p.running = true;
    p.listen_fd = listen_fd;
    p.info = info;
    return true;
}

bool Registry::running(PeerClass c) const {
    std::lock_guard<std::mutex> lk(_mtx);
    return pop(c).running;
}

bool Registry::any_running() const {
    std::lock_guard<std::mutex> lk(_mtx);
    return _clients.running || _clusters.running;
}

void Registry::stop_all() {
    std::lock_guard<std::mutex> lk(_mtx);
    _clients.running = false;
    _clusters.running = false;
}

int Registry::end_serving(PeerClass c) {
    std::lock_guard<std::mutex> lk(_mtx);
    Population& p = pop(c);
    p.running = false;
    const int fd = p.listen_fd;
    p.listen_fd = -1;
    return fd;
}

bool Registry::idle() const {
    std::lock_guard<std::mutex> lk(_mtx);
    for (const Population* p : {&_clients, &_clusters}) {
        if (p->running || p->listen_fd >= 0 || !p->members.empty()) return false;
    }
    return true;
}

std::vector<int> Registry::take_listeners() {
    std::lock_guard<std::mutex> lk(_mtx);
    std::vector<int> fds;
    for (Population* p : {&_clients, &_clusters}) {
        if (p->listen_fd >= 0) {
            fds.push_back(p->listen_fd);
            p->listen_fd = -1;
        }
    }
    return fds;
}

BaseInfo Registry::listener_info(PeerClass c) const {
    std::lock_guard<std::mutex> lk(_mtx);
    return pop(c).info;
}

void Registry::add_connect_hook(PeerClass c, Hook fn) {
    std::lock_guard<std::mutex> lk(_mtx);
    pop(c).on_connect.push_back(std::move(fn));
}

void Registry::add_disconnect_hook(PeerClass c, Hook fn) {
    std::lock_guard<std::mutex> lk(_mtx);
    pop(c).on_disconnect.push_back(std::move(fn));
}

static bool holds(const std::vector<std::shared_ptr<Provider>>& v, const Provider* p) {
    return std::any_of(v.begin(), v.end(),
                       [p](const std::shared_ptr<Provider>& m) { return m.get() == p; });
}

bool Registry::admit(PeerClass c, const std::shared_ptr<Provider>& p) {
    std::lock_guard<std::mutex> lk(_mtx);
    if (holds(_clients.members, p.get()) || holds(_clusters.members, p.get())) {
        return false;
    }
    Population& pp = pop(c);
    pp.members.push_back(p);
    for (const auto& fn : pp.on_connect) {
        fn(p);
    }
    return true;
}

bool Registry::remove(PeerClass c, const std::shared_ptr<Provider>& p) {
    std::lock_guard<std::mutex> lk(_mtx);
    Population& pp = pop(c);
    auto it = std::find(pp.members.begin(), pp.members.end(), p);
    if (it == pp.members.end()) return false;
    pp.members.erase(it);
    for (const auto& fn : pp.on_disconnect) {
        fn(p);
    }
    return true;
}

bool Registry::contains(const Provider* p) const {
    std::lock_guard<std::mutex> lk(_mtx);
    return holds(_clients.members, p) || holds(_clusters.members, p);
}

std::size_t Registry::size(PeerClass c) const {
    std::lock_guard<std::mutex> lk(_mtx);
    return pop(c).members.size();
}

InfoList Registry::snapshot(PeerClass c) const {
    std::lock_guard<std::mutex> lk(_mtx);
    std::vector<BaseInfo> out;
    out.reserve(pop(c).members.size());
    for (const auto& m : pop(c).members) {
        out.push_back(m->base_info());
    }
    return InfoList(std::move(out));
}

std::vector<std::shared_ptr<Provider>> Registry::members(PeerClass c) const {
    std::lock_guard<std::mutex> lk(_mtx);
    return pop(c).members;
}

void Registry::for_each(PeerClass c,
                        const std::function<void(const std::shared_ptr<Provider>&)>& fn) const {
    std::lock_guard<std::mutex> lk(_mtx);
    for (const auto& m : pop(c).members) {
        fn(m);
    }
}

} // namespace tg::internal
