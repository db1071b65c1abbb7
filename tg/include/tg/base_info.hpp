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
#include <optional>
#include <string>
#include <vector>

namespace tg {

// Identity snapshot of one endpoint: a listening socket (server side)
// or an accepted peer.
struct BaseInfo {
    std::string addr;
    std::string ip;
    int         port = 0;
    std::string server_id;
    std::string version;
    std::string build;
    std::size_t max_payload = 0;

    // Flat JSON form, used in logs and traces.
    std::string to_string() const;
};

// Build identifier of this binary (compiler and standard library).
std::string build_id();

// Ordered snapshot of connection identities with lookup helpers.
class InfoList {
public:
    InfoList() = default;
    explicit InfoList(std::vector<BaseInfo> items) : _items(std::move(items)) {}

    // All entries whose ip (or addr) equals `ip`.
    InfoList by_ip(const std::string& ip) const;

    // First entry matching address and port.
    std::optional<BaseInfo> find(const std::string& addr, int port) const;

    bool has(const std::string& addr, int port) const;

    std::size_t size() const { return _items.size(); }
    bool empty() const { return _items.empty(); }
    const BaseInfo& operator[](std::size_t i) const { return _items[i]; }

    std::vector<BaseInfo>::const_iterator begin() const { return _items.begin(); }
    std::vector<BaseInfo>::const_iterator end() const { return _items.end(); }

private:
    std::vector<BaseInfo> _items;
};

} // namespace tg
