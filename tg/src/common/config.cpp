/*
 * Part of the TwinGate (TG) project.
 *
 * SPDX-FileCopyrightText: 2025 TwinGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of TwinGate (TG). See LICENSE for details.
 */

#include "tg/server_config.hpp"
#include "tg/internal/utils.hpp"

namespace tg {

void ServerConfig::init_log_and_trace() {
    if (!log) log = std::make_shared<NullLog>();
    if (!trace) trace = std::make_shared<NullTrace>();
}

bool match_credentials(const std::vector<Credential>& list, const Credential& c) {
    for (const auto& user : list) {
        if (user.username == c.username && internal::ct_equal(user.password, c.password)) {
            return true;
        }
    }
    return false;
}

bool ServerConfig::match_client_credentials(const Credential& c) const {
    return match_credentials(client_credentials, c);
}

bool ServerConfig::match_cluster_credentials(const Credential& c) const {
    return match_credentials(cluster_credentials, c);
}

} // namespace tg
