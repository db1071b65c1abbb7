/*
 * Part of the TwinGate (TG) project.
 *
 * SPDX-FileCopyrightText: 2025 TwinGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of TwinGate (TG). See LICENSE for details.
 */

#include "tg/internal/auth_gate.hpp"
#include "tg/server_config.hpp"

namespace tg::internal {

const char* to_string(AuthVerdict v) {
    switch (v) {
    case AuthVerdict::Admit:                    return "admit";
    case AuthVerdict::RejectNoAuthCapability:   return "reject:no-auth-capability";
    case AuthVerdict::RejectCredentialsInvalid: return "reject:credentials-invalid";
    }
    return "unknown";
}

AuthVerdict authorize(const AuthPolicy& policy, Provider& provider) {
    if (!policy.enabled) return AuthVerdict::Admit;

    const auto* who = dynamic_cast<const ClientAuth*>(&provider);
    if (!who) {
        return policy.mandatory ? AuthVerdict::RejectNoAuthCapability : AuthVerdict::Admit;
    }

    if (policy.authenticator && policy.authenticator->authenticate(*who)) {
        return AuthVerdict::Admit;
    }
    if (policy.credentials && match_credentials(*policy.credentials, who->credentials())) {
        return AuthVerdict::Admit;
    }
    return AuthVerdict::RejectCredentialsInvalid;
}

} // namespace tg::internal
