/*
 * Part of the TwinGate (TG) project.
 *
 * SPDX-FileCopyrightText: 2025 TwinGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of TwinGate (TG). See LICENSE for details.
 */

#pragma once
#include <vector>
#include "tg/provider.hpp"
#include "tg/types.hpp"

namespace tg::internal {

enum class AuthVerdict {
    Admit,
    RejectNoAuthCapability,
    RejectCredentialsInvalid
};

const char* to_string(AuthVerdict v);

// Inputs for one population.
struct AuthPolicy {
    bool enabled   = false;
    bool mandatory = false;
    Authenticator* authenticator = nullptr;                // may be null
    const std::vector<Credential>* credentials = nullptr;  // may be null
};

// Admission decision for a freshly built provider. The authenticator is
// asked first; the static list is checked independently when it refuses.
// Providers without the ClientAuth capability pass unless auth is
// mandatory.
AuthVerdict authorize(const AuthPolicy& policy, Provider& provider);

} // namespace tg::internal
