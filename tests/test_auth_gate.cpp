/*
 * Part of the TwinGate (TG) project.
 *
 * SPDX-FileCopyrightText: 2025 TwinGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of TwinGate (TG). See LICENSE for details.
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "tg/internal/auth_gate.hpp"
#include "tg/server_config.hpp"

#include <vector>

using tg::internal::AuthPolicy;
using tg::internal::AuthVerdict;
using tg::internal::authorize;

namespace {

class BareProvider : public tg::Provider {
public:
    bool close() override { _sig.fire(); return true; }
    bool send_message(const std::string&, bool) override { return true; }
    tg::CloseSignal& close_notify() override { return _sig; }
    tg::BaseInfo base_info() const override { return {}; }

private:
    tg::CloseSignal _sig;
};

class CredProvider : public BareProvider, public tg::ClientAuth {
public:
    CredProvider(std::string u, std::string p) : _c{std::move(u), std::move(p)} {}
    tg::Credential credentials() const override { return _c; }

private:
    tg::Credential _c;
};

class OnlyBob : public tg::Authenticator {
public:
    int calls = 0;
    bool authenticate(const tg::ClientAuth& who) override {
        ++calls;
        return who.credentials().username == "bob";
    }
};

} // namespace

TEST_CASE("disabled authentication admits everything")
{
    AuthPolicy p;
    BareProvider bare;
    CredProvider wrong("x", "y");
    CHECK(authorize(p, bare) == AuthVerdict::Admit);
    CHECK(authorize(p, wrong) == AuthVerdict::Admit);
}

TEST_CASE("providers without credentials")
{
    AuthPolicy p;
    p.enabled = true;
    BareProvider bare;

    SUBCASE("optional authentication lets them in")
    {
        CHECK(authorize(p, bare) == AuthVerdict::Admit);
    }

    SUBCASE("mandatory authentication rejects them")
    {
        p.mandatory = true;
        CHECK(authorize(p, bare) == AuthVerdict::RejectNoAuthCapability);
    }
}

TEST_CASE("static credential list")
{
    const std::vector<tg::Credential> list{{"alice", "secret"}, {"carol", "hunter2"}};
    AuthPolicy p;
    p.enabled = true;
    p.credentials = &list;

    CredProvider alice("alice", "secret");
    CredProvider carol("carol", "hunter2");
    CredProvider bad_pw("alice", "Secret");
    CredProvider unknown("mallory", "secret");
    CredProvider empty("", "");

    CHECK(authorize(p, alice) == AuthVerdict::Admit);
    CHECK(authorize(p, carol) == AuthVerdict::Admit);
    CHECK(authorize(p, bad_pw) == AuthVerdict::RejectCredentialsInvalid);
    CHECK(authorize(p, unknown) == AuthVerdict::RejectCredentialsInvalid);
    CHECK(authorize(p, empty) == AuthVerdict::RejectCredentialsInvalid);
}

TEST_CASE("authenticator is consulted before the static list")
{
    const std::vector<tg::Credential> list{{"alice", "secret"}};
    OnlyBob bob_only;
    AuthPolicy p;
    p.enabled = true;
    p.authenticator = &bob_only;
    p.credentials = &list;

    CredProvider bob("bob", "anything");
    CredProvider alice("alice", "secret");
    CredProvider eve("eve", "secret");

    CHECK(authorize(p, bob) == AuthVerdict::Admit);
    CHECK(bob_only.calls == 1);

    // Authenticator refuses; the static list still admits.
    CHECK(authorize(p, alice) == AuthVerdict::Admit);
    CHECK(bob_only.calls == 2);

    CHECK(authorize(p, eve) == AuthVerdict::RejectCredentialsInvalid);
    CHECK(bob_only.calls == 3);
}

TEST_CASE("authenticator alone")
{
    OnlyBob bob_only;
    AuthPolicy p;
    p.enabled = true;
    p.mandatory = true;
    p.authenticator = &bob_only;

    CredProvider bob("bob", "");
    CredProvider alice("alice", "secret");
    CHECK(authorize(p, bob) == AuthVerdict::Admit);
    CHECK(authorize(p, alice) == AuthVerdict::RejectCredentialsInvalid);
}

TEST_CASE("verdict names")
{
    CHECK(std::string(to_string(AuthVerdict::Admit)) == "admit");
    CHECK(std::string(to_string(AuthVerdict::RejectNoAuthCapability)) == "reject:no-auth-capability");
    CHECK(std::string(to_string(AuthVerdict::RejectCredentialsInvalid)) == "reject:credentials-invalid");
}

TEST_CASE("config credential matching is exact")
{
    tg::ServerConfig cfg;
    cfg.client_credentials  = {{"alice", "secret"}};
    cfg.cluster_credentials = {{"node", "token"}};

    CHECK(cfg.match_client_credentials({"alice", "secret"}));
    CHECK_FALSE(cfg.match_client_credentials({"alice", "secret "}));
    CHECK_FALSE(cfg.match_client_credentials({"node", "token"}));
    CHECK(cfg.match_cluster_credentials({"node", "token"}));
    CHECK_FALSE(cfg.match_cluster_credentials({"alice", "secret"}));
}
