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

#include "tg/internal/backoff.hpp"

using tg::internal::AcceptBackoff;
using ms = std::chrono::milliseconds;

TEST_CASE("backoff doubles from the minimum and stops at the cap")
{
    AcceptBackoff b(ms(10), ms(1000));

    CHECK(b.next() == ms(10));
    CHECK(b.next() == ms(20));
    CHECK(b.next() == ms(40));
    CHECK(b.next() == ms(80));
    CHECK(b.next() == ms(160));
    CHECK(b.next() == ms(320));
    CHECK(b.next() == ms(640));
    CHECK(b.next() == ms(1000));
    CHECK(b.next() == ms(1000));
    CHECK(b.current() == ms(1000));
}

TEST_CASE("backoff reset after a successful accept")
{
    AcceptBackoff b(ms(10), ms(1000));
    b.next();
    b.next();
    b.next();
    CHECK(b.current() == ms(80));

    b.reset();
    CHECK(b.current() == ms(10));
    CHECK(b.next() == ms(10));
}

TEST_CASE("backoff bounds are sanitized")
{
    SUBCASE("zero minimum becomes one millisecond")
    {
        AcceptBackoff b(ms(0), ms(4));
        CHECK(b.next() == ms(1));
        CHECK(b.next() == ms(2));
        CHECK(b.next() == ms(4));
        CHECK(b.next() == ms(4));
    }

    SUBCASE("maximum below minimum pins the delay")
    {
        AcceptBackoff b(ms(50), ms(5));
        CHECK(b.next() == ms(50));
        CHECK(b.next() == ms(50));
    }
}
