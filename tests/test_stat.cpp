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

#include "tg/stat.hpp"

#include <thread>
#include <vector>

TEST_CASE("fresh counters are zero")
{
    tg::Stat s;
    const auto snap = s.snapshot();
    CHECK(snap.in_msg == 0);
    CHECK(snap.out_msg == 0);
    CHECK(snap.in_bytes == 0);
    CHECK(snap.out_bytes == 0);
    CHECK(snap.requests == 0);
    CHECK(snap.total_clients == 0);
}

TEST_CASE("counters survive concurrent increments")
{
    tg::Stat s;
    constexpr int kThreads = 8;
    constexpr int kIters = 10000;

    std::vector<std::thread> ts;
    for (int t = 0; t < kThreads; ++t) {
        ts.emplace_back([&s]() {
            for (int i = 0; i < kIters; ++i) {
                s.increment_in_msg();
                s.increment_out_msg();
                s.increment_request();
                s.increment_clients();
                s.increment_reads(3);
                s.increment_writes(5);
            }
        });
    }
    for (auto& t : ts) t.join();

    const auto snap = s.snapshot();
    const int64_t n = int64_t(kThreads) * kIters;
    CHECK(snap.in_msg == n);
    CHECK(snap.out_msg == n);
    CHECK(snap.requests == n);
    CHECK(snap.total_clients == n);
    CHECK(snap.in_bytes == 3 * n);
    CHECK(snap.out_bytes == 5 * n);
}
