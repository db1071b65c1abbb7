/*
 * Part of the TwinGate (TG) project.
 *
 * SPDX-FileCopyrightText: 2025 TwinGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of TwinGate (TG). See LICENSE for details.
 */

#include "tg/log.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>

namespace {

// Process-wide line sink. The file opens lazily so a path set before the
// first line is honored.
struct LineSink {
    std::mutex    mtx;
    std::ofstream ofs;
    std::string   path = "log.txt";

    void open_unlocked() {
        if (!ofs.is_open()) ofs.open(path, std::ios::out | std::ios::app);
    }
};

LineSink& sink() {
    static LineSink s;
    return s;
}

// "YYYY-MM-DDTHH:MM:SS.mmmZ"
std::string utc_timestamp() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const std::time_t t = system_clock::to_time_t(now);
    const auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[40]{0};
    std::size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    n += static_cast<std::size_t>(std::snprintf(buf + n, sizeof(buf) - n, ".%03dZ", static_cast<int>(ms)));
    return std::string(buf, n);
}

} // namespace

namespace tg {

void set_log_file(const std::string& path) {
    LineSink& s = sink();
    std::lock_guard<std::mutex> lk(s.mtx);
    if (s.ofs.is_open()) s.ofs.close();
    s.path = path;
    s.open_unlocked();
}

void log_line(const std::string& line) {
    LineSink& s = sink();
    std::lock_guard<std::mutex> lk(s.mtx);
    s.open_unlocked();
    if (s.ofs) {
        s.ofs << line << '\n';
        s.ofs.flush();
    }
    std::cout << line << '\n';
}

void LineLog::log(const std::string& target, const std::string& message) {
    log_line(utc_timestamp() + " [INFO] " + target + " : " + message);
}

void LineLog::error(const std::string& target, const std::string& err,
                    const std::string& message) {
    std::string line = utc_timestamp() + " [ERROR] " + target + " : " + message;
    if (!err.empty()) line += " : Error[" + err + "]";
    log_line(line);
}

void LineTrace::trace(const std::string& data) {
    log_line(utc_timestamp() + " [TRACE] " + data);
}

} // namespace tg
