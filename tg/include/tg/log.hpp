/*
 * Part of the TwinGate (TG) project.
 *
 * SPDX-FileCopyrightText: 2025 TwinGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of TwinGate (TG). See LICENSE for details.
 */

#pragma once
#include <string>

namespace tg {

// Thread-safe logging (to file + stdout).
void set_log_file(const std::string& path);
void log_line(const std::string& line);

// Log sink consumed by the server. Implementations must be safe for
// concurrent calls and must not throw.
class Log {
public:
    virtual ~Log() = default;
    virtual void log(const std::string& target, const std::string& message) = 0;
    virtual void error(const std::string& target, const std::string& err,
                       const std::string& message) = 0;
};

// Receives raw data traces (payload dumps around broadcasts).
class Trace {
public:
    virtual ~Trace() = default;
    virtual void trace(const std::string& data) = 0;
};

// Installed when the config leaves a sink unset.
class NullLog : public Log {
public:
    void log(const std::string&, const std::string&) override {}
    void error(const std::string&, const std::string&, const std::string&) override {}
};

class NullTrace : public Trace {
public:
    void trace(const std::string&) override {}
};

// Routes to log_line() with a UTC timestamp and level prefix.
class LineLog : public Log {
public:
    void log(const std::string& target, const std::string& message) override;
    void error(const std::string& target, const std::string& err,
               const std::string& message) override;
};

class LineTrace : public Trace {
public:
    void trace(const std::string& data) override;
};

} // namespace tg
