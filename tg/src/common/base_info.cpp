/*
 * Part of the TwinGate (TG) project.
 *
 * SPDX-FileCopyrightText: 2025 TwinGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of TwinGate (TG). See LICENSE for details.
 */

#include "tg/base_info.hpp"
#include <cstdio>
#include <sstream>

namespace tg {

static std::string json_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    for (char ch : s) {
        switch (ch) {
        case '"':  out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n";  break;
        case '\r': out += "\\r";  break;
        case '\t': out += "\\t";  break;
        default:
            if ((unsigned char)ch < 0x20) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\u%04x", (unsigned)(unsigned char)ch);
                out += buf;
            } else {
                out += ch;
            }
        }
    }
    return out;
}

std::string BaseInfo::to_string() const {
    std::ostringstream os;
    os << R"({"addr":")" << json_escape(addr)
       << R"(","port":)" << port
       << R"(,"server_id":")" << json_escape(server_id)
       << R"(","version":")" << json_escape(version)
       << R"(","build":")" << json_escape(build)
       << R"(","ip":")" << json_escape(ip)
       << R"(","max_payload":)" << max_payload << "}";
    return os.str();
}

std::string build_id() {
#if defined(__clang__)
    return std::string("clang-") + __clang_version__;
#elif defined(__GNUC__)
    return std::string("gcc-") + __VERSION__;
#else
    return "c++" + std::to_string(__cplusplus);
#endif
}

InfoList InfoList::by_ip(const std::string& ip) const {
    std::vector<BaseInfo> out;
    for (const auto& i : _items) {
        if (i.ip == ip || i.addr == ip) out.push_back(i);
    }
    return InfoList(std::move(out));
}

std::optional<BaseInfo> InfoList::find(const std::string& addr, int port) const {
    for (const auto& i : _items) {
        if ((i.addr == addr || i.ip == addr) && i.port == port) return i;
    }
    return std::nullopt;
}

bool InfoList::has(const std::string& addr, int port) const {
    return find(addr, port).has_value();
}

} // namespace tg
