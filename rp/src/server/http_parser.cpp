/*
 * Part of the RelayPlane (RP) project.
 *
 * SPDX-FileCopyrightText: 2025 RelayPlane contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of RelayPlane (RP). See LICENSE for details.
 */

#include "rp/internal/http_parser.hpp"
#include "rp/internal/utils.hpp"

#include <cerrno>
#include <cstdlib>
#include <sstream>
#include <strings.h> // strcasecmp

namespace rp::internal {

bool parse_request_line(const std::string& line, rp::HttpRequest& r) {
    const std::size_t sp1 = line.find(' ');
    if (sp1 == std::string::npos || sp1 == 0) return false;
    const std::size_t sp2 = line.find(' ', sp1 + 1);
    if (sp2 == std::string::npos || sp2 == sp1 + 1) return false;

    r.method  = line.substr(0, sp1);
    r.httpver = line.substr(sp2 + 1);
    if (r.httpver.compare(0, 5, "HTTP/") != 0) return false;

    const std::string target = line.substr(sp1 + 1, sp2 - sp1 - 1);
    if (target.empty() || target[0] != '/') return false;
    const std::size_t q = target.find('?');
    if (q == std::string::npos) {
        r.path = target;
        r.query.clear();
    } else {
        r.path  = target.substr(0, q);
        r.query = target.substr(q + 1);
    }
    return true;
}

bool parse_request_head(const std::string& head, rp::HttpRequest& r) {
    std::size_t line_end = head.find("\r\n");
    if (line_end == std::string::npos) line_end = head.size();
    if (!parse_request_line(head.substr(0, line_end), r)) return false;

    r.headers.clear();
    std::size_t pos = line_end + 2;
    while (pos < head.size()) {
        std::size_t next = head.find("\r\n", pos);
        if (next == std::string::npos) next = head.size();
        const std::string line = head.substr(pos, next - pos);
        pos = next + 2;
        const std::size_t c = line.find(':');
        if (c == std::string::npos) continue;
        std::string k = line.substr(0, c), v = line.substr(c + 1);
        trim_inplace(k);
        trim_inplace(v);
        if (!k.empty()) r.headers[k] = v;
    }
    return true;
}

bool content_length(const rp::HttpRequest& r, std::size_t max_body, std::size_t& out) {
    out = 0;
    const std::string v = hdr_ci(r, "Content-Length");
    if (v.empty()) return true;
    errno = 0;
    char* end = nullptr;
    unsigned long long n = std::strtoull(v.c_str(), &end, 10);
    if (errno != 0 || !end || *end != '\0' || v[0] == '-') return false;
    if (n > max_body) return false;
    out = static_cast<std::size_t>(n);
    return true;
}

std::string hdr_ci(const rp::HttpRequest& r, const char* name) {
    auto it = r.headers.find(name);
    if (it != r.headers.end()) return it->second;
    for (const auto& kv : r.headers) {
        if (strcasecmp(kv.first.c_str(), name) == 0) return kv.second;
    }
    return {};
}

bool should_keep_alive(const rp::HttpRequest& r) {
    const std::string conn = lower_copy(hdr_ci(r, "Connection"));
    if (r.httpver == "HTTP/1.1") return conn != "close";
    return conn == "keep-alive";
}

std::string format_response(const rp::PanelConfig& cfg, const rp::HttpResponse& resp, bool keep_alive) {
    std::ostringstream oss;
    oss << "HTTP/1.1 " << resp.status << " " << resp.reason << "\r\n";
    oss << "Content-Type: " << resp.content_type << "\r\n";
    oss << "Content-Length: " << resp.body.size() << "\r\n";
    if (keep_alive) {
        oss << "Connection: keep-alive\r\n";
        oss << "Keep-Alive: timeout=" << cfg.ka_timeout_sec << ", max=" << cfg.ka_max << "\r\n";
    } else {
        oss << "Connection: close\r\n";
    }
    oss << "\r\n";
    oss << resp.body;
    return oss.str();
}

} // namespace rp::internal
