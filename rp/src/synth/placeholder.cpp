/*
 * Part of the RelayPlane (RP) project.
 *
 * SPDX-FileCopyrightText: 2025 RelayPlane contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of RelayPlane (RP). See LICENSE for details.
 */


#include "rp/internal/placeholder.hpp"
#include "rp/internal/utils.hpp"

namespace rp::internal {

static std::string canonical_name(const std::string& raw) {
    std::string n = lower_copy(trim_copy(raw));
    if (n == "pool_sni") n = "sni";
    return n;
}

static const std::string* lookup(const PlaceholderValues& v, const std::string& name) {
    if (name == "port")            return &v.port;
    if (name == "uuid")            return &v.uuid;
    if (name == "sni")             return &v.sni;
    if (name == "domain")          return &v.domain;
    if (name == "reality_private") return &v.reality_private;
    if (name == "reality_pbk")     return &v.reality_pbk;
    if (name == "reality_sid")     return &v.reality_sid;
    return nullptr;
}

std::string render_placeholders(const std::string& text, const PlaceholderValues& values,
                                std::vector<std::string>* unknown) {
    std::string out;
    out.reserve(text.size());
    std::size_t pos = 0;
    while (pos < text.size()) {
        const std::size_t open = text.find("{{", pos);
        if (open == std::string::npos) break;
        const std::size_t close = text.find("}}", open + 2);
        if (close == std::string::npos) break;

        out.append(text, pos, open - pos);
        const std::string name = canonical_name(text.substr(open + 2, close - open - 2));
        const std::string* value = lookup(values, name);
        if (value) {
            out += *value;
        } else {
            out.append(text, open, close + 2 - open);
            if (unknown) unknown->push_back(name);
        }
        pos = close + 2;
    }
    out.append(text, pos, std::string::npos);
    return out;
}

bool has_placeholder(const std::string& text, const std::string& name) {
    const std::string want = canonical_name(name);
    std::size_t pos = 0;
    while (true) {
        const std::size_t open = text.find("{{", pos);
        if (open == std::string::npos) return false;
        const std::size_t close = text.find("}}", open + 2);
        if (close == std::string::npos) return false;
        if (canonical_name(text.substr(open + 2, close - open - 2)) == want) return true;
        pos = close + 2;
    }
}

} // namespace rp::internal
